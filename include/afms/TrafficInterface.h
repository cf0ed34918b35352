// ****************************************************************************
// NOTICE
//
// This work was produced for the U.S. Government under Contract 693KA8-22-C-00001
// and is subject to Federal Aviation Administration Acquisition Management System
// Clause 3.5-13, Rights In Data-General, Alt. III and Alt. IV (Oct. 1996).
//
// The contents of this document reflect the views of the author and The MITRE
// Corporation and do not necessarily reflect the views of the Federal Aviation
// Administration (FAA) or the Department of Transportation (DOT). Neither the FAA
// nor the DOT makes any warranty or guarantee, expressed or implied, concerning
// the content or accuracy of these views.
//
// For further information, please contact The MITRE Corporation, Contracts Management
// Office, 7515 Colshire Drive, McLean, VA 22102-7539, (703) 983-6000.
//
// 2023 The MITRE Corporation. All Rights Reserved.
// ****************************************************************************

#pragma once

#include <string>
#include <scalar/Speed.h>
#include <scalar/Time.h>
#include "afms/AnnotatedRoute.h"
#include "afms/VehicleState.h"

namespace afms {
namespace open_source {

struct SpeedCommand {
   Units::MetersPerSecondSpeed m_cas;
   bool m_navigation_armed;
};

/**
 * The traffic simulation as seen by the advisory engine and the route commands:
 * vehicle snapshots, their annotated routes and the speed command sink.
 */
class TrafficInterface {
  public:
   virtual ~TrafficInterface() = default;

   virtual Units::SecondsTime GetTimeOfDay() const = 0;

   virtual int GetVehicleCount() const = 0;

   virtual VehicleState GetVehicleState(const int vehicle_index) const = 0;

   virtual const AnnotatedRoute &GetRoute(const int vehicle_index) const = 0;

   virtual AnnotatedRoute &GetMutableRoute(const int vehicle_index) = 0;

   /**
    * @return index of the vehicle, UNDEFINED_INDEX if no vehicle has this id
    */
   virtual int FindVehicleIndex(const std::string &vehicle_id) const = 0;

   virtual void IssueSpeedCommand(const int vehicle_index, const SpeedCommand &command) = 0;
};
}  // namespace open_source
}  // namespace afms
