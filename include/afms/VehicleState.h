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
#include <scalar/Angle.h>
#include <scalar/Length.h>
#include <scalar/Speed.h>

namespace afms {
namespace open_source {

/**
 * Snapshot of one vehicle as seen by the advisory engine for a single cycle.
 */
struct VehicleState {
   enum FlightPhase { GROUND = 0, CLIMB, CRUISE, DESCENT };

   std::string m_id;
   Units::DegreesAngle m_latitude;
   Units::DegreesAngle m_longitude;
   Units::FeetLength m_altitude;
   Units::MetersPerSecondSpeed m_cas;
   Units::MetersPerSecondSpeed m_tas;
   FlightPhase m_flight_phase;
   double m_reference_cruise_mach;
};
}  // namespace open_source
}  // namespace afms
