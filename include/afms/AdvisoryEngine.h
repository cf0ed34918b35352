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

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "afms/AfmsConfiguration.h"
#include "afms/AfmsUtils.h"
#include "afms/AnnotatedRoute.h"
#include "afms/ConstraintLocator.h"
#include "afms/KinematicSpeedSolver.h"
#include "afms/PreferredSpeed.h"
#include "afms/TrafficInterface.h"
#include "afms/VehicleState.h"
#include "public/Logging.h"

namespace afms {
namespace open_source {

class AdvisoryEngine {
  public:
   enum AdvisoryStatus {
      NOT_IN_CRUISE = 0,
      MODE_OFF,
      COMMAND_ISSUED,
      NO_PREFERRED_SPEED,
      NO_CONSTRAINT,
      UNRECOGNIZED_MODE,
      DEADLINE_MISSED,
   };

   static std::map<AdvisoryStatus, std::string> advisory_status_dictionary;

   struct AdvisoryResult {
      std::string m_vehicle_id;
      AfmsUtils::AdvisoryModes m_mode;
      AdvisoryStatus m_status;

      // set only when m_status is COMMAND_ISSUED
      Units::MetersPerSecondSpeed m_commanded_cas;
   };

   AdvisoryEngine(std::shared_ptr<Atmosphere> atmosphere, const AfmsConfiguration &configuration);

   ~AdvisoryEngine() = default;

   /**
    * Runs one advisory cycle over every vehicle of the traffic. A vehicle whose
    * targeted arrival time or time window has already passed gets no command and
    * reports DEADLINE_MISSED.
    */
   std::vector<AdvisoryResult> Update(TrafficInterface &traffic) const;

   AdvisoryResult UpdateVehicle(TrafficInterface &traffic, const int vehicle_index) const;

   /**
    * Segment 0 runs from the vehicle to the waypoint at the constraint's start index
    * at the vehicle altitude. Segment k ends at waypoint start index + k.
    */
   SpeedProfile BuildSpeedProfile(const VehicleState &state, const Route &route,
                                  const ConstraintWindow &constraint) const;

   const KinematicSpeedSolver &GetSolver() const;

   const AfmsConfiguration &GetConfiguration() const;

  private:
   static log4cplus::Logger m_logger;

   AdvisoryResult AdviseVehicle(TrafficInterface &traffic, const int vehicle_index) const;

   AdvisoryResult HandleOwnMode(TrafficInterface &traffic, const int vehicle_index, const VehicleState &state,
                                const std::optional<PreferredSpeed> &preferred_speed) const;

   AdvisoryResult HandleRtaMode(TrafficInterface &traffic, const int vehicle_index, const VehicleState &state,
                                const AnnotatedRoute &route) const;

   AdvisoryResult HandleTimeWindowMode(TrafficInterface &traffic, const int vehicle_index, const VehicleState &state,
                                       const AnnotatedRoute &route,
                                       const std::optional<PreferredSpeed> &preferred_speed) const;

   AdvisoryResult IssueCommand(TrafficInterface &traffic, const int vehicle_index, const VehicleState &state,
                               const AfmsUtils::AdvisoryModes mode, const Units::Speed cas) const;

   static AdvisoryResult MakeResult(const VehicleState &state, const AfmsUtils::AdvisoryModes mode,
                                    const AdvisoryStatus status);

   std::shared_ptr<Atmosphere> m_atmosphere;
   AfmsConfiguration m_configuration;
   KinematicSpeedSolver m_solver;
};

inline const KinematicSpeedSolver &AdvisoryEngine::GetSolver() const { return m_solver; }

inline const AfmsConfiguration &AdvisoryEngine::GetConfiguration() const { return m_configuration; }
}  // namespace open_source
}  // namespace afms
