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

#include <memory>
#include <vector>
#include <scalar/Length.h>
#include <scalar/Speed.h>
#include <scalar/Time.h>
#include "afms/AfmsConfiguration.h"
#include "public/Logging.h"
#include "public/StandardAtmosphere.h"

namespace afms {
namespace open_source {

/**
 * Path from the vehicle to a constrained waypoint, one entry per segment.
 * A negative altitude holds the altitude of the previous segment.
 */
struct SpeedProfile {
   std::vector<Units::Length> m_distances;
   std::vector<Units::Length> m_altitudes;
};

class KinematicSpeedSolver {
  public:
   KinematicSpeedSolver(std::shared_ptr<Atmosphere> atmosphere, const AfmsConfiguration &configuration);

   ~KinematicSpeedSolver() = default;

   /**
    * Estimates the constant CAS that covers the profile in time_budget. Each round
    * flies the profile at the current estimate, including the speed change from
    * current_cas on the first segment, and rescales the estimate by the ratio of
    * flown time to budget. Returns the estimate used by the final round.
    *
    * A non-positive budget returns current_cas.
    */
   Units::Speed SolveCasForTimeBudget(const SpeedProfile &profile, const Units::Time time_budget,
                                      const Units::Speed current_cas) const;

   /**
    * As above, with the speed change on the first segment starting from the
    * measured current_tas instead of the TAS of current_cas.
    */
   Units::Speed SolveCasForTimeBudget(const SpeedProfile &profile, const Units::Time time_budget,
                                      const Units::Speed current_cas, const Units::Speed current_tas) const;

   /**
    * Time to fly the profile at a constant CAS, speed changes ignored.
    */
   Units::Time EtaForCas(const SpeedProfile &profile, const Units::Speed cas) const;

  private:
   static log4cplus::Logger m_logger;

   std::vector<Units::Length> ResolveAltitudes(const SpeedProfile &profile) const;

   Units::Time FirstSegmentTime(const Units::Length distance, const Units::Speed current_tas,
                                const Units::Speed new_tas) const;

   Units::Time FlyProfile(const SpeedProfile &profile, const std::vector<Units::Length> &altitudes,
                          const Units::Speed cas, const Units::Speed current_tas) const;

   std::shared_ptr<Atmosphere> m_atmosphere;
   double m_acceleration;
   double m_deceleration;
   int m_iterations;
};
}  // namespace open_source
}  // namespace afms
