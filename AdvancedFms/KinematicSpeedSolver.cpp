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

#include "afms/KinematicSpeedSolver.h"

#include <stdexcept>
#include "afms/AfmsUtils.h"

using namespace afms::open_source;

log4cplus::Logger KinematicSpeedSolver::m_logger =
      log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("KinematicSpeedSolver"));

KinematicSpeedSolver::KinematicSpeedSolver(std::shared_ptr<Atmosphere> atmosphere,
                                           const AfmsConfiguration &configuration)
   : m_atmosphere(atmosphere),
     m_acceleration(configuration.m_acceleration),
     m_deceleration(configuration.m_deceleration),
     m_iterations(configuration.m_solver_iterations) {
   if (!m_atmosphere) {
      throw std::invalid_argument("KinematicSpeedSolver requires an atmosphere");
   }
}

std::vector<Units::Length> KinematicSpeedSolver::ResolveAltitudes(const SpeedProfile &profile) const {
   if (profile.m_distances.size() != profile.m_altitudes.size()) {
      std::string msg = "speed profile has " + std::to_string(profile.m_distances.size()) + " distances and " +
                        std::to_string(profile.m_altitudes.size()) + " altitudes";
      LOG4CPLUS_ERROR(m_logger, msg);
      throw std::invalid_argument(msg);
   }

   std::vector<Units::Length> altitudes;
   altitudes.reserve(profile.m_altitudes.size());
   Units::Length held_altitude = Units::zero();
   for (const Units::Length &altitude : profile.m_altitudes) {
      if (altitude >= Units::zero()) {
         held_altitude = altitude;
      }
      altitudes.push_back(held_altitude);
   }
   return altitudes;
}

Units::Time KinematicSpeedSolver::FirstSegmentTime(const Units::Length distance, const Units::Speed current_tas,
                                                   const Units::Speed new_tas) const {
   const Units::Speed speed_change = new_tas - current_tas;
   if (Units::abs(speed_change) <= AfmsUtils::TRANSIENT_SPEED_TOLERANCE) {
      return distance / new_tas;
   }

   const double a = speed_change > Units::zero() ? m_acceleration : m_deceleration;
   const double v0 = Units::MetersPerSecondSpeed(current_tas).value();
   const double t = Units::MetersPerSecondSpeed(speed_change).value() / a;
   const double d = v0 * t + 0.5 * a * t * t;

   if (d < 0 || Units::MetersLength(d) > distance) {
      // speed change does not complete inside the segment, fly it at the new speed
      LOG4CPLUS_TRACE(m_logger, "transient of " << d << " m clamped, segment is "
                                                << Units::MetersLength(distance).value() << " m");
      return distance / new_tas;
   }

   return Units::SecondsTime(t) + (distance - Units::MetersLength(d)) / new_tas;
}

Units::Time KinematicSpeedSolver::FlyProfile(const SpeedProfile &profile, const std::vector<Units::Length> &altitudes,
                                             const Units::Speed cas, const Units::Speed current_tas) const {
   Units::Time total_time = Units::zero();
   for (size_t i = 0; i < profile.m_distances.size(); ++i) {
      const Units::Length distance = profile.m_distances[i];
      if (distance <= Units::zero()) {
         continue;
      }

      const Units::Speed tas = m_atmosphere->CAS2TAS(cas, altitudes[i]);
      if (i == 0) {
         total_time += FirstSegmentTime(distance, current_tas, tas);
      } else {
         total_time += distance / tas;
      }
   }
   return total_time;
}

Units::Speed KinematicSpeedSolver::SolveCasForTimeBudget(const SpeedProfile &profile, const Units::Time time_budget,
                                                         const Units::Speed current_cas) const {
   const std::vector<Units::Length> altitudes = ResolveAltitudes(profile);
   if (altitudes.empty()) {
      return current_cas;
   }
   return SolveCasForTimeBudget(profile, time_budget, current_cas, m_atmosphere->CAS2TAS(current_cas, altitudes[0]));
}

Units::Speed KinematicSpeedSolver::SolveCasForTimeBudget(const SpeedProfile &profile, const Units::Time time_budget,
                                                         const Units::Speed current_cas,
                                                         const Units::Speed current_tas) const {
   const std::vector<Units::Length> altitudes = ResolveAltitudes(profile);

   if (time_budget <= Units::zero()) {
      LOG4CPLUS_DEBUG(m_logger, "no time left to adjust, keeping " << Units::KnotsSpeed(current_cas).value()
                                                                   << " kts");
      return current_cas;
   }
   if (altitudes.empty()) {
      return current_cas;
   }

   Units::Speed estimated_cas = current_cas;
   if (estimated_cas < AfmsUtils::MINIMUM_CAS) {
      estimated_cas = AfmsUtils::MINIMUM_CAS;
   }

   Units::Speed solved_cas = estimated_cas;
   for (int round = 0; round < m_iterations; ++round) {
      solved_cas = estimated_cas;
      const Units::Time total_time = FlyProfile(profile, altitudes, estimated_cas, current_tas);
      const double time_ratio = Units::SecondsTime(total_time).value() / Units::SecondsTime(time_budget).value();
      estimated_cas = estimated_cas * time_ratio;
      if (estimated_cas < AfmsUtils::MINIMUM_CAS) {
         estimated_cas = AfmsUtils::MINIMUM_CAS;
      }

      LOG4CPLUS_TRACE(m_logger, "round " << round << " cas " << Units::MetersPerSecondSpeed(solved_cas).value()
                                         << " m/s flies " << Units::SecondsTime(total_time).value() << " s of "
                                         << Units::SecondsTime(time_budget).value() << " s");
   }

   return solved_cas;
}

Units::Time KinematicSpeedSolver::EtaForCas(const SpeedProfile &profile, const Units::Speed cas) const {
   const std::vector<Units::Length> altitudes = ResolveAltitudes(profile);

   Units::Time total_time = Units::zero();
   for (size_t i = 0; i < profile.m_distances.size(); ++i) {
      if (profile.m_distances[i] <= Units::zero()) {
         continue;
      }
      total_time += profile.m_distances[i] / m_atmosphere->CAS2TAS(cas, altitudes[i]);
   }
   return total_time;
}
