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

#include "afms/AdvisoryEngine.h"

#include "afms/ModeResolver.h"
#include "afms/TimeOfDay.h"

using namespace afms::open_source;

log4cplus::Logger AdvisoryEngine::m_logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("AdvisoryEngine"));

std::map<AdvisoryEngine::AdvisoryStatus, std::string> AdvisoryEngine::advisory_status_dictionary = {
      {AdvisoryStatus::NOT_IN_CRUISE, "NOT_IN_CRUISE"},
      {AdvisoryStatus::MODE_OFF, "MODE_OFF"},
      {AdvisoryStatus::COMMAND_ISSUED, "COMMAND_ISSUED"},
      {AdvisoryStatus::NO_PREFERRED_SPEED, "NO_PREFERRED_SPEED"},
      {AdvisoryStatus::NO_CONSTRAINT, "NO_CONSTRAINT"},
      {AdvisoryStatus::UNRECOGNIZED_MODE, "UNRECOGNIZED_MODE"},
      {AdvisoryStatus::DEADLINE_MISSED, "DEADLINE_MISSED"}};

AdvisoryEngine::AdvisoryEngine(std::shared_ptr<Atmosphere> atmosphere, const AfmsConfiguration &configuration)
   : m_atmosphere(atmosphere), m_configuration(configuration), m_solver(atmosphere, configuration) {}

std::vector<AdvisoryEngine::AdvisoryResult> AdvisoryEngine::Update(TrafficInterface &traffic) const {
   std::vector<AdvisoryResult> results;
   results.reserve(traffic.GetVehicleCount());
   for (int i = 0; i < traffic.GetVehicleCount(); ++i) {
      results.push_back(UpdateVehicle(traffic, i));
   }
   return results;
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::UpdateVehicle(TrafficInterface &traffic,
                                                             const int vehicle_index) const {
   const AdvisoryResult result = AdviseVehicle(traffic, vehicle_index);
   LOG4CPLUS_DEBUG(m_logger, "Vehicle " << result.m_vehicle_id << " "
                                        << AfmsUtils::GetAdvisoryModeString(result.m_mode) << " "
                                        << advisory_status_dictionary.at(result.m_status));
   return result;
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::AdviseVehicle(TrafficInterface &traffic,
                                                             const int vehicle_index) const {
   const VehicleState state = traffic.GetVehicleState(vehicle_index);
   if (state.m_flight_phase != VehicleState::CRUISE) {
      return MakeResult(state, AfmsUtils::AdvisoryModes::OFF, NOT_IN_CRUISE);
   }

   const AnnotatedRoute &route = traffic.GetRoute(vehicle_index);
   const int active_index = route.GetActiveWaypointIndex();
   const AfmsUtils::AdvisoryModes mode = ModeResolver::ResolveMode(route.GetConstraints(), active_index);
   const std::optional<PreferredSpeed> preferred_speed =
         ModeResolver::ResolvePreferredSpeed(route.GetConstraints(), active_index);

   switch (mode) {
      case AfmsUtils::AdvisoryModes::OFF:
         return MakeResult(state, mode, MODE_OFF);
      case AfmsUtils::AdvisoryModes::OWN:
         return HandleOwnMode(traffic, vehicle_index, state, preferred_speed);
      case AfmsUtils::AdvisoryModes::RTA:
         return HandleRtaMode(traffic, vehicle_index, state, route);
      case AfmsUtils::AdvisoryModes::TW:
         return HandleTimeWindowMode(traffic, vehicle_index, state, route, preferred_speed);
      default:
         LOG4CPLUS_ERROR(m_logger, "Vehicle " << state.m_id << " has unrecognized advisory mode "
                                              << AfmsUtils::GetAdvisoryModeString(mode));
         return MakeResult(state, mode, UNRECOGNIZED_MODE);
   }
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::HandleOwnMode(
      TrafficInterface &traffic, const int vehicle_index, const VehicleState &state,
      const std::optional<PreferredSpeed> &preferred_speed) const {
   if (!preferred_speed.has_value()) {
      LOG4CPLUS_WARN(m_logger, "Vehicle " << state.m_id << " is in OWN mode without a preferred speed");
      return MakeResult(state, AfmsUtils::AdvisoryModes::OWN, NO_PREFERRED_SPEED);
   }

   const Units::Speed cas = preferred_speed->ToCas(m_atmosphere, state.m_altitude);
   return IssueCommand(traffic, vehicle_index, state, AfmsUtils::AdvisoryModes::OWN, cas);
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::HandleRtaMode(TrafficInterface &traffic, const int vehicle_index,
                                                             const VehicleState &state,
                                                             const AnnotatedRoute &route) const {
   std::optional<ConstraintWindow> constraint =
         ConstraintLocator::LocateConstraint(route.GetConstraints(), route.GetActiveWaypointIndex());
   if (!constraint.has_value()) {
      LOG4CPLUS_DEBUG(m_logger, "Vehicle " << state.m_id << " has no arrival time ahead");
      return MakeResult(state, AfmsUtils::AdvisoryModes::RTA, NO_CONSTRAINT);
   }

   // negative once the arrival time has passed
   Units::Time time_remaining = TimeOfDay::SecondsUntil(constraint->m_time_of_day, traffic.GetTimeOfDay());
   if (time_remaining < m_configuration.m_skip_threshold) {
      constraint = ConstraintLocator::LocateNextConstraintAfter(route.GetConstraints(), *constraint);
      time_remaining = TimeOfDay::SecondsUntil(constraint->m_time_of_day, traffic.GetTimeOfDay());
      LOG4CPLUS_DEBUG(m_logger, "Vehicle " << state.m_id << " targets "
                                           << route.GetRoute().GetWaypoint(constraint->m_end_index).m_name);
   }

   if (time_remaining <= Units::zero()) {
      LOG4CPLUS_WARN(m_logger, "Vehicle " << state.m_id << " missed arrival time "
                                          << TimeOfDay::Format(constraint->m_time_of_day) << " at "
                                          << route.GetRoute().GetWaypoint(constraint->m_end_index).m_name << " by "
                                          << -Units::SecondsTime(time_remaining).value() << " s");
      return MakeResult(state, AfmsUtils::AdvisoryModes::RTA, DEADLINE_MISSED);
   }

   const SpeedProfile profile = BuildSpeedProfile(state, route.GetRoute(), *constraint);
   const Units::Speed cas = m_solver.SolveCasForTimeBudget(profile, time_remaining, state.m_cas, state.m_tas);
   return IssueCommand(traffic, vehicle_index, state, AfmsUtils::AdvisoryModes::RTA, cas);
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::HandleTimeWindowMode(
      TrafficInterface &traffic, const int vehicle_index, const VehicleState &state, const AnnotatedRoute &route,
      const std::optional<PreferredSpeed> &preferred_speed) const {
   std::optional<ConstraintWindow> constraint =
         ConstraintLocator::LocateConstraint(route.GetConstraints(), route.GetActiveWaypointIndex());
   if (!constraint.has_value()) {
      LOG4CPLUS_DEBUG(m_logger, "Vehicle " << state.m_id << " has no time window ahead");
      return MakeResult(state, AfmsUtils::AdvisoryModes::TW, NO_CONSTRAINT);
   }

   Units::Speed preferred_cas = state.m_cas;
   if (preferred_speed.has_value()) {
      preferred_cas = preferred_speed->ToCas(m_atmosphere, state.m_altitude);
   }

   SpeedProfile profile = BuildSpeedProfile(state, route.GetRoute(), *constraint);
   Units::Time preferred_eta = m_solver.EtaForCas(profile, preferred_cas);
   if (preferred_eta < m_configuration.m_skip_threshold) {
      constraint = ConstraintLocator::LocateNextConstraintAfter(route.GetConstraints(), *constraint);
      profile = BuildSpeedProfile(state, route.GetRoute(), *constraint);
      preferred_eta = m_solver.EtaForCas(profile, preferred_cas);
      LOG4CPLUS_DEBUG(m_logger, "Vehicle " << state.m_id << " targets "
                                           << route.GetRoute().GetWaypoint(constraint->m_end_index).m_name);
   }

   // earliest and latest go negative as the window passes
   const Units::Time time_to_rta = TimeOfDay::SecondsUntil(constraint->m_time_of_day, traffic.GetTimeOfDay());
   const Units::Time earliest = time_to_rta - constraint->m_window_size / 2.0;
   const Units::Time latest = time_to_rta + constraint->m_window_size / 2.0;

   if (latest <= Units::zero()) {
      LOG4CPLUS_WARN(m_logger, "Vehicle " << state.m_id << " missed time window closing "
                                          << -Units::SecondsTime(latest).value() << " s ago at "
                                          << route.GetRoute().GetWaypoint(constraint->m_end_index).m_name);
      return MakeResult(state, AfmsUtils::AdvisoryModes::TW, DEADLINE_MISSED);
   }

   Units::Speed cas = preferred_cas;
   if (preferred_eta < earliest) {
      cas = m_solver.SolveCasForTimeBudget(profile, earliest, state.m_cas, state.m_tas);
   } else if (preferred_eta > latest) {
      cas = m_solver.SolveCasForTimeBudget(profile, latest, state.m_cas, state.m_tas);
   }

   LOG4CPLUS_TRACE(m_logger, "Vehicle " << state.m_id << " preferred eta "
                                        << Units::SecondsTime(preferred_eta).value() << " s, window ["
                                        << Units::SecondsTime(earliest).value() << ", "
                                        << Units::SecondsTime(latest).value() << "] s");

   return IssueCommand(traffic, vehicle_index, state, AfmsUtils::AdvisoryModes::TW, cas);
}

SpeedProfile AdvisoryEngine::BuildSpeedProfile(const VehicleState &state, const Route &route,
                                               const ConstraintWindow &constraint) const {
   SpeedProfile profile;

   const Waypoint &first = route.GetWaypoint(constraint.m_start_index);
   profile.m_distances.push_back(AfmsUtils::CalculateGreatCircleDistance(state.m_latitude, state.m_longitude,
                                                                         first.m_latitude, first.m_longitude));
   profile.m_altitudes.push_back(state.m_altitude);

   for (int i = constraint.m_start_index + 1; i <= constraint.m_end_index; ++i) {
      const Waypoint &waypoint = route.GetWaypoint(i);
      profile.m_distances.push_back(waypoint.m_distance_from_previous);
      profile.m_altitudes.push_back(waypoint.m_altitude);
   }

   return profile;
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::IssueCommand(TrafficInterface &traffic, const int vehicle_index,
                                                            const VehicleState &state,
                                                            const AfmsUtils::AdvisoryModes mode,
                                                            const Units::Speed cas) const {
   SpeedCommand command;
   command.m_cas = cas;
   command.m_navigation_armed = true;
   traffic.IssueSpeedCommand(vehicle_index, command);

   LOG4CPLUS_DEBUG(m_logger, "Vehicle " << state.m_id << " " << AfmsUtils::GetAdvisoryModeString(mode)
                                        << " command " << Units::KnotsSpeed(cas).value() << " kts CAS");

   AdvisoryResult result = MakeResult(state, mode, COMMAND_ISSUED);
   result.m_commanded_cas = cas;
   return result;
}

AdvisoryEngine::AdvisoryResult AdvisoryEngine::MakeResult(const VehicleState &state,
                                                          const AfmsUtils::AdvisoryModes mode,
                                                          const AdvisoryStatus status) {
   AdvisoryResult result;
   result.m_vehicle_id = state.m_id;
   result.m_mode = mode;
   result.m_status = status;
   result.m_commanded_cas = Units::zero();
   return result;
}
