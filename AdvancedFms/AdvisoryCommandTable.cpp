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

#include "afms/AdvisoryCommandTable.h"

#include "afms/AfmsUtils.h"
#include "afms/PreferredSpeed.h"
#include "afms/TimeOfDay.h"

using namespace afms::open_source;

log4cplus::Logger AdvisoryCommandTable::m_logger =
      log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("AdvisoryCommandTable"));

const std::map<std::string, AdvisoryCommandTable::CommandEntry> AdvisoryCommandTable::m_command_table = {
      {"AFMS_FROM", {"acid AFMS_FROM wpname OFF|CONTINUE|OWN|RTA|TW", 3, 3, &AdvisoryCommandTable::AfmsFrom}},
      {"RTA_AT", {"acid RTA_AT wpname HH:MM:SS", 3, 3, &AdvisoryCommandTable::RtaAt}},
      {"TW_SIZE_AT", {"acid TW_SIZE_AT wpname time_window_size", 3, 3, &AdvisoryCommandTable::TwSizeAt}},
      {"RTWA_AT", {"acid RTWA_AT wpname HH:MM:SS [time_window_size]", 3, 4, &AdvisoryCommandTable::RtwaAt}},
      {"OWN_SPD_FROM", {"acid OWN_SPD_FROM wpname [spd]", 2, 3, &AdvisoryCommandTable::OwnSpeedFrom}}};

AdvisoryCommandTable::AdvisoryCommandTable(TrafficInterface &traffic) : m_traffic(traffic) {}

bool AdvisoryCommandTable::IsCommand(const std::string &name) {
   return m_command_table.find(name) != m_command_table.end();
}

std::string AdvisoryCommandTable::GetUsage(const std::string &name) {
   std::map<std::string, CommandEntry>::const_iterator it = m_command_table.find(name);
   if (it == m_command_table.end()) {
      return "";
   }
   return it->second.m_usage;
}

bool AdvisoryCommandTable::Execute(const std::string &name, const std::vector<std::string> &arguments,
                                   std::string &response) {
   std::map<std::string, CommandEntry>::const_iterator it = m_command_table.find(name);
   if (it == m_command_table.end()) {
      return Fail("Unknown command " + name, response);
   }

   const CommandEntry &entry = it->second;
   if (arguments.size() < entry.m_min_arguments || arguments.size() > entry.m_max_arguments) {
      return Fail(name + " needs " + std::to_string(entry.m_min_arguments) +
                        (entry.m_min_arguments == entry.m_max_arguments
                               ? ""
                               : " to " + std::to_string(entry.m_max_arguments)) +
                        " arguments: " + entry.m_usage,
                  response);
   }

   return (this->*entry.m_handler)(arguments, response);
}

bool AdvisoryCommandTable::AfmsFrom(const std::vector<std::string> &arguments, std::string &response) {
   return SetModeFrom(arguments[0], arguments[1], arguments[2], response);
}

bool AdvisoryCommandTable::RtaAt(const std::vector<std::string> &arguments, std::string &response) {
   return SetArrivalTimeAt(arguments[0], arguments[1], arguments[2], response);
}

bool AdvisoryCommandTable::TwSizeAt(const std::vector<std::string> &arguments, std::string &response) {
   return SetWindowSizeAt(arguments[0], arguments[1], arguments[2], response);
}

bool AdvisoryCommandTable::RtwaAt(const std::vector<std::string> &arguments, std::string &response) {
   std::optional<std::string> window_size;
   if (arguments.size() > 3) {
      window_size = arguments[3];
   }
   return SetArrivalTimeAndWindowAt(arguments[0], arguments[1], arguments[2], window_size, response);
}

bool AdvisoryCommandTable::OwnSpeedFrom(const std::vector<std::string> &arguments, std::string &response) {
   std::optional<std::string> speed;
   if (arguments.size() > 2) {
      speed = arguments[2];
   }
   return SetPreferredSpeedFrom(arguments[0], arguments[1], speed, response);
}

bool AdvisoryCommandTable::SetModeFrom(const std::string &vehicle_id, const std::string &waypoint_name,
                                       const std::string &mode_token, std::string &response) {
   int vehicle_index, waypoint_index;
   if (!LocateWaypoint(vehicle_id, waypoint_name, vehicle_index, waypoint_index, response)) {
      return false;
   }

   AfmsUtils::AdvisoryModes mode;
   if (!AfmsUtils::ParseAdvisoryMode(mode_token, mode)) {
      return Fail("Advisory mode " + mode_token + " does not exist for " + vehicle_id, response);
   }

   m_traffic.GetMutableRoute(vehicle_index).GetConstraints().SetAdvisoryMode(waypoint_index, mode);
   response = vehicle_id + " advisory mode " + AfmsUtils::GetAdvisoryModeString(mode) + " from " + waypoint_name;
   return true;
}

bool AdvisoryCommandTable::SetArrivalTimeAt(const std::string &vehicle_id, const std::string &waypoint_name,
                                            const std::string &time_of_day, std::string &response) {
   int vehicle_index, waypoint_index;
   if (!LocateWaypoint(vehicle_id, waypoint_name, vehicle_index, waypoint_index, response)) {
      return false;
   }

   Units::SecondsTime arrival_time;
   if (!TimeOfDay::Parse(time_of_day, arrival_time)) {
      return Fail("Arrival time " + time_of_day + " at " + waypoint_name + " for " + vehicle_id +
                        " is not HH:MM:SS",
                  response);
   }

   m_traffic.GetMutableRoute(vehicle_index).GetConstraints().SetArrivalTime(waypoint_index, arrival_time);
   response = vehicle_id + " arrival time " + TimeOfDay::Format(arrival_time) + " at " + waypoint_name;
   return true;
}

bool AdvisoryCommandTable::SetWindowSizeAt(const std::string &vehicle_id, const std::string &waypoint_name,
                                           const std::string &window_size, std::string &response) {
   int vehicle_index, waypoint_index;
   if (!LocateWaypoint(vehicle_id, waypoint_name, vehicle_index, waypoint_index, response)) {
      return false;
   }

   Units::SecondsTime size;
   if (!AfmsUtils::ParseWholeSeconds(window_size, size)) {
      return Fail("Time window size " + window_size + " at " + waypoint_name + " for " + vehicle_id +
                        " is not a number of seconds",
                  response);
   }

   m_traffic.GetMutableRoute(vehicle_index).GetConstraints().SetWindowSize(waypoint_index, size);
   response = vehicle_id + " time window " + std::to_string(static_cast<long>(size.value())) + " s at " +
              waypoint_name;
   return true;
}

bool AdvisoryCommandTable::SetArrivalTimeAndWindowAt(const std::string &vehicle_id,
                                                     const std::string &waypoint_name,
                                                     const std::string &time_of_day,
                                                     const std::optional<std::string> &window_size,
                                                     std::string &response) {
   if (!window_size.has_value()) {
      return SetArrivalTimeAt(vehicle_id, waypoint_name, time_of_day, response);
   }

   int vehicle_index, waypoint_index;
   if (!LocateWaypoint(vehicle_id, waypoint_name, vehicle_index, waypoint_index, response)) {
      return false;
   }

   // both values are checked before either is stored
   Units::SecondsTime arrival_time;
   if (!TimeOfDay::Parse(time_of_day, arrival_time)) {
      return Fail("Arrival time " + time_of_day + " at " + waypoint_name + " for " + vehicle_id +
                        " is not HH:MM:SS",
                  response);
   }
   Units::SecondsTime size;
   if (!AfmsUtils::ParseWholeSeconds(*window_size, size)) {
      return Fail("Time window size " + *window_size + " at " + waypoint_name + " for " + vehicle_id +
                        " is not a number of seconds",
                  response);
   }

   WaypointConstraintStore &constraints = m_traffic.GetMutableRoute(vehicle_index).GetConstraints();
   constraints.SetArrivalTime(waypoint_index, arrival_time);
   constraints.SetWindowSize(waypoint_index, size);
   response = vehicle_id + " arrival time " + TimeOfDay::Format(arrival_time) + " +/- " +
              std::to_string(static_cast<long>(size.value()) / 2) + " s at " + waypoint_name;
   return true;
}

bool AdvisoryCommandTable::SetPreferredSpeedFrom(const std::string &vehicle_id, const std::string &waypoint_name,
                                                 const std::optional<std::string> &speed, std::string &response) {
   int vehicle_index, waypoint_index;
   if (!LocateWaypoint(vehicle_id, waypoint_name, vehicle_index, waypoint_index, response)) {
      return false;
   }

   PreferredSpeed preferred_speed;
   if (speed.has_value()) {
      if (!AfmsUtils::ParseSpeedToken(*speed, preferred_speed)) {
         return Fail("Speed " + *speed + " for " + vehicle_id + " at " + waypoint_name + " is not a valid speed",
                     response);
      }
   } else {
      const double reference_mach = m_traffic.GetVehicleState(vehicle_index).m_reference_cruise_mach;
      if (reference_mach <= 0 || reference_mach >= 1.0) {
         return Fail(vehicle_id + " has no usable reference cruise Mach", response);
      }
      preferred_speed = PreferredSpeed::Mach(reference_mach);
   }

   m_traffic.GetMutableRoute(vehicle_index).GetConstraints().SetPreferredSpeed(waypoint_index, preferred_speed);
   response = vehicle_id + " preferred speed from " + waypoint_name;
   return true;
}

bool AdvisoryCommandTable::LocateWaypoint(const std::string &vehicle_id, const std::string &waypoint_name,
                                          int &vehicle_index, int &waypoint_index, std::string &response) const {
   vehicle_index = m_traffic.FindVehicleIndex(vehicle_id);
   if (vehicle_index == AfmsUtils::UNDEFINED_INDEX) {
      return Fail("Vehicle " + vehicle_id + " not found", response);
   }

   waypoint_index = m_traffic.GetRoute(vehicle_index).FindWaypointIndex(waypoint_name);
   if (waypoint_index == AfmsUtils::UNDEFINED_INDEX) {
      return Fail(waypoint_name + " not found in route of " + vehicle_id, response);
   }
   return true;
}

bool AdvisoryCommandTable::Fail(const std::string &message, std::string &response) const {
   LOG4CPLUS_WARN(m_logger, message);
   response = message;
   return false;
}
