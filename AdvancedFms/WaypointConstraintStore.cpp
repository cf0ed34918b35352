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

#include "afms/WaypointConstraintStore.h"

#include <stdexcept>
#include <string>

using namespace afms::open_source;

log4cplus::Logger WaypointConstraintStore::m_logger =
      log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("WaypointConstraintStore"));

WaypointConstraintStore::WaypointConstraintStore(const Units::SecondsTime standard_window_size)
   : m_standard_window_size(standard_window_size),
     m_arrival_times(),
     m_window_sizes(),
     m_advisory_modes(),
     m_preferred_speeds() {}

void WaypointConstraintStore::CheckIndex(const int index, const char *caller) const {
   if (index < 0 || index >= Size()) {
      std::string msg = std::string(caller) + ": waypoint index " + std::to_string(index) +
                        " out of range for " + std::to_string(Size()) + " waypoints";
      LOG4CPLUS_ERROR(m_logger, msg);
      throw std::out_of_range(msg);
   }
}

const std::optional<Units::SecondsTime> &WaypointConstraintStore::GetArrivalTime(const int index) const {
   CheckIndex(index, "GetArrivalTime");
   return m_arrival_times[index];
}

Units::SecondsTime WaypointConstraintStore::GetWindowSize(const int index) const {
   CheckIndex(index, "GetWindowSize");
   return m_window_sizes[index];
}

AfmsUtils::AdvisoryModes WaypointConstraintStore::GetAdvisoryMode(const int index) const {
   CheckIndex(index, "GetAdvisoryMode");
   return m_advisory_modes[index];
}

const std::optional<PreferredSpeed> &WaypointConstraintStore::GetPreferredSpeed(const int index) const {
   CheckIndex(index, "GetPreferredSpeed");
   return m_preferred_speeds[index];
}

void WaypointConstraintStore::SetArrivalTime(const int index, const Units::SecondsTime time_of_day) {
   CheckIndex(index, "SetArrivalTime");
   m_arrival_times[index] = time_of_day;
}

void WaypointConstraintStore::ClearArrivalTime(const int index) {
   CheckIndex(index, "ClearArrivalTime");
   m_arrival_times[index].reset();
}

void WaypointConstraintStore::SetWindowSize(const int index, const Units::SecondsTime window_size) {
   CheckIndex(index, "SetWindowSize");
   m_window_sizes[index] = window_size;
}

void WaypointConstraintStore::SetAdvisoryMode(const int index, const AfmsUtils::AdvisoryModes mode) {
   CheckIndex(index, "SetAdvisoryMode");
   m_advisory_modes[index] = mode;
}

void WaypointConstraintStore::SetPreferredSpeed(const int index, const PreferredSpeed &speed) {
   CheckIndex(index, "SetPreferredSpeed");
   m_preferred_speeds[index] = speed;
}

void WaypointConstraintStore::ClearPreferredSpeed(const int index) {
   CheckIndex(index, "ClearPreferredSpeed");
   m_preferred_speeds[index].reset();
}

void WaypointConstraintStore::Insert(const int index) {
   if (index < 0 || index > Size()) {
      std::string msg = "Insert: waypoint index " + std::to_string(index) + " out of range for " +
                        std::to_string(Size()) + " waypoints";
      LOG4CPLUS_ERROR(m_logger, msg);
      throw std::out_of_range(msg);
   }

   m_arrival_times.insert(m_arrival_times.begin() + index, std::optional<Units::SecondsTime>());
   m_window_sizes.insert(m_window_sizes.begin() + index, m_standard_window_size);
   m_advisory_modes.insert(m_advisory_modes.begin() + index, AfmsUtils::AdvisoryModes::CONTINUE);
   m_preferred_speeds.insert(m_preferred_speeds.begin() + index, std::optional<PreferredSpeed>());
}

void WaypointConstraintStore::Overwrite(const int index) {
   CheckIndex(index, "Overwrite");

   m_arrival_times[index].reset();
   m_window_sizes[index] = m_standard_window_size;
   m_advisory_modes[index] = AfmsUtils::AdvisoryModes::CONTINUE;
   m_preferred_speeds[index].reset();
}

void WaypointConstraintStore::Erase(const int index) {
   CheckIndex(index, "Erase");

   m_arrival_times.erase(m_arrival_times.begin() + index);
   m_window_sizes.erase(m_window_sizes.begin() + index);
   m_advisory_modes.erase(m_advisory_modes.begin() + index);
   m_preferred_speeds.erase(m_preferred_speeds.begin() + index);
}

void WaypointConstraintStore::Clear() {
   m_arrival_times.clear();
   m_window_sizes.clear();
   m_advisory_modes.clear();
   m_preferred_speeds.clear();
}
