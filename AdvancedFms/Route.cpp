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

#include "afms/Route.h"

#include <stdexcept>
#include "afms/AfmsUtils.h"

using namespace afms::open_source;

log4cplus::Logger Route::m_logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("Route"));

Route::Route() : m_waypoints(), m_active_waypoint_index(0) {}

Waypoint Route::MakeWaypoint(const std::string &name, const Units::Angle latitude, const Units::Angle longitude,
                             const Units::Length altitude) {
   Waypoint waypoint;
   waypoint.m_name = name;
   waypoint.m_latitude = latitude;
   waypoint.m_longitude = longitude;
   waypoint.m_altitude = altitude;
   waypoint.m_distance_from_previous = Units::zero();
   return waypoint;
}

void Route::Insert(const int index, const Waypoint &waypoint) {
   if (index < 0 || index > Size()) {
      std::string msg = "Insert: index " + std::to_string(index) + " out of range for route of " +
                        std::to_string(Size()) + " waypoints";
      LOG4CPLUS_ERROR(m_logger, msg);
      throw std::out_of_range(msg);
   }

   m_waypoints.insert(m_waypoints.begin() + index, waypoint);
   if (index < m_active_waypoint_index) {
      ++m_active_waypoint_index;
   }

   UpdateLegDistance(index);
   UpdateLegDistance(index + 1);
}

void Route::Overwrite(const int index, const Waypoint &waypoint) {
   GetWaypoint(index);  // throws on a bad index

   m_waypoints[index] = waypoint;
   UpdateLegDistance(index);
   UpdateLegDistance(index + 1);
}

void Route::Erase(const int index) {
   GetWaypoint(index);  // throws on a bad index

   m_waypoints.erase(m_waypoints.begin() + index);
   if (index < m_active_waypoint_index) {
      --m_active_waypoint_index;
   }
   if (m_active_waypoint_index > Size()) {
      m_active_waypoint_index = Size();
   }

   UpdateLegDistance(index);
}

void Route::Clear() {
   m_waypoints.clear();
   m_active_waypoint_index = 0;
}

const Waypoint &Route::GetWaypoint(const int index) const {
   if (index < 0 || index >= Size()) {
      std::string msg = "index " + std::to_string(index) + " out of range for route of " + std::to_string(Size()) +
                        " waypoints";
      LOG4CPLUS_ERROR(m_logger, msg);
      throw std::out_of_range(msg);
   }
   return m_waypoints[index];
}

int Route::FindWaypointIndex(const std::string &name) const {
   for (int i = 0; i < Size(); ++i) {
      if (m_waypoints[i].m_name == name) {
         return i;
      }
   }
   return AfmsUtils::UNDEFINED_INDEX;
}

void Route::SetActiveWaypointIndex(const int index) {
   // index == Size() means the route has been flown
   if (index < 0 || index > Size()) {
      std::string msg = "active waypoint index " + std::to_string(index) + " out of range for route of " +
                        std::to_string(Size()) + " waypoints";
      LOG4CPLUS_ERROR(m_logger, msg);
      throw std::out_of_range(msg);
   }
   m_active_waypoint_index = index;
}

void Route::UpdateLegDistance(const int index) {
   if (index < 0 || index >= Size()) {
      return;
   }
   if (index == 0) {
      m_waypoints[0].m_distance_from_previous = Units::zero();
      return;
   }

   const Waypoint &previous = m_waypoints[index - 1];
   Waypoint &current = m_waypoints[index];
   current.m_distance_from_previous = AfmsUtils::CalculateGreatCircleDistance(
         previous.m_latitude, previous.m_longitude, current.m_latitude, current.m_longitude);
}
