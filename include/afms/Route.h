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
#include <vector>
#include <scalar/Angle.h>
#include <scalar/Length.h>
#include "public/Logging.h"

namespace afms {
namespace open_source {

struct Waypoint {
   std::string m_name;
   Units::DegreesAngle m_latitude;
   Units::DegreesAngle m_longitude;

   // negative when the waypoint carries no altitude
   Units::FeetLength m_altitude;

   // great-circle leg length from the preceding waypoint, zero for the first one
   Units::MetersLength m_distance_from_previous;
};

/**
 * Ordered waypoint sequence with an active-waypoint cursor. Leg distances are
 * recomputed from the waypoint positions after every structural edit.
 */
class Route {
  public:
   Route();

   ~Route() = default;

   static Waypoint MakeWaypoint(const std::string &name, const Units::Angle latitude, const Units::Angle longitude,
                                const Units::Length altitude);

   void Insert(const int index, const Waypoint &waypoint);

   void Overwrite(const int index, const Waypoint &waypoint);

   void Erase(const int index);

   void Clear();

   int Size() const;

   const Waypoint &GetWaypoint(const int index) const;

   const std::vector<Waypoint> &GetWaypoints() const;

   /**
    * @return index of the first waypoint with this name, UNDEFINED_INDEX if absent
    */
   int FindWaypointIndex(const std::string &name) const;

   int GetActiveWaypointIndex() const;

   void SetActiveWaypointIndex(const int index);

  private:
   static log4cplus::Logger m_logger;

   void UpdateLegDistance(const int index);

   std::vector<Waypoint> m_waypoints;
   int m_active_waypoint_index;
};

inline int Route::Size() const { return static_cast<int>(m_waypoints.size()); }

inline const std::vector<Waypoint> &Route::GetWaypoints() const { return m_waypoints; }

inline int Route::GetActiveWaypointIndex() const { return m_active_waypoint_index; }
}  // namespace open_source
}  // namespace afms
