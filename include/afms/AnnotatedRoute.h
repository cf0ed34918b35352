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
#include "afms/Route.h"
#include "afms/WaypointConstraintStore.h"

namespace afms {
namespace open_source {

/**
 * A route together with its advisory annotations. Every structural edit is
 * applied to both at the same index, so the constraint store always has one
 * entry per waypoint. New and overwritten waypoints start unconstrained, with
 * the standard window size and mode CONTINUE.
 */
class AnnotatedRoute {
  public:
   explicit AnnotatedRoute(const Units::SecondsTime standard_window_size);

   ~AnnotatedRoute() = default;

   /**
    * @param index position of the new waypoint, or of the waypoint to replace
    * @param overwrite replace the waypoint at index instead of inserting before it
    */
   void AddWaypoint(const int index, const Waypoint &waypoint, const bool overwrite);

   void AppendWaypoint(const Waypoint &waypoint);

   void DeleteWaypoint(const int index);

   void Clear();

   int Size() const;

   int FindWaypointIndex(const std::string &name) const;

   int GetActiveWaypointIndex() const;

   void SetActiveWaypointIndex(const int index);

   const Route &GetRoute() const;

   const WaypointConstraintStore &GetConstraints() const;

   WaypointConstraintStore &GetConstraints();

  private:
   static log4cplus::Logger m_logger;

   Route m_route;
   WaypointConstraintStore m_constraints;
};

inline int AnnotatedRoute::Size() const { return m_route.Size(); }

inline int AnnotatedRoute::FindWaypointIndex(const std::string &name) const { return m_route.FindWaypointIndex(name); }

inline int AnnotatedRoute::GetActiveWaypointIndex() const { return m_route.GetActiveWaypointIndex(); }

inline void AnnotatedRoute::SetActiveWaypointIndex(const int index) { m_route.SetActiveWaypointIndex(index); }

inline const Route &AnnotatedRoute::GetRoute() const { return m_route; }

inline const WaypointConstraintStore &AnnotatedRoute::GetConstraints() const { return m_constraints; }

inline WaypointConstraintStore &AnnotatedRoute::GetConstraints() { return m_constraints; }
}  // namespace open_source
}  // namespace afms
