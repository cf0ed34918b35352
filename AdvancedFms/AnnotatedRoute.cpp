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

#include "afms/AnnotatedRoute.h"

using namespace afms::open_source;

log4cplus::Logger AnnotatedRoute::m_logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("AnnotatedRoute"));

AnnotatedRoute::AnnotatedRoute(const Units::SecondsTime standard_window_size)
   : m_route(), m_constraints(standard_window_size) {}

void AnnotatedRoute::AddWaypoint(const int index, const Waypoint &waypoint, const bool overwrite) {
   if (overwrite) {
      // route first: it rejects a bad index before the annotations are touched
      m_route.Overwrite(index, waypoint);
      m_constraints.Overwrite(index);
   } else {
      m_route.Insert(index, waypoint);
      m_constraints.Insert(index);
   }
   LOG4CPLUS_TRACE(m_logger, (overwrite ? "overwrote " : "inserted ") << waypoint.m_name << " at " << index);
}

void AnnotatedRoute::AppendWaypoint(const Waypoint &waypoint) { AddWaypoint(Size(), waypoint, false); }

void AnnotatedRoute::DeleteWaypoint(const int index) {
   m_route.Erase(index);
   m_constraints.Erase(index);
}

void AnnotatedRoute::Clear() {
   m_route.Clear();
   m_constraints.Clear();
}
