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

#include "afms/ConstraintLocator.h"

#include <algorithm>
#include "afms/AfmsUtils.h"

using namespace afms::open_source;

int ConstraintLocator::FindConstrainedIndex(const WaypointConstraintStore &constraints, const int from_index) {
   for (int i = std::max(from_index, 0); i < constraints.Size(); ++i) {
      if (constraints.GetArrivalTime(i).has_value()) {
         return i;
      }
   }
   return AfmsUtils::UNDEFINED_INDEX;
}

std::optional<ConstraintWindow> ConstraintLocator::LocateConstraint(const WaypointConstraintStore &constraints,
                                                                    const int from_index) {
   const int end_index = FindConstrainedIndex(constraints, from_index);
   if (end_index == AfmsUtils::UNDEFINED_INDEX) {
      return std::nullopt;
   }

   ConstraintWindow window;
   window.m_start_index = from_index;
   window.m_end_index = end_index;
   window.m_time_of_day = constraints.GetArrivalTime(end_index).value();
   window.m_window_size = constraints.GetWindowSize(end_index);
   return window;
}

ConstraintWindow ConstraintLocator::LocateNextConstraintAfter(const WaypointConstraintStore &constraints,
                                                              const ConstraintWindow &current) {
   const int end_index = FindConstrainedIndex(constraints, current.m_end_index + 1);
   if (end_index == AfmsUtils::UNDEFINED_INDEX) {
      return current;
   }

   ConstraintWindow next(current);
   next.m_end_index = end_index;
   next.m_time_of_day = constraints.GetArrivalTime(end_index).value();
   next.m_window_size = constraints.GetWindowSize(end_index);
   return next;
}
