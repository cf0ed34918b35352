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

#include <optional>
#include <scalar/Time.h>
#include "afms/WaypointConstraintStore.h"

namespace afms {
namespace open_source {

/**
 * The stretch of route from start_index to the constrained waypoint at end_index.
 */
struct ConstraintWindow {
   int m_start_index;
   int m_end_index;
   Units::SecondsTime m_time_of_day;
   Units::SecondsTime m_window_size;
};

class ConstraintLocator {
  public:
   /**
    * Finds the first waypoint at or after from_index that carries an arrival time.
    */
   static std::optional<ConstraintWindow> LocateConstraint(const WaypointConstraintStore &constraints,
                                                           const int from_index);

   /**
    * Finds the first constrained waypoint strictly after current.m_end_index, keeping
    * current.m_start_index. Returns current itself when nothing follows.
    */
   static ConstraintWindow LocateNextConstraintAfter(const WaypointConstraintStore &constraints,
                                                     const ConstraintWindow &current);

  private:
   static int FindConstrainedIndex(const WaypointConstraintStore &constraints, const int from_index);
};
}  // namespace open_source
}  // namespace afms
