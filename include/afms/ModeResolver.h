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
#include "afms/AfmsUtils.h"
#include "afms/PreferredSpeed.h"
#include "afms/WaypointConstraintStore.h"

namespace afms {
namespace open_source {

/**
 * Resolves the advisory settings in effect at the active waypoint. A setting on a
 * waypoint applies from the moment that waypoint is passed, so only waypoints
 * before the active index are considered and the nearest one wins.
 */
class ModeResolver {
  public:
   /**
    * @return mode of the nearest passed waypoint whose mode is not CONTINUE, OFF if there is none
    */
   static AfmsUtils::AdvisoryModes ResolveMode(const WaypointConstraintStore &constraints, const int active_index);

   /**
    * @return preferred speed of the nearest passed waypoint that carries one
    */
   static std::optional<PreferredSpeed> ResolvePreferredSpeed(const WaypointConstraintStore &constraints,
                                                              const int active_index);

  private:
   static int LastPassedIndex(const WaypointConstraintStore &constraints, const int active_index);
};
}  // namespace open_source
}  // namespace afms
