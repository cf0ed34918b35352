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

#include "afms/ModeResolver.h"

#include <algorithm>

using namespace afms::open_source;

int ModeResolver::LastPassedIndex(const WaypointConstraintStore &constraints, const int active_index) {
   return std::min(active_index, constraints.Size()) - 1;
}

AfmsUtils::AdvisoryModes ModeResolver::ResolveMode(const WaypointConstraintStore &constraints,
                                                   const int active_index) {
   for (int i = LastPassedIndex(constraints, active_index); i >= 0; --i) {
      const AfmsUtils::AdvisoryModes mode = constraints.GetAdvisoryMode(i);
      if (mode != AfmsUtils::AdvisoryModes::CONTINUE) {
         return mode;
      }
   }
   return AfmsUtils::AdvisoryModes::OFF;
}

std::optional<PreferredSpeed> ModeResolver::ResolvePreferredSpeed(const WaypointConstraintStore &constraints,
                                                                  const int active_index) {
   for (int i = LastPassedIndex(constraints, active_index); i >= 0; --i) {
      const std::optional<PreferredSpeed> &speed = constraints.GetPreferredSpeed(i);
      if (speed.has_value()) {
         return speed;
      }
   }
   return std::nullopt;
}
