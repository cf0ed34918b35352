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
#include <vector>
#include <scalar/Time.h>
#include "afms/AfmsUtils.h"
#include "afms/PreferredSpeed.h"
#include "public/Logging.h"

namespace afms {
namespace open_source {

/**
 * Per-waypoint advisory annotations of a route: arrival time, window size,
 * advisory mode and preferred speed. The four sequences always have the length
 * of the waypoint sequence they annotate. Structural edits are only performed
 * through AnnotatedRoute so that the two cannot drift apart.
 */
class WaypointConstraintStore {
   friend class AnnotatedRoute;

  public:
   explicit WaypointConstraintStore(const Units::SecondsTime standard_window_size);

   ~WaypointConstraintStore() = default;

   int Size() const;

   const std::optional<Units::SecondsTime> &GetArrivalTime(const int index) const;

   Units::SecondsTime GetWindowSize(const int index) const;

   AfmsUtils::AdvisoryModes GetAdvisoryMode(const int index) const;

   const std::optional<PreferredSpeed> &GetPreferredSpeed(const int index) const;

   Units::SecondsTime GetStandardWindowSize() const;

   void SetArrivalTime(const int index, const Units::SecondsTime time_of_day);

   void ClearArrivalTime(const int index);

   void SetWindowSize(const int index, const Units::SecondsTime window_size);

   void SetAdvisoryMode(const int index, const AfmsUtils::AdvisoryModes mode);

   void SetPreferredSpeed(const int index, const PreferredSpeed &speed);

   void ClearPreferredSpeed(const int index);

  private:
   static log4cplus::Logger m_logger;

   void Insert(const int index);

   void Overwrite(const int index);

   void Erase(const int index);

   void Clear();

   void CheckIndex(const int index, const char *caller) const;

   Units::SecondsTime m_standard_window_size;
   std::vector<std::optional<Units::SecondsTime> > m_arrival_times;
   std::vector<Units::SecondsTime> m_window_sizes;
   std::vector<AfmsUtils::AdvisoryModes> m_advisory_modes;
   std::vector<std::optional<PreferredSpeed> > m_preferred_speeds;
};

inline int WaypointConstraintStore::Size() const { return static_cast<int>(m_advisory_modes.size()); }

inline Units::SecondsTime WaypointConstraintStore::GetStandardWindowSize() const { return m_standard_window_size; }
}  // namespace open_source
}  // namespace afms
