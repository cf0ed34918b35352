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
#include <scalar/Time.h>
#include "public/Logging.h"

namespace afms {
namespace open_source {

/**
 * Arithmetic on wall-clock times of day. A time of day is a Units::Time measured
 * from midnight and carries no date.
 */
class TimeOfDay {
  public:
   static const long SECONDS_PER_DAY;

   /**
    * Signed whole seconds from current to the nearest occurrence of target, in
    * [-43200, 43200). A negative result means target has already passed.
    *
    * e.g. SecondsUntil(00:00:01, 23:59:59) is 2 s
    *      SecondsUntil(23:59:50, 00:00:05) is -15 s
    */
   static Units::SecondsTime SecondsUntil(const Units::Time target_time_of_day, const Units::Time current_time_of_day);

   static Units::SecondsTime Normalize(const Units::Time time);

   /**
    * Parses HH:MM:SS with hours 0-23.
    *
    * @param text
    * @param time_of_day untouched on failure
    * @return false if text is not a valid time of day
    */
   static bool Parse(const std::string &text, Units::SecondsTime &time_of_day);

   static std::string Format(const Units::Time time_of_day);

  private:
   static log4cplus::Logger m_logger;
};
}  // namespace open_source
}  // namespace afms
