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

#include "afms/TimeOfDay.h"

#include <cmath>
#include <iomanip>
#include <sstream>

using namespace afms::open_source;

log4cplus::Logger TimeOfDay::m_logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("TimeOfDay"));

const long TimeOfDay::SECONDS_PER_DAY = 86400;

Units::SecondsTime TimeOfDay::SecondsUntil(const Units::Time target_time_of_day,
                                           const Units::Time current_time_of_day) {
   const long target_seconds = static_cast<long>(Normalize(target_time_of_day).value());
   const long current_seconds = static_cast<long>(Normalize(current_time_of_day).value());

   long difference = target_seconds - current_seconds;
   if (difference < -SECONDS_PER_DAY / 2) {
      // more than half a day behind, next occurrence is tomorrow
      difference += SECONDS_PER_DAY;
   } else if (difference >= SECONDS_PER_DAY / 2) {
      // more than half a day ahead, it was passed yesterday
      difference -= SECONDS_PER_DAY;
   }

   return Units::SecondsTime(static_cast<double>(difference));
}

Units::SecondsTime TimeOfDay::Normalize(const Units::Time time) {
   double seconds = std::fmod(Units::SecondsTime(time).value(), static_cast<double>(SECONDS_PER_DAY));
   if (seconds < 0) {
      seconds += SECONDS_PER_DAY;
   }
   return Units::SecondsTime(seconds);
}

bool TimeOfDay::Parse(const std::string &text, Units::SecondsTime &time_of_day) {
   std::istringstream stream(text);
   int hours, minutes, seconds;
   char first_separator, second_separator;
   std::string trailing;

   if (!(stream >> hours >> first_separator >> minutes >> second_separator >> seconds)) {
      LOG4CPLUS_DEBUG(m_logger, "Unable to parse time of day: " << text);
      return false;
   }
   if (first_separator != ':' || second_separator != ':' || (stream >> trailing)) {
      LOG4CPLUS_DEBUG(m_logger, "Malformed time of day: " << text);
      return false;
   }
   if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59 || seconds < 0 || seconds > 59) {
      LOG4CPLUS_DEBUG(m_logger, "Time of day out of range: " << text);
      return false;
   }

   time_of_day = Units::SecondsTime(hours * 3600.0 + minutes * 60.0 + seconds);
   return true;
}

std::string TimeOfDay::Format(const Units::Time time_of_day) {
   const long total_seconds = static_cast<long>(Normalize(time_of_day).value());

   std::ostringstream stream;
   stream << std::setfill('0') << std::setw(2) << total_seconds / 3600 << ":" << std::setw(2)
          << (total_seconds % 3600) / 60 << ":" << std::setw(2) << total_seconds % 60;
   return stream.str();
}
