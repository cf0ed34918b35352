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

#include "afms/AfmsUtils.h"

#include <cctype>
#include <cmath>
#include <sstream>
#include "afms/PreferredSpeed.h"

using namespace afms::open_source;

log4cplus::Logger AfmsUtils::m_logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("AfmsUtils"));

const int AfmsUtils::UNDEFINED_INDEX = -1;
const Units::MetersPerSecondSpeed AfmsUtils::MINIMUM_CAS(1.0);
const Units::MetersPerSecondSpeed AfmsUtils::TRANSIENT_SPEED_TOLERANCE(1.0);
const Units::MetersLength AfmsUtils::MEAN_EARTH_RADIUS(6371000.0);

std::map<AfmsUtils::AdvisoryModes, std::string> AfmsUtils::advisory_mode_dictionary = {
      {AdvisoryModes::OFF, "OFF"}, {AdvisoryModes::CONTINUE, "CONTINUE"}, {AdvisoryModes::OWN, "OWN"},
      {AdvisoryModes::RTA, "RTA"}, {AdvisoryModes::TW, "TW"}};

bool AfmsUtils::ParseAdvisoryMode(const std::string &token, AdvisoryModes &mode) {
   std::string upper_token(token);
   for (char &c : upper_token) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
   }

   for (std::map<AdvisoryModes, std::string>::const_iterator it = advisory_mode_dictionary.begin();
        it != advisory_mode_dictionary.end(); ++it) {
      if (it->second == upper_token) {
         mode = it->first;
         return true;
      }
   }
   return false;
}

std::string AfmsUtils::GetAdvisoryModeString(const AdvisoryModes mode) {
   std::map<AdvisoryModes, std::string>::const_iterator it = advisory_mode_dictionary.find(mode);
   if (it == advisory_mode_dictionary.end()) {
      return "UNKNOWN(" + std::to_string(static_cast<int>(mode)) + ")";
   }
   return it->second;
}

Units::Length AfmsUtils::CalculateGreatCircleDistance(const Units::Angle latitude_1, const Units::Angle longitude_1,
                                                      const Units::Angle latitude_2, const Units::Angle longitude_2) {
   // haversine on a sphere of MEAN_EARTH_RADIUS
   const Units::RadiansAngle half_delta_latitude = (latitude_2 - latitude_1) / 2.0;
   const Units::RadiansAngle half_delta_longitude = (longitude_2 - longitude_1) / 2.0;

   double h = Units::sin(half_delta_latitude) * Units::sin(half_delta_latitude) +
              Units::cos(latitude_1) * Units::cos(latitude_2) * Units::sin(half_delta_longitude) *
                    Units::sin(half_delta_longitude);
   if (h > 1.0) {
      h = 1.0;
   }

   return Units::MetersLength(2.0 * MEAN_EARTH_RADIUS.value() * asin(sqrt(h)));
}

bool AfmsUtils::ParseSpeedToken(const std::string &token, PreferredSpeed &speed) {
   if (token.empty()) {
      return false;
   }

   bool force_mach = false;
   std::string number_text(token);
   if (number_text[0] == 'M' || number_text[0] == 'm') {
      force_mach = true;
      number_text.erase(0, 1);
   }

   std::istringstream stream(number_text);
   double value;
   std::string trailing;
   if (!(stream >> value) || (stream >> trailing)) {
      LOG4CPLUS_DEBUG(m_logger, "speed token is not a number: " << token);
      return false;
   }

   if (!std::isfinite(value) || value <= 0.0) {
      return false;
   }

   if (force_mach || value < 1.0) {
      if (value >= 1.0) {
         // M78 style tokens
         value *= 0.01;
      }
      if (value >= 1.0) {
         LOG4CPLUS_DEBUG(m_logger, "Mach out of range: " << token);
         return false;
      }
      speed = PreferredSpeed::Mach(value);
      return true;
   }

   const Units::KnotsSpeed cas(value);
   if (cas < MINIMUM_CAS) {
      return false;
   }
   speed = PreferredSpeed::Cas(cas);
   return true;
}

bool AfmsUtils::ParseWholeSeconds(const std::string &token, Units::SecondsTime &seconds) {
   std::istringstream stream(token);
   long value;
   std::string trailing;
   if (!(stream >> value) || (stream >> trailing) || value < 0) {
      return false;
   }
   seconds = Units::SecondsTime(static_cast<double>(value));
   return true;
}
