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

#include <map>
#include <string>
#include <scalar/Angle.h>
#include <scalar/Length.h>
#include <scalar/Speed.h>
#include <scalar/Time.h>
#include "public/Logging.h"

namespace afms {
namespace open_source {
class PreferredSpeed;

class AfmsUtils {
  public:
   static const int UNDEFINED_INDEX;
   static const Units::MetersPerSecondSpeed MINIMUM_CAS;
   static const Units::MetersPerSecondSpeed TRANSIENT_SPEED_TOLERANCE;
   static const Units::MetersLength MEAN_EARTH_RADIUS;

   /**
    * Advisory mode carried by a waypoint. CONTINUE inherits the nearest
    * explicit setting of an earlier waypoint and is never an effective mode.
    */
   enum AdvisoryModes {
      OFF = 0,
      CONTINUE,
      OWN,
      RTA,
      TW,
   };

   /**
    * This map is a simple container that provides retrieval of the command token of an advisory mode.
    * e.g. advisory_mode_dictionary.at(AfmsUtils::AdvisoryModes::TW)
    */
   static std::map<AfmsUtils::AdvisoryModes, std::string> advisory_mode_dictionary;

   static bool ParseAdvisoryMode(const std::string &token, AdvisoryModes &mode);

   static std::string GetAdvisoryModeString(const AdvisoryModes mode);

   static Units::Length CalculateGreatCircleDistance(const Units::Angle latitude_1, const Units::Angle longitude_1,
                                                     const Units::Angle latitude_2, const Units::Angle longitude_2);

   /**
    * Decodes a speed argument of a route command. Values below one are a Mach number,
    * values of one and above are calibrated airspeed in knots. A leading 'M' forces Mach.
    *
    * @param token
    * @param speed decoded speed, untouched on failure
    * @return false if the token is not a positive number
    */
   static bool ParseSpeedToken(const std::string &token, PreferredSpeed &speed);

   static bool ParseWholeSeconds(const std::string &token, Units::SecondsTime &seconds);

  private:
   static log4cplus::Logger m_logger;
};
}  // namespace open_source
}  // namespace afms
