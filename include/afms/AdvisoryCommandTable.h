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
#include <optional>
#include <string>
#include <vector>
#include <scalar/Time.h>
#include "afms/TrafficInterface.h"
#include "public/Logging.h"

namespace afms {
namespace open_source {

/**
 * Route-edit commands that annotate waypoints of a vehicle's route with advisory
 * settings. Every command takes the vehicle id and a waypoint name first; a waypoint
 * name refers to its first occurrence in the route. A failed command leaves the
 * route untouched and explains itself in the response text.
 *
 *    AFMS_FROM    acid wpname OFF|CONTINUE|OWN|RTA|TW
 *    RTA_AT       acid wpname HH:MM:SS
 *    TW_SIZE_AT   acid wpname seconds
 *    RTWA_AT      acid wpname HH:MM:SS [seconds]
 *    OWN_SPD_FROM acid wpname [speed]
 */
class AdvisoryCommandTable {
  public:
   explicit AdvisoryCommandTable(TrafficInterface &traffic);

   ~AdvisoryCommandTable() = default;

   /**
    * Checks the argument count of the named command and dispatches it.
    *
    * @param name command name, e.g. RTA_AT
    * @param arguments vehicle id followed by the command arguments
    * @param response confirmation or reason for failure
    * @return true if the command was applied
    */
   bool Execute(const std::string &name, const std::vector<std::string> &arguments, std::string &response);

   static bool IsCommand(const std::string &name);

   static std::string GetUsage(const std::string &name);

   bool SetModeFrom(const std::string &vehicle_id, const std::string &waypoint_name, const std::string &mode_token,
                    std::string &response);

   bool SetArrivalTimeAt(const std::string &vehicle_id, const std::string &waypoint_name,
                         const std::string &time_of_day, std::string &response);

   bool SetWindowSizeAt(const std::string &vehicle_id, const std::string &waypoint_name,
                        const std::string &window_size, std::string &response);

   bool SetArrivalTimeAndWindowAt(const std::string &vehicle_id, const std::string &waypoint_name,
                                  const std::string &time_of_day, const std::optional<std::string> &window_size,
                                  std::string &response);

   /**
    * An omitted speed selects the vehicle's reference cruise Mach.
    */
   bool SetPreferredSpeedFrom(const std::string &vehicle_id, const std::string &waypoint_name,
                              const std::optional<std::string> &speed, std::string &response);

  private:
   typedef bool (AdvisoryCommandTable::*CommandHandler)(const std::vector<std::string> &arguments,
                                                        std::string &response);

   struct CommandEntry {
      std::string m_usage;
      size_t m_min_arguments;
      size_t m_max_arguments;
      CommandHandler m_handler;
   };

   static log4cplus::Logger m_logger;
   static const std::map<std::string, CommandEntry> m_command_table;

   bool AfmsFrom(const std::vector<std::string> &arguments, std::string &response);

   bool RtaAt(const std::vector<std::string> &arguments, std::string &response);

   bool TwSizeAt(const std::vector<std::string> &arguments, std::string &response);

   bool RtwaAt(const std::vector<std::string> &arguments, std::string &response);

   bool OwnSpeedFrom(const std::vector<std::string> &arguments, std::string &response);

   bool LocateWaypoint(const std::string &vehicle_id, const std::string &waypoint_name, int &vehicle_index,
                       int &waypoint_index, std::string &response) const;

   bool Fail(const std::string &message, std::string &response) const;

   TrafficInterface &m_traffic;
};
}  // namespace open_source
}  // namespace afms
