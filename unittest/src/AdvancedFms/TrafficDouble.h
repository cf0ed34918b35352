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
#include <vector>
#include "afms/AfmsConfiguration.h"
#include "afms/AfmsUtils.h"
#include "afms/AnnotatedRoute.h"
#include "afms/TrafficInterface.h"
#include "afms/VehicleState.h"

namespace afms {
namespace test {

/**
 * Traffic made of hand-built vehicles. Speed commands are recorded per vehicle.
 */
class TrafficDouble : public afms::open_source::TrafficInterface {
  public:
   TrafficDouble() : m_time_of_day(0), m_states(), m_routes(), m_commands() {}

   int AddVehicle(const afms::open_source::VehicleState &state, const afms::open_source::AnnotatedRoute &route) {
      m_states.push_back(state);
      m_routes.push_back(route);
      m_commands.push_back(std::vector<afms::open_source::SpeedCommand>());
      return static_cast<int>(m_states.size()) - 1;
   }

   void SetTimeOfDay(const Units::SecondsTime time_of_day) { m_time_of_day = time_of_day; }

   Units::SecondsTime GetTimeOfDay() const { return m_time_of_day; }

   int GetVehicleCount() const { return static_cast<int>(m_states.size()); }

   afms::open_source::VehicleState GetVehicleState(const int vehicle_index) const {
      return m_states.at(vehicle_index);
   }

   const afms::open_source::AnnotatedRoute &GetRoute(const int vehicle_index) const {
      return m_routes.at(vehicle_index);
   }

   afms::open_source::AnnotatedRoute &GetMutableRoute(const int vehicle_index) { return m_routes.at(vehicle_index); }

   int FindVehicleIndex(const std::string &vehicle_id) const {
      for (size_t i = 0; i < m_states.size(); ++i) {
         if (m_states[i].m_id == vehicle_id) {
            return static_cast<int>(i);
         }
      }
      return afms::open_source::AfmsUtils::UNDEFINED_INDEX;
   }

   void IssueSpeedCommand(const int vehicle_index, const afms::open_source::SpeedCommand &command) {
      m_commands.at(vehicle_index).push_back(command);
   }

   const std::vector<afms::open_source::SpeedCommand> &GetCommands(const int vehicle_index) const {
      return m_commands.at(vehicle_index);
   }

   afms::open_source::VehicleState &GetMutableState(const int vehicle_index) { return m_states.at(vehicle_index); }

  private:
   Units::SecondsTime m_time_of_day;
   std::vector<afms::open_source::VehicleState> m_states;
   std::vector<afms::open_source::AnnotatedRoute> m_routes;
   std::vector<std::vector<afms::open_source::SpeedCommand> > m_commands;
};

// along the equator one degree of longitude spans R * pi / 180 meters
inline Units::DegreesAngle LongitudeEastOf(const double meters) {
   return Units::RadiansAngle(meters / afms::open_source::AfmsUtils::MEAN_EARTH_RADIUS.value());
}

inline afms::open_source::Waypoint EquatorWaypoint(const std::string &name, const double meters_east,
                                                   const Units::Length altitude = Units::FeetLength(0)) {
   return afms::open_source::Route::MakeWaypoint(name, Units::DegreesAngle(0), LongitudeEastOf(meters_east),
                                                 altitude);
}

inline afms::open_source::VehicleState CruiseStateAt(const std::string &id, const double meters_east,
                                                     const Units::Speed cas) {
   afms::open_source::VehicleState state;
   state.m_id = id;
   state.m_latitude = Units::DegreesAngle(0);
   state.m_longitude = LongitudeEastOf(meters_east);
   state.m_altitude = Units::FeetLength(0);
   state.m_cas = cas;
   state.m_tas = cas;
   state.m_flight_phase = afms::open_source::VehicleState::CRUISE;
   state.m_reference_cruise_mach = 0.78;
   return state;
}

inline afms::open_source::AnnotatedRoute MakeEmptyRoute() {
   return afms::open_source::AnnotatedRoute(
         afms::open_source::AfmsConfiguration::GetDefaultConfiguration().m_standard_window_size);
}
}  // namespace test
}  // namespace afms
