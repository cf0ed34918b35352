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

#include "gtest/gtest.h"
#include "afms/AfmsConfiguration.h"
#include "afms/KinematicSpeedSolver.h"
#include "public/StandardAtmosphere.h"

using namespace afms::open_source;

namespace afms {
namespace test {

class KinematicSpeedSolverTest : public ::testing::Test {
  protected:
   KinematicSpeedSolverTest()
      : atmosphere(StandardAtmosphere::MakeInstanceFromTemperatureOffset(Units::CelsiusTemperature(0))),
        solver(atmosphere, AfmsConfiguration::GetDefaultConfiguration()) {}

   static SpeedProfile MakeProfile(const std::vector<double> &distances_m, const std::vector<double> &altitudes_ft) {
      SpeedProfile profile;
      for (double distance : distances_m) {
         profile.m_distances.push_back(Units::MetersLength(distance));
      }
      for (double altitude : altitudes_ft) {
         profile.m_altitudes.push_back(Units::FeetLength(altitude));
      }
      return profile;
   }

   static double Seconds(const Units::Time time) { return Units::SecondsTime(time).value(); }

   static double MetersPerSecond(const Units::Speed speed) { return Units::MetersPerSecondSpeed(speed).value(); }

   std::shared_ptr<Atmosphere> atmosphere;
   KinematicSpeedSolver solver;
};

TEST_F(KinematicSpeedSolverTest, ten_kilometers_in_ten_minutes) {
   const SpeedProfile profile = MakeProfile({10000}, {0});
   const Units::Speed cas =
         solver.SolveCasForTimeBudget(profile, Units::SecondsTime(600), Units::MetersPerSecondSpeed(200));

   // the deceleration from 200 m/s cannot complete inside the segment
   EXPECT_NEAR(10000.0 / 600.0, MetersPerSecond(cas), 0.05);
   EXPECT_NEAR(600, Seconds(solver.EtaForCas(profile, cas)), 3);
}

TEST_F(KinematicSpeedSolverTest, current_speed_already_on_time) {
   const SpeedProfile profile = MakeProfile({40000, 25000, 60000}, {0, 0, 0});
   const Units::MetersPerSecondSpeed current_cas(200);
   const Units::Time budget = solver.EtaForCas(profile, current_cas);

   EXPECT_NEAR(200, MetersPerSecond(solver.SolveCasForTimeBudget(profile, budget, current_cas)), 0.5);
}

TEST_F(KinematicSpeedSolverTest, current_speed_already_on_time_across_levels) {
   const SpeedProfile profile = MakeProfile({40000, 25000, 60000, 30000}, {33000, 35000, -1, 37000});
   const Units::KnotsSpeed current_cas(260);
   const Units::Time budget = solver.EtaForCas(profile, current_cas);

   const Units::Speed cas = solver.SolveCasForTimeBudget(profile, budget, current_cas);
   EXPECT_NEAR(MetersPerSecond(current_cas), MetersPerSecond(cas), 0.5);
}

TEST_F(KinematicSpeedSolverTest, speed_change_inside_first_segment) {
   const SpeedProfile profile = MakeProfile({10000, 110000}, {0, 0});
   const Units::Speed cas =
         solver.SolveCasForTimeBudget(profile, Units::SecondsTime(700), Units::MetersPerSecondSpeed(175));

   EXPECT_NEAR(171.41, MetersPerSecond(cas), 0.1);
   EXPECT_NEAR(700, Seconds(solver.EtaForCas(profile, cas)), 1);
}

TEST_F(KinematicSpeedSolverTest, speed_change_starts_from_measured_tas) {
   const SpeedProfile profile = MakeProfile({10000, 110000}, {0, 0});
   const Units::MetersPerSecondSpeed current_cas(175);

   const Units::Speed from_cas = solver.SolveCasForTimeBudget(profile, Units::SecondsTime(700), current_cas);
   const Units::Speed from_same_tas = solver.SolveCasForTimeBudget(
         profile, Units::SecondsTime(700), current_cas, atmosphere->CAS2TAS(current_cas, Units::FeetLength(0)));
   EXPECT_DOUBLE_EQ(MetersPerSecond(from_cas), MetersPerSecond(from_same_tas));

   // a faster measured TAS covers more of the first segment while slowing down
   const Units::Speed from_faster_tas = solver.SolveCasForTimeBudget(profile, Units::SecondsTime(700), current_cas,
                                                                     Units::MetersPerSecondSpeed(200));
   EXPECT_LT(MetersPerSecond(from_faster_tas), MetersPerSecond(from_cas) - 0.5);
}

TEST_F(KinematicSpeedSolverTest, acceleration_needed) {
   const SpeedProfile profile = MakeProfile({50000, 50000}, {0, 0});
   const Units::Speed cas =
         solver.SolveCasForTimeBudget(profile, Units::SecondsTime(500), Units::MetersPerSecondSpeed(180));

   EXPECT_GT(MetersPerSecond(cas), 180);
   EXPECT_NEAR(500, Seconds(solver.EtaForCas(profile, cas)), 3);
}

TEST_F(KinematicSpeedSolverTest, non_positive_budget_keeps_current_speed) {
   const SpeedProfile profile = MakeProfile({10000}, {0});
   EXPECT_DOUBLE_EQ(190, MetersPerSecond(solver.SolveCasForTimeBudget(profile, Units::SecondsTime(0),
                                                                      Units::MetersPerSecondSpeed(190))));
   EXPECT_DOUBLE_EQ(190, MetersPerSecond(solver.SolveCasForTimeBudget(profile, Units::SecondsTime(-30),
                                                                      Units::MetersPerSecondSpeed(190))));
}

TEST_F(KinematicSpeedSolverTest, zero_distance_segments_take_no_time) {
   const SpeedProfile profile = MakeProfile({0, 20000, 0}, {0, 0, 0});
   EXPECT_NEAR(100, Seconds(solver.EtaForCas(profile, Units::MetersPerSecondSpeed(200))), 0.5);

   const SpeedProfile empty_path = MakeProfile({0}, {0});
   EXPECT_DOUBLE_EQ(0, Seconds(solver.EtaForCas(empty_path, Units::MetersPerSecondSpeed(200))));
   EXPECT_GE(MetersPerSecond(solver.SolveCasForTimeBudget(empty_path, Units::SecondsTime(60),
                                                          Units::MetersPerSecondSpeed(200))),
             MetersPerSecond(AfmsUtils::MINIMUM_CAS));
}

TEST_F(KinematicSpeedSolverTest, never_below_minimum_cas) {
   const SpeedProfile profile = MakeProfile({10}, {0});
   const Units::Speed cas =
         solver.SolveCasForTimeBudget(profile, Units::SecondsTime(86000), Units::MetersPerSecondSpeed(200));
   EXPECT_GE(MetersPerSecond(cas), MetersPerSecond(AfmsUtils::MINIMUM_CAS));
}

TEST_F(KinematicSpeedSolverTest, eta_holds_altitude_of_previous_segment) {
   const SpeedProfile held = MakeProfile({30000, 30000}, {30000, -1});
   const SpeedProfile explicit_levels = MakeProfile({30000, 30000}, {30000, 30000});
   const Units::KnotsSpeed cas(250);

   EXPECT_DOUBLE_EQ(Seconds(solver.EtaForCas(explicit_levels, cas)), Seconds(solver.EtaForCas(held, cas)));

   // higher true airspeed at altitude
   const SpeedProfile sea_level = MakeProfile({30000, 30000}, {0, 0});
   EXPECT_LT(Seconds(solver.EtaForCas(held, cas)), Seconds(solver.EtaForCas(sea_level, cas)));
}

TEST_F(KinematicSpeedSolverTest, mismatched_profile_throws) {
   const SpeedProfile profile = MakeProfile({10000, 10000}, {0});
   EXPECT_THROW(solver.EtaForCas(profile, Units::MetersPerSecondSpeed(200)), std::invalid_argument);
   EXPECT_THROW(solver.SolveCasForTimeBudget(profile, Units::SecondsTime(100), Units::MetersPerSecondSpeed(200)),
                std::invalid_argument);
}
}  // namespace test
}  // namespace afms
