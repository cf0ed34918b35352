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
#include "afms/AdvisoryCommandTable.h"
#include "TrafficDouble.h"

using namespace afms::open_source;

namespace afms {
namespace test {

class AdvisoryCommandTableTest : public ::testing::Test {
  protected:
   AdvisoryCommandTableTest() : traffic(), commands(traffic) {
      AnnotatedRoute route = MakeEmptyRoute();
      route.AppendWaypoint(EquatorWaypoint("START", 0));
      route.AppendWaypoint(EquatorWaypoint("ALPHA", 10000));
      route.AppendWaypoint(EquatorWaypoint("BRAVO", 30000));
      route.AppendWaypoint(EquatorWaypoint("ALPHA", 50000));
      vehicle = traffic.AddVehicle(CruiseStateAt("KL204", 0, Units::MetersPerSecondSpeed(200)), route);
   }

   bool Run(const std::string &name, const std::vector<std::string> &arguments) {
      return commands.Execute(name, arguments, response);
   }

   const WaypointConstraintStore &Constraints() const { return traffic.GetRoute(vehicle).GetConstraints(); }

   void ExpectUntouched() const {
      for (int i = 0; i < Constraints().Size(); ++i) {
         EXPECT_FALSE(Constraints().GetArrivalTime(i).has_value());
         EXPECT_DOUBLE_EQ(60, Constraints().GetWindowSize(i).value());
         EXPECT_EQ(AfmsUtils::AdvisoryModes::CONTINUE, Constraints().GetAdvisoryMode(i));
         EXPECT_FALSE(Constraints().GetPreferredSpeed(i).has_value());
      }
   }

   TrafficDouble traffic;
   AdvisoryCommandTable commands;
   int vehicle;
   std::string response;
};

TEST_F(AdvisoryCommandTableTest, afms_from) {
   ASSERT_TRUE(Run("AFMS_FROM", {"KL204", "BRAVO", "TW"}));
   EXPECT_EQ(AfmsUtils::AdvisoryModes::TW, Constraints().GetAdvisoryMode(2));

   ASSERT_TRUE(Run("AFMS_FROM", {"KL204", "BRAVO", "continue"}));
   EXPECT_EQ(AfmsUtils::AdvisoryModes::CONTINUE, Constraints().GetAdvisoryMode(2));
}

TEST_F(AdvisoryCommandTableTest, waypoint_name_resolves_to_first_occurrence) {
   ASSERT_TRUE(Run("AFMS_FROM", {"KL204", "ALPHA", "OWN"}));
   EXPECT_EQ(AfmsUtils::AdvisoryModes::OWN, Constraints().GetAdvisoryMode(1));
   EXPECT_EQ(AfmsUtils::AdvisoryModes::CONTINUE, Constraints().GetAdvisoryMode(3));
}

TEST_F(AdvisoryCommandTableTest, rta_at) {
   ASSERT_TRUE(Run("RTA_AT", {"KL204", "BRAVO", "14:05:30"}));
   ASSERT_TRUE(Constraints().GetArrivalTime(2).has_value());
   EXPECT_DOUBLE_EQ(50730, Constraints().GetArrivalTime(2)->value());
}

TEST_F(AdvisoryCommandTableTest, tw_size_at) {
   ASSERT_TRUE(Run("TW_SIZE_AT", {"KL204", "BRAVO", "180"}));
   EXPECT_DOUBLE_EQ(180, Constraints().GetWindowSize(2).value());
}

TEST_F(AdvisoryCommandTableTest, rtwa_at) {
   ASSERT_TRUE(Run("RTWA_AT", {"KL204", "BRAVO", "14:05:30", "120"}));
   EXPECT_DOUBLE_EQ(50730, Constraints().GetArrivalTime(2)->value());
   EXPECT_DOUBLE_EQ(120, Constraints().GetWindowSize(2).value());

   // without a size only the arrival time changes
   ASSERT_TRUE(Run("RTWA_AT", {"KL204", "BRAVO", "14:10:00"}));
   EXPECT_DOUBLE_EQ(51000, Constraints().GetArrivalTime(2)->value());
   EXPECT_DOUBLE_EQ(120, Constraints().GetWindowSize(2).value());
}

TEST_F(AdvisoryCommandTableTest, rtwa_at_bad_size_stores_nothing) {
   EXPECT_FALSE(Run("RTWA_AT", {"KL204", "BRAVO", "14:05:30", "wide"}));
   ExpectUntouched();
}

TEST_F(AdvisoryCommandTableTest, own_spd_from) {
   ASSERT_TRUE(Run("OWN_SPD_FROM", {"KL204", "START", "0.8"}));
   EXPECT_EQ(PreferredSpeed::Mach(0.8), Constraints().GetPreferredSpeed(0).value());

   ASSERT_TRUE(Run("OWN_SPD_FROM", {"KL204", "BRAVO", "280"}));
   const PreferredSpeed cas = Constraints().GetPreferredSpeed(2).value();
   EXPECT_EQ(PreferredSpeed::CAS, cas.GetSpeedType());
   EXPECT_NEAR(280, Units::KnotsSpeed(cas.GetCas()).value(), 1e-9);
}

TEST_F(AdvisoryCommandTableTest, own_spd_from_defaults_to_reference_mach) {
   ASSERT_TRUE(Run("OWN_SPD_FROM", {"KL204", "START"}));
   EXPECT_EQ(PreferredSpeed::Mach(0.78), Constraints().GetPreferredSpeed(0).value());
}

TEST_F(AdvisoryCommandTableTest, unknown_waypoint) {
   EXPECT_FALSE(Run("AFMS_FROM", {"KL204", "ZULU", "RTA"}));
   EXPECT_NE(std::string::npos, response.find("ZULU"));
   EXPECT_NE(std::string::npos, response.find("KL204"));
   ExpectUntouched();
}

TEST_F(AdvisoryCommandTableTest, unknown_vehicle) {
   EXPECT_FALSE(Run("RTA_AT", {"XX999", "ALPHA", "12:00:00"}));
   EXPECT_NE(std::string::npos, response.find("XX999"));
   ExpectUntouched();
}

TEST_F(AdvisoryCommandTableTest, unknown_mode) {
   EXPECT_FALSE(Run("AFMS_FROM", {"KL204", "ALPHA", "CRUISE"}));
   EXPECT_NE(std::string::npos, response.find("CRUISE"));
   EXPECT_NE(std::string::npos, response.find("KL204"));
   ExpectUntouched();
}

TEST_F(AdvisoryCommandTableTest, bad_values) {
   EXPECT_FALSE(Run("RTA_AT", {"KL204", "ALPHA", "25:00:00"}));
   EXPECT_FALSE(Run("TW_SIZE_AT", {"KL204", "ALPHA", "-60"}));
   EXPECT_FALSE(Run("OWN_SPD_FROM", {"KL204", "ALPHA", "fast"}));
   ExpectUntouched();
}

TEST_F(AdvisoryCommandTableTest, bad_arity) {
   EXPECT_FALSE(Run("AFMS_FROM", {"KL204", "ALPHA"}));
   EXPECT_FALSE(Run("AFMS_FROM", {"KL204", "ALPHA", "TW", "extra"}));
   EXPECT_FALSE(Run("RTA_AT", {"KL204"}));
   EXPECT_FALSE(Run("RTWA_AT", {"KL204", "ALPHA", "12:00:00", "60", "extra"}));
   EXPECT_FALSE(Run("OWN_SPD_FROM", {"KL204"}));
   EXPECT_NE(std::string::npos, response.find(AdvisoryCommandTable::GetUsage("OWN_SPD_FROM")));
   ExpectUntouched();
}

TEST_F(AdvisoryCommandTableTest, unknown_command) {
   EXPECT_FALSE(AdvisoryCommandTable::IsCommand("SPD_AT"));
   EXPECT_TRUE(AdvisoryCommandTable::IsCommand("RTWA_AT"));
   EXPECT_FALSE(Run("SPD_AT", {"KL204", "ALPHA", "250"}));
   ExpectUntouched();
}
}  // namespace test
}  // namespace afms
