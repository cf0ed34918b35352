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
#include "afms/AnnotatedRoute.h"
#include "TrafficDouble.h"

using namespace afms::open_source;

namespace afms {
namespace test {

class AnnotatedRouteTest : public ::testing::Test {
  protected:
   AnnotatedRouteTest() : route(MakeEmptyRoute()) {
      route.AppendWaypoint(EquatorWaypoint("START", 0));
      route.AppendWaypoint(EquatorWaypoint("ALPHA", 10000));
      route.AppendWaypoint(EquatorWaypoint("BRAVO", 30000));
   }

   void ExpectInLockStep() const {
      const WaypointConstraintStore &constraints = route.GetConstraints();
      ASSERT_EQ(route.GetRoute().Size(), constraints.Size());
   }

   void ExpectDefaults(const int index) const {
      const WaypointConstraintStore &constraints = route.GetConstraints();
      EXPECT_FALSE(constraints.GetArrivalTime(index).has_value());
      EXPECT_DOUBLE_EQ(60, constraints.GetWindowSize(index).value());
      EXPECT_EQ(AfmsUtils::AdvisoryModes::CONTINUE, constraints.GetAdvisoryMode(index));
      EXPECT_FALSE(constraints.GetPreferredSpeed(index).has_value());
   }

   AnnotatedRoute route;
};

TEST_F(AnnotatedRouteTest, append_gives_defaults) {
   ExpectInLockStep();
   EXPECT_EQ(3, route.Size());
   for (int i = 0; i < route.Size(); ++i) {
      ExpectDefaults(i);
   }
}

TEST_F(AnnotatedRouteTest, insert_shifts_annotations) {
   route.GetConstraints().SetArrivalTime(1, Units::SecondsTime(50400));
   route.GetConstraints().SetAdvisoryMode(1, AfmsUtils::AdvisoryModes::RTA);

   route.AddWaypoint(1, EquatorWaypoint("NEW", 5000), false);

   ExpectInLockStep();
   EXPECT_EQ("NEW", route.GetRoute().GetWaypoint(1).m_name);
   ExpectDefaults(1);
   EXPECT_EQ(AfmsUtils::AdvisoryModes::RTA, route.GetConstraints().GetAdvisoryMode(2));
   EXPECT_DOUBLE_EQ(50400, route.GetConstraints().GetArrivalTime(2)->value());
}

TEST_F(AnnotatedRouteTest, overwrite_resets_annotations) {
   WaypointConstraintStore &constraints = route.GetConstraints();
   constraints.SetArrivalTime(2, Units::SecondsTime(50400));
   constraints.SetWindowSize(2, Units::SecondsTime(120));
   constraints.SetAdvisoryMode(2, AfmsUtils::AdvisoryModes::TW);
   constraints.SetPreferredSpeed(2, PreferredSpeed::Mach(0.78));

   route.AddWaypoint(2, EquatorWaypoint("CHARLIE", 40000), true);

   ExpectInLockStep();
   EXPECT_EQ(3, route.Size());
   EXPECT_EQ("CHARLIE", route.GetRoute().GetWaypoint(2).m_name);
   ExpectDefaults(2);
}

TEST_F(AnnotatedRouteTest, delete_removes_annotations) {
   route.GetConstraints().SetAdvisoryMode(2, AfmsUtils::AdvisoryModes::OWN);

   route.DeleteWaypoint(1);

   ExpectInLockStep();
   EXPECT_EQ(2, route.Size());
   EXPECT_EQ("BRAVO", route.GetRoute().GetWaypoint(1).m_name);
   EXPECT_EQ(AfmsUtils::AdvisoryModes::OWN, route.GetConstraints().GetAdvisoryMode(1));
}

TEST_F(AnnotatedRouteTest, bad_index_changes_nothing) {
   EXPECT_THROW(route.AddWaypoint(4, EquatorWaypoint("FAR", 90000), false), std::out_of_range);
   EXPECT_THROW(route.AddWaypoint(3, EquatorWaypoint("FAR", 90000), true), std::out_of_range);
   EXPECT_THROW(route.DeleteWaypoint(-1), std::out_of_range);
   EXPECT_THROW(route.DeleteWaypoint(3), std::out_of_range);

   ExpectInLockStep();
   EXPECT_EQ(3, route.Size());
}

TEST_F(AnnotatedRouteTest, mixed_edits_keep_lock_step) {
   route.AddWaypoint(0, EquatorWaypoint("ORIGIN", -5000), false);
   route.DeleteWaypoint(2);
   route.AppendWaypoint(EquatorWaypoint("DELTA", 50000));
   route.AddWaypoint(1, EquatorWaypoint("ECHO", 1000), true);
   route.DeleteWaypoint(0);

   ExpectInLockStep();
   EXPECT_EQ(3, route.Size());

   route.Clear();
   ExpectInLockStep();
   EXPECT_EQ(0, route.Size());
}

TEST_F(AnnotatedRouteTest, leg_distances_follow_edits) {
   EXPECT_DOUBLE_EQ(0, Units::MetersLength(route.GetRoute().GetWaypoint(0).m_distance_from_previous).value());
   EXPECT_NEAR(20000, Units::MetersLength(route.GetRoute().GetWaypoint(2).m_distance_from_previous).value(), 1e-3);

   route.DeleteWaypoint(1);
   EXPECT_NEAR(30000, Units::MetersLength(route.GetRoute().GetWaypoint(1).m_distance_from_previous).value(), 1e-3);

   route.AddWaypoint(1, EquatorWaypoint("MID", 12000), false);
   EXPECT_NEAR(12000, Units::MetersLength(route.GetRoute().GetWaypoint(1).m_distance_from_previous).value(), 1e-3);
   EXPECT_NEAR(18000, Units::MetersLength(route.GetRoute().GetWaypoint(2).m_distance_from_previous).value(), 1e-3);
}

TEST_F(AnnotatedRouteTest, active_index_follows_edits_before_it) {
   route.SetActiveWaypointIndex(2);
   route.AddWaypoint(0, EquatorWaypoint("ORIGIN", -5000), false);
   EXPECT_EQ(3, route.GetActiveWaypointIndex());

   route.DeleteWaypoint(1);
   EXPECT_EQ(2, route.GetActiveWaypointIndex());

   route.DeleteWaypoint(2);
   EXPECT_EQ(2, route.GetActiveWaypointIndex());

   EXPECT_THROW(route.SetActiveWaypointIndex(4), std::out_of_range);
}

TEST_F(AnnotatedRouteTest, find_waypoint_returns_first_occurrence) {
   route.AppendWaypoint(EquatorWaypoint("ALPHA", 60000));
   EXPECT_EQ(1, route.FindWaypointIndex("ALPHA"));
   EXPECT_EQ(AfmsUtils::UNDEFINED_INDEX, route.FindWaypointIndex("ZULU"));
}

TEST_F(AnnotatedRouteTest, store_rejects_bad_index) {
   WaypointConstraintStore &constraints = route.GetConstraints();
   EXPECT_THROW(constraints.GetAdvisoryMode(3), std::out_of_range);
   EXPECT_THROW(constraints.SetArrivalTime(-1, Units::SecondsTime(0)), std::out_of_range);
   EXPECT_THROW(constraints.SetPreferredSpeed(5, PreferredSpeed::Mach(0.8)), std::out_of_range);
}

TEST_F(AnnotatedRouteTest, clear_annotations) {
   WaypointConstraintStore &constraints = route.GetConstraints();
   constraints.SetArrivalTime(1, Units::SecondsTime(100));
   constraints.SetPreferredSpeed(1, PreferredSpeed::Mach(0.8));
   constraints.ClearArrivalTime(1);
   constraints.ClearPreferredSpeed(1);
   ExpectDefaults(1);
}
}  // namespace test
}  // namespace afms
