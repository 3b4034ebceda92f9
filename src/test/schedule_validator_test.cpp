#include <algorithm>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "util/logging.h"
#include "route_timeline.h"
#include "schedule.h"
#include "schedule_validator.h"
#include "test_util.h"

using walkplan::test::MakeEvent;
using walkplan::test::MakeInstance;
using walkplan::test::PointAt;
using walkplan::test::Time;
using walkplan::test::UniformMatrix;

class TestRouteTimeline : public ::testing::Test {
protected:
    static walkplan::TripRequest MakeRequest(const std::string &end_time) {
        return {PointAt(0),
                Time("08:00:00"),
                boost::none,
                Time(end_time),
                {MakeEvent("evt_1", PointAt(1), "08:20:00", "09:00:00", 10, 30, 2.0),
                 MakeEvent("evt_2", PointAt(2), "08:00:00", "09:30:00", 15, 15, 1.0)}};
    }

    static bool HasError(const walkplan::ScheduleValidator::ValidationResult &result,
                         walkplan::ScheduleValidator::ErrorCode error_code) {
        const auto &errors = result.errors();
        return std::any_of(std::begin(errors), std::end(errors),
                           [error_code](const walkplan::ScheduleValidator::ValidationError &error) -> bool {
                               return error.error_code() == error_code;
                           });
    }
};

TEST_F(TestRouteTimeline, WaitsForWindowToOpen) {
    // given
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 600));

    // when
    const auto timeline = walkplan::RouteTimeline::Simulate(instance, {1, 2}, {600, 900});

    // then
    ASSERT_TRUE(timeline.feasible());
    ASSERT_EQ(timeline.stops().size(), 2);
    EXPECT_EQ(timeline.stops()[0].Arrival, 1200);
    EXPECT_EQ(timeline.stops()[0].Wait, 600);
    EXPECT_EQ(timeline.stops()[0].Departure, 1800);
    EXPECT_EQ(timeline.stops()[1].Arrival, 2400);
    EXPECT_EQ(timeline.stops()[1].Departure, 3300);
    EXPECT_EQ(timeline.total_travel(), 1200);
    EXPECT_EQ(timeline.total_wait(), 600);
    EXPECT_EQ(timeline.total_late(), 0);
    EXPECT_DOUBLE_EQ(timeline.total_popularity(), 3.0);
    EXPECT_DOUBLE_EQ(timeline.Objective(instance.weights()), 1200.0 + 0.3 * 600.0 - 0.4 * 3.0);
}

TEST_F(TestRouteTimeline, LateArrivalIsInfeasibleUnlessTolerated) {
    // given
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 4000));

    // when
    const auto strict = walkplan::RouteTimeline::Simulate(instance, {1}, {600});
    const auto tolerant = walkplan::RouteTimeline::Simulate(instance, {1}, {600}, 600);

    // then
    EXPECT_FALSE(strict.feasible());
    EXPECT_TRUE(tolerant.feasible());
    EXPECT_EQ(tolerant.total_late(), 400);
    EXPECT_DOUBLE_EQ(tolerant.Objective(instance.weights()), 4000.0 + 2.0 * 400.0 - 0.4 * 2.0);
}

TEST_F(TestRouteTimeline, DepartureAfterEndTimeIsInfeasible) {
    const auto instance = MakeInstance(MakeRequest("08:45:00"), UniformMatrix(3, 600));

    EXPECT_TRUE(walkplan::RouteTimeline::Simulate(instance, {2}, {900}).feasible());
    EXPECT_FALSE(walkplan::RouteTimeline::Simulate(instance, {1, 2}, {600, 900}).feasible());
}

TEST_F(TestRouteTimeline, DwellOutsideRangeIsInfeasible) {
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 600));

    EXPECT_FALSE(walkplan::RouteTimeline::Simulate(instance, {1}, {300}).feasible());
    EXPECT_FALSE(walkplan::RouteTimeline::Simulate(instance, {1}, {2400}).feasible());
}

TEST_F(TestRouteTimeline, ExtendsDwellsWithinLimits) {
    // given
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 600));
    const std::vector<std::size_t> nodes{1, 2};

    // when
    const auto timeline = walkplan::RouteTimeline::ExtendDwells(instance,
                                                                nodes,
                                                                walkplan::RouteTimeline::MinDwells(instance, nodes),
                                                                0);

    // then
    ASSERT_TRUE(timeline.feasible());
    EXPECT_EQ(timeline.dwells(), (std::vector<std::int64_t>{1800, 900}));
}

TEST_F(TestRouteTimeline, ExtensionStopsAtEndTime) {
    // given
    const auto instance = MakeInstance(MakeRequest("09:00:00"), UniformMatrix(3, 300));
    const std::vector<std::size_t> nodes{1, 2};

    // when
    const auto timeline = walkplan::RouteTimeline::ExtendDwells(instance,
                                                                nodes,
                                                                walkplan::RouteTimeline::MinDwells(instance, nodes),
                                                                0);

    // then the last visit ends exactly at the end of the trip
    ASSERT_TRUE(timeline.feasible());
    EXPECT_EQ(timeline.dwells()[0], 1200);
    EXPECT_EQ(timeline.stops()[1].Departure, 3600);
}

TEST_F(TestRouteTimeline, ValidatorAcceptsSimulatedSchedule) {
    // given
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 600));
    const auto timeline = walkplan::RouteTimeline::Simulate(instance, {1, 2}, {600, 900});

    // when
    const auto schedule = walkplan::Schedule::FromTimeline(instance, timeline);
    const auto result = walkplan::ScheduleValidator().Validate(schedule, instance);

    // then
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(schedule.size(), 2);
    EXPECT_EQ(schedule.visits()[0].EventId, "evt_1");
    EXPECT_EQ(schedule.visits()[0].Arrival, Time("08:20:00"));
    EXPECT_EQ(schedule.visits()[0].dwell(), boost::posix_time::minutes(10));
    EXPECT_EQ(schedule.visits()[1].TravelSecondsFromPrevious, 600);
    EXPECT_EQ(schedule.total_travel_seconds(), 1200);
}

TEST_F(TestRouteTimeline, ValidatorAcceptsEmptySchedule) {
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 600));

    const auto schedule = walkplan::Schedule::Empty(instance);

    EXPECT_TRUE(schedule.empty());
    EXPECT_TRUE(walkplan::ScheduleValidator().Validate(schedule, instance).ok());
}

TEST_F(TestRouteTimeline, ValidatorDetectsBrokenVisits) {
    // given
    const auto instance = MakeInstance(MakeRequest("09:00:00"), UniformMatrix(3, 600));
    const walkplan::VisitRecord late{1, "evt_1", Time("09:05:00"), Time("09:15:00"), 600};
    const walkplan::VisitRecord early{1, "evt_1", Time("08:10:00"), Time("08:20:00"), 600};
    const walkplan::VisitRecord short_dwell{1, "evt_1", Time("08:20:00"), Time("08:25:00"), 600};
    const walkplan::VisitRecord wrong_travel{1, "evt_1", Time("08:20:00"), Time("08:30:00"), 60};
    const walkplan::VisitRecord orphaned{1, "evt_9", Time("08:20:00"), Time("08:30:00"), 600};
    const walkplan::VisitRecord first{1, "evt_1", Time("08:20:00"), Time("08:30:00"), 600};
    const walkplan::VisitRecord repeated{1, "evt_1", Time("08:40:00"), Time("08:50:00"), 0};
    const walkplan::VisitRecord too_long{2, "evt_2", Time("08:50:00"), Time("09:05:00"), 600};

    const auto validate = [&instance](std::vector<walkplan::VisitRecord> visits) {
        return walkplan::ScheduleValidator().Validate(walkplan::Schedule(std::move(visits), 0, 0, 0.0), instance);
    };

    // then
    EXPECT_TRUE(HasError(validate({late}), walkplan::ScheduleValidator::ErrorCode::LATE_ARRIVAL));
    EXPECT_TRUE(HasError(validate({early}), walkplan::ScheduleValidator::ErrorCode::EARLY_ARRIVAL));
    EXPECT_TRUE(HasError(validate({short_dwell}), walkplan::ScheduleValidator::ErrorCode::DWELL_OUT_OF_RANGE));
    EXPECT_TRUE(HasError(validate({wrong_travel}), walkplan::ScheduleValidator::ErrorCode::TRAVEL_MISMATCH));
    EXPECT_TRUE(HasError(validate({orphaned}), walkplan::ScheduleValidator::ErrorCode::ORPHANED));
    EXPECT_TRUE(HasError(validate({first, repeated}), walkplan::ScheduleValidator::ErrorCode::DUPLICATED));
    EXPECT_TRUE(HasError(validate({too_long}), walkplan::ScheduleValidator::ErrorCode::END_TIME_EXCEEDED));
    EXPECT_TRUE(validate({first}).ok());
}

TEST_F(TestRouteTimeline, ValidatorRequiresIncreasingArrivals) {
    // given
    const auto instance = MakeInstance(MakeRequest("10:00:00"), UniformMatrix(3, 0));
    const walkplan::VisitRecord first{2, "evt_2", Time("08:20:00"), Time("08:35:00"), 0};
    const walkplan::VisitRecord second{1, "evt_1", Time("08:20:00"), Time("08:30:00"), 0};

    // when
    const auto result = walkplan::ScheduleValidator().Validate(
            walkplan::Schedule({first, second}, 0, 0, 0.0), instance);

    // then
    EXPECT_TRUE(HasError(result, walkplan::ScheduleValidator::ErrorCode::NOT_INCREASING));
}

int main(int argc, char **argv) {
    util::SetupLogging(argv[0]);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
