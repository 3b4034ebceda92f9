#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "util/logging.h"
#include "primary_solver.h"
#include "schedule_validator.h"
#include "test_util.h"

using walkplan::test::MakeEvent;
using walkplan::test::MakeInstance;
using walkplan::test::PointAt;
using walkplan::test::Time;
using walkplan::test::UniformMatrix;

static walkplan::TripRequest MakeRequest(const std::string &end_time, std::vector<walkplan::Event> events) {
    return {PointAt(0), Time("08:00:00"), boost::none, Time(end_time), std::move(events)};
}

static void ExpectValid(const walkplan::Schedule &schedule, const walkplan::ProblemInstance &instance) {
    const auto result = walkplan::ScheduleValidator().Validate(schedule, instance);
    for (const auto &error : result.errors()) {
        ADD_FAILURE() << error;
    }
}

TEST(TestPrimarySolver, TimeLimitDependsOnProblemSize) {
    // given
    const walkplan::PrimarySolver solver;

    // then
    EXPECT_EQ(solver.TimeLimit(1), boost::posix_time::milliseconds(150));
    EXPECT_EQ(solver.TimeLimit(5), boost::posix_time::milliseconds(150));
    EXPECT_EQ(solver.TimeLimit(10), boost::posix_time::milliseconds(400));
    EXPECT_EQ(solver.TimeLimit(15), boost::posix_time::milliseconds(1200));

    walkplan::PrimarySolver::Config config;
    config.TimeLimit = boost::posix_time::seconds(3);
    const walkplan::PrimarySolver solver_with_limit{config, nullptr, nullptr};
    EXPECT_EQ(solver_with_limit.TimeLimit(5), boost::posix_time::seconds(3));
}

TEST(TestPrimarySolver, ReturnsNothingWithoutTimeBudget) {
    // given
    const auto instance = MakeInstance(MakeRequest("12:00:00", {
            MakeEvent("evt_1", PointAt(1), "08:00:00", "10:00:00", 20, 45, 1.0)}), UniformMatrix(2, 600));
    walkplan::PrimarySolver::Config config;
    config.TimeLimit = boost::posix_time::seconds(0);

    // when
    const auto schedule = walkplan::PrimarySolver(config, nullptr, nullptr).Solve(instance);

    // then
    EXPECT_FALSE(schedule);
}

TEST(TestPrimarySolver, VisitsSingleEvent) {
    // given
    const auto instance = MakeInstance(MakeRequest("12:00:00", {
            MakeEvent("evt_1", PointAt(1), "08:00:00", "10:00:00", 20, 45, 1.0)}), UniformMatrix(2, 600));

    // when
    const auto schedule = walkplan::PrimarySolver().Solve(instance);

    // then
    ASSERT_TRUE(schedule);
    ASSERT_EQ(schedule->size(), 1);
    const auto &visit = schedule->visits().front();
    EXPECT_EQ(visit.EventId, "evt_1");
    EXPECT_EQ(visit.Arrival, Time("08:10:00"));
    EXPECT_EQ(visit.TravelSecondsFromPrevious, 600);
    EXPECT_EQ(visit.dwell(), boost::posix_time::minutes(45));
    ExpectValid(schedule.get(), instance);
}

TEST(TestPrimarySolver, FollowsTimeWindows) {
    // given
    const auto instance = MakeInstance(MakeRequest("12:00:00", {
            MakeEvent("later", PointAt(1), "09:00:00", "09:30:00", 10, 10, 1.0),
            MakeEvent("earlier", PointAt(2), "08:10:00", "08:30:00", 10, 10, 1.0)}), UniformMatrix(3, 600));

    // when
    const auto schedule = walkplan::PrimarySolver().Solve(instance);

    // then
    ASSERT_TRUE(schedule);
    ASSERT_EQ(schedule->size(), 2);
    EXPECT_EQ(schedule->visits()[0].EventId, "earlier");
    EXPECT_EQ(schedule->visits()[1].EventId, "later");
    EXPECT_EQ(schedule->visits()[1].Arrival, Time("09:00:00"));
    ExpectValid(schedule.get(), instance);
}

TEST(TestPrimarySolver, SkipsUnreachableEvent) {
    // given
    const auto instance = MakeInstance(MakeRequest("12:00:00", {
            MakeEvent("closing", PointAt(1), "08:00:00", "08:05:00", 10, 10, 10.0),
            MakeEvent("open", PointAt(2), "08:00:00", "11:00:00", 10, 10, 1.0)}), UniformMatrix(3, 600));

    // when
    const auto schedule = walkplan::PrimarySolver().Solve(instance);

    // then
    ASSERT_TRUE(schedule);
    ASSERT_EQ(schedule->size(), 1);
    EXPECT_EQ(schedule->visits()[0].EventId, "open");
    ExpectValid(schedule.get(), instance);
}

TEST(TestPrimarySolver, PrefersPopularEventWhenOnlyOneFits) {
    // given
    const auto instance = MakeInstance(MakeRequest("09:00:00", {
            MakeEvent("quiet", PointAt(1), "08:00:00", "09:00:00", 40, 40, 1.0),
            MakeEvent("popular", PointAt(2), "08:00:00", "09:00:00", 40, 40, 5.0)}), UniformMatrix(3, 300));

    // when
    const auto schedule = walkplan::PrimarySolver().Solve(instance);

    // then
    ASSERT_TRUE(schedule);
    ASSERT_EQ(schedule->size(), 1);
    EXPECT_EQ(schedule->visits()[0].EventId, "popular");
    ExpectValid(schedule.get(), instance);
}

TEST(TestPrimarySolver, ReportsFinalLegToFixedEnd) {
    // given
    const walkplan::TripRequest request{PointAt(0),
                                        Time("08:00:00"),
                                        PointAt(9),
                                        Time("12:00:00"),
                                        {MakeEvent("evt_1", PointAt(1), "08:00:00", "10:00:00", 20, 20, 1.0)}};
    const auto instance = MakeInstance(request, {{0,   600, 1200},
                                                 {600, 0,   900},
                                                 {1200, 900, 0}});

    // when
    const auto schedule = walkplan::PrimarySolver().Solve(instance);

    // then
    ASSERT_TRUE(schedule);
    ASSERT_EQ(schedule->size(), 1);
    EXPECT_EQ(schedule->final_leg_seconds(), 900);
    EXPECT_EQ(schedule->total_travel_seconds(), 1500);
    ExpectValid(schedule.get(), instance);
}

TEST(TestPrimarySolver, LargeProblemFinishesWithinBudget) {
    // given
    static const std::size_t EVENTS = 15;
    std::vector<walkplan::Event> events;
    for (std::size_t index = 1; index <= EVENTS; ++index) {
        events.push_back(MakeEvent("evt_" + std::to_string(index),
                                   PointAt(static_cast<int>(index)),
                                   "08:00:00",
                                   "12:00:00",
                                   5,
                                   10,
                                   static_cast<double>(index % 4)));
    }

    std::vector<std::vector<std::int64_t> > matrix(EVENTS + 1, std::vector<std::int64_t>(EVENTS + 1, 0));
    for (std::size_t from = 0; from <= EVENTS; ++from) {
        for (std::size_t to = 0; to <= EVENTS; ++to) {
            matrix[from][to] = 120 * std::abs(static_cast<int>(from) - static_cast<int>(to));
        }
    }
    const auto instance = MakeInstance(MakeRequest("12:00:00", events), matrix);
    const walkplan::PrimarySolver solver;

    // when
    const auto started_at = std::chrono::steady_clock::now();
    const auto schedule = solver.Solve(instance);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at);

    // then
    ASSERT_TRUE(schedule);
    LOG(INFO) << "Visited " << schedule->size() << " out of " << EVENTS << " events in " << elapsed.count() << "ms";
    EXPECT_LT(elapsed.count(), solver.TimeLimit(EVENTS).total_milliseconds() + 1000);
    ExpectValid(schedule.get(), instance);
}

int main(int argc, char **argv) {
    util::SetupLogging(argv[0]);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
