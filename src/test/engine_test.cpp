#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <glog/logging.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "util/application_error.h"
#include "util/logging.h"
#include "itinerary_engine.h"
#include "test_util.h"

using walkplan::test::FakeTravelTimeProvider;
using walkplan::test::MakeEvent;
using walkplan::test::PointAt;
using walkplan::test::Time;

class TestItineraryEngine : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeTravelTimeProvider>(300);
        cache_ = std::make_shared<walkplan::TravelTimeCache>();
    }

    walkplan::ItineraryEngine MakeEngine() const {
        return MakeEngine(walkplan::EngineConfig());
    }

    walkplan::ItineraryEngine MakeEngine(walkplan::EngineConfig config) const {
        return {std::move(config), provider_, cache_, nullptr};
    }

    static walkplan::TripRequest MakeRequest(const std::string &end_time, std::vector<walkplan::Event> events) {
        return {PointAt(0), Time("08:00:00"), boost::none, Time(end_time), std::move(events)};
    }

    static walkplan::TripRequest CompetingEvents(const std::string &end_time) {
        return MakeRequest(end_time, {MakeEvent("quiet", PointAt(1), "08:00:00", end_time, 40, 40, 1.0),
                                      MakeEvent("popular", PointAt(2), "08:00:00", end_time, 40, 40, 5.0)});
    }

    static walkplan::TripRequest OverlappingEvents() {
        return MakeRequest("09:10:00", {MakeEvent("museum", PointAt(1), "08:00:00", "09:10:00", 20, 60, 3.0),
                                        MakeEvent("concert", PointAt(2), "08:40:00", "08:50:00", 15, 15, 2.0)});
    }

    static std::vector<std::string> VisitedIds(const walkplan::SolveResponse &response) {
        std::vector<std::string> ids;
        for (const auto &stop : response.Route) {
            ids.push_back(stop.Visit.EventId);
        }
        return ids;
    }

    static void ExpectWellFormed(const walkplan::SolveResponse &response, const walkplan::TripRequest &request) {
        EXPECT_EQ(response.Route.size() + response.Dropped.size(), request.events().size());
        EXPECT_EQ(response.Metrics.Visited, response.Route.size());
        EXPECT_EQ(response.Metrics.Dropped, response.Dropped.size());

        auto previous_arrival = request.start_time();
        for (const auto &stop : response.Route) {
            EXPECT_GT(stop.Visit.Arrival, previous_arrival);
            EXPECT_LE(stop.Visit.Departure, request.end_time());
            previous_arrival = stop.Visit.Arrival;
        }
    }

    static nlohmann::json WithoutSolveTime(const walkplan::SolveResponse &response) {
        nlohmann::json json = response;
        json["metrics"].erase("solveMs");
        return json;
    }

    std::shared_ptr<FakeTravelTimeProvider> provider_;
    std::shared_ptr<walkplan::TravelTimeCache> cache_;
};

TEST_F(TestItineraryEngine, CanVisitSingleEvent) {
    // given
    provider_->Set(PointAt(0), PointAt(1), 600);
    const auto request = MakeRequest("10:00:00", {MakeEvent("gallery", PointAt(1), "08:00:00", "10:00:00", 30, 45, 2.0)});

    // when
    const auto response = MakeEngine().Solve(request);

    // then
    ASSERT_EQ(response.Route.size(), 1);
    EXPECT_EQ(response.Route[0].Visit.EventId, "gallery");
    EXPECT_EQ(response.Route[0].Visit.TravelSecondsFromPrevious, 600);
    EXPECT_EQ(response.Route[0].Visit.Arrival, Time("08:10:00"));
    EXPECT_FALSE(response.Route[0].Polyline.empty());
    EXPECT_TRUE(response.Dropped.empty());
    EXPECT_EQ(response.Metrics.Stage, walkplan::SolveStage::Primary);
    EXPECT_EQ(response.Metrics.TotalWalkSeconds, 600);
    EXPECT_FALSE(response.Metrics.Degraded);
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, CanDropUnreachableEvent) {
    // given
    const auto request = MakeRequest("10:00:00", {MakeEvent("faraway", PointAt(45), "08:00:00", "08:30:00", 10, 10, 5.0)});

    // when
    const auto response = MakeEngine().Solve(request);

    // then
    EXPECT_TRUE(response.Route.empty());
    ASSERT_EQ(response.Dropped.size(), 1);
    EXPECT_EQ(response.Dropped[0], walkplan::DropRecord("faraway", walkplan::DropReason::WindowConflict));
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, CanPreferPopularEvent) {
    // given
    const auto request = CompetingEvents("09:00:00");

    // when
    const auto response = MakeEngine().Solve(request);

    // then
    EXPECT_EQ(VisitedIds(response), (std::vector<std::string>{"popular"}));
    ASSERT_EQ(response.Dropped.size(), 1);
    EXPECT_EQ(response.Dropped[0].EventId, "quiet");
    EXPECT_TRUE(response.Dropped[0].Reason == walkplan::DropReason::TimeBudgetExceeded
                || response.Dropped[0].Reason == walkplan::DropReason::LowPriority);
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, CanShortenDwellToFitEvent) {
    // given
    const auto request = OverlappingEvents();

    // when
    const auto response = MakeEngine().Solve(request);

    // then
    ASSERT_EQ(VisitedIds(response), (std::vector<std::string>{"museum", "concert"}));
    const auto museum_dwell = response.Route[0].Visit.dwell();
    EXPECT_GE(museum_dwell, boost::posix_time::minutes(20));
    EXPECT_LT(museum_dwell, boost::posix_time::minutes(60));
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, CanFallBackWhenPrimaryIsDisabled) {
    // given
    walkplan::EngineConfig config;
    config.Primary.TimeLimit = boost::posix_time::seconds(0);
    const auto request = OverlappingEvents();

    // when
    const auto response = MakeEngine(config).Solve(request);

    // then
    EXPECT_EQ(response.Metrics.Stage, walkplan::SolveStage::FallbackCompressed);
    ASSERT_EQ(VisitedIds(response), (std::vector<std::string>{"museum", "concert"}));
    EXPECT_EQ(response.Route[0].Visit.dwell(), boost::posix_time::minutes(40));
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, CanDropOnlyConflictingEventInFallback) {
    // given
    walkplan::EngineConfig config;
    config.Primary.TimeLimit = boost::posix_time::seconds(0);
    const auto request = MakeRequest("12:00:00", {
            MakeEvent("popular", PointAt(1), "08:00:00", "08:30:00", 30, 30, 5.0),
            MakeEvent("rival", PointAt(2), "08:00:00", "08:30:00", 30, 30, 3.0),
            MakeEvent("filler", PointAt(3), "08:00:00", "12:00:00", 10, 10, 1.0)});

    // when
    const auto response = MakeEngine(config).Solve(request);

    // then
    EXPECT_EQ(response.Metrics.Stage, walkplan::SolveStage::FallbackDropped);
    auto visited = VisitedIds(response);
    std::sort(std::begin(visited), std::end(visited));
    EXPECT_EQ(visited, (std::vector<std::string>{"filler", "popular"}));
    ASSERT_EQ(response.Dropped.size(), 1);
    EXPECT_EQ(response.Dropped[0], walkplan::DropRecord("rival", walkplan::DropReason::LowPriority));
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, RejectsInvalidRequest) {
    // given
    const auto request = MakeRequest("07:00:00", {MakeEvent("early", PointAt(1), "08:00:00", "09:00:00", 10, 10, 1.0)});
    const auto engine = MakeEngine();

    // when
    try {
        engine.Solve(request);
        FAIL() << "Expected an exception";
    } catch (const util::ApplicationError &ex) {
        // then
        EXPECT_EQ(ex.error_code(), util::ErrorCode::INFEASIBLE_INPUT);
    }
    EXPECT_EQ(provider_->calls(), 0);
}

TEST_F(TestItineraryEngine, ReportsDegradedTravelTimes) {
    // given
    provider_->set_failure(FakeTravelTimeProvider::Failure::Unavailable);
    const auto request = CompetingEvents("10:00:00");

    // when
    const auto response = MakeEngine().Solve(request);

    // then
    EXPECT_TRUE(response.Metrics.Degraded);
    EXPECT_EQ(response.Route.size(), 2);
    ExpectWellFormed(response, request);
}

TEST_F(TestItineraryEngine, IsIdempotentWithWarmCache) {
    // given
    provider_->Set(PointAt(0), PointAt(1), 200);
    provider_->Set(PointAt(0), PointAt(2), 500);
    provider_->Set(PointAt(1), PointAt(2), 250);
    const auto request = MakeRequest("11:00:00", {
            MakeEvent("first", PointAt(1), "08:00:00", "11:00:00", 20, 30, 2.0),
            MakeEvent("second", PointAt(2), "08:00:00", "11:00:00", 20, 30, 3.0)});
    const auto engine = MakeEngine();

    // when
    const auto cold = engine.Solve(request);
    const auto calls_after_cold = provider_->calls();
    const auto warm = engine.Solve(request);

    // then
    EXPECT_EQ(WithoutSolveTime(cold), WithoutSolveTime(warm));
    EXPECT_EQ(provider_->calls(), calls_after_cold);
}

TEST_F(TestItineraryEngine, VisitsMoreEventsWithLongerTrip) {
    // given
    const auto engine = MakeEngine();

    // when
    const auto short_trip = engine.Solve(CompetingEvents("09:00:00"));
    const auto long_trip = engine.Solve(CompetingEvents("10:00:00"));

    // then
    EXPECT_EQ(short_trip.Metrics.Visited, 1);
    EXPECT_EQ(long_trip.Metrics.Visited, 2);
    EXPECT_LE(short_trip.Metrics.Visited, long_trip.Metrics.Visited);
}

TEST_F(TestItineraryEngine, CanSolveConcurrently) {
    // given
    static const std::size_t NUM_THREADS = 4;
    const auto request = CompetingEvents("10:00:00");
    const auto engine = MakeEngine();
    std::vector<walkplan::SolveResponse> responses(NUM_THREADS);

    // when
    std::vector<std::thread> threads;
    for (std::size_t thread_index = 0; thread_index < NUM_THREADS; ++thread_index) {
        threads.emplace_back([&engine, &request, &responses, thread_index]() -> void {
            responses[thread_index] = engine.Solve(request);
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    // then
    for (const auto &response : responses) {
        EXPECT_EQ(VisitedIds(response), VisitedIds(responses.front()));
        ExpectWellFormed(response, request);
    }

    const auto calls = provider_->calls();
    engine.Solve(request);
    EXPECT_EQ(provider_->calls(), calls);
}

TEST_F(TestItineraryEngine, CanAttachDebugSection) {
    // given
    walkplan::EngineConfig config;
    config.AttachDebug = true;
    const auto request = CompetingEvents("10:00:00");

    // when
    const auto response = MakeEngine(config).Solve(request);

    // then
    ASSERT_TRUE(response.Debug);
    const auto &debug = response.Debug.get();
    EXPECT_EQ(debug.at("nodes").size(), 3);
    EXPECT_EQ(debug.at("matrix").at("provider"), "fake");
    EXPECT_EQ(debug.at("matrix").at("seconds").size(), 3);
    EXPECT_EQ(debug.at("matrix").at("seconds")[0][1], 300);
}

TEST_F(TestItineraryEngine, CanSerializeResponse) {
    // given
    const auto request = CompetingEvents("09:00:00");

    // when
    const nlohmann::json json = MakeEngine().Solve(request);

    // then
    ASSERT_EQ(json.at("route").size(), 1);
    const auto &stop = json.at("route")[0];
    EXPECT_EQ(stop.at("eventId"), "popular");
    EXPECT_EQ(stop.at("travelSecFromPrev"), 300);
    EXPECT_EQ(stop.at("dwellSec"), 2400);
    EXPECT_TRUE(stop.at("arrive").is_string());
    EXPECT_TRUE(stop.at("polyline").is_string());

    ASSERT_EQ(json.at("dropped").size(), 1);
    EXPECT_EQ(json.at("dropped")[0].at("eventId"), "quiet");

    const auto &metrics = json.at("metrics");
    EXPECT_EQ(metrics.at("stage"), "primary");
    EXPECT_EQ(metrics.at("visited"), 1);
    EXPECT_EQ(metrics.at("dropped"), 1);
    EXPECT_EQ(metrics.at("totalWalkSec"), 300);
    EXPECT_EQ(metrics.at("degraded"), false);
    EXPECT_EQ(metrics.count("solveMs"), 1);
    EXPECT_EQ(json.count("debug"), 0);
}

int main(int argc, char **argv) {
    util::SetupLogging(argv[0]);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
