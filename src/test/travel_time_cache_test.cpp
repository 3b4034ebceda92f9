#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "util/logging.h"
#include "travel_time_cache.h"
#include "test_util.h"

using walkplan::test::ManualClock;
using walkplan::test::PointAt;
using walkplan::test::Time;

class TestTravelTimeCache : public ::testing::Test {
protected:
    TestTravelTimeCache()
            : clock_{},
              cache_{walkplan::TravelTimeCache::Config(), clock_.AsClock()} {}

    walkplan::PairwiseKey Key(int from, int to, const std::string &time) const {
        return cache_.MakePairwiseKey("fake", PointAt(from), PointAt(to), Time(time));
    }

    ManualClock clock_;
    walkplan::TravelTimeCache cache_;
};

TEST_F(TestTravelTimeCache, ComputesValueOnceAndThenHits) {
    // given
    std::size_t calls = 0;
    const auto compute = [&calls]() -> walkplan::TravelLeg {
        ++calls;
        return {120, 160.0, ""};
    };

    // when
    const auto first = cache_.pairwise().GetOrCompute(Key(0, 1, "08:00:00"), compute);
    const auto second = cache_.pairwise().GetOrCompute(Key(0, 1, "08:00:00"), compute);

    // then
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first.second, walkplan::CacheOutcome::Miss);
    EXPECT_EQ(second.second, walkplan::CacheOutcome::Hit);
    EXPECT_EQ(first.first, second.first);

    const auto stats = cache_.pairwise().stats();
    EXPECT_EQ(stats.Misses, 1);
    EXPECT_EQ(stats.Hits, 1);
}

TEST_F(TestTravelTimeCache, BuildsKeysFromRoundedCoordinatesAndTimeBuckets) {
    const walkplan::Location from{55.86001, -4.25002};
    const walkplan::Location nearby_from{55.86003, -4.24998};

    EXPECT_EQ(cache_.MakePairwiseKey("fake", from, PointAt(1), Time("08:00:00")),
              cache_.MakePairwiseKey("fake", nearby_from, PointAt(1), Time("08:00:00")));
    EXPECT_EQ(Key(0, 1, "08:01:00"), Key(0, 1, "08:14:59"));
    EXPECT_FALSE(Key(0, 1, "08:14:59") == Key(0, 1, "08:15:00"));
    EXPECT_FALSE(Key(0, 1, "08:00:00") == Key(1, 0, "08:00:00"));
    EXPECT_FALSE(cache_.MakePairwiseKey("fake", from, PointAt(1), Time("08:00:00"))
                 == cache_.MakePairwiseKey("osrm", from, PointAt(1), Time("08:00:00")));

    EXPECT_EQ(cache_.MakeDirectionsKey(from, PointAt(1)), cache_.MakeDirectionsKey(from, PointAt(1)));
    EXPECT_FALSE(cache_.MakeDirectionsKey(from, PointAt(1)) == cache_.MakeDirectionsKey(nearby_from, PointAt(1)));
}

TEST_F(TestTravelTimeCache, ExpiredEntriesAreRecomputedButRemainAvailable) {
    // given
    const auto key = Key(0, 1, "08:00:00");
    cache_.pairwise().Put(key, {120, 160.0, ""});
    ASSERT_TRUE(cache_.pairwise().Find(key));

    // when
    clock_.Advance(boost::posix_time::hours(25));

    // then
    EXPECT_FALSE(cache_.pairwise().Find(key));
    const auto stale = cache_.pairwise().FindStale(key);
    ASSERT_TRUE(stale);
    EXPECT_EQ(stale->Seconds, 120);

    const auto refreshed = cache_.pairwise().GetOrCompute(key, []() -> walkplan::TravelLeg {
        return {180, 240.0, ""};
    });
    EXPECT_EQ(refreshed.second, walkplan::CacheOutcome::Miss);
    EXPECT_EQ(refreshed.first.Seconds, 180);
}

TEST_F(TestTravelTimeCache, EvictsEntriesPastStaleRetention) {
    // given
    const auto old_key = Key(0, 1, "08:00:00");
    const auto recent_key = Key(0, 2, "08:00:00");
    cache_.pairwise().Put(old_key, {120, 160.0, ""});
    clock_.Advance(boost::posix_time::hours(30));
    cache_.pairwise().Put(recent_key, {240, 320.0, ""});
    ASSERT_EQ(cache_.pairwise().size(), 2);
    ASSERT_TRUE(cache_.pairwise().FindStale(old_key));

    // when
    clock_.Advance(boost::posix_time::hours(24));
    cache_.pairwise().Put(Key(0, 3, "08:00:00"), {360, 480.0, ""});

    // then
    EXPECT_EQ(cache_.pairwise().size(), 2);
    EXPECT_FALSE(cache_.pairwise().FindStale(old_key));
    EXPECT_TRUE(cache_.pairwise().FindStale(recent_key));
}

TEST_F(TestTravelTimeCache, DirectionsLiveLongerThanDurations) {
    // given
    const auto pairwise_key = Key(0, 1, "08:00:00");
    const auto directions_key = cache_.MakeDirectionsKey(PointAt(0), PointAt(1));
    cache_.pairwise().Put(pairwise_key, {120, 160.0, ""});
    cache_.directions().Put(directions_key, {120, 160.0, "_p~iF~ps|U"});

    // when
    clock_.Advance(boost::posix_time::hours(48));

    // then
    EXPECT_FALSE(cache_.pairwise().Find(pairwise_key));
    EXPECT_TRUE(cache_.directions().Find(directions_key));

    clock_.Advance(boost::posix_time::hours(24 * 6));
    EXPECT_FALSE(cache_.directions().Find(directions_key));
}

TEST_F(TestTravelTimeCache, FailuresAreNotStored) {
    // given
    const auto key = Key(0, 1, "08:00:00");

    // when
    EXPECT_THROW(cache_.pairwise().GetOrCompute(key, []() -> walkplan::TravelLeg {
        throw std::runtime_error("provider failed");
    }), std::runtime_error);

    // then
    EXPECT_EQ(cache_.pairwise().size(), 0);
    EXPECT_EQ(cache_.pairwise().stats().Failures, 1);

    const auto result = cache_.pairwise().GetOrCompute(key, []() -> walkplan::TravelLeg {
        return {60, 80.0, ""};
    });
    EXPECT_EQ(result.second, walkplan::CacheOutcome::Miss);
    EXPECT_EQ(result.first.Seconds, 60);
}

TEST_F(TestTravelTimeCache, ConcurrentReadersShareSingleComputation) {
    // given
    static const std::size_t THREADS = 8;
    const auto key = Key(0, 1, "08:00:00");
    std::atomic<std::size_t> calls{0};
    std::atomic<std::size_t> misses{0};
    std::atomic<std::size_t> seconds_sum{0};

    // when
    std::vector<std::thread> threads;
    for (std::size_t thread_index = 0; thread_index < THREADS; ++thread_index) {
        threads.emplace_back([this, &key, &calls, &misses, &seconds_sum]() {
            const auto result = cache_.pairwise().GetOrCompute(key, [&calls]() -> walkplan::TravelLeg {
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                return {300, 400.0, ""};
            });

            if (result.second == walkplan::CacheOutcome::Miss) {
                ++misses;
            }
            seconds_sum += static_cast<std::size_t>(result.first.Seconds);
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    // then
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(misses, 1);
    EXPECT_EQ(seconds_sum, THREADS * 300);

    const auto stats = cache_.pairwise().stats();
    EXPECT_EQ(stats.Misses + stats.Hits + stats.Coalesced, THREADS);
}

TEST_F(TestTravelTimeCache, ConcurrentReadersShareFailure) {
    // given
    static const std::size_t THREADS = 4;
    const auto key = Key(0, 1, "08:00:00");
    std::atomic<std::size_t> calls{0};
    std::atomic<std::size_t> failures{0};

    // when
    std::vector<std::thread> threads;
    for (std::size_t thread_index = 0; thread_index < THREADS; ++thread_index) {
        threads.emplace_back([this, &key, &calls, &failures]() {
            try {
                cache_.pairwise().GetOrCompute(key, [&calls]() -> walkplan::TravelLeg {
                    ++calls;
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                    throw std::runtime_error("provider failed");
                });
            } catch (const std::runtime_error &ex) {
                ++failures;
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    // then
    EXPECT_EQ(failures, THREADS);
    EXPECT_GE(calls, 1);
    EXPECT_EQ(cache_.pairwise().size(), 0);
}

int main(int argc, char **argv) {
    util::SetupLogging(argv[0]);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
