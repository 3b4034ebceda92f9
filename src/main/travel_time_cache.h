#ifndef WALKPLAN_TRAVEL_TIME_CACHE_H
#define WALKPLAN_TRAVEL_TIME_CACHE_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/functional/hash.hpp>
#include <boost/optional.hpp>
#include <glog/logging.h>

#include "location.h"
#include "travel_time_provider.h"

namespace walkplan {

    struct PairwiseKey {
        PairwiseKey(std::string mode, Location from, Location to, std::int64_t time_bucket);

        bool operator==(const PairwiseKey &other) const;

        std::string Mode;
        Location From;
        Location To;
        std::int64_t TimeBucket;
    };

    struct DirectionsKey {
        DirectionsKey(Location from, Location to);

        bool operator==(const DirectionsKey &other) const;

        Location From;
        Location To;
    };
}

namespace std {

    template<>
    struct hash<walkplan::PairwiseKey> {
        std::size_t operator()(const walkplan::PairwiseKey &key) const noexcept {
            static const std::hash<walkplan::Location> hash_location{};

            std::size_t seed = 0;
            boost::hash_combine(seed, key.Mode);
            boost::hash_combine(seed, hash_location(key.From));
            boost::hash_combine(seed, hash_location(key.To));
            boost::hash_combine(seed, key.TimeBucket);
            return seed;
        }
    };

    template<>
    struct hash<walkplan::DirectionsKey> {
        std::size_t operator()(const walkplan::DirectionsKey &key) const noexcept {
            static const std::hash<walkplan::Location> hash_location{};

            std::size_t seed = 0;
            boost::hash_combine(seed, hash_location(key.From));
            boost::hash_combine(seed, hash_location(key.To));
            return seed;
        }
    };
}

namespace walkplan {

    enum class CacheOutcome {
        Hit,
        Miss,
        Coalesced
    };

    std::string to_string(CacheOutcome value);

    struct CacheStats {
        CacheStats();

        std::size_t Hits;
        std::size_t Misses;
        std::size_t Coalesced;
        std::size_t Failures;
    };

    using Clock = std::function<boost::posix_time::ptime()>;

    Clock SystemClock();

    /*!
     * Key-value store with expiring entries.
     *
     * A miss calls the supplied function exactly once per key.
     * Concurrent readers of a key that is being computed wait for the result
     * instead of calling the function themselves. Failures are shared with the
     * waiting readers and are never stored. Expired entries are retained for the stale retention period,
     * so that they can still serve as the last known value. Entries older than that are evicted when
     * the cache is filled.
     */
    template<typename KeyType, typename ValueType>
    class ExpiringCache {
    public:
        ExpiringCache(boost::posix_time::time_duration time_to_live, Clock clock);

        ExpiringCache(boost::posix_time::time_duration time_to_live,
                      boost::posix_time::time_duration stale_retention,
                      Clock clock);

        std::pair<ValueType, CacheOutcome> GetOrCompute(const KeyType &key,
                                                        const std::function<ValueType()> &compute);

        boost::optional<ValueType> Find(const KeyType &key) const;

        boost::optional<ValueType> FindStale(const KeyType &key) const;

        void Put(const KeyType &key, ValueType value);

        std::size_t size() const;

        CacheStats stats() const;

        boost::posix_time::time_duration time_to_live() const;

        boost::posix_time::time_duration stale_retention() const;

    private:
        struct Entry {
            ValueType Value;
            boost::posix_time::ptime ExpiresAt;
        };

        // requires the mutex to be held
        void Store(const KeyType &key, ValueType value);

        const boost::posix_time::time_duration time_to_live_;
        const boost::posix_time::time_duration stale_retention_;
        const Clock clock_;

        mutable std::mutex mutex_;
        std::unordered_map<KeyType, Entry> entries_;
        std::unordered_map<KeyType, std::shared_future<ValueType> > in_flight_;
        CacheStats stats_;
        boost::posix_time::ptime next_eviction_;
    };

    /*!
     * Travel data shared by all solves of an engine.
     * Pairwise durations are keyed by the provider, rounded coordinates and the departure time bucket.
     * Directions are keyed by the rounded coordinates only and live longer.
     */
    class TravelTimeCache {
    public:
        struct Config {
            Config();

            int PairwisePrecision;
            int DirectionsPrecision;
            boost::posix_time::time_duration TimeBucket;
            boost::posix_time::time_duration PairwiseTimeToLive;
            boost::posix_time::time_duration DirectionsTimeToLive;
            boost::posix_time::time_duration StaleRetention;
        };

        TravelTimeCache();

        explicit TravelTimeCache(Config config);

        TravelTimeCache(Config config, Clock clock);

        PairwiseKey MakePairwiseKey(const std::string &mode,
                                    const Location &from,
                                    const Location &to,
                                    boost::posix_time::ptime depart_at) const;

        DirectionsKey MakeDirectionsKey(const Location &from, const Location &to) const;

        ExpiringCache<PairwiseKey, TravelLeg> &pairwise();

        const ExpiringCache<PairwiseKey, TravelLeg> &pairwise() const;

        ExpiringCache<DirectionsKey, TravelLeg> &directions();

        const ExpiringCache<DirectionsKey, TravelLeg> &directions() const;

        const Config &config() const;

    private:
        Config config_;
        ExpiringCache<PairwiseKey, TravelLeg> pairwise_;
        ExpiringCache<DirectionsKey, TravelLeg> directions_;
    };
}

namespace walkplan {

    template<typename KeyType, typename ValueType>
    ExpiringCache<KeyType, ValueType>::ExpiringCache(boost::posix_time::time_duration time_to_live, Clock clock)
            : ExpiringCache(time_to_live, time_to_live, std::move(clock)) {}

    template<typename KeyType, typename ValueType>
    ExpiringCache<KeyType, ValueType>::ExpiringCache(boost::posix_time::time_duration time_to_live,
                                                     boost::posix_time::time_duration stale_retention,
                                                     Clock clock)
            : time_to_live_{time_to_live},
              stale_retention_{stale_retention},
              clock_{std::move(clock)},
              mutex_{},
              entries_{},
              in_flight_{},
              stats_{},
              next_eviction_{boost::posix_time::neg_infin} {
        CHECK(clock_);
        CHECK(!stale_retention_.is_negative());
    }

    template<typename KeyType, typename ValueType>
    std::pair<ValueType, CacheOutcome> ExpiringCache<KeyType, ValueType>::GetOrCompute(
            const KeyType &key,
            const std::function<ValueType()> &compute) {
        std::promise<ValueType> promise;

        std::unique_lock<std::mutex> lock{mutex_};
        const auto entry_it = entries_.find(key);
        if (entry_it != std::end(entries_) && clock_() < entry_it->second.ExpiresAt) {
            ++stats_.Hits;
            return {entry_it->second.Value, CacheOutcome::Hit};
        }

        const auto in_flight_it = in_flight_.find(key);
        if (in_flight_it != std::end(in_flight_)) {
            ++stats_.Coalesced;
            auto pending_value = in_flight_it->second;
            lock.unlock();
            return {pending_value.get(), CacheOutcome::Coalesced};
        }

        ++stats_.Misses;
        in_flight_.emplace(key, promise.get_future().share());
        lock.unlock();

        try {
            auto value = compute();
            {
                std::lock_guard<std::mutex> lock{mutex_};
                Store(key, value);
                in_flight_.erase(key);
            }
            promise.set_value(value);
            return {std::move(value), CacheOutcome::Miss};
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock{mutex_};
                ++stats_.Failures;
                in_flight_.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    template<typename KeyType, typename ValueType>
    boost::optional<ValueType> ExpiringCache<KeyType, ValueType>::Find(const KeyType &key) const {
        std::lock_guard<std::mutex> lock{mutex_};
        const auto entry_it = entries_.find(key);
        if (entry_it == std::end(entries_) || clock_() >= entry_it->second.ExpiresAt) {
            return boost::none;
        }
        return entry_it->second.Value;
    }

    template<typename KeyType, typename ValueType>
    boost::optional<ValueType> ExpiringCache<KeyType, ValueType>::FindStale(const KeyType &key) const {
        std::lock_guard<std::mutex> lock{mutex_};
        const auto entry_it = entries_.find(key);
        if (entry_it == std::end(entries_) || clock_() >= entry_it->second.ExpiresAt + stale_retention_) {
            return boost::none;
        }
        return entry_it->second.Value;
    }

    template<typename KeyType, typename ValueType>
    void ExpiringCache<KeyType, ValueType>::Put(const KeyType &key, ValueType value) {
        std::lock_guard<std::mutex> lock{mutex_};
        Store(key, std::move(value));
    }

    template<typename KeyType, typename ValueType>
    void ExpiringCache<KeyType, ValueType>::Store(const KeyType &key, ValueType value) {
        const auto now = clock_();

        // a full scan at most once per retention period
        if (now >= next_eviction_) {
            auto entry_it = std::begin(entries_);
            while (entry_it != std::end(entries_)) {
                if (now >= entry_it->second.ExpiresAt + stale_retention_) {
                    entry_it = entries_.erase(entry_it);
                } else {
                    ++entry_it;
                }
            }
            next_eviction_ = now + stale_retention_;
        }

        entries_[key] = Entry{std::move(value), now + time_to_live_};
    }

    template<typename KeyType, typename ValueType>
    std::size_t ExpiringCache<KeyType, ValueType>::size() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return entries_.size();
    }

    template<typename KeyType, typename ValueType>
    CacheStats ExpiringCache<KeyType, ValueType>::stats() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return stats_;
    }

    template<typename KeyType, typename ValueType>
    boost::posix_time::time_duration ExpiringCache<KeyType, ValueType>::time_to_live() const {
        return time_to_live_;
    }

    template<typename KeyType, typename ValueType>
    boost::posix_time::time_duration ExpiringCache<KeyType, ValueType>::stale_retention() const {
        return stale_retention_;
    }
}


#endif //WALKPLAN_TRAVEL_TIME_CACHE_H
