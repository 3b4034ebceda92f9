#include "travel_time_cache.h"

#include <stdexcept>

namespace walkplan {

    PairwiseKey::PairwiseKey(std::string mode, Location from, Location to, std::int64_t time_bucket)
            : Mode{std::move(mode)},
              From{std::move(from)},
              To{std::move(to)},
              TimeBucket{time_bucket} {}

    bool PairwiseKey::operator==(const PairwiseKey &other) const {
        return TimeBucket == other.TimeBucket && From == other.From && To == other.To && Mode == other.Mode;
    }

    DirectionsKey::DirectionsKey(Location from, Location to)
            : From{std::move(from)},
              To{std::move(to)} {}

    bool DirectionsKey::operator==(const DirectionsKey &other) const {
        return From == other.From && To == other.To;
    }

    std::string to_string(CacheOutcome value) {
        switch (value) {
            case CacheOutcome::Hit:
                return "hit";
            case CacheOutcome::Miss:
                return "miss";
            case CacheOutcome::Coalesced:
                return "coalesced";
            default:
                throw std::invalid_argument("Conversion to std::string not defined for value="
                                            + std::to_string(static_cast<int>(value)));
        }
    }

    CacheStats::CacheStats()
            : Hits{0},
              Misses{0},
              Coalesced{0},
              Failures{0} {}

    Clock SystemClock() {
        return []() -> boost::posix_time::ptime { return boost::posix_time::microsec_clock::universal_time(); };
    }

    TravelTimeCache::Config::Config()
            : PairwisePrecision{4},
              DirectionsPrecision{5},
              TimeBucket{boost::posix_time::minutes(15)},
              PairwiseTimeToLive{boost::posix_time::hours(24)},
              DirectionsTimeToLive{boost::posix_time::hours(24 * 7)},
              StaleRetention{boost::posix_time::hours(24)} {}

    TravelTimeCache::TravelTimeCache()
            : TravelTimeCache(Config()) {}

    TravelTimeCache::TravelTimeCache(Config config)
            : TravelTimeCache(std::move(config), SystemClock()) {}

    TravelTimeCache::TravelTimeCache(Config config, Clock clock)
            : config_{std::move(config)},
              pairwise_{config_.PairwiseTimeToLive, config_.StaleRetention, clock},
              directions_{config_.DirectionsTimeToLive, config_.StaleRetention, clock} {
        CHECK_GT(config_.TimeBucket.total_seconds(), 0);
    }

    PairwiseKey TravelTimeCache::MakePairwiseKey(const std::string &mode,
                                                 const Location &from,
                                                 const Location &to,
                                                 boost::posix_time::ptime depart_at) const {
        static const boost::posix_time::ptime EPOCH{boost::gregorian::date(1970, 1, 1)};

        std::int64_t time_bucket = 0;
        if (!depart_at.is_special()) {
            const auto seconds_since_epoch = (depart_at - EPOCH).total_seconds();
            const auto bucket_seconds = config_.TimeBucket.total_seconds();
            time_bucket = seconds_since_epoch / bucket_seconds;
            if (seconds_since_epoch < 0 && seconds_since_epoch % bucket_seconds != 0) {
                --time_bucket;
            }
        }

        return {mode,
                from.Round(config_.PairwisePrecision),
                to.Round(config_.PairwisePrecision),
                time_bucket};
    }

    DirectionsKey TravelTimeCache::MakeDirectionsKey(const Location &from, const Location &to) const {
        return {from.Round(config_.DirectionsPrecision), to.Round(config_.DirectionsPrecision)};
    }

    ExpiringCache<PairwiseKey, TravelLeg> &TravelTimeCache::pairwise() {
        return pairwise_;
    }

    const ExpiringCache<PairwiseKey, TravelLeg> &TravelTimeCache::pairwise() const {
        return pairwise_;
    }

    ExpiringCache<DirectionsKey, TravelLeg> &TravelTimeCache::directions() {
        return directions_;
    }

    const ExpiringCache<DirectionsKey, TravelLeg> &TravelTimeCache::directions() const {
        return directions_;
    }

    const TravelTimeCache::Config &TravelTimeCache::config() const {
        return config_;
    }
}
