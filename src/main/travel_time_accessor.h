#ifndef WALKPLAN_TRAVEL_TIME_ACCESSOR_H
#define WALKPLAN_TRAVEL_TIME_ACCESSOR_H

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <nlohmann/json.hpp>

#include "location.h"
#include "travel_time_cache.h"
#include "travel_time_provider.h"

namespace walkplan {

    enum class TravelSource {
        Provider,
        Cache,
        StaleCache,
        Estimate
    };

    std::string to_string(TravelSource value);

    /*!
     * Travel leg together with the origin of the data.
     */
    struct ResolvedLeg {
        ResolvedLeg();

        ResolvedLeg(TravelLeg leg, TravelSource source, std::string provider);

        TravelLeg Leg;
        TravelSource Source;
        std::string Provider;
    };

    void to_json(nlohmann::json &json, const ResolvedLeg &leg);

    struct ResolvedMatrix {
        ResolvedMatrix();

        explicit ResolvedMatrix(std::size_t size);

        std::size_t size() const;

        TravelMatrix Values;
        std::vector<std::vector<TravelSource> > Sources;
    };

    /*!
     * Travel data used by a single solve.
     *
     * Values are looked up in the shared cache first, then requested from the provider.
     * If the provider fails, the last known value from the cache is used instead,
     * and if there is no such value, the estimate computed from the great circle distance.
     * Using the estimate marks the data as degraded.
     */
    class TravelTimeAccessor {
    public:
        TravelTimeAccessor(std::shared_ptr<TravelTimeProvider> provider,
                           std::shared_ptr<TravelTimeCache> cache,
                           std::shared_ptr<EstimateTravelTimeProvider> estimate_provider,
                           std::size_t concurrency);

        ResolvedLeg Duration(const Location &from, const Location &to, boost::posix_time::ptime depart_at);

        /*!
         * Full leg including the geometry, served from the directions cache.
         */
        ResolvedLeg Directions(const Location &from, const Location &to, boost::posix_time::ptime depart_at);

        /*!
         * Pairwise durations between all points.
         * The departure time for legs leaving the point i is depart_at[i].
         *
         * Rows in the same departure time bucket which are missing from the cache are requested
         * from the provider in a single matrix call. The remaining legs are looked up concurrently
         * one by one, which is also the recovery path if the matrix call fails.
         */
        ResolvedMatrix Matrix(const std::vector<Location> &points,
                              const std::vector<boost::posix_time::ptime> &depart_at);

        /*!
         * Duration estimated from the great circle distance, no provider is called.
         */
        std::int64_t Estimate(const Location &from, const Location &to) const;

        bool degraded() const;

        std::size_t concurrency() const;

        const std::string &provider_mode() const;

    private:
        bool IsCold(const std::vector<Location> &points,
                    const std::vector<boost::posix_time::ptime> &depart_at,
                    const std::vector<std::size_t> &rows) const;

        void FillRows(const std::vector<Location> &points,
                      boost::posix_time::ptime depart_at,
                      const std::vector<std::size_t> &rows,
                      ResolvedMatrix &matrix,
                      std::vector<std::vector<bool> > &resolved);

        ResolvedLeg Fallback(const std::string &what,
                             const boost::optional<TravelLeg> &stale_leg,
                             const Location &from,
                             const Location &to,
                             boost::posix_time::ptime depart_at);

        std::shared_ptr<TravelTimeProvider> provider_;
        std::shared_ptr<TravelTimeCache> cache_;
        std::shared_ptr<EstimateTravelTimeProvider> estimate_provider_;
        std::size_t concurrency_;
        std::string provider_mode_;
        std::atomic<bool> degraded_;
    };
}


#endif //WALKPLAN_TRAVEL_TIME_ACCESSOR_H
