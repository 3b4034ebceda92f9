#include "travel_time_accessor.h"

#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <boost/format.hpp>
#include <glog/logging.h>

#include "provider_error.h"

namespace walkplan {

    std::string to_string(TravelSource value) {
        switch (value) {
            case TravelSource::Provider:
                return "provider";
            case TravelSource::Cache:
                return "cache";
            case TravelSource::StaleCache:
                return "stale_cache";
            case TravelSource::Estimate:
                return "estimate";
            default:
                throw std::invalid_argument("Conversion to std::string not defined for value="
                                            + std::to_string(static_cast<int>(value)));
        }
    }

    ResolvedLeg::ResolvedLeg()
            : ResolvedLeg(TravelLeg(), TravelSource::Provider, "") {}

    ResolvedLeg::ResolvedLeg(TravelLeg leg, TravelSource source, std::string provider)
            : Leg{std::move(leg)},
              Source{source},
              Provider{std::move(provider)} {}

    void to_json(nlohmann::json &json, const ResolvedLeg &leg) {
        json = nlohmann::json{
                {"seconds",  leg.Leg.Seconds},
                {"meters",   leg.Leg.Meters},
                {"source",   to_string(leg.Source)},
                {"provider", leg.Provider},
                {"cached",   leg.Source == TravelSource::Cache || leg.Source == TravelSource::StaleCache},
                {"fallback", leg.Source == TravelSource::Estimate}
        };
    }

    ResolvedMatrix::ResolvedMatrix()
            : ResolvedMatrix(0) {}

    ResolvedMatrix::ResolvedMatrix(std::size_t size)
            : Values{size},
              Sources(size, std::vector<TravelSource>(size, TravelSource::Provider)) {}

    std::size_t ResolvedMatrix::size() const {
        return Values.size();
    }

    TravelTimeAccessor::TravelTimeAccessor(std::shared_ptr<TravelTimeProvider> provider,
                                           std::shared_ptr<TravelTimeCache> cache,
                                           std::shared_ptr<EstimateTravelTimeProvider> estimate_provider,
                                           std::size_t concurrency)
            : provider_{std::move(provider)},
              cache_{std::move(cache)},
              estimate_provider_{std::move(estimate_provider)},
              concurrency_{std::max(concurrency, static_cast<std::size_t>(1))},
              provider_mode_{},
              degraded_{false} {
        CHECK(provider_);
        CHECK(cache_);
        CHECK(estimate_provider_);

        provider_mode_ = provider_->mode();
    }

    ResolvedLeg TravelTimeAccessor::Duration(const Location &from,
                                             const Location &to,
                                             boost::posix_time::ptime depart_at) {
        if (from == to) {
            return {TravelLeg(), TravelSource::Provider, provider_mode_};
        }

        const auto key = cache_->MakePairwiseKey(provider_mode_, from, to, depart_at);
        try {
            auto result = cache_->pairwise().GetOrCompute(key, [this, &from, &to, depart_at]() -> TravelLeg {
                auto leg = provider_->Duration(from, to, depart_at);
                // the geometry is kept by the directions cache
                leg.Polyline.clear();
                return leg;
            });

            const auto source = result.second == CacheOutcome::Miss ? TravelSource::Provider : TravelSource::Cache;
            return {std::move(result.first), source, provider_mode_};
        } catch (const ProviderError &ex) {
            LOG(WARNING) << boost::format("Provider %1% failed to compute the duration from %2% to %3%: %4%")
                            % ex.provider()
                            % from
                            % to
                            % ex.what();
            return Fallback("duration", cache_->pairwise().FindStale(key), from, to, depart_at);
        }
    }

    ResolvedLeg TravelTimeAccessor::Directions(const Location &from,
                                               const Location &to,
                                               boost::posix_time::ptime depart_at) {
        if (from == to) {
            return {TravelLeg(), TravelSource::Provider, provider_mode_};
        }

        const auto key = cache_->MakeDirectionsKey(from, to);
        try {
            auto result = cache_->directions().GetOrCompute(key, [this, &from, &to, depart_at]() -> TravelLeg {
                return provider_->Duration(from, to, depart_at);
            });

            const auto source = result.second == CacheOutcome::Miss ? TravelSource::Provider : TravelSource::Cache;
            return {std::move(result.first), source, provider_mode_};
        } catch (const ProviderError &ex) {
            LOG(WARNING) << boost::format("Provider %1% failed to compute directions from %2% to %3%: %4%")
                            % ex.provider()
                            % from
                            % to
                            % ex.what();
            return Fallback("directions", cache_->directions().FindStale(key), from, to, depart_at);
        }
    }

    ResolvedLeg TravelTimeAccessor::Fallback(const std::string &what,
                                             const boost::optional<TravelLeg> &stale_leg,
                                             const Location &from,
                                             const Location &to,
                                             boost::posix_time::ptime depart_at) {
        if (stale_leg) {
            VLOG(1) << boost::format("Using the expired %1% from %2% to %3%") % what % from % to;
            return {stale_leg.get(), TravelSource::StaleCache, provider_mode_};
        }

        degraded_ = true;
        return {estimate_provider_->Duration(from, to, depart_at),
                TravelSource::Estimate,
                estimate_provider_->mode()};
    }

    ResolvedMatrix TravelTimeAccessor::Matrix(const std::vector<Location> &points,
                                              const std::vector<boost::posix_time::ptime> &depart_at) {
        CHECK_EQ(points.size(), depart_at.size());

        ResolvedMatrix matrix{points.size()};
        std::vector<std::vector<bool> > resolved(points.size(), std::vector<bool>(points.size(), false));

        // rows which share the departure time bucket can be requested from the provider at once
        std::map<std::int64_t, std::vector<std::size_t> > rows_by_bucket;
        for (std::size_t from = 0; from < points.size(); ++from) {
            const auto key = cache_->MakePairwiseKey(provider_mode_, points[from], points[from], depart_at[from]);
            rows_by_bucket[key.TimeBucket].push_back(from);
        }

        if (points.size() > 1) {
            for (const auto &bucket_rows : rows_by_bucket) {
                const auto &rows = bucket_rows.second;
                if (IsCold(points, depart_at, rows)) {
                    FillRows(points, depart_at[rows.front()], rows, matrix, resolved);
                }
            }
        }

        std::vector<std::pair<std::size_t, std::size_t> > legs;
        for (std::size_t from = 0; from < points.size(); ++from) {
            for (std::size_t to = 0; to < points.size(); ++to) {
                if (from != to && !resolved[from][to]) {
                    legs.emplace_back(from, to);
                }
            }
        }

        std::atomic<std::size_t> next_leg{0};
        std::mutex error_mutex;
        std::exception_ptr error;

        const auto worker = [&]() {
            while (true) {
                const auto leg_index = next_leg.fetch_add(1);
                if (leg_index >= legs.size()) {
                    return;
                }

                const auto from = legs[leg_index].first;
                const auto to = legs[leg_index].second;
                try {
                    const auto leg = Duration(points[from], points[to], depart_at[from]);

                    // each worker writes distinct cells
                    matrix.Values.Seconds[from][to] = leg.Leg.Seconds;
                    matrix.Values.Meters[from][to] = leg.Leg.Meters;
                    matrix.Sources[from][to] = leg.Source;
                } catch (...) {
                    std::lock_guard<std::mutex> lock{error_mutex};
                    if (!error) {
                        error = std::current_exception();
                    }
                    next_leg = legs.size();
                    return;
                }
            }
        };

        const auto thread_count = std::min(concurrency_, std::max(legs.size(), static_cast<std::size_t>(1)));
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        try {
            for (std::size_t thread_index = 1; thread_index < thread_count; ++thread_index) {
                threads.emplace_back(worker);
            }
        } catch (const std::system_error &ex) {
            LOG(ERROR) << boost::format("Failed to start a worker thread: %1%") % ex.what();
            next_leg = legs.size();
            for (auto &thread : threads) {
                thread.join();
            }
            throw;
        }
        worker();
        for (auto &thread : threads) {
            thread.join();
        }

        if (error) {
            std::rethrow_exception(error);
        }

        VLOG(1) << boost::format("Computed travel matrix of size %1% using %2% threads") % points.size() % thread_count;
        return matrix;
    }

    bool TravelTimeAccessor::IsCold(const std::vector<Location> &points,
                                    const std::vector<boost::posix_time::ptime> &depart_at,
                                    const std::vector<std::size_t> &rows) const {
        for (const auto from : rows) {
            for (std::size_t to = 0; to < points.size(); ++to) {
                if (points[from] == points[to]) {
                    continue;
                }

                const auto key = cache_->MakePairwiseKey(provider_mode_, points[from], points[to], depart_at[from]);
                if (cache_->pairwise().Find(key)) {
                    return false;
                }
            }
        }
        return true;
    }

    void TravelTimeAccessor::FillRows(const std::vector<Location> &points,
                                      boost::posix_time::ptime depart_at,
                                      const std::vector<std::size_t> &rows,
                                      ResolvedMatrix &matrix,
                                      std::vector<std::vector<bool> > &resolved) {
        TravelMatrix values;
        try {
            values = provider_->Matrix(points, depart_at);
        } catch (const ProviderError &ex) {
            LOG(WARNING) << boost::format("Provider %1% failed to compute the travel matrix of size %2%: %3%")
                            % ex.provider()
                            % points.size()
                            % ex.what();
            return;
        }
        CHECK_EQ(values.size(), points.size());

        for (const auto from : rows) {
            for (std::size_t to = 0; to < points.size(); ++to) {
                if (from == to) {
                    continue;
                }

                if (points[from] == points[to]) {
                    matrix.Values.Seconds[from][to] = 0;
                    matrix.Values.Meters[from][to] = 0.0;
                } else {
                    TravelLeg leg{values.Seconds[from][to], values.Meters[from][to], ""};
                    cache_->pairwise().Put(
                            cache_->MakePairwiseKey(provider_mode_, points[from], points[to], depart_at), leg);
                    matrix.Values.Seconds[from][to] = leg.Seconds;
                    matrix.Values.Meters[from][to] = leg.Meters;
                }
                matrix.Sources[from][to] = TravelSource::Provider;
                resolved[from][to] = true;
            }
        }

        VLOG(1) << boost::format("Requested %1% rows of the travel matrix from the provider %2%")
                   % rows.size()
                   % provider_mode_;
    }

    std::int64_t TravelTimeAccessor::Estimate(const Location &from, const Location &to) const {
        return estimate_provider_->Seconds(Location::GreatCircleDistance(from, to));
    }

    bool TravelTimeAccessor::degraded() const {
        return degraded_;
    }

    std::size_t TravelTimeAccessor::concurrency() const {
        return concurrency_;
    }

    const std::string &TravelTimeAccessor::provider_mode() const {
        return provider_mode_;
    }
}
