#include "routed_travel_time_provider.h"

#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <thread>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/format.hpp>

#include <glog/logging.h>

#include <osrm/coordinate.hpp>
#include <osrm/route_parameters.hpp>
#include <osrm/table_parameters.hpp>

#include "provider_error.h"

namespace walkplan {

    static const std::string PROVIDER_NAME{"osrm"};

    RequestThrottle::RequestThrottle(std::size_t capacity)
            : capacity_{capacity},
              in_use_{0} {
        CHECK_GT(capacity_, 0);
    }

    bool RequestThrottle::TryAcquire(boost::posix_time::time_duration timeout) {
        std::unique_lock<std::mutex> lock{mutex_};
        const auto acquired = released_.wait_for(lock,
                                                 std::chrono::milliseconds(timeout.total_milliseconds()),
                                                 [this]() -> bool { return in_use_ < capacity_; });
        if (acquired) {
            ++in_use_;
        }
        return acquired;
    }

    void RequestThrottle::Release() {
        {
            std::lock_guard<std::mutex> lock{mutex_};
            DCHECK_GT(in_use_, 0);
            --in_use_;
        }
        released_.notify_one();
    }

    std::size_t RequestThrottle::capacity() const {
        return capacity_;
    }

    RoutedTravelTimeProvider::RoutedTravelTimeProvider(osrm::EngineConfig &config,
                                                       boost::posix_time::time_duration timeout,
                                                       std::size_t max_concurrent_requests)
            : routing_service_{std::make_shared<osrm::OSRM>(config)},
              timeout_{timeout},
              throttle_{std::make_shared<RequestThrottle>(max_concurrent_requests)} {}

    std::string RoutedTravelTimeProvider::mode() const {
        return PROVIDER_NAME;
    }

    template<typename Query>
    RoutedTravelTimeProvider::Reply RoutedTravelTimeProvider::Call(const std::string &service, Query query) {
        if (!throttle_->TryAcquire(timeout_)) {
            throw ProviderError::RateLimited(PROVIDER_NAME,
                                             (boost::format("Too many concurrent %1% requests") % service).str());
        }

        // the query runs on its own thread, so that a timed out call does not hold the caller
        std::future<Reply> reply_future;
        try {
            auto task = std::make_shared<std::packaged_task<Reply()> >(
                    [routing_service = routing_service_, query = std::move(query)]() -> Reply {
                        Reply reply;
                        reply.Status = query(*routing_service, reply.Result);
                        return reply;
                    });
            reply_future = task->get_future();
            std::thread([task, throttle = throttle_]() {
                (*task)();
                throttle->Release();
            }).detach();
        } catch (const std::exception &ex) {
            // the permit is released by the worker thread only once it has started
            throttle_->Release();
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("Failed to start the %1% request") % service).str(),
                                             ex.what());
        }

        if (reply_future.wait_for(std::chrono::milliseconds(timeout_.total_milliseconds()))
            == std::future_status::timeout) {
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("The %1% request timed out after %2%")
                                              % service
                                              % timeout_).str());
        }

        try {
            return reply_future.get();
        } catch (const ProviderError &) {
            throw;
        } catch (...) {
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("The %1% request failed") % service).str(),
                                             boost::current_exception_diagnostic_information());
        }
    }

    TravelLeg RoutedTravelTimeProvider::Duration(const Location &from,
                                                 const Location &to,
                                                 boost::posix_time::ptime depart_at) {
        if (from == to) {
            return {};
        }

        osrm::RouteParameters params;
        params.coordinates = {from.ToCoordinate(), to.ToCoordinate()};
        params.geometries = osrm::RouteParameters::GeometriesType::Polyline;
        params.overview = osrm::RouteParameters::OverviewType::Full;
        DCHECK(params.IsValid());

        auto reply = Call("route", [params](osrm::OSRM &service, osrm::json::Object &result) -> osrm::Status {
            return service.Route(params, result);
        });

        if (reply.Status != osrm::Status::Ok) {
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("Failed to find a route from '%1%' to '%2%'")
                                              % from
                                              % to).str());
        }

        const auto routes_it = reply.Result.values.find("routes");
        if (routes_it == std::end(reply.Result.values)) {
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("No routes have been found from '%1%' to '%2%'")
                                              % from
                                              % to).str());
        }

        const auto &routes = routes_it->second.get<osrm::json::Array>();
        if (routes.values.empty()) {
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("No routes have been found from '%1%' to '%2%'")
                                              % from
                                              % to).str());
        }

        const auto &route = routes.values.at(0).get<osrm::json::Object>();
        const auto duration_it = route.values.find("duration");
        const auto distance_it = route.values.find("distance");
        if (duration_it == std::end(route.values) || distance_it == std::end(route.values)) {
            throw ProviderError::Unavailable(PROVIDER_NAME,
                                             (boost::format("Duration has not been calculated for a route"
                                                            " found from '%1%' to '%2%'")
                                              % from
                                              % to).str());
        }

        std::string polyline;
        const auto geometry_it = route.values.find("geometry");
        if (geometry_it != std::end(route.values) && geometry_it->second.is<osrm::json::String>()) {
            polyline = geometry_it->second.get<osrm::json::String>().value;
        }

        const auto duration = duration_it->second.get<osrm::json::Number>().value;
        const auto distance = distance_it->second.get<osrm::json::Number>().value;
        return {static_cast<std::int64_t>(std::ceil(duration)), distance, std::move(polyline)};
    }

    TravelMatrix RoutedTravelTimeProvider::Matrix(const std::vector<Location> &points,
                                                  boost::posix_time::ptime depart_at) {
        TravelMatrix matrix{points.size()};
        if (points.size() < 2) {
            return matrix;
        }

        osrm::TableParameters params;
        for (const auto &point : points) {
            params.coordinates.push_back(point.ToCoordinate());
        }
        params.annotations = osrm::TableParameters::AnnotationsType::All;
        DCHECK(params.IsValid());

        auto reply = Call("table", [params](osrm::OSRM &service, osrm::json::Object &result) -> osrm::Status {
            return service.Table(params, result);
        });

        if (reply.Status != osrm::Status::Ok) {
            throw ProviderError::Unavailable(PROVIDER_NAME, "Failed to compute the duration table");
        }

        const auto read_table = [&reply](const std::string &key, const std::function<void(std::size_t,
                                                                                            std::size_t,
                                                                                            double)> &sink) {
            const auto table_it = reply.Result.values.find(key);
            if (table_it == std::end(reply.Result.values)) {
                throw ProviderError::Unavailable(PROVIDER_NAME,
                                                 (boost::format("The response does not contain '%1%'") % key).str());
            }

            const auto &rows = table_it->second.get<osrm::json::Array>().values;
            for (std::size_t from = 0; from < rows.size(); ++from) {
                const auto &columns = rows[from].get<osrm::json::Array>().values;
                for (std::size_t to = 0; to < columns.size(); ++to) {
                    if (from == to) { continue; }

                    if (!columns[to].is<osrm::json::Number>()) {
                        throw ProviderError::Unavailable(PROVIDER_NAME,
                                                         (boost::format("No route between points %1% and %2%")
                                                          % from
                                                          % to).str());
                    }
                    sink(from, to, columns[to].get<osrm::json::Number>().value);
                }
            }
        };

        read_table("durations", [&matrix](std::size_t from, std::size_t to, double value) {
            matrix.Seconds[from][to] = static_cast<std::int64_t>(std::ceil(value));
        });
        read_table("distances", [&matrix](std::size_t from, std::size_t to, double value) {
            matrix.Meters[from][to] = value;
        });
        return matrix;
    }
}
