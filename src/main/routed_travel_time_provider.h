#ifndef WALKPLAN_ROUTED_TRAVEL_TIME_PROVIDER_H
#define WALKPLAN_ROUTED_TRAVEL_TIME_PROVIDER_H

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <osrm/engine_config.hpp>
#include <osrm/json_container.hpp>
#include <osrm/osrm.hpp>
#include <osrm/status.hpp>

#include "travel_time_provider.h"

namespace walkplan {

    /*!
     * Bounds the number of requests in flight to an external service.
     */
    class RequestThrottle {
    public:
        explicit RequestThrottle(std::size_t capacity);

        bool TryAcquire(boost::posix_time::time_duration timeout);

        void Release();

        std::size_t capacity() const;

    private:
        const std::size_t capacity_;
        std::size_t in_use_;
        std::mutex mutex_;
        std::condition_variable released_;
    };

    /*!
     * Walking routes computed by the Open Source Routing Machine over a local data set.
     */
    class RoutedTravelTimeProvider : public TravelTimeProvider {
    public:
        RoutedTravelTimeProvider(osrm::EngineConfig &config,
                                 boost::posix_time::time_duration timeout,
                                 std::size_t max_concurrent_requests);

        std::string mode() const override;

        TravelLeg Duration(const Location &from, const Location &to, boost::posix_time::ptime depart_at) override;

        TravelMatrix Matrix(const std::vector<Location> &points, boost::posix_time::ptime depart_at) override;

    private:
        struct Reply {
            osrm::Status Status;
            osrm::json::Object Result;
        };

        template<typename Query>
        Reply Call(const std::string &service, Query query);

        std::shared_ptr<osrm::OSRM> routing_service_;
        boost::posix_time::time_duration timeout_;
        std::shared_ptr<RequestThrottle> throttle_;
    };
}


#endif //WALKPLAN_ROUTED_TRAVEL_TIME_PROVIDER_H
