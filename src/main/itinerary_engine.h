#ifndef WALKPLAN_ITINERARY_ENGINE_H
#define WALKPLAN_ITINERARY_ENGINE_H

#include <cstddef>
#include <memory>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "fallback_heuristic.h"
#include "primary_solver.h"
#include "printer.h"
#include "response_builder.h"
#include "travel_time_cache.h"
#include "travel_time_provider.h"
#include "trip_request.h"

namespace walkplan {

    struct EngineConfig {
        EngineConfig();

        PrimarySolver::Config Primary;
        std::size_t LocalSearchIterations;
        std::size_t ProviderConcurrency;
        // applies to the routing engine created by the caller
        boost::posix_time::time_duration ProviderTimeout;
        TravelTimeCache::Config Cache;
        bool AttachDebug;
    };

    /*!
     * Turns a trip request into an itinerary.
     *
     * The engine does not hold any per request state, so concurrent calls to Solve are safe
     * as long as the provider is. The cache is shared by all requests.
     */
    class ItineraryEngine {
    public:
        // travel times are estimated from the great circle distance if the provider is missing
        ItineraryEngine(EngineConfig config,
                        std::shared_ptr<TravelTimeProvider> provider,
                        std::shared_ptr<TravelTimeCache> cache,
                        std::shared_ptr<Printer> printer);

        /*!
         * Throws ApplicationError with the error code INFEASIBLE_INPUT if the request is not valid.
         * Provider failures never reach the caller, they are reported by the degraded flag.
         */
        SolveResponse Solve(const TripRequest &request) const;

        const EngineConfig &config() const;

        const std::shared_ptr<TravelTimeCache> &cache() const;

    private:
        void Trace(TracingEventType type, const std::string &comment) const;

        EngineConfig config_;
        std::shared_ptr<TravelTimeProvider> provider_;
        std::shared_ptr<TravelTimeCache> cache_;
        std::shared_ptr<Printer> printer_;
    };
}


#endif //WALKPLAN_ITINERARY_ENGINE_H
