#include "itinerary_engine.h"

#include <chrono>

#include <boost/format.hpp>
#include <glog/logging.h>

#include "feasibility_filter.h"
#include "problem_instance.h"
#include "travel_time_accessor.h"

namespace walkplan {

    EngineConfig::EngineConfig()
            : Primary{},
              LocalSearchIterations{64},
              ProviderConcurrency{4},
              ProviderTimeout{boost::posix_time::seconds(5)},
              Cache{},
              AttachDebug{false} {}

    ItineraryEngine::ItineraryEngine(EngineConfig config,
                                     std::shared_ptr<TravelTimeProvider> provider,
                                     std::shared_ptr<TravelTimeCache> cache,
                                     std::shared_ptr<Printer> printer)
            : config_{std::move(config)},
              provider_{std::move(provider)},
              cache_{std::move(cache)},
              printer_{std::move(printer)} {
        CHECK(cache_);
        CHECK_GT(config_.ProviderConcurrency, 0);
    }

    SolveResponse ItineraryEngine::Solve(const TripRequest &request) const {
        const auto started_at = std::chrono::steady_clock::now();

        request.Validate();

        auto estimate_provider = std::make_shared<EstimateTravelTimeProvider>(request.walking_speed());
        std::shared_ptr<TravelTimeProvider> provider = provider_;
        if (!provider) {
            provider = estimate_provider;
        }
        TravelTimeAccessor accessor{provider, cache_, estimate_provider, config_.ProviderConcurrency};

        FeasibilityFilter filter{*estimate_provider};
        auto filter_result = filter.Apply(request);

        if (printer_) {
            *printer_ << TripDefinition(request.events().size(),
                                        filter_result.Accepted.size(),
                                        request.start_time(),
                                        request.end_time(),
                                        accessor.provider_mode());
        }

        Trace(TracingEventType::Started, "Travel Matrix");
        const auto instance = ProblemInstance::Create(request, std::move(filter_result.Accepted), accessor);
        Trace(TracingEventType::Finished, "Travel Matrix");

        auto stage = SolveStage::Primary;
        Schedule schedule;

        Trace(TracingEventType::Started, "Primary");
        PrimarySolver primary_solver{config_.Primary, printer_, nullptr};
        const auto primary_schedule = primary_solver.Solve(instance);
        Trace(TracingEventType::Finished, "Primary");

        if (primary_schedule) {
            schedule = primary_schedule.get();
        } else {
            FallbackHeuristic::Config fallback_config;
            fallback_config.LocalSearchIterations = config_.LocalSearchIterations;
            fallback_config.MaxLateness = config_.Primary.MaxLateness;

            Trace(TracingEventType::Started, "Fallback");
            const auto fallback_result = FallbackHeuristic(fallback_config).Solve(instance);
            Trace(TracingEventType::Finished, "Fallback");

            schedule = fallback_result.Itinerary;
            stage = fallback_result.Stage;
        }

        ResponseBuilder builder{accessor, config_.AttachDebug, config_.Primary.MaxLateness};
        auto response = builder.Build(request, filter_result.Dropped, instance, schedule, stage, started_at);

        LOG(INFO) << boost::format("Visited %1% out of %2% events. Stage: %3%, walk: %4%s, degraded: %5%, time: %6%ms")
                     % response.Metrics.Visited
                     % request.events().size()
                     % to_string(response.Metrics.Stage)
                     % response.Metrics.TotalWalkSeconds
                     % response.Metrics.Degraded
                     % response.Metrics.SolveMilliseconds;
        return response;
    }

    const EngineConfig &ItineraryEngine::config() const {
        return config_;
    }

    const std::shared_ptr<TravelTimeCache> &ItineraryEngine::cache() const {
        return cache_;
    }

    void ItineraryEngine::Trace(TracingEventType type, const std::string &comment) const {
        if (printer_) {
            *printer_ << TracingEvent(type, comment);
        }
    }
}
