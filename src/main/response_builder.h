#ifndef WALKPLAN_RESPONSE_BUILDER_H
#define WALKPLAN_RESPONSE_BUILDER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include "problem_instance.h"
#include "schedule.h"
#include "travel_time_accessor.h"
#include "trip_request.h"

namespace walkplan {

    struct RouteStop {
        RouteStop(VisitRecord visit, std::string polyline);

        VisitRecord Visit;
        std::string Polyline;
    };

    void to_json(nlohmann::json &json, const RouteStop &stop);

    struct SolveMetrics {
        SolveMetrics();

        std::int64_t TotalWalkSeconds;
        std::int64_t FinalLegSeconds;
        std::size_t Visited;
        std::size_t Dropped;
        std::int64_t SolveMilliseconds;
        SolveStage Stage;
        bool Degraded;
        double Objective;
    };

    void to_json(nlohmann::json &json, const SolveMetrics &metrics);

    struct SolveResponse {
        std::vector<RouteStop> Route;
        std::vector<DropRecord> Dropped;
        SolveMetrics Metrics;
        boost::optional<nlohmann::json> Debug;
    };

    void to_json(nlohmann::json &json, const SolveResponse &response);

    /*!
     * Assembles the answer returned to the caller. It never fails.
     */
    class ResponseBuilder {
    public:
        ResponseBuilder(TravelTimeAccessor &accessor, bool attach_debug, std::int64_t max_lateness);

        SolveResponse Build(const TripRequest &request,
                            const std::vector<DropRecord> &filtered_out,
                            const ProblemInstance &instance,
                            const Schedule &schedule,
                            SolveStage stage,
                            std::chrono::steady_clock::time_point started_at) const;

        /*!
         * Explains why an event which passed the pre-filter is not part of the schedule.
         */
        DropReason Classify(const ProblemInstance &instance, const Schedule &schedule, std::size_t node) const;

    private:
        std::vector<RouteStop> BuildRoute(const ProblemInstance &instance, const Schedule &schedule) const;

        nlohmann::json BuildDebug(const ProblemInstance &instance) const;

        TravelTimeAccessor &accessor_;
        bool attach_debug_;
        std::int64_t max_lateness_;
    };
}


#endif //WALKPLAN_RESPONSE_BUILDER_H
