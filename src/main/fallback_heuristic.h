#ifndef WALKPLAN_FALLBACK_HEURISTIC_H
#define WALKPLAN_FALLBACK_HEURISTIC_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "local_search.h"
#include "problem_instance.h"
#include "route_timeline.h"
#include "schedule.h"

namespace walkplan {

    /*!
     * Best effort schedule used when the primary solver does not answer in time.
     *
     * Events are inserted greedily in the order of popularity, the route is improved by local search,
     * dwell times are compressed to admit the events that did not fit, and finally one event is dropped
     * and the process starts again. The empty schedule is the worst possible outcome.
     */
    class FallbackHeuristic {
    public:
        struct Config {
            Config();

            std::size_t LocalSearchIterations;
            std::int64_t MaxLateness;
        };

        struct InsertionResult {
            RouteTimeline Timeline;
            std::vector<std::size_t> Deferred;
        };

        struct CompressionResult {
            RouteTimeline Timeline;
            std::vector<std::int64_t> DwellByNode;
            std::vector<std::size_t> Deferred;
            std::size_t Admitted;
        };

        struct Result {
            Schedule Itinerary;
            SolveStage Stage;
            std::vector<std::size_t> DroppedNodes;
        };

        FallbackHeuristic();

        explicit FallbackHeuristic(Config config);

        Result Solve(const ProblemInstance &instance) const;

        /*!
         * Inserts the candidates one by one at the position with the lowest extra travel time.
         * Candidates that cannot be inserted without breaking a time window are deferred.
         */
        InsertionResult Insert(const ProblemInstance &instance,
                               const RouteTimeline &route,
                               const std::vector<std::size_t> &candidates,
                               const std::vector<std::int64_t> &dwell_by_node) const;

        LocalSearch::Result Improve(const ProblemInstance &instance,
                                    const RouteTimeline &route,
                                    const std::vector<std::int64_t> &dwell_by_node) const;

        /*!
         * Shrinks dwell times of the visited events towards their minimum, starting from the latest one,
         * until the deferred event can be inserted.
         */
        CompressionResult Compress(const ProblemInstance &instance,
                                   const RouteTimeline &route,
                                   const std::vector<std::size_t> &deferred,
                                   const std::vector<std::int64_t> &dwell_by_node) const;

        /*!
         * Event removed from the candidates when some of them remain deferred after compression.
         *
         * A visited event is removed only if this admits the most popular deferred event and the visited one
         * is less popular. Otherwise the least popular deferred event is removed.
         */
        std::size_t SelectDropped(const ProblemInstance &instance,
                                  const RouteTimeline &route,
                                  const std::vector<std::size_t> &deferred,
                                  const std::vector<std::int64_t> &dwell_by_node) const;

        /*!
         * Candidates in the order they are considered for insertion.
         */
        static std::vector<std::size_t> ByPriority(const ProblemInstance &instance,
                                                   const std::vector<std::size_t> &nodes);

        static std::vector<std::int64_t> InitialDwells(const ProblemInstance &instance);

    private:
        bool IsValid(const ProblemInstance &instance, const RouteTimeline &route, const char *stage) const;

        Config config_;
    };
}


#endif //WALKPLAN_FALLBACK_HEURISTIC_H
