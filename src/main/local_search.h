#ifndef WALKPLAN_LOCAL_SEARCH_H
#define WALKPLAN_LOCAL_SEARCH_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "problem_instance.h"
#include "route_timeline.h"

namespace walkplan {

    /*!
     * First improvement descent over 2-opt segment reversals and or-opt single node relocations.
     *
     * Moves are scanned in a fixed order and the first move that keeps all time windows
     * and strictly reduces the objective is applied. The descent stops at a local optimum
     * or after the given number of applied moves.
     */
    class LocalSearch {
    public:
        struct Result {
            RouteTimeline Timeline;
            std::size_t Improvements;
        };

        LocalSearch(std::size_t max_iterations, std::int64_t max_lateness);

        /*!
         * @param dwell_by_node dwell time of every node in the problem instance
         */
        Result Improve(const ProblemInstance &instance,
                       const std::vector<std::size_t> &nodes,
                       const std::vector<std::int64_t> &dwell_by_node) const;

    private:
        bool TryTwoOpt(const ProblemInstance &instance,
                       const std::vector<std::int64_t> &dwell_by_node,
                       RouteTimeline &current) const;

        bool TryOrOpt(const ProblemInstance &instance,
                      const std::vector<std::int64_t> &dwell_by_node,
                      RouteTimeline &current) const;

        bool Accept(const ProblemInstance &instance,
                    const std::vector<std::size_t> &nodes,
                    const std::vector<std::int64_t> &dwell_by_node,
                    RouteTimeline &current) const;

        std::size_t max_iterations_;
        std::int64_t max_lateness_;
    };

    std::vector<std::int64_t> SelectDwells(const std::vector<std::size_t> &nodes,
                                           const std::vector<std::int64_t> &dwell_by_node);
}


#endif //WALKPLAN_LOCAL_SEARCH_H
