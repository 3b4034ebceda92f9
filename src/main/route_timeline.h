#ifndef WALKPLAN_ROUTE_TIMELINE_H
#define WALKPLAN_ROUTE_TIMELINE_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "problem_instance.h"
#include "trip_request.h"

namespace walkplan {

    struct TimelineStop {
        TimelineStop();

        std::size_t Node;
        std::int64_t Travel;
        std::int64_t Arrival;
        std::int64_t Wait;
        std::int64_t Late;
        std::int64_t Dwell;
        std::int64_t Departure;
    };

    /*!
     * Simulates walking a sequence of events with the given dwell times.
     *
     * The visitor enters an event at the later of the physical arrival and the opening of its window,
     * and two consecutive arrivals are at least a second apart.
     */
    class RouteTimeline {
    public:
        RouteTimeline();

        static RouteTimeline Simulate(const ProblemInstance &instance,
                                      const std::vector<std::size_t> &nodes,
                                      const std::vector<std::int64_t> &dwells);

        static RouteTimeline Simulate(const ProblemInstance &instance,
                                      const std::vector<std::size_t> &nodes,
                                      const std::vector<std::int64_t> &dwells,
                                      std::int64_t max_lateness);

        /*!
         * Lengthens the dwell times from the first stop onwards while the route remains feasible
         * and the objective does not get worse.
         */
        static RouteTimeline ExtendDwells(const ProblemInstance &instance,
                                          const std::vector<std::size_t> &nodes,
                                          const std::vector<std::int64_t> &dwells,
                                          std::int64_t max_lateness);

        static std::vector<std::int64_t> MinDwells(const ProblemInstance &instance,
                                                   const std::vector<std::size_t> &nodes);

        static std::vector<std::int64_t> MaxDwells(const ProblemInstance &instance,
                                                   const std::vector<std::size_t> &nodes);

        bool feasible() const;

        const std::vector<TimelineStop> &stops() const;

        std::vector<std::size_t> nodes() const;

        std::vector<std::int64_t> dwells() const;

        std::int64_t total_travel() const;

        std::int64_t final_leg() const;

        std::int64_t total_wait() const;

        std::int64_t total_late() const;

        double total_popularity() const;

        double Objective(const ObjectiveWeights &weights) const;

        friend std::ostream &operator<<(std::ostream &out, const RouteTimeline &timeline);

    private:
        std::vector<TimelineStop> stops_;
        std::int64_t total_travel_;
        std::int64_t final_leg_;
        std::int64_t total_wait_;
        std::int64_t total_late_;
        double total_popularity_;
        bool feasible_;
    };
}


#endif //WALKPLAN_ROUTE_TIMELINE_H
