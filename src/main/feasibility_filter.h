#ifndef WALKPLAN_FEASIBILITY_FILTER_H
#define WALKPLAN_FEASIBILITY_FILTER_H

#include <vector>

#include "event.h"
#include "schedule.h"
#include "travel_time_provider.h"
#include "trip_request.h"

namespace walkplan {

    /*!
     * Removes events that no ordering can visit.
     *
     * Travel times are taken from the great circle estimate, which never exceeds the walking time
     * along the streets, so only events which are infeasible under ideal routing are dropped.
     */
    class FeasibilityFilter {
    public:
        struct Result {
            std::vector<Event> Accepted;
            std::vector<DropRecord> Dropped;
        };

        explicit FeasibilityFilter(EstimateTravelTimeProvider &estimate_provider);

        Result Apply(const TripRequest &request) const;

    private:
        EstimateTravelTimeProvider &estimate_provider_;
    };
}


#endif //WALKPLAN_FEASIBILITY_FILTER_H
