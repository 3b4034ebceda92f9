#ifndef WALKPLAN_PROBLEM_INSTANCE_H
#define WALKPLAN_PROBLEM_INSTANCE_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "event.h"
#include "location.h"
#include "travel_time_accessor.h"
#include "trip_request.h"

namespace walkplan {

    /*!
     * Events that survived the pre-filter together with the travel matrix between them.
     *
     * Node 0 is the start, nodes 1..n are the events and node n + 1 is the end location if it is fixed.
     * Times are expressed in seconds elapsed since the start of the trip.
     */
    class ProblemInstance {
    public:
        static const std::size_t START_NODE;

        ProblemInstance(TripRequest request,
                        std::vector<Event> events,
                        ResolvedMatrix matrix,
                        bool degraded);

        static ProblemInstance Create(const TripRequest &request,
                                      std::vector<Event> events,
                                      TravelTimeAccessor &accessor);

        const TripRequest &request() const;

        const ObjectiveWeights &weights() const;

        const std::vector<Event> &events() const;

        std::size_t event_count() const;

        std::size_t node_count() const;

        bool has_end_node() const;

        std::size_t end_node() const;

        bool IsEventNode(std::size_t node) const;

        const Event &NodeToEvent(std::size_t node) const;

        const Location &NodeLocation(std::size_t node) const;

        std::vector<std::size_t> EventNodes() const;

        std::int64_t Travel(std::size_t from_node, std::size_t to_node) const;

        double Distance(std::size_t from_node, std::size_t to_node) const;

        TravelSource Source(std::size_t from_node, std::size_t to_node) const;

        const ResolvedMatrix &matrix() const;

        std::int64_t horizon() const;

        std::int64_t WindowBegin(std::size_t node) const;

        std::int64_t WindowEnd(std::size_t node) const;

        std::int64_t DwellMin(std::size_t node) const;

        std::int64_t DwellMax(std::size_t node) const;

        boost::posix_time::ptime ToTime(std::int64_t offset) const;

        std::int64_t ToOffset(boost::posix_time::ptime time) const;

        bool degraded() const;

    private:
        static std::vector<Location> CollectLocations(const TripRequest &request, const std::vector<Event> &events);

        TripRequest request_;
        std::vector<Event> events_;
        std::vector<Location> locations_;
        ResolvedMatrix matrix_;
        bool degraded_;
    };
}


#endif //WALKPLAN_PROBLEM_INSTANCE_H
