#include "problem_instance.h"

#include <algorithm>

#include <glog/logging.h>

namespace walkplan {

    const std::size_t ProblemInstance::START_NODE = 0;

    ProblemInstance::ProblemInstance(TripRequest request,
                                     std::vector<Event> events,
                                     ResolvedMatrix matrix,
                                     bool degraded)
            : request_{std::move(request)},
              events_{std::move(events)},
              locations_{CollectLocations(request_, events_)},
              matrix_{std::move(matrix)},
              degraded_{degraded} {
        CHECK_EQ(matrix_.size(), locations_.size());
    }

    ProblemInstance ProblemInstance::Create(const TripRequest &request,
                                            std::vector<Event> events,
                                            TravelTimeAccessor &accessor) {
        auto locations = CollectLocations(request, events);

        // legs leaving an event are looked up at the earliest time the event can end
        std::vector<boost::posix_time::ptime> depart_at;
        depart_at.push_back(request.start_time());
        for (const auto &event : events) {
            depart_at.push_back(std::max(request.start_time(), event.window_begin()) + event.dwell_min());
        }
        if (request.end_location()) {
            depart_at.push_back(request.end_time());
        }

        auto matrix = accessor.Matrix(locations, depart_at);
        return {request, std::move(events), std::move(matrix), accessor.degraded()};
    }

    std::vector<Location> ProblemInstance::CollectLocations(const TripRequest &request,
                                                            const std::vector<Event> &events) {
        std::vector<Location> locations;
        locations.reserve(events.size() + 2);
        locations.push_back(request.start_location());
        for (const auto &event : events) {
            locations.push_back(event.location());
        }
        if (request.end_location()) {
            locations.push_back(request.end_location().get());
        }
        return locations;
    }

    const TripRequest &ProblemInstance::request() const {
        return request_;
    }

    const ObjectiveWeights &ProblemInstance::weights() const {
        return request_.weights();
    }

    const std::vector<Event> &ProblemInstance::events() const {
        return events_;
    }

    std::size_t ProblemInstance::event_count() const {
        return events_.size();
    }

    std::size_t ProblemInstance::node_count() const {
        return locations_.size();
    }

    bool ProblemInstance::has_end_node() const {
        return static_cast<bool>(request_.end_location());
    }

    std::size_t ProblemInstance::end_node() const {
        CHECK(has_end_node());
        return events_.size() + 1;
    }

    bool ProblemInstance::IsEventNode(std::size_t node) const {
        return node > START_NODE && node <= events_.size();
    }

    const Event &ProblemInstance::NodeToEvent(std::size_t node) const {
        DCHECK(IsEventNode(node));
        return events_.at(node - 1);
    }

    const Location &ProblemInstance::NodeLocation(std::size_t node) const {
        return locations_.at(node);
    }

    std::vector<std::size_t> ProblemInstance::EventNodes() const {
        std::vector<std::size_t> nodes;
        for (std::size_t node = 1; node <= events_.size(); ++node) {
            nodes.push_back(node);
        }
        return nodes;
    }

    std::int64_t ProblemInstance::Travel(std::size_t from_node, std::size_t to_node) const {
        return matrix_.Values.Seconds.at(from_node).at(to_node);
    }

    double ProblemInstance::Distance(std::size_t from_node, std::size_t to_node) const {
        return matrix_.Values.Meters.at(from_node).at(to_node);
    }

    TravelSource ProblemInstance::Source(std::size_t from_node, std::size_t to_node) const {
        return matrix_.Sources.at(from_node).at(to_node);
    }

    const ResolvedMatrix &ProblemInstance::matrix() const {
        return matrix_;
    }

    std::int64_t ProblemInstance::horizon() const {
        return ToOffset(request_.end_time());
    }

    std::int64_t ProblemInstance::WindowBegin(std::size_t node) const {
        if (!IsEventNode(node)) {
            return 0;
        }
        return ToOffset(NodeToEvent(node).window_begin());
    }

    std::int64_t ProblemInstance::WindowEnd(std::size_t node) const {
        if (!IsEventNode(node)) {
            return horizon();
        }
        return ToOffset(NodeToEvent(node).window_end());
    }

    std::int64_t ProblemInstance::DwellMin(std::size_t node) const {
        if (!IsEventNode(node)) {
            return 0;
        }
        return NodeToEvent(node).dwell_min().total_seconds();
    }

    std::int64_t ProblemInstance::DwellMax(std::size_t node) const {
        if (!IsEventNode(node) || request_.compress_dwell_to_min()) {
            return DwellMin(node);
        }
        return NodeToEvent(node).dwell_max().total_seconds();
    }

    boost::posix_time::ptime ProblemInstance::ToTime(std::int64_t offset) const {
        return request_.start_time() + boost::posix_time::seconds(offset);
    }

    std::int64_t ProblemInstance::ToOffset(boost::posix_time::ptime time) const {
        return (time - request_.start_time()).total_seconds();
    }

    bool ProblemInstance::degraded() const {
        return degraded_;
    }
}
