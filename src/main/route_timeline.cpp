#include "route_timeline.h"

#include <algorithm>

#include <boost/format.hpp>
#include <glog/logging.h>

namespace walkplan {

    TimelineStop::TimelineStop()
            : Node{0},
              Travel{0},
              Arrival{0},
              Wait{0},
              Late{0},
              Dwell{0},
              Departure{0} {}

    RouteTimeline::RouteTimeline()
            : stops_{},
              total_travel_{0},
              final_leg_{0},
              total_wait_{0},
              total_late_{0},
              total_popularity_{0.0},
              feasible_{true} {}

    RouteTimeline RouteTimeline::Simulate(const ProblemInstance &instance,
                                          const std::vector<std::size_t> &nodes,
                                          const std::vector<std::int64_t> &dwells) {
        return Simulate(instance, nodes, dwells, 0);
    }

    RouteTimeline RouteTimeline::Simulate(const ProblemInstance &instance,
                                          const std::vector<std::size_t> &nodes,
                                          const std::vector<std::int64_t> &dwells,
                                          std::int64_t max_lateness) {
        CHECK_EQ(nodes.size(), dwells.size());

        RouteTimeline timeline;
        const auto horizon = instance.horizon();

        auto previous_node = ProblemInstance::START_NODE;
        std::int64_t previous_departure = 0;
        std::int64_t previous_arrival = -1;
        for (std::size_t position = 0; position < nodes.size(); ++position) {
            const auto node = nodes[position];
            CHECK(instance.IsEventNode(node));

            TimelineStop stop;
            stop.Node = node;
            stop.Travel = instance.Travel(previous_node, node);

            const auto physical_arrival = std::max(previous_departure + stop.Travel, previous_arrival + 1);
            stop.Arrival = std::max(physical_arrival, instance.WindowBegin(node));
            stop.Wait = stop.Arrival - physical_arrival;
            stop.Late = std::max(static_cast<std::int64_t>(0), stop.Arrival - instance.WindowEnd(node));
            stop.Dwell = dwells[position];
            stop.Departure = stop.Arrival + stop.Dwell;

            if (stop.Late > max_lateness
                || stop.Dwell < instance.DwellMin(node)
                || stop.Dwell > instance.DwellMax(node)
                || stop.Departure > horizon) {
                timeline.feasible_ = false;
            }

            timeline.total_travel_ += stop.Travel;
            timeline.total_wait_ += stop.Wait;
            timeline.total_late_ += stop.Late;
            timeline.total_popularity_ += instance.NodeToEvent(node).popularity();

            previous_node = node;
            previous_departure = stop.Departure;
            previous_arrival = stop.Arrival;
            timeline.stops_.push_back(stop);
        }

        if (instance.has_end_node()) {
            timeline.final_leg_ = instance.Travel(previous_node, instance.end_node());
            timeline.total_travel_ += timeline.final_leg_;
        }

        return timeline;
    }

    RouteTimeline RouteTimeline::ExtendDwells(const ProblemInstance &instance,
                                              const std::vector<std::size_t> &nodes,
                                              const std::vector<std::int64_t> &dwells,
                                              std::int64_t max_lateness) {
        auto current_dwells = dwells;
        auto current = Simulate(instance, nodes, current_dwells, max_lateness);
        if (!current.feasible()) {
            return current;
        }

        for (std::size_t position = 0; position < nodes.size(); ++position) {
            // feasibility is monotone in the extension, so the largest one is found by bisection
            std::int64_t low = 0;
            std::int64_t high = instance.DwellMax(nodes[position]) - current_dwells[position];
            while (low < high) {
                const auto middle = low + (high - low + 1) / 2;
                auto trial_dwells = current_dwells;
                trial_dwells[position] += middle;
                if (Simulate(instance, nodes, trial_dwells, max_lateness).feasible()) {
                    low = middle;
                } else {
                    high = middle - 1;
                }
            }

            if (low == 0) {
                continue;
            }

            auto extended_dwells = current_dwells;
            extended_dwells[position] += low;
            auto extended = Simulate(instance, nodes, extended_dwells, max_lateness);
            if (extended.Objective(instance.weights()) <= current.Objective(instance.weights())) {
                current = std::move(extended);
                current_dwells = std::move(extended_dwells);
            }
        }

        return current;
    }

    std::vector<std::int64_t> RouteTimeline::MinDwells(const ProblemInstance &instance,
                                                       const std::vector<std::size_t> &nodes) {
        std::vector<std::int64_t> dwells;
        for (const auto node : nodes) {
            dwells.push_back(instance.DwellMin(node));
        }
        return dwells;
    }

    std::vector<std::int64_t> RouteTimeline::MaxDwells(const ProblemInstance &instance,
                                                       const std::vector<std::size_t> &nodes) {
        std::vector<std::int64_t> dwells;
        for (const auto node : nodes) {
            dwells.push_back(instance.DwellMax(node));
        }
        return dwells;
    }

    bool RouteTimeline::feasible() const {
        return feasible_;
    }

    const std::vector<TimelineStop> &RouteTimeline::stops() const {
        return stops_;
    }

    std::vector<std::size_t> RouteTimeline::nodes() const {
        std::vector<std::size_t> nodes;
        for (const auto &stop : stops_) {
            nodes.push_back(stop.Node);
        }
        return nodes;
    }

    std::vector<std::int64_t> RouteTimeline::dwells() const {
        std::vector<std::int64_t> dwells;
        for (const auto &stop : stops_) {
            dwells.push_back(stop.Dwell);
        }
        return dwells;
    }

    std::int64_t RouteTimeline::total_travel() const {
        return total_travel_;
    }

    std::int64_t RouteTimeline::final_leg() const {
        return final_leg_;
    }

    std::int64_t RouteTimeline::total_wait() const {
        return total_wait_;
    }

    std::int64_t RouteTimeline::total_late() const {
        return total_late_;
    }

    double RouteTimeline::total_popularity() const {
        return total_popularity_;
    }

    double RouteTimeline::Objective(const ObjectiveWeights &weights) const {
        return weights.Walk * static_cast<double>(total_travel_)
               + weights.LatePenalty * static_cast<double>(total_late_)
               + weights.WaitPenalty * static_cast<double>(total_wait_)
               - weights.VisitedBonus * total_popularity_;
    }

    std::ostream &operator<<(std::ostream &out, const RouteTimeline &timeline) {
        out << "[";
        auto first = true;
        for (const auto &stop : timeline.stops_) {
            if (!first) {
                out << ", ";
            }
            first = false;

            out << boost::format("%1%@%2%+%3%") % stop.Node % stop.Arrival % stop.Dwell;
        }
        out << "]";
        return out;
    }
}
