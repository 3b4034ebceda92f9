#include "local_search.h"

#include <algorithm>

#include <boost/format.hpp>
#include <glog/logging.h>

namespace walkplan {

    static const double MIN_IMPROVEMENT = 1e-9;

    std::vector<std::int64_t> SelectDwells(const std::vector<std::size_t> &nodes,
                                           const std::vector<std::int64_t> &dwell_by_node) {
        std::vector<std::int64_t> dwells;
        dwells.reserve(nodes.size());
        for (const auto node : nodes) {
            dwells.push_back(dwell_by_node.at(node));
        }
        return dwells;
    }

    LocalSearch::LocalSearch(std::size_t max_iterations, std::int64_t max_lateness)
            : max_iterations_{max_iterations},
              max_lateness_{max_lateness} {}

    LocalSearch::Result LocalSearch::Improve(const ProblemInstance &instance,
                                             const std::vector<std::size_t> &nodes,
                                             const std::vector<std::int64_t> &dwell_by_node) const {
        auto current = RouteTimeline::Simulate(instance, nodes, SelectDwells(nodes, dwell_by_node), max_lateness_);
        CHECK(current.feasible()) << "Local search requires a feasible route";

        std::size_t improvements = 0;
        while (improvements < max_iterations_) {
            if (TryTwoOpt(instance, dwell_by_node, current) || TryOrOpt(instance, dwell_by_node, current)) {
                ++improvements;
                continue;
            }
            break;
        }

        VLOG(1) << boost::format("Local search applied %1% moves. Objective: %2%")
                   % improvements
                   % current.Objective(instance.weights());
        return {current, improvements};
    }

    bool LocalSearch::TryTwoOpt(const ProblemInstance &instance,
                                const std::vector<std::int64_t> &dwell_by_node,
                                RouteTimeline &current) const {
        const auto nodes = current.nodes();
        for (std::size_t first = 0; first + 1 < nodes.size(); ++first) {
            for (std::size_t last = first + 1; last < nodes.size(); ++last) {
                auto trial = nodes;
                std::reverse(std::begin(trial) + first, std::begin(trial) + last + 1);
                if (Accept(instance, trial, dwell_by_node, current)) {
                    return true;
                }
            }
        }
        return false;
    }

    bool LocalSearch::TryOrOpt(const ProblemInstance &instance,
                               const std::vector<std::int64_t> &dwell_by_node,
                               RouteTimeline &current) const {
        const auto nodes = current.nodes();
        for (std::size_t from = 0; from < nodes.size(); ++from) {
            for (std::size_t to = 0; to < nodes.size(); ++to) {
                if (from == to) { continue; }

                auto trial = nodes;
                const auto node = trial[from];
                trial.erase(std::begin(trial) + from);
                trial.insert(std::begin(trial) + to, node);
                if (Accept(instance, trial, dwell_by_node, current)) {
                    return true;
                }
            }
        }
        return false;
    }

    bool LocalSearch::Accept(const ProblemInstance &instance,
                             const std::vector<std::size_t> &nodes,
                             const std::vector<std::int64_t> &dwell_by_node,
                             RouteTimeline &current) const {
        auto candidate = RouteTimeline::Simulate(instance, nodes, SelectDwells(nodes, dwell_by_node), max_lateness_);
        if (!candidate.feasible()) {
            return false;
        }

        const auto &weights = instance.weights();
        if (candidate.Objective(weights) + MIN_IMPROVEMENT < current.Objective(weights)) {
            current = std::move(candidate);
            return true;
        }
        return false;
    }
}
