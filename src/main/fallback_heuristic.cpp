#include "fallback_heuristic.h"

#include <algorithm>
#include <limits>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <glog/logging.h>

#include "schedule_validator.h"

namespace walkplan {

    static SolveStage Escalate(SolveStage current, SolveStage next) {
        return static_cast<int>(next) > static_cast<int>(current) ? next : current;
    }

    FallbackHeuristic::Config::Config()
            : LocalSearchIterations{64},
              MaxLateness{0} {}

    FallbackHeuristic::FallbackHeuristic()
            : FallbackHeuristic(Config()) {}

    FallbackHeuristic::FallbackHeuristic(Config config)
            : config_{std::move(config)} {}

    std::vector<std::size_t> FallbackHeuristic::ByPriority(const ProblemInstance &instance,
                                                           const std::vector<std::size_t> &nodes) {
        static const ByPopularityDescending BY_POPULARITY{};

        auto ordered_nodes = nodes;
        std::stable_sort(std::begin(ordered_nodes), std::end(ordered_nodes),
                         [&instance](std::size_t left, std::size_t right) -> bool {
                             return BY_POPULARITY(instance.NodeToEvent(left), instance.NodeToEvent(right));
                         });
        return ordered_nodes;
    }

    std::vector<std::int64_t> FallbackHeuristic::InitialDwells(const ProblemInstance &instance) {
        std::vector<std::int64_t> dwell_by_node(instance.node_count(), 0);
        for (const auto node : instance.EventNodes()) {
            dwell_by_node[node] = instance.DwellMax(node);
        }
        return dwell_by_node;
    }

    FallbackHeuristic::InsertionResult FallbackHeuristic::Insert(const ProblemInstance &instance,
                                                                 const RouteTimeline &route,
                                                                 const std::vector<std::size_t> &candidates,
                                                                 const std::vector<std::int64_t> &dwell_by_node) const {
        auto current = route;
        std::vector<std::size_t> deferred;

        for (const auto candidate : candidates) {
            const auto nodes = current.nodes();

            boost::optional<RouteTimeline> best_route;
            auto best_increase = std::numeric_limits<std::int64_t>::max();
            for (std::size_t position = 0; position <= nodes.size(); ++position) {
                auto trial_nodes = nodes;
                trial_nodes.insert(std::begin(trial_nodes) + position, candidate);

                auto trial = RouteTimeline::Simulate(instance,
                                                     trial_nodes,
                                                     SelectDwells(trial_nodes, dwell_by_node),
                                                     config_.MaxLateness);
                if (!trial.feasible()) {
                    continue;
                }

                // ties are resolved in favour of the earliest position
                const auto increase = trial.total_travel() - current.total_travel();
                if (increase < best_increase) {
                    best_increase = increase;
                    best_route = std::move(trial);
                }
            }

            if (best_route) {
                current = std::move(best_route.get());
            } else {
                VLOG(2) << boost::format("Deferred insertion of the event %1%") % instance.NodeToEvent(candidate).id();
                deferred.push_back(candidate);
            }
        }

        return {current, deferred};
    }

    LocalSearch::Result FallbackHeuristic::Improve(const ProblemInstance &instance,
                                                   const RouteTimeline &route,
                                                   const std::vector<std::int64_t> &dwell_by_node) const {
        const LocalSearch local_search{config_.LocalSearchIterations, config_.MaxLateness};
        return local_search.Improve(instance, route.nodes(), dwell_by_node);
    }

    FallbackHeuristic::CompressionResult FallbackHeuristic::Compress(const ProblemInstance &instance,
                                                                     const RouteTimeline &route,
                                                                     const std::vector<std::size_t> &deferred,
                                                                     const std::vector<std::int64_t> &dwell_by_node) const {
        CompressionResult result{route, dwell_by_node, {}, 0};

        for (const auto candidate : deferred) {
            const auto nodes = result.Timeline.nodes();

            auto compressed_dwells = result.DwellByNode;
            auto admitted = false;
            for (auto position = nodes.size(); position > 0 && !admitted; --position) {
                const auto node = nodes[position - 1];
                if (compressed_dwells[node] == instance.DwellMin(node)) {
                    continue;
                }

                compressed_dwells[node] = instance.DwellMin(node);
                const auto compressed_route = RouteTimeline::Simulate(instance,
                                                                      nodes,
                                                                      SelectDwells(nodes, compressed_dwells),
                                                                      config_.MaxLateness);
                if (!compressed_route.feasible()) {
                    continue;
                }

                auto insertion = Insert(instance, compressed_route, {candidate}, compressed_dwells);
                if (insertion.Deferred.empty()) {
                    VLOG(1) << boost::format("Compressed dwell times to admit the event %1%")
                               % instance.NodeToEvent(candidate).id();
                    result.Timeline = std::move(insertion.Timeline);
                    result.DwellByNode = compressed_dwells;
                    ++result.Admitted;
                    admitted = true;
                }
            }

            if (!admitted) {
                result.Deferred.push_back(candidate);
            }
        }

        if (result.Admitted > 0) {
            // give back the time which is not needed
            const auto nodes = result.Timeline.nodes();
            auto extended = RouteTimeline::ExtendDwells(instance,
                                                        nodes,
                                                        SelectDwells(nodes, result.DwellByNode),
                                                        config_.MaxLateness);
            if (extended.feasible()) {
                for (const auto &stop : extended.stops()) {
                    result.DwellByNode[stop.Node] = stop.Dwell;
                }
                result.Timeline = std::move(extended);
            }
        }

        return result;
    }

    FallbackHeuristic::Result FallbackHeuristic::Solve(const ProblemInstance &instance) const {
        auto candidates = ByPriority(instance, instance.EventNodes());
        std::vector<std::size_t> dropped_nodes;
        auto stage = SolveStage::FallbackGreedy;

        while (true) {
            auto dwell_by_node = InitialDwells(instance);

            const auto empty_route = RouteTimeline::Simulate(instance, {}, {}, config_.MaxLateness);
            auto insertion = Insert(instance, empty_route, candidates, dwell_by_node);
            if (!IsValid(instance, insertion.Timeline, "greedy insertion")) {
                break;
            }
            auto route = std::move(insertion.Timeline);
            auto deferred = std::move(insertion.Deferred);

            const auto improvement = Improve(instance, route, dwell_by_node);
            if (!IsValid(instance, improvement.Timeline, "local search")) {
                break;
            }
            if (improvement.Improvements > 0) {
                stage = Escalate(stage, SolveStage::FallbackLocalSearch);
            }
            route = improvement.Timeline;

            if (!deferred.empty()) {
                auto compression = Compress(instance, route, deferred, dwell_by_node);
                if (!IsValid(instance, compression.Timeline, "dwell compression")) {
                    break;
                }
                if (compression.Admitted > 0) {
                    stage = Escalate(stage, SolveStage::FallbackCompressed);
                }
                route = std::move(compression.Timeline);
                deferred = std::move(compression.Deferred);
                dwell_by_node = std::move(compression.DwellByNode);
            }

            if (deferred.empty()) {
                LOG(INFO) << boost::format("Fallback heuristic visits %1% out of %2% events at stage %3%")
                             % route.stops().size()
                             % instance.event_count()
                             % to_string(stage);
                return {Schedule::FromTimeline(instance, route), stage, dropped_nodes};
            }

            const auto dropped_node = SelectDropped(instance, route, deferred, dwell_by_node);
            const auto candidate_it = std::find(std::begin(candidates), std::end(candidates), dropped_node);
            CHECK(candidate_it != std::end(candidates));
            candidates.erase(candidate_it);
            dropped_nodes.push_back(dropped_node);
            stage = SolveStage::FallbackDropped;

            VLOG(1) << boost::format("Dropped the event %1% of popularity %2%")
                       % instance.NodeToEvent(dropped_node).id()
                       % instance.NodeToEvent(dropped_node).popularity();
        }

        LOG(ERROR) << "Fallback heuristic returns the empty schedule";
        return {Schedule::Empty(instance), SolveStage::FallbackDropped, instance.EventNodes()};
    }

    std::size_t FallbackHeuristic::SelectDropped(const ProblemInstance &instance,
                                                 const RouteTimeline &route,
                                                 const std::vector<std::size_t> &deferred,
                                                 const std::vector<std::int64_t> &dwell_by_node) const {
        CHECK(!deferred.empty());

        const auto ordered_deferred = ByPriority(instance, deferred);
        const auto best_deferred = ordered_deferred.front();
        const auto best_popularity = instance.NodeToEvent(best_deferred).popularity();

        auto visited = ByPriority(instance, route.nodes());
        std::reverse(std::begin(visited), std::end(visited));
        for (const auto node : visited) {
            if (instance.NodeToEvent(node).popularity() >= best_popularity) {
                break;
            }

            auto remaining_nodes = route.nodes();
            remaining_nodes.erase(std::find(std::begin(remaining_nodes), std::end(remaining_nodes), node));
            const auto reduced_route = RouteTimeline::Simulate(instance,
                                                               remaining_nodes,
                                                               SelectDwells(remaining_nodes, dwell_by_node),
                                                               config_.MaxLateness);
            if (!reduced_route.feasible()) {
                continue;
            }

            if (Insert(instance, reduced_route, {best_deferred}, dwell_by_node).Deferred.empty()) {
                VLOG(1) << boost::format("Replacing the event %1% by the more popular event %2%")
                           % instance.NodeToEvent(node).id()
                           % instance.NodeToEvent(best_deferred).id();
                return node;
            }
        }

        return ordered_deferred.back();
    }

    bool FallbackHeuristic::IsValid(const ProblemInstance &instance,
                                    const RouteTimeline &route,
                                    const char *stage) const {
        if (!route.feasible()) {
            LOG(ERROR) << boost::format("Route %1% produced by %2% violates time windows") % route % stage;
            return false;
        }

        const ScheduleValidator validator{config_.MaxLateness};
        const auto validation_result = validator.Validate(Schedule::FromTimeline(instance, route), instance);
        for (const auto &error : validation_result.errors()) {
            LOG(ERROR) << boost::format("Schedule produced by %1% is invalid: %2%") % stage % error;
        }
        return validation_result.ok();
    }
}
