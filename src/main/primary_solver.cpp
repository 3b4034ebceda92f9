#include "primary_solver.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

#include <absl/time/time.h>
#include <boost/format.hpp>
#include <glog/logging.h>

#include <ortools/base/protoutil.h>
#include <ortools/constraint_solver/routing_parameters.h>

#include "deadline_search_limit.h"
#include "progress_printer_monitor.h"
#include "route_timeline.h"
#include "schedule_validator.h"
#include "util/routing.h"

namespace walkplan {

    const std::string PrimarySolver::TIME_DIMENSION{"Time"};

    // walking to the fixed end location is not bounded by the end of the trip
    static const int64 MAX_FINAL_LEG = 24 * 3600;

    PrimarySolver::Config::Config()
            : SmallProblemTimeLimit{boost::posix_time::milliseconds(150)},
              MediumProblemTimeLimit{boost::posix_time::milliseconds(400)},
              LargeProblemTimeLimit{boost::posix_time::milliseconds(1200)},
              SmallProblemSize{5},
              MediumProblemSize{10},
              TimeLimit{},
              MaxLateness{0},
              CostScale{100},
              MinSkipPenalty{3600} {}

    PrimarySolver::PrimarySolver()
            : PrimarySolver(Config(), nullptr, nullptr) {}

    PrimarySolver::PrimarySolver(Config config,
                                 std::shared_ptr<Printer> printer,
                                 std::shared_ptr<const std::atomic<bool> > cancel_token)
            : config_{std::move(config)},
              printer_{std::move(printer)},
              cancel_token_{std::move(cancel_token)} {
        CHECK_GT(config_.CostScale, 0);
        CHECK_GE(config_.MaxLateness, 0);
    }

    boost::posix_time::time_duration PrimarySolver::TimeLimit(std::size_t event_count) const {
        if (config_.TimeLimit) {
            return config_.TimeLimit.get();
        }

        if (event_count <= config_.SmallProblemSize) {
            return config_.SmallProblemTimeLimit;
        }

        if (event_count <= config_.MediumProblemSize) {
            return config_.MediumProblemTimeLimit;
        }

        return config_.LargeProblemTimeLimit;
    }

    int64 PrimarySolver::SkipPenalty(const ProblemInstance &instance) const {
        // skipping an event must cost more than any detour fitting into the trip
        return std::max(config_.MinSkipPenalty, 2 * instance.horizon());
    }

    const PrimarySolver::Config &PrimarySolver::config() const {
        return config_;
    }

    boost::optional<Schedule> PrimarySolver::Solve(const ProblemInstance &instance) const {
        const auto time_limit = TimeLimit(instance.event_count());
        if (time_limit.is_special() || time_limit.total_milliseconds() <= 0) {
            LOG(INFO) << "Primary solver has no time budget";
            return boost::none;
        }

        if (instance.event_count() == 0) {
            return Schedule::Empty(instance);
        }

        const auto deadline = std::chrono::steady_clock::now()
                              + std::chrono::milliseconds(time_limit.total_milliseconds());

        // the route always ends at a separate node, which is a virtual one for open ended trips
        const auto end_node = instance.has_end_node() ? instance.end_node() : instance.node_count();
        const auto node_count = static_cast<int>(end_node + 1);

        operations_research::RoutingIndexManager index_manager{
                node_count,
                1,
                std::vector<operations_research::RoutingIndexManager::NodeIndex>{
                        operations_research::RoutingIndexManager::NodeIndex{
                                static_cast<int>(ProblemInstance::START_NODE)}},
                std::vector<operations_research::RoutingIndexManager::NodeIndex>{
                        operations_research::RoutingIndexManager::NodeIndex{static_cast<int>(end_node)}}};
        operations_research::RoutingModel model{index_manager};

        AddTravelTime(model, index_manager, instance);
        AddEventsHandling(model, index_manager, instance);

        auto parameters = operations_research::DefaultRoutingSearchParameters();
        parameters.set_first_solution_strategy(operations_research::FirstSolutionStrategy::PATH_CHEAPEST_ARC);
        parameters.set_use_depth_first_search(true);
        CHECK_OK(util_time::EncodeGoogleApiProto(absl::Milliseconds(time_limit.total_milliseconds()),
                                                 parameters.mutable_time_limit()));

        model.CloseModelWithParameters(parameters);

        auto solver = model.solver();
        if (printer_) {
            model.AddSearchMonitor(solver->RevAlloc(
                    new ProgressPrinterMonitor(model, instance.event_count(), config_.CostScale, printer_)));
        }
        model.AddSearchMonitor(solver->RevAlloc(new DeadlineSearchLimit(deadline, cancel_token_, solver)));

        VLOG(1) << boost::format("Primary solver started for %1% events with the time limit %2%")
                   % instance.event_count()
                   % time_limit;

        const operations_research::Assignment *assignment = model.SolveWithParameters(parameters);
        if (assignment == nullptr) {
            LOG(INFO) << boost::format("Primary solver found no solution within %1%. Status: %2%")
                         % time_limit
                         % model.status();
            return boost::none;
        }

        return ExtractSchedule(model, index_manager, *assignment, instance);
    }

    void PrimarySolver::AddTravelTime(operations_research::RoutingModel &model,
                                      const operations_research::RoutingIndexManager &index_manager,
                                      const ProblemInstance &instance) const {
        static const auto FIX_START_CUMULATIVE_TO_ZERO = true;

        const auto travel = [&instance](int64 from_node, int64 to_node) -> int64 {
            const auto node_count = static_cast<int64>(instance.node_count());
            if (from_node >= node_count || to_node >= node_count) {
                return 0;
            }
            return instance.Travel(static_cast<std::size_t>(from_node), static_cast<std::size_t>(to_node));
        };

        const auto &weights = instance.weights();
        const auto scale = static_cast<double>(config_.CostScale);

        // waiting is charged by the span cost, which also covers travel and service, hence the difference
        CHECK_GE(weights.Walk, weights.WaitPenalty);
        const auto arc_coefficient = (weights.Walk - weights.WaitPenalty) * scale;
        const auto transit_callback_handle = model.RegisterTransitCallback(
                [&index_manager, travel, arc_coefficient](int64 from_index, int64 to_index) -> int64 {
                    const auto travel_time = travel(index_manager.IndexToNode(from_index).value(),
                                                    index_manager.IndexToNode(to_index).value());
                    return static_cast<int64>(std::llround(arc_coefficient * static_cast<double>(travel_time)));
                });
        model.SetArcCostEvaluatorOfAllVehicles(transit_callback_handle);

        const auto service_time_callback_handle = model.RegisterTransitCallback(
                [&index_manager, &instance, travel](int64 from_index, int64 to_index) -> int64 {
                    const auto from_node = index_manager.IndexToNode(from_index).value();
                    const auto to_node = index_manager.IndexToNode(to_index).value();
                    return instance.DwellMin(static_cast<std::size_t>(from_node)) + travel(from_node, to_node);
                });

        const auto horizon = instance.horizon();
        model.AddDimension(service_time_callback_handle,
                           horizon,
                           horizon + MAX_FINAL_LEG,
                           FIX_START_CUMULATIVE_TO_ZERO,
                           TIME_DIMENSION);

        auto time_dimension = model.GetMutableDimension(TIME_DIMENSION);
        time_dimension->SetSpanCostCoefficientForAllVehicles(
                static_cast<int64>(std::llround(weights.WaitPenalty * scale)));
    }

    void PrimarySolver::AddEventsHandling(operations_research::RoutingModel &model,
                                          const operations_research::RoutingIndexManager &index_manager,
                                          const ProblemInstance &instance) const {
        auto time_dimension = model.GetMutableDimension(TIME_DIMENSION);

        const auto &weights = instance.weights();
        const auto scale = static_cast<double>(config_.CostScale);
        const auto skip_penalty = SkipPenalty(instance);
        const auto horizon = instance.horizon();

        for (const auto node : instance.EventNodes()) {
            const auto &event = instance.NodeToEvent(node);
            const auto index = index_manager.NodeToIndex(
                    operations_research::RoutingIndexManager::NodeIndex{static_cast<int>(node)});

            const auto dwell = instance.DwellMin(node);
            const auto window_begin = std::max(static_cast<int64>(0), instance.WindowBegin(node));
            const auto window_end = std::min(instance.WindowEnd(node) + config_.MaxLateness, horizon - dwell);
            if (window_begin > window_end) {
                VLOG(2) << boost::format("Event %1% cannot start within the trip") % event.id();
                model.ActiveVar(index)->SetValue(0);
                continue;
            }

            time_dimension->CumulVar(index)->SetRange(window_begin, window_end);
            if (config_.MaxLateness > 0) {
                time_dimension->SetCumulVarSoftUpperBound(
                        index,
                        instance.WindowEnd(node),
                        static_cast<int64>(std::llround(weights.LatePenalty * scale)));
            }
            model.AddVariableMinimizedByFinalizer(time_dimension->CumulVar(index));

            // visiting an event is rewarded by its popularity and charged its service time by the span cost
            const auto penalty = static_cast<double>(skip_penalty)
                                 + weights.VisitedBonus * event.popularity()
                                 + weights.WaitPenalty * static_cast<double>(dwell);
            model.AddDisjunction({index}, static_cast<int64>(std::llround(penalty * scale)));

            VLOG(2) << boost::format("Event %1% node %2% window [%3%, %4%] service %5%")
                       % event.id()
                       % node
                       % window_begin
                       % window_end
                       % dwell;
        }

        model.AddVariableMinimizedByFinalizer(time_dimension->CumulVar(model.End(0)));
    }

    boost::optional<Schedule> PrimarySolver::ExtractSchedule(
            const operations_research::RoutingModel &model,
            const operations_research::RoutingIndexManager &index_manager,
            const operations_research::Assignment &assignment,
            const ProblemInstance &instance) const {
        const auto nodes = util::GetRouteNodes(model, index_manager, assignment, 0);

        const auto timeline = RouteTimeline::ExtendDwells(instance,
                                                          nodes,
                                                          RouteTimeline::MinDwells(instance, nodes),
                                                          config_.MaxLateness);
        if (!timeline.feasible()) {
            LOG(ERROR) << boost::format("Primary solver returned the route %1% which violates time windows")
                          % timeline;
            return boost::none;
        }

        auto schedule = Schedule::FromTimeline(instance, timeline);
        const ScheduleValidator validator{config_.MaxLateness};
        const auto validation_result = validator.Validate(schedule, instance);
        if (!validation_result.ok()) {
            for (const auto &error : validation_result.errors()) {
                LOG(ERROR) << error;
            }
            return boost::none;
        }

        VLOG(1) << boost::format("Primary solver visits %1% out of %2% events. Cost: %3%")
                   % schedule.size()
                   % instance.event_count()
                   % (static_cast<double>(assignment.ObjectiveValue()) / static_cast<double>(config_.CostScale));
        return schedule;
    }
}
