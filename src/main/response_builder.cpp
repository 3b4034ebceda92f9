#include "response_builder.h"

#include <algorithm>
#include <unordered_map>

#include <boost/variant/static_visitor.hpp>
#include <glog/logging.h>

#include "route_timeline.h"
#include "util/json.h"

namespace walkplan {

    namespace {

        class DropListVisitor : public boost::static_visitor<void> {
        public:
            DropListVisitor(const std::string &event_id, std::vector<DropRecord> &dropped)
                    : event_id_{event_id},
                      dropped_{dropped} {}

            void operator()(const Visited &visited) const {}

            void operator()(const Skipped &skipped) const {
                dropped_.emplace_back(event_id_, skipped.Reason);
            }

        private:
            const std::string &event_id_;
            std::vector<DropRecord> &dropped_;
        };
    }

    RouteStop::RouteStop(VisitRecord visit, std::string polyline)
            : Visit{std::move(visit)},
              Polyline{std::move(polyline)} {}

    void to_json(nlohmann::json &json, const RouteStop &stop) {
        json = nlohmann::json{
                {"eventId",           stop.Visit.EventId},
                {"arrive",            stop.Visit.Arrival},
                {"depart",            stop.Visit.Departure},
                {"dwellSec",          stop.Visit.dwell().total_seconds()},
                {"travelSecFromPrev", stop.Visit.TravelSecondsFromPrevious},
                {"polyline",          stop.Polyline}
        };
    }

    SolveMetrics::SolveMetrics()
            : TotalWalkSeconds{0},
              FinalLegSeconds{0},
              Visited{0},
              Dropped{0},
              SolveMilliseconds{0},
              Stage{SolveStage::Primary},
              Degraded{false},
              Objective{0.0} {}

    void to_json(nlohmann::json &json, const SolveMetrics &metrics) {
        json = nlohmann::json{
                {"totalWalkSec", metrics.TotalWalkSeconds},
                {"finalLegSec",  metrics.FinalLegSeconds},
                {"visited",      metrics.Visited},
                {"dropped",      metrics.Dropped},
                {"solveMs",      metrics.SolveMilliseconds},
                {"stage",        to_string(metrics.Stage)},
                {"degraded",     metrics.Degraded},
                {"objective",    metrics.Objective}
        };
    }

    void to_json(nlohmann::json &json, const SolveResponse &response) {
        json = nlohmann::json{
                {"route",   response.Route},
                {"dropped", response.Dropped},
                {"metrics", response.Metrics}
        };

        if (response.Debug) {
            json["debug"] = response.Debug.get();
        }
    }

    ResponseBuilder::ResponseBuilder(TravelTimeAccessor &accessor, bool attach_debug, std::int64_t max_lateness)
            : accessor_{accessor},
              attach_debug_{attach_debug},
              max_lateness_{max_lateness} {}

    SolveResponse ResponseBuilder::Build(const TripRequest &request,
                                         const std::vector<DropRecord> &filtered_out,
                                         const ProblemInstance &instance,
                                         const Schedule &schedule,
                                         SolveStage stage,
                                         std::chrono::steady_clock::time_point started_at) const {
        std::unordered_map<std::string, NodeOutcome> outcomes;
        for (const auto &drop : filtered_out) {
            outcomes.emplace(drop.EventId, Skipped{drop.Reason});
        }

        for (const auto &visit : schedule.visits()) {
            outcomes.emplace(visit.EventId, Visited{visit});
        }

        for (const auto node : instance.EventNodes()) {
            const auto &event_id = instance.NodeToEvent(node).id();
            if (outcomes.find(event_id) == std::end(outcomes)) {
                outcomes.emplace(event_id, Skipped{Classify(instance, schedule, node)});
            }
        }

        SolveResponse response;
        response.Route = BuildRoute(instance, schedule);

        // dropped events are reported in the order of the request
        for (const auto &event : request.events()) {
            const auto outcome_it = outcomes.find(event.id());
            CHECK(outcome_it != std::end(outcomes)) << event.id();
            boost::apply_visitor(DropListVisitor(event.id(), response.Dropped), outcome_it->second);
        }
        CHECK_EQ(response.Route.size() + response.Dropped.size(), request.events().size());

        response.Metrics.TotalWalkSeconds = schedule.total_travel_seconds();
        response.Metrics.FinalLegSeconds = schedule.final_leg_seconds();
        response.Metrics.Visited = response.Route.size();
        response.Metrics.Dropped = response.Dropped.size();
        response.Metrics.Stage = stage;
        response.Metrics.Degraded = accessor_.degraded() || instance.degraded();
        response.Metrics.Objective = schedule.objective();

        if (attach_debug_) {
            response.Debug = BuildDebug(instance);
        }

        response.Metrics.SolveMilliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_at).count();
        return response;
    }

    DropReason ResponseBuilder::Classify(const ProblemInstance &instance,
                                         const Schedule &schedule,
                                         std::size_t node) const {
        const auto on_time = [this](const RouteTimeline &timeline) -> bool {
            const auto &stops = timeline.stops();
            return std::all_of(std::begin(stops), std::end(stops), [this](const TimelineStop &stop) -> bool {
                return stop.Late <= max_lateness_;
            });
        };

        const auto alone = RouteTimeline::Simulate(instance, {node}, {instance.DwellMin(node)}, max_lateness_);
        if (!on_time(alone)) {
            return DropReason::WindowConflict;
        }

        // check whether the event fits into the schedule if the end time was not a constraint
        const auto nodes = schedule.nodes();
        std::vector<std::int64_t> dwells;
        for (const auto &visit : schedule.visits()) {
            dwells.push_back(visit.dwell().total_seconds());
        }

        for (std::size_t position = 0; position <= nodes.size(); ++position) {
            auto trial_nodes = nodes;
            auto trial_dwells = dwells;
            trial_nodes.insert(std::begin(trial_nodes) + position, node);
            trial_dwells.insert(std::begin(trial_dwells) + position, instance.DwellMin(node));

            if (on_time(RouteTimeline::Simulate(instance, trial_nodes, trial_dwells, max_lateness_))) {
                return DropReason::TimeBudgetExceeded;
            }
        }

        return DropReason::LowPriority;
    }

    std::vector<RouteStop> ResponseBuilder::BuildRoute(const ProblemInstance &instance,
                                                       const Schedule &schedule) const {
        std::vector<RouteStop> route;

        auto previous_node = ProblemInstance::START_NODE;
        auto previous_departure = instance.request().start_time();
        for (const auto &visit : schedule.visits()) {
            const auto directions = accessor_.Directions(instance.NodeLocation(previous_node),
                                                         instance.NodeLocation(visit.Node),
                                                         previous_departure);
            route.emplace_back(visit, directions.Leg.Polyline);

            previous_node = visit.Node;
            previous_departure = visit.Departure;
        }

        return route;
    }

    nlohmann::json ResponseBuilder::BuildDebug(const ProblemInstance &instance) const {
        auto nodes = nlohmann::json::array();
        for (std::size_t node = 0; node < instance.node_count(); ++node) {
            std::string id;
            if (node == ProblemInstance::START_NODE) {
                id = "start";
            } else if (instance.IsEventNode(node)) {
                id = instance.NodeToEvent(node).id();
            } else {
                id = "end";
            }

            const auto &location = instance.NodeLocation(node);
            nodes.push_back({
                                    {"node",        node},
                                    {"id",          id},
                                    {"lat",         location.latitude_degrees()},
                                    {"lng",         location.longitude_degrees()},
                                    {"windowBegin", instance.WindowBegin(node)},
                                    {"windowEnd",   instance.WindowEnd(node)},
                                    {"serviceSec",  instance.DwellMin(node)}
                            });
        }

        const auto &matrix = instance.matrix();
        auto sources = nlohmann::json::array();
        for (const auto &row : matrix.Sources) {
            auto source_row = nlohmann::json::array();
            for (const auto source : row) {
                source_row.push_back(to_string(source));
            }
            sources.push_back(std::move(source_row));
        }

        return nlohmann::json{
                {"nodes",  nodes},
                {"matrix", {
                                   {"provider", accessor_.provider_mode()},
                                   {"seconds", matrix.Values.Seconds},
                                   {"meters", matrix.Values.Meters},
                                   {"sources", sources}
                           }}
        };
    }
}
