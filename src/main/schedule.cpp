#include "schedule.h"

#include <stdexcept>

#include <boost/format.hpp>

namespace walkplan {

    VisitRecord::VisitRecord()
            : VisitRecord(0, "", boost::posix_time::not_a_date_time, boost::posix_time::not_a_date_time, 0) {}

    VisitRecord::VisitRecord(std::size_t node,
                             std::string event_id,
                             boost::posix_time::ptime arrival,
                             boost::posix_time::ptime departure,
                             std::int64_t travel_seconds_from_previous)
            : Node{node},
              EventId{std::move(event_id)},
              Arrival{arrival},
              Departure{departure},
              TravelSecondsFromPrevious{travel_seconds_from_previous} {}

    bool VisitRecord::operator==(const VisitRecord &other) const {
        return Node == other.Node
               && EventId == other.EventId
               && Arrival == other.Arrival
               && Departure == other.Departure
               && TravelSecondsFromPrevious == other.TravelSecondsFromPrevious;
    }

    boost::posix_time::time_duration VisitRecord::dwell() const {
        return Departure - Arrival;
    }

    std::ostream &operator<<(std::ostream &out, const VisitRecord &record) {
        out << boost::format("%1% [%2%, %3%] travel %4%s")
               % record.EventId
               % record.Arrival
               % record.Departure
               % record.TravelSecondsFromPrevious;
        return out;
    }

    std::string to_string(DropReason value) {
        static const std::string WINDOW_CONFLICT{"window_conflict"};
        static const std::string TIME_BUDGET_EXCEEDED{"time_budget_exceeded"};
        static const std::string BOOKING_CONFLICT{"booking_conflict"};
        static const std::string LOW_PRIORITY{"low_priority"};

        switch (value) {
            case DropReason::WindowConflict:
                return WINDOW_CONFLICT;
            case DropReason::TimeBudgetExceeded:
                return TIME_BUDGET_EXCEEDED;
            case DropReason::BookingConflict:
                return BOOKING_CONFLICT;
            case DropReason::LowPriority:
                return LOW_PRIORITY;
            default:
                throw std::invalid_argument("Conversion to std::string not defined for value="
                                            + std::to_string(static_cast<int>(value)));
        }
    }

    DropRecord::DropRecord(std::string event_id, DropReason reason)
            : EventId{std::move(event_id)},
              Reason{reason} {}

    bool DropRecord::operator==(const DropRecord &other) const {
        return EventId == other.EventId && Reason == other.Reason;
    }

    void to_json(nlohmann::json &json, const DropRecord &record) {
        json = nlohmann::json{
                {"eventId", record.EventId},
                {"reason",  to_string(record.Reason)}
        };
    }

    std::string to_string(SolveStage value) {
        static const std::string PRIMARY{"primary"};
        static const std::string FALLBACK_GREEDY{"fallback-greedy"};
        static const std::string FALLBACK_LOCAL_SEARCH{"fallback-local-search"};
        static const std::string FALLBACK_COMPRESSED{"fallback-compressed"};
        static const std::string FALLBACK_DROPPED{"fallback-dropped"};

        switch (value) {
            case SolveStage::Primary:
                return PRIMARY;
            case SolveStage::FallbackGreedy:
                return FALLBACK_GREEDY;
            case SolveStage::FallbackLocalSearch:
                return FALLBACK_LOCAL_SEARCH;
            case SolveStage::FallbackCompressed:
                return FALLBACK_COMPRESSED;
            case SolveStage::FallbackDropped:
                return FALLBACK_DROPPED;
            default:
                throw std::invalid_argument("Conversion to std::string not defined for value="
                                            + std::to_string(static_cast<int>(value)));
        }
    }

    Schedule::Schedule()
            : Schedule({}, 0, 0, 0.0) {}

    Schedule::Schedule(std::vector<VisitRecord> visits,
                       std::int64_t total_travel_seconds,
                       std::int64_t final_leg_seconds,
                       double objective)
            : visits_{std::move(visits)},
              total_travel_seconds_{total_travel_seconds},
              final_leg_seconds_{final_leg_seconds},
              objective_{objective} {}

    Schedule Schedule::FromTimeline(const ProblemInstance &instance, const RouteTimeline &timeline) {
        std::vector<VisitRecord> visits;
        for (const auto &stop : timeline.stops()) {
            visits.emplace_back(stop.Node,
                                instance.NodeToEvent(stop.Node).id(),
                                instance.ToTime(stop.Arrival),
                                instance.ToTime(stop.Departure),
                                stop.Travel);
        }

        return {std::move(visits),
                timeline.total_travel(),
                timeline.final_leg(),
                timeline.Objective(instance.weights())};
    }

    Schedule Schedule::Empty(const ProblemInstance &instance) {
        return FromTimeline(instance, RouteTimeline::Simulate(instance, {}, {}));
    }

    bool Schedule::operator==(const Schedule &other) const {
        return visits_ == other.visits_
               && total_travel_seconds_ == other.total_travel_seconds_
               && final_leg_seconds_ == other.final_leg_seconds_;
    }

    const std::vector<VisitRecord> &Schedule::visits() const {
        return visits_;
    }

    std::vector<std::size_t> Schedule::nodes() const {
        std::vector<std::size_t> nodes;
        for (const auto &visit : visits_) {
            nodes.push_back(visit.Node);
        }
        return nodes;
    }

    bool Schedule::empty() const {
        return visits_.empty();
    }

    std::size_t Schedule::size() const {
        return visits_.size();
    }

    std::int64_t Schedule::total_travel_seconds() const {
        return total_travel_seconds_;
    }

    std::int64_t Schedule::final_leg_seconds() const {
        return final_leg_seconds_;
    }

    double Schedule::objective() const {
        return objective_;
    }

    std::ostream &operator<<(std::ostream &out, const Schedule &schedule) {
        out << "[";
        auto first = true;
        for (const auto &visit : schedule.visits_) {
            if (!first) {
                out << ", ";
            }
            first = false;
            out << visit;
        }
        out << "]";
        return out;
    }
}
