#include "schedule_validator.h"

#include <stdexcept>
#include <unordered_set>

#include <boost/format.hpp>
#include <boost/optional.hpp>

namespace walkplan {

    ScheduleValidator::ValidationError::ValidationError(ErrorCode error_code,
                                                        std::string event_id,
                                                        std::string error_message)
            : error_code_{error_code},
              event_id_{std::move(event_id)},
              error_message_{std::move(error_message)} {}

    std::ostream &operator<<(std::ostream &out, const ScheduleValidator::ValidationError &error) {
        out << boost::format("%1% [%2%]: %3%") % to_string(error.error_code_) % error.event_id_ % error.error_message_;
        return out;
    }

    ScheduleValidator::ErrorCode ScheduleValidator::ValidationError::error_code() const {
        return error_code_;
    }

    const std::string &ScheduleValidator::ValidationError::event_id() const {
        return event_id_;
    }

    const std::string &ScheduleValidator::ValidationError::error_message() const {
        return error_message_;
    }

    ScheduleValidator::ValidationResult::ValidationResult()
            : errors_{} {}

    bool ScheduleValidator::ValidationResult::ok() const {
        return errors_.empty();
    }

    const std::vector<ScheduleValidator::ValidationError> &ScheduleValidator::ValidationResult::errors() const {
        return errors_;
    }

    void ScheduleValidator::ValidationResult::Add(ValidationError error) {
        errors_.emplace_back(std::move(error));
    }

    ScheduleValidator::ScheduleValidator()
            : ScheduleValidator(0) {}

    ScheduleValidator::ScheduleValidator(std::int64_t max_lateness)
            : max_lateness_{max_lateness} {}

    ScheduleValidator::ValidationResult ScheduleValidator::Validate(const Schedule &schedule,
                                                                    const ProblemInstance &instance) const {
        ValidationResult result;

        std::unordered_set<std::size_t> visited_nodes;
        auto previous_node = ProblemInstance::START_NODE;
        auto previous_departure = instance.request().start_time();
        boost::optional<boost::posix_time::ptime> previous_arrival;
        for (const auto &visit : schedule.visits()) {
            if (!instance.IsEventNode(visit.Node) || instance.NodeToEvent(visit.Node).id() != visit.EventId) {
                result.Add({ErrorCode::ORPHANED, visit.EventId, "the event is not part of the problem"});
                continue;
            }

            if (!visited_nodes.insert(visit.Node).second) {
                result.Add({ErrorCode::DUPLICATED, visit.EventId, "the event is visited more than once"});
            }

            const auto &event = instance.NodeToEvent(visit.Node);
            if (visit.Arrival > event.window_end() + boost::posix_time::seconds(max_lateness_)) {
                result.Add({ErrorCode::LATE_ARRIVAL,
                            visit.EventId,
                            (boost::format("arrival %1% is after the end of the window %2%")
                             % visit.Arrival
                             % event.window_end()).str()});
            }

            if (visit.Arrival < event.window_begin()) {
                result.Add({ErrorCode::EARLY_ARRIVAL,
                            visit.EventId,
                            (boost::format("arrival %1% is before the beginning of the window %2%")
                             % visit.Arrival
                             % event.window_begin()).str()});
            }

            const auto dwell = visit.dwell();
            const auto dwell_max = boost::posix_time::seconds(instance.DwellMax(visit.Node));
            if (dwell < event.dwell_min() || dwell > dwell_max) {
                result.Add({ErrorCode::DWELL_OUT_OF_RANGE,
                            visit.EventId,
                            (boost::format("dwell %1% is outside the range [%2%, %3%]")
                             % dwell
                             % event.dwell_min()
                             % dwell_max).str()});
            }

            const auto expected_travel = instance.Travel(previous_node, visit.Node);
            if (visit.TravelSecondsFromPrevious != expected_travel
                || visit.Arrival < previous_departure + boost::posix_time::seconds(expected_travel)) {
                result.Add({ErrorCode::TRAVEL_MISMATCH,
                            visit.EventId,
                            (boost::format("travel from the previous stop takes %1%s, the visit assumes %2%s")
                             % expected_travel
                             % visit.TravelSecondsFromPrevious).str()});
            }

            if (previous_arrival && visit.Arrival <= previous_arrival.get()) {
                result.Add({ErrorCode::NOT_INCREASING,
                            visit.EventId,
                            (boost::format("arrival %1% is not after the previous arrival %2%")
                             % visit.Arrival
                             % previous_arrival.get()).str()});
            }

            if (visit.Departure > instance.request().end_time()) {
                result.Add({ErrorCode::END_TIME_EXCEEDED,
                            visit.EventId,
                            (boost::format("departure %1% is after the end of the trip %2%")
                             % visit.Departure
                             % instance.request().end_time()).str()});
            }

            previous_node = visit.Node;
            previous_departure = visit.Departure;
            previous_arrival = visit.Arrival;
        }

        return result;
    }

    std::string to_string(ScheduleValidator::ErrorCode error_code) {
        switch (error_code) {
            case ScheduleValidator::ErrorCode::UNKNOWN:
                return "UNKNOWN";
            case ScheduleValidator::ErrorCode::ORPHANED:
                return "ORPHANED";
            case ScheduleValidator::ErrorCode::DUPLICATED:
                return "DUPLICATED";
            case ScheduleValidator::ErrorCode::LATE_ARRIVAL:
                return "LATE_ARRIVAL";
            case ScheduleValidator::ErrorCode::EARLY_ARRIVAL:
                return "EARLY_ARRIVAL";
            case ScheduleValidator::ErrorCode::DWELL_OUT_OF_RANGE:
                return "DWELL_OUT_OF_RANGE";
            case ScheduleValidator::ErrorCode::TRAVEL_MISMATCH:
                return "TRAVEL_MISMATCH";
            case ScheduleValidator::ErrorCode::NOT_INCREASING:
                return "NOT_INCREASING";
            case ScheduleValidator::ErrorCode::END_TIME_EXCEEDED:
                return "END_TIME_EXCEEDED";
            default:
                throw std::invalid_argument("Conversion to std::string not defined for value="
                                            + std::to_string(static_cast<int>(error_code)));
        }
    }
}
