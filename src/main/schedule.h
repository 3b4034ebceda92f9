#ifndef WALKPLAN_SCHEDULE_H
#define WALKPLAN_SCHEDULE_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/variant.hpp>
#include <nlohmann/json.hpp>

#include "problem_instance.h"
#include "route_timeline.h"

namespace walkplan {

    struct VisitRecord {
        VisitRecord();

        VisitRecord(std::size_t node,
                    std::string event_id,
                    boost::posix_time::ptime arrival,
                    boost::posix_time::ptime departure,
                    std::int64_t travel_seconds_from_previous);

        bool operator==(const VisitRecord &other) const;

        boost::posix_time::time_duration dwell() const;

        std::size_t Node;
        std::string EventId;
        boost::posix_time::ptime Arrival;
        boost::posix_time::ptime Departure;
        std::int64_t TravelSecondsFromPrevious;
    };

    std::ostream &operator<<(std::ostream &out, const VisitRecord &record);

    enum class DropReason {
        WindowConflict,
        TimeBudgetExceeded,
        BookingConflict,
        LowPriority
    };

    std::string to_string(DropReason value);

    struct DropRecord {
        DropRecord(std::string event_id, DropReason reason);

        bool operator==(const DropRecord &other) const;

        std::string EventId;
        DropReason Reason;
    };

    void to_json(nlohmann::json &json, const DropRecord &record);

    enum class SolveStage {
        Primary,
        FallbackGreedy,
        FallbackLocalSearch,
        FallbackCompressed,
        FallbackDropped
    };

    std::string to_string(SolveStage value);

    // outcome of a single event in the final answer
    struct Visited {
        VisitRecord Record;
    };

    struct Skipped {
        DropReason Reason;
    };

    using NodeOutcome = boost::variant<Visited, Skipped>;

    /*!
     * Visits ordered by the arrival time.
     */
    class Schedule {
    public:
        Schedule();

        Schedule(std::vector<VisitRecord> visits,
                 std::int64_t total_travel_seconds,
                 std::int64_t final_leg_seconds,
                 double objective);

        static Schedule FromTimeline(const ProblemInstance &instance, const RouteTimeline &timeline);

        static Schedule Empty(const ProblemInstance &instance);

        bool operator==(const Schedule &other) const;

        const std::vector<VisitRecord> &visits() const;

        std::vector<std::size_t> nodes() const;

        bool empty() const;

        std::size_t size() const;

        std::int64_t total_travel_seconds() const;

        std::int64_t final_leg_seconds() const;

        double objective() const;

        friend std::ostream &operator<<(std::ostream &out, const Schedule &schedule);

    private:
        std::vector<VisitRecord> visits_;
        std::int64_t total_travel_seconds_;
        std::int64_t final_leg_seconds_;
        double objective_;
    };
}


#endif //WALKPLAN_SCHEDULE_H
