#ifndef WALKPLAN_SCHEDULE_VALIDATOR_H
#define WALKPLAN_SCHEDULE_VALIDATOR_H

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "problem_instance.h"
#include "schedule.h"

namespace walkplan {

    class ScheduleValidator {
    public:
        enum class ErrorCode {
            UNKNOWN,
            ORPHANED, // the event is not part of the problem instance
            DUPLICATED,
            LATE_ARRIVAL,
            EARLY_ARRIVAL,
            DWELL_OUT_OF_RANGE,
            TRAVEL_MISMATCH,
            NOT_INCREASING,
            END_TIME_EXCEEDED
        };

        class ValidationError {
        public:
            ValidationError(ErrorCode error_code, std::string event_id, std::string error_message);

            friend std::ostream &operator<<(std::ostream &out, const ValidationError &error);

            ErrorCode error_code() const;

            const std::string &event_id() const;

            const std::string &error_message() const;

        private:
            ErrorCode error_code_;
            std::string event_id_;
            std::string error_message_;
        };

        class ValidationResult {
        public:
            ValidationResult();

            bool ok() const;

            const std::vector<ValidationError> &errors() const;

            void Add(ValidationError error);

        private:
            std::vector<ValidationError> errors_;
        };

        ScheduleValidator();

        explicit ScheduleValidator(std::int64_t max_lateness);

        /*!
         * Checks every visit against the time window and the dwell range of its event,
         * the travel time from the previous stop and the end time of the trip.
         */
        ValidationResult Validate(const Schedule &schedule, const ProblemInstance &instance) const;

    private:
        std::int64_t max_lateness_;
    };

    std::string to_string(ScheduleValidator::ErrorCode error_code);
}


#endif //WALKPLAN_SCHEDULE_VALIDATOR_H
