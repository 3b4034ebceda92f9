#include "trip_request.h"

#include <cmath>

#include <boost/format.hpp>

#include "util/application_error.h"

namespace walkplan {

    const double TripRequest::DEFAULT_WALKING_SPEED = 1.35;
    const double TripRequest::MIN_WALKING_SPEED = 0.05;
    const double TripRequest::MAX_WALKING_SPEED = 3.0;
    const std::size_t TripRequest::MAX_EVENTS = 24;

    ObjectiveWeights::ObjectiveWeights()
            : ObjectiveWeights(1.0, 0.4, 2.0, 0.3) {}

    ObjectiveWeights::ObjectiveWeights(double walk, double visited_bonus, double late_penalty, double wait_penalty)
            : Walk{walk},
              VisitedBonus{visited_bonus},
              LatePenalty{late_penalty},
              WaitPenalty{wait_penalty} {}

    void to_json(nlohmann::json &json, const ObjectiveWeights &weights) {
        json = nlohmann::json{
                {"walk",         weights.Walk},
                {"visitedBonus", weights.VisitedBonus},
                {"latePenalty",  weights.LatePenalty},
                {"waitPenalty",  weights.WaitPenalty}
        };
    }

    TripRequest::TripRequest()
            : TripRequest(Location(),
                          boost::posix_time::not_a_date_time,
                          boost::none,
                          boost::posix_time::not_a_date_time,
                          {}) {}

    TripRequest::TripRequest(Location start_location,
                             boost::posix_time::ptime start_time,
                             boost::optional<Location> end_location,
                             boost::posix_time::ptime end_time,
                             std::vector<Event> events)
            : start_location_(std::move(start_location)),
              start_time_(start_time),
              end_location_(std::move(end_location)),
              end_time_(end_time),
              walking_speed_(DEFAULT_WALKING_SPEED),
              weights_(),
              compress_dwell_to_min_(false),
              booked_events_(),
              events_(std::move(events)) {}

    const Location &TripRequest::start_location() const {
        return start_location_;
    }

    boost::posix_time::ptime TripRequest::start_time() const {
        return start_time_;
    }

    const boost::optional<Location> &TripRequest::end_location() const {
        return end_location_;
    }

    boost::posix_time::ptime TripRequest::end_time() const {
        return end_time_;
    }

    double TripRequest::walking_speed() const {
        return walking_speed_;
    }

    const ObjectiveWeights &TripRequest::weights() const {
        return weights_;
    }

    bool TripRequest::compress_dwell_to_min() const {
        return compress_dwell_to_min_;
    }

    const std::unordered_set<std::string> &TripRequest::booked_events() const {
        return booked_events_;
    }

    const std::vector<Event> &TripRequest::events() const {
        return events_;
    }

    bool TripRequest::IsBooked(const Event &event) const {
        return booked_events_.find(event.id()) != std::end(booked_events_);
    }

    void TripRequest::set_walking_speed(double walking_speed) {
        walking_speed_ = walking_speed;
    }

    void TripRequest::set_weights(ObjectiveWeights weights) {
        weights_ = weights;
    }

    void TripRequest::set_compress_dwell_to_min(bool value) {
        compress_dwell_to_min_ = value;
    }

    void TripRequest::set_booked_events(std::unordered_set<std::string> booked_events) {
        booked_events_ = std::move(booked_events);
    }

    static util::ApplicationError InfeasibleInput(const std::string &message) {
        return util::ApplicationError(message, util::ErrorCode::INFEASIBLE_INPUT);
    }

    void TripRequest::Validate() const {
        if (start_time_.is_special() || end_time_.is_special()) {
            throw InfeasibleInput("Start time and end time must be set");
        }

        if (end_time_ <= start_time_) {
            throw InfeasibleInput((boost::format("End time %1% must be after start time %2%")
                                   % end_time_
                                   % start_time_).str());
        }

        if (!start_location_.IsValid()) {
            throw InfeasibleInput((boost::format("Start location %1% is out of range") % start_location_).str());
        }

        if (end_location_ && !end_location_->IsValid()) {
            throw InfeasibleInput((boost::format("End location %1% is out of range") % *end_location_).str());
        }

        if (!std::isfinite(walking_speed_)
            || walking_speed_ <= MIN_WALKING_SPEED
            || walking_speed_ > MAX_WALKING_SPEED) {
            throw InfeasibleInput((boost::format("Walking speed %1% m/s must be in the range (%2%, %3%]")
                                   % walking_speed_
                                   % MIN_WALKING_SPEED
                                   % MAX_WALKING_SPEED).str());
        }

        if (weights_.Walk < 0.0 || weights_.VisitedBonus < 0.0
            || weights_.LatePenalty < 0.0 || weights_.WaitPenalty < 0.0) {
            throw InfeasibleInput("Objective weights must not be negative");
        }

        if (weights_.Walk < weights_.WaitPenalty) {
            throw InfeasibleInput((boost::format("Walk weight %1% must not be lower than the wait penalty %2%")
                                   % weights_.Walk
                                   % weights_.WaitPenalty).str());
        }

        if (events_.empty()) {
            throw InfeasibleInput("List of events must not be empty");
        }

        if (events_.size() > MAX_EVENTS) {
            throw InfeasibleInput((boost::format("Too many events: %1%. At most %2% events are supported")
                                   % events_.size()
                                   % MAX_EVENTS).str());
        }

        std::unordered_set<std::string> event_ids;
        for (const auto &event : events_) {
            if (event.id().empty()) {
                throw InfeasibleInput("Event identifier must not be empty");
            }

            if (!event_ids.insert(event.id()).second) {
                throw InfeasibleInput((boost::format("Duplicate event id '%1%'") % event.id()).str());
            }

            if (!event.location().IsValid()) {
                throw InfeasibleInput((boost::format("Location of the event '%1%' is out of range")
                                       % event.id()).str());
            }

            if (event.window_begin().is_special() || event.window_end().is_special()) {
                throw InfeasibleInput((boost::format("Time window of the event '%1%' is not set") % event.id()).str());
            }

            if (event.window_end() < event.window_begin()) {
                throw InfeasibleInput((boost::format("Time window of the event '%1%' ends before it begins")
                                       % event.id()).str());
            }

            if (event.dwell_min().is_negative() || event.dwell_max().is_negative()) {
                throw InfeasibleInput((boost::format("Dwell time of the event '%1%' is negative") % event.id()).str());
            }

            if (event.dwell_min() > event.dwell_max()) {
                throw InfeasibleInput((boost::format("Minimum dwell time of the event '%1%' exceeds the maximum")
                                       % event.id()).str());
            }

            if (!std::isfinite(event.popularity()) || event.popularity() < 0.0) {
                throw InfeasibleInput((boost::format("Popularity of the event '%1%' must not be negative")
                                       % event.id()).str());
            }
        }
    }
}
