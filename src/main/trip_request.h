#ifndef WALKPLAN_TRIP_REQUEST_H
#define WALKPLAN_TRIP_REQUEST_H

#include <string>
#include <unordered_set>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include "event.h"
#include "location.h"
#include "util/json.h"

namespace walkplan {

    struct ObjectiveWeights {
        ObjectiveWeights();

        ObjectiveWeights(double walk, double visited_bonus, double late_penalty, double wait_penalty);

        double Walk;
        double VisitedBonus;
        double LatePenalty;
        double WaitPenalty;
    };

    void to_json(nlohmann::json &json, const ObjectiveWeights &weights);

    class TripRequest {
    public:
        static const double DEFAULT_WALKING_SPEED;
        static const double MIN_WALKING_SPEED;
        static const double MAX_WALKING_SPEED;
        static const std::size_t MAX_EVENTS;

        TripRequest();

        TripRequest(Location start_location,
                    boost::posix_time::ptime start_time,
                    boost::optional<Location> end_location,
                    boost::posix_time::ptime end_time,
                    std::vector<Event> events);

        const Location &start_location() const;

        boost::posix_time::ptime start_time() const;

        const boost::optional<Location> &end_location() const;

        boost::posix_time::ptime end_time() const;

        double walking_speed() const;

        const ObjectiveWeights &weights() const;

        bool compress_dwell_to_min() const;

        const std::unordered_set<std::string> &booked_events() const;

        const std::vector<Event> &events() const;

        bool IsBooked(const Event &event) const;

        void set_walking_speed(double walking_speed);

        void set_weights(ObjectiveWeights weights);

        void set_compress_dwell_to_min(bool value);

        void set_booked_events(std::unordered_set<std::string> booked_events);

        /*!
         * Checks conditions that no amount of dropping events can repair.
         * @throws util::ApplicationError with util::ErrorCode::INFEASIBLE_INPUT
         */
        void Validate() const;

        class JsonLoader : protected walkplan::JsonLoader {
        public:
            /*!
             * @throws std::domain_error
             */
            template<typename JsonType>
            TripRequest Load(const JsonType &document) const;

        private:
            template<typename JsonType>
            ObjectiveWeights LoadWeights(const JsonType &document) const;
        };

    private:
        Location start_location_;
        boost::posix_time::ptime start_time_;
        boost::optional<Location> end_location_;
        boost::posix_time::ptime end_time_;
        double walking_speed_;
        ObjectiveWeights weights_;
        bool compress_dwell_to_min_;
        std::unordered_set<std::string> booked_events_;
        std::vector<Event> events_;
    };
}

namespace walkplan {

    template<typename JsonType>
    TripRequest TripRequest::JsonLoader::Load(const JsonType &document) const {
        static const Location::JsonLoader location_loader{};
        static const Event::JsonLoader event_loader{};

        const auto &start_json = Require(document, "start");
        auto start_location = location_loader.Load(start_json);
        const auto start_time = Require(start_json, "time").template get<boost::posix_time::ptime>();

        boost::optional<Location> end_location;
        const auto end_it = document.find("end");
        if (end_it != std::end(document) && !end_it.value().is_null()) {
            end_location = location_loader.Load(end_it.value());
        }

        const auto end_time = Require(document, "endTime").template get<boost::posix_time::ptime>();

        std::vector<Event> events;
        const auto events_it = document.find("events");
        if (events_it != std::end(document)) {
            for (const auto &event_json : events_it.value()) {
                events.push_back(event_loader.Load(event_json));
            }
        }

        TripRequest request{std::move(start_location), start_time, std::move(end_location), end_time, std::move(events)};

        const auto speed_it = document.find("walkingSpeed");
        if (speed_it != std::end(document) && !speed_it.value().is_null()) {
            request.set_walking_speed(speed_it.value().template get<double>());
        }

        const auto weights_it = document.find("weights");
        if (weights_it != std::end(document) && !weights_it.value().is_null()) {
            request.set_weights(LoadWeights(weights_it.value()));
        }

        const auto compress_it = document.find("compressDwellToMin");
        if (compress_it != std::end(document) && !compress_it.value().is_null()) {
            request.set_compress_dwell_to_min(compress_it.value().template get<bool>());
        }

        const auto booked_it = document.find("bookedEvents");
        if (booked_it != std::end(document) && !booked_it.value().is_null()) {
            std::unordered_set<std::string> booked_events;
            for (const auto &event_id_json : booked_it.value()) {
                booked_events.insert(event_id_json.template get<std::string>());
            }
            request.set_booked_events(std::move(booked_events));
        }

        return request;
    }

    template<typename JsonType>
    ObjectiveWeights TripRequest::JsonLoader::LoadWeights(const JsonType &document) const {
        ObjectiveWeights weights;

        const auto read_weight = [&document](const std::string &key, double &value) {
            const auto value_it = document.find(key);
            if (value_it != std::end(document) && !value_it.value().is_null()) {
                value = value_it.value().template get<double>();
            }
        };

        read_weight("walk", weights.Walk);
        read_weight("visitedBonus", weights.VisitedBonus);
        read_weight("latePenalty", weights.LatePenalty);
        read_weight("waitPenalty", weights.WaitPenalty);
        return weights;
    }
}


#endif //WALKPLAN_TRIP_REQUEST_H
