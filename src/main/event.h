#ifndef WALKPLAN_EVENT_H
#define WALKPLAN_EVENT_H

#include <cmath>
#include <ostream>
#include <string>
#include <utility>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <nlohmann/json.hpp>

#include "location.h"
#include "util/json.h"

namespace walkplan {

    /*!
     * Time-boxed event hosted at a venue.
     * The event can be entered at any time within the window [window_begin, window_end] (both inclusive)
     * and the visitor stays there between dwell_min and dwell_max.
     */
    class Event {
    public:
        Event();

        Event(std::string id,
              Location location,
              boost::posix_time::ptime window_begin,
              boost::posix_time::ptime window_end,
              boost::posix_time::time_duration dwell_min,
              boost::posix_time::time_duration dwell_max,
              double popularity,
              bool booking_required);

        Event(const Event &other) = default;

        Event(Event &&other) noexcept = default;

        Event &operator=(const Event &other) = default;

        Event &operator=(Event &&other) noexcept = default;

        bool operator==(const Event &other) const;

        bool operator!=(const Event &other) const;

        const std::string &id() const;

        const Location &location() const;

        boost::posix_time::ptime window_begin() const;

        boost::posix_time::ptime window_end() const;

        boost::posix_time::time_duration dwell_min() const;

        boost::posix_time::time_duration dwell_max() const;

        double popularity() const;

        bool booking_required() const;

        Event WithDwellMax(boost::posix_time::time_duration dwell_max) const;

        friend std::ostream &operator<<(std::ostream &out, const Event &object);

        class JsonLoader : protected walkplan::JsonLoader {
        public:
            template<typename JsonType>
            Event Load(const JsonType &document) const;

        private:
            template<typename JsonType>
            boost::posix_time::time_duration LoadDwell(const JsonType &document, const std::string &key) const;
        };

    private:
        std::string id_;
        Location location_;
        boost::posix_time::ptime window_begin_;
        boost::posix_time::ptime window_end_;
        boost::posix_time::time_duration dwell_min_;
        boost::posix_time::time_duration dwell_max_;
        double popularity_;
        bool booking_required_;
    };

    /*!
     * Popularity in descending order, ties broken by the event identifier.
     */
    struct ByPopularityDescending {
        bool operator()(const Event &left, const Event &right) const;
    };
}

namespace walkplan {

    template<typename JsonType>
    Event Event::JsonLoader::Load(const JsonType &document) const {
        static const Location::JsonLoader location_loader{};

        auto id = Require(document, "id").template get<std::string>();

        Location location;
        const auto location_it = document.find("location");
        if (location_it != std::end(document)) {
            location = location_loader.Load(location_it.value());
        } else {
            location = location_loader.Load(document);
        }

        const auto window_begin = Require(document, "windowStart").template get<boost::posix_time::ptime>();
        const auto window_end = Require(document, "windowEnd").template get<boost::posix_time::ptime>();

        const auto dwell_min = LoadDwell(document, "dwellMin");
        auto dwell_max = dwell_min;
        if (document.find("dwellMax") != std::end(document)) {
            dwell_max = LoadDwell(document, "dwellMax");
        }

        double popularity = 0.0;
        const auto popularity_it = document.find("popularity");
        if (popularity_it != std::end(document) && !popularity_it.value().is_null()) {
            popularity = popularity_it.value().template get<double>();
        }

        auto booking_required = false;
        const auto booking_it = document.find("bookingRequired");
        if (booking_it != std::end(document) && !booking_it.value().is_null()) {
            booking_required = booking_it.value().template get<bool>();
        }

        return {std::move(id),
                std::move(location),
                window_begin,
                window_end,
                dwell_min,
                dwell_max,
                popularity,
                booking_required};
    }

    template<typename JsonType>
    boost::posix_time::time_duration Event::JsonLoader::LoadDwell(const JsonType &document,
                                                                  const std::string &key) const {
        const auto &value = Require(document, key);
        if (value.is_number_integer()) {
            return boost::posix_time::minutes(value.template get<long>());
        }

        if (value.is_number()) {
            return boost::posix_time::seconds(static_cast<long>(std::lround(value.template get<double>() * 60.0)));
        }

        throw OnInvalidValue(key, "dwell must be given in minutes");
    }
}


#endif //WALKPLAN_EVENT_H
