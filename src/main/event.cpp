#include "event.h"

#include <boost/format.hpp>

namespace walkplan {

    Event::Event()
            : Event("",
                    Location(),
                    boost::posix_time::not_a_date_time,
                    boost::posix_time::not_a_date_time,
                    boost::posix_time::seconds(0),
                    boost::posix_time::seconds(0),
                    0.0,
                    false) {}

    Event::Event(std::string id,
                 Location location,
                 boost::posix_time::ptime window_begin,
                 boost::posix_time::ptime window_end,
                 boost::posix_time::time_duration dwell_min,
                 boost::posix_time::time_duration dwell_max,
                 double popularity,
                 bool booking_required)
            : id_(std::move(id)),
              location_(std::move(location)),
              window_begin_(window_begin),
              window_end_(window_end),
              dwell_min_(dwell_min),
              dwell_max_(dwell_max),
              popularity_(popularity),
              booking_required_(booking_required) {}

    bool Event::operator==(const Event &other) const {
        return id_ == other.id_
               && location_ == other.location_
               && window_begin_ == other.window_begin_
               && window_end_ == other.window_end_
               && dwell_min_ == other.dwell_min_
               && dwell_max_ == other.dwell_max_
               && popularity_ == other.popularity_
               && booking_required_ == other.booking_required_;
    }

    bool Event::operator!=(const Event &other) const {
        return !operator==(other);
    }

    const std::string &Event::id() const {
        return id_;
    }

    const Location &Event::location() const {
        return location_;
    }

    boost::posix_time::ptime Event::window_begin() const {
        return window_begin_;
    }

    boost::posix_time::ptime Event::window_end() const {
        return window_end_;
    }

    boost::posix_time::time_duration Event::dwell_min() const {
        return dwell_min_;
    }

    boost::posix_time::time_duration Event::dwell_max() const {
        return dwell_max_;
    }

    double Event::popularity() const {
        return popularity_;
    }

    bool Event::booking_required() const {
        return booking_required_;
    }

    Event Event::WithDwellMax(boost::posix_time::time_duration dwell_max) const {
        Event copy{*this};
        copy.dwell_max_ = dwell_max;
        return copy;
    }

    std::ostream &operator<<(std::ostream &out, const Event &object) {
        out << boost::format("%1% %2% [%3%, %4%] dwell [%5%, %6%] popularity %7%")
               % object.id_
               % object.location_
               % object.window_begin_
               % object.window_end_
               % object.dwell_min_
               % object.dwell_max_
               % object.popularity_;
        return out;
    }

    bool ByPopularityDescending::operator()(const Event &left, const Event &right) const {
        if (left.popularity() != right.popularity()) {
            return left.popularity() > right.popularity();
        }
        return left.id() < right.id();
    }
}
