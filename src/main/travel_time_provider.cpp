#include "travel_time_provider.h"

#include <cmath>

#include <boost/format.hpp>
#include <glog/logging.h>

#include "util/polyline.h"

namespace walkplan {

    TravelLeg::TravelLeg()
            : TravelLeg(0, 0.0, "") {}

    TravelLeg::TravelLeg(std::int64_t seconds, double meters, std::string polyline)
            : Seconds{seconds},
              Meters{meters},
              Polyline{std::move(polyline)} {}

    bool TravelLeg::operator==(const TravelLeg &other) const {
        return Seconds == other.Seconds && Meters == other.Meters && Polyline == other.Polyline;
    }

    TravelMatrix::TravelMatrix()
            : TravelMatrix(0) {}

    TravelMatrix::TravelMatrix(std::size_t size)
            : Seconds(size, std::vector<std::int64_t>(size, 0)),
              Meters(size, std::vector<double>(size, 0.0)) {}

    std::size_t TravelMatrix::size() const {
        return Seconds.size();
    }

    TravelMatrix TravelTimeProvider::Matrix(const std::vector<Location> &points,
                                            boost::posix_time::ptime depart_at) {
        TravelMatrix matrix{points.size()};
        for (std::size_t from = 0; from < points.size(); ++from) {
            for (std::size_t to = 0; to < points.size(); ++to) {
                if (from == to) { continue; }

                const auto leg = Duration(points[from], points[to], depart_at);
                matrix.Seconds[from][to] = leg.Seconds;
                matrix.Meters[from][to] = leg.Meters;
            }
        }
        return matrix;
    }

    EstimateTravelTimeProvider::EstimateTravelTimeProvider(double walking_speed)
            : walking_speed_{walking_speed} {
        CHECK_GT(walking_speed_, 0.0);
    }

    std::string EstimateTravelTimeProvider::mode() const {
        return (boost::format("estimate@%.3f") % walking_speed_).str();
    }

    TravelLeg EstimateTravelTimeProvider::Duration(const Location &from,
                                                   const Location &to,
                                                   boost::posix_time::ptime depart_at) {
        const auto meters = Location::GreatCircleDistance(from, to);
        auto polyline = util::polyline::Encode({{from.latitude_degrees(), from.longitude_degrees()},
                                                {to.latitude_degrees(),   to.longitude_degrees()}});
        return {Seconds(meters), meters, std::move(polyline)};
    }

    TravelMatrix EstimateTravelTimeProvider::Matrix(const std::vector<Location> &points,
                                                    boost::posix_time::ptime depart_at) {
        TravelMatrix matrix{points.size()};
        for (std::size_t from = 0; from < points.size(); ++from) {
            for (std::size_t to = from + 1; to < points.size(); ++to) {
                const auto meters = Location::GreatCircleDistance(points[from], points[to]);
                const auto seconds = Seconds(meters);

                matrix.Meters[from][to] = meters;
                matrix.Meters[to][from] = meters;
                matrix.Seconds[from][to] = seconds;
                matrix.Seconds[to][from] = seconds;
            }
        }
        return matrix;
    }

    double EstimateTravelTimeProvider::walking_speed() const {
        return walking_speed_;
    }

    std::int64_t EstimateTravelTimeProvider::Seconds(double meters) const {
        return static_cast<std::int64_t>(std::ceil(meters / walking_speed_));
    }
}
