#include <algorithm>
#include <cmath>

#include <boost/format.hpp>

#include "location.h"

namespace walkplan {

    static const double EARTH_RADIUS_METERS = 6371000.0;

    Location::Location()
            : latitude_(osrm::util::FixedLatitude{0}),
              longitude_(osrm::util::FixedLongitude{0}) {}

    Location::Location(double latitude, double longitude)
            : latitude_(osrm::toFixed(osrm::util::FloatLatitude{latitude})),
              longitude_(osrm::toFixed(osrm::util::FloatLongitude{longitude})) {}

    Location::Location(osrm::util::FixedLatitude latitude, osrm::util::FixedLongitude longitude)
            : latitude_(latitude),
              longitude_(longitude) {}

    Location::Location(const Location &other)
            : latitude_(other.latitude_),
              longitude_(other.longitude_) {}

    Location::Location(Location &&other) noexcept
            : latitude_(other.latitude_),
              longitude_(other.longitude_) {}

    Location &Location::operator=(const Location &other) {
        latitude_ = other.latitude_;
        longitude_ = other.longitude_;
        return *this;
    }

    Location &Location::operator=(Location &&other) noexcept {
        latitude_ = other.latitude_;
        longitude_ = other.longitude_;
        return *this;
    }

    bool Location::operator==(const Location &other) const {
        return latitude_ == other.latitude_
               && longitude_ == other.longitude_;
    }

    bool Location::operator!=(const Location &other) const {
        return !operator==(other);
    }

    const osrm::util::FixedLatitude &Location::latitude() const {
        return latitude_;
    }

    const osrm::util::FixedLongitude &Location::longitude() const {
        return longitude_;
    }

    double Location::latitude_degrees() const {
        return static_cast<double>(osrm::toFloating(latitude_));
    }

    double Location::longitude_degrees() const {
        return static_cast<double>(osrm::toFloating(longitude_));
    }

    bool Location::IsValid() const {
        const auto latitude = latitude_degrees();
        const auto longitude = longitude_degrees();
        return std::isfinite(latitude) && std::isfinite(longitude)
               && latitude >= -90.0 && latitude <= 90.0
               && longitude >= -180.0 && longitude <= 180.0;
    }

    Location Location::Round(int decimal_places) const {
        return {osrm::util::FixedLatitude{RoundFixedValue(static_cast<std::int32_t>(latitude_), decimal_places)},
                osrm::util::FixedLongitude{RoundFixedValue(static_cast<std::int32_t>(longitude_), decimal_places)}};
    }

    osrm::util::Coordinate Location::ToCoordinate() const {
        return {longitude_, latitude_};
    }

    std::int32_t Location::RoundFixedValue(std::int32_t value, int decimal_places) {
        static const auto DECIMAL_PLACES = static_cast<int>(std::log10(osrm::COORDINATE_PRECISION));

        if (decimal_places >= DECIMAL_PLACES) {
            return value;
        }

        const auto step = static_cast<std::int64_t>(std::pow(10.0, DECIMAL_PLACES - std::max(decimal_places, 0)));
        const auto raw_value = static_cast<std::int64_t>(value);
        const auto half_step = step / 2;
        std::int64_t rounded = 0;
        if (raw_value >= 0) {
            rounded = ((raw_value + half_step) / step) * step;
        } else {
            rounded = -(((-raw_value + half_step) / step) * step);
        }
        return static_cast<std::int32_t>(rounded);
    }

    double Location::GreatCircleDistance(const Location &from, const Location &to) {
        static const auto TO_RADIANS = M_PI / 180.0;

        const auto from_latitude = from.latitude_degrees() * TO_RADIANS;
        const auto to_latitude = to.latitude_degrees() * TO_RADIANS;
        const auto delta_latitude = to_latitude - from_latitude;
        const auto delta_longitude = (to.longitude_degrees() - from.longitude_degrees()) * TO_RADIANS;

        const auto h = std::pow(std::sin(delta_latitude / 2.0), 2.0)
                       + std::cos(from_latitude) * std::cos(to_latitude) * std::pow(std::sin(delta_longitude / 2.0), 2.0);
        return 2.0 * EARTH_RADIUS_METERS * std::asin(std::min(1.0, std::sqrt(h)));
    }

    std::ostream &operator<<(std::ostream &out, const Location &object) {
        out << boost::format("(%1%, %2%)") % object.latitude_ % object.longitude_;
        return out;
    }
}
