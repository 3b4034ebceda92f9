#ifndef WALKPLAN_LOCATION_H
#define WALKPLAN_LOCATION_H

#include <cstddef>
#include <cstdint>
#include <utility>
#include <string>
#include <ostream>

#include <boost/functional/hash.hpp>
#include <osrm/util/alias.hpp>
#include <osrm/coordinate.hpp>

#include "util/json.h"


namespace walkplan {

    class Location {
    public:
        Location();

        Location(double latitude, double longitude);

        Location(osrm::util::FixedLatitude latitude, osrm::util::FixedLongitude longitude);

        Location(const Location &other);

        Location(Location &&other) noexcept;

        Location &operator=(const Location &other);

        Location &operator=(Location &&other) noexcept;

        bool operator==(const Location &other) const;

        bool operator!=(const Location &other) const;

        class JsonLoader : protected walkplan::JsonLoader {
        public:
            template<typename JsonType>
            Location Load(const JsonType &document) const;
        };

        const osrm::util::FixedLatitude &latitude() const;

        const osrm::util::FixedLongitude &longitude() const;

        double latitude_degrees() const;

        double longitude_degrees() const;

        bool IsValid() const;

        /*!
         * Returns the location with coordinates rounded to the given number of decimal places.
         * Near duplicate coordinates collapse onto the same rounded location.
         */
        Location Round(int decimal_places) const;

        osrm::util::Coordinate ToCoordinate() const;

        static double GreatCircleDistance(const Location &from, const Location &to);

        friend struct std::hash<walkplan::Location>;

        friend std::ostream &operator<<(std::ostream &out, const Location &object);

    private:
        static std::int32_t RoundFixedValue(std::int32_t value, int decimal_places);

        osrm::util::FixedLatitude latitude_;
        osrm::util::FixedLongitude longitude_;
    };
}

namespace walkplan {

    template<typename JsonType>
    Location Location::JsonLoader::Load(const JsonType &document) const {
        const auto read_coordinate = [this, &document](const std::string &short_key,
                                                       const std::string &long_key) -> double {
            auto value_it = document.find(short_key);
            if (value_it == std::end(document)) {
                value_it = document.find(long_key);
                if (value_it == std::end(document)) { throw OnKeyNotFound(short_key); }
            }

            if (value_it.value().is_string()) {
                return std::stod(value_it.value().template get<std::string>());
            }
            return value_it.value().template get<double>();
        };

        const auto latitude = read_coordinate("lat", "latitude");
        const auto longitude = read_coordinate("lng", "longitude");
        return {latitude, longitude};
    }
}

namespace std {

    template<>
    struct hash<walkplan::Location> {
        typedef walkplan::Location argument_type;
        typedef std::size_t result_type;

        result_type operator()(const argument_type &object) const noexcept {
            static const std::hash<osrm::FixedLatitude> hash_latitude{};
            static const std::hash<osrm::FixedLongitude> hash_longitude{};

            std::size_t seed = 0;
            boost::hash_combine(seed, hash_latitude(object.latitude_));
            boost::hash_combine(seed, hash_longitude(object.longitude_));
            return seed;
        }
    };
}

#endif //WALKPLAN_LOCATION_H
