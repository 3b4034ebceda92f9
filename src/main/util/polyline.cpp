#include "polyline.h"

#include <cmath>
#include <stdexcept>

namespace {

    void EncodeValue(long value, std::string &output) {
        value <<= 1;
        if (value < 0) {
            value = ~value;
        }

        while (value >= 0x20) {
            output.push_back(static_cast<char>((0x20 | (value & 0x1f)) + 63));
            value >>= 5;
        }
        output.push_back(static_cast<char>(value + 63));
    }

    long DecodeValue(const std::string &text, std::size_t &position) {
        long result = 0;
        int shift = 0;
        int chunk = 0;
        do {
            if (position >= text.size()) {
                throw std::domain_error("Polyline is truncated");
            }

            chunk = static_cast<int>(text[position++]) - 63;
            result |= static_cast<long>(chunk & 0x1f) << shift;
            shift += 5;
        } while (chunk >= 0x20);

        if (result & 1) {
            return ~(result >> 1);
        }
        return result >> 1;
    }
}

std::string util::polyline::Encode(const std::vector<std::pair<double, double> > &points, int precision) {
    const auto factor = std::pow(10.0, precision);

    std::string output;
    long previous_latitude = 0;
    long previous_longitude = 0;
    for (const auto &point : points) {
        const auto latitude = std::lround(point.first * factor);
        const auto longitude = std::lround(point.second * factor);
        EncodeValue(latitude - previous_latitude, output);
        EncodeValue(longitude - previous_longitude, output);
        previous_latitude = latitude;
        previous_longitude = longitude;
    }
    return output;
}

std::vector<std::pair<double, double> > util::polyline::Decode(const std::string &text, int precision) {
    const auto factor = std::pow(10.0, precision);

    std::vector<std::pair<double, double> > points;
    std::size_t position = 0;
    long latitude = 0;
    long longitude = 0;
    while (position < text.size()) {
        latitude += DecodeValue(text, position);
        longitude += DecodeValue(text, position);
        points.emplace_back(static_cast<double>(latitude) / factor, static_cast<double>(longitude) / factor);
    }
    return points;
}
