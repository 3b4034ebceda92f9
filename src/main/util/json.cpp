#include "json.h"

#include <boost/format.hpp>

std::domain_error walkplan::JsonLoader::OnKeyNotFound(std::string key) const {
    return std::domain_error((boost::format("Key '%1%' not found") % key).str());
}

std::domain_error walkplan::JsonLoader::OnInvalidValue(std::string key, std::string reason) const {
    return std::domain_error((boost::format("Invalid value of the key '%1%': %2%") % key % reason).str());
}

void boost::posix_time::to_json(nlohmann::json &json, const boost::posix_time::ptime &value) {
    json = boost::posix_time::to_iso_extended_string(value);
}

void boost::posix_time::from_json(const nlohmann::json &json, boost::posix_time::ptime &value) {
    auto string_value = json.get<std::string>();
    if (!string_value.empty() && string_value.back() == 'Z') {
        string_value.pop_back();
    }

    if (string_value.find('T') != std::string::npos) {
        value = boost::posix_time::from_iso_extended_string(string_value);
    } else {
        value = boost::posix_time::time_from_string(string_value);
    }

    if (value.is_special()) {
        throw std::domain_error((boost::format("Failed to parse date time '%1%'") % json.get<std::string>()).str());
    }
}

void boost::posix_time::to_json(nlohmann::json &json, const boost::posix_time::time_duration &value) {
    json = value.total_seconds();
}

void boost::posix_time::from_json(const nlohmann::json &json, boost::posix_time::time_duration &value) {
    if (json.is_number()) {
        value = boost::posix_time::seconds(json.get<long>());
        return;
    }

    const auto raw_duration = json.get<std::string>();
    if (raw_duration.find(':') == std::string::npos) {
        value = boost::posix_time::seconds(std::stol(raw_duration));
    } else {
        value = boost::posix_time::duration_from_string(raw_duration);
    }
}
