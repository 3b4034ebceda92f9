#include "input.h"

#include <fstream>
#include <iostream>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <nlohmann/json.hpp>

#include "util/application_error.h"
#include "util/error_code.h"

walkplan::TripRequest util::LoadTripRequest(const std::string &request_path) {
    boost::filesystem::path request_file(boost::filesystem::canonical(request_path));
    std::ifstream request_stream;
    request_stream.open(request_file.c_str());
    if (!request_stream.is_open()) {
        throw util::ApplicationError((boost::format("Failed to open the file: %1%") % request_file).str(),
                                     util::ErrorCode::ERROR);
    }

    nlohmann::json request_json;
    try {
        request_stream >> request_json;
    } catch (...) {
        throw util::ApplicationError((boost::format("The file %1% is not a valid JSON document") % request_file).str(),
                                     boost::current_exception_diagnostic_information(),
                                     util::ErrorCode::ERROR);
    }

    try {
        walkplan::TripRequest::JsonLoader json_loader;
        return json_loader.Load(request_json);
    } catch (const std::domain_error &ex) {
        throw util::ApplicationError(
                (boost::format("Failed to parse the file %1% due to error: '%2%'") % request_file % ex.what()).str(),
                util::ErrorCode::ERROR);
    } catch (const nlohmann::json::exception &ex) {
        throw util::ApplicationError(
                (boost::format("Failed to parse the file %1% due to error: '%2%'") % request_file % ex.what()).str(),
                util::ErrorCode::ERROR);
    }
}

void util::SaveResponse(const std::string &output_path, const walkplan::SolveResponse &response) {
    static const auto INDENT = 2;

    const nlohmann::json response_json = response;
    if (output_path.empty()) {
        std::cout << response_json.dump(INDENT) << std::endl;
        return;
    }

    std::ofstream output_stream;
    output_stream.open(output_path);
    if (!output_stream.is_open()) {
        throw util::ApplicationError((boost::format("Failed to open the file: %1%") % output_path).str(),
                                     util::ErrorCode::ERROR);
    }

    output_stream << response_json.dump(INDENT);
    output_stream.close();
}

boost::posix_time::time_duration util::GetTimeDurationOrDefault(const std::string &text,
                                                                boost::posix_time::time_duration default_value) {
    if (text.empty()) {
        return default_value;
    }

    return boost::posix_time::duration_from_string(text);
}

osrm::EngineConfig util::CreateEngineConfig(const std::string &maps_file) {
    osrm::EngineConfig config;
    config.storage_config = osrm::StorageConfig(maps_file);
    config.use_shared_memory = false;
    config.algorithm = osrm::EngineConfig::Algorithm::MLD;

    if (!config.IsValid()) {
        throw util::ApplicationError("Invalid Open Street Map engine configuration", util::ErrorCode::ERROR);
    }

    return config;
}
