#ifndef WALKPLAN_INPUT_H
#define WALKPLAN_INPUT_H

#include <string>

#include <osrm/engine/engine_config.hpp>
#include <osrm/engine_config.hpp>
#include <osrm/storage_config.hpp>

#include <boost/date_time.hpp>

#include "trip_request.h"
#include "response_builder.h"

namespace util {

    walkplan::TripRequest LoadTripRequest(const std::string &request_path);

    // an empty path writes the response to the standard output
    void SaveResponse(const std::string &output_path, const walkplan::SolveResponse &response);

    boost::posix_time::time_duration GetTimeDurationOrDefault(const std::string &text,
                                                              boost::posix_time::time_duration default_value);

    osrm::EngineConfig CreateEngineConfig(const std::string &maps_file);
}


#endif //WALKPLAN_INPUT_H
