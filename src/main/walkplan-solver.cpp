#include <memory>
#include <string>

#include <boost/format.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <osrm/engine/engine_config.hpp>

#include "util/application_error.h"
#include "util/error_code.h"
#include "util/input.h"
#include "util/logging.h"
#include "util/validation.h"
#include "itinerary_engine.h"
#include "printer.h"
#include "routed_travel_time_provider.h"
#include "travel_time_cache.h"

DEFINE_string(request, "../request.json", "a file path to the trip request");
DEFINE_validator(request, &util::file::Exists);

DEFINE_string(output, "", "a file path to save the itinerary, the standard output is used if not set");

DEFINE_string(maps, "", "a file path to the map, travel times are estimated if not set");
DEFINE_validator(maps, &util::file::IsNullOrExists);

DEFINE_string(console_format, "log", "output format. Available options: txt, json or log");
DEFINE_validator(console_format, &walkplan::ValidateConsoleFormat);

DEFINE_string(provider_timeout, "00:00:05", "time limit for a single request to the routing engine");
DEFINE_validator(provider_timeout, &util::time_duration::IsPositive);

DEFINE_int32(provider_concurrency, 4, "maximum number of concurrent requests to the routing engine");
DEFINE_validator(provider_concurrency, &util::numeric::IsPositive<gflags::int32>);

DEFINE_string(primary_time_limit, "",
              "time limit for the routing solver, depends on the number of events if not set, 0 skips the solver");
DEFINE_validator(primary_time_limit, &util::time_duration::IsNullOrNonNegative);

DEFINE_int32(local_search_iterations, 64, "maximum number of local search passes in the fallback heuristic");
DEFINE_validator(local_search_iterations, &util::numeric::IsPositive<gflags::int32>);

DEFINE_int64(max_lateness, 0, "seconds an arrival may exceed the end of the event window");
DEFINE_validator(max_lateness, &util::numeric::IsNonNegative<gflags::int64>);

DEFINE_bool(debug, false, "attach the nodes and the travel matrix to the response");

static const std::string YES_OPTION{"yes"};
static const std::string NO_OPTION{"no"};

inline const std::string &GetYesOrNoOption(bool value) {
    if (value) { return YES_OPTION; }
    return NO_OPTION;
}

inline std::string FlagOrDefaultValue(const std::string &flag_value, const std::string &default_value) {
    if (flag_value.empty()) { return default_value; }
    return flag_value;
}

void ParseArgs(int argc, char **argv) {
    gflags::SetVersionString("0.0.1");
    gflags::SetUsageMessage("Walking itinerary planner\n"
                            "Example: walkplan-solver"
                            " --request=request.json"
                            " --maps=./data/city-latest.osrm"
                            " --output=itinerary.json"
                            " --primary_time_limit=00:00:00.400");

    static const auto REMOVE_FLAGS = false;
    gflags::ParseCommandLineFlags(&argc, &argv, REMOVE_FLAGS);

    VLOG(1) << boost::format("Launched with the arguments:\n"
                             "request: %1%\n"
                             "output: %2%\n"
                             "maps: %3%\n"
                             "provider-timeout: %4%\n"
                             "provider-concurrency: %5%\n"
                             "primary-time-limit: %6%\n"
                             "local-search-iterations: %7%\n"
                             "max-lateness: %8%\n"
                             "debug: %9%")
               % FLAGS_request
               % FlagOrDefaultValue(FLAGS_output, "stdout")
               % FlagOrDefaultValue(FLAGS_maps, "estimate")
               % FLAGS_provider_timeout
               % FLAGS_provider_concurrency
               % FlagOrDefaultValue(FLAGS_primary_time_limit, "auto")
               % FLAGS_local_search_iterations
               % FLAGS_max_lateness
               % GetYesOrNoOption(FLAGS_debug);
}

int Run() {
    std::shared_ptr<walkplan::Printer> printer = walkplan::CreatePrinter(FLAGS_console_format);

    const auto request = util::LoadTripRequest(FLAGS_request);

    walkplan::EngineConfig config;
    config.LocalSearchIterations = static_cast<std::size_t>(FLAGS_local_search_iterations);
    config.ProviderConcurrency = static_cast<std::size_t>(FLAGS_provider_concurrency);
    config.ProviderTimeout = util::GetTimeDurationOrDefault(FLAGS_provider_timeout, config.ProviderTimeout);
    config.AttachDebug = FLAGS_debug;
    config.Primary.MaxLateness = FLAGS_max_lateness;
    if (!FLAGS_primary_time_limit.empty()) {
        config.Primary.TimeLimit = boost::posix_time::duration_from_string(FLAGS_primary_time_limit);
    }

    std::shared_ptr<walkplan::TravelTimeProvider> provider;
    if (!FLAGS_maps.empty()) {
        auto engine_config = util::CreateEngineConfig(FLAGS_maps);
        provider = std::make_shared<walkplan::RoutedTravelTimeProvider>(
                engine_config,
                config.ProviderTimeout,
                config.ProviderConcurrency);
    }

    auto cache = std::make_shared<walkplan::TravelTimeCache>(config.Cache);
    walkplan::ItineraryEngine engine{config, provider, cache, printer};
    const auto response = engine.Solve(request);
    util::SaveResponse(FLAGS_output, response);
    return util::to_exit_code(util::ErrorCode::OK);
}

int main(int argc, char **argv) {
    util::SetupLogging(argv[0]);
    ParseArgs(argc, argv);

    try {
        return Run();
    } catch (const util::ApplicationError &ex) {
        LOG(ERROR) << ex.msg() << std::endl << ex.diagnostic_info();
        return util::to_exit_code(ex.error_code());
    }
}
