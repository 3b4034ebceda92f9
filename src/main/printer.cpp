#include <iostream>

#include <nlohmann/json.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>

#include "printer.h"
#include "util/application_error.h"

static std::string NormalizeFormat(const std::string &format) {
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(format));
}

namespace walkplan {

    TripDefinition::TripDefinition(std::size_t events,
                                   std::size_t candidates,
                                   boost::posix_time::ptime start_time,
                                   boost::posix_time::ptime end_time,
                                   std::string provider)
            : Events{events},
              Candidates{candidates},
              StartTime{start_time},
              EndTime{end_time},
              Provider{std::move(provider)} {}

    void to_json(nlohmann::json &json, const TripDefinition &trip_definition) {
        json = nlohmann::json{
                {"events",     trip_definition.Events},
                {"candidates", trip_definition.Candidates},
                {"start_time", boost::posix_time::to_simple_string(trip_definition.StartTime)},
                {"end_time",   boost::posix_time::to_simple_string(trip_definition.EndTime)},
                {"provider",   trip_definition.Provider}
        };
    }

    ProgressStep::ProgressStep(double objective,
                               std::size_t visited_events,
                               std::size_t candidate_events,
                               boost::posix_time::time_duration wall_time,
                               std::size_t branches,
                               std::size_t solutions)
            : Objective{objective},
              VisitedEvents{visited_events},
              CandidateEvents{candidate_events},
              WallTime{wall_time},
              Branches{branches},
              Solutions{solutions} {}

    void to_json(nlohmann::json &json, const TracingEvent &tracing_event) {
        json = nlohmann::json{
                {"type",    to_string(tracing_event.Type)},
                {"comment", tracing_event.Comment}
        };
    }

    void to_json(nlohmann::json &json, const ProgressStep &progress_step) {
        json = nlohmann::json{
                {"objective",        progress_step.Objective},
                {"visited_events",   progress_step.VisitedEvents},
                {"candidate_events", progress_step.CandidateEvents},
                {"wall_time_ms",     progress_step.WallTime.total_milliseconds()},
                {"branches",         progress_step.Branches},
                {"solutions",        progress_step.Solutions}
        };
    }

    Printer &Printer::operator<<(const std::string &text) {
        std::cout << text << std::endl;
        return *this;
    }

    Printer &ConsolePrinter::operator<<(const TripDefinition &trip_definition) {
        Printer::operator<<((boost::format(
                "Events | Candidates | Start Time | End Time | Provider\n"
                "%6d | %10d | %19s | %19s | %s")
                             % trip_definition.Events
                             % trip_definition.Candidates
                             % trip_definition.StartTime
                             % trip_definition.EndTime
                             % trip_definition.Provider).str());
        return *this;
    }

    Printer &ConsolePrinter::operator<<(const ProgressStep &progress_step) {
        if (!progress_header_printed_) {
            progress_header_printed_ = true;
            Printer::operator<<((boost::format("%12s | %7s | %9s | %8s | %9s")
                                 % "Objective"
                                 % "Visited"
                                 % "Wall Time"
                                 % "Branches"
                                 % "Solutions").str());
        }

        Printer::operator<<((boost::format("%12.2f | %3d/%-3d | %7dms | %8d | %9d")
                             % progress_step.Objective
                             % progress_step.VisitedEvents
                             % progress_step.CandidateEvents
                             % progress_step.WallTime.total_milliseconds()
                             % progress_step.Branches
                             % progress_step.Solutions).str());
        return *this;
    }

    Printer &ConsolePrinter::operator<<(const TracingEvent &trace_event) {
        switch (trace_event.Type) {
            case TracingEventType::Started:
                Printer::operator<<("> " + trace_event.Comment);
                break;
            case TracingEventType::Finished:
                Printer::operator<<("< " + trace_event.Comment);
                break;
            default:
                break;
        }
        return *this;
    }

    Printer &JsonPrinter::operator<<(const std::string &text) {
        Printer::operator<<(nlohmann::json{
                {"type",    "message"},
                {"content", text}}.dump());
        return *this;
    }

    Printer &JsonPrinter::operator<<(const TripDefinition &trip_definition) {
        Printer::operator<<(nlohmann::json{
                {"type",    "trip_definition"},
                {"content", trip_definition}
        }.dump());
        return *this;
    }

    Printer &JsonPrinter::operator<<(const ProgressStep &progress_step) {
        Printer::operator<<(nlohmann::json{
                {"type",    "progress_step"},
                {"content", progress_step}
        }.dump());
        return *this;
    }

    Printer &JsonPrinter::operator<<(const TracingEvent &trace_event) {
        Printer::operator<<(nlohmann::json{
                {"type",    "tracing_event"},
                {"content", trace_event}
        }.dump());
        return *this;
    }

    TracingEvent::TracingEvent(TracingEventType type, std::string comment)
            : Type(type),
              Comment(std::move(comment)) {}

    std::string to_string(const TracingEventType &value) {
        static const std::string UNKNOWN_NAME{"unknown"};
        static const std::string STARTED_NAME{"started"};
        static const std::string FINISHED_NAME{"finished"};

        switch (value) {
            case TracingEventType::Unknown:
                return UNKNOWN_NAME;
            case TracingEventType::Started:
                return STARTED_NAME;
            case TracingEventType::Finished:
                return FINISHED_NAME;
            default:
                throw std::invalid_argument("Conversion to std::string not defined for value="
                                            + std::to_string(static_cast<int>(value)));
        }
    }

    Printer &LogPrinter::operator<<(const std::string &text) {
        LOG(INFO) << text;
        return *this;
    }

    Printer &LogPrinter::operator<<(const TripDefinition &trip_definition) {
        LogPrinter::operator<<(static_cast<nlohmann::json>(trip_definition).dump());
        return *this;
    }

    Printer &LogPrinter::operator<<(const TracingEvent &trace_event) {
        LogPrinter::operator<<(static_cast<nlohmann::json>(trace_event).dump());
        return *this;
    }

    Printer &LogPrinter::operator<<(const ProgressStep &progress_step) {
        LogPrinter::operator<<(static_cast<nlohmann::json>(progress_step).dump());
        return *this;
    }

    bool ValidateConsoleFormat(const char *flagname, const std::string &value) {
        const auto value_to_use = NormalizeFormat(value);
        return value_to_use == JSON_FORMAT || value_to_use == TEXT_FORMAT || value_to_use == LOG_FORMAT;
    }

    std::shared_ptr<Printer> CreatePrinter(const std::string &format) {
        const auto format_to_use = NormalizeFormat(format);
        if (format_to_use == JSON_FORMAT) {
            return std::make_shared<JsonPrinter>();
        }

        if (format_to_use == TEXT_FORMAT) {
            return std::make_shared<ConsolePrinter>();
        }

        if (format_to_use == LOG_FORMAT) {
            return std::make_shared<LogPrinter>();
        }

        throw util::ApplicationError("Unknown console format.", util::ErrorCode::ERROR);
    }
}
