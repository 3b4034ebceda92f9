#ifndef WALKPLAN_PRINTER_H
#define WALKPLAN_PRINTER_H

#include <memory>
#include <string>

#include <boost/date_time.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace walkplan {

    struct TripDefinition {
        TripDefinition(std::size_t events,
                       std::size_t candidates,
                       boost::posix_time::ptime start_time,
                       boost::posix_time::ptime end_time,
                       std::string provider);

        std::size_t Events;
        std::size_t Candidates;
        boost::posix_time::ptime StartTime;
        boost::posix_time::ptime EndTime;
        std::string Provider;
    };

    void to_json(nlohmann::json &json, const TripDefinition &trip_definition);

    enum class TracingEventType {
        Unknown,
        Started,
        Finished
    };

    std::string to_string(const TracingEventType &value);

    struct TracingEvent {
        TracingEvent(TracingEventType type, std::string comment);

        TracingEventType Type;
        std::string Comment;
    };

    void to_json(nlohmann::json &json, const TracingEvent &tracing_event);

    /*!
     * Improving solution found by the primary solver.
     */
    struct ProgressStep {
        ProgressStep(double objective,
                     std::size_t visited_events,
                     std::size_t candidate_events,
                     boost::posix_time::time_duration wall_time,
                     std::size_t branches,
                     std::size_t solutions);

        double Objective;
        std::size_t VisitedEvents;
        std::size_t CandidateEvents;
        boost::posix_time::time_duration WallTime;
        std::size_t Branches;
        std::size_t Solutions;
    };

    void to_json(nlohmann::json &json, const ProgressStep &progress_step);

    class Printer {
    public:
        virtual ~Printer() = default;

        virtual Printer &operator<<(const std::string &text);

        virtual Printer &operator<<(const TripDefinition &trip_definition) = 0;

        virtual Printer &operator<<(const TracingEvent &trace_event) = 0;

        virtual Printer &operator<<(const ProgressStep &progress_step) = 0;
    };

    class ConsolePrinter : public Printer {
    public:
        ~ConsolePrinter() override = default;

        Printer &operator<<(const TripDefinition &trip_definition) override;

        Printer &operator<<(const TracingEvent &trace_event) override;

        Printer &operator<<(const ProgressStep &progress_step) override;

    private:
        bool progress_header_printed_{false};
    };

    class JsonPrinter : public Printer {
    public:
        ~JsonPrinter() override = default;

        Printer &operator<<(const std::string &text) override;

        Printer &operator<<(const TripDefinition &trip_definition) override;

        Printer &operator<<(const TracingEvent &trace_event) override;

        Printer &operator<<(const ProgressStep &progress_step) override;
    };

    class LogPrinter : public Printer {
    public:
        ~LogPrinter() override = default;

        Printer &operator<<(const std::string &text) override;

        Printer &operator<<(const TripDefinition &trip_definition) override;

        Printer &operator<<(const TracingEvent &trace_event) override;

        Printer &operator<<(const ProgressStep &progress_step) override;
    };

    static const std::string JSON_FORMAT{"json"};
    static const std::string TEXT_FORMAT{"txt"};
    static const std::string LOG_FORMAT{"log"};

    /*!
     * @throws util::ApplicationError if the format is not known
     */
    std::shared_ptr<Printer> CreatePrinter(const std::string &format);

    bool ValidateConsoleFormat(const char *flagname, const std::string &value);
}


#endif //WALKPLAN_PRINTER_H
