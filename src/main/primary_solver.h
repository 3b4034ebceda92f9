#ifndef WALKPLAN_PRIMARY_SOLVER_H
#define WALKPLAN_PRIMARY_SOLVER_H

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>

#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_index_manager.h>

#include "printer.h"
#include "problem_instance.h"
#include "schedule.h"

namespace walkplan {

    /*!
     * Time windowed routing of a single walker where every event is an optional visit.
     *
     * The search runs until its wall clock deadline, which depends on the number of events.
     * An empty result means that no sound schedule was found before the deadline,
     * in which case the caller should fall back to the heuristic.
     */
    class PrimarySolver {
    public:
        static const std::string TIME_DIMENSION;

        struct Config {
            Config();

            boost::posix_time::time_duration SmallProblemTimeLimit;
            boost::posix_time::time_duration MediumProblemTimeLimit;
            boost::posix_time::time_duration LargeProblemTimeLimit;
            std::size_t SmallProblemSize;
            std::size_t MediumProblemSize;

            // overrides the limits above
            boost::optional<boost::posix_time::time_duration> TimeLimit;

            // seconds an arrival may exceed the end of the window, penalised with the late weight
            int64 MaxLateness;

            int64 CostScale;
            int64 MinSkipPenalty;
        };

        PrimarySolver();

        PrimarySolver(Config config,
                      std::shared_ptr<Printer> printer,
                      std::shared_ptr<const std::atomic<bool> > cancel_token);

        boost::optional<Schedule> Solve(const ProblemInstance &instance) const;

        boost::posix_time::time_duration TimeLimit(std::size_t event_count) const;

        int64 SkipPenalty(const ProblemInstance &instance) const;

        const Config &config() const;

    private:
        void AddTravelTime(operations_research::RoutingModel &model,
                           const operations_research::RoutingIndexManager &index_manager,
                           const ProblemInstance &instance) const;

        void AddEventsHandling(operations_research::RoutingModel &model,
                               const operations_research::RoutingIndexManager &index_manager,
                               const ProblemInstance &instance) const;

        boost::optional<Schedule> ExtractSchedule(const operations_research::RoutingModel &model,
                                                  const operations_research::RoutingIndexManager &index_manager,
                                                  const operations_research::Assignment &assignment,
                                                  const ProblemInstance &instance) const;

        Config config_;
        std::shared_ptr<Printer> printer_;
        std::shared_ptr<const std::atomic<bool> > cancel_token_;
    };
}


#endif //WALKPLAN_PRIMARY_SOLVER_H
