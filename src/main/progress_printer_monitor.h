#ifndef WALKPLAN_PROGRESS_PRINTER_MONITOR_H
#define WALKPLAN_PROGRESS_PRINTER_MONITOR_H

#include <cstddef>
#include <cstdint>
#include <memory>

#include <ortools/constraint_solver/constraint_solver.h>
#include <ortools/constraint_solver/routing.h>

#include "printer.h"

namespace walkplan {

    /*!
     * Reports every improving solution found by the primary solver.
     */
    class ProgressPrinterMonitor : public operations_research::SearchMonitor {
    public:
        ProgressPrinterMonitor(const operations_research::RoutingModel &model,
                               std::size_t candidate_events,
                               std::int64_t cost_scale,
                               std::shared_ptr<Printer> printer);

        bool AtSolution() override;

    private:
        const operations_research::RoutingModel &model_;
        std::size_t candidate_events_;
        double cost_scale_;
        std::shared_ptr<Printer> printer_;
        int64 best_cost_;
    };
}


#endif //WALKPLAN_PROGRESS_PRINTER_MONITOR_H
