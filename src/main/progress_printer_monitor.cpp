#include "progress_printer_monitor.h"

#include <limits>
#include <utility>

#include <glog/logging.h>

#include "util/routing.h"

namespace walkplan {

    ProgressPrinterMonitor::ProgressPrinterMonitor(const operations_research::RoutingModel &model,
                                                   std::size_t candidate_events,
                                                   std::int64_t cost_scale,
                                                   std::shared_ptr<Printer> printer)
            : SearchMonitor(model.solver()),
              model_{model},
              candidate_events_{candidate_events},
              cost_scale_{static_cast<double>(cost_scale)},
              printer_{std::move(printer)},
              best_cost_{std::numeric_limits<int64>::max()} {
        CHECK(printer_);
        CHECK_GT(cost_scale_, 0.0);
    }

    bool ProgressPrinterMonitor::AtSolution() {
        const auto cost = model_.CostVar()->Value();
        if (cost < best_cost_) {
            best_cost_ = cost;
            *printer_ << ProgressStep(static_cast<double>(cost) / cost_scale_,
                                      util::GetActiveNodeCount(model_),
                                      candidate_events_,
                                      util::WallTime(solver()),
                                      static_cast<std::size_t>(solver()->branches()),
                                      static_cast<std::size_t>(solver()->solutions()));
        }

        return SearchMonitor::AtSolution();
    }
}
