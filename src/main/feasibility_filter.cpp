#include "feasibility_filter.h"

#include <algorithm>

#include <boost/format.hpp>
#include <glog/logging.h>

namespace walkplan {

    FeasibilityFilter::FeasibilityFilter(EstimateTravelTimeProvider &estimate_provider)
            : estimate_provider_{estimate_provider} {}

    FeasibilityFilter::Result FeasibilityFilter::Apply(const TripRequest &request) const {
        Result result;

        for (const auto &event : request.events()) {
            if (event.booking_required() && !request.IsBooked(event)) {
                VLOG(2) << boost::format("Event %1% requires a booking") % event.id();
                result.Dropped.emplace_back(event.id(), DropReason::BookingConflict);
                continue;
            }

            const auto travel = estimate_provider_.Duration(request.start_location(),
                                                            event.location(),
                                                            request.start_time());
            const auto earliest_arrival = request.start_time() + boost::posix_time::seconds(travel.Seconds);
            if (earliest_arrival > event.window_end()
                || event.window_begin() + event.dwell_min() > request.end_time()) {
                VLOG(2) << boost::format("Event %1% cannot be reached within its window [%2%, %3%]."
                                         " The earliest arrival is %4%")
                           % event.id()
                           % event.window_begin()
                           % event.window_end()
                           % earliest_arrival;
                result.Dropped.emplace_back(event.id(), DropReason::WindowConflict);
                continue;
            }

            if (std::max(earliest_arrival, event.window_begin()) + event.dwell_min() > request.end_time()) {
                VLOG(2) << boost::format("Event %1% cannot end before the end of the trip %2%")
                           % event.id()
                           % request.end_time();
                result.Dropped.emplace_back(event.id(), DropReason::TimeBudgetExceeded);
                continue;
            }

            result.Accepted.push_back(event);
        }

        VLOG(1) << boost::format("Pre-filter accepted %1% out of %2% events")
                   % result.Accepted.size()
                   % request.events().size();
        return result;
    }
}
