#ifndef WALKPLAN_UTIL_ROUTING_H
#define WALKPLAN_UTIL_ROUTING_H

#include <cstddef>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_index_manager.h>

namespace util {

    /*!
     * Nodes visited by the vehicle between its start and end.
     */
    std::vector<std::size_t> GetRouteNodes(const operations_research::RoutingModel &model,
                                           const operations_research::RoutingIndexManager &index_manager,
                                           const operations_research::Assignment &assignment,
                                           int vehicle);

    // must be called from a search monitor while the solution is bound
    std::size_t GetActiveNodeCount(const operations_research::RoutingModel &model);

    boost::posix_time::time_duration WallTime(const operations_research::Solver *solver);
}


#endif //WALKPLAN_UTIL_ROUTING_H
