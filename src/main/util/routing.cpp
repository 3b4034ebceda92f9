#include "routing.h"

namespace util {

    std::vector<std::size_t> GetRouteNodes(const operations_research::RoutingModel &model,
                                           const operations_research::RoutingIndexManager &index_manager,
                                           const operations_research::Assignment &assignment,
                                           int vehicle) {
        std::vector<std::size_t> nodes;
        for (auto index = assignment.Value(model.NextVar(model.Start(vehicle)));
             !model.IsEnd(index);
             index = assignment.Value(model.NextVar(index))) {
            nodes.push_back(static_cast<std::size_t>(index_manager.IndexToNode(index).value()));
        }
        return nodes;
    }

    std::size_t GetActiveNodeCount(const operations_research::RoutingModel &model) {
        std::size_t active_nodes = 0;
        for (int64 index = 0; index < model.Size(); ++index) {
            if (!model.IsStart(index) && model.NextVar(index)->Value() != index) {
                ++active_nodes;
            }
        }
        return active_nodes;
    }

    boost::posix_time::time_duration WallTime(const operations_research::Solver *solver) {
        return boost::posix_time::milliseconds(solver->wall_time());
    }
}
