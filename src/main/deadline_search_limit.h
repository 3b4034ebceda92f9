#ifndef WALKPLAN_DEADLINE_SEARCH_LIMIT_H
#define WALKPLAN_DEADLINE_SEARCH_LIMIT_H

#include <atomic>
#include <chrono>
#include <memory>

#include <ortools/constraint_solver/constraint_solver.h>

namespace walkplan {

    /*!
     * Abandons the search once the wall clock passes the deadline or the solve is cancelled.
     */
    class DeadlineSearchLimit : public operations_research::SearchLimit {
    public:
        DeadlineSearchLimit(std::chrono::steady_clock::time_point deadline,
                            std::shared_ptr<const std::atomic<bool> > cancel_token,
                            operations_research::Solver *solver);

        bool Check() override;

        void Init() override;

        void Copy(const SearchLimit *limit) override;

        operations_research::SearchLimit *MakeClone() const override;

        bool expired() const;

    private:
        std::chrono::steady_clock::time_point deadline_;
        std::shared_ptr<const std::atomic<bool> > cancel_token_;
        bool expired_;
    };
}


#endif //WALKPLAN_DEADLINE_SEARCH_LIMIT_H
