#include "deadline_search_limit.h"

walkplan::DeadlineSearchLimit::DeadlineSearchLimit(std::chrono::steady_clock::time_point deadline,
                                                   std::shared_ptr<const std::atomic<bool> > cancel_token,
                                                   operations_research::Solver *solver)
        : SearchLimit(solver),
          deadline_{deadline},
          cancel_token_{std::move(cancel_token)},
          expired_{false} {}

bool walkplan::DeadlineSearchLimit::Check() {
    // return true if solver should stop
    if (std::chrono::steady_clock::now() >= deadline_ || (cancel_token_ && *cancel_token_)) {
        expired_ = true;
    }
    return expired_;
}

void walkplan::DeadlineSearchLimit::Init() {
    expired_ = false;
}

void walkplan::DeadlineSearchLimit::Copy(const operations_research::SearchLimit *limit) {
    auto prototype_limit_ptr = reinterpret_cast<const DeadlineSearchLimit *>(limit);
    deadline_ = prototype_limit_ptr->deadline_;
    cancel_token_ = prototype_limit_ptr->cancel_token_;
    expired_ = prototype_limit_ptr->expired_;
}

operations_research::SearchLimit *walkplan::DeadlineSearchLimit::MakeClone() const {
    return solver()->RevAlloc(new DeadlineSearchLimit(deadline_, cancel_token_, solver()));
}

bool walkplan::DeadlineSearchLimit::expired() const {
    return expired_;
}
