#include "provider_error.h"

namespace walkplan {

    ProviderError::ProviderError(std::string provider,
                                 std::string msg,
                                 std::string diagnostic_info,
                                 util::ErrorCode error_code)
            : ApplicationError(std::move(msg), std::move(diagnostic_info), error_code),
              provider_(std::move(provider)) {}

    const std::string &ProviderError::provider() const {
        return provider_;
    }

    bool ProviderError::rate_limited() const {
        return error_code() == util::ErrorCode::PROVIDER_RATE_LIMITED;
    }

    ProviderError ProviderError::Unavailable(std::string provider, std::string msg) {
        return Unavailable(std::move(provider), std::move(msg), "");
    }

    ProviderError ProviderError::Unavailable(std::string provider, std::string msg, std::string diagnostic_info) {
        return {std::move(provider), std::move(msg), std::move(diagnostic_info), util::ErrorCode::PROVIDER_UNAVAILABLE};
    }

    ProviderError ProviderError::RateLimited(std::string provider, std::string msg) {
        return {std::move(provider), std::move(msg), "", util::ErrorCode::PROVIDER_RATE_LIMITED};
    }
}
