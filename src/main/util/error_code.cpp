#include "error_code.h"

int util::to_exit_code(util::ErrorCode error_code) {
    switch (error_code) {
        case ErrorCode::OK:
            return 0;
        case ErrorCode::UNKNOWN:
        case ErrorCode::ERROR:
            return 1;
        case ErrorCode::INFEASIBLE_INPUT:
            return 2;
        case ErrorCode::PROVIDER_UNAVAILABLE:
        case ErrorCode::PROVIDER_RATE_LIMITED:
            return 3;
    }
    return 1;
}

std::string util::to_string(util::ErrorCode error_code) {
    switch (error_code) {
        case ErrorCode::UNKNOWN:
            return "unknown";
        case ErrorCode::OK:
            return "ok";
        case ErrorCode::ERROR:
            return "error";
        case ErrorCode::INFEASIBLE_INPUT:
            return "infeasible_input";
        case ErrorCode::PROVIDER_UNAVAILABLE:
            return "provider_unavailable";
        case ErrorCode::PROVIDER_RATE_LIMITED:
            return "provider_rate_limited";
    }
    return "unknown";
}
