#ifndef WALKPLAN_ERROR_CODE_H
#define WALKPLAN_ERROR_CODE_H

#include <string>

namespace util {

    enum class ErrorCode {
        UNKNOWN,
        OK,
        ERROR,
        INFEASIBLE_INPUT,
        PROVIDER_UNAVAILABLE,
        PROVIDER_RATE_LIMITED
    };

    int to_exit_code(ErrorCode error_code);

    std::string to_string(ErrorCode error_code);
}


#endif //WALKPLAN_ERROR_CODE_H
