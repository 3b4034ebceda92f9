#ifndef WALKPLAN_APPLICATION_ERROR_H
#define WALKPLAN_APPLICATION_ERROR_H

#include <string>
#include <exception>

#include "error_code.h"

namespace util {

    class ApplicationError : public std::exception {
    public:
        ApplicationError(std::string msg, std::string diagnostic_info, ErrorCode error_code);

        ApplicationError(std::string msg, ErrorCode error_code);

        const char *what() const noexcept override;

        inline std::string msg() const { return msg_; }

        inline std::string diagnostic_info() const { return diagnostic_info_; }

        inline ErrorCode error_code() const { return error_code_; }

    private:
        std::string msg_;
        std::string diagnostic_info_;
        ErrorCode error_code_;
    };
}


#endif //WALKPLAN_APPLICATION_ERROR_H
