#ifndef WALKPLAN_PROVIDER_ERROR_H
#define WALKPLAN_PROVIDER_ERROR_H

#include <string>

#include "util/application_error.h"

namespace walkplan {

    /*!
     * Failure of a travel time provider. It is recovered inside a solve and never reaches the caller.
     */
    class ProviderError : public util::ApplicationError {
    public:
        ProviderError(std::string provider, std::string msg, std::string diagnostic_info, util::ErrorCode error_code);

        const std::string &provider() const;

        bool rate_limited() const;

        static ProviderError Unavailable(std::string provider, std::string msg);

        static ProviderError Unavailable(std::string provider, std::string msg, std::string diagnostic_info);

        static ProviderError RateLimited(std::string provider, std::string msg);

    private:
        std::string provider_;
    };
}


#endif //WALKPLAN_PROVIDER_ERROR_H
