#ifndef WALKPLAN_VALIDATION_H
#define WALKPLAN_VALIDATION_H

#include <string>

#include <boost/format.hpp>
#include <glog/logging.h>

namespace util {

    namespace file {

        bool Exists(const char *flagname, const std::string &value);

        bool IsNullOrExists(const char *flagname, const std::string &value);
    }

    namespace numeric {

        template<typename Number>
        bool IsPositive(const char *flagname, Number value);

        template<typename Number>
        bool IsNonNegative(const char *flagname, Number value);
    }

    namespace time_duration {

        bool IsPositive(const char *flagname, const std::string &value);

        // zero is accepted, an empty value means the default
        bool IsNullOrNonNegative(const char *flagname, const std::string &value);
    }
}

namespace util::numeric {

    template<typename Number>
    bool IsPositive(const char *flagname, Number value) {
        if (value > 0) {
            return true;
        }

        LOG(ERROR) << boost::format("Flag %1%: number %2% is not positive") % flagname % value;
        return false;
    }

    template<typename Number>
    bool IsNonNegative(const char *flagname, Number value) {
        if (value >= 0) {
            return true;
        }

        LOG(ERROR) << boost::format("Flag %1%: number %2% is negative") % flagname % value;
        return false;
    }
}

#endif //WALKPLAN_VALIDATION_H
