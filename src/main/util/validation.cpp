#include <exception>

#include <glog/logging.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/date_time.hpp>

#include "validation.h"

bool util::file::Exists(const char *flagname, const std::string &value) {
    boost::filesystem::path file_path(value);
    if (!boost::filesystem::exists(file_path)) {
        LOG(ERROR) << boost::format("Flag %1%: file '%2%' does not exist") % flagname % file_path;
        return false;
    }

    if (!boost::filesystem::is_regular_file(file_path)) {
        LOG(ERROR) << boost::format("Flag %1%: path '%2%' does not point to a file") % flagname % file_path;
        return false;
    }

    return true;
}

bool util::file::IsNullOrExists(const char *flagname, const std::string &value) {
    if (value.empty()) {
        return true;
    }

    return Exists(flagname, value);
}

static bool ParseDuration(const char *flagname,
                          const std::string &value,
                          boost::posix_time::time_duration &duration) {
    try {
        duration = boost::posix_time::duration_from_string(value);
    } catch (const std::exception &ex) {
        LOG(ERROR) << boost::format("Flag %1%: failed to parse duration '%2%' due to error: %3%")
                      % flagname
                      % value
                      % ex.what();
        return false;
    }

    if (duration.is_special()) {
        LOG(ERROR) << boost::format("Flag %1%: duration '%2%' is not a finite value") % flagname % value;
        return false;
    }

    return true;
}

bool util::time_duration::IsPositive(const char *flagname, const std::string &value) {
    boost::posix_time::time_duration duration;
    if (!ParseDuration(flagname, value, duration)) {
        return false;
    }

    if (duration.is_negative() || duration.total_milliseconds() <= 0) {
        LOG(ERROR) << boost::format("Flag %1%: duration %2% is not positive") % flagname % duration;
        return false;
    }

    return true;
}

bool util::time_duration::IsNullOrNonNegative(const char *flagname, const std::string &value) {
    if (value.empty()) {
        return true;
    }

    boost::posix_time::time_duration duration;
    if (!ParseDuration(flagname, value, duration)) {
        return false;
    }

    if (duration.is_negative()) {
        LOG(ERROR) << boost::format("Flag %1%: duration %2% is negative") % flagname % duration;
        return false;
    }

    return true;
}
