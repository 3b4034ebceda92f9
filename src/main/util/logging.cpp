#include "logging.h"

#include <glog/logging.h>

namespace util {

    void SetupLogging(const char *program_name) {
        // stdout is reserved for the response and the console printer
        FLAGS_logtostderr = true;
        FLAGS_colorlogtostderr = true;
        FLAGS_minloglevel = google::GLOG_INFO;
        FLAGS_logbufsecs = 0;

        google::InitGoogleLogging(program_name);
        google::InstallFailureSignalHandler();
    }
}
