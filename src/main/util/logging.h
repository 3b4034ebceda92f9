#ifndef WALKPLAN_LOGGING_H
#define WALKPLAN_LOGGING_H

namespace util {

    void SetupLogging(const char *program_name);
}


#endif //WALKPLAN_LOGGING_H
