#ifndef WALKPLAN_POLYLINE_H
#define WALKPLAN_POLYLINE_H

#include <string>
#include <utility>
#include <vector>

namespace util {

    namespace polyline {

        // encodes (latitude, longitude) pairs using the Google encoded polyline algorithm
        std::string Encode(const std::vector<std::pair<double, double> > &points, int precision = 5);

        std::vector<std::pair<double, double> > Decode(const std::string &text, int precision = 5);
    }
}


#endif //WALKPLAN_POLYLINE_H
