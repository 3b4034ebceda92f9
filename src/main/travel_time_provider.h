#ifndef WALKPLAN_TRAVEL_TIME_PROVIDER_H
#define WALKPLAN_TRAVEL_TIME_PROVIDER_H

#include <cstdint>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "location.h"

namespace walkplan {

    struct TravelLeg {
        TravelLeg();

        TravelLeg(std::int64_t seconds, double meters, std::string polyline);

        bool operator==(const TravelLeg &other) const;

        std::int64_t Seconds;
        double Meters;

        // encoded with precision 5, may be empty if the provider does not compute the geometry
        std::string Polyline;
    };

    struct TravelMatrix {
        TravelMatrix();

        explicit TravelMatrix(std::size_t size);

        std::size_t size() const;

        std::vector<std::vector<std::int64_t> > Seconds;
        std::vector<std::vector<double> > Meters;
    };

    /*!
     * Time and distance needed to walk from one point to another at a given departure time.
     * Implementations are safe to call from multiple threads.
     */
    class TravelTimeProvider {
    public:
        virtual ~TravelTimeProvider() = default;

        /*!
         * Name of the provider used to partition the cache.
         */
        virtual std::string mode() const = 0;

        /*!
         * @throws ProviderError
         */
        virtual TravelLeg Duration(const Location &from,
                                   const Location &to,
                                   boost::posix_time::ptime depart_at) = 0;

        /*!
         * @throws ProviderError
         */
        virtual TravelMatrix Matrix(const std::vector<Location> &points, boost::posix_time::ptime depart_at);
    };

    /*!
     * Great circle distance divided by the walking speed.
     */
    class EstimateTravelTimeProvider : public TravelTimeProvider {
    public:
        explicit EstimateTravelTimeProvider(double walking_speed);

        std::string mode() const override;

        TravelLeg Duration(const Location &from, const Location &to, boost::posix_time::ptime depart_at) override;

        TravelMatrix Matrix(const std::vector<Location> &points, boost::posix_time::ptime depart_at) override;

        double walking_speed() const;

        std::int64_t Seconds(double meters) const;

    private:
        double walking_speed_;
    };
}


#endif //WALKPLAN_TRAVEL_TIME_PROVIDER_H
