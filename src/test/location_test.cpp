#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "util/logging.h"
#include "util/polyline.h"
#include "location.h"

TEST(TestLocation, CanDeserializeFromJson) {
    // given
    const auto location_json = nlohmann::json::parse("{ \"latitude\": \"55.862\", \"longitude\": \"-4.24539\" }");
    const walkplan::Location expected_location(55.862, -4.24539);
    const walkplan::Location::JsonLoader loader{};

    // when
    const auto actual_location = loader.Load(location_json);

    // then
    EXPECT_EQ(expected_location, actual_location);
}

TEST(TestLocation, CanDeserializeShortKeysFromJson) {
    // given
    const auto location_json = nlohmann::json::parse("{ \"lat\": 55.862, \"lng\": -4.24539 }");
    const walkplan::Location::JsonLoader loader{};

    // when
    const auto actual_location = loader.Load(location_json);

    // then
    EXPECT_EQ(walkplan::Location(55.862, -4.24539), actual_location);
}

TEST(TestLocation, FailsToDeserializeWithoutLongitude) {
    const auto location_json = nlohmann::json::parse("{ \"lat\": 55.862 }");
    const walkplan::Location::JsonLoader loader{};

    EXPECT_THROW(loader.Load(location_json), std::domain_error);
}

TEST(TestLocation, RoundingCollapsesNearbyPoints) {
    // given
    const walkplan::Location first{55.86201, -4.24539};
    const walkplan::Location second{55.86204, -4.24541};
    const walkplan::Location distant{55.86301, -4.24539};

    // then
    EXPECT_NE(first, second);
    EXPECT_EQ(first.Round(4), second.Round(4));
    EXPECT_NE(first.Round(4), distant.Round(4));
    EXPECT_NE(first.Round(5), second.Round(5));

    std::unordered_set<walkplan::Location> locations{first.Round(4), second.Round(4), distant.Round(4)};
    EXPECT_EQ(locations.size(), 2);
}

TEST(TestLocation, ValidatesRange) {
    EXPECT_TRUE(walkplan::Location(55.862, -4.24539).IsValid());
    EXPECT_TRUE(walkplan::Location(-90.0, 180.0).IsValid());
    EXPECT_FALSE(walkplan::Location(90.5, 0.0).IsValid());
    EXPECT_FALSE(walkplan::Location(0.0, -180.5).IsValid());
}

TEST(TestLocation, CanComputeGreatCircleDistance) {
    // given
    const walkplan::Location glasgow{55.8642, -4.2518};
    const walkplan::Location edinburgh{55.9533, -3.1883};

    // when
    const auto distance = walkplan::Location::GreatCircleDistance(glasgow, edinburgh);

    // then
    EXPECT_NEAR(distance, 67000.0, 1500.0);
    EXPECT_DOUBLE_EQ(walkplan::Location::GreatCircleDistance(glasgow, glasgow), 0.0);
    EXPECT_DOUBLE_EQ(distance, walkplan::Location::GreatCircleDistance(edinburgh, glasgow));
}

TEST(TestPolyline, CanEncodeReferencePath) {
    // given
    const std::vector<std::pair<double, double> > points{{38.5,   -120.2},
                                                         {40.7,   -120.95},
                                                         {43.252, -126.453}};

    // when
    const auto text = util::polyline::Encode(points);

    // then
    EXPECT_EQ(text, "_p~iF~ps|U_ulLnnqC_mqNvxq`@");
}

TEST(TestPolyline, CanDecodeReferencePath) {
    // when
    const auto points = util::polyline::Decode("_p~iF~ps|U_ulLnnqC_mqNvxq`@");

    // then
    ASSERT_EQ(points.size(), 3);
    EXPECT_NEAR(points[0].first, 38.5, 1e-6);
    EXPECT_NEAR(points[0].second, -120.2, 1e-6);
    EXPECT_NEAR(points[2].first, 43.252, 1e-6);
    EXPECT_NEAR(points[2].second, -126.453, 1e-6);
}

TEST(TestPolyline, FailsOnTruncatedInput) {
    EXPECT_THROW(util::polyline::Decode("_p~iF~ps|U_"), std::domain_error);
}

int main(int argc, char **argv) {
    util::SetupLogging(argv[0]);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
