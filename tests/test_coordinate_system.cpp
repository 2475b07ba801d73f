#include <gtest/gtest.h>
#include <eyemap/coordinate_system.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <cstring>

using namespace eyemap;

class CoordinateSystemTest : public ::testing::Test {
protected:
    CoordinateSystem coords{6.0, 1.1};
    const double s = 6.0 * 1.1;
    const double sqrt3 = std::sqrt(3.0);
};

TEST_F(CoordinateSystemTest, OriginMapsToOrigin) {
    PixelPoint p = coords.to_pixel(0, 0, false);
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 0.0);
}

TEST_F(CoordinateSystemTest, AxialTransform) {
    // (1,0): q = -1, r = 0
    PixelPoint a = coords.to_pixel(1, 0, false);
    EXPECT_NEAR(a.x, -1.5 * s, 1e-12);
    EXPECT_NEAR(a.y, -sqrt3 / 2.0 * s, 1e-12);

    // (0,1): q = 1, r = -1
    PixelPoint b = coords.to_pixel(0, 1, false);
    EXPECT_NEAR(b.x, 1.5 * s, 1e-12);
    EXPECT_NEAR(b.y, s * (sqrt3 / 2.0 - sqrt3), 1e-12);

    // (3,5): q = 2, r = -5
    PixelPoint c = coords.to_pixel(3, 5, false);
    EXPECT_NEAR(c.x, 3.0 * s, 1e-12);
    EXPECT_NEAR(c.y, s * (sqrt3 - 5.0 * sqrt3), 1e-12);
}

TEST_F(CoordinateSystemTest, MirroringNegatesHorizontalAxisOnly) {
    for (int h1 = -3; h1 <= 3; ++h1) {
        for (int h2 = -3; h2 <= 3; ++h2) {
            PixelPoint plain = coords.to_pixel(h1, h2, false);
            PixelPoint mirrored = coords.to_pixel(h1, h2, true);
            EXPECT_DOUBLE_EQ(mirrored.x, -plain.x);
            EXPECT_DOUBLE_EQ(mirrored.y, plain.y);
        }
    }
}

TEST_F(CoordinateSystemTest, MirrorIsDerivedFromHemisphere) {
    EXPECT_TRUE(CoordinateSystem::mirror_for(Hemisphere::Right));
    EXPECT_FALSE(CoordinateSystem::mirror_for(Hemisphere::Left));
}

TEST_F(CoordinateSystemTest, RepeatedCallsAreBitIdentical) {
    for (int i = 0; i < 100; ++i) {
        PixelPoint a = coords.to_pixel(17, -4, true);
        PixelPoint b = coords.to_pixel(17, -4, true);
        EXPECT_EQ(std::memcmp(&a.x, &b.x, sizeof(double)), 0);
        EXPECT_EQ(std::memcmp(&a.y, &b.y, sizeof(double)), 0);
    }
}

TEST_F(CoordinateSystemTest, HexagonPointsLieOnCircle) {
    auto points = coords.hexagon_points(10.0, 20.0);
    EXPECT_NEAR(points[0].x, 16.0, 1e-12);
    EXPECT_NEAR(points[0].y, 20.0, 1e-12);
    EXPECT_NEAR(points[3].x, 4.0, 1e-12);
    for (const auto& p : points) {
        EXPECT_NEAR(std::hypot(p.x - 10.0, p.y - 20.0), 6.0, 1e-9);
    }

    auto inner = coords.hexagon_points(0.0, 0.0, 2.0);
    for (const auto& p : inner) {
        EXPECT_NEAR(std::hypot(p.x, p.y), 2.0, 1e-9);
    }
}

TEST_F(CoordinateSystemTest, CoordinateRanges) {
    auto lattice = test_utils::make_lattice("ME", Hemisphere::Left, {{3, 7}, {-2, 9}, {5, -1}});
    auto ranges = coords.coordinate_ranges(lattice);
    ASSERT_TRUE(ranges.ok());
    EXPECT_EQ(ranges.value().min_hex1, -2);
    EXPECT_EQ(ranges.value().min_hex2, -1);
}

TEST_F(CoordinateSystemTest, CoordinateRangesOfEmptyLatticeFail) {
    auto ranges = coords.coordinate_ranges({});
    ASSERT_FALSE(ranges.ok());
    EXPECT_EQ(ranges.error().kind, ErrorKind::DataProcessing);
}
