// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/elevation_encoding.h>

#include <gtest/gtest.h>

namespace dem_query {
namespace {

TEST(ElevationEncodingTest, SeaMarkerIsNoData) {
    EXPECT_TRUE(ElevationEncoding::IsNoData(RGBPixel{128, 0, 0}));
    EXPECT_FALSE(ElevationEncoding::Decode(128, 0, 0).has_value());
}

TEST(ElevationEncodingTest, PositiveValue) {
    const auto elevation = ElevationEncoding::Decode(0, 0, 100);
    ASSERT_TRUE(elevation.has_value());
    EXPECT_DOUBLE_EQ(elevation.value(), 1.0);
}

TEST(ElevationEncodingTest, NegativeValueIsSignExtended) {
    // d = 2^24 - 100
    EXPECT_EQ(ElevationEncoding::ToSignedValue(RGBPixel{255, 255, 156}), -100);

    const auto elevation = ElevationEncoding::Decode(255, 255, 156);
    ASSERT_TRUE(elevation.has_value());
    EXPECT_DOUBLE_EQ(elevation.value(), -1.0);
}

TEST(ElevationEncodingTest, MostNegativeValueIsNoData) {
    // d = 2^23 is the same pixel as the sea marker
    EXPECT_EQ(ElevationEncoding::ToSignedValue(RGBPixel{128, 0, 0}), -(1 << 23));
    EXPECT_FALSE(ElevationEncoding::Decode(RGBPixel{128, 0, 0}).has_value());
}

TEST(ElevationEncodingTest, ZeroIsSeaLevelNotNoData) {
    const auto elevation = ElevationEncoding::Decode(0, 0, 0);
    ASSERT_TRUE(elevation.has_value());
    EXPECT_DOUBLE_EQ(elevation.value(), 0.0);
}

TEST(ElevationEncodingTest, ChannelWeights) {
    // 1 * 65536 + 2 * 256 + 3 = 66051 cm
    const auto elevation = ElevationEncoding::Decode(1, 2, 3);
    ASSERT_TRUE(elevation.has_value());
    EXPECT_NEAR(elevation.value(), 660.51, 1e-9);
}

TEST(ElevationEncodingTest, RangeLimits) {
    const auto highest = ElevationEncoding::Decode(127, 255, 255);
    ASSERT_TRUE(highest.has_value());
    EXPECT_NEAR(highest.value(), 83886.07, 1e-6);

    const auto lowest = ElevationEncoding::Decode(128, 0, 1);
    ASSERT_TRUE(lowest.has_value());
    EXPECT_NEAR(lowest.value(), -83886.07, 1e-6);

    const auto minus_one_cm = ElevationEncoding::Decode(255, 255, 255);
    ASSERT_TRUE(minus_one_cm.has_value());
    EXPECT_NEAR(minus_one_cm.value(), -0.01, 1e-12);
}

TEST(ElevationEncodingTest, MountFujiSummit) {
    // 3776.24 m = 377624 cm = 0x05C318
    const auto elevation = ElevationEncoding::Decode(0x05, 0xC3, 0x18);
    ASSERT_TRUE(elevation.has_value());
    EXPECT_NEAR(elevation.value(), 3776.24, 1e-6);
}

} // anonymous namespace
} // namespace dem_query
