// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/tile_decoder.h>
#include <dem_query/errors.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace dem_query {
namespace {

/// Binary PNM image (P6 color or P5 gray) with 8-bit samples
std::vector<std::uint8_t> CreatePNM(char kind, std::uint32_t width, std::uint32_t height,
                                    const std::vector<std::uint8_t>& samples) {
    const std::string header = std::string("P") + kind + "\n" + std::to_string(width) + " " +
                               std::to_string(height) + "\n255\n";
    std::vector<std::uint8_t> data(header.begin(), header.end());
    data.insert(data.end(), samples.begin(), samples.end());
    return data;
}

/// Test fixture for the stb_image tile decoder
class TileDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        decoder_ = TileDecoder::Create();
        ASSERT_NE(decoder_, nullptr);
    }

    std::unique_ptr<TileDecoder> decoder_;
};

TEST_F(TileDecoderTest, DecodeColorImage) {
    // 2x2: sea marker, 1 m, -1 m, 3776.24 m
    const auto data = CreatePNM('6', 2, 2, {
        128, 0, 0,    0, 0, 100,
        255, 255, 156,    0x05, 0xC3, 0x18
    });

    const TileImage image = decoder_->Decode(data);
    EXPECT_EQ(image.GetWidth(), 2u);
    EXPECT_EQ(image.GetHeight(), 2u);

    EXPECT_EQ(image.GetPixel(0, 0), (RGBPixel{128, 0, 0}));
    EXPECT_EQ(image.GetPixel(1, 0), (RGBPixel{0, 0, 100}));
    EXPECT_EQ(image.GetPixel(0, 1), (RGBPixel{255, 255, 156}));
    EXPECT_EQ(image.GetPixel(1, 1), (RGBPixel{0x05, 0xC3, 0x18}));
}

TEST_F(TileDecoderTest, GrayImageExpandsToRGB) {
    const auto data = CreatePNM('5', 1, 1, {42});

    const TileImage image = decoder_->Decode(data);
    EXPECT_EQ(image.GetPixel(0, 0), (RGBPixel{42, 42, 42}));
}

TEST_F(TileDecoderTest, EmptyBodyThrows) {
    EXPECT_THROW(decoder_->Decode({}), DecodeError);
}

TEST_F(TileDecoderTest, GarbageBodyThrows) {
    const std::string html = "<html><body>Not Found</body></html>";
    const std::vector<std::uint8_t> data(html.begin(), html.end());
    EXPECT_THROW(decoder_->Decode(data), DecodeError);
}

TEST(TileImageTest, FilledImage) {
    const TileImage image = TileImage::Filled(256, 256, RGBPixel{1, 2, 3});
    EXPECT_EQ(image.GetWidth(), 256u);
    EXPECT_EQ(image.GetHeight(), 256u);
    EXPECT_FALSE(image.IsEmpty());
    EXPECT_EQ(image.GetPixel(0, 0), (RGBPixel{1, 2, 3}));
    EXPECT_EQ(image.GetPixel(255, 255), (RGBPixel{1, 2, 3}));
}

TEST(TileImageTest, SetPixelOnlyChangesTarget) {
    TileImage image = TileImage::Filled(4, 4, RGBPixel{0, 0, 0});
    image.SetPixel(2, 1, RGBPixel{9, 8, 7});

    EXPECT_EQ(image.GetPixel(2, 1), (RGBPixel{9, 8, 7}));
    EXPECT_EQ(image.GetPixel(1, 2), (RGBPixel{0, 0, 0}));
}

TEST(TileImageTest, OutOfBoundsPixelThrows) {
    const TileImage image = TileImage::Filled(16, 16, RGBPixel{});
    EXPECT_THROW(image.GetPixel(16, 0), DecodeError);
    EXPECT_THROW(image.GetPixel(0, 16), DecodeError);
    EXPECT_THROW(image.GetPixel(-1, 0), DecodeError);
}

TEST(TileImageTest, SizeMismatchThrows) {
    EXPECT_THROW(TileImage(2, 2, std::vector<std::uint8_t>(11)), DecodeError);
}

TEST(TileImageTest, DefaultImageIsEmpty) {
    const TileImage image;
    EXPECT_TRUE(image.IsEmpty());
    EXPECT_THROW(image.GetPixel(0, 0), DecodeError);
}

} // anonymous namespace
} // namespace dem_query
