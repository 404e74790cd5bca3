// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/tile_decoder.h>
#include <dem_query/errors.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <spdlog/spdlog.h>

#include <limits>
#include <string>
#include <utility>

namespace dem_query {

TileImage::TileImage(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    const std::size_t expected = static_cast<std::size_t>(width) * height * CHANNELS;
    if (pixels_.size() != expected) {
        throw DecodeError("Raster size mismatch: expected " + std::to_string(expected) +
                          " bytes, got " + std::to_string(pixels_.size()));
    }
}

TileImage TileImage::Filled(std::uint32_t width, std::uint32_t height, const RGBPixel& color) {
    std::vector<std::uint8_t> pixels;
    pixels.reserve(static_cast<std::size_t>(width) * height * CHANNELS);
    for (std::size_t i = 0; i < static_cast<std::size_t>(width) * height; ++i) {
        pixels.push_back(color.r);
        pixels.push_back(color.g);
        pixels.push_back(color.b);
    }
    return TileImage(width, height, std::move(pixels));
}

RGBPixel TileImage::GetPixel(std::int32_t x, std::int32_t y) const {
    const std::size_t offset = PixelOffset(x, y);
    return RGBPixel{pixels_[offset], pixels_[offset + 1], pixels_[offset + 2]};
}

void TileImage::SetPixel(std::int32_t x, std::int32_t y, const RGBPixel& color) {
    const std::size_t offset = PixelOffset(x, y);
    pixels_[offset] = color.r;
    pixels_[offset + 1] = color.g;
    pixels_[offset + 2] = color.b;
}

std::size_t TileImage::PixelOffset(std::int32_t x, std::int32_t y) const {
    if (x < 0 || y < 0 ||
        static_cast<std::uint32_t>(x) >= width_ || static_cast<std::uint32_t>(y) >= height_) {
        throw DecodeError("Pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                          ") outside " + std::to_string(width_) + "x" +
                          std::to_string(height_) + " raster");
    }
    return (static_cast<std::size_t>(y) * width_ + static_cast<std::size_t>(x)) * CHANNELS;
}

namespace {

/// stb_image decoder
class StbTileDecoder : public TileDecoder {
public:
    TileImage Decode(const std::vector<std::uint8_t>& data) const override {
        if (data.empty()) {
            throw DecodeError("Cannot decode tile: no data");
        }
        if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw DecodeError("Cannot decode tile: body too large");
        }

        int width = 0;
        int height = 0;
        int channels = 0;

        // Force RGB; a palette or RGBA PNG decodes to the same triples
        constexpr int kDesiredChannels = static_cast<int>(TileImage::CHANNELS);
        unsigned char* decoded_data = stbi_load_from_memory(
            data.data(),
            static_cast<int>(data.size()),
            &width,
            &height,
            &channels,
            kDesiredChannels
        );

        if (!decoded_data) {
            const char* error = stbi_failure_reason();
            spdlog::warn("stb_image decode failed: {}", error ? error : "unknown error");
            throw DecodeError(std::string("Cannot decode tile: ") +
                              (error ? error : "unknown error"));
        }

        const std::size_t decoded_size =
            static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kDesiredChannels;
        std::vector<std::uint8_t> pixels(decoded_data, decoded_data + decoded_size);
        stbi_image_free(decoded_data);

        spdlog::trace("Decoded tile: {}x{}, {} source channels", width, height, channels);

        return TileImage(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height),
                         std::move(pixels));
    }
};

} // anonymous namespace

std::unique_ptr<TileDecoder> TileDecoder::Create() {
    return std::make_unique<StbTileDecoder>();
}

} // namespace dem_query
