// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <dem_query/data/elevation_encoding.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace dem_query {

/// Decoded tile raster, 3 bytes per pixel, rows top to bottom
class TileImage {
public:
    TileImage() = default;

    /// @param width Raster width in pixels
    /// @param height Raster height in pixels
    /// @param pixels RGB bytes, size must be width * height * 3
    /// @throws DecodeError if the buffer size does not match the dimensions
    TileImage(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> pixels);

    /// Raster filled with a single color
    [[nodiscard]] static TileImage Filled(std::uint32_t width, std::uint32_t height,
                                          const RGBPixel& color);

    /// Read one pixel
    /// @throws DecodeError if (x, y) is outside the raster
    [[nodiscard]] RGBPixel GetPixel(std::int32_t x, std::int32_t y) const;

    /// Overwrite one pixel
    /// @throws DecodeError if (x, y) is outside the raster
    void SetPixel(std::int32_t x, std::int32_t y, const RGBPixel& color);

    [[nodiscard]] std::uint32_t GetWidth() const noexcept { return width_; }
    [[nodiscard]] std::uint32_t GetHeight() const noexcept { return height_; }
    [[nodiscard]] bool IsEmpty() const noexcept { return pixels_.empty(); }

    static constexpr std::uint32_t CHANNELS = 3;

private:
    [[nodiscard]] std::size_t PixelOffset(std::int32_t x, std::int32_t y) const;

    std::uint32_t width_ = 0;
    std::uint32_t height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

/// Raster decoder for tile bodies
class TileDecoder {
public:
    virtual ~TileDecoder() = default;

    /// Decode an encoded image (PNG) into an RGB raster; alpha is dropped
    /// @param data Encoded image bytes
    /// @return Decoded raster
    /// @throws DecodeError if the bytes cannot be decoded
    [[nodiscard]] virtual TileImage Decode(const std::vector<std::uint8_t>& data) const = 0;

    /// Create the stb_image decoder
    [[nodiscard]] static std::unique_ptr<TileDecoder> Create();
};

} // namespace dem_query
