// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>

namespace dem_query {

/// Color triple of one tile pixel
struct RGBPixel {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const RGBPixel& other) const noexcept {
        return r == other.r && g == other.g && b == other.b;
    }
};

/// Decoder for elevation packed as a 24-bit two's-complement integer in R, G, B
/// Values are centimeters; (128, 0, 0) is the sea / no-data marker
class ElevationEncoding {
public:
    /// Decode a pixel into meters
    /// @return Elevation in meters, or nullopt for the no-data marker
    [[nodiscard]] static std::optional<double> Decode(const RGBPixel& pixel) noexcept;

    /// Decode channel values into meters
    [[nodiscard]] static std::optional<double> Decode(std::uint8_t r, std::uint8_t g,
                                                      std::uint8_t b) noexcept {
        return Decode(RGBPixel{r, g, b});
    }

    /// Sign-extended 24-bit value of a pixel, in centimeters
    [[nodiscard]] static std::int32_t ToSignedValue(const RGBPixel& pixel) noexcept;

    /// Check for the no-data marker
    [[nodiscard]] static bool IsNoData(const RGBPixel& pixel) noexcept;
};

} // namespace dem_query
