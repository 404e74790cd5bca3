// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/elevation_encoding.h>
#include <dem_query/constants.h>

namespace dem_query {

using namespace constants::encoding;

std::int32_t ElevationEncoding::ToSignedValue(const RGBPixel& pixel) noexcept {
    const std::int32_t packed = pixel.r * POW2_16 + pixel.g * POW2_8 + pixel.b;
    return packed < POW2_23 ? packed : packed - POW2_24;
}

bool ElevationEncoding::IsNoData(const RGBPixel& pixel) noexcept {
    if (pixel.r == NO_DATA_R && pixel.g == NO_DATA_G && pixel.b == NO_DATA_B) {
        return true;
    }
    return ToSignedValue(pixel) == NO_DATA_VALUE;
}

std::optional<double> ElevationEncoding::Decode(const RGBPixel& pixel) noexcept {
    if (IsNoData(pixel)) {
        return std::nullopt;
    }
    return ToSignedValue(pixel) * RESOLUTION_METERS;
}

} // namespace dem_query
