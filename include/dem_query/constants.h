#pragma once

/**
 * @file constants.h
 * @brief Central repository for dem_query constants
 *
 * Tile geometry and the RGB elevation encoding used by the DEM tile service.
 */

#include <cstdint>

namespace dem_query {
namespace constants {

//==============================================================================
// Tile Geometry
//==============================================================================

/**
 * @namespace tiles
 * @brief Web-Mercator tile pyramid parameters
 */
namespace tiles {
    /// Width and height of a tile raster in pixels
    constexpr std::int32_t TILE_SIZE = 256;

    /// Zoom level at which the tile address and pixel offset are computed
    constexpr std::int32_t QUERY_ZOOM = 15;

    /// Supported zoom range for tile addressing
    constexpr std::int32_t MIN_ZOOM = 0;
    constexpr std::int32_t MAX_ZOOM = 30;

    /// Width of the world at zoom 0 in pixels
    constexpr double WORLD_SIZE = 256.0;
} // namespace tiles

//==============================================================================
// Elevation Encoding
//==============================================================================

/**
 * @namespace encoding
 * @brief 24-bit signed elevation packed big-endian into R, G, B
 *
 * h = R * 2^16 + G * 2^8 + B, sign-extended from 24 bits, in units of 0.01 m.
 * The pixel (128, 0, 0), which is also the value -2^23, marks "no data".
 */
namespace encoding {
    constexpr std::int32_t POW2_8 = 1 << 8;
    constexpr std::int32_t POW2_16 = 1 << 16;
    constexpr std::int32_t POW2_23 = 1 << 23;
    constexpr std::int32_t POW2_24 = 1 << 24;

    /// Meters per encoded unit
    constexpr double RESOLUTION_METERS = 0.01;

    /// Sea / no-data marker pixel
    constexpr std::uint8_t NO_DATA_R = 128;
    constexpr std::uint8_t NO_DATA_G = 0;
    constexpr std::uint8_t NO_DATA_B = 0;

    /// Most negative 24-bit value, reserved for "no data"
    constexpr std::int32_t NO_DATA_VALUE = -POW2_23;
} // namespace encoding

//==============================================================================
// HTTP
//==============================================================================

namespace http {
    constexpr std::uint32_t STATUS_NOT_FOUND = 404;

    /// First status code treated as an error response
    constexpr std::uint32_t FIRST_ERROR_STATUS = 400;

    constexpr long MAX_REDIRECTS = 5;
} // namespace http

} // namespace constants
} // namespace dem_query
