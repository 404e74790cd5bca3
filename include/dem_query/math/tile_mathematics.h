#pragma once

/**
 * @file tile_mathematics.h
 * @brief Web-Mercator tile addressing
 *
 * Converts geographic coordinates into tile indices and the pixel offset of
 * the query point inside its 256x256 tile raster.
 */

#include <cstdint>
#include <string>

namespace dem_query {

/**
 * @brief Tile coordinates (X, Y, Zoom)
 */
struct TileCoordinates {
    std::int32_t x;      ///< Tile X coordinate
    std::int32_t y;      ///< Tile Y coordinate
    std::int32_t zoom;   ///< Zoom level

    /**
     * @brief Default constructor
     */
    constexpr TileCoordinates() : x(0), y(0), zoom(0) {}

    /**
     * @brief Construct from coordinates and zoom
     *
     * @param tile_x Tile X coordinate
     * @param tile_y Tile Y coordinate
     * @param tile_zoom Zoom level
     */
    constexpr TileCoordinates(std::int32_t tile_x, std::int32_t tile_y, std::int32_t tile_zoom)
        : x(tile_x), y(tile_y), zoom(tile_zoom) {}

    /**
     * @brief Check if the tile lies inside the pyramid at its zoom level
     */
    bool IsValid() const;

    /**
     * @brief Get tile key as string
     *
     * @return std::string Tile key in format "zoom/x/y"
     */
    std::string GetKey() const {
        return std::to_string(zoom) + "/" + std::to_string(x) + "/" + std::to_string(y);
    }

    bool operator==(const TileCoordinates& other) const {
        return x == other.x && y == other.y && zoom == other.zoom;
    }
};

/**
 * @brief Tile address of a query point
 *
 * Tile indices plus the integer pixel offset of the point inside the tile.
 * The pixel offset is always within [0, TILE_SIZE).
 */
struct TileAddress {
    std::int32_t tile_x = 0;   ///< Tile X index
    std::int32_t tile_y = 0;   ///< Tile Y index
    std::int32_t pixel_x = 0;  ///< Column inside the tile raster
    std::int32_t pixel_y = 0;  ///< Row inside the tile raster
    std::int32_t zoom = 0;     ///< Zoom level the address was computed at

    /**
     * @brief Tile part of the address
     */
    TileCoordinates GetTile() const {
        return TileCoordinates(tile_x, tile_y, zoom);
    }

    bool operator==(const TileAddress& other) const {
        return tile_x == other.tile_x && tile_y == other.tile_y &&
               pixel_x == other.pixel_x && pixel_y == other.pixel_y &&
               zoom == other.zoom;
    }
};

/**
 * @brief Tile mathematics utilities
 */
class TileMathematics {
public:
    /**
     * @brief Project a geographic coordinate onto the tile pyramid
     *
     * Spherical web-Mercator with 256-pixel tiles. Longitude is not range
     * checked and wraps through the formula.
     *
     * @param latitude Latitude in degrees, strictly inside (-90, 90)
     * @param longitude Longitude in degrees
     * @param zoom Zoom level
     * @return TileAddress Tile indices and pixel offset
     * @throws DomainError at or beyond the poles, for non-finite input,
     *         unsupported zoom, or a tile index that does not fit 32 bits
     */
    static TileAddress Project(double latitude, double longitude, std::int32_t zoom);
};

/**
 * @brief Tile validation utilities
 */
class TileValidator {
public:
    static bool IsSupportedZoom(std::int32_t zoom);
};

} // namespace dem_query
