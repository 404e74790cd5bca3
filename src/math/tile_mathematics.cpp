/**
 * @file tile_mathematics.cpp
 * @brief Web-Mercator tile addressing implementation
 */

#include <dem_query/math/tile_mathematics.h>
#include <dem_query/constants.h>
#include <dem_query/errors.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace dem_query {

namespace {

using constants::tiles::TILE_SIZE;
using constants::tiles::WORLD_SIZE;

double DegreesToRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

std::int32_t ToTileIndex(double pixel, const char* axis) {
    const double index = std::floor(pixel / TILE_SIZE);
    if (!std::isfinite(index) ||
        index < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
        index > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
        throw DomainError(std::string("Tile ") + axis + " index out of range");
    }
    return static_cast<std::int32_t>(index);
}

std::int32_t ToPixelOffset(double pixel, std::int32_t tile_index) {
    const double offset = std::floor(pixel - static_cast<double>(tile_index) * TILE_SIZE);
    // Rounding at a tile edge can land one pixel outside the raster
    return std::clamp(static_cast<std::int32_t>(offset), 0, TILE_SIZE - 1);
}

} // anonymous namespace

bool TileCoordinates::IsValid() const {
    if (!TileValidator::IsSupportedZoom(zoom)) return false;
    const std::int64_t max_coord = std::int64_t{1} << zoom;
    return x >= 0 && x < max_coord && y >= 0 && y < max_coord;
}

TileAddress TileMathematics::Project(double latitude, double longitude, std::int32_t zoom) {
    if (!(latitude > -90.0 && latitude < 90.0)) {
        throw DomainError("Latitude must be strictly between -90 and 90 degrees, got " +
                          std::to_string(latitude));
    }
    if (!std::isfinite(longitude)) {
        throw DomainError("Longitude must be finite");
    }
    if (!TileValidator::IsSupportedZoom(zoom)) {
        throw DomainError("Unsupported zoom level " + std::to_string(zoom));
    }

    const double radius = (WORLD_SIZE / 2.0) / M_PI;
    const double scale = std::ldexp(1.0, zoom);

    const double world_x = radius * (DegreesToRadians(longitude) + M_PI);
    const double pixel_x = world_x * scale;

    const double sin_lat = std::sin(DegreesToRadians(latitude));
    const double world_y = -radius / 2.0 * std::log((1.0 + sin_lat) / (1.0 - sin_lat)) +
                           WORLD_SIZE / 2.0;
    const double pixel_y = world_y * scale;

    TileAddress address;
    address.zoom = zoom;
    address.tile_x = ToTileIndex(pixel_x, "X");
    address.tile_y = ToTileIndex(pixel_y, "Y");
    address.pixel_x = ToPixelOffset(pixel_x, address.tile_x);
    address.pixel_y = ToPixelOffset(pixel_y, address.tile_y);
    return address;
}

bool TileValidator::IsSupportedZoom(std::int32_t zoom) {
    return zoom >= constants::tiles::MIN_ZOOM && zoom <= constants::tiles::MAX_ZOOM;
}

} // namespace dem_query
