// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <dem_query/math/tile_mathematics.h>

#include <cstdint>
#include <string>
#include <vector>

namespace dem_query {

/// A DEM tile layer published by a tile server
/// Catalog order is the priority order: earlier sources are tried first
struct DEMSource {
    std::string title;            ///< Identifier, e.g. "DEM5A"
    std::string url_template;     ///< URL with {x}, {y} and {z} placeholders
    std::int32_t min_zoom = 0;    ///< Coarsest zoom level served
    std::int32_t max_zoom = 0;    ///< Finest zoom level served
    bool fixed = false;           ///< True for preferred high-resolution sources
};

/// Ordered list of DEM sources
using DEMCatalog = std::vector<DEMSource>;

/// One (source, zoom) attempt of the cascade
struct CascadeEntry {
    std::string title;
    std::int32_t zoom = 0;
    std::string url_template;
    bool fixed = false;

    bool operator==(const CascadeEntry& other) const noexcept {
        return title == other.title && zoom == other.zoom &&
               url_template == other.url_template && fixed == other.fixed;
    }
};

/// Expand a catalog into the flat, priority-ordered list of attempts
/// Sources keep catalog order; each source contributes its zooms from finest
/// to coarsest. Inverted zoom bounds are swapped.
/// @param catalog Sources in priority order
/// @return Cascade entries in retry order
[[nodiscard]] std::vector<CascadeEntry> BuildCascade(const DEMCatalog& catalog);

/// Substitute {x}, {y} and {z} in the entry's URL template
/// {x} and {y} come from the tile address, {z} from the entry zoom
[[nodiscard]] std::string BuildTileURL(const CascadeEntry& entry, const TileAddress& address);

/// Predefined DEM sources of the GSI (Geospatial Information Authority of Japan)
namespace DEMSources {

extern const DEMSource DEM5A;
extern const DEMSource DEM5B;
extern const DEMSource DEM5C;
extern const DEMSource DEM10B;

/// GSI 5 m laser/photogrammetry layers first, 10 m layer as fallback
[[nodiscard]] DEMCatalog DefaultCatalog();

} // namespace DEMSources

} // namespace dem_query
