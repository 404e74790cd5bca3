// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <dem_query/data/dem_source.h>
#include <dem_query/data/tile_decoder.h>
#include <dem_query/data/tile_fetcher.h>
#include <dem_query/math/tile_mathematics.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dem_query {

/// States of a single resolution
enum class ResolveState {
    ATTEMPTING,  ///< Requesting the next cascade entry
    DECODING,    ///< A tile was fetched, reading the addressed pixel
    RESOLVED,    ///< Pixel decoded (possibly to "no data")
    EXHAUSTED    ///< No cascade entry had a tile
};

/// Human readable state name
[[nodiscard]] const char* ToString(ResolveState state) noexcept;

/// Outcome of walking the cascade for one tile address
struct ResolveResult {
    std::optional<double> elevation_meters;  ///< Empty for "no data"
    ResolveState state = ResolveState::ATTEMPTING;
    std::string source_title;                ///< Entry that answered, empty if exhausted
    std::int32_t source_zoom = 0;            ///< Zoom of that entry
    std::uint32_t attempts = 0;              ///< HTTP requests issued
};

/// Walks the source cascade until a tile is found
///
/// Entries are requested in order. HTTP 404 moves on to the next entry; any
/// other error status, transport failure or undecodable body is fatal. The
/// first tile found ends the walk, even when its pixel carries no data.
class ElevationResolver {
public:
    /// @param fetcher Transport used for tile requests
    /// @param decoder Raster decoder for tile bodies
    ElevationResolver(TileFetcher& fetcher, const TileDecoder& decoder) noexcept
        : fetcher_(fetcher), decoder_(decoder) {}

    /// Resolve the elevation of the pixel at the given address
    /// The pixel offset of the address is used for every entry, whatever its zoom
    /// @param address Tile address of the query point
    /// @param cascade Entries in retry order
    /// @return Result with elevation, terminal state and answering source
    /// @throws TransportError, ServiceError, DecodeError
    [[nodiscard]] ResolveResult Resolve(const TileAddress& address,
                                        const std::vector<CascadeEntry>& cascade) const;

private:
    TileFetcher& fetcher_;
    const TileDecoder& decoder_;
};

} // namespace dem_query
