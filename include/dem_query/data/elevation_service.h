// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <dem_query/constants.h>
#include <dem_query/data/dem_source.h>
#include <dem_query/data/elevation_resolver.h>
#include <dem_query/data/tile_decoder.h>
#include <dem_query/data/tile_fetcher.h>
#include <dem_query/math/tile_mathematics.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dem_query {

/// Configuration for the elevation service
struct ElevationServiceConfig {
    /// DEM sources in priority order
    DEMCatalog catalog = DEMSources::DefaultCatalog();

    /// Zoom level of the tile address and pixel offset
    std::int32_t query_zoom = constants::tiles::QUERY_ZOOM;

    /// HTTP transport settings
    TileFetcherConfig fetcher;
};

/// Result of elevation query at a specific point
struct ElevationQuery {
    double latitude = 0.0;                   ///< Query latitude
    double longitude = 0.0;                  ///< Query longitude
    std::optional<double> elevation_meters;  ///< Elevation, empty for "no data"
    TileAddress address;                     ///< Tile address used for every attempt
    std::string source_title;                ///< Source that answered, empty if none
    std::int32_t source_zoom = 0;            ///< Zoom of the answering source
    std::uint32_t attempts = 0;              ///< HTTP requests issued
    ResolveState state = ResolveState::ATTEMPTING;

    /// True if a source reported an elevation
    [[nodiscard]] bool HasData() const noexcept { return elevation_meters.has_value(); }

    /// Elevation in meters, 0 for "no data"
    [[nodiscard]] double GetElevationOrZero() const noexcept {
        return elevation_meters.value_or(0.0);
    }
};

/// Elevation lookup against a tiled DEM service
/// Immutable after construction
class ElevationService {
public:
    /// Construct with injected transport and decoder
    /// @throws ConfigError if the configuration is invalid
    ElevationService(const ElevationServiceConfig& config,
                     std::unique_ptr<TileFetcher> fetcher,
                     std::unique_ptr<TileDecoder> decoder);

    /// Query the elevation at a point
    /// @param latitude Latitude in degrees, strictly inside (-90, 90)
    /// @param longitude Longitude in degrees
    /// @return Query result; elevation is empty when no source has data
    /// @throws DomainError, TransportError, ServiceError, DecodeError
    [[nodiscard]] ElevationQuery Query(double latitude, double longitude) const;

    /// Elevation in meters at a point, 0 when no data is available
    [[nodiscard]] double GetElevation(double latitude, double longitude) const;

    [[nodiscard]] const ElevationServiceConfig& GetConfiguration() const noexcept {
        return config_;
    }

    /// Create a service using libcurl and stb_image
    /// @throws ConfigError if the configuration is invalid
    [[nodiscard]] static std::unique_ptr<ElevationService> Create(
        const ElevationServiceConfig& config = ElevationServiceConfig{});

    /// Check a configuration
    /// @throws ConfigError describing the first problem found
    static void ValidateConfiguration(const ElevationServiceConfig& config);

private:
    ElevationServiceConfig config_;
    std::unique_ptr<TileFetcher> fetcher_;
    std::unique_ptr<TileDecoder> decoder_;
};

/// Elevation in meters at a point using the default GSI catalog
/// Returns 0 when no source has data
/// @throws DomainError, TransportError, ServiceError, DecodeError
[[nodiscard]] double GetElevation(double latitude, double longitude);

} // namespace dem_query
