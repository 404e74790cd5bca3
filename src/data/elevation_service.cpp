// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/elevation_service.h>
#include <dem_query/errors.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace dem_query {

ElevationService::ElevationService(const ElevationServiceConfig& config,
                                   std::unique_ptr<TileFetcher> fetcher,
                                   std::unique_ptr<TileDecoder> decoder)
    : config_(config), fetcher_(std::move(fetcher)), decoder_(std::move(decoder)) {
    ValidateConfiguration(config_);
    if (!fetcher_) {
        throw ConfigError("Tile fetcher is required");
    }
    if (!decoder_) {
        throw ConfigError("Tile decoder is required");
    }
}

void ElevationService::ValidateConfiguration(const ElevationServiceConfig& config) {
    if (config.catalog.empty()) {
        throw ConfigError("DEM catalog is empty");
    }
    for (const auto& source : config.catalog) {
        if (source.title.empty()) {
            throw ConfigError("DEM source with empty title");
        }
        if (source.url_template.empty()) {
            throw ConfigError("DEM source " + source.title + " has no URL template");
        }
        if (!TileValidator::IsSupportedZoom(source.min_zoom) ||
            !TileValidator::IsSupportedZoom(source.max_zoom)) {
            throw ConfigError("DEM source " + source.title + " has an unsupported zoom range");
        }
    }
    if (!TileValidator::IsSupportedZoom(config.query_zoom)) {
        throw ConfigError("Unsupported query zoom " + std::to_string(config.query_zoom));
    }
    if (config.fetcher.timeout_seconds == 0) {
        throw ConfigError("Request timeout must be positive");
    }
}

ElevationQuery ElevationService::Query(double latitude, double longitude) const {
    ElevationQuery query;
    query.latitude = latitude;
    query.longitude = longitude;

    query.address = TileMathematics::Project(latitude, longitude, config_.query_zoom);
    spdlog::debug("Tile address for ({}, {}): tile {} pixel ({}, {})",
                  latitude, longitude, query.address.GetTile().GetKey(),
                  query.address.pixel_x, query.address.pixel_y);
    if (!query.address.GetTile().IsValid()) {
        spdlog::warn("Tile {} lies outside the tile pyramid, no source will have it",
                     query.address.GetTile().GetKey());
    }

    const std::vector<CascadeEntry> cascade = BuildCascade(config_.catalog);

    const ElevationResolver resolver(*fetcher_, *decoder_);
    const ResolveResult resolved = resolver.Resolve(query.address, cascade);

    query.elevation_meters = resolved.elevation_meters;
    query.source_title = resolved.source_title;
    query.source_zoom = resolved.source_zoom;
    query.attempts = resolved.attempts;
    query.state = resolved.state;

    return query;
}

double ElevationService::GetElevation(double latitude, double longitude) const {
    return Query(latitude, longitude).GetElevationOrZero();
}

std::unique_ptr<ElevationService> ElevationService::Create(const ElevationServiceConfig& config) {
    return std::make_unique<ElevationService>(config, TileFetcher::Create(config.fetcher),
                                              TileDecoder::Create());
}

double GetElevation(double latitude, double longitude) {
    static const std::unique_ptr<ElevationService> service = ElevationService::Create();
    return service->GetElevation(latitude, longitude);
}

} // namespace dem_query
