// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/elevation_resolver.h>
#include <dem_query/data/elevation_encoding.h>
#include <dem_query/errors.h>

#include <spdlog/spdlog.h>

namespace dem_query {

const char* ToString(ResolveState state) noexcept {
    switch (state) {
        case ResolveState::ATTEMPTING:
            return "ATTEMPTING";
        case ResolveState::DECODING:
            return "DECODING";
        case ResolveState::RESOLVED:
            return "RESOLVED";
        case ResolveState::EXHAUSTED:
            return "EXHAUSTED";
        default:
            return "UNKNOWN";
    }
}

ResolveResult ElevationResolver::Resolve(const TileAddress& address,
                                         const std::vector<CascadeEntry>& cascade) const {
    ResolveResult result;
    result.state = ResolveState::ATTEMPTING;

    auto next_entry = cascade.begin();
    const CascadeEntry* current = nullptr;
    HttpResponse response;

    while (result.state != ResolveState::RESOLVED && result.state != ResolveState::EXHAUSTED) {
        switch (result.state) {
            case ResolveState::ATTEMPTING: {
                if (next_entry == cascade.end()) {
                    result.state = ResolveState::EXHAUSTED;
                    break;
                }
                current = &*next_entry++;

                const std::string url = BuildTileURL(*current, address);
                if (current->zoom != address.zoom) {
                    // Pixel offset stays at the query zoom
                    spdlog::debug("{} at zoom {} reuses pixel ({}, {}) computed at zoom {}",
                                  current->title, current->zoom,
                                  address.pixel_x, address.pixel_y, address.zoom);
                }

                ++result.attempts;
                response = fetcher_.Fetch(url);

                switch (ClassifyResponse(response.status_code)) {
                    case ResponseClass::NOT_FOUND:
                        spdlog::debug("HTTP 404 for {}, trying next source", url);
                        break;
                    case ResponseClass::ERROR:
                        spdlog::error("HTTP error {} for URL: {}", response.status_code, url);
                        throw ServiceError(url, response.status_code);
                    case ResponseClass::SUCCESS:
                        result.state = ResolveState::DECODING;
                        break;
                }
                break;
            }

            case ResolveState::DECODING: {
                const TileImage image = decoder_.Decode(response.body);
                const RGBPixel pixel = image.GetPixel(address.pixel_x, address.pixel_y);

                result.elevation_meters = ElevationEncoding::Decode(pixel);
                result.source_title = current->title;
                result.source_zoom = current->zoom;
                result.state = ResolveState::RESOLVED;

                spdlog::info("Elevation from {} z{}: pixel ({}, {}, {}) -> {}",
                             current->title, current->zoom, pixel.r, pixel.g, pixel.b,
                             result.elevation_meters ? std::to_string(*result.elevation_meters)
                                                     : std::string("no data"));
                break;
            }

            case ResolveState::RESOLVED:
            case ResolveState::EXHAUSTED:
                break;
        }
    }

    if (result.state == ResolveState::EXHAUSTED) {
        spdlog::info("No source has a tile for {} after {} attempts",
                     address.GetTile().GetKey(), result.attempts);
    }

    return result;
}

} // namespace dem_query
