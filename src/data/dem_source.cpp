// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/dem_source.h>

#include <algorithm>
#include <utility>

namespace dem_query {

namespace DEMSources {

const DEMSource DEM5A = {
    .title = "DEM5A",
    .url_template = "https://cyberjapandata.gsi.go.jp/xyz/dem5a_png/{z}/{x}/{y}.png",
    .min_zoom = 15,
    .max_zoom = 15,
    .fixed = true
};

const DEMSource DEM5B = {
    .title = "DEM5B",
    .url_template = "https://cyberjapandata.gsi.go.jp/xyz/dem5b_png/{z}/{x}/{y}.png",
    .min_zoom = 15,
    .max_zoom = 15,
    .fixed = true
};

const DEMSource DEM5C = {
    .title = "DEM5C",
    .url_template = "https://cyberjapandata.gsi.go.jp/xyz/dem5c_png/{z}/{x}/{y}.png",
    .min_zoom = 15,
    .max_zoom = 15,
    .fixed = true
};

const DEMSource DEM10B = {
    .title = "DEM10B",
    .url_template = "https://cyberjapandata.gsi.go.jp/xyz/dem_png/{z}/{x}/{y}.png",
    .min_zoom = 14,
    .max_zoom = 14,
    .fixed = false
};

DEMCatalog DefaultCatalog() {
    return {DEM5A, DEM5B, DEM5C, DEM10B};
}

} // namespace DEMSources

namespace {

/// Replace every occurrence of a placeholder
void ReplaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
    std::size_t pos = text.find(placeholder);
    while (pos != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos = text.find(placeholder, pos + value.size());
    }
}

} // anonymous namespace

std::vector<CascadeEntry> BuildCascade(const DEMCatalog& catalog) {
    std::vector<CascadeEntry> cascade;

    for (const auto& source : catalog) {
        std::int32_t min_zoom = source.min_zoom;
        std::int32_t max_zoom = source.max_zoom;
        if (max_zoom < min_zoom) {
            std::swap(min_zoom, max_zoom);
        }

        for (std::int32_t zoom = max_zoom; zoom >= min_zoom; --zoom) {
            CascadeEntry entry;
            entry.title = source.title;
            entry.zoom = zoom;
            entry.url_template = source.url_template;
            entry.fixed = source.fixed;
            cascade.push_back(std::move(entry));
        }
    }

    return cascade;
}

std::string BuildTileURL(const CascadeEntry& entry, const TileAddress& address) {
    std::string url = entry.url_template;
    ReplaceAll(url, "{x}", std::to_string(address.tile_x));
    ReplaceAll(url, "{y}", std::to_string(address.tile_y));
    ReplaceAll(url, "{z}", std::to_string(entry.zoom));
    return url;
}

} // namespace dem_query
