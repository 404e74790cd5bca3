// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dem_query {

/// HTTP response of a tile request
struct HttpResponse {
    std::uint32_t status_code = 0;     ///< HTTP status code
    std::vector<std::uint8_t> body;    ///< Response body bytes
};

/// Classification of a tile response
enum class ResponseClass {
    SUCCESS,    ///< Tile present, body should be decoded
    NOT_FOUND,  ///< Tile absent at this source/zoom (HTTP 404)
    ERROR       ///< Any other HTTP error status
};

/// Classify an HTTP status code for the source cascade
[[nodiscard]] ResponseClass ClassifyResponse(std::uint32_t status_code) noexcept;

/// Configuration for the HTTP tile fetcher
struct TileFetcherConfig {
    /// Request timeout in seconds (also used as connect timeout)
    std::uint32_t timeout_seconds = 30;

    /// User agent string
    std::string user_agent = "DEMQuery/1.0";

    /// Follow HTTP redirects
    bool follow_redirects = true;

    /// Verify SSL certificates
    bool verify_ssl = true;

    /// Proxy URL, empty for a direct connection
    std::string proxy_url;
};

/// HTTP transport for tile requests
class TileFetcher {
public:
    virtual ~TileFetcher() = default;

    /// Issue a GET request
    /// Every HTTP response, including error statuses, is returned
    /// @param url Tile URL
    /// @return Status code and body
    /// @throws TransportError if no HTTP response was received
    virtual HttpResponse Fetch(const std::string& url) = 0;

    /// Create the libcurl fetcher
    /// @param config Fetcher configuration
    /// @return Unique pointer to fetcher instance
    [[nodiscard]] static std::unique_ptr<TileFetcher> Create(const TileFetcherConfig& config);
};

} // namespace dem_query
