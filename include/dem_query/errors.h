// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file errors.h
 * @brief Exception hierarchy for elevation queries
 *
 * Fatal conditions are reported as exceptions derived from dem_query::Error.
 * A missing tile (HTTP 404) is not an error: it is a response classification
 * that drives the source cascade.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dem_query {

/**
 * @brief Base class for all dem_query errors
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid geographic input (latitude at or beyond the poles, non-finite values)
 */
class DomainError : public Error {
public:
    explicit DomainError(const std::string& message) : Error(message) {}
};

/**
 * @brief Invalid service configuration
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

/**
 * @brief Network failure while requesting a tile
 */
class TransportError : public Error {
public:
    TransportError(const std::string& url, const std::string& reason)
        : Error("Transport error for " + url + ": " + reason), url_(url) {}

    const std::string& GetURL() const noexcept { return url_; }

private:
    std::string url_;
};

/**
 * @brief Tile server answered with an HTTP error status other than 404
 */
class ServiceError : public Error {
public:
    ServiceError(const std::string& url, std::uint32_t status_code)
        : Error("HTTP error " + std::to_string(status_code) + " for " + url),
          url_(url),
          status_code_(status_code) {}

    const std::string& GetURL() const noexcept { return url_; }
    std::uint32_t GetStatusCode() const noexcept { return status_code_; }

private:
    std::string url_;
    std::uint32_t status_code_;
};

/**
 * @brief Tile body could not be decoded into a raster
 */
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message) : Error(message) {}
};

} // namespace dem_query
