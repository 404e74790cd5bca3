#pragma once

/**
 * @file library_info.h
 * @brief Library information and utilities
 *
 * Provides version information and build details.
 */

#include <string>

namespace dem_query {

/**
 * @brief Library information and utilities
 */
class LibraryInfo {
public:
    /**
     * @brief Get library version
     *
     * @return std::string Version string in format "major.minor.patch"
     */
    static std::string GetVersion();

    /**
     * @brief Get build information
     *
     * @return std::string Version, libcurl version and build timestamp
     */
    static std::string GetBuildInfo();
};

} // namespace dem_query
