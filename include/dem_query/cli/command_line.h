// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#pragma once

#include <dem_query/errors.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dem_query {

/// Malformed command line
class UsageError : public Error {
public:
    explicit UsageError(const std::string& message) : Error(message) {}
};

/// Parsed options of the dem_elevation tool
struct CommandLineOptions {
    double latitude = 0.0;
    double longitude = 0.0;

    /// Log level, ERROR unless --log is given
    spdlog::level::level_enum log_level = spdlog::level::err;

    /// Request timeout override
    std::optional<std::uint32_t> timeout_seconds;

    bool show_help = false;
    bool show_version = false;
};

/// Parse a log level name: DEBUG, INFO, WARN, ERROR or CRITICAL (any case)
/// @return Level, or nullopt for an unknown name
[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name);

/// Parse arguments (without the program name)
/// Usage: <lat> <lng> [--log LEVEL] [--timeout SECONDS] [--help] [--version]
/// Negative numbers are positionals. Latitude/longitude are only required
/// when neither --help nor --version is given.
/// @throws UsageError on malformed input
[[nodiscard]] CommandLineOptions ParseCommandLine(const std::vector<std::string>& args);

/// One-line usage text
[[nodiscard]] std::string GetUsage(const std::string& program_name);

/// Make a stderr logger the default logger, so stdout carries only results
/// @param name Logger name, reused if already registered
/// @param level Level applied to the logger
std::shared_ptr<spdlog::logger> InstallStderrLogger(const std::string& name,
                                                    spdlog::level::level_enum level);

/// Elevation as printed by the tool, shortest form that round-trips
[[nodiscard]] std::string FormatElevation(double meters);

} // namespace dem_query
