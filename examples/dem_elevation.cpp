// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

// Prints the ground elevation at a latitude/longitude using the GSI DEM tiles.
//
//   dem_elevation 35.681167 139.767052 --log DEBUG

#include <dem_query/cli/command_line.h>
#include <dem_query/data/elevation_service.h>
#include <dem_query/errors.h>
#include <dem_query/platform/library_info.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string program_name = argc > 0 ? argv[0] : "dem_elevation";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    dem_query::CommandLineOptions options;
    try {
        options = dem_query::ParseCommandLine(args);
    } catch (const dem_query::UsageError& e) {
        std::cerr << e.what() << "\n" << dem_query::GetUsage(program_name) << "\n";
        return 2;
    }

    if (options.show_help) {
        std::cout << dem_query::GetUsage(program_name) << "\n";
        return 0;
    }
    if (options.show_version) {
        std::cout << dem_query::LibraryInfo::GetBuildInfo() << "\n";
        return 0;
    }

    dem_query::InstallStderrLogger("dem_elevation", options.log_level);

    dem_query::ElevationServiceConfig config;
    if (options.timeout_seconds) {
        config.fetcher.timeout_seconds = *options.timeout_seconds;
    }

    try {
        const auto service = dem_query::ElevationService::Create(config);
        const auto query = service->Query(options.latitude, options.longitude);

        if (query.HasData()) {
            spdlog::debug("Answered by {} at zoom {} after {} request(s)",
                          query.source_title, query.source_zoom, query.attempts);
        } else {
            spdlog::debug("No elevation data ({}), reporting 0", ToString(query.state));
        }

        std::cout << dem_query::FormatElevation(query.GetElevationOrZero()) << "\n";
    } catch (const dem_query::Error& e) {
        spdlog::critical("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        return 1;
    }

    return 0;
}
