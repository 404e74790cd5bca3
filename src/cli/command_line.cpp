// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/cli/command_line.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace dem_query {

namespace {

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

/// Parse a whole token as a double
std::optional<double> ParseNumber(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(token, &consumed);
        if (consumed != token.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::uint32_t ParseTimeout(const std::string& token) {
    const auto value = ParseNumber(token);
    if (!value || *value < 1.0 || *value != std::floor(*value) ||
        *value > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
        throw UsageError("--timeout expects a positive whole number of seconds, got '" +
                         token + "'");
    }
    return static_cast<std::uint32_t>(*value);
}

bool IsOption(const std::string& token) {
    return token.size() > 1 && token[0] == '-' && !ParseNumber(token).has_value();
}

} // anonymous namespace

std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name) {
    const std::string upper = ToUpper(name);
    if (upper == "DEBUG") return spdlog::level::debug;
    if (upper == "INFO") return spdlog::level::info;
    if (upper == "WARN") return spdlog::level::warn;
    if (upper == "ERROR") return spdlog::level::err;
    if (upper == "CRITICAL") return spdlog::level::critical;
    return std::nullopt;
}

CommandLineOptions ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    std::vector<double> positionals;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!IsOption(arg)) {
            const auto value = ParseNumber(arg);
            if (!value) {
                throw UsageError("Expected a number, got '" + arg + "'");
            }
            positionals.push_back(*value);
            continue;
        }

        // Accept both "--log DEBUG" and "--log=DEBUG"
        std::string name = arg;
        std::optional<std::string> inline_value;
        const std::size_t equals = arg.find('=');
        if (equals != std::string::npos) {
            name = arg.substr(0, equals);
            inline_value = arg.substr(equals + 1);
        }

        auto take_value = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= args.size()) {
                throw UsageError(name + " requires a value");
            }
            return args[++i];
        };

        if (name == "-h" || name == "--help") {
            options.show_help = true;
        } else if (name == "--version") {
            options.show_version = true;
        } else if (name == "--log") {
            const std::string level_name = take_value();
            const auto level = ParseLogLevel(level_name);
            if (!level) {
                throw UsageError("Invalid log level '" + level_name +
                                 "' (choose from DEBUG, INFO, WARN, ERROR, CRITICAL)");
            }
            options.log_level = *level;
        } else if (name == "--timeout") {
            options.timeout_seconds = ParseTimeout(take_value());
        } else {
            throw UsageError("Unknown option '" + name + "'");
        }
    }

    if (options.show_help || options.show_version) {
        return options;
    }

    if (positionals.size() != 2) {
        throw UsageError("Expected latitude and longitude, got " +
                         std::to_string(positionals.size()) + " value(s)");
    }
    options.latitude = positionals[0];
    options.longitude = positionals[1];

    return options;
}

std::string GetUsage(const std::string& program_name) {
    return "Usage: " + program_name +
           " <lat> <lng> [--log DEBUG|INFO|WARN|ERROR|CRITICAL] [--timeout SECONDS]"
           " [--help] [--version]";
}

std::shared_ptr<spdlog::logger> InstallStderrLogger(const std::string& name,
                                                    spdlog::level::level_enum level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    return logger;
}

std::string FormatElevation(double meters) {
    return fmt::format("{}", meters);
}

} // namespace dem_query
