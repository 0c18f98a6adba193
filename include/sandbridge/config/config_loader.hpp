/**
 * @file config_loader.hpp
 * @brief JSON configuration file to explicit configuration structs
 *
 * Every setting is optional; an absent key keeps its default. A key of the
 * wrong type is an error, never silently ignored. The channel endpoint
 * defaults to the sandbox's published endpoint and the request timeout to
 * the sandbox execution timeout.
 *
 * **Example File**:
 * ```json
 * {
 *   "sandbox": {"image": "sandbox-image", "memoryLimit": "512m", "cpuLimit": 1.5,
 *               "maxProcesses": 64, "timeoutSeconds": 20, "hostPort": 8001},
 *   "channel": {"maxRetries": 5, "retryDelayMs": 1000, "backoff": "linear"},
 *   "monitor": {"pollIntervalMs": 2000},
 *   "log":     {"level": "debug"}
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/channel/control_channel.hpp"
#include "sandbridge/core/sandbox_spec.hpp"
#include "sandbridge/monitor/status_reporter.hpp"

#include <filesystem>
#include <string>

namespace sandbridge {
namespace config {

/**
 * @struct LogConfig
 * @brief spdlog settings applied by the executable
 */
struct LogConfig {
    std::string level{"info"};                      ///< trace, debug, info, warn, error, critical, off
    std::string pattern{"[%H:%M:%S] [%^%l%$] %v"};  ///< spdlog pattern
};

/**
 * @struct AppConfig
 * @brief Complete process configuration
 */
struct AppConfig {
    core::SandboxSpec sandbox;         ///< Sandbox to run
    channel::ChannelConfig channel;    ///< Channel to its endpoint
    monitor::ReporterConfig monitor;   ///< Status polling
    LogConfig log;                     ///< Logging
};

/// Defaults, with the channel addressing the default sandbox endpoint
AppConfig DefaultConfig();

/**
 * @brief Parse a JSON configuration document
 * @throws ConfigError on malformed JSON, wrong types or invalid values
 */
AppConfig ParseConfig(const std::string& text);

/**
 * @brief Read and parse a configuration file
 * @throws ConfigError if the file cannot be read or parsed
 */
AppConfig LoadConfig(const std::filesystem::path& path);

/**
 * @brief Validate every section
 * @throws ConfigError describing the first invalid value
 */
void ValidateConfig(const AppConfig& config);

} // namespace config
} // namespace sandbridge
