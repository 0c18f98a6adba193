/**
 * @file string_utils.hpp
 * @brief String helpers for container engine output and configuration values
 *
 * Parses the size, percentage and timestamp notations the Docker CLI emits
 * ("512m", "12.5MiB / 1GiB", "3.21%", RFC 3339 timestamps) and formats
 * values for the dashboard.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sandbridge {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * **Usage Example**:
 * @code
 * auto bytes = StringUtils::ParseByteSize("512m");      // 536870912
 * auto used  = StringUtils::ParseByteSize("12.5MiB");   // 13107200
 * auto pct   = StringUtils::ParsePercent("3.21%");      // 3.21
 * auto label = StringUtils::FormatUptime(std::chrono::minutes(75));  // "1h 15m"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Quote an argument for /bin/sh
     *
     * Wraps the argument in single quotes and escapes embedded single quotes,
     * so no shell expansion happens inside it.
     */
    static std::string ShellQuote(const std::string& arg);

    /***************************************************************************
     * Parsing
     ***************************************************************************/

    /**
     * @brief Parse a byte size in Docker or engine notation
     *
     * Accepts plain byte counts and the suffixes b, k, m, g, t (binary
     * multiples, as in `docker run --memory`), KiB/MiB/GiB/TiB, and the
     * decimal kB/MB/GB/TB that `docker stats` prints. Case-insensitive for
     * the single-letter forms; fractional values are allowed.
     *
     * @param text Size string
     * @return Size in bytes, or std::nullopt if the text is not a size or
 *         does not fit in 64 bits
     */
    static std::optional<std::uint64_t> ParseByteSize(const std::string& text);

    /// Parse "12.34%" (or "12.34") into 12.34
    static std::optional<double> ParsePercent(const std::string& text);

    /**
     * @brief Parse an RFC 3339 timestamp as emitted by the engine
     *
     * Fractional seconds are ignored. Only UTC ("Z") timestamps are accepted,
     * which is what the Docker daemon reports. The zero time
     * "0001-01-01T00:00:00Z" maps to std::nullopt.
     */
    static std::optional<std::chrono::system_clock::time_point> ParseTimestamp(
        const std::string& text);

    /***************************************************************************
     * Formatting
     ***************************************************************************/

    /// Megabyte count as the dashboard shows it, e.g. "512MB"
    static std::string FormatMegabytes(std::uint64_t bytes);

    /// Uptime as "<h>h <m>m", or "<m>m" below one hour
    static std::string FormatUptime(std::chrono::seconds uptime);

    /// RFC 3339 UTC with second precision ("2025-01-31T12:00:00Z")
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);
};

} // namespace utils
} // namespace sandbridge
