/**
 * @file string_utils.cpp
 * @brief Implementation of string parsing and formatting helpers
 *
 * @date 2025
 */

#include "sandbridge/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sandbridge {
namespace utils {

namespace {

struct SizeUnit {
    const char* suffix;
    double multiplier;
};

// Longest suffixes first so "MiB" is not read as "B"
const SizeUnit kSizeUnits[] = {
    {"kib", 1024.0},
    {"mib", 1024.0 * 1024.0},
    {"gib", 1024.0 * 1024.0 * 1024.0},
    {"tib", 1024.0 * 1024.0 * 1024.0 * 1024.0},
    {"kb", 1000.0},
    {"mb", 1000.0 * 1000.0},
    {"gb", 1000.0 * 1000.0 * 1000.0},
    {"tb", 1000.0 * 1000.0 * 1000.0 * 1000.0},
    {"k", 1024.0},
    {"m", 1024.0 * 1024.0},
    {"g", 1024.0 * 1024.0 * 1024.0},
    {"t", 1024.0 * 1024.0 * 1024.0 * 1024.0},
    {"b", 1.0},
};

std::optional<double> ParseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (consumed != text.size() || !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// ============================================================================
// PARSING
// ============================================================================

std::optional<std::uint64_t> StringUtils::ParseByteSize(const std::string& text) {
    const std::string lowered = ToLower(Trim(text));
    if (lowered.empty()) {
        return std::nullopt;
    }

    double multiplier = 1.0;
    std::string number = lowered;
    for (const auto& unit : kSizeUnits) {
        if (EndsWith(lowered, unit.suffix)) {
            multiplier = unit.multiplier;
            number = Trim(lowered.substr(0, lowered.size() - std::char_traits<char>::length(unit.suffix)));
            break;
        }
    }

    auto value = ParseNumber(number);
    if (!value) {
        return std::nullopt;
    }
    // Anything at or above 2^64 bytes does not fit the result
    const double bytes = std::round(*value * multiplier);
    if (!std::isfinite(bytes) || bytes >= std::ldexp(1.0, 64)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(bytes);
}

std::optional<double> StringUtils::ParsePercent(const std::string& text) {
    std::string trimmed = Trim(text);
    if (EndsWith(trimmed, "%")) {
        trimmed.pop_back();
    }
    return ParseNumber(Trim(trimmed));
}

std::optional<std::chrono::system_clock::time_point> StringUtils::ParseTimestamp(
    const std::string& text) {
    const std::string trimmed = Trim(text);
    if (trimmed.size() < 20 || !EndsWith(trimmed, "Z")) {
        return std::nullopt;
    }

    // Docker reports never-started containers with the zero time
    if (StartsWith(trimmed, "0001-01-01")) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream stream(trimmed.substr(0, 19));
    stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }

    const std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string StringUtils::FormatMegabytes(std::uint64_t bytes) {
    return std::to_string(bytes / (1024 * 1024)) + "MB";
}

std::string StringUtils::FormatUptime(std::chrono::seconds uptime) {
    if (uptime.count() < 0) {
        uptime = std::chrono::seconds(0);
    }
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime);
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime - hours);

    if (hours.count() > 0) {
        return std::to_string(hours.count()) + "h " + std::to_string(minutes.count()) + "m";
    }
    return std::to_string(minutes.count()) + "m";
}

std::string StringUtils::FormatTimestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace utils
} // namespace sandbridge
