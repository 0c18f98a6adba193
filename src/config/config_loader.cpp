/**
 * @file config_loader.cpp
 * @brief Implementation of the JSON configuration loader
 *
 * @date 2025
 */

#include "sandbridge/config/config_loader.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace sandbridge {
namespace config {

using json = nlohmann::json;

namespace {

const char* kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

// ============================================================================
// TYPED FIELD READERS
// ============================================================================

const json* Find(const json& section, const char* key) {
    auto it = section.find(key);
    return it == section.end() ? nullptr : &*it;
}

[[noreturn]] void WrongType(const std::string& path, const char* expected) {
    throw ConfigError("'" + path + "' must be " + expected);
}

void ReadString(const json& section, const std::string& prefix, const char* key,
                std::string& target) {
    if (const auto* value = Find(section, key)) {
        if (!value->is_string()) {
            WrongType(prefix + key, "a string");
        }
        target = value->get<std::string>();
    }
}

void ReadBool(const json& section, const std::string& prefix, const char* key, bool& target) {
    if (const auto* value = Find(section, key)) {
        if (!value->is_boolean()) {
            WrongType(prefix + key, "a boolean");
        }
        target = value->get<bool>();
    }
}

// Integer in [min, max]; out-of-range values are errors, never truncated
long long ReadRangedInteger(const json& value, const std::string& path,
                            long long min, long long max) {
    if (!value.is_number_integer()) {
        WrongType(path, "an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(max)) {
        throw ConfigError("'" + path + "' is out of range");
    }
    const auto number = value.get<long long>();
    if (number < min || number > max) {
        throw ConfigError("'" + path + "' is out of range");
    }
    return number;
}

void ReadInt(const json& section, const std::string& prefix, const char* key, int& target) {
    if (const auto* value = Find(section, key)) {
        target = static_cast<int>(ReadRangedInteger(*value, prefix + key,
                                                    std::numeric_limits<int>::min(),
                                                    std::numeric_limits<int>::max()));
    }
}

void ReadDouble(const json& section, const std::string& prefix, const char* key, double& target) {
    if (const auto* value = Find(section, key)) {
        if (!value->is_number()) {
            WrongType(prefix + key, "a number");
        }
        target = value->get<double>();
    }
}

void ReadPort(const json& section, const std::string& prefix, const char* key,
              std::uint16_t& target) {
    if (const auto* value = Find(section, key)) {
        target = static_cast<std::uint16_t>(ReadRangedInteger(
            *value, prefix + key, 0, std::numeric_limits<std::uint16_t>::max()));
    }
}

template <typename Duration>
void ReadDuration(const json& section, const std::string& prefix, const char* key,
                  Duration& target) {
    if (const auto* value = Find(section, key)) {
        // Must stay representable in milliseconds, the unit timers run on
        const auto max = std::chrono::duration_cast<Duration>(
            std::chrono::milliseconds::max()).count();
        target = Duration(ReadRangedInteger(*value, prefix + key,
                                            std::numeric_limits<long long>::min(), max));
    }
}

void ReadStringList(const json& section, const std::string& prefix, const char* key,
                    std::vector<std::string>& target) {
    if (const auto* value = Find(section, key)) {
        if (!value->is_array()) {
            WrongType(prefix + key, "an array of strings");
        }
        std::vector<std::string> items;
        for (const auto& item : *value) {
            if (!item.is_string()) {
                WrongType(prefix + key, "an array of strings");
            }
            items.push_back(item.get<std::string>());
        }
        target = std::move(items);
    }
}

void ReadOptionalString(const json& section, const std::string& prefix, const char* key,
                        std::optional<std::string>& target) {
    if (Find(section, key)) {
        std::string value;
        ReadString(section, prefix, key, value);
        target = value;
    }
}

const json* Section(const json& root, const char* name) {
    const auto* section = Find(root, name);
    if (section && !section->is_object()) {
        WrongType(name, "an object");
    }
    return section;
}

// ============================================================================
// SECTIONS
// ============================================================================

void ApplySandbox(core::SandboxSpec& spec, const json& section) {
    const std::string prefix = "sandbox.";

    ReadString(section, prefix, "image", spec.image_name);
    if (const auto* value = Find(section, "dockerfile")) {
        if (!value->is_string()) {
            WrongType(prefix + "dockerfile", "a string");
        }
        spec.dockerfile_path = value->get<std::string>();
    }
    ReadBool(section, prefix, "forceRebuild", spec.force_rebuild);

    ReadDouble(section, prefix, "cpuLimit", spec.limits.cpu_limit);
    if (const auto* value = Find(section, "memoryLimit")) {
        if (value->is_string()) {
            auto bytes = utils::StringUtils::ParseByteSize(value->get<std::string>());
            if (!bytes) {
                throw ConfigError("'sandbox.memoryLimit' is not a size: " + value->get<std::string>());
            }
            spec.limits.memory_limit_bytes = *bytes;
        } else if (value->is_number_unsigned()) {
            spec.limits.memory_limit_bytes = value->get<std::uint64_t>();
        } else {
            WrongType(prefix + "memoryLimit", "a size string or a byte count");
        }
    }
    ReadInt(section, prefix, "maxProcesses", spec.limits.max_processes);
    ReadDuration(section, prefix, "timeoutSeconds", spec.limits.execution_timeout);

    ReadString(section, prefix, "host", spec.host);
    ReadPort(section, prefix, "hostPort", spec.host_port);
    ReadPort(section, prefix, "containerPort", spec.container_port);
    ReadString(section, prefix, "endpointPath", spec.endpoint_path);

    ReadString(section, prefix, "containerName", spec.container_name);
    ReadOptionalString(section, prefix, "user", spec.user);
    ReadOptionalString(section, prefix, "seccompProfile", spec.seccomp_profile);
    ReadStringList(section, prefix, "capDrop", spec.capabilities_drop);
    ReadStringList(section, prefix, "capAdd", spec.capabilities_add);
    ReadStringList(section, prefix, "groupAdd", spec.group_add);
    ReadStringList(section, prefix, "tmpfs", spec.tmpfs_mounts);

    ReadInt(section, prefix, "readinessRetries", spec.readiness_retries);
    ReadDuration(section, prefix, "readinessDelayMs", spec.readiness_delay);
    ReadDuration(section, prefix, "probeTimeoutMs", spec.probe_timeout);
    ReadDuration(section, prefix, "stopGraceSeconds", spec.stop_grace);
    ReadBool(section, prefix, "debug", spec.debug);
}

void ApplyChannel(channel::ChannelConfig& config, const json& section) {
    const std::string prefix = "channel.";

    ReadString(section, prefix, "host", config.host);
    ReadPort(section, prefix, "port", config.port);
    ReadString(section, prefix, "path", config.path);

    ReadInt(section, prefix, "maxRetries", config.max_retries);
    ReadDuration(section, prefix, "retryDelayMs", config.retry_delay);
    if (Find(section, "backoff")) {
        std::string backoff;
        ReadString(section, prefix, "backoff", backoff);
        backoff = utils::StringUtils::ToLower(backoff);
        if (backoff == "fixed") {
            config.backoff = channel::BackoffPolicy::FIXED;
        } else if (backoff == "linear") {
            config.backoff = channel::BackoffPolicy::LINEAR;
        } else {
            throw ConfigError("'channel.backoff' must be \"fixed\" or \"linear\"");
        }
    }
    ReadDuration(section, prefix, "connectTimeoutMs", config.connect_timeout);

    ReadDuration(section, prefix, "heartbeatIntervalMs", config.heartbeat_interval);
    ReadDuration(section, prefix, "heartbeatTimeoutMs", config.heartbeat_timeout);
    ReadDuration(section, prefix, "graceWindowMs", config.grace_window);

    ReadDuration(section, prefix, "requestTimeoutMs", config.request_timeout);
    ReadDuration(section, prefix, "pollIntervalMs", config.poll_interval);
}

void ApplyLog(LogConfig& log, const json& section) {
    ReadString(section, "log.", "level", log.level);
    ReadString(section, "log.", "pattern", log.pattern);
    log.level = utils::StringUtils::ToLower(log.level);
}

} // anonymous namespace

// ============================================================================
// PUBLIC API
// ============================================================================

AppConfig DefaultConfig() {
    AppConfig config;
    config.channel = channel::ChannelConfigFor(config.sandbox);
    return config;
}

AppConfig ParseConfig(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded()) {
        throw ConfigError("configuration is not valid JSON");
    }
    if (!data.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    AppConfig config;
    if (const auto* section = Section(data, "sandbox")) {
        ApplySandbox(config.sandbox, *section);
    }

    // The channel follows the sandbox endpoint unless told otherwise
    config.channel = channel::ChannelConfigFor(config.sandbox);
    if (const auto* section = Section(data, "channel")) {
        ApplyChannel(config.channel, *section);
    }

    if (const auto* section = Section(data, "monitor")) {
        ReadDuration(*section, "monitor.", "pollIntervalMs", config.monitor.poll_interval);
    }
    if (const auto* section = Section(data, "log")) {
        ApplyLog(config.log, *section);
    }

    ValidateConfig(config);
    return config;
}

AppConfig LoadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return ParseConfig(buffer.str());
}

void ValidateConfig(const AppConfig& config) {
    core::ValidateSpec(config.sandbox);
    channel::ValidateChannelConfig(config.channel);

    if (config.monitor.poll_interval.count() <= 0) {
        throw ConfigError("monitor poll interval must be positive");
    }

    bool known_level = false;
    for (const char* level : kLogLevels) {
        if (config.log.level == level) {
            known_level = true;
            break;
        }
    }
    if (!known_level) {
        throw ConfigError("unknown log level '" + config.log.level + "'");
    }
}

} // namespace config
} // namespace sandbridge
