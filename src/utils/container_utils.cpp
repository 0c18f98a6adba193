/**
 * @file container_utils.cpp
 * @brief Docker CLI implementation of the container engine
 *
 * Every operation is a single `docker` invocation through /bin/sh with each
 * argument single-quoted. Output of stdout and stderr is captured together
 * so a failing command's diagnostics end up in the raised EngineError.
 *
 * **Container Lifecycle**:
 * ```
 * create (limits bound) → start → inspect/stats … → stop (grace) → rm
 * ```
 *
 * @date 2025
 */

#include "sandbridge/utils/container_utils.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <regex>
#include <sstream>

#include <sys/wait.h>

using json = nlohmann::json;

namespace sandbridge {
namespace utils {

namespace {

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CommandResult ExecuteCommand(const std::string& command) {
    CommandResult result;

    std::array<char, 256> buffer;
    // Capture stderr together with stdout
    std::string cmd = command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    const int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + WTERMSIG(status);
    }
    result.success = (result.exit_code == 0);
    return result;
}

std::string FirstLine(const std::string& text) {
    auto trimmed = StringUtils::Trim(text);
    auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

// Inspect output uses null for unset values, so typed lookups go through here
std::string StringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

template <typename T>
T NumberField(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<T>();
}

bool BoolField(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

const json& ObjectField(const json& object, const char* key) {
    static const json kEmpty = json::object();
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION / RUNTIME DETECTION
// ============================================================================

DockerEngine::DockerEngine(std::string binary)
    : binary_(std::move(binary)) {
    spdlog::debug("Docker engine using binary: {}", binary_);
}

bool DockerEngine::IsRuntimeAvailable(const std::string& binary) {
    auto result = ExecuteCommand(StringUtils::ShellQuote(binary) + " --version");
    return result.success;
}

std::string DockerEngine::GetRuntimeVersion(const std::string& binary) {
    auto result = ExecuteCommand(StringUtils::ShellQuote(binary) + " --version");
    if (!result.success) {
        return "unknown";
    }

    // Extract x.y.z from "Docker version 24.0.7, build afdd53b"
    static const std::regex version_regex(R"((\d+\.\d+\.\d+))");
    std::smatch match;
    if (std::regex_search(result.output, match, version_regex)) {
        return match[1].str();
    }
    return StringUtils::Trim(result.output);
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerEngine::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"images", "-q", image});
    if (!result.success) {
        throw EngineError("failed to list images: " + FirstLine(result.output),
                          result.exit_code);
    }
    return !StringUtils::Trim(result.output).empty();
}

std::optional<std::chrono::system_clock::time_point> DockerEngine::GetImageCreatedTime(
    const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Created}}", image});
    if (!result.success) {
        return std::nullopt;
    }
    return StringUtils::ParseTimestamp(result.output);
}

std::string DockerEngine::BuildImage(const std::string& image,
                                     const std::filesystem::path& dockerfile,
                                     const std::filesystem::path& context) {
    spdlog::info("Building image {} from {}", image, dockerfile.string());

    auto result = ExecuteDockerCommand({
        "build",
        "-t", image,
        "-f", dockerfile.string(),
        context.string()
    });

    if (!result.success) {
        spdlog::error("Build output:\n{}", result.output);
        throw EngineError("docker build exited with " + std::to_string(result.exit_code) +
                          ": " + FirstLine(result.output), result.exit_code);
    }

    spdlog::debug("Build output:\n{}", result.output);
    return result.output;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string DockerEngine::CreateContainer(const ContainerConfig& config) {
    if (config.image.empty()) {
        throw EngineError("container image not specified");
    }

    spdlog::info("Creating container {} from {}", config.name, config.image);
    std::string container_id = RunOrThrow(BuildCreateCommand(config), "create container");
    container_id = StringUtils::Trim(container_id);

    // `docker create` may print pull progress before the ID
    auto newline = container_id.find_last_of('\n');
    if (newline != std::string::npos) {
        container_id = StringUtils::Trim(container_id.substr(newline + 1));
    }
    if (container_id.empty()) {
        throw EngineError("docker create returned no container id");
    }

    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

void DockerEngine::StartContainer(const std::string& container_id) {
    spdlog::info("Starting container: {}", container_id.substr(0, 12));
    RunOrThrow({"start", container_id}, "start container");
}

void DockerEngine::StopContainer(const std::string& container_id,
                                 std::chrono::seconds grace) {
    spdlog::info("Stopping container: {} (grace: {}s)",
                 container_id.substr(0, 12), grace.count());
    RunOrThrow({"stop", "--time", std::to_string(grace.count()), container_id},
               "stop container");
}

void DockerEngine::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {} (force: {})", container_id.substr(0, 12), force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);
    RunOrThrow(args, "remove container");
}

// ============================================================================
// CONTAINER QUERIES
// ============================================================================

ContainerInfo DockerEngine::InspectContainer(const std::string& container_id) {
    auto output = RunOrThrow({"inspect", container_id}, "inspect container");
    try {
        return ParseInspectOutput(output);
    } catch (const json::exception& e) {
        throw EngineError(std::string("failed to parse inspect output: ") + e.what());
    }
}

ContainerStats DockerEngine::GetContainerStats(const std::string& container_id) {
    auto output = RunOrThrow({
        "stats",
        "--no-stream",
        "--format", "{{json .}}",
        container_id
    }, "query container stats");

    try {
        return ParseStatsOutput(FirstLine(output));
    } catch (const json::exception& e) {
        throw EngineError(std::string("failed to parse stats output: ") + e.what());
    }
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerEngine::BuildCreateCommand(const ContainerConfig& config) {
    std::vector<std::string> args;
    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Resource limits
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }
    if (config.memory_limit_bytes > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_bytes) + "b");
    }
    if (config.memory_swap_bytes > 0) {
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_swap_bytes) + "b");
    }
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Network
    if (!config.network_mode.empty()) {
        args.push_back("--network");
        args.push_back(config.network_mode);
    }
    for (const auto& [host_port, container_port] : config.port_mappings) {
        args.push_back("-p");
        args.push_back(std::to_string(host_port) + ":" + std::to_string(container_port));
    }

    // Security
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : config.capabilities_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }
    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }
    if (config.seccomp_profile) {
        args.push_back("--security-opt");
        args.push_back("seccomp=" + *config.seccomp_profile);
    }
    if (config.user) {
        args.push_back("--user");
        args.push_back(*config.user);
    }
    for (const auto& group : config.group_add) {
        args.push_back("--group-add");
        args.push_back(group);
    }
    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }

    // Writable paths
    for (const auto& mount : config.tmpfs_mounts) {
        args.push_back("--tmpfs");
        args.push_back(mount);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Image (must be last)
    args.push_back(config.image);
    return args;
}

// ============================================================================
// OUTPUT PARSING
// ============================================================================

ContainerInfo DockerEngine::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns an array with a single object
    if (j.is_array()) {
        if (j.empty()) {
            throw EngineError("inspect returned no containers");
        }
        j = j[0];
    }
    if (!j.is_object()) {
        throw EngineError("inspect output is not an object");
    }

    ContainerInfo info;
    info.id = StringField(j, "Id");
    info.name = StringField(j, "Name");
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }
    info.image = StringField(ObjectField(j, "Config"), "Image");

    const auto& state = ObjectField(j, "State");
    info.state_string = StringField(state, "Status");
    info.state = ParseState(info.state_string);
    info.started_at = StringUtils::ParseTimestamp(StringField(state, "StartedAt"));
    info.exit_code = NumberField<int>(state, "ExitCode", 0);
    info.oom_killed = BoolField(state, "OOMKilled");

    const auto& host_config = ObjectField(j, "HostConfig");
    info.read_only_rootfs = BoolField(host_config, "ReadonlyRootfs");
    info.network_mode = StringField(host_config, "NetworkMode");
    info.memory_limit_bytes = NumberField<std::uint64_t>(host_config, "Memory", 0);
    info.pids_limit = NumberField<int>(host_config, "PidsLimit", 0);

    auto cap_drop = host_config.find("CapDrop");
    if (cap_drop != host_config.end() && cap_drop->is_array()) {
        for (const auto& cap : *cap_drop) {
            if (cap.is_string()) {
                info.capabilities_dropped.push_back(cap.get<std::string>());
            }
        }
    }

    return info;
}

ContainerStats DockerEngine::ParseStatsOutput(const std::string& json_str) {
    json j = json::parse(json_str);
    if (!j.is_object()) {
        throw EngineError("stats output is not an object");
    }

    ContainerStats stats;
    stats.timestamp = std::chrono::system_clock::now();

    // Stopped containers report "--" or "0.00%"; anything unparseable is zero
    stats.cpu_usage_percent = StringUtils::ParsePercent(StringField(j, "CPUPerc")).value_or(0.0);
    stats.memory_usage_percent = StringUtils::ParsePercent(StringField(j, "MemPerc")).value_or(0.0);

    // Format: "123.4MiB / 2GiB"
    const std::string mem_usage = StringField(j, "MemUsage");
    const auto slash_pos = mem_usage.find('/');
    if (slash_pos != std::string::npos) {
        stats.memory_usage_bytes =
            StringUtils::ParseByteSize(mem_usage.substr(0, slash_pos)).value_or(0);
        stats.memory_limit_bytes =
            StringUtils::ParseByteSize(mem_usage.substr(slash_pos + 1)).value_or(0);
    }

    const std::string pids = StringUtils::Trim(StringField(j, "PIDs"));
    if (!pids.empty() && std::all_of(pids.begin(), pids.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        stats.process_count = std::stoi(pids);
    }

    return stats;
}

ContainerState DockerEngine::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RESTARTING;
    if (state_str == "removing") return ContainerState::REMOVING;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string DockerEngine::StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::RESTARTING: return "restarting";
        case ContainerState::REMOVING: return "removing";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        default: return "unknown";
    }
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

CommandResult DockerEngine::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::ostringstream cmd;
    cmd << StringUtils::ShellQuote(binary_);
    for (const auto& arg : args) {
        cmd << " " << StringUtils::ShellQuote(arg);
    }

    spdlog::debug("Executing: {}", cmd.str());
    return ExecuteCommand(cmd.str());
}

std::string DockerEngine::RunOrThrow(const std::vector<std::string>& args,
                                     const std::string& action) const {
    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        spdlog::error("Failed to {}: {}", action, FirstLine(result.output));
        throw EngineError("failed to " + action + ": " + FirstLine(result.output),
                          result.exit_code);
    }
    return result.output;
}

} // namespace utils
} // namespace sandbridge
