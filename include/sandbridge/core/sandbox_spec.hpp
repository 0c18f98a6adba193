/**
 * @file sandbox_spec.hpp
 * @brief Immutable configuration of one sandbox instance
 *
 * A SandboxSpec fully describes the container a SandboxController creates:
 * image and image definition, resource ceilings, published endpoint,
 * security options and readiness policy. Host and port live here rather
 * than in any process-wide default, so several sandboxes can coexist in
 * one process.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandbridge {
namespace core {

/**
 * @struct ResourceLimits
 * @brief Resource ceilings enforced by the engine at container creation
 */
struct ResourceLimits {
    double cpu_limit{2.0};                             ///< CPUs (--cpus)
    std::uint64_t memory_limit_bytes{1024ULL * 1024 * 1024};  ///< Memory ceiling (1GiB default)
    int max_processes{100};                            ///< Process-count ceiling (--pids-limit)
    std::chrono::seconds execution_timeout{30};        ///< Per-request execution timeout
};

/**
 * @struct SandboxSpec
 * @brief Complete sandbox configuration
 */
struct SandboxSpec {
    // Image
    std::string image_name{"sandbox-image"};          ///< Image tag
    std::filesystem::path dockerfile_path{"Dockerfile"};  ///< Image definition; context is its directory
    bool force_rebuild{false};                        ///< Rebuild even if the image is present

    // Limits
    ResourceLimits limits;                            ///< Resource ceilings

    // Endpoint
    std::string host{"127.0.0.1"};                    ///< Host the endpoint is reached on
    std::uint16_t host_port{8000};                    ///< Published host port
    std::uint16_t container_port{8000};               ///< Control service port inside the container
    std::string endpoint_path{"/"};                   ///< WebSocket target path

    // Security
    std::optional<std::string> user;                  ///< --user mapping
    std::optional<std::string> seccomp_profile;       ///< Seccomp profile path
    std::vector<std::string> group_add;               ///< --group-add entries
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Capabilities removed
    std::vector<std::string> capabilities_add;        ///< Capabilities granted back after the drop
    std::vector<std::string> tmpfs_mounts{            ///< Writable paths on a read-only root
        "/tmp:exec,mode=777",
        "/var/tmp:exec,mode=777",
        "/run:exec,mode=777"};

    // Lifecycle
    std::string container_name;                       ///< Generated when empty
    int readiness_retries{10};                        ///< Readiness probe attempts
    std::chrono::milliseconds readiness_delay{2000};  ///< Delay between probe attempts
    std::chrono::milliseconds probe_timeout{3000};    ///< Timeout of a single probe
    std::chrono::seconds stop_grace{10};              ///< Grace period before SIGKILL

    bool debug{false};                                ///< Verbose lifecycle logging
};

/**
 * @brief Validate a spec
 * @throws ConfigError describing the first invalid field
 */
void ValidateSpec(const SandboxSpec& spec);

/**
 * @brief Endpoint URL of the sandbox control service
 * @return e.g. "ws://127.0.0.1:8000/"
 */
std::string EndpointUrl(const SandboxSpec& spec);

/**
 * @class SandboxSpecBuilder
 * @brief Fluent API for constructing sandbox specs
 *
 * **Usage Example**:
 * @code
 * auto spec = SandboxSpecBuilder()
 *     .WithImage("sandbox-image")
 *     .WithMemoryLimit("512m")
 *     .WithMaxProcesses(50)
 *     .WithTimeout(std::chrono::seconds(10))
 *     .WithHostPort(8001)
 *     .Build();
 * @endcode
 */
class SandboxSpecBuilder {
public:
    SandboxSpecBuilder& WithImage(const std::string& image) {
        spec_.image_name = image;
        return *this;
    }

    SandboxSpecBuilder& WithDockerfile(const std::filesystem::path& path) {
        spec_.dockerfile_path = path;
        return *this;
    }

    SandboxSpecBuilder& ForceRebuild(bool rebuild = true) {
        spec_.force_rebuild = rebuild;
        return *this;
    }

    SandboxSpecBuilder& WithCPULimit(double cpus) {
        spec_.limits.cpu_limit = cpus;
        return *this;
    }

    SandboxSpecBuilder& WithMemoryLimit(std::uint64_t bytes) {
        spec_.limits.memory_limit_bytes = bytes;
        return *this;
    }

    /**
     * @brief Set memory limit in Docker notation ("512m", "1g")
     * @throws ConfigError if the text is not a size
     */
    SandboxSpecBuilder& WithMemoryLimit(const std::string& size);

    SandboxSpecBuilder& WithMaxProcesses(int max_processes) {
        spec_.limits.max_processes = max_processes;
        return *this;
    }

    SandboxSpecBuilder& WithTimeout(std::chrono::seconds timeout) {
        spec_.limits.execution_timeout = timeout;
        return *this;
    }

    SandboxSpecBuilder& WithHost(const std::string& host) {
        spec_.host = host;
        return *this;
    }

    SandboxSpecBuilder& WithHostPort(std::uint16_t port) {
        spec_.host_port = port;
        return *this;
    }

    SandboxSpecBuilder& WithContainerPort(std::uint16_t port) {
        spec_.container_port = port;
        return *this;
    }

    SandboxSpecBuilder& WithContainerName(const std::string& name) {
        spec_.container_name = name;
        return *this;
    }

    SandboxSpecBuilder& WithUser(const std::string& user) {
        spec_.user = user;
        return *this;
    }

    SandboxSpecBuilder& AddGroup(const std::string& group) {
        spec_.group_add.push_back(group);
        return *this;
    }

    SandboxSpecBuilder& AddCapability(const std::string& capability) {
        spec_.capabilities_add.push_back(capability);
        return *this;
    }

    SandboxSpecBuilder& WithSeccompProfile(const std::string& profile) {
        spec_.seccomp_profile = profile;
        return *this;
    }

    SandboxSpecBuilder& WithReadiness(int retries, std::chrono::milliseconds delay) {
        spec_.readiness_retries = retries;
        spec_.readiness_delay = delay;
        return *this;
    }

    SandboxSpecBuilder& WithStopGrace(std::chrono::seconds grace) {
        spec_.stop_grace = grace;
        return *this;
    }

    SandboxSpecBuilder& WithDebug(bool debug = true) {
        spec_.debug = debug;
        return *this;
    }

    /// Validate and return the spec
    SandboxSpec Build() const;

private:
    SandboxSpec spec_;  ///< Spec being built
};

} // namespace core
} // namespace sandbridge
