/**
 * @file container_utils.hpp
 * @brief Container engine abstraction and Docker CLI implementation
 *
 * ContainerEngine is the seam between the sandbox lifecycle and the engine
 * that actually runs containers. DockerEngine drives the `docker` CLI; tests
 * substitute an in-memory engine. Every failing engine command raises
 * EngineError carrying the command output, so the lifecycle layer can move
 * its instance to Failed and surface the reason.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandbridge {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container states as reported by the engine
 */
enum class ContainerState {
    CREATED,     ///< Created but never started
    RUNNING,     ///< Running
    PAUSED,      ///< Paused
    RESTARTING,  ///< Restarting
    REMOVING,    ///< Being removed
    EXITED,      ///< Process exited (stopped)
    DEAD,        ///< Engine gave up on the container
    UNKNOWN      ///< Unrecognised state string
};

/**
 * @struct ContainerConfig
 * @brief Everything bound to a container at creation time
 */
struct ContainerConfig {
    std::string name;                             ///< Container name
    std::string image;                            ///< Image tag

    // Resource Limits
    double cpu_limit{0.0};                        ///< CPUs (0 = unlimited)
    std::uint64_t memory_limit_bytes{0};          ///< Memory ceiling (0 = unlimited)
    std::uint64_t memory_swap_bytes{0};           ///< Memory + swap ceiling (0 = engine default)
    int pids_limit{0};                            ///< Process ceiling (0 = unlimited)

    // Network
    std::string network_mode{"bridge"};           ///< Network mode
    std::map<int, int> port_mappings;             ///< host port -> container port

    // Security
    bool read_only_rootfs{true};                  ///< Read-only root filesystem
    bool no_new_privileges{true};                 ///< Block privilege escalation
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Capabilities removed
    std::vector<std::string> capabilities_add;    ///< Capabilities granted back
    std::optional<std::string> seccomp_profile;   ///< Seccomp profile path
    std::optional<std::string> user;              ///< Run as user
    std::vector<std::string> group_add;           ///< Supplementary groups

    // Filesystem
    std::vector<std::string> tmpfs_mounts;        ///< "path[:options]" entries

    std::map<std::string, std::string> labels;    ///< Container labels
};

/**
 * @struct ContainerInfo
 * @brief Parsed `docker inspect` output
 */
struct ContainerInfo {
    std::string id;                               ///< Full container ID
    std::string name;                             ///< Name without leading '/'
    std::string image;                            ///< Image tag
    ContainerState state{ContainerState::UNKNOWN};  ///< Current state
    std::string state_string;                     ///< Raw engine state

    std::optional<std::chrono::system_clock::time_point> started_at;  ///< Last start time
    int exit_code{0};                             ///< Exit code of the last run
    bool oom_killed{false};                       ///< Killed by the memory ceiling

    // Security configuration actually applied
    bool read_only_rootfs{false};                 ///< HostConfig.ReadonlyRootfs
    std::string network_mode;                     ///< HostConfig.NetworkMode
    std::vector<std::string> capabilities_dropped;  ///< HostConfig.CapDrop

    // Limits actually applied
    std::uint64_t memory_limit_bytes{0};          ///< HostConfig.Memory
    int pids_limit{0};                            ///< HostConfig.PidsLimit
};

/**
 * @struct ContainerStats
 * @brief One `docker stats --no-stream` sample
 */
struct ContainerStats {
    double cpu_usage_percent{0.0};                ///< CPU utilisation
    std::uint64_t memory_usage_bytes{0};          ///< Memory in use
    std::uint64_t memory_limit_bytes{0};          ///< Memory ceiling seen by the engine
    double memory_usage_percent{0.0};             ///< Memory utilisation
    int process_count{0};                         ///< Active processes
    std::chrono::system_clock::time_point timestamp;  ///< Sample time
};

/**
 * @struct CommandResult
 * @brief Result of one engine command
 */
struct CommandResult {
    int exit_code{0};        ///< Exit status
    std::string output;      ///< Combined stdout and stderr
    bool success{false};     ///< exit_code == 0
};

/**
 * @class ContainerEngine
 * @brief Operations the sandbox lifecycle needs from a container engine
 *
 * Implementations throw EngineError when the engine reports a failure.
 * Implementations must allow the query methods (InspectContainer,
 * GetContainerStats) to run concurrently with lifecycle calls.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /// True if the image tag exists locally
    virtual bool ImageExists(const std::string& image) = 0;

    /// Creation time of a local image, std::nullopt if absent or unknown
    virtual std::optional<std::chrono::system_clock::time_point> GetImageCreatedTime(
        const std::string& image) = 0;

    /**
     * @brief Build an image from a definition
     * @param image Tag to build
     * @param dockerfile Image definition
     * @param context Build context directory
     * @return Build output
     * @throws EngineError with the build output on failure
     */
    virtual std::string BuildImage(const std::string& image,
                                   const std::filesystem::path& dockerfile,
                                   const std::filesystem::path& context) = 0;

    /// Create (but do not start) a container, returning its ID
    virtual std::string CreateContainer(const ContainerConfig& config) = 0;

    virtual void StartContainer(const std::string& container_id) = 0;

    /// Stop with SIGTERM, then SIGKILL after the grace period
    virtual void StopContainer(const std::string& container_id,
                               std::chrono::seconds grace) = 0;

    virtual void RemoveContainer(const std::string& container_id, bool force) = 0;

    virtual ContainerInfo InspectContainer(const std::string& container_id) = 0;

    virtual ContainerStats GetContainerStats(const std::string& container_id) = 0;
};

/**
 * @class DockerEngine
 * @brief ContainerEngine backed by the Docker CLI
 *
 * **Usage Example**:
 * @code
 * DockerEngine docker;
 *
 * ContainerConfig config;
 * config.name = "sandbox_1";
 * config.image = "sandbox-image";
 * config.memory_limit_bytes = 512ULL * 1024 * 1024;
 * config.port_mappings[8000] = 8000;
 *
 * auto id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 * auto stats = docker.GetContainerStats(id);
 * docker.StopContainer(id, std::chrono::seconds(10));
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class DockerEngine : public ContainerEngine {
public:
    /**
     * @param binary Docker executable (looked up on PATH when not absolute)
     */
    explicit DockerEngine(std::string binary = "docker");

    /// True if `docker --version` succeeds
    static bool IsRuntimeAvailable(const std::string& binary = "docker");

    /// Engine version ("24.0.7") or "unknown"
    static std::string GetRuntimeVersion(const std::string& binary = "docker");

    bool ImageExists(const std::string& image) override;
    std::optional<std::chrono::system_clock::time_point> GetImageCreatedTime(
        const std::string& image) override;
    std::string BuildImage(const std::string& image,
                           const std::filesystem::path& dockerfile,
                           const std::filesystem::path& context) override;
    std::string CreateContainer(const ContainerConfig& config) override;
    void StartContainer(const std::string& container_id) override;
    void StopContainer(const std::string& container_id,
                       std::chrono::seconds grace) override;
    void RemoveContainer(const std::string& container_id, bool force) override;
    ContainerInfo InspectContainer(const std::string& container_id) override;
    ContainerStats GetContainerStats(const std::string& container_id) override;

    /***************************************************************************
     * Command construction and output parsing
     ***************************************************************************/

    /// Arguments of `docker create` for a config (without the binary)
    static std::vector<std::string> BuildCreateCommand(const ContainerConfig& config);

    /// Parse `docker inspect` JSON (array or single object)
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    /// Parse one `docker stats --format {{json .}}` line
    static ContainerStats ParseStatsOutput(const std::string& json_str);

    static ContainerState ParseState(const std::string& state_str);
    static std::string StateToString(ContainerState state);

private:
    std::string binary_;  ///< Docker executable

    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;

    /// Execute and throw EngineError on a non-zero exit
    std::string RunOrThrow(const std::vector<std::string>& args,
                           const std::string& action) const;
};

} // namespace utils
} // namespace sandbridge
