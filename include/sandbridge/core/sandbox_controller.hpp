/**
 * @file sandbox_controller.hpp
 * @brief Lifecycle state machine of one sandbox container
 *
 * A SandboxController owns exactly one container instance created from an
 * immutable SandboxSpec. Resource ceilings are bound when the container is
 * created and cannot be changed afterwards; a different limit means a new
 * controller with a new spec.
 *
 * **State Machine**:
 * ```
 * UNBUILT ──EnsureImage──▶ BUILDING ──Create──▶ CREATED ──Start──▶ STARTING ──ready──▶ RUNNING
 *                              │                   │                  │                   │
 *                              └────── error ──────┴───── error ──────┘                 Stop
 *                                         ▼                                               ▼
 *                                       FAILED                         STOPPED ◀──── STOPPING
 * ```
 *
 * FAILED and STOPPED are terminal. Destroy() removes the container in
 * CREATED, STOPPED and FAILED.
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/core/sandbox_spec.hpp"
#include "sandbridge/utils/container_utils.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sandbridge {
namespace core {

/**
 * @enum SandboxState
 * @brief Lifecycle state of a sandbox instance
 */
enum class SandboxState {
    UNBUILT,    ///< Image not yet ensured
    BUILDING,   ///< Image being ensured, or ensured and awaiting Create()
    CREATED,    ///< Container created with limits bound, not started
    STARTING,   ///< Container started, readiness not yet confirmed
    RUNNING,    ///< Control endpoint confirmed ready
    STOPPING,   ///< Graceful stop in progress
    STOPPED,    ///< Stopped (terminal)
    FAILED      ///< Lifecycle error (terminal)
};

/**
 * @struct SandboxMetrics
 * @brief Point-in-time sample returned by SandboxController::Status()
 *
 * A failed engine query yields reachable = false and the error text; it is
 * never raised as an exception.
 */
struct SandboxMetrics {
    bool reachable{false};                       ///< Engine query succeeded
    std::string error;                           ///< Query failure reason

    SandboxState state{SandboxState::UNBUILT};   ///< Controller state at sample time
    bool container_exists{false};                ///< A container is currently bound
    std::string container_id;                    ///< Full container ID
    utils::ContainerState container_state{utils::ContainerState::UNKNOWN};  ///< Engine-reported state

    // Resource usage (zero unless the container is running)
    double cpu_percent{0.0};                     ///< CPU utilisation
    double memory_percent{0.0};                  ///< Memory utilisation
    std::uint64_t memory_usage_bytes{0};         ///< Memory in use
    std::uint64_t memory_limit_bytes{0};         ///< Memory ceiling
    int process_count{0};                        ///< Active processes
    std::optional<std::chrono::seconds> uptime;  ///< Time since start, when running

    // Security flags as applied by the engine
    bool read_only{false};                       ///< Read-only root filesystem
    std::string network_mode;                    ///< Network mode
    bool caps_dropped{false};                    ///< Any capability dropped

    std::chrono::system_clock::time_point sampled_at;  ///< Sample time
};

/// Readiness check of the control endpoint; true once the service answers
using ReadinessProbe = std::function<bool(const SandboxSpec&)>;

/// Called on every state transition (from, to)
using StateListener = std::function<void(SandboxState, SandboxState)>;

/**
 * @class SandboxController
 * @brief Builds, creates, starts, monitors, stops and removes one container
 *
 * **Thread Safety**: lifecycle calls are serialised against each other and
 * may run concurrently with Status() and state queries. Stop() interrupts a
 * Start() that is waiting for readiness.
 *
 * **Usage Example**:
 * @code
 * auto engine = std::make_shared<utils::DockerEngine>();
 * SandboxController sandbox(spec, engine, channel::HandshakeProbe());
 *
 * sandbox.EnsureRunning();          // build if needed, create, start, wait ready
 * auto metrics = sandbox.Status();  // never throws
 * sandbox.Stop();
 * sandbox.Destroy();
 * @endcode
 */
class SandboxController {
public:
    /**
     * @param spec Validated sandbox spec
     * @param engine Container engine
     * @param probe Readiness probe; when empty, a running container counts as ready
     * @throws ConfigError if the SandboxSpec is invalid
     */
    SandboxController(SandboxSpec spec,
                      std::shared_ptr<utils::ContainerEngine> engine,
                      ReadinessProbe probe = nullptr);

    /// Removes a container that is still bound; errors are logged
    ~SandboxController();

    SandboxController(const SandboxController&) = delete;
    SandboxController& operator=(const SandboxController&) = delete;

    /**
     * @brief UNBUILT → BUILDING; build the image if missing, forced or stale
     * @throws ImageBuildError after moving to FAILED
     * @throws InvalidStateError if not UNBUILT
     */
    void EnsureImage();

    /**
     * @brief BUILDING → CREATED; create the container with all limits bound
     * @throws ContainerStartError after moving to FAILED
     * @throws InvalidStateError if not BUILDING
     */
    void Create();

    /**
     * @brief CREATED → STARTING → RUNNING
     *
     * Starts the container and probes the control endpoint up to
     * readiness_retries times, readiness_delay apart. The container is
     * inspected before each probe.
     *
     * @throws ContainerStartError if the start fails or the container exits
     * @throws ReadinessTimeoutError if the probe never succeeds
     * @throws InvalidStateError if not CREATED, or if Stop() interrupted the wait
     */
    void Start();

    /// EnsureImage(), Create() and Start() from whatever step the instance is at
    void EnsureRunning();

    /**
     * @brief Verify a RUNNING container is still running
     * @return false (after moving to FAILED) if it exited or vanished
     */
    bool CheckHealth();

    /**
     * @brief RUNNING → STOPPING → STOPPED (SIGTERM, SIGKILL after stop_grace)
     * @throws EngineError after moving to FAILED
     * @throws InvalidStateError if not RUNNING or STARTING
     */
    void Stop();

    /**
     * @brief Remove the container and invalidate its ID
     * @throws InvalidStateError unless CREATED, STOPPED or FAILED
     * @throws EngineError after moving to FAILED
     */
    void Destroy();

    /// One synchronous engine query; never throws
    SandboxMetrics Status() const;

    SandboxState State() const;

    /// Container ID, empty before Create() and after Destroy()
    std::string ContainerId() const;

    /// Reason of the last failure, empty unless FAILED
    std::string FailureReason() const;

    /// Creation time of the bound container
    std::optional<std::chrono::system_clock::time_point> CreatedAt() const;

    const SandboxSpec& Spec() const { return spec_; }

    /// Register a transition listener; returns an ID for RemoveStateListener()
    std::uint64_t AddStateListener(StateListener listener);
    void RemoveStateListener(std::uint64_t listener_id);

    static std::string StateToString(SandboxState state);

private:
    SandboxSpec spec_;                                 ///< Immutable spec
    std::shared_ptr<utils::ContainerEngine> engine_;   ///< Container engine
    ReadinessProbe probe_;                             ///< Readiness probe
    std::string container_name_;                       ///< Name used at creation

    std::mutex lifecycle_mutex_;                       ///< Serialises lifecycle calls
    mutable std::mutex state_mutex_;                   ///< Guards the fields below
    std::condition_variable stop_cv_;                  ///< Wakes the readiness wait
    SandboxState state_{SandboxState::UNBUILT};        ///< Current state
    std::string container_id_;                         ///< Bound container
    std::string failure_reason_;                       ///< Last failure
    std::optional<std::chrono::system_clock::time_point> created_at_;  ///< Container creation time
    bool stop_requested_{false};                       ///< Set by Stop()

    std::mutex listeners_mutex_;                       ///< Guards listeners_
    std::map<std::uint64_t, StateListener> listeners_; ///< Transition listeners
    std::uint64_t next_listener_id_{1};                ///< Next listener ID

    void Transition(SandboxState to);
    void Fail(const std::string& reason);
    void RequireState(SandboxState expected, const char* operation) const;
    void WaitForReadiness(const std::string& container_id);
    utils::ContainerConfig BuildContainerConfig() const;
};

} // namespace core
} // namespace sandbridge
