/**
 * @file sandbox_controller.cpp
 * @brief Implementation of the sandbox lifecycle state machine
 *
 * **Container Hardening** (bound at creation):
 * - `--cpus`, `--memory`, `--memory-swap` = memory (no swap beyond the ceiling)
 * - `--pids-limit` against fork bombs
 * - `--read-only` root with tmpfs for the writable paths
 * - `--cap-drop ALL` and `--security-opt no-new-privileges`
 * - bridge network with a single published control port
 *
 * Every engine failure moves the instance to FAILED before the exception
 * reaches the caller.
 *
 * @date 2025
 */

#include "sandbridge/core/sandbox_controller.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/core/image_builder.hpp"

#include <spdlog/spdlog.h>

#include <random>
#include <sstream>
#include <vector>

namespace sandbridge {
namespace core {

namespace {

constexpr const char* kManagedLabel = "sandbridge.managed";

std::string GenerateContainerName() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::uint32_t> dist;

    std::ostringstream oss;
    oss << "sandbridge_" << std::hex << dist(gen);
    return oss.str();
}

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxController::SandboxController(SandboxSpec spec,
                                     std::shared_ptr<utils::ContainerEngine> engine,
                                     ReadinessProbe probe)
    : spec_(std::move(spec))
    , engine_(std::move(engine))
    , probe_(std::move(probe)) {
    ValidateSpec(spec_);
    if (!engine_) {
        throw ConfigError("container engine must not be null");
    }
    container_name_ = spec_.container_name.empty() ? GenerateContainerName()
                                                   : spec_.container_name;
}

SandboxController::~SandboxController() {
    std::string container_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        container_id = container_id_;
    }
    if (container_id.empty()) {
        return;
    }

    try {
        engine_->RemoveContainer(container_id, true);
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove container {} on shutdown: {}",
                      ShortId(container_id), e.what());
    }
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SandboxController::EnsureImage() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    RequireState(SandboxState::UNBUILT, "EnsureImage");
    Transition(SandboxState::BUILDING);

    try {
        ImageBuilder builder(*engine_);
        builder.EnsureImage(spec_);
    } catch (const ImageBuildError& e) {
        Fail(e.what());
        throw;
    }
}

void SandboxController::Create() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    RequireState(SandboxState::BUILDING, "Create");

    std::string container_id;
    try {
        container_id = engine_->CreateContainer(BuildContainerConfig());
    } catch (const EngineError& e) {
        Fail(e.what());
        throw ContainerStartError(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        container_id_ = container_id;
        created_at_ = std::chrono::system_clock::now();
    }
    Transition(SandboxState::CREATED);
}

void SandboxController::Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    RequireState(SandboxState::CREATED, "Start");

    const std::string container_id = ContainerId();
    Transition(SandboxState::STARTING);

    try {
        engine_->StartContainer(container_id);
    } catch (const EngineError& e) {
        Fail(e.what());
        throw ContainerStartError(e.what());
    }

    WaitForReadiness(container_id);
    Transition(SandboxState::RUNNING);
}

void SandboxController::EnsureRunning() {
    switch (State()) {
        case SandboxState::UNBUILT:
            EnsureImage();
            Create();
            Start();
            break;
        case SandboxState::BUILDING:
            Create();
            Start();
            break;
        case SandboxState::CREATED:
            Start();
            break;
        case SandboxState::RUNNING:
            break;
        default:
            throw InvalidStateError("cannot ensure running sandbox in state " +
                                    StateToString(State()));
    }
}

bool SandboxController::CheckHealth() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (State() != SandboxState::RUNNING) {
        return false;
    }

    try {
        auto info = engine_->InspectContainer(ContainerId());
        if (info.state == utils::ContainerState::RUNNING) {
            return true;
        }
        std::string reason = "container exited unexpectedly (exit code " +
                             std::to_string(info.exit_code) + ")";
        if (info.oom_killed) {
            reason += ", killed by memory limit";
        }
        Fail(reason);
    } catch (const EngineError& e) {
        Fail(std::string("container vanished: ") + e.what());
    }
    return false;
}

void SandboxController::Stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SandboxState::STARTING) {
            stop_requested_ = true;
            stop_cv_.notify_all();
        }
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    const auto current = State();
    if (current != SandboxState::RUNNING && current != SandboxState::STARTING) {
        throw InvalidStateError("Stop not allowed in state " + StateToString(current));
    }

    const std::string container_id = ContainerId();
    Transition(SandboxState::STOPPING);

    try {
        engine_->StopContainer(container_id,
                               std::chrono::duration_cast<std::chrono::seconds>(spec_.stop_grace));
    } catch (const EngineError& e) {
        Fail(e.what());
        throw;
    }

    Transition(SandboxState::STOPPED);
}

void SandboxController::Destroy() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    const auto current = State();
    if (current != SandboxState::CREATED && current != SandboxState::STOPPED &&
        current != SandboxState::FAILED) {
        throw InvalidStateError("Destroy not allowed in state " + StateToString(current));
    }

    const std::string container_id = ContainerId();
    if (container_id.empty()) {
        return;
    }

    try {
        engine_->RemoveContainer(container_id, true);
    } catch (const EngineError& e) {
        Fail(e.what());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        container_id_.clear();
        created_at_.reset();
    }
    spdlog::info("Container {} removed", ShortId(container_id));

    if (current == SandboxState::CREATED) {
        Transition(SandboxState::STOPPED);
    }
}

// ============================================================================
// STATUS
// ============================================================================

SandboxMetrics SandboxController::Status() const {
    SandboxMetrics metrics;
    metrics.sampled_at = std::chrono::system_clock::now();

    std::string container_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics.state = state_;
        container_id = container_id_;
    }

    // No container bound: nothing to ask the engine
    if (container_id.empty()) {
        metrics.reachable = true;
        return metrics;
    }

    metrics.container_exists = true;
    metrics.container_id = container_id;

    try {
        auto info = engine_->InspectContainer(container_id);
        metrics.container_state = info.state;
        metrics.read_only = info.read_only_rootfs;
        metrics.network_mode = info.network_mode;
        metrics.caps_dropped = !info.capabilities_dropped.empty();
        metrics.memory_limit_bytes = info.memory_limit_bytes;

        if (info.state == utils::ContainerState::RUNNING) {
            auto stats = engine_->GetContainerStats(container_id);
            metrics.cpu_percent = stats.cpu_usage_percent;
            metrics.memory_percent = stats.memory_usage_percent;
            metrics.memory_usage_bytes = stats.memory_usage_bytes;
            if (stats.memory_limit_bytes > 0) {
                metrics.memory_limit_bytes = stats.memory_limit_bytes;
            }
            metrics.process_count = stats.process_count;

            if (info.started_at) {
                metrics.uptime = std::chrono::duration_cast<std::chrono::seconds>(
                    metrics.sampled_at - *info.started_at);
            }
        }
        metrics.reachable = true;
    } catch (const std::exception& e) {
        metrics.reachable = false;
        metrics.error = e.what();
        spdlog::debug("Status query for {} failed: {}", ShortId(container_id), e.what());
    }

    return metrics;
}

SandboxState SandboxController::State() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string SandboxController::ContainerId() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return container_id_;
}

std::string SandboxController::FailureReason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_reason_;
}

std::optional<std::chrono::system_clock::time_point> SandboxController::CreatedAt() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return created_at_;
}

// ============================================================================
// LISTENERS
// ============================================================================

std::uint64_t SandboxController::AddStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const auto id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void SandboxController::RemoveStateListener(std::uint64_t listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(listener_id);
}

std::string SandboxController::StateToString(SandboxState state) {
    switch (state) {
        case SandboxState::UNBUILT: return "unbuilt";
        case SandboxState::BUILDING: return "building";
        case SandboxState::CREATED: return "created";
        case SandboxState::STARTING: return "starting";
        case SandboxState::RUNNING: return "running";
        case SandboxState::STOPPING: return "stopping";
        case SandboxState::STOPPED: return "stopped";
        case SandboxState::FAILED: return "failed";
        default: return "unknown";
    }
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

void SandboxController::Transition(SandboxState to) {
    SandboxState from;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        from = state_;
        state_ = to;
        if (to != SandboxState::STARTING) {
            stop_requested_ = false;
        }
    }

    if (to == SandboxState::FAILED) {
        spdlog::error("Sandbox {}: {} → {}", container_name_, StateToString(from), StateToString(to));
    } else {
        spdlog::info("Sandbox {}: {} → {}", container_name_, StateToString(from), StateToString(to));
    }

    // Listeners run outside the locks so they may query the controller
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        listener(from, to);
    }
}

void SandboxController::Fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure_reason_ = reason;
    }
    spdlog::error("Sandbox {} failed: {}", container_name_, reason);
    Transition(SandboxState::FAILED);
}

void SandboxController::RequireState(SandboxState expected, const char* operation) const {
    const auto current = State();
    if (current != expected) {
        throw InvalidStateError(std::string(operation) + " not allowed in state " +
                                StateToString(current));
    }
}

void SandboxController::WaitForReadiness(const std::string& container_id) {
    spdlog::info("Waiting for control endpoint {} ({} attempts, {}ms apart)",
                 EndpointUrl(spec_), spec_.readiness_retries, spec_.readiness_delay.count());

    for (int attempt = 1; attempt <= spec_.readiness_retries; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (stop_requested_) {
                throw InvalidStateError("start interrupted by stop");
            }
        }

        utils::ContainerInfo info;
        try {
            info = engine_->InspectContainer(container_id);
        } catch (const EngineError& e) {
            Fail(e.what());
            throw ContainerStartError(e.what());
        }

        if (info.state == utils::ContainerState::EXITED ||
            info.state == utils::ContainerState::DEAD) {
            const std::string reason = "container exited during startup with code " +
                                       std::to_string(info.exit_code);
            Fail(reason);
            throw ContainerStartError(reason);
        }

        if (info.state == utils::ContainerState::RUNNING) {
            if (!probe_ || probe_(spec_)) {
                spdlog::info("✓ Control endpoint ready after {} attempt(s)", attempt);
                return;
            }
        }
        spdlog::debug("Readiness attempt {}/{} failed", attempt, spec_.readiness_retries);

        if (attempt < spec_.readiness_retries) {
            std::unique_lock<std::mutex> lock(state_mutex_);
            stop_cv_.wait_for(lock, spec_.readiness_delay, [this] { return stop_requested_; });
        }
    }

    // A stop that arrived during the last attempt wins over the timeout
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_requested_) {
            throw InvalidStateError("start interrupted by stop");
        }
    }

    const std::string reason = "no answer from " + EndpointUrl(spec_) + " after " +
                               std::to_string(spec_.readiness_retries) + " attempts";
    Fail(reason);
    throw ReadinessTimeoutError(reason);
}

utils::ContainerConfig SandboxController::BuildContainerConfig() const {
    utils::ContainerConfig config;
    config.name = container_name_;
    config.image = spec_.image_name;

    config.cpu_limit = spec_.limits.cpu_limit;
    config.memory_limit_bytes = spec_.limits.memory_limit_bytes;
    config.memory_swap_bytes = spec_.limits.memory_limit_bytes;
    config.pids_limit = spec_.limits.max_processes;

    config.network_mode = "bridge";
    config.port_mappings[spec_.host_port] = spec_.container_port;

    config.read_only_rootfs = true;
    config.no_new_privileges = true;
    config.capabilities_drop = spec_.capabilities_drop;
    config.capabilities_add = spec_.capabilities_add;
    config.group_add = spec_.group_add;
    config.seccomp_profile = spec_.seccomp_profile;
    config.user = spec_.user;
    config.tmpfs_mounts = spec_.tmpfs_mounts;

    config.labels[kManagedLabel] = "true";
    return config;
}

} // namespace core
} // namespace sandbridge
