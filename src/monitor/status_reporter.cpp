/**
 * @file status_reporter.cpp
 * @brief Implementation of the dashboard status poller
 *
 * @date 2025
 */

#include "sandbridge/monitor/status_reporter.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace sandbridge {
namespace monitor {

using utils::StringUtils;

namespace {

double RoundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::string StatusLabel(utils::ContainerState state) {
    if (state == utils::ContainerState::EXITED) {
        return "stopped";
    }
    return utils::DockerEngine::StateToString(state);
}

} // anonymous namespace

StatusReporter::StatusReporter(ReporterConfig config)
    : config_(config)
    , snapshots_(std::make_shared<const SnapshotList>())
    , updated_at_(std::chrono::system_clock::now()) {}

StatusReporter::~StatusReporter() {
    Stop();
}

// ============================================================================
// TRACKING
// ============================================================================

void StatusReporter::Track(const std::string& name,
                           std::shared_ptr<const core::SandboxController> controller) {
    if (!controller) {
        throw ConfigError("cannot track '" + name + "': controller is null");
    }

    std::lock_guard<std::mutex> lock(tracked_mutex_);
    for (auto& entry : tracked_) {
        if (entry.first == name) {
            entry.second = std::move(controller);
            return;
        }
    }
    tracked_.emplace_back(name, std::move(controller));
    spdlog::debug("Tracking sandbox '{}'", name);
}

bool StatusReporter::Untrack(const std::string& name) {
    std::lock_guard<std::mutex> lock(tracked_mutex_);
    for (auto it = tracked_.begin(); it != tracked_.end(); ++it) {
        if (it->first == name) {
            tracked_.erase(it);
            return true;
        }
    }
    return false;
}

// ============================================================================
// POLLING
// ============================================================================

void StatusReporter::Start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Status reporter started (every {}ms)", config_.poll_interval.count());
    worker_ = std::thread([this]() { RunLoop(); });
}

void StatusReporter::Stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Status reporter stopped");
}

void StatusReporter::PollOnce() {
    decltype(tracked_) tracked;
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        tracked = tracked_;
    }

    auto snapshots = std::make_shared<SnapshotList>();
    snapshots->reserve(tracked.size());

    for (const auto& [name, controller] : tracked) {
        // Status() never throws; failures come back as reachable = false
        const auto metrics = controller->Status();
        snapshots->push_back(MakeSnapshot(name, metrics,
                                          controller->Spec().limits.memory_limit_bytes));
        if (!metrics.reachable) {
            spdlog::warn("Status of sandbox '{}' unavailable: {}", name, metrics.error);
        }
    }

    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshots_ = std::move(snapshots);
    updated_at_ = std::chrono::system_clock::now();
}

void StatusReporter::RunLoop() {
    while (running_) {
        PollOnce();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, config_.poll_interval, [this] { return !running_.load(); });
    }
}

// ============================================================================
// READ PATH
// ============================================================================

std::shared_ptr<const SnapshotList> StatusReporter::Snapshots() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshots_;
}

json StatusReporter::ToJson() const {
    std::shared_ptr<const SnapshotList> snapshots;
    std::chrono::system_clock::time_point updated_at;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshots = snapshots_;
        updated_at = updated_at_;
    }

    json containers = json::array();
    for (const auto& snapshot : *snapshots) {
        containers.push_back(SnapshotToJson(snapshot));
    }

    return {
        {"containers", containers},
        {"updatedAt", StringUtils::FormatTimestamp(updated_at)}
    };
}

// ============================================================================
// MAPPING
// ============================================================================

StatusSnapshot StatusReporter::MakeSnapshot(const std::string& name,
                                            const core::SandboxMetrics& metrics,
                                            std::uint64_t configured_memory_limit) {
    StatusSnapshot snapshot;
    snapshot.name = name;
    snapshot.memory_limit = StringUtils::FormatMegabytes(configured_memory_limit);

    if (!metrics.reachable) {
        snapshot.status = "error";
        snapshot.error = true;
        snapshot.error_message = metrics.error;
        return snapshot;
    }

    // Never created, or removed
    if (!metrics.container_exists) {
        return snapshot;
    }

    snapshot.id = metrics.container_id.substr(0, 12);
    snapshot.status = StatusLabel(metrics.container_state);
    snapshot.read_only = metrics.read_only;
    snapshot.network_mode = metrics.network_mode.empty() ? "bridge" : metrics.network_mode;
    snapshot.caps_dropped = metrics.caps_dropped;
    if (metrics.memory_limit_bytes > 0) {
        snapshot.memory_limit = StringUtils::FormatMegabytes(metrics.memory_limit_bytes);
    }

    // Usage figures only mean something while the container runs
    if (metrics.container_state == utils::ContainerState::RUNNING) {
        snapshot.cpu_percent = RoundToTenth(metrics.cpu_percent);
        snapshot.memory_percent = RoundToTenth(metrics.memory_percent);
        snapshot.memory_used = StringUtils::FormatMegabytes(metrics.memory_usage_bytes);
        snapshot.process_count = metrics.process_count;
        if (metrics.uptime) {
            snapshot.uptime = StringUtils::FormatUptime(*metrics.uptime);
        }
    }

    return snapshot;
}

json StatusReporter::SnapshotToJson(const StatusSnapshot& snapshot) {
    return {
        {"name", snapshot.name},
        {"container", {
            {"status", snapshot.status},
            {"id", snapshot.id},
            {"uptime", snapshot.uptime}
        }},
        {"resources", {
            {"cpu", snapshot.cpu_percent},
            {"memory", snapshot.memory_percent},
            {"memoryUsed", snapshot.memory_used},
            {"memoryLimit", snapshot.memory_limit}
        }},
        {"security", {
            {"readOnly", snapshot.read_only},
            {"networkMode", snapshot.network_mode},
            {"capsDropped", snapshot.caps_dropped}
        }},
        {"processCount", snapshot.process_count},
        {"error", snapshot.error},
        {"errorMessage", snapshot.error_message}
    };
}

} // namespace monitor
} // namespace sandbridge
