/**
 * @file status_reporter.hpp
 * @brief Polled, read-only status of tracked sandboxes for the dashboard
 *
 * The reporter never mutates a sandbox. Each poll queries every tracked
 * controller once, maps the result to a StatusSnapshot and swaps the whole
 * list in one step, so readers always see one complete poll.
 *
 * **Dashboard Document** (ToJson):
 * ```
 * {
 *   "containers": [{
 *     "name": "default",
 *     "container": {"status": "running", "id": "3f2a9c1b7d4e", "uptime": "1h 15m"},
 *     "resources": {"cpu": 12.5, "memory": 40.1, "memoryUsed": "410MB", "memoryLimit": "1024MB"},
 *     "security":  {"readOnly": true, "networkMode": "bridge", "capsDropped": true},
 *     "processCount": 7,
 *     "error": false,
 *     "errorMessage": ""
 *   }],
 *   "updatedAt": "2025-01-31T12:00:00Z"
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/core/sandbox_controller.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sandbridge {
namespace monitor {

using json = nlohmann::json;

/**
 * @struct ReporterConfig
 * @brief Poll settings
 */
struct ReporterConfig {
    std::chrono::milliseconds poll_interval{2000};  ///< Time between polls
};

/**
 * @struct StatusSnapshot
 * @brief One sandbox as shown on the dashboard
 */
struct StatusSnapshot {
    std::string name;                 ///< Tracking name
    std::string id{"-"};              ///< Short container ID
    std::string status{"stopped"};    ///< Human status label
    std::string uptime{"-"};          ///< "1h 15m", "5m" or "-"

    double cpu_percent{0.0};          ///< CPU utilisation
    double memory_percent{0.0};       ///< Memory utilisation
    std::string memory_used{"0MB"};   ///< Memory in use
    std::string memory_limit;         ///< Memory ceiling

    bool read_only{false};            ///< Read-only root filesystem
    std::string network_mode{"bridge"};  ///< Network mode
    bool caps_dropped{false};         ///< Capabilities dropped
    int process_count{0};             ///< Active processes

    bool error{false};                ///< Status query failed
    std::string error_message;        ///< Failure reason
};

using SnapshotList = std::vector<StatusSnapshot>;

/**
 * @class StatusReporter
 * @brief Background poller over tracked sandbox controllers
 *
 * **Usage Example**:
 * @code
 * StatusReporter reporter;
 * reporter.Track("default", sandbox);
 * reporter.Start();
 * ...
 * auto snapshots = reporter.Snapshots();   // never a partial poll
 * std::cout << reporter.ToJson().dump(2);
 * reporter.Stop();
 * @endcode
 */
class StatusReporter {
public:
    explicit StatusReporter(ReporterConfig config = ReporterConfig{});
    ~StatusReporter();

    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    /// Track a controller; a name already tracked is replaced in place
    void Track(const std::string& name, std::shared_ptr<const core::SandboxController> controller);

    /// Stop tracking; false if the name was unknown
    bool Untrack(const std::string& name);

    /// Start polling in the background (first poll is immediate)
    void Start();

    /// Stop polling and join the poll thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Poll every tracked controller once and publish the result
    void PollOnce();

    /// Latest published list, in tracking order
    std::shared_ptr<const SnapshotList> Snapshots() const;

    /// Latest published list as the dashboard document
    json ToJson() const;

    /**
     * @brief Map one metrics sample to its dashboard entry
     * @param configured_memory_limit Shown as the limit when the engine reports none
     */
    static StatusSnapshot MakeSnapshot(const std::string& name,
                                       const core::SandboxMetrics& metrics,
                                       std::uint64_t configured_memory_limit);

    static json SnapshotToJson(const StatusSnapshot& snapshot);

private:
    ReporterConfig config_;

    mutable std::mutex tracked_mutex_;
    std::vector<std::pair<std::string, std::shared_ptr<const core::SandboxController>>> tracked_;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const SnapshotList> snapshots_;       ///< Latest poll
    std::chrono::system_clock::time_point updated_at_;   ///< Time of the latest poll

    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread worker_;

    void RunLoop();
};

} // namespace monitor
} // namespace sandbridge
