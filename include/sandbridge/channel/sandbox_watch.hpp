/**
 * @file sandbox_watch.hpp
 * @brief Ties a control channel to the lifecycle of its sandbox
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/channel/control_channel.hpp"
#include "sandbridge/core/sandbox_controller.hpp"

#include <cstdint>

namespace sandbridge {
namespace channel {

/**
 * @class SandboxWatch
 * @brief While alive, a stopping or failed sandbox drops the channel session
 *
 * Both the controller and the channel must outlive the watch.
 *
 * **Usage Example**:
 * @code
 * SandboxWatch watch(sandbox, channel);
 * sandbox.Stop();   // channel moves to DISCONNECTED instead of stalling
 * @endcode
 */
class SandboxWatch {
public:
    SandboxWatch(core::SandboxController& controller, ControlChannel& channel)
        : controller_(controller) {
        listener_id_ = controller_.AddStateListener(
            [&channel](core::SandboxState, core::SandboxState to) {
                if (to == core::SandboxState::STOPPING ||
                    to == core::SandboxState::STOPPED ||
                    to == core::SandboxState::FAILED) {
                    channel.NotifyPeerLost("sandbox " + core::SandboxController::StateToString(to));
                }
            });
    }

    ~SandboxWatch() {
        controller_.RemoveStateListener(listener_id_);
    }

    SandboxWatch(const SandboxWatch&) = delete;
    SandboxWatch& operator=(const SandboxWatch&) = delete;

private:
    core::SandboxController& controller_;  ///< Watched controller
    std::uint64_t listener_id_{0};         ///< Registered listener
};

} // namespace channel
} // namespace sandbridge
