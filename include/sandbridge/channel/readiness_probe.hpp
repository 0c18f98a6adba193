/**
 * @file readiness_probe.hpp
 * @brief Readiness handshake against a sandbox control endpoint
 *
 * An open port is not readiness: the service inside the container may
 * accept TCP before it speaks the protocol. The probe connects, sends a
 * heartbeat and requires a heartbeat back within SandboxSpec::probe_timeout.
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/channel/transport.hpp"
#include "sandbridge/core/sandbox_spec.hpp"

#include <functional>
#include <memory>

namespace sandbridge {
namespace channel {

/**
 * @class HandshakeProbe
 * @brief Callable usable as a core::ReadinessProbe
 *
 * **Usage Example**:
 * @code
 * core::SandboxController sandbox(spec, engine, HandshakeProbe());
 * @endcode
 */
class HandshakeProbe {
public:
    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    /// Probe over a fresh WebSocketTransport per attempt
    HandshakeProbe();

    explicit HandshakeProbe(TransportFactory factory);

    /// One handshake attempt; false on any failure
    bool operator()(const core::SandboxSpec& spec) const;

private:
    TransportFactory factory_;  ///< Creates the probe connection
};

} // namespace channel
} // namespace sandbridge
