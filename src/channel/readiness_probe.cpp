/**
 * @file readiness_probe.cpp
 * @brief Heartbeat round-trip readiness probe
 *
 * @date 2025
 */

#include "sandbridge/channel/readiness_probe.hpp"

#include "sandbridge/channel/websocket_transport.hpp"
#include "sandbridge/core/errors.hpp"
#include "sandbridge/protocol/message_codec.hpp"

#include <spdlog/spdlog.h>

namespace sandbridge {
namespace channel {

HandshakeProbe::HandshakeProbe()
    : factory_([]() { return std::make_unique<WebSocketTransport>(); }) {}

HandshakeProbe::HandshakeProbe(TransportFactory factory)
    : factory_(std::move(factory)) {}

bool HandshakeProbe::operator()(const core::SandboxSpec& spec) const {
    using protocol::MessageCodec;

    const auto deadline = std::chrono::steady_clock::now() + spec.probe_timeout;
    auto transport = factory_();

    try {
        transport->Connect(spec.host, spec.host_port, spec.endpoint_path, spec.probe_timeout);
        transport->Send(MessageCodec::Encode(protocol::Heartbeat{}));

        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                spdlog::debug("Readiness probe: no heartbeat reply within {}ms",
                              spec.probe_timeout.count());
                break;
            }

            auto frame = transport->Receive(remaining);
            if (!frame) {
                continue;
            }

            try {
                if (std::holds_alternative<protocol::Heartbeat>(MessageCodec::Decode(*frame))) {
                    transport->Close();
                    return true;
                }
            } catch (const ProtocolDecodeError& e) {
                spdlog::debug("Readiness probe ignoring frame: {}", e.what());
            }
        }
    } catch (const ConnectionError& e) {
        spdlog::debug("Readiness probe failed: {}", e.what());
    }

    transport->Close();
    return false;
}

} // namespace channel
} // namespace sandbridge
