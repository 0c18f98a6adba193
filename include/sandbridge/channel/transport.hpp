/**
 * @file transport.hpp
 * @brief Text-frame duplex connection used by the control channel
 *
 * A Transport is owned by exactly one thread (the channel worker) and is not
 * thread-safe. It may be reconnected after Close().
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sandbridge {
namespace channel {

/**
 * @class Transport
 * @brief Connection seam between ControlChannel and the network
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Open a connection to ws://host:port/target
     * @throws ConnectionError if the connection or handshake fails or times out
     */
    virtual void Connect(const std::string& host, std::uint16_t port,
                         const std::string& target,
                         std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Send one text frame
     * @throws ConnectionError if the connection is not open or the write fails
     */
    virtual void Send(const std::string& text) = 0;

    /**
     * @brief Wait up to timeout for one text frame
     * @return The frame, or std::nullopt if nothing arrived in time
     * @throws ConnectionError if the connection closed or failed
     */
    virtual std::optional<std::string> Receive(std::chrono::milliseconds timeout) = 0;

    /// Close the connection; no-op when not open
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;
};

} // namespace channel
} // namespace sandbridge
