/**
 * @file websocket_transport.hpp
 * @brief Boost.Beast WebSocket client implementing Transport
 *
 * All operations are asynchronous Beast operations driven on a private
 * io_context by the calling thread, which gives every call a bounded wait
 * while a single read stays outstanding between Receive() calls.
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/channel/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <memory>

namespace sandbridge {
namespace channel {

/**
 * @class WebSocketTransport
 * @brief Plain (ws://) WebSocket client connection
 *
 * **Usage Example**:
 * @code
 * WebSocketTransport ws;
 * ws.Connect("127.0.0.1", 8000, "/", std::chrono::seconds(5));
 * ws.Send(R"({"type":"heartbeat"})");
 * if (auto frame = ws.Receive(std::chrono::seconds(1))) {
 *     spdlog::info("Received: {}", *frame);
 * }
 * ws.Close();
 * @endcode
 */
class WebSocketTransport : public Transport {
public:
    /**
     * @param write_timeout Upper bound of a single Send()
     */
    explicit WebSocketTransport(std::chrono::milliseconds write_timeout = std::chrono::seconds(5));
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void Connect(const std::string& host, std::uint16_t port,
                 const std::string& target,
                 std::chrono::milliseconds timeout) override;
    void Send(const std::string& text) override;
    std::optional<std::string> Receive(std::chrono::milliseconds timeout) override;
    void Close() override;
    bool IsOpen() const override;

private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    boost::asio::io_context ioc_;                ///< Driven by the calling thread
    std::unique_ptr<Stream> ws_;                 ///< Current connection
    std::chrono::milliseconds write_timeout_;    ///< Send() bound

    boost::beast::flat_buffer buffer_;           ///< Read buffer
    bool read_pending_{false};                   ///< async_read outstanding
    bool read_done_{false};                      ///< Outstanding read completed
    boost::beast::error_code read_ec_;           ///< Result of the completed read
    bool open_{false};                           ///< Handshake completed and not failed

    /// Run the io_context until done is set or the deadline passes
    bool RunUntil(const bool& done, std::chrono::steady_clock::time_point deadline);

    /// Cancel everything outstanding and drop the stream
    void Teardown();
};

} // namespace channel
} // namespace sandbridge
