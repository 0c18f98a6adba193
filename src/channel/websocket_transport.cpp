/**
 * @file websocket_transport.cpp
 * @brief Boost.Beast WebSocket client
 *
 * The io_context is only ever run by the thread calling into the transport.
 * One async_read stays outstanding across Receive() calls so a timed-out
 * receive never loses a partially read frame; Send() runs the io_context
 * until its own write completes, which may also complete that read.
 *
 * @date 2025
 */

#include "sandbridge/channel/websocket_transport.hpp"

#include "sandbridge/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

namespace sandbridge {
namespace channel {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr auto kCloseTimeout = std::chrono::seconds(1);

} // anonymous namespace

WebSocketTransport::WebSocketTransport(std::chrono::milliseconds write_timeout)
    : write_timeout_(write_timeout) {}

WebSocketTransport::~WebSocketTransport() {
    Close();
}

// ============================================================================
// CONNECTION
// ============================================================================

void WebSocketTransport::Connect(const std::string& host, std::uint16_t port,
                                 const std::string& target,
                                 std::chrono::milliseconds timeout) {
    Teardown();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string port_str = std::to_string(port);

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, port_str, ec);
    if (ec) {
        throw ConnectionError("cannot resolve " + host + ": " + ec.message());
    }

    ws_ = std::make_unique<Stream>(ioc_);
    auto& socket = beast::get_lowest_layer(*ws_);

    // TCP connect
    bool done = false;
    socket.expires_after(timeout);
    socket.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) {
        ec = e;
        done = true;
    });
    if (!RunUntil(done, deadline)) {
        Teardown();
        throw ConnectionError("connect to " + host + ":" + port_str + " timed out");
    }
    if (ec) {
        Teardown();
        throw ConnectionError("connect to " + host + ":" + port_str + " failed: " + ec.message());
    }

    // The websocket stream has its own timeouts
    socket.expires_never();

    auto options = websocket::stream_base::timeout::suggested(beast::role_type::client);
    options.handshake_timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        deadline - std::chrono::steady_clock::now());
    ws_->set_option(options);
    ws_->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "sandbridge");
        }));

    // WebSocket upgrade
    done = false;
    ws_->async_handshake(host + ":" + port_str, target, [&](beast::error_code e) {
        ec = e;
        done = true;
    });
    if (!RunUntil(done, deadline)) {
        Teardown();
        throw ConnectionError("handshake with " + host + ":" + port_str + " timed out");
    }
    if (ec) {
        Teardown();
        throw ConnectionError("handshake with " + host + ":" + port_str + " failed: " + ec.message());
    }

    ws_->text(true);
    open_ = true;
    spdlog::debug("WebSocket connected to ws://{}:{}{}", host, port, target);
}

void WebSocketTransport::Close() {
    if (!ws_) {
        return;
    }

    if (open_ && ws_->is_open()) {
        bool done = false;
        ws_->async_close(websocket::close_code::normal, [&](beast::error_code e) {
            if (e) {
                spdlog::debug("WebSocket close: {}", e.message());
            }
            done = true;
        });
        RunUntil(done, std::chrono::steady_clock::now() + kCloseTimeout);
    }

    Teardown();
}

bool WebSocketTransport::IsOpen() const {
    return open_ && ws_ && ws_->is_open();
}

// ============================================================================
// FRAMES
// ============================================================================

void WebSocketTransport::Send(const std::string& text) {
    if (!IsOpen()) {
        throw ConnectionError("not connected");
    }

    bool done = false;
    beast::error_code ec;
    ws_->async_write(net::buffer(text), [&](beast::error_code e, std::size_t) {
        ec = e;
        done = true;
    });

    if (!RunUntil(done, std::chrono::steady_clock::now() + write_timeout_)) {
        Teardown();
        throw ConnectionError("write timed out");
    }
    if (ec) {
        Teardown();
        throw ConnectionError("write failed: " + ec.message());
    }
}

std::optional<std::string> WebSocketTransport::Receive(std::chrono::milliseconds timeout) {
    if (!ws_ || !open_) {
        throw ConnectionError("not connected");
    }

    if (!read_pending_) {
        read_pending_ = true;
        read_done_ = false;
        ws_->async_read(buffer_, [this](beast::error_code e, std::size_t) {
            read_ec_ = e;
            read_done_ = true;
        });
    }

    if (!read_done_ && !RunUntil(read_done_, std::chrono::steady_clock::now() + timeout)) {
        return std::nullopt;
    }

    read_pending_ = false;
    read_done_ = false;

    if (read_ec_) {
        const bool closed = (read_ec_ == websocket::error::closed);
        const std::string reason = closed ? "connection closed by peer" : read_ec_.message();
        Teardown();
        throw ConnectionError(reason);
    }

    std::string frame = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    return frame;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

bool WebSocketTransport::RunUntil(const bool& done,
                                  std::chrono::steady_clock::time_point deadline) {
    ioc_.restart();
    while (!done) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        // Zero means the deadline passed or nothing is left to run
        if (ioc_.run_one_until(deadline) == 0) {
            return done;
        }
    }
    return true;
}

void WebSocketTransport::Teardown() {
    if (!ws_) {
        return;
    }

    // Closing the socket aborts every outstanding operation; drain their handlers
    beast::get_lowest_layer(*ws_).close();
    ioc_.restart();
    ioc_.run();

    ws_.reset();
    buffer_.consume(buffer_.size());
    read_pending_ = false;
    read_done_ = false;
    read_ec_ = {};
    open_ = false;
}

} // namespace channel
} // namespace sandbridge
