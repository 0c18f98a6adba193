#include <gtest/gtest.h>
#include "fakes.hpp"
#include "sandbridge/channel/readiness_probe.hpp"
#include "sandbridge/channel/websocket_transport.hpp"
#include "sandbridge/core/errors.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <thread>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using namespace sandbridge;
using namespace sandbridge::channel;
using namespace std::chrono_literals;

namespace {

// Single-connection WebSocket server echoing every text frame
class EchoServer {
public:
    explicit EchoServer(bool close_after_first = false)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , close_after_first_(close_after_first) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { Serve(); });
    }

    ~EchoServer() {
        thread_.join();
    }

    std::uint16_t Port() const { return port_; }

private:
    void Serve() {
        beast::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        websocket::stream<tcp::socket> ws(std::move(socket));
        ws.accept(ec);
        while (!ec) {
            beast::flat_buffer buffer;
            ws.read(buffer, ec);
            if (ec) {
                break;
            }
            if (close_after_first_) {
                ws.close(websocket::close_code::normal, ec);
                break;
            }
            ws.text(true);
            ws.write(buffer.data(), ec);
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    bool close_after_first_;
    std::uint16_t port_{0};
    std::thread thread_;
};

// A loopback port with nothing listening on it
std::uint16_t ClosedPort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

} // namespace

// ============================================================================
// WebSocketTransport
// ============================================================================

TEST(WebSocketTransportTest, UnconnectedTransportRefusesIo) {
    WebSocketTransport transport;

    EXPECT_FALSE(transport.IsOpen());
    EXPECT_THROW(transport.Send("x"), ConnectionError);
    EXPECT_THROW(transport.Receive(10ms), ConnectionError);
    EXPECT_NO_THROW(transport.Close());
}

TEST(WebSocketTransportTest, RefusedConnectionIsConnectionError) {
    WebSocketTransport transport;
    EXPECT_THROW(transport.Connect("127.0.0.1", ClosedPort(), "/", 1000ms), ConnectionError);
    EXPECT_FALSE(transport.IsOpen());
}

TEST(WebSocketTransportTest, EchoRoundTrip) {
    EchoServer server;
    WebSocketTransport transport;

    transport.Connect("127.0.0.1", server.Port(), "/", 2000ms);
    ASSERT_TRUE(transport.IsOpen());

    // Nothing sent yet: the receive times out without error
    EXPECT_FALSE(transport.Receive(20ms));

    transport.Send(R"({"type":"heartbeat"})");
    auto frame = transport.Receive(2000ms);
    ASSERT_TRUE(frame) << "Echo not received";
    EXPECT_EQ(*frame, R"({"type":"heartbeat"})");

    transport.Close();
    EXPECT_FALSE(transport.IsOpen());
}

TEST(WebSocketTransportTest, PeerCloseIsConnectionError) {
    EchoServer server(true);
    WebSocketTransport transport;

    transport.Connect("127.0.0.1", server.Port(), "/", 2000ms);
    transport.Send("bye");

    std::optional<std::string> frame;
    try {
        frame = transport.Receive(2000ms);
        FAIL() << "Peer close not reported";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("closed by peer"), std::string::npos) << e.what();
    }
    EXPECT_FALSE(transport.IsOpen());
}

// ============================================================================
// HandshakeProbe
// ============================================================================

TEST(HandshakeProbeTest, ReadyWhenHeartbeatAnswered) {
    auto server = std::make_shared<test::FakeServer>();
    HandshakeProbe probe([server]() { return std::make_unique<test::FakeTransport>(server); });

    core::SandboxSpec spec;
    spec.probe_timeout = 200ms;
    EXPECT_TRUE(probe(spec));
}

TEST(HandshakeProbeTest, NotReadyWithoutReply) {
    auto server = std::make_shared<test::FakeServer>();
    server->answer_heartbeats = false;
    HandshakeProbe probe([server]() { return std::make_unique<test::FakeTransport>(server); });

    core::SandboxSpec spec;
    spec.probe_timeout = 50ms;
    EXPECT_FALSE(probe(spec));
}

TEST(HandshakeProbeTest, NotReadyWhenRefused) {
    auto server = std::make_shared<test::FakeServer>();
    server->reachable = false;
    HandshakeProbe probe([server]() { return std::make_unique<test::FakeTransport>(server); });

    core::SandboxSpec spec;
    EXPECT_FALSE(probe(spec));
    EXPECT_EQ(server->ConnectAttempts(), 1);
}

TEST(HandshakeProbeTest, DefaultProbeOverWebSocket) {
    EchoServer server;
    HandshakeProbe probe;

    core::SandboxSpec spec;
    spec.host_port = server.Port();
    spec.probe_timeout = 2000ms;
    EXPECT_TRUE(probe(spec)) << "Echoed heartbeat should count as ready";
}
