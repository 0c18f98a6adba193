#include <gtest/gtest.h>
#include "fakes.hpp"
#include "sandbridge/channel/control_channel.hpp"
#include "sandbridge/channel/sandbox_watch.hpp"
#include "sandbridge/core/errors.hpp"
#include "sandbridge/core/sandbox_controller.hpp"

#include <algorithm>
#include <future>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

using namespace sandbridge;
using namespace sandbridge::channel;
using namespace std::chrono_literals;
using sandbridge::test::ChunkFrame;
using sandbridge::test::ErrorFrame;
using sandbridge::test::FakeServer;
using sandbridge::test::FakeTransport;
using sandbridge::test::ResultFrame;
using sandbridge::test::WaitUntil;

class ControlChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<FakeServer>();

        config_.max_retries = 3;
        config_.retry_delay = 5ms;
        config_.backoff = BackoffPolicy::FIXED;
        config_.connect_timeout = 100ms;
        config_.heartbeat_interval = 20ms;
        config_.heartbeat_timeout = 200ms;
        config_.grace_window = 200ms;
        config_.request_timeout = 2000ms;
        config_.poll_interval = 5ms;
    }

    std::unique_ptr<ControlChannel> MakeChannel() {
        auto channel = std::make_unique<ControlChannel>(config_, std::make_unique<FakeTransport>(server_));
        channel->SetStateCallback([this](ChannelState state) {
            std::lock_guard<std::mutex> lock(states_mutex_);
            states_.push_back(state);
        });
        return channel;
    }

    std::vector<ChannelState> States() {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return states_;
    }

    bool SawState(ChannelState state) {
        auto states = States();
        return std::find(states.begin(), states.end(), state) != states.end();
    }

    // Reply "<code>" as one chunk per character, then the code as result
    static std::vector<std::string> EchoHandler(const protocol::Request& request) {
        std::vector<std::string> frames;
        for (char c : request.code) {
            frames.push_back(ChunkFrame(request.id, std::string(1, c)));
        }
        frames.push_back(ResultFrame(request.id, request.code));
        return frames;
    }

    std::shared_ptr<FakeServer> server_;
    ChannelConfig config_;

    std::mutex states_mutex_;
    std::vector<ChannelState> states_;
};

// ============================================================================
// Configuration
// ============================================================================

TEST(ChannelConfigTest, DefaultValues) {
    ChannelConfig config;
    EXPECT_EQ(config.max_retries, 10);
    EXPECT_EQ(config.retry_delay, 2000ms);
    EXPECT_EQ(config.backoff, BackoffPolicy::LINEAR);
    EXPECT_EQ(config.heartbeat_interval, 10000ms);
    EXPECT_NO_THROW(ValidateChannelConfig(config));
}

TEST(ChannelConfigTest, RejectsInvalidValues) {
    ChannelConfig config;
    config.max_retries = 0;
    EXPECT_THROW(ValidateChannelConfig(config), ConfigError);

    config = ChannelConfig{};
    config.path = "ws";
    EXPECT_THROW(ValidateChannelConfig(config), ConfigError);

    config = ChannelConfig{};
    config.heartbeat_timeout = 0ms;
    EXPECT_THROW(ValidateChannelConfig(config), ConfigError);
}

TEST(ChannelConfigTest, FollowsSandboxEndpoint) {
    core::SandboxSpec spec;
    spec.host_port = 8123;
    spec.endpoint_path = "/ws";
    spec.limits.execution_timeout = std::chrono::seconds(12);

    auto config = ChannelConfigFor(spec);
    EXPECT_EQ(config.port, 8123);
    EXPECT_EQ(config.path, "/ws");
    EXPECT_EQ(config.request_timeout, 12000ms);
}

TEST(ChannelConfigTest, NullTransportRejected) {
    EXPECT_THROW(ControlChannel(ChannelConfig{}, nullptr), ConfigError);
}

// ============================================================================
// Connection
// ============================================================================

TEST_F(ControlChannelTest, OpenConnectsAndSendsHeartbeat) {
    auto channel = MakeChannel();
    channel->Open();

    EXPECT_EQ(channel->State(), ChannelState::CONNECTED);
    EXPECT_EQ(channel->ConnectAttempts(), 1);
    EXPECT_TRUE(WaitUntil([&] { return server_->HeartbeatsSent() >= 2; }))
        << "Heartbeats must be sent on a fixed interval";
    channel->Close();
}

TEST_F(ControlChannelTest, GivesUpAfterMaxRetries) {
    // Given: An endpoint that refuses every connection
    server_->SetReachable(false);
    auto channel = MakeChannel();

    // When: Opening the channel
    EXPECT_THROW(channel->Open(), ConnectionError);

    // Then: Exactly max_retries attempts, then terminal CLOSED
    EXPECT_EQ(server_->ConnectAttempts(), 3);
    EXPECT_EQ(channel->ConnectAttempts(), 3);
    EXPECT_EQ(channel->State(), ChannelState::CLOSED);
    EXPECT_NE(channel->LastError().find("gave up after 3"), std::string::npos);
    EXPECT_NE(channel->LastError().find("connection refused"), std::string::npos);

    // A closed channel stays closed
    EXPECT_THROW(channel->Open(), ConnectionError);
    auto outcome = channel->Execute("1");
    EXPECT_EQ(outcome.kind, OutcomeKind::CANCELLED);
}

TEST_F(ControlChannelTest, RetriesBetweenAttempts) {
    server_->SetReachable(false);
    auto channel = MakeChannel();
    EXPECT_THROW(channel->Open(), ConnectionError);
    ASSERT_TRUE(WaitUntil([&] { return SawState(ChannelState::CLOSED); }));

    const std::vector<ChannelState> expected = {
        ChannelState::CONNECTING, ChannelState::DISCONNECTED,
        ChannelState::CONNECTING, ChannelState::DISCONNECTED,
        ChannelState::CONNECTING, ChannelState::CLOSED,
    };
    EXPECT_EQ(States(), expected);
}

TEST_F(ControlChannelTest, ReconnectsAfterDrop) {
    server_->handler = EchoHandler;
    auto channel = MakeChannel();
    channel->Open();

    server_->Drop();

    ASSERT_TRUE(WaitUntil([&] { return server_->ConnectAttempts() >= 2; }));
    ASSERT_TRUE(WaitUntil([&] { return channel->State() == ChannelState::CONNECTED; }));
    EXPECT_TRUE(SawState(ChannelState::DISCONNECTED));

    auto outcome = channel->Execute("ok");
    EXPECT_TRUE(outcome.Succeeded()) << outcome.reason;
    channel->Close();
}

// ============================================================================
// Requests
// ============================================================================

TEST_F(ControlChannelTest, StreamsChunksInOrder) {
    server_->handler = EchoHandler;
    auto channel = MakeChannel();
    channel->Open();

    auto stream = channel->Submit("abc");
    std::vector<std::string> chunks;
    while (auto chunk = stream.Next()) {
        chunks.push_back(*chunk);
    }
    auto outcome = stream.Wait();

    EXPECT_EQ(chunks, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(outcome.kind, OutcomeKind::RESULT);
    EXPECT_EQ(outcome.value, "abc");
    EXPECT_EQ(outcome.id, stream.Id());
    EXPECT_NO_THROW(outcome.ThrowIfFailed());
    channel->Close();
}

TEST_F(ControlChannelTest, UnencodableCodeFailsOnlyThatRequest) {
    server_->handler = EchoHandler;
    auto channel = MakeChannel();
    channel->Open();

    // Given: Code that is not valid UTF-8
    auto outcome = channel->Execute("print(\"\xff\xfe\")");

    // Then: The request fails locally and leaves nothing behind
    EXPECT_EQ(outcome.kind, OutcomeKind::PROTOCOL_ERROR);
    EXPECT_EQ(channel->PendingCount(), 0u) << "Rejected request must not stay pending";
    EXPECT_TRUE(server_->Requests().empty());

    // And: The channel keeps serving
    EXPECT_EQ(channel->Execute("ok").kind, OutcomeKind::RESULT);
    channel->Close();
}

TEST_F(ControlChannelTest, ExecuteCollectsOutput) {
    server_->handler = EchoHandler;
    auto channel = MakeChannel();
    channel->Open();

    auto outcome = channel->Execute("hello");
    EXPECT_EQ(outcome.output, "hello");
    EXPECT_EQ(channel->PendingCount(), 0u);
    channel->Close();
}

TEST_F(ControlChannelTest, CorrelationIdsAreUnique) {
    server_->handler = EchoHandler;
    auto channel = MakeChannel();
    channel->Open();

    auto first = channel->Submit("1");
    auto second = channel->Submit("2");
    EXPECT_NE(first.Id(), second.Id());

    EXPECT_EQ(second.Wait().value, "2");
    EXPECT_EQ(first.Wait().value, "1");
    channel->Close();
}

TEST_F(ControlChannelTest, RemoteErrorOutcome) {
    server_->handler = [](const protocol::Request& request) {
        return std::vector<std::string>{ErrorFrame(request.id, "NameError: name 'x' is not defined")};
    };
    auto channel = MakeChannel();
    channel->Open();

    auto outcome = channel->Execute("x");
    EXPECT_EQ(outcome.kind, OutcomeKind::ERROR);
    EXPECT_EQ(outcome.reason, "NameError: name 'x' is not defined");
    EXPECT_THROW(outcome.ThrowIfFailed(), RemoteExecutionError);
    channel->Close();
}

TEST_F(ControlChannelTest, ResourceLimitLeavesChannelConnected) {
    server_->handler = [](const protocol::Request& request) {
        if (request.code == "fork_bomb()") {
            return std::vector<std::string>{
                ChunkFrame(request.id, "forking\n"),
                ErrorFrame(request.id, "process limit reached", std::string(protocol::kResourceLimitExceededCode))};
        }
        return std::vector<std::string>{ResultFrame(request.id, "fine")};
    };
    auto channel = MakeChannel();
    channel->Open();

    auto outcome = channel->Execute("fork_bomb()");
    EXPECT_EQ(outcome.kind, OutcomeKind::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_EQ(outcome.error_code, protocol::kResourceLimitExceededCode);
    EXPECT_EQ(outcome.output, "forking\n");
    EXPECT_THROW(outcome.ThrowIfFailed(), ResourceLimitExceeded);

    // The session survives the limit hit
    EXPECT_EQ(channel->State(), ChannelState::CONNECTED);
    EXPECT_TRUE(channel->Execute("1").Succeeded());
    EXPECT_EQ(server_->ConnectAttempts(), 1);
    channel->Close();
}

TEST_F(ControlChannelTest, UnansweredRequestTimesOut) {
    config_.request_timeout = 100ms;
    auto channel = MakeChannel();
    channel->Open();

    const auto before = std::chrono::steady_clock::now();
    auto outcome = channel->Execute("while True: pass");

    EXPECT_EQ(outcome.kind, OutcomeKind::TIMEOUT);
    EXPECT_GE(std::chrono::steady_clock::now() - before, 100ms);
    EXPECT_THROW(outcome.ThrowIfFailed(), RequestTimeoutError);
    EXPECT_EQ(channel->State(), ChannelState::CONNECTED);
    EXPECT_TRUE(WaitUntil([&] { return channel->PendingCount() == 0; }));
    channel->Close();
}

TEST_F(ControlChannelTest, LateResultAfterTimeoutIsDropped) {
    config_.request_timeout = 50ms;
    auto channel = MakeChannel();
    channel->Open();

    auto outcome = channel->Execute("slow()");
    ASSERT_EQ(outcome.kind, OutcomeKind::TIMEOUT);

    server_->Push(ResultFrame(outcome.id, "too late"));
    server_->Push(ChunkFrame(outcome.id, "too late"));
    EXPECT_TRUE(WaitUntil([&] { return channel->PendingCount() == 0; }));
    EXPECT_EQ(channel->ProtocolViolations(), 0u);
    EXPECT_EQ(channel->State(), ChannelState::CONNECTED);
    channel->Close();
}

// ============================================================================
// Malformed messages
// ============================================================================

TEST_F(ControlChannelTest, MalformedReplyFailsOnlyItsRequest) {
    server_->handler = [](const protocol::Request& request) {
        if (request.code == "bad") {
            // result without its value
            return std::vector<std::string>{R"({"type":"result","id":")" + request.id + R"("})"};
        }
        return std::vector<std::string>{ResultFrame(request.id, "good")};
    };
    auto channel = MakeChannel();
    channel->Open();

    auto bad = channel->Submit("bad");
    auto good = channel->Submit("good");

    auto bad_outcome = bad.Wait();
    EXPECT_EQ(bad_outcome.kind, OutcomeKind::PROTOCOL_ERROR);
    EXPECT_THROW(bad_outcome.ThrowIfFailed(), ProtocolDecodeError);
    EXPECT_TRUE(good.Wait().Succeeded());

    EXPECT_EQ(channel->ProtocolViolations(), 0u);
    EXPECT_EQ(channel->State(), ChannelState::CONNECTED);
    channel->Close();
}

TEST_F(ControlChannelTest, UnscopedMalformedFramesAreCounted) {
    auto channel = MakeChannel();
    channel->Open();

    server_->Push("definitely not json");
    server_->Push(R"({"type":"shutdown"})");
    server_->Push(R"json({"type":"request","id":"1","code":"os.system('x')"})json");

    EXPECT_TRUE(WaitUntil([&] { return channel->ProtocolViolations() == 3; }));
    EXPECT_EQ(channel->State(), ChannelState::CONNECTED) << "Violations must not drop the session";
    channel->Close();
}

// ============================================================================
// Liveness
// ============================================================================

TEST_F(ControlChannelTest, SilenceDegradesThenDisconnects) {
    server_->SetAnswerHeartbeats(false);
    auto channel = MakeChannel();
    channel->Open();
    auto pending = channel->Submit("sleep(60)");

    // Degraded once heartbeat_timeout passes without inbound traffic
    ASSERT_TRUE(WaitUntil([&] { return SawState(ChannelState::DEGRADED); }));

    // Disconnected after the grace window; the in-flight request is lost
    auto outcome = pending.Wait();
    EXPECT_EQ(outcome.kind, OutcomeKind::CONNECTION_LOST);
    EXPECT_THROW(outcome.ThrowIfFailed(), ConnectionError);

    auto states = States();
    auto connected = std::find(states.begin(), states.end(), ChannelState::CONNECTED);
    auto degraded = std::find(connected, states.end(), ChannelState::DEGRADED);
    auto disconnected = std::find(degraded, states.end(), ChannelState::DISCONNECTED);
    EXPECT_NE(disconnected, states.end()) << "Expected CONNECTED, DEGRADED, DISCONNECTED in order";

    channel->Close();
}

TEST_F(ControlChannelTest, DegradedRecoversOnHeartbeat) {
    config_.grace_window = 5000ms;
    server_->SetAnswerHeartbeats(false);
    auto channel = MakeChannel();
    channel->Open();

    ASSERT_TRUE(WaitUntil([&] { return channel->State() == ChannelState::DEGRADED; }));

    server_->SetAnswerHeartbeats(true);
    EXPECT_TRUE(WaitUntil([&] { return channel->State() == ChannelState::CONNECTED; }));
    EXPECT_EQ(server_->ConnectAttempts(), 1) << "Recovery must not reconnect";
    channel->Close();
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(ControlChannelTest, CloseCancelsPendingRequests) {
    auto channel = MakeChannel();
    channel->Open();

    auto first = channel->Submit("sleep(60)");
    auto second = channel->Submit("sleep(60)");
    ASSERT_TRUE(WaitUntil([&] { return server_->Requests().size() == 2; }));

    channel->Close();

    auto first_outcome = first.Wait();
    auto second_outcome = second.Wait();
    EXPECT_EQ(first_outcome.kind, OutcomeKind::CANCELLED);
    EXPECT_EQ(second_outcome.kind, OutcomeKind::CANCELLED);
    EXPECT_THROW(first_outcome.ThrowIfFailed(), RequestCancelledError);
    EXPECT_EQ(channel->State(), ChannelState::CLOSED);
    EXPECT_EQ(channel->PendingCount(), 0u);

    // Second close is a no-op; results after close change nothing
    server_->Push(ResultFrame(first.Id(), "late"));
    EXPECT_NO_THROW(channel->Close());
    EXPECT_EQ(first.Wait().kind, OutcomeKind::CANCELLED);
}

TEST_F(ControlChannelTest, CloseInterruptsRetryDelay) {
    // Given: A refused endpoint and a long delay between attempts
    server_->SetReachable(false);
    config_.retry_delay = 5000ms;
    auto channel = MakeChannel();

    auto opening = std::async(std::launch::async, [&]() { channel->Open(); });
    ASSERT_TRUE(WaitUntil([&]() { return server_->ConnectAttempts() == 1; }));
    ASSERT_TRUE(WaitUntil([&]() { return channel->State() == ChannelState::DISCONNECTED; }));

    // When: Closing while the worker waits to retry
    const auto started = std::chrono::steady_clock::now();
    channel->Close();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    // Then: Close returns without sitting out the delay
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_EQ(server_->ConnectAttempts(), 1);
    EXPECT_THROW(opening.get(), ConnectionError);
}

TEST_F(ControlChannelTest, SubmitAfterCloseIsCancelledImmediately) {
    auto channel = MakeChannel();
    channel->Open();
    channel->Close();

    auto stream = channel->Submit("1");
    EXPECT_FALSE(stream.Next());
    EXPECT_EQ(stream.Wait().kind, OutcomeKind::CANCELLED);
    EXPECT_TRUE(server_->Requests().empty());
}

TEST_F(ControlChannelTest, PeerLossFailsInFlightRequests) {
    auto channel = MakeChannel();
    channel->Open();
    auto pending = channel->Submit("sleep(60)");

    channel->NotifyPeerLost("sandbox stopped");

    auto outcome = pending.Wait();
    EXPECT_EQ(outcome.kind, OutcomeKind::CONNECTION_LOST);
    EXPECT_NE(outcome.reason.find("sandbox stopped"), std::string::npos);
    channel->Close();
}

// ============================================================================
// SandboxWatch
// ============================================================================

TEST_F(ControlChannelTest, StoppingSandboxDropsSession) {
    namespace fs = std::filesystem;
    const auto dockerfile = fs::temp_directory_path() / "sandbridge_watch.Dockerfile";
    std::ofstream(dockerfile) << "FROM scratch\n";

    core::SandboxSpec spec;
    spec.dockerfile_path = dockerfile;
    spec.readiness_delay = 1ms;
    core::SandboxController sandbox(spec, std::make_shared<test::FakeEngine>());
    sandbox.EnsureRunning();

    auto channel = MakeChannel();
    channel->Open();
    auto pending = channel->Submit("sleep(60)");

    {
        SandboxWatch watch(sandbox, *channel);
        sandbox.Stop();

        auto outcome = pending.Wait();
        EXPECT_EQ(outcome.kind, OutcomeKind::CONNECTION_LOST);
        EXPECT_NE(outcome.reason.find("sandbox stopping"), std::string::npos) << outcome.reason;
    }

    channel->Close();
    sandbox.Destroy();
    fs::remove(dockerfile);
}
