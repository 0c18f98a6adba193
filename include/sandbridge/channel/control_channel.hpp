/**
 * @file control_channel.hpp
 * @brief Resilient request/stream channel to a running sandbox
 *
 * A ControlChannel runs one worker thread that owns the transport. The
 * worker connects with bounded retries, sends queued frames, heartbeats on a
 * fixed interval, watches inbound liveness and routes inbound messages to the
 * pending request they belong to. Callers submit code from any thread and
 * consume each response as a lazy stream.
 *
 * **Session State Machine**:
 * ```
 * DISCONNECTED ─▶ CONNECTING ─ok─▶ CONNECTED ◀─any message─┐
 *      ▲              │                 │                   │
 *      │          retries          heartbeat_timeout        │
 *      │         exhausted              ▼                   │
 *      │              │             DEGRADED ───────────────┘
 *      │              ▼                 │
 *      │           CLOSED      + grace_window / closed
 *      └────────────────────────────────┘
 * ```
 * Close() moves any state to CLOSED.
 *
 * **Three Independent Timeouts**:
 * - request_timeout: fails one request, channel stays up
 * - heartbeat_timeout (+ grace_window): degrades, then drops the session
 * - connect_timeout: bounds each connect attempt
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/channel/transport.hpp"
#include "sandbridge/protocol/message.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sandbridge {

namespace core {
struct SandboxSpec;
}

namespace channel {

/**
 * @enum ChannelState
 * @brief Connection state of a channel session
 */
enum class ChannelState {
    DISCONNECTED,  ///< No connection; retry cycle pending
    CONNECTING,    ///< Connect attempt in progress
    CONNECTED,     ///< Healthy
    DEGRADED,      ///< Heartbeats missed; grace window running
    CLOSED         ///< Terminal
};

/**
 * @enum BackoffPolicy
 * @brief Delay between connect attempts
 */
enum class BackoffPolicy {
    FIXED,   ///< retry_delay every time
    LINEAR   ///< retry_delay × attempt
};

/**
 * @struct ChannelConfig
 * @brief Endpoint, retry and timeout settings of a channel
 */
struct ChannelConfig {
    std::string host{"127.0.0.1"};                      ///< Endpoint host
    std::uint16_t port{8000};                           ///< Endpoint port
    std::string path{"/"};                              ///< WebSocket target

    // Retry
    int max_retries{10};                                ///< Connect attempts per cycle
    std::chrono::milliseconds retry_delay{2000};        ///< Base delay between attempts
    BackoffPolicy backoff{BackoffPolicy::LINEAR};       ///< Delay growth
    std::chrono::milliseconds connect_timeout{5000};    ///< Bound of one attempt

    // Liveness
    std::chrono::milliseconds heartbeat_interval{10000};  ///< Heartbeat send period
    std::chrono::milliseconds heartbeat_timeout{30000};   ///< Silence before DEGRADED
    std::chrono::milliseconds grace_window{15000};        ///< Further silence before DISCONNECTED

    // Requests
    std::chrono::milliseconds request_timeout{30000};   ///< Per-request deadline
    std::chrono::milliseconds poll_interval{50};        ///< Worker receive slice
};

/**
 * @brief Validate a channel config
 * @throws ConfigError describing the first invalid field
 */
void ValidateChannelConfig(const ChannelConfig& config);

/// Channel config addressing a sandbox's published endpoint
ChannelConfig ChannelConfigFor(const core::SandboxSpec& spec);

/**
 * @enum OutcomeKind
 * @brief How a request ended
 */
enum class OutcomeKind {
    RESULT,                   ///< Result message received
    ERROR,                    ///< Error message received
    RESOURCE_LIMIT_EXCEEDED,  ///< Error message with the resource limit code
    PROTOCOL_ERROR,           ///< Malformed message for this request
    TIMEOUT,                  ///< request_timeout elapsed
    CANCELLED,                ///< Channel closed by the caller
    CONNECTION_LOST           ///< Session dropped or never established
};

/**
 * @struct RequestOutcome
 * @brief Terminal outcome of one request
 */
struct RequestOutcome {
    std::string id;                         ///< Correlation id
    OutcomeKind kind{OutcomeKind::RESULT};  ///< How the request ended
    protocol::json value;                   ///< Result payload (RESULT only)
    std::string reason;                     ///< Failure reason
    std::optional<std::string> error_code;  ///< Remote error code, if any
    std::string output;                     ///< Chunks drained by ResponseStream::Wait()

    bool Succeeded() const { return kind == OutcomeKind::RESULT; }

    /**
     * @brief Raise the exception matching a failed outcome
     * @throws RemoteExecutionError, ResourceLimitExceeded, ProtocolDecodeError,
     *         RequestTimeoutError, RequestCancelledError or ConnectionError
     */
    void ThrowIfFailed() const;

    static std::string KindToString(OutcomeKind kind);
};

struct PendingRequest;

/**
 * @class ResponseStream
 * @brief Lazy, single-pass sequence of output chunks for one request
 *
 * Next() blocks only the calling thread. The sequence ends exactly when the
 * request reaches its terminal outcome; chunks arriving later are dropped.
 *
 * **Usage Example**:
 * @code
 * auto stream = channel.Submit("print('ok')");
 * while (auto chunk = stream.Next()) {
 *     std::cout << *chunk;
 * }
 * auto outcome = stream.Wait();
 * outcome.ThrowIfFailed();
 * @endcode
 */
class ResponseStream {
public:
    explicit ResponseStream(std::shared_ptr<PendingRequest> request);

    /// Next chunk, or std::nullopt once the request is resolved
    std::optional<std::string> Next();

    /// Drain the remaining chunks into outcome.output and return the outcome
    RequestOutcome Wait();

    const std::string& Id() const;

private:
    std::shared_ptr<PendingRequest> request_;
};

/**
 * @class ControlChannel
 * @brief Bidirectional request channel with reconnect, heartbeat and timeouts
 *
 * **Thread Safety**: Submit(), Close(), NotifyPeerLost() and all accessors
 * are safe from any thread. The transport is touched only by the worker.
 *
 * **Usage Example**:
 * @code
 * ControlChannel channel(ChannelConfigFor(spec), std::make_unique<WebSocketTransport>());
 * channel.Open();                              // throws ConnectionError when exhausted
 * auto outcome = channel.Execute("print('ok')");
 * channel.Close();                             // cancels whatever is still pending
 * @endcode
 */
class ControlChannel {
public:
    using StateCallback = std::function<void(ChannelState)>;

    /**
     * @throws ConfigError if the config is invalid or the transport is null
     */
    ControlChannel(ChannelConfig config, std::unique_ptr<Transport> transport);
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    /**
     * @brief Start the worker and wait for the first connection
     * @throws ConnectionError if retries are exhausted or the channel is closed
     */
    void Open();

    /// Cancel all pending requests, stop the worker and close the transport
    void Close();

    /// Drop the current session (the sandbox went away); reconnect follows
    void NotifyPeerLost(const std::string& reason);

    /**
     * @brief Submit code for execution
     *
     * On a closed channel the returned stream is already resolved as
     * CANCELLED.
     */
    ResponseStream Submit(const std::string& code);

    /// Submit(code).Wait()
    RequestOutcome Execute(const std::string& code);

    /// Must be set before Open()
    void SetStateCallback(StateCallback callback);

    ChannelState State() const;
    std::string LastError() const;
    int ConnectAttempts() const { return connect_attempts_.load(); }
    std::uint64_t ProtocolViolations() const { return protocol_violations_.load(); }
    std::size_t PendingCount() const;
    const ChannelConfig& Config() const { return config_; }

    static std::string StateToString(ChannelState state);

private:
    ChannelConfig config_;                   ///< Immutable settings
    std::unique_ptr<Transport> transport_;   ///< Owned by the worker while it runs
    std::thread worker_;                     ///< Session worker
    StateCallback state_callback_;           ///< Transition observer

    mutable std::mutex mutex_;               ///< Guards the fields below
    std::condition_variable cv_;             ///< State changes and shutdown
    ChannelState state_{ChannelState::DISCONNECTED};
    std::map<std::string, std::shared_ptr<PendingRequest>> pending_;  ///< By correlation id
    std::deque<std::string> outbox_;         ///< Encoded frames awaiting send
    std::string last_error_;                 ///< Last connection failure
    std::string peer_lost_reason_;           ///< Reason passed to NotifyPeerLost()
    bool started_{false};                    ///< Worker launched

    std::atomic<bool> closing_{false};       ///< Close() requested
    std::atomic<bool> peer_lost_{false};     ///< NotifyPeerLost() requested
    std::atomic<std::uint64_t> next_id_{1};  ///< Correlation id source
    std::atomic<int> connect_attempts_{0};   ///< Attempts over the channel lifetime
    std::atomic<std::uint64_t> protocol_violations_{0};  ///< Dropped malformed frames

    // Worker-only liveness clocks
    std::chrono::steady_clock::time_point last_inbound_;
    std::chrono::steady_clock::time_point last_heartbeat_sent_;

    void Run();
    bool ConnectWithRetry();
    void RunSession();
    void Disconnect(const std::string& reason);
    void HandleFrame(const std::string& frame);
    void HandleMessage(const protocol::Message& message);
    void ExpireDeadlines();
    bool FlushOutbox();
    void SendHeartbeatIfDue();

    void SetState(ChannelState state);
    void FailAll(OutcomeKind kind, const std::string& reason);
    std::shared_ptr<PendingRequest> FindPending(const std::string& id) const;
    void Resolve(const std::string& id, RequestOutcome outcome);
    std::chrono::milliseconds RetryDelay(int attempt) const;
};

} // namespace channel
} // namespace sandbridge
