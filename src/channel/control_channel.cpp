/**
 * @file control_channel.cpp
 * @brief Implementation of the resilient control channel
 *
 * **Worker Loop** (one iteration per poll_interval):
 * 1. Handle a pending NotifyPeerLost()
 * 2. Flush queued request frames
 * 3. Send a heartbeat when due
 * 4. Check inbound liveness (DEGRADED / DISCONNECTED)
 * 5. Expire request deadlines
 * 6. Receive and route at most one frame
 *
 * Lock order: channel mutex before request mutex, never the reverse.
 *
 * @date 2025
 */

#include "sandbridge/channel/control_channel.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/core/sandbox_spec.hpp"
#include "sandbridge/protocol/message_codec.hpp"
#include "sandbridge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace sandbridge {
namespace channel {

using protocol::MessageCodec;

// ============================================================================
// PENDING REQUEST
// ============================================================================

/**
 * @struct PendingRequest
 * @brief Shared state between a ResponseStream and the channel worker
 */
struct PendingRequest {
    PendingRequest(std::string request_id, std::chrono::milliseconds request_timeout)
        : id(std::move(request_id))
        , timeout(request_timeout)
        , deadline(std::chrono::steady_clock::now() + request_timeout) {}

    const std::string id;
    const std::chrono::milliseconds timeout;
    const std::chrono::steady_clock::time_point deadline;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> chunks;
    std::optional<RequestOutcome> outcome;

    /// Queue a chunk; false once resolved
    bool AddChunk(std::string data) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (outcome) {
                return false;
            }
            chunks.push_back(std::move(data));
        }
        cv.notify_all();
        return true;
    }

    /// Set the terminal outcome; false if it was already set
    bool Resolve(RequestOutcome result) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (outcome) {
                return false;
            }
            outcome = std::move(result);
        }
        cv.notify_all();
        return true;
    }

    bool IsResolved() {
        std::lock_guard<std::mutex> lock(mutex);
        return outcome.has_value();
    }

    RequestOutcome TimeoutOutcome() const {
        RequestOutcome result;
        result.id = id;
        result.kind = OutcomeKind::TIMEOUT;
        result.reason = "no response within " + std::to_string(timeout.count()) + "ms";
        return result;
    }
};

namespace {

RequestOutcome MakeOutcome(const std::string& id, OutcomeKind kind, const std::string& reason) {
    RequestOutcome outcome;
    outcome.id = id;
    outcome.kind = kind;
    outcome.reason = reason;
    return outcome;
}

// Transport errors carry the "connection error: " prefix already
std::string ReasonOf(const ConnectionError& e) {
    static const std::string kPrefix = "connection error: ";
    const std::string what = e.what();
    return utils::StringUtils::StartsWith(what, kPrefix) ? what.substr(kPrefix.size()) : what;
}

} // anonymous namespace

// ============================================================================
// CONFIGURATION
// ============================================================================

void ValidateChannelConfig(const ChannelConfig& config) {
    if (config.host.empty()) {
        throw ConfigError("channel host must not be empty");
    }
    if (config.port == 0) {
        throw ConfigError("channel port must be non-zero");
    }
    if (config.path.empty() || config.path.front() != '/') {
        throw ConfigError("channel path must start with '/'");
    }
    if (config.max_retries <= 0) {
        throw ConfigError("max retries must be positive");
    }
    if (config.retry_delay.count() < 0 || config.grace_window.count() < 0) {
        throw ConfigError("retry delay and grace window must be non-negative");
    }
    if (config.connect_timeout.count() <= 0 || config.request_timeout.count() <= 0) {
        throw ConfigError("connect and request timeouts must be positive");
    }
    if (config.heartbeat_interval.count() <= 0 || config.heartbeat_timeout.count() <= 0) {
        throw ConfigError("heartbeat interval and timeout must be positive");
    }
    if (config.poll_interval.count() <= 0) {
        throw ConfigError("poll interval must be positive");
    }
}

ChannelConfig ChannelConfigFor(const core::SandboxSpec& spec) {
    ChannelConfig config;
    config.host = spec.host;
    config.port = spec.host_port;
    config.path = spec.endpoint_path;
    config.request_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        spec.limits.execution_timeout);
    return config;
}

// ============================================================================
// REQUEST OUTCOME
// ============================================================================

void RequestOutcome::ThrowIfFailed() const {
    switch (kind) {
        case OutcomeKind::RESULT:
            return;
        case OutcomeKind::ERROR:
            throw RemoteExecutionError(reason);
        case OutcomeKind::RESOURCE_LIMIT_EXCEEDED:
            throw ResourceLimitExceeded(reason);
        case OutcomeKind::PROTOCOL_ERROR:
            throw ProtocolDecodeError("malformed response to request " + id, id);
        case OutcomeKind::TIMEOUT:
            throw RequestTimeoutError("request " + id + ": " + reason);
        case OutcomeKind::CANCELLED:
            throw RequestCancelledError("request " + id + ": " + reason);
        case OutcomeKind::CONNECTION_LOST:
            throw ConnectionError("request " + id + ": " + reason);
    }
}

std::string RequestOutcome::KindToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::RESULT: return "result";
        case OutcomeKind::ERROR: return "error";
        case OutcomeKind::RESOURCE_LIMIT_EXCEEDED: return "resource limit exceeded";
        case OutcomeKind::PROTOCOL_ERROR: return "protocol error";
        case OutcomeKind::TIMEOUT: return "timeout";
        case OutcomeKind::CANCELLED: return "cancelled";
        case OutcomeKind::CONNECTION_LOST: return "connection lost";
        default: return "unknown";
    }
}

// ============================================================================
// RESPONSE STREAM
// ============================================================================

ResponseStream::ResponseStream(std::shared_ptr<PendingRequest> request)
    : request_(std::move(request)) {}

std::optional<std::string> ResponseStream::Next() {
    auto& request = *request_;
    std::unique_lock<std::mutex> lock(request.mutex);

    request.cv.wait_until(lock, request.deadline, [&request] {
        return !request.chunks.empty() || request.outcome.has_value();
    });

    if (!request.chunks.empty()) {
        std::string chunk = std::move(request.chunks.front());
        request.chunks.pop_front();
        return chunk;
    }

    if (!request.outcome) {
        // Deadline passed before the worker noticed
        request.outcome = request.TimeoutOutcome();
        spdlog::warn("Request {} timed out after {}ms", request.id, request.timeout.count());
    }
    return std::nullopt;
}

RequestOutcome ResponseStream::Wait() {
    std::string output;
    while (auto chunk = Next()) {
        output += *chunk;
    }

    std::lock_guard<std::mutex> lock(request_->mutex);
    RequestOutcome outcome = *request_->outcome;
    outcome.output = std::move(output);
    return outcome;
}

const std::string& ResponseStream::Id() const {
    return request_->id;
}

// ============================================================================
// CONSTRUCTION / PUBLIC API
// ============================================================================

ControlChannel::ControlChannel(ChannelConfig config, std::unique_ptr<Transport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport)) {
    ValidateChannelConfig(config_);
    if (!transport_) {
        throw ConfigError("transport must not be null");
    }
}

ControlChannel::~ControlChannel() {
    Close();
}

void ControlChannel::Open() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closing_ || state_ == ChannelState::CLOSED) {
        throw ConnectionError(last_error_.empty() ? "channel is closed" : last_error_);
    }

    if (!started_) {
        started_ = true;
        worker_ = std::thread([this]() { Run(); });
    }

    cv_.wait(lock, [this] {
        return state_ == ChannelState::CONNECTED ||
               state_ == ChannelState::DEGRADED ||
               state_ == ChannelState::CLOSED;
    });

    if (state_ == ChannelState::CLOSED) {
        throw ConnectionError(last_error_.empty() ? "channel is closed" : last_error_);
    }
}

void ControlChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    // Worker is gone; the transport is ours now
    transport_->Close();
    SetState(ChannelState::CLOSED);
    FailAll(OutcomeKind::CANCELLED, "channel closed");
}

void ControlChannel::NotifyPeerLost(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peer_lost_reason_ = reason;
    }
    peer_lost_ = true;
    spdlog::info("Control channel peer lost: {}", reason);
}

ResponseStream ControlChannel::Submit(const std::string& code) {
    const std::string id = std::to_string(next_id_++);
    auto request = std::make_shared<PendingRequest>(id, config_.request_timeout);

    // Encode first: a payload that cannot go on the wire never enters the table
    std::string frame;
    try {
        frame = MessageCodec::Encode(protocol::Request{id, code});
    } catch (const ProtocolEncodeError& e) {
        spdlog::warn("Request {} rejected: {}", id, e.what());
        request->Resolve(MakeOutcome(id, OutcomeKind::PROTOCOL_ERROR, e.what()));
        return ResponseStream(request);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_ || state_ == ChannelState::CLOSED) {
            request->Resolve(MakeOutcome(id, OutcomeKind::CANCELLED, "channel closed"));
            return ResponseStream(request);
        }
        pending_.emplace(id, request);
        outbox_.push_back(std::move(frame));
    }

    spdlog::debug("Request {} queued ({} bytes of code)", id, code.size());
    return ResponseStream(request);
}

RequestOutcome ControlChannel::Execute(const std::string& code) {
    return Submit(code).Wait();
}

void ControlChannel::SetStateCallback(StateCallback callback) {
    state_callback_ = std::move(callback);
}

ChannelState ControlChannel::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ControlChannel::LastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::size_t ControlChannel::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::string ControlChannel::StateToString(ChannelState state) {
    switch (state) {
        case ChannelState::DISCONNECTED: return "disconnected";
        case ChannelState::CONNECTING: return "connecting";
        case ChannelState::CONNECTED: return "connected";
        case ChannelState::DEGRADED: return "degraded";
        case ChannelState::CLOSED: return "closed";
        default: return "unknown";
    }
}

// ============================================================================
// WORKER
// ============================================================================

void ControlChannel::Run() {
    spdlog::debug("Control channel worker started for ws://{}:{}{}",
                  config_.host, config_.port, config_.path);

    while (!closing_) {
        if (!ConnectWithRetry()) {
            break;
        }
        RunSession();
    }

    spdlog::debug("Control channel worker stopped");
}

bool ControlChannel::ConnectWithRetry() {
    peer_lost_ = false;

    for (int attempt = 1; attempt <= config_.max_retries; ++attempt) {
        if (closing_) {
            return false;
        }

        SetState(ChannelState::CONNECTING);
        ++connect_attempts_;
        spdlog::info("Connecting to ws://{}:{}{} (attempt {}/{})",
                     config_.host, config_.port, config_.path, attempt, config_.max_retries);

        try {
            transport_->Connect(config_.host, config_.port, config_.path, config_.connect_timeout);

            last_inbound_ = std::chrono::steady_clock::now();
            last_heartbeat_sent_ = std::chrono::steady_clock::time_point{};
            SetState(ChannelState::CONNECTED);
            spdlog::info("✓ Control channel connected");
            return true;
        } catch (const ConnectionError& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = ReasonOf(e);
            spdlog::error("Connection attempt {}/{} failed: {}",
                          attempt, config_.max_retries, last_error_);
        }

        if (attempt < config_.max_retries) {
            const auto delay = RetryDelay(attempt);
            SetState(ChannelState::DISCONNECTED);
            spdlog::info("Retrying in {}ms...", delay.count());

            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, delay, [this] { return closing_.load(); })) {
                return false;
            }
        }
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "gave up after " + std::to_string(config_.max_retries) +
                      " connect attempts (" + last_error_ + ")";
        reason = last_error_;
    }
    spdlog::error("Control channel closed: {}", reason);

    // CLOSED first so no Submit() slips in after the table is drained
    SetState(ChannelState::CLOSED);
    FailAll(OutcomeKind::CONNECTION_LOST, reason);
    return false;
}

void ControlChannel::RunSession() {
    const auto dead_after = config_.heartbeat_timeout + config_.grace_window;

    while (!closing_) {
        if (peer_lost_.exchange(false)) {
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                reason = peer_lost_reason_;
            }
            Disconnect("peer lost: " + reason);
            return;
        }

        if (!FlushOutbox()) {
            return;
        }

        try {
            SendHeartbeatIfDue();
        } catch (const ConnectionError& e) {
            Disconnect(ReasonOf(e));
            return;
        }

        const auto silence = std::chrono::steady_clock::now() - last_inbound_;
        if (silence >= dead_after) {
            Disconnect("no inbound traffic for " +
                       std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(silence).count()) +
                       "ms");
            return;
        }
        if (silence >= config_.heartbeat_timeout && State() == ChannelState::CONNECTED) {
            spdlog::warn("Control channel degraded: no heartbeat for {}ms",
                         std::chrono::duration_cast<std::chrono::milliseconds>(silence).count());
            SetState(ChannelState::DEGRADED);
        }

        ExpireDeadlines();

        std::optional<std::string> frame;
        try {
            frame = transport_->Receive(config_.poll_interval);
        } catch (const ConnectionError& e) {
            Disconnect(ReasonOf(e));
            return;
        }

        if (frame) {
            HandleFrame(*frame);
        }
    }
}

void ControlChannel::Disconnect(const std::string& reason) {
    spdlog::warn("Control channel disconnected: {}", reason);
    transport_->Close();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = reason;
    }
    SetState(ChannelState::DISCONNECTED);
    FailAll(OutcomeKind::CONNECTION_LOST, reason);
}

bool ControlChannel::FlushOutbox() {
    while (true) {
        std::string frame;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outbox_.empty()) {
                return true;
            }
            frame = std::move(outbox_.front());
            outbox_.pop_front();
        }

        try {
            transport_->Send(frame);
        } catch (const ConnectionError& e) {
            Disconnect(ReasonOf(e));
            return false;
        }
    }
}

void ControlChannel::SendHeartbeatIfDue() {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_heartbeat_sent_ < config_.heartbeat_interval) {
        return;
    }
    transport_->Send(MessageCodec::Encode(protocol::Heartbeat{}));
    last_heartbeat_sent_ = now;
}

// ============================================================================
// INBOUND ROUTING
// ============================================================================

void ControlChannel::HandleFrame(const std::string& frame) {
    protocol::Message message;
    try {
        message = MessageCodec::Decode(frame);
    } catch (const ProtocolDecodeError& e) {
        const auto& id = e.CorrelationId();
        if (id && FindPending(*id)) {
            spdlog::warn("Malformed response to request {}: {}", *id, e.what());
            Resolve(*id, MakeOutcome(*id, OutcomeKind::PROTOCOL_ERROR, e.what()));
        } else {
            ++protocol_violations_;
            spdlog::warn("Dropping malformed message: {}", e.what());
        }
        return;
    }

    // Any valid message proves the peer alive
    last_inbound_ = std::chrono::steady_clock::now();
    if (State() == ChannelState::DEGRADED) {
        spdlog::info("Control channel recovered");
        SetState(ChannelState::CONNECTED);
    }

    HandleMessage(message);
}

void ControlChannel::HandleMessage(const protocol::Message& message) {
    if (std::holds_alternative<protocol::Heartbeat>(message)) {
        spdlog::debug("Heartbeat received");
        return;
    }

    if (const auto* chunk = std::get_if<protocol::StreamChunk>(&message)) {
        auto request = FindPending(chunk->id);
        if (!request || !request->AddChunk(chunk->data)) {
            spdlog::debug("Dropping chunk for unknown or finished request {}", chunk->id);
        }
        return;
    }

    if (const auto* result = std::get_if<protocol::Result>(&message)) {
        RequestOutcome outcome = MakeOutcome(result->id, OutcomeKind::RESULT, "");
        outcome.value = result->value;
        Resolve(result->id, std::move(outcome));
        return;
    }

    if (const auto* error = std::get_if<protocol::Error>(&message)) {
        const bool limit_hit = error->code && *error->code == protocol::kResourceLimitExceededCode;
        RequestOutcome outcome = MakeOutcome(
            error->id,
            limit_hit ? OutcomeKind::RESOURCE_LIMIT_EXCEEDED : OutcomeKind::ERROR,
            error->reason);
        outcome.error_code = error->code;
        if (limit_hit) {
            spdlog::warn("Request {} hit a resource limit: {}", error->id, error->reason);
        }
        Resolve(error->id, std::move(outcome));
        return;
    }

    // Only the client sends requests
    ++protocol_violations_;
    spdlog::warn("Dropping unexpected request message from sandbox");
}

// ============================================================================
// PENDING TABLE
// ============================================================================

void ControlChannel::ExpireDeadlines() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<PendingRequest>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second->deadline <= now || it->second->IsResolved()) {
                expired.push_back(it->second);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& request : expired) {
        if (request->Resolve(request->TimeoutOutcome())) {
            spdlog::warn("Request {} timed out after {}ms", request->id, request->timeout.count());
        }
    }
}

void ControlChannel::FailAll(OutcomeKind kind, const std::string& reason) {
    std::map<std::string, std::shared_ptr<PendingRequest>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
        outbox_.clear();
    }

    std::size_t resolved = 0;
    for (const auto& [id, request] : pending) {
        if (request->Resolve(MakeOutcome(id, kind, reason))) {
            ++resolved;
        }
    }
    if (resolved > 0) {
        spdlog::warn("{} pending request(s) resolved as {}: {}",
                     resolved, RequestOutcome::KindToString(kind), reason);
    }
}

std::shared_ptr<PendingRequest> ControlChannel::FindPending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    return it == pending_.end() ? nullptr : it->second;
}

void ControlChannel::Resolve(const std::string& id, RequestOutcome outcome) {
    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            spdlog::debug("Dropping terminal message for unknown request {}", id);
            return;
        }
        request = it->second;
        pending_.erase(it);
    }
    request->Resolve(std::move(outcome));
}

// ============================================================================
// STATE
// ============================================================================

void ControlChannel::SetState(ChannelState state) {
    ChannelState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) {
            return;
        }
        previous = state_;
        state_ = state;
    }
    cv_.notify_all();

    spdlog::debug("Control channel: {} → {}", StateToString(previous), StateToString(state));
    if (state_callback_) {
        state_callback_(state);
    }
}

std::chrono::milliseconds ControlChannel::RetryDelay(int attempt) const {
    if (config_.backoff == BackoffPolicy::LINEAR) {
        return config_.retry_delay * attempt;
    }
    return config_.retry_delay;
}

} // namespace channel
} // namespace sandbridge
