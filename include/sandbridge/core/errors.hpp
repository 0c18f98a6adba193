/**
 * @file errors.hpp
 * @brief Exception hierarchy for sandbox lifecycle and control channel failures
 *
 * Lifecycle failures (build, create, start, readiness) are thrown synchronously
 * from the failing call. Channel failures scoped to one request are delivered
 * as that request's outcome and only become exceptions when the caller asks
 * for it via RequestOutcome::ThrowIfFailed().
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace sandbridge {

/**
 * @class SandboxError
 * @brief Root of all sandbridge exceptions
 */
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Invalid or inconsistent configuration value
class ConfigError : public SandboxError {
public:
    explicit ConfigError(const std::string& message)
        : SandboxError("configuration error: " + message) {}
};

/// Container engine command failed (permission denied, daemon down, port conflict)
class EngineError : public SandboxError {
public:
    EngineError(const std::string& message, int exit_code = -1)
        : SandboxError(message), exit_code_(exit_code) {}

    int ExitCode() const { return exit_code_; }

private:
    int exit_code_;
};

/// Image build failed; fatal to that build attempt
class ImageBuildError : public SandboxError {
public:
    explicit ImageBuildError(const std::string& message)
        : SandboxError("image build failed: " + message) {}
};

/// Container could not be created or started, or exited during startup
class ContainerStartError : public SandboxError {
public:
    explicit ContainerStartError(const std::string& message)
        : SandboxError("container start failed: " + message) {}
};

/// Readiness probe exhausted its retries
class ReadinessTimeoutError : public SandboxError {
public:
    explicit ReadinessTimeoutError(const std::string& message)
        : SandboxError("readiness timeout: " + message) {}
};

/// Lifecycle operation called in a state that does not allow it
class InvalidStateError : public SandboxError {
public:
    explicit InvalidStateError(const std::string& message)
        : SandboxError(message) {}
};

/// Connection could not be established or was lost
class ConnectionError : public SandboxError {
public:
    explicit ConnectionError(const std::string& message)
        : SandboxError("connection error: " + message) {}
};

/**
 * @class ProtocolDecodeError
 * @brief Inbound payload violates the wire protocol
 *
 * Carries the correlation id when one could be recovered from the payload,
 * so the failure can be scoped to a single request.
 */
class ProtocolDecodeError : public SandboxError {
public:
    ProtocolDecodeError(const std::string& message,
                        std::optional<std::string> correlation_id = std::nullopt)
        : SandboxError("protocol violation: " + message)
        , correlation_id_(std::move(correlation_id)) {}

    const std::optional<std::string>& CorrelationId() const { return correlation_id_; }

private:
    std::optional<std::string> correlation_id_;
};

/// Outbound message cannot be represented on the wire (e.g. invalid UTF-8)
class ProtocolEncodeError : public SandboxError {
public:
    explicit ProtocolEncodeError(const std::string& message)
        : SandboxError("protocol encode failed: " + message) {}
};

/// Request did not reach a terminal message within its timeout
class RequestTimeoutError : public SandboxError {
public:
    explicit RequestTimeoutError(const std::string& message)
        : SandboxError("request timed out: " + message) {}
};

/// Request was cancelled because its session was closed
class RequestCancelledError : public SandboxError {
public:
    explicit RequestCancelledError(const std::string& message)
        : SandboxError("request cancelled: " + message) {}
};

/// Sandbox reported an execution error for the request
class RemoteExecutionError : public SandboxError {
public:
    explicit RemoteExecutionError(const std::string& message)
        : SandboxError(message) {}
};

/// Engine-enforced resource ceiling hit by the in-flight request
class ResourceLimitExceeded : public SandboxError {
public:
    explicit ResourceLimitExceeded(const std::string& message)
        : SandboxError("resource limit exceeded: " + message) {}
};

} // namespace sandbridge
