/**
 * @file message.hpp
 * @brief Closed set of messages exchanged over the control channel
 *
 * Every request eventually yields exactly one terminal message (Result or
 * Error) carrying its correlation id. StreamChunks for that id may precede
 * the terminal message but never follow it.
 *
 * **Wire Format** (one JSON object per WebSocket text frame):
 * ```
 * {"type":"request",      "id":"7", "code":"print('ok')"}
 * {"type":"stream-chunk", "id":"7", "data":"ok"}
 * {"type":"result",       "id":"7", "value":null}
 * {"type":"error",        "id":"7", "reason":"...", "code":"resource_limit_exceeded"}
 * {"type":"heartbeat"}
 * ```
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace sandbridge {
namespace protocol {

using json = nlohmann::json;

/// Code submitted for execution
struct Request {
    std::string id;    ///< Correlation id
    std::string code;  ///< Source to execute
};

/// Incremental output of a running request
struct StreamChunk {
    std::string id;    ///< Correlation id
    std::string data;  ///< Output fragment
};

/// Successful terminal message
struct Result {
    std::string id;    ///< Correlation id
    json value;        ///< Opaque result payload
};

/// Failed terminal message
struct Error {
    std::string id;                   ///< Correlation id
    std::string reason;               ///< Human-readable reason
    std::optional<std::string> code;  ///< Machine-readable error code
};

/// Liveness signal, sent on a fixed interval by both sides
struct Heartbeat {};

using Message = std::variant<Request, StreamChunk, Result, Error, Heartbeat>;

/**
 * @enum MessageKind
 * @brief Discriminator of a Message
 */
enum class MessageKind {
    REQUEST,
    STREAM_CHUNK,
    RESULT,
    ERROR,
    HEARTBEAT
};

/// Error code reported when an engine-enforced ceiling was hit
inline constexpr const char* kResourceLimitExceededCode = "resource_limit_exceeded";

} // namespace protocol
} // namespace sandbridge
