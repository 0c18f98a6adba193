/**
 * @file message_codec.cpp
 * @brief Implementation of the strict message codec
 *
 * @date 2025
 */

#include "sandbridge/protocol/message_codec.hpp"

#include "sandbridge/core/errors.hpp"

#include <initializer_list>
#include <type_traits>

namespace sandbridge {
namespace protocol {

namespace {

constexpr const char* kTypeRequest = "request";
constexpr const char* kTypeStreamChunk = "stream-chunk";
constexpr const char* kTypeResult = "result";
constexpr const char* kTypeError = "error";
constexpr const char* kTypeHeartbeat = "heartbeat";

/// Reject any key outside the allowed set
void RequireOnlyKeys(const json& j, std::initializer_list<const char*> allowed,
                     const std::string& type, const std::optional<std::string>& id) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* key : allowed) {
            if (it.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw ProtocolDecodeError("unexpected field '" + it.key() + "' in " + type, id);
        }
    }
}

std::string RequireString(const json& j, const char* key,
                          const std::string& type, const std::optional<std::string>& id) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw ProtocolDecodeError("missing field '" + std::string(key) + "' in " + type, id);
    }
    if (!it->is_string()) {
        throw ProtocolDecodeError("field '" + std::string(key) + "' in " + type +
                                  " must be a string", id);
    }
    return it->get<std::string>();
}

std::string RequireId(const json& j, const std::string& type,
                      const std::optional<std::string>& id) {
    auto value = RequireString(j, "id", type, id);
    if (value.empty()) {
        throw ProtocolDecodeError("empty id in " + type);
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// ENCODING
// ============================================================================

std::string MessageCodec::Encode(const Message& message) {
    json j = std::visit([](const auto& msg) -> json {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Request>) {
            return {{"type", kTypeRequest}, {"id", msg.id}, {"code", msg.code}};
        } else if constexpr (std::is_same_v<T, StreamChunk>) {
            return {{"type", kTypeStreamChunk}, {"id", msg.id}, {"data", msg.data}};
        } else if constexpr (std::is_same_v<T, Result>) {
            return {{"type", kTypeResult}, {"id", msg.id}, {"value", msg.value}};
        } else if constexpr (std::is_same_v<T, Error>) {
            json e = {{"type", kTypeError}, {"id", msg.id}, {"reason", msg.reason}};
            if (msg.code) {
                e["code"] = *msg.code;
            }
            return e;
        } else {
            return {{"type", kTypeHeartbeat}};
        }
    }, message);

    try {
        return j.dump();
    } catch (const json::type_error& e) {
        throw ProtocolEncodeError(e.what());
    }
}

// ============================================================================
// DECODING
// ============================================================================

Message MessageCodec::Decode(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ProtocolDecodeError("payload is not valid JSON");
    }
    if (!j.is_object()) {
        throw ProtocolDecodeError("payload is not a JSON object");
    }

    // Recover the correlation id first so later failures can be scoped
    std::optional<std::string> id;
    auto id_it = j.find("id");
    if (id_it != j.end() && id_it->is_string() && !id_it->get<std::string>().empty()) {
        id = id_it->get<std::string>();
    }

    auto type_it = j.find("type");
    if (type_it == j.end()) {
        throw ProtocolDecodeError("missing field 'type'", id);
    }
    if (!type_it->is_string()) {
        throw ProtocolDecodeError("field 'type' must be a string", id);
    }
    const std::string type = type_it->get<std::string>();

    if (type == kTypeRequest) {
        RequireOnlyKeys(j, {"type", "id", "code"}, type, id);
        return Request{RequireId(j, type, id), RequireString(j, "code", type, id)};
    }

    if (type == kTypeStreamChunk) {
        RequireOnlyKeys(j, {"type", "id", "data"}, type, id);
        return StreamChunk{RequireId(j, type, id), RequireString(j, "data", type, id)};
    }

    if (type == kTypeResult) {
        RequireOnlyKeys(j, {"type", "id", "value"}, type, id);
        auto value_it = j.find("value");
        if (value_it == j.end()) {
            throw ProtocolDecodeError("missing field 'value' in result", id);
        }
        return Result{RequireId(j, type, id), *value_it};
    }

    if (type == kTypeError) {
        RequireOnlyKeys(j, {"type", "id", "reason", "code"}, type, id);
        Error error{RequireId(j, type, id), RequireString(j, "reason", type, id), std::nullopt};
        if (j.contains("code")) {
            error.code = RequireString(j, "code", type, id);
        }
        return error;
    }

    if (type == kTypeHeartbeat) {
        RequireOnlyKeys(j, {"type"}, type, id);
        return Heartbeat{};
    }

    throw ProtocolDecodeError("unknown message type '" + type + "'", id);
}

// ============================================================================
// INSPECTION
// ============================================================================

MessageKind MessageCodec::KindOf(const Message& message) {
    return std::visit([](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Request>) return MessageKind::REQUEST;
        else if constexpr (std::is_same_v<T, StreamChunk>) return MessageKind::STREAM_CHUNK;
        else if constexpr (std::is_same_v<T, Result>) return MessageKind::RESULT;
        else if constexpr (std::is_same_v<T, Error>) return MessageKind::ERROR;
        else return MessageKind::HEARTBEAT;
    }, message);
}

std::optional<std::string> MessageCodec::CorrelationIdOf(const Message& message) {
    return std::visit([](const auto& msg) -> std::optional<std::string> {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Heartbeat>) {
            return std::nullopt;
        } else {
            return msg.id;
        }
    }, message);
}

std::string MessageCodec::KindToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::REQUEST: return kTypeRequest;
        case MessageKind::STREAM_CHUNK: return kTypeStreamChunk;
        case MessageKind::RESULT: return kTypeResult;
        case MessageKind::ERROR: return kTypeError;
        case MessageKind::HEARTBEAT: return kTypeHeartbeat;
        default: return "unknown";
    }
}

} // namespace protocol
} // namespace sandbridge
