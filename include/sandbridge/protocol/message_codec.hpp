/**
 * @file message_codec.hpp
 * @brief Strict JSON codec for control channel messages
 *
 * Decoding fails closed: non-object documents, unknown `type` values,
 * missing or mistyped fields and unknown keys are all rejected with
 * ProtocolDecodeError. When the rejected payload still carries a string
 * `id`, it is attached to the error so the failure can be scoped to that
 * request.
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/protocol/message.hpp"

#include <optional>
#include <string>

namespace sandbridge {
namespace protocol {

/**
 * @class MessageCodec
 * @brief Encode/decode Message to and from its wire text
 *
 * **Usage Example**:
 * @code
 * auto text = MessageCodec::Encode(Request{"1", "print('ok')"});
 *
 * try {
 *     auto msg = MessageCodec::Decode(frame);
 *     if (auto* chunk = std::get_if<StreamChunk>(&msg)) {
 *         std::cout << chunk->data;
 *     }
 * } catch (const ProtocolDecodeError& e) {
 *     // e.CorrelationId() names the affected request, if any
 * }
 * @endcode
 */
class MessageCodec {
public:
    /**
     * @brief Serialise to one compact JSON object
     * @throws ProtocolEncodeError if a text field is not valid UTF-8
     */
    static std::string Encode(const Message& message);

    /**
     * @brief Parse and validate one wire frame
     * @throws ProtocolDecodeError on any deviation from the wire format
     */
    static Message Decode(const std::string& text);

    static MessageKind KindOf(const Message& message);

    /// Correlation id of the message, std::nullopt for heartbeats
    static std::optional<std::string> CorrelationIdOf(const Message& message);

    /// Wire `type` string of a kind ("stream-chunk", ...)
    static std::string KindToString(MessageKind kind);
};

} // namespace protocol
} // namespace sandbridge
