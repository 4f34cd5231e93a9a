#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

// Closed set of envelope kinds. The numeric value is the wire frame's kind byte.
enum class MessageKind : uint8_t {
    TEXT          = 0x01,
    IMAGE         = 0x02,
    VIDEO_FILE    = 0x03,
    SYSTEM        = 0x04,

    // Transfer frames: one slice of an IMAGE/VIDEO_FILE payload.
    CHUNK         = 0x10,

    // Call negotiation control frames (no user-visible content).
    CALL_REQUEST  = 0x20,
    CALL_RESPONSE = 0x21
};

const char* message_kind_to_string(MessageKind kind);
std::optional<MessageKind> message_kind_from_string(std::string_view name);
bool is_valid_message_kind(uint8_t raw);
