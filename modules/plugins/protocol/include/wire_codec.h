#pragma once

#include "envelope.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wire {

// Maximum allowed frame size to prevent DoS attacks (10 MB)
inline constexpr uint32_t kMaxFrameSize = 10u * 1024u * 1024u;

// Maximum JSON header size (64 KB)
inline constexpr uint32_t kMaxHeaderSize = 64u * 1024u;

// Fixed prefix: [kind: 1 byte][header length: 4 bytes big-endian]
inline constexpr size_t kFramePrefixSize = 5;

// Frame format: [kind: 1 byte][header length: 4 bytes big-endian][JSON header][binary body]
// Text content travels in the header; image/video/chunk bytes are the body.
std::string encode_envelope(const Envelope& envelope);

// Decodes one complete frame. Returns nullopt (and fills `error` when non-null) if the
// frame is truncated, too large, carries an unknown kind, or its header is not valid JSON.
// The decoded envelope is also run through validate_envelope().
std::optional<Envelope> decode_envelope(std::string_view data, std::string* error = nullptr);

} // namespace wire
