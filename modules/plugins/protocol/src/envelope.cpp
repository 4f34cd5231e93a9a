#include "envelope.h"
#include "identity.h"

#include <algorithm>
#include <cctype>
#include <chrono>

// ============================================================================
// MESSAGE KINDS
// ============================================================================

const char* message_kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::TEXT: return "TEXT";
        case MessageKind::IMAGE: return "IMAGE";
        case MessageKind::VIDEO_FILE: return "VIDEO_FILE";
        case MessageKind::SYSTEM: return "SYSTEM";
        case MessageKind::CHUNK: return "CHUNK";
        case MessageKind::CALL_REQUEST: return "CALL_REQUEST";
        case MessageKind::CALL_RESPONSE: return "CALL_RESPONSE";
        default: return "UNKNOWN";
    }
}

std::optional<MessageKind> message_kind_from_string(std::string_view name) {
    if (name == "TEXT") return MessageKind::TEXT;
    if (name == "IMAGE") return MessageKind::IMAGE;
    if (name == "VIDEO_FILE") return MessageKind::VIDEO_FILE;
    if (name == "SYSTEM") return MessageKind::SYSTEM;
    if (name == "CHUNK") return MessageKind::CHUNK;
    if (name == "CALL_REQUEST") return MessageKind::CALL_REQUEST;
    if (name == "CALL_RESPONSE") return MessageKind::CALL_RESPONSE;
    return std::nullopt;
}

bool is_valid_message_kind(uint8_t raw) {
    switch (static_cast<MessageKind>(raw)) {
        case MessageKind::TEXT:
        case MessageKind::IMAGE:
        case MessageKind::VIDEO_FILE:
        case MessageKind::SYSTEM:
        case MessageKind::CHUNK:
        case MessageKind::CALL_REQUEST:
        case MessageKind::CALL_RESPONSE:
            return true;
    }
    return false;
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

MessageKind classify_file_kind(const std::string& file_name) {
    static const char* const kImageSuffixes[] = {
        ".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp", ".svg", ".heic", ".avif"
    };

    std::string lower = file_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* suffix : kImageSuffixes) {
        const std::string s(suffix);
        if (lower.size() >= s.size() && lower.compare(lower.size() - s.size(), s.size(), s) == 0) {
            return MessageKind::IMAGE;
        }
    }
    return MessageKind::VIDEO_FILE;
}

// ============================================================================
// ENVELOPE
// ============================================================================

Envelope::Envelope(std::string id,
                   std::string sender_id,
                   MessageKind kind,
                   EnvelopeContent content,
                   int64_t timestamp_ms,
                   std::optional<std::string> file_name,
                   std::optional<std::string> transfer_id,
                   std::optional<uint32_t> chunk_index,
                   std::optional<uint32_t> total_chunks)
    : m_id(std::move(id)),
      m_sender_id(std::move(sender_id)),
      m_kind(kind),
      m_content(std::move(content)),
      m_timestamp_ms(timestamp_ms),
      m_file_name(std::move(file_name)),
      m_transfer_id(std::move(transfer_id)),
      m_chunk_index(chunk_index),
      m_total_chunks(total_chunks) {}

Envelope Envelope::text(const std::string& sender_id, const std::string& text) {
    return Envelope(generate_uuid(), sender_id, MessageKind::TEXT, TextContent{text}, now_millis());
}

Envelope Envelope::system(const std::string& sender_id, const std::string& text) {
    return Envelope(generate_uuid(), sender_id, MessageKind::SYSTEM, TextContent{text}, now_millis());
}

Envelope Envelope::file(const std::string& sender_id, MessageKind kind, Bytes data, const std::string& file_name) {
    if (kind != MessageKind::IMAGE && kind != MessageKind::VIDEO_FILE) {
        kind = classify_file_kind(file_name);
    }
    EnvelopeContent content;
    if (kind == MessageKind::IMAGE) {
        content = ImageContent{std::move(data)};
    } else {
        content = VideoContent{std::move(data)};
    }
    return Envelope(generate_uuid(), sender_id, kind, std::move(content), now_millis(), file_name);
}

Envelope Envelope::chunk(const std::string& sender_id,
                         const std::string& transfer_id,
                         uint32_t chunk_index,
                         uint32_t total_chunks,
                         Bytes data,
                         const std::string& file_name) {
    return Envelope(generate_uuid(), sender_id, MessageKind::CHUNK, ChunkContent{std::move(data)}, now_millis(),
                    file_name, transfer_id, chunk_index, total_chunks);
}

Envelope Envelope::call_request(const std::string& sender_id) {
    return Envelope(generate_uuid(), sender_id, MessageKind::CALL_REQUEST, std::monostate{}, now_millis());
}

Envelope Envelope::call_response(const std::string& sender_id, CallDecision decision) {
    const char* token = decision == CallDecision::ACCEPT ? kCallAccept : kCallReject;
    return Envelope(generate_uuid(), sender_id, MessageKind::CALL_RESPONSE, TextContent{token}, now_millis());
}

const std::string* Envelope::text() const {
    if (const auto* t = std::get_if<TextContent>(&m_content)) {
        return &t->text;
    }
    return nullptr;
}

const Bytes* Envelope::binary() const {
    if (const auto* c = std::get_if<ChunkContent>(&m_content)) return &c->data;
    if (const auto* i = std::get_if<ImageContent>(&m_content)) return &i->data;
    if (const auto* v = std::get_if<VideoContent>(&m_content)) return &v->data;
    return nullptr;
}

std::optional<CallDecision> Envelope::call_decision() const {
    if (m_kind != MessageKind::CALL_RESPONSE) return std::nullopt;
    const std::string* t = text();
    if (!t) return std::nullopt;
    if (*t == kCallAccept) return CallDecision::ACCEPT;
    if (*t == kCallReject) return CallDecision::REJECT;
    return std::nullopt;
}

size_t Envelope::content_size() const {
    if (const std::string* t = text()) return t->size();
    if (const Bytes* b = binary()) return b->size();
    return 0;
}

// ============================================================================
// VALIDATION
// ============================================================================

namespace {

bool fail(std::string* error, const std::string& reason) {
    if (error) *error = reason;
    return false;
}

} // namespace

bool validate_envelope(const Envelope& envelope, std::string* error) {
    const std::string kind_name = message_kind_to_string(envelope.kind());

    if (envelope.id().empty()) return fail(error, kind_name + ": missing id");
    if (envelope.sender_id().empty()) return fail(error, kind_name + ": missing sender id");

    const bool has_chunk_fields = envelope.transfer_id().has_value() ||
                                  envelope.chunk_index().has_value() ||
                                  envelope.total_chunks().has_value();
    if (envelope.kind() != MessageKind::CHUNK && has_chunk_fields) {
        return fail(error, kind_name + ": transfer fields are only valid on CHUNK");
    }

    const auto& content = envelope.content();
    switch (envelope.kind()) {
        case MessageKind::TEXT:
            if (!std::holds_alternative<TextContent>(content)) return fail(error, "TEXT: content must be text");
            if (envelope.text()->empty()) return fail(error, "TEXT: empty text");
            return true;

        case MessageKind::SYSTEM:
            if (!std::holds_alternative<TextContent>(content)) return fail(error, "SYSTEM: content must be text");
            return true;

        case MessageKind::IMAGE:
            if (!std::holds_alternative<ImageContent>(content)) return fail(error, "IMAGE: content must be image bytes");
            if (!envelope.file_name() || envelope.file_name()->empty()) return fail(error, "IMAGE: missing file name");
            return true;

        case MessageKind::VIDEO_FILE:
            if (!std::holds_alternative<VideoContent>(content)) return fail(error, "VIDEO_FILE: content must be video bytes");
            if (!envelope.file_name() || envelope.file_name()->empty()) return fail(error, "VIDEO_FILE: missing file name");
            return true;

        case MessageKind::CHUNK:
            if (!std::holds_alternative<ChunkContent>(content)) return fail(error, "CHUNK: content must be raw bytes");
            if (envelope.binary()->empty()) return fail(error, "CHUNK: empty slice");
            if (!envelope.transfer_id() || envelope.transfer_id()->empty()) return fail(error, "CHUNK: missing transfer id");
            if (!envelope.chunk_index()) return fail(error, "CHUNK: missing chunk index");
            if (!envelope.total_chunks() || *envelope.total_chunks() == 0) return fail(error, "CHUNK: missing total chunks");
            if (*envelope.chunk_index() >= *envelope.total_chunks()) return fail(error, "CHUNK: chunk index out of range");
            return true;

        case MessageKind::CALL_REQUEST:
            if (envelope.has_content()) return fail(error, "CALL_REQUEST: must not carry content");
            return true;

        case MessageKind::CALL_RESPONSE:
            if (!envelope.call_decision()) return fail(error, "CALL_RESPONSE: content must be ACCEPT or REJECT");
            return true;
    }
    return fail(error, "unknown kind");
}
