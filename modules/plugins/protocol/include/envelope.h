#ifndef ENVELOPE_H
#define ENVELOPE_H

#include "message_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using Bytes = std::vector<uint8_t>;

// ============================================================================
// CONTENT - tagged union over everything an envelope may carry
// ============================================================================

struct TextContent {
    std::string text;
};

struct ImageContent {
    Bytes data;
};

struct VideoContent {
    Bytes data;
};

struct ChunkContent {
    Bytes data;
};

// std::monostate is the empty content of control kinds (CALL_REQUEST).
using EnvelopeContent = std::variant<std::monostate, TextContent, ImageContent, VideoContent, ChunkContent>;

enum class CallDecision {
    ACCEPT,
    REJECT
};

inline constexpr const char kCallAccept[] = "ACCEPT";
inline constexpr const char kCallReject[] = "REJECT";

int64_t now_millis();

// IMAGE for common image suffixes (case-insensitive), VIDEO_FILE otherwise.
MessageKind classify_file_kind(const std::string& file_name);

// ============================================================================
// ENVELOPE
// ============================================================================

/**
 * One discrete protocol message. Immutable once constructed: build it with one
 * of the named factories (which stamp a fresh id and the current time) or with
 * the full constructor when decoding from the wire.
 */
class Envelope {
public:
    Envelope(std::string id,
             std::string sender_id,
             MessageKind kind,
             EnvelopeContent content,
             int64_t timestamp_ms,
             std::optional<std::string> file_name = std::nullopt,
             std::optional<std::string> transfer_id = std::nullopt,
             std::optional<uint32_t> chunk_index = std::nullopt,
             std::optional<uint32_t> total_chunks = std::nullopt);

    static Envelope text(const std::string& sender_id, const std::string& text);
    static Envelope system(const std::string& sender_id, const std::string& text);

    // kind must be IMAGE or VIDEO_FILE; any other kind is coerced through classify_file_kind().
    static Envelope file(const std::string& sender_id, MessageKind kind, Bytes data, const std::string& file_name);

    static Envelope chunk(const std::string& sender_id,
                          const std::string& transfer_id,
                          uint32_t chunk_index,
                          uint32_t total_chunks,
                          Bytes data,
                          const std::string& file_name);

    static Envelope call_request(const std::string& sender_id);
    static Envelope call_response(const std::string& sender_id, CallDecision decision);

    const std::string& id() const { return m_id; }
    const std::string& sender_id() const { return m_sender_id; }
    MessageKind kind() const { return m_kind; }
    const EnvelopeContent& content() const { return m_content; }
    int64_t timestamp_ms() const { return m_timestamp_ms; }
    const std::optional<std::string>& file_name() const { return m_file_name; }
    const std::optional<std::string>& transfer_id() const { return m_transfer_id; }
    const std::optional<uint32_t>& chunk_index() const { return m_chunk_index; }
    const std::optional<uint32_t>& total_chunks() const { return m_total_chunks; }

    // Kind-specific accessors; nullptr / nullopt when the content does not match.
    const std::string* text() const;
    const Bytes* binary() const;
    std::optional<CallDecision> call_decision() const;

    bool has_content() const { return !std::holds_alternative<std::monostate>(m_content); }
    size_t content_size() const;

private:
    std::string m_id;
    std::string m_sender_id;
    MessageKind m_kind;
    EnvelopeContent m_content;
    int64_t m_timestamp_ms;
    std::optional<std::string> m_file_name;
    std::optional<std::string> m_transfer_id;
    std::optional<uint32_t> m_chunk_index;
    std::optional<uint32_t> m_total_chunks;
};

/**
 * Checks the per-kind field requirements. Returns false and fills `error`
 * (when non-null) for a malformed envelope.
 */
bool validate_envelope(const Envelope& envelope, std::string* error = nullptr);

#endif // ENVELOPE_H
