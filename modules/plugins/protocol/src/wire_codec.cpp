#include "wire_codec.h"
#include "logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    inline void wire_debug_log(const std::string& msg) {
#ifdef P2PLINK_WIRE_CODEC_DEBUG
        LOG_DEBUG(msg);
#else
        (void)msg;
#endif
    }

    bool reject(std::string* error, const std::string& reason) {
        wire_debug_log("WIRE_DEBUG: " + reason);
        if (error) *error = reason;
        return false;
    }

    void put_u32_be(std::string& out, uint32_t value) {
        out.push_back(static_cast<char>((value >> 24) & 0xFF));
        out.push_back(static_cast<char>((value >> 16) & 0xFF));
        out.push_back(static_cast<char>((value >> 8) & 0xFF));
        out.push_back(static_cast<char>(value & 0xFF));
    }

    uint32_t get_u32_be(std::string_view data, size_t offset) {
        return (static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) << 24) |
               (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 16) |
               (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 8) |
               static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3]));
    }

    bool is_text_kind(MessageKind kind) {
        return kind == MessageKind::TEXT || kind == MessageKind::SYSTEM || kind == MessageKind::CALL_RESPONSE;
    }

    bool is_binary_kind(MessageKind kind) {
        return kind == MessageKind::IMAGE || kind == MessageKind::VIDEO_FILE || kind == MessageKind::CHUNK;
    }
}

namespace wire {

std::string encode_envelope(const Envelope& envelope) {
    json header;
    header["id"] = envelope.id();
    header["senderId"] = envelope.sender_id();
    header["kind"] = message_kind_to_string(envelope.kind());
    header["timestamp"] = envelope.timestamp_ms();
    if (envelope.file_name()) header["fileName"] = *envelope.file_name();
    if (envelope.transfer_id()) header["transferId"] = *envelope.transfer_id();
    if (envelope.chunk_index()) header["chunkIndex"] = *envelope.chunk_index();
    if (envelope.total_chunks()) header["totalChunks"] = *envelope.total_chunks();
    if (const std::string* text = envelope.text()) header["text"] = *text;

    const std::string header_text = header.dump();
    const Bytes* body = envelope.binary();
    const size_t body_size = body ? body->size() : 0;

    std::string encoded;
    encoded.reserve(kFramePrefixSize + header_text.size() + body_size);
    encoded.push_back(static_cast<char>(envelope.kind()));
    put_u32_be(encoded, static_cast<uint32_t>(header_text.size()));
    encoded.append(header_text);
    if (body && !body->empty()) {
        encoded.append(reinterpret_cast<const char*>(body->data()), body->size());
    }
    return encoded;
}

std::optional<Envelope> decode_envelope(std::string_view data, std::string* error) {
    if (data.size() < kFramePrefixSize) {
        reject(error, "Frame truncated: " + std::to_string(data.size()) + " bytes");
        return std::nullopt;
    }
    if (data.size() > kMaxFrameSize) {
        reject(error, "Frame too large: " + std::to_string(data.size()));
        return std::nullopt;
    }

    const uint8_t raw_kind = static_cast<uint8_t>(data[0]);
    if (!is_valid_message_kind(raw_kind)) {
        reject(error, "Unknown kind byte: " + std::to_string(raw_kind));
        return std::nullopt;
    }
    const MessageKind kind = static_cast<MessageKind>(raw_kind);

    const uint32_t header_length = get_u32_be(data, 1);
    if (header_length > kMaxHeaderSize) {
        reject(error, "Header too large: " + std::to_string(header_length));
        return std::nullopt;
    }
    if (data.size() < kFramePrefixSize + header_length) {
        reject(error, "Header truncated. Expected " + std::to_string(kFramePrefixSize + header_length) +
                          ", got " + std::to_string(data.size()));
        return std::nullopt;
    }

    const std::string_view header_text = data.substr(kFramePrefixSize, header_length);
    const std::string_view body = data.substr(kFramePrefixSize + header_length);

    try {
        const json header = json::parse(header_text);
        if (!header.is_object()) {
            reject(error, "Header is not a JSON object");
            return std::nullopt;
        }

        const auto header_kind = message_kind_from_string(header.at("kind").get<std::string>());
        if (!header_kind || *header_kind != kind) {
            reject(error, "Header kind does not match kind byte");
            return std::nullopt;
        }

        EnvelopeContent content;
        if (is_text_kind(kind)) {
            if (!body.empty()) {
                reject(error, std::string(message_kind_to_string(kind)) + " frame must not carry a body");
                return std::nullopt;
            }
            content = TextContent{header.at("text").get<std::string>()};
        } else if (is_binary_kind(kind)) {
            Bytes bytes(body.begin(), body.end());
            if (kind == MessageKind::IMAGE) {
                content = ImageContent{std::move(bytes)};
            } else if (kind == MessageKind::VIDEO_FILE) {
                content = VideoContent{std::move(bytes)};
            } else {
                content = ChunkContent{std::move(bytes)};
            }
        } else if (!body.empty()) {
            reject(error, std::string(message_kind_to_string(kind)) + " frame must not carry a body");
            return std::nullopt;
        }

        std::optional<std::string> file_name;
        std::optional<std::string> transfer_id;
        std::optional<uint32_t> chunk_index;
        std::optional<uint32_t> total_chunks;
        if (header.contains("fileName")) file_name = header["fileName"].get<std::string>();
        if (header.contains("transferId")) transfer_id = header["transferId"].get<std::string>();
        if (header.contains("chunkIndex")) chunk_index = header["chunkIndex"].get<uint32_t>();
        if (header.contains("totalChunks")) total_chunks = header["totalChunks"].get<uint32_t>();

        Envelope envelope(header.at("id").get<std::string>(),
                          header.at("senderId").get<std::string>(),
                          kind,
                          std::move(content),
                          header.at("timestamp").get<int64_t>(),
                          std::move(file_name),
                          std::move(transfer_id),
                          chunk_index,
                          total_chunks);

        std::string validation_error;
        if (!validate_envelope(envelope, &validation_error)) {
            reject(error, "Invalid envelope: " + validation_error);
            return std::nullopt;
        }
        return envelope;
    } catch (const json::exception& e) {
        reject(error, std::string("Malformed header: ") + e.what());
        return std::nullopt;
    }
}

} // namespace wire
