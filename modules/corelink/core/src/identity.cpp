#include "identity.h"
#include "logger.h"
#include <sodium.h>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <stdexcept>

namespace {

const char kIdAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "0123456789";

void ensure_sodium() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (sodium_init() < 0) {
            nativeLog("Libsodium initialization failed!");
            throw std::runtime_error("Libsodium init failed");
        }
    });
}

} // namespace

std::string generate_peer_id(size_t length) {
    ensure_sodium();

    std::string id;
    id.reserve(length);
    const uint32_t alphabet_size = static_cast<uint32_t>(sizeof(kIdAlphabet) - 1);
    for (size_t i = 0; i < length; ++i) {
        id += kIdAlphabet[randombytes_uniform(alphabet_size)];
    }
    return id;
}

std::string generate_uuid() {
    ensure_sodium();

    unsigned char bytes[16];
    randombytes_buf(bytes, sizeof(bytes));

    // Version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += hex[(bytes[i] >> 4) & 0x0F];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}

std::string normalize_peer_id(const std::string& raw) {
    size_t begin = 0;
    size_t end = raw.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

    std::string out = raw.substr(begin, end - begin);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool is_valid_peer_id(const std::string& peer_id) {
    if (peer_id.empty()) return false;
    for (char c : peer_id) {
        const bool upper = c >= 'A' && c <= 'Z';
        const bool digit = c >= '0' && c <= '9';
        if (!upper && !digit) return false;
    }
    return true;
}
