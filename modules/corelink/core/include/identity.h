#ifndef IDENTITY_H
#define IDENTITY_H

#include <cstddef>
#include <string>

/**
 * @brief Generates a short peer identity: `length` characters drawn from [A-Z0-9].
 *
 * Not guaranteed globally unique; collisions are left to the user to resolve.
 */
std::string generate_peer_id(size_t length = 6);

/**
 * @brief Generates a random RFC 4122 version 4 UUID in canonical text form.
 * Used for envelope ids and transfer ids.
 */
std::string generate_uuid();

// Trims surrounding whitespace and upper-cases, e.g. " abc123 " -> "ABC123".
std::string normalize_peer_id(const std::string& raw);

// Non-empty and strictly [A-Z0-9].
bool is_valid_peer_id(const std::string& peer_id);

#endif // IDENTITY_H
