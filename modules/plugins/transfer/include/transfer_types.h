#ifndef TRANSFER_TYPES_H
#define TRANSFER_TYPES_H

#include "envelope.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * TRANSFER TYPES AND COMMON DEFINITIONS
 *
 * Shared enums and callback typedefs used by TransferManager and the
 * SessionController that drives it.
 */

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr uint32_t DEFAULT_CHUNK_SIZE = 16 * 1024;      // 16KB slices, identical on both sides
constexpr uint32_t DEFAULT_PACE_BATCH = 8;              // Yield to the event loop every 8 chunks
constexpr uint64_t DEFAULT_MAX_TRANSFER_BYTES = 64ull * 1024 * 1024;  // Largest payload in either direction
constexpr size_t DEFAULT_MAX_INBOUND_TRANSFERS = 8;     // Partial inbound transfers open at once
constexpr size_t RECENT_COMPLETED_LIMIT = 64;           // Completed inbound ids kept to drop late re-deliveries

// ============================================================================
// ENUMS - Transfer Control
// ============================================================================

enum class PumpResult {
    YIELD,              // Batch sent, continuation must be scheduled
    DONE,               // Last chunk sent, transfer removed
    ABORTED,            // Sink refused a chunk, transfer abandoned
    UNKNOWN_TRANSFER    // No such outbound transfer (discarded or finished)
};

enum class ChunkResult {
    ACCEPTED,           // Slot filled, transfer still partial
    DUPLICATE,          // Slot already filled (or transfer already completed), count unchanged
    COMPLETED,          // Last slot filled, payload reassembled
    REJECTED            // Inconsistent with the transfer, dropped
};

const char* pump_result_to_string(PumpResult result);
const char* chunk_result_to_string(ChunkResult result);

// ============================================================================
// RESULTS
// ============================================================================

struct PumpOutcome {
    PumpResult result = PumpResult::UNKNOWN_TRANSFER;
    uint32_t chunks_sent = 0;
};

struct ChunkOutcome {
    ChunkResult result = ChunkResult::REJECTED;
    // Set on COMPLETED: the reassembled IMAGE/VIDEO_FILE envelope.
    std::optional<Envelope> completed;
};

// ============================================================================
// CALLBACKS AND TYPEDEFS
// ============================================================================

using TransferProgressCallback = std::function<void(const std::string& transfer_id, int progress_percent)>;
using TransferRemovedCallback = std::function<void(const std::string& transfer_id)>;

// Sends one chunk envelope; false means the transport refused it.
using ChunkSink = std::function<bool(const Envelope& chunk)>;

#endif // TRANSFER_TYPES_H
