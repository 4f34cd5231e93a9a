#ifndef TRANSFER_MANAGER_H
#define TRANSFER_MANAGER_H

#include "transfer_types.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * CHUNKED TRANSFER MODULE
 *
 * Splits outbound IMAGE/VIDEO_FILE payloads into CHUNK envelopes that are
 * emitted in paced batches, and reassembles inbound CHUNK envelopes into the
 * original payload. Only complete payloads are ever handed back; partial
 * state is dropped by discard_all() when the owning session goes away.
 *
 * Not thread-safe: driven exclusively from the session's event loop.
 */

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * Reassembly state for one inbound transfer
 */
struct InboundTransfer {
    std::string transfer_id;
    std::string sender_id;
    std::string file_name;
    uint32_t total_chunks = 0;
    uint32_t received_count = 0;           // Number of populated slots
    std::vector<std::optional<Bytes>> slots;
};

/**
 * Send state for one outbound transfer
 */
struct OutboundTransfer {
    std::string transfer_id;
    Bytes payload;
    std::string file_name;
    MessageKind kind = MessageKind::VIDEO_FILE;
    uint32_t total_chunks = 0;
    uint32_t next_index = 0;
};

// ============================================================================
// TRANSFER MANAGER
// ============================================================================

class TransferManager {
public:
    /**
     * Constructor
     * @param local_id Sender id stamped on outbound chunks
     * @param chunk_size Slice size in bytes (must be > 0)
     * @param pace_batch Chunks emitted per pump() call (must be > 0)
     * @param max_transfer_bytes Largest payload sent or accepted; bounds inbound totalChunks
     * @param max_inbound_transfers Partial inbound transfers allowed at once
     * @throws std::invalid_argument on a zero chunk size, batch or limit
     */
    TransferManager(std::string local_id,
                    uint32_t chunk_size = DEFAULT_CHUNK_SIZE,
                    uint32_t pace_batch = DEFAULT_PACE_BATCH,
                    uint64_t max_transfer_bytes = DEFAULT_MAX_TRANSFER_BYTES,
                    size_t max_inbound_transfers = DEFAULT_MAX_INBOUND_TRANSFERS);

    // ceil(payload_size / chunk_size)
    static uint32_t chunk_count(size_t payload_size, uint32_t chunk_size);

    void set_progress_callback(TransferProgressCallback callback) { m_progress_callback = std::move(callback); }
    void set_removed_callback(TransferRemovedCallback callback) { m_removed_callback = std::move(callback); }

    // ==================== SEND PATH ====================

    /**
     * Register an outbound transfer. Nothing is sent until pump().
     * @return Transfer ID, or nullopt for an empty payload
     */
    std::optional<std::string> begin_send(Bytes payload, const std::string& file_name, MessageKind kind);

    /**
     * Emit up to pace_batch chunks of the transfer through `sink`.
     * YIELD means the caller must schedule another pump().
     */
    PumpOutcome pump(const std::string& transfer_id, const ChunkSink& sink);

    // Abandon an outbound transfer without sending further chunks.
    bool cancel_send(const std::string& transfer_id);

    // ==================== RECEIVE PATH ====================

    // Feed one CHUNK envelope (already validated).
    ChunkOutcome handle_chunk(const Envelope& chunk);

    // ==================== LIFECYCLE ====================

    // Drop every inbound and outbound transfer and their progress entries.
    void discard_all();

    bool has_outbound(const std::string& transfer_id) const { return m_outbound.count(transfer_id) > 0; }
    bool has_inbound(const std::string& transfer_id) const { return m_inbound.count(transfer_id) > 0; }
    size_t outbound_count() const { return m_outbound.size(); }
    size_t inbound_count() const { return m_inbound.size(); }
    std::optional<uint32_t> received_count(const std::string& transfer_id) const;

    uint32_t chunk_size() const { return m_chunk_size; }
    uint32_t pace_batch() const { return m_pace_batch; }
    uint32_t max_chunks() const { return m_max_chunks; }
    size_t max_inbound_transfers() const { return m_max_inbound; }
    bool recently_completed(const std::string& transfer_id) const { return m_completed.count(transfer_id) > 0; }

private:
    void report_progress(const std::string& transfer_id, int percent);
    void report_removed(const std::string& transfer_id);
    Envelope assemble(const InboundTransfer& transfer) const;
    void remember_completed(const std::string& transfer_id);

    std::string m_local_id;
    uint32_t m_chunk_size;
    uint32_t m_pace_batch;
    uint64_t m_max_transfer_bytes;
    uint32_t m_max_chunks;
    size_t m_max_inbound;

    std::map<std::string, OutboundTransfer> m_outbound;
    std::map<std::string, InboundTransfer> m_inbound;

    // Bounded FIFO of completed inbound ids; cleared with the session.
    std::deque<std::string> m_completed_order;
    std::set<std::string> m_completed;

    TransferProgressCallback m_progress_callback;
    TransferRemovedCallback m_removed_callback;
};

#endif // TRANSFER_MANAGER_H
