#include "transfer_manager.h"
#include "identity.h"
#include "logger.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

const char* pump_result_to_string(PumpResult result) {
    switch (result) {
        case PumpResult::YIELD: return "YIELD";
        case PumpResult::DONE: return "DONE";
        case PumpResult::ABORTED: return "ABORTED";
        case PumpResult::UNKNOWN_TRANSFER: return "UNKNOWN_TRANSFER";
        default: return "UNKNOWN";
    }
}

const char* chunk_result_to_string(ChunkResult result) {
    switch (result) {
        case ChunkResult::ACCEPTED: return "ACCEPTED";
        case ChunkResult::DUPLICATE: return "DUPLICATE";
        case ChunkResult::COMPLETED: return "COMPLETED";
        case ChunkResult::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

TransferManager::TransferManager(std::string local_id,
                                 uint32_t chunk_size,
                                 uint32_t pace_batch,
                                 uint64_t max_transfer_bytes,
                                 size_t max_inbound_transfers)
    : m_local_id(std::move(local_id)),
      m_chunk_size(chunk_size),
      m_pace_batch(pace_batch),
      m_max_transfer_bytes(max_transfer_bytes),
      m_max_chunks(0),
      m_max_inbound(max_inbound_transfers) {
    if (m_chunk_size == 0) {
        throw std::invalid_argument("TransferManager: chunk size must be positive");
    }
    if (m_pace_batch == 0) {
        throw std::invalid_argument("TransferManager: pace batch must be positive");
    }
    if (m_max_transfer_bytes == 0 || m_max_inbound == 0) {
        throw std::invalid_argument("TransferManager: transfer limits must be positive");
    }
    const uint64_t max_chunks = (m_max_transfer_bytes + m_chunk_size - 1) / m_chunk_size;
    m_max_chunks = static_cast<uint32_t>(std::min<uint64_t>(max_chunks, UINT32_MAX));
}

uint32_t TransferManager::chunk_count(size_t payload_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<uint32_t>((payload_size + chunk_size - 1) / chunk_size);
}

std::optional<uint32_t> TransferManager::received_count(const std::string& transfer_id) const {
    auto it = m_inbound.find(transfer_id);
    if (it == m_inbound.end()) {
        return std::nullopt;
    }
    return it->second.received_count;
}

void TransferManager::report_progress(const std::string& transfer_id, int percent) {
    if (m_progress_callback) {
        m_progress_callback(transfer_id, percent);
    }
}

void TransferManager::report_removed(const std::string& transfer_id) {
    if (m_removed_callback) {
        m_removed_callback(transfer_id);
    }
}

// ============================================================================
// SEND PATH
// ============================================================================

std::optional<std::string> TransferManager::begin_send(Bytes payload, const std::string& file_name, MessageKind kind) {
    if (payload.empty()) {
        LOG_WARN("TM: Refusing to send empty payload: " + file_name);
        return std::nullopt;
    }
    if (payload.size() > m_max_transfer_bytes) {
        LOG_WARN("TM: Refusing to send " + file_name + ": " + std::to_string(payload.size()) +
                 " bytes exceeds limit " + std::to_string(m_max_transfer_bytes));
        return std::nullopt;
    }

    OutboundTransfer transfer;
    transfer.transfer_id = generate_uuid();
    transfer.file_name = file_name;
    transfer.kind = kind;
    transfer.total_chunks = chunk_count(payload.size(), m_chunk_size);
    transfer.payload = std::move(payload);

    const std::string id = transfer.transfer_id;
    LOG_INFO("TM: Sending " + file_name + " (" + std::to_string(transfer.payload.size()) + " bytes, " +
             std::to_string(transfer.total_chunks) + " chunks) transfer=" + id);

    m_outbound.emplace(id, std::move(transfer));
    report_progress(id, 0);
    return id;
}

PumpOutcome TransferManager::pump(const std::string& transfer_id, const ChunkSink& sink) {
    PumpOutcome outcome;

    auto it = m_outbound.find(transfer_id);
    if (it == m_outbound.end()) {
        LOG_DEBUG("TM: Pump for unknown transfer: " + transfer_id);
        outcome.result = PumpResult::UNKNOWN_TRANSFER;
        return outcome;
    }

    auto& transfer = it->second;
    while (transfer.next_index < transfer.total_chunks) {
        const uint32_t index = transfer.next_index;
        const size_t offset = static_cast<size_t>(index) * m_chunk_size;
        const size_t size = std::min<size_t>(m_chunk_size, transfer.payload.size() - offset);

        Bytes slice(transfer.payload.begin() + static_cast<std::ptrdiff_t>(offset),
                    transfer.payload.begin() + static_cast<std::ptrdiff_t>(offset + size));
        Envelope chunk = Envelope::chunk(m_local_id, transfer_id, index, transfer.total_chunks,
                                         std::move(slice), transfer.file_name);

        if (!sink || !sink(chunk)) {
            LOG_WARN("TM: Sink refused chunk " + std::to_string(index) + " transfer=" + transfer_id +
                     ", abandoning transfer");
            m_outbound.erase(it);
            report_removed(transfer_id);
            outcome.result = PumpResult::ABORTED;
            return outcome;
        }

        transfer.next_index++;
        outcome.chunks_sent++;

        if (transfer.next_index == transfer.total_chunks) {
            break;
        }
        if (transfer.next_index % m_pace_batch == 0) {
            report_progress(transfer_id, static_cast<int>(static_cast<uint64_t>(transfer.next_index) * 100 /
                                                          transfer.total_chunks));
            outcome.result = PumpResult::YIELD;
            return outcome;
        }
    }

    LOG_INFO("TM: Transfer sent: " + transfer_id);
    m_outbound.erase(it);
    report_progress(transfer_id, 100);
    report_removed(transfer_id);
    outcome.result = PumpResult::DONE;
    return outcome;
}

bool TransferManager::cancel_send(const std::string& transfer_id) {
    auto it = m_outbound.find(transfer_id);
    if (it == m_outbound.end()) {
        return false;
    }
    LOG_INFO("TM: Cancelled outbound transfer " + transfer_id + " at chunk " +
             std::to_string(it->second.next_index) + "/" + std::to_string(it->second.total_chunks));
    m_outbound.erase(it);
    report_removed(transfer_id);
    return true;
}

// ============================================================================
// RECEIVE PATH
// ============================================================================

ChunkOutcome TransferManager::handle_chunk(const Envelope& chunk) {
    ChunkOutcome outcome;

    const Bytes* data = chunk.binary();
    if (chunk.kind() != MessageKind::CHUNK || !data || !chunk.transfer_id() || !chunk.chunk_index() ||
        !chunk.total_chunks()) {
        LOG_WARN("TM: Not a chunk envelope: " + chunk.id());
        return outcome;
    }

    const std::string& transfer_id = *chunk.transfer_id();
    const uint32_t index = *chunk.chunk_index();
    const uint32_t total = *chunk.total_chunks();

    if (total == 0 || index >= total) {
        LOG_WARN("TM: Chunk index out of range: " + std::to_string(index) + " total=" + std::to_string(total) +
                 " transfer=" + transfer_id);
        return outcome;
    }
    // Slots are reserved up front, so totalChunks must fit the size limit.
    if (total > m_max_chunks) {
        LOG_WARN("TM: totalChunks " + std::to_string(total) + " exceeds limit " + std::to_string(m_max_chunks) +
                 " transfer=" + transfer_id);
        return outcome;
    }
    if (data->empty() || data->size() > m_chunk_size) {
        LOG_WARN("TM: Invalid chunk size: " + std::to_string(data->size()) + " transfer=" + transfer_id);
        return outcome;
    }

    auto it = m_inbound.find(transfer_id);
    if (it == m_inbound.end()) {
        if (m_completed.count(transfer_id) > 0) {
            LOG_DEBUG("TM: Chunk " + std::to_string(index) + " for completed transfer=" + transfer_id);
            outcome.result = ChunkResult::DUPLICATE;
            return outcome;
        }
        if (m_inbound.size() >= m_max_inbound) {
            LOG_WARN("TM: Too many open inbound transfers (" + std::to_string(m_inbound.size()) +
                     "), dropping transfer=" + transfer_id);
            return outcome;
        }

        InboundTransfer transfer;
        transfer.transfer_id = transfer_id;
        transfer.sender_id = chunk.sender_id();
        transfer.file_name = chunk.file_name() && !chunk.file_name()->empty() ? *chunk.file_name()
                                                                              : "transfer-" + transfer_id;
        transfer.total_chunks = total;
        transfer.slots.resize(total);
        it = m_inbound.emplace(transfer_id, std::move(transfer)).first;
        LOG_INFO("TM: Receiving " + it->second.file_name + " (" + std::to_string(total) +
                 " chunks) from " + chunk.sender_id() + " transfer=" + transfer_id);
    }

    auto& transfer = it->second;
    if (transfer.total_chunks != total) {
        LOG_WARN("TM: totalChunks mismatch (" + std::to_string(total) + " vs " +
                 std::to_string(transfer.total_chunks) + ") transfer=" + transfer_id);
        return outcome;
    }
    if (transfer.sender_id != chunk.sender_id()) {
        LOG_WARN("TM: Chunk from unexpected sender " + chunk.sender_id() + " transfer=" + transfer_id);
        return outcome;
    }

    // Duplicate chunk: last write wins, but do not double-count.
    const bool duplicate = transfer.slots[index].has_value();
    transfer.slots[index] = *data;
    if (duplicate) {
        LOG_DEBUG("TM: Duplicate chunk " + std::to_string(index) + " transfer=" + transfer_id);
        outcome.result = ChunkResult::DUPLICATE;
        return outcome;
    }

    transfer.received_count++;

    if (transfer.received_count < transfer.total_chunks) {
        report_progress(transfer_id, static_cast<int>(static_cast<uint64_t>(transfer.received_count) * 100 /
                                                      transfer.total_chunks));
        outcome.result = ChunkResult::ACCEPTED;
        return outcome;
    }

    // Completion: concatenate in index order and hand back one envelope.
    outcome.completed = assemble(transfer);
    outcome.result = ChunkResult::COMPLETED;
    LOG_INFO("TM: Transfer complete: " + transfer.file_name + " transfer=" + transfer_id);

    m_inbound.erase(it);
    remember_completed(transfer_id);
    report_progress(transfer_id, 100);
    report_removed(transfer_id);
    return outcome;
}

void TransferManager::remember_completed(const std::string& transfer_id) {
    if (!m_completed.insert(transfer_id).second) {
        return;
    }
    m_completed_order.push_back(transfer_id);
    while (m_completed_order.size() > RECENT_COMPLETED_LIMIT) {
        m_completed.erase(m_completed_order.front());
        m_completed_order.pop_front();
    }
}

Envelope TransferManager::assemble(const InboundTransfer& transfer) const {
    size_t total_size = 0;
    for (const auto& slot : transfer.slots) {
        total_size += slot->size();
    }

    Bytes payload;
    payload.reserve(total_size);
    for (const auto& slot : transfer.slots) {
        payload.insert(payload.end(), slot->begin(), slot->end());
    }

    return Envelope::file(transfer.sender_id, classify_file_kind(transfer.file_name), std::move(payload),
                          transfer.file_name);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void TransferManager::discard_all() {
    m_completed.clear();
    m_completed_order.clear();

    if (m_outbound.empty() && m_inbound.empty()) {
        return;
    }

    LOG_INFO("TM: Discarding " + std::to_string(m_outbound.size()) + " outbound and " +
             std::to_string(m_inbound.size()) + " inbound transfers");

    std::vector<std::string> removed;
    for (const auto& entry : m_outbound) removed.push_back(entry.first);
    for (const auto& entry : m_inbound) removed.push_back(entry.first);

    m_outbound.clear();
    m_inbound.clear();

    for (const auto& id : removed) {
        report_removed(id);
    }
}
