#include "session_controller.h"
#include "identity.h"
#include "logger.h"

#include <stdexcept>

const char* transport_error_to_string(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::PEER_UNAVAILABLE: return "peer unavailable";
        case TransportErrorKind::SIGNALING_DISCONNECTED: return "signaling disconnected";
        case TransportErrorKind::NEGOTIATION_FAILED: return "negotiation failed";
        case TransportErrorKind::NETWORK: return "network error";
        case TransportErrorKind::UNKNOWN: return "unknown error";
        default: return "unknown error";
    }
}

SessionController::SessionController(std::string local_id,
                                     const LinkSettings& settings,
                                     EventLoop& loop,
                                     ILinkTransport& transport,
                                     IMediaCallTransport& media_transport,
                                     IMediaDevices& media_devices,
                                     LinkCallbacks callbacks)
    : m_local_id(std::move(local_id)),
      m_settings(settings),
      m_loop(loop),
      m_transport(transport),
      m_callbacks(std::move(callbacks)),
      m_event_log(settings.event_log_capacity),
      m_created_at(std::chrono::steady_clock::now()),
      m_transfers(m_local_id, settings.chunk_size, settings.pace_batch, settings.max_transfer_bytes,
                  settings.max_inbound_transfers),
      m_call(m_local_id, media_transport, media_devices, m_event_log) {

    if (m_local_id.empty()) {
        throw std::invalid_argument("SessionController: local id must not be empty");
    }

    m_event_log.set_entry_callback([this](const LogEntry& entry) {
        if (m_callbacks.on_log_entry) m_callbacks.on_log_entry(entry);
    });
    m_transfers.set_progress_callback([this](const std::string& id, int percent) {
        if (m_callbacks.on_transfer_progress) m_callbacks.on_transfer_progress(id, percent);
    });
    m_transfers.set_removed_callback([this](const std::string& id) {
        if (m_callbacks.on_transfer_removed) m_callbacks.on_transfer_removed(id);
    });

    m_call.set_signal_sender([this](const Envelope& signal) {
        if (m_context.state != ConnectionState::CONNECTED || m_handle == kNoHandle) {
            return false;
        }
        return m_transport.send(m_handle, signal);
    });
    m_call.set_state_callback([this](CallPhase phase, CallRole role) {
        if (m_callbacks.on_call_state) m_callbacks.on_call_state(phase, role);
    });
    m_call.set_remote_media_callback([this](const std::optional<RemoteMedia>& remote) {
        if (m_callbacks.on_remote_media) m_callbacks.on_remote_media(remote);
    });

    LOG_INFO("SC: Session controller ready for " + m_local_id);
}

SessionController::~SessionController() {
    cancel_timers();
    if (m_handle != kNoHandle) {
        m_transport.close(m_handle);
        m_handle = kNoHandle;
    }
}

SessionInfo SessionController::session() const {
    SessionInfo info;
    info.peer_id = m_context.peer_id;
    info.state = m_context.state;
    info.handle = m_handle;
    info.created_at = m_created_at;
    return info;
}

// ============================================================================
// DISPATCH
// ============================================================================

void SessionController::dispatch(LinkEvent event) {
    try {
        if (auto* e = std::get_if<ConnectRequest>(&event)) {
            connect(e->peer_id);
        } else if (std::get_if<RetryRequest>(&event)) {
            retry();
        } else if (std::get_if<DisconnectRequest>(&event)) {
            disconnect();
        } else if (auto* e = std::get_if<SendTextRequest>(&event)) {
            send_text(e->text);
        } else if (auto* e = std::get_if<SendFileRequest>(&event)) {
            send_file(e->file_name, std::move(e->data));
        } else if (std::get_if<StartCallRequest>(&event)) {
            start_call();
        } else if (std::get_if<AcceptCallRequest>(&event)) {
            accept_call();
        } else if (std::get_if<RejectCallRequest>(&event)) {
            reject_call();
        } else if (std::get_if<HangUpRequest>(&event)) {
            hang_up();
        } else if (auto* e = std::get_if<TransportOpened>(&event)) {
            handle_opened(*e);
        } else if (auto* e = std::get_if<TransportData>(&event)) {
            handle_data(*e);
        } else if (auto* e = std::get_if<TransportClosed>(&event)) {
            handle_closed(*e);
        } else if (auto* e = std::get_if<TransportError>(&event)) {
            handle_error(*e);
        } else if (auto* e = std::get_if<InboundSessionAccepted>(&event)) {
            handle_inbound(*e);
        } else if (auto* e = std::get_if<ConnectTimeoutExpired>(&event)) {
            handle_timeout(*e);
        } else if (auto* e = std::get_if<ConnectRetryTick>(&event)) {
            handle_retry_tick(*e);
        } else if (auto* e = std::get_if<TransferPaceTick>(&event)) {
            handle_pace_tick(*e);
        } else if (auto* e = std::get_if<LocalMediaResult>(&event)) {
            m_call.handle_media_result(std::move(*e));
        } else if (auto* e = std::get_if<MediaCallIncoming>(&event)) {
            m_call.handle_incoming_media_call(*e);
        } else if (auto* e = std::get_if<MediaStreamArrived>(&event)) {
            m_call.handle_stream_arrived(*e);
        } else if (auto* e = std::get_if<MediaCallClosed>(&event)) {
            m_call.handle_media_call_closed(*e);
        } else if (auto* e = std::get_if<MediaCallError>(&event)) {
            m_call.handle_media_call_error(*e);
        }
    } catch (const std::exception& e) {
        LOG_WARN("SC: Error processing event: " + std::string(e.what()));
    }
}

// ============================================================================
// LOCAL USER
// ============================================================================

bool SessionController::connect(const std::string& raw_peer_id) {
    const std::string peer_id = normalize_peer_id(raw_peer_id);
    if (!is_valid_peer_id(peer_id)) {
        m_event_log.warn("Invalid peer id: '" + raw_peer_id + "'");
        return false;
    }
    if (peer_id == m_local_id) {
        m_event_log.warn("Cannot connect to yourself");
        return false;
    }
    if (m_context.state == ConnectionState::CONNECTED && peer_id == m_context.peer_id) {
        LOG_INFO("SC: Already connected to " + peer_id);
        return true;
    }

    // Close the old handle before the new target becomes current.
    if (m_handle != kNoHandle) {
        release_handle(true);
    }

    m_target = peer_id;
    m_context.peer_id = peer_id;
    transition(ConnectionEvent::CONNECT_REQUESTED);
    return m_context.state == ConnectionState::CONNECTING;
}

bool SessionController::retry() {
    if (m_context.state != ConnectionState::ERROR) {
        m_event_log.warn(std::string("Nothing to retry while ") +
                         ConnectionStateMachine::state_to_string(m_context.state));
        return false;
    }
    if (m_target.empty()) {
        m_event_log.warn("Nothing to retry: no previous target");
        return false;
    }

    m_context.peer_id = m_target;
    transition(ConnectionEvent::RETRY_REQUESTED);
    return m_context.state == ConnectionState::CONNECTING;
}

void SessionController::disconnect() {
    if (m_context.state == ConnectionState::DISCONNECTED) {
        LOG_DEBUG("SC: Disconnect while already disconnected");
        return;
    }
    const std::string peer = m_context.peer_id;
    transition(ConnectionEvent::LOCAL_DISCONNECT);
    LOG_INFO("SC: Disconnected locally from " + peer);
}

bool SessionController::send_text(const std::string& text) {
    if (m_context.state != ConnectionState::CONNECTED) {
        m_event_log.warn("Cannot send message: not connected");
        return false;
    }
    if (text.empty()) {
        m_event_log.warn("Cannot send an empty message");
        return false;
    }

    Envelope envelope = Envelope::text(m_local_id, text);
    if (!m_transport.send(m_handle, envelope)) {
        m_event_log.warn("Failed to send message to " + m_context.peer_id);
        return false;
    }
    append_message(envelope);
    return true;
}

bool SessionController::send_file(const std::string& file_name, Bytes data) {
    if (m_context.state != ConnectionState::CONNECTED) {
        m_event_log.warn("Cannot send file: not connected");
        return false;
    }
    if (file_name.empty() || data.empty()) {
        m_event_log.warn("Cannot send an empty file");
        return false;
    }

    const MessageKind kind = classify_file_kind(file_name);
    Envelope local_copy = Envelope::file(m_local_id, kind, data, file_name);

    const auto transfer_id = m_transfers.begin_send(std::move(data), file_name, kind);
    if (!transfer_id) {
        m_event_log.warn("Failed to start transfer of " + file_name);
        return false;
    }

    m_event_log.info("Sending " + file_name + " (" + std::to_string(local_copy.content_size()) + " bytes)");
    append_message(local_copy);
    pump_transfer(*transfer_id);
    return true;
}

// ============================================================================
// TRANSPORT SIGNALS
// ============================================================================

void SessionController::handle_opened(const TransportOpened& event) {
    if (!is_current(event.handle) || m_context.state != ConnectionState::CONNECTING) {
        LOG_DEBUG("SC: Ignoring open for stale handle " + std::to_string(event.handle));
        return;
    }

    transition(ConnectionEvent::TRANSPORT_OPENED);
    m_created_at = std::chrono::steady_clock::now();
    m_call.bind_session(m_context.peer_id);
    m_event_log.info("Connected to " + m_context.peer_id);
}

void SessionController::handle_data(const TransportData& event) {
    if (!is_current(event.handle) || m_context.state != ConnectionState::CONNECTED) {
        LOG_DEBUG("SC: Ignoring data for stale handle " + std::to_string(event.handle));
        return;
    }

    std::string error;
    if (!validate_envelope(event.envelope, &error)) {
        m_event_log.warn("Dropped malformed envelope from " + m_context.peer_id + ": " + error);
        return;
    }
    if (event.envelope.sender_id() != m_context.peer_id) {
        m_event_log.warn("Dropped envelope from unexpected sender " + event.envelope.sender_id());
        return;
    }

    route_envelope(event.envelope);
}

void SessionController::handle_closed(const TransportClosed& event) {
    if (!is_current(event.handle)) {
        LOG_DEBUG("SC: Ignoring close for stale handle " + std::to_string(event.handle));
        return;
    }

    const std::string peer = m_context.peer_id;
    const ConnectionState before = m_context.state;
    transition(ConnectionEvent::TRANSPORT_CLOSED, true);

    if (before == ConnectionState::CONNECTING) {
        m_event_log.error("Connection to " + peer + " closed before it opened");
    } else if (before == ConnectionState::CONNECTED) {
        m_event_log.info(peer + " disconnected");
    }
}

void SessionController::handle_error(const TransportError& event) {
    if (!is_current(event.handle)) {
        LOG_DEBUG("SC: Ignoring error for stale handle " + std::to_string(event.handle));
        return;
    }

    const std::string peer = m_context.peer_id;
    transition(ConnectionEvent::TRANSPORT_ERROR);
    m_event_log.error("Connection error with " + peer + ": " + transport_error_to_string(event.kind) +
                      (event.detail.empty() ? "" : " (" + event.detail + ")"));
}

void SessionController::handle_inbound(const InboundSessionAccepted& event) {
    const std::string peer_id = normalize_peer_id(event.peer_id);
    if (event.handle == kNoHandle || !is_valid_peer_id(peer_id) || peer_id == m_local_id) {
        m_event_log.warn("Rejected inbound session from '" + event.peer_id + "'");
        if (event.handle != kNoHandle) {
            m_transport.close(event.handle);
        }
        return;
    }
    if (event.handle == m_handle) {
        LOG_DEBUG("SC: Duplicate inbound accept for handle " + std::to_string(event.handle));
        return;
    }

    if (m_context.state == ConnectionState::CONNECTED && m_context.peer_id != peer_id) {
        m_event_log.info("Closing session with " + m_context.peer_id + " for " + peer_id);
    }

    // Old handle (outbound attempt or previous session) goes through RELEASE_HANDLE.
    const bool replacing = m_context.state == ConnectionState::CONNECTED;
    m_context.peer_id = peer_id;
    transition(ConnectionEvent::INBOUND_ACCEPTED);

    m_handle = event.handle;
    m_target = peer_id;
    m_created_at = std::chrono::steady_clock::now();
    m_call.bind_session(peer_id);
    m_event_log.info("Accepted session from " + peer_id);
    if (replacing) {
        notify_state();
    }
}

// ============================================================================
// TIMERS
// ============================================================================

void SessionController::handle_timeout(const ConnectTimeoutExpired& event) {
    if (event.attempt != m_attempt_id || m_context.state != ConnectionState::CONNECTING) {
        LOG_DEBUG("SC: Ignoring stale connect timeout (attempt " + std::to_string(event.attempt) + ")");
        return;
    }

    const std::string peer = m_context.peer_id;
    transition(ConnectionEvent::TIMEOUT);
    m_event_log.error("Connection to " + peer + " timed out after " +
                      std::to_string(m_settings.connect_timeout_ms) + " ms");
}

void SessionController::handle_retry_tick(const ConnectRetryTick& event) {
    if (event.attempt != m_attempt_id || m_context.state != ConnectionState::CONNECTING) {
        return;
    }

    if (m_handle != kNoHandle) {
        release_handle(true);
    }
    m_context.connect_attempts++;
    m_event_log.info("Retrying connection to " + m_context.peer_id + " (attempt " +
                     std::to_string(m_context.connect_attempts) + ")");

    m_handle = m_transport.connect(m_context.peer_id);
    if (m_handle == kNoHandle) {
        LOG_WARN("SC: Transport could not start attempt to " + m_context.peer_id);
    }

    m_loop.addScheduledEvent(kConnectRetryTimer, ConnectRetryTick{m_attempt_id},
                             m_loop.now() + std::chrono::milliseconds(m_settings.retry_interval_ms));
}

void SessionController::handle_pace_tick(const TransferPaceTick& event) {
    if (event.session_generation != m_session_generation || m_context.state != ConnectionState::CONNECTED) {
        LOG_DEBUG("SC: Dropping pace tick for " + event.transfer_id + " from an ended session");
        m_transfers.cancel_send(event.transfer_id);
        return;
    }
    pump_transfer(event.transfer_id);
}

// ============================================================================
// ROUTING
// ============================================================================

void SessionController::route_envelope(const Envelope& envelope) {
    switch (envelope.kind()) {
        case MessageKind::CHUNK: {
            ChunkOutcome outcome = m_transfers.handle_chunk(envelope);
            if (outcome.result == ChunkResult::REJECTED) {
                m_event_log.warn("Dropped chunk from " + envelope.sender_id() + " (inconsistent or over transfer limits)");
            } else if (outcome.result == ChunkResult::COMPLETED && outcome.completed) {
                m_event_log.info("Received " + outcome.completed->file_name().value_or("file") + " from " +
                                 envelope.sender_id());
                append_message(*outcome.completed);
            }
            break;
        }

        case MessageKind::CALL_REQUEST:
        case MessageKind::CALL_RESPONSE:
            m_call.handle_signal(envelope);
            break;

        case MessageKind::TEXT:
        case MessageKind::SYSTEM:
        case MessageKind::IMAGE:
        case MessageKind::VIDEO_FILE:
            append_message(envelope);
            break;
    }
}

void SessionController::append_message(const Envelope& envelope) {
    m_messages.push_back(envelope);
    if (m_callbacks.on_message) {
        m_callbacks.on_message(m_messages.back());
    }
}

// ============================================================================
// FSM PLUMBING
// ============================================================================

void SessionController::transition(ConnectionEvent event, bool handle_closed_by_peer) {
    const ConnectionState before = m_context.state;
    FSMResult result = m_fsm.handle_event(m_context, event);
    if (result.ignored) {
        return;
    }

    apply_actions(result, handle_closed_by_peer);

    if (result.new_state != before) {
        notify_state();
    }
}

void SessionController::apply_actions(const FSMResult& result, bool handle_closed_by_peer) {
    for (ConnectionAction action : result.actions) {
        switch (action) {
            case ConnectionAction::NONE:
                break;
            case ConnectionAction::ARM_TIMEOUT:
                start_attempt();
                break;
            case ConnectionAction::CANCEL_TIMEOUT:
                cancel_timers();
                break;
            case ConnectionAction::RELEASE_HANDLE:
                release_handle(!handle_closed_by_peer);
                break;
            case ConnectionAction::DISCARD_TRANSFERS:
                m_transfers.discard_all();
                m_session_generation++;
                break;
            case ConnectionAction::END_CALL:
                m_call.unbind_session();
                break;
            case ConnectionAction::CLEAR_MESSAGES:
                clear_messages();
                break;
        }
    }
}

void SessionController::start_attempt() {
    m_attempt_id++;
    const auto now = m_loop.now();

    m_event_log.info("Connecting to " + m_context.peer_id + "...");
    m_handle = m_transport.connect(m_context.peer_id);
    if (m_handle == kNoHandle) {
        LOG_WARN("SC: Transport could not start attempt to " + m_context.peer_id);
    }
    m_created_at = std::chrono::steady_clock::now();

    m_loop.addScheduledEvent(kConnectTimeoutTimer, ConnectTimeoutExpired{m_attempt_id},
                             now + std::chrono::milliseconds(m_settings.connect_timeout_ms));
    if (m_settings.retry_interval_ms > 0) {
        m_loop.addScheduledEvent(kConnectRetryTimer, ConnectRetryTick{m_attempt_id},
                                 now + std::chrono::milliseconds(m_settings.retry_interval_ms));
    }
}

void SessionController::cancel_timers() {
    m_loop.removeScheduledEvent(kConnectTimeoutTimer);
    m_loop.removeScheduledEvent(kConnectRetryTimer);
}

void SessionController::release_handle(bool close_transport) {
    if (m_handle == kNoHandle) {
        return;
    }
    const TransportHandle handle = m_handle;
    m_handle = kNoHandle;
    if (close_transport) {
        m_transport.close(handle);
    }
    LOG_DEBUG("SC: Released handle " + std::to_string(handle));
}

void SessionController::clear_messages() {
    m_messages.clear();
    m_target.clear();
    m_context.peer_id.clear();
    if (m_callbacks.on_messages_cleared) {
        m_callbacks.on_messages_cleared();
    }
}

void SessionController::notify_state() {
    if (m_callbacks.on_connection_state) {
        m_callbacks.on_connection_state(m_context.state, m_context.peer_id);
    }
}

// ============================================================================
// OUTBOUND TRANSFERS
// ============================================================================

void SessionController::pump_transfer(const std::string& transfer_id) {
    const PumpOutcome outcome = m_transfers.pump(transfer_id, [this](const Envelope& chunk) {
        return m_handle != kNoHandle && m_transport.send(m_handle, chunk);
    });

    switch (outcome.result) {
        case PumpResult::YIELD:
            schedule_pace(transfer_id);
            break;
        case PumpResult::DONE:
            LOG_INFO("SC: Transfer " + transfer_id + " sent to " + m_context.peer_id);
            break;
        case PumpResult::ABORTED:
            m_event_log.warn("Transfer to " + m_context.peer_id + " abandoned");
            break;
        case PumpResult::UNKNOWN_TRANSFER:
            break;
    }
}

void SessionController::schedule_pace(const std::string& transfer_id) {
    TransferPaceTick tick{transfer_id, m_session_generation};
    if (m_settings.pace_delay_ms <= 0) {
        m_loop.pushEvent(std::move(tick));
        return;
    }
    m_loop.addScheduledEvent(pace_timer_id(transfer_id), std::move(tick),
                             m_loop.now() + std::chrono::milliseconds(m_settings.pace_delay_ms));
}
