#include "call_negotiation.h"
#include "logger.h"

const char* media_error_to_string(MediaErrorKind kind) {
    switch (kind) {
        case MediaErrorKind::NONE: return "NONE";
        case MediaErrorKind::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case MediaErrorKind::DEVICE_BUSY: return "DEVICE_BUSY";
        case MediaErrorKind::DEVICE_UNAVAILABLE: return "DEVICE_UNAVAILABLE";
        case MediaErrorKind::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

const char* call_phase_to_string(CallPhase phase) {
    switch (phase) {
        case CallPhase::IDLE: return "IDLE";
        case CallPhase::REQUESTING: return "REQUESTING";
        case CallPhase::INCOMING: return "INCOMING";
        case CallPhase::ACTIVE: return "ACTIVE";
        default: return "UNKNOWN";
    }
}

const char* call_role_to_string(CallRole role) {
    switch (role) {
        case CallRole::NONE: return "NONE";
        case CallRole::CALLER: return "CALLER";
        case CallRole::CALLEE: return "CALLEE";
        default: return "UNKNOWN";
    }
}

CallNegotiation::CallNegotiation(std::string local_id,
                                 IMediaCallTransport& media_transport,
                                 IMediaDevices& media_devices,
                                 EventLog& event_log)
    : m_local_id(std::move(local_id)),
      m_media_transport(media_transport),
      m_media_devices(media_devices),
      m_event_log(event_log) {}

CallNegotiation::~CallNegotiation() {
    if (m_media_call != kNoMediaCall) {
        m_media_transport.close(m_media_call);
    }
    if (m_offered_call != kNoMediaCall) {
        m_media_transport.close(m_offered_call);
    }
    release_local_media();
}

void CallNegotiation::bind_session(const std::string& peer_id) {
    if (m_peer_id != peer_id && m_phase != CallPhase::IDLE) {
        end_call("Session replaced", true);
    }
    m_peer_id = peer_id;
}

void CallNegotiation::unbind_session() {
    end_call("Session closed", true);
    m_peer_id.clear();
}

// ============================================================================
// LOCAL USER
// ============================================================================

bool CallNegotiation::start_call() {
    if (m_peer_id.empty()) {
        m_event_log.warn("Cannot start a call without a connected peer");
        return false;
    }
    if (m_phase != CallPhase::IDLE) {
        m_event_log.warn(std::string("Cannot start a call while ") + call_phase_to_string(m_phase));
        return false;
    }
    if (!m_send_signal || !m_send_signal(Envelope::call_request(m_local_id))) {
        m_event_log.warn("Failed to send call request to " + m_peer_id);
        return false;
    }

    m_event_log.info("Calling " + m_peer_id + "...");
    set_phase(CallPhase::REQUESTING, CallRole::CALLER);
    return true;
}

bool CallNegotiation::accept_call() {
    if (m_phase != CallPhase::INCOMING || m_role != CallRole::CALLEE) {
        m_event_log.warn("No incoming call to accept");
        return false;
    }
    if (m_pending_request != 0) {
        LOG_DEBUG("[Call] Accept already pending media acquisition");
        return true;
    }

    m_event_log.info("Accepting call from " + m_peer_id);
    request_media();
    return true;
}

bool CallNegotiation::reject_call() {
    if (m_phase != CallPhase::INCOMING) {
        m_event_log.warn("No incoming call to reject");
        return false;
    }
    if (!send_decision(CallDecision::REJECT)) {
        m_event_log.warn("Failed to send call rejection to " + m_peer_id);
    }
    end_call("Call rejected", true);
    return true;
}

bool CallNegotiation::hang_up() {
    if (m_phase == CallPhase::IDLE) {
        return false;
    }

    // Before a media call exists the remote side only learns about the end in-band.
    if (m_media_call == kNoMediaCall && !send_decision(CallDecision::REJECT)) {
        LOG_WARN("[Call] Failed to send in-band cancel to " + m_peer_id);
    }
    end_call("Call ended", true);
    return true;
}

// ============================================================================
// SIGNALS
// ============================================================================

void CallNegotiation::handle_signal(const Envelope& envelope) {
    if (envelope.kind() == MessageKind::CALL_REQUEST) {
        if (m_phase != CallPhase::IDLE) {
            m_event_log.info("Busy: rejecting call request from " + envelope.sender_id());
            if (!send_decision(CallDecision::REJECT)) {
                LOG_WARN("[Call] Failed to send busy rejection to " + envelope.sender_id());
            }
            return;
        }
        m_event_log.info("Incoming call from " + envelope.sender_id());
        set_phase(CallPhase::INCOMING, CallRole::CALLEE);
        return;
    }

    if (envelope.kind() != MessageKind::CALL_RESPONSE) {
        LOG_WARN("[Call] Not a call signal: " + std::string(message_kind_to_string(envelope.kind())));
        return;
    }

    const auto decision = envelope.call_decision();
    if (!decision) {
        LOG_WARN("[Call] Malformed call response from " + envelope.sender_id());
        return;
    }

    if (*decision == CallDecision::ACCEPT) {
        if (m_phase != CallPhase::REQUESTING || m_role != CallRole::CALLER || m_pending_request != 0) {
            LOG_DEBUG(std::string("[Call] Ignoring ACCEPT while ") + call_phase_to_string(m_phase));
            return;
        }
        m_event_log.info(envelope.sender_id() + " accepted the call");
        request_media();
        return;
    }

    if (m_phase == CallPhase::IDLE) {
        LOG_DEBUG("[Call] Ignoring REJECT while IDLE");
        return;
    }
    if (m_role == CallRole::CALLER && m_phase == CallPhase::REQUESTING && m_pending_request == 0) {
        end_call(envelope.sender_id() + " rejected the call", true);
    } else {
        end_call(envelope.sender_id() + " ended the call", true);
    }
}

void CallNegotiation::handle_media_result(LocalMediaResult result) {
    if (result.request_id == 0 || result.request_id != m_pending_request) {
        LOG_INFO("[Call] Releasing stale local media (request " + std::to_string(result.request_id) + ")");
        if (result.media) {
            result.media->stop_tracks();
        }
        return;
    }
    m_pending_request = 0;

    if (!result.media) {
        m_event_log.error(std::string("Could not access camera/microphone: ") +
                          media_error_to_string(result.error) +
                          (result.detail.empty() ? "" : " (" + result.detail + ")"));
        if (!send_decision(CallDecision::REJECT)) {
            LOG_WARN("[Call] Failed to send in-band cancel to " + m_peer_id);
        }
        end_call("Call failed", true);
        return;
    }

    m_local_media = std::move(result.media);
    LOG_INFO("[Call] Local media ready: " + m_local_media->describe());

    if (m_role == CallRole::CALLER) {
        const MediaCallHandle handle = m_media_transport.call(m_peer_id, *m_local_media);
        if (handle == kNoMediaCall) {
            m_event_log.error("Could not place media call to " + m_peer_id);
            if (!send_decision(CallDecision::REJECT)) {
                LOG_WARN("[Call] Failed to send in-band cancel to " + m_peer_id);
            }
            end_call("Call failed", false);
            return;
        }
        m_media_call = handle;
        set_phase(CallPhase::ACTIVE, CallRole::CALLER);
        return;
    }

    if (!send_decision(CallDecision::ACCEPT)) {
        m_event_log.error("Failed to send call acceptance to " + m_peer_id);
        end_call("Call failed", true);
        return;
    }
    set_phase(CallPhase::ACTIVE, CallRole::CALLEE);
    answer_offered_call();
}

void CallNegotiation::handle_incoming_media_call(const MediaCallIncoming& event) {
    const bool negotiated = m_role == CallRole::CALLEE && event.peer_id == m_peer_id &&
                            m_media_call == kNoMediaCall &&
                            (m_phase == CallPhase::INCOMING || m_phase == CallPhase::ACTIVE);
    if (!negotiated) {
        LOG_WARN("[Call] Closing unexpected media call from " + event.peer_id + " while " +
                 call_phase_to_string(m_phase));
        m_media_transport.close(event.handle);
        return;
    }

    if (m_offered_call != kNoMediaCall && m_offered_call != event.handle) {
        m_media_transport.close(m_offered_call);
    }
    m_offered_call = event.handle;

    if (m_phase == CallPhase::ACTIVE) {
        answer_offered_call();
    } else {
        LOG_INFO("[Call] Holding media call from " + event.peer_id + " until accepted");
    }
}

void CallNegotiation::handle_stream_arrived(const MediaStreamArrived& event) {
    if (event.handle == kNoMediaCall || event.handle != m_media_call) {
        LOG_DEBUG("[Call] Ignoring stream on stale media call " + std::to_string(event.handle));
        return;
    }
    m_remote_media = event.remote;
    m_event_log.info("Remote video connected");
    if (m_remote_media_callback) {
        m_remote_media_callback(m_remote_media);
    }
}

void CallNegotiation::handle_media_call_closed(const MediaCallClosed& event) {
    if (event.handle != kNoMediaCall && event.handle == m_offered_call) {
        m_offered_call = kNoMediaCall;
        return;
    }
    if (event.handle == kNoMediaCall || event.handle != m_media_call) {
        return;
    }
    m_media_call = kNoMediaCall;
    end_call("Call ended by " + m_peer_id, false);
}

void CallNegotiation::handle_media_call_error(const MediaCallError& event) {
    if (event.handle == kNoMediaCall || event.handle != m_media_call) {
        return;
    }
    m_event_log.error("Call error: " + event.detail);
    m_media_transport.close(m_media_call);
    m_media_call = kNoMediaCall;
    end_call("Call failed", false);
}

// ============================================================================
// INTERNALS
// ============================================================================

void CallNegotiation::request_media() {
    m_pending_request = m_next_request_id++;
    LOG_DEBUG("[Call] Requesting local media (request " + std::to_string(m_pending_request) + ")");
    m_media_devices.request_local_media(m_pending_request);
}

bool CallNegotiation::send_decision(CallDecision decision) {
    if (!m_send_signal) {
        return false;
    }
    return m_send_signal(Envelope::call_response(m_local_id, decision));
}

void CallNegotiation::answer_offered_call() {
    if (m_offered_call == kNoMediaCall || !m_local_media) {
        return;
    }
    const MediaCallHandle handle = m_offered_call;
    m_offered_call = kNoMediaCall;

    if (!m_media_transport.answer(handle, *m_local_media)) {
        m_event_log.error("Could not answer media call from " + m_peer_id);
        m_media_transport.close(handle);
        end_call("Call failed", true);
        return;
    }
    m_media_call = handle;
    LOG_INFO("[Call] Answered media call " + std::to_string(handle));
}

void CallNegotiation::set_phase(CallPhase phase, CallRole role) {
    if (phase == m_phase && role == m_role) {
        return;
    }
    LOG_INFO(std::string("[Call] ") + call_phase_to_string(m_phase) + " -> " + call_phase_to_string(phase) +
             " role=" + call_role_to_string(role) + " peer=" + m_peer_id);
    m_phase = phase;
    m_role = role;
    if (m_state_callback) {
        m_state_callback(m_phase, m_role);
    }
}

void CallNegotiation::release_local_media() {
    if (!m_local_media) {
        return;
    }
    m_local_media->stop_tracks();
    m_local_media.reset();
    m_release_count++;
}

void CallNegotiation::end_call(const std::string& reason, bool close_media_call) {
    if (m_phase == CallPhase::IDLE && !m_local_media && m_media_call == kNoMediaCall &&
        m_offered_call == kNoMediaCall && m_pending_request == 0) {
        return;
    }

    // Local media goes first so no transition completes while it is still held.
    release_local_media();

    if (close_media_call && m_media_call != kNoMediaCall) {
        m_media_transport.close(m_media_call);
    }
    if (m_offered_call != kNoMediaCall) {
        m_media_transport.close(m_offered_call);
    }
    m_media_call = kNoMediaCall;
    m_offered_call = kNoMediaCall;
    m_pending_request = 0;

    const bool had_remote = m_remote_media.has_value();
    m_remote_media.reset();

    if (m_phase != CallPhase::IDLE) {
        m_event_log.info(reason);
    }
    set_phase(CallPhase::IDLE, CallRole::NONE);

    if (had_remote && m_remote_media_callback) {
        m_remote_media_callback(m_remote_media);
    }
}
