#ifndef CALL_NEGOTIATION_H
#define CALL_NEGOTIATION_H

#include "envelope.h"
#include "event_log.h"
#include "media_interfaces.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

enum class CallPhase {
    IDLE,           // No call
    REQUESTING,     // CALL_REQUEST sent, waiting for the answer (or for local media)
    INCOMING,       // CALL_REQUEST received, waiting for the local user
    ACTIVE          // Media flowing (or being attached)
};

enum class CallRole {
    NONE,
    CALLER,
    CALLEE
};

const char* call_phase_to_string(CallPhase phase);
const char* call_role_to_string(CallRole role);

/**
 * CALL NEGOTIATION
 *
 * In-band CALL_REQUEST / CALL_RESPONSE handshake on the data session, followed
 * by a media call on the media-call transport. Owns the local media for the
 * lifetime of one call and releases it exactly once when the call ends.
 *
 * A REJECT sent after an ACCEPT (or before any answer) is the in-band cancel:
 * either side that receives it while a call is in progress ends the call.
 */
class CallNegotiation {
public:
    using SignalSender = std::function<bool(const Envelope&)>;
    using StateCallback = std::function<void(CallPhase phase, CallRole role)>;
    using RemoteMediaCallback = std::function<void(const std::optional<RemoteMedia>& remote)>;

    CallNegotiation(std::string local_id,
                    IMediaCallTransport& media_transport,
                    IMediaDevices& media_devices,
                    EventLog& event_log);
    ~CallNegotiation();

    CallNegotiation(const CallNegotiation&) = delete;
    CallNegotiation& operator=(const CallNegotiation&) = delete;

    void set_signal_sender(SignalSender sender) { m_send_signal = std::move(sender); }
    void set_state_callback(StateCallback callback) { m_state_callback = std::move(callback); }
    void set_remote_media_callback(RemoteMediaCallback callback) { m_remote_media_callback = std::move(callback); }

    // The data session the handshake runs on. Unbinding ends any call.
    void bind_session(const std::string& peer_id);
    void unbind_session();

    // ==================== LOCAL USER ====================

    bool start_call();
    bool accept_call();
    bool reject_call();
    bool hang_up();

    // ==================== SIGNALS ====================

    void handle_signal(const Envelope& envelope);
    void handle_media_result(LocalMediaResult result);
    void handle_incoming_media_call(const MediaCallIncoming& event);
    void handle_stream_arrived(const MediaStreamArrived& event);
    void handle_media_call_closed(const MediaCallClosed& event);
    void handle_media_call_error(const MediaCallError& event);

    // ==================== STATE ====================

    CallPhase phase() const { return m_phase; }
    CallRole role() const { return m_role; }
    const std::string& peer_id() const { return m_peer_id; }
    bool has_local_media() const { return m_local_media != nullptr; }
    bool media_request_pending() const { return m_pending_request != 0; }
    const std::optional<RemoteMedia>& remote_media() const { return m_remote_media; }
    MediaCallHandle media_call_handle() const { return m_media_call; }
    MediaCallHandle offered_call_handle() const { return m_offered_call; }
    int local_media_release_count() const { return m_release_count; }

private:
    void request_media();
    bool send_decision(CallDecision decision);
    void set_phase(CallPhase phase, CallRole role);
    void end_call(const std::string& reason, bool close_media_call);
    void release_local_media();
    void answer_offered_call();

    std::string m_local_id;
    IMediaCallTransport& m_media_transport;
    IMediaDevices& m_media_devices;
    EventLog& m_event_log;

    std::string m_peer_id;
    CallPhase m_phase = CallPhase::IDLE;
    CallRole m_role = CallRole::NONE;

    std::unique_ptr<LocalMedia> m_local_media;
    std::optional<RemoteMedia> m_remote_media;
    MediaCallHandle m_media_call = kNoMediaCall;
    MediaCallHandle m_offered_call = kNoMediaCall;

    uint64_t m_next_request_id = 1;
    uint64_t m_pending_request = 0;
    int m_release_count = 0;

    SignalSender m_send_signal;
    StateCallback m_state_callback;
    RemoteMediaCallback m_remote_media_callback;
};

#endif // CALL_NEGOTIATION_H
