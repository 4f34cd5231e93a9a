#ifndef SESSION_CONTROLLER_H
#define SESSION_CONTROLLER_H

#include "call_negotiation.h"
#include "config_manager.h"
#include "connection_state_machine.h"
#include "envelope.h"
#include "event_log.h"
#include "event_loop.h"
#include "link_events.h"
#include "link_transport.h"
#include "media_interfaces.h"
#include "transfer_manager.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Observer hooks. Every member is optional; all are invoked on the event-loop thread.
struct LinkCallbacks {
    std::function<void(const Envelope&)> on_message;
    std::function<void()> on_messages_cleared;
    std::function<void(const std::string& transfer_id, int percent)> on_transfer_progress;
    std::function<void(const std::string& transfer_id)> on_transfer_removed;
    std::function<void(const LogEntry&)> on_log_entry;
    std::function<void(ConnectionState state, const std::string& peer_id)> on_connection_state;
    std::function<void(CallPhase phase, CallRole role)> on_call_state;
    std::function<void(const std::optional<RemoteMedia>&)> on_remote_media;
};

struct SessionInfo {
    std::string peer_id;
    ConnectionState state = ConnectionState::DISCONNECTED;
    TransportHandle handle = kNoHandle;
    std::chrono::steady_clock::time_point created_at;
};

/**
 * SESSION CONTROLLER
 *
 * Owns the single data session of one endpoint: drives the connection FSM,
 * arms the connect timeout and retry timers, routes inbound envelopes
 * (CHUNK to the transfer manager, CALL_* to the call negotiation, the rest to
 * the message stream) and paces outbound transfers on the event loop.
 *
 * Not thread-safe. dispatch() and the direct operations must run on the
 * thread that runs `loop`; other threads push events into the loop instead.
 */
class SessionController {
public:
    SessionController(std::string local_id,
                      const LinkSettings& settings,
                      EventLoop& loop,
                      ILinkTransport& transport,
                      IMediaCallTransport& media_transport,
                      IMediaDevices& media_devices,
                      LinkCallbacks callbacks = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Single entry point for requests, transport signals, timers and media completions.
    void dispatch(LinkEvent event);

    // ==================== LOCAL USER ====================

    bool connect(const std::string& peer_id);
    bool retry();
    void disconnect();

    bool send_text(const std::string& text);
    bool send_file(const std::string& file_name, Bytes data);

    bool start_call() { return m_call.start_call(); }
    bool accept_call() { return m_call.accept_call(); }
    bool reject_call() { return m_call.reject_call(); }
    bool hang_up() { return m_call.hang_up(); }

    // ==================== STATE ====================

    const std::string& local_id() const { return m_local_id; }
    ConnectionState state() const { return m_context.state; }
    const std::string& peer_id() const { return m_context.peer_id; }
    const std::string& target_peer() const { return m_target; }
    TransportHandle handle() const { return m_handle; }
    SessionInfo session() const;
    uint64_t session_generation() const { return m_session_generation; }
    int connect_attempts() const { return m_context.connect_attempts; }

    const std::vector<Envelope>& messages() const { return m_messages; }
    const EventLog& event_log() const { return m_event_log; }
    const TransferManager& transfers() const { return m_transfers; }
    const CallNegotiation& call() const { return m_call; }
    const LinkSettings& settings() const { return m_settings; }

    static constexpr const char* kConnectTimeoutTimer = "connect-timeout";
    static constexpr const char* kConnectRetryTimer = "connect-retry";
    static std::string pace_timer_id(const std::string& transfer_id) { return "pace:" + transfer_id; }

private:
    // Transport signals
    void handle_opened(const TransportOpened& event);
    void handle_data(const TransportData& event);
    void handle_closed(const TransportClosed& event);
    void handle_error(const TransportError& event);
    void handle_inbound(const InboundSessionAccepted& event);

    // Timers
    void handle_timeout(const ConnectTimeoutExpired& event);
    void handle_retry_tick(const ConnectRetryTick& event);
    void handle_pace_tick(const TransferPaceTick& event);

    void route_envelope(const Envelope& envelope);

    // FSM plumbing
    void transition(ConnectionEvent event, bool handle_closed_by_peer = false);
    void apply_actions(const FSMResult& result, bool handle_closed_by_peer);
    void start_attempt();
    void cancel_timers();
    void release_handle(bool close_transport);
    void clear_messages();
    void notify_state();

    void pump_transfer(const std::string& transfer_id);
    void schedule_pace(const std::string& transfer_id);
    void append_message(const Envelope& envelope);
    bool is_current(TransportHandle handle) const { return handle != kNoHandle && handle == m_handle; }

    std::string m_local_id;
    LinkSettings m_settings;
    EventLoop& m_loop;
    ILinkTransport& m_transport;
    LinkCallbacks m_callbacks;

    EventLog m_event_log;
    ConnectionStateMachine m_fsm;
    ConnectionContext m_context;

    TransportHandle m_handle = kNoHandle;
    std::string m_target;                  // Last connect target, used by retry()
    std::chrono::steady_clock::time_point m_created_at;
    uint64_t m_attempt_id = 0;             // Guards connect timers against stale firings
    uint64_t m_session_generation = 1;     // Bumped whenever session resources are discarded

    std::vector<Envelope> m_messages;
    TransferManager m_transfers;
    CallNegotiation m_call;
};

#endif // SESSION_CONTROLLER_H
