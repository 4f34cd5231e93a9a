#ifndef CONNECTION_STATE_MACHINE_H
#define CONNECTION_STATE_MACHINE_H

#include <chrono>
#include <initializer_list>
#include <string>
#include <vector>

// =======================================================
// Authoritative Session State (FSM owns this exclusively)
// =======================================================
enum class ConnectionState {
    DISCONNECTED,   // No session
    CONNECTING,     // Outbound attempt in flight, timeout armed
    CONNECTED,      // Transport open, envelopes flow
    ERROR           // Attempt or session failed; recoverable via retry
};

// =======================================================
// FSM Input Events (external stimuli only)
// =======================================================
enum class ConnectionEvent {
    CONNECT_REQUESTED,
    RETRY_REQUESTED,
    TRANSPORT_OPENED,
    INBOUND_ACCEPTED,
    TIMEOUT,
    TRANSPORT_ERROR,
    TRANSPORT_CLOSED,
    LOCAL_DISCONNECT
};

// =======================================================
// FSM Output Actions (INTENTS ONLY, no side effects here)
// =======================================================
enum class ConnectionAction {
    NONE,
    ARM_TIMEOUT,          // Start connect timeout (and retry) timers
    CANCEL_TIMEOUT,       // Stop connect timeout and retry timers
    RELEASE_HANDLE,       // Close and forget the current transport handle
    DISCARD_TRANSFERS,    // Drop partial inbound and pending outbound transfers
    END_CALL,             // End any call on the session
    CLEAR_MESSAGES        // Clear the message stream and the active target
};

// =======================================================
// FSM Result (pure description of what to do next)
// =======================================================
struct FSMResult {
    ConnectionState new_state;
    std::vector<ConnectionAction> actions;
    bool ignored = false;

    explicit FSMResult(ConnectionState state)
        : new_state(state) {}

    FSMResult(ConnectionState state, std::initializer_list<ConnectionAction> action_list)
        : new_state(state), actions(action_list) {}

    bool has(ConnectionAction action) const;
};

// =======================================================
// Connection Context (FSM-owned mutable state only)
// =======================================================
struct ConnectionContext {
    std::string peer_id;
    ConnectionState state = ConnectionState::DISCONNECTED;
    int connect_attempts = 0;
    std::chrono::steady_clock::time_point last_state_change = std::chrono::steady_clock::now();
};

// =======================================================
// Connection State Machine (PURE LOGIC ONLY)
// =======================================================
class ConnectionStateMachine {
public:
    // (Context + Event) -> (New State + Actions)
    FSMResult handle_event(ConnectionContext& context, ConnectionEvent event);

    static const char* state_to_string(ConnectionState state);
    static const char* event_to_string(ConnectionEvent event);
    static const char* action_to_string(ConnectionAction action);

private:
    FSMResult compute_transition(ConnectionState current, ConnectionEvent event, ConnectionContext& context) const;
};

#endif // CONNECTION_STATE_MACHINE_H
