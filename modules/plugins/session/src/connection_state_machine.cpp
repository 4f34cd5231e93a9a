#include "connection_state_machine.h"
#include "logger.h"

#include <algorithm>

bool FSMResult::has(ConnectionAction action) const {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

// ==========================================================
// FSM ENTRY POINT (PURE except timestamp and counter update)
// ==========================================================
FSMResult ConnectionStateMachine::handle_event(ConnectionContext& context, ConnectionEvent event) {
    const ConnectionState old_state = context.state;

    FSMResult result = compute_transition(old_state, event, context);

    if (result.new_state != old_state) {
        context.state = result.new_state;
        context.last_state_change = std::chrono::steady_clock::now();

        LOG_INFO(
            std::string("[LinkFSM] ") +
            state_to_string(old_state) +
            " --(" + event_to_string(event) + ")--> " +
            state_to_string(result.new_state) +
            " peer=" + context.peer_id
        );
    }

    return result;
}

// ==========================================================
// PURE FSM TRANSITION TABLE (AUTHORITATIVE)
// ==========================================================
FSMResult ConnectionStateMachine::compute_transition(
    ConnectionState current,
    ConnectionEvent event,
    ConnectionContext& context
) const {

    // Accepting an inbound session wins from any state.
    if (event == ConnectionEvent::INBOUND_ACCEPTED) {
        context.connect_attempts = 0;
        switch (current) {
            case ConnectionState::CONNECTING:
                return FSMResult(ConnectionState::CONNECTED,
                                 { ConnectionAction::CANCEL_TIMEOUT, ConnectionAction::RELEASE_HANDLE });
            case ConnectionState::CONNECTED:
                return FSMResult(ConnectionState::CONNECTED,
                                 { ConnectionAction::RELEASE_HANDLE, ConnectionAction::DISCARD_TRANSFERS,
                                   ConnectionAction::END_CALL });
            default:
                return FSMResult(ConnectionState::CONNECTED);
        }
    }

    switch (current) {

    // ------------------------------------------------------
    case ConnectionState::DISCONNECTED:
        if (event == ConnectionEvent::CONNECT_REQUESTED) {
            context.connect_attempts = 1;
            return FSMResult(ConnectionState::CONNECTING, { ConnectionAction::ARM_TIMEOUT });
        }

        // Closing an already-closed session is a no-op.
        if (event == ConnectionEvent::LOCAL_DISCONNECT)
            return FSMResult(ConnectionState::DISCONNECTED);
        break;

    // ------------------------------------------------------
    case ConnectionState::CONNECTING:
        // A new target (or the same one again) restarts the attempt.
        if (event == ConnectionEvent::CONNECT_REQUESTED) {
            context.connect_attempts = 1;
            return FSMResult(ConnectionState::CONNECTING,
                             { ConnectionAction::RELEASE_HANDLE, ConnectionAction::ARM_TIMEOUT });
        }

        if (event == ConnectionEvent::TRANSPORT_OPENED) {
            context.connect_attempts = 0;
            return FSMResult(ConnectionState::CONNECTED, { ConnectionAction::CANCEL_TIMEOUT });
        }

        if (event == ConnectionEvent::TIMEOUT)
            return FSMResult(ConnectionState::ERROR,
                             { ConnectionAction::CANCEL_TIMEOUT, ConnectionAction::RELEASE_HANDLE });

        if (event == ConnectionEvent::TRANSPORT_ERROR || event == ConnectionEvent::TRANSPORT_CLOSED)
            return FSMResult(ConnectionState::ERROR,
                             { ConnectionAction::CANCEL_TIMEOUT, ConnectionAction::RELEASE_HANDLE });

        if (event == ConnectionEvent::LOCAL_DISCONNECT)
            return FSMResult(ConnectionState::DISCONNECTED,
                             { ConnectionAction::CANCEL_TIMEOUT, ConnectionAction::RELEASE_HANDLE,
                               ConnectionAction::CLEAR_MESSAGES });
        break;

    // ------------------------------------------------------
    case ConnectionState::CONNECTED:
        if (event == ConnectionEvent::CONNECT_REQUESTED) {
            context.connect_attempts = 1;
            return FSMResult(ConnectionState::CONNECTING,
                             { ConnectionAction::RELEASE_HANDLE, ConnectionAction::DISCARD_TRANSFERS,
                               ConnectionAction::END_CALL, ConnectionAction::ARM_TIMEOUT });
        }

        if (event == ConnectionEvent::TRANSPORT_CLOSED)
            return FSMResult(ConnectionState::DISCONNECTED,
                             { ConnectionAction::RELEASE_HANDLE, ConnectionAction::DISCARD_TRANSFERS,
                               ConnectionAction::END_CALL });

        if (event == ConnectionEvent::TRANSPORT_ERROR)
            return FSMResult(ConnectionState::ERROR,
                             { ConnectionAction::RELEASE_HANDLE, ConnectionAction::DISCARD_TRANSFERS,
                               ConnectionAction::END_CALL });

        if (event == ConnectionEvent::LOCAL_DISCONNECT)
            return FSMResult(ConnectionState::DISCONNECTED,
                             { ConnectionAction::RELEASE_HANDLE, ConnectionAction::DISCARD_TRANSFERS,
                               ConnectionAction::END_CALL, ConnectionAction::CLEAR_MESSAGES });
        break;

    // ------------------------------------------------------
    case ConnectionState::ERROR:
        // Only an explicit retry leaves ERROR toward CONNECTING; a connect to a
        // (possibly new) target counts as one.
        if (event == ConnectionEvent::RETRY_REQUESTED || event == ConnectionEvent::CONNECT_REQUESTED) {
            context.connect_attempts = 1;
            return FSMResult(ConnectionState::CONNECTING, { ConnectionAction::ARM_TIMEOUT });
        }

        if (event == ConnectionEvent::LOCAL_DISCONNECT)
            return FSMResult(ConnectionState::DISCONNECTED, { ConnectionAction::CLEAR_MESSAGES });
        break;
    }

    LOG_WARN(
        std::string("[LinkFSM] Ignored transition ") +
        state_to_string(current) +
        " + " + event_to_string(event)
    );

    FSMResult ignored(current);
    ignored.ignored = true;
    return ignored;
}

// ==========================================================
// DEBUG HELPERS
// ==========================================================
const char* ConnectionStateMachine::state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* ConnectionStateMachine::event_to_string(ConnectionEvent event) {
    switch (event) {
        case ConnectionEvent::CONNECT_REQUESTED: return "CONNECT_REQUESTED";
        case ConnectionEvent::RETRY_REQUESTED: return "RETRY_REQUESTED";
        case ConnectionEvent::TRANSPORT_OPENED: return "TRANSPORT_OPENED";
        case ConnectionEvent::INBOUND_ACCEPTED: return "INBOUND_ACCEPTED";
        case ConnectionEvent::TIMEOUT: return "TIMEOUT";
        case ConnectionEvent::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case ConnectionEvent::TRANSPORT_CLOSED: return "TRANSPORT_CLOSED";
        case ConnectionEvent::LOCAL_DISCONNECT: return "LOCAL_DISCONNECT";
        default: return "UNKNOWN";
    }
}

const char* ConnectionStateMachine::action_to_string(ConnectionAction action) {
    switch (action) {
        case ConnectionAction::NONE: return "NONE";
        case ConnectionAction::ARM_TIMEOUT: return "ARM_TIMEOUT";
        case ConnectionAction::CANCEL_TIMEOUT: return "CANCEL_TIMEOUT";
        case ConnectionAction::RELEASE_HANDLE: return "RELEASE_HANDLE";
        case ConnectionAction::DISCARD_TRANSFERS: return "DISCARD_TRANSFERS";
        case ConnectionAction::END_CALL: return "END_CALL";
        case ConnectionAction::CLEAR_MESSAGES: return "CLEAR_MESSAGES";
        default: return "UNKNOWN";
    }
}
