#ifndef LINK_EVENTS_H
#define LINK_EVENTS_H

#include "envelope.h"
#include "link_transport.h"
#include "media_interfaces.h"

#include <cstdint>
#include <string>
#include <variant>

// ============================================================================
// LOCAL USER REQUESTS
// ============================================================================

// --- Connect to a peer (or retry toward a new target from ERROR) ---
struct ConnectRequest {
    std::string peer_id;
};

// --- Re-issue the connect to the last target (only from ERROR) ---
struct RetryRequest {};

// --- Local disconnect ("logout"): closes the session and clears the stream ---
struct DisconnectRequest {};

struct SendTextRequest {
    std::string text;
};

struct SendFileRequest {
    std::string file_name;
    Bytes data;
};

struct StartCallRequest {};
struct AcceptCallRequest {};
struct RejectCallRequest {};
struct HangUpRequest {};

// ============================================================================
// TRANSPORT SIGNALS
// ============================================================================

struct TransportOpened {
    TransportHandle handle = kNoHandle;
};

struct TransportData {
    TransportHandle handle = kNoHandle;
    Envelope envelope;
};

struct TransportClosed {
    TransportHandle handle = kNoHandle;
};

struct TransportError {
    TransportHandle handle = kNoHandle;
    TransportErrorKind kind = TransportErrorKind::UNKNOWN;
    std::string detail;
};

// --- A remote peer opened a session to us ---
struct InboundSessionAccepted {
    TransportHandle handle = kNoHandle;
    std::string peer_id;
};

// ============================================================================
// TIMERS (scheduled on the event loop)
// ============================================================================

// --- Connect attempt timed out; `attempt` guards against stale timers ---
struct ConnectTimeoutExpired {
    uint64_t attempt = 0;
};

// --- Re-issue the pending connect while still CONNECTING ---
struct ConnectRetryTick {
    uint64_t attempt = 0;
};

// --- Continue pumping an outbound transfer ---
struct TransferPaceTick {
    std::string transfer_id;
    uint64_t session_generation = 0;
};

using LinkEvent = std::variant<
    ConnectRequest,
    RetryRequest,
    DisconnectRequest,
    SendTextRequest,
    SendFileRequest,
    StartCallRequest,
    AcceptCallRequest,
    RejectCallRequest,
    HangUpRequest,
    TransportOpened,
    TransportData,
    TransportClosed,
    TransportError,
    InboundSessionAccepted,
    ConnectTimeoutExpired,
    ConnectRetryTick,
    TransferPaceTick,
    LocalMediaResult,
    MediaCallIncoming,
    MediaStreamArrived,
    MediaCallClosed,
    MediaCallError
>;

#endif // LINK_EVENTS_H
