#ifndef LINK_TRANSPORT_H
#define LINK_TRANSPORT_H

#include "envelope.h"

#include <cstdint>
#include <string>

// Opaque id of one data session on the transport. 0 is never issued.
using TransportHandle = uint64_t;
inline constexpr TransportHandle kNoHandle = 0;

enum class TransportErrorKind {
    PEER_UNAVAILABLE,
    SIGNALING_DISCONNECTED,
    NEGOTIATION_FAILED,
    NETWORK,
    UNKNOWN
};

const char* transport_error_to_string(TransportErrorKind kind);

// Envelope transport between two peers. Signals (open, data, close, error,
// inbound accept) come back asynchronously as LinkEvents on the event loop.
class ILinkTransport {
public:
    virtual ~ILinkTransport() = default;

    // Starts an outbound session; returns kNoHandle if the attempt could not be started.
    virtual TransportHandle connect(const std::string& peer_id) = 0;
    virtual bool send(TransportHandle handle, const Envelope& envelope) = 0;
    virtual void close(TransportHandle handle) = 0;
};

#endif // LINK_TRANSPORT_H
