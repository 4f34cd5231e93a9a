#ifndef MEDIA_INTERFACES_H
#define MEDIA_INTERFACES_H

#include <cstdint>
#include <memory>
#include <string>

// Opaque id of one media call on the media-call transport. 0 is never issued.
using MediaCallHandle = uint64_t;
inline constexpr MediaCallHandle kNoMediaCall = 0;

// Local capture resource (camera + microphone). Owned exclusively by the call
// negotiation; stop_tracks() must be called before it is dropped.
class LocalMedia {
public:
    virtual ~LocalMedia() = default;

    virtual std::string describe() const = 0;
    virtual void stop_tracks() = 0;
};

// Remote stream as observed from the media-call transport.
struct RemoteMedia {
    std::string stream_id;
    std::string peer_id;
};

enum class MediaErrorKind {
    NONE,
    PERMISSION_DENIED,
    DEVICE_BUSY,
    DEVICE_UNAVAILABLE,
    UNKNOWN
};

const char* media_error_to_string(MediaErrorKind kind);

// ============================================================================
// MEDIA SIGNALS (delivered through the event loop)
// ============================================================================

// --- Completion of IMediaDevices::request_local_media ---
struct LocalMediaResult {
    uint64_t request_id = 0;
    std::unique_ptr<LocalMedia> media;       // Set on success
    MediaErrorKind error = MediaErrorKind::NONE;
    std::string detail;
};

// --- Remote peer placed a media call to us ---
struct MediaCallIncoming {
    MediaCallHandle handle = kNoMediaCall;
    std::string peer_id;
};

// --- Remote stream attached to a media call ---
struct MediaStreamArrived {
    MediaCallHandle handle = kNoMediaCall;
    RemoteMedia remote;
};

// --- Media call ended by the transport or the remote side ---
struct MediaCallClosed {
    MediaCallHandle handle = kNoMediaCall;
};

// --- Media call failed ---
struct MediaCallError {
    MediaCallHandle handle = kNoMediaCall;
    std::string detail;
};

// ============================================================================
// COLLABORATOR INTERFACES
// ============================================================================

class IMediaCallTransport {
public:
    virtual ~IMediaCallTransport() = default;

    // Places a media call; returns kNoMediaCall if it could not be placed.
    virtual MediaCallHandle call(const std::string& peer_id, const LocalMedia& media) = 0;
    virtual bool answer(MediaCallHandle handle, const LocalMedia& media) = 0;
    virtual void close(MediaCallHandle handle) = 0;
};

class IMediaDevices {
public:
    virtual ~IMediaDevices() = default;

    // Asynchronous: completion arrives later as a LocalMediaResult carrying request_id.
    virtual void request_local_media(uint64_t request_id) = 0;
};

#endif // MEDIA_INTERFACES_H
