#pragma once

#include "event_loop.h"
#include "link_transport.h"
#include "media_interfaces.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

class LoopbackEndpoint;

/**
 * @brief In-process stand-in for the signaling broker + peer connections.
 *
 * Endpoints register under their peer id. Every envelope crosses the
 * "network" as a wire frame (wire::encode_envelope / decode_envelope) and is
 * delivered as a LinkEvent on the receiving endpoint's event loop.
 * Thread-safe: endpoints may live on different loop threads.
 */
class LoopbackNetwork {
public:
    LoopbackNetwork() = default;
    LoopbackNetwork(const LoopbackNetwork&) = delete;
    LoopbackNetwork& operator=(const LoopbackNetwork&) = delete;

    size_t endpointCount() const;
    size_t openLinkCount() const;
    size_t openMediaCallCount() const;
    uint64_t framesDelivered() const { return m_frames_delivered.load(); }

private:
    friend class LoopbackEndpoint;

    // One direction of a link: the handle a given endpoint uses and where it leads.
    struct Route {
        std::string owner_id;
        std::string remote_id;
        uint64_t remote_handle = 0;
    };

    bool registerEndpoint(const std::string& peer_id, LoopbackEndpoint* endpoint);
    void unregisterEndpoint(const std::string& peer_id);
    LoopbackEndpoint* findLocked(const std::string& peer_id) const;

    uint64_t nextHandle() { return m_next_handle++; }

    mutable std::mutex m_mutex;
    std::map<std::string, LoopbackEndpoint*> m_endpoints;
    std::map<uint64_t, Route> m_links;         // data session handles
    std::map<uint64_t, Route> m_media_calls;   // media call handles
    uint64_t m_next_handle = 1;
    std::atomic<uint64_t> m_frames_delivered{0};
};

/**
 * @brief One peer on a LoopbackNetwork. Implements every collaborator a
 * SessionController needs (data transport, media-call transport, devices).
 */
class LoopbackEndpoint : public ILinkTransport, public IMediaCallTransport, public IMediaDevices {
public:
    LoopbackEndpoint(LoopbackNetwork& network, std::string peer_id, EventLoop& loop);
    ~LoopbackEndpoint() override;

    LoopbackEndpoint(const LoopbackEndpoint&) = delete;
    LoopbackEndpoint& operator=(const LoopbackEndpoint&) = delete;

    const std::string& peerId() const { return m_peer_id; }
    bool isRegistered() const { return m_registered; }

    // ILinkTransport
    TransportHandle connect(const std::string& peer_id) override;
    bool send(TransportHandle handle, const Envelope& envelope) override;

    // Data sessions and media calls share one handle space, so a single
    // close() serves both ILinkTransport and IMediaCallTransport.
    void close(uint64_t handle) override;

    // IMediaCallTransport
    MediaCallHandle call(const std::string& peer_id, const LocalMedia& media) override;
    bool answer(MediaCallHandle handle, const LocalMedia& media) override;

    // IMediaDevices
    void request_local_media(uint64_t request_id) override;

    // Simulation knobs
    void setCameraAvailable(bool available) { m_camera_available = available; }
    // An unreachable endpoint swallows connect attempts (the caller times out).
    void setReachable(bool reachable) { m_reachable = reachable; }
    bool isReachable() const { return m_reachable; }

    size_t mediaAcquired() const { return m_media_acquired.load(); }
    size_t mediaReleased() const { return m_media_released.load(); }

private:
    friend class LoopbackNetwork;

    void deliver(LinkEvent event) { m_loop.pushEvent(std::move(event)); }

    LoopbackNetwork& m_network;
    std::string m_peer_id;
    EventLoop& m_loop;
    bool m_registered = false;

    std::atomic<bool> m_camera_available{true};
    std::atomic<bool> m_reachable{true};
    std::atomic<size_t> m_media_acquired{0};
    std::atomic<size_t> m_media_released{0};
};
