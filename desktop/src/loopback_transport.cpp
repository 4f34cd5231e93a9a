#include "loopback_transport.h"
#include "logger.h"
#include "wire_codec.h"

#include <memory>
#include <vector>

namespace {

class SimulatedLocalMedia : public LocalMedia {
public:
    SimulatedLocalMedia(std::string owner, std::atomic<size_t>& released_counter)
        : m_owner(std::move(owner)), m_released(released_counter) {}

    ~SimulatedLocalMedia() override {
        if (!m_stopped) {
            LOG_WARN("Loopback: local media of " + m_owner + " dropped without stop_tracks()");
        }
    }

    std::string describe() const override { return "camera+microphone of " + m_owner; }

    void stop_tracks() override {
        if (m_stopped) {
            return;
        }
        m_stopped = true;
        m_released++;
    }

private:
    std::string m_owner;
    std::atomic<size_t>& m_released;
    bool m_stopped = false;
};

} // namespace

// ============================================================================
// NETWORK
// ============================================================================

size_t LoopbackNetwork::endpointCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoints.size();
}

size_t LoopbackNetwork::openLinkCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_links.size() / 2;
}

size_t LoopbackNetwork::openMediaCallCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_media_calls.size() / 2;
}

bool LoopbackNetwork::registerEndpoint(const std::string& peer_id, LoopbackEndpoint* endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoints.emplace(peer_id, endpoint).second;
}

void LoopbackNetwork::unregisterEndpoint(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_endpoints.erase(peer_id);

    // Tear down every route the endpoint still owns and tell the other side.
    auto drop_routes = [this, &peer_id](std::map<uint64_t, Route>& routes, bool media) {
        std::vector<uint64_t> owned;
        for (const auto& [handle, route] : routes) {
            if (route.owner_id == peer_id) owned.push_back(handle);
        }
        for (uint64_t handle : owned) {
            auto it = routes.find(handle);
            if (it == routes.end()) continue;
            const Route route = it->second;
            routes.erase(it);
            routes.erase(route.remote_handle);
            if (LoopbackEndpoint* remote = findLocked(route.remote_id)) {
                if (media) {
                    remote->deliver(MediaCallClosed{route.remote_handle});
                } else {
                    remote->deliver(TransportClosed{route.remote_handle});
                }
            }
        }
    };
    drop_routes(m_links, false);
    drop_routes(m_media_calls, true);
}

LoopbackEndpoint* LoopbackNetwork::findLocked(const std::string& peer_id) const {
    auto it = m_endpoints.find(peer_id);
    return it == m_endpoints.end() ? nullptr : it->second;
}

// ============================================================================
// ENDPOINT
// ============================================================================

LoopbackEndpoint::LoopbackEndpoint(LoopbackNetwork& network, std::string peer_id, EventLoop& loop)
    : m_network(network), m_peer_id(std::move(peer_id)), m_loop(loop) {
    m_registered = m_network.registerEndpoint(m_peer_id, this);
    if (!m_registered) {
        LOG_WARN("Loopback: peer id already registered: " + m_peer_id);
    }
}

LoopbackEndpoint::~LoopbackEndpoint() {
    if (m_registered) {
        m_network.unregisterEndpoint(m_peer_id);
    }
}

TransportHandle LoopbackEndpoint::connect(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_network.m_mutex);

    const TransportHandle local_handle = m_network.nextHandle();
    LoopbackEndpoint* target = m_network.findLocked(peer_id);
    if (!target) {
        LOG_DEBUG("Loopback: " + m_peer_id + " -> " + peer_id + " unavailable");
        TransportError error;
        error.handle = local_handle;
        error.kind = TransportErrorKind::PEER_UNAVAILABLE;
        error.detail = "Could not connect to peer " + peer_id;
        deliver(std::move(error));
        return local_handle;
    }
    if (!target->m_reachable) {
        LOG_DEBUG("Loopback: " + peer_id + " is unreachable, attempt " + std::to_string(local_handle) + " will hang");
        return local_handle;
    }

    const TransportHandle remote_handle = m_network.nextHandle();
    m_network.m_links[local_handle] = LoopbackNetwork::Route{m_peer_id, peer_id, remote_handle};
    m_network.m_links[remote_handle] = LoopbackNetwork::Route{peer_id, m_peer_id, local_handle};

    target->deliver(InboundSessionAccepted{remote_handle, m_peer_id});
    deliver(TransportOpened{local_handle});
    return local_handle;
}

bool LoopbackEndpoint::send(TransportHandle handle, const Envelope& envelope) {
    std::lock_guard<std::mutex> lock(m_network.m_mutex);

    auto it = m_network.m_links.find(handle);
    if (it == m_network.m_links.end() || it->second.owner_id != m_peer_id) {
        return false;
    }
    LoopbackEndpoint* target = m_network.findLocked(it->second.remote_id);
    if (!target) {
        return false;
    }

    // Cross the "wire" exactly as a byte-oriented transport would.
    const std::string frame = wire::encode_envelope(envelope);
    std::string error;
    auto decoded = wire::decode_envelope(frame, &error);
    if (!decoded) {
        LOG_WARN("Loopback: frame rejected by codec: " + error);
        return false;
    }

    target->deliver(TransportData{it->second.remote_handle, std::move(*decoded)});
    m_network.m_frames_delivered++;
    return true;
}

void LoopbackEndpoint::close(uint64_t handle) {
    std::lock_guard<std::mutex> lock(m_network.m_mutex);

    auto link = m_network.m_links.find(handle);
    if (link != m_network.m_links.end()) {
        const LoopbackNetwork::Route route = link->second;
        m_network.m_links.erase(link);
        m_network.m_links.erase(route.remote_handle);
        if (LoopbackEndpoint* remote = m_network.findLocked(route.remote_id)) {
            remote->deliver(TransportClosed{route.remote_handle});
        }
        return;
    }

    auto media = m_network.m_media_calls.find(handle);
    if (media != m_network.m_media_calls.end()) {
        const LoopbackNetwork::Route route = media->second;
        m_network.m_media_calls.erase(media);
        m_network.m_media_calls.erase(route.remote_handle);
        if (LoopbackEndpoint* remote = m_network.findLocked(route.remote_id)) {
            remote->deliver(MediaCallClosed{route.remote_handle});
        }
    }
}

MediaCallHandle LoopbackEndpoint::call(const std::string& peer_id, const LocalMedia& media) {
    std::lock_guard<std::mutex> lock(m_network.m_mutex);

    LoopbackEndpoint* target = m_network.findLocked(peer_id);
    if (!target) {
        return kNoMediaCall;
    }

    const MediaCallHandle local_handle = m_network.nextHandle();
    const MediaCallHandle remote_handle = m_network.nextHandle();
    m_network.m_media_calls[local_handle] = LoopbackNetwork::Route{m_peer_id, peer_id, remote_handle};
    m_network.m_media_calls[remote_handle] = LoopbackNetwork::Route{peer_id, m_peer_id, local_handle};

    LOG_DEBUG("Loopback: media call " + m_peer_id + " -> " + peer_id + " with " + media.describe());
    target->deliver(MediaCallIncoming{remote_handle, m_peer_id});
    return local_handle;
}

bool LoopbackEndpoint::answer(MediaCallHandle handle, const LocalMedia& media) {
    std::lock_guard<std::mutex> lock(m_network.m_mutex);

    auto it = m_network.m_media_calls.find(handle);
    if (it == m_network.m_media_calls.end()) {
        return false;
    }
    const LoopbackNetwork::Route route = it->second;

    LOG_DEBUG("Loopback: " + m_peer_id + " answers media call with " + media.describe());
    if (LoopbackEndpoint* caller = m_network.findLocked(route.remote_id)) {
        caller->deliver(MediaStreamArrived{route.remote_handle, RemoteMedia{"stream-" + m_peer_id, m_peer_id}});
    }
    deliver(MediaStreamArrived{handle, RemoteMedia{"stream-" + route.remote_id, route.remote_id}});
    return true;
}

void LoopbackEndpoint::request_local_media(uint64_t request_id) {
    LocalMediaResult result;
    result.request_id = request_id;
    if (m_camera_available) {
        result.media = std::make_unique<SimulatedLocalMedia>(m_peer_id, m_media_released);
        m_media_acquired++;
    } else {
        result.error = MediaErrorKind::PERMISSION_DENIED;
        result.detail = "camera access denied";
    }
    deliver(std::move(result));
}
