#pragma once

#include "call_negotiation.h"
#include "config_manager.h"
#include "connection_state_machine.h"
#include "envelope.h"
#include "event_log.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class EventLoop;
class LoopbackNetwork;
class LoopbackEndpoint;
class SessionController;

/**
 * @brief Link node wrapper for the desktop CLI
 *
 * Owns one endpoint's event loop (on its own thread), its loopback endpoint
 * and its SessionController. Every request is queued onto the loop; queries
 * read a snapshot that the controller's callbacks keep current, so they are
 * safe from any thread.
 */
class LinkNode {
public:
    struct Status {
        std::string peer_id;
        ConnectionState state = ConnectionState::DISCONNECTED;
        std::string remote_peer;
        CallPhase call_phase = CallPhase::IDLE;
        CallRole call_role = CallRole::NONE;
        bool remote_media = false;
        size_t message_count = 0;
        std::map<std::string, int> transfers;   // transfer id -> percent
    };

    explicit LinkNode(LoopbackNetwork& network);
    ~LinkNode();

    LinkNode(const LinkNode&) = delete;
    LinkNode& operator=(const LinkNode&) = delete;

    bool start(const std::string& peer_id, const LinkSettings& settings);
    void stop();

    bool isRunning() const { return running_; }
    std::string getPeerId() const { return peer_id_; }

    // Requests (thread-safe, processed on the node's loop)
    void connectToPeer(const std::string& peer_id);
    void retry();
    void disconnect();
    void sendText(const std::string& text);
    void sendFile(const std::string& file_name, Bytes data);
    void startCall();
    void acceptCall();
    void rejectCall();
    void hangUp();

    // Simulation knobs forwarded to the endpoint
    void setCameraAvailable(bool available);
    void setReachable(bool reachable);

    // Snapshots (thread-safe)
    Status getStatus() const;
    std::vector<Envelope> getMessages() const;
    std::vector<LogEntry> getLogEntries() const;

    // Desktop UI integration (optional). Invoked on the node's loop thread.
    void setEventCallbacks(
        std::function<void(const Envelope& message)> on_message,
        std::function<void(const LogEntry& entry)> on_log,
        std::function<void(ConnectionState state, const std::string& peer_id)> on_state,
        std::function<void(CallPhase phase, CallRole role)> on_call);

    void clearEventCallbacks();

private:
    LoopbackNetwork& network_;
    bool running_ = false;
    std::string peer_id_;

    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<LoopbackEndpoint> endpoint_;
    std::unique_ptr<SessionController> controller_;
    std::thread loop_thread_;

    mutable std::mutex state_mutex_;
    Status status_;
    std::vector<Envelope> messages_;
    std::vector<LogEntry> log_entries_;
    size_t log_capacity_ = 200;

    mutable std::mutex callbacks_mutex_;
    std::function<void(const Envelope&)> on_message_cb_;
    std::function<void(const LogEntry&)> on_log_cb_;
    std::function<void(ConnectionState, const std::string&)> on_state_cb_;
    std::function<void(CallPhase, CallRole)> on_call_cb_;
};
