#include "link_node.h"
#include "event_loop.h"
#include "logger.h"
#include "loopback_transport.h"
#include "session_controller.h"

LinkNode::LinkNode(LoopbackNetwork& network) : network_(network) {}

LinkNode::~LinkNode() {
    stop();
}

bool LinkNode::start(const std::string& peer_id, const LinkSettings& settings) {
    if (running_) {
        LOG_WARN("LinkNode: Already running as " + peer_id_);
        return false;
    }

    peer_id_ = peer_id;
    log_capacity_ = settings.event_log_capacity;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = Status{};
        status_.peer_id = peer_id;
        messages_.clear();
        log_entries_.clear();
    }

    loop_ = std::make_unique<EventLoop>();
    endpoint_ = std::make_unique<LoopbackEndpoint>(network_, peer_id, *loop_);
    if (!endpoint_->isRegistered()) {
        endpoint_.reset();
        loop_.reset();
        return false;
    }

    LinkCallbacks callbacks;
    callbacks.on_message = [this](const Envelope& message) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            messages_.push_back(message);
            status_.message_count = messages_.size();
        }
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        if (on_message_cb_) on_message_cb_(message);
    };
    callbacks.on_messages_cleared = [this]() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        messages_.clear();
        status_.message_count = 0;
    };
    callbacks.on_transfer_progress = [this](const std::string& id, int percent) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_.transfers[id] = percent;
    };
    callbacks.on_transfer_removed = [this](const std::string& id) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_.transfers.erase(id);
    };
    callbacks.on_log_entry = [this](const LogEntry& entry) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            log_entries_.push_back(entry);
            if (log_entries_.size() > log_capacity_) {
                log_entries_.erase(log_entries_.begin());
            }
        }
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        if (on_log_cb_) on_log_cb_(entry);
    };
    callbacks.on_connection_state = [this](ConnectionState state, const std::string& peer) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            status_.state = state;
            status_.remote_peer = peer;
        }
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        if (on_state_cb_) on_state_cb_(state, peer);
    };
    callbacks.on_call_state = [this](CallPhase phase, CallRole role) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            status_.call_phase = phase;
            status_.call_role = role;
        }
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        if (on_call_cb_) on_call_cb_(phase, role);
    };
    callbacks.on_remote_media = [this](const std::optional<RemoteMedia>& remote) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_.remote_media = remote.has_value();
    };

    try {
        controller_ = std::make_unique<SessionController>(peer_id, settings, *loop_, *endpoint_, *endpoint_,
                                                          *endpoint_, std::move(callbacks));
    } catch (const std::exception& e) {
        LOG_ERROR("LinkNode: Failed to create session controller: " + std::string(e.what()));
        endpoint_.reset();
        loop_.reset();
        return false;
    }

    loop_->setHandler([this](LinkEvent event) { controller_->dispatch(std::move(event)); });
    loop_thread_ = std::thread([this]() { loop_->run(); });

    running_ = true;
    LOG_INFO("LinkNode: Started " + peer_id);
    return true;
}

void LinkNode::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    loop_->stop();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    // Controller first: it releases local media and closes handles on the endpoint.
    controller_.reset();
    endpoint_.reset();
    loop_.reset();
    LOG_INFO("LinkNode: Stopped " + peer_id_);
}

void LinkNode::connectToPeer(const std::string& peer_id) {
    if (running_) loop_->pushEvent(ConnectRequest{peer_id});
}

void LinkNode::retry() {
    if (running_) loop_->pushEvent(RetryRequest{});
}

void LinkNode::disconnect() {
    if (running_) loop_->pushEvent(DisconnectRequest{});
}

void LinkNode::sendText(const std::string& text) {
    if (running_) loop_->pushEvent(SendTextRequest{text});
}

void LinkNode::sendFile(const std::string& file_name, Bytes data) {
    if (running_) loop_->pushEvent(SendFileRequest{file_name, std::move(data)});
}

void LinkNode::startCall() {
    if (running_) loop_->pushEvent(StartCallRequest{});
}

void LinkNode::acceptCall() {
    if (running_) loop_->pushEvent(AcceptCallRequest{});
}

void LinkNode::rejectCall() {
    if (running_) loop_->pushEvent(RejectCallRequest{});
}

void LinkNode::hangUp() {
    if (running_) loop_->pushEvent(HangUpRequest{});
}

void LinkNode::setCameraAvailable(bool available) {
    if (endpoint_) endpoint_->setCameraAvailable(available);
}

void LinkNode::setReachable(bool reachable) {
    if (endpoint_) endpoint_->setReachable(reachable);
}

LinkNode::Status LinkNode::getStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::vector<Envelope> LinkNode::getMessages() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return messages_;
}

std::vector<LogEntry> LinkNode::getLogEntries() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return log_entries_;
}

void LinkNode::setEventCallbacks(
    std::function<void(const Envelope&)> on_message,
    std::function<void(const LogEntry&)> on_log,
    std::function<void(ConnectionState, const std::string&)> on_state,
    std::function<void(CallPhase, CallRole)> on_call) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_message_cb_ = std::move(on_message);
    on_log_cb_ = std::move(on_log);
    on_state_cb_ = std::move(on_state);
    on_call_cb_ = std::move(on_call);
}

void LinkNode::clearEventCallbacks() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_message_cb_ = nullptr;
    on_log_cb_ = nullptr;
    on_state_cb_ = nullptr;
    on_call_cb_ = nullptr;
}
