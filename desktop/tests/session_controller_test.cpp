#include "session_controller.h"
#include "logger.h"
#include "test_fakes.h"

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

// One controller wired to fakes; events pushed to the loop are dispatched by runUntilIdle().
struct Harness {
    EventLoop loop;
    FakeTransport transport;
    FakeMediaCallTransport media;
    FakeMediaDevices devices;
    std::unique_ptr<SessionController> sc;

    std::vector<ConnectionState> states;
    std::map<std::string, int> progress;
    int received = 0;
    int cleared = 0;

    explicit Harness(LinkSettings settings = LinkSettings{}) {
        LinkCallbacks callbacks;
        callbacks.on_connection_state = [this](ConnectionState state, const std::string&) { states.push_back(state); };
        callbacks.on_transfer_progress = [this](const std::string& id, int percent) { progress[id] = percent; };
        callbacks.on_transfer_removed = [this](const std::string& id) { progress.erase(id); };
        callbacks.on_message = [this](const Envelope&) { received++; };
        callbacks.on_messages_cleared = [this]() { cleared++; };

        sc = std::make_unique<SessionController>("LOCAL1", settings, loop, transport, media, devices,
                                                 std::move(callbacks));
        loop.setHandler([this](LinkEvent event) { sc->dispatch(std::move(event)); });
    }

    ~Harness() {
        // The controller holds local media that reports into `devices`.
        sc.reset();
    }

    // Connects to `peer` and delivers the open signal.
    TransportHandle open_session(const std::string& peer = "ABC123") {
        sc->connect(peer);
        const TransportHandle handle = sc->handle();
        sc->dispatch(TransportOpened{handle});
        return handle;
    }

    size_t messages_of(MessageKind kind) const {
        size_t n = 0;
        for (const auto& m : sc->messages()) {
            if (m.kind() == kind) n++;
        }
        return n;
    }
};

static bool test_connect_timeout_enters_error() {
    Harness h;
    const auto t0 = EventLoop::Clock::now();

    TEST_ASSERT(h.sc->connect("ABC123"), "connect accepted");
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTING, "CONNECTING");
    TEST_ASSERT(h.transport.connect_targets.size() == 1 && h.transport.connect_targets[0] == "ABC123",
                "transport asked to connect");
    TEST_ASSERT(h.loop.hasScheduledEvent(SessionController::kConnectTimeoutTimer), "timeout armed");

    h.loop.runUntilIdle(t0 + 14s);
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTING, "still CONNECTING before 15000 ms");
    TEST_ASSERT(h.sc->connect_attempts() == 3, "retried every 5000 ms while waiting");

    h.loop.runUntilIdle(EventLoop::Clock::now() + 16s);
    TEST_ASSERT(h.sc->state() == ConnectionState::ERROR, "ERROR after timeout");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::ERROR) == 1, "exactly one error entry");
    TEST_ASSERT(h.loop.scheduledEventCount() == 0, "no timers left");
    TEST_ASSERT(h.sc->handle() == kNoHandle, "attempt released");
    return true;
}

static bool test_open_connects_and_cancels_timer() {
    Harness h;
    const TransportHandle handle = h.open_session("abc123");

    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "CONNECTED");
    TEST_ASSERT(h.sc->peer_id() == "ABC123", "peer id normalized");
    TEST_ASSERT(h.sc->handle() == handle, "handle kept");
    TEST_ASSERT(!h.loop.hasScheduledEvent(SessionController::kConnectTimeoutTimer), "timeout cancelled");
    TEST_ASSERT(!h.loop.hasScheduledEvent(SessionController::kConnectRetryTimer), "retry cancelled");
    TEST_ASSERT(h.states.size() == 2 && h.states[1] == ConnectionState::CONNECTED, "state callbacks");
    return true;
}

static bool test_invalid_and_self_connect() {
    Harness h;
    TEST_ASSERT(!h.sc->connect("LOCAL1"), "self connect refused");
    TEST_ASSERT(!h.sc->connect("  "), "blank id refused");
    TEST_ASSERT(!h.sc->connect("AB-12"), "punctuation refused");
    TEST_ASSERT(h.sc->state() == ConnectionState::DISCONNECTED, "still DISCONNECTED");
    TEST_ASSERT(h.transport.connect_targets.empty(), "transport untouched");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::WARNING) == 3, "each refusal logged");
    return true;
}

static bool test_inbound_replaces_existing_session() {
    Harness h;
    const TransportHandle first = h.open_session("A");

    h.sc->dispatch(InboundSessionAccepted{50, "A"});
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "still CONNECTED");
    TEST_ASSERT(h.transport.was_closed(first), "outbound A handle closed");

    h.sc->dispatch(InboundSessionAccepted{51, "B"});
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "CONNECTED");
    TEST_ASSERT(h.sc->peer_id() == "B", "session is for B");
    TEST_ASSERT(h.sc->handle() == 51, "B handle current");
    TEST_ASSERT(h.transport.was_closed(50), "inbound A handle closed");
    TEST_ASSERT(!h.transport.was_closed(51), "B handle open");

    // Signals on the replaced handles are stale.
    h.sc->dispatch(TransportClosed{50});
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "stale close ignored");
    h.sc->dispatch(TransportData{50, Envelope::text("A", "late")});
    TEST_ASSERT(h.sc->messages().empty(), "stale data ignored");
    return true;
}

static bool test_inbound_during_outbound_attempt() {
    Harness h;
    h.sc->connect("ABC123");
    const TransportHandle attempt = h.sc->handle();

    h.sc->dispatch(InboundSessionAccepted{77, "XYZ789"});
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "inbound wins");
    TEST_ASSERT(h.sc->peer_id() == "XYZ789", "inbound peer");
    TEST_ASSERT(h.transport.was_closed(attempt), "outbound attempt closed");
    TEST_ASSERT(h.loop.scheduledEventCount() == 0, "attempt timers cancelled");

    h.sc->dispatch(TransportOpened{attempt});
    TEST_ASSERT(h.sc->handle() == 77, "late open of the attempt ignored");
    return true;
}

static bool test_send_requires_connection() {
    Harness h;
    TEST_ASSERT(!h.sc->send_text("hello"), "text refused while DISCONNECTED");
    TEST_ASSERT(!h.sc->send_file("a.png", Bytes{1, 2, 3}), "file refused while DISCONNECTED");
    TEST_ASSERT(h.transport.sent.empty(), "nothing sent");
    TEST_ASSERT(h.sc->messages().empty(), "nothing appended");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::WARNING) == 2, "warnings logged");

    h.sc->connect("ABC123");
    TEST_ASSERT(!h.sc->send_text("hello"), "text refused while CONNECTING");
    return true;
}

static bool test_text_round_trip_routing() {
    Harness h;
    const TransportHandle handle = h.open_session();

    TEST_ASSERT(h.sc->send_text("hi"), "text sent");
    TEST_ASSERT(h.transport.count_sent(MessageKind::TEXT) == 1, "one text on the wire");
    TEST_ASSERT(h.transport.sent_handles.back() == handle, "sent on the session handle");

    h.sc->dispatch(TransportData{handle, Envelope::text("ABC123", "hello back")});
    TEST_ASSERT(h.sc->messages().size() == 2, "local copy and received message");
    TEST_ASSERT(h.received == 2, "message callbacks");

    h.sc->dispatch(TransportData{handle, Envelope::text("IMPOST", "spoof")});
    TEST_ASSERT(h.sc->messages().size() == 2, "foreign sender dropped");

    h.sc->dispatch(TransportData{handle, Envelope::text("ABC123", "")});
    TEST_ASSERT(h.sc->messages().size() == 2, "malformed envelope dropped");
    return true;
}

static bool test_file_send_is_paced() {
    LinkSettings settings;
    settings.chunk_size = 4;
    settings.pace_batch = 2;
    settings.pace_delay_ms = 5;
    Harness h(settings);
    h.open_session();

    TEST_ASSERT(h.sc->send_file("a.png", Bytes{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}), "file accepted");
    TEST_ASSERT(h.messages_of(MessageKind::IMAGE) == 1, "local copy appended immediately");
    TEST_ASSERT(h.transport.count_sent(MessageKind::CHUNK) == 2, "first batch only");
    TEST_ASSERT(h.progress.size() == 1, "progress entry exists");
    TEST_ASSERT(h.sc->transfers().outbound_count() == 1, "transfer pending");

    h.loop.runUntilIdle(EventLoop::Clock::now() + 1s);
    TEST_ASSERT(h.transport.count_sent(MessageKind::CHUNK) == 3, "remaining chunk sent after pace delay");
    TEST_ASSERT(h.progress.empty(), "progress entry removed when done");
    TEST_ASSERT(h.sc->transfers().outbound_count() == 0, "transfer finished");

    uint32_t expected_index = 0;
    for (const auto& chunk : h.transport.sent) {
        if (chunk.kind() != MessageKind::CHUNK) continue;
        TEST_ASSERT(chunk.chunk_index() == expected_index, "chunks in index order");
        TEST_ASSERT(chunk.total_chunks() == std::optional<uint32_t>(3), "total on every chunk");
        expected_index++;
    }
    return true;
}

static bool test_disconnect_abandons_outbound_transfer() {
    LinkSettings settings;
    settings.chunk_size = 4;
    settings.pace_batch = 1;
    Harness h(settings);
    h.open_session();

    h.sc->send_file("clip.mp4", Bytes(20, 7));
    TEST_ASSERT(h.transport.count_sent(MessageKind::CHUNK) == 1, "one chunk before yielding");

    h.sc->disconnect();
    TEST_ASSERT(h.sc->state() == ConnectionState::DISCONNECTED, "DISCONNECTED");
    TEST_ASSERT(h.sc->messages().empty(), "local disconnect clears the stream");
    TEST_ASSERT(h.cleared == 1, "clear callback");
    TEST_ASSERT(h.progress.empty(), "transfer progress removed");

    h.loop.runUntilIdle(EventLoop::Clock::now() + 1s);
    TEST_ASSERT(h.transport.count_sent(MessageKind::CHUNK) == 1, "no chunk after disconnect");
    return true;
}

static bool test_remote_close_discards_partial_inbound() {
    Harness h;
    const TransportHandle handle = h.open_session();

    for (uint32_t i = 0; i < 6; ++i) {
        h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-10", i, 10, Bytes(100, 1), "big.png")});
    }
    TEST_ASSERT(h.progress.count("t-10") == 1 && h.progress["t-10"] == 60, "partial progress entry");
    TEST_ASSERT(h.sc->transfers().inbound_count() == 1, "partial transfer tracked");

    h.sc->dispatch(TransportClosed{handle});
    TEST_ASSERT(h.sc->state() == ConnectionState::DISCONNECTED, "remote close -> DISCONNECTED");
    TEST_ASSERT(h.progress.empty(), "progress entry removed");
    TEST_ASSERT(h.sc->transfers().inbound_count() == 0, "partial transfer dropped");
    TEST_ASSERT(h.messages_of(MessageKind::IMAGE) == 0, "no completed image appended");
    TEST_ASSERT(!h.transport.was_closed(handle), "peer-closed handle not closed again");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::ERROR) == 0, "remote close is not an error");

    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-10", 6, 10, Bytes(100, 1), "big.png")});
    TEST_ASSERT(h.progress.empty(), "late chunk ignored");
    return true;
}

static bool test_inbound_file_completes() {
    Harness h;
    const TransportHandle handle = h.open_session();

    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-2", 1, 2, Bytes{3, 4}, "pic.jpg")});
    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-2", 0, 2, Bytes{1, 2}, "pic.jpg")});

    TEST_ASSERT(h.messages_of(MessageKind::IMAGE) == 1, "completed image appended");
    const Envelope& image = h.sc->messages().back();
    TEST_ASSERT(image.binary() && *image.binary() == (Bytes{1, 2, 3, 4}), "bytes in index order");
    TEST_ASSERT(image.sender_id() == "ABC123", "sender preserved");
    TEST_ASSERT(h.progress.empty(), "progress entry removed");
    return true;
}

static bool test_inbound_chunk_limits_from_settings() {
    LinkSettings settings;
    settings.chunk_size = 16;
    settings.max_transfer_bytes = 64;
    settings.max_inbound_transfers = 1;
    Harness h(settings);
    const TransportHandle handle = h.open_session();

    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-big", 0, 5, Bytes(16, 1), "a.png")});
    TEST_ASSERT(h.sc->transfers().inbound_count() == 0, "totalChunks over the size limit dropped");
    TEST_ASSERT(h.progress.empty(), "no progress entry for a dropped chunk");

    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-1", 0, 2, Bytes(16, 1), "a.png")});
    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-2", 0, 2, Bytes(16, 2), "b.png")});
    TEST_ASSERT(h.sc->transfers().inbound_count() == 1, "second open transfer refused");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::WARNING) == 2, "each refusal logged");

    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-1", 1, 2, Bytes(16, 1), "a.png")});
    TEST_ASSERT(h.messages_of(MessageKind::IMAGE) == 1, "open transfer completes");
    h.sc->dispatch(TransportData{handle, Envelope::chunk("ABC123", "t-1", 0, 2, Bytes(16, 1), "a.png")});
    TEST_ASSERT(h.sc->transfers().inbound_count() == 0, "late re-delivery opens nothing");
    TEST_ASSERT(h.progress.empty(), "no progress after completion");
    TEST_ASSERT(h.messages_of(MessageKind::IMAGE) == 1, "no second image");
    return true;
}

static bool test_error_then_retry() {
    Harness h;
    h.sc->connect("ABC123");
    const TransportHandle attempt = h.sc->handle();

    h.sc->dispatch(TransportError{attempt, TransportErrorKind::PEER_UNAVAILABLE, "no such peer"});
    TEST_ASSERT(h.sc->state() == ConnectionState::ERROR, "ERROR");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::ERROR) == 1, "one error entry");
    TEST_ASSERT(h.loop.scheduledEventCount() == 0, "timers cancelled");

    TEST_ASSERT(h.sc->retry(), "retry accepted");
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTING, "CONNECTING again");
    TEST_ASSERT(h.transport.connect_targets.size() == 2, "second attempt issued");
    TEST_ASSERT(h.transport.connect_targets[1] == "ABC123", "same target");

    h.sc->dispatch(TransportOpened{h.sc->handle()});
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "retry succeeded");
    TEST_ASSERT(!h.sc->retry(), "retry refused while CONNECTED");
    return true;
}

static bool test_close_before_open_is_error() {
    Harness h;
    h.sc->connect("ABC123");
    h.sc->dispatch(TransportClosed{h.sc->handle()});
    TEST_ASSERT(h.sc->state() == ConnectionState::ERROR, "ERROR");
    TEST_ASSERT(h.sc->event_log().count(LogLevel::ERROR) == 1, "one error entry");
    return true;
}

static bool test_disconnect_when_disconnected_is_noop() {
    Harness h;
    h.sc->disconnect();
    TEST_ASSERT(h.sc->state() == ConnectionState::DISCONNECTED, "DISCONNECTED");
    TEST_ASSERT(h.states.empty(), "no state callback");
    TEST_ASSERT(h.cleared == 0, "nothing cleared");
    TEST_ASSERT(h.transport.closed.empty(), "nothing closed");
    return true;
}

static bool test_stale_timeout_ignored_after_reconnect() {
    Harness h;
    const auto t0 = EventLoop::Clock::now();
    h.sc->connect("ABC123");
    h.sc->dispatch(TransportOpened{h.sc->handle()});

    // A timeout event from the finished attempt arrives late.
    h.sc->dispatch(ConnectTimeoutExpired{1});
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "stale timeout ignored");

    h.loop.runUntilIdle(t0 + 60s);
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTED, "no timer fires on a live session");
    return true;
}

static bool test_requests_through_dispatch() {
    Harness h;
    h.loop.pushEvent(ConnectRequest{"ABC123"});
    h.loop.processPendingEvents();
    TEST_ASSERT(h.sc->state() == ConnectionState::CONNECTING, "connect request dispatched");

    h.loop.pushEvent(TransportOpened{h.sc->handle()});
    h.loop.pushEvent(SendTextRequest{"queued"});
    h.loop.processPendingEvents();
    TEST_ASSERT(h.transport.count_sent(MessageKind::TEXT) == 1, "queued send after open");

    h.loop.pushEvent(DisconnectRequest{});
    h.loop.processPendingEvents();
    TEST_ASSERT(h.sc->state() == ConnectionState::DISCONNECTED, "disconnect dispatched");
    return true;
}

static bool test_disconnect_ends_call_and_releases_media() {
    Harness h;
    const TransportHandle handle = h.open_session();

    TEST_ASSERT(h.sc->start_call(), "call started");
    TEST_ASSERT(h.transport.count_sent(MessageKind::CALL_REQUEST) == 1, "request sent in-band");

    h.sc->dispatch(TransportData{handle, Envelope::call_response("ABC123", CallDecision::ACCEPT)});
    TEST_ASSERT(h.devices.requests.size() == 1, "media requested after accept");
    h.sc->dispatch(h.devices.grant(h.devices.last_request()));
    TEST_ASSERT(h.sc->call().phase() == CallPhase::ACTIVE, "call ACTIVE");
    TEST_ASSERT(h.media.called_peers.size() == 1 && h.media.called_peers[0] == "ABC123", "media call placed");

    h.sc->disconnect();
    TEST_ASSERT(h.sc->call().phase() == CallPhase::IDLE, "call ended with session");
    TEST_ASSERT(h.devices.stops == 1, "local media released once");
    TEST_ASSERT(h.media.closed.size() == 1 && h.media.closed[0] == 100, "media call closed");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- SessionController tests ---" << std::endl;

    RUN_TEST(test_connect_timeout_enters_error, "connect timeout enters ERROR");
    RUN_TEST(test_open_connects_and_cancels_timer, "open connects");
    RUN_TEST(test_invalid_and_self_connect, "invalid and self connect");
    RUN_TEST(test_inbound_replaces_existing_session, "inbound replaces existing session");
    RUN_TEST(test_inbound_during_outbound_attempt, "inbound during outbound attempt");
    RUN_TEST(test_send_requires_connection, "send requires connection");
    RUN_TEST(test_text_round_trip_routing, "text routing");
    RUN_TEST(test_file_send_is_paced, "paced file send");
    RUN_TEST(test_disconnect_abandons_outbound_transfer, "disconnect abandons transfer");
    RUN_TEST(test_remote_close_discards_partial_inbound, "remote close discards partial inbound");
    RUN_TEST(test_inbound_file_completes, "inbound file completes");
    RUN_TEST(test_inbound_chunk_limits_from_settings, "inbound chunk limits from settings");
    RUN_TEST(test_error_then_retry, "error then retry");
    RUN_TEST(test_close_before_open_is_error, "close before open");
    RUN_TEST(test_disconnect_when_disconnected_is_noop, "disconnect no-op");
    RUN_TEST(test_stale_timeout_ignored_after_reconnect, "stale timeout ignored");
    RUN_TEST(test_requests_through_dispatch, "requests through dispatch");
    RUN_TEST(test_disconnect_ends_call_and_releases_media, "disconnect ends call");

    return report_results("session_controller_test");
}
