#include "event_loop.h"
#include "link_node.h"
#include "logger.h"
#include "loopback_transport.h"
#include "session_controller.h"
#include "test_fakes.h"

#include <chrono>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// One endpoint on the loopback network, pumped by hand from the test thread.
struct Side {
    EventLoop loop;
    LoopbackEndpoint endpoint;
    std::map<std::string, int> last_progress;
    SessionController controller;

    Side(LoopbackNetwork& network, const std::string& id, const LinkSettings& settings)
        : endpoint(network, id, loop),
          controller(id, settings, loop, endpoint, endpoint, endpoint, make_callbacks()) {
        loop.setHandler([this](LinkEvent event) { controller.dispatch(std::move(event)); });
    }

    LinkCallbacks make_callbacks() {
        LinkCallbacks callbacks;
        callbacks.on_transfer_progress = [this](const std::string& id, int percent) { last_progress[id] = percent; };
        return callbacks;
    }
};

static LinkSettings fast_settings() {
    LinkSettings s;
    s.chunk_size = 1024;
    s.pace_batch = 2;
    s.pace_delay_ms = 0;
    return s;
}

static void pump(std::initializer_list<Side*> sides, EventLoop::Clock::time_point now = EventLoop::Clock::now()) {
    for (int round = 0; round < 1000; ++round) {
        size_t handled = 0;
        for (Side* side : sides) {
            handled += side->loop.runUntilIdle(now);
        }
        if (handled == 0) return;
    }
}

static bool wait_until(const std::function<bool()>& condition) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

static bool test_connect_and_exchange_text() {
    LoopbackNetwork network;
    Side a(network, "AAAAAA", fast_settings());
    Side b(network, "BBBBBB", fast_settings());

    TEST_ASSERT(a.controller.connect("bbbbbb"), "connect accepted");
    TEST_ASSERT(a.controller.state() == ConnectionState::CONNECTING, "CONNECTING");
    pump({&a, &b});

    TEST_ASSERT(a.controller.state() == ConnectionState::CONNECTED, "A CONNECTED");
    TEST_ASSERT(b.controller.state() == ConnectionState::CONNECTED, "B CONNECTED by inbound session");
    TEST_ASSERT(a.controller.peer_id() == "BBBBBB" && b.controller.peer_id() == "AAAAAA", "peers recorded");
    TEST_ASSERT(network.openLinkCount() == 1, "one link");

    TEST_ASSERT(a.controller.send_text("hello"), "A sends");
    pump({&a, &b});
    TEST_ASSERT(b.controller.send_text("hi back"), "B replies");
    pump({&a, &b});

    TEST_ASSERT(a.controller.messages().size() == 2, "A sees both messages");
    TEST_ASSERT(b.controller.messages().size() == 2, "B sees both messages");
    const Envelope& received = b.controller.messages()[0];
    TEST_ASSERT(received.sender_id() == "AAAAAA", "sender preserved across the wire");
    TEST_ASSERT(received.text() && *received.text() == "hello", "text preserved across the wire");
    TEST_ASSERT(received.id() == a.controller.messages()[0].id(), "same envelope id on both sides");
    return true;
}

static bool test_file_transfer_end_to_end() {
    LoopbackNetwork network;
    Side a(network, "AAAAAA", fast_settings());
    Side b(network, "BBBBBB", fast_settings());
    a.controller.connect("BBBBBB");
    pump({&a, &b});

    Bytes data(5000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i * 7);

    TEST_ASSERT(a.controller.send_file("photo.PNG", data), "send accepted");
    pump({&a, &b});

    TEST_ASSERT(a.controller.transfers().outbound_count() == 0, "outbound finished");
    TEST_ASSERT(b.controller.transfers().inbound_count() == 0, "inbound reassembled");
    TEST_ASSERT(b.controller.messages().size() == 1, "one file message delivered");

    const Envelope& file = b.controller.messages()[0];
    TEST_ASSERT(file.kind() == MessageKind::IMAGE, "classified as image");
    TEST_ASSERT(file.file_name() && *file.file_name() == "photo.PNG", "file name kept");
    TEST_ASSERT(file.binary() && *file.binary() == data, "bytes identical");
    TEST_ASSERT(network.framesDelivered() == 5, "five chunks on the wire");
    TEST_ASSERT(!b.last_progress.empty() && b.last_progress.begin()->second == 100, "receiver reached 100%");
    return true;
}

static bool test_call_accept_and_hang_up() {
    LoopbackNetwork network;
    Side a(network, "AAAAAA", fast_settings());
    Side b(network, "BBBBBB", fast_settings());
    a.controller.connect("BBBBBB");
    pump({&a, &b});

    TEST_ASSERT(a.controller.start_call(), "call started");
    pump({&a, &b});
    TEST_ASSERT(b.controller.call().phase() == CallPhase::INCOMING, "B ringing");
    TEST_ASSERT(a.endpoint.mediaAcquired() == 0 && b.endpoint.mediaAcquired() == 0, "no media before accept");

    TEST_ASSERT(b.controller.accept_call(), "B accepts");
    pump({&a, &b});

    TEST_ASSERT(a.controller.call().phase() == CallPhase::ACTIVE, "A ACTIVE");
    TEST_ASSERT(b.controller.call().phase() == CallPhase::ACTIVE, "B ACTIVE");
    TEST_ASSERT(a.controller.call().remote_media().has_value(), "A has remote media");
    TEST_ASSERT(b.controller.call().remote_media().has_value(), "B has remote media");
    TEST_ASSERT(network.openMediaCallCount() == 1, "one media call");

    TEST_ASSERT(a.controller.hang_up(), "A hangs up");
    pump({&a, &b});

    TEST_ASSERT(a.controller.call().phase() == CallPhase::IDLE, "A IDLE");
    TEST_ASSERT(b.controller.call().phase() == CallPhase::IDLE, "B IDLE after media call closed");
    TEST_ASSERT(a.endpoint.mediaReleased() == 1 && b.endpoint.mediaReleased() == 1, "both released their media");
    TEST_ASSERT(network.openMediaCallCount() == 0, "media call torn down");
    TEST_ASSERT(a.controller.state() == ConnectionState::CONNECTED, "data session survives the call");
    return true;
}

static bool test_call_rejected_and_camera_denied() {
    LoopbackNetwork network;
    Side a(network, "AAAAAA", fast_settings());
    Side b(network, "BBBBBB", fast_settings());
    a.controller.connect("BBBBBB");
    pump({&a, &b});

    a.controller.start_call();
    pump({&a, &b});
    TEST_ASSERT(b.controller.reject_call(), "B rejects");
    pump({&a, &b});
    TEST_ASSERT(a.controller.call().phase() == CallPhase::IDLE, "A IDLE after reject");
    TEST_ASSERT(a.endpoint.mediaAcquired() == 0 && b.endpoint.mediaAcquired() == 0, "no media acquired");

    b.endpoint.setCameraAvailable(false);
    a.controller.start_call();
    pump({&a, &b});
    b.controller.accept_call();
    pump({&a, &b});
    TEST_ASSERT(b.controller.call().phase() == CallPhase::IDLE, "B IDLE after camera denied");
    TEST_ASSERT(a.controller.call().phase() == CallPhase::IDLE, "A told to stop waiting");
    TEST_ASSERT(b.controller.event_log().count(LogLevel::ERROR) == 1, "media failure logged");
    return true;
}

static bool test_unknown_peer_is_error() {
    LoopbackNetwork network;
    Side a(network, "AAAAAA", fast_settings());

    TEST_ASSERT(a.controller.connect("ZZZZZZ"), "attempt starts");
    pump({&a});
    TEST_ASSERT(a.controller.state() == ConnectionState::ERROR, "unavailable peer -> ERROR");
    TEST_ASSERT(a.controller.event_log().count(LogLevel::ERROR) == 1, "error entry");
    TEST_ASSERT(a.controller.target_peer() == "ZZZZZZ", "target kept for retry");
    return true;
}

static bool test_unreachable_times_out_then_retry_connects() {
    LoopbackNetwork network;
    LinkSettings settings = fast_settings();
    settings.connect_timeout_ms = 15000;
    settings.retry_interval_ms = 5000;
    Side a(network, "AAAAAA", settings);
    Side b(network, "BBBBBB", settings);

    b.endpoint.setReachable(false);
    const auto t0 = EventLoop::Clock::now();
    a.controller.connect("BBBBBB");
    pump({&a, &b}, t0);
    TEST_ASSERT(a.controller.state() == ConnectionState::CONNECTING, "still CONNECTING");

    pump({&a, &b}, t0 + 16s);
    TEST_ASSERT(a.controller.state() == ConnectionState::ERROR, "timed out");
    TEST_ASSERT(a.controller.connect_attempts() == 3, "re-issued on every retry interval");
    TEST_ASSERT(b.controller.state() == ConnectionState::DISCONNECTED, "B never saw a session");

    b.endpoint.setReachable(true);
    TEST_ASSERT(a.controller.retry(), "retry accepted");
    pump({&a, &b});
    TEST_ASSERT(a.controller.state() == ConnectionState::CONNECTED, "retry connects");
    TEST_ASSERT(b.controller.state() == ConnectionState::CONNECTED, "B accepted");
    return true;
}

static bool test_remote_disconnect_and_replacement() {
    LoopbackNetwork network;
    Side a(network, "AAAAAA", fast_settings());
    Side b(network, "BBBBBB", fast_settings());
    Side c(network, "CCCCCC", fast_settings());

    a.controller.connect("BBBBBB");
    pump({&a, &b, &c});
    a.controller.send_text("before");
    pump({&a, &b, &c});

    // C dials A while A is talking to B: A switches, B is closed.
    c.controller.connect("AAAAAA");
    pump({&a, &b, &c});
    TEST_ASSERT(a.controller.state() == ConnectionState::CONNECTED && a.controller.peer_id() == "CCCCCC",
                "A now with C");
    TEST_ASSERT(b.controller.state() == ConnectionState::DISCONNECTED, "B closed by peer");
    TEST_ASSERT(b.controller.messages().size() == 1, "remote close keeps B's messages");
    TEST_ASSERT(network.openLinkCount() == 1, "only the new link left");

    c.controller.disconnect();
    pump({&a, &b, &c});
    TEST_ASSERT(c.controller.state() == ConnectionState::DISCONNECTED, "C disconnected locally");
    TEST_ASSERT(c.controller.messages().empty(), "local disconnect clears C");
    TEST_ASSERT(a.controller.state() == ConnectionState::DISCONNECTED, "A saw the close");
    TEST_ASSERT(network.openLinkCount() == 0, "no links left");
    return true;
}

static bool test_link_nodes_on_threads() {
    LoopbackNetwork network;
    LinkNode a(network);
    LinkNode b(network);
    LinkSettings settings;
    settings.pace_delay_ms = 0;

    TEST_ASSERT(a.start("AAAAAA", settings), "A started");
    TEST_ASSERT(b.start("BBBBBB", settings), "B started");
    LinkNode dup(network);
    TEST_ASSERT(!dup.start("AAAAAA", settings), "duplicate id refused");

    a.connectToPeer("BBBBBB");
    TEST_ASSERT(wait_until([&]() { return b.getStatus().state == ConnectionState::CONNECTED; }), "B connected");
    TEST_ASSERT(wait_until([&]() { return a.getStatus().state == ConnectionState::CONNECTED; }), "A connected");

    a.sendText("over threads");
    TEST_ASSERT(wait_until([&]() { return b.getMessages().size() == 1; }), "message crossed threads");
    TEST_ASSERT(b.getStatus().remote_peer == "AAAAAA", "remote peer in snapshot");

    a.stop();
    b.stop();
    TEST_ASSERT(!a.isRunning() && !b.isRunning(), "stopped");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- Loopback integration tests ---" << std::endl;

    RUN_TEST(test_connect_and_exchange_text, "connect and exchange text");
    RUN_TEST(test_file_transfer_end_to_end, "file transfer end to end");
    RUN_TEST(test_call_accept_and_hang_up, "call accept and hang up");
    RUN_TEST(test_call_rejected_and_camera_denied, "call rejected and camera denied");
    RUN_TEST(test_unknown_peer_is_error, "unknown peer is an error");
    RUN_TEST(test_unreachable_times_out_then_retry_connects, "timeout then retry");
    RUN_TEST(test_remote_disconnect_and_replacement, "remote disconnect and replacement");
    RUN_TEST(test_link_nodes_on_threads, "link nodes on threads");

    return report_results("loopback_integration_test");
}
