/**
 * terminal_cli.cpp - Plain console front end
 *
 * Engine callbacks arrive on the nodes' loop threads; everything printed goes
 * through print_line() so prompt and event lines do not interleave mid-line.
 */

#include "terminal_cli.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

#define C_RESET      "\033[0m"
#define C_DIM        "\033[2m"
#define C_RED        "\033[31m"
#define C_GREEN      "\033[32m"
#define C_YELLOW     "\033[33m"
#define C_CYAN       "\033[36m"
#define C_BRED       "\033[91m"
#define C_BGREEN     "\033[92m"
#define C_BYELLOW    "\033[93m"

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

static std::string format_time(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour << ":"
        << std::setw(2) << tm.tm_min << ":" << std::setw(2) << tm.tm_sec;
    return oss.str();
}

static std::string format_time_ms(int64_t millis) {
    return format_time(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
}

static std::string describe_message(const Envelope& message) {
    std::string body;
    switch (message.kind()) {
        case MessageKind::TEXT:
        case MessageKind::SYSTEM:
            body = message.text() ? *message.text() : std::string();
            break;
        case MessageKind::IMAGE:
        case MessageKind::VIDEO_FILE:
            body = std::string(message.kind() == MessageKind::IMAGE ? "[image] " : "[file] ") +
                   message.file_name().value_or("?") + " (" + std::to_string(message.content_size()) + " bytes)";
            break;
        default:
            body = std::string("[") + message_kind_to_string(message.kind()) + "]";
            break;
    }
    return "[" + format_time_ms(message.timestamp_ms()) + "] " + message.sender_id() + ": " + body;
}

static const char* severity_color(LogLevel severity) {
    switch (severity) {
        case LogLevel::ERROR: return C_BRED;
        case LogLevel::WARNING: return C_BYELLOW;
        case LogLevel::INFO: return C_BGREEN;
        default: return C_DIM;
    }
}

static std::string trim_leading_space(std::string value) {
    if (!value.empty() && value[0] == ' ') value = value.substr(1);
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════
// LIFECYCLE
// ═══════════════════════════════════════════════════════════════════════════

TerminalCLI::TerminalCLI(LinkNode& node, LinkNode* demo_peer)
    : node(node), demo_peer(demo_peer), running(false), log_filter_level(CLILogLevel::INFO) {
    attach(node, "");
    if (demo_peer) {
        attach(*demo_peer, "@" + demo_peer->getPeerId() + " ");
    }
}

TerminalCLI::~TerminalCLI() {
    node.clearEventCallbacks();
    if (demo_peer) {
        demo_peer->clearEventCallbacks();
    }
}

void TerminalCLI::attach(LinkNode& target, const std::string& label) {
    target.setEventCallbacks(
        [this, label](const Envelope& message) {
            print_line(label + C_CYAN + describe_message(message) + C_RESET);
        },
        [this, label](const LogEntry& entry) {
            if (!should_show(entry.severity)) return;
            print_line(label + severity_color(entry.severity) + "[" + format_time(entry.time) + "] " +
                       entry.message + C_RESET);
        },
        [this, label](ConnectionState state, const std::string& peer_id) {
            print_line(label + C_DIM + "state: " + ConnectionStateMachine::state_to_string(state) +
                       (peer_id.empty() ? "" : " (" + peer_id + ")") + C_RESET);
        },
        [this, label](CallPhase phase, CallRole role) {
            std::string line = label + C_DIM + "call: " + call_phase_to_string(phase);
            if (role != CallRole::NONE) line += std::string(" as ") + call_role_to_string(role);
            if (phase == CallPhase::INCOMING) line += std::string(C_RESET) + C_YELLOW + "  (answer / reject)";
            print_line(line + C_RESET);
        });
}

void TerminalCLI::run() {
    running = true;
    std::cout << "P2PLink (plain mode). Peer ID: " << node.getPeerId()
              << ". Type 'help' for commands. Ctrl-D to exit." << std::endl;

    std::string line;
    while (running) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "p2plink> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        process_command(line);
    }

    std::cout << "Goodbye!" << std::endl;
}

void TerminalCLI::stop() {
    running = false;
}

void TerminalCLI::print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line << std::endl;
}

bool TerminalCLI::should_show(LogLevel severity) const {
    switch (severity) {
        case LogLevel::ERROR: return log_filter_level.load() >= CLILogLevel::ERROR;
        case LogLevel::WARNING: return log_filter_level.load() >= CLILogLevel::WARNING;
        case LogLevel::INFO: return log_filter_level.load() >= CLILogLevel::INFO;
        case LogLevel::DEBUG: return log_filter_level.load() >= CLILogLevel::DEBUG;
        case LogLevel::NONE: return false;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// COMMANDS
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::process_command(const std::string& input) {
    if (!input.empty() && input[0] == '@') {
        if (!demo_peer) {
            print_line(C_YELLOW "No demo peer running" C_RESET);
            return;
        }
        execute(*demo_peer, "@" + demo_peer->getPeerId(), input.substr(1));
        return;
    }
    execute(node, node.getPeerId(), input);
}

void TerminalCLI::execute(LinkNode& target, const std::string& label, const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        stop();
    } else if (cmd == "connect" || cmd == "c") {
        std::string peer_id;
        iss >> peer_id;
        if (peer_id.empty()) {
            print_line(C_YELLOW "Usage: connect <peer_id>" C_RESET);
            return;
        }
        target.connectToPeer(peer_id);
    } else if (cmd == "retry") {
        target.retry();
    } else if (cmd == "disconnect" || cmd == "dc") {
        target.disconnect();
    } else if (cmd == "send" || cmd == "msg" || cmd == "m") {
        std::string message;
        std::getline(iss, message);
        message = trim_leading_space(message);
        if (message.empty()) {
            print_line(C_YELLOW "Usage: send <text>" C_RESET);
            return;
        }
        target.sendText(message);
    } else if (cmd == "sendfile" || cmd == "file" || cmd == "f") {
        std::string path;
        std::getline(iss, path);
        cmd_send_file(target, trim_leading_space(path));
    } else if (cmd == "call") {
        target.startCall();
    } else if (cmd == "accept") {
        // Inbound session: the other node dials this one.
        LinkNode* other = &target == &node ? demo_peer : &node;
        if (!other) {
            print_line(C_YELLOW "No demo peer to accept a session from" C_RESET);
            return;
        }
        other->connectToPeer(target.getPeerId());
    } else if (cmd == "answer") {
        target.acceptCall();
    } else if (cmd == "reject" || cmd == "decline") {
        target.rejectCall();
    } else if (cmd == "hangup" || cmd == "end") {
        target.hangUp();
    } else if (cmd == "camera") {
        std::string value;
        iss >> value;
        target.setCameraAvailable(value != "off");
        print_line(label + " camera " + (value == "off" ? "off" : "on"));
    } else if (cmd == "reachable") {
        std::string value;
        iss >> value;
        target.setReachable(value != "off");
        print_line(label + " reachable " + (value == "off" ? "off" : "on"));
    } else if (cmd == "status" || cmd == "stat" || cmd == "s") {
        cmd_status(target, label);
    } else if (cmd == "messages" || cmd == "msgs") {
        cmd_messages(target);
    } else if (cmd == "log" || cmd == "l") {
        std::string count;
        iss >> count;
        cmd_log(target, count);
    } else if (cmd == "logfilter" || cmd == "lf") {
        std::string level;
        iss >> level;
        cmd_log_filter(level);
    } else if (!cmd.empty()) {
        print_line(C_YELLOW "Unknown: " + cmd + " (type 'help')" C_RESET);
    }
}

void TerminalCLI::cmd_help() {
    print_line(C_CYAN "═══════════ COMMANDS ═══════════" C_RESET);
    print_line(C_GREEN "connect" C_RESET " id   Open a session to peer id");
    print_line(C_GREEN "accept" C_RESET "       Take an inbound session from the other node");
    print_line(C_GREEN "retry" C_RESET "        Retry the last connect after an error");
    print_line(C_GREEN "disconnect" C_RESET "   Close the session");
    print_line(C_GREEN "send" C_RESET " text    Send a text message");
    print_line(C_GREEN "sendfile" C_RESET " p   Send a file (image or video by extension)");
    print_line(C_GREEN "call" C_RESET "         Ask the peer for a video call");
    print_line(C_GREEN "answer" C_RESET "       Accept an incoming call");
    print_line(C_GREEN "reject" C_RESET "       Decline an incoming call");
    print_line(C_GREEN "hangup" C_RESET "       End or cancel the call");
    print_line(C_GREEN "camera" C_RESET " on|off     Simulate camera availability");
    print_line(C_GREEN "reachable" C_RESET " on|off  Swallow inbound connects when off");
    print_line(C_GREEN "status" C_RESET "       Show session status");
    print_line(C_GREEN "messages" C_RESET "     Show the message stream");
    print_line(C_GREEN "log" C_RESET " [n]      Show the last n event log entries");
    print_line(C_YELLOW "logfilter" C_RESET " l  error/warn/info/debug/none");
    print_line(C_RED "quit" C_RESET "         Exit");
    if (demo_peer) {
        print_line(C_DIM "Prefix any command with '@' to run it on demo peer " + demo_peer->getPeerId() +
                   ", e.g. '@connect " + node.getPeerId() + "'" C_RESET);
    }
}

void TerminalCLI::cmd_status(LinkNode& target, const std::string& label) {
    const LinkNode::Status status = target.getStatus();
    print_line(C_CYAN "═══════════ STATUS " + label + " ═══════════" C_RESET);
    print_line("Peer ID:    " + status.peer_id);
    print_line(std::string("Engine:     ") + (target.isRunning() ? C_BGREEN "Running" : C_RED "Stopped") + C_RESET);
    print_line(std::string("Connection: ") + ConnectionStateMachine::state_to_string(status.state) +
               (status.remote_peer.empty() ? "" : " -> " + status.remote_peer));
    std::string call = std::string("Call:       ") + call_phase_to_string(status.call_phase);
    if (status.call_role != CallRole::NONE) call += std::string(" (") + call_role_to_string(status.call_role) + ")";
    if (status.remote_media) call += ", remote video attached";
    print_line(call);
    print_line("Messages:   " + std::to_string(status.message_count));
    for (const auto& [id, percent] : status.transfers) {
        print_line("Transfer:   " + id + " " + std::to_string(percent) + "%");
    }
    print_line("Log Filter: " + get_log_level_name(log_filter_level.load()));
}

void TerminalCLI::cmd_messages(LinkNode& target) {
    const auto messages = target.getMessages();
    if (messages.empty()) {
        print_line(C_DIM "(no messages)" C_RESET);
        return;
    }
    for (const auto& message : messages) {
        print_line(describe_message(message));
    }
}

void TerminalCLI::cmd_log(LinkNode& target, const std::string& count) {
    size_t limit = 20;
    if (!count.empty()) {
        try {
            limit = static_cast<size_t>(std::max(1, std::stoi(count)));
        } catch (const std::exception&) {
            print_line(C_YELLOW "Usage: log [n]" C_RESET);
            return;
        }
    }

    const auto entries = target.getLogEntries();
    const size_t start = entries.size() > limit ? entries.size() - limit : 0;
    for (size_t i = start; i < entries.size(); ++i) {
        const LogEntry& entry = entries[i];
        print_line(std::string(severity_color(entry.severity)) + "[" + format_time(entry.time) + "] " +
                   log_level_to_string(entry.severity) + " " + entry.message + C_RESET);
    }
}

void TerminalCLI::cmd_send_file(LinkNode& target, const std::string& path) {
    if (path.empty()) {
        print_line(C_YELLOW "Usage: sendfile <path>" C_RESET);
        return;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        print_line(C_RED "Cannot open " + path + C_RESET);
        return;
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (data.empty()) {
        print_line(C_YELLOW "Refusing to send an empty file" C_RESET);
        return;
    }

    const size_t slash = path.find_last_of('/');
    const std::string file_name = slash == std::string::npos ? path : path.substr(slash + 1);
    print_line(C_DIM "Sending " + file_name + " (" + std::to_string(data.size()) + " bytes)" C_RESET);
    target.sendFile(file_name, std::move(data));
}

void TerminalCLI::cmd_log_filter(const std::string& level) {
    std::string lvl = level;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);

    if (lvl.empty()) {
        print_line("Current: " + get_log_level_name(log_filter_level.load()));
        return;
    }

    if (lvl == "error" || lvl == "e") log_filter_level = CLILogLevel::ERROR;
    else if (lvl == "warn" || lvl == "warning" || lvl == "w") log_filter_level = CLILogLevel::WARNING;
    else if (lvl == "info" || lvl == "i") log_filter_level = CLILogLevel::INFO;
    else if (lvl == "debug" || lvl == "d" || lvl == "all" || lvl == "a") log_filter_level = CLILogLevel::DEBUG;
    else if (lvl == "none" || lvl == "off" || lvl == "n") log_filter_level = CLILogLevel::NONE;
    else {
        print_line(C_YELLOW "Use: error, warn, info, debug, none" C_RESET);
        return;
    }

    print_line(C_BGREEN "Filter: " + get_log_level_name(log_filter_level.load()) + C_RESET);
}

std::string TerminalCLI::get_log_level_name(CLILogLevel level) const {
    switch (level) {
        case CLILogLevel::NONE: return "NONE";
        case CLILogLevel::ERROR: return "ERROR";
        case CLILogLevel::WARNING: return "WARN";
        case CLILogLevel::INFO: return "INFO";
        case CLILogLevel::DEBUG: return "DEBUG";
    }
    return "?";
}
