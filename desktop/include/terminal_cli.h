/**
 * terminal_cli.h - Line-oriented console for a link node
 *
 * Drives the local node and, optionally, a second "demo" node living on the
 * same loopback network so both ends of a session can be exercised from one
 * terminal. Any command prefixed with '@' is executed by the demo node.
 */

#ifndef TERMINAL_CLI_H
#define TERMINAL_CLI_H

#include "link_node.h"

#include <atomic>
#include <mutex>
#include <string>

enum class CLILogLevel {
    NONE = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DEBUG = 4
};

class TerminalCLI {
public:
    TerminalCLI(LinkNode& node, LinkNode* demo_peer = nullptr);
    ~TerminalCLI();

    void run();
    void stop();

    void process_command(const std::string& input);

private:
    LinkNode& node;
    LinkNode* demo_peer;
    std::atomic<bool> running;
    std::atomic<CLILogLevel> log_filter_level;
    std::mutex output_mutex;

    void attach(LinkNode& target, const std::string& label);
    void print_line(const std::string& line);
    bool should_show(LogLevel severity) const;

    void execute(LinkNode& target, const std::string& label, const std::string& input);

    // Command handlers
    void cmd_help();
    void cmd_status(LinkNode& target, const std::string& label);
    void cmd_messages(LinkNode& target);
    void cmd_log(LinkNode& target, const std::string& count);
    void cmd_send_file(LinkNode& target, const std::string& path);
    void cmd_log_filter(const std::string& level);
    std::string get_log_level_name(CLILogLevel level) const;
};

#endif // TERMINAL_CLI_H
