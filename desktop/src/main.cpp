#include "link_node.h"
#include "loopback_transport.h"
#include "terminal_cli.h"
#include "config_manager.h"
#include "identity.h"
#include "logger.h"
#include <filesystem>
#include <iostream>
#include <signal.h>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --id ID         Set explicit peer id (upper-cased; default: random)\n"
              << "  --config FILE   Path to configuration file (default: config.json)\n"
              << "  --log-level LVL Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --help          Show this help message\n"
              << "\nInteractive CLI (after startup):\n"
              << "  A second demo node runs on the same in-process network.\n"
              << "  Type 'help' to see commands; prefix a command with '@' to run it on the demo node.\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    std::string custom_peer_id;
    std::string config_path = "config.json";
    bool explicit_config = false;
    std::string requested_log_level;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
                explicit_config = true;
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--id") {
            if (i + 1 < argc) {
                custom_peer_id = argv[++i];
            } else {
                std::cerr << "Error: --id requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                requested_log_level = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration. An explicit --config must load; otherwise fall back
    // to the usual locations relative to the working directory and binary.
    ConfigManager& config = ConfigManager::getInstance();
    if (explicit_config) {
        if (!config.loadConfig(config_path)) {
            std::cerr << "CRITICAL ERROR: Failed to load configuration: " << config_path << std::endl;
            return 1;
        }
    } else {
        std::vector<std::string> candidates;
        candidates.push_back(config_path);
        candidates.push_back("../config.json");
        candidates.push_back("../../config.json");

        std::error_code ec;
        const std::filesystem::path exe_dir = std::filesystem::absolute(argv[0], ec).parent_path();
        if (!ec) {
            candidates.push_back((exe_dir / "config.json").string());
            candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
        }

        std::string chosen_config;
        for (const auto& c : candidates) {
            if (std::filesystem::exists(c, ec) && config.loadConfig(c)) {
                chosen_config = c;
                break;
            }
        }
        if (chosen_config.empty()) {
            std::cerr << "Warning: no config.json found, using built-in defaults" << std::endl;
        }
    }

    const LinkSettings settings = config.getLinkSettings();
    const std::string level_name = requested_log_level.empty() ? settings.log_level : requested_log_level;
    set_log_level(parse_log_level(level_name, LogLevel::INFO));

    std::string peer_id;
    if (custom_peer_id.empty()) {
        peer_id = generate_peer_id(static_cast<size_t>(settings.identity_length));
    } else {
        peer_id = normalize_peer_id(custom_peer_id);
        if (!is_valid_peer_id(peer_id)) {
            std::cerr << "Error: --id must be letters and digits only" << std::endl;
            return 1;
        }
    }
    setSessionId(peer_id);

    std::string demo_id;
    do {
        demo_id = generate_peer_id(static_cast<size_t>(settings.identity_length));
    } while (demo_id == peer_id);

    nativeLog("MAIN: Starting link node, peer_id=" + peer_id + ", demo peer=" + demo_id);

    LoopbackNetwork network;
    LinkNode node(network);
    LinkNode demo(network);

    if (!node.start(peer_id, settings)) {
        std::cerr << "Error: Failed to start link node" << std::endl;
        return 1;
    }
    if (!demo.start(demo_id, settings)) {
        std::cerr << "Error: Failed to start demo node" << std::endl;
        return 1;
    }

    {
        TerminalCLI cli(node, &demo);
        cli.run();
    }

    demo.stop();
    node.stop();
    return 0;
}
