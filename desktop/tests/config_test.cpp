#include "config_manager.h"
#include "event_log.h"
#include "logger.h"
#include "test_fakes.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::string find_repo_config_json_path() {
    namespace fs = std::filesystem;
    fs::path p = fs::current_path();
    // Walk upwards a few levels to find the repo root config.json.
    for (int i = 0; i < 8; ++i) {
        fs::path cand = p / "config.json";
        if (fs::exists(cand)) {
            return cand.string();
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return "config.json";
}

static bool test_defaults_without_config() {
    ConfigManager& cfg = ConfigManager::getInstance();
    cfg.reset();

    const LinkSettings s = cfg.getLinkSettings();
    TEST_ASSERT(s.identity_length == 6, "identity length default");
    TEST_ASSERT(s.chunk_size == 16384, "chunk size default");
    TEST_ASSERT(s.pace_batch == 8, "pace batch default");
    TEST_ASSERT(s.pace_delay_ms == 5, "pace delay default");
    TEST_ASSERT(s.max_transfer_bytes == 64ull * 1024 * 1024, "max transfer bytes default");
    TEST_ASSERT(s.max_inbound_transfers == 8, "max inbound transfers default");
    TEST_ASSERT(s.connect_timeout_ms == 15000, "connect timeout default");
    TEST_ASSERT(s.retry_interval_ms == 5000, "retry interval default");
    TEST_ASSERT(s.event_log_capacity == 200, "event log capacity default");
    TEST_ASSERT(s.log_level == "info", "log level default");
    return true;
}

static bool test_load_from_string_and_overrides() {
    ConfigManager& cfg = ConfigManager::getInstance();
    cfg.reset();

    TEST_ASSERT(cfg.loadConfigFromString(R"({"transfer": {"chunk_size": 1024}, "session": {"connect_timeout_ms": 2000}})"),
                "config text loads");
    TEST_ASSERT(cfg.getChunkSize() == 1024, "chunk size from config");
    TEST_ASSERT(cfg.getConnectTimeoutMs() == 2000, "timeout from config");
    TEST_ASSERT(cfg.getPaceBatch() == 8, "missing key keeps default");

    TEST_ASSERT(cfg.setValueAtPath({"transfer", "max_inbound_transfers"}, 2), "limit override applied");
    TEST_ASSERT(cfg.getLinkSettings().max_inbound_transfers == 2, "limit reaches link settings");
    TEST_ASSERT(cfg.setValueAtPath({"transfer", "max_transfer_bytes"}, 0), "zero limit stored");
    TEST_ASSERT(cfg.getMaxTransferBytes() == 64ull * 1024 * 1024, "zero limit falls back");

    TEST_ASSERT(cfg.setValueAtPath({"session", "retry_interval_ms"}, 0), "override applied");
    TEST_ASSERT(cfg.getRetryIntervalMs() == 0, "retry disabled by override");
    TEST_ASSERT(cfg.setValueAtPath({"logging", "level"}, "debug"), "nested override applied");
    TEST_ASSERT(cfg.getLogLevel() == "debug", "log level override");
    return true;
}

static bool test_invalid_values_fall_back() {
    ConfigManager& cfg = ConfigManager::getInstance();
    cfg.reset();

    TEST_ASSERT(cfg.loadConfigFromString(R"({"transfer": {"chunk_size": 0, "pace_batch": "many"}, "identity": {"length": 2}})"),
                "config text loads");
    TEST_ASSERT(cfg.getChunkSize() == 16384, "zero chunk size falls back");
    TEST_ASSERT(cfg.getPaceBatch() == 8, "non-integer batch falls back");
    TEST_ASSERT(cfg.getIdentityLength() == 6, "too-short identity falls back");

    TEST_ASSERT(!cfg.loadConfigFromString("{not json"), "malformed text rejected");
    TEST_ASSERT(!cfg.loadConfigFromString("[1, 2]"), "non-object root rejected");
    TEST_ASSERT(cfg.getChunkSize() == 16384, "previous config kept after rejection");
    return true;
}

static bool test_load_repo_config_file() {
    ConfigManager& cfg = ConfigManager::getInstance();
    cfg.reset();

    const std::string path = find_repo_config_json_path();
    if (!std::filesystem::exists(path)) {
        std::cout << "SKIP: repo config.json not reachable from " << std::filesystem::current_path() << std::endl;
        return true;
    }
    TEST_ASSERT(cfg.loadConfig(path), "repo config.json loads");
    TEST_ASSERT(cfg.getChunkSize() == 16384, "repo chunk size");
    TEST_ASSERT(cfg.getConnectTimeoutMs() == 15000, "repo connect timeout");

    TEST_ASSERT(!cfg.loadConfig("/nonexistent/p2plink/config.json"), "missing file reported");
    return true;
}

static bool test_event_log_ring() {
    EventLog log(3);
    std::vector<uint64_t> forwarded;
    log.set_entry_callback([&forwarded](const LogEntry& e) { forwarded.push_back(e.id); });

    log.info("one");
    log.warn("two");
    log.error("three");
    log.info("four");

    TEST_ASSERT(log.size() == 3, "capacity respected");
    const auto entries = log.entries();
    TEST_ASSERT(entries.front().message == "two", "oldest dropped");
    TEST_ASSERT(entries.back().message == "four", "newest last");
    TEST_ASSERT(entries.front().id < entries.back().id, "ids increase");
    TEST_ASSERT(log.count(LogLevel::ERROR) == 1, "severity count");
    TEST_ASSERT(forwarded.size() == 4, "every entry forwarded");

    bool threw = false;
    try {
        EventLog bad(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "zero capacity throws");
    return true;
}

static bool test_log_level_parsing() {
    TEST_ASSERT(parse_log_level("DEBUG") == LogLevel::DEBUG, "upper-case debug");
    TEST_ASSERT(parse_log_level("warn") == LogLevel::WARNING, "warn alias");
    TEST_ASSERT(parse_log_level("none") == LogLevel::NONE, "none");
    TEST_ASSERT(parse_log_level("bogus", LogLevel::ERROR) == LogLevel::ERROR, "fallback for unknown");

    std::vector<std::string> lines;
    setLogCallback([&lines](const std::string& line) { lines.push_back(line); });
    set_log_level(LogLevel::INFO);
    setSessionId("TEST01");
    LOG_DEBUG("hidden");
    LOG_INFO("shown");
    setLogCallback(nullptr);
    set_log_level(LogLevel::ERROR);

    TEST_ASSERT(lines.size() == 1, "debug filtered at INFO");
    TEST_ASSERT(lines[0].find("shown") != std::string::npos, "message forwarded");
    TEST_ASSERT(lines[0].find("TEST01") != std::string::npos, "session id prefixed");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- Config / logging tests ---" << std::endl;

    RUN_TEST(test_defaults_without_config, "defaults without config");
    RUN_TEST(test_load_from_string_and_overrides, "load from string and overrides");
    RUN_TEST(test_invalid_values_fall_back, "invalid values fall back");
    RUN_TEST(test_load_repo_config_file, "repo config.json");
    RUN_TEST(test_event_log_ring, "event log ring");
    RUN_TEST(test_log_level_parsing, "log level parsing");

    ConfigManager::getInstance().reset();
    return report_results("config_test");
}
