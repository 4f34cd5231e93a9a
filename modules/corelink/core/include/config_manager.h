#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

using json = nlohmann::json;

// Snapshot of every tunable the link layer reads. Passed explicitly to the
// session controller so no component reads the config singleton at runtime.
struct LinkSettings {
    int identity_length = 6;
    uint32_t chunk_size = 16 * 1024;
    uint32_t pace_batch = 8;
    int pace_delay_ms = 5;
    uint64_t max_transfer_bytes = 64ull * 1024 * 1024;
    size_t max_inbound_transfers = 8;
    int connect_timeout_ms = 15000;
    int retry_interval_ms = 5000;
    size_t event_log_capacity = 200;
    std::string log_level = "info";
};

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadConfigFromString(const std::string& text);

    // Drops every loaded value; getters fall back to their defaults.
    void reset();

    // Creates intermediate objects as needed, e.g. setValueAtPath({"session", "connect_timeout_ms"}, 1000).
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    // Identity
    int getIdentityLength() const;

    // Transfer
    uint32_t getChunkSize() const;
    uint32_t getPaceBatch() const;
    int getPaceDelayMs() const;
    uint64_t getMaxTransferBytes() const;
    size_t getMaxInboundTransfers() const;

    // Session
    int getConnectTimeoutMs() const;
    int getRetryIntervalMs() const;

    // Logging
    std::string getLogLevel() const;
    size_t getEventLogCapacity() const;

    LinkSettings getLinkSettings() const;

private:
    ConfigManager() = default;

    int getInt(const std::vector<std::string>& path, int fallback, int min_value) const;
    std::string getString(const std::vector<std::string>& path, const std::string& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
