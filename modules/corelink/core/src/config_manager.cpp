#include "config_manager.h"
#include "logger.h"
#include <fstream>
#include <iostream>
#include <limits>

namespace {

const json* find_path(const json& root, const std::vector<std::string>& path) {
    const json* node = &root;
    for (const auto& key : path) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(key);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (const auto& key : path) {
        if (!out.empty()) out += ".";
        out += key;
    }
    return out;
}

} // namespace

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "ERROR: Failed to open config file: " << config_path << std::endl;
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            std::cerr << "ERROR: Config root must be an object: " << config_path << std::endl;
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Config loading failed: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadConfigFromString(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_WARN("CFG: Rejected malformed config text");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = std::move(parsed);
    return true;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            if (!child.is_null()) {
                return false;
            }
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

int ConfigManager::getInt(const std::vector<std::string>& path, int fallback, int min_value) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = find_path(m_config, path);
    if (!node) return fallback;
    if (!node->is_number_integer()) {
        LOG_WARN("CFG: " + join_path(path) + " is not an integer, using default " + std::to_string(fallback));
        return fallback;
    }
    const auto v = node->get<int64_t>();
    if (v < min_value || v > std::numeric_limits<int>::max()) {
        LOG_WARN("CFG: " + join_path(path) + " out of range, using default " + std::to_string(fallback));
        return fallback;
    }
    return static_cast<int>(v);
}

std::string ConfigManager::getString(const std::vector<std::string>& path, const std::string& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = find_path(m_config, path);
    if (!node || !node->is_string()) return fallback;
    return node->get<std::string>();
}

int ConfigManager::getIdentityLength() const {
    return getInt({"identity", "length"}, 6, 4);
}

uint32_t ConfigManager::getChunkSize() const {
    return static_cast<uint32_t>(getInt({"transfer", "chunk_size"}, 16 * 1024, 1));
}

uint32_t ConfigManager::getPaceBatch() const {
    return static_cast<uint32_t>(getInt({"transfer", "pace_batch"}, 8, 1));
}

int ConfigManager::getPaceDelayMs() const {
    return getInt({"transfer", "pace_delay_ms"}, 5, 0);
}

uint64_t ConfigManager::getMaxTransferBytes() const {
    return static_cast<uint64_t>(getInt({"transfer", "max_transfer_bytes"}, 64 * 1024 * 1024, 1));
}

size_t ConfigManager::getMaxInboundTransfers() const {
    return static_cast<size_t>(getInt({"transfer", "max_inbound_transfers"}, 8, 1));
}

int ConfigManager::getConnectTimeoutMs() const {
    return getInt({"session", "connect_timeout_ms"}, 15000, 1);
}

int ConfigManager::getRetryIntervalMs() const {
    return getInt({"session", "retry_interval_ms"}, 5000, 0);
}

std::string ConfigManager::getLogLevel() const {
    return getString({"logging", "level"}, "info");
}

size_t ConfigManager::getEventLogCapacity() const {
    return static_cast<size_t>(getInt({"logging", "event_log_capacity"}, 200, 1));
}

LinkSettings ConfigManager::getLinkSettings() const {
    LinkSettings settings;
    settings.identity_length = getIdentityLength();
    settings.chunk_size = getChunkSize();
    settings.pace_batch = getPaceBatch();
    settings.pace_delay_ms = getPaceDelayMs();
    settings.max_transfer_bytes = getMaxTransferBytes();
    settings.max_inbound_transfers = getMaxInboundTransfers();
    settings.connect_timeout_ms = getConnectTimeoutMs();
    settings.retry_interval_ms = getRetryIntervalMs();
    settings.event_log_capacity = getEventLogCapacity();
    settings.log_level = getLogLevel();
    return settings;
}
