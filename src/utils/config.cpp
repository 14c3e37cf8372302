#include "utils/config.h"
#include "utils/logger.h"
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace liarslie {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    mutable std::mutex mtx;
};

static void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("agent.address", "127.0.0.1");
    set("agent.base_port", 5000);

    set("game.roster_path", "agents.config");
    set("game.spawn_timeout_ms", 5000);

    set("network.connect_timeout_ms", 3000);
    set("network.io_timeout_ms", 5000);
    set("network.max_frame_size", 4 * 1024 * 1024);
    set("network.fanout_threads", 16);

    set("log.level", "info");
    set("log.file", "");
    set("log.console", true);
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        lineNo++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            LOG_WARN("config " + path + ":" + std::to_string(lineNo) + ": ignoring line without '='");
            continue;
        }
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);
        impl_->data[key] = value;
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stod(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

NetworkSettings Config::getNetworkSettings() const {
    NetworkSettings cfg;
    cfg.connectTimeoutMs = static_cast<uint32_t>(getInt64("network.connect_timeout_ms", 3000));
    cfg.ioTimeoutMs = static_cast<uint32_t>(getInt64("network.io_timeout_ms", 5000));
    cfg.maxFrameSize = static_cast<uint32_t>(getInt64("network.max_frame_size", 4 * 1024 * 1024));
    cfg.fanoutThreads = static_cast<uint32_t>(getInt64("network.fanout_threads", 16));
    return cfg;
}

AgentSettings Config::getAgentSettings() const {
    AgentSettings cfg;
    cfg.address = getString("agent.address", "127.0.0.1");
    cfg.basePort = static_cast<uint16_t>(getInt("agent.base_port", 5000));
    return cfg;
}

GameSettings Config::getGameSettings() const {
    GameSettings cfg;
    cfg.rosterPath = getString("game.roster_path", "agents.config");
    cfg.spawnTimeoutMs = static_cast<uint32_t>(getInt64("game.spawn_timeout_ms", 5000));
    cfg.agent = getAgentSettings();
    cfg.network = getNetworkSettings();
    return cfg;
}

LogSettings Config::getLogSettings() const {
    LogSettings cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", true);
    return cfg;
}

Result<void> Config::validate() const {
    auto inRange = [this](const std::string& key, int64_t lo, int64_t hi) {
        int64_t v = getInt64(key, lo - 1);
        return v >= lo && v <= hi;
    };
    LIARSLIE_CHECK(inRange("agent.base_port", 1, 65535), ErrorCode::CONFIG_ERROR,
                   "agent.base_port must be within [1, 65535]");
    LIARSLIE_CHECK(inRange("game.spawn_timeout_ms", 1, 600000), ErrorCode::CONFIG_ERROR,
                   "game.spawn_timeout_ms must be positive");
    LIARSLIE_CHECK(inRange("network.connect_timeout_ms", 1, 600000), ErrorCode::CONFIG_ERROR,
                   "network.connect_timeout_ms must be positive");
    LIARSLIE_CHECK(inRange("network.io_timeout_ms", 1, 600000), ErrorCode::CONFIG_ERROR,
                   "network.io_timeout_ms must be positive");
    LIARSLIE_CHECK(inRange("network.max_frame_size", 16, 1LL << 30), ErrorCode::CONFIG_ERROR,
                   "network.max_frame_size out of range");
    LIARSLIE_CHECK(inRange("network.fanout_threads", 1, 1024), ErrorCode::CONFIG_ERROR,
                   "network.fanout_threads must be within [1, 1024]");
    LIARSLIE_CHECK(!getString("agent.address", "").empty(), ErrorCode::CONFIG_ERROR,
                   "agent.address must not be empty");
    LogLevel level;
    LIARSLIE_CHECK(Logger::parseLevel(getString("log.level", "info"), level), ErrorCode::CONFIG_ERROR,
                   "log.level is not a known level");
    return {};
}

}
}
