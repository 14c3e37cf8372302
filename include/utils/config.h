#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

#include "infrastructure/error_handling.h"

namespace liarslie {
namespace utils {

struct NetworkSettings {
    uint32_t connectTimeoutMs = 3000;
    uint32_t ioTimeoutMs = 5000;
    uint32_t maxFrameSize = 4 * 1024 * 1024;
    uint32_t fanoutThreads = 16;
};

struct AgentSettings {
    std::string address = "127.0.0.1";
    uint16_t basePort = 5000;
};

struct GameSettings {
    std::string rosterPath = "agents.config";
    uint32_t spawnTimeoutMs = 5000;
    AgentSettings agent;
    NetworkSettings network;
};

struct LogSettings {
    std::string level = "info";
    std::string file;
    bool console = true;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;
    std::string getConfigPath() const;

    NetworkSettings getNetworkSettings() const;
    AgentSettings getAgentSettings() const;
    GameSettings getGameSettings() const;
    LogSettings getLogSettings() const;

    // Range checks on the typed settings; CONFIG_ERROR names the offending key.
    Result<void> validate() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
