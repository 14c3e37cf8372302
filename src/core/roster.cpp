#include "core/roster.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace liarslie::core {

using json = nlohmann::json;

std::string rosterToJson(const std::vector<AgentDescriptor>& agents) {
    json out = json::array();
    for (const auto& a : agents) {
        json entry;
        entry["agent_id"] = a.agentId;
        entry["address"] = a.address;
        entry["port"] = a.port;
        entry["public_key"] = a.publicKey;
        out.push_back(entry);
    }
    return out.dump(2);
}

Result<std::vector<AgentDescriptor>> rosterFromJson(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return makeError(ErrorCode::DECODE_ERROR, "roster is not valid JSON");
    }
    if (!parsed.is_array()) {
        return makeError(ErrorCode::DECODE_ERROR, "roster must be a JSON array");
    }
    std::vector<AgentDescriptor> agents;
    for (const auto& entry : parsed) {
        if (!entry.is_object() ||
            !entry.contains("agent_id") || !entry["agent_id"].is_number_unsigned() ||
            !entry.contains("address") || !entry["address"].is_string() ||
            !entry.contains("port") || !entry["port"].is_number_unsigned() ||
            !entry.contains("public_key") || !entry["public_key"].is_string()) {
            return makeError(ErrorCode::DECODE_ERROR, "malformed roster entry: " + entry.dump());
        }
        uint64_t port = entry["port"].get<uint64_t>();
        if (port == 0 || port > 65535) {
            return makeError(ErrorCode::DECODE_ERROR, "roster port out of range: " + std::to_string(port));
        }
        AgentDescriptor d;
        d.agentId = entry["agent_id"].get<uint64_t>();
        d.address = entry["address"].get<std::string>();
        d.port = static_cast<uint16_t>(port);
        d.publicKey = entry["public_key"].get<std::string>();
        agents.push_back(d);
    }
    return agents;
}

Result<void> saveRoster(const std::string& path, const std::vector<AgentDescriptor>& agents) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return makeError(ErrorCode::IO_ERROR, "cannot open " + path + " for writing");
    }
    file << rosterToJson(agents) << "\n";
    file.flush();
    if (!file.good()) {
        return makeError(ErrorCode::IO_ERROR, "failed writing " + path);
    }
    return {};
}

Result<std::vector<AgentDescriptor>> loadRoster(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return makeError(ErrorCode::IO_ERROR, "cannot open " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    auto agents = rosterFromJson(ss.str());
    if (!agents.ok()) {
        Error err = agents.error();
        err.context = path;
        return err;
    }
    return agents;
}

Result<void> removeRoster(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::remove(path, ec) || ec) {
        return makeError(ErrorCode::IO_ERROR,
                         "cannot remove " + path + (ec ? ": " + ec.message() : ": no such file"));
    }
    return {};
}

bool rosterExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

}
