#pragma once

#include <string>
#include <vector>

#include "core/message.h"
#include "infrastructure/error_handling.h"

namespace liarslie::core {

// JSON array of {"agent_id", "address", "port", "public_key"}. Private keys and
// reported values are never part of the roster.
std::string rosterToJson(const std::vector<AgentDescriptor>& agents);
Result<std::vector<AgentDescriptor>> rosterFromJson(const std::string& text);

Result<void> saveRoster(const std::string& path, const std::vector<AgentDescriptor>& agents);
Result<std::vector<AgentDescriptor>> loadRoster(const std::string& path);
Result<void> removeRoster(const std::string& path);
bool rosterExists(const std::string& path);

}
