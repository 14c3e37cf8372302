#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>

#include "core/message.h"
#include "crypto/keys.h"

namespace liarslie::core {

enum class AgentStatus : uint8_t {
    UNINITIALIZED = 0,
    READY = 1,
    KILLED = 2
};

const char* statusName(AgentStatus status);

// Everything a runtime needs to answer requests. Shared read-only between the
// session and the connection handlers.
struct AgentProfile {
    uint64_t agentId = 0;
    uint64_t value = 0;
    std::string address;
    uint16_t port = 0;
    crypto::Keys keys;
    std::string clientPublicKey;
    bool liar = false;
    double tamperProbability = 0.0;
    uint64_t maxValue = 0;

    AgentDescriptor descriptor() const;
};

struct Agent {
    std::shared_ptr<const AgentProfile> profile;
    AgentStatus status = AgentStatus::UNINITIALIZED;

    uint64_t id() const { return profile->agentId; }
    bool isLiar() const { return profile->liar; }
    bool ready() const { return status == AgentStatus::READY; }
    AgentDescriptor descriptor() const { return profile->descriptor(); }
};

struct AgentParams {
    uint64_t honestValue = 0;
    uint64_t maxValue = 0;
    double tamperProbability = 0.0;
    std::string address = "127.0.0.1";
    std::string clientPublicKey;
};

// Uniform value in [1, maxValue] that differs from honestValue. Requires maxValue >= 2.
uint64_t liarValue(uint64_t honestValue, uint64_t maxValue, std::mt19937_64& rng);

// (honest, liars) for n agents; the liar count is truncated.
std::pair<uint64_t, uint64_t> agentDistribution(uint64_t numAgents, double liarRatio);

// Generate a fresh key pair; throw std::runtime_error if key generation fails.
Agent makeHonestAgent(uint64_t agentId, uint16_t port, const AgentParams& params);
Agent makeLiarAgent(uint64_t agentId, uint16_t port, const AgentParams& params, std::mt19937_64& rng);

}
