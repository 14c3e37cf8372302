#include "core/agent.h"
#include <cmath>

namespace liarslie::core {

const char* statusName(AgentStatus status) {
    switch (status) {
        case AgentStatus::UNINITIALIZED: return "uninitialized";
        case AgentStatus::READY: return "ready";
        case AgentStatus::KILLED: return "killed";
    }
    return "unknown";
}

AgentDescriptor AgentProfile::descriptor() const {
    AgentDescriptor d;
    d.agentId = agentId;
    d.address = address;
    d.port = port;
    d.publicKey = keys.publicKey();
    return d;
}

uint64_t liarValue(uint64_t honestValue, uint64_t maxValue, std::mt19937_64& rng) {
    std::uniform_int_distribution<uint64_t> dist(1, maxValue - 1);
    uint64_t v = dist(rng);
    if (v >= honestValue) v++;
    return v;
}

std::pair<uint64_t, uint64_t> agentDistribution(uint64_t numAgents, double liarRatio) {
    uint64_t liars = static_cast<uint64_t>(std::floor(static_cast<double>(numAgents) * liarRatio));
    if (liars > numAgents) liars = numAgents;
    return {numAgents - liars, liars};
}

static std::shared_ptr<AgentProfile> baseProfile(uint64_t agentId, uint16_t port, const AgentParams& params) {
    auto profile = std::make_shared<AgentProfile>();
    profile->agentId = agentId;
    profile->address = params.address;
    profile->port = port;
    profile->keys = crypto::Keys::generate();
    profile->clientPublicKey = params.clientPublicKey;
    profile->maxValue = params.maxValue;
    return profile;
}

Agent makeHonestAgent(uint64_t agentId, uint16_t port, const AgentParams& params) {
    auto profile = baseProfile(agentId, port, params);
    profile->value = params.honestValue;
    Agent agent;
    agent.profile = profile;
    return agent;
}

Agent makeLiarAgent(uint64_t agentId, uint16_t port, const AgentParams& params, std::mt19937_64& rng) {
    auto profile = baseProfile(agentId, port, params);
    profile->value = liarValue(params.honestValue, params.maxValue, rng);
    profile->liar = true;
    profile->tamperProbability = params.tamperProbability;
    Agent agent;
    agent.profile = profile;
    return agent;
}

}
