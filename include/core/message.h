#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "infrastructure/error_handling.h"
#include "network/envelope.h"

namespace liarslie::core {

enum class MessageTag : uint8_t {
    QUERY_VALUE = 0,
    SEND_VALUE = 1,
    KILL_AGENT = 2,
    FETCH_VALUES = 3,
    FWD_VALUES = 4
};

// Public identity of an agent; what the roster stores and what relays are told to poll.
struct AgentDescriptor {
    uint64_t agentId = 0;
    std::string address;
    uint16_t port = 0;
    std::string publicKey;

    bool operator==(const AgentDescriptor& o) const {
        return agentId == o.agentId && address == o.address && port == o.port && publicKey == o.publicKey;
    }
    bool operator!=(const AgentDescriptor& o) const { return !(*this == o); }
};

struct QueryValue {
    bool operator==(const QueryValue&) const { return true; }
};

struct SendValue {
    uint64_t agentId = 0;
    uint64_t value = 0;
    bool operator==(const SendValue& o) const { return agentId == o.agentId && value == o.value; }
};

struct KillAgent {
    uint64_t agentId = 0;
    bool operator==(const KillAgent& o) const { return agentId == o.agentId; }
};

struct FetchValues {
    uint64_t agentId = 0;
    std::vector<AgentDescriptor> peers;
    bool operator==(const FetchValues& o) const { return agentId == o.agentId && peers == o.peers; }
};

struct FwdValues {
    uint64_t agentId = 0;
    std::vector<network::Envelope> peerValues;
    bool operator==(const FwdValues& o) const { return agentId == o.agentId && peerValues == o.peerValues; }
};

using Message = std::variant<QueryValue, SendValue, KillAgent, FetchValues, FwdValues>;

Message buildQueryValue();
Message buildSendValue(uint64_t agentId, uint64_t value);
Message buildKillAgent(uint64_t agentId);
Message buildFetchValues(uint64_t agentId, const std::vector<AgentDescriptor>& peers);
Message buildFwdValues(uint64_t agentId, const std::vector<network::Envelope>& peerValues);

MessageTag tagOf(const Message& msg);
const char* messageName(const Message& msg);

std::vector<uint8_t> serialize(const Message& msg);
Result<Message> deserialize(const std::vector<uint8_t>& bytes);

// Unsigned envelope carrying msg.
network::Envelope wrap(const Message& msg);

}
