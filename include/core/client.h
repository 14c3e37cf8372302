#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/agent.h"
#include "core/message.h"
#include "crypto/keys.h"
#include "infrastructure/error_handling.h"
#include "network/envelope.h"
#include "utils/config.h"

namespace liarslie::core {

// (reporter agent id, value) as accepted by an expert round.
using Vote = std::pair<uint64_t, uint64_t>;

// Sole trust anchor of the game. Holds the client key and the peer registry
// and drives both round kinds. The registry is read-only while a round runs.
class Client {
public:
    explicit Client(const utils::NetworkSettings& net = utils::NetworkSettings{});
    Client(crypto::Keys keys, const utils::NetworkSettings& net);

    const crypto::Keys& keys() const { return keys_; }
    const std::string& publicKey() const { return keys_.publicKey(); }

    void setPeers(const std::vector<AgentDescriptor>& peers) { peers_ = peers; }
    const std::vector<AgentDescriptor>& peers() const { return peers_; }
    Result<void> loadRoster(const std::string& path);
    std::optional<AgentDescriptor> findPeer(uint64_t agentId) const;

    std::vector<uint64_t> queryStandardRound() const { return queryStandardRound(peers_); }
    std::vector<uint64_t> queryStandardRound(const std::vector<AgentDescriptor>& peers) const;
    std::vector<uint64_t> queryExpertRound(const std::vector<AgentDescriptor>& expertSubset) const;

    // Votes carried by one relay's FwdValues reply. AUTH_ERROR if the outer
    // signature is not the relay's; inner envelopes that fail are dropped.
    Result<std::vector<Vote>> collectForwardedVotes(const AgentDescriptor& relay,
                                                     const network::Envelope& reply) const;
    // Verified value of one direct SendValue reply.
    Result<uint64_t> acceptDirectVote(const AgentDescriptor& peer, const network::Envelope& reply) const;

    static std::vector<uint64_t> mergeUniqueVotes(const std::vector<std::vector<Vote>>& perRelay);
    static std::optional<std::vector<uint64_t>> inferNetworkValue(const std::vector<uint64_t>& values);

    Result<void> killAgent(uint64_t agentId, const std::string& address, uint16_t port) const;

private:
    crypto::Keys keys_;
    utils::NetworkSettings net_;
    std::vector<AgentDescriptor> peers_;
};

// Read timeout for a FetchValues reply: the relay's own fan-out over peerCount peers
// runs in batches of fanoutThreads, each bounded by connect plus read timeouts.
uint32_t relayReplyTimeoutMs(const utils::NetworkSettings& net, size_t peerCount);

// Availability is checked first, without touching the network; then Ready agents
// are shuffled and the first wantHonest honest and wantLiars liars are taken.
Result<std::vector<AgentDescriptor>> sampleExpertSubset(const std::vector<Agent>& agents,
                                                        uint64_t wantHonest,
                                                        uint64_t wantLiars,
                                                        std::mt19937_64& rng);

}
