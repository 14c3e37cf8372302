#include "core/client.h"
#include "core/fanout.h"
#include "core/roster.h"
#include "utils/logger.h"
#include <algorithm>
#include <limits>
#include <map>

namespace liarslie::core {

Client::Client(const utils::NetworkSettings& net)
    : keys_(crypto::Keys::generate()), net_(net) {}

Client::Client(crypto::Keys keys, const utils::NetworkSettings& net)
    : keys_(std::move(keys)), net_(net) {}

Result<void> Client::loadRoster(const std::string& path) {
    auto agents = core::loadRoster(path);
    if (!agents.ok()) return agents.error();
    peers_ = std::move(agents.value());
    LOG_DEBUG("client registry loaded " + std::to_string(peers_.size()) + " agents from " + path);
    return {};
}

std::optional<AgentDescriptor> Client::findPeer(uint64_t agentId) const {
    for (const auto& p : peers_) {
        if (p.agentId == agentId) return p;
    }
    return std::nullopt;
}

Result<uint64_t> Client::acceptDirectVote(const AgentDescriptor& peer, const network::Envelope& reply) const {
    auto verified = network::verifyEnvelope(reply, peer.publicKey);
    if (!verified.ok()) return verified.error();
    auto msg = deserialize(reply.payload);
    if (!msg.ok()) return msg.error();
    const SendValue* sv = std::get_if<SendValue>(&msg.value());
    if (!sv) {
        return makeError(ErrorCode::DECODE_ERROR,
                         std::string("expected SendValue, got ") + messageName(msg.value()));
    }
    if (sv->agentId != peer.agentId) {
        return makeError(ErrorCode::AUTH_ERROR, "reply claims agent " + std::to_string(sv->agentId));
    }
    return sv->value;
}

std::vector<uint64_t> Client::queryStandardRound(const std::vector<AgentDescriptor>& peers) const {
    auto signedQuery = network::signEnvelope(serialize(buildQueryValue()), keys_);
    if (!signedQuery.ok()) {
        Error err = signedQuery.error();
        err.context = "standard round";
        ErrorHandler::instance().handle(err);
        return {};
    }
    const network::Envelope& request = signedQuery.value();
    const utils::NetworkSettings& net = net_;

    auto results = fanOut(peers, net_.fanoutThreads, [this, &request, &net](const AgentDescriptor& peer) -> Result<uint64_t> {
        auto reply = network::roundTrip(peer.address, peer.port, request, net);
        if (!reply.ok()) return reply.error();
        return acceptDirectVote(peer, reply.value());
    });

    std::vector<uint64_t> values;
    for (size_t i = 0; i < results.size(); i++) {
        if (results[i].ok()) {
            values.push_back(results[i].value());
            continue;
        }
        Error err = results[i].error();
        err.context = "standard round, agent " + std::to_string(peers[i].agentId);
        ErrorHandler::instance().handle(err);
    }
    LOG_INFO("standard round: " + std::to_string(values.size()) + "/" + std::to_string(peers.size()) +
             " valid votes");
    return values;
}

Result<std::vector<Vote>> Client::collectForwardedVotes(const AgentDescriptor& relay,
                                                        const network::Envelope& reply) const {
    auto verified = network::verifyEnvelope(reply, relay.publicKey);
    if (!verified.ok()) return verified.error();
    auto msg = deserialize(reply.payload);
    if (!msg.ok()) return msg.error();
    const FwdValues* fwd = std::get_if<FwdValues>(&msg.value());
    if (!fwd) {
        return makeError(ErrorCode::DECODE_ERROR,
                         std::string("expected FwdValues, got ") + messageName(msg.value()));
    }
    if (fwd->agentId != relay.agentId) {
        return makeError(ErrorCode::AUTH_ERROR, "relay reply claims agent " + std::to_string(fwd->agentId));
    }

    std::vector<Vote> votes;
    size_t dropped = 0;
    for (const auto& inner : fwd->peerValues) {
        auto innerMsg = deserialize(inner.payload);
        const SendValue* sv = innerMsg.ok() ? std::get_if<SendValue>(&innerMsg.value()) : nullptr;
        if (!sv) {
            dropped++;
            continue;
        }
        auto reporter = findPeer(sv->agentId);
        if (!reporter || !network::verifyEnvelope(inner, reporter->publicKey).ok()) {
            dropped++;
            continue;
        }
        votes.emplace_back(sv->agentId, sv->value);
    }
    if (dropped > 0) {
        LOG_DEBUG("relay " + std::to_string(relay.agentId) + ": dropped " + std::to_string(dropped) +
                  " unverifiable values");
    }
    return votes;
}

uint32_t relayReplyTimeoutMs(const utils::NetworkSettings& net, size_t peerCount) {
    uint64_t threads = std::max<uint32_t>(1, net.fanoutThreads);
    uint64_t batches = (static_cast<uint64_t>(peerCount) + threads - 1) / threads;
    uint64_t total = static_cast<uint64_t>(net.ioTimeoutMs) +
                     batches * (static_cast<uint64_t>(net.connectTimeoutMs) + net.ioTimeoutMs);
    return static_cast<uint32_t>(std::min<uint64_t>(total, std::numeric_limits<uint32_t>::max()));
}

std::vector<uint64_t> Client::queryExpertRound(const std::vector<AgentDescriptor>& expertSubset) const {
    utils::NetworkSettings net = net_;
    net.ioTimeoutMs = relayReplyTimeoutMs(net_, peers_.size());
    const std::vector<AgentDescriptor>& everyone = peers_;

    auto results = fanOut(expertSubset, net_.fanoutThreads,
        [this, &net, &everyone](const AgentDescriptor& relay) -> Result<std::vector<Vote>> {
            auto request = network::signEnvelope(serialize(buildFetchValues(relay.agentId, everyone)), keys_);
            if (!request.ok()) return request.error();
            auto reply = network::roundTrip(relay.address, relay.port, request.value(), net);
            if (!reply.ok()) return reply.error();
            return collectForwardedVotes(relay, reply.value());
        });

    std::vector<std::vector<Vote>> perRelay;
    for (size_t i = 0; i < results.size(); i++) {
        if (results[i].ok()) {
            perRelay.push_back(std::move(results[i].value()));
            continue;
        }
        Error err = results[i].error();
        err.context = "expert round, relay " + std::to_string(expertSubset[i].agentId);
        ErrorHandler::instance().handle(err);
    }
    std::vector<uint64_t> values = mergeUniqueVotes(perRelay);
    LOG_INFO("expert round: " + std::to_string(perRelay.size()) + "/" + std::to_string(expertSubset.size()) +
             " relays answered, " + std::to_string(values.size()) + " distinct signed votes");
    return values;
}

std::vector<uint64_t> Client::mergeUniqueVotes(const std::vector<std::vector<Vote>>& perRelay) {
    std::set<Vote> unique;
    for (const auto& votes : perRelay) {
        unique.insert(votes.begin(), votes.end());
    }
    std::vector<uint64_t> values;
    values.reserve(unique.size());
    for (const auto& v : unique) values.push_back(v.second);
    return values;
}

std::optional<std::vector<uint64_t>> Client::inferNetworkValue(const std::vector<uint64_t>& values) {
    if (values.empty()) return std::nullopt;
    std::map<uint64_t, size_t> counts;
    size_t best = 0;
    for (uint64_t v : values) {
        best = std::max(best, ++counts[v]);
    }
    std::vector<uint64_t> winners;
    for (const auto& [value, count] : counts) {
        if (count == best) winners.push_back(value);
    }
    return winners;
}

Result<void> Client::killAgent(uint64_t agentId, const std::string& address, uint16_t port) const {
    auto request = network::signEnvelope(serialize(buildKillAgent(agentId)), keys_);
    if (!request.ok()) return request.error();
    auto sent = network::deliver(address, port, request.value(), net_);
    if (!sent.ok()) {
        Error err = sent.error();
        err.context = "kill agent " + std::to_string(agentId);
        return err;
    }
    return {};
}

Result<std::vector<AgentDescriptor>> sampleExpertSubset(const std::vector<Agent>& agents,
                                                        uint64_t wantHonest,
                                                        uint64_t wantLiars,
                                                        std::mt19937_64& rng) {
    std::vector<Agent> ready;
    uint64_t honestAvail = 0;
    uint64_t liarsAvail = 0;
    for (const auto& a : agents) {
        if (!a.ready()) continue;
        ready.push_back(a);
        if (a.isLiar()) liarsAvail++;
        else honestAvail++;
    }
    if (wantHonest > honestAvail) {
        return makeError(ErrorCode::CONFIG_ERROR,
                         "not enough honest agents to form the requested subset. "
                         "Choose a smaller number or extend the game.");
    }
    if (wantLiars > liarsAvail) {
        return makeError(ErrorCode::CONFIG_ERROR,
                         "not enough liars to form the requested subset. "
                         "Choose a smaller number or extend the game.");
    }

    std::shuffle(ready.begin(), ready.end(), rng);
    std::vector<AgentDescriptor> subset;
    uint64_t honest = 0;
    uint64_t liars = 0;
    for (const auto& a : ready) {
        if (a.isLiar() && liars < wantLiars) {
            subset.push_back(a.descriptor());
            liars++;
        } else if (!a.isLiar() && honest < wantHonest) {
            subset.push_back(a.descriptor());
            honest++;
        }
    }
    return subset;
}

}
