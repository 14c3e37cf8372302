#include "core/tamper.h"
#include "core/message.h"
#include "utils/logger.h"
#include <algorithm>

namespace liarslie::core {

Result<network::Envelope> forgeSendValue(const network::Envelope& original,
                                         uint64_t maxValue,
                                         std::mt19937_64& rng) {
    auto msg = deserialize(original.payload);
    if (!msg.ok()) return msg.error();
    const SendValue* sv = std::get_if<SendValue>(&msg.value());
    if (!sv) {
        return makeError(ErrorCode::INVALID_ARGUMENT,
                         std::string("cannot forge a ") + messageName(msg.value()));
    }
    if (maxValue < 1) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "maxValue must be positive");
    }
    std::uniform_int_distribution<uint64_t> dist(1, maxValue);
    network::Envelope forged;
    forged.payload = serialize(buildSendValue(sv->agentId, dist(rng)));
    forged.signature = original.signature;
    return forged;
}

std::vector<network::Envelope> tamperReplies(const std::vector<network::Envelope>& replies,
                                             double probability,
                                             uint64_t maxValue,
                                             std::mt19937_64& rng,
                                             const ForgeFn& forge) {
    std::bernoulli_distribution hit(std::min(1.0, std::max(0.0, probability)));
    std::vector<network::Envelope> out;
    out.reserve(replies.size());
    size_t forgedCount = 0;
    for (const auto& env : replies) {
        if (!hit(rng)) {
            out.push_back(env);
            continue;
        }
        auto forged = forge(env, maxValue, rng);
        if (!forged.ok()) {
            LOG_DEBUG("tamper abandoned: " + forged.error().describe());
            return replies;
        }
        out.push_back(std::move(forged.value()));
        forgedCount++;
    }
    LOG_DEBUG("tampered with " + std::to_string(forgedCount) + "/" + std::to_string(replies.size()) + " replies");
    return out;
}

}
