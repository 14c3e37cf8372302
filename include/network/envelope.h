#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/error_handling.h"
#include "utils/config.h"

namespace liarslie {
namespace crypto { class Keys; }

namespace network {

// A serialized message plus the detached signature over exactly those bytes.
struct Envelope {
    std::vector<uint8_t> payload;
    std::optional<std::vector<uint8_t>> signature;

    bool isSigned() const { return signature.has_value(); }
    bool operator==(const Envelope& other) const {
        return payload == other.payload && signature == other.signature;
    }
    bool operator!=(const Envelope& other) const { return !(*this == other); }
};

std::vector<uint8_t> encodeEnvelope(const Envelope& envelope);
Result<Envelope> decodeEnvelope(const std::vector<uint8_t>& bytes);

Result<Envelope> signEnvelope(const std::vector<uint8_t>& payload, const crypto::Keys& keys);
// AUTH_ERROR when the envelope is unsigned or the signature does not match publicKey.
Result<void> verifyEnvelope(const Envelope& envelope, const std::string& publicKey);

Result<void> sendEnvelope(int fd, const Envelope& envelope);
Result<Envelope> recvEnvelope(int fd, uint32_t maxFrameSize);

// One connection, one request, one reply.
Result<Envelope> roundTrip(const std::string& address, uint16_t port,
                           const Envelope& request, const utils::NetworkSettings& net);
// One connection, one request, no reply expected.
Result<void> deliver(const std::string& address, uint16_t port,
                     const Envelope& request, const utils::NetworkSettings& net);

}
}
