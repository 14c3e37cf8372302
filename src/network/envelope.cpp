#include "network/envelope.h"
#include "network/framing.h"
#include "crypto/keys.h"
#include "utils/serialize.h"
#include <stdexcept>

namespace liarslie {
namespace network {

std::vector<uint8_t> encodeEnvelope(const Envelope& envelope) {
    utils::ByteBuffer buf;
    buf.writeBytes(envelope.payload);
    if (envelope.signature) {
        buf.writeUint8(1);
        buf.writeBytes(*envelope.signature);
    } else {
        buf.writeUint8(0);
    }
    return buf.data();
}

Result<Envelope> decodeEnvelope(const std::vector<uint8_t>& bytes) {
    utils::ByteBuffer buf(bytes);
    Envelope env;
    try {
        env.payload = buf.readBytes();
        uint8_t hasSig = buf.readUint8();
        if (hasSig == 1) {
            env.signature = buf.readBytes();
        } else if (hasSig != 0) {
            return makeError(ErrorCode::DECODE_ERROR, "invalid signature flag " + std::to_string(hasSig));
        }
    } catch (const std::runtime_error& e) {
        return makeError(ErrorCode::DECODE_ERROR, std::string("truncated envelope: ") + e.what());
    }
    if (!buf.exhausted()) {
        return makeError(ErrorCode::DECODE_ERROR,
                         std::to_string(buf.remaining()) + " trailing bytes after envelope");
    }
    return env;
}

Result<Envelope> signEnvelope(const std::vector<uint8_t>& payload, const crypto::Keys& keys) {
    auto sig = keys.sign(payload);
    if (!sig.ok()) return sig.error();
    Envelope env;
    env.payload = payload;
    env.signature = std::move(sig.value());
    return env;
}

Result<void> verifyEnvelope(const Envelope& envelope, const std::string& publicKey) {
    if (!envelope.signature) {
        return makeError(ErrorCode::AUTH_ERROR, "envelope is not signed");
    }
    return crypto::verify(envelope.payload, *envelope.signature, publicKey);
}

Result<void> sendEnvelope(int fd, const Envelope& envelope) {
    return sendPacket(fd, encodeEnvelope(envelope));
}

Result<Envelope> recvEnvelope(int fd, uint32_t maxFrameSize) {
    auto bytes = recvPacket(fd, maxFrameSize);
    if (!bytes.ok()) return bytes.error();
    return decodeEnvelope(bytes.value());
}

Result<Envelope> roundTrip(const std::string& address, uint16_t port,
                           const Envelope& request, const utils::NetworkSettings& net) {
    auto sock = connectTo(address, port, net.connectTimeoutMs, net.ioTimeoutMs);
    if (!sock.ok()) return sock.error();
    auto sent = sendEnvelope(sock.value().fd(), request);
    if (!sent.ok()) return sent.error();
    return recvEnvelope(sock.value().fd(), net.maxFrameSize);
}

Result<void> deliver(const std::string& address, uint16_t port,
                     const Envelope& request, const utils::NetworkSettings& net) {
    auto sock = connectTo(address, port, net.connectTimeoutMs, net.ioTimeoutMs);
    if (!sock.ok()) return sock.error();
    return sendEnvelope(sock.value().fd(), request);
}

}
}
