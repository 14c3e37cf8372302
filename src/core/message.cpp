#include "core/message.h"
#include "utils/serialize.h"
#include <stdexcept>

namespace liarslie::core {

namespace {

void writeDescriptor(utils::ByteBuffer& buf, const AgentDescriptor& d) {
    buf.writeUint64(d.agentId);
    buf.writeString(d.address);
    buf.writeUint16(d.port);
    buf.writeString(d.publicKey);
}

AgentDescriptor readDescriptor(utils::ByteBuffer& buf) {
    AgentDescriptor d;
    d.agentId = buf.readUint64();
    d.address = buf.readString();
    d.port = buf.readUint16();
    d.publicKey = buf.readString();
    return d;
}

// Each list element occupies at least minSize bytes, which bounds the count
// before anything is reserved.
uint32_t readCount(utils::ByteBuffer& buf, size_t minSize) {
    uint32_t count = buf.readUint32();
    if (static_cast<uint64_t>(count) * minSize > buf.remaining()) {
        throw std::runtime_error("list count " + std::to_string(count) + " exceeds input");
    }
    return count;
}

struct Writer {
    utils::ByteBuffer& buf;

    void operator()(const QueryValue&) const {}
    void operator()(const SendValue& m) const {
        buf.writeUint64(m.agentId);
        buf.writeUint64(m.value);
    }
    void operator()(const KillAgent& m) const {
        buf.writeUint64(m.agentId);
    }
    void operator()(const FetchValues& m) const {
        buf.writeUint64(m.agentId);
        buf.writeUint32(static_cast<uint32_t>(m.peers.size()));
        for (const auto& p : m.peers) writeDescriptor(buf, p);
    }
    void operator()(const FwdValues& m) const {
        buf.writeUint64(m.agentId);
        buf.writeUint32(static_cast<uint32_t>(m.peerValues.size()));
        for (const auto& env : m.peerValues) buf.writeBytes(network::encodeEnvelope(env));
    }
};

}

Message buildQueryValue() {
    return QueryValue{};
}

Message buildSendValue(uint64_t agentId, uint64_t value) {
    return SendValue{agentId, value};
}

Message buildKillAgent(uint64_t agentId) {
    return KillAgent{agentId};
}

Message buildFetchValues(uint64_t agentId, const std::vector<AgentDescriptor>& peers) {
    return FetchValues{agentId, peers};
}

Message buildFwdValues(uint64_t agentId, const std::vector<network::Envelope>& peerValues) {
    return FwdValues{agentId, peerValues};
}

MessageTag tagOf(const Message& msg) {
    return static_cast<MessageTag>(msg.index());
}

const char* messageName(const Message& msg) {
    switch (tagOf(msg)) {
        case MessageTag::QUERY_VALUE: return "QueryValue";
        case MessageTag::SEND_VALUE: return "SendValue";
        case MessageTag::KILL_AGENT: return "KillAgent";
        case MessageTag::FETCH_VALUES: return "FetchValues";
        case MessageTag::FWD_VALUES: return "FwdValues";
    }
    return "Unknown";
}

std::vector<uint8_t> serialize(const Message& msg) {
    utils::ByteBuffer buf;
    buf.writeUint8(static_cast<uint8_t>(tagOf(msg)));
    std::visit(Writer{buf}, msg);
    return buf.data();
}

Result<Message> deserialize(const std::vector<uint8_t>& bytes) {
    utils::ByteBuffer buf(bytes);
    Message msg;
    try {
        uint8_t tag = buf.readUint8();
        switch (static_cast<MessageTag>(tag)) {
            case MessageTag::QUERY_VALUE:
                msg = QueryValue{};
                break;
            case MessageTag::SEND_VALUE: {
                SendValue m;
                m.agentId = buf.readUint64();
                m.value = buf.readUint64();
                msg = m;
                break;
            }
            case MessageTag::KILL_AGENT:
                msg = KillAgent{buf.readUint64()};
                break;
            case MessageTag::FETCH_VALUES: {
                FetchValues m;
                m.agentId = buf.readUint64();
                uint32_t count = readCount(buf, 8 + 4 + 2 + 4);
                m.peers.reserve(count);
                for (uint32_t i = 0; i < count; i++) m.peers.push_back(readDescriptor(buf));
                msg = std::move(m);
                break;
            }
            case MessageTag::FWD_VALUES: {
                FwdValues m;
                m.agentId = buf.readUint64();
                uint32_t count = readCount(buf, 4);
                m.peerValues.reserve(count);
                for (uint32_t i = 0; i < count; i++) {
                    auto env = network::decodeEnvelope(buf.readBytes());
                    if (!env.ok()) return env.error();
                    m.peerValues.push_back(std::move(env.value()));
                }
                msg = std::move(m);
                break;
            }
            default:
                return makeError(ErrorCode::DECODE_ERROR, "unknown message tag " + std::to_string(tag));
        }
    } catch (const std::runtime_error& e) {
        return makeError(ErrorCode::DECODE_ERROR, std::string("truncated message: ") + e.what());
    }
    if (!buf.exhausted()) {
        return makeError(ErrorCode::DECODE_ERROR,
                         std::to_string(buf.remaining()) + " trailing bytes after message");
    }
    return msg;
}

network::Envelope wrap(const Message& msg) {
    network::Envelope env;
    env.payload = serialize(msg);
    return env;
}

}
