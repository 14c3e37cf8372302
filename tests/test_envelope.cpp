#include <gtest/gtest.h>
#include "network/envelope.h"
#include "network/framing.h"
#include "crypto/keys.h"
#include <sys/socket.h>

using namespace liarslie;
using namespace liarslie::network;

TEST(EnvelopeTest, EncodesUnsignedLayout) {
    Envelope env;
    env.payload = {0xAA, 0xBB};
    std::vector<uint8_t> expected = {0, 0, 0, 2, 0xAA, 0xBB, 0};
    EXPECT_EQ(encodeEnvelope(env), expected);
}

TEST(EnvelopeTest, EncodesSignedLayout) {
    Envelope env;
    env.payload = {0x01};
    env.signature = std::vector<uint8_t>{0x10, 0x20};
    std::vector<uint8_t> expected = {0, 0, 0, 1, 0x01, 1, 0, 0, 0, 2, 0x10, 0x20};
    EXPECT_EQ(encodeEnvelope(env), expected);

    auto decoded = decodeEnvelope(expected);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), env);
}

TEST(EnvelopeTest, RejectsBadSignatureFlag) {
    std::vector<uint8_t> bytes = {0, 0, 0, 1, 0x01, 2};
    auto res = decodeEnvelope(bytes);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::DECODE_ERROR);
}

TEST(EnvelopeTest, RejectsTruncation) {
    std::vector<uint8_t> full = {0, 0, 0, 1, 0x01, 1, 0, 0, 0, 2, 0x10, 0x20};
    for (size_t len = 0; len < full.size(); len++) {
        std::vector<uint8_t> cut(full.begin(), full.begin() + len);
        auto res = decodeEnvelope(cut);
        ASSERT_FALSE(res.ok()) << "length " << len;
        EXPECT_EQ(res.error().code, ErrorCode::DECODE_ERROR);
    }
}

TEST(EnvelopeTest, RejectsTrailingBytes) {
    std::vector<uint8_t> bytes = {0, 0, 0, 1, 0x01, 0, 0xFF};
    auto res = decodeEnvelope(bytes);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::DECODE_ERROR);
}

TEST(EnvelopeTest, RejectsLengthBeyondInput) {
    std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF, 0x01};
    EXPECT_EQ(decodeEnvelope(bytes).error().code, ErrorCode::DECODE_ERROR);
}

TEST(EnvelopeTest, SignatureCoversPayloadOnly) {
    crypto::Keys keys = crypto::Keys::generate();
    auto env = signEnvelope({5, 6, 7}, keys);
    ASSERT_TRUE(env.ok());
    EXPECT_TRUE(verifyEnvelope(env.value(), keys.publicKey()).ok());

    Envelope altered = env.value();
    altered.payload[0] = 4;
    EXPECT_EQ(verifyEnvelope(altered, keys.publicKey()).error().code, ErrorCode::AUTH_ERROR);

    Envelope unsignedEnv;
    unsignedEnv.payload = {5, 6, 7};
    EXPECT_EQ(verifyEnvelope(unsignedEnv, keys.publicKey()).error().code, ErrorCode::AUTH_ERROR);
}

TEST(EnvelopeTest, AlteredSignatureByteFailsVerification) {
    crypto::Keys keys = crypto::Keys::generate();
    auto env = signEnvelope({1, 2, 3, 4}, keys);
    ASSERT_TRUE(env.ok());
    for (size_t i = 0; i < env.value().signature->size(); i++) {
        Envelope altered = env.value();
        (*altered.signature)[i] ^= 0x80;
        EXPECT_EQ(verifyEnvelope(altered, keys.publicKey()).error().code, ErrorCode::AUTH_ERROR) << i;
    }
}

TEST(FramingTest, FramePrefixesLength) {
    std::vector<uint8_t> framed = frame({1, 2, 3});
    std::vector<uint8_t> expected = {0, 0, 0, 3, 1, 2, 3};
    EXPECT_EQ(framed, expected);
}

TEST(FramingTest, RejectsOversizedFrame) {
    uint8_t header[4] = {0x00, 0x50, 0x00, 0x01};
    auto res = parseFrameHeader(header, DEFAULT_MAX_FRAME_SIZE);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::DECODE_ERROR);

    uint8_t ok[4] = {0x00, 0x00, 0x01, 0x00};
    auto len = parseFrameHeader(ok, DEFAULT_MAX_FRAME_SIZE);
    ASSERT_TRUE(len.ok());
    EXPECT_EQ(len.value(), 256u);
}

TEST(FramingTest, PacketOverLoopback) {
    auto listener = listenOn("127.0.0.1", 0);
    ASSERT_TRUE(listener.ok());
    uint16_t port = listener.value().localPort();
    ASSERT_NE(port, 0);

    auto client = connectTo("127.0.0.1", port, 1000, 2000);
    ASSERT_TRUE(client.ok());
    Socket server(::accept(listener.value().fd(), nullptr, nullptr));
    ASSERT_TRUE(server.valid());
    ASSERT_TRUE(setIoTimeout(server.fd(), 2000).ok());

    std::vector<uint8_t> payload = {10, 20, 30, 40};
    ASSERT_TRUE(sendPacket(client.value().fd(), payload).ok());
    auto got = recvPacket(server.fd());
    ASSERT_TRUE(got.ok());
    EXPECT_EQ(got.value(), payload);

    ASSERT_TRUE(sendPacket(client.value().fd(), std::vector<uint8_t>(64, 1)).ok());
    auto limited = recvPacket(server.fd(), 16);
    ASSERT_FALSE(limited.ok());
    EXPECT_EQ(limited.error().code, ErrorCode::DECODE_ERROR);
}

TEST(FramingTest, ReadTimesOutWithoutData) {
    auto listener = listenOn("127.0.0.1", 0);
    ASSERT_TRUE(listener.ok());
    auto client = connectTo("127.0.0.1", listener.value().localPort(), 1000, 200);
    ASSERT_TRUE(client.ok());
    auto got = recvPacket(client.value().fd());
    ASSERT_FALSE(got.ok());
    EXPECT_EQ(got.error().code, ErrorCode::NETWORK_ERROR);
}

TEST(FramingTest, ConnectRefused) {
    uint16_t port = 0;
    {
        auto listener = listenOn("127.0.0.1", 0);
        ASSERT_TRUE(listener.ok());
        port = listener.value().localPort();
    }
    auto res = connectTo("127.0.0.1", port, 500, 500);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NETWORK_ERROR);
}
