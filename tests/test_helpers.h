#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "core/agent.h"
#include "core/agent_runtime.h"
#include "core/lifecycle.h"
#include "crypto/keys.h"
#include "network/framing.h"
#include "utils/config.h"

namespace liarslie::test {

inline utils::NetworkSettings fastNetwork() {
    utils::NetworkSettings net;
    net.connectTimeoutMs = 1000;
    net.ioTimeoutMs = 2000;
    net.fanoutThreads = 8;
    return net;
}

// A port nothing listens on: bound once, then released.
inline uint16_t closedPort() {
    auto sock = network::listenOn("127.0.0.1", 0);
    if (!sock.ok()) return 1;
    return sock.value().localPort();
}

inline std::shared_ptr<core::AgentProfile> makeProfile(uint64_t id, uint64_t value,
                                                       const std::string& clientPublicKey,
                                                       bool liar = false,
                                                       double tamperProbability = 0.0,
                                                       uint64_t maxValue = 10) {
    auto p = std::make_shared<core::AgentProfile>();
    p->agentId = id;
    p->value = value;
    p->address = "127.0.0.1";
    p->port = 0;
    p->keys = crypto::Keys::generate();
    p->clientPublicKey = clientPublicKey;
    p->liar = liar;
    p->tamperProbability = tamperProbability;
    p->maxValue = maxValue;
    return p;
}

// An agent runtime serving on an ephemeral localhost port for the duration of a test.
struct LocalAgent {
    std::shared_ptr<core::AgentProfile> profile;
    std::unique_ptr<core::AgentRuntime> runtime;
    std::thread thread;
    core::AgentDescriptor descriptor;

    ~LocalAgent() {
        if (runtime) runtime->stop();
        if (thread.joinable()) thread.join();
    }

    bool waitStopped(std::chrono::milliseconds timeout) {
        return runtime->shutdownSignal().waitFor(timeout);
    }
};

inline std::unique_ptr<LocalAgent> launch(std::shared_ptr<core::AgentProfile> profile,
                                          const utils::NetworkSettings& net = fastNetwork()) {
    auto agent = std::make_unique<LocalAgent>();
    agent->profile = profile;
    agent->runtime = std::make_unique<core::AgentRuntime>(profile, net);

    core::ReadySignal ready;
    auto readyFuture = ready.future();
    core::AgentRuntime* rt = agent->runtime.get();
    agent->thread = std::thread([rt, r = std::move(ready)]() mutable {
        auto res = rt->run(std::move(r));
        (void)res;
    });

    EXPECT_EQ(readyFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(readyFuture.get(), profile->agentId);
    agent->descriptor = profile->descriptor();
    agent->descriptor.port = agent->runtime->boundPort();
    return agent;
}

}
