#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "core/agent.h"
#include "core/lifecycle.h"
#include "infrastructure/error_handling.h"
#include "network/envelope.h"
#include "utils/config.h"

namespace liarslie::core {

// Serves one agent: binds its port, answers QueryValue, relays FetchValues and
// exits on an authenticated KillAgent. One thread per accepted connection.
class AgentRuntime {
public:
    AgentRuntime(std::shared_ptr<const AgentProfile> profile, const utils::NetworkSettings& net);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    // Blocks until shutdown. ready receives the agent id once the socket is
    // listening, or an error if binding failed.
    Result<void> run(ReadySignal ready);
    void stop();

    bool running() const;
    uint16_t boundPort() const;
    ShutdownSignal& shutdownSignal();
    const AgentProfile& profile() const;

    // Decoded request in, optional reply out. Used by the connection handlers.
    std::optional<network::Envelope> handleRequest(const network::Envelope& request);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
