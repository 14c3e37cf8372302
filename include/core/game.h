#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/agent.h"
#include "core/client.h"
#include "core/sequence.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"

namespace liarslie::core {

struct StartOptions {
    uint64_t value = 0;
    uint64_t maxValue = 0;
    uint64_t numAgents = 0;
    double liarRatio = 0.0;
    double tamperChance = 0.0;
};

struct RoundOutcome {
    std::vector<uint64_t> votes;
    std::vector<AgentDescriptor> subset;
    std::optional<std::vector<uint64_t>> networkValue;
};

// One game: spawns agent runtimes on local threads, keeps the roster file in
// sync and plays rounds through its Client.
class Game {
public:
    explicit Game(const utils::GameSettings& settings);
    Game(const utils::GameSettings& settings,
         std::shared_ptr<SequenceAllocator> ids,
         std::shared_ptr<SequenceAllocator> ports);
    ~Game();

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    bool started() const;
    Result<void> start(const StartOptions& opts);
    Result<void> extend(uint64_t numAgents, double liarRatio);
    Result<RoundOutcome> play();
    Result<RoundOutcome> playExpert(uint64_t numAgents, double liarRatio);
    Result<void> kill(uint64_t agentId);
    Result<void> stop();

    // Marks agents whose runtime exited as Killed and prunes them.
    void refresh();

    std::vector<Agent> agents() const;
    size_t readyCount() const;
    const Client& client() const;
    const utils::GameSettings& settings() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
