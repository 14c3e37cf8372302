#include "core/game.h"
#include "core/agent_runtime.h"
#include "core/lifecycle.h"
#include "core/roster.h"
#include "utils/logger.h"
#include <chrono>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>

namespace liarslie::core {

namespace {

struct Slot {
    Agent agent;
    std::unique_ptr<AgentRuntime> runtime;
    std::thread thread;
};

void joinSlot(Slot& slot) {
    if (slot.runtime) slot.runtime->stop();
    if (slot.thread.joinable()) slot.thread.join();
}

}

struct Game::Impl {
    utils::GameSettings settings;
    std::shared_ptr<SequenceAllocator> ids;
    std::shared_ptr<SequenceAllocator> ports;
    std::unique_ptr<Client> client;
    std::mt19937_64 rng{std::random_device{}()};

    bool started = false;
    uint64_t honestValue = 0;
    uint64_t maxValue = 0;
    double tamperChance = 0.0;
    std::vector<std::unique_ptr<Slot>> slots;

    std::vector<AgentDescriptor> descriptors() const {
        std::vector<AgentDescriptor> out;
        for (const auto& s : slots) out.push_back(s->agent.descriptor());
        return out;
    }

    Result<size_t> spawn(uint64_t numHonest, uint64_t numLiars);
    void prune();
    void reset();
};

Result<size_t> Game::Impl::spawn(uint64_t numHonest, uint64_t numLiars) {
    AgentParams params;
    params.honestValue = honestValue;
    params.maxValue = maxValue;
    params.tamperProbability = tamperChance;
    params.address = settings.agent.address;
    params.clientPublicKey = client->publicKey();

    std::vector<std::unique_ptr<Slot>> fresh;
    std::vector<std::future<uint64_t>> readyFutures;
    try {
        for (uint64_t i = 0; i < numHonest + numLiars; i++) {
            uint64_t id = ids->next();
            uint64_t port = ports->next();
            if (port > 65535) {
                return makeError(ErrorCode::INVALID_STATE, "port range exhausted");
            }
            auto slot = std::make_unique<Slot>();
            slot->agent = i < numHonest
                ? makeHonestAgent(id, static_cast<uint16_t>(port), params)
                : makeLiarAgent(id, static_cast<uint16_t>(port), params, rng);
            fresh.push_back(std::move(slot));
        }
    } catch (const std::runtime_error& e) {
        return makeError(ErrorCode::CRYPTO_ERROR, std::string("agent key generation failed: ") + e.what());
    }

    for (auto& slot : fresh) {
        slot->runtime = std::make_unique<AgentRuntime>(slot->agent.profile, settings.network);
        ReadySignal ready;
        readyFutures.push_back(ready.future());
        AgentRuntime* rt = slot->runtime.get();
        slot->thread = std::thread([rt, r = std::move(ready)]() mutable {
            auto res = rt->run(std::move(r));
            if (!res.ok()) {
                ErrorHandler::instance().handle(res.error());
            }
        });
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings.spawnTimeoutMs);
    size_t launched = 0;
    for (size_t i = 0; i < fresh.size(); i++) {
        Slot& slot = *fresh[i];
        bool ok = false;
        if (readyFutures[i].wait_until(deadline) == std::future_status::ready) {
            try {
                ok = readyFutures[i].get() == slot.agent.id();
            } catch (const std::exception& e) {
                LOG_WARN("agent " + std::to_string(slot.agent.id()) + " failed to start: " + e.what());
            }
        } else {
            LOG_WARN("agent " + std::to_string(slot.agent.id()) + " did not acknowledge readiness in time");
        }
        if (ok) {
            slot.agent.status = AgentStatus::READY;
            launched++;
        } else {
            joinSlot(slot);
            slot.agent.status = AgentStatus::KILLED;
        }
    }

    for (auto& slot : fresh) {
        if (slot->agent.ready()) slots.push_back(std::move(slot));
    }
    LOG_INFO("spawned " + std::to_string(launched) + "/" + std::to_string(fresh.size()) + " agents");
    return launched;
}

void Game::Impl::prune() {
    for (auto it = slots.begin(); it != slots.end();) {
        Slot& slot = **it;
        if (slot.agent.ready() && slot.runtime && slot.runtime->shutdownSignal().triggered()) {
            slot.agent.status = AgentStatus::KILLED;
        }
        if (slot.agent.status == AgentStatus::KILLED) {
            joinSlot(slot);
            it = slots.erase(it);
        } else {
            ++it;
        }
    }
}

void Game::Impl::reset() {
    for (auto& slot : slots) joinSlot(*slot);
    slots.clear();
    started = false;
    honestValue = 0;
    maxValue = 0;
    tamperChance = 0.0;
}

Game::Game(const utils::GameSettings& settings)
    : Game(settings,
           std::make_shared<SequenceAllocator>(1),
           std::make_shared<SequenceAllocator>(settings.agent.basePort)) {}

Game::Game(const utils::GameSettings& settings,
           std::shared_ptr<SequenceAllocator> ids,
           std::shared_ptr<SequenceAllocator> ports)
    : impl_(std::make_unique<Impl>()) {
    impl_->settings = settings;
    impl_->ids = std::move(ids);
    impl_->ports = std::move(ports);
    impl_->client = std::make_unique<Client>(settings.network);
}

Game::~Game() {
    impl_->reset();
}

bool Game::started() const {
    return impl_->started;
}

Result<void> Game::start(const StartOptions& opts) {
    if (impl_->started) {
        return makeError(ErrorCode::INVALID_STATE, "The game has already been started!");
    }
    LIARSLIE_CHECK(opts.value > 0, ErrorCode::INVALID_ARGUMENT, "--value must be greater than 0");
    LIARSLIE_CHECK(opts.maxValue > 1, ErrorCode::INVALID_ARGUMENT, "--max-value must be greater than 1");
    LIARSLIE_CHECK(opts.value <= opts.maxValue, ErrorCode::INVALID_ARGUMENT,
                   "--value cannot be greater than --max-value");
    LIARSLIE_CHECK(opts.numAgents > 0, ErrorCode::INVALID_ARGUMENT, "--num-agents must be greater than 0");
    LIARSLIE_CHECK(opts.liarRatio >= 0.0 && opts.liarRatio <= 1.0, ErrorCode::INVALID_ARGUMENT,
                   "--liar-ratio must be within [0, 1]");
    LIARSLIE_CHECK(opts.tamperChance >= 0.0 && opts.tamperChance <= 1.0, ErrorCode::INVALID_ARGUMENT,
                   "--tamper-chance must be within [0, 1]");

    impl_->honestValue = opts.value;
    impl_->maxValue = opts.maxValue;
    impl_->tamperChance = opts.tamperChance;

    auto [honest, liars] = agentDistribution(opts.numAgents, opts.liarRatio);
    auto spawned = impl_->spawn(honest, liars);
    if (!spawned.ok() || spawned.value() == 0) {
        impl_->reset();
        if (!spawned.ok()) return spawned.error();
        return makeError(ErrorCode::NETWORK_ERROR, "no agent could be started");
    }

    auto saved = saveRoster(impl_->settings.rosterPath, impl_->descriptors());
    if (!saved.ok()) {
        impl_->reset();
        return saved.error();
    }
    impl_->client->setPeers(impl_->descriptors());
    impl_->started = true;
    LOG_INFO("game started with " + std::to_string(impl_->slots.size()) + " agents, roster " +
             impl_->settings.rosterPath);
    return {};
}

Result<void> Game::extend(uint64_t numAgents, double liarRatio) {
    if (!impl_->started || !rosterExists(impl_->settings.rosterPath)) {
        return makeError(ErrorCode::INVALID_STATE, "The game has not yet been started!");
    }
    LIARSLIE_CHECK(numAgents > 0, ErrorCode::INVALID_ARGUMENT, "--num-agents must be greater than 0");
    LIARSLIE_CHECK(liarRatio >= 0.0 && liarRatio <= 1.0, ErrorCode::INVALID_ARGUMENT,
                   "--liar-ratio must be within [0, 1]");

    impl_->prune();
    std::string backup;
    {
        std::ifstream in(impl_->settings.rosterPath);
        std::stringstream ss;
        ss << in.rdbuf();
        backup = ss.str();
    }

    size_t before = impl_->slots.size();
    auto [honest, liars] = agentDistribution(numAgents, liarRatio);
    auto spawned = impl_->spawn(honest, liars);
    if (!spawned.ok()) return spawned.error();

    auto saved = saveRoster(impl_->settings.rosterPath, impl_->descriptors());
    if (!saved.ok()) {
        std::ofstream restore(impl_->settings.rosterPath, std::ios::trunc);
        restore << backup;
        for (size_t i = before; i < impl_->slots.size(); i++) {
            joinSlot(*impl_->slots[i]);
        }
        impl_->slots.resize(before);
        return saved.error();
    }
    impl_->client->setPeers(impl_->descriptors());
    LOG_INFO("game extended by " + std::to_string(spawned.value()) + " agents");
    return {};
}

Result<RoundOutcome> Game::play() {
    if (!impl_->started) {
        return makeError(ErrorCode::INVALID_STATE, "The game has not yet been started!");
    }
    impl_->prune();
    auto loaded = impl_->client->loadRoster(impl_->settings.rosterPath);
    if (!loaded.ok()) return loaded.error();

    RoundOutcome outcome;
    outcome.subset = impl_->client->peers();
    outcome.votes = impl_->client->queryStandardRound();
    outcome.networkValue = Client::inferNetworkValue(outcome.votes);
    return outcome;
}

Result<RoundOutcome> Game::playExpert(uint64_t numAgents, double liarRatio) {
    if (!impl_->started) {
        return makeError(ErrorCode::INVALID_STATE, "The game has not yet been started!");
    }
    LIARSLIE_CHECK(numAgents > 0, ErrorCode::INVALID_ARGUMENT, "--num-agents must be greater than 0");
    LIARSLIE_CHECK(liarRatio >= 0.0 && liarRatio <= 1.0, ErrorCode::INVALID_ARGUMENT,
                   "--liar-ratio must be within [0, 1]");
    impl_->prune();
    auto loaded = impl_->client->loadRoster(impl_->settings.rosterPath);
    if (!loaded.ok()) return loaded.error();

    auto [honest, liars] = agentDistribution(numAgents, liarRatio);
    auto subset = sampleExpertSubset(agents(), honest, liars, impl_->rng);
    if (!subset.ok()) return subset.error();

    RoundOutcome outcome;
    outcome.subset = subset.value();
    outcome.votes = impl_->client->queryExpertRound(outcome.subset);
    outcome.networkValue = Client::inferNetworkValue(outcome.votes);
    return outcome;
}

Result<void> Game::kill(uint64_t agentId) {
    if (!impl_->started) {
        return makeError(ErrorCode::INVALID_STATE, "The game has not yet been started!");
    }
    impl_->prune();
    Slot* target = nullptr;
    for (auto& s : impl_->slots) {
        if (s->agent.id() == agentId && s->agent.ready()) target = s.get();
    }
    if (!target) {
        return makeError(ErrorCode::NOT_FOUND,
                         "the ID '" + std::to_string(agentId) + "' does not correspond to any active agent");
    }

    AgentDescriptor d = target->agent.descriptor();
    auto sent = impl_->client->killAgent(agentId, d.address, d.port);
    if (!sent.ok()) return sent;

    if (!target->runtime->shutdownSignal().waitFor(std::chrono::milliseconds(impl_->settings.spawnTimeoutMs))) {
        LOG_WARN("agent " + std::to_string(agentId) + " did not confirm shutdown, stopping it locally");
    }
    target->agent.status = AgentStatus::KILLED;
    impl_->prune();
    return {};
}

Result<void> Game::stop() {
    if (!impl_->started) {
        return makeError(ErrorCode::INVALID_STATE, "The game has not yet been started!");
    }
    impl_->prune();
    size_t failures = 0;
    for (auto& s : impl_->slots) {
        if (!s->agent.ready()) continue;
        AgentDescriptor d = s->agent.descriptor();
        auto sent = impl_->client->killAgent(d.agentId, d.address, d.port);
        if (!sent.ok()) {
            failures++;
            ErrorHandler::instance().handle(sent.error());
        }
    }
    impl_->reset();

    auto removed = removeRoster(impl_->settings.rosterPath);
    if (!removed.ok()) return removed;
    if (failures > 0) {
        LOG_WARN(std::to_string(failures) + " agents were stopped locally after the kill request failed");
    }
    return {};
}

void Game::refresh() {
    impl_->prune();
}

std::vector<Agent> Game::agents() const {
    std::vector<Agent> out;
    for (const auto& s : impl_->slots) out.push_back(s->agent);
    return out;
}

size_t Game::readyCount() const {
    size_t n = 0;
    for (const auto& s : impl_->slots) {
        if (s->agent.ready()) n++;
    }
    return n;
}

const Client& Game::client() const {
    return *impl_->client;
}

const utils::GameSettings& Game::settings() const {
    return impl_->settings;
}

}
