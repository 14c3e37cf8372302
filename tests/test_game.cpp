#include <gtest/gtest.h>
#include "test_helpers.h"
#include "core/game.h"
#include "core/roster.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <filesystem>
#include <fstream>

using namespace liarslie;
using namespace liarslie::core;

class GameTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        settings.rosterPath = ::testing::TempDir() + "liarslie_" + info->name() + ".config";
        std::filesystem::remove(settings.rosterPath);
        settings.spawnTimeoutMs = 5000;
        settings.network = test::fastNetwork();
        game = std::make_unique<Game>(settings,
                                      std::make_shared<SequenceAllocator>(1),
                                      std::make_shared<SequenceAllocator>(test::closedPort()));
        ErrorHandler::instance().clearErrors();
    }

    void TearDown() override {
        game.reset();
        std::filesystem::remove(settings.rosterPath);
    }

    StartOptions options(uint64_t value, uint64_t num, double liarRatio) const {
        StartOptions o;
        o.value = value;
        o.maxValue = 10;
        o.numAgents = num;
        o.liarRatio = liarRatio;
        return o;
    }

    utils::GameSettings settings;
    std::unique_ptr<Game> game;
};

TEST_F(GameTest, CommandsBeforeStartAreRejected) {
    EXPECT_FALSE(game->started());
    EXPECT_EQ(game->play().error().code, ErrorCode::INVALID_STATE);
    EXPECT_EQ(game->playExpert(1, 0.0).error().code, ErrorCode::INVALID_STATE);
    EXPECT_EQ(game->extend(1, 0.0).error().code, ErrorCode::INVALID_STATE);
    EXPECT_EQ(game->kill(1).error().code, ErrorCode::INVALID_STATE);
    auto stopped = game->stop();
    ASSERT_FALSE(stopped.ok());
    EXPECT_EQ(stopped.error().message, "The game has not yet been started!");
}

TEST_F(GameTest, StartWritesRosterAndPlays) {
    ASSERT_TRUE(game->start(options(5, 4, 0.5)).ok());
    EXPECT_TRUE(game->started());
    EXPECT_EQ(game->readyCount(), 4u);

    auto roster = loadRoster(settings.rosterPath);
    ASSERT_TRUE(roster.ok());
    ASSERT_EQ(roster.value().size(), 4u);
    for (size_t i = 0; i < roster.value().size(); i++) {
        EXPECT_EQ(roster.value()[i].agentId, i + 1);
    }

    auto round = game->play();
    ASSERT_TRUE(round.ok()) << round.error().describe();
    EXPECT_EQ(round.value().votes.size(), 4u);
    EXPECT_EQ(std::count(round.value().votes.begin(), round.value().votes.end(), 5u), 2);
    ASSERT_TRUE(round.value().networkValue.has_value());
    EXPECT_NE(std::find(round.value().networkValue->begin(), round.value().networkValue->end(), 5u),
              round.value().networkValue->end());
}

TEST_F(GameTest, StartTwiceIsRejected) {
    ASSERT_TRUE(game->start(options(5, 1, 0.0)).ok());
    auto again = game->start(options(5, 1, 0.0));
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::INVALID_STATE);
    EXPECT_EQ(again.error().message, "The game has already been started!");
}

TEST_F(GameTest, StartValidatesOptions) {
    auto bad = options(11, 3, 0.0);
    EXPECT_EQ(game->start(bad).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(game->started());
    EXPECT_FALSE(rosterExists(settings.rosterPath));
}

TEST_F(GameTest, HonestMajorityWins) {
    ASSERT_TRUE(game->start(options(3, 7, 0.4)).ok());
    auto round = game->play();
    ASSERT_TRUE(round.ok());
    EXPECT_EQ(*round.value().networkValue, std::vector<uint64_t>({3}));
}

TEST_F(GameTest, ExtendAppendsAgents) {
    ASSERT_TRUE(game->start(options(4, 2, 0.0)).ok());
    ASSERT_TRUE(game->extend(3, 1.0).ok());
    EXPECT_EQ(game->readyCount(), 5u);

    auto roster = loadRoster(settings.rosterPath);
    ASSERT_TRUE(roster.ok());
    ASSERT_EQ(roster.value().size(), 5u);
    EXPECT_EQ(roster.value().back().agentId, 5u);

    size_t liars = 0;
    for (const auto& a : game->agents()) {
        if (a.isLiar()) liars++;
    }
    EXPECT_EQ(liars, 3u);

    auto round = game->play();
    ASSERT_TRUE(round.ok());
    EXPECT_EQ(round.value().votes.size(), 5u);
}

TEST_F(GameTest, KillRemovesAgentFromLaterRounds) {
    ASSERT_TRUE(game->start(options(6, 3, 0.0)).ok());
    ASSERT_TRUE(game->kill(2).ok());
    EXPECT_EQ(game->readyCount(), 2u);

    auto round = game->play();
    ASSERT_TRUE(round.ok());
    EXPECT_EQ(round.value().votes, std::vector<uint64_t>({6, 6}));

    auto again = game->kill(2);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(again.error().message, "the ID '2' does not correspond to any active agent");
}

TEST_F(GameTest, RefreshPrunesAgentsThatExited) {
    ASSERT_TRUE(game->start(options(6, 3, 0.0)).ok());
    auto target = game->client().findPeer(3);
    ASSERT_TRUE(target.has_value());
    ASSERT_TRUE(game->client().killAgent(3, target->address, target->port).ok());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (game->readyCount() == 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        game->refresh();
    }
    EXPECT_EQ(game->readyCount(), 2u);
    for (const auto& a : game->agents()) {
        EXPECT_NE(a.id(), 3u);
    }
}

TEST_F(GameTest, ExpertRoundUsesRequestedSubset) {
    ASSERT_TRUE(game->start(options(8, 6, 0.5)).ok());
    auto round = game->playExpert(2, 0.5);
    ASSERT_TRUE(round.ok()) << round.error().describe();
    EXPECT_EQ(round.value().subset.size(), 2u);
    EXPECT_EQ(round.value().votes.size(), 6u);
    EXPECT_EQ(std::count(round.value().votes.begin(), round.value().votes.end(), 8u), 3);
}

TEST_F(GameTest, ExpertRoundNeedsEnoughAgents) {
    ASSERT_TRUE(game->start(options(8, 2, 0.0)).ok());
    auto round = game->playExpert(2, 0.5);
    ASSERT_FALSE(round.ok());
    EXPECT_EQ(round.error().code, ErrorCode::CONFIG_ERROR);
    EXPECT_NE(round.error().message.find("not enough liars"), std::string::npos);
}

TEST_F(GameTest, StopKillsEveryAgentAndRemovesRoster) {
    ASSERT_TRUE(game->start(options(2, 3, 0.0)).ok());
    std::vector<AgentDescriptor> peers = game->client().peers();
    ASSERT_TRUE(game->stop().ok());
    EXPECT_FALSE(game->started());
    EXPECT_EQ(game->readyCount(), 0u);
    EXPECT_FALSE(rosterExists(settings.rosterPath));

    Client observer(test::fastNetwork());
    EXPECT_TRUE(observer.queryStandardRound(peers).empty());
}

TEST_F(GameTest, BindFailureLeavesOtherAgentsRunning) {
    auto squatter = network::listenOn("127.0.0.1", 0);
    ASSERT_TRUE(squatter.ok());
    uint16_t taken = squatter.value().localPort();
    game = std::make_unique<Game>(settings,
                                  std::make_shared<SequenceAllocator>(1),
                                  std::make_shared<SequenceAllocator>(taken));

    ASSERT_TRUE(game->start(options(5, 3, 0.0)).ok());
    EXPECT_EQ(game->readyCount(), 2u);
    for (const auto& a : game->agents()) {
        EXPECT_NE(a.id(), 1u);
    }
    EXPECT_EQ(loadRoster(settings.rosterPath).value().size(), 2u);
}
