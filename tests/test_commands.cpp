#include <gtest/gtest.h>
#include "cli/commands.h"

using namespace liarslie;
using namespace liarslie::cli;

TEST(CommandsTest, Tokenize) {
    EXPECT_EQ(tokenize("  play-expert   --num-agents 3\t--liar-ratio 0.5 "),
              std::vector<std::string>({"play-expert", "--num-agents", "3", "--liar-ratio", "0.5"}));
    EXPECT_TRUE(tokenize("   ").empty());
}

TEST(CommandsTest, ParseStart) {
    auto cmd = parseCommand("start --value 5 --max-value 10 --num-agents 7 --liar-ratio 0.25");
    ASSERT_TRUE(cmd.ok()) << cmd.error().describe();
    EXPECT_EQ(cmd.value().kind, CommandKind::START);
    EXPECT_EQ(cmd.value().start.value, 5u);
    EXPECT_EQ(cmd.value().start.maxValue, 10u);
    EXPECT_EQ(cmd.value().start.numAgents, 7u);
    EXPECT_DOUBLE_EQ(cmd.value().start.liarRatio, 0.25);
    EXPECT_DOUBLE_EQ(cmd.value().start.tamperChance, 0.0);
}

TEST(CommandsTest, ParseStartWithTamperChanceAndEqualsForm) {
    auto cmd = parseCommand("start --liar-ratio=0 --num-agents=2 --max-value=3 --value=3 --tamper-chance=1");
    ASSERT_TRUE(cmd.ok()) << cmd.error().describe();
    EXPECT_DOUBLE_EQ(cmd.value().start.tamperChance, 1.0);
    EXPECT_EQ(cmd.value().start.value, 3u);
}

TEST(CommandsTest, ParseSimpleCommands) {
    EXPECT_EQ(parseCommand("play").value().kind, CommandKind::PLAY);
    EXPECT_EQ(parseCommand("stop").value().kind, CommandKind::STOP);
    EXPECT_EQ(parseCommand("help").value().kind, CommandKind::HELP);

    auto kill = parseCommand("kill --id 12");
    ASSERT_TRUE(kill.ok());
    EXPECT_EQ(kill.value().kind, CommandKind::KILL);
    EXPECT_EQ(kill.value().agentId, 12u);

    auto extend = parseCommand("extend --num-agents 4 --liar-ratio 1.0");
    ASSERT_TRUE(extend.ok());
    EXPECT_EQ(extend.value().kind, CommandKind::EXTEND);
    EXPECT_EQ(extend.value().numAgents, 4u);
    EXPECT_DOUBLE_EQ(extend.value().liarRatio, 1.0);

    auto expert = parseCommand("play-expert --liar-ratio 0 --num-agents 2");
    ASSERT_TRUE(expert.ok());
    EXPECT_EQ(expert.value().kind, CommandKind::PLAY_EXPERT);
    EXPECT_EQ(expert.value().numAgents, 2u);
}

TEST(CommandsTest, RejectsMalformedLines) {
    const char* bad[] = {
        "",
        "launch",
        "play --now",
        "kill",
        "kill --id",
        "kill --id -1",
        "kill --id 3x",
        "kill --id 1 --id 2",
        "kill 3",
        "start --value 5 --max-value 10 --num-agents 7",
        "start --value 0 --max-value 10 --num-agents 7 --liar-ratio 0.1",
        "start --value 11 --max-value 10 --num-agents 7 --liar-ratio 0.1",
        "start --value 1 --max-value 1 --num-agents 7 --liar-ratio 0.1",
        "start --value 5 --max-value 10 --num-agents 0 --liar-ratio 0.1",
        "start --value 5 --max-value 10 --num-agents 7 --liar-ratio abc",
        "start --value 5 --max-value 10 --num-agents 7 --liar-ratio 0.1 --tamper-chance 2",
        "extend --num-agents 0 --liar-ratio 0.5",
        "play-expert --num-agents 3",
    };
    for (const char* line : bad) {
        auto cmd = parseCommand(line);
        ASSERT_FALSE(cmd.ok()) << "accepted: " << line;
        EXPECT_EQ(cmd.error().code, ErrorCode::INVALID_ARGUMENT) << line;
    }
}

TEST(CommandsTest, RatioOutOfRangeMessage) {
    auto cmd = parseCommand("extend --num-agents 2 --liar-ratio 1.5");
    ASSERT_FALSE(cmd.ok());
    EXPECT_EQ(cmd.error().message, "--liar-ratio must be within the range of 0.0 to 1.0 (inclusive)");
    EXPECT_FALSE(parseCommand("extend --num-agents 2 --liar-ratio -0.1").ok());
}

TEST(CommandsTest, HelpListsEveryCommand) {
    std::string help = helpText();
    for (const char* name : {"start", "play", "extend", "play-expert", "kill", "stop"}) {
        EXPECT_NE(help.find(name), std::string::npos) << name;
    }
}
