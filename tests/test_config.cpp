#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/logger.h"
#include "infrastructure/error_handling.h"

#include <filesystem>
#include <fstream>

using namespace liarslie;
using namespace liarslie::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().reset();
        path = ::testing::TempDir() + "liarslie_config_test.conf";
    }

    void TearDown() override {
        Config::instance().reset();
        std::filesystem::remove(path);
    }

    void write(const std::string& text) {
        std::ofstream out(path, std::ios::trunc);
        out << text;
    }

    std::string path;
};

TEST_F(ConfigTest, Defaults) {
    Config& cfg = Config::instance();
    GameSettings game = cfg.getGameSettings();
    EXPECT_EQ(game.rosterPath, "agents.config");
    EXPECT_EQ(game.agent.address, "127.0.0.1");
    EXPECT_EQ(game.agent.basePort, 5000);
    EXPECT_EQ(game.network.fanoutThreads, 16u);
    EXPECT_EQ(cfg.getLogSettings().level, "info");
    EXPECT_TRUE(cfg.getLogSettings().console);
    EXPECT_TRUE(cfg.validate().ok());
}

TEST_F(ConfigTest, LoadOverridesDefaults) {
    write("# game settings\n"
          "game.roster_path = /tmp/roster.json\n"
          "agent.base_port=7100\n"
          "\n"
          "network.io_timeout_ms = 250\n"
          "log.console = off\n"
          "this line is ignored\n");
    Config& cfg = Config::instance();
    ASSERT_TRUE(cfg.load(path));
    EXPECT_EQ(cfg.getConfigPath(), path);

    GameSettings game = cfg.getGameSettings();
    EXPECT_EQ(game.rosterPath, "/tmp/roster.json");
    EXPECT_EQ(game.agent.basePort, 7100);
    EXPECT_EQ(game.network.ioTimeoutMs, 250u);
    EXPECT_EQ(game.network.connectTimeoutMs, 3000u);
    EXPECT_FALSE(cfg.getLogSettings().console);
    EXPECT_TRUE(cfg.validate().ok());
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(Config::instance().load(path));
}

TEST_F(ConfigTest, TypedGetters) {
    Config& cfg = Config::instance();
    cfg.set("x.int", 42);
    cfg.set("x.big", static_cast<int64_t>(1) << 40);
    cfg.set("x.ratio", "0.75");
    cfg.set("x.flag", true);
    cfg.set("x.junk", "abc");

    EXPECT_EQ(cfg.getInt("x.int"), 42);
    EXPECT_EQ(cfg.getInt64("x.big"), static_cast<int64_t>(1) << 40);
    EXPECT_DOUBLE_EQ(cfg.getDouble("x.ratio"), 0.75);
    EXPECT_TRUE(cfg.getBool("x.flag"));
    EXPECT_EQ(cfg.getInt("x.junk", -3), -3);
    EXPECT_EQ(cfg.keys("x.").size(), 5u);

    cfg.remove("x.int");
    EXPECT_FALSE(cfg.has("x.int"));
    EXPECT_EQ(cfg.getInt("x.int", 7), 7);
}

TEST_F(ConfigTest, ValidateNamesOffendingKey) {
    Config& cfg = Config::instance();
    cfg.set("agent.base_port", 70000);
    auto res = cfg.validate();
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::CONFIG_ERROR);
    EXPECT_NE(res.error().message.find("agent.base_port"), std::string::npos);

    cfg.reset();
    cfg.set("log.level", "chatty");
    EXPECT_FALSE(cfg.validate().ok());

    cfg.reset();
    cfg.set("network.fanout_threads", 0);
    EXPECT_FALSE(cfg.validate().ok());
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("");
        Logger::enableConsole(false);
        Logger::setLevel(LogLevel::TRACE);
        Logger::setAllowSensitiveLogging(false);
        Logger::clearLogs();
    }

    void TearDown() override {
        Logger::onLog(nullptr);
        Logger::setLevel(LogLevel::INFO);
        Logger::enableConsole(true);
        Logger::shutdown();
    }
};

TEST_F(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::WARN);
}

TEST_F(LoggerTest, LevelFilters) {
    Logger::setLevel(LogLevel::WARN);
    LOG_INFO("dropped");
    LOG_DEBUG("dropped");
    LOG_WARN("kept");
    LOG_ERROR("kept too");
    auto logs = Logger::getRecentLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].message, "kept");
    EXPECT_EQ(Logger::getErrorCount(), 1u);
}

TEST_F(LoggerTest, RedactsKeyMaterial) {
    std::vector<std::string> seen;
    Logger::onLog([&seen](const LogEntry& e) { seen.push_back(e.message); });
    LOG_INFO("loaded private_key=QUJDREVGRw== for agent 3");
    LOG_INFO("seed: c2VjcmV0");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "loaded private_key=[REDACTED] for agent 3");
    EXPECT_EQ(seen[1].find("c2VjcmV0"), std::string::npos);
    EXPECT_EQ(Logger::redactPrivateKey("QUJD"), "[REDACTED_KEY]");

    Logger::setAllowSensitiveLogging(true);
    LOG_INFO("private_key=QUJD");
    EXPECT_EQ(seen.back(), "private_key=QUJD");
}

TEST_F(LoggerTest, ErrorHandlerLogsAndCounts) {
    ErrorHandler::instance().clearErrors();
    std::vector<Error> handled;
    ErrorHandler::instance().setHandler([&handled](const Error& e) { handled.push_back(e); });
    ErrorHandler::instance().handle(makeError(ErrorCode::NETWORK_ERROR, "connection refused", "agent 4"));
    ErrorHandler::instance().handle(ErrorCode::AUTH_ERROR, "signature mismatch");
    ErrorHandler::instance().setHandler(nullptr);

    EXPECT_EQ(handled.size(), 2u);
    EXPECT_EQ(ErrorHandler::instance().getErrorCount(), 2u);
    EXPECT_EQ(ErrorHandler::instance().getErrorCount(ErrorCode::NETWORK_ERROR), 1u);
    EXPECT_EQ(ErrorHandler::instance().getLastError().code, ErrorCode::AUTH_ERROR);

    auto logs = Logger::getRecentLogs(2);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].category, "error");
    EXPECT_EQ(logs[0].message, "Network error: connection refused [agent 4]");
}

TEST(ErrorHandlingTest, ResultBasics) {
    Result<int> ok(5);
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.valueOr(9), 5);

    Result<int> bad = makeError(ErrorCode::NOT_FOUND, "missing");
    EXPECT_TRUE(bad.failed());
    EXPECT_EQ(bad.valueOr(9), 9);
    EXPECT_EQ(bad.error().describe(), "Not found: missing");

    Result<void> done;
    EXPECT_TRUE(done.ok());
}
