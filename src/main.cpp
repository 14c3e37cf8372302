#include "cli/commands.h"
#include "core/game.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"

#include <csignal>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

using namespace liarslie;

struct LaunchOptions {
    std::string configPath;
    std::string rosterPath;
    std::string logLevel;
};

void printHelp(const char* progName) {
    std::cout << "Liars Lie - distributed value oracle game\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE     Read key=value settings from FILE\n";
    std::cout << "  -r, --roster FILE     Roster file (default agents.config)\n";
    std::cout << "  -l, --loglevel LEVEL  trace, debug, info, warn, error, off\n";
    std::cout << "  -h, --help            Show this help\n\n";
    std::cout << cli::helpText();
}

// 0 to continue, 1 on error, 2 when help was printed.
int parseArgs(int argc, char* argv[], LaunchOptions& opts) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"config", required_argument, nullptr, 'c'},
        {"roster", required_argument, nullptr, 'r'},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hc:r:l:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                printHelp(argv[0]);
                return 2;
            case 'c':
                opts.configPath = optarg;
                break;
            case 'r':
                opts.rosterPath = optarg;
                break;
            case 'l':
                opts.logLevel = optarg;
                break;
            default:
                return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return 1;
    }
    return 0;
}

static void printNetworkValue(const core::RoundOutcome& outcome) {
    if (!outcome.networkValue) {
        std::cout << "[!] No valid values were received, the network value is unknown.\n\n";
        return;
    }
    const auto& values = *outcome.networkValue;
    if (values.size() == 1) {
        std::cout << "[+] The network value is: " << values[0] << "\n\n";
        return;
    }
    std::cout << "[+] Unable to determine a single network value.\n";
    std::cout << "[+] The following values are tied: ";
    for (size_t i = 0; i < values.size(); i++) {
        if (i) std::cout << ", ";
        std::cout << values[i];
    }
    std::cout << "\n\n";
}

static void printError(const Error& err) {
    std::cout << "[!] error: " << err.message;
    if (!err.context.empty()) std::cout << " (" << err.context << ")";
    std::cout << "\n\n";
}

// Returns false when the REPL should exit.
static bool execute(core::Game& game, const cli::Command& cmd) {
    switch (cmd.kind) {
        case cli::CommandKind::HELP:
            std::cout << cli::helpText() << "\n";
            return true;

        case cli::CommandKind::START: {
            std::cout << "[+] Starting game!\n\n";
            auto r = game.start(cmd.start);
            if (!r.ok()) {
                printError(r.error());
                return true;
            }
            std::cout << "[+] Game is ready! " << game.readyCount() << " agents listed in "
                      << game.settings().rosterPath << "\n\n";
            return true;
        }

        case cli::CommandKind::PLAY: {
            std::cout << "[+] Playing a standard round...\n\n";
            auto r = game.play();
            if (!r.ok()) {
                printError(r.error());
                return true;
            }
            std::cout << "[+] Queried " << r.value().subset.size() << " agents, "
                      << r.value().votes.size() << " valid signed replies.\n";
            printNetworkValue(r.value());
            return true;
        }

        case cli::CommandKind::EXTEND: {
            auto r = game.extend(cmd.numAgents, cmd.liarRatio);
            if (!r.ok()) {
                printError(r.error());
                return true;
            }
            std::cout << "[+] Game extended, " << game.readyCount() << " agents are running.\n\n";
            return true;
        }

        case cli::CommandKind::PLAY_EXPERT: {
            std::cout << "[+] Playing an expert round...\n\n";
            auto r = game.playExpert(cmd.numAgents, cmd.liarRatio);
            if (!r.ok()) {
                printError(r.error());
                return true;
            }
            std::cout << "[+] The following agents compose this round's expert subset: ";
            for (size_t i = 0; i < r.value().subset.size(); i++) {
                if (i) std::cout << ", ";
                std::cout << r.value().subset[i].agentId;
            }
            std::cout << "\n\n[+] Received valid, signed replies from " << r.value().votes.size()
                      << " agents!\n";
            printNetworkValue(r.value());
            return true;
        }

        case cli::CommandKind::KILL: {
            auto r = game.kill(cmd.agentId);
            if (!r.ok()) {
                printError(r.error());
                return true;
            }
            std::cout << "[+] Agent " << cmd.agentId << " was killed.\n\n";
            return true;
        }

        case cli::CommandKind::STOP: {
            std::cout << "[+] Stopping all agents...\n\n";
            auto r = game.stop();
            if (!r.ok()) {
                printError(r.error());
                // agents are already down unless the game was never started
                return r.error().code == ErrorCode::INVALID_STATE;
            }
            std::cout << "[+] All agents stopped. Bye!\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    LaunchOptions launch;
    int parsed = parseArgs(argc, argv, launch);
    if (parsed == 2) return 0;
    if (parsed != 0) {
        printHelp(argv[0]);
        return 1;
    }

    auto& config = utils::Config::instance();
    if (!launch.configPath.empty() && !config.load(launch.configPath)) {
        std::cerr << "Cannot read config file " << launch.configPath << "\n";
        return 1;
    }
    if (!launch.rosterPath.empty()) config.set("game.roster_path", launch.rosterPath);
    if (!launch.logLevel.empty()) config.set("log.level", launch.logLevel);

    auto valid = config.validate();
    if (!valid.ok()) {
        std::cerr << valid.error().describe() << "\n";
        return 1;
    }

    utils::LogSettings logSettings = config.getLogSettings();
    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::Logger::parseLevel(logSettings.level, level)) level = utils::LogLevel::INFO;
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(logSettings.console);
    utils::Logger::init(logSettings.file);

    std::unique_ptr<core::Game> game;
    try {
        game = std::make_unique<core::Game>(config.getGameSettings());
    } catch (const std::runtime_error& e) {
        LOG_FATAL(std::string("cannot create client identity: ") + e.what());
        return 1;
    }

    std::cout << "\n>>>>> Welcome to Liars Lie! <<<<<\n\n";
    std::cout << "Type 'help' for a list of commands.\n\n";

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (cli::tokenize(line).empty()) continue;

        auto cmd = cli::parseCommand(line);
        if (!cmd.ok()) {
            printError(cmd.error());
            continue;
        }
        if (!execute(*game, cmd.value())) break;
    }

    game.reset();
    utils::Logger::shutdown();
    return 0;
}
