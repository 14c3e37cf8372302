#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/game.h"
#include "infrastructure/error_handling.h"

namespace liarslie::cli {

enum class CommandKind {
    START,
    PLAY,
    EXTEND,
    PLAY_EXPERT,
    KILL,
    STOP,
    HELP
};

struct Command {
    CommandKind kind = CommandKind::HELP;
    core::StartOptions start;
    uint64_t numAgents = 0;
    double liarRatio = 0.0;
    uint64_t agentId = 0;
};

std::vector<std::string> tokenize(const std::string& line);

// Parses and validates one REPL line. INVALID_ARGUMENT on unknown commands,
// unknown or repeated options, missing options and out-of-range values.
Result<Command> parseCommand(const std::string& line);

std::string helpText();

}
