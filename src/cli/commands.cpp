#include "cli/commands.h"
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace liarslie::cli {

namespace {

using Options = std::map<std::string, std::string>;

struct CommandSpec {
    CommandKind kind;
    std::set<std::string> required;
    std::set<std::string> optional;
};

const std::map<std::string, CommandSpec>& commandTable() {
    static const std::map<std::string, CommandSpec> table = {
        {"start", {CommandKind::START, {"value", "max-value", "num-agents", "liar-ratio"}, {"tamper-chance"}}},
        {"play", {CommandKind::PLAY, {}, {}}},
        {"extend", {CommandKind::EXTEND, {"num-agents", "liar-ratio"}, {}}},
        {"play-expert", {CommandKind::PLAY_EXPERT, {"num-agents", "liar-ratio"}, {}}},
        {"kill", {CommandKind::KILL, {"id"}, {}}},
        {"stop", {CommandKind::STOP, {}, {}}},
        {"help", {CommandKind::HELP, {}, {}}},
    };
    return table;
}

Result<Options> collectOptions(const std::string& name, const CommandSpec& spec,
                               const std::vector<std::string>& tokens) {
    Options opts;
    for (size_t i = 1; i < tokens.size(); i++) {
        const std::string& tok = tokens[i];
        if (tok.size() < 3 || tok.compare(0, 2, "--") != 0) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "unexpected argument '" + tok + "' for " + name);
        }
        std::string key = tok.substr(2);
        std::string value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        } else {
            if (i + 1 >= tokens.size()) {
                return makeError(ErrorCode::INVALID_ARGUMENT, "option --" + key + " requires a value");
            }
            value = tokens[++i];
        }
        if (!spec.required.count(key) && !spec.optional.count(key)) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "unknown option --" + key + " for " + name);
        }
        if (opts.count(key)) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "option --" + key + " given twice");
        }
        opts[key] = value;
    }
    for (const auto& req : spec.required) {
        if (!opts.count(req)) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "missing required option --" + req + " for " + name);
        }
    }
    return opts;
}

Result<uint64_t> parseUnsigned(const std::string& key, const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return makeError(ErrorCode::INVALID_ARGUMENT, "--" + key + " expects a non-negative integer");
    }
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(text, &pos, 10);
        if (pos != text.size()) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "--" + key + " expects a non-negative integer");
        }
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "--" + key + " is not a valid integer: " + text);
    }
}

Result<double> parseRatio(const std::string& key, const std::string& text) {
    double v = 0.0;
    try {
        size_t pos = 0;
        v = std::stod(text, &pos);
        if (pos != text.size()) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "--" + key + " is not a number: " + text);
        }
    } catch (const std::logic_error&) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "--" + key + " is not a number: " + text);
    }
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        return makeError(ErrorCode::INVALID_ARGUMENT,
                         "--" + key + " must be within the range of 0.0 to 1.0 (inclusive)");
    }
    return v;
}

Result<void> validateStart(const core::StartOptions& s) {
    LIARSLIE_CHECK(s.value > 0, ErrorCode::INVALID_ARGUMENT, "--value must be greater than 0");
    LIARSLIE_CHECK(s.value <= s.maxValue, ErrorCode::INVALID_ARGUMENT,
                   "--value cannot be greater than --max-value");
    LIARSLIE_CHECK(s.maxValue > 1, ErrorCode::INVALID_ARGUMENT, "--max-value must be greater than 1");
    LIARSLIE_CHECK(s.numAgents > 0, ErrorCode::INVALID_ARGUMENT, "--num-agents must be greater than 0");
    return {};
}

}

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

Result<Command> parseCommand(const std::string& line) {
    std::vector<std::string> tokens = tokenize(line);
    if (tokens.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "empty command");
    }
    const std::string& name = tokens[0];
    auto it = commandTable().find(name);
    if (it == commandTable().end()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "unrecognized command '" + name + "'");
    }
    auto opts = collectOptions(name, it->second, tokens);
    if (!opts.ok()) return opts.error();
    const Options& o = opts.value();

    Command cmd;
    cmd.kind = it->second.kind;

    auto number = [&o](const std::string& key, uint64_t& out) -> Result<void> {
        auto v = parseUnsigned(key, o.at(key));
        if (!v.ok()) return v.error();
        out = v.value();
        return {};
    };
    auto ratio = [&o](const std::string& key, double& out) -> Result<void> {
        auto v = parseRatio(key, o.at(key));
        if (!v.ok()) return v.error();
        out = v.value();
        return {};
    };

    Result<void> r;
    switch (cmd.kind) {
        case CommandKind::START:
            if ((r = number("value", cmd.start.value)).failed()) return r.error();
            if ((r = number("max-value", cmd.start.maxValue)).failed()) return r.error();
            if ((r = number("num-agents", cmd.start.numAgents)).failed()) return r.error();
            if ((r = ratio("liar-ratio", cmd.start.liarRatio)).failed()) return r.error();
            if (o.count("tamper-chance") && (r = ratio("tamper-chance", cmd.start.tamperChance)).failed()) {
                return r.error();
            }
            if ((r = validateStart(cmd.start)).failed()) return r.error();
            break;
        case CommandKind::EXTEND:
        case CommandKind::PLAY_EXPERT:
            if ((r = number("num-agents", cmd.numAgents)).failed()) return r.error();
            if ((r = ratio("liar-ratio", cmd.liarRatio)).failed()) return r.error();
            LIARSLIE_CHECK(cmd.numAgents > 0, ErrorCode::INVALID_ARGUMENT, "--num-agents must be greater than 0");
            break;
        case CommandKind::KILL:
            if ((r = number("id", cmd.agentId)).failed()) return r.error();
            break;
        case CommandKind::PLAY:
        case CommandKind::STOP:
        case CommandKind::HELP:
            break;
    }
    return cmd;
}

std::string helpText() {
    return
        "Commands:\n"
        "  start --value V --max-value M --num-agents N --liar-ratio R [--tamper-chance T]\n"
        "      spawn N agents, a fraction R of them liars, and write the roster file\n"
        "  play\n"
        "      query every agent directly and infer the network value\n"
        "  extend --num-agents N --liar-ratio R\n"
        "      spawn N more agents and add them to the roster\n"
        "  play-expert --num-agents N --liar-ratio R\n"
        "      ask a random subset of agents to relay the values of every other agent\n"
        "  kill --id ID\n"
        "      kill one agent\n"
        "  stop\n"
        "      kill every agent, remove the roster file and exit\n"
        "  help\n"
        "      show this text\n";
}

}
