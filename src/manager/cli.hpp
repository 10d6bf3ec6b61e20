#pragma once

#include "agent_registry.hpp"

#include <expected>
#include <string>
#include <vector>

struct CommandLine {
    bool verbose = false;
    bool all = false;
    bool as_json = false;
    bool help = false;
    std::string config_path;
    Selector selector;
    std::vector<std::string> positional;
};

// Error holds a one-line message for usage errors (missing option values,
// unknown options, no command).
std::expected<CommandLine, std::string> parse_command_line(int argc, const char* const argv[]);
