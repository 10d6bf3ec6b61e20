#pragma once

#include <expected>
#include <string>
#include <utility>
#include <vector>

struct CommandResult {
    int exit_code = 0;
    std::string out; // captured stdout
};

// Runs argv[0] from PATH, waits for it, and captures its stdout. stderr and
// stdin are inherited so prompts and diagnostics reach the terminal.
// `env` entries are set in the child before exec.
std::expected<CommandResult, std::string>
    run_command(const std::vector<std::string>& argv,
                const std::vector<std::pair<std::string, std::string>>& env = {});
