#pragma once

#include <dotkeep/result.hpp>
#include <string>
#include <vector>

namespace dotkeep {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// A timeout of 0 waits for the child indefinitely.
// Returns an Execution error when the child cannot enter working_dir or
// exec the program, or on timeout; IO errors cover pipe/fork failures.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 0);

// Run an external command attached to the caller's terminal (stdin, stdout
// and stderr inherited). Returns the exit code, with the same spawn errors
// as run_command.
Result<int> run_interactive(const std::vector<std::string>& args,
                            const std::string& working_dir = "");

// Split a command line such as "less -R" on whitespace. Quoting is not
// interpreted.
std::vector<std::string> split_command(const std::string& command);

} // namespace dotkeep
