#pragma once

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace platform {

struct ProcessOptions {
    std::string input;             // written to the child's stdin, then closed
    bool capture_output = false;   // otherwise stdout goes to /dev/null
    bool quiet = false;            // send the child's stderr to /dev/null
};

struct ProcessResult {
    int exit_code = 0;             // 128 + signal when killed
    bool stopped = false;          // killed because stop was requested
    std::string output;
};

// fork/exec argv[0] from PATH and wait for it. Exit code 127 means the
// program could not be executed. A stop request kills the child.
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      const ProcessOptions& opts = {},
                                                      std::stop_token stop = {});

// True if `name` resolves to an executable on PATH.
bool find_in_path(const std::string& name);

} // namespace platform
