#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;
    std::string output; // stdout and stderr interleaved
    bool timed_out = false;

    bool ok() const { return !timed_out && exit_code == 0; }
};

// Runs argv[0] from PATH in cwd with stdin on /dev/null. A zero timeout means
// no limit; on expiry the child is killed and timed_out is set. Throws
// std::runtime_error when the child cannot be started.
CommandResult run_command(const std::vector<std::string>& args,
                          const std::filesystem::path& cwd,
                          std::chrono::seconds timeout = std::chrono::seconds(0),
                          const std::vector<std::string>& extra_env = {});
