#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <sys/types.h>

/// @brief Raised when a subprocess cannot be started (fork or exec failure)
class ProcessLaunchError : public std::runtime_error {
public:
    explicit ProcessLaunchError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Outcome of a bounded, blocking command
struct CommandResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;

    bool success() const { return !timed_out && exit_code == 0; }
};

namespace process {

struct SpawnOptions {
    std::map<std::string, std::string> env;  // added to the inherited environment
    std::string working_dir;                 // empty = inherit
    bool quiet = false;                      // send stdout/stderr to /dev/null
};

/// @brief fork + execvp without waiting
/// Exec failure in the child is reported back through a close-on-exec pipe,
/// so a missing executable throws here instead of producing a dead child.
/// @return child pid
pid_t spawn(const std::vector<std::string>& argv, const SpawnOptions& options = {});

/// @brief Run a command to completion, capturing output
/// The child is killed with SIGKILL once timeout elapses.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::seconds timeout);

/// @brief Non-blocking reap
/// @return exit code if the child has exited (signal deaths map to 128+sig)
std::optional<int> try_reap(pid_t pid);

/// @brief SIGTERM, wait up to grace, then SIGKILL; always reaps
void terminate(pid_t pid, std::chrono::milliseconds grace);

/// @brief Shell-style rendering for log lines
std::string join_command(const std::vector<std::string>& argv);

} // namespace process
