#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace somaplay {
namespace process {

enum class OutputMode {
    Discard,  // stdout/stderr -> /dev/null
    Pipe,     // stdout and stderr share the given pipe write end
};

// posix_spawnp wrapper. stdin is always /dev/null. With OutputMode::Pipe
// both stdout and stderr are redirected to pipeWriteFd.
std::optional<pid_t> spawnProcess(const std::vector<std::string>& args,
                                  OutputMode mode = OutputMode::Discard, int pipeWriteFd = -1);

// Wait up to timeout for pid to exit; true when it was reaped.
bool waitForExit(pid_t pid, std::chrono::milliseconds timeout, int* status = nullptr);

// SIGINT, then SIGTERM, then SIGKILL, with a grace period between each.
// Returns the wait status of the reaped child.
int stopProcess(pid_t pid, std::chrono::milliseconds grace = std::chrono::milliseconds(500));

std::string toCommandString(const std::vector<std::string>& args);

// Collects fire-and-forget children so they do not linger as zombies.
class ChildReaper {
   public:
    ChildReaper() = default;
    ~ChildReaper();

    ChildReaper(const ChildReaper&) = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    void track(pid_t pid);

    // Non-blocking; returns how many children were reaped.
    size_t reapFinished();

    // Give outstanding children a bounded time to finish, then leave them.
    void waitAll(std::chrono::milliseconds timeout);

    size_t pending() const {
        return pids_.size();
    }

   private:
    std::vector<pid_t> pids_;
};

}  // namespace process
}  // namespace somaplay
