#pragma once

#include "core/error_codes.h"

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace somaplay {
namespace player {

struct PlayerExit {
    bool exited = false;  // normal exit (exitCode valid)
    int exitCode = 0;
    int signal = 0;  // terminating signal when !exited

    ErrorCode toErrorCode() const;
};

PlayerExit decodeWaitStatus(int status);

// A running player whose stdout and stderr are merged into one pipe.
// Move-only; the destructor stops the process if it is still running.
class PlayerProcess {
   public:
    static std::optional<PlayerProcess> launch(const std::vector<std::string>& args,
                                               ErrorCode* error = nullptr);

    PlayerProcess(const PlayerProcess&) = delete;
    PlayerProcess& operator=(const PlayerProcess&) = delete;

    PlayerProcess(PlayerProcess&& other) noexcept;
    PlayerProcess& operator=(PlayerProcess&& other) noexcept;

    ~PlayerProcess();

    pid_t pid() const {
        return pid_;
    }
    // Read end of the combined output pipe; EOF once the player exits.
    int outputFd() const {
        return readFd_;
    }

    // Escalating SIGINT/SIGTERM/SIGKILL; no-op once reaped.
    PlayerExit stop();

    // Block until the player exits.
    PlayerExit wait();

   private:
    PlayerProcess(pid_t pid, int readFd);

    void release() noexcept;

    pid_t pid_ = -1;
    int readFd_ = -1;
    bool reaped_ = false;
    PlayerExit exit_;
};

}  // namespace player
}  // namespace somaplay
