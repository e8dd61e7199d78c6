#include "player/player_process.h"

#include "logging/logger.h"
#include "process/spawn.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace somaplay {
namespace player {

ErrorCode PlayerExit::toErrorCode() const {
    if (exited) {
        return exitCode == 0 ? ErrorCode::OK : ErrorCode::PLAYER_EXITED_WITH_ERROR;
    }
    return ErrorCode::PLAYER_KILLED_BY_SIGNAL;
}

PlayerExit decodeWaitStatus(int status) {
    PlayerExit result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

std::optional<PlayerProcess> PlayerProcess::launch(const std::vector<std::string>& args,
                                                   ErrorCode* error) {
    if (error) {
        *error = ErrorCode::OK;
    }

    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) < 0) {
        LOG_ERROR("Cannot create player output pipe: {}", std::strerror(errno));
        if (error) {
            *error = ErrorCode::PLAYER_PIPE_FAILED;
        }
        return std::nullopt;
    }

    auto pid = process::spawnProcess(args, process::OutputMode::Pipe, fds[1]);
    // The child holds its own copy of the write end; ours must go so that
    // reading sees EOF when the player exits.
    close(fds[1]);

    if (!pid) {
        close(fds[0]);
        if (error) {
            *error = ErrorCode::PLAYER_SPAWN_FAILED;
        }
        return std::nullopt;
    }

    LOG_INFO("Started player pid={}: {}", *pid, process::toCommandString(args));
    return PlayerProcess(*pid, fds[0]);
}

PlayerProcess::PlayerProcess(pid_t pid, int readFd) : pid_(pid), readFd_(readFd) {}

PlayerProcess::PlayerProcess(PlayerProcess&& other) noexcept
    : pid_(other.pid_), readFd_(other.readFd_), reaped_(other.reaped_), exit_(other.exit_) {
    other.pid_ = -1;
    other.readFd_ = -1;
    other.reaped_ = true;
}

PlayerProcess& PlayerProcess::operator=(PlayerProcess&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();
    pid_ = other.pid_;
    readFd_ = other.readFd_;
    reaped_ = other.reaped_;
    exit_ = other.exit_;
    other.pid_ = -1;
    other.readFd_ = -1;
    other.reaped_ = true;
    return *this;
}

PlayerProcess::~PlayerProcess() {
    release();
}

PlayerExit PlayerProcess::stop() {
    if (pid_ > 0 && !reaped_) {
        exit_ = decodeWaitStatus(process::stopProcess(pid_));
        reaped_ = true;
    }
    return exit_;
}

PlayerExit PlayerProcess::wait() {
    if (pid_ > 0 && !reaped_) {
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                LOG_WARN("waitpid({}) failed: {}", pid_, std::strerror(errno));
                reaped_ = true;
                return exit_;
            }
        }
        exit_ = decodeWaitStatus(status);
        reaped_ = true;
    }
    return exit_;
}

void PlayerProcess::release() noexcept {
    if (pid_ > 0 && !reaped_) {
        exit_ = decodeWaitStatus(process::stopProcess(pid_));
        reaped_ = true;
    }
    if (readFd_ >= 0) {
        close(readFd_);
        readFd_ = -1;
    }
}

}  // namespace player
}  // namespace somaplay
