#include "process/spawn.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace somaplay {
namespace process {

namespace {

// RAII holder for posix_spawn_file_actions_t
class FileActions {
   public:
    FileActions() {
        ok_ = (posix_spawn_file_actions_init(&actions_) == 0);
    }
    ~FileActions() {
        if (ok_) {
            posix_spawn_file_actions_destroy(&actions_);
        }
    }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    bool ok() const {
        return ok_;
    }
    posix_spawn_file_actions_t* get() {
        return &actions_;
    }

   private:
    posix_spawn_file_actions_t actions_{};
    bool ok_ = false;
};

// RAII holder for posix_spawnattr_t. Children start with default handlers
// for the signals we ignore or catch, and an empty signal mask.
class SpawnAttr {
   public:
    SpawnAttr() {
        initialized_ = (posix_spawnattr_init(&attr_) == 0);
        if (!initialized_) {
            return;
        }
        sigset_t defaults;
        sigemptyset(&defaults);
        for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE}) {
            sigaddset(&defaults, sig);
        }
        sigset_t emptyMask;
        sigemptyset(&emptyMask);
        const auto flags = static_cast<short>(POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
        ok_ = posix_spawnattr_setsigdefault(&attr_, &defaults) == 0 &&
              posix_spawnattr_setsigmask(&attr_, &emptyMask) == 0 &&
              posix_spawnattr_setflags(&attr_, flags) == 0;
    }
    ~SpawnAttr() {
        if (initialized_) {
            posix_spawnattr_destroy(&attr_);
        }
    }
    SpawnAttr(const SpawnAttr&) = delete;
    SpawnAttr& operator=(const SpawnAttr&) = delete;

    bool ok() const {
        return ok_;
    }
    posix_spawnattr_t* get() {
        return &attr_;
    }

   private:
    posix_spawnattr_t attr_{};
    bool initialized_ = false;
    bool ok_ = false;
};

}  // namespace

std::optional<pid_t> spawnProcess(const std::vector<std::string>& args, OutputMode mode,
                                  int pipeWriteFd) {
    if (args.empty() || args[0].empty()) {
        LOG_ERROR("[spawn] empty command");
        return std::nullopt;
    }
    if (mode == OutputMode::Pipe && pipeWriteFd < 0) {
        LOG_ERROR("[spawn] pipe output requested without a descriptor");
        return std::nullopt;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    FileActions actions;
    if (!actions.ok()) {
        LOG_ERROR("[spawn] posix_spawn_file_actions_init failed");
        return std::nullopt;
    }
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (mode == OutputMode::Pipe) {
        posix_spawn_file_actions_adddup2(actions.get(), pipeWriteFd, STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(actions.get(), pipeWriteFd, STDERR_FILENO);
    } else {
        posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(actions.get(), STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    }

    SpawnAttr attr;
    if (!attr.ok()) {
        LOG_ERROR("[spawn] posix_spawnattr setup failed");
        return std::nullopt;
    }

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0].c_str(), actions.get(), attr.get(), argv.data(), environ);
    if (rc != 0) {
        LOG_ERROR("[spawn] Failed to spawn {}: {} ({})", args[0], rc, std::strerror(rc));
        return std::nullopt;
    }
    LOG_DEBUG("[spawn] pid={} cmd={}", pid, toCommandString(args));
    return pid;
}

bool waitForExit(pid_t pid, std::chrono::milliseconds timeout, int* status) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int localStatus = 0;
    while (true) {
        pid_t ret = waitpid(pid, &localStatus, WNOHANG);
        if (ret == pid) {
            if (status) {
                *status = localStatus;
            }
            return true;
        }
        if (ret < 0 && errno != EINTR) {
            // Not our child (or already reaped)
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

int stopProcess(pid_t pid, std::chrono::milliseconds grace) {
    int status = 0;
    if (pid <= 0) {
        return status;
    }
    if (waitForExit(pid, std::chrono::milliseconds(0), &status)) {
        return status;
    }
    kill(pid, SIGINT);
    if (waitForExit(pid, grace, &status)) {
        return status;
    }
    kill(pid, SIGTERM);
    if (waitForExit(pid, grace, &status)) {
        return status;
    }
    LOG_WARN("[spawn] pid={} ignored SIGINT/SIGTERM, killing", pid);
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

std::string toCommandString(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        const bool quote = args[i].empty() || args[i].find(' ') != std::string::npos;
        if (quote) {
            out += '"';
            out += args[i];
            out += '"';
        } else {
            out += args[i];
        }
    }
    return out;
}

ChildReaper::~ChildReaper() {
    reapFinished();
}

void ChildReaper::track(pid_t pid) {
    if (pid > 0) {
        pids_.push_back(pid);
    }
}

size_t ChildReaper::reapFinished() {
    size_t reaped = 0;
    auto it = std::remove_if(pids_.begin(), pids_.end(), [&reaped](pid_t pid) {
        int status = 0;
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid || (ret < 0 && errno == ECHILD)) {
            ++reaped;
            return true;
        }
        return false;
    });
    pids_.erase(it, pids_.end());
    return reaped;
}

void ChildReaper::waitAll(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pids_.empty()) {
        reapFinished();
        if (pids_.empty() || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!pids_.empty()) {
        LOG_DEBUG("[spawn] {} notification process(es) still running at exit", pids_.size());
    }
}

}  // namespace process
}  // namespace somaplay
