#include "core/graceful_shutdown.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <initializer_list>

namespace somaplay {
namespace graceful_shutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.shutdown = 1;
}

bool installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART

    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        if (sigaction(sig, &action, nullptr) < 0) {
            LOG_ERROR("[Signals] sigaction({}) failed: {}", sig, std::strerror(errno));
            return false;
        }
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) < 0) {
        LOG_WARN("[Signals] Cannot ignore SIGPIPE: {}", std::strerror(errno));
    }
    return true;
}

bool Controller::processPendingSignals() {
    if (!signalState_ || !signalState_->shutdown) {
        return false;
    }

    signalState_->shutdown = 0;
    lastSignal_ = signalState_->received;

    const bool wasRunning = running_.exchange(false);
    if (onLog_) {
        char line[80];
        std::snprintf(line, sizeof(line), "[Signals] signal %d, %s", lastSignal_,
                      wasRunning ? "stopping player" : "already stopping");
        onLog_(line);
    }
    if (wasRunning && onStop_) {
        onStop_();
    }
    return true;
}

}  // namespace graceful_shutdown
}  // namespace somaplay
