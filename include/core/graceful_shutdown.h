#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace somaplay {
namespace graceful_shutdown {

// Written only from signalHandler; drained by Controller on the main thread.
struct SignalState {
    volatile sig_atomic_t shutdown = 0;
    volatile sig_atomic_t received = 0;  // signal number, for the log line

    void reset() {
        shutdown = received = 0;
    }
};

// Turns a pending signal into one stop-player call and a cleared running
// flag. The session polls isRunning() between lines.
class Controller {
   public:
    using StopPlayerCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    void setSignalState(SignalState* state) { signalState_ = state; }
    void setStopPlayerCallback(StopPlayerCallback cb) { onStop_ = std::move(cb); }
    void setLogCallback(LogCallback cb) { onLog_ = std::move(cb); }

    // true when a shutdown request was consumed by this call
    bool processPendingSignals();

    bool isRunning() const { return running_.load(); }
    int getLastSignal() const { return lastSignal_; }

   private:
    SignalState* signalState_ = nullptr;
    StopPlayerCallback onStop_;
    LogCallback onLog_;
    std::atomic<bool> running_{true};
    int lastSignal_ = 0;
};

// Async-signal-safe.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

// Install signalHandler for SIGINT, SIGTERM and SIGHUP without SA_RESTART,
// so a read blocked on the player pipe returns EINTR. SIGPIPE is ignored.
bool installSignalHandlers();

}  // namespace graceful_shutdown
}  // namespace somaplay
