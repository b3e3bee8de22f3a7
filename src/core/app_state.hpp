#pragma once

#include <atomic>
#include <chrono>

namespace neo {

// Process-wide lifecycle flag. shutdown() only touches atomics, so it may be called from a
// signal handler.
class AppState {
public:
    AppState();

    void shutdown(int signal = 0);
    bool is_running() const { return running_; }

    // Signal that requested the shutdown, 0 when none did
    int shutdown_signal() const { return shutdown_signal_; }

    std::chrono::seconds uptime() const;

private:
    std::atomic<bool> running_;
    std::atomic<int> shutdown_signal_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace neo
