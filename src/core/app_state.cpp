#include "app_state.hpp"

namespace neo {

AppState::AppState()
    : running_(true), shutdown_signal_(0), started_at_(std::chrono::steady_clock::now()) {}

void AppState::shutdown(int signal) {
    int expected = 0;
    shutdown_signal_.compare_exchange_strong(expected, signal);
    running_ = false;
}

std::chrono::seconds AppState::uptime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_);
}

} // namespace neo
