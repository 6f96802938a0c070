/**
 * @file shutdown_signals.cpp
 * @brief Implementation of the scoped shutdown signal handlers
 */

#include "shutdown_signals.hpp"
#include <atomic>
#include <csignal>
#include <stdexcept>

namespace {

// Loop instance for signal handler access
std::atomic<ControlLoop*> g_loop{nullptr};

static_assert(std::atomic<ControlLoop*>::is_always_lock_free,
              "signal handler reads g_loop");

} // namespace

ShutdownSignals::ShutdownSignals(ControlLoop& loop) {
    ControlLoop* expected = nullptr;
    if (!g_loop.compare_exchange_strong(expected, &loop)) {
        throw std::logic_error("shutdown signals already routed to a control loop");
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

ShutdownSignals::~ShutdownSignals() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_loop.store(nullptr);
}

ControlLoop* ShutdownSignals::target() {
    return g_loop.load();
}

void ShutdownSignals::signalHandler(int /*signal*/) {
    ControlLoop* loop = g_loop.load();
    if (loop) {
        loop->stop();
    }
}
