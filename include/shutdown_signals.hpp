#ifndef SHUTDOWN_SIGNALS_HPP
#define SHUTDOWN_SIGNALS_HPP

/**
 * @file shutdown_signals.hpp
 * @brief Scoped SIGINT/SIGTERM routing to a control loop
 */

#include "control_loop.hpp"

/**
 * @brief Routes SIGINT and SIGTERM to ControlLoop::stop() while in scope
 *
 * The destructor restores the default dispositions before detaching the loop,
 * so no handler can reach a loop that is being destroyed, including during
 * stack unwinding. Only one instance may exist at a time.
 */
class ShutdownSignals {
public:
    explicit ShutdownSignals(ControlLoop& loop);
    ~ShutdownSignals();

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

    /// Loop currently receiving signals, or nullptr
    static ControlLoop* target();

private:
    static void signalHandler(int signal);
};

#endif // SHUTDOWN_SIGNALS_HPP
