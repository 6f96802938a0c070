#ifndef CONTROL_LOOP_HPP
#define CONTROL_LOOP_HPP

/**
 * @file control_loop.hpp
 * @brief Fixed cadence driver for the hysteresis controller
 */

#include "config_parser.hpp"
#include "hysteresis_controller.hpp"
#include <atomic>

class ControlLoop {
public:
    ControlLoop(HysteresisController& controller, const ControlParameters& params);
    ~ControlLoop() = default;

    /**
     * @brief Tick the controller at roughly 1 Hz until stop() is called
     *
     * Sensor failures are logged and skipped; once max_sensor_failures ticks
     * in a row have failed the loop gives up. A failed fan command ends the
     * loop immediately.
     *
     * @return true on shutdown via stop(), false on a fatal fault
     */
    bool run();

    /**
     * @brief Request shutdown; the current tick finishes first
     *
     * Only stores to a lock-free atomic, so it may be called from a signal
     * handler.
     */
    void stop();

    bool running() const { return running_.load(); }
    int consecutiveSensorFailures() const { return consecutive_failures_; }
    unsigned long tickCount() const { return tick_count_; }
    double loopDelay() const { return loop_delay_; }

    /**
     * @brief Pause between ticks
     *
     * Sampling already takes sample_count * sample_delay seconds, which is
     * subtracted from the 1 s period. If sampling alone takes a second or
     * more, a 10 ms floor is used.
     */
    static double loopDelay(int sample_count, double sample_delay);

    static constexpr double kLoopPeriod = 1.0;
    static constexpr double kMinLoopDelay = 0.01;

private:
    HysteresisController& controller_;
    double loop_delay_;
    int max_sensor_failures_;
    std::atomic<bool> running_;
    int consecutive_failures_;
    unsigned long tick_count_;
};

#endif // CONTROL_LOOP_HPP
