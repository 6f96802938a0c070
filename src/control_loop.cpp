/**
 * @file control_loop.cpp
 * @brief Implementation of the control loop
 */

#include "control_loop.hpp"
#include "logger.hpp"
#include <chrono>
#include <thread>

static_assert(std::atomic<bool>::is_always_lock_free,
              "ControlLoop::stop() must be async-signal-safe");

ControlLoop::ControlLoop(HysteresisController& controller, const ControlParameters& params)
    : controller_(controller)
    , loop_delay_(loopDelay(params.cpu_temp_sample_count, params.cpu_temp_sample_delay))
    , max_sensor_failures_(params.max_sensor_failures)
    , running_(true)
    , consecutive_failures_(0)
    , tick_count_(0)
{
}

double ControlLoop::loopDelay(int sample_count, double sample_delay) {
    double sample_time = sample_count * sample_delay;
    if (sample_time < kLoopPeriod) {
        return kLoopPeriod - sample_time;
    }
    return kMinLoopDelay;
}

bool ControlLoop::run() {
    while (running_.load()) {
        try {
            controller_.tick();
            consecutive_failures_ = 0;
        } catch (const SensorError& e) {
            ++consecutive_failures_;
            Logger::error(std::string(e.what()) + ", keeping current fan speed (" +
                          std::to_string(consecutive_failures_) + " consecutive failure(s))");

            if (max_sensor_failures_ > 0 && consecutive_failures_ >= max_sensor_failures_) {
                Logger::error("Temperature sensor failed " + std::to_string(consecutive_failures_) +
                              " times in a row, giving up");
                return false;
            }
        } catch (const ActuatorError& e) {
            Logger::error(std::string("Fan command failed: ") + e.what());
            return false;
        }

        ++tick_count_;

        if (!running_.load()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(loop_delay_));
    }

    Logger::info("Control loop stopped after " + std::to_string(tick_count_) + " tick(s)");
    return true;
}

void ControlLoop::stop() {
    running_.store(false);
}
