#ifndef HYSTERESIS_CONTROLLER_HPP
#define HYSTERESIS_CONTROLLER_HPP

/**
 * @file hysteresis_controller.hpp
 * @brief Proportional fan control with an activation hysteresis band
 */

#include "config_parser.hpp"
#include "temperature_source.hpp"
#include "fan_actuator.hpp"
#include <vector>

enum class ControlState {
    Idle,    // fan stopped, activates at trigger_temp
    Active   // fan running, stops below trigger_temp - hysteresis
};

/**
 * @brief Outcome of one control tick
 */
struct TickResult {
    std::vector<int> samples;
    int temperature = 0;
    double effective_trigger = 0.0;
    int speed = 0;
    ControlState state = ControlState::Idle;
};

/**
 * @brief Samples the sensor and commands the fan, one decision per tick
 *
 * While Idle the fan stays off until the smoothed temperature reaches
 * trigger_temp. Once Active, the threshold drops by the hysteresis band and
 * the speed follows the temperature linearly from fan_active_min_speed at the
 * threshold to 100% at cpu_temp_max.
 */
class HysteresisController {
public:
    /**
     * The initial state is taken from the actuator: Active if the fan is
     * already running.
     */
    HysteresisController(const ControlParameters& params, TemperatureSource& source, FanActuator& fan);

    /**
     * @brief Sample, decide and command the fan once
     *
     * Blocks for cpu_temp_sample_count * cpu_temp_sample_delay seconds.
     *
     * @throws SensorError if a sample fails; no command is issued and the
     *         state is unchanged
     * @throws ActuatorError if the fan command fails; the state is unchanged
     */
    TickResult tick();

    /**
     * @brief Take the sample window and reduce it to one temperature
     *
     * Each sample is rounded to a whole degree, then the mean is rounded again.
     */
    int sampleTemperature(std::vector<int>& samples);

    double effectiveTrigger() const;
    ControlState state() const { return state_; }

    static const char* stateToString(ControlState state);

private:
    ControlParameters params_;
    TemperatureSource& source_;
    FanActuator& fan_;
    ControlState state_;
};

#endif // HYSTERESIS_CONTROLLER_HPP
