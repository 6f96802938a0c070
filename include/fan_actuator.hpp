#ifndef FAN_ACTUATOR_HPP
#define FAN_ACTUATOR_HPP

/**
 * @file fan_actuator.hpp
 * @brief Percentage speed control of a PWM fan
 */

#include "pwm_output.hpp"

class FanActuator {
public:
    /// 25 kHz is the carrier recommended for 4-wire PWM fans (inaudible)
    static constexpr unsigned kDefaultFrequency = 25000;

    /**
     * @brief Take control of the fan and stop it
     * @throws ActuatorError if the initial 0% command fails
     */
    FanActuator(PwmOutput& output, unsigned pin, unsigned frequency = kDefaultFrequency);

    /**
     * @brief Command the fan speed
     *
     * The hardware is always commanded, even if @p percent equals the current
     * speed.
     *
     * @throws std::invalid_argument if @p percent is outside [0, 100]
     * @throws ActuatorError if the PWM command fails; the recorded speed is kept
     */
    void setSpeed(int percent);

    /// Last successfully commanded speed in percent
    int getSpeed() const { return speed_percent_; }

    unsigned pin() const { return pin_; }
    unsigned frequency() const { return frequency_; }

private:
    PwmOutput& output_;
    unsigned pin_;
    unsigned frequency_;
    int speed_percent_;
};

#endif // FAN_ACTUATOR_HPP
