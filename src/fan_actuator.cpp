/**
 * @file fan_actuator.cpp
 * @brief Implementation of the PWM fan actuator
 */

#include "fan_actuator.hpp"
#include <string>

namespace {

constexpr unsigned kDutyPerPercent = PwmOutput::kDutyCycleFullScale / 100;

} // namespace

FanActuator::FanActuator(PwmOutput& output, unsigned pin, unsigned frequency)
    : output_(output)
    , pin_(pin)
    , frequency_(frequency)
    , speed_percent_(0)
{
    setSpeed(0);
}

void FanActuator::setSpeed(int percent) {
    if (percent < 0 || percent > 100) {
        throw std::invalid_argument("Invalid fan speed: " + std::to_string(percent) + "%");
    }

    output_.hardwarePwm(pin_, frequency_, static_cast<unsigned>(percent) * kDutyPerPercent);
    speed_percent_ = percent;
}
