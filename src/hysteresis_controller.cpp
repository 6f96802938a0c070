/**
 * @file hysteresis_controller.cpp
 * @brief Implementation of the hysteresis fan controller
 */

#include "hysteresis_controller.hpp"
#include "speed_mapper.hpp"
#include "logger.hpp"
#include <cmath>
#include <chrono>
#include <thread>
#include <sstream>

namespace {

std::string formatSamples(const std::vector<int>& samples) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < samples.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << samples[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace

HysteresisController::HysteresisController(const ControlParameters& params,
                                           TemperatureSource& source,
                                           FanActuator& fan)
    : params_(params)
    , source_(source)
    , fan_(fan)
    , state_(fan.getSpeed() > 0 ? ControlState::Active : ControlState::Idle)
{
}

int HysteresisController::sampleTemperature(std::vector<int>& samples) {
    samples.clear();
    samples.reserve(static_cast<size_t>(params_.cpu_temp_sample_count));

    // nearbyint rounds half to even in the default rounding mode
    for (int i = 0; i < params_.cpu_temp_sample_count; ++i) {
        samples.push_back(static_cast<int>(std::nearbyint(source_.read())));
        if (params_.cpu_temp_sample_delay > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(params_.cpu_temp_sample_delay));
        }
    }

    double sum = 0.0;
    for (int sample : samples) {
        sum += sample;
    }
    return static_cast<int>(std::nearbyint(sum / samples.size()));
}

double HysteresisController::effectiveTrigger() const {
    if (state_ == ControlState::Active) {
        return params_.trigger_temp - params_.hysteresis;
    }
    return params_.trigger_temp;
}

TickResult HysteresisController::tick() {
    TickResult result;
    result.temperature = sampleTemperature(result.samples);
    Logger::info("CPU temp samples: " + formatSamples(result.samples));
    Logger::info("Averaged CPU temp: " + std::to_string(result.temperature));

    result.effective_trigger = effectiveTrigger();
    Logger::info("Current fan speed percent: " + std::to_string(fan_.getSpeed()) +
                 ", Trigger: " + Logger::formatTemperature(result.effective_trigger) + "C");

    if (result.temperature < result.effective_trigger) {
        result.speed = 0;
    } else {
        double fanspeed = clampedMap(result.temperature,
                                     result.effective_trigger,
                                     params_.cpu_temp_max,
                                     params_.fan_active_min_speed,
                                     100.0);
        result.speed = static_cast<int>(fanspeed);
    }

    fan_.setSpeed(result.speed);
    state_ = result.speed > 0 ? ControlState::Active : ControlState::Idle;
    result.state = state_;

    Logger::info("Set fan speed percent to " + std::to_string(result.speed) +
                 " (" + stateToString(state_) + ")");
    return result;
}

const char* HysteresisController::stateToString(ControlState state) {
    switch (state) {
        case ControlState::Idle:
            return "IDLE";
        case ControlState::Active:
            return "ACTIVE";
    }
    return "UNKNOWN";
}
