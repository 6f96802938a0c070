/**
 * @file pwm_output.cpp
 * @brief Implementation of the sysfs PWM output
 */

#include "pwm_output.hpp"
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr unsigned long kNanosecondsPerSecond = 1000000000UL;

// The export completes asynchronously; udev may still be adjusting permissions
constexpr int kExportPollAttempts = 50;
constexpr useconds_t kExportPollIntervalUs = 10000;

} // namespace

SysfsPwmOutput::SysfsPwmOutput(const std::string& chip_path, int channel)
    : chip_path_(chip_path)
    , channel_override_(channel)
    , channel_(-1)
    , period_ns_(0)
    , enabled_(false)
{
}

int SysfsPwmOutput::channelForPin(unsigned pin) {
    switch (pin) {
        case 12:
        case 18:
        case 40:
            return 0;
        case 13:
        case 19:
        case 41:
        case 45:
            return 1;
        default:
            return -1;
    }
}

std::string SysfsPwmOutput::channelPath(int channel) const {
    return (fs::path(chip_path_) / ("pwm" + std::to_string(channel))).string();
}

void SysfsPwmOutput::writeAttribute(const std::string& path, unsigned long value) const {
    std::ofstream attr(path);
    if (!attr.is_open()) {
        throw ActuatorError("Failed to open PWM attribute: " + path);
    }

    attr << value;
    attr.flush();
    if (!attr) {
        throw ActuatorError("Failed to write " + std::to_string(value) + " to " + path);
    }
}

void SysfsPwmOutput::exportChannel(int channel) {
    std::error_code ec;
    std::string duty_path = channelPath(channel) + "/duty_cycle";
    if (fs::exists(duty_path, ec)) {
        return;
    }

    if (!fs::exists(chip_path_, ec)) {
        throw ActuatorError("PWM chip does not exist: " + chip_path_);
    }

    writeAttribute(chip_path_ + "/export", static_cast<unsigned long>(channel));

    for (int attempt = 0; attempt < kExportPollAttempts; ++attempt) {
        if (fs::exists(duty_path, ec) && access(duty_path.c_str(), W_OK) == 0) {
            return;
        }
        usleep(kExportPollIntervalUs);
    }

    throw ActuatorError("PWM channel " + std::to_string(channel) + " did not appear under " + chip_path_);
}

void SysfsPwmOutput::hardwarePwm(unsigned pin, unsigned frequency, unsigned duty_cycle) {
    if (frequency == 0) {
        throw std::invalid_argument("PWM frequency must be positive");
    }
    if (duty_cycle > kDutyCycleFullScale) {
        throw std::invalid_argument("PWM duty cycle out of range: " + std::to_string(duty_cycle));
    }

    int channel = channel_override_ >= 0 ? channel_override_ : channelForPin(pin);
    if (channel < 0) {
        throw std::invalid_argument("GPIO " + std::to_string(pin) + " has no hardware PWM channel");
    }

    if (channel != channel_) {
        exportChannel(channel);
        channel_ = channel;
        period_ns_ = 0;
        enabled_ = false;
    }

    std::string base = channelPath(channel_);
    unsigned period_ns = static_cast<unsigned>((kNanosecondsPerSecond + frequency / 2) / frequency);

    if (period_ns != period_ns_) {
        // duty_cycle may never exceed period, so clear it before shrinking the period
        writeAttribute(base + "/duty_cycle", 0);
        writeAttribute(base + "/period", period_ns);
        period_ns_ = period_ns;
    }

    unsigned long duty_ns = static_cast<unsigned long>(
        static_cast<unsigned long long>(period_ns) * duty_cycle / kDutyCycleFullScale);
    writeAttribute(base + "/duty_cycle", duty_ns);

    if (!enabled_) {
        writeAttribute(base + "/enable", 1);
        enabled_ = true;
    }
}
