#ifndef PWM_OUTPUT_HPP
#define PWM_OUTPUT_HPP

/**
 * @file pwm_output.hpp
 * @brief Hardware PWM channel abstraction and Linux sysfs implementation
 */

#include <string>
#include <stdexcept>

/**
 * @brief Raised when the PWM hardware rejects a command
 */
class ActuatorError : public std::runtime_error {
public:
    explicit ActuatorError(const std::string& what) : std::runtime_error(what) {}
};

class PwmOutput {
public:
    /// Full scale of the duty cycle argument (1,000,000 == 100%)
    static constexpr unsigned kDutyCycleFullScale = 1000000;

    virtual ~PwmOutput() = default;

    /**
     * @brief Drive @p pin at @p frequency Hz with @p duty_cycle out of kDutyCycleFullScale
     * @throws std::invalid_argument for an unusable pin, frequency or duty cycle
     * @throws ActuatorError if the hardware command fails
     */
    virtual void hardwarePwm(unsigned pin, unsigned frequency, unsigned duty_cycle) = 0;
};

/**
 * @brief PWM output through /sys/class/pwm/pwmchipN
 *
 * The channel is exported on first use and left running on destruction so the
 * fan keeps its last speed if the daemon exits.
 */
class SysfsPwmOutput : public PwmOutput {
public:
    /**
     * @param chip_path e.g. /sys/class/pwm/pwmchip0
     * @param channel Channel on the chip, or -1 to derive it from the GPIO pin
     */
    explicit SysfsPwmOutput(const std::string& chip_path, int channel = -1);

    void hardwarePwm(unsigned pin, unsigned frequency, unsigned duty_cycle) override;

    /**
     * @brief Hardware PWM channel of a Raspberry Pi GPIO pin
     * @return Channel number, or -1 if the pin has no hardware PWM
     */
    static int channelForPin(unsigned pin);

private:
    std::string chip_path_;
    int channel_override_;
    int channel_;
    unsigned period_ns_;
    bool enabled_;

    std::string channelPath(int channel) const;
    void exportChannel(int channel);
    void writeAttribute(const std::string& path, unsigned long value) const;
};

#endif // PWM_OUTPUT_HPP
