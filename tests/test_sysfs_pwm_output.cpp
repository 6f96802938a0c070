#include "../include/pwm_output.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

fs::path scratchChip(const std::string& name) {
    fs::path chip = fs::temp_directory_path() /
                    ("fanctl_pwm_" + std::to_string(getpid()) + "_" + name) / "pwmchip0";
    fs::create_directories(chip);
    std::ofstream(chip / "export").put('\n');
    return chip;
}

// Pre-create an exported channel, as the kernel would after an export
void exportFake(const fs::path& chip, int channel) {
    fs::path dir = chip / ("pwm" + std::to_string(channel));
    fs::create_directories(dir);
    for (const char* attr : {"period", "duty_cycle", "enable"}) {
        std::ofstream(dir / attr) << 0;
    }
}

std::string readAttr(const fs::path& path) {
    std::ifstream in(path);
    std::string value;
    std::getline(in, value);
    return value;
}

} // namespace

void test_channel_mapping() {
    assert(SysfsPwmOutput::channelForPin(12) == 0);
    assert(SysfsPwmOutput::channelForPin(18) == 0);
    assert(SysfsPwmOutput::channelForPin(13) == 1);
    assert(SysfsPwmOutput::channelForPin(19) == 1);
    assert(SysfsPwmOutput::channelForPin(4) == -1);
    assert(SysfsPwmOutput::channelForPin(17) == -1);
    std::cout << "✓ GPIO pins mapped to PWM channels" << std::endl;
}

void test_writes_period_duty_and_enable() {
    fs::path chip = scratchChip("write");
    exportFake(chip, 1);
    SysfsPwmOutput pwm(chip.string());

    pwm.hardwarePwm(13, 25000, 500000);
    assert(readAttr(chip / "pwm1" / "period") == "40000");
    assert(readAttr(chip / "pwm1" / "duty_cycle") == "20000");
    assert(readAttr(chip / "pwm1" / "enable") == "1");

    pwm.hardwarePwm(13, 25000, 1000000);
    assert(readAttr(chip / "pwm1" / "duty_cycle") == "40000");

    pwm.hardwarePwm(13, 25000, 0);
    assert(readAttr(chip / "pwm1" / "duty_cycle") == "0");

    // Frequency change rewrites the period
    pwm.hardwarePwm(13, 20000, 250000);
    assert(readAttr(chip / "pwm1" / "period") == "50000");
    assert(readAttr(chip / "pwm1" / "duty_cycle") == "12500");

    fs::remove_all(chip.parent_path());
    std::cout << "✓ period, duty_cycle and enable written" << std::endl;
}

void test_explicit_channel() {
    fs::path chip = scratchChip("explicit");
    exportFake(chip, 2);
    SysfsPwmOutput pwm(chip.string(), 2);

    // Any pin goes to the configured channel
    pwm.hardwarePwm(5, 25000, 300000);
    assert(readAttr(chip / "pwm2" / "duty_cycle") == "12000");

    fs::remove_all(chip.parent_path());
    std::cout << "✓ Explicit channel overrides pin mapping" << std::endl;
}

void test_invalid_arguments() {
    fs::path chip = scratchChip("invalid");
    exportFake(chip, 1);
    SysfsPwmOutput pwm(chip.string());

    bool threw = false;
    try {
        pwm.hardwarePwm(4, 25000, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        pwm.hardwarePwm(13, 25000, 1000001);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        pwm.hardwarePwm(13, 0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(chip.parent_path());
    std::cout << "✓ Invalid pin, frequency and duty cycle rejected" << std::endl;
}

void test_missing_hardware() {
    SysfsPwmOutput absent((fs::temp_directory_path() / "fanctl_no_such_pwmchip").string());
    bool threw = false;
    try {
        absent.hardwarePwm(13, 25000, 0);
    } catch (const ActuatorError&) {
        threw = true;
    }
    assert(threw);

    // Export accepted but the channel never shows up
    fs::path chip = scratchChip("noexport");
    SysfsPwmOutput pwm(chip.string());
    threw = false;
    try {
        pwm.hardwarePwm(12, 25000, 0);
    } catch (const ActuatorError&) {
        threw = true;
    }
    assert(threw);
    assert(readAttr(chip / "export") == "0");

    fs::remove_all(chip.parent_path());
    std::cout << "✓ Missing PWM hardware raises ActuatorError" << std::endl;
}

int main() {
    std::cout << "Testing SysfsPwmOutput..." << std::endl;

    test_channel_mapping();
    test_writes_period_duty_and_enable();
    test_explicit_channel();
    test_invalid_arguments();
    test_missing_hardware();

    std::cout << "✅ All SysfsPwmOutput tests passed!" << std::endl;
    return 0;
}
