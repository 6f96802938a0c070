/**
 * @file main.cpp
 * @brief Main entry point for the fanctl daemon
 */

#include "config_parser.hpp"
#include "control_loop.hpp"
#include "fan_actuator.hpp"
#include "hysteresis_controller.hpp"
#include "logger.hpp"
#include "pwm_output.hpp"
#include "shutdown_signals.hpp"
#include "temperature_source.hpp"
#include <iostream>
#include <string>

namespace {

const char* const kDefaultConfigPath = "/etc/fanctl/fanctl.conf";

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [-c|--config <path>] [-v|--verbose] [-h|--help]\n";
    std::cout << "Control a PWM fan based on CPU temperature.\n\n";
    std::cout << "  -c, --config   Configuration file (default: " << kDefaultConfigPath << ").\n";
    std::cout << "                 Built-in defaults are used if it cannot be read.\n";
    std::cout << "  -v, --verbose  Log every sample and fan command.\n";
    std::cout << "Environment variables FANCTL_<KEY> override configuration keys.\n";
}

} // namespace

/**
 * @brief Main entry point
 *
 * Loads the configuration, opens the sensor and the PWM channel, and runs the
 * control loop until SIGINT/SIGTERM.
 */
int main(int argc, char* argv[]) {
    std::string config_path = kDefaultConfigPath;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            Logger::setVerbose(true);
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    ControlParameters params = ConfigParser::loadConfig(config_path);
    Logger::info("parameters: " + ConfigParser::describe(params));

    try {
        FileTemperatureSource cpu_temp(params.cpu_temp_file);
        SysfsPwmOutput pwm(params.pwm_chip, params.pwm_channel);
        FanActuator fan(pwm,
                        static_cast<unsigned>(params.fan_pwm_pin),
                        static_cast<unsigned>(params.fan_pwm_frequency));

        HysteresisController controller(params, cpu_temp, fan);
        ControlLoop loop(controller, params);

        bool clean;
        {
            ShutdownSignals signals(loop);
            clean = loop.run();
        }
        cpu_temp.close();

        if (!clean) {
            return 1;
        }
        Logger::info("Shutdown complete");
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
