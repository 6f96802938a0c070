#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

/**
 * @file config_parser.hpp
 * @brief Configuration parsing for fanctl
 */

#include <string>
#include <map>
#include <vector>
#include <stdexcept>

/**
 * @brief Raised for a missing, malformed or inconsistent configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Control parameters with default values
struct ControlParameters {
    std::string cpu_temp_file = "/sys/class/thermal/thermal_zone0/temp";
    std::string cpu_temp_hwmon_name;
    double cpu_temp_max = 80.0;
    int cpu_temp_sample_count = 5;
    double cpu_temp_sample_delay = 0.1;

    int fan_active_min_speed = 20;
    int fan_pwm_pin = 13;
    int fan_pwm_frequency = 25000;
    std::string pwm_chip = "/sys/class/pwm/pwmchip0";
    int pwm_channel = -1;

    double hysteresis = 5.0;
    double trigger_temp = 50.0;

    int max_sensor_failures = 10;
};

class ConfigParser {
public:
    /**
     * @brief Load the configuration used by the daemon
     *
     * Reads @p config_path, falling back to the built-in defaults (and logging
     * why) if the file cannot be read or is invalid. FANCTL_<KEY> environment
     * variables are applied on top, then the hwmon sensor name is resolved.
     */
    static ControlParameters loadConfig(const std::string& config_path);

    /// @throws ConfigError if the file is unreadable, malformed or invalid
    static ControlParameters parseConfigFile(const std::string& config_path);

    /**
     * @brief Apply FANCTL_<KEY> environment overrides on top of @p base
     *
     * An invalid override is logged and the unmodified @p base is returned.
     */
    static ControlParameters applyEnvironment(const ControlParameters& base);

    static ControlParameters getDefaultConfig();

    /// @throws ConfigError naming the first violated constraint
    static void validate(const ControlParameters& config);

    static std::string describe(const ControlParameters& config);

    static std::string findHwmonDeviceByName(const std::string& device_name,
                                             const std::string& hwmon_base_path = "/sys/class/hwmon");

    static const std::vector<std::string>& knownKeys();

private:
    static std::string trim(const std::string& str);
    static std::string toLower(std::string str);
    static std::string toUpper(std::string str);
    static std::map<std::string, std::string> parseKeyValueFile(const std::string& path);
    static void applyValue(ControlParameters& config, const std::string& key, const std::string& value);
    static double parseDouble(const std::string& key, const std::string& value);
    static int parseInt(const std::string& key, const std::string& value);
    static void resolveSensorPath(ControlParameters& config);
};

#endif // CONFIG_PARSER_HPP
