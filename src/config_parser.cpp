/**
 * @file config_parser.cpp
 * @brief Implementation of configuration file and environment variable parsing
 */

#include "config_parser.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

const std::vector<std::string>& ConfigParser::knownKeys() {
    static const std::vector<std::string> keys = {
        "cpu_temp_file",
        "cpu_temp_hwmon_name",
        "cpu_temp_max",
        "cpu_temp_sample_count",
        "cpu_temp_sample_delay",
        "fan_active_min_speed",
        "fan_pwm_pin",
        "fan_pwm_frequency",
        "pwm_chip",
        "pwm_channel",
        "hysteresis",
        "trigger_temp",
        "max_sensor_failures",
    };
    return keys;
}

std::string ConfigParser::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, (last - first + 1));
}

std::string ConfigParser::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string ConfigParser::toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::map<std::string, std::string> ConfigParser::parseKeyValueFile(const std::string& path) {
    std::map<std::string, std::string> result;
    std::ifstream file(path);

    if (!file.is_open()) {
        throw ConfigError("cannot open " + path);
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // The file is sectionless; tolerate an explicit [DEFAULT] header
        if (line.front() == '[' && line.back() == ']') {
            if (toLower(trim(line.substr(1, line.size() - 2))) != "default") {
                throw ConfigError("line " + std::to_string(line_number) + ": unexpected section " + line);
            }
            continue;
        }

        size_t sep_pos = line.find_first_of("=:");
        if (sep_pos == std::string::npos) {
            throw ConfigError("line " + std::to_string(line_number) + ": expected 'key = value'");
        }

        std::string key = toLower(trim(line.substr(0, sep_pos)));
        std::string value = trim(line.substr(sep_pos + 1));

        if (key.empty()) {
            throw ConfigError("line " + std::to_string(line_number) + ": missing key");
        }
        result[key] = value;
    }

    if (file.bad()) {
        throw ConfigError("read error on " + path);
    }

    return result;
}

double ConfigParser::parseDouble(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size() || !std::isfinite(parsed)) {
            throw ConfigError("invalid number for " + key + ": '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("invalid number for " + key + ": '" + value + "'");
    }
}

int ConfigParser::parseInt(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw ConfigError("invalid integer for " + key + ": '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("invalid integer for " + key + ": '" + value + "'");
    }
}

void ConfigParser::applyValue(ControlParameters& config, const std::string& key, const std::string& value) {
    if (key == "cpu_temp_file") {
        config.cpu_temp_file = value;
    } else if (key == "cpu_temp_hwmon_name") {
        config.cpu_temp_hwmon_name = value;
    } else if (key == "cpu_temp_max") {
        config.cpu_temp_max = parseDouble(key, value);
    } else if (key == "cpu_temp_sample_count") {
        config.cpu_temp_sample_count = parseInt(key, value);
    } else if (key == "cpu_temp_sample_delay") {
        config.cpu_temp_sample_delay = parseDouble(key, value);
    } else if (key == "fan_active_min_speed") {
        config.fan_active_min_speed = parseInt(key, value);
    } else if (key == "fan_pwm_pin") {
        config.fan_pwm_pin = parseInt(key, value);
    } else if (key == "fan_pwm_frequency") {
        config.fan_pwm_frequency = parseInt(key, value);
    } else if (key == "pwm_chip") {
        config.pwm_chip = value;
    } else if (key == "pwm_channel") {
        config.pwm_channel = parseInt(key, value);
    } else if (key == "hysteresis") {
        config.hysteresis = parseDouble(key, value);
    } else if (key == "trigger_temp") {
        config.trigger_temp = parseDouble(key, value);
    } else if (key == "max_sensor_failures") {
        config.max_sensor_failures = parseInt(key, value);
    } else {
        throw ConfigError("unknown key '" + key + "'");
    }
}

void ConfigParser::validate(const ControlParameters& config) {
    if (config.cpu_temp_file.empty()) {
        throw ConfigError("cpu_temp_file must not be empty");
    }
    if (!std::isfinite(config.cpu_temp_max) || !std::isfinite(config.cpu_temp_sample_delay) ||
        !std::isfinite(config.hysteresis) || !std::isfinite(config.trigger_temp)) {
        throw ConfigError("temperature and delay parameters must be finite numbers");
    }
    if (config.cpu_temp_sample_count < 1) {
        throw ConfigError("cpu_temp_sample_count must be at least 1");
    }
    if (config.cpu_temp_sample_delay < 0.0) {
        throw ConfigError("cpu_temp_sample_delay must not be negative");
    }
    if (config.fan_active_min_speed < 0 || config.fan_active_min_speed > 100) {
        throw ConfigError("fan_active_min_speed must be within 0-100");
    }
    if (config.fan_pwm_pin < 0) {
        throw ConfigError("fan_pwm_pin must not be negative");
    }
    if (config.fan_pwm_frequency <= 0) {
        throw ConfigError("fan_pwm_frequency must be positive");
    }
    if (config.hysteresis < 0.0) {
        throw ConfigError("hysteresis must not be negative");
    }
    if (config.trigger_temp >= config.cpu_temp_max) {
        throw ConfigError("trigger_temp (" + Logger::formatTemperature(config.trigger_temp) +
                          ") must be below cpu_temp_max (" +
                          Logger::formatTemperature(config.cpu_temp_max) + ")");
    }
    if (config.max_sensor_failures < 0) {
        throw ConfigError("max_sensor_failures must not be negative");
    }
}

std::string ConfigParser::findHwmonDeviceByName(const std::string& device_name,
                                                 const std::string& hwmon_base_path) {
    std::error_code ec;
    if (!fs::exists(hwmon_base_path, ec)) {
        return "";
    }

    for (const auto& entry : fs::directory_iterator(hwmon_base_path, ec)) {
        std::string entry_name = entry.path().filename().string();
        if (entry_name.find("hwmon") != 0) {
            continue;
        }

        std::string name_file = entry.path() / "name";
        if (!fs::exists(name_file, ec)) {
            continue;
        }

        std::ifstream name_stream(name_file);
        std::string name;
        if (std::getline(name_stream, name)) {
            name = trim(name);
            if (name == device_name) {
                std::string temp_input = entry.path() / "temp1_input";
                if (fs::exists(temp_input, ec)) {
                    return temp_input;
                }
            }
        }
    }

    return "";
}

void ConfigParser::resolveSensorPath(ControlParameters& config) {
    if (config.cpu_temp_hwmon_name.empty()) {
        return;
    }

    std::string path = findHwmonDeviceByName(config.cpu_temp_hwmon_name);
    if (path.empty()) {
        Logger::error("No hwmon device named '" + config.cpu_temp_hwmon_name +
                      "', keeping cpu_temp_file " + config.cpu_temp_file);
        return;
    }
    config.cpu_temp_file = path;
}

ControlParameters ConfigParser::parseConfigFile(const std::string& config_path) {
    ControlParameters config = getDefaultConfig();
    auto kv_map = parseKeyValueFile(config_path);

    for (const auto& kv : kv_map) {
        applyValue(config, kv.first, kv.second);
    }

    validate(config);
    return config;
}

ControlParameters ConfigParser::applyEnvironment(const ControlParameters& base) {
    ControlParameters config = base;

    try {
        for (const auto& key : knownKeys()) {
            std::string env_name = "FANCTL_" + toUpper(key);
            const char* env_val = std::getenv(env_name.c_str());
            if (env_val != nullptr) {
                applyValue(config, key, trim(env_val));
            }
        }
        validate(config);
    } catch (const ConfigError& e) {
        Logger::error(std::string("Ignoring environment overrides: ") + e.what());
        return base;
    }

    return config;
}

ControlParameters ConfigParser::loadConfig(const std::string& config_path) {
    ControlParameters config = getDefaultConfig();

    try {
        config = parseConfigFile(config_path);
    } catch (const ConfigError& e) {
        Logger::error("Unable to read '" + config_path + "', using built-in defaults. (" +
                      e.what() + ")");
    }

    config = applyEnvironment(config);
    resolveSensorPath(config);
    return config;
}

ControlParameters ConfigParser::getDefaultConfig() {
    ControlParameters config;
    return config;
}

std::string ConfigParser::describe(const ControlParameters& config) {
    std::ostringstream oss;
    oss << "cpu_temp_file=" << config.cpu_temp_file
        << " cpu_temp_max=" << Logger::formatTemperature(config.cpu_temp_max)
        << " cpu_temp_sample_count=" << config.cpu_temp_sample_count
        << " cpu_temp_sample_delay=" << config.cpu_temp_sample_delay
        << " fan_active_min_speed=" << config.fan_active_min_speed
        << " fan_pwm_pin=" << config.fan_pwm_pin
        << " fan_pwm_frequency=" << config.fan_pwm_frequency
        << " pwm_chip=" << config.pwm_chip
        << " pwm_channel=" << config.pwm_channel
        << " hysteresis=" << Logger::formatTemperature(config.hysteresis)
        << " trigger_temp=" << Logger::formatTemperature(config.trigger_temp)
        << " max_sensor_failures=" << config.max_sensor_failures;
    return oss.str();
}
