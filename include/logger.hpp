#ifndef LOGGER_HPP
#define LOGGER_HPP

/**
 * @file logger.hpp
 * @brief Minimal process logger for fanctl
 *
 * Informational lines go to stdout and are only emitted in verbose mode,
 * errors always go to stderr. Under systemd both streams end up in journald.
 */

#include <string>

class Logger {
public:
    static void setVerbose(bool verbose);
    static bool verbose();

    static void info(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Format a temperature with one decimal, dropping a trailing ".0"
     */
    static std::string formatTemperature(double temp);

private:
    static std::string timestamp();
    static bool verbose_;
};

#endif // LOGGER_HPP
