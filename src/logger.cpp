/**
 * @file logger.cpp
 * @brief Implementation of the fanctl logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

bool Logger::verbose_ = false;

void Logger::setVerbose(bool verbose) {
    verbose_ = verbose;
}

bool Logger::verbose() {
    return verbose_;
}

void Logger::info(const std::string& message) {
    if (verbose_) {
        std::cout << "[" << timestamp() << "] INFO: " << message << std::endl;
    }
}

void Logger::error(const std::string& message) {
    std::cerr << "[" << timestamp() << "] ERROR: " << message << std::endl;
}

std::string Logger::formatTemperature(double temp) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << temp;
    std::string result = oss.str();
    size_t dot_pos = result.find('.');
    if (dot_pos != std::string::npos) {
        while (result.size() > dot_pos + 1 && result.back() == '0') {
            result.pop_back();
        }
        if (result.size() == dot_pos + 1) {
            result.pop_back();
        }
    }
    return result;
}

std::string Logger::timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
