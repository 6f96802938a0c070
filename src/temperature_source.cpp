/**
 * @file temperature_source.cpp
 * @brief Implementation of the file backed temperature sensor
 */

#include "temperature_source.hpp"
#include <cerrno>
#include <cstring>
#include <cctype>
#include <unistd.h>
#include <fcntl.h>

FileTemperatureSource::FileTemperatureSource(const std::string& path)
    : path_(path)
    , fd_(-1)
{
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw SensorError("Failed to open temperature sensor " + path_ + ": " + std::strerror(errno));
    }
}

FileTemperatureSource::~FileTemperatureSource() {
    close();
}

double FileTemperatureSource::read() {
    if (fd_ < 0) {
        throw SensorError("Temperature sensor is closed: " + path_);
    }

    char buf[64];
    ssize_t n;
    do {
        n = ::pread(fd_, buf, sizeof(buf) - 1, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw SensorError("Failed to read temperature sensor " + path_ + ": " + std::strerror(errno));
    }
    buf[n] = '\0';

    std::string temp_str(buf);
    size_t first = temp_str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw SensorError("Temperature sensor file is empty: " + path_);
    }
    size_t last = temp_str.find_last_not_of(" \t\r\n");
    temp_str = temp_str.substr(first, last - first + 1);

    long temp_millicelsius = 0;
    try {
        size_t pos = 0;
        temp_millicelsius = std::stol(temp_str, &pos);
        if (pos != temp_str.size()) {
            throw SensorError("Invalid temperature value from " + path_ + ": '" + temp_str + "'");
        }
    } catch (const std::logic_error& e) {
        throw SensorError("Invalid temperature value from " + path_ + ": " + e.what());
    }

    double temp_celsius = temp_millicelsius / 1000.0;
    if (temp_celsius < kMinPlausibleCelsius || temp_celsius > kMaxPlausibleCelsius) {
        throw SensorError("Unreasonable temperature read from " + path_ + ": " + temp_str + " m°C");
    }

    return temp_celsius;
}

void FileTemperatureSource::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
