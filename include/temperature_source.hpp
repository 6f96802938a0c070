#ifndef TEMPERATURE_SOURCE_HPP
#define TEMPERATURE_SOURCE_HPP

/**
 * @file temperature_source.hpp
 * @brief Temperature sensor abstraction and sysfs file implementation
 */

#include <string>
#include <stdexcept>

/**
 * @brief Raised when the sensor cannot be opened, read or parsed
 */
class SensorError : public std::runtime_error {
public:
    explicit SensorError(const std::string& what) : std::runtime_error(what) {}
};

class TemperatureSource {
public:
    virtual ~TemperatureSource() = default;

    /**
     * @brief Read the current temperature
     * @return Temperature in degrees Celsius
     * @throws SensorError on read or parse failure
     */
    virtual double read() = 0;

    virtual void close() = 0;
};

/**
 * @brief Sensor backed by a text file holding millidegrees Celsius
 *
 * The file (e.g. /sys/class/thermal/thermal_zone0/temp) is opened once and
 * re-read from offset 0 on every read() instead of being reopened, since the
 * controller polls it several times per second.
 */
class FileTemperatureSource : public TemperatureSource {
public:
    /// @throws SensorError if @p path cannot be opened for reading
    explicit FileTemperatureSource(const std::string& path);
    ~FileTemperatureSource() override;

    FileTemperatureSource(const FileTemperatureSource&) = delete;
    FileTemperatureSource& operator=(const FileTemperatureSource&) = delete;

    double read() override;
    void close() override;

    const std::string& path() const { return path_; }
    bool isOpen() const { return fd_ >= 0; }

    static constexpr double kMinPlausibleCelsius = -50.0;
    static constexpr double kMaxPlausibleCelsius = 150.0;

private:
    std::string path_;
    int fd_;
};

#endif // TEMPERATURE_SOURCE_HPP
