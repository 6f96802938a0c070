/**
 * @file speed_mapper.cpp
 * @brief Implementation of the clamped linear map
 */

#include "speed_mapper.hpp"
#include <stdexcept>

double clampedMap(double x, double in_min, double in_max, double out_min, double out_max) {
    if (x < in_min) {
        return out_min;
    }

    if (x > in_max) {
        return out_max;
    }

    if (in_max == in_min) {
        throw std::invalid_argument("clampedMap: empty input range");
    }

    return (x - in_min) * (out_max - out_min) / (in_max - in_min) + out_min;
}
