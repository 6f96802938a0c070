#ifndef SPEED_MAPPER_HPP
#define SPEED_MAPPER_HPP

/**
 * @file speed_mapper.hpp
 * @brief Linear range mapping used to derive fan speed from temperature
 */

/**
 * @brief Re-map @p x from [in_min, in_max] to [out_min, out_max]
 *
 * Like Arduino's map(), but the result is clamped: out_min below the input
 * range and out_max above it.
 *
 * @throws std::invalid_argument if the input range is empty and @p x lies on it
 */
double clampedMap(double x, double in_min, double in_max, double out_min, double out_max);

#endif // SPEED_MAPPER_HPP
