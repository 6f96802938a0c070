#include "../include/speed_mapper.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

int main() {
    std::cout << "Testing clampedMap..." << std::endl;

    // Below and at the lower bound
    assert(clampedMap(10.0, 45.0, 80.0, 20.0, 100.0) == 20.0);
    assert(clampedMap(-40.0, 45.0, 80.0, 20.0, 100.0) == 20.0);
    assert(clampedMap(45.0, 45.0, 80.0, 20.0, 100.0) == 20.0);

    // At and above the upper bound
    assert(clampedMap(80.0, 45.0, 80.0, 20.0, 100.0) == 100.0);
    assert(clampedMap(95.0, 45.0, 80.0, 20.0, 100.0) == 100.0);

    // Linear in between
    assert(clampedMap(62.5, 45.0, 80.0, 20.0, 100.0) == 60.0);
    assert(std::fabs(clampedMap(48.0, 45.0, 80.0, 20.0, 100.0) - (20.0 + 3.0 * 80.0 / 35.0)) < 1e-9);
    assert(clampedMap(5.0, 0.0, 10.0, 0.0, 1.0) == 0.5);

    // Strictly increasing across the range
    double previous = clampedMap(45.0, 45.0, 80.0, 20.0, 100.0);
    for (double x = 45.25; x <= 80.0; x += 0.25) {
        double y = clampedMap(x, 45.0, 80.0, 20.0, 100.0);
        assert(y > previous);
        previous = y;
    }

    // Inverted output range maps downwards
    assert(clampedMap(0.0, 0.0, 10.0, 100.0, 0.0) == 100.0);
    assert(clampedMap(10.0, 0.0, 10.0, 100.0, 0.0) == 0.0);

    // Empty input range only fails when x lands on it
    assert(clampedMap(40.0, 50.0, 50.0, 20.0, 100.0) == 20.0);
    assert(clampedMap(60.0, 50.0, 50.0, 20.0, 100.0) == 100.0);
    bool threw = false;
    try {
        clampedMap(50.0, 50.0, 50.0, 20.0, 100.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✅ All clampedMap tests passed!" << std::endl;
    return 0;
}
