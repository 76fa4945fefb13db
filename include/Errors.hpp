#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Fleet or building shape cannot be served. Raised before any event.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument("Configuration error: " + what) {}
};

// A referenced floor lies outside [0, maxFloor]. Rejected, never clamped.
class InvalidFloorError : public std::out_of_range {
public:
    InvalidFloorError(int floor, int maxFloor)
        : std::out_of_range("Invalid floor: " + std::to_string(floor) +
                            " (valid 0-" + std::to_string(maxFloor) + ")"),
          floor_(floor) {}

    int getFloor() const { return floor_; }

private:
    int floor_;
};

class InvalidCarError : public std::out_of_range {
public:
    explicit InvalidCarError(int carId)
        : std::out_of_range("Invalid car ID: " + std::to_string(carId)) {}
};

class InvalidEventError : public std::invalid_argument {
public:
    explicit InvalidEventError(const std::string& what)
        : std::invalid_argument("Invalid event: " + what) {}
};

class CapacityError : public std::overflow_error {
public:
    CapacityError(int carId, int capacity)
        : std::overflow_error("Car " + std::to_string(carId) +
                              " is full (capacity " + std::to_string(capacity) + ")") {}
};

#endif // ERRORS_HPP
