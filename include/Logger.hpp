#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Types.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

class Car;

// ============== Logger ==============

class Logger {
private:
    mutable std::mutex mutex_;
    std::ostream& out_;
    std::atomic<bool> enabled_;
    const std::atomic<int>* tickRef_ = nullptr;  // Reference to current tick

public:
    explicit Logger(std::ostream& out = std::cout, bool enabled = true);

    void setTickReference(const std::atomic<int>* tick);

    void log(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    void logEvent(const Event& event);
    void logCarState(const Car& car);
    void logCall(int floor, Direction dir);
    void logAssignment(int carId, int floor, Direction dir, double score);
    void logCommand(const Command& command);

    void enable();
    void disable();
    bool isEnabled() const;

private:
    std::string getTimestamp() const;
};

#endif // LOGGER_HPP
