#include "Logger.hpp"
#include "Domain.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::setTickReference(const std::atomic<int>* tick) {
    tickRef_ = tick;
}

void Logger::log(const std::string& message) {
    if (!enabled_.load()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::warn(const std::string& message) {
    log("[WARN] " + message);
}

void Logger::error(const std::string& message) {
    log("[ERROR] " + message);
}

void Logger::logEvent(const Event& event) {
    if (!enabled_.load()) return;

    std::ostringstream oss;
    oss << "[EVENT] " << eventTypeToString(event.type);

    switch (event.type) {
        case EventType::Call:
            oss << " floor=" << event.floor
                << " dir=" << directionToString(event.direction);
            if (event.passengerId >= 0) {
                oss << " passenger=" << event.passengerId;
            }
            break;
        case EventType::Stopped:
        case EventType::PassingFloor:
            oss << " car=" << event.carId << " floor=" << event.floor;
            break;
        case EventType::Board:
            oss << " car=" << event.carId
                << " passenger=" << event.passengerId
                << " dest=" << event.destination;
            break;
        case EventType::Alight:
            oss << " car=" << event.carId
                << " passenger=" << event.passengerId
                << " floor=" << event.floor;
            break;
        case EventType::Idle:
            oss << " car=" << event.carId;
            break;
    }

    log(oss.str());
}

void Logger::logCarState(const Car& car) {
    if (!enabled_.load()) return;

    std::ostringstream oss;
    oss << "[CAR " << car.getId() << "] "
        << "floor=" << car.getCurrentFloor() << " "
        << "state=" << stateToString(car.getState()) << " "
        << "dir=" << directionToString(car.getDirection()) << " "
        << "load=" << car.getLoad() << "/" << car.getCapacity();

    const auto& targets = car.getTargetFloors();
    if (!targets.empty()) {
        oss << " targets={";
        bool first = true;
        for (int t : targets) {
            if (!first) oss << ",";
            oss << t;
            first = false;
        }
        oss << "}";
    }

    log(oss.str());
}

void Logger::logCall(int floor, Direction dir) {
    log("[CALL] floor=" + std::to_string(floor) +
        " dir=" + directionToString(dir));
}

void Logger::logAssignment(int carId, int floor, Direction dir, double score) {
    if (!enabled_.load()) return;

    std::ostringstream oss;
    oss << "[ASSIGN] car=" << carId << " -> floor=" << floor
        << " dir=" << directionToString(dir)
        << " score=" << std::fixed << std::setprecision(1) << score;
    log(oss.str());
}

void Logger::logCommand(const Command& command) {
    log("[MOVE] car=" + std::to_string(command.carId) +
        " -> floor=" + std::to_string(command.targetFloor) +
        (command.immediate ? " (immediate)" : ""));
}

void Logger::enable() { enabled_.store(true); }
void Logger::disable() { enabled_.store(false); }
bool Logger::isEnabled() const { return enabled_.load(); }

std::string Logger::getTimestamp() const {
    std::ostringstream oss;
    oss << "[";
    if (tickRef_) {
        oss << "T" << std::setw(4) << std::setfill('0') << tickRef_->load();
    } else {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        oss << std::put_time(std::localtime(&time), "%H:%M:%S");
    }
    oss << "]";
    return oss.str();
}
