#include "Simulator.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

// ============== Building Simulator Implementation ==============

BuildingSimulator::BuildingSimulator(const Config& config)
    : numFloors_(config.numFloors),
      capacity_(config.carCapacity),
      cars_(config.numCars),
      waiting_(config.numFloors) {}

void BuildingSimulator::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void BuildingSimulator::moveCommand(const Command& command) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (command.carId < 0 || command.carId >= static_cast<int>(cars_.size())) {
        throw InvalidCarError(command.carId);
    }
    if (command.targetFloor < 0 || command.targetFloor >= numFloors_) {
        throw InvalidFloorError(command.targetFloor, numFloors_ - 1);
    }

    ++commandCount_;
    SimCar& car = cars_[command.carId];
    if (command.immediate) {
        car.floor = command.targetFloor;
        car.target.reset();
    } else {
        car.target = command.targetFloor;
    }
}

int BuildingSimulator::spawnPassenger(int origin, int destination) {
    if (origin < 0 || origin >= numFloors_) {
        throw InvalidFloorError(origin, numFloors_ - 1);
    }
    if (destination < 0 || destination >= numFloors_) {
        throw InvalidFloorError(destination, numFloors_ - 1);
    }
    if (origin == destination) {
        throw std::invalid_argument("passenger origin and destination are the same floor");
    }

    Event call;
    call.type = EventType::Call;
    call.floor = origin;
    call.direction = directionBetween(origin, destination);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SimPassenger passenger;
        passenger.id = nextPassengerId_++;
        passenger.origin = origin;
        passenger.destination = destination;
        passenger.spawnTick = tick_;
        passengers_[passenger.id] = passenger;
        waiting_[origin].push_back(passenger.id);

        call.passengerId = passenger.id;
        call.tick = tick_;
    }

    deliver({call});
    return call.passengerId;
}

void BuildingSimulator::step() {
    std::vector<Event> events;
    std::vector<int> arrived;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++tick_;

        for (int id = 0; id < static_cast<int>(cars_.size()); ++id) {
            SimCar& car = cars_[id];
            if (!car.target) continue;

            Event base;
            base.carId = id;
            base.tick = tick_;

            if (car.floor != *car.target) {
                car.floor += (*car.target > car.floor) ? 1 : -1;
                if (car.floor != *car.target) {
                    Event passing = base;
                    passing.type = EventType::PassingFloor;
                    passing.floor = car.floor;
                    events.push_back(passing);
                    continue;
                }
            }

            // Arrived
            car.target.reset();
            arrived.push_back(id);

            Event stopped = base;
            stopped.type = EventType::Stopped;
            stopped.floor = car.floor;
            events.push_back(stopped);

            // Riders for this floor get off first
            auto keep = std::stable_partition(car.riders.begin(), car.riders.end(),
                [this, &car](int pid) { return passengers_[pid].destination != car.floor; });
            for (auto it = keep; it != car.riders.end(); ++it) {
                passengers_[*it].arriveTick = tick_;

                Event alight = base;
                alight.type = EventType::Alight;
                alight.passengerId = *it;
                alight.floor = car.floor;
                events.push_back(alight);
            }
            car.riders.erase(keep, car.riders.end());

            // Then everyone waiting boards while there is room
            std::vector<int> leftBehind;
            for (int pid : waiting_[car.floor]) {
                SimPassenger& passenger = passengers_[pid];
                if (static_cast<int>(car.riders.size()) >= capacity_) {
                    leftBehind.push_back(pid);
                    continue;
                }
                car.riders.push_back(pid);
                passenger.boardTick = tick_;
                passenger.carId = id;

                Event board = base;
                board.type = EventType::Board;
                board.passengerId = pid;
                board.floor = car.floor;
                board.destination = passenger.destination;
                events.push_back(board);
            }
            waiting_[car.floor] = leftBehind;

            // Whoever did not fit presses the button again
            for (int pid : leftBehind) {
                const SimPassenger& passenger = passengers_[pid];
                Event call = base;
                call.type = EventType::Call;
                call.carId = -1;
                call.floor = passenger.origin;
                call.direction = directionBetween(passenger.origin, passenger.destination);
                call.passengerId = pid;
                events.push_back(call);
            }
        }
    }

    deliver(events);

    // Cars that stopped and were not sent anywhere report idle
    std::vector<Event> idles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int id : arrived) {
            if (!cars_[id].target) {
                Event idle;
                idle.type = EventType::Idle;
                idle.carId = id;
                idle.tick = tick_;
                idles.push_back(idle);
            }
        }
    }
    deliver(idles);
}

void BuildingSimulator::run(int steps) {
    for (int i = 0; i < steps; ++i) {
        step();
    }
}

bool BuildingSimulator::runUntilDelivered(int maxSteps) {
    for (int i = 0; i < maxSteps; ++i) {
        if (getDeliveredCount() == getSpawnedCount()) {
            return true;
        }
        step();
    }
    return getDeliveredCount() == getSpawnedCount();
}

void BuildingSimulator::deliver(const std::vector<Event>& events) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (!handler) return;

    for (const auto& event : events) {
        handler(event);
    }
}

int BuildingSimulator::getTick() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tick_;
}

int BuildingSimulator::getCarFloor(int carId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cars_.at(carId).floor;
}

std::optional<int> BuildingSimulator::getCarTarget(int carId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cars_.at(carId).target;
}

int BuildingSimulator::getCommandCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commandCount_;
}

int BuildingSimulator::getSpawnedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(passengers_.size());
}

int BuildingSimulator::deliveredLocked() const {
    return static_cast<int>(std::count_if(passengers_.begin(), passengers_.end(),
        [](const std::pair<const int, SimPassenger>& entry) {
            return entry.second.arriveTick >= 0;
        }));
}

int BuildingSimulator::getDeliveredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveredLocked();
}

int BuildingSimulator::getWaitingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& floor : waiting_) {
        count += static_cast<int>(floor.size());
    }
    return count;
}

std::vector<SimPassenger> BuildingSimulator::getPassengers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SimPassenger> result;
    result.reserve(passengers_.size());
    for (const auto& [id, passenger] : passengers_) {
        result.push_back(passenger);
    }
    return result;
}

double BuildingSimulator::averageWait() const {
    std::lock_guard<std::mutex> lock(mutex_);
    long total = 0;
    int boarded = 0;
    for (const auto& [id, passenger] : passengers_) {
        if (passenger.boardTick >= 0) {
            total += passenger.boardTick - passenger.spawnTick;
            ++boarded;
        }
    }
    return boarded == 0 ? 0.0 : static_cast<double>(total) / boarded;
}

int BuildingSimulator::maxWait() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int worst = 0;
    for (const auto& [id, passenger] : passengers_) {
        if (passenger.boardTick >= 0) {
            worst = std::max(worst, passenger.boardTick - passenger.spawnTick);
        }
    }
    return worst;
}

void BuildingSimulator::printStatus(std::ostream& out) const {
    std::lock_guard<std::mutex> lock(mutex_);

    out << "Building at tick " << tick_ << ": ";
    for (int id = 0; id < static_cast<int>(cars_.size()); ++id) {
        const SimCar& car = cars_[id];
        out << "E" << id << "@F" << car.floor;
        if (car.target) {
            out << "->F" << *car.target;
        }
        out << "[" << car.riders.size() << "] ";
    }
    out << "\nPassengers: " << passengers_.size() << " spawned, "
        << deliveredLocked() << " delivered\n";
}

// ============== CLI Implementation ==============

CLI::CLI(BuildingSimulator& simulator, DispatchService& service, int tickDurationMs)
    : simulator_(simulator), service_(service), tickDurationMs_(tickDurationMs) {}

CLI::~CLI() {
    stop();
}

void CLI::run() {
    printHelp();

    clock_ = std::thread(&CLI::runClock, this);

    std::string line;
    while (running_.load() && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        processCommand(line);
    }

    stop();
}

void CLI::stop() {
    running_.store(false);
    if (clock_.joinable()) {
        clock_.join();
    }
}

void CLI::runClock() {
    while (running_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(tickDurationMs_));
        if (!running_.load()) break;
        simulator_.step();
    }
}

void CLI::printHelp() {
    std::cout << "\n=== Elevator Dispatch CLI ===\n"
              << "Commands:\n"
              << "  spawn <from> <to>   - New passenger (e.g., 'spawn 0 7')\n"
              << "  call <floor> <u|d>  - Bare hall call (e.g., 'call 5 u')\n"
              << "  status              - Print fleet and building status\n"
              << "  help                - Show this help\n"
              << "  quit                - Exit\n"
              << "\n";
}

void CLI::processCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    if (cmd == "spawn") {
        std::string args;
        std::getline(iss, args);
        if (!parseSpawn(args)) {
            std::cout << "Usage: spawn <from> <to>\n";
        }
    }
    else if (cmd == "call") {
        std::string args;
        std::getline(iss, args);
        if (!parseCall(args)) {
            std::cout << "Usage: call <floor> <u|d>\n";
        }
    }
    else if (cmd == "status") {
        service_.printStatus();
        simulator_.printStatus();
        std::cout << "Average wait: " << simulator_.averageWait()
                  << " ticks, max wait: " << simulator_.maxWait() << " ticks\n";
    }
    else if (cmd == "help") {
        printHelp();
    }
    else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running_.store(false);
    }
    else {
        std::cout << "Unknown command: " << cmd << ". Type 'help' for usage.\n";
    }
}

bool CLI::parseSpawn(const std::string& args) {
    std::istringstream iss(args);
    int origin, destination;

    if (!(iss >> origin >> destination)) {
        return false;
    }

    try {
        int id = simulator_.spawnPassenger(origin, destination);
        std::cout << "Passenger " << id << ": F" << origin << " -> F" << destination << "\n";
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << "\n";
    }
    return true;
}

bool CLI::parseCall(const std::string& args) {
    std::istringstream iss(args);
    int floor;
    char dirChar;

    if (!(iss >> floor >> dirChar)) {
        return false;
    }

    Event event;
    event.type = EventType::Call;
    event.floor = floor;
    if (dirChar == 'u' || dirChar == 'U') {
        event.direction = Direction::Up;
    } else if (dirChar == 'd' || dirChar == 'D') {
        event.direction = Direction::Down;
    } else {
        return false;
    }

    event.tick = simulator_.getTick();
    service_.submit(event);
    return true;
}
