#include "Domain.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <iterator>

// ============== Floor Implementation ==============

Floor::Floor(int number) : floorNumber_(number) {}

bool Floor::setCall(Direction dir) {
    bool& flag = (dir == Direction::Up) ? upCall_ : downCall_;
    if (dir == Direction::None || flag) return false;
    flag = true;
    return true;
}

bool Floor::clearCall(Direction dir) {
    bool& flag = (dir == Direction::Up) ? upCall_ : downCall_;
    if (dir == Direction::None || !flag) return false;
    flag = false;
    return true;
}

bool Floor::hasCall(Direction dir) const {
    if (dir == Direction::Up) return upCall_;
    if (dir == Direction::Down) return downCall_;
    return false;
}

bool Floor::hasAnyCall() const { return upCall_ || downCall_; }
int Floor::getNumber() const { return floorNumber_; }

// ============== Floor Request Registry Implementation ==============

FloorRequestRegistry::FloorRequestRegistry(int numFloors) {
    floors_.reserve(numFloors);
    for (int i = 0; i < numFloors; ++i) {
        floors_.emplace_back(i);
    }
}

const Floor& FloorRequestRegistry::floorAt(int floor) const {
    if (!isValidFloor(floor)) {
        throw InvalidFloorError(floor, getMaxFloor());
    }
    return floors_[floor];
}

Floor& FloorRequestRegistry::floorAt(int floor) {
    if (!isValidFloor(floor)) {
        throw InvalidFloorError(floor, getMaxFloor());
    }
    return floors_[floor];
}

bool FloorRequestRegistry::addCall(int floor, Direction dir) {
    return floorAt(floor).setCall(dir);
}

bool FloorRequestRegistry::clearCall(int floor, Direction dir) {
    return floorAt(floor).clearCall(dir);
}

bool FloorRequestRegistry::hasCall(int floor, Direction dir) const {
    return floorAt(floor).hasCall(dir);
}

std::set<int> FloorRequestRegistry::pendingFloors() const {
    std::set<int> pending;
    for (const auto& floor : floors_) {
        if (floor.hasAnyCall()) {
            pending.insert(floor.getNumber());
        }
    }
    return pending;
}

std::vector<std::pair<int, Direction>> FloorRequestRegistry::pendingCalls() const {
    std::vector<std::pair<int, Direction>> calls;

    for (const auto& floor : floors_) {
        if (floor.hasCall(Direction::Up)) {
            calls.emplace_back(floor.getNumber(), Direction::Up);
        }
        if (floor.hasCall(Direction::Down)) {
            calls.emplace_back(floor.getNumber(), Direction::Down);
        }
    }

    return calls;
}

bool FloorRequestRegistry::hasAny() const {
    return std::any_of(floors_.begin(), floors_.end(),
        [](const Floor& f) { return f.hasAnyCall(); });
}

int FloorRequestRegistry::getMaxFloor() const {
    return static_cast<int>(floors_.size()) - 1;
}

bool FloorRequestRegistry::isValidFloor(int floor) const {
    return floor >= 0 && floor < static_cast<int>(floors_.size());
}

// ============== Car Implementation ==============

Car::Car(int id, int capacity, int homeFloor, Zone homeZone, int energyRate)
    : id_(id), currentFloor_(homeFloor), capacity_(capacity),
      homeFloor_(homeFloor), homeZone_(homeZone), restingFloor_(homeFloor),
      energyRate_(energyRate) {}

int Car::getId() const { return id_; }
int Car::getCurrentFloor() const { return currentFloor_; }
Direction Car::getDirection() const { return direction_; }
CarState Car::getState() const { return state_; }
int Car::getCapacity() const { return capacity_; }
int Car::getHomeFloor() const { return homeFloor_; }
const Zone& Car::getHomeZone() const { return homeZone_; }
int Car::getRestingFloor() const { return restingFloor_; }
const std::set<int>& Car::getTargetFloors() const { return targetFloors_; }

const std::set<std::pair<int, Direction>>& Car::getAssignedCalls() const {
    return assignedCalls_;
}

const std::map<int, int>& Car::getOnboard() const { return onboard_; }

void Car::placeAt(int floor) {
    currentFloor_ = floor;
    restingFloor_ = floor;
}

void Car::moveTo(int floor) {
    int floors = std::abs(floor - currentFloor_);
    floorsTravelled_ += floors;
    energyUsed_ += static_cast<long>(floors) * energyRate_;
    currentFloor_ = floor;
}

void Car::recordStop() { ++stopCount_; }
int Car::getFloorsTravelled() const { return floorsTravelled_; }
int Car::getStopCount() const { return stopCount_; }
long Car::getEnergyUsed() const { return energyUsed_; }
int Car::getEnergyRate() const { return energyRate_; }

void Car::setDirection(Direction dir) { direction_ = dir; }
void Car::setState(CarState state) { state_ = state; }

void Car::rest() {
    state_ = CarState::Resting;
    direction_ = Direction::None;
    restingFloor_ = currentFloor_;
}

void Car::addTarget(int floor) { targetFloors_.insert(floor); }

bool Car::removeTarget(int floor) {
    return targetFloors_.erase(floor) > 0;
}

bool Car::hasTargetAt(int floor) const {
    return targetFloors_.count(floor) > 0;
}

bool Car::hasTargets() const { return !targetFloors_.empty(); }

bool Car::hasTargetsAhead(Direction dir) const {
    return nearestTargetAhead(dir).has_value();
}

std::optional<int> Car::nearestTargetAhead(Direction dir) const {
    if (dir == Direction::Up) {
        auto it = targetFloors_.upper_bound(currentFloor_);
        if (it != targetFloors_.end()) return *it;
    } else if (dir == Direction::Down) {
        auto it = targetFloors_.lower_bound(currentFloor_);
        if (it != targetFloors_.begin()) return *std::prev(it);
    }
    return std::nullopt;
}

std::optional<int> Car::farthestTargetAhead(Direction dir) const {
    if (targetFloors_.empty()) return std::nullopt;

    if (dir == Direction::Up) {
        int top = *targetFloors_.rbegin();
        if (top > currentFloor_) return top;
    } else if (dir == Direction::Down) {
        int bottom = *targetFloors_.begin();
        if (bottom < currentFloor_) return bottom;
    }
    return std::nullopt;
}

std::optional<int> Car::nearestTarget() const {
    if (targetFloors_.empty()) return std::nullopt;

    // Ties go to the lower floor: std::set iterates ascending
    return *std::min_element(targetFloors_.begin(), targetFloors_.end(),
        [this](int a, int b) {
            return std::abs(a - currentFloor_) < std::abs(b - currentFloor_);
        });
}

void Car::assignCall(int floor, Direction dir) {
    assignedCalls_.emplace(floor, dir);
}

bool Car::releaseCall(int floor, Direction dir) {
    return assignedCalls_.erase(std::make_pair(floor, dir)) > 0;
}

bool Car::isAssigned(int floor, Direction dir) const {
    return assignedCalls_.count(std::make_pair(floor, dir)) > 0;
}

std::vector<Direction> Car::assignmentsAt(int floor) const {
    std::vector<Direction> dirs;
    for (const auto& [assignedFloor, dir] : assignedCalls_) {
        if (assignedFloor == floor) {
            dirs.push_back(dir);
        }
    }
    return dirs;
}

bool Car::needsFloor(int floor) const {
    return !assignmentsAt(floor).empty() || hasDestination(floor);
}

void Car::board(int passengerId, int destination) {
    if (onboard_.count(passengerId) == 0 && isFull()) {
        throw CapacityError(id_, capacity_);
    }
    onboard_[passengerId] = destination;
}

bool Car::alight(int passengerId) {
    return onboard_.erase(passengerId) > 0;
}

bool Car::isCarrying(int passengerId) const {
    return onboard_.count(passengerId) > 0;
}

bool Car::hasDestination(int floor) const {
    return std::any_of(onboard_.begin(), onboard_.end(),
        [floor](const std::pair<const int, int>& entry) { return entry.second == floor; });
}

bool Car::isFull() const {
    return static_cast<int>(onboard_.size()) >= capacity_;
}

int Car::getLoad() const { return static_cast<int>(onboard_.size()); }

std::optional<int> Car::getCommittedStop() const { return committedStop_; }
void Car::commit(int floor) { committedStop_ = floor; }
void Car::clearCommitment() { committedStop_.reset(); }

// ============== Fleet Implementation ==============

void Fleet::validate(const Config& config) {
    if (config.numFloors < 1) {
        throw ConfigurationError("building needs at least one floor");
    }
    if (config.numCars < 1) {
        throw ConfigurationError("fleet must have at least one car");
    }
    if (config.carCapacity < 1) {
        throw ConfigurationError("car capacity must be positive");
    }
    if (!config.energyRates.empty() &&
        static_cast<int>(config.energyRates.size()) != config.numCars) {
        throw ConfigurationError("expected " + std::to_string(config.numCars) +
                                 " energy rates, got " +
                                 std::to_string(config.energyRates.size()));
    }
    for (int rate : config.energyRates) {
        if (rate < 0) {
            throw ConfigurationError("energy rate must not be negative");
        }
    }
}

Fleet::Fleet(const Config& config)
    : config_((validate(config), config)),
      partitioner_(config.numFloors - 1, config.zoneMode, config.zoneOverlap),
      registry_(config.numFloors) {
    cars_.reserve(config.numCars);
    for (int i = 0; i < config.numCars; ++i) {
        int rate = config.energyRates.empty() ? 1 : config.energyRates[i];
        cars_.emplace_back(i, config.carCapacity,
                           partitioner_.homeFloor(i, config.numCars),
                           partitioner_.zoneFor(i, config.numCars),
                           rate);
    }
}

int Fleet::getNumFloors() const { return config_.numFloors; }
int Fleet::getMaxFloor() const { return config_.numFloors - 1; }
int Fleet::getNumCars() const { return config_.numCars; }
const Config& Fleet::getConfig() const { return config_; }
const ZonePartitioner& Fleet::getPartitioner() const { return partitioner_; }

Car& Fleet::getCar(int id) {
    if (!isValidCar(id)) {
        throw InvalidCarError(id);
    }
    return cars_[id];
}

const Car& Fleet::getCar(int id) const {
    if (!isValidCar(id)) {
        throw InvalidCarError(id);
    }
    return cars_[id];
}

std::vector<Car>& Fleet::getCars() { return cars_; }
const std::vector<Car>& Fleet::getCars() const { return cars_; }

FloorRequestRegistry& Fleet::getRegistry() { return registry_; }
const FloorRequestRegistry& Fleet::getRegistry() const { return registry_; }

bool Fleet::isCallAssigned(int floor, Direction dir) const {
    return std::any_of(cars_.begin(), cars_.end(),
        [floor, dir](const Car& car) { return car.isAssigned(floor, dir); });
}

std::vector<std::pair<int, Direction>> Fleet::unassignedCalls() const {
    std::vector<std::pair<int, Direction>> calls;
    for (const auto& [floor, dir] : registry_.pendingCalls()) {
        if (!isCallAssigned(floor, dir)) {
            calls.emplace_back(floor, dir);
        }
    }
    return calls;
}

bool Fleet::isValidFloor(int floor) const {
    return floor >= 0 && floor < config_.numFloors;
}

bool Fleet::isValidCar(int id) const {
    return id >= 0 && id < config_.numCars;
}

void Fleet::requireFloor(int floor) const {
    if (!isValidFloor(floor)) {
        throw InvalidFloorError(floor, getMaxFloor());
    }
}
