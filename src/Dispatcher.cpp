#include "Dispatcher.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cstdlib>

Dispatcher::Dispatcher(Fleet& fleet, Logger& logger)
    : fleet_(fleet),
      logger_(logger),
      scorer_(fleet.getConfig().scoring, fleet.getConfig().lookVariant),
      planner_(fleet.getConfig().lookVariant) {}

std::vector<Command> Dispatcher::initFleet() {
    std::vector<Command> commands;

    for (Car& car : fleet_.getCars()) {
        car.placeAt(car.getHomeFloor());
        car.rest();

        const Zone& zone = car.getHomeZone();
        logger_.log("Car " + std::to_string(car.getId()) +
                    " home=F" + std::to_string(car.getHomeFloor()) +
                    " zone=[" + std::to_string(zone.low) + "," +
                    std::to_string(zone.high) + "]");

        issueMove(car, car.getHomeFloor(), true, commands);
    }

    return commands;
}

std::vector<Command> Dispatcher::handle(const Event& event) {
    logger_.logEvent(event);

    switch (event.type) {
        case EventType::Call:
            return onCall(event.floor, event.direction, event.passengerId, event.tick);
        case EventType::Stopped:
            return onStopped(event.carId, event.floor);
        case EventType::Board:
            return onBoard(event.carId, event.passengerId, event.destination, event.tick);
        case EventType::Alight:
            return onAlight(event.carId, event.passengerId, event.floor);
        case EventType::Idle:
            return onIdle(event.carId);
        case EventType::PassingFloor:
            return onPassingFloor(event.carId, event.floor);
    }
    return {};
}

// ============== Event Hooks ==============

std::vector<Command> Dispatcher::onCall(int floor, Direction dir, int passengerId, int tick) {
    fleet_.requireFloor(floor);
    if (dir == Direction::None) {
        throw InvalidEventError("call at floor " + std::to_string(floor) +
                                " has no direction");
    }

    logger_.logCall(floor, dir);
    if (passengerId >= 0) {
        // A repeated call keeps the original call tick
        waiting_.emplace(passengerId, Passenger{passengerId, floor, -1, tick});
    }
    fleet_.getRegistry().addCall(floor, dir);

    std::vector<Command> commands;

    // Already being answered
    if (fleet_.isCallAssigned(floor, dir)) {
        return commands;
    }

    if (auto carId = selectScanningCar(floor, dir)) {
        Car& car = fleet_.getCar(*carId);
        logger_.logAssignment(car.getId(), floor, dir, scorer_.score(car, floor, dir));
        car.assignCall(floor, dir);
        car.addTarget(floor);
        replan(car, commands);
        return commands;
    }

    if (auto carId = selectRestingCar(floor, dir)) {
        Car& car = fleet_.getCar(*carId);
        logger_.logAssignment(car.getId(), floor, dir, scorer_.score(car, floor, dir));
        logger_.log("[WAKE] car=" + std::to_string(car.getId()) +
                    " at F" + std::to_string(car.getCurrentFloor()));
        wake(car, floor, dir, commands);
        return commands;
    }

    logger_.log("[CALL] no car available, floor=" + std::to_string(floor) +
                " dir=" + directionToString(dir) + " left pending");
    return commands;
}

std::vector<Command> Dispatcher::onStopped(int carId, int floor) {
    Car& car = fleet_.getCar(carId);
    fleet_.requireFloor(floor);

    car.moveTo(floor);
    car.recordStop();
    car.clearCommitment();
    car.setState(CarState::Loading);
    car.removeTarget(floor);

    std::vector<Command> commands;
    Direction heading = car.getDirection();
    bool aheadRemains = car.hasTargetsAhead(heading);

    // Calls this car was sent for, plus whatever waits in its heading
    std::vector<Direction> assigned = car.assignmentsAt(floor);
    std::vector<Direction> served = assigned;
    if (heading != Direction::None &&
        std::find(served.begin(), served.end(), heading) == served.end()) {
        served.push_back(heading);
    }
    for (Direction dir : served) {
        serveCall(floor, dir, car, commands);
    }

    // Leave in the direction of the call answered here once the sweep is done
    if (!aheadRemains) {
        for (Direction dir : assigned) {
            if (dir != heading) {
                car.setDirection(dir);
                break;
            }
        }
    }

    settle(car, commands);
    logger_.logCarState(car);
    return commands;
}

std::vector<Command> Dispatcher::onBoard(int carId, int passengerId, int destination, int tick) {
    Car& car = fleet_.getCar(carId);
    fleet_.requireFloor(destination);

    auto waiting = waiting_.find(passengerId);
    if (waiting != waiting_.end()) {
        logger_.log("[BOARD] passenger=" + std::to_string(passengerId) +
                    " car=" + std::to_string(carId) +
                    " waited=" + std::to_string(tick - waiting->second.callTick));
        waiting_.erase(waiting);
    }

    car.board(passengerId, destination);

    std::vector<Command> commands;
    if (destination == car.getCurrentFloor()) {
        logger_.warn("passenger " + std::to_string(passengerId) +
                     " boarded car " + std::to_string(carId) +
                     " for the floor it is already at");
        return commands;
    }

    car.addTarget(destination);
    replan(car, commands);
    return commands;
}

std::vector<Command> Dispatcher::onAlight(int carId, int passengerId, int floor) {
    Car& car = fleet_.getCar(carId);
    fleet_.requireFloor(floor);

    // Target floors are only cleared when the car stops
    if (!car.alight(passengerId)) {
        logger_.warn("passenger " + std::to_string(passengerId) +
                     " was not aboard car " + std::to_string(carId));
    }
    return {};
}

std::vector<Command> Dispatcher::onIdle(int carId) {
    Car& car = fleet_.getCar(carId);
    std::vector<Command> commands;

    dropStaleTargets(car);

    if (car.hasTargets()) {
        replan(car, commands);
        return commands;
    }

    if (selfDispatch(car, commands)) {
        return commands;
    }

    car.rest();
    driftHome(car, commands);
    return commands;
}

std::vector<Command> Dispatcher::onPassingFloor(int carId, int floor) {
    Car& car = fleet_.getCar(carId);
    fleet_.requireFloor(floor);
    car.moveTo(floor);
    return {};
}

bool Dispatcher::hasPendingRequests() const {
    return fleet_.getRegistry().hasAny();
}

const Fleet& Dispatcher::getFleet() const { return fleet_; }
const DispatchScorer& Dispatcher::getScorer() const { return scorer_; }
const ScanPlanner& Dispatcher::getPlanner() const { return planner_; }
const std::map<int, Passenger>& Dispatcher::getWaiting() const { return waiting_; }

// ============== Candidate Selection ==============

std::optional<int> Dispatcher::selectScanningCar(int floor, Direction dir) const {
    std::optional<int> best;
    double bestScore = 0.0;

    for (const Car& car : fleet_.getCars()) {
        if (car.getState() != CarState::Scanning) continue;

        double score = scorer_.score(car, floor, dir);
        if (score > 0.0 && (!best || score > bestScore)) {
            best = car.getId();
            bestScore = score;
        }
    }

    return best;
}

// No positive-score gate here: a resting car always answers rather than
// leaving the call pending with nothing moving.
std::optional<int> Dispatcher::selectRestingCar(int floor, Direction dir) const {
    std::optional<int> best;
    double bestScore = 0.0;

    for (const Car& car : fleet_.getCars()) {
        if (car.getState() != CarState::Resting || car.isFull()) continue;

        double score = scorer_.score(car, floor, dir);
        if (!best || score > bestScore) {
            best = car.getId();
            bestScore = score;
        }
    }

    return best;
}

// ============== Planning ==============

void Dispatcher::wake(Car& car, int floor, Direction dir, std::vector<Command>& out) {
    car.assignCall(floor, dir);
    car.addTarget(floor);

    Direction toward = directionBetween(car.getCurrentFloor(), floor);
    car.setDirection(toward == Direction::None ? dir : toward);
    car.setState(CarState::Scanning);

    replan(car, out);
}

void Dispatcher::replan(Car& car, std::vector<Command>& out) {
    // First pass settles the direction so on-the-way calls can be picked up
    if (!planner_.nextStop(car)) {
        return;
    }
    absorbPendingCalls(car);

    if (auto stop = planner_.nextStop(car)) {
        issueMove(car, *stop, false, out);
    }
}

// Decide what a car does once the current stop is handled
void Dispatcher::settle(Car& car, std::vector<Command>& out) {
    if (car.hasTargets()) {
        replan(car, out);
        return;
    }

    if (selfDispatch(car, out)) {
        return;
    }

    car.rest();
    logger_.log("[REST] car=" + std::to_string(car.getId()) +
                " at F" + std::to_string(car.getCurrentFloor()));
}

// Pick the best unassigned pending call by zone-weighted distance
bool Dispatcher::selfDispatch(Car& car, std::vector<Command>& out) {
    if (car.isFull()) {
        return false;
    }

    std::optional<std::pair<int, Direction>> best;
    double bestScore = 0.0;

    for (const auto& call : fleet_.unassignedCalls()) {
        double score = scorer_.restingScore(car, call.first);
        if (!best || score > bestScore) {
            best = call;
            bestScore = score;
        }
    }

    if (!best) {
        return false;
    }

    logger_.logAssignment(car.getId(), best->first, best->second, bestScore);
    wake(car, best->first, best->second, out);
    return true;
}

void Dispatcher::absorbPendingCalls(Car& car) {
    for (const auto& [floor, dir] : fleet_.unassignedCalls()) {
        double score = scorer_.score(car, floor, dir);
        if (score > 0.0) {
            logger_.logAssignment(car.getId(), floor, dir, score);
            car.assignCall(floor, dir);
            car.addTarget(floor);
        }
    }
}

// First arrival wins: clear the call and take it off every other car
void Dispatcher::serveCall(int floor, Direction dir, Car& server, std::vector<Command>& out) {
    fleet_.getRegistry().clearCall(floor, dir);
    server.releaseCall(floor, dir);

    for (Car& other : fleet_.getCars()) {
        if (other.getId() == server.getId() || !other.releaseCall(floor, dir)) {
            continue;
        }

        logger_.log("[RELEASE] car=" + std::to_string(other.getId()) +
                    " floor=" + std::to_string(floor) +
                    " dir=" + directionToString(dir) +
                    " served by car=" + std::to_string(server.getId()));

        if (other.needsFloor(floor)) continue;

        bool committed = other.getCommittedStop() == floor;
        if (committed && other.getTargetFloors().size() == 1) {
            // Already on its way with nothing else to do; it settles on arrival
            continue;
        }

        other.removeTarget(floor);
        if (committed) {
            replan(other, out);
        }
    }
}

// Keep only targets backed by a pending assigned call or a rider
void Dispatcher::dropStaleTargets(Car& car) {
    const FloorRequestRegistry& registry = fleet_.getRegistry();

    auto assigned = car.getAssignedCalls();
    for (const auto& [floor, dir] : assigned) {
        if (!registry.hasCall(floor, dir)) {
            car.releaseCall(floor, dir);
        }
    }

    auto targets = car.getTargetFloors();
    for (int floor : targets) {
        if (!car.needsFloor(floor)) {
            car.removeTarget(floor);
        }
    }

    for (const auto& [passengerId, destination] : car.getOnboard()) {
        if (destination != car.getCurrentFloor()) {
            car.addTarget(destination);
        }
    }
}

void Dispatcher::driftHome(Car& car, std::vector<Command>& out) {
    int threshold = fleet_.getConfig().driftThreshold;
    const Zone& zone = car.getHomeZone();
    if (threshold < 0 || zone.empty()) {
        return;
    }

    int center = zone.center();
    if (std::abs(car.getCurrentFloor() - center) <= threshold) {
        return;
    }

    logger_.log("[DRIFT] car=" + std::to_string(car.getId()) +
                " F" + std::to_string(car.getCurrentFloor()) +
                " -> F" + std::to_string(center));
    issueMove(car, center, false, out);
}

void Dispatcher::issueMove(Car& car, int floor, bool immediate, std::vector<Command>& out) {
    if (!immediate) {
        if (car.getCommittedStop() == floor) {
            return;
        }
        car.commit(floor);
    }

    Command command{car.getId(), floor, immediate};
    logger_.logCommand(command);
    out.push_back(command);
}
