#include "Scheduler.hpp"
#include <algorithm>
#include <cstdlib>

// ============== Dispatch Scorer Implementation ==============

DispatchScorer::DispatchScorer(const ScoringPolicy& policy, LookVariant lookVariant)
    : policy_(policy), lookVariant_(lookVariant) {}

double DispatchScorer::score(const Car& car, int callFloor, Direction callDirection) const {
    if (car.isFull()) {
        return 0.0;
    }

    switch (car.getState()) {
        case CarState::Resting:
            return restingScore(car, callFloor);

        case CarState::Scanning: {
            if (!isOnTheWay(car, callFloor, callDirection)) {
                return 0.0;
            }
            int distance = std::abs(car.getCurrentFloor() - callFloor);
            double score = policy_.movingBase - policy_.movingDistanceWeight * distance;

            double load = static_cast<double>(car.getLoad()) / car.getCapacity();
            score *= (1.0 - policy_.loadPenalty * std::min(1.0, load));
            return score;
        }

        case CarState::Loading:
            return 0.0;
    }
    return 0.0;
}

double DispatchScorer::restingScore(const Car& car, int floor) const {
    int distance = std::abs(car.getCurrentFloor() - floor);
    double score = policy_.restingBase - policy_.restingDistanceWeight * distance;

    if (car.getHomeZone().contains(floor)) {
        score += policy_.zoneBonus;
    }
    return score;
}

bool DispatchScorer::isOnTheWay(const Car& car, int floor, Direction dir) const {
    Direction heading = car.getDirection();
    if (heading == Direction::None || heading != dir) {
        return false;
    }

    auto target = primaryTarget(car);
    if (!target) {
        return false;
    }

    int current = car.getCurrentFloor();
    if (heading == Direction::Up) {
        return current <= floor && floor <= *target;
    }
    return current >= floor && floor >= *target;
}

std::optional<int> DispatchScorer::primaryTarget(const Car& car) const {
    if (lookVariant_ == LookVariant::FarthestFirst) {
        return car.farthestTargetAhead(car.getDirection());
    }
    return car.nearestTargetAhead(car.getDirection());
}

// ============== Scan Planner Implementation ==============

ScanPlanner::ScanPlanner(LookVariant lookVariant) : lookVariant_(lookVariant) {}

std::optional<int> ScanPlanner::stopAhead(const Car& car, Direction dir) const {
    if (lookVariant_ == LookVariant::NearestFirst) {
        return car.nearestTargetAhead(dir);
    }

    auto farthest = car.farthestTargetAhead(dir);
    if (!farthest) {
        return std::nullopt;
    }
    if (auto pickup = nearestPickupAhead(car, dir)) {
        return pickup;
    }
    return farthest;
}

// Hall calls assigned in the sweep direction are stops even when the sweep
// runs past them; otherwise they would be served heading the wrong way.
std::optional<int> ScanPlanner::nearestPickupAhead(const Car& car, Direction dir) const {
    std::optional<int> nearest;
    int current = car.getCurrentFloor();

    for (const auto& [floor, callDir] : car.getAssignedCalls()) {
        if (callDir != dir) continue;

        bool ahead = (dir == Direction::Up) ? floor > current : floor < current;
        if (!ahead) continue;

        if (!nearest || std::abs(floor - current) < std::abs(*nearest - current)) {
            nearest = floor;
        }
    }
    return nearest;
}

std::optional<int> ScanPlanner::nextStop(Car& car) const {
    if (!car.hasTargets()) {
        car.rest();
        return std::nullopt;
    }

    car.setState(CarState::Scanning);

    Direction dir = car.getDirection();
    if (dir == Direction::None) {
        dir = directionBetween(car.getCurrentFloor(), *car.nearestTarget());
        if (dir == Direction::None) {
            dir = Direction::Up;
        }
        car.setDirection(dir);
    }

    if (auto stop = stopAhead(car, dir)) {
        return stop;
    }

    Direction reversed = opposite(dir);
    if (auto stop = stopAhead(car, reversed)) {
        car.setDirection(reversed);
        return stop;
    }

    // Every remaining target is the current floor; direction stays as it was
    return car.nearestTarget();
}
