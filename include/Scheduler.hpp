#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include <optional>

// ============== Dispatch Scorer ==============
// Ranks cars for a hall call. Higher is better, <= 0 means not a candidate.
// Pure function of the car snapshot; never mutates.

class DispatchScorer {
private:
    ScoringPolicy policy_;
    LookVariant lookVariant_;

public:
    explicit DispatchScorer(const ScoringPolicy& policy = ScoringPolicy{},
                            LookVariant lookVariant = LookVariant::NearestFirst);

    double score(const Car& car, int callFloor, Direction callDirection) const;

    // Distance score plus zone bonus, as for a resting car. Also used when a
    // car picks up a pending call on its own.
    double restingScore(const Car& car, int floor) const;

    // Call floor lies between the car and its primary target, same direction
    bool isOnTheWay(const Car& car, int floor, Direction dir) const;

    // The stop the car is currently sweeping toward
    std::optional<int> primaryTarget(const Car& car) const;

    const ScoringPolicy& getPolicy() const { return policy_; }
};

// ============== Scan Planner ==============
// LOOK discipline: keep the current direction while targets remain ahead,
// reverse once the sweep is exhausted.

class ScanPlanner {
private:
    LookVariant lookVariant_;

public:
    explicit ScanPlanner(LookVariant lookVariant = LookVariant::NearestFirst);

    // Picks the next stop and updates the car's direction and state.
    // Returns nullopt and rests the car when it has no targets.
    std::optional<int> nextStop(Car& car) const;

    // Stop the car would pick in dir without reversing. FarthestFirst still
    // stops at same-direction hall calls assigned on the way.
    std::optional<int> stopAhead(const Car& car, Direction dir) const;

    std::optional<int> nearestPickupAhead(const Car& car, Direction dir) const;

    LookVariant getVariant() const { return lookVariant_; }
};

#endif // SCHEDULER_HPP
