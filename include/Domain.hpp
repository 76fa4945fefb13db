#ifndef DOMAIN_HPP
#define DOMAIN_HPP

#include "Types.hpp"
#include "Zone.hpp"
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

// ============== Floor ==============

class Floor {
private:
    int floorNumber_;
    bool upCall_ = false;
    bool downCall_ = false;

public:
    explicit Floor(int number);

    // Return true when the flag actually changed
    bool setCall(Direction dir);
    bool clearCall(Direction dir);

    bool hasCall(Direction dir) const;
    bool hasAnyCall() const;
    int getNumber() const;
};

// ============== Floor Request Registry ==============
// Outstanding hall calls per floor and direction. Floors outside
// [0, maxFloor] are rejected with InvalidFloorError.

class FloorRequestRegistry {
private:
    std::vector<Floor> floors_;

public:
    explicit FloorRequestRegistry(int numFloors);

    bool addCall(int floor, Direction dir);
    bool clearCall(int floor, Direction dir);
    bool hasCall(int floor, Direction dir) const;

    std::set<int> pendingFloors() const;
    // Ordered by floor, Up before Down
    std::vector<std::pair<int, Direction>> pendingCalls() const;
    bool hasAny() const;

    int getMaxFloor() const;
    bool isValidFloor(int floor) const;

private:
    const Floor& floorAt(int floor) const;
    Floor& floorAt(int floor);
};

// ============== Car ==============

class Car {
private:
    int id_;
    int currentFloor_;
    Direction direction_ = Direction::None;
    CarState state_ = CarState::Resting;
    std::set<int> targetFloors_;                          // Obligated stops
    std::set<std::pair<int, Direction>> assignedCalls_;   // Hall calls this car answers
    std::map<int, int> onboard_;                          // passengerId -> destination
    int capacity_;
    int homeFloor_;
    Zone homeZone_;
    int restingFloor_;
    std::optional<int> committedStop_;                    // Last floor commanded

    int energyRate_;
    int floorsTravelled_ = 0;
    int stopCount_ = 0;
    long energyUsed_ = 0;

public:
    Car(int id, int capacity, int homeFloor, Zone homeZone, int energyRate = 1);

    // Getters
    int getId() const;
    int getCurrentFloor() const;
    Direction getDirection() const;
    CarState getState() const;
    int getCapacity() const;
    int getHomeFloor() const;
    const Zone& getHomeZone() const;
    int getRestingFloor() const;
    const std::set<int>& getTargetFloors() const;
    const std::set<std::pair<int, Direction>>& getAssignedCalls() const;
    const std::map<int, int>& getOnboard() const;

    // Position and accounting
    void placeAt(int floor);   // Startup placement, not counted as travel
    void moveTo(int floor);
    void recordStop();
    int getFloorsTravelled() const;
    int getStopCount() const;
    long getEnergyUsed() const;
    int getEnergyRate() const;

    // State transitions
    void setDirection(Direction dir);
    void setState(CarState state);
    void rest();

    // Target floors
    void addTarget(int floor);
    bool removeTarget(int floor);
    bool hasTargetAt(int floor) const;
    bool hasTargets() const;
    bool hasTargetsAhead(Direction dir) const;
    std::optional<int> nearestTargetAhead(Direction dir) const;
    std::optional<int> farthestTargetAhead(Direction dir) const;
    std::optional<int> nearestTarget() const;

    // Hall call assignments
    void assignCall(int floor, Direction dir);
    bool releaseCall(int floor, Direction dir);
    bool isAssigned(int floor, Direction dir) const;
    std::vector<Direction> assignmentsAt(int floor) const;

    // True when an assignment or an onboard destination still needs this floor
    bool needsFloor(int floor) const;

    // Passenger management
    void board(int passengerId, int destination);
    bool alight(int passengerId);
    bool isCarrying(int passengerId) const;
    bool hasDestination(int floor) const;
    bool isFull() const;
    int getLoad() const;

    // Move commitment
    std::optional<int> getCommittedStop() const;
    void commit(int floor);
    void clearCommitment();
};

// ============== Fleet ==============
// Owns every car and the call registry. Construction validates the
// configuration and throws ConfigurationError.

class Fleet {
private:
    Config config_;
    ZonePartitioner partitioner_;
    FloorRequestRegistry registry_;
    std::vector<Car> cars_;

public:
    explicit Fleet(const Config& config);

    // Accessors
    int getNumFloors() const;
    int getMaxFloor() const;
    int getNumCars() const;
    const Config& getConfig() const;
    const ZonePartitioner& getPartitioner() const;

    // Car access
    Car& getCar(int id);
    const Car& getCar(int id) const;
    std::vector<Car>& getCars();
    const std::vector<Car>& getCars() const;

    // Call registry access
    FloorRequestRegistry& getRegistry();
    const FloorRequestRegistry& getRegistry() const;

    // Queries
    bool isCallAssigned(int floor, Direction dir) const;
    std::vector<std::pair<int, Direction>> unassignedCalls() const;

    // Validation
    bool isValidFloor(int floor) const;
    bool isValidCar(int id) const;
    void requireFloor(int floor) const;

    static void validate(const Config& config);
};

#endif // DOMAIN_HPP
