#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <vector>

// ============== Enums =============

enum class Direction {
    Up,
    Down,
    None
};

enum class CarState {
    Resting,    // No pending work, no commanded motion
    Scanning,   // Has at least one target, sweeping toward it
    Loading     // Stopped with doors open, next decision not yet made
};

enum class EventType {
    Call,           // Floor button pressed
    Stopped,        // Car stopped at a floor
    Board,          // Passenger entered a car
    Alight,         // Passenger left a car
    Idle,           // Car has no commanded floor left
    PassingFloor    // Car moved past a floor without stopping
};

// Stop selection inside the active direction
enum class LookVariant {
    NearestFirst,
    FarthestFirst
};

enum class ZoneMode {
    Contiguous,
    Overlapping
};

// ============== Configuration ==============

struct ScoringPolicy {
    double restingBase = 100.0;
    double restingDistanceWeight = 2.0;
    double zoneBonus = 50.0;
    double movingBase = 80.0;
    double movingDistanceWeight = 1.0;
    double loadPenalty = 0.5;
};

struct Config {
    int numFloors = 10;         // Floors 0 .. numFloors-1
    int numCars = 2;
    int carCapacity = 8;
    LookVariant lookVariant = LookVariant::NearestFirst;
    ZoneMode zoneMode = ZoneMode::Contiguous;
    double zoneOverlap = 0.1;   // Fraction of a zone segment, Overlapping only
    int driftThreshold = 2;     // Negative disables drifting home
    std::vector<int> energyRates;  // Per car; empty means 1 for every car
    int tickDurationMs = 200;
    ScoringPolicy scoring;
};

// ============== Event ==============

// One inbound notification from the building. Which fields are meaningful
// depends on type:
//   Call          floor, direction, [passengerId]
//   Stopped       carId, floor
//   Board         carId, passengerId, destination
//   Alight        carId, passengerId, floor
//   Idle          carId
//   PassingFloor  carId, floor
struct Event {
    EventType type = EventType::Idle;
    int carId = -1;
    int floor = -1;
    Direction direction = Direction::None;
    int passengerId = -1;
    int destination = -1;
    int tick = 0;
};

// ============== Passenger ==============

// Bookkeeping from call to boarding. destinationFloor is -1 until known.
struct Passenger {
    int id = -1;
    int originFloor = -1;
    int destinationFloor = -1;
    int callTick = 0;
};

// ============== Command ==============

struct Command {
    int carId = -1;
    int targetFloor = -1;
    bool immediate = false;  // Startup placement only

    bool operator==(const Command& other) const {
        return carId == other.carId && targetFloor == other.targetFloor &&
               immediate == other.immediate;
    }
};

// ============== Utility Functions ==============

inline std::string directionToString(Direction dir) {
    switch (dir) {
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
        case Direction::None: return "None";
    }
    return "Unknown";
}

inline std::string stateToString(CarState state) {
    switch (state) {
        case CarState::Resting: return "Resting";
        case CarState::Scanning: return "Scanning";
        case CarState::Loading: return "Loading";
    }
    return "Unknown";
}

inline std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::Call: return "Call";
        case EventType::Stopped: return "Stopped";
        case EventType::Board: return "Board";
        case EventType::Alight: return "Alight";
        case EventType::Idle: return "Idle";
        case EventType::PassingFloor: return "PassingFloor";
    }
    return "Unknown";
}

inline Direction opposite(Direction dir) {
    switch (dir) {
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::None: return Direction::None;
    }
    return Direction::None;
}

// Direction of travel from one floor to another; None when equal
inline Direction directionBetween(int from, int to) {
    if (to > from) return Direction::Up;
    if (to < from) return Direction::Down;
    return Direction::None;
}

#endif // TYPES_HPP
