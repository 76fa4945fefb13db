#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include "Types.hpp"
#include "Service.hpp"
#include <atomic>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// ============== Simulated Passenger ==============

struct SimPassenger {
    int id = -1;
    int origin = -1;
    int destination = -1;
    int spawnTick = 0;
    int boardTick = -1;
    int arriveTick = -1;
    int carId = -1;
};

// ============== Building Simulator ==============
// Minimal stand-in for the building: cars move one floor per step toward the
// last commanded floor, passengers board everything that stops (up to
// capacity) and press the button again when left behind.

class BuildingSimulator : public ICommandSink {
public:
    using EventHandler = std::function<void(const Event&)>;

private:
    struct SimCar {
        int floor = 0;
        std::optional<int> target;
        std::vector<int> riders;
    };

    int numFloors_;
    int capacity_;
    std::vector<SimCar> cars_;
    std::map<int, SimPassenger> passengers_;
    std::vector<std::vector<int>> waiting_;  // Passenger ids per floor
    EventHandler handler_;
    int tick_ = 0;
    int nextPassengerId_ = 0;
    int commandCount_ = 0;
    mutable std::mutex mutex_;

public:
    explicit BuildingSimulator(const Config& config);

    void setEventHandler(EventHandler handler);

    // ICommandSink
    void moveCommand(const Command& command) override;

    // Adds a waiting passenger and raises the call
    int spawnPassenger(int origin, int destination);

    // Advance one tick
    void step();
    void run(int steps);

    // Steps until every spawned passenger has arrived; false on timeout
    bool runUntilDelivered(int maxSteps);

    // Queries
    int getTick() const;
    int getCarFloor(int carId) const;
    std::optional<int> getCarTarget(int carId) const;
    int getCommandCount() const;
    int getSpawnedCount() const;
    int getDeliveredCount() const;
    int getWaitingCount() const;
    std::vector<SimPassenger> getPassengers() const;
    double averageWait() const;
    int maxWait() const;

    void printStatus(std::ostream& out = std::cout) const;

private:
    void deliver(const std::vector<Event>& events);
    int deliveredLocked() const;
};

// ============== CLI Helper ==============

class CLI {
private:
    BuildingSimulator& simulator_;
    DispatchService& service_;
    int tickDurationMs_;
    std::atomic<bool> running_{true};
    std::thread clock_;

public:
    CLI(BuildingSimulator& simulator, DispatchService& service, int tickDurationMs);
    ~CLI();

    void run();
    void stop();

private:
    void runClock();
    void printHelp();
    void processCommand(const std::string& line);
    bool parseSpawn(const std::string& args);
    bool parseCall(const std::string& args);
};

#endif // SIMULATOR_HPP
