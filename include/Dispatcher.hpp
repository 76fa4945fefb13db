#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Logger.hpp"
#include "Scheduler.hpp"
#include <map>
#include <optional>
#include <vector>

// ============== Dispatcher ==============
// Turns building events into move commands. Owns every decision about which
// car answers a call and where each car goes next. Single-threaded: callers
// embedding it in a concurrent service must serialise handle().
//
// A command is only emitted when it changes the car's commitment, so
// replaying an event with no intervening change yields no new command.

class Dispatcher {
private:
    Fleet& fleet_;
    Logger& logger_;
    DispatchScorer scorer_;
    ScanPlanner planner_;
    std::map<int, Passenger> waiting_;  // Called, not yet boarded

public:
    Dispatcher(Fleet& fleet, Logger& logger);

    // Startup placement: every car to its home floor, immediate
    std::vector<Command> initFleet();

    // Single entry point for all event kinds
    std::vector<Command> handle(const Event& event);

    // Event hooks
    std::vector<Command> onCall(int floor, Direction dir, int passengerId = -1, int tick = 0);
    std::vector<Command> onStopped(int carId, int floor);
    std::vector<Command> onBoard(int carId, int passengerId, int destination, int tick = 0);
    std::vector<Command> onAlight(int carId, int passengerId, int floor);
    std::vector<Command> onIdle(int carId);
    std::vector<Command> onPassingFloor(int carId, int floor);

    bool hasPendingRequests() const;

    const Fleet& getFleet() const;
    const DispatchScorer& getScorer() const;
    const ScanPlanner& getPlanner() const;
    const std::map<int, Passenger>& getWaiting() const;

private:
    // Candidate selection, ties to the lowest car id
    std::optional<int> selectScanningCar(int floor, Direction dir) const;
    std::optional<int> selectRestingCar(int floor, Direction dir) const;

    void wake(Car& car, int floor, Direction dir, std::vector<Command>& out);
    void replan(Car& car, std::vector<Command>& out);
    void settle(Car& car, std::vector<Command>& out);
    bool selfDispatch(Car& car, std::vector<Command>& out);
    void absorbPendingCalls(Car& car);
    void serveCall(int floor, Direction dir, Car& server, std::vector<Command>& out);
    void dropStaleTargets(Car& car);
    void driftHome(Car& car, std::vector<Command>& out);
    void issueMove(Car& car, int floor, bool immediate, std::vector<Command>& out);
};

#endif // DISPATCHER_HPP
