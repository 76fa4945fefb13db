#include <gtest/gtest.h>
#include "Types.hpp"
#include "Errors.hpp"
#include "Zone.hpp"
#include "Domain.hpp"
#include "EventQueue.hpp"
#include "Scheduler.hpp"
#include "Dispatcher.hpp"
#include "Service.hpp"
#include "Simulator.hpp"
#include <mutex>
#include <sstream>
#include <vector>

namespace {

Config makeConfig(int floors, int cars, int capacity = 8) {
    Config config;
    config.numFloors = floors;
    config.numCars = cars;
    config.carCapacity = capacity;
    return config;
}

class RecordingSink : public ICommandSink {
public:
    void moveCommand(const Command& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(command);
    }

    std::vector<Command> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Command> commands_;
};

}  // namespace

// ============== Floor Tests ==============

TEST(FloorTest, InitialState) {
    Floor floor(5);
    EXPECT_EQ(floor.getNumber(), 5);
    EXPECT_FALSE(floor.hasCall(Direction::Up));
    EXPECT_FALSE(floor.hasCall(Direction::Down));
    EXPECT_FALSE(floor.hasAnyCall());
}

TEST(FloorTest, CallFlags) {
    Floor floor(3);

    EXPECT_TRUE(floor.setCall(Direction::Up));
    EXPECT_FALSE(floor.setCall(Direction::Up));
    EXPECT_TRUE(floor.hasCall(Direction::Up));
    EXPECT_FALSE(floor.hasCall(Direction::Down));

    EXPECT_TRUE(floor.setCall(Direction::Down));
    EXPECT_FALSE(floor.setCall(Direction::None));

    EXPECT_TRUE(floor.clearCall(Direction::Up));
    EXPECT_FALSE(floor.clearCall(Direction::Up));
    EXPECT_TRUE(floor.hasCall(Direction::Down));
    EXPECT_TRUE(floor.hasAnyCall());
}

// ============== Floor Request Registry Tests ==============

TEST(RegistryTest, AddIsIdempotent) {
    FloorRequestRegistry registry(10);

    EXPECT_TRUE(registry.addCall(5, Direction::Up));
    EXPECT_FALSE(registry.addCall(5, Direction::Up));
    EXPECT_TRUE(registry.hasCall(5, Direction::Up));
    EXPECT_EQ(registry.pendingCalls().size(), 1u);
}

TEST(RegistryTest, PendingOrder) {
    FloorRequestRegistry registry(10);
    registry.addCall(7, Direction::Down);
    registry.addCall(2, Direction::Up);
    registry.addCall(7, Direction::Up);

    auto calls = registry.pendingCalls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0], std::make_pair(2, Direction::Up));
    EXPECT_EQ(calls[1], std::make_pair(7, Direction::Up));
    EXPECT_EQ(calls[2], std::make_pair(7, Direction::Down));

    auto floors = registry.pendingFloors();
    EXPECT_EQ(floors.size(), 2u);
    EXPECT_TRUE(floors.count(2));
    EXPECT_TRUE(floors.count(7));
}

TEST(RegistryTest, ClearOnlyMatchingDirection) {
    FloorRequestRegistry registry(10);
    registry.addCall(4, Direction::Up);
    registry.addCall(4, Direction::Down);

    EXPECT_TRUE(registry.clearCall(4, Direction::Up));
    EXPECT_FALSE(registry.hasCall(4, Direction::Up));
    EXPECT_TRUE(registry.hasCall(4, Direction::Down));
    EXPECT_TRUE(registry.hasAny());

    registry.clearCall(4, Direction::Down);
    EXPECT_FALSE(registry.hasAny());
}

TEST(RegistryTest, RejectsOutOfRangeFloors) {
    FloorRequestRegistry registry(10);

    EXPECT_EQ(registry.getMaxFloor(), 9);
    EXPECT_THROW(registry.addCall(10, Direction::Up), InvalidFloorError);
    EXPECT_THROW(registry.addCall(-1, Direction::Down), InvalidFloorError);
    EXPECT_THROW(registry.hasCall(42, Direction::Up), InvalidFloorError);
    EXPECT_FALSE(registry.hasAny());
}

// ============== Zone Partitioner Tests ==============

TEST(ZoneTest, TwoCarsTenFloors) {
    ZonePartitioner partitioner(9);

    EXPECT_EQ(partitioner.homeFloor(0, 2), 2);
    EXPECT_EQ(partitioner.homeFloor(1, 2), 7);
    EXPECT_EQ(partitioner.zoneFor(0, 2), (Zone{0, 4}));
    EXPECT_EQ(partitioner.zoneFor(1, 2), (Zone{5, 9}));
}

TEST(ZoneTest, SingleCarCoversBuilding) {
    ZonePartitioner partitioner(9);

    EXPECT_EQ(partitioner.homeFloor(0, 1), 4);
    EXPECT_EQ(partitioner.zoneFor(0, 1), (Zone{0, 9}));
}

TEST(ZoneTest, ContiguousZonesCoverEveryFloorOnce) {
    for (int maxFloor : {0, 4, 9, 20, 31}) {
        ZonePartitioner partitioner(maxFloor);
        for (int total = 1; total <= 12; ++total) {
            for (int floor = 0; floor <= maxFloor; ++floor) {
                int owners = 0;
                for (int i = 0; i < total; ++i) {
                    if (partitioner.zoneFor(i, total).contains(floor)) ++owners;
                }
                EXPECT_EQ(owners, 1) << "maxFloor=" << maxFloor
                                     << " total=" << total << " floor=" << floor;
            }
            for (int i = 0; i < total; ++i) {
                int home = partitioner.homeFloor(i, total);
                EXPECT_GE(home, 0);
                EXPECT_LE(home, maxFloor);
            }
        }
    }
}

TEST(ZoneTest, OverlapWidensInteriorBoundaries) {
    ZonePartitioner partitioner(9, ZoneMode::Overlapping, 0.1);

    EXPECT_EQ(partitioner.zoneFor(0, 2), (Zone{0, 5}));
    EXPECT_EQ(partitioner.zoneFor(1, 2), (Zone{4, 9}));
    EXPECT_EQ(partitioner.homeFloor(1, 2), 7);
    EXPECT_EQ(partitioner.getMode(), ZoneMode::Overlapping);
}

TEST(ZoneTest, BadArgumentsThrow) {
    EXPECT_THROW(ZonePartitioner(-1), ConfigurationError);
    EXPECT_THROW(ZonePartitioner(9, ZoneMode::Overlapping, -0.5), ConfigurationError);

    ZonePartitioner partitioner(9);
    EXPECT_THROW(partitioner.homeFloor(0, 0), ConfigurationError);
    EXPECT_THROW(partitioner.zoneFor(2, 2), ConfigurationError);
    EXPECT_THROW(partitioner.zoneFor(-1, 2), ConfigurationError);
}

// ============== Car Tests ==============

TEST(CarTest, InitialState) {
    Car car(0, 6, 2, Zone{0, 4});

    EXPECT_EQ(car.getId(), 0);
    EXPECT_EQ(car.getCurrentFloor(), 2);
    EXPECT_EQ(car.getDirection(), Direction::None);
    EXPECT_EQ(car.getState(), CarState::Resting);
    EXPECT_EQ(car.getLoad(), 0);
    EXPECT_EQ(car.getCapacity(), 6);
    EXPECT_FALSE(car.hasTargets());
    EXPECT_FALSE(car.getCommittedStop().has_value());
}

TEST(CarTest, TargetsAhead) {
    Car car(0, 6, 5, Zone{0, 9});
    car.addTarget(8);
    car.addTarget(3);
    car.addTarget(9);

    EXPECT_EQ(car.nearestTargetAhead(Direction::Up), 8);
    EXPECT_EQ(car.farthestTargetAhead(Direction::Up), 9);
    EXPECT_EQ(car.nearestTargetAhead(Direction::Down), 3);
    EXPECT_EQ(car.nearestTarget(), 3);
    EXPECT_FALSE(car.nearestTargetAhead(Direction::None).has_value());

    car.removeTarget(3);
    EXPECT_FALSE(car.hasTargetsAhead(Direction::Down));
}

TEST(CarTest, BoardingRespectsCapacity) {
    Car car(0, 2, 0, Zone{0, 9});

    car.board(1, 5);
    car.board(2, 7);
    EXPECT_TRUE(car.isFull());
    EXPECT_THROW(car.board(3, 4), CapacityError);

    // Re-reporting an onboard passenger is not a new boarding
    EXPECT_NO_THROW(car.board(2, 7));

    EXPECT_TRUE(car.alight(1));
    EXPECT_FALSE(car.alight(1));
    EXPECT_FALSE(car.isFull());
    EXPECT_TRUE(car.hasDestination(7));
    EXPECT_TRUE(car.needsFloor(7));
    EXPECT_FALSE(car.needsFloor(5));
}

TEST(CarTest, EnergyAccounting) {
    Car car(1, 8, 7, Zone{5, 9}, 2);

    car.placeAt(7);
    car.moveTo(3);
    car.recordStop();
    car.moveTo(5);

    EXPECT_EQ(car.getFloorsTravelled(), 6);
    EXPECT_EQ(car.getEnergyUsed(), 12);
    EXPECT_EQ(car.getStopCount(), 1);
}

// ============== Fleet Tests ==============

TEST(FleetTest, BuildsCarsFromPartition) {
    Fleet fleet(makeConfig(10, 2));

    EXPECT_EQ(fleet.getNumCars(), 2);
    EXPECT_EQ(fleet.getMaxFloor(), 9);
    EXPECT_EQ(fleet.getCar(0).getHomeFloor(), 2);
    EXPECT_EQ(fleet.getCar(1).getHomeZone(), (Zone{5, 9}));
    EXPECT_EQ(fleet.getPartitioner().getMaxFloor(), 9);
    EXPECT_EQ(fleet.getPartitioner().getMode(), ZoneMode::Contiguous);
    EXPECT_THROW(fleet.getCar(2), InvalidCarError);
    EXPECT_THROW(fleet.requireFloor(10), InvalidFloorError);
}

TEST(FleetTest, RejectsBadConfiguration) {
    EXPECT_THROW(Fleet{makeConfig(0, 2)}, ConfigurationError);
    EXPECT_THROW(Fleet{makeConfig(10, 0)}, ConfigurationError);
    EXPECT_THROW(Fleet{makeConfig(10, 2, 0)}, ConfigurationError);

    Config rates = makeConfig(10, 3);
    rates.energyRates = {1, 2};
    EXPECT_THROW(Fleet{rates}, ConfigurationError);

    rates.energyRates = {1, -1, 1};
    EXPECT_THROW(Fleet{rates}, ConfigurationError);
}

TEST(FleetTest, MoreCarsThanFloors) {
    Fleet fleet(makeConfig(3, 5));

    int nonEmpty = 0;
    for (const Car& car : fleet.getCars()) {
        EXPECT_GE(car.getHomeFloor(), 0);
        EXPECT_LE(car.getHomeFloor(), 2);
        if (!car.getHomeZone().empty()) ++nonEmpty;
    }
    EXPECT_EQ(nonEmpty, 3);
}

// ============== Dispatch Scorer Tests ==============

TEST(ScorerTest, RestingDistanceAndZoneBonus) {
    DispatchScorer scorer;
    Car car0(0, 8, 2, Zone{0, 4});
    Car car1(1, 8, 7, Zone{5, 9});

    EXPECT_DOUBLE_EQ(scorer.score(car0, 5, Direction::Up), 94.0);
    EXPECT_DOUBLE_EQ(scorer.score(car1, 5, Direction::Up), 146.0);
    EXPECT_DOUBLE_EQ(scorer.restingScore(car0, 3), 148.0);
}

TEST(ScorerTest, ScanningOnTheWay) {
    DispatchScorer scorer;
    Car car(0, 8, 3, Zone{0, 4});
    car.addTarget(6);
    car.addTarget(8);
    car.setDirection(Direction::Up);
    car.setState(CarState::Scanning);

    EXPECT_TRUE(scorer.isOnTheWay(car, 5, Direction::Up));
    EXPECT_DOUBLE_EQ(scorer.score(car, 5, Direction::Up), 78.0);

    // Wrong direction, behind, and past the primary target
    EXPECT_DOUBLE_EQ(scorer.score(car, 5, Direction::Down), 0.0);
    EXPECT_DOUBLE_EQ(scorer.score(car, 2, Direction::Up), 0.0);
    EXPECT_DOUBLE_EQ(scorer.score(car, 7, Direction::Up), 0.0);
}

TEST(ScorerTest, FarthestFirstExtendsTheWindow) {
    DispatchScorer scorer(ScoringPolicy{}, LookVariant::FarthestFirst);
    Car car(0, 8, 3, Zone{0, 4});
    car.addTarget(6);
    car.addTarget(8);
    car.setDirection(Direction::Up);
    car.setState(CarState::Scanning);

    EXPECT_EQ(scorer.primaryTarget(car), 8);
    EXPECT_DOUBLE_EQ(scorer.score(car, 7, Direction::Up), 76.0);
}

TEST(ScorerTest, LoadReducesScore) {
    DispatchScorer scorer;
    Car car(0, 4, 0, Zone{0, 9});
    car.addTarget(9);
    car.setDirection(Direction::Up);
    car.setState(CarState::Scanning);
    car.board(1, 9);
    car.board(2, 9);

    // (80 - 5) * (1 - 0.5 * 0.5)
    EXPECT_DOUBLE_EQ(scorer.score(car, 5, Direction::Up), 56.25);
}

TEST(ScorerTest, FullOrLoadingScoresZero) {
    DispatchScorer scorer;

    Car full(0, 1, 2, Zone{0, 4});
    full.board(1, 8);
    EXPECT_DOUBLE_EQ(scorer.score(full, 3, Direction::Up), 0.0);

    Car loading(1, 8, 2, Zone{0, 4});
    loading.setState(CarState::Loading);
    EXPECT_DOUBLE_EQ(scorer.score(loading, 3, Direction::Up), 0.0);
}

TEST(ScorerTest, PolicyIsConfigurable) {
    ScoringPolicy policy;
    policy.restingDistanceWeight = 1.0;
    policy.zoneBonus = 0.0;
    DispatchScorer scorer(policy);

    Car car(0, 8, 2, Zone{0, 4});
    EXPECT_DOUBLE_EQ(scorer.score(car, 4, Direction::Down), 98.0);
}

// ============== Scan Planner Tests ==============

TEST(PlannerTest, NearestFirstKeepsDirection) {
    ScanPlanner planner;
    Car car(0, 8, 5, Zone{0, 9});
    car.setDirection(Direction::Up);
    car.addTarget(2);
    car.addTarget(7);
    car.addTarget(9);

    EXPECT_EQ(planner.nextStop(car), 7);
    EXPECT_EQ(car.getDirection(), Direction::Up);
    EXPECT_EQ(car.getState(), CarState::Scanning);
}

TEST(PlannerTest, FarthestFirstRunsToTheEnd) {
    ScanPlanner planner(LookVariant::FarthestFirst);
    Car car(0, 8, 5, Zone{0, 9});
    car.setDirection(Direction::Up);
    car.addTarget(2);
    car.addTarget(7);
    car.addTarget(9);

    EXPECT_EQ(planner.nextStop(car), 9);
}

TEST(PlannerTest, FarthestFirstStopsForAssignedPickup) {
    ScanPlanner planner(LookVariant::FarthestFirst);
    Car car(0, 8, 4, Zone{0, 9});
    car.setDirection(Direction::Up);
    car.addTarget(9);
    car.addTarget(6);
    car.assignCall(6, Direction::Up);

    EXPECT_EQ(planner.nextStop(car), 6);

    // Calls for the return sweep do not interrupt this one
    car.releaseCall(6, Direction::Up);
    car.assignCall(6, Direction::Down);
    EXPECT_EQ(planner.nextStop(car), 9);
}

TEST(PlannerTest, ReversesWhenSweepExhausted) {
    ScanPlanner planner;
    Car car(0, 8, 5, Zone{0, 9});
    car.setDirection(Direction::Up);
    car.addTarget(2);
    car.addTarget(3);

    EXPECT_EQ(planner.nextStop(car), 3);
    EXPECT_EQ(car.getDirection(), Direction::Down);

    ScanPlanner farthest(LookVariant::FarthestFirst);
    car.setDirection(Direction::Up);
    EXPECT_EQ(farthest.nextStop(car), 2);
    EXPECT_EQ(car.getDirection(), Direction::Down);
}

TEST(PlannerTest, PicksDirectionFromNearestTarget) {
    ScanPlanner planner;
    Car car(0, 8, 5, Zone{0, 9});
    car.addTarget(3);
    car.addTarget(8);

    EXPECT_EQ(planner.nextStop(car), 3);
    EXPECT_EQ(car.getDirection(), Direction::Down);
}

TEST(PlannerTest, TargetAtCurrentFloor) {
    ScanPlanner planner;
    Car car(0, 8, 5, Zone{0, 9});
    car.setDirection(Direction::Up);
    car.addTarget(5);

    EXPECT_EQ(planner.nextStop(car), 5);
    EXPECT_EQ(car.getDirection(), Direction::Up);
}

TEST(PlannerTest, RestsWithoutTargets) {
    ScanPlanner planner;
    Car car(0, 8, 5, Zone{0, 9});
    car.setDirection(Direction::Down);
    car.setState(CarState::Scanning);
    car.moveTo(6);

    EXPECT_FALSE(planner.nextStop(car).has_value());
    EXPECT_EQ(car.getState(), CarState::Resting);
    EXPECT_EQ(car.getDirection(), Direction::None);
    EXPECT_EQ(car.getRestingFloor(), 6);
}

// ============== Dispatcher Tests ==============

class DispatcherTest : public ::testing::Test {
protected:
    Config config = makeConfig(10, 2);
    Logger logger{std::cout, false};
};

TEST_F(DispatcherTest, InitFleetPlacesCarsHome) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);

    auto commands = dispatcher.initFleet();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0], (Command{0, 2, true}));
    EXPECT_EQ(commands[1], (Command{1, 7, true}));

    for (const Car& car : fleet.getCars()) {
        EXPECT_EQ(car.getState(), CarState::Resting);
        EXPECT_FALSE(car.getCommittedStop().has_value());
    }
}

TEST_F(DispatcherTest, RestingCarInZoneWins) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    auto commands = dispatcher.onCall(5, Direction::Up);

    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{1, 5, false}));

    const Car& car1 = fleet.getCar(1);
    EXPECT_EQ(car1.getState(), CarState::Scanning);
    EXPECT_EQ(car1.getDirection(), Direction::Down);
    EXPECT_TRUE(car1.isAssigned(5, Direction::Up));
    EXPECT_TRUE(car1.hasTargetAt(5));
    EXPECT_EQ(fleet.getCar(0).getState(), CarState::Resting);
    EXPECT_TRUE(fleet.getRegistry().hasCall(5, Direction::Up));
}

TEST_F(DispatcherTest, ArrivalServesCallThenBoardingSetsDestination) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();
    dispatcher.onCall(5, Direction::Up, 0, 0);

    dispatcher.onPassingFloor(1, 6);
    auto commands = dispatcher.onStopped(1, 5);
    EXPECT_TRUE(commands.empty());
    EXPECT_FALSE(fleet.getRegistry().hasCall(5, Direction::Up));
    EXPECT_FALSE(fleet.getCar(1).isAssigned(5, Direction::Up));
    EXPECT_EQ(fleet.getCar(1).getState(), CarState::Resting);

    commands = dispatcher.onBoard(1, 0, 8, 2);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{1, 8, false}));
    EXPECT_EQ(fleet.getCar(1).getDirection(), Direction::Up);
    EXPECT_EQ(fleet.getCar(1).getState(), CarState::Scanning);
    EXPECT_TRUE(dispatcher.getWaiting().empty());
}

TEST_F(DispatcherTest, ScanningCarPicksUpOnTheWay) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    Car& car0 = fleet.getCar(0);
    car0.moveTo(3);
    car0.addTarget(6);
    car0.addTarget(8);
    car0.setDirection(Direction::Up);
    car0.setState(CarState::Scanning);
    car0.commit(6);

    EXPECT_DOUBLE_EQ(dispatcher.getScorer().score(car0, 5, Direction::Up), 78.0);

    auto commands = dispatcher.onCall(5, Direction::Up);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 5, false}));
    EXPECT_TRUE(car0.isAssigned(5, Direction::Up));
    EXPECT_EQ(car0.getTargetFloors(), (std::set<int>{5, 6, 8}));

    // The resting car would have scored higher but stays put
    EXPECT_EQ(fleet.getCar(1).getState(), CarState::Resting);
}

TEST_F(DispatcherTest, FarthestFirstStopsAtOnTheWayCall) {
    Config single = makeConfig(10, 1);
    single.lookVariant = LookVariant::FarthestFirst;
    Fleet fleet(single);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();
    EXPECT_EQ(dispatcher.getPlanner().getVariant(), LookVariant::FarthestFirst);

    auto commands = dispatcher.onBoard(0, 1, 9);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 9, false}));

    commands = dispatcher.onCall(6, Direction::Up);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 6, false}));
    EXPECT_TRUE(fleet.getCar(0).isAssigned(6, Direction::Up));

    dispatcher.onPassingFloor(0, 5);
    commands = dispatcher.onStopped(0, 6);
    EXPECT_EQ(fleet.getCar(0).getDirection(), Direction::Up);
    EXPECT_FALSE(fleet.getRegistry().hasCall(6, Direction::Up));
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 9, false}));
}

TEST_F(DispatcherTest, RepeatedCallIsNotReassigned) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    EXPECT_EQ(dispatcher.onCall(5, Direction::Up).size(), 1u);
    EXPECT_TRUE(dispatcher.onCall(5, Direction::Up).empty());
    EXPECT_EQ(fleet.getCar(0).getState(), CarState::Resting);
}

TEST_F(DispatcherTest, TieGoesToLowestCarId) {
    config.scoring.zoneBonus = 0.0;
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();
    fleet.getCar(1).placeAt(6);

    auto commands = dispatcher.onCall(4, Direction::Down);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].carId, 0);
}

TEST_F(DispatcherTest, OppositeCallAtSameFloorStaysPending) {
    Config single = makeConfig(10, 1);
    Fleet fleet(single);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    dispatcher.onCall(5, Direction::Up);
    EXPECT_TRUE(dispatcher.onCall(5, Direction::Down).empty());

    auto commands = dispatcher.onStopped(0, 5);
    EXPECT_FALSE(fleet.getRegistry().hasCall(5, Direction::Up));
    EXPECT_TRUE(fleet.getRegistry().hasCall(5, Direction::Down));

    // Picks up the other direction straight away
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 5, false}));
    EXPECT_EQ(fleet.getCar(0).getDirection(), Direction::Down);

    dispatcher.onStopped(0, 5);
    EXPECT_FALSE(dispatcher.hasPendingRequests());
    EXPECT_EQ(fleet.getCar(0).getState(), CarState::Resting);
}

TEST_F(DispatcherTest, FirstArrivalReleasesOtherCars) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();
    dispatcher.onCall(5, Direction::Up);

    Car& car0 = fleet.getCar(0);
    car0.moveTo(3);
    car0.assignCall(5, Direction::Up);
    car0.addTarget(5);
    car0.addTarget(8);
    car0.setDirection(Direction::Up);
    car0.setState(CarState::Scanning);
    car0.commit(5);

    auto commands = dispatcher.onStopped(1, 5);

    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 8, false}));
    EXPECT_FALSE(car0.isAssigned(5, Direction::Up));
    EXPECT_FALSE(car0.hasTargetAt(5));
    EXPECT_FALSE(fleet.isCallAssigned(5, Direction::Up));
}

TEST_F(DispatcherTest, AlightKeepsTargetsUntilStop) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    dispatcher.onBoard(0, 1, 8);
    EXPECT_TRUE(fleet.getCar(0).hasTargetAt(8));

    dispatcher.onAlight(0, 1, 8);
    EXPECT_FALSE(fleet.getCar(0).isCarrying(1));
    EXPECT_TRUE(fleet.getCar(0).hasTargetAt(8));

    dispatcher.onStopped(0, 8);
    EXPECT_FALSE(fleet.getCar(0).hasTargets());
}

TEST_F(DispatcherTest, IdleDriftIsIssuedOnce) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();
    fleet.getCar(0).moveTo(9);

    auto first = dispatcher.onIdle(0);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], (Command{0, 2, false}));
    EXPECT_EQ(fleet.getCar(0).getState(), CarState::Resting);

    EXPECT_TRUE(dispatcher.onIdle(0).empty());
    EXPECT_TRUE(dispatcher.onIdle(0).empty());
}

TEST_F(DispatcherTest, NoDriftWithinThreshold) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    fleet.getCar(0).moveTo(4);
    EXPECT_TRUE(dispatcher.onIdle(0).empty());

    fleet.getCar(1).moveTo(8);
    EXPECT_TRUE(dispatcher.onIdle(1).empty());
}

TEST_F(DispatcherTest, DriftCanBeDisabled) {
    config.driftThreshold = -1;
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();
    fleet.getCar(0).moveTo(9);

    EXPECT_TRUE(dispatcher.onIdle(0).empty());
    EXPECT_EQ(fleet.getCar(0).getRestingFloor(), 9);
}

TEST_F(DispatcherTest, FullCarLeavesCallForLater) {
    Config single = makeConfig(10, 1, 1);
    Fleet fleet(single);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    auto commands = dispatcher.onBoard(0, 1, 8);
    ASSERT_EQ(commands.size(), 1u);

    EXPECT_TRUE(dispatcher.onCall(6, Direction::Up).empty());
    EXPECT_FALSE(fleet.isCallAssigned(6, Direction::Up));
    EXPECT_THROW(dispatcher.onBoard(0, 2, 3), CapacityError);

    dispatcher.onPassingFloor(0, 7);
    EXPECT_TRUE(dispatcher.onStopped(0, 8).empty());
    dispatcher.onAlight(0, 1, 8);

    commands = dispatcher.onIdle(0);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 6, false}));
    EXPECT_TRUE(fleet.getCar(0).isAssigned(6, Direction::Up));
}

TEST_F(DispatcherTest, IdleDropsStaleAssignments) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    Car& car0 = fleet.getCar(0);
    car0.assignCall(4, Direction::Up);
    car0.addTarget(4);

    auto commands = dispatcher.onIdle(0);
    EXPECT_TRUE(commands.empty());
    EXPECT_FALSE(car0.hasTargets());
    EXPECT_TRUE(car0.getAssignedCalls().empty());
}

TEST_F(DispatcherTest, EnergyFollowsEvents) {
    config.energyRates = {1, 2};
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    dispatcher.onPassingFloor(1, 6);
    dispatcher.onStopped(1, 5);

    const Car& car1 = fleet.getCar(1);
    EXPECT_EQ(car1.getFloorsTravelled(), 2);
    EXPECT_EQ(car1.getEnergyUsed(), 4);
    EXPECT_EQ(car1.getStopCount(), 1);
    EXPECT_EQ(car1.getEnergyRate(), 2);
    EXPECT_EQ(fleet.getCar(0).getEnergyUsed(), 0);
    EXPECT_EQ(fleet.getCar(0).getEnergyRate(), 1);
}

TEST_F(DispatcherTest, RejectsInvalidInput) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    EXPECT_THROW(dispatcher.onCall(10, Direction::Up), InvalidFloorError);
    EXPECT_THROW(dispatcher.onCall(-1, Direction::Up), InvalidFloorError);
    EXPECT_THROW(dispatcher.onCall(3, Direction::None), InvalidEventError);
    EXPECT_THROW(dispatcher.onBoard(0, 1, 12), InvalidFloorError);
    EXPECT_THROW(dispatcher.onStopped(5, 3), InvalidCarError);

    Event idle;
    idle.type = EventType::Idle;
    idle.carId = 7;
    EXPECT_THROW(dispatcher.handle(idle), InvalidCarError);

    EXPECT_FALSE(dispatcher.hasPendingRequests());
}

TEST_F(DispatcherTest, HandleRoutesEvents) {
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    dispatcher.initFleet();

    Event call;
    call.type = EventType::Call;
    call.floor = 1;
    call.direction = Direction::Up;
    call.passengerId = 4;

    auto commands = dispatcher.handle(call);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{0, 1, false}));
    EXPECT_EQ(dispatcher.getWaiting().count(4), 1u);
}

// ============== Logger Tests ==============

TEST(LoggerTest, TickStampAndTags) {
    std::ostringstream out;
    Logger logger(out);
    std::atomic<int> tick{42};
    logger.setTickReference(&tick);

    logger.logAssignment(1, 5, Direction::Up, 146.0);
    logger.warn("careful");

    std::string text = out.str();
    EXPECT_NE(text.find("[T0042] [ASSIGN] car=1 -> floor=5 dir=Up score=146.0"), std::string::npos);
    EXPECT_NE(text.find("[WARN] careful"), std::string::npos);
}

TEST(LoggerTest, DisabledWritesNothing) {
    std::ostringstream out;
    Logger logger(out, false);

    logger.log("hidden");
    logger.logCommand(Command{0, 3, false});
    EXPECT_TRUE(out.str().empty());

    logger.enable();
    logger.logCommand(Command{0, 3, true});
    EXPECT_NE(out.str().find("[MOVE] car=0 -> floor=3 (immediate)"), std::string::npos);
}

// ============== EventQueue Tests ==============

TEST(EventQueueTest, PushPop) {
    EventQueue<Event> queue;

    Event e1;
    e1.type = EventType::Call;
    e1.floor = 5;

    EXPECT_TRUE(queue.push(e1));
    EXPECT_FALSE(queue.empty());

    auto result = queue.tryPop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->floor, 5);
    EXPECT_TRUE(queue.empty());
}

TEST(EventQueueTest, FIFO) {
    EventQueue<int> queue;

    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.tryPop().value(), 1);
    EXPECT_EQ(queue.drain(), (std::vector<int>{2, 3}));
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(EventQueueTest, ShutdownRefusesButDrains) {
    EventQueue<int> queue;
    queue.push(7);
    queue.shutdown();

    EXPECT_TRUE(queue.isShutdown());
    EXPECT_FALSE(queue.push(8));
    EXPECT_EQ(queue.pop().value(), 7);
    EXPECT_FALSE(queue.pop().has_value());
}

// ============== Dispatch Service Tests ==============

TEST(ServiceTest, ProcessDeliversToSink) {
    RecordingSink sink;
    std::ostringstream log;
    DispatchService service(makeConfig(10, 2), sink, log, false);

    service.placeFleet();
    service.placeFleet();
    EXPECT_EQ(sink.commands().size(), 2u);

    Event call;
    call.type = EventType::Call;
    call.floor = 5;
    call.direction = Direction::Up;
    call.tick = 3;

    auto commands = service.process(call);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (Command{1, 5, false}));
    EXPECT_EQ(sink.commands().back(), (Command{1, 5, false}));
    EXPECT_EQ(service.getCurrentTick(), 3);
    EXPECT_EQ(service.getProcessedCount(), 1);

    Fleet snapshot = service.snapshot();
    EXPECT_EQ(snapshot.getCar(1).getState(), CarState::Scanning);
}

TEST(ServiceTest, HandlerErrorsAreCounted) {
    RecordingSink sink;
    std::ostringstream log;
    DispatchService service(makeConfig(10, 2), sink, log, true);

    Event stopped;
    stopped.type = EventType::Stopped;
    stopped.carId = 9;
    stopped.floor = 2;

    EXPECT_TRUE(service.process(stopped).empty());
    EXPECT_EQ(service.getFailedCount(), 1);
    EXPECT_NE(log.str().find("[ERROR]"), std::string::npos);
}

TEST(ServiceTest, SubmitValidates) {
    RecordingSink sink;
    std::ostringstream log;
    DispatchService service(makeConfig(10, 2), sink, log, false);

    Event event;
    event.type = EventType::Call;
    event.floor = 12;
    event.direction = Direction::Up;
    EXPECT_FALSE(service.submit(event));

    event.floor = 0;
    event.direction = Direction::Down;
    EXPECT_FALSE(service.submit(event));

    event.floor = 9;
    event.direction = Direction::Up;
    EXPECT_FALSE(service.submit(event));

    event.direction = Direction::None;
    EXPECT_FALSE(service.submit(event));

    Event board;
    board.type = EventType::Board;
    board.carId = 0;
    board.passengerId = 1;
    board.destination = 10;
    EXPECT_FALSE(service.submit(board));

    board.carId = 2;
    board.destination = 4;
    EXPECT_FALSE(service.submit(board));

    EXPECT_EQ(service.getQueuedCount(), 0u);

    event.floor = 4;
    event.direction = Direction::Down;
    EXPECT_TRUE(service.submit(event));
    EXPECT_EQ(service.getQueuedCount(), 1u);
}

TEST(ServiceTest, WorkerDrainsQueueOnStop) {
    RecordingSink sink;
    std::ostringstream log;
    DispatchService service(makeConfig(10, 2), sink, log, false);

    Event call;
    call.type = EventType::Call;
    call.floor = 5;
    call.direction = Direction::Up;
    ASSERT_TRUE(service.submit(call));

    service.start();
    EXPECT_TRUE(service.isRunning());
    service.stop();
    EXPECT_FALSE(service.isRunning());

    EXPECT_EQ(service.getProcessedCount(), 1);
    auto commands = sink.commands();
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_TRUE(commands[0].immediate);
    EXPECT_EQ(commands[2], (Command{1, 5, false}));

    EXPECT_FALSE(service.submit(call));
}

// ============== Simulator Tests ==============

TEST(SimulatorTest, MovesOneFloorPerStep) {
    BuildingSimulator sim(makeConfig(10, 1));
    std::vector<Event> events;
    sim.setEventHandler([&events](const Event& e) { events.push_back(e); });

    sim.moveCommand(Command{0, 2, true});
    sim.moveCommand(Command{0, 4, false});
    EXPECT_EQ(sim.getCarFloor(0), 2);

    sim.step();
    EXPECT_EQ(sim.getCarFloor(0), 3);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::PassingFloor);

    sim.step();
    EXPECT_EQ(sim.getCarFloor(0), 4);
    EXPECT_FALSE(sim.getCarTarget(0).has_value());
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].type, EventType::Stopped);
    EXPECT_EQ(events[1].floor, 4);
    EXPECT_EQ(events[2].type, EventType::Idle);
}

TEST(SimulatorTest, RejectsBadInput) {
    BuildingSimulator sim(makeConfig(10, 2));

    EXPECT_THROW(sim.moveCommand(Command{2, 3, false}), InvalidCarError);
    EXPECT_THROW(sim.moveCommand(Command{0, 10, false}), InvalidFloorError);
    EXPECT_THROW(sim.spawnPassenger(-1, 3), InvalidFloorError);
    EXPECT_THROW(sim.spawnPassenger(3, 3), std::invalid_argument);
    EXPECT_EQ(sim.getSpawnedCount(), 0);
}

// ============== Integration Tests ==============

TEST(IntegrationTest, SinglePassengerDelivered) {
    Config config = makeConfig(10, 2);
    Logger logger(std::cout, false);
    Fleet fleet(config);
    Dispatcher dispatcher(fleet, logger);
    BuildingSimulator sim(config);

    for (const auto& command : dispatcher.initFleet()) {
        sim.moveCommand(command);
    }
    sim.setEventHandler([&](const Event& e) {
        for (const auto& command : dispatcher.handle(e)) {
            sim.moveCommand(command);
        }
    });

    sim.spawnPassenger(5, 8);
    EXPECT_TRUE(sim.runUntilDelivered(50));

    auto passengers = sim.getPassengers();
    ASSERT_EQ(passengers.size(), 1u);
    EXPECT_EQ(passengers[0].carId, 1);
    EXPECT_EQ(passengers[0].boardTick, 2);
    EXPECT_EQ(passengers[0].arriveTick, 5);
    EXPECT_EQ(sim.getCarFloor(1), 8);
    EXPECT_FALSE(dispatcher.hasPendingRequests());
}

// ============== Main ==============

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
