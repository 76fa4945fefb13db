#include "Service.hpp"
#include <exception>

DispatchService::DispatchService(const Config& config, ICommandSink& sink,
                                 std::ostream& logOut, bool logging)
    : fleet_(config),
      logger_(logOut, logging),
      dispatcher_(fleet_, logger_),
      sink_(sink) {

    logger_.setTickReference(&currentTick_);
    logger_.log("Dispatcher initialized with " +
                std::to_string(config.numFloors) + " floors, " +
                std::to_string(config.numCars) + " cars");
    logger_.log(std::string("LOOK: ") +
                (config.lookVariant == LookVariant::NearestFirst ? "nearest-first" : "farthest-first") +
                ", zones: " +
                (config.zoneMode == ZoneMode::Contiguous ? "contiguous" : "overlapping"));
}

DispatchService::~DispatchService() {
    stop();
}

void DispatchService::start() {
    if (running_.load()) return;

    placeFleet();

    running_.store(true);
    logger_.log("Dispatch service starting...");
    worker_ = std::thread(&DispatchService::runLoop, this);
}

void DispatchService::stop() {
    if (!running_.load()) return;

    logger_.log("Dispatch service stopping...");
    running_.store(false);

    // Worker finishes what is already queued, then exits
    eventQueue_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }

    logger_.log("Dispatch service stopped. processed=" +
                std::to_string(processed_.load()) +
                " failed=" + std::to_string(failed_.load()));
}

bool DispatchService::isRunning() const {
    return running_.load();
}

void DispatchService::placeFleet() {
    std::lock_guard<std::mutex> ordered(deliveryMutex_);
    std::vector<Command> commands;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (placed_) return;
        commands = dispatcher_.initFleet();
        placed_ = true;
    }
    deliver(commands);
}

bool DispatchService::submit(const Event& event) {
    if (!validate(event)) {
        return false;
    }

    if (!eventQueue_.push(event)) {
        logger_.warn("Service stopped, " + eventTypeToString(event.type) + " event dropped");
        return false;
    }
    return true;
}

std::vector<Command> DispatchService::process(const Event& event) {
    std::lock_guard<std::mutex> ordered(deliveryMutex_);
    std::vector<Command> commands;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (event.tick > currentTick_.load()) {
            currentTick_.store(event.tick);
        }

        try {
            commands = dispatcher_.handle(event);
            ++processed_;
        } catch (const std::exception& e) {
            logger_.error(std::string(e.what()) + ", " +
                          eventTypeToString(event.type) + " event dropped");
            ++failed_;
        }
    }

    deliver(commands);
    return commands;
}

void DispatchService::runLoop() {
    while (auto event = eventQueue_.pop()) {
        process(*event);
    }
}

// Reject what the dispatcher would refuse before it reaches the queue
bool DispatchService::validate(const Event& event) {
    const int maxFloor = fleet_.getMaxFloor();

    switch (event.type) {
        case EventType::Call:
            if (!fleet_.isValidFloor(event.floor)) {
                logger_.error("Invalid floor: " + std::to_string(event.floor));
                return false;
            }
            if (event.direction == Direction::None) {
                logger_.error("Call must have Up or Down direction");
                return false;
            }
            if (event.floor == 0 && event.direction == Direction::Down) {
                logger_.warn("Cannot go down from floor 0");
                return false;
            }
            if (event.floor == maxFloor && event.direction == Direction::Up) {
                logger_.warn("Cannot go up from top floor");
                return false;
            }
            return true;

        case EventType::Stopped:
        case EventType::Alight:
        case EventType::PassingFloor:
        case EventType::Board:
        case EventType::Idle:
            break;
    }

    if (!fleet_.isValidCar(event.carId)) {
        logger_.error("Invalid car: " + std::to_string(event.carId));
        return false;
    }

    int floor = (event.type == EventType::Board) ? event.destination : event.floor;
    if (event.type != EventType::Idle && !fleet_.isValidFloor(floor)) {
        logger_.error("Invalid floor: " + std::to_string(floor));
        return false;
    }
    return true;
}

void DispatchService::deliver(const std::vector<Command>& commands) {
    for (const auto& command : commands) {
        sink_.moveCommand(command);
    }
}

Fleet DispatchService::snapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return fleet_;
}

void DispatchService::printStatus(std::ostream& out) const {
    Fleet fleet = snapshot();

    out << "\n========== Status at Tick " << currentTick_.load() << " ==========\n";

    for (const Car& car : fleet.getCars()) {
        out << "Car " << car.getId() << ": "
            << "Floor " << car.getCurrentFloor() << ", "
            << stateToString(car.getState()) << ", "
            << directionToString(car.getDirection()) << ", "
            << "Load " << car.getLoad() << "/" << car.getCapacity() << ", "
            << "Energy " << car.getEnergyUsed()
            << " (" << car.getFloorsTravelled() << " floors, "
            << car.getStopCount() << " stops)";

        const auto& targets = car.getTargetFloors();
        if (!targets.empty()) {
            out << ", Targets: {";
            bool first = true;
            for (int t : targets) {
                if (!first) out << ", ";
                out << t;
                first = false;
            }
            out << "}";
        }
        out << "\n";
    }

    auto calls = fleet.getRegistry().pendingCalls();
    if (!calls.empty()) {
        out << "Pending Calls: ";
        for (const auto& [floor, dir] : calls) {
            out << floor << directionToString(dir)[0] << " ";
        }
        out << "\n";
    }

    out << "==========================================\n\n";
}

int DispatchService::getCurrentTick() const { return currentTick_.load(); }
int DispatchService::getProcessedCount() const { return processed_.load(); }
int DispatchService::getFailedCount() const { return failed_.load(); }
size_t DispatchService::getQueuedCount() const { return eventQueue_.size(); }
Logger& DispatchService::getLogger() { return logger_; }
