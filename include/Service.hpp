#ifndef SERVICE_HPP
#define SERVICE_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Dispatcher.hpp"
#include "EventQueue.hpp"
#include "Logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

// ============== Command Sink ==============
// Receives move commands. Called outside the dispatch lock; implementations
// must not block for long.

class ICommandSink {
public:
    virtual ~ICommandSink() = default;
    virtual void moveCommand(const Command& command) = 0;
};

// ============== Dispatch Service ==============
// Threaded embedding of the dispatcher. Events are queued by any thread and
// handled one at a time on the worker, behind a single state lock, so scoring
// never sees a half-updated fleet.

class DispatchService {
private:
    Fleet fleet_;
    Logger logger_;
    Dispatcher dispatcher_;
    EventQueue<Event> eventQueue_;
    ICommandSink& sink_;

    mutable std::mutex stateMutex_;
    std::mutex deliveryMutex_;  // Held across handling and delivery
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<int> currentTick_{0};
    std::atomic<int> processed_{0};
    std::atomic<int> failed_{0};
    bool placed_ = false;

public:
    DispatchService(const Config& config, ICommandSink& sink,
                    std::ostream& logOut = std::cout, bool logging = true);
    ~DispatchService();

    // Non-copyable
    DispatchService(const DispatchService&) = delete;
    DispatchService& operator=(const DispatchService&) = delete;

    // Lifecycle. The service runs once; events submitted after stop() are refused.
    void start();
    void stop();
    bool isRunning() const;

    // Startup placement, sent to the sink once
    void placeFleet();

    // Validate and queue for the worker
    bool submit(const Event& event);

    // Handle on the calling thread and deliver the resulting commands.
    // Concurrent callers reach the sink in the order their state changes
    // were applied.
    std::vector<Command> process(const Event& event);

    // Status
    Fleet snapshot() const;
    void printStatus(std::ostream& out = std::cout) const;
    int getCurrentTick() const;
    int getProcessedCount() const;
    int getFailedCount() const;
    size_t getQueuedCount() const;
    Logger& getLogger();

private:
    void runLoop();
    bool validate(const Event& event);
    void deliver(const std::vector<Command>& commands);
};

#endif // SERVICE_HPP
