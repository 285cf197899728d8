#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "services/Post.hpp"
#include "services/TimerQueue.hpp"

namespace RedditDash {

class Aggregator;

// Runs an aggregation cycle immediately on start() and then every interval
// until stop(). A schedule's source list never changes; restart to change it.
class Scheduler {
public:
    using Executor = std::function<void(std::function<void()>)>;

    // cycleStarted may veto a cycle by returning false; the trigger is then skipped
    struct Listener {
        std::function<bool()> cycleStarted;
        std::function<void(const AggregateResult&)> cycleFinished;
    };

    class Handle {
    public:
        Handle() : id_(0) {}
        bool isValid() const { return id_ != 0; }
        uint64_t id() const { return id_; }
        bool operator==(const Handle& other) const { return id_ == other.id_; }
        bool operator!=(const Handle& other) const { return id_ != other.id_; }

    private:
        friend class Scheduler;
        explicit Handle(uint64_t id) : id_(id) {}
        uint64_t id_;
    };

    Scheduler(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers);
    Scheduler(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers, Executor executor);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // An empty source list schedules nothing and returns an invalid handle.
    Handle start(const std::vector<std::string>& sources, std::chrono::milliseconds interval,
                 Listener listener);
    // Pending triggers are dropped. A cycle already running finishes, but its
    // result is not delivered once stop() has returned. Safe to call from
    // inside cycleFinished.
    void stop(Handle handle);
    void stopAll();
    // Aborts the in-flight cycle of a schedule, if any
    void cancelInFlight(Handle handle);

    bool isActive(Handle handle) const;
    bool isCycleInProgress(Handle handle) const;
    size_t activeCount() const;

    // Runs each cycle on its own detached thread
    static Executor threadExecutor();

private:
    struct Schedule;

    void runCycle(const std::shared_ptr<Schedule>& schedule);
    static void deactivate(Schedule& schedule);
    static void release(Schedule& schedule);
    std::shared_ptr<Schedule> find(Handle handle) const;

    std::shared_ptr<Aggregator> aggregator_;
    TimerQueue& timers_;
    Executor executor_;
    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<Schedule>> schedules_;
    uint64_t nextId_;
};

}
