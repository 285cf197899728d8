#include "services/Scheduler.hpp"
#include "services/Aggregator.hpp"
#include "utils/CancellationFlag.hpp"
#include "utils/SourceList.hpp"
#include <glib.h>
#include <exception>
#include <thread>
#include <utility>

namespace RedditDash {

struct Scheduler::Schedule {
    uint64_t id = 0;
    std::vector<std::string> sources;
    std::chrono::milliseconds interval{0};
    Listener listener;
    TimerQueue::TimerId timer = 0;
    std::atomic<bool> active{true};
    std::atomic<bool> inFlight{false};
    // Held while clearing active and while delivering a result
    std::recursive_mutex deliverMutex;
    std::mutex cancelMutex;
    std::shared_ptr<CancellationFlag> cancel;
};

Scheduler::Executor Scheduler::threadExecutor() {
    return [](std::function<void()> task) {
        std::thread(std::move(task)).detach();
    };
}

Scheduler::Scheduler(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers)
    : Scheduler(std::move(aggregator), timers, threadExecutor()) {}

Scheduler::Scheduler(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers, Executor executor)
    : aggregator_(std::move(aggregator)), timers_(timers), executor_(std::move(executor)), nextId_(1) {
    if (!executor_) executor_ = threadExecutor();
}

Scheduler::~Scheduler() { stopAll(); }

Scheduler::Handle Scheduler::start(const std::vector<std::string>& sources,
                                   std::chrono::milliseconds interval, Listener listener) {
    auto names = normalizeSources(sources);
    if (names.empty()) {
        g_debug("No subreddits, schedule not started");
        return Handle();
    }

    auto schedule = std::make_shared<Schedule>();
    schedule->sources = names;
    schedule->interval = interval;
    schedule->listener = std::move(listener);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        schedule->id = nextId_++;
        schedules_[schedule->id] = schedule;
    }

    schedule->timer = timers_.scheduleRepeating(interval, [this, schedule]() { runCycle(schedule); });
    g_message("Refreshing %s every %lld s", joinSourceList(names).c_str(),
              static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(interval).count()));

    Handle handle(schedule->id);
    runCycle(schedule);
    return handle;
}

void Scheduler::stop(Handle handle) {
    std::shared_ptr<Schedule> schedule;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = schedules_.find(handle.id());
        if (it == schedules_.end()) return;
        schedule = it->second;
        schedules_.erase(it);
    }
    deactivate(*schedule);
    timers_.cancel(schedule->timer);
    g_debug("Schedule %llu stopped", static_cast<unsigned long long>(schedule->id));
}

void Scheduler::stopAll() {
    std::map<uint64_t, std::shared_ptr<Schedule>> stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped.swap(schedules_);
    }
    for (auto& entry : stopped) {
        deactivate(*entry.second);
        timers_.cancel(entry.second->timer);
    }
}

void Scheduler::deactivate(Schedule& schedule) {
    std::lock_guard<std::recursive_mutex> lock(schedule.deliverMutex);
    schedule.active = false;
}

void Scheduler::cancelInFlight(Handle handle) {
    auto schedule = find(handle);
    if (!schedule) return;
    std::lock_guard<std::mutex> lock(schedule->cancelMutex);
    if (schedule->cancel) schedule->cancel->cancel();
}

bool Scheduler::isActive(Handle handle) const {
    return find(handle) != nullptr;
}

bool Scheduler::isCycleInProgress(Handle handle) const {
    auto schedule = find(handle);
    return schedule && schedule->inFlight;
}

size_t Scheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schedules_.size();
}

std::shared_ptr<Scheduler::Schedule> Scheduler::find(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(handle.id());
    return it == schedules_.end() ? nullptr : it->second;
}

void Scheduler::runCycle(const std::shared_ptr<Schedule>& schedule) {
    if (!schedule->active) return;

    bool expected = false;
    if (!schedule->inFlight.compare_exchange_strong(expected, true)) {
        g_message("Previous refresh of %s still running, skipping this one",
                  joinSourceList(schedule->sources).c_str());
        return;
    }

    auto cancel = std::make_shared<CancellationFlag>();
    {
        std::lock_guard<std::mutex> lock(schedule->cancelMutex);
        schedule->cancel = cancel;
    }

    if (schedule->listener.cycleStarted && !schedule->listener.cycleStarted()) {
        g_message("Another refresh of %s is running, skipping this one",
                  joinSourceList(schedule->sources).c_str());
        release(*schedule);
        return;
    }

    auto aggregator = aggregator_;
    try {
        executor_([aggregator, schedule, cancel]() {
            AggregateResult result = aggregator->aggregate(schedule->sources, cancel.get());
            {
                std::lock_guard<std::recursive_mutex> lock(schedule->deliverMutex);
                if (schedule->active) {
                    if (schedule->listener.cycleFinished) schedule->listener.cycleFinished(result);
                } else {
                    g_debug("Schedule %llu was stopped, dropping its result",
                            static_cast<unsigned long long>(schedule->id));
                }
            }
            release(*schedule);
        });
    } catch (const std::exception& e) {
        g_warning("Could not start refresh of %s: %s", joinSourceList(schedule->sources).c_str(), e.what());
        AggregateResult result;
        result.error = Aggregator::kGenericError;
        result.errorKind = AggregateErrorKind::SourceFailure;
        {
            std::lock_guard<std::recursive_mutex> lock(schedule->deliverMutex);
            if (schedule->active && schedule->listener.cycleFinished) schedule->listener.cycleFinished(result);
        }
        release(*schedule);
    }
}

void Scheduler::release(Schedule& schedule) {
    {
        std::lock_guard<std::mutex> lock(schedule.cancelMutex);
        schedule.cancel.reset();
    }
    schedule.inFlight = false;
}

}
