#include "app/Session.hpp"
#include "services/Aggregator.hpp"
#include "utils/CancellationFlag.hpp"
#include "utils/SourceList.hpp"
#include <glib.h>
#include <mutex>
#include <utility>

namespace RedditDash {

struct Session::Shared {
    std::mutex mutex;
    SessionState state;
    Listener listener;
    Scheduler::Handle handle;
    // Bumped whenever the source list changes; results of older cycles are dropped
    uint64_t generation = 0;
    // One cycle at a time, scheduled or manual
    bool cycleActive = false;
    std::shared_ptr<CancellationFlag> manualCancel;
};

bool Session::beginCycle(const std::shared_ptr<Shared>& shared, uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        if (generation != shared->generation || shared->cycleActive) return false;
        shared->cycleActive = true;
        shared->state.loading = true;
        shared->state.error.clear();
    }
    notify(shared);
    return true;
}

void Session::finishCycle(const std::shared_ptr<Shared>& shared, uint64_t generation,
                          const AggregateResult& result) {
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        if (generation != shared->generation) return;
        shared->cycleActive = false;
        shared->state.loading = false;
        if (result.success) {
            shared->state.posts = result.posts;
        } else {
            shared->state.error = result.error;
        }
    }
    notify(shared);
}

void Session::notify(const std::shared_ptr<Shared>& shared) {
    Listener listener;
    SessionState copy;
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        listener = shared->listener;
        copy = shared->state;
    }
    if (listener) listener(copy);
}

Session::Session(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers, std::chrono::milliseconds interval)
    : Session(std::move(aggregator), timers, interval, Scheduler::threadExecutor()) {}

Session::Session(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers, std::chrono::milliseconds interval,
                 Scheduler::Executor executor)
    : aggregator_(aggregator),
      scheduler_(aggregator, timers, executor),
      executor_(executor ? executor : Scheduler::threadExecutor()),
      interval_(interval),
      shared_(std::make_shared<Shared>()) {}

Session::~Session() { shutdown(); }

void Session::setSourceText(const std::string& raw) {
    setSources(parseSourceList(raw));
}

void Session::setSources(const std::vector<std::string>& sources) {
    auto names = normalizeSources(sources);
    Scheduler::Handle previous;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        previous = shared_->handle;
        shared_->handle = Scheduler::Handle();
        shared_->state.sources = names;
        shared_->state.loading = false;
        shared_->cycleActive = false;
        generation = ++shared_->generation;
    }
    scheduler_.stop(previous);
    notify(shared_);

    if (names.empty()) return;

    auto shared = shared_;
    Scheduler::Listener listener;
    listener.cycleStarted = [shared, generation]() { return beginCycle(shared, generation); };
    listener.cycleFinished = [shared, generation](const AggregateResult& result) {
        finishCycle(shared, generation, result);
    };

    auto handle = scheduler_.start(names, interval_, listener);
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->generation == generation) shared_->handle = handle;
}

void Session::refresh() {
    std::vector<std::string> sources;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        sources = shared_->state.sources;
        generation = shared_->generation;
    }

    if (!beginCycle(shared_, generation)) {
        g_debug("Refresh ignored, posts are already loading");
        return;
    }

    auto cancel = std::make_shared<CancellationFlag>();
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        // shutdown() may have run since beginCycle
        if (generation == shared_->generation) shared_->manualCancel = cancel;
        else cancel->cancel();
    }

    auto aggregator = aggregator_;
    auto shared = shared_;
    executor_([aggregator, shared, generation, sources, cancel]() {
        AggregateResult result = aggregator->aggregate(sources, cancel.get());
        finishCycle(shared, generation, result);
    });
}

void Session::shutdown() {
    Scheduler::Handle handle;
    std::shared_ptr<CancellationFlag> manual;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        handle = shared_->handle;
        shared_->handle = Scheduler::Handle();
        manual = shared_->manualCancel;
        shared_->manualCancel.reset();
        shared_->generation++;
        shared_->cycleActive = false;
        shared_->state.loading = false;
    }
    scheduler_.cancelInFlight(handle);
    scheduler_.stop(handle);
    if (manual) manual->cancel();
}

SessionState Session::snapshot() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->state;
}

void Session::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->listener = std::move(listener);
}

Scheduler::Handle Session::scheduleHandle() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->handle;
}

}
