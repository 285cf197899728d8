#include "services/Aggregator.hpp"
#include "services/Scheduler.hpp"
#include "services/SourceFetcher.hpp"
#include "services/TimerQueue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

using RedditDash::AggregateErrorKind;
using RedditDash::AggregateResult;
using RedditDash::Aggregator;
using RedditDash::CancellationFlag;
using RedditDash::FetchError;
using RedditDash::FetchOutcome;
using RedditDash::Post;
using RedditDash::Scheduler;
using RedditDash::SourceFetcher;
using RedditDash::TimerQueue;
using std::chrono::milliseconds;

const milliseconds kWeek = std::chrono::hours(24 * 7);

// Simulated clock: timers fire only when advance() moves time past them
class ManualTimerQueue : public TimerQueue {
public:
    TimerId scheduleRepeating(milliseconds interval, Tick tick) override {
        TimerId id = nextId_++;
        timers_[id] = Timer{interval, now_ + interval, std::move(tick)};
        return id;
    }

    void cancel(TimerId id) override { timers_.erase(id); }

    void advance(milliseconds by) {
        milliseconds target = now_ + by;
        for (;;) {
            TimerId due = 0;
            milliseconds earliest = target;
            for (const auto& entry : timers_) {
                if (entry.second.next <= earliest) {
                    earliest = entry.second.next;
                    due = entry.first;
                }
            }
            if (due == 0) break;
            now_ = earliest;
            auto tick = timers_[due].tick;
            timers_[due].next += timers_[due].interval;
            tick();
        }
        now_ = target;
    }

    size_t pending() const { return timers_.size(); }

private:
    struct Timer {
        milliseconds interval;
        milliseconds next;
        Tick tick;
    };
    std::map<TimerId, Timer> timers_;
    milliseconds now_{0};
    TimerId nextId_ = 1;
};

class CountingFetcher : public SourceFetcher {
public:
    std::atomic<int> calls{0};
    bool fail = false;

    FetchOutcome fetch(const std::string& sourceName, const CancellationFlag*) override {
        calls++;
        if (fail) return FetchOutcome::failure(sourceName, FetchError::Network, "down");
        Post post;
        post.id = sourceName + "_1";
        post.subreddit = sourceName;
        return FetchOutcome::ok(sourceName, {post});
    }
};

Scheduler::Executor inlineExecutor() {
    return [](std::function<void()> task) { task(); };
}

struct Recorder {
    int started = 0;
    bool allow = true;
    std::vector<AggregateResult> results;

    Scheduler::Listener listener() {
        Scheduler::Listener l;
        l.cycleStarted = [this]() {
            if (!allow) return false;
            started++;
            return true;
        };
        l.cycleFinished = [this](const AggregateResult& r) { results.push_back(r); };
        return l;
    }
};

void TestStartRunsImmediatelyThenEveryInterval() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());
    Recorder recorder;

    auto handle = scheduler.start({"cpp"}, kWeek, recorder.listener());
    assert(handle.isValid());
    assert(scheduler.isActive(handle));
    assert(recorder.started == 1);
    assert(recorder.results.size() == 1);
    assert(recorder.results[0].success);

    timers.advance(kWeek - milliseconds(1));
    assert(recorder.results.size() == 1);

    timers.advance(milliseconds(1));
    assert(recorder.results.size() == 2);
    assert(fetcher->calls == 2);

    timers.advance(kWeek * 3);
    assert(recorder.results.size() == 5);
}

void TestStopBeforeIntervalPreventsSecondCycle() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());
    Recorder recorder;

    auto handle = scheduler.start({"cpp", "linux"}, kWeek, recorder.listener());
    assert(recorder.results.size() == 1);

    timers.advance(kWeek / 2);
    scheduler.stop(handle);
    assert(!scheduler.isActive(handle));
    assert(timers.pending() == 0);

    timers.advance(kWeek * 2);
    assert(recorder.results.size() == 1);
    assert(fetcher->calls == 2);
}

void TestEmptyListDoesNotSchedule() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());
    Recorder recorder;

    auto handle = scheduler.start({" ", ""}, kWeek, recorder.listener());
    assert(!handle.isValid());
    assert(!scheduler.isActive(handle));
    assert(timers.pending() == 0);
    assert(recorder.started == 0);
    assert(fetcher->calls == 0);
}

void TestFailuresKeepTheScheduleRunning() {
    auto fetcher = std::make_shared<CountingFetcher>();
    fetcher->fail = true;
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());
    Recorder recorder;

    auto handle = scheduler.start({"cpp"}, kWeek, recorder.listener());
    assert(recorder.results.size() == 1);
    assert(!recorder.results[0].success);

    fetcher->fail = false;
    timers.advance(kWeek);
    assert(scheduler.isActive(handle));
    assert(recorder.results.size() == 2);
    assert(recorder.results[1].success);
}

void TestRestartReplacesSourceList() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());
    Recorder first;
    Recorder second;

    auto a = scheduler.start({"cpp"}, kWeek, first.listener());
    scheduler.stop(a);
    auto b = scheduler.start({"rust", "go"}, kWeek, second.listener());
    assert(a != b);
    assert(scheduler.activeCount() == 1);

    timers.advance(kWeek);
    assert(first.results.size() == 1);
    assert(second.results.size() == 2);
    assert(second.results[1].posts.size() == 2);
    assert(second.results[1].posts[0].subreddit == "rust");
}

void TestOverlappingTriggerIsSkipped() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;

    // Hold cycles back so the next trigger finds one still running
    std::vector<std::function<void()>> parked;
    Scheduler scheduler(aggregator, timers, [&parked](std::function<void()> task) {
        parked.push_back(std::move(task));
    });
    Recorder recorder;

    auto handle = scheduler.start({"cpp"}, kWeek, recorder.listener());
    assert(recorder.started == 1);
    assert(scheduler.isCycleInProgress(handle));

    timers.advance(kWeek);
    assert(recorder.started == 1);
    assert(parked.size() == 1);

    parked[0]();
    assert(!scheduler.isCycleInProgress(handle));
    assert(recorder.results.size() == 1);

    timers.advance(kWeek);
    assert(recorder.started == 2);
    assert(parked.size() == 2);
}

void TestStoppedScheduleDropsInFlightResult() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;

    std::vector<std::function<void()>> parked;
    Scheduler scheduler(aggregator, timers, [&parked](std::function<void()> task) {
        parked.push_back(std::move(task));
    });
    Recorder recorder;

    auto handle = scheduler.start({"cpp"}, kWeek, recorder.listener());
    scheduler.stop(handle);

    // The in-flight cycle still runs to completion
    parked[0]();
    assert(fetcher->calls == 1);
    assert(recorder.results.empty());
}

void TestCancelInFlightAbortsRunningCycle() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;

    std::vector<std::function<void()>> parked;
    Scheduler scheduler(aggregator, timers, [&parked](std::function<void()> task) {
        parked.push_back(std::move(task));
    });
    Recorder recorder;

    auto handle = scheduler.start({"cpp", "linux"}, kWeek, recorder.listener());
    scheduler.cancelInFlight(handle);
    parked[0]();

    assert(fetcher->calls == 0);
    assert(recorder.results.size() == 1);
    assert(!recorder.results[0].success);
    assert(recorder.results[0].errorKind == AggregateErrorKind::Cancelled);
    assert(recorder.results[0].error == Aggregator::kCancelledError);

    // Only that cycle is cancelled; the schedule keeps going
    assert(scheduler.isActive(handle));
    timers.advance(kWeek);
    parked[1]();
    assert(fetcher->calls == 2);
    assert(recorder.results.back().success);
}

void TestStopWaitsForDeliveryInProgress() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;

    std::vector<std::function<void()>> parked;
    Scheduler scheduler(aggregator, timers, [&parked](std::function<void()> task) {
        parked.push_back(std::move(task));
    });

    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> finished{false};

    Scheduler::Listener listener;
    listener.cycleFinished = [&](const AggregateResult&) {
        entered.set_value();
        released.wait();
        finished = true;
    };
    auto handle = scheduler.start({"cpp"}, kWeek, listener);

    std::thread worker(parked[0]);
    entered.get_future().wait();

    auto stopped = std::async(std::launch::async, [&]() { scheduler.stop(handle); });
    assert(stopped.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

    release.set_value();
    stopped.wait();
    assert(finished);
    worker.join();
    assert(!scheduler.isActive(handle));
}

void TestStopFromInsideCycleFinished() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());

    Scheduler::Handle handle;
    int delivered = 0;
    Scheduler::Listener listener;
    listener.cycleFinished = [&](const AggregateResult&) {
        delivered++;
        scheduler.stop(handle);
    };
    handle = scheduler.start({"cpp"}, kWeek, listener);
    assert(delivered == 1);
    assert(scheduler.isActive(handle));

    timers.advance(kWeek);
    assert(delivered == 2);
    assert(!scheduler.isActive(handle));
    assert(timers.pending() == 0);

    timers.advance(kWeek);
    assert(delivered == 2);
}

void TestVetoedCycleIsSkipped() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    Scheduler scheduler(aggregator, timers, inlineExecutor());
    Recorder recorder;
    recorder.allow = false;

    auto handle = scheduler.start({"cpp"}, kWeek, recorder.listener());
    assert(scheduler.isActive(handle));
    assert(!scheduler.isCycleInProgress(handle));
    assert(fetcher->calls == 0);
    assert(recorder.results.empty());

    recorder.allow = true;
    timers.advance(kWeek);
    assert(fetcher->calls == 1);
    assert(recorder.results.size() == 1);
}

void TestExecutorFailureReleasesCycle() {
    auto fetcher = std::make_shared<CountingFetcher>();
    auto aggregator = std::make_shared<Aggregator>(fetcher);
    ManualTimerQueue timers;
    bool fail = true;
    Scheduler scheduler(aggregator, timers, [&fail](std::function<void()> task) {
        if (fail) throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        task();
    });
    Recorder recorder;

    auto handle = scheduler.start({"cpp"}, kWeek, recorder.listener());
    assert(recorder.results.size() == 1);
    assert(!recorder.results[0].success);
    assert(recorder.results[0].error == Aggregator::kGenericError);
    assert(!scheduler.isCycleInProgress(handle));
    assert(fetcher->calls == 0);

    fail = false;
    timers.advance(kWeek);
    assert(recorder.results.size() == 2);
    assert(recorder.results[1].success);
}

} // namespace

int main() {
    TestStartRunsImmediatelyThenEveryInterval();
    TestStopBeforeIntervalPreventsSecondCycle();
    TestEmptyListDoesNotSchedule();
    TestFailuresKeepTheScheduleRunning();
    TestRestartReplacesSourceList();
    TestOverlappingTriggerIsSkipped();
    TestStoppedScheduleDropsInFlightResult();
    TestCancelInFlightAbortsRunningCycle();
    TestStopWaitsForDeliveryInProgress();
    TestStopFromInsideCycleFinished();
    TestVetoedCycleIsSkipped();
    TestExecutorFailureReleasesCycle();

    std::cout << "scheduler_test: pass\n";
    return 0;
}
