#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "services/Post.hpp"
#include "services/Scheduler.hpp"

namespace RedditDash {

class Aggregator;
class TimerQueue;

struct SessionState {
    std::vector<std::string> sources;
    std::vector<Post> posts;
    std::string error;
    bool loading = false;
};

// Owns what the front end shows: the source list, the last posts, the last
// error and the loading flag, plus the refresh schedule for the source list.
class Session {
public:
    using Listener = std::function<void(const SessionState&)>;

    Session(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers, std::chrono::milliseconds interval);
    Session(std::shared_ptr<Aggregator> aggregator, TimerQueue& timers, std::chrono::milliseconds interval,
            Scheduler::Executor executor);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void setSourceText(const std::string& raw);
    void setSources(const std::vector<std::string>& sources);

    // One cycle now; ignored while a cycle is loading
    void refresh();
    void shutdown();

    SessionState snapshot() const;
    // Called from whichever thread changed the state
    void setListener(Listener listener);

    Scheduler::Handle scheduleHandle() const;

private:
    struct Shared;

    static bool beginCycle(const std::shared_ptr<Shared>& shared, uint64_t generation);
    static void finishCycle(const std::shared_ptr<Shared>& shared, uint64_t generation,
                            const AggregateResult& result);
    static void notify(const std::shared_ptr<Shared>& shared);

    std::shared_ptr<Aggregator> aggregator_;
    Scheduler scheduler_;
    Scheduler::Executor executor_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<Shared> shared_;
};

}
