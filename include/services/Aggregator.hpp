#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "services/Post.hpp"

namespace RedditDash {

class CancellationFlag;
class SourceFetcher;

class Aggregator {
public:
    using Callback = std::function<void(AggregateResult)>;
    // Starts one worker; throws when no worker can be started
    using Launcher = std::function<void(std::function<void()>)>;

    static const char* const kValidationError;
    static const char* const kNotFoundPrefix;
    static const char* const kGenericError;
    static const char* const kCancelledError;

    // maxConcurrent == 0 starts one fetch per source at once
    explicit Aggregator(std::shared_ptr<SourceFetcher> fetcher, size_t maxConcurrent = 0);

    // Blocks until every fetch has finished
    AggregateResult aggregate(const std::vector<std::string>& sources);
    AggregateResult aggregate(const std::vector<std::string>& sources, const CancellationFlag* cancel);

    // The callback runs on the worker thread that finished last, or inline for
    // validation errors. cancel must outlive the cycle.
    void aggregateAsync(const std::vector<std::string>& sources, const CancellationFlag* cancel,
                        Callback callback);

    void setCycleTimeout(std::chrono::milliseconds timeout) { cycleTimeout_ = timeout; }
    void setLauncher(Launcher launcher);

    static AggregateResult validationFailure();
    static AggregateResult merge(const std::vector<FetchOutcome>& outcomes);

private:
    std::shared_ptr<SourceFetcher> fetcher_;
    size_t maxConcurrent_;
    std::chrono::milliseconds cycleTimeout_;
    Launcher launcher_;
};

}
