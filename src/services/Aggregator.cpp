#include "services/Aggregator.hpp"
#include "services/SourceFetcher.hpp"
#include "utils/CancellationFlag.hpp"
#include "utils/SourceList.hpp"
#include <glib.h>
#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

namespace RedditDash {

const char* const Aggregator::kValidationError = "At least one source required";
const char* const Aggregator::kNotFoundPrefix = "Subreddit not found: ";
const char* const Aggregator::kGenericError =
    "An error occurred while fetching posts. Please try again later.";
const char* const Aggregator::kCancelledError = "Fetching posts was cancelled.";

namespace {

// State shared by the workers of one cycle
struct Cycle {
    std::vector<std::string> sources;
    std::vector<FetchOutcome> outcomes;
    std::mutex mutex;
    size_t next = 0;
    size_t remaining = 0;
    std::unique_ptr<CancellationFlag> cancel;
    Aggregator::Callback callback;
};

// Fetches sources until none are left; whoever records the last outcome merges
void drain(const std::shared_ptr<Cycle>& cycle, const std::shared_ptr<SourceFetcher>& fetcher) {
    for (;;) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(cycle->mutex);
            if (cycle->next >= cycle->sources.size()) return;
            index = cycle->next++;
        }

        const std::string& name = cycle->sources[index];
        FetchOutcome outcome;
        if (cycle->cancel->isCancelled()) {
            outcome = FetchOutcome::failure(name, FetchError::Cancelled,
                                            "Fetching posts from r/" + name + " was cancelled.");
        } else {
            try {
                outcome = fetcher->fetch(name, cycle->cancel.get());
            } catch (const std::exception& e) {
                g_warning("Error fetching posts from r/%s: %s", name.c_str(), e.what());
                outcome = FetchOutcome::failure(name, FetchError::Network,
                                                "Failed to fetch posts from r/" + name + ": " + e.what());
            }
        }

        bool last = false;
        {
            std::lock_guard<std::mutex> lock(cycle->mutex);
            cycle->outcomes[index] = std::move(outcome);
            last = (--cycle->remaining == 0);
        }

        if (last) {
            AggregateResult result = Aggregator::merge(cycle->outcomes);
            if (result.success) {
                g_debug("Fetched %zu posts from %zu subreddits", result.posts.size(), cycle->sources.size());
            } else {
                g_warning("Fetching posts failed: %s", result.error.c_str());
            }
            cycle->callback(std::move(result));
            return;
        }
    }
}

}

Aggregator::Aggregator(std::shared_ptr<SourceFetcher> fetcher, size_t maxConcurrent)
    : fetcher_(std::move(fetcher)), maxConcurrent_(maxConcurrent), cycleTimeout_(0),
      launcher_([](std::function<void()> task) { std::thread(std::move(task)).detach(); }) {}

void Aggregator::setLauncher(Launcher launcher) {
    launcher_ = std::move(launcher);
}

AggregateResult Aggregator::validationFailure() {
    AggregateResult result;
    result.success = false;
    result.error = kValidationError;
    result.errorKind = AggregateErrorKind::Validation;
    return result;
}

AggregateResult Aggregator::merge(const std::vector<FetchOutcome>& outcomes) {
    AggregateResult result;
    for (const auto& outcome : outcomes) {
        if (!outcome.success) result.failures.push_back(outcome);
    }

    if (result.failures.empty()) {
        result.success = true;
        for (const auto& outcome : outcomes) {
            result.posts.insert(result.posts.end(), outcome.posts.begin(), outcome.posts.end());
        }
        return result;
    }

    result.success = false;
    auto isCancelled = [](const FetchOutcome& o) { return o.error == FetchError::Cancelled; };
    auto isNotFound = [](const FetchOutcome& o) { return o.error == FetchError::NotFound; };

    auto cancelled = std::find_if(result.failures.begin(), result.failures.end(), isCancelled);
    auto notFound = std::find_if(result.failures.begin(), result.failures.end(), isNotFound);
    if (cancelled != result.failures.end()) {
        result.errorKind = AggregateErrorKind::Cancelled;
        result.error = kCancelledError;
    } else if (notFound != result.failures.end()) {
        result.errorKind = AggregateErrorKind::SourceFailure;
        result.error = std::string(kNotFoundPrefix) + notFound->detail;
    } else {
        result.errorKind = AggregateErrorKind::SourceFailure;
        result.error = kGenericError;
    }
    return result;
}

AggregateResult Aggregator::aggregate(const std::vector<std::string>& sources) {
    return aggregate(sources, nullptr);
}

AggregateResult Aggregator::aggregate(const std::vector<std::string>& sources,
                                      const CancellationFlag* cancel) {
    auto prom = std::make_shared<std::promise<AggregateResult>>();
    auto fut = prom->get_future();
    aggregateAsync(sources, cancel, [prom](AggregateResult result) {
        prom->set_value(std::move(result));
    });
    return fut.get();
}

void Aggregator::aggregateAsync(const std::vector<std::string>& sources, const CancellationFlag* cancel,
                                Callback callback) {
    auto names = normalizeSources(sources);
    if (names.empty()) {
        g_message("No subreddits given, nothing fetched");
        callback(validationFailure());
        return;
    }

    auto cycle = std::make_shared<Cycle>();
    cycle->sources = names;
    cycle->outcomes.resize(names.size());
    cycle->remaining = names.size();
    cycle->cancel = std::make_unique<CancellationFlag>(cancel);
    if (cycleTimeout_.count() > 0) cycle->cancel->setTimeout(cycleTimeout_);
    cycle->callback = std::move(callback);

    size_t workers = names.size();
    if (maxConcurrent_ > 0) workers = std::min(workers, maxConcurrent_);
    g_debug("Fetching %zu subreddits with %zu workers", names.size(), workers);

    auto fetcher = fetcher_;
    for (size_t w = 0; w < workers; ++w) {
        try {
            launcher_([cycle, fetcher]() { drain(cycle, fetcher); });
        } catch (const std::exception& e) {
            // Workers already running pick up the remaining sources
            g_warning("Started %zu of %zu fetch workers: %s", w, workers, e.what());
            if (w == 0) drain(cycle, fetcher);
            return;
        }
    }
}

}
