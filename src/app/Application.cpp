#include "app/Application.hpp"
#include "services/Aggregator.hpp"
#include "services/SourceFetcher.hpp"
#include "services/TimerQueue.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/SourceList.hpp"
#include <glib-unix.h>
#include <csignal>
#include <iostream>

namespace RedditDash {

namespace {

struct StateUpdate {
    Application* app;
    SessionState state;
};

}

Application::Application() : loop_(nullptr), subredditsGiven_(false), once_(false), sawLoading_(false), exitCode_(0) {
    loop_ = g_main_loop_new(nullptr, FALSE);
}

Application::~Application() {
    session_.reset();
    timers_.reset();
    if (loop_) {
        g_main_loop_unref(loop_);
    }
}

bool Application::parseOptions(int argc, char* argv[]) {
    gchar* subreddits = nullptr;
    gchar* configPath = nullptr;
    gboolean once = FALSE;

    GOptionEntry entries[] = {
        {"subreddits", 's', 0, G_OPTION_ARG_STRING, &subreddits,
         "Comma-separated subreddits to follow (saved to the config)", "LIST"},
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &configPath, "Config file to use", "PATH"},
        {"once", 'o', 0, G_OPTION_ARG_NONE, &once, "Fetch once and exit", nullptr},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}
    };

    GOptionContext* context = g_option_context_new("- top posts of the week from several subreddits");
    g_option_context_add_main_entries(context, entries, nullptr);

    GError* error = nullptr;
    bool ok = g_option_context_parse(context, &argc, &argv, &error);
    if (!ok) {
        std::cerr << "Option parsing failed: " << (error ? error->message : "unknown error") << std::endl;
        if (error) g_error_free(error);
    }
    g_option_context_free(context);

    subredditsGiven_ = subreddits != nullptr;
    if (subreddits) subredditsOption_ = subreddits;
    if (configPath) configPath_ = configPath;
    once_ = once;
    g_free(subreddits);
    g_free(configPath);
    return ok;
}

bool Application::setupSession() {
    auto& config = Config::getInstance();
    if (!configPath_.empty()) config.setConfigPath(configPath_);
    config.load();
    if (subredditsGiven_ && !config.setSubredditsFromText(subredditsOption_)) {
        // Keep the saved list rather than replacing it with nothing
        std::cerr << Aggregator::kValidationError << std::endl;
        return false;
    }

    auto client = std::make_shared<HttpClient>();
    client->setUserAgent(config.getUserAgent());
    client->setTimeout(config.getRequestTimeoutSeconds());

    RedditFetcher::Options options;
    options.baseUrl = config.getBaseUrl();
    options.timeWindow = config.getTimeWindow();
    options.limit = config.getItemLimit();
    auto fetcher = std::make_shared<RedditFetcher>(client, options);

    auto aggregator = std::make_shared<Aggregator>(fetcher, static_cast<size_t>(config.getMaxConcurrentFetches()));
    aggregator->setCycleTimeout(std::chrono::seconds(config.getCycleTimeoutSeconds()));

    timers_ = std::make_unique<GLibTimerQueue>();
    session_ = std::make_unique<Session>(aggregator, *timers_,
                                         std::chrono::seconds(config.getRefreshIntervalSeconds()));

    // Session callbacks arrive on worker threads; hop to the main loop before printing
    session_->setListener([this](const SessionState& state) {
        g_idle_add(onStateChanged, new StateUpdate{this, state});
    });
    return true;
}

int Application::run(int argc, char* argv[]) {
    if (!parseOptions(argc, argv)) return 2;

    if (!setupSession()) return 1;
    g_unix_signal_add(SIGINT, onQuitSignal, this);
    g_unix_signal_add(SIGTERM, onQuitSignal, this);

    auto sources = Config::getInstance().getSubreddits();
    if (sources.empty()) {
        // Nothing to schedule; let the aggregator report the validation error
        once_ = true;
        session_->refresh();
    } else {
        session_->setSources(sources);
    }

    g_main_loop_run(loop_);
    session_->shutdown();
    return exitCode_;
}

void Application::handleState(const SessionState& state) {
    if (state.loading) {
        if (!sawLoading_) std::cout << "Fetching posts from " << joinSourceList(state.sources) << "..." << std::endl;
        sawLoading_ = true;
        return;
    }
    if (!sawLoading_) return;
    sawLoading_ = false;

    render(state);
    if (once_) quit(state.error.empty() ? 0 : 1);
}

void Application::render(const SessionState& state) const {
    if (!state.error.empty()) {
        std::cerr << state.error << std::endl;
        return;
    }
    if (state.posts.empty()) {
        std::cout << "No posts found." << std::endl;
        return;
    }
    for (const auto& post : state.posts) {
        std::cout << post.title << "\n"
                  << "   Subreddit: r/" << post.subreddit
                  << " | Upvotes: " << post.score
                  << " | Comments: " << post.commentCount << "\n"
                  << "   https://reddit.com" << post.permalink << "\n\n";
    }
    std::cout.flush();
}

void Application::quit(int exitCode) {
    exitCode_ = exitCode;
    g_main_loop_quit(loop_);
}

gboolean Application::onStateChanged(gpointer userData) {
    std::unique_ptr<StateUpdate> update(static_cast<StateUpdate*>(userData));
    update->app->handleState(update->state);
    return G_SOURCE_REMOVE;
}

gboolean Application::onQuitSignal(gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    g_message("Interrupted, shutting down");
    self->quit(self->exitCode_);
    return G_SOURCE_CONTINUE;
}

} // namespace RedditDash
