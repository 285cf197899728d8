#pragma once

#include <glib.h>
#include <memory>
#include <string>
#include "app/Session.hpp"

namespace RedditDash {

class GLibTimerQueue;

class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

private:
    bool parseOptions(int argc, char* argv[]);
    bool setupSession();
    void handleState(const SessionState& state);
    void render(const SessionState& state) const;
    void quit(int exitCode);

    static gboolean onStateChanged(gpointer userData);
    static gboolean onQuitSignal(gpointer userData);

    GMainLoop* loop_;
    std::unique_ptr<GLibTimerQueue> timers_;
    std::unique_ptr<Session> session_;

    bool subredditsGiven_;
    std::string subredditsOption_;
    std::string configPath_;
    bool once_;
    bool sawLoading_;
    int exitCode_;
};

} // namespace RedditDash
