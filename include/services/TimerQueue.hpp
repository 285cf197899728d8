#pragma once
#include <glib.h>
#include <chrono>
#include <functional>

namespace RedditDash {

class TimerQueue {
public:
    using TimerId = unsigned int;
    using Tick = std::function<void()>;

    virtual ~TimerQueue() = default;

    // Runs tick every interval until cancelled. Never returns 0.
    virtual TimerId scheduleRepeating(std::chrono::milliseconds interval, Tick tick) = 0;
    virtual void cancel(TimerId id) = 0;
};

// Timers attached to a GLib main context; ticks run on that context's thread.
class GLibTimerQueue : public TimerQueue {
public:
    explicit GLibTimerQueue(GMainContext* context = nullptr);
    ~GLibTimerQueue() override;

    TimerId scheduleRepeating(std::chrono::milliseconds interval, Tick tick) override;
    void cancel(TimerId id) override;

private:
    static gboolean onTimeout(gpointer userData);
    static void onDestroy(gpointer userData);

    GMainContext* context_;
};

}
