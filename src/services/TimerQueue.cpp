#include "services/TimerQueue.hpp"
#include <utility>

namespace RedditDash {

GLibTimerQueue::GLibTimerQueue(GMainContext* context)
    : context_(context ? g_main_context_ref(context) : g_main_context_ref(g_main_context_default())) {}

GLibTimerQueue::~GLibTimerQueue() { g_main_context_unref(context_); }

gboolean GLibTimerQueue::onTimeout(gpointer userData) {
    auto* tick = static_cast<Tick*>(userData);
    (*tick)();
    return G_SOURCE_CONTINUE;
}

void GLibTimerQueue::onDestroy(gpointer userData) {
    delete static_cast<Tick*>(userData);
}

TimerQueue::TimerId GLibTimerQueue::scheduleRepeating(std::chrono::milliseconds interval, Tick tick) {
    auto ms = interval.count() > 0 ? interval.count() : 1;
    // Whole seconds use the seconds timer
    GSource* source = (ms % 1000 == 0)
        ? g_timeout_source_new_seconds(static_cast<guint>(ms / 1000))
        : g_timeout_source_new(static_cast<guint>(ms));
    g_source_set_callback(source, onTimeout, new Tick(std::move(tick)), onDestroy);
    guint id = g_source_attach(source, context_);
    g_source_unref(source);
    return id;
}

void GLibTimerQueue::cancel(TimerId id) {
    if (id == 0) return;
    GSource* source = g_main_context_find_source_by_id(context_, id);
    if (source) g_source_destroy(source);
}

}
