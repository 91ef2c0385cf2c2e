#include "utils/UiDispatcher.hpp"
#include <exception>

namespace FeedLine {

namespace {

gboolean runOnce(gpointer data) {
    auto* task = static_cast<UiDispatcher::Task*>(data);
    try {
        (*task)();
    } catch (const std::exception& e) {
        g_warning("UI task failed: %s", e.what());
    }
    return G_SOURCE_REMOVE;
}

gboolean runRepeating(gpointer data) {
    auto* tick = static_cast<UiDispatcher::RepeatingTask*>(data);
    try {
        return (*tick)() ? G_SOURCE_CONTINUE : G_SOURCE_REMOVE;
    } catch (const std::exception& e) {
        g_warning("periodic UI task failed: %s", e.what());
        return G_SOURCE_REMOVE;
    }
}

void destroyTask(gpointer data) { delete static_cast<UiDispatcher::Task*>(data); }
void destroyRepeating(gpointer data) { delete static_cast<UiDispatcher::RepeatingTask*>(data); }

}

UiDispatcher::UiDispatcher(GMainContext* context)
    : context_(g_main_context_ref(context ? context : g_main_context_default())) {}

UiDispatcher::~UiDispatcher() { g_main_context_unref(context_); }

guint UiDispatcher::attach(GSource* source, GSourceFunc func, gpointer data, GDestroyNotify destroy) {
    g_source_set_priority(source, G_PRIORITY_DEFAULT);
    g_source_set_callback(source, func, data, destroy);
    guint id = g_source_attach(source, context_);
    g_source_unref(source);
    return id;
}

guint UiDispatcher::post(Task task) {
    return attach(g_idle_source_new(), runOnce, new Task(std::move(task)), destroyTask);
}

guint UiDispatcher::postDelayed(guint delayMs, Task task) {
    return attach(g_timeout_source_new(delayMs), runOnce, new Task(std::move(task)), destroyTask);
}

guint UiDispatcher::schedulePeriodic(guint intervalMs, RepeatingTask tick) {
    return attach(g_timeout_source_new(intervalMs), runRepeating, new RepeatingTask(std::move(tick)),
                  destroyRepeating);
}

void UiDispatcher::cancel(guint sourceId) {
    if (sourceId == 0) return;
    GSource* source = g_main_context_find_source_by_id(context_, sourceId);
    if (source) g_source_destroy(source);
}

}
