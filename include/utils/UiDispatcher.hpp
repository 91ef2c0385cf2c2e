#pragma once
#include <glib.h>
#include <functional>

namespace FeedLine {

// Marshals closures onto one GMainContext. Safe to call from any thread; the
// closures themselves run on whichever thread iterates the context. Sources of
// equal priority run in the order they were posted.
class UiDispatcher {
public:
    using Task = std::function<void()>;
    // Return false to stop the repetition
    using RepeatingTask = std::function<bool()>;

    // A null context means the process default context
    explicit UiDispatcher(GMainContext* context = nullptr);
    ~UiDispatcher();
    UiDispatcher(const UiDispatcher&) = delete;
    UiDispatcher& operator=(const UiDispatcher&) = delete;

    guint post(Task task);
    guint postDelayed(guint delayMs, Task task);
    guint schedulePeriodic(guint intervalMs, RepeatingTask tick);
    // No-op for ids that already ran or were cancelled
    void cancel(guint sourceId);

    GMainContext* context() const { return context_; }

private:
    guint attach(GSource* source, GSourceFunc func, gpointer data, GDestroyNotify destroy);
    GMainContext* context_;
};

}
