#include "utils/FetchThrottle.hpp"
#include <glib.h>

namespace FeedLine {

FetchThrottle::FetchThrottle(size_t maxActive) : maxActive_(maxActive > 0 ? maxActive : 1) {}

bool FetchThrottle::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ >= maxActive_) return false;
    ++active_;
    return true;
}

void FetchThrottle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ == 0) {
        g_warning("throttle released more often than acquired");
        return;
    }
    --active_;
}

size_t FetchThrottle::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

}
