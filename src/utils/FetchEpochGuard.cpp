#include "utils/FetchEpochGuard.hpp"
#include <glib.h>

namespace FeedLine {

FetchEpochGuard::Epoch FetchEpochGuard::beginNewEpoch(const std::string& view) {
    std::lock_guard<std::mutex> lock(viewMutex_);
    view_ = view;
    Epoch epoch = ++current_;
    g_debug("epoch %" G_GUINT64_FORMAT " begins for view %s", static_cast<guint64>(epoch), view.c_str());
    return epoch;
}

std::string FetchEpochGuard::currentView() const {
    std::lock_guard<std::mutex> lock(viewMutex_);
    return view_;
}

}
