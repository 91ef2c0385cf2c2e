#pragma once
#include <functional>
#include <string>

namespace FeedLine {

using SetLabelFunc = std::function<void(const std::string& label)>;
using ClearItemsFunc = std::function<void()>;
using AddItemFunc = std::function<void(const std::string& title, const std::string& url,
                                       const std::string& thumbnail, const std::string& categoryId,
                                       const std::string& sourceName)>;

// Presentation callbacks. Calls arrive on the UI context in issue order.
struct ResultSink {
    SetLabelFunc setLabel;
    ClearItemsFunc clearItems;
    AddItemFunc addItem;
};

// Terminal-state notifications for the loading indicator
struct LoadingObserver {
    std::function<void()> onReveal;
    std::function<void(const std::string& message)> onError;
    // Batch queue for the category drained; badge counts can be recomputed
    std::function<void(const std::string& categoryId)> onBadgeRefresh;
};

}
