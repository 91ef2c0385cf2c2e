#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace FeedLine {

// Generation counter for user-triggered fetches. Older epochs are never
// cancelled; their callbacks compare against current() and drop themselves.
class FetchEpochGuard {
public:
    using Epoch = uint64_t;

    FetchEpochGuard() = default;
    FetchEpochGuard(const FetchEpochGuard&) = delete;
    FetchEpochGuard& operator=(const FetchEpochGuard&) = delete;

    Epoch beginNewEpoch(const std::string& view);
    bool isCurrent(Epoch epoch) const { return epoch == current_.load(); }
    Epoch current() const { return current_.load(); }
    std::string currentView() const;

private:
    std::atomic<Epoch> current_{0};
    mutable std::mutex viewMutex_;
    std::string view_;
};

}
