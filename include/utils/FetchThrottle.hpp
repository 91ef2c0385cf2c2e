#pragma once
#include <mutex>
#include <cstddef>

namespace FeedLine {

// Bounded gate on simultaneous enrichment fetches. Callers that cannot get a
// slot reschedule themselves instead of blocking.
class FetchThrottle {
public:
    explicit FetchThrottle(size_t maxActive = 6);
    FetchThrottle(const FetchThrottle&) = delete;
    FetchThrottle& operator=(const FetchThrottle&) = delete;

    bool tryAcquire();
    void release();
    size_t active() const;
    size_t maxActive() const { return maxActive_; }

    // Owns one acquired slot and gives it back on destruction
    class Slot {
    public:
        explicit Slot(FetchThrottle& throttle) : throttle_(&throttle) {}
        Slot(Slot&& other) noexcept : throttle_(other.throttle_) { other.throttle_ = nullptr; }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot& operator=(Slot&&) = delete;
        ~Slot() { if (throttle_) throttle_->release(); }

    private:
        FetchThrottle* throttle_;
    };

private:
    mutable std::mutex mutex_;
    size_t active_ = 0;
    const size_t maxActive_;
};

}
