#pragma once
#include "services/CdnImageFetcher.hpp"
#include "services/FeedMetadataStore.hpp"
#include "services/LocalFeedList.hpp"
#include "services/OpenGraphImageFetcher.hpp"
#include "services/RSSService.hpp"
#include "services/ResultSink.hpp"
#include "utils/Config.hpp"
#include "utils/FetchEpochGuard.hpp"
#include "utils/FetchThrottle.hpp"
#include "utils/HttpFetcher.hpp"
#include "utils/ImageCache.hpp"
#include "utils/UiDispatcher.hpp"
#include "utils/WorkerPool.hpp"
#include <deque>
#include <memory>
#include <string>

namespace FeedLine {

enum class ViewState {
    Idle,
    Fetching,
    Delivered,
    Errored
};

const char* viewStateName(ViewState state);

// Owns the fetch pipeline for one window. Every fetch* call starts a new epoch;
// results of older epochs are dropped on the UI context before they touch the
// sink. All public methods must be called on the thread iterating the
// dispatcher's context.
class FetchOrchestrator {
public:
    FetchOrchestrator(HttpFetcher& http, UiDispatcher& dispatcher, FeedMetadataStore& metadata,
                      LocalFeedList& localFeeds, const PipelineSettings& settings,
                      LoadingObserver observer = LoadingObserver());
    ~FetchOrchestrator();
    FetchOrchestrator(const FetchOrchestrator&) = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;

    FetchEpochGuard::Epoch fetchFeed(const FeedRequest& request, const ResultSink& sink);
    FetchEpochGuard::Epoch fetchLocalNews(const std::string& searchQuery, const ResultSink& sink);
    FetchEpochGuard::Epoch fetchMyFeed(const std::string& searchQuery, const ResultSink& sink);

    ViewState state() const;
    size_t appliedItemCount() const;
    size_t queuedItemCount() const;

    FetchEpochGuard& epochGuard() { return epoch_; }
    FetchThrottle& throttle() { return throttle_; }
    ImageCache& imageCache() { return imageCache_; }
    RSSService& feedService() { return *feedService_; }

private:
    struct QueuedItem {
        std::string title;
        std::string url;
        std::string thumbnail;
        std::string categoryId;
        std::string sourceName;
    };

    // Per-epoch state; only touched on the UI context
    struct ViewRun {
        FetchEpochGuard::Epoch epoch = 0;
        std::string view;
        std::string categoryId;
        ResultSink sink;
        ViewState state = ViewState::Fetching;
        bool cleared = false;
        bool batching = false;
        bool forwardSourceLabels = true;
        bool networkFailure = false;
        std::string lastErrorLabel;
        size_t pendingSources = 0;
        size_t totalSources = 0;
        size_t failedSources = 0;
        size_t applied = 0;
        std::deque<QueuedItem> queue;
        guint batchSource = 0;
        guint safetySource = 0;
    };
    using RunPtr = std::shared_ptr<ViewRun>;

    RunPtr beginRun(const std::string& view, const std::string& categoryId, const ResultSink& sink);
    ResultSink wrapSink(const RunPtr& run, bool allowClear);
    void submitSource(const RunPtr& run, const FeedRequest& request, const ResultSink& wrapped);
    bool isLive(const RunPtr& run) const;

    void applyLabel(ViewRun& run, const std::string& text);
    void applyClear(ViewRun& run);
    void applyAdd(const RunPtr& run, QueuedItem item);
    void deliverItem(ViewRun& run, const QueuedItem& item);
    bool drainBatch(const RunPtr& run);
    void sourceFinished(ViewRun& run, FeedFetchStatus status);
    void maybeComplete(ViewRun& run);
    void finish(ViewRun& run, ViewState state, const std::string& message = "");
    void onSafetyTimeout(ViewRun& run);
    std::string timeoutMessage(const ViewRun& run) const;
    void stopTimers(ViewRun& run);

    PipelineSettings settings_;
    UiDispatcher& dispatcher_;
    FeedMetadataStore& metadata_;
    LocalFeedList& localFeeds_;
    LoadingObserver observer_;

    FetchEpochGuard epoch_;
    FetchThrottle throttle_;
    ImageCache imageCache_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<CdnImageFetcher> cdnFetcher_;
    std::unique_ptr<OpenGraphImageFetcher> ogFetcher_;
    std::unique_ptr<RSSService> feedService_;
    RunPtr current_;
    // Closures queued on the dispatcher check this before touching the orchestrator
    std::shared_ptr<char> alive_;
};

}
