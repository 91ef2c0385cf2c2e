#include "services/FetchOrchestrator.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <glib.h>

namespace FeedLine {

static const char* const kNetworkTimeoutMessage =
    "No network connection detected. Check your connection and try again.";
static const char* const kGenericTimeoutMessage =
    "No articles could be loaded. Try refreshing or check your source settings.";

const char* viewStateName(ViewState state) {
    switch (state) {
        case ViewState::Idle: return "idle";
        case ViewState::Fetching: return "fetching";
        case ViewState::Delivered: return "delivered";
        case ViewState::Errored: return "errored";
    }
    return "unknown";
}

static bool isErrorLabel(const std::string& text) {
    return StringUtils::containsIgnoreCase(text, "error") || StringUtils::containsIgnoreCase(text, "failed");
}

static std::string viewLabel(const std::string& categoryName, const std::string& searchQuery) {
    if (searchQuery.empty()) return categoryName;
    return "Search Results: \"" + searchQuery + "\" in " + categoryName;
}

FetchOrchestrator::FetchOrchestrator(HttpFetcher& http, UiDispatcher& dispatcher, FeedMetadataStore& metadata,
                                     LocalFeedList& localFeeds, const PipelineSettings& settings,
                                     LoadingObserver observer)
    : settings_(settings), dispatcher_(dispatcher), metadata_(metadata), localFeeds_(localFeeds),
      observer_(std::move(observer)), throttle_(static_cast<size_t>(settings.maxConcurrentFetches)),
      imageCache_(12), pool_(std::make_unique<WorkerPool>(static_cast<unsigned>(settings.workerThreads))),
      alive_(std::make_shared<char>(0)) {
    cdnFetcher_ = std::make_unique<CdnImageFetcher>(http, throttle_, *pool_, dispatcher_, settings_);
    ogFetcher_ = std::make_unique<OpenGraphImageFetcher>(http, throttle_, *pool_, dispatcher_, settings_);
    feedService_ = std::make_unique<RSSService>(http, *pool_, *cdnFetcher_, *ogFetcher_, &metadata_, &localFeeds_,
                                                settings_);
}

FetchOrchestrator::~FetchOrchestrator() {
    alive_.reset();
    if (current_) stopTimers(*current_);
    // Jobs still running reference the fetchers and the feed service
    pool_.reset();
}

bool FetchOrchestrator::isLive(const RunPtr& run) const {
    return run && epoch_.isCurrent(run->epoch) && current_ == run;
}

FetchOrchestrator::RunPtr FetchOrchestrator::beginRun(const std::string& view, const std::string& categoryId,
                                                      const ResultSink& sink) {
    if (current_) stopTimers(*current_);

    auto run = std::make_shared<ViewRun>();
    run->epoch = epoch_.beginNewEpoch(view);
    run->view = view;
    run->categoryId = categoryId;
    run->sink = sink;
    run->batching = (categoryId == kLocalNewsCategory);
    current_ = run;

    imageCache_.setCapacity(categoryId == kLocalNewsCategory ? 6 : 12);

    std::weak_ptr<char> alive = alive_;
    run->safetySource = dispatcher_.postDelayed(static_cast<guint>(settings_.safetyTimeoutMs), [this, alive, run]() {
        if (alive.expired() || !isLive(run)) return;
        run->safetySource = 0;
        onSafetyTimeout(*run);
    });
    return run;
}

ResultSink FetchOrchestrator::wrapSink(const RunPtr& run, bool allowClear) {
    std::weak_ptr<char> alive = alive_;
    UiDispatcher* dispatcher = &dispatcher_;
    ResultSink wrapped;

    wrapped.setLabel = [this, alive, dispatcher, run](const std::string& text) {
        dispatcher->post([this, alive, run, text]() {
            if (alive.expired() || !isLive(run)) return;
            applyLabel(*run, text);
        });
    };
    if (allowClear) {
        wrapped.clearItems = [this, alive, dispatcher, run]() {
            dispatcher->post([this, alive, run]() {
                if (alive.expired() || !isLive(run)) return;
                applyClear(*run);
            });
        };
    } else {
        wrapped.clearItems = []() {};
    }
    wrapped.addItem = [this, alive, dispatcher, run](const std::string& title, const std::string& url,
                                                    const std::string& thumbnail, const std::string& categoryId,
                                                    const std::string& sourceName) {
        QueuedItem item{title, url, thumbnail, categoryId, sourceName};
        dispatcher->post([this, alive, run, item]() {
            if (alive.expired()) return;
            if (!isLive(run)) {
                g_debug("dropping stale item from epoch %" G_GUINT64_FORMAT, static_cast<guint64>(run->epoch));
                return;
            }
            applyAdd(run, item);
        });
    };
    return wrapped;
}

void FetchOrchestrator::submitSource(const RunPtr& run, const FeedRequest& request, const ResultSink& wrapped) {
    std::weak_ptr<char> alive = alive_;
    UiDispatcher* dispatcher = &dispatcher_;
    RSSService* service = feedService_.get();
    pool_->submit([this, alive, dispatcher, service, run, request, wrapped]() {
        FeedFetchStatus status = FeedFetchStatus::Failed;
        try {
            status = service->fetchFeedSync(request, wrapped);
        } catch (const std::exception& e) {
            g_warning("feed job for '%s' failed: %s", request.displayName.c_str(), e.what());
        }
        // Posted after every sink call of this job, so it runs after them
        dispatcher->post([this, alive, run, status]() {
            if (alive.expired() || !isLive(run)) return;
            sourceFinished(*run, status);
        });
    }, "feed " + request.displayName);
}

FetchEpochGuard::Epoch FetchOrchestrator::fetchFeed(const FeedRequest& request, const ResultSink& sink) {
    RunPtr run = beginRun(request.categoryId.empty() ? request.sourceUrl : request.categoryId,
                          request.categoryId, sink);
    run->pendingSources = 1;
    run->totalSources = 1;
    submitSource(run, request, wrapSink(run, true));
    return run->epoch;
}

FetchEpochGuard::Epoch FetchOrchestrator::fetchLocalNews(const std::string& searchQuery, const ResultSink& sink) {
    RunPtr run = beginRun(kLocalNewsCategory, kLocalNewsCategory, sink);
    run->forwardSourceLabels = false;

    std::vector<std::string> urls = localFeeds_.readUrls();
    if (urls.empty()) {
        if (run->sink.setLabel) run->sink.setLabel("Local News — No local feeds configured");
        finish(*run, ViewState::Delivered);
        return run->epoch;
    }

    if (run->sink.setLabel) run->sink.setLabel(viewLabel("Local News", searchQuery));
    applyClear(*run);
    ResultSink wrapped = wrapSink(run, false);
    run->pendingSources = urls.size();
    run->totalSources = urls.size();
    for (const auto& url : urls) {
        FeedRequest request{url, "Local Feed", kLocalNewsCategory, "Local News", searchQuery};
        submitSource(run, request, wrapped);
    }
    return run->epoch;
}

FetchEpochGuard::Epoch FetchOrchestrator::fetchMyFeed(const std::string& searchQuery, const ResultSink& sink) {
    RunPtr run = beginRun(kMyFeedCategory, kMyFeedCategory, sink);
    run->forwardSourceLabels = false;

    std::vector<FeedSource> sources = metadata_.findAll();
    if (sources.empty()) {
        if (run->sink.setLabel) run->sink.setLabel("My Feed — No custom RSS feeds configured");
        finish(*run, ViewState::Delivered);
        return run->epoch;
    }

    if (run->sink.setLabel) run->sink.setLabel(viewLabel("My Feed", searchQuery));
    applyClear(*run);
    ResultSink wrapped = wrapSink(run, false);
    run->pendingSources = sources.size();
    run->totalSources = sources.size();
    for (const auto& source : sources) {
        std::string name = source.name.empty() ? UrlUtils::extractHost(source.url) : source.name;
        FeedRequest request{source.url, name, kMyFeedCategory, "My Feed", searchQuery};
        submitSource(run, request, wrapped);
    }
    return run->epoch;
}

// Error-like labels only select the timeout message; they never end the view
void FetchOrchestrator::applyLabel(ViewRun& run, const std::string& text) {
    if (isErrorLabel(text)) {
        run.networkFailure = true;
        run.lastErrorLabel = text;
    }
    if (run.forwardSourceLabels && run.sink.setLabel) run.sink.setLabel(text);
}

void FetchOrchestrator::applyClear(ViewRun& run) {
    if (run.cleared) return;
    run.cleared = true;
    if (run.sink.clearItems) run.sink.clearItems();
}

void FetchOrchestrator::applyAdd(const RunPtr& run, QueuedItem item) {
    if (!run->batching) {
        deliverItem(*run, item);
        return;
    }
    run->queue.push_back(std::move(item));
    if (run->batchSource == 0) {
        std::weak_ptr<char> alive = alive_;
        run->batchSource = dispatcher_.schedulePeriodic(static_cast<guint>(settings_.batchIntervalMs),
                                                        [this, alive, run]() {
            if (alive.expired()) return false;
            return drainBatch(run);
        });
    }
}

void FetchOrchestrator::deliverItem(ViewRun& run, const QueuedItem& item) {
    if (run.sink.addItem) run.sink.addItem(item.title, item.url, item.thumbnail, item.categoryId, item.sourceName);
    run.applied++;
}

bool FetchOrchestrator::drainBatch(const RunPtr& run) {
    if (!isLive(run)) {
        run->queue.clear();
        run->batchSource = 0;
        return false;
    }
    int processed = 0;
    while (!run->queue.empty() && processed < settings_.batchSize) {
        QueuedItem item = std::move(run->queue.front());
        run->queue.pop_front();
        deliverItem(*run, item);
        processed++;
    }
    if (!run->queue.empty()) return true;

    run->batchSource = 0;
    if (observer_.onBadgeRefresh) observer_.onBadgeRefresh(run->categoryId);
    maybeComplete(*run);
    return false;
}

void FetchOrchestrator::sourceFinished(ViewRun& run, FeedFetchStatus status) {
    if (status == FeedFetchStatus::NetworkError) run.networkFailure = true;
    if (status != FeedFetchStatus::Delivered) run.failedSources++;
    if (run.pendingSources > 0) run.pendingSources--;
    maybeComplete(run);
}

void FetchOrchestrator::maybeComplete(ViewRun& run) {
    if (run.state != ViewState::Fetching) return;
    if (run.pendingSources > 0 || !run.queue.empty()) return;
    if (run.applied == 0 && run.totalSources > 0 && run.failedSources == run.totalSources) {
        finish(run, ViewState::Errored, run.lastErrorLabel.empty() ? timeoutMessage(run) : run.lastErrorLabel);
        return;
    }
    finish(run, ViewState::Delivered);
}

void FetchOrchestrator::finish(ViewRun& run, ViewState state, const std::string& message) {
    if (run.state != ViewState::Fetching) return;
    run.state = state;
    if (run.safetySource != 0) {
        dispatcher_.cancel(run.safetySource);
        run.safetySource = 0;
    }
    g_debug("view %s reached %s", run.view.c_str(), viewStateName(state));
    if (state == ViewState::Errored) {
        if (observer_.onError) observer_.onError(message);
    } else if (observer_.onReveal) {
        observer_.onReveal();
    }
}

void FetchOrchestrator::onSafetyTimeout(ViewRun& run) {
    if (run.state != ViewState::Fetching) return;
    g_warning("view %s still loading after %d ms", run.view.c_str(), settings_.safetyTimeoutMs);
    if (run.applied == 0) {
        finish(run, ViewState::Errored, timeoutMessage(run));
    } else {
        finish(run, ViewState::Delivered);
    }
}

std::string FetchOrchestrator::timeoutMessage(const ViewRun& run) const {
    return run.networkFailure ? kNetworkTimeoutMessage : kGenericTimeoutMessage;
}

void FetchOrchestrator::stopTimers(ViewRun& run) {
    if (run.safetySource != 0) {
        dispatcher_.cancel(run.safetySource);
        run.safetySource = 0;
    }
    if (run.batchSource != 0) {
        dispatcher_.cancel(run.batchSource);
        run.batchSource = 0;
    }
}

ViewState FetchOrchestrator::state() const {
    return current_ ? current_->state : ViewState::Idle;
}

size_t FetchOrchestrator::appliedItemCount() const {
    return current_ ? current_->applied : 0;
}

size_t FetchOrchestrator::queuedItemCount() const {
    return current_ ? current_->queue.size() : 0;
}

}
