#pragma once
#include "services/ResultSink.hpp"
#include "utils/Config.hpp"
#include "utils/FetchThrottle.hpp"
#include "utils/HttpFetcher.hpp"
#include "utils/UiDispatcher.hpp"
#include "utils/WorkerPool.hpp"
#include <memory>
#include <string>

namespace FeedLine {

struct EnrichmentRequest {
    std::string articleUrl;
    std::string title;
    std::string categoryId;
    std::string sourceName;
};

// Best-effort fetch of an article page to find a better image for an item that
// is already displayed. Failures are dropped; success delivers exactly once.
class EnrichmentFetcher {
public:
    EnrichmentFetcher(HttpFetcher& http, FetchThrottle& throttle, WorkerPool& pool,
                      UiDispatcher& dispatcher, const PipelineSettings& settings);
    virtual ~EnrichmentFetcher() = default;
    EnrichmentFetcher(const EnrichmentFetcher&) = delete;
    EnrichmentFetcher& operator=(const EnrichmentFetcher&) = delete;

    // Never blocks: with the throttle full, the call is retried later on the UI context
    void enrich(const EnrichmentRequest& request, AddItemFunc deliver);

    // Runs on the calling thread without the throttle; returns whether deliver was called
    bool fetchAndDeliver(const EnrichmentRequest& request, const AddItemFunc& deliver);

protected:
    // Picks the image from the article HTML and may override the delivered title
    virtual std::string resolveImage(const std::string& html, const EnrichmentRequest& request,
                                     std::string& title) = 0;
    virtual const char* name() const = 0;

private:
    HttpFetcher& http_;
    FetchThrottle& throttle_;
    WorkerPool& pool_;
    UiDispatcher& dispatcher_;
    PipelineSettings settings_;
    // Retries queued on the dispatcher check this before touching the fetcher
    std::shared_ptr<char> alive_;
};

}
