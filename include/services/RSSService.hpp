#pragma once
#include "services/EnrichmentFetcher.hpp"
#include "services/FeedMetadataStore.hpp"
#include "services/FeedParser.hpp"
#include "services/LocalFeedList.hpp"
#include "services/ResultSink.hpp"
#include "utils/Config.hpp"
#include "utils/HttpFetcher.hpp"
#include "utils/WorkerPool.hpp"
#include <future>
#include <string>
#include <vector>

namespace FeedLine {

constexpr const char* kLocalNewsCategory = "local_news";
constexpr const char* kMyFeedCategory = "myfeed";

struct FeedRequest {
    std::string sourceUrl;
    std::string displayName;
    std::string categoryId;
    std::string categoryName;
    std::string searchQuery;
};

enum class FeedFetchStatus {
    Delivered,
    InvalidUrl,
    FileMissing,
    FileUnreadable,
    NetworkError,
    HttpError,
    EmptyResponse,
    Failed
};

// Loads one feed source and reports it through a ResultSink: label, clear, then
// one add per item. Enrichment and favicon side effects are started from here.
class RSSService {
public:
    // metadata and localFeeds may be null when the caller has none
    RSSService(HttpFetcher& http, WorkerPool& pool, EnrichmentFetcher& cdnFetcher,
               EnrichmentFetcher& ogFetcher, FeedMetadataStore* metadata, LocalFeedList* localFeeds,
               const PipelineSettings& settings);

    // Runs fetchFeedSync on the worker pool
    std::future<void> fetchFeed(const FeedRequest& request, const ResultSink& sink);
    FeedFetchStatus fetchFeedSync(const FeedRequest& request, const ResultSink& sink);

    // Parses body and delivers the items; returns the number of items added
    size_t parseAndDeliver(const std::string& body, const FeedRequest& request, const ResultSink& sink);

    static std::string deliveryLabel(const FeedRequest& request);
    static bool matchesSearch(const FeedItem& item, const std::string& query);

    std::vector<EnrichmentRequest> planCdnUpgrades(const std::vector<FeedItem>& items,
                                                   const FeedRequest& request) const;
    // Items without any thumbnail that are not already covered by skip
    std::vector<EnrichmentRequest> planOpenGraph(const std::vector<FeedItem>& items, const FeedRequest& request,
                                                 const std::vector<EnrichmentRequest>& skip) const;

    const PipelineSettings& settings() const { return settings_; }

private:
    FeedFetchStatus fail(FeedFetchStatus status, const std::string& label, const FeedRequest& request,
                         const ResultSink& sink, bool prune);
    FeedFetchStatus loadLocalFile(const FeedRequest& request, const ResultSink& sink);
    void scheduleFaviconUpdate(const std::string& sourceUrl, const std::string& faviconUrl);

    HttpFetcher& http_;
    WorkerPool& pool_;
    EnrichmentFetcher& cdnFetcher_;
    EnrichmentFetcher& ogFetcher_;
    FeedMetadataStore* metadata_;
    LocalFeedList* localFeeds_;
    PipelineSettings settings_;
};

}
