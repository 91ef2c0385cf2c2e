#include "services/RSSService.hpp"
#include "services/ImageResolver.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <glib.h>
#include <algorithm>

namespace FeedLine {

RSSService::RSSService(HttpFetcher& http, WorkerPool& pool, EnrichmentFetcher& cdnFetcher,
                       EnrichmentFetcher& ogFetcher, FeedMetadataStore* metadata, LocalFeedList* localFeeds,
                       const PipelineSettings& settings)
    : http_(http), pool_(pool), cdnFetcher_(cdnFetcher), ogFetcher_(ogFetcher),
      metadata_(metadata), localFeeds_(localFeeds), settings_(settings) {}

std::future<void> RSSService::fetchFeed(const FeedRequest& request, const ResultSink& sink) {
    return pool_.submit([this, request, sink]() { fetchFeedSync(request, sink); },
                        "fetch-feed " + request.displayName);
}

FeedFetchStatus RSSService::fail(FeedFetchStatus status, const std::string& label, const FeedRequest& request,
                                 const ResultSink& sink, bool prune) {
    if (sink.setLabel) sink.setLabel(label);
    if (prune && request.categoryId == kLocalNewsCategory && localFeeds_) {
        localFeeds_->prune(StringUtils::trim(request.sourceUrl));
    }
    return status;
}

FeedFetchStatus RSSService::fetchFeedSync(const FeedRequest& request, const ResultSink& sink) {
    const std::string url = StringUtils::trim(request.sourceUrl);
    try {
        if (url.empty()) {
            g_warning("feed fetch with empty URL for source '%s'", request.displayName.c_str());
            return fail(FeedFetchStatus::InvalidUrl, "Error loading feed — invalid (empty) URL", request, sink, false);
        }
        if (!UrlUtils::isSupportedFeedUrl(url)) {
            g_warning("malformed or unsupported feed URL for source '%s': %s", request.displayName.c_str(),
                      url.c_str());
            return fail(FeedFetchStatus::InvalidUrl, "Error loading feed — invalid URL", request, sink, false);
        }
        if (StringUtils::startsWith(url, "file://")) return loadLocalFile(request, sink);

        RequestOptions options;
        options.userAgent = settings_.userAgent;
        options.withTimeout(settings_.requestTimeoutSeconds);
        Response response = http_.fetchSync(url, options);

        if (response.statusCode == 0) {
            const char* reason = response.error.empty() ? "unknown error" : response.error.c_str();
            if (response.dnsFailure) {
                g_warning("DNS error fetching feed '%s' (%s): %s", request.displayName.c_str(), url.c_str(), reason);
            } else {
                g_warning("network error fetching feed '%s' (%s): %s", request.displayName.c_str(), url.c_str(), reason);
            }
            return fail(FeedFetchStatus::NetworkError, "Error loading feed — network/DNS error", request, sink, true);
        }
        if (!response.success) {
            g_warning("HTTP %d fetching feed '%s' (%s)", response.statusCode, request.displayName.c_str(), url.c_str());
            return fail(FeedFetchStatus::HttpError, "Error loading feed — HTTP " + std::to_string(response.statusCode),
                        request, sink, true);
        }
        if (response.body.empty()) {
            g_warning("empty response for feed '%s' (%s)", request.displayName.c_str(), url.c_str());
            return fail(FeedFetchStatus::EmptyResponse, "Error loading feed — empty response", request, sink, true);
        }

        parseAndDeliver(response.body, request, sink);
        return FeedFetchStatus::Delivered;
    } catch (const std::exception& e) {
        g_warning("feed fetch error for '%s': %s", request.displayName.c_str(), e.what());
        return fail(FeedFetchStatus::Failed, "Error loading feed", request, sink, true);
    }
}

FeedFetchStatus RSSService::loadLocalFile(const FeedRequest& request, const ResultSink& sink) {
    std::string path = UrlUtils::filePathFromUrl(StringUtils::trim(request.sourceUrl));
    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        g_warning("local feed file not found: %s", path.c_str());
        return fail(FeedFetchStatus::FileMissing, "Error loading feed — local file not found", request, sink, false);
    }

    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    bool ok = g_file_get_contents(path.c_str(), &contents, &length, &error);
    std::string body = ok ? std::string(contents, length) : std::string();
    g_free(contents);
    if (!ok || body.empty()) {
        g_warning("failed to read local feed file %s: %s", path.c_str(),
                  error ? error->message : "empty file");
        if (error) g_error_free(error);
        return fail(FeedFetchStatus::FileUnreadable, "Failed to read local RSS file", request, sink, false);
    }

    parseAndDeliver(body, request, sink);
    return FeedFetchStatus::Delivered;
}

std::string RSSService::deliveryLabel(const FeedRequest& request) {
    if (!request.searchQuery.empty()) {
        return "Search Results: \"" + request.searchQuery + "\" in " + request.categoryName + " — " +
               request.displayName;
    }
    return request.categoryName + " — " + request.displayName;
}

bool RSSService::matchesSearch(const FeedItem& item, const std::string& query) {
    if (query.empty()) return true;
    return StringUtils::containsIgnoreCase(item.title, query) || StringUtils::containsIgnoreCase(item.link, query);
}

size_t RSSService::parseAndDeliver(const std::string& body, const FeedRequest& request, const ResultSink& sink) {
    FeedParseOptions options;
    options.categoryId = request.categoryId;
    options.sourceName = request.displayName;
    options.cdnEnabled = settings_.cdnExtractEnabled;
    if (request.categoryId == kLocalNewsCategory) options.itemCap = static_cast<size_t>(settings_.localNewsItemCap);

    ParsedFeed feed;
    try {
        feed = FeedParser::parse(body, options);
    } catch (const std::exception& e) {
        g_warning("feed parse error for '%s': %s", request.displayName.c_str(), e.what());
    }
    if (feed.items.empty()) {
        g_warning("no items parsed from '%s'", request.displayName.c_str());
    }

    if (sink.setLabel) sink.setLabel(deliveryLabel(request));
    if (sink.clearItems) sink.clearItems();

    std::vector<FeedItem> delivered;
    for (const auto& item : feed.items) {
        if (!matchesSearch(item, request.searchQuery)) continue;
        if (sink.addItem) {
            sink.addItem(StringUtils::sanitizeUtf8(item.title), item.link, item.thumbnail, request.categoryId,
                         request.displayName);
        }
        delivered.push_back(item);
    }

    if (request.categoryId == kMyFeedCategory && !feed.faviconUrl.empty()) {
        scheduleFaviconUpdate(request.sourceUrl, feed.faviconUrl);
    }

    std::vector<EnrichmentRequest> cdn;
    if (settings_.cdnExtractEnabled) {
        cdn = planCdnUpgrades(delivered, request);
        for (const auto& r : cdn) cdnFetcher_.enrich(r, sink.addItem);
    }
    if (settings_.enrichMissingThumbnails) {
        for (const auto& r : planOpenGraph(delivered, request, cdn)) ogFetcher_.enrich(r, sink.addItem);
    }
    return delivered.size();
}

std::vector<EnrichmentRequest> RSSService::planCdnUpgrades(const std::vector<FeedItem>& items,
                                                           const FeedRequest& request) const {
    std::vector<EnrichmentRequest> planned;
    const size_t limit = static_cast<size_t>(std::max(0, settings_.maxEnrichmentUpgrades));
    for (const auto& item : items) {
        if (planned.size() >= limit) break;
        if (item.link.empty() || !ImageResolver::isCdnUrl(item.link)) continue;
        if (item.thumbnail.size() >= 50) continue;
        planned.push_back({item.link, item.title, request.categoryId, request.displayName});
    }
    return planned;
}

std::vector<EnrichmentRequest> RSSService::planOpenGraph(const std::vector<FeedItem>& items,
                                                         const FeedRequest& request,
                                                         const std::vector<EnrichmentRequest>& skip) const {
    std::vector<EnrichmentRequest> planned;
    const size_t limit = static_cast<size_t>(std::max(0, settings_.maxEnrichmentUpgrades));
    for (const auto& item : items) {
        if (planned.size() >= limit) break;
        if (!item.thumbnail.empty() || !UrlUtils::isHttpUrl(item.link)) continue;
        bool covered = std::any_of(skip.begin(), skip.end(),
                                   [&item](const EnrichmentRequest& r) { return r.articleUrl == item.link; });
        if (covered) continue;
        planned.push_back({item.link, item.title, request.categoryId, request.displayName});
    }
    return planned;
}

void RSSService::scheduleFaviconUpdate(const std::string& sourceUrl, const std::string& faviconUrl) {
    if (!metadata_) return;
    FeedMetadataStore* store = metadata_;
    pool_.submit([store, sourceUrl, faviconUrl]() {
        FeedSource source;
        if (!store->findByUrl(sourceUrl, source)) {
            g_debug("no stored source for %s, favicon not saved", sourceUrl.c_str());
            return;
        }
        if (source.faviconUrl == faviconUrl) return;
        if (!store->updateFaviconUrl(source.url, faviconUrl)) {
            g_warning("could not store favicon for %s", sourceUrl.c_str());
        }
    }, "favicon-update");
}

}
