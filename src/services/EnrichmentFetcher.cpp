#include "services/EnrichmentFetcher.hpp"
#include "utils/StringUtils.hpp"
#include <glib.h>

namespace FeedLine {

EnrichmentFetcher::EnrichmentFetcher(HttpFetcher& http, FetchThrottle& throttle, WorkerPool& pool,
                                     UiDispatcher& dispatcher, const PipelineSettings& settings)
    : http_(http), throttle_(throttle), pool_(pool), dispatcher_(dispatcher), settings_(settings),
      alive_(std::make_shared<char>(0)) {}

void EnrichmentFetcher::enrich(const EnrichmentRequest& request, AddItemFunc deliver) {
    if (request.articleUrl.empty()) return;

    if (!throttle_.tryAcquire()) {
        gint32 delay = g_random_int_range(settings_.retryDelayMinMs, settings_.retryDelayMaxMs + 1);
        g_debug("%s: throttle full, retrying %s in %d ms", name(),
                StringUtils::truncateForLog(request.articleUrl).c_str(), delay);
        std::weak_ptr<char> alive = alive_;
        dispatcher_.postDelayed(static_cast<guint>(delay), [this, alive, request, deliver]() {
            if (alive.expired()) return;
            enrich(request, deliver);
        });
        return;
    }

    auto slot = std::make_shared<FetchThrottle::Slot>(throttle_);
    pool_.submit([this, slot, request, deliver]() {
        fetchAndDeliver(request, deliver);
    }, name());
}

bool EnrichmentFetcher::fetchAndDeliver(const EnrichmentRequest& request, const AddItemFunc& deliver) {
    RequestOptions options;
    options.withBrowserHeaders().withTimeout(settings_.requestTimeoutSeconds);
    Response response = http_.fetchSync(request.articleUrl, options);
    if (!response.success || response.body.empty()) {
        g_debug("%s: no page for %s (%s)", name(), StringUtils::truncateForLog(request.articleUrl).c_str(),
                response.error.empty() ? "empty body" : response.error.c_str());
        return false;
    }

    std::string title = request.title.empty() ? request.articleUrl : request.title;
    std::string image = resolveImage(response.body, request, title);
    if (image.empty()) {
        g_debug("%s: no image candidate for %s", name(), StringUtils::truncateForLog(request.articleUrl).c_str());
        return false;
    }

    g_debug("%s: chose %s for %s", name(), StringUtils::truncateForLog(image).c_str(),
            StringUtils::truncateForLog(request.articleUrl).c_str());
    if (deliver) deliver(title, request.articleUrl, image, request.categoryId, request.sourceName);
    return true;
}

}
