#include <gtest/gtest.h>
#include "services/CdnImageFetcher.hpp"
#include "services/OpenGraphImageFetcher.hpp"
#include "TestSupport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

using namespace FeedLine;

namespace {

struct Delivery {
    std::string title;
    std::string url;
    std::string thumbnail;
    std::string categoryId;
    std::string sourceName;
};

class DeliveryLog {
public:
    AddItemFunc func() {
        return [this](const std::string& title, const std::string& url, const std::string& thumbnail,
                      const std::string& categoryId, const std::string& sourceName) {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back({title, url, thumbnail, categoryId, sourceName});
        };
    }
    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }
    std::vector<Delivery> items() {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }

private:
    std::mutex mutex_;
    std::vector<Delivery> items_;
};

}

TEST(CdnImageFetcherTest, PrefersJsonLd) {
    std::string html =
        "<script type=\"application/ld+json\">{\"image\":{\"url\":\"http://ichef.bbci.co.uk/news/1024/a.jpg\"}}</script>"
        "<img src=\"https://ichef.bbci.co.uk/news/240/b.jpg\">";
    EXPECT_EQ(CdnImageFetcher::pickImage(html), "https://ichef.bbci.co.uk/news/1024/a.jpg");
}

TEST(CdnImageFetcherTest, UsesLargestSrcsetThenSkipsDataUris) {
    std::string html =
        "<img src=\"data:image/gif;base64,R0lGOD\" "
        "srcset=\"https://ichef.bbci.co.uk/news/320/x.jpg 320w, https://ichef.bbci.co.uk/news/976/x.jpg 976w\">";
    EXPECT_EQ(CdnImageFetcher::pickImage(html), "https://ichef.bbci.co.uk/news/976/x.jpg");

    std::string dataOnly = "<img src=\"data:image/gif;base64,R0lGOD\"><img src=\"//ichef.bbci.co.uk/news/480/y.jpg?a=1&amp;b=2\">";
    EXPECT_EQ(CdnImageFetcher::pickImage(dataOnly), "https://ichef.bbci.co.uk/news/480/y.jpg?a=1&b=2");
}

TEST(CdnImageFetcherTest, FallsBackToHostedUrlInText) {
    std::string html = "<div data-image='none'>see https://ichef.bbci.co.uk/ace/standard/976/z.png here</div>";
    EXPECT_EQ(CdnImageFetcher::pickImage(html), "https://ichef.bbci.co.uk/ace/standard/976/z.png");
    EXPECT_EQ(CdnImageFetcher::pickImage("<p>plain</p>"), "");
}

class EnrichmentFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_ = g_main_context_new();
        dispatcher_ = std::make_unique<UiDispatcher>(context_);
        settings_.retryDelayMinMs = 5;
        settings_.retryDelayMaxMs = 20;
        settings_.maxConcurrentFetches = 2;
        throttle_ = std::make_unique<FetchThrottle>(static_cast<size_t>(settings_.maxConcurrentFetches));
        pool_ = std::make_unique<WorkerPool>(6);
        cdn_ = std::make_unique<CdnImageFetcher>(http_, *throttle_, *pool_, *dispatcher_, settings_);
        og_ = std::make_unique<OpenGraphImageFetcher>(http_, *throttle_, *pool_, *dispatcher_, settings_);
    }

    void TearDown() override {
        pool_.reset();
        cdn_.reset();
        og_.reset();
        dispatcher_.reset();
        g_main_context_unref(context_);
    }

    EnrichmentRequest request(const std::string& url, const std::string& title = "Feed title") {
        return EnrichmentRequest{url, title, "world", "BBC"};
    }

    Testing::FakeHttpFetcher http_;
    PipelineSettings settings_;
    GMainContext* context_ = nullptr;
    std::unique_ptr<UiDispatcher> dispatcher_;
    std::unique_ptr<FetchThrottle> throttle_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<CdnImageFetcher> cdn_;
    std::unique_ptr<OpenGraphImageFetcher> og_;
};

TEST_F(EnrichmentFetcherTest, CdnDeliversOnceWithFeedTitle) {
    http_.respond("https://www.bbc.co.uk/news/1", 200,
                  "<img srcset=\"https://ichef.bbci.co.uk/news/976/big.jpg 976w\">");
    DeliveryLog log;
    ASSERT_TRUE(cdn_->fetchAndDeliver(request("https://www.bbc.co.uk/news/1"), log.func()));

    auto items = log.items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].title, "Feed title");
    EXPECT_EQ(items[0].url, "https://www.bbc.co.uk/news/1");
    EXPECT_EQ(items[0].thumbnail, "https://ichef.bbci.co.uk/news/976/big.jpg");
    EXPECT_EQ(items[0].categoryId, "world");
    EXPECT_EQ(items[0].sourceName, "BBC");
}

TEST_F(EnrichmentFetcherTest, FailedPageDeliversNothing) {
    http_.respond("https://www.bbc.co.uk/news/404", 404, "gone");
    DeliveryLog log;
    EXPECT_FALSE(cdn_->fetchAndDeliver(request("https://www.bbc.co.uk/news/404"), log.func()));
    EXPECT_FALSE(cdn_->fetchAndDeliver(request("https://unknown.example/none"), log.func()));
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(EnrichmentFetcherTest, OpenGraphOverridesTitle) {
    http_.respond("https://site.example/story", 200,
                  "<html><head><meta property=\"og:image\" content=\"/media/lead.jpg\">"
                  "<meta property=\"og:title\" content=\"Page headline\"></head></html>");
    DeliveryLog log;
    ASSERT_TRUE(og_->fetchAndDeliver(request("https://site.example/story", ""), log.func()));
    auto items = log.items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].title, "Page headline");
    EXPECT_EQ(items[0].thumbnail, "https://site.example/media/lead.jpg");
}

TEST_F(EnrichmentFetcherTest, OpenGraphRejectsTrackingImages) {
    http_.respond("https://site.example/tracked", 200,
                  "<html><head><meta property=\"og:image\" content=\"https://stats.site.example/pixel.gif\"></head></html>");
    DeliveryLog log;
    EXPECT_FALSE(og_->fetchAndDeliver(request("https://site.example/tracked"), log.func()));
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(EnrichmentFetcherTest, OpenGraphWithoutImageKeepsNothing) {
    http_.respond("https://site.example/plain", 200, "<html><body><h1>Text only</h1></body></html>");
    DeliveryLog log;
    EXPECT_FALSE(og_->fetchAndDeliver(request("https://site.example/plain"), log.func()));
}

TEST_F(EnrichmentFetcherTest, EnrichRespectsThrottleAndRetries) {
    const int kRequests = 6;
    http_.setDelayMs(30);
    for (int i = 0; i < kRequests; ++i) {
        http_.respond("https://www.bbc.co.uk/news/" + std::to_string(i), 200,
                      "<img src=\"https://ichef.bbci.co.uk/news/976/" + std::to_string(i) + ".jpg\">");
    }

    DeliveryLog log;
    for (int i = 0; i < kRequests; ++i) {
        cdn_->enrich(request("https://www.bbc.co.uk/news/" + std::to_string(i)), log.func());
    }

    ASSERT_TRUE(Testing::pumpUntil(context_, [&]() { return log.size() == static_cast<size_t>(kRequests); }));
    EXPECT_LE(http_.maxInFlight(), settings_.maxConcurrentFetches);
    for (int i = 0; i < kRequests; ++i) {
        EXPECT_EQ(http_.requestCount("https://www.bbc.co.uk/news/" + std::to_string(i)), 1u);
    }
    ASSERT_TRUE(Testing::pumpUntil(context_, [&]() { return throttle_->active() == 0; }));
}

TEST_F(EnrichmentFetcherTest, EmptyUrlIsIgnored) {
    DeliveryLog log;
    cdn_->enrich(request(""), log.func());
    Testing::pumpFor(context_, 20);
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(throttle_->active(), 0u);
}
