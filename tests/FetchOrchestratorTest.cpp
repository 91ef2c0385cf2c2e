#include <gtest/gtest.h>
#include "services/FetchOrchestrator.hpp"
#include "TestSupport.hpp"
#include <memory>
#include <vector>

using namespace FeedLine;

namespace {

struct ViewLog {
    std::vector<std::string> labels;
    int clears = 0;
    std::vector<std::string> titles;
    std::vector<std::string> sources;

    ResultSink sink() {
        ResultSink s;
        s.setLabel = [this](const std::string& text) { labels.push_back(text); };
        s.clearItems = [this]() { clears++; };
        s.addItem = [this](const std::string& title, const std::string&, const std::string&,
                           const std::string&, const std::string& sourceName) {
            titles.push_back(title);
            sources.push_back(sourceName);
        };
        return s;
    }
};

std::string feedWith(const std::string& prefix, int count) {
    std::string xml = "<rss version=\"2.0\"><channel><title>" + prefix + "</title>";
    for (int i = 0; i < count; ++i) {
        xml += "<item><title>" + prefix + " " + std::to_string(i) + "</title><link>https://" + prefix +
               ".example/" + std::to_string(i) + "</link></item>";
    }
    return xml + "</channel></rss>";
}

}

class FetchOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_ = g_main_context_new();
        dispatcher_ = std::make_unique<UiDispatcher>(context_);
        localFeeds_ = std::make_unique<LocalFeedList>(dir_.file("local_feeds"));
        store_ = std::make_unique<JsonFeedMetadataStore>(dir_.file("sources.json"));
        settings_.enrichMissingThumbnails = false;
        settings_.cdnExtractEnabled = false;
        settings_.batchIntervalMs = 5;
    }

    void TearDown() override {
        orchestrator_.reset();
        dispatcher_.reset();
        g_main_context_unref(context_);
    }

    FetchOrchestrator& orchestrator() {
        if (!orchestrator_) {
            LoadingObserver observer;
            observer.onReveal = [this]() { reveals_++; };
            observer.onError = [this](const std::string& message) { errors_.push_back(message); };
            observer.onBadgeRefresh = [this](const std::string& category) { badges_.push_back(category); };
            orchestrator_ = std::make_unique<FetchOrchestrator>(http_, *dispatcher_, *store_, *localFeeds_, settings_,
                                                                observer);
        }
        return *orchestrator_;
    }

    bool settle(int timeoutMs = 5000) {
        return Testing::pumpUntil(context_, [this]() { return orchestrator_->state() != ViewState::Fetching; },
                                  timeoutMs);
    }

    FeedRequest request(const std::string& url) {
        return FeedRequest{url, "Wire", "world", "World", ""};
    }

    Testing::TempDir dir_;
    Testing::FakeHttpFetcher http_;
    PipelineSettings settings_;
    GMainContext* context_ = nullptr;
    std::unique_ptr<UiDispatcher> dispatcher_;
    std::unique_ptr<LocalFeedList> localFeeds_;
    std::unique_ptr<JsonFeedMetadataStore> store_;
    std::unique_ptr<FetchOrchestrator> orchestrator_;
    int reveals_ = 0;
    std::vector<std::string> errors_;
    std::vector<std::string> badges_;
};

TEST_F(FetchOrchestratorTest, StartsIdle) {
    EXPECT_EQ(orchestrator().state(), ViewState::Idle);
    EXPECT_STREQ(viewStateName(ViewState::Errored), "errored");
}

TEST_F(FetchOrchestratorTest, SingleFeedDeliversAndReveals) {
    http_.respond("https://wire.example/rss", 200, feedWith("wire", 3));
    ViewLog log;
    FetchEpochGuard::Epoch epoch = orchestrator().fetchFeed(request("https://wire.example/rss"), log.sink());
    EXPECT_TRUE(orchestrator().epochGuard().isCurrent(epoch));
    EXPECT_EQ(orchestrator().state(), ViewState::Fetching);

    ASSERT_TRUE(settle());
    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"World — Wire"}));
    EXPECT_EQ(log.clears, 1);
    EXPECT_EQ(log.titles, (std::vector<std::string>{"wire 0", "wire 1", "wire 2"}));
    EXPECT_EQ(orchestrator().appliedItemCount(), 3u);
    EXPECT_EQ(reveals_, 1);
    EXPECT_TRUE(errors_.empty());
    EXPECT_EQ(orchestrator().imageCache().capacity(), 12u);
}

TEST_F(FetchOrchestratorTest, FailingSourceEndsInErrored) {
    ViewLog log;
    orchestrator().fetchFeed(request("https://unreachable.example/rss"), log.sink());
    ASSERT_TRUE(settle());

    EXPECT_EQ(orchestrator().state(), ViewState::Errored);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], "Error loading feed — network/DNS error");
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Error loading feed — network/DNS error"}));
    EXPECT_EQ(reveals_, 0);
}

TEST_F(FetchOrchestratorTest, SourceNamedLikeAnErrorStillReveals) {
    http_.respond("https://weekly.example/rss", 200, feedWith("weekly", 2));
    ViewLog log;
    orchestrator().fetchFeed(FeedRequest{"https://weekly.example/rss", "Error Weekly", "feed", "Feed", ""},
                             log.sink());
    ASSERT_TRUE(settle());

    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Feed — Error Weekly"}));
    EXPECT_EQ(log.titles.size(), 2u);
    EXPECT_EQ(reveals_, 1);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(FetchOrchestratorTest, SearchForFailedStillReveals) {
    http_.respond("https://wire.example/rss", 200, feedWith("failed", 2));
    FeedRequest req = request("https://wire.example/rss");
    req.searchQuery = "failed";

    ViewLog log;
    orchestrator().fetchFeed(req, log.sink());
    ASSERT_TRUE(settle());
    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.titles.size(), 2u);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(FetchOrchestratorTest, LocalNewsWithOneDeadFeedDelivers) {
    dir_.write("local_feeds", "https://dead.example/rss\nhttps://town.example/rss\n");
    http_.respond("https://town.example/rss", 200, feedWith("town", 4));

    ViewLog log;
    orchestrator().fetchLocalNews("", log.sink());
    ASSERT_TRUE(settle());

    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Local News"}));
    EXPECT_EQ(log.titles.size(), 4u);
    EXPECT_EQ(reveals_, 1);
    EXPECT_TRUE(errors_.empty());
    // Network failures prune the dead URL from the list
    EXPECT_EQ(localFeeds_->readUrls(), (std::vector<std::string>{"https://town.example/rss"}));
}

TEST_F(FetchOrchestratorTest, LocalNewsAllFeedsDeadEndsInErrored) {
    dir_.write("local_feeds", "https://dead.example/rss\nhttps://gone.example/rss\n");

    ViewLog log;
    orchestrator().fetchLocalNews("", log.sink());
    ASSERT_TRUE(settle());

    EXPECT_EQ(orchestrator().state(), ViewState::Errored);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], "Error loading feed — network/DNS error");
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Local News"}));
}

TEST_F(FetchOrchestratorTest, SupersededFetchIsDropped) {
    http_.setDelayMs(50);
    http_.respond("https://old.example/rss", 200, feedWith("old", 4));
    http_.respond("https://new.example/rss", 200, feedWith("new", 2));

    ViewLog oldLog;
    ViewLog newLog;
    FetchEpochGuard::Epoch first = orchestrator().fetchFeed(request("https://old.example/rss"), oldLog.sink());
    FetchEpochGuard::Epoch second = orchestrator().fetchFeed(request("https://new.example/rss"), newLog.sink());
    EXPECT_GT(second, first);

    ASSERT_TRUE(settle());
    Testing::pumpFor(context_, 150);

    EXPECT_TRUE(oldLog.labels.empty());
    EXPECT_EQ(oldLog.clears, 0);
    EXPECT_TRUE(oldLog.titles.empty());
    EXPECT_EQ(newLog.titles.size(), 2u);
    EXPECT_EQ(reveals_, 1);
}

TEST_F(FetchOrchestratorTest, EmptyLocalListExplains) {
    ViewLog log;
    orchestrator().fetchLocalNews("", log.sink());
    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Local News — No local feeds configured"}));
    EXPECT_EQ(reveals_, 1);
    EXPECT_EQ(http_.totalRequests(), 0u);
}

TEST_F(FetchOrchestratorTest, EmptyMyFeedExplains) {
    ViewLog log;
    orchestrator().fetchMyFeed("", log.sink());
    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"My Feed — No custom RSS feeds configured"}));
}

TEST_F(FetchOrchestratorTest, LocalNewsBatchesAndClearsOnce) {
    dir_.write("local_feeds", "https://big.example/rss\nhttps://small.example/rss\n");
    http_.respond("https://big.example/rss", 200, feedWith("big", 30));
    http_.respond("https://small.example/rss", 200, feedWith("small", 5));

    ViewLog log;
    orchestrator().fetchLocalNews("", log.sink());
    EXPECT_EQ(orchestrator().imageCache().capacity(), 6u);
    ASSERT_TRUE(settle());

    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Local News"}));
    EXPECT_EQ(log.clears, 1);
    EXPECT_EQ(log.titles.size(), 17u);
    EXPECT_EQ(orchestrator().queuedItemCount(), 0u);
    ASSERT_FALSE(badges_.empty());
    EXPECT_EQ(badges_.back(), kLocalNewsCategory);
    for (const auto& source : log.sources) EXPECT_EQ(source, "Local Feed");
}

TEST_F(FetchOrchestratorTest, LocalNewsSearchLabel) {
    dir_.write("local_feeds", "https://town.example/rss\n");
    http_.respond("https://town.example/rss", 200, feedWith("town", 3));

    ViewLog log;
    orchestrator().fetchLocalNews("town 1", log.sink());
    ASSERT_TRUE(settle());
    EXPECT_EQ(log.labels, (std::vector<std::string>{"Search Results: \"town 1\" in Local News"}));
    EXPECT_EQ(log.titles, (std::vector<std::string>{"town 1"}));
}

TEST_F(FetchOrchestratorTest, MyFeedUsesHostWhenNameMissing) {
    ASSERT_TRUE(store_->add({"", "https://www.blog.example/rss", ""}));
    http_.respond("https://www.blog.example/rss", 200, feedWith("blog", 2));

    ViewLog log;
    orchestrator().fetchMyFeed("", log.sink());
    ASSERT_TRUE(settle());
    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.labels, (std::vector<std::string>{"My Feed"}));
    ASSERT_EQ(log.sources.size(), 2u);
    EXPECT_EQ(log.sources[0], "blog.example");
}

TEST_F(FetchOrchestratorTest, SafetyTimeoutWithoutItemsErrors) {
    settings_.safetyTimeoutMs = 100;
    http_.setDelayMs(600);
    http_.respond("https://slow.example/rss", 200, feedWith("slow", 2));

    ViewLog log;
    orchestrator().fetchFeed(request("https://slow.example/rss"), log.sink());
    ASSERT_TRUE(settle(2000));
    EXPECT_EQ(orchestrator().state(), ViewState::Errored);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], "No articles could be loaded. Try refreshing or check your source settings.");
}

TEST_F(FetchOrchestratorTest, SafetyTimeoutAfterNetworkFailureSaysOffline) {
    settings_.safetyTimeoutMs = 150;
    dir_.write("local_feeds", "https://dead.example/rss\nhttps://slow.example/rss\n");
    http_.respond("https://slow.example/rss", 200, feedWith("slow", 2));
    http_.setDelayMs("https://slow.example/rss", 800);

    ViewLog log;
    orchestrator().fetchLocalNews("", log.sink());
    ASSERT_TRUE(settle(2000));

    EXPECT_EQ(orchestrator().state(), ViewState::Errored);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], "No network connection detected. Check your connection and try again.");
    EXPECT_TRUE(log.titles.empty());
}

TEST_F(FetchOrchestratorTest, SafetyTimeoutWithItemsReveals) {
    settings_.safetyTimeoutMs = 150;
    dir_.write("local_feeds", "https://quick.example/rss\nhttps://slow.example/rss\n");
    http_.respond("https://quick.example/rss", 200, feedWith("quick", 3));
    http_.respond("https://slow.example/rss", 200, feedWith("slow", 2));
    http_.setDelayMs("https://slow.example/rss", 800);

    ViewLog log;
    orchestrator().fetchLocalNews("", log.sink());
    ASSERT_TRUE(settle(2000));

    EXPECT_EQ(orchestrator().state(), ViewState::Delivered);
    EXPECT_EQ(log.titles.size(), 3u);
    EXPECT_EQ(reveals_, 1);
    EXPECT_TRUE(errors_.empty());

    // The slow source still lands in the revealed view
    ASSERT_TRUE(Testing::pumpUntil(context_, [&log]() { return log.titles.size() == 5u; }, 3000));
    EXPECT_EQ(reveals_, 1);
}

TEST_F(FetchOrchestratorTest, DestroyingWithWorkInFlightDropsResults) {
    http_.setDelayMs(100);
    http_.respond("https://wire.example/rss", 200, feedWith("wire", 2));

    ViewLog log;
    orchestrator().fetchFeed(request("https://wire.example/rss"), log.sink());
    orchestrator_.reset();
    Testing::pumpFor(context_, 150);

    EXPECT_TRUE(log.labels.empty());
    EXPECT_TRUE(log.titles.empty());
    EXPECT_EQ(reveals_, 0);
}
