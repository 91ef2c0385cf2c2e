#include <gtest/gtest.h>
#include "services/LocalFeedList.hpp"
#include "TestSupport.hpp"

using namespace FeedLine;

class LocalFeedListTest : public ::testing::Test {
protected:
    Testing::TempDir dir_;
};

TEST_F(LocalFeedListTest, MissingFileReadsEmpty) {
    LocalFeedList list(dir_.file("local_feeds"));
    EXPECT_TRUE(list.readUrls().empty());
    EXPECT_FALSE(list.prune("https://gone.example.com/rss"));
}

TEST_F(LocalFeedListTest, ReadsTrimmedNonEmptyLines) {
    dir_.write("local_feeds", "  https://a.example.com/rss  \n\n\thttps://b.example.com/feed\r\n   \n");
    LocalFeedList list(dir_.file("local_feeds"));
    auto urls = list.readUrls();
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0], "https://a.example.com/rss");
    EXPECT_EQ(urls[1], "https://b.example.com/feed");
}

TEST_F(LocalFeedListTest, PruneRemovesOnlyMatchingLines) {
    dir_.write("local_feeds", "https://a.example.com/rss\nhttps://dead.example.com/rss\nhttps://c.example.com/rss\n");
    LocalFeedList list(dir_.file("local_feeds"));

    EXPECT_TRUE(list.prune("https://dead.example.com/rss"));
    EXPECT_EQ(dir_.read("local_feeds"), "https://a.example.com/rss\nhttps://c.example.com/rss\n");
    EXPECT_FALSE(list.prune("https://dead.example.com/rss"));
}

TEST_F(LocalFeedListTest, AppendSkipsDuplicates) {
    LocalFeedList list(dir_.file("nested/local_feeds"));
    EXPECT_TRUE(list.append("https://a.example.com/rss"));
    EXPECT_FALSE(list.append(" https://a.example.com/rss "));
    EXPECT_TRUE(list.append("https://b.example.com/rss"));
    EXPECT_FALSE(list.append("   "));

    auto urls = list.readUrls();
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[1], "https://b.example.com/rss");
}
