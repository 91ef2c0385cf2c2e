#include <gtest/gtest.h>
#include "utils/Config.hpp"
#include "TestSupport.hpp"

using namespace FeedLine;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { TearDown(); }

    void TearDown() override {
        g_unsetenv("FEEDLINE_DEBUG");
        g_unsetenv("FEEDLINE_ENABLE_CDN_EXTRACT");
    }

    Testing::TempDir dir_;
};

TEST_F(ConfigTest, MissingFileLeavesDefaults) {
    PipelineSettings settings;
    settings.batchSize = 99;
    EXPECT_FALSE(Config::readSettings(dir_.file("absent.json"), settings));
    EXPECT_EQ(settings.batchSize, 99);
}

TEST_F(ConfigTest, WrittenSettingsReadBack) {
    PipelineSettings settings;
    settings.maxConcurrentFetches = 3;
    settings.safetyTimeoutMs = 8000;
    settings.userAgent = "feedline-test/2";
    settings.enrichMissingThumbnails = false;
    ASSERT_TRUE(Config::writeSettings(dir_.file("config.json"), settings));

    PipelineSettings loaded;
    ASSERT_TRUE(Config::readSettings(dir_.file("config.json"), loaded));
    EXPECT_EQ(loaded.maxConcurrentFetches, 3);
    EXPECT_EQ(loaded.safetyTimeoutMs, 8000);
    EXPECT_EQ(loaded.userAgent, "feedline-test/2");
    EXPECT_FALSE(loaded.enrichMissingThumbnails);
    EXPECT_EQ(loaded.batchSize, PipelineSettings().batchSize);
}

TEST_F(ConfigTest, InvalidNumbersFallBack) {
    dir_.write("config.json",
               "{\"batchSize\": 0, \"safetyTimeoutMs\": -5, \"retryDelayMinMs\": 500, \"retryDelayMaxMs\": 100}");
    PipelineSettings loaded;
    ASSERT_TRUE(Config::readSettings(dir_.file("config.json"), loaded));
    EXPECT_EQ(loaded.batchSize, 6);
    EXPECT_EQ(loaded.safetyTimeoutMs, 15000);
    EXPECT_EQ(loaded.retryDelayMinMs, 500);
    EXPECT_EQ(loaded.retryDelayMaxMs, 500);
}

TEST_F(ConfigTest, MalformedFileIsRejected) {
    dir_.write("broken.json", "{ not json");
    dir_.write("array.json", "[1, 2, 3]");
    PipelineSettings loaded;
    EXPECT_FALSE(Config::readSettings(dir_.file("broken.json"), loaded));
    EXPECT_FALSE(Config::readSettings(dir_.file("array.json"), loaded));
}

TEST_F(ConfigTest, EnvironmentToggles) {
    PipelineSettings settings;
    Config::applyEnvironment(settings);
    EXPECT_TRUE(settings.cdnExtractEnabled);
    EXPECT_FALSE(settings.debugLogging);

    g_setenv("FEEDLINE_ENABLE_CDN_EXTRACT", "0", TRUE);
    g_setenv("FEEDLINE_DEBUG", "1", TRUE);
    Config::applyEnvironment(settings);
    EXPECT_FALSE(settings.cdnExtractEnabled);
    EXPECT_TRUE(settings.debugLogging);

    g_setenv("FEEDLINE_ENABLE_CDN_EXTRACT", "1", TRUE);
    Config::applyEnvironment(settings);
    EXPECT_TRUE(settings.cdnExtractEnabled);
}
