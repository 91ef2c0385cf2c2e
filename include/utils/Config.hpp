#pragma once
#include <string>

namespace FeedLine {

// Values handed to pipeline components by copy, so tests can build them directly
struct PipelineSettings {
    int maxConcurrentFetches = 6;
    int workerThreads = 8;
    int retryDelayMinMs = 200;
    int retryDelayMaxMs = 1000;
    int localNewsItemCap = 12;
    int maxEnrichmentUpgrades = 8;
    int batchSize = 6;
    int batchIntervalMs = 60;
    int safetyTimeoutMs = 15000;
    int requestTimeoutSeconds = 15;
    std::string userAgent = "feedline/1.0";
    bool enrichMissingThumbnails = true;
    bool cdnExtractEnabled = true;
    bool debugLogging = false;
};

class Config {
public:
    static Config& getInstance();

    PipelineSettings pipelineSettings() const;

    // <user config dir>/feedline
    std::string configDir() const;
    std::string localFeedListPath() const;
    std::string sourcesPath() const;

    void load();
    void save();
    // File-level helpers behind load()/save(); missing keys keep their defaults
    static bool readSettings(const std::string& path, PipelineSettings& out);
    static bool writeSettings(const std::string& path, const PipelineSettings& settings);

    // FEEDLINE_DEBUG and FEEDLINE_ENABLE_CDN_EXTRACT
    static void applyEnvironment(PipelineSettings& settings);

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    std::string getConfigPath() const;
    PipelineSettings settings_;
};

}
