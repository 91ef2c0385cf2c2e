#pragma once

#include <glib.h>
#include <memory>
#include <set>
#include <string>

namespace FeedLine {

class HttpClient;
class UiDispatcher;
class JsonFeedMetadataStore;
class LocalFeedList;
class FetchOrchestrator;

struct CliOptions {
    std::string url;
    std::string categoryId = "feed";
    std::string categoryName = "Feed";
    std::string sourceName;
    std::string searchQuery;
    bool localNews = false;
    bool myFeed = false;
    int graceMs = 3000;
};

// Command-line front end: runs one view on a GLib main loop and prints what the
// pipeline delivers
class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

    static Application* getInstance();
    // Returns false with a message in error when the arguments are unusable
    static bool parseArguments(int& argc, char**& argv, CliOptions& options, std::string& error);

private:
    void startView(const CliOptions& options);
    void onLabel(const std::string& text);
    void onItem(const std::string& title, const std::string& url, const std::string& thumbnail,
                const std::string& sourceName);
    void scheduleQuit(int exitCode, int graceMs);

    GMainLoop* loop_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<UiDispatcher> dispatcher_;
    std::unique_ptr<JsonFeedMetadataStore> metadata_;
    std::unique_ptr<LocalFeedList> localFeeds_;
    std::unique_ptr<FetchOrchestrator> orchestrator_;
    std::set<std::string> printedUrls_;
    int exitCode_;
    bool quitScheduled_;

    static Application* instance_;
};

} // namespace FeedLine
