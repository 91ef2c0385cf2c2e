#include "app/Application.hpp"
#include "services/FeedMetadataStore.hpp"
#include "services/FetchOrchestrator.hpp"
#include "services/LocalFeedList.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/UiDispatcher.hpp"
#include "utils/UrlUtils.hpp"
#include <iostream>

namespace FeedLine {

Application* Application::instance_ = nullptr;

Application::Application() : loop_(nullptr), exitCode_(0), quitScheduled_(false) {
    instance_ = this;
    loop_ = g_main_loop_new(nullptr, FALSE);
}

Application::~Application() {
    // The orchestrator joins its workers before the dispatcher and loop go away
    orchestrator_.reset();
    dispatcher_.reset();
    if (loop_) {
        g_main_loop_unref(loop_);
    }
    instance_ = nullptr;
}

Application* Application::getInstance() {
    return instance_;
}

bool Application::parseArguments(int& argc, char**& argv, CliOptions& options, std::string& error) {
    gchar* category = nullptr;
    gchar* categoryName = nullptr;
    gchar* sourceName = nullptr;
    gchar* search = nullptr;
    gboolean localNews = FALSE;
    gboolean myFeed = FALSE;
    gint graceMs = options.graceMs;

    GOptionEntry entries[] = {
        {"category", 'c', 0, G_OPTION_ARG_STRING, &category, "Category id for delivered items", "ID"},
        {"category-name", 0, 0, G_OPTION_ARG_STRING, &categoryName, "Category name shown in the label", "NAME"},
        {"name", 'n', 0, G_OPTION_ARG_STRING, &sourceName, "Display name of the source", "NAME"},
        {"search", 's', 0, G_OPTION_ARG_STRING, &search, "Only show items whose title or link match", "QUERY"},
        {"local-news", 'l', 0, G_OPTION_ARG_NONE, &localNews, "Load every feed in the local feed list", nullptr},
        {"my-feed", 'm', 0, G_OPTION_ARG_NONE, &myFeed, "Load every saved feed source", nullptr},
        {"grace", 0, 0, G_OPTION_ARG_INT, &graceMs, "Milliseconds to wait for image upgrades", "MS"},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}
    };

    GOptionContext* context = g_option_context_new("[URL] - fetch and print a news feed");
    g_option_context_add_main_entries(context, entries, nullptr);
    GError* gerror = nullptr;
    bool ok = g_option_context_parse(context, &argc, &argv, &gerror);
    if (!ok) {
        error = gerror ? gerror->message : "invalid arguments";
        if (gerror) g_error_free(gerror);
    }
    g_option_context_free(context);

    if (ok) {
        if (category) options.categoryId = category;
        if (categoryName) options.categoryName = categoryName;
        if (sourceName) options.sourceName = sourceName;
        if (search) options.searchQuery = search;
        options.localNews = localNews;
        options.myFeed = myFeed;
        options.graceMs = graceMs >= 0 ? graceMs : 0;
        if (argc > 1) options.url = argv[1];

        if (options.localNews && options.myFeed) {
            error = "--local-news and --my-feed are exclusive";
            ok = false;
        } else if (!options.localNews && !options.myFeed && options.url.empty()) {
            error = "a feed URL is required";
            ok = false;
        }
        if (options.sourceName.empty()) options.sourceName = UrlUtils::extractHost(options.url);
        if (options.sourceName.empty()) options.sourceName = options.url;
    }

    g_free(category);
    g_free(categoryName);
    g_free(sourceName);
    g_free(search);
    return ok;
}

int Application::run(int argc, char* argv[]) {
    CliOptions options;
    std::string error;
    if (!parseArguments(argc, argv, options, error)) {
        std::cerr << "feedline: " << error << std::endl;
        return 2;
    }

    Config& config = Config::getInstance();
    PipelineSettings settings = config.pipelineSettings();
    // An explicit G_MESSAGES_DEBUG from the caller wins
    if (settings.debugLogging) g_setenv("G_MESSAGES_DEBUG", G_LOG_DOMAIN, FALSE);

    http_ = std::make_unique<HttpClient>();
    http_->setUserAgent(settings.userAgent);
    http_->setTimeout(settings.requestTimeoutSeconds);
    dispatcher_ = std::make_unique<UiDispatcher>();
    metadata_ = std::make_unique<JsonFeedMetadataStore>(config.sourcesPath());
    localFeeds_ = std::make_unique<LocalFeedList>(config.localFeedListPath());

    LoadingObserver observer;
    observer.onReveal = [this, options]() { scheduleQuit(0, options.graceMs); };
    observer.onError = [this](const std::string& message) {
        std::cerr << "error: " << message << std::endl;
        scheduleQuit(1, 0);
    };
    observer.onBadgeRefresh = [](const std::string& categoryId) {
        g_debug("batch drained for %s", categoryId.c_str());
    };

    orchestrator_ = std::make_unique<FetchOrchestrator>(*http_, *dispatcher_, *metadata_, *localFeeds_, settings,
                                                        observer);
    startView(options);

    g_main_loop_run(loop_);
    return exitCode_;
}

void Application::startView(const CliOptions& options) {
    ResultSink sink;
    sink.setLabel = [this](const std::string& text) { onLabel(text); };
    sink.clearItems = [this]() { printedUrls_.clear(); };
    sink.addItem = [this](const std::string& title, const std::string& url, const std::string& thumbnail,
                          const std::string&, const std::string& sourceName) {
        onItem(title, url, thumbnail, sourceName);
    };

    if (options.localNews) {
        orchestrator_->fetchLocalNews(options.searchQuery, sink);
    } else if (options.myFeed) {
        orchestrator_->fetchMyFeed(options.searchQuery, sink);
    } else {
        FeedRequest request{options.url, options.sourceName, options.categoryId, options.categoryName,
                            options.searchQuery};
        orchestrator_->fetchFeed(request, sink);
    }
}

void Application::onLabel(const std::string& text) {
    std::cout << "== " << text << " ==" << std::endl;
}

void Application::onItem(const std::string& title, const std::string& url, const std::string& thumbnail,
                         const std::string& sourceName) {
    if (!printedUrls_.insert(url).second) {
        std::cout << "   image upgrade for " << url << ": " << thumbnail << std::endl;
        return;
    }
    std::cout << "* " << title << " [" << sourceName << "]" << std::endl;
    std::cout << "   " << url << std::endl;
    if (!thumbnail.empty()) std::cout << "   image: " << thumbnail << std::endl;
}

void Application::scheduleQuit(int exitCode, int graceMs) {
    if (quitScheduled_) return;
    quitScheduled_ = true;
    exitCode_ = exitCode;
    GMainLoop* loop = loop_;
    dispatcher_->postDelayed(static_cast<guint>(graceMs), [loop]() { g_main_loop_quit(loop); });
}

} // namespace FeedLine
