#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace FeedLine {

struct FeedItem {
    std::string title;
    std::string link;
    std::string thumbnail;
};

enum class FeedKind {
    Unknown,
    Rss,
    Atom
};

struct ParsedFeed {
    std::vector<FeedItem> items;
    std::string faviconUrl;
    FeedKind kind = FeedKind::Unknown;
};

struct FeedParseOptions {
    std::string categoryId;
    std::string sourceName;
    // 0 means unlimited
    size_t itemCap = 0;
    bool cdnEnabled = true;
};

class FeedParser {
public:
    static constexpr const char* kMediaNamespace = "http://search.yahoo.com/mrss/";
    static constexpr const char* kContentNamespace = "http://purl.org/rss/1.0/modules/content/";

    // Never throws; an unparseable document yields an empty ParsedFeed
    static ParsedFeed parse(const std::string& body, const FeedParseOptions& options);
};

}
