#pragma once
#include <string>

namespace FeedLine {

namespace UrlUtils {

// "//host/path" -> "https://host/path"
std::string upgradeProtocolRelative(const std::string& url);
// Protocol-relative and plain http URLs become https
std::string forceHttps(const std::string& url);
// Resolves href against the page it was found on
std::string resolveUrl(const std::string& base, const std::string& href);
// "https://www.example.com:8080/path" -> "example.com"
std::string extractHost(const std::string& url);
// Drops query and trailing slashes, lowercases scheme and host
bool isHttpUrl(const std::string& url);
bool isSupportedFeedUrl(const std::string& url);
std::string filePathFromUrl(const std::string& url);

}

}
