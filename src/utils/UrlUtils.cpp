#include "utils/UrlUtils.hpp"
#include "utils/StringUtils.hpp"

namespace FeedLine {

namespace UrlUtils {

std::string upgradeProtocolRelative(const std::string& url) {
    if (StringUtils::startsWith(url, "//")) return "https:" + url;
    return url;
}

std::string forceHttps(const std::string& url) {
    std::string u = upgradeProtocolRelative(url);
    if (StringUtils::startsWith(u, "http:")) return "https:" + u.substr(5);
    return u;
}

std::string resolveUrl(const std::string& base, const std::string& href) {
    if (href.empty()) return href;
    if (StringUtils::startsWith(href, "http://") || StringUtils::startsWith(href, "https://")) return href;

    size_t s = base.find("://");
    std::string scheme = "https";
    std::string host = base;
    if (s != std::string::npos) {
        scheme = base.substr(0, s);
        size_t start = s + 3;
        size_t end = base.find('/', start);
        host = (end == std::string::npos) ? base.substr(start) : base.substr(start, end - start);
    }
    if (StringUtils::startsWith(href, "//")) return scheme + ":" + href;
    if (href[0] == '/') return scheme + "://" + host + href;

    // Relative to the base document's directory
    std::string path = base;
    size_t q = path.find_first_of("?#");
    if (q != std::string::npos) path = path.substr(0, q);
    size_t pos = path.rfind('/');
    if (pos == std::string::npos || (s != std::string::npos && pos < s + 3)) {
        return scheme + "://" + host + "/" + href;
    }
    return path.substr(0, pos + 1) + href;
}

std::string extractHost(const std::string& url) {
    std::string u = StringUtils::trim(url);
    if (u.empty()) return "";
    size_t schemeEnd = u.find("://");
    if (schemeEnd != std::string::npos) u = u.substr(schemeEnd + 3);
    size_t slash = u.find('/');
    if (slash != std::string::npos) u = u.substr(0, slash);
    size_t colon = u.find(':');
    if (colon != std::string::npos) u = u.substr(0, colon);
    u = StringUtils::toLower(u);
    if (StringUtils::startsWith(u, "www.")) u = u.substr(4);
    return u;
}

bool isHttpUrl(const std::string& url) {
    return StringUtils::startsWith(url, "http://") || StringUtils::startsWith(url, "https://");
}

bool isSupportedFeedUrl(const std::string& url) {
    if (url.find_first_of(" \t\r\n") != std::string::npos) return false;
    return isHttpUrl(url) || StringUtils::startsWith(url, "file://");
}

std::string filePathFromUrl(const std::string& url) {
    if (!StringUtils::startsWith(url, "file://")) return url;
    return url.substr(7);
}

}

}
