#include "services/OpenGraphImageFetcher.hpp"
#include "services/ImageResolver.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"

namespace FeedLine {

std::string OpenGraphImageFetcher::resolveImage(const std::string& html, const EnrichmentRequest& request,
                                                std::string& title) {
    OpenGraphInfo info = ImageResolver::extractOpenGraph(html, request.articleUrl);
    if (info.imageUrl.empty() || !UrlUtils::isHttpUrl(info.imageUrl)) return "";
    if (ImageResolver::isTrackingUrl(info.imageUrl)) return "";

    if (!info.title.empty()) title = StringUtils::sanitizeUtf8(info.title);
    return UrlUtils::upgradeProtocolRelative(info.imageUrl);
}

}
