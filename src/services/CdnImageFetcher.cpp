#include "services/CdnImageFetcher.hpp"
#include "services/ImageResolver.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"

namespace FeedLine {

std::string CdnImageFetcher::pickImage(const std::string& html) {
    std::string best = ImageResolver::extractJsonLdImage(html);

    if (best.empty()) {
        for (const auto& m : ImageResolver::scanAttributes(html, {"srcset", "data-srcset", "data-src", "src"})) {
            std::string value = StringUtils::trim(m.value);
            if (StringUtils::endsWith(m.name, "srcset")) {
                value = ImageResolver::selectLargestFromSrcset(value);
            } else if (StringUtils::startsWith(StringUtils::toLower(value), "data:")) {
                continue;
            }
            if (!value.empty()) {
                best = value;
                break;
            }
        }
    }

    if (best.empty()) best = ImageResolver::findCdnHostedImage(html);
    if (best.empty()) return "";
    return UrlUtils::forceHttps(StringUtils::replaceAll(best, "&amp;", "&"));
}

std::string CdnImageFetcher::resolveImage(const std::string& html, const EnrichmentRequest&, std::string&) {
    return pickImage(html);
}

}
