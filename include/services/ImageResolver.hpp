#pragma once
#include <string>
#include <vector>

namespace FeedLine {

enum class ImageSource {
    None,
    Srcset,
    HrefToFile,
    SrcAttribute,
    JsonLd,
    OgTag,
    CdnPattern
};

struct ImageCandidate {
    std::string url;
    ImageSource source = ImageSource::None;

    bool empty() const { return url.empty(); }
};

// A quoted attribute found by the scanner, in document order
struct AttributeMatch {
    std::string name;
    std::string value;
};

struct OpenGraphInfo {
    std::string imageUrl;
    std::string title;
};

class ImageResolver {
public:
    // Best image in an HTML fragment (feed description, content:encoded, article page)
    static ImageCandidate resolveFromHtmlSnippet(const std::string& html);
    static std::string extractFromHtmlSnippet(const std::string& html);

    // URL with the largest "w" descriptor, else the first entry; empty for an empty set
    static std::string selectLargestFromSrcset(const std::string& srcset);

    // Rewrites BBC ichef URLs to their 1024-wide rendition
    static std::string normalizeCdnImageUrl(const std::string& url);
    static bool isCdnUrl(const std::string& url);

    // Removes resize/crop/quality query parameters
    static std::string stripResizeParams(const std::string& url);

    static std::string extractJsonLdImage(const std::string& html);
    static std::string findCdnHostedImage(const std::string& html);
    static OpenGraphInfo extractOpenGraph(const std::string& html, const std::string& pageUrl);

    static bool isThumbnailPath(const std::string& url);
    static bool isTrackingUrl(const std::string& url);
    static bool hasImageExtension(const std::string& url);
    static std::string decodeAttributeValue(const std::string& value);

    // Finds name="value" / name='value' for any of the given attribute names
    static std::vector<AttributeMatch> scanAttributes(const std::string& html,
                                                      const std::vector<std::string>& names,
                                                      bool ignoreCase = false);
};

}
