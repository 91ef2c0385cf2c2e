#include "services/ImageResolver.hpp"
#include "utils/HtmlParser.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <regex>
#include <cstdlib>
#include <cerrno>

namespace FeedLine {

using StringUtils::toLower;
using StringUtils::startsWith;
using StringUtils::endsWith;

static const char* const kImageKeywords[] = {"jpg", "jpeg", "png", "webp", "gif"};

static bool looksLikeImage(const std::string& lowerUrl) {
    for (const char* k : kImageKeywords) {
        if (lowerUrl.find(k) != std::string::npos) return true;
    }
    return false;
}

bool ImageResolver::isThumbnailPath(const std::string& url) {
    std::string lower = toLower(url);
    return lower.find("_thm.") != std::string::npos ||
           lower.find("/thumb/") != std::string::npos ||
           lower.find("/thumbnail/") != std::string::npos;
}

bool ImageResolver::isTrackingUrl(const std::string& url) {
    std::string lower = toLower(url);
    return lower.find("tracking") != std::string::npos ||
           lower.find("pixel") != std::string::npos ||
           lower.find("1x1") != std::string::npos;
}

bool ImageResolver::hasImageExtension(const std::string& url) {
    std::string lower = toLower(url);
    for (const char* k : kImageKeywords) {
        if (endsWith(lower, std::string(".") + k)) return true;
    }
    return false;
}

std::string ImageResolver::decodeAttributeValue(const std::string& value) {
    std::string v = value;
    v = StringUtils::replaceAll(v, "&amp;", "&");
    v = StringUtils::replaceAll(v, "&lt;", "<");
    v = StringUtils::replaceAll(v, "&gt;", ">");
    v = StringUtils::replaceAll(v, "&quot;", "\"");
    static const std::pair<const char*, const char*> kEscapes[] = {
        {"%3A", ":"}, {"%3a", ":"}, {"%2F", "/"}, {"%2f", "/"}, {"%3F", "?"}, {"%3f", "?"},
        {"%3D", "="}, {"%3d", "="}, {"%26", "&"}
    };
    for (const auto& e : kEscapes) v = StringUtils::replaceAll(v, e.first, e.second);
    return v;
}

std::vector<AttributeMatch> ImageResolver::scanAttributes(const std::string& html,
                                                          const std::vector<std::string>& names,
                                                          bool ignoreCase) {
    std::vector<AttributeMatch> matches;
    const std::string hay = ignoreCase ? toLower(html) : html;
    const size_t n = hay.size();
    size_t i = 0;
    while (i < n) {
        bool matched = false;
        for (const auto& name : names) {
            const std::string key = ignoreCase ? toLower(name) : name;
            size_t eq = i + key.size();
            if (eq + 1 >= n || hay[eq] != '=' || hay.compare(i, key.size(), key) != 0) continue;
            size_t q = eq + 1;
            if (hay[q] != '"' && hay[q] != '\'') continue;
            size_t end = hay.find_first_of("\"'", q + 1);
            if (end == std::string::npos || end == q + 1) continue;
            matches.push_back({key, html.substr(q + 1, end - q - 1)});
            i = end + 1;
            matched = true;
            break;
        }
        if (!matched) ++i;
    }
    return matches;
}

std::string ImageResolver::selectLargestFromSrcset(const std::string& srcset) {
    int bestWidth = -1;
    std::string bestUrl;
    std::string firstUrl;
    for (const auto& part : StringUtils::split(srcset, ',')) {
        std::string t = StringUtils::trim(part);
        if (t.empty()) continue;
        size_t space = t.find_first_of(" \t\n");
        std::string url = space == std::string::npos ? t : t.substr(0, space);
        std::string desc = space == std::string::npos ? "" : StringUtils::trim(t.substr(space + 1));
        if (firstUrl.empty()) firstUrl = url;

        if (desc.size() > 1 && desc.back() == 'w') {
            std::string digits = desc.substr(0, desc.size() - 1);
            char* endp = nullptr;
            errno = 0;
            long w = std::strtol(digits.c_str(), &endp, 10);
            if (endp && *endp == '\0' && errno == 0 && w > bestWidth && w < 1000000) {
                bestWidth = static_cast<int>(w);
                bestUrl = url;
            }
        }
    }
    std::string chosen = bestWidth >= 0 ? bestUrl : firstUrl;
    return StringUtils::replaceAll(chosen, "&amp;", "&");
}

ImageCandidate ImageResolver::resolveFromHtmlSnippet(const std::string& html) {
    std::string hrefCandidate;
    std::string srcCandidate;

    // Pass 1: the first <a href> pointing straight at an image file
    for (const auto& m : scanAttributes(html, {"href"}, true)) {
        if (!hasImageExtension(m.value)) continue;
        std::string hrefUrl = UrlUtils::upgradeProtocolRelative(StringUtils::replaceAll(m.value, "&amp;", "&"));
        if (!isTrackingUrl(hrefUrl) && !isThumbnailPath(hrefUrl) && hrefUrl.size() >= 20 &&
            startsWith(hrefUrl, "http")) {
            hrefCandidate = hrefUrl;
        }
        break;
    }

    // Pass 2: src/srcset family; a usable srcset wins outright
    for (const auto& m : scanAttributes(html, {"src", "data-src", "srcset", "data-srcset"})) {
        bool isSrcset = endsWith(m.name, "srcset");
        std::string value = m.value;
        if (isSrcset) value = selectLargestFromSrcset(value);

        std::string imgUrl = UrlUtils::upgradeProtocolRelative(decodeAttributeValue(value));
        std::string lower = toLower(imgUrl);
        if (startsWith(lower, "data:") || imgUrl.size() < 20) continue;
        if (isTrackingUrl(imgUrl) || !looksLikeImage(lower) || !startsWith(imgUrl, "http")) continue;

        if (isSrcset) {
            g_debug("snippet image from srcset: %s", StringUtils::truncateForLog(imgUrl).c_str());
            return {imgUrl, ImageSource::Srcset};
        }
        if (srcCandidate.empty() && !isThumbnailPath(imgUrl)) srcCandidate = imgUrl;
    }

    if (!hrefCandidate.empty() && !srcCandidate.empty() && isThumbnailPath(srcCandidate)) {
        return {hrefCandidate, ImageSource::HrefToFile};
    }
    if (!srcCandidate.empty()) return {srcCandidate, ImageSource::SrcAttribute};
    if (!hrefCandidate.empty()) return {hrefCandidate, ImageSource::HrefToFile};
    return {};
}

std::string ImageResolver::extractFromHtmlSnippet(const std::string& html) {
    return resolveFromHtmlSnippet(html).url;
}

bool ImageResolver::isCdnUrl(const std::string& url) {
    std::string lower = toLower(url);
    return lower.find("bbc.") != std::string::npos || lower.find("bbci.co.uk") != std::string::npos;
}

std::string ImageResolver::normalizeCdnImageUrl(const std::string& url) {
    try {
        static const std::regex reNewsSize(R"(/news/\d+/)");
        static const std::regex reDimensions(R"(/\d+x\d+/(?!cpsprodpb))");
        static const std::regex reAceStandard(R"(/ace/standard/\d+/)");
        static const std::regex reAceThumb(R"(/ace/(thumbnail|thumb|standard)/\d+/)");
        static const std::regex reResize(R"(/(resize|preview)/\d+x\d+/(?!cpsprodpb))");
        static const std::regex reCps(R"(/news/(?:[^/]+/)*cpsprodpb/)");
        static const std::regex reNewsNoSize(R"(/news/(?!1024/))");
        static const std::regex reSmall(R"(/(thumb|thumbnail|small|crop)/)");

        std::string u = UrlUtils::forceHttps(StringUtils::replaceAll(url, "&amp;", "&"));

        u = std::regex_replace(u, reNewsSize, "/news/1024/");
        u = std::regex_replace(u, reDimensions, "/1024x576/");
        u = std::regex_replace(u, reAceStandard, "/ace/standard/1024/");
        u = std::regex_replace(u, reAceThumb, "/ace/standard/1024/");
        u = std::regex_replace(u, reResize, "/resize/1024x576/");
        if (std::regex_search(u, reCps)) {
            u = std::regex_replace(u, reNewsNoSize, "/news/1024/");
        }
        u = std::regex_replace(u, reSmall, "/1024x576/");

        size_t q = u.find('?');
        if (q != std::string::npos) u = u.substr(0, q);
        return u;
    } catch (const std::exception& e) {
        g_debug("CDN normalization failed for %s: %s", url.c_str(), e.what());
        return url;
    }
}

std::string ImageResolver::stripResizeParams(const std::string& url) {
    static const char* const kStripped[] = {
        "resize=", "w=", "h=", "width=", "height=", "fit=", "crop=", "quality=", "zoom="
    };
    size_t q = url.find('?');
    if (q == std::string::npos) return url;

    std::string base = url.substr(0, q);
    std::string kept;
    for (const auto& param : StringUtils::split(url.substr(q + 1), '&')) {
        std::string lower = toLower(param);
        bool strip = false;
        for (const char* key : kStripped) {
            if (startsWith(lower, key)) { strip = true; break; }
        }
        if (strip) continue;
        if (!kept.empty()) kept += "&";
        kept += param;
    }
    return kept.empty() ? base : base + "?" + kept;
}

// image value forms: "url", {"url": ...}, ["url", ...] or [{"url": ...}]
static std::string imageValueFromNode(JsonNode* node) {
    if (!node) return "";
    if (JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING) {
        const char* s = json_node_get_string(node);
        return s ? s : "";
    }
    if (JSON_NODE_HOLDS_OBJECT(node)) {
        JsonObject* obj = json_node_get_object(node);
        for (const char* key : {"url", "contentUrl"}) {
            if (json_object_has_member(obj, key)) {
                std::string v = imageValueFromNode(json_object_get_member(obj, key));
                if (!v.empty()) return v;
            }
        }
        return "";
    }
    if (JSON_NODE_HOLDS_ARRAY(node)) {
        JsonArray* arr = json_node_get_array(node);
        guint len = json_array_get_length(arr);
        for (guint i = 0; i < len; i++) {
            std::string v = imageValueFromNode(json_array_get_element(arr, i));
            if (!v.empty()) return v;
        }
    }
    return "";
}

// Depth-first search for the first "image" member in document order
static std::string findImageMember(JsonNode* node) {
    if (!node) return "";
    if (JSON_NODE_HOLDS_OBJECT(node)) {
        JsonObject* obj = json_node_get_object(node);
        if (json_object_has_member(obj, "image")) {
            std::string v = imageValueFromNode(json_object_get_member(obj, "image"));
            if (!v.empty()) return v;
        }
        std::string found;
        GList* members = json_object_get_members(obj);
        for (GList* l = members; l && found.empty(); l = l->next) {
            const char* name = static_cast<const char*>(l->data);
            if (g_strcmp0(name, "image") == 0) continue;
            found = findImageMember(json_object_get_member(obj, name));
        }
        g_list_free(members);
        return found;
    }
    if (JSON_NODE_HOLDS_ARRAY(node)) {
        JsonArray* arr = json_node_get_array(node);
        guint len = json_array_get_length(arr);
        for (guint i = 0; i < len; i++) {
            std::string v = findImageMember(json_array_get_element(arr, i));
            if (!v.empty()) return v;
        }
    }
    return "";
}

static std::string readJsonString(const std::string& s, size_t openQuote) {
    size_t end = s.find('"', openQuote + 1);
    if (end == std::string::npos) return "";
    return s.substr(openQuote + 1, end - openQuote - 1);
}

// Textual fallback for blocks json-glib rejects (trailing commas, raw newlines in strings)
static std::string scanImageMember(const std::string& block) {
    size_t pos = block.find("\"image\"");
    if (pos == std::string::npos) return "";
    size_t p = block.find_first_not_of(" \t\r\n", pos + 7);
    if (p == std::string::npos || block[p] != ':') return "";
    p = block.find_first_not_of(" \t\r\n", p + 1);
    if (p == std::string::npos) return "";
    if (block[p] == '[') {
        p = block.find_first_not_of(" \t\r\n", p + 1);
        if (p == std::string::npos) return "";
    }
    if (block[p] == '"') return readJsonString(block, p);
    if (block[p] == '{') {
        size_t u = block.find("\"url\"", p);
        size_t close = block.find('}', p);
        if (u == std::string::npos || (close != std::string::npos && u > close)) return "";
        size_t q = block.find('"', block.find(':', u + 5));
        if (q == std::string::npos) return "";
        return readJsonString(block, q);
    }
    return "";
}

static std::string imageFromJsonLdBlock(const std::string& block) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;
    std::string found;
    if (json_parser_load_from_data(parser, block.c_str(), static_cast<gssize>(block.size()), &error)) {
        found = findImageMember(json_parser_get_root(parser));
    } else {
        if (error) g_error_free(error);
        found = scanImageMember(block);
    }
    g_object_unref(parser);
    return found;
}

std::string ImageResolver::extractJsonLdImage(const std::string& html) {
    const std::string lower = toLower(html);
    size_t pos = 0;
    while ((pos = lower.find("<script", pos)) != std::string::npos) {
        size_t tagEnd = lower.find('>', pos);
        if (tagEnd == std::string::npos) break;
        size_t close = lower.find("</script>", tagEnd);
        if (close == std::string::npos) break;
        if (lower.substr(pos, tagEnd - pos).find("application/ld+json") != std::string::npos) {
            std::string image = imageFromJsonLdBlock(html.substr(tagEnd + 1, close - tagEnd - 1));
            if (!image.empty()) return image;
        }
        pos = close + 9;
    }
    return "";
}

std::string ImageResolver::findCdnHostedImage(const std::string& html) {
    static const std::regex reCdnImage(R"(https?://ichef\.bbci\.co\.[a-z]+/[^"'\s]+)");
    std::smatch match;
    if (std::regex_search(html, match, reCdnImage)) return match[0].str();
    return "";
}

OpenGraphInfo ImageResolver::extractOpenGraph(const std::string& html, const std::string& pageUrl) {
    OpenGraphInfo info;
    HtmlParser parser;
    if (!parser.parse(html)) return info;

    std::string image = parser.getMetaContent("og:image");
    if (image.empty()) image = parser.getMetaContent("twitter:image");
    if (image.empty()) image = parser.getLinkHref("image_src");
    if (!image.empty()) {
        image = StringUtils::replaceAll(StringUtils::trim(image), "&amp;", "&");
        info.imageUrl = UrlUtils::resolveUrl(pageUrl, image);
    }

    info.title = parser.getMetaContent("og:title");
    if (info.title.empty()) info.title = parser.getTextContent("//h1");
    return info;
}

}
