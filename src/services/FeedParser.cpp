#include "services/FeedParser.hpp"
#include "services/ImageResolver.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <glib.h>
#include <memory>
#include <cstring>

namespace FeedLine {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

const int kParseOptions = XML_PARSE_NONET | XML_PARSE_NOCDATA | XML_PARSE_NOBLANKS |
                          XML_PARSE_RECOVER | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

bool nameIs(xmlNodePtr node, const char* name) {
    return node && node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, BAD_CAST name) == 0;
}

// Element in the document's default namespace (or none): excludes dc:title, atom:link and friends
bool isPlain(xmlNodePtr node, const char* name) {
    return nameIs(node, name) && (!node->ns || !node->ns->prefix);
}

// Matches by namespace URI, then by prefix; recovering parses keep undeclared
// prefixes inside the node name
bool isQualified(xmlNodePtr node, const char* name, const char* nsUri, const char* prefix) {
    if (!node || node->type != XML_ELEMENT_NODE) return false;
    if (nameIs(node, name) && node->ns) {
        if (node->ns->href && xmlStrcmp(node->ns->href, BAD_CAST nsUri) == 0) return true;
        if (node->ns->prefix && xmlStrcmp(node->ns->prefix, BAD_CAST prefix) == 0) return true;
    }
    std::string qualified = std::string(prefix) + ":" + name;
    return xmlStrcmp(node->name, BAD_CAST qualified.c_str()) == 0;
}

bool isMedia(xmlNodePtr node, const char* name) {
    return isQualified(node, name, FeedParser::kMediaNamespace, "media");
}

std::string textOf(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

std::string attrOf(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, BAD_CAST name);
    if (!value) return "";
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string cleanImageUrl(const std::string& url) {
    return UrlUtils::upgradeProtocolRelative(StringUtils::replaceAll(StringUtils::trim(url), "&amp;", "&"));
}

// Candidate slots in thumbnail priority order
struct ThumbnailSlots {
    std::string enclosure;
    std::string mediaThumbnail;
    std::string mediaContent;
    std::string description;
    std::string atomContent;
    std::string atomSummary;
    std::string contentEncoded;

    std::string best() const {
        if (!enclosure.empty()) return enclosure;
        if (!mediaThumbnail.empty()) return mediaThumbnail;
        if (!mediaContent.empty()) return mediaContent;
        for (const std::string* html : {&description, &atomContent, &atomSummary, &contentEncoded}) {
            if (html->empty()) continue;
            std::string found = ImageResolver::extractFromHtmlSnippet(*html);
            if (!found.empty()) return found;
        }
        return "";
    }
};

bool isImageMediaContent(xmlNodePtr node, const std::string& url) {
    std::string type = attrOf(node, "type");
    if (StringUtils::startsWith(type, "image")) return true;
    if (attrOf(node, "medium") == "image") return true;
    if (ImageResolver::hasImageExtension(url)) return true;
    return url.find("images.wsj.net/im-") != std::string::npos;
}

void collectMedia(xmlNodePtr node, ThumbnailSlots& slots) {
    if (isMedia(node, "thumbnail")) {
        std::string url = attrOf(node, "url");
        if (slots.mediaThumbnail.empty() && !url.empty()) slots.mediaThumbnail = cleanImageUrl(url);
    } else if (isMedia(node, "content")) {
        std::string url = attrOf(node, "url");
        if (slots.mediaContent.empty() && !url.empty() && isImageMediaContent(node, url)) {
            slots.mediaContent = cleanImageUrl(url);
        }
        for (xmlNodePtr c = node->children; c; c = c->next) collectMedia(c, slots);
    } else if (isMedia(node, "group")) {
        for (xmlNodePtr c = node->children; c; c = c->next) collectMedia(c, slots);
    }
}

std::string linkFromAtomLinks(xmlNodePtr item) {
    std::string fallback;
    for (xmlNodePtr c = item->children; c; c = c->next) {
        if (!isPlain(c, "link")) continue;
        std::string href = attrOf(c, "href");
        if (href.empty()) continue;
        std::string rel = attrOf(c, "rel");
        if (rel.empty() || rel == "alternate") return href;
        if (fallback.empty()) fallback = href;
    }
    return fallback;
}

// Returns false when the entry lacks a title element or a link
bool extractItem(xmlNodePtr item, FeedItem& out) {
    bool hasTitle = false;
    std::string linkText;
    ThumbnailSlots slots;

    for (xmlNodePtr c = item->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;
        if (isPlain(c, "title") && !hasTitle) {
            hasTitle = true;
            out.title = StringUtils::trim(textOf(c));
        } else if (isPlain(c, "link") && linkText.empty()) {
            linkText = StringUtils::trim(textOf(c));
        } else if (isPlain(c, "enclosure")) {
            std::string url = attrOf(c, "url");
            std::string type = StringUtils::toLower(attrOf(c, "type"));
            bool image = type.empty() || StringUtils::startsWith(type, "image") ||
                         ImageResolver::hasImageExtension(url);
            if (slots.enclosure.empty() && !url.empty() && image) slots.enclosure = cleanImageUrl(url);
        } else if (isPlain(c, "description")) {
            if (slots.description.empty()) slots.description = textOf(c);
        } else if (isPlain(c, "content")) {
            if (slots.atomContent.empty()) slots.atomContent = textOf(c);
        } else if (isPlain(c, "summary")) {
            if (slots.atomSummary.empty()) slots.atomSummary = textOf(c);
        } else if (isQualified(c, "encoded", FeedParser::kContentNamespace, "content")) {
            if (slots.contentEncoded.empty()) slots.contentEncoded = textOf(c);
        } else {
            collectMedia(c, slots);
        }
    }

    out.link = StringUtils::trim(linkFromAtomLinks(item));
    if (out.link.empty()) out.link = linkText;
    if (!hasTitle || out.link.empty()) return false;
    if (out.title.empty()) out.title = "No title";
    out.thumbnail = slots.best();
    return true;
}

// Channel-level icon: <link rel="icon" href>, <image><url>, or Atom <icon>
void collectFavicon(xmlNodePtr node, std::string& favicon) {
    if (!favicon.empty()) return;
    if (isPlain(node, "image")) {
        for (xmlNodePtr c = node->children; c; c = c->next) {
            if (isPlain(c, "url")) { favicon = StringUtils::trim(textOf(c)); return; }
        }
    } else if (nameIs(node, "link") && attrOf(node, "rel") == "icon") {
        favicon = attrOf(node, "href");
    } else if (isPlain(node, "icon")) {
        favicon = StringUtils::trim(textOf(node));
    }
}

class ItemCollector {
public:
    ItemCollector(ParsedFeed& feed, const FeedParseOptions& options) : feed_(feed), options_(options) {}

    void add(xmlNodePtr node) {
        if (capped_) return;
        FeedItem item;
        if (!extractItem(node, item)) return;
        if (options_.itemCap > 0 && feed_.items.size() >= options_.itemCap) {
            g_debug("item cap reached (%zu) for %s", options_.itemCap, options_.sourceName.c_str());
            capped_ = true;
            return;
        }
        if (options_.cdnEnabled && !item.thumbnail.empty() && ImageResolver::isCdnUrl(item.thumbnail)) {
            std::string before = item.thumbnail;
            item.thumbnail = ImageResolver::normalizeCdnImageUrl(item.thumbnail);
            g_debug("normalized thumbnail %s -> %s", before.c_str(), item.thumbnail.c_str());
        }
        feed_.items.push_back(std::move(item));
    }

private:
    ParsedFeed& feed_;
    const FeedParseOptions& options_;
    bool capped_ = false;
};

}

ParsedFeed FeedParser::parse(const std::string& body, const FeedParseOptions& options) {
    ParsedFeed feed;
    std::string clean = StringUtils::sanitizeUtf8(body);
    if (clean.empty()) {
        g_warning("empty feed document from %s", options.sourceName.c_str());
        return feed;
    }

    XmlDocPtr doc(xmlReadMemory(clean.data(), static_cast<int>(clean.size()), nullptr, "UTF-8", kParseOptions),
                  &xmlFreeDoc);
    if (!doc) {
        g_warning("failed to parse feed from %s", options.sourceName.c_str());
        return feed;
    }
    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) {
        g_warning("feed from %s has no root element", options.sourceName.c_str());
        return feed;
    }

    ItemCollector collector(feed, options);
    if (nameIs(root, "feed")) {
        feed.kind = FeedKind::Atom;
        for (xmlNodePtr c = root->children; c; c = c->next) {
            if (nameIs(c, "entry")) collector.add(c);
            else collectFavicon(c, feed.faviconUrl);
        }
        return feed;
    }

    feed.kind = FeedKind::Rss;
    for (xmlNodePtr ch = root->children; ch; ch = ch->next) {
        if (nameIs(ch, "channel") || nameIs(ch, "feed")) {
            for (xmlNodePtr it = ch->children; it; it = it->next) {
                if (nameIs(it, "item") || nameIs(it, "entry")) collector.add(it);
                else collectFavicon(it, feed.faviconUrl);
            }
        } else if (nameIs(ch, "item")) {
            // RSS 1.0 keeps items beside the channel
            collector.add(ch);
        } else {
            collectFavicon(ch, feed.faviconUrl);
        }
    }
    if (feed.items.empty() && !nameIs(root, "rss") && !nameIs(root, "RDF")) {
        feed.kind = FeedKind::Unknown;
    }
    return feed;
}

}
