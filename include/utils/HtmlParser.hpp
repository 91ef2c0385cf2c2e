#pragma once
#include <string>
#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>

namespace FeedLine {

// Recovering libxml2 HTML parse of an article page with XPath lookups
class HtmlParser {
public:
    HtmlParser();
    ~HtmlParser();
    HtmlParser(const HtmlParser&) = delete;
    HtmlParser& operator=(const HtmlParser&) = delete;

    bool parse(const std::string& html);
    std::string getTextContent(const std::string& xpath);
    std::string getAttribute(const std::string& xpath, const std::string& attr);

    // <meta property="key" content=...> or <meta name="key" content=...>
    std::string getMetaContent(const std::string& key);
    // href of the first <link> with the given rel
    std::string getLinkHref(const std::string& rel);

private:
    htmlDocPtr doc_;
    xmlXPathContextPtr xpathCtx_;
    xmlNodePtr firstNode(const std::string& xpath, xmlXPathObjectPtr* holder);
    static std::string nodeToText(xmlNodePtr node);
    void cleanup();
};

}
