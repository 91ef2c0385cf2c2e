#include "utils/HtmlParser.hpp"
#include <libxml/parser.h>

namespace FeedLine {

// xmlInitParser is idempotent; xmlCleanupParser is left to process exit because
// other workers may still be parsing
HtmlParser::HtmlParser() : doc_(nullptr), xpathCtx_(nullptr) { xmlInitParser(); }
HtmlParser::~HtmlParser() { cleanup(); }

void HtmlParser::cleanup() {
    if (xpathCtx_) { xmlXPathFreeContext(xpathCtx_); xpathCtx_ = nullptr; }
    if (doc_) { xmlFreeDoc(doc_); doc_ = nullptr; }
}

bool HtmlParser::parse(const std::string& html) {
    cleanup();
    if (html.empty()) return false;
    doc_ = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
                          HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!doc_) return false;
    xpathCtx_ = xmlXPathNewContext(doc_);
    return xpathCtx_ != nullptr;
}

std::string HtmlParser::nodeToText(xmlNodePtr node) {
    if (!node) return "";
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    size_t start = result.find_first_not_of(" \t\n\r");
    size_t end = result.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : result.substr(start, end - start + 1);
}

// Caller frees *holder with xmlXPathFreeObject when it is non-null
xmlNodePtr HtmlParser::firstNode(const std::string& xpath, xmlXPathObjectPtr* holder) {
    *holder = nullptr;
    if (!xpathCtx_) return nullptr;
    *holder = xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), xpathCtx_);
    if (!*holder || !(*holder)->nodesetval || (*holder)->nodesetval->nodeNr == 0) return nullptr;
    return (*holder)->nodesetval->nodeTab[0];
}

std::string HtmlParser::getTextContent(const std::string& xpath) {
    xmlXPathObjectPtr result = nullptr;
    std::string text = nodeToText(firstNode(xpath, &result));
    if (result) xmlXPathFreeObject(result);
    return text;
}

std::string HtmlParser::getAttribute(const std::string& xpath, const std::string& attr) {
    xmlXPathObjectPtr result = nullptr;
    xmlNodePtr node = firstNode(xpath, &result);
    std::string value;
    if (node) {
        xmlChar* attrVal = xmlGetProp(node, reinterpret_cast<const xmlChar*>(attr.c_str()));
        if (attrVal) { value = reinterpret_cast<char*>(attrVal); xmlFree(attrVal); }
    }
    if (result) xmlXPathFreeObject(result);
    return value;
}

std::string HtmlParser::getMetaContent(const std::string& key) {
    std::string value = getAttribute("//meta[@property='" + key + "']", "content");
    if (value.empty()) value = getAttribute("//meta[@name='" + key + "']", "content");
    return value;
}

std::string HtmlParser::getLinkHref(const std::string& rel) {
    return getAttribute("//link[@rel='" + rel + "']", "href");
}

}
