#include "sitemap.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include "../../core/logger/logger.hpp"
#include "../text/string_utils.hpp"

namespace Sightline {
namespace Utils {

namespace {

class XmlDocGuard {
public:
    explicit XmlDocGuard(xmlDocPtr doc) : doc_(doc) {
    }
    ~XmlDocGuard() {
        if (doc_)
            xmlFreeDoc(doc_);
    }
    XmlDocGuard(const XmlDocGuard&)            = delete;
    XmlDocGuard& operator=(const XmlDocGuard&) = delete;

    xmlDocPtr get() const {
        return doc_;
    }
    explicit operator bool() const {
        return doc_ != nullptr;
    }

private:
    xmlDocPtr doc_;
};

bool is_named(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcasecmp(node->name, BAD_CAST name) == 0;
}

std::string loc_of(xmlNodePtr entry) {
    for (xmlNodePtr child = entry->children; child; child = child->next) {
        if (!is_named(child, "loc"))
            continue;
        xmlChar* content = xmlNodeGetContent(child);
        if (!content)
            return "";
        std::string loc(reinterpret_cast<char*>(content));
        xmlFree(content);
        return Text::trim(loc);
    }
    return "";
}

void collect(xmlNodePtr node, SitemapEntries& entries) {
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE)
            continue;
        if (is_named(cur, "url") || is_named(cur, "sitemap")) {
            std::string loc = loc_of(cur);
            if (!loc.empty())
                (is_named(cur, "url") ? entries.pages : entries.sitemaps).push_back(std::move(loc));
            continue;
        }
        if (cur->children)
            collect(cur->children, entries);
    }
}

}  // namespace

SitemapEntries Sitemap::parse(const std::string& xml) {
    SitemapEntries entries;
    if (Text::is_blank(xml))
        return entries;

    XmlDocGuard doc(xmlReadMemory(xml.data(),
                                  static_cast<int>(xml.size()),
                                  nullptr,
                                  nullptr,
                                  XML_PARSE_RECOVER | XML_PARSE_NOERROR | XML_PARSE_NOWARNING
                                      | XML_PARSE_NONET));
    if (!doc) {
        Core::Logger::debug("Sitemap is not parseable XML");
        return entries;
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (root)
        collect(root, entries);
    return entries;
}

}  // namespace Utils
}  // namespace Sightline
