#include "discovery/MarkupDocument.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <libxml/xpath.h>

namespace tankobon::discovery {

namespace {

struct XPathContextDeleter {
    void operator()(xmlXPathContextPtr p) const { xmlXPathFreeContext(p); }
};

struct XPathObjectDeleter {
    void operator()(xmlXPathObjectPtr p) const { xmlXPathFreeObject(p); }
};

void collect_text(xmlNodePtr node, const std::vector<std::string>& skip_tags, std::string& out) {
    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            if (child->content) {
                out += util::trim_unicode(reinterpret_cast<const char*>(child->content));
            }
        } else if (child->type == XML_ELEMENT_NODE) {
            std::string tag = child->name ? reinterpret_cast<const char*>(child->name) : "";
            if (std::find(skip_tags.begin(), skip_tags.end(), tag) != skip_tags.end()) continue;
            if (tag == "script" || tag == "style") continue;
            collect_text(child, skip_tags, out);
        }
    }
}

}  // namespace

MarkupDocument::MarkupDocument(const std::string& markup) {
    const int options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                        HTML_PARSE_NONET | HTML_PARSE_NOBLANKS;
    doc_ = htmlReadMemory(markup.data(), static_cast<int>(markup.size()), nullptr, "UTF-8", options);
}

MarkupDocument::~MarkupDocument() {
    if (doc_) {
        xmlFreeDoc(doc_);
    }
}

bool MarkupDocument::empty() const {
    return !doc_ || !xmlDocGetRootElement(doc_);
}

std::vector<xmlNodePtr> MarkupDocument::select(const std::string& xpath) const {
    std::vector<xmlNodePtr> nodes;
    if (empty()) return nodes;

    std::unique_ptr<xmlXPathContext, XPathContextDeleter> context(xmlXPathNewContext(doc_));
    if (!context) return nodes;

    std::unique_ptr<xmlXPathObject, XPathObjectDeleter> result(
        xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), context.get()));
    if (!result || result->type != XPATH_NODESET || !result->nodesetval) return nodes;

    const xmlNodeSetPtr set = result->nodesetval;
    for (int i = 0; i < set->nodeNr; ++i) {
        if (set->nodeTab[i] && set->nodeTab[i]->type == XML_ELEMENT_NODE) {
            nodes.push_back(set->nodeTab[i]);
        }
    }
    return nodes;
}

std::optional<std::string> MarkupDocument::attribute(xmlNodePtr node, const std::string& name) {
    if (!node) return std::nullopt;

    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name.c_str()));
    if (!value) return std::nullopt;

    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string MarkupDocument::text(xmlNodePtr node, const std::vector<std::string>& skip_tags) {
    std::string out;
    if (node) {
        collect_text(node, skip_tags, out);
    }
    return out;
}

std::string xpath_literal(const std::string& value) {
    if (value.find('\'') == std::string::npos) {
        return "'" + value + "'";
    }
    if (value.find('"') == std::string::npos) {
        return "\"" + value + "\"";
    }

    // Both quote kinds present: concat('part', "'", 'part', ...)
    std::string out = "concat(";
    size_t start = 0;
    while (true) {
        size_t quote = value.find('\'', start);
        out += "'" + value.substr(start, quote == std::string::npos ? std::string::npos : quote - start) + "'";
        if (quote == std::string::npos) break;
        out += ", \"'\", ";
        start = quote + 1;
    }
    out += ")";
    return out;
}

std::string xpath_has_class(const std::string& class_name) {
    return "contains(concat(' ', normalize-space(@class), ' '), ' " + class_name + " ')";
}

}  // namespace tankobon::discovery
