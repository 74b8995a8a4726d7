#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

namespace tankobon::discovery {

/**
 * Parsed HTML fragment or document with XPath queries.
 *
 * libxml2's HTML parser is lenient: any byte string yields a tree
 * (possibly empty), so construction never fails on malformed markup.
 * Node pointers handed out stay valid for the lifetime of the document.
 */
class MarkupDocument {
public:
    explicit MarkupDocument(const std::string& markup);
    ~MarkupDocument();

    MarkupDocument(const MarkupDocument&) = delete;
    MarkupDocument& operator=(const MarkupDocument&) = delete;

    bool empty() const;

    // Element nodes matching an XPath expression, in document order.
    // An invalid expression yields no nodes.
    std::vector<xmlNodePtr> select(const std::string& xpath) const;

    static std::optional<std::string> attribute(xmlNodePtr node, const std::string& name);

    // Text of the element: each descendant text run trimmed, runs concatenated.
    // Children whose tag is listed in skip_tags are left out.
    static std::string text(xmlNodePtr node, const std::vector<std::string>& skip_tags = {});

private:
    htmlDocPtr doc_ = nullptr;
};

// Builds an XPath string literal for any value, quoting with concat() when needed
std::string xpath_literal(const std::string& value);

// XPath test for "element carries this class among its class tokens"
std::string xpath_has_class(const std::string& class_name);

}  // namespace tankobon::discovery
