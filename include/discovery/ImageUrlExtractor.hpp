#pragma once

#include "discovery/MarkupDocument.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::discovery {

// One way of finding image references in a chapter view.
// collect() returns raw candidates in document order.
struct ExtractionStrategy {
    std::string name;
    std::function<std::vector<std::string>(const MarkupDocument&)> collect;
};

/**
 * Recovers the ordered image references of a rendered chapter view.
 *
 * Strategies are tried in order; the first one that yields at least one
 * usable reference wins. Every candidate is normalized (query stripped,
 * percent-decoded, protocol-relative upgraded to the page scheme, relative
 * resolved against the page URL) and the result is deduplicated keeping
 * first occurrences. No match is an empty result, not an error.
 */
class ImageUrlExtractor {
public:
    ImageUrlExtractor();
    explicit ImageUrlExtractor(std::vector<ExtractionStrategy> chain);

    std::vector<std::string> extract(const std::string& markup, const std::string& base_url,
                                     std::string* matched_strategy = nullptr) const;

    const std::vector<ExtractionStrategy>& chain() const { return chain_; }

    // Reader container <img src>, lazy data-src, <source srcset>, url-encoded data-url
    static std::vector<ExtractionStrategy> default_chain();

    static ExtractionStrategy attribute_strategy(std::string name, std::string xpath, std::string attribute);
    static ExtractionStrategy srcset_strategy(std::string name, std::string xpath);
    static ExtractionStrategy encoded_attribute_strategy(std::string name, std::string xpath, std::string attribute);

    static std::optional<std::string> normalize_url(const std::string& candidate, const std::string& base_url);
    static std::string percent_decode(const std::string& text);

    // Best candidate of a srcset value (largest width/density descriptor)
    static std::optional<std::string> pick_srcset_candidate(const std::string& srcset);

    static std::vector<std::string> deduplicate(const std::vector<std::string>& urls);

private:
    std::vector<ExtractionStrategy> chain_;
};

}  // namespace tankobon::discovery
