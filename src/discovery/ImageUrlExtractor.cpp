#include "discovery/ImageUrlExtractor.hpp"
#include "util/UnicodeUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <memory>
#include <unordered_set>
#include <utility>
#include <curl/curl.h>

namespace tankobon::discovery {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};

struct CurlStringDeleter {
    void operator()(char* p) const { curl_free(p); }
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool has_scheme(const std::string& url) {
    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    for (size_t i = 0; i < colon; ++i) {
        char c = url[i];
        bool valid = std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        if (!valid) return false;
    }
    return std::isalpha(static_cast<unsigned char>(url[0])) != 0;
}

std::string scheme_of(const std::string& url) {
    if (!has_scheme(url)) return "https";
    std::string scheme = url.substr(0, url.find(':'));
    for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return scheme;
}

std::optional<std::string> resolve_relative(const std::string& base_url, const std::string& reference) {
    std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
    if (!handle) return std::nullopt;

    const unsigned int flags = CURLU_ALLOW_SPACE | CURLU_NON_SUPPORT_SCHEME;
    if (curl_url_set(handle.get(), CURLUPART_URL, base_url.c_str(), flags) != CURLUE_OK) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, reference.c_str(), flags) != CURLUE_OK) {
        return std::nullopt;
    }

    char* raw = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_URL, &raw, 0) != CURLUE_OK || !raw) {
        return std::nullopt;
    }
    std::unique_ptr<char, CurlStringDeleter> resolved(raw);
    return std::string(resolved.get());
}

}  // namespace

ImageUrlExtractor::ImageUrlExtractor() : chain_(default_chain()) {}

ImageUrlExtractor::ImageUrlExtractor(std::vector<ExtractionStrategy> chain) : chain_(std::move(chain)) {}

std::vector<std::string> ImageUrlExtractor::extract(const std::string& markup, const std::string& base_url,
                                                    std::string* matched_strategy) const {
    MarkupDocument document(markup);
    if (document.empty()) return {};

    for (const auto& strategy : chain_) {
        std::vector<std::string> urls;
        for (const auto& candidate : strategy.collect(document)) {
            if (auto url = normalize_url(candidate, base_url)) {
                urls.push_back(std::move(*url));
            }
        }
        if (!urls.empty()) {
            if (matched_strategy) *matched_strategy = strategy.name;
            return deduplicate(urls);
        }
    }
    return {};
}

std::vector<ExtractionStrategy> ImageUrlExtractor::default_chain() {
    return {
        attribute_strategy("reader-img-src", "//div[@id='comics-pics']//img[@src]", "src"),
        attribute_strategy("lazy-data-src", "//img[@data-src]", "data-src"),
        srcset_strategy("source-srcset", "//source[@srcset]"),
        encoded_attribute_strategy("encoded-data-url", "//*[@data-url]", "data-url"),
    };
}

ExtractionStrategy ImageUrlExtractor::attribute_strategy(std::string name, std::string xpath, std::string attribute) {
    return {std::move(name), [xpath = std::move(xpath), attribute = std::move(attribute)](const MarkupDocument& doc) {
        std::vector<std::string> out;
        for (xmlNodePtr node : doc.select(xpath)) {
            if (auto value = MarkupDocument::attribute(node, attribute); value && !value->empty()) {
                out.push_back(*value);
            }
        }
        return out;
    }};
}

ExtractionStrategy ImageUrlExtractor::srcset_strategy(std::string name, std::string xpath) {
    return {std::move(name), [xpath = std::move(xpath)](const MarkupDocument& doc) {
        std::vector<std::string> out;
        for (xmlNodePtr node : doc.select(xpath)) {
            auto value = MarkupDocument::attribute(node, "srcset");
            if (!value) continue;
            if (auto candidate = pick_srcset_candidate(*value)) {
                out.push_back(*candidate);
            }
        }
        return out;
    }};
}

ExtractionStrategy ImageUrlExtractor::encoded_attribute_strategy(std::string name, std::string xpath,
                                                                 std::string attribute) {
    return {std::move(name), [xpath = std::move(xpath), attribute = std::move(attribute)](const MarkupDocument& doc) {
        std::vector<std::string> out;
        for (xmlNodePtr node : doc.select(xpath)) {
            if (auto value = MarkupDocument::attribute(node, attribute); value && !value->empty()) {
                // Attribute holds an escaped URL; the common normalization decodes a second layer
                out.push_back(percent_decode(*value));
            }
        }
        return out;
    }};
}

std::optional<std::string> ImageUrlExtractor::normalize_url(const std::string& candidate, const std::string& base_url) {
    std::string url = util::trim_unicode(candidate);
    if (url.empty()) return std::nullopt;

    // Inline placeholders are not fetchable pages
    if (url.rfind("data:", 0) == 0 || url.rfind("javascript:", 0) == 0) return std::nullopt;

    url = url.substr(0, url.find('?'));
    url = percent_decode(url);
    if (url.empty()) return std::nullopt;

    if (url.rfind("//", 0) == 0) {
        return scheme_of(base_url) + ":" + url;
    }
    if (has_scheme(url)) {
        return url;
    }
    return resolve_relative(base_url, url);
}

std::string ImageUrlExtractor::percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

std::optional<std::string> ImageUrlExtractor::pick_srcset_candidate(const std::string& srcset) {
    std::optional<std::string> best;
    double best_score = -1.0;

    size_t pos = 0;
    while (pos < srcset.size()) {
        size_t comma = srcset.find(',', pos);
        std::string part = util::trim_unicode(srcset.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
        pos = comma == std::string::npos ? srcset.size() : comma + 1;
        if (part.empty()) continue;

        size_t space = part.find_first_of(" \t\n");
        std::string url = part.substr(0, space);
        std::string descriptor = space == std::string::npos ? "" : util::trim_unicode(part.substr(space));

        // "800w" / "2x"; a bare URL counts as 1x
        double score = 1.0;
        if (!descriptor.empty()) {
            char* end = nullptr;
            double value = std::strtod(descriptor.c_str(), &end);
            if (end != descriptor.c_str()) score = value;
        }
        if (score > best_score) {
            best_score = score;
            best = url;
        }
    }
    return best;
}

std::vector<std::string> ImageUrlExtractor::deduplicate(const std::vector<std::string>& urls) {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& url : urls) {
        if (seen.insert(url).second) {
            unique.push_back(url);
        }
    }
    return unique;
}

}  // namespace tankobon::discovery
