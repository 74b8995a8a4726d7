#pragma once

#include "discovery/ImageUrlExtractor.hpp"
#include "model/Book.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::discovery {

struct ChapterListSchema {
    std::string region_xpath;                 // Container holding the chapter list
    std::string entry_xpath;                  // Chapter entries inside that markup
    model::HandleKind handle_kind = model::HandleKind::Href;
    std::vector<std::string> name_skip_tags;  // Child elements excluded from the display name
    model::ChapterOrder order = model::ChapterOrder::ReadingOrder;
};

struct BookIdentity {
    std::string title;
    bool completed = false;
};

// Site-specific knowledge layered over the generic discovery protocol.
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    virtual std::string site_tag() const = 0;
    virtual std::string landing_url(const std::string& book_id) const = 0;

    // Title and lifecycle flag from the landing page markup;
    // nullopt when the page does not look like a book page
    virtual std::optional<BookIdentity> read_identity(const std::string& landing_markup) const = 0;

    virtual const ChapterListSchema& chapter_list() const = 0;

    // Element to activate to open a chapter from the chapter list
    virtual std::string activation_xpath(const model::Chapter& chapter) const = 0;

    // Elements that must exist before the chapter view is considered loaded
    virtual std::vector<std::string> ready_xpaths() const = 0;

    // Element that returns from a chapter view to the chapter list
    virtual std::string back_xpath() const = 0;

    virtual std::vector<ExtractionStrategy> extraction_chain() const = 0;
};

// Declarative description of a source; enough for the sites we know.
struct SourceProfile {
    std::string site_tag;
    std::string landing_url_pattern;   // "{id}" is replaced by the book id
    std::string title_xpath;
    std::string title_attribute;       // Empty: use element text
    std::string default_title;         // Used when the title is missing; empty means required
    std::string status_xpath;
    std::vector<std::string> completed_labels;
    ChapterListSchema chapter_list;
    std::vector<std::string> ready_xpaths;
    std::string back_xpath;
};

class ProfileSourceAdapter : public SourceAdapter {
public:
    explicit ProfileSourceAdapter(SourceProfile profile);

    std::string site_tag() const override { return profile_.site_tag; }
    std::string landing_url(const std::string& book_id) const override;
    std::optional<BookIdentity> read_identity(const std::string& landing_markup) const override;
    const ChapterListSchema& chapter_list() const override { return profile_.chapter_list; }
    std::string activation_xpath(const model::Chapter& chapter) const override;
    std::vector<std::string> ready_xpaths() const override { return profile_.ready_xpaths; }
    std::string back_xpath() const override { return profile_.back_xpath; }
    std::vector<ExtractionStrategy> extraction_chain() const override;

    const SourceProfile& profile() const { return profile_; }

private:
    SourceProfile profile_;
};

SourceProfile eight_comic_profile();
SourceProfile xmanhua_profile();

// "8comic" or "xmanhua"; nullptr for unknown tags
std::unique_ptr<SourceAdapter> make_source_adapter(const std::string& site_tag);

}  // namespace tankobon::discovery
