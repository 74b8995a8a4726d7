#include "discovery/SourceAdapter.hpp"
#include "discovery/MarkupDocument.hpp"
#include "util/UnicodeUtils.hpp"

namespace tankobon::discovery {

ProfileSourceAdapter::ProfileSourceAdapter(SourceProfile profile) : profile_(std::move(profile)) {}

std::string ProfileSourceAdapter::landing_url(const std::string& book_id) const {
    std::string url = profile_.landing_url_pattern;
    const std::string token = "{id}";
    for (auto pos = url.find(token); pos != std::string::npos; pos = url.find(token, pos + book_id.size())) {
        url.replace(pos, token.size(), book_id);
    }
    return url;
}

std::optional<BookIdentity> ProfileSourceAdapter::read_identity(const std::string& landing_markup) const {
    MarkupDocument document(landing_markup);

    BookIdentity identity;
    auto title_nodes = document.select(profile_.title_xpath);
    if (!title_nodes.empty()) {
        if (profile_.title_attribute.empty()) {
            identity.title = MarkupDocument::text(title_nodes.front());
        } else {
            identity.title = util::trim_unicode(
                MarkupDocument::attribute(title_nodes.front(), profile_.title_attribute).value_or(""));
        }
    }
    if (identity.title.empty()) {
        if (profile_.default_title.empty()) return std::nullopt;
        identity.title = profile_.default_title;
    }

    if (!profile_.status_xpath.empty()) {
        for (xmlNodePtr node : document.select(profile_.status_xpath)) {
            const std::string status = MarkupDocument::text(node);
            for (const auto& label : profile_.completed_labels) {
                if (status.find(label) != std::string::npos) {
                    identity.completed = true;
                }
            }
        }
    }
    return identity;
}

std::string ProfileSourceAdapter::activation_xpath(const model::Chapter& chapter) const {
    const char* attribute = chapter.handle_kind == model::HandleKind::ElementId ? "@id" : "@href";
    return "//a[" + std::string(attribute) + "=" + xpath_literal(chapter.handle) + "]";
}

std::vector<ExtractionStrategy> ProfileSourceAdapter::extraction_chain() const {
    return ImageUrlExtractor::default_chain();
}

SourceProfile eight_comic_profile() {
    SourceProfile p;
    p.site_tag = "8comic";
    p.landing_url_pattern = "https://www.8comic.com/html/{id}.html";
    p.title_xpath = "//meta[@name='name']";
    p.title_attribute = "content";
    p.default_title = "Unknown Comic";
    p.status_xpath = "//*[" + xpath_has_class("item-info") + "]";
    p.completed_labels = {"完結", "完结"};
    p.chapter_list.region_xpath = "//div[@id='chapters']";
    p.chapter_list.entry_xpath = "//a";
    p.chapter_list.handle_kind = model::HandleKind::ElementId;
    p.chapter_list.order = model::ChapterOrder::ReadingOrder;
    p.ready_xpaths = {
        "//div[" + xpath_has_class("comics-end") + "]",
        "//div[@id='comics-pics']//img",
    };
    p.back_xpath = "//a[" + xpath_has_class("view-back") + "]";
    return p;
}

SourceProfile xmanhua_profile() {
    SourceProfile p;
    p.site_tag = "xmanhua";
    p.landing_url_pattern = "https://www.xmanhua.com/{id}/";
    p.title_xpath = "//p[" + xpath_has_class("detail-info-title") + "]";
    p.status_xpath = "//p[" + xpath_has_class("detail-info-tip") + "]";
    p.completed_labels = {"已完結", "已完结"};
    p.chapter_list.region_xpath = "//body";
    p.chapter_list.entry_xpath = "//a[" + xpath_has_class("detail-list-form-item") + "]";
    p.chapter_list.handle_kind = model::HandleKind::Href;
    p.chapter_list.name_skip_tags = {"span"};
    p.chapter_list.order = model::ChapterOrder::NewestFirst;
    p.back_xpath = "//a[" + xpath_has_class("view-back") + "]";
    return p;
}

std::unique_ptr<SourceAdapter> make_source_adapter(const std::string& site_tag) {
    if (site_tag == "8comic") {
        return std::make_unique<ProfileSourceAdapter>(eight_comic_profile());
    }
    if (site_tag == "xmanhua") {
        return std::make_unique<ProfileSourceAdapter>(xmanhua_profile());
    }
    return nullptr;
}

}  // namespace tankobon::discovery
