#include "discovery/ChapterResolver.hpp"
#include "backend/ArtifactStore.hpp"
#include "discovery/MarkupDocument.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <unordered_set>

namespace tankobon::discovery {

ChapterResolver::ChapterResolver(ChapterListSchema schema, util::Logger& logger)
    : schema_(std::move(schema)), logger_(logger) {}

std::vector<model::Chapter> ChapterResolver::parse(const std::string& markup) const {
    std::vector<model::Chapter> chapters;
    MarkupDocument document(markup);
    if (document.empty()) {
        return chapters;
    }

    // Every enumerated entry takes a position, even one without a handle,
    // so indices match the site's own list
    std::vector<xmlNodePtr> entries = document.select(schema_.entry_xpath);
    if (schema_.order == model::ChapterOrder::NewestFirst) {
        std::reverse(entries.begin(), entries.end());
    }

    const char* handle_attribute = schema_.handle_kind == model::HandleKind::ElementId ? "id" : "href";
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < entries.size(); ++i) {
        auto handle = MarkupDocument::attribute(entries[i], handle_attribute);
        if (!handle) continue;
        std::string trimmed = util::trim_unicode(*handle);
        if (trimmed.empty()) continue;
        if (!seen.insert(trimmed).second) {
            logger_.debug("ChapterResolver: Dropping repeated entry " + trimmed);
            continue;
        }

        model::Chapter chapter;
        chapter.index = static_cast<int>(i) + 1;
        chapter.handle = std::move(trimmed);
        chapter.handle_kind = schema_.handle_kind;
        chapter.name = util::sanitize_path_component(MarkupDocument::text(entries[i], schema_.name_skip_tags));
        chapters.push_back(std::move(chapter));
    }
    return chapters;
}

std::vector<model::Chapter> ChapterResolver::resolve(const std::string& markup, const backend::ArtifactStore& store,
                                                     const model::Book& book, bool overwrite) const {
    auto all = parse(markup);
    if (overwrite) {
        logger_.info("ChapterResolver: " + std::to_string(all.size()) + " chapters (overwrite)");
        return all;
    }

    std::vector<model::Chapter> pending;
    for (auto& chapter : all) {
        if (store.has_url_list(book, chapter)) {
            logger_.debug("ChapterResolver: Skipping ch" + std::to_string(chapter.index) + " " + chapter.name +
                          " (already discovered)");
            continue;
        }
        pending.push_back(std::move(chapter));
    }
    logger_.info("ChapterResolver: " + std::to_string(pending.size()) + " of " + std::to_string(all.size()) +
                 " chapters pending");
    return pending;
}

}  // namespace tankobon::discovery
