#pragma once

#include "discovery/ImageUrlExtractor.hpp"
#include "discovery/RenderingEngine.hpp"
#include "discovery/SourceAdapter.hpp"
#include "model/Book.hpp"
#include "util/Result.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tankobon::util { class Logger; }
namespace tankobon::backend { class ArtifactStore; }

namespace tankobon::discovery {

struct NavigationOptions {
    int attempts = 3;
    std::chrono::milliseconds timeout{15000};
};

// A chapter that reached the Persisted state
struct ChapterOutcome {
    model::Chapter chapter;
    std::filesystem::path url_list;
    size_t image_count = 0;
    std::string strategy;   // Extraction strategy that matched
};

using ChapterResult = util::Result<ChapterOutcome>;

/**
 * Drives the rendering session through the per-chapter discovery cycle:
 * navigate (retrying with a reload on timeout), extract, persist the URL
 * list, return to the chapter list.
 *
 * Chapters are processed strictly one after another on the single session.
 * A chapter failure is reported in its result and never stops the loop;
 * only a lost session (reload impossible) raises RunError.
 */
class NavigationController {
public:
    NavigationController(RenderingEngine& engine, const SourceAdapter& adapter,
                         const backend::ArtifactStore& store, util::Logger& logger,
                         NavigationOptions options = {});

    // landing_url is the chapter-list view to fall back to
    ChapterResult process(const model::Book& book, model::Chapter& chapter, const std::string& landing_url);

    std::vector<ChapterResult> process_all(const model::Book& book, std::vector<model::Chapter>& chapters,
                                           const std::string& landing_url);

    // Chapter views successfully entered so far
    size_t navigations() const { return navigations_; }

private:
    util::Status navigate_to(const model::Chapter& chapter);
    bool in_chapter_view();
    void return_to_list(const std::string& landing_url);
    void recover(const std::string& landing_url);

    RenderingEngine& engine_;
    const SourceAdapter& adapter_;
    const backend::ArtifactStore& store_;
    util::Logger& logger_;
    NavigationOptions options_;
    ImageUrlExtractor extractor_;
    size_t navigations_ = 0;
};

}  // namespace tankobon::discovery
