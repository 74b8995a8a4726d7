#include "discovery/NavigationController.hpp"
#include "backend/ArtifactStore.hpp"
#include "util/Logger.hpp"

namespace tankobon::discovery {

namespace {

std::string describe(const model::Chapter& chapter) {
    return "ch" + std::to_string(chapter.index) + " '" + chapter.name + "'";
}

}  // namespace

NavigationController::NavigationController(RenderingEngine& engine, const SourceAdapter& adapter,
                                           const backend::ArtifactStore& store, util::Logger& logger,
                                           NavigationOptions options)
    : engine_(engine),
      adapter_(adapter),
      store_(store),
      logger_(logger),
      options_(options),
      extractor_(adapter.extraction_chain()) {}

bool NavigationController::in_chapter_view() {
    const auto ready = adapter_.ready_xpaths();
    if (ready.empty()) return false;
    for (const auto& xpath : ready) {
        if (engine_.query(xpath, std::chrono::milliseconds(0)).empty()) return false;
    }
    return true;
}

util::Status NavigationController::navigate_to(const model::Chapter& chapter) {
    const std::string activation = adapter_.activation_xpath(chapter);
    std::string last_error;

    for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
        try {
            if (attempt > 1) {
                engine_.reload();
            }

            auto elements = engine_.query(activation, options_.timeout);
            if (!elements.empty()) {
                engine_.click(elements.front());
            } else if (!in_chapter_view()) {
                // The previous attempt may have landed before the reload
                throw EngineError("activation element not found: " + activation, true);
            }

            for (const auto& xpath : adapter_.ready_xpaths()) {
                engine_.wait_for(xpath, options_.timeout);
            }
            return util::success();
        } catch (const EngineError& e) {
            last_error = e.what();
            logger_.warn("Navigation: " + describe(chapter) + " attempt " + std::to_string(attempt) + "/" +
                         std::to_string(options_.attempts) + (e.is_timeout() ? " timed out: " : " failed: ") +
                         last_error);
        }
    }
    return util::Status::failure(util::ErrorKind::NavigationTimeout,
                                 describe(chapter) + " not reached after " + std::to_string(options_.attempts) +
                                 " attempts: " + last_error);
}

void NavigationController::return_to_list(const std::string& landing_url) {
    const auto& region = adapter_.chapter_list().region_xpath;
    try {
        auto back = engine_.query(adapter_.back_xpath(), options_.timeout);
        if (back.empty()) {
            throw EngineError("back link not found", true);
        }
        engine_.click(back.front());
        engine_.wait_for(region, options_.timeout);
        return;
    } catch (const EngineError& e) {
        logger_.warn("Navigation: Return to chapter list failed (" + std::string(e.what()) +
                     "), reopening " + landing_url);
    }
    recover(landing_url);
}

void NavigationController::recover(const std::string& landing_url) {
    try {
        engine_.navigate(landing_url);
        engine_.wait_for(adapter_.chapter_list().region_xpath, options_.timeout);
    } catch (const EngineError& e) {
        if (!e.is_timeout()) {
            throw util::RunError("rendering session lost: " + std::string(e.what()));
        }
        // The next chapter starts with its own navigation and retries
        logger_.warn("Navigation: Chapter list did not reload: " + std::string(e.what()));
    }
}

ChapterResult NavigationController::process(const model::Book& book, model::Chapter& chapter,
                                            const std::string& landing_url) {
    logger_.info("Navigation: Opening " + describe(chapter));

    // Navigating
    auto navigated = navigate_to(chapter);
    if (!navigated) {
        chapter.status = model::DiscoveryStatus::Failed;
        logger_.error("Navigation: " + navigated.error().message);
        recover(landing_url);
        return navigated.error();
    }
    ++navigations_;

    // Extracting
    ChapterOutcome outcome;
    std::vector<std::string> urls;
    try {
        const std::string base_url = engine_.current_url();
        urls = extractor_.extract(engine_.markup(""), base_url, &outcome.strategy);
    } catch (const EngineError& e) {
        chapter.status = model::DiscoveryStatus::Failed;
        logger_.error("Navigation: Could not read " + describe(chapter) + ": " + e.what());
        return_to_list(landing_url);
        return util::Error{util::ErrorKind::ExtractionEmpty, describe(chapter) + ": " + e.what()};
    }

    if (urls.empty()) {
        chapter.status = model::DiscoveryStatus::Failed;
        logger_.error("Navigation: No images found in " + describe(chapter));
        return_to_list(landing_url);
        return util::Error{util::ErrorKind::ExtractionEmpty, describe(chapter) + ": no image references"};
    }

    // Persisted
    auto written = store_.write_url_list(book, chapter, urls);
    if (!written) {
        chapter.status = model::DiscoveryStatus::Failed;
        logger_.error("Navigation: Could not persist " + describe(chapter) + ": " + written.error().message);
        return_to_list(landing_url);
        return written.error();
    }

    chapter.status = model::DiscoveryStatus::Discovered;
    outcome.chapter = chapter;
    outcome.url_list = store_.url_list_path(book, chapter.index, chapter.name);
    outcome.image_count = urls.size();
    logger_.info("Navigation: " + describe(chapter) + " has " + std::to_string(urls.size()) + " images (" +
                 outcome.strategy + ")");

    return_to_list(landing_url);
    return outcome;
}

std::vector<ChapterResult> NavigationController::process_all(const model::Book& book,
                                                             std::vector<model::Chapter>& chapters,
                                                             const std::string& landing_url) {
    std::vector<ChapterResult> results;
    results.reserve(chapters.size());
    for (auto& chapter : chapters) {
        results.push_back(process(book, chapter, landing_url));
    }
    return results;
}

}  // namespace tankobon::discovery
