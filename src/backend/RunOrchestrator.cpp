#include "backend/RunOrchestrator.hpp"
#include "backend/AcquisitionPool.hpp"
#include "backend/IndexPageGenerator.hpp"
#include "discovery/ChapterResolver.hpp"
#include "discovery/NavigationController.hpp"
#include "imaging/DocumentAssembler.hpp"
#include "util/Logger.hpp"
#include <chrono>

namespace fs = std::filesystem;

namespace tankobon::backend {

RunOrchestrator::RunOrchestrator(RunContext& context, discovery::RenderingEngine& engine,
                                 const discovery::SourceAdapter& adapter, const ArtifactStore& store)
    : context_(context), engine_(engine), adapter_(adapter), store_(store) {}

model::Book RunOrchestrator::open_book(const std::string& book_id, const std::string& landing_url) {
    const std::chrono::milliseconds timeout(context_.config.navigation_timeout_ms);

    std::optional<discovery::BookIdentity> identity;
    try {
        engine_.navigate(landing_url);
        engine_.wait_for(adapter_.chapter_list().region_xpath, timeout);
        identity = adapter_.read_identity(engine_.markup(""));
    } catch (const discovery::EngineError& e) {
        throw util::RunError("cannot open book " + book_id + " at " + landing_url + ": " + e.what());
    }
    if (!identity) {
        throw util::RunError("no book identity found at " + landing_url);
    }

    model::Book book;
    book.id = book_id;
    book.title = identity->title;
    book.site_tag = adapter_.site_tag();
    book.state = identity->completed ? model::LifecycleState::Completed : model::LifecycleState::Active;

    context_.logger.info("Run: Opened '" + book.title + "' (" + book.site_tag + " " + book.id + ", " +
                         (identity->completed ? "completed" : "ongoing") + ")");
    return book;
}

void RunOrchestrator::discover(const model::Book& book, const std::string& landing_url, bool overwrite,
                               RunSummary& summary) {
    std::string chapter_markup;
    try {
        chapter_markup = engine_.markup(adapter_.chapter_list().region_xpath);
    } catch (const discovery::EngineError& e) {
        throw util::RunError("cannot read chapter list of " + book.id + ": " + e.what());
    }

    discovery::ChapterResolver resolver(adapter_.chapter_list(), context_.logger);
    summary.chapters_listed = resolver.parse(chapter_markup).size();
    auto pending = resolver.resolve(chapter_markup, store_, book, overwrite);
    summary.chapters_pending = pending.size();

    if (pending.empty()) {
        context_.logger.info("Run: Discovery up to date (" + std::to_string(summary.chapters_listed) + " chapters)");
        return;
    }

    discovery::NavigationOptions nav_options;
    nav_options.attempts = context_.config.navigation_attempts;
    nav_options.timeout = std::chrono::milliseconds(context_.config.navigation_timeout_ms);
    discovery::NavigationController controller(engine_, adapter_, store_, context_.logger, nav_options);

    auto results = controller.process_all(book, pending, landing_url);
    summary.navigations = controller.navigations();

    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i]) {
            ++summary.discovered;
        } else {
            ++summary.discovery_failed;
            summary.skipped.push_back("ch" + std::to_string(pending[i].index) + " " + pending[i].name + ": " +
                                      util::to_string(results[i].error().kind) + ": " + results[i].error().message);
        }
    }
    context_.logger.info("Run: Discovered " + std::to_string(summary.discovered) + "/" +
                         std::to_string(pending.size()) + " chapters");
}

util::Status RunOrchestrator::assemble_chapter(const model::ChapterArtifacts& chapter) {
    const std::string label = "ch" + std::to_string(chapter.index) + " '" + chapter.name + "'";

    auto urls = store_.read_url_list(chapter.url_list);
    if (!urls) {
        return urls.error();
    }
    if (urls.value().empty()) {
        return util::Status::failure(util::ErrorKind::ExtractionEmpty, label + ": empty URL list");
    }

    AcquisitionOptions options;
    options.attempts = context_.config.attempts;
    options.backoff = std::chrono::milliseconds(context_.config.backoff_ms);
    AcquisitionPool pool(context_.fetcher, context_.workers, context_.logger, options);

    auto images = pool.acquire(urls.value(), label);
    if (!images) {
        return images.error();
    }

    auto document = imaging::DocumentAssembler::assemble(images.value());
    if (!document) {
        return document.error();
    }
    auto written = store_.write_document(chapter.document, document.value());
    if (!written) {
        return written.error();
    }

    context_.logger.info("Run: Assembled " + label + " (" + std::to_string(images.value().size()) + " pages)");
    return util::success();
}

bool RunOrchestrator::assemble(const model::Book& book, bool overwrite, RunSummary& summary) {
    bool complete = true;
    for (const auto& chapter : store_.list_chapters(book)) {
        std::error_code ec;
        if (!overwrite && fs::exists(chapter.document, ec)) continue;

        auto status = assemble_chapter(chapter);
        if (status) {
            ++summary.assembled;
        } else {
            complete = false;
            ++summary.assembly_failed;
            summary.skipped.push_back("ch" + std::to_string(chapter.index) + " " + chapter.name + ": " +
                                      util::to_string(status.error().kind) + ": " + status.error().message);
            context_.logger.error("Run: Assembly of ch" + std::to_string(chapter.index) + " '" + chapter.name +
                                  "' skipped: " + status.error().message);
        }
    }
    return complete;
}

RunSummary RunOrchestrator::run(const RunOptions& options) {
    RunSummary summary;
    const std::string landing_url = adapter_.landing_url(options.book_id);

    summary.book = open_book(options.book_id, landing_url);
    const model::Book& book = summary.book;

    if (store_.is_archived(book)) {
        if (book.state != model::LifecycleState::Completed) {
            context_.logger.warn("Run: " + ArtifactStore::book_directory_name(book) +
                                 " is archived but the source lists it as ongoing; leaving it alone");
        } else {
            context_.logger.info("Run: " + ArtifactStore::book_directory_name(book) + " already archived");
        }
        summary.short_circuited = true;
        fs::path archived_index = store_.archived_book_root(book) / store_.document_directory(book).filename() /
                                  IndexPageGenerator::INDEX_FILE;
        std::error_code ec;
        if (fs::exists(archived_index, ec)) summary.index_page = archived_index;
        return summary;
    }

    discover(book, landing_url, options.overwrite, summary);
    const bool documents_complete = assemble(book, options.overwrite, summary);

    const fs::path documents = store_.document_directory(book);
    std::error_code ec;
    if (fs::is_directory(documents, ec)) {
        IndexPageGenerator generator(context_.logger);
        auto index = generator.generate(documents);
        if (index) {
            summary.index_page = index.value();
        } else {
            context_.logger.warn("Run: Index page not written: " + index.error().message);
        }
    }

    if (book.state != model::LifecycleState::Completed) {
        return summary;
    }
    if (!documents_complete || summary.discovery_failed > 0) {
        context_.logger.info("Run: Book is completed but chapters are outstanding; archive deferred");
        return summary;
    }

    if (!fs::exists(store_.book_root(book), ec)) {
        context_.logger.info("Run: Book is completed but nothing was produced; nothing to archive");
        return summary;
    }

    auto archived = store_.archive(book);
    if (!archived) {
        context_.logger.error("Run: Archive failed: " + archived.error().message);
        return summary;
    }
    summary.archived = true;
    if (summary.index_page) {
        summary.index_page = store_.archived_book_root(book) / documents.filename() / IndexPageGenerator::INDEX_FILE;
    }
    return summary;
}

}  // namespace tankobon::backend
