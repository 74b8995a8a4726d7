#pragma once

#include "backend/ArtifactStore.hpp"
#include "backend/RunContext.hpp"
#include "discovery/RenderingEngine.hpp"
#include "discovery/SourceAdapter.hpp"
#include "model/Book.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tankobon::backend {

struct RunOptions {
    std::string book_id;
    bool overwrite = false;
};

struct RunSummary {
    model::Book book;
    bool short_circuited = false;     // Already archived, nothing done
    size_t chapters_listed = 0;       // Chapters on the source page
    size_t chapters_pending = 0;      // Left after the resumability filter
    size_t discovered = 0;
    size_t discovery_failed = 0;
    size_t navigations = 0;
    size_t assembled = 0;
    size_t assembly_failed = 0;
    bool archived = false;
    std::optional<std::filesystem::path> index_page;
    std::vector<std::string> skipped;  // One line per chapter left behind
};

/**
 * One pass over one book: open it, discover pending chapters, assemble
 * missing documents, then archive the book if the source says it is
 * finished and nothing is outstanding.
 *
 * Throws util::RunError when the book cannot be opened or its chapter list
 * cannot be read; nothing is archived in that case and the run can simply
 * be repeated.
 */
class RunOrchestrator {
public:
    RunOrchestrator(RunContext& context, discovery::RenderingEngine& engine,
                    const discovery::SourceAdapter& adapter, const ArtifactStore& store);

    RunSummary run(const RunOptions& options);

private:
    model::Book open_book(const std::string& book_id, const std::string& landing_url);
    void discover(const model::Book& book, const std::string& landing_url, bool overwrite, RunSummary& summary);
    bool assemble(const model::Book& book, bool overwrite, RunSummary& summary);
    util::Status assemble_chapter(const model::ChapterArtifacts& chapter);

    RunContext& context_;
    discovery::RenderingEngine& engine_;
    const discovery::SourceAdapter& adapter_;
    const ArtifactStore& store_;
};

}  // namespace tankobon::backend
