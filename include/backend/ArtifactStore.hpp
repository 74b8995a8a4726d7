#pragma once

#include "model/Book.hpp"
#include "util/Result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tankobon::util { class Logger; }

namespace tankobon::backend {

/**
 * Filesystem layout of everything a run persists.
 *
 *   <out>/<siteTag>/<bookDir>/<bookDir>-images/chNNNN - <name> - <siteTag>.txt
 *   <out>/<siteTag>/<bookDir>/<bookDir>-pdf/chNNNN - <name>.pdf
 *   <out>/completed/<bookDir>/...   (same tree once archived)
 *
 * bookDir is the sanitized "<title>_<id>". Every file write goes through a
 * ".part" sibling and a rename, so a crash never leaves a partial artifact
 * under its final name.
 */
class ArtifactStore {
public:
    static constexpr const char* COMPLETED_DIR = "completed";
    static constexpr const char* PARTIAL_SUFFIX = ".part";

    ArtifactStore(std::filesystem::path output_root, util::Logger& logger);

    static std::string book_directory_name(const model::Book& book);
    static std::string chapter_stem(int index, const std::string& name);

    std::filesystem::path site_root(const model::Book& book) const;
    std::filesystem::path completed_root() const;
    std::filesystem::path book_root(const model::Book& book) const;
    std::filesystem::path archived_book_root(const model::Book& book) const;
    std::filesystem::path url_list_directory(const model::Book& book) const;
    std::filesystem::path document_directory(const model::Book& book) const;

    std::filesystem::path url_list_path(const model::Book& book, int index, const std::string& name) const;
    std::filesystem::path document_path(const model::Book& book, int index, const std::string& name) const;

    bool has_url_list(const model::Book& book, const model::Chapter& chapter) const;
    bool is_archived(const model::Book& book) const;

    // One URL per line, in page order
    util::Status write_url_list(const model::Book& book, const model::Chapter& chapter,
                                const std::vector<std::string>& urls) const;
    util::Result<std::vector<std::string>> read_url_list(const std::filesystem::path& path) const;

    util::Status write_document(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) const;

    // Every chapter that has a URL list, ordered by index, with the
    // matching document path (which may not exist yet)
    std::vector<model::ChapterArtifacts> list_chapters(const model::Book& book) const;

    // Moves the book tree under the completed root in one rename.
    // Succeeds without change when the book is already archived.
    util::Status archive(const model::Book& book) const;

    static util::Status write_atomically(const std::filesystem::path& path, const void* data, size_t size);

private:
    std::filesystem::path output_root_;
    util::Logger& logger_;
};

}  // namespace tankobon::backend
