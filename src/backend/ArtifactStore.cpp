#include "backend/ArtifactStore.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tankobon::backend {

ArtifactStore::ArtifactStore(fs::path output_root, util::Logger& logger)
    : output_root_(std::move(output_root)), logger_(logger) {}

std::string ArtifactStore::book_directory_name(const model::Book& book) {
    return util::sanitize_path_component(book.title + "_" + book.id);
}

std::string ArtifactStore::chapter_stem(int index, const std::string& name) {
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "ch%04d", index);
    return std::string(prefix) + " - " + util::sanitize_path_component(name);
}

fs::path ArtifactStore::site_root(const model::Book& book) const {
    return output_root_ / util::sanitize_path_component(book.site_tag);
}

fs::path ArtifactStore::completed_root() const {
    return output_root_ / COMPLETED_DIR;
}

fs::path ArtifactStore::book_root(const model::Book& book) const {
    return site_root(book) / book_directory_name(book);
}

fs::path ArtifactStore::archived_book_root(const model::Book& book) const {
    return completed_root() / book_directory_name(book);
}

fs::path ArtifactStore::url_list_directory(const model::Book& book) const {
    return book_root(book) / (book_directory_name(book) + "-images");
}

fs::path ArtifactStore::document_directory(const model::Book& book) const {
    return book_root(book) / (book_directory_name(book) + "-pdf");
}

fs::path ArtifactStore::url_list_path(const model::Book& book, int index, const std::string& name) const {
    return url_list_directory(book) / (chapter_stem(index, name) + " - " + book.site_tag + ".txt");
}

fs::path ArtifactStore::document_path(const model::Book& book, int index, const std::string& name) const {
    return document_directory(book) / (chapter_stem(index, name) + ".pdf");
}

bool ArtifactStore::has_url_list(const model::Book& book, const model::Chapter& chapter) const {
    std::error_code ec;
    return fs::is_regular_file(url_list_path(book, chapter.index, chapter.name), ec);
}

bool ArtifactStore::is_archived(const model::Book& book) const {
    std::error_code ec;
    return fs::is_directory(archived_book_root(book), ec);
}

util::Status ArtifactStore::write_atomically(const fs::path& path, const void* data, size_t size) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return util::Status::failure(util::ErrorKind::ArtifactIO,
                                     "cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path partial = path;
    partial += PARTIAL_SUFFIX;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            return util::Status::failure(util::ErrorKind::ArtifactIO, "cannot open " + partial.string());
        }
        out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(partial, ec);
            return util::Status::failure(util::ErrorKind::ArtifactIO, "short write to " + partial.string());
        }
    }

    fs::rename(partial, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        return util::Status::failure(util::ErrorKind::ArtifactIO,
                                     "cannot rename into " + path.string() + ": " + ec.message());
    }
    return util::success();
}

util::Status ArtifactStore::write_url_list(const model::Book& book, const model::Chapter& chapter,
                                           const std::vector<std::string>& urls) const {
    std::string content;
    for (const auto& url : urls) {
        content += url;
        content += '\n';
    }
    auto path = url_list_path(book, chapter.index, chapter.name);
    auto status = write_atomically(path, content.data(), content.size());
    if (status) {
        logger_.debug("ArtifactStore: Wrote " + std::to_string(urls.size()) + " URLs to " + path.string());
    }
    return status;
}

util::Result<std::vector<std::string>> ArtifactStore::read_url_list(const fs::path& path) const {
    std::ifstream in(path);
    if (!in) {
        return util::Error{util::ErrorKind::ArtifactIO, "cannot read " + path.string()};
    }
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string url = util::trim_unicode(line);
        if (!url.empty()) urls.push_back(std::move(url));
    }
    return urls;
}

util::Status ArtifactStore::write_document(const fs::path& path, const std::vector<uint8_t>& bytes) const {
    auto status = write_atomically(path, bytes.data(), bytes.size());
    if (status) {
        logger_.debug("ArtifactStore: Wrote document " + path.string() + " (" +
                      std::to_string(bytes.size() / 1024) + " KB)");
    }
    return status;
}

std::vector<model::ChapterArtifacts> ArtifactStore::list_chapters(const model::Book& book) const {
    std::vector<model::ChapterArtifacts> chapters;
    const fs::path dir = url_list_directory(book);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return chapters;
    }

    const std::string site_suffix = " - " + book.site_tag;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->path().extension() != ".txt") continue;

        // "chNNNN - <name> - <siteTag>"
        std::string stem = it->path().stem().string();
        if (stem.size() < 3 || stem.compare(0, 2, "ch") != 0) continue;

        size_t digits_end = 2;
        while (digits_end < stem.size() && std::isdigit(static_cast<unsigned char>(stem[digits_end]))) {
            ++digits_end;
        }
        if (digits_end == 2 || stem.compare(digits_end, 3, " - ") != 0) continue;

        model::ChapterArtifacts artifacts;
        try {
            artifacts.index = std::stoi(stem.substr(2, digits_end - 2));
        } catch (const std::exception&) {
            continue;
        }

        std::string name = stem.substr(digits_end + 3);
        if (name.size() > site_suffix.size() &&
            name.compare(name.size() - site_suffix.size(), site_suffix.size(), site_suffix) == 0) {
            name.erase(name.size() - site_suffix.size());
        }
        artifacts.name = name;
        artifacts.url_list = it->path();
        artifacts.document = document_directory(book) / (stem.substr(0, digits_end) + " - " + name + ".pdf");
        chapters.push_back(std::move(artifacts));
    }
    if (ec) {
        logger_.warn("ArtifactStore: Listing " + dir.string() + " stopped early: " + ec.message());
    }

    std::sort(chapters.begin(), chapters.end(), [](const auto& a, const auto& b) {
        return a.index != b.index ? a.index < b.index : a.name < b.name;
    });
    return chapters;
}

util::Status ArtifactStore::archive(const model::Book& book) const {
    const fs::path source = book_root(book);
    const fs::path target = archived_book_root(book);

    std::error_code ec;
    const bool source_exists = fs::exists(source, ec);
    const bool target_exists = fs::exists(target, ec);

    if (!source_exists && target_exists) {
        logger_.info("ArtifactStore: " + book_directory_name(book) + " already archived");
        return util::success();
    }
    if (!source_exists) {
        return util::Status::failure(util::ErrorKind::ArtifactIO, "nothing to archive at " + source.string());
    }
    if (target_exists) {
        return util::Status::failure(util::ErrorKind::ArtifactIO,
                                     "archive target already exists: " + target.string());
    }

    fs::create_directories(completed_root(), ec);
    if (ec) {
        return util::Status::failure(util::ErrorKind::ArtifactIO,
                                     "cannot create " + completed_root().string() + ": " + ec.message());
    }
    fs::rename(source, target, ec);
    if (ec) {
        return util::Status::failure(util::ErrorKind::ArtifactIO,
                                     "cannot move " + source.string() + " to " + target.string() + ": " +
                                     ec.message());
    }

    logger_.info("ArtifactStore: Archived " + source.string() + " -> " + target.string());
    return util::success();
}

}  // namespace tankobon::backend
