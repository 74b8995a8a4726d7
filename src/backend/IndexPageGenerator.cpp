#include "backend/IndexPageGenerator.hpp"
#include "backend/ArtifactStore.hpp"
#include "imaging/DocumentAssembler.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace tankobon::backend {

namespace {

struct DocumentEntry {
    std::string file_name;
    std::string title;
    int pages = 0;
    uintmax_t size = 0;
    std::string modified;
};

std::string format_time(std::time_t t) {
    char buffer[64];
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::strftime(buffer, sizeof(buffer), "%a %b %d %H:%M:%S %Y", &tm_buf);
    return buffer;
}

std::string format_kb(uintmax_t bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    return buffer;
}

const char* PAGE_STYLE = R"(        body { font-family: Arial, sans-serif; margin: 2rem; background-color: #f5f5f5; }
        .header { text-align: center; margin-bottom: 2rem; color: #2c3e50; }
        .doc-list { max-width: 800px; margin: 0 auto; background: white; padding: 2rem;
                    border-radius: 10px; box-shadow: 0 2px 5px rgba(0,0,0,0.1); }
        .doc-item { padding: 1rem; border-bottom: 1px solid #eee; display: flex;
                    justify-content: space-between; align-items: center; }
        .doc-item:hover { background-color: #f9f9f9; }
        .doc-info { color: #666; font-size: 0.9rem; }
        a { color: #2980b9; text-decoration: none; font-weight: bold; }
        a:hover { color: #3498db; }
        .stats { text-align: center; margin-bottom: 1.5rem; color: #7f8c8d; }
)";

}  // namespace

IndexPageGenerator::IndexPageGenerator(util::Logger& logger) : logger_(logger) {}

std::string IndexPageGenerator::escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string IndexPageGenerator::encode_href(const std::string& file_name) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : file_name) {
        if (c <= 0x20 || c == '%' || c == '#' || c == '?' || c == '"' || c == '<' || c == '>' || c == '&' ||
            c == '\'') {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

util::Result<fs::path> IndexPageGenerator::generate(const fs::path& documents_dir) const {
    std::error_code ec;
    if (!fs::is_directory(documents_dir, ec)) {
        return util::Error{util::ErrorKind::ArtifactIO, "not a directory: " + documents_dir.string()};
    }

    std::vector<DocumentEntry> entries;
    for (fs::directory_iterator it(documents_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || !util::Platform::is_document_file(it->path())) continue;

        std::ifstream in(it->path(), std::ios::binary);
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (!in && !in.eof()) {
            logger_.warn("IndexPage: Cannot read " + it->path().string());
            continue;
        }

        DocumentEntry entry;
        entry.file_name = it->path().filename().string();
        entry.title = it->path().stem().string();
        auto pages = imaging::DocumentAssembler::count_pages(bytes);
        if (pages) {
            entry.pages = pages.value();
        } else {
            logger_.warn("IndexPage: " + entry.file_name + ": " + pages.error().message);
        }
        entry.size = bytes.size();

        auto mtime = fs::last_write_time(it->path(), ec);
        if (!ec) {
            auto system_time = std::chrono::file_clock::to_sys(mtime);
            entry.modified = format_time(std::chrono::system_clock::to_time_t(
                std::chrono::time_point_cast<std::chrono::system_clock::duration>(system_time)));
        }
        ec.clear();
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return util::Error{util::ErrorKind::ArtifactIO, "cannot list " + documents_dir.string() + ": " + ec.message()};
    }

    std::sort(entries.begin(), entries.end(),
              [](const DocumentEntry& a, const DocumentEntry& b) { return a.file_name < b.file_name; });

    const std::string folder = escape_html(documents_dir.filename().string());
    std::string html;
    html += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
    html += "    <meta charset=\"UTF-8\">\n";
    html += "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n";
    html += "    <title>Document Index - " + folder + "</title>\n";
    html += "    <style>\n";
    html += PAGE_STYLE;
    html += "    </style>\n</head>\n<body>\n";
    html += "    <div class=\"header\">\n";
    html += "        <h1>" + folder + "</h1>\n";
    html += "        <div class=\"stats\">Total documents: " + std::to_string(entries.size()) +
            " | Last updated: " + format_time(std::time(nullptr)) + "</div>\n";
    html += "    </div>\n";
    html += "    <div class=\"doc-list\">\n";
    for (const auto& entry : entries) {
        html += "        <div class=\"doc-item\"><a href=\"" + encode_href(entry.file_name) + "\" target=\"_blank\">" +
                escape_html(entry.title) + "</a><div class=\"doc-info\">Pages: " + std::to_string(entry.pages) +
                " | Size: " + format_kb(entry.size) + " | Modified: " + entry.modified + "</div></div>\n";
    }
    html += "    </div>\n</body>\n</html>\n";

    const fs::path index = documents_dir / INDEX_FILE;
    auto written = ArtifactStore::write_atomically(index, html.data(), html.size());
    if (!written) {
        return written.error();
    }

    logger_.info("IndexPage: Listed " + std::to_string(entries.size()) + " documents in " + index.string());
    return index;
}

}  // namespace tankobon::backend
