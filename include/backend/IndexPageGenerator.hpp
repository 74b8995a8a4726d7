#pragma once

#include "util/Result.hpp"
#include <filesystem>
#include <string>

namespace tankobon::util { class Logger; }

namespace tankobon::backend {

// Browsable index.html for a documents directory
class IndexPageGenerator {
public:
    static constexpr const char* INDEX_FILE = "index.html";

    explicit IndexPageGenerator(util::Logger& logger);

    // Lists every document in the directory (by name) with page count,
    // size and modification time; returns the written index path
    util::Result<std::filesystem::path> generate(const std::filesystem::path& documents_dir) const;

    static std::string escape_html(const std::string& text);
    static std::string encode_href(const std::string& file_name);

private:
    util::Logger& logger_;
};

}  // namespace tankobon::backend
