#pragma once

#include <filesystem>
#include <string>

namespace tankobon::util {

class Logger;

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_state_directory();
    static std::filesystem::path get_default_log_file();

    static bool is_document_file(const std::filesystem::path& path);

    // Hands a file to the desktop opener; false if it could not be launched
    static bool open_in_viewer(const std::filesystem::path& path, Logger& logger);
};

}  // namespace tankobon::util
