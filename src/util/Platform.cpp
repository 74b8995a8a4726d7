#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <sys/wait.h>
#include <unistd.h>

namespace tankobon::util {

std::filesystem::path Platform::get_config_directory() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "tankobon";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "tankobon";
    }
    return ".config/tankobon";
}

std::filesystem::path Platform::get_state_directory() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "tankobon";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "state" / "tankobon";
    }
    return "/tmp/tankobon";
}

std::filesystem::path Platform::get_default_log_file() {
    return get_state_directory() / "tankobon.log";
}

bool Platform::is_document_file(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pdf";
}

bool Platform::open_in_viewer(const std::filesystem::path& path, Logger& logger) {
    auto target = std::filesystem::absolute(path).string();

    pid_t pid = fork();
    if (pid < 0) {
        logger.error("Platform: fork failed, cannot open " + target);
        return false;
    }
    if (pid == 0) {
        execlp("xdg-open", "xdg-open", target.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        logger.warn("Platform: xdg-open failed for " + target);
        return false;
    }
    logger.info("Platform: Opened " + target);
    return true;
}

}  // namespace tankobon::util
