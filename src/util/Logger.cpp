#include "util/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <string_view>

namespace tankobon::util {

Logger::Logger(const std::filesystem::path& file, Level min_level, bool echo)
    : min_level_(min_level), echo_(echo) {
    if (file.empty()) return;

    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
    }
    file_.open(file, std::ios::app);
    if (!file_ && echo_) {
        std::cerr << "Logger: cannot open " << file.string() << ", logging to stderr only" << std::endl;
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    if (file_) {
        file_ << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ") << level_str << message << '\n';
        file_.flush();
    }
    if (echo_) {
        std::cerr << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << std::endl;
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name, Level fallback) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return fallback;
}

}  // namespace tankobon::util
