#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace tankobon::util {

// Log sink passed explicitly to every component (no process-wide state).
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    explicit Logger(const std::filesystem::path& file, Level min_level = Level::Info, bool echo = false);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(Level level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    static Level parse_level(const std::string& name, Level fallback = Level::Info);

private:
    mutable std::mutex mutex_;
    std::ofstream file_;  // Kept open for the lifetime of the sink
    Level min_level_;
    bool echo_;
};

}  // namespace tankobon::util
