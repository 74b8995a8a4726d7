#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tankobon::backend {

struct Config {
    // Paths
    std::filesystem::path output_root;   // Empty: current directory
    std::filesystem::path log_file;      // Empty: platform state directory

    // Logging
    std::string log_level = "info";
    bool log_echo = true;

    // Network (transport-level retry layer)
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0 Safari/537.36";
    int connect_timeout_s = 10;
    int request_timeout_s = 20;
    int max_connections = 20;
    int transport_retries = 5;
    int transport_backoff_ms = 1000;

    // Acquisition (per-URL retry layer)
    int max_workers = 20;
    int attempts = 3;
    int backoff_ms = 1000;

    // Rendering engine
    std::string webdriver_url = "http://localhost:9515";
    std::string browser = "chrome";
    bool headless = true;
    int navigation_timeout_ms = 15000;
    int action_delay_ms = 500;

    // Discovery
    int navigation_attempts = 3;

    // Caller-level re-invocation budget on fatal run errors
    int run_max_attempts = 3;
};

class ConfigLoader {
public:
    // Default file if present, built-in defaults otherwise.
    // Values that fail to parse keep their default and add a warning.
    static Config load_config(std::vector<std::string>* warnings = nullptr);
    static Config load_from_file(const std::filesystem::path& path, std::vector<std::string>* warnings = nullptr);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace tankobon::backend
