#include "backend/Config.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace tankobon::backend {

namespace {

void parse_int(const std::string& key, const std::string& value, int& target, std::vector<std::string>* warnings) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        target = parsed;
    } catch (const std::exception&) {
        if (warnings) warnings->push_back("Config: Invalid number for " + key + ": '" + value + "', keeping " +
                                          std::to_string(target));
    }
}

void parse_bool(const std::string& key, const std::string& value, bool& target, std::vector<std::string>* warnings) {
    if (value == "true") target = true;
    else if (value == "false") target = false;
    else if (warnings) warnings->push_back("Config: Invalid boolean for " + key + ": '" + value + "'");
}

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

}  // namespace

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    return Config{};
}

Config ConfigLoader::load_config(std::vector<std::string>* warnings) {
    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file, warnings);
    }
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path, std::vector<std::string>* warnings) {
    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        if (warnings) warnings->push_back("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        const std::string qualified = current_section + "." + key;

        if (current_section == "paths") {
            if (key == "output_root") cfg.output_root = value;
            else if (key == "log_file") cfg.log_file = value;
        }
        else if (current_section == "log") {
            if (key == "level") cfg.log_level = value;
            else if (key == "echo") parse_bool(qualified, value, cfg.log_echo, warnings);
        }
        else if (current_section == "network") {
            if (key == "user_agent") cfg.user_agent = value;
            else if (key == "connect_timeout_s") parse_int(qualified, value, cfg.connect_timeout_s, warnings);
            else if (key == "request_timeout_s") parse_int(qualified, value, cfg.request_timeout_s, warnings);
            else if (key == "max_connections") parse_int(qualified, value, cfg.max_connections, warnings);
            else if (key == "transport_retries") parse_int(qualified, value, cfg.transport_retries, warnings);
            else if (key == "transport_backoff_ms") parse_int(qualified, value, cfg.transport_backoff_ms, warnings);
        }
        else if (current_section == "acquisition") {
            if (key == "max_workers") parse_int(qualified, value, cfg.max_workers, warnings);
            else if (key == "attempts") parse_int(qualified, value, cfg.attempts, warnings);
            else if (key == "backoff_ms") parse_int(qualified, value, cfg.backoff_ms, warnings);
        }
        else if (current_section == "browser") {
            if (key == "webdriver_url") cfg.webdriver_url = value;
            else if (key == "browser") cfg.browser = value;
            else if (key == "headless") parse_bool(qualified, value, cfg.headless, warnings);
            else if (key == "navigation_timeout_ms") parse_int(qualified, value, cfg.navigation_timeout_ms, warnings);
            else if (key == "action_delay_ms") parse_int(qualified, value, cfg.action_delay_ms, warnings);
        }
        else if (current_section == "discovery") {
            if (key == "navigation_attempts") parse_int(qualified, value, cfg.navigation_attempts, warnings);
        }
        else if (current_section == "run") {
            if (key == "max_attempts") parse_int(qualified, value, cfg.run_max_attempts, warnings);
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return false;

    std::ofstream file(path);
    if (!file) return false;

    file << "# TANKOBON Config\n";
    file << "# Edit with care; unknown keys are ignored\n\n";

    file << "[paths]\n";
    file << "# Where <site>/ and completed/ trees are created (empty: current directory)\n";
    file << "output_root = \"" << cfg.output_root.string() << "\"\n";
    file << "log_file = \"" << cfg.log_file.string() << "\"\n\n";

    file << "[log]\n";
    file << "# \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "echo = " << (cfg.log_echo ? "true" : "false") << "\n\n";

    file << "[network]\n";
    file << "user_agent = \"" << cfg.user_agent << "\"\n";
    file << "connect_timeout_s = " << cfg.connect_timeout_s << "\n";
    file << "request_timeout_s = " << cfg.request_timeout_s << "\n";
    file << "max_connections = " << cfg.max_connections << "\n";
    file << "# Retries on 429/500/502/503/504, doubling the backoff each time\n";
    file << "transport_retries = " << cfg.transport_retries << "\n";
    file << "transport_backoff_ms = " << cfg.transport_backoff_ms << "\n\n";

    file << "[acquisition]\n";
    file << "# Capped by the number of CPUs\n";
    file << "max_workers = " << cfg.max_workers << "\n";
    file << "# Attempts per image URL (fetch + decode)\n";
    file << "attempts = " << cfg.attempts << "\n";
    file << "backoff_ms = " << cfg.backoff_ms << "\n\n";

    file << "[browser]\n";
    file << "webdriver_url = \"" << cfg.webdriver_url << "\"\n";
    file << "# \"chrome\" or \"firefox\"\n";
    file << "browser = \"" << cfg.browser << "\"\n";
    file << "headless = " << (cfg.headless ? "true" : "false") << "\n";
    file << "navigation_timeout_ms = " << cfg.navigation_timeout_ms << "\n";
    file << "action_delay_ms = " << cfg.action_delay_ms << "\n\n";

    file << "[discovery]\n";
    file << "navigation_attempts = " << cfg.navigation_attempts << "\n\n";

    file << "[run]\n";
    file << "# Fresh attempts when the book cannot be opened\n";
    file << "max_attempts = " << cfg.run_max_attempts << "\n";

    return static_cast<bool>(file);
}

}  // namespace tankobon::backend
