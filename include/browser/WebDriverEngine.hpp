#pragma once

#include "discovery/RenderingEngine.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace tankobon::util { class Logger; }
namespace tankobon::net { class HttpClient; }

namespace tankobon::browser {

struct WebDriverOptions {
    std::string endpoint = "http://localhost:9515";
    std::string browser = "chrome";     // "chrome" or "firefox"
    bool headless = true;
    std::string user_agent;
    std::chrono::milliseconds page_load_timeout{15000};
    std::chrono::milliseconds action_delay{500};
    std::chrono::milliseconds poll_interval{250};
};

/**
 * RenderingEngine over the W3C WebDriver protocol (chromedriver, geckodriver).
 *
 * The constructor opens a browser session and throws EngineError if the
 * driver cannot be reached; the destructor closes it. Protocol "timeout"
 * errors and expired waits are reported as timeouts.
 */
class WebDriverEngine : public discovery::RenderingEngine {
public:
    static constexpr const char* ELEMENT_KEY = "element-6066-11e4-a52e-4f735466cecf";

    WebDriverEngine(net::HttpClient& http, util::Logger& logger, WebDriverOptions options);
    ~WebDriverEngine() override;

    WebDriverEngine(const WebDriverEngine&) = delete;
    WebDriverEngine& operator=(const WebDriverEngine&) = delete;

    void navigate(const std::string& url) override;
    void reload() override;
    std::string current_url() override;
    std::string markup(const std::string& region_xpath) override;
    std::vector<discovery::ElementHandle> query(const std::string& xpath, std::chrono::milliseconds timeout) override;
    std::optional<std::string> attribute(const discovery::ElementHandle& element, const std::string& name) override;
    void click(const discovery::ElementHandle& element) override;
    void wait_for(const std::string& xpath, std::chrono::milliseconds timeout) override;

    const std::string& session_id() const { return session_id_; }

    nlohmann::json capabilities() const;

private:
    enum class Verb { Get, Post, Delete };

    // Sends a command and returns its "value"; throws EngineError on protocol errors
    nlohmann::json command(Verb verb, const std::string& path, const nlohmann::json& payload = nlohmann::json::object());
    std::vector<discovery::ElementHandle> find_elements(const std::string& xpath);
    void pause() const;

    net::HttpClient& http_;
    util::Logger& logger_;
    WebDriverOptions options_;
    std::string session_id_;
};

}  // namespace tankobon::browser
