#include "browser/WebDriverEngine.hpp"
#include "net/HttpClient.hpp"
#include "util/Logger.hpp"
#include <thread>

namespace tankobon::browser {

using json = nlohmann::json;

namespace {

bool is_timeout_error(const std::string& error) {
    return error == "timeout" || error == "script timeout";
}

}  // namespace

WebDriverEngine::WebDriverEngine(net::HttpClient& http, util::Logger& logger, WebDriverOptions options)
    : http_(http), logger_(logger), options_(std::move(options)) {
    while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
        options_.endpoint.pop_back();
    }

    json session = command(Verb::Post, "/session", {{"capabilities", capabilities()}});
    if (!session.is_object() || !session.contains("sessionId") || !session["sessionId"].is_string()) {
        throw discovery::EngineError("WebDriver: session response without sessionId");
    }
    session_id_ = session["sessionId"].get<std::string>();
    logger_.info("WebDriver: Session " + session_id_ + " (" + options_.browser +
                 (options_.headless ? ", headless)" : ")"));

    command(Verb::Post, "/session/" + session_id_ + "/timeouts",
            {{"pageLoad", options_.page_load_timeout.count()}, {"implicit", 0}});
}

WebDriverEngine::~WebDriverEngine() {
    if (session_id_.empty()) return;
    try {
        command(Verb::Delete, "/session/" + session_id_);
        logger_.debug("WebDriver: Closed session " + session_id_);
    } catch (const discovery::EngineError& e) {
        logger_.warn("WebDriver: Closing session failed: " + std::string(e.what()));
    }
}

json WebDriverEngine::capabilities() const {
    json always;
    always["browserName"] = options_.browser;

    json args = json::array();
    if (options_.headless) args.push_back(options_.browser == "firefox" ? "-headless" : "--headless=new");

    if (options_.browser == "firefox") {
        json firefox = {{"args", args}};
        if (!options_.user_agent.empty()) {
            firefox["prefs"] = {{"general.useragent.override", options_.user_agent}};
        }
        always["moz:firefoxOptions"] = firefox;
    } else {
        args.push_back("--disable-gpu");
        args.push_back("--no-sandbox");
        if (!options_.user_agent.empty()) args.push_back("--user-agent=" + options_.user_agent);
        always["goog:chromeOptions"] = {{"args", args}};
    }
    return {{"alwaysMatch", always}};
}

json WebDriverEngine::command(Verb verb, const std::string& path, const json& payload) {
    const std::string url = options_.endpoint + path;

    net::HttpResponse response;
    switch (verb) {
        case Verb::Get: response = http_.get(url); break;
        case Verb::Post: response = http_.post(url, payload.dump()); break;
        case Verb::Delete: response = http_.del(url); break;
    }

    if (!response.error.empty()) {
        throw discovery::EngineError("WebDriver: " + path + ": " + response.error);
    }

    json body = json::parse(response.text(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw discovery::EngineError("WebDriver: " + path + ": HTTP " + std::to_string(response.status) +
                                     " with unreadable body");
    }

    json value = body.contains("value") ? body["value"] : json();
    if (!response.ok() || (value.is_object() && value.contains("error"))) {
        std::string error = value.is_object() ? value.value("error", std::string("unknown error")) : "unknown error";
        std::string message = value.is_object() ? value.value("message", std::string()) : "";
        throw discovery::EngineError("WebDriver: " + path + ": " + error + (message.empty() ? "" : ": " + message),
                                     is_timeout_error(error));
    }
    return value;
}

void WebDriverEngine::pause() const {
    if (options_.action_delay.count() > 0) {
        std::this_thread::sleep_for(options_.action_delay);
    }
}

void WebDriverEngine::navigate(const std::string& url) {
    logger_.debug("WebDriver: Navigate " + url);
    command(Verb::Post, "/session/" + session_id_ + "/url", {{"url", url}});
    pause();
}

void WebDriverEngine::reload() {
    logger_.debug("WebDriver: Reload");
    command(Verb::Post, "/session/" + session_id_ + "/refresh");
    pause();
}

std::string WebDriverEngine::current_url() {
    json value = command(Verb::Get, "/session/" + session_id_ + "/url");
    return value.is_string() ? value.get<std::string>() : "";
}

std::vector<discovery::ElementHandle> WebDriverEngine::find_elements(const std::string& xpath) {
    json value = command(Verb::Post, "/session/" + session_id_ + "/elements", {{"using", "xpath"}, {"value", xpath}});

    std::vector<discovery::ElementHandle> elements;
    if (!value.is_array()) return elements;
    for (const auto& item : value) {
        if (item.is_object() && item.contains(ELEMENT_KEY) && item[ELEMENT_KEY].is_string()) {
            elements.push_back({item[ELEMENT_KEY].get<std::string>()});
        }
    }
    return elements;
}

std::string WebDriverEngine::markup(const std::string& region_xpath) {
    if (region_xpath.empty()) {
        json value = command(Verb::Get, "/session/" + session_id_ + "/source");
        return value.is_string() ? value.get<std::string>() : "";
    }

    auto elements = find_elements(region_xpath);
    if (elements.empty()) {
        throw discovery::EngineError("WebDriver: region not found: " + region_xpath);
    }
    json value = command(Verb::Get, "/session/" + session_id_ + "/element/" + elements.front().id +
                                    "/property/innerHTML");
    return value.is_string() ? value.get<std::string>() : "";
}

std::vector<discovery::ElementHandle> WebDriverEngine::query(const std::string& xpath,
                                                             std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto elements = find_elements(xpath);
        if (!elements.empty() || std::chrono::steady_clock::now() >= deadline) {
            return elements;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

std::optional<std::string> WebDriverEngine::attribute(const discovery::ElementHandle& element,
                                                      const std::string& name) {
    json value = command(Verb::Get, "/session/" + session_id_ + "/element/" + element.id + "/attribute/" + name);
    if (!value.is_string()) return std::nullopt;
    return value.get<std::string>();
}

void WebDriverEngine::click(const discovery::ElementHandle& element) {
    command(Verb::Post, "/session/" + session_id_ + "/element/" + element.id + "/click");
    pause();
}

void WebDriverEngine::wait_for(const std::string& xpath, std::chrono::milliseconds timeout) {
    if (query(xpath, timeout).empty()) {
        throw discovery::EngineError("WebDriver: timed out waiting for " + xpath, true);
    }
}

}  // namespace tankobon::browser
