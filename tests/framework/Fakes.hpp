#pragma once

#include "discovery/MarkupDocument.hpp"
#include "discovery/RenderingEngine.hpp"
#include "imaging/ImageNormalizer.hpp"
#include "net/Fetcher.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <libxml/tree.h>

namespace tankobon::test {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "tankobon-test") {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / (prefix + "-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Gradient JPEG of the given size
inline std::vector<uint8_t> make_jpeg(int width, int height, int seed = 0) {
    std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t i = (static_cast<size_t>(y) * width + x) * 3;
            rgb[i] = static_cast<uint8_t>((x * 255) / (width > 1 ? width - 1 : 1));
            rgb[i + 1] = static_cast<uint8_t>((y * 255) / (height > 1 ? height - 1 : 1));
            rgb[i + 2] = static_cast<uint8_t>(seed * 37);
        }
    }
    return imaging::ImageNormalizer::encode_jpeg(rgb.data(), width, height);
}

/**
 * Fetcher serving canned bodies.
 *
 * Unknown URLs fail. fail_times[url] makes the first N fetches of a URL fail
 * before it succeeds; max_delay adds a random per-fetch delay so completion
 * order differs from submission order.
 */
class StubFetcher : public net::Fetcher {
public:
    std::map<std::string, std::vector<uint8_t>> bodies;
    std::map<std::string, int> fail_times;
    std::chrono::milliseconds max_delay{0};

    util::Result<std::vector<uint8_t>> fetch(const std::string& url) override {
        int delay_ms = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[url];
            ++total_calls_;
            if (max_delay.count() > 0) {
                delay_ms = std::uniform_int_distribution<int>(0, static_cast<int>(max_delay.count()))(rng_);
            }
            auto failing = fail_times.find(url);
            if (failing != fail_times.end() && failing->second > 0) {
                --failing->second;
                return util::Error{util::ErrorKind::Fetch, "HTTP 503 for " + url};
            }
        }
        if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

        auto it = bodies.find(url);
        if (it == bodies.end()) {
            return util::Error{util::ErrorKind::Fetch, "HTTP 404 for " + url};
        }
        return it->second;
    }

    int calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    int total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, int> calls_;
    int total_calls_ = 0;
    std::mt19937 rng_{1234};
};

/**
 * Scripted rendering engine over static HTML pages.
 *
 * Clicking an element follows its data-goto attribute. wait_timeouts[url]
 * makes the next N waits on that page time out; unreachable URLs make
 * navigate() time out.
 */
class FakeEngine : public discovery::RenderingEngine {
public:
    std::map<std::string, std::string> pages;
    std::map<std::string, int> wait_timeouts;
    std::set<std::string> unreachable;

    int navigate_calls = 0;
    int reload_calls = 0;
    int click_calls = 0;
    std::vector<std::string> visited;   // Every page entered, in order

    void navigate(const std::string& url) override {
        ++navigate_calls;
        if (unreachable.count(url)) {
            throw discovery::EngineError("navigation timeout: " + url, true);
        }
        enter(url);
    }

    void reload() override { ++reload_calls; }

    std::string current_url() override { return current_; }

    std::string markup(const std::string& region_xpath) override {
        const std::string& html = page();
        if (region_xpath.empty()) return html;

        discovery::MarkupDocument document(html);
        auto nodes = document.select(region_xpath);
        if (nodes.empty()) throw discovery::EngineError("region not found: " + region_xpath);

        std::string inner;
        xmlBufferPtr buffer = xmlBufferCreate();
        for (xmlNodePtr child = nodes.front()->children; child; child = child->next) {
            xmlNodeDump(buffer, child->doc, child, 0, 0);
        }
        inner.assign(reinterpret_cast<const char*>(xmlBufferContent(buffer)),
                     static_cast<size_t>(xmlBufferLength(buffer)));
        xmlBufferFree(buffer);
        return inner;
    }

    std::vector<discovery::ElementHandle> query(const std::string& xpath, std::chrono::milliseconds) override {
        discovery::MarkupDocument document(page());
        std::vector<discovery::ElementHandle> handles;
        auto nodes = document.select(xpath);
        for (size_t i = 0; i < nodes.size(); ++i) {
            handles.push_back({xpath + "\n" + std::to_string(i)});
        }
        return handles;
    }

    std::optional<std::string> attribute(const discovery::ElementHandle& element, const std::string& name) override {
        discovery::MarkupDocument document(page());
        xmlNodePtr node = resolve(document, element);
        if (!node) throw discovery::EngineError("stale element");
        return discovery::MarkupDocument::attribute(node, name);
    }

    void click(const discovery::ElementHandle& element) override {
        ++click_calls;
        std::string target;
        {
            discovery::MarkupDocument document(page());
            xmlNodePtr node = resolve(document, element);
            if (!node) throw discovery::EngineError("stale element");
            target = discovery::MarkupDocument::attribute(node, "data-goto").value_or("");
        }
        if (!target.empty()) enter(target);
    }

    void wait_for(const std::string& xpath, std::chrono::milliseconds timeout) override {
        auto pending = wait_timeouts.find(current_);
        if (pending != wait_timeouts.end() && pending->second > 0) {
            --pending->second;
            throw discovery::EngineError("timed out waiting for " + xpath, true);
        }
        if (query(xpath, timeout).empty()) {
            throw discovery::EngineError("timed out waiting for " + xpath, true);
        }
    }

private:
    const std::string& page() const {
        static const std::string blank = "<html><body></body></html>";
        auto it = pages.find(current_);
        return it == pages.end() ? blank : it->second;
    }

    void enter(const std::string& url) {
        current_ = url;
        visited.push_back(url);
    }

    static xmlNodePtr resolve(const discovery::MarkupDocument& document, const discovery::ElementHandle& element) {
        auto split = element.id.rfind('\n');
        if (split == std::string::npos) return nullptr;
        auto nodes = document.select(element.id.substr(0, split));
        size_t index = std::stoul(element.id.substr(split + 1));
        return index < nodes.size() ? nodes[index] : nullptr;
    }

    std::string current_;
};

}  // namespace tankobon::test
