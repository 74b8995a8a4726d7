#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tankobon::discovery {

// Raised by engine operations. Timeouts feed the navigation retry loop;
// anything else is a structural failure.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message, bool timeout = false)
        : std::runtime_error(message), timeout_(timeout) {}

    bool is_timeout() const { return timeout_; }

private:
    bool timeout_;
};

struct ElementHandle {
    std::string id;
};

/**
 * Capability surface of the external page rendering engine (a browser).
 *
 * Element queries take XPath expressions. One engine instance is one
 * rendered session: it is driven by exactly one caller at a time.
 */
class RenderingEngine {
public:
    virtual ~RenderingEngine() = default;

    virtual void navigate(const std::string& url) = 0;
    virtual void reload() = 0;
    virtual std::string current_url() = 0;

    // Inner markup of the first element matching region_xpath;
    // an empty expression returns the whole document
    virtual std::string markup(const std::string& region_xpath) = 0;

    // Elements matching xpath, waiting up to timeout for at least one.
    // Returns an empty list when nothing appeared in time.
    virtual std::vector<ElementHandle> query(const std::string& xpath, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<std::string> attribute(const ElementHandle& element, const std::string& name) = 0;
    virtual void click(const ElementHandle& element) = 0;

    // Throws EngineError(timeout) if nothing matches within the timeout
    virtual void wait_for(const std::string& xpath, std::chrono::milliseconds timeout) = 0;
};

}  // namespace tankobon::discovery
