#pragma once

#include "util/Result.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tankobon::net {

// Source of raw image bytes; implemented by HttpClient, stubbed in tests.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Body of a successful (2xx) response, or a Fetch error
    virtual util::Result<std::vector<uint8_t>> fetch(const std::string& url) = 0;
};

}  // namespace tankobon::net
