#pragma once

#include "backend/Config.hpp"

namespace tankobon::util {
class Logger;
class WorkerPool;
}
namespace tankobon::net { class Fetcher; }

namespace tankobon::backend {

// Everything a run shares, handed down explicitly instead of living in globals.
// main owns the referenced objects; they outlive every component using them.
struct RunContext {
    const Config& config;
    util::Logger& logger;
    net::Fetcher& fetcher;
    util::WorkerPool& workers;
};

}  // namespace tankobon::backend
