#include "backend/ArtifactStore.hpp"
#include "backend/Config.hpp"
#include "backend/RunContext.hpp"
#include "backend/RunOrchestrator.hpp"
#include "browser/WebDriverEngine.hpp"
#include "discovery/SourceAdapter.hpp"
#include "net/HttpClient.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/WorkerPool.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tankobon;

namespace {

struct CommandLine {
    bool from_8comic = false;
    bool from_xmanhua = false;
    std::string book_id;
    bool overwrite = false;
    bool show_index = false;
    bool rescan = false;
    bool verbose = false;
    std::string config_path;
};

// One complete attempt with a fresh browser session
backend::RunSummary run_once(backend::RunContext& context, const discovery::SourceAdapter& adapter,
                             const backend::ArtifactStore& store, const backend::RunOptions& options) {
    const auto& cfg = context.config;

    // Driver traffic gets its own client: no transport retries, page loads may be slow
    net::HttpClientOptions driver_http;
    driver_http.user_agent = cfg.user_agent;
    driver_http.connect_timeout_s = cfg.connect_timeout_s;
    driver_http.request_timeout_s = cfg.navigation_timeout_ms / 1000 + 30;
    driver_http.max_connections = 1;
    driver_http.transport_retries = 0;
    net::HttpClient driver_client(driver_http, context.logger);

    browser::WebDriverOptions driver_options;
    driver_options.endpoint = cfg.webdriver_url;
    driver_options.browser = cfg.browser;
    driver_options.headless = cfg.headless;
    driver_options.user_agent = cfg.user_agent;
    driver_options.page_load_timeout = std::chrono::milliseconds(cfg.navigation_timeout_ms);
    driver_options.action_delay = std::chrono::milliseconds(cfg.action_delay_ms);

    std::unique_ptr<browser::WebDriverEngine> engine;
    try {
        engine = std::make_unique<browser::WebDriverEngine>(driver_client, context.logger, driver_options);
    } catch (const discovery::EngineError& e) {
        throw util::RunError("cannot start rendering session: " + std::string(e.what()));
    }

    backend::RunOrchestrator orchestrator(context, *engine, adapter, store);
    return orchestrator.run(options);
}

void report(util::Logger& logger, const backend::RunSummary& summary) {
    if (summary.short_circuited) {
        logger.info("Done: '" + summary.book.title + "' is already archived");
        return;
    }
    logger.info("Done: '" + summary.book.title + "' chapters=" + std::to_string(summary.chapters_listed) +
                " discovered=" + std::to_string(summary.discovered) + "/" +
                std::to_string(summary.chapters_pending) + " assembled=" + std::to_string(summary.assembled) +
                (summary.archived ? " (archived)" : ""));
    for (const auto& line : summary.skipped) {
        logger.warn("Skipped: " + line);
    }
}

}  // namespace

int main(int argc, char** argv) {
    CommandLine cli;
    CLI::App app{"tankobon - collects web comic chapters into PDF documents"};

    auto* source = app.add_option_group("source", "Where the book comes from");
    source->add_flag("--from-8comic", cli.from_8comic, "Download from 8comic");
    source->add_flag("--from-xmanhua", cli.from_xmanhua, "Download from xmanhua");
    source->require_option(1);

    app.add_option("--book-id", cli.book_id, "Book identifier on the source site")->required();
    app.add_flag("--overwrite", cli.overwrite, "Discover and assemble again even if artifacts exist");
    app.add_flag("--show-index,--show-content", cli.show_index, "Open the document index when done");
    app.add_flag("--rescan", cli.rescan, "Revisit archived books (reserved)");
    app.add_option("--config", cli.config_path, "Configuration file")->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", cli.verbose, "Debug logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    std::vector<std::string> config_warnings;
    backend::Config config = cli.config_path.empty()
        ? backend::ConfigLoader::load_config(&config_warnings)
        : backend::ConfigLoader::load_from_file(cli.config_path, &config_warnings);

    fs::path log_file = config.log_file.empty() ? util::Platform::get_default_log_file() : config.log_file;
    util::Logger::Level level = cli.verbose ? util::Logger::Level::Debug
                                            : util::Logger::parse_level(config.log_level);
    util::Logger logger(log_file, level, config.log_echo);

    for (const auto& warning : config_warnings) {
        logger.warn(warning);
    }

    if (cli.rescan) {
        logger.info("Rescan is reserved and does nothing yet");
        return 0;
    }

    try {
        const std::string site_tag = cli.from_8comic ? "8comic" : "xmanhua";
        auto adapter = discovery::make_source_adapter(site_tag);
        if (!adapter) {
            logger.error("Unknown source: " + site_tag);
            return 1;
        }

        fs::path output_root = config.output_root.empty() ? fs::current_path() : config.output_root;
        backend::ArtifactStore store(output_root, logger);

        net::HttpClientOptions http_options;
        http_options.user_agent = config.user_agent;
        http_options.connect_timeout_s = config.connect_timeout_s;
        http_options.request_timeout_s = config.request_timeout_s;
        http_options.max_connections = config.max_connections;
        http_options.transport_retries = config.transport_retries;
        http_options.transport_backoff = std::chrono::milliseconds(config.transport_backoff_ms);
        net::HttpClient http(http_options, logger);

        size_t cap = config.max_workers > 0 ? static_cast<size_t>(config.max_workers) : 1;
        cap = std::min<size_t>(cap, util::WorkerPool::MAX_THREADS);
        util::WorkerPool workers(util::WorkerPool::bounded_thread_count(cap), logger);

        backend::RunContext context{config, logger, http, workers};
        backend::RunOptions options{cli.book_id, cli.overwrite};

        logger.info("tankobon: " + site_tag + " book " + cli.book_id + " -> " + output_root.string());

        const int max_attempts = config.run_max_attempts > 0 ? config.run_max_attempts : 1;
        std::optional<backend::RunSummary> summary;
        for (int attempt = 1; attempt <= max_attempts && !summary; ++attempt) {
            try {
                summary = run_once(context, *adapter, store, options);
            } catch (const util::RunError& e) {
                logger.error("Run attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                             " failed: " + e.what());
            }
        }
        if (!summary) {
            logger.error("Giving up on book " + cli.book_id);
            return 1;
        }

        report(logger, *summary);
        if (cli.show_index && summary->index_page) {
            if (!util::Platform::open_in_viewer(*summary->index_page, logger)) {
                std::cerr << "Index page: " << summary->index_page->string() << std::endl;
            }
        }
        return 0;

    } catch (const std::exception& e) {
        logger.error(std::string("Fatal: ") + e.what());
        std::cerr << "tankobon: " << e.what() << std::endl;
        return 1;
    }
}
