#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "backend/AcquisitionPool.hpp"
#include "backend/ArtifactStore.hpp"
#include "backend/Config.hpp"
#include "backend/IndexPageGenerator.hpp"
#include "imaging/DocumentAssembler.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include "util/WorkerPool.hpp"
#include <atomic>
#include <fstream>
#include <sstream>

using namespace tankobon;
using namespace tankobon::backend;
namespace fs = std::filesystem;

namespace {

util::Logger& quiet_logger() {
    static util::Logger logger("", util::Logger::Level::Error);
    return logger;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

const model::Book BOOK{"10406", "One Piece: 航海王", "8comic", model::LifecycleState::Completed};

}  // namespace

// --- UnicodeUtils ---

TEST_CASE(test_sanitize_path_component) {
    ASSERT_EQ(util::sanitize_path_component("a/b\\c:d*e?f\"g<h>i|j"), std::string("a_b_c_d_e_f_g_h_i_j"));
    ASSERT_EQ(util::sanitize_path_component("  ..name.. "), std::string("name"));
    ASSERT_EQ(util::sanitize_path_component("..."), std::string("_"));
    ASSERT_EQ(util::sanitize_path_component("tab\there"), std::string("tab_here"));
    // Decomposed e + combining acute composes to U+00E9
    ASSERT_EQ(util::sanitize_path_component("Cafe\xCC\x81"), std::string("Caf\xC3\xA9"));
    ASSERT_EQ(util::trim_unicode("\xE3\x80\x80第1話\xE3\x80\x80"), std::string("第1話"));
}

// --- ArtifactStore ---

TEST_CASE(test_store_layout) {
    ArtifactStore store("/out", quiet_logger());
    ASSERT_EQ(ArtifactStore::book_directory_name(BOOK), std::string("One Piece_ 航海王_10406"));
    ASSERT_EQ(store.url_list_path(BOOK, 7, "第7話").string(),
              std::string("/out/8comic/One Piece_ 航海王_10406/One Piece_ 航海王_10406-images/ch0007 - 第7話 - 8comic.txt"));
    ASSERT_EQ(store.document_path(BOOK, 12345, "x").string(),
              std::string("/out/8comic/One Piece_ 航海王_10406/One Piece_ 航海王_10406-pdf/ch12345 - x.pdf"));
    ASSERT_EQ(store.archived_book_root(BOOK).string(), std::string("/out/completed/One Piece_ 航海王_10406"));
}

TEST_CASE(test_store_url_list_round_trip_leaves_no_partial) {
    test::TempDir dir;
    ArtifactStore store(dir.path(), quiet_logger());
    model::Chapter chapter{3, "Three", "c3", model::HandleKind::ElementId, model::DiscoveryStatus::Pending};

    ASSERT_FALSE(store.has_url_list(BOOK, chapter));
    ASSERT_TRUE(store.write_url_list(BOOK, chapter, {"https://a/1.jpg", "https://a/2.jpg"}).ok());
    ASSERT_TRUE(store.has_url_list(BOOK, chapter));

    auto path = store.url_list_path(BOOK, 3, "Three");
    ASSERT_EQ(read_file(path), std::string("https://a/1.jpg\nhttps://a/2.jpg\n"));
    ASSERT_FALSE(fs::exists(path.string() + ArtifactStore::PARTIAL_SUFFIX));

    auto urls = store.read_url_list(path);
    ASSERT_TRUE(urls.ok());
    ASSERT_EQ(urls.value().size(), static_cast<size_t>(2));

    auto missing = store.read_url_list(dir.path() / "nope.txt");
    ASSERT_FALSE(missing.ok());
    ASSERT_TRUE(missing.error().kind == util::ErrorKind::ArtifactIO);
}

TEST_CASE(test_store_lists_chapters_in_index_order) {
    test::TempDir dir;
    ArtifactStore store(dir.path(), quiet_logger());
    for (int i : {10, 2, 1}) {
        model::Chapter c{i, "第" + std::to_string(i) + "話 - 特別", "h", model::HandleKind::Href, model::DiscoveryStatus::Pending};
        ASSERT_TRUE(store.write_url_list(BOOK, c, {"https://x/" + std::to_string(i)}).ok());
    }
    std::ofstream(store.url_list_directory(BOOK) / "notes.txt") << "ignored";
    std::ofstream(store.url_list_directory(BOOK) / "ch0001 - One - 8comic.txt.part") << "ignored";

    auto chapters = store.list_chapters(BOOK);
    ASSERT_EQ(chapters.size(), static_cast<size_t>(3));
    ASSERT_EQ(chapters[0].index, 1);
    ASSERT_EQ(chapters[1].index, 2);
    ASSERT_EQ(chapters[2].index, 10);
    ASSERT_EQ(chapters[2].name, std::string("第10話 - 特別"));
    ASSERT_EQ(chapters[2].document, store.document_path(BOOK, 10, "第10話 - 特別"));
}

TEST_CASE(test_store_archive_moves_once) {
    test::TempDir dir;
    ArtifactStore store(dir.path(), quiet_logger());
    model::Chapter c{1, "One", "h", model::HandleKind::Href, model::DiscoveryStatus::Pending};
    ASSERT_TRUE(store.write_url_list(BOOK, c, {"https://x/1"}).ok());

    ASSERT_FALSE(store.is_archived(BOOK));
    ASSERT_TRUE(store.archive(BOOK).ok());
    ASSERT_TRUE(store.is_archived(BOOK));
    ASSERT_FALSE(fs::exists(store.book_root(BOOK)));
    ASSERT_TRUE(fs::exists(store.archived_book_root(BOOK) / "One Piece_ 航海王_10406-images" /
                           "ch0001 - One - 8comic.txt"));

    // Second call is a no-op
    ASSERT_TRUE(store.archive(BOOK).ok());

    // Both roots present: refuse and move nothing
    ASSERT_TRUE(store.write_url_list(BOOK, c, {"https://x/1"}).ok());
    auto conflict = store.archive(BOOK);
    ASSERT_FALSE(conflict.ok());
    ASSERT_TRUE(fs::exists(store.book_root(BOOK)));
    ASSERT_TRUE(fs::exists(store.archived_book_root(BOOK)));
}

// --- Config ---

TEST_CASE(test_config_defaults) {
    Config cfg;
    ASSERT_EQ(cfg.max_workers, 20);
    ASSERT_EQ(cfg.attempts, 3);
    ASSERT_EQ(cfg.transport_retries, 5);
    ASSERT_EQ(cfg.navigation_attempts, 3);
    ASSERT_EQ(cfg.webdriver_url, std::string("http://localhost:9515"));
}

TEST_CASE(test_config_parses_file_and_warns) {
    test::TempDir dir;
    auto path = dir.path() / "config.toml";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "[paths]\noutput_root = \"/srv/comics\"\n\n"
            << "[network]\ntransport_retries = 2\nmax_connections = lots\n"
            << "[acquisition]\n  attempts = 4  \nbackoff_ms = 10\n"
            << "[browser]\nheadless = false\nbrowser = \"firefox\"\n"
            << "[run]\nmax_attempts = 5\n"
            << "[unknown]\nkey = 1\n";
    }

    std::vector<std::string> warnings;
    Config cfg = ConfigLoader::load_from_file(path, &warnings);
    ASSERT_EQ(cfg.output_root, fs::path("/srv/comics"));
    ASSERT_EQ(cfg.transport_retries, 2);
    ASSERT_EQ(cfg.max_connections, 20);
    ASSERT_EQ(cfg.attempts, 4);
    ASSERT_EQ(cfg.backoff_ms, 10);
    ASSERT_FALSE(cfg.headless);
    ASSERT_EQ(cfg.browser, std::string("firefox"));
    ASSERT_EQ(cfg.run_max_attempts, 5);
    ASSERT_EQ(warnings.size(), static_cast<size_t>(1));
}

TEST_CASE(test_config_save_then_load) {
    test::TempDir dir;
    Config cfg;
    cfg.output_root = "/data/out";
    cfg.action_delay_ms = 0;
    cfg.log_echo = false;
    ASSERT_TRUE(ConfigLoader::save_config(cfg, dir.path() / "sub" / "config.toml"));

    Config loaded = ConfigLoader::load_from_file(dir.path() / "sub" / "config.toml");
    ASSERT_EQ(loaded.output_root, fs::path("/data/out"));
    ASSERT_EQ(loaded.action_delay_ms, 0);
    ASSERT_FALSE(loaded.log_echo);
    ASSERT_EQ(loaded.user_agent, cfg.user_agent);
}

// --- WorkerPool ---

TEST_CASE(test_worker_pool_runs_all_jobs) {
    util::WorkerPool pool(4, quiet_logger(), 2);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.submit([&counter] { counter++; }));
    }
    for (auto& f : futures) f.get();
    ASSERT_EQ(counter.load(), 50);
    ASSERT_EQ(pool.size(), static_cast<size_t>(4));
    ASSERT_TRUE(util::WorkerPool::bounded_thread_count(20) <= 20);
    ASSERT_TRUE(util::WorkerPool::bounded_thread_count(0) >= 1);
}

TEST_CASE(test_worker_count_never_exceeds_ceiling) {
    ASSERT_TRUE(util::WorkerPool::bounded_thread_count(1000) <= util::WorkerPool::MAX_THREADS);
    ASSERT_TRUE(util::WorkerPool::bounded_thread_count(static_cast<size_t>(-1)) <= util::WorkerPool::MAX_THREADS);
    ASSERT_EQ(util::WorkerPool::bounded_thread_count(1), static_cast<size_t>(1));
}

TEST_CASE(test_document_file_detection) {
    ASSERT_TRUE(util::Platform::is_document_file("book/001.pdf"));
    ASSERT_TRUE(util::Platform::is_document_file("book/001.PDF"));
    ASSERT_FALSE(util::Platform::is_document_file("book/001.jpg"));
    ASSERT_FALSE(util::Platform::is_document_file("book/README"));
    // High-byte extensions must not reach tolower as negative values
    ASSERT_FALSE(util::Platform::is_document_file("book/001.\xE7\xAC\xAC"));
    ASSERT_FALSE(util::Platform::is_document_file("book/001.p\xC3\xA4f"));
}

TEST_CASE(test_worker_pool_propagates_exceptions) {
    util::WorkerPool pool(1, quiet_logger());
    auto f = pool.submit([] { throw std::runtime_error("boom"); });
    ASSERT_THROWS(f.get(), std::runtime_error);
}

// --- AcquisitionPool ---

TEST_CASE(test_acquire_preserves_input_order) {
    test::StubFetcher fetcher;
    fetcher.max_delay = std::chrono::milliseconds(15);
    std::vector<std::string> urls;
    for (int i = 0; i < 12; ++i) {
        std::string url = "https://img/" + std::to_string(i) + ".jpg";
        // Width encodes the position so order can be checked after normalization
        fetcher.bodies[url] = test::make_jpeg(16, 4 + i);
        urls.push_back(url);
    }

    util::WorkerPool workers(6, quiet_logger());
    AcquisitionPool pool(fetcher, workers, quiet_logger(), {3, std::chrono::milliseconds(1)});
    auto result = pool.acquire(urls, "ch1");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), urls.size());
    for (int i = 0; i < 12; ++i) {
        auto expected = imaging::ImageNormalizer::target_dimensions(16, 4 + i);
        ASSERT_EQ(result.value()[i].height, expected.height);
    }
}

TEST_CASE(test_acquire_retries_transient_failures) {
    test::StubFetcher fetcher;
    fetcher.bodies["https://img/a.jpg"] = test::make_jpeg(8, 8);
    fetcher.bodies["https://img/b.jpg"] = test::make_jpeg(8, 8);
    fetcher.fail_times["https://img/b.jpg"] = 2;

    util::WorkerPool workers(2, quiet_logger());
    AcquisitionPool pool(fetcher, workers, quiet_logger(), {3, std::chrono::milliseconds(1)});
    auto result = pool.acquire({"https://img/a.jpg", "https://img/b.jpg"}, "ch1");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(fetcher.calls("https://img/b.jpg"), 3);
}

TEST_CASE(test_acquire_is_all_or_nothing) {
    test::StubFetcher fetcher;
    std::vector<std::string> urls;
    for (int i = 0; i < 6; ++i) {
        std::string url = "https://img/" + std::to_string(i) + ".jpg";
        fetcher.bodies[url] = test::make_jpeg(8, 8);
        urls.push_back(url);
    }
    fetcher.fail_times[urls[3]] = 100;

    util::WorkerPool workers(3, quiet_logger());
    AcquisitionPool pool(fetcher, workers, quiet_logger(), {3, std::chrono::milliseconds(1)});
    auto result = pool.acquire(urls, "ch1");
    ASSERT_FALSE(result.ok());
    ASSERT_TRUE(result.error().kind == util::ErrorKind::Fetch);
    ASSERT_TRUE(result.error().message.find(urls[3]) != std::string::npos);
    ASSERT_EQ(fetcher.calls(urls[3]), 3);
}

TEST_CASE(test_acquire_undecodable_payload_fails) {
    test::StubFetcher fetcher;
    std::string page = "<html>blocked</html>";
    fetcher.bodies["https://img/x.jpg"] = std::vector<uint8_t>(page.begin(), page.end());

    util::WorkerPool workers(1, quiet_logger());
    AcquisitionPool pool(fetcher, workers, quiet_logger(), {2, std::chrono::milliseconds(1)});
    auto result = pool.acquire({"https://img/x.jpg"}, "ch1");
    ASSERT_FALSE(result.ok());
    ASSERT_EQ(fetcher.calls("https://img/x.jpg"), 2);
}

// --- IndexPageGenerator ---

TEST_CASE(test_index_page_lists_documents) {
    test::TempDir dir;
    std::vector<model::EncodedImage> images;
    images.push_back({test::make_jpeg(8, 8), 8, 8});
    images.push_back({test::make_jpeg(8, 8), 8, 8});
    auto pdf = imaging::DocumentAssembler::assemble(images);
    ASSERT_TRUE(pdf.ok());
    ASSERT_TRUE(ArtifactStore::write_atomically(dir.path() / "ch0002 - B&C.pdf", pdf.value().data(), pdf.value().size()).ok());
    ASSERT_TRUE(ArtifactStore::write_atomically(dir.path() / "ch0001 - A.pdf", pdf.value().data(), pdf.value().size()).ok());
    std::ofstream(dir.path() / "readme.txt") << "not listed";

    IndexPageGenerator generator(quiet_logger());
    auto index = generator.generate(dir.path());
    ASSERT_TRUE(index.ok());
    ASSERT_EQ(index.value(), dir.path() / "index.html");

    std::string html = read_file(index.value());
    ASSERT_TRUE(html.find("Total documents: 2") != std::string::npos);
    ASSERT_TRUE(html.find("ch0002 - B&amp;C") != std::string::npos);
    ASSERT_TRUE(html.find("href=\"ch0001%20-%20A.pdf\"") != std::string::npos);
    ASSERT_TRUE(html.find("Pages: 2") != std::string::npos);
    ASSERT_TRUE(html.find("ch0001 - A") < html.find("ch0002 - B"));
    ASSERT_TRUE(html.find("readme") == std::string::npos);

    ASSERT_FALSE(generator.generate(dir.path() / "missing").ok());
}

int main() {
    return tankobon::test::TestRunner::instance().run_all();
}
