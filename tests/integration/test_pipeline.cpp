#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "backend/ArtifactStore.hpp"
#include "backend/Config.hpp"
#include "backend/RunContext.hpp"
#include "backend/RunOrchestrator.hpp"
#include "discovery/SourceAdapter.hpp"
#include "imaging/DocumentAssembler.hpp"
#include "util/Logger.hpp"
#include "util/WorkerPool.hpp"
#include <fstream>
#include <iterator>
#include <sstream>

using namespace tankobon;
using namespace tankobon::backend;
namespace fs = std::filesystem;

namespace {

const std::string LANDING = "https://www.8comic.com/html/777.html";

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

std::string image_url(int chapter, int page) {
    return "https://img.8comic.com/777/" + std::to_string(chapter) + "/" + std::to_string(page) + ".jpg";
}

// A three-chapter book on a scripted 8comic site, with every image served
struct Harness {
    test::TempDir dir;
    test::FakeEngine engine;
    test::StubFetcher fetcher;
    Config config;
    util::WorkerPool workers{4, quiet_logger()};
    std::unique_ptr<discovery::SourceAdapter> adapter = discovery::make_source_adapter("8comic");
    std::unique_ptr<ArtifactStore> store;
    RunContext context{config, quiet_logger(), fetcher, workers};

    explicit Harness(bool completed) {
        config.navigation_timeout_ms = 10;
        config.backoff_ms = 1;
        store = std::make_unique<ArtifactStore>(dir.path(), quiet_logger());

        std::string chapters;
        for (int c = 1; c <= 3; ++c) {
            std::string view = "https://www.8comic.com/view/777-" + std::to_string(c) + ".html";
            chapters += "<a id='c" + std::to_string(c) + "' data-goto='" + view + "'>第" + std::to_string(c) + "話</a>";

            std::string pics;
            for (int p = 1; p <= 2; ++p) {
                pics += "<img src='" + image_url(c, p) + "?v=1'>";
                fetcher.bodies[image_url(c, p)] = test::make_jpeg(12, 16, c * 10 + p);
            }
            engine.pages[view] = "<html><body><a class='view-back' data-goto='" + LANDING + "'>back</a>"
                                 "<div id='comics-pics'>" + pics + "</div><div class='comics-end'></div></body></html>";
        }
        engine.pages[LANDING] = "<html><head><meta name='name' content='測試漫畫'></head><body>"
                                "<div class='item-info'>" + std::string(completed ? "完結" : "連載中") + "</div>"
                                "<div id='chapters'>" + chapters + "</div></body></html>";
    }

    model::Book book() const {
        return {"777", "測試漫畫", "8comic", model::LifecycleState::Active};
    }

    RunSummary run(bool overwrite = false) {
        RunOrchestrator orchestrator(context, engine, *adapter, *store);
        return orchestrator.run({"777", overwrite});
    }

    void seed_url_list(int index) {
        model::Chapter chapter{index, "第" + std::to_string(index) + "話", "c" + std::to_string(index),
                               model::HandleKind::ElementId, model::DiscoveryStatus::Pending};
        if (!store->write_url_list(book(), chapter, {image_url(index, 1), image_url(index, 2)}).ok()) {
            throw std::runtime_error("seeding failed");
        }
    }
};

}  // namespace

TEST_CASE(test_scenario_two_of_three_discovered) {
    Harness h(false);
    h.seed_url_list(1);
    h.seed_url_list(2);

    auto summary = h.run();

    ASSERT_EQ(summary.chapters_listed, static_cast<size_t>(3));
    ASSERT_EQ(summary.chapters_pending, static_cast<size_t>(1));
    ASSERT_EQ(summary.navigations, static_cast<size_t>(1));
    ASSERT_EQ(summary.discovered, static_cast<size_t>(1));
    ASSERT_EQ(summary.assembled, static_cast<size_t>(3));
    ASSERT_FALSE(summary.archived);

    auto book = h.book();
    for (int c = 1; c <= 3; ++c) {
        auto pdf = h.store->document_path(book, c, "第" + std::to_string(c) + "話");
        ASSERT_TRUE(fs::exists(pdf));
        std::ifstream in(pdf, std::ios::binary);
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto pages = imaging::DocumentAssembler::count_pages(bytes);
        ASSERT_TRUE(pages.ok());
        ASSERT_EQ(pages.value(), 2);
    }
    ASSERT_EQ(read_file(h.store->url_list_path(book, 3, "第3話")), image_url(3, 1) + "\n" + image_url(3, 2) + "\n");
    ASSERT_TRUE(summary.index_page.has_value());
    ASSERT_TRUE(fs::exists(*summary.index_page));
}

TEST_CASE(test_second_run_is_idempotent) {
    Harness h(false);
    auto first = h.run();
    ASSERT_EQ(first.discovered, static_cast<size_t>(3));
    ASSERT_EQ(first.assembled, static_cast<size_t>(3));

    auto list = h.store->url_list_path(h.book(), 2, "第2話");
    const std::string before = read_file(list);
    const int clicks_before = h.engine.click_calls;
    const int fetches_before = h.fetcher.total_calls();

    auto second = h.run();
    ASSERT_EQ(second.chapters_pending, static_cast<size_t>(0));
    ASSERT_EQ(second.navigations, static_cast<size_t>(0));
    ASSERT_EQ(second.assembled, static_cast<size_t>(0));
    ASSERT_EQ(h.engine.click_calls, clicks_before);
    ASSERT_EQ(h.fetcher.total_calls(), fetches_before);
    ASSERT_EQ(read_file(list), before);
}

TEST_CASE(test_overwrite_rediscovers_and_reassembles) {
    Harness h(false);
    h.run();
    auto again = h.run(true);
    ASSERT_EQ(again.chapters_pending, static_cast<size_t>(3));
    ASSERT_EQ(again.navigations, static_cast<size_t>(3));
    ASSERT_EQ(again.assembled, static_cast<size_t>(3));
}

TEST_CASE(test_completed_book_archived_exactly_once) {
    Harness h(true);
    auto first = h.run();
    ASSERT_TRUE(first.archived);
    ASSERT_TRUE(first.book.state == model::LifecycleState::Completed);

    auto book = h.book();
    ASSERT_FALSE(fs::exists(h.store->book_root(book)));
    ASSERT_TRUE(fs::exists(h.store->archived_book_root(book)));
    ASSERT_TRUE(first.index_page.has_value());
    ASSERT_TRUE(fs::exists(*first.index_page));

    const int navigations_before = h.engine.navigate_calls;
    auto second = h.run();
    ASSERT_TRUE(second.short_circuited);
    ASSERT_FALSE(second.archived);
    ASSERT_EQ(h.engine.navigate_calls, navigations_before + 1);
    ASSERT_FALSE(fs::exists(h.store->book_root(book)));
    ASSERT_TRUE(fs::exists(h.store->archived_book_root(book)));
}

TEST_CASE(test_archive_deferred_while_chapters_outstanding) {
    Harness h(true);
    // Chapter 2 loses an image for good
    h.fetcher.bodies.erase(image_url(2, 2));

    auto summary = h.run();
    ASSERT_EQ(summary.assembled, static_cast<size_t>(2));
    ASSERT_EQ(summary.assembly_failed, static_cast<size_t>(1));
    ASSERT_FALSE(summary.archived);
    ASSERT_TRUE(fs::exists(h.store->book_root(h.book())));
    ASSERT_FALSE(fs::exists(h.store->document_path(h.book(), 2, "第2話")));

    // The image comes back: only the missing document is built, then the book is archived
    h.fetcher.bodies[image_url(2, 2)] = test::make_jpeg(12, 16);
    auto retry = h.run();
    ASSERT_EQ(retry.navigations, static_cast<size_t>(0));
    ASSERT_EQ(retry.assembled, static_cast<size_t>(1));
    ASSERT_TRUE(retry.archived);
}

TEST_CASE(test_unreachable_book_is_fatal) {
    Harness h(true);
    h.engine.unreachable.insert(LANDING);
    ASSERT_THROWS(h.run(), util::RunError);
    ASSERT_FALSE(fs::exists(h.store->completed_root()));
}

int main() {
    return tankobon::test::TestRunner::instance().run_all();
}
