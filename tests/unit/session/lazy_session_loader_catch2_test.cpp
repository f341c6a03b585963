#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <prompter/session/lazy_session_loader.h>
#include <prompter/session/session_cache_manager.h>

#include <algorithm>
#include <limits>
#include <thread>

using namespace std::chrono_literals;
using namespace prompter;
using namespace prompter::session;
using prompter::test::make_entry;
using prompter::test::make_session;
using prompter::test::TempDir;
using prompter::test::write_file;
using prompter::test::write_session;

namespace {

std::vector<std::string> prompts(const std::vector<ConversationEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) {
        out.push_back(e.prompt);
    }
    return out;
}

std::vector<std::string> promptRange(size_t first, size_t last) {
    std::vector<std::string> out;
    for (size_t i = first; i <= last; ++i) {
        out.push_back("prompt " + std::to_string(i));
    }
    return out;
}

struct LoaderFixture {
    TempDir dir{"prompter_lazy_"};
    config::CacheConfiguration cfg;
    std::unique_ptr<SessionCacheManager> manager;
    std::unique_ptr<LazySessionLoader> loader;

    explicit LoaderFixture(size_t cacheSize = 20) { cfg.maxSessionDataCacheSize = cacheSize; }

    void start() {
        manager = std::make_unique<SessionCacheManager>(dir.path(), cfg);
        REQUIRE(manager->initialize().has_value());
        loader = std::make_unique<LazySessionLoader>(*manager);
    }

    std::filesystem::path add(const std::string& id, size_t entries = 2,
                              const std::string& project = "project") {
        return write_session(dir.path(), id, make_session(id, project, entries));
    }
};

LazyLoadOptions withHistory(std::optional<size_t> page = {}, std::optional<size_t> limit = {}) {
    LazyLoadOptions options;
    options.includeHistory = true;
    options.historyPage = page;
    options.historyLimit = limit;
    return options;
}

LazyLoadOptions withContext() {
    LazyLoadOptions options;
    options.includeContext = true;
    return options;
}

} // namespace

TEST_CASE("History pagination", "[session][loader]") {
    LoaderFixture fx;
    fx.add("long", 25);
    fx.start();

    SECTION("limit only returns the most recent entries") {
        auto tail = fx.loader->loadSessionHistory("long", HistoryQuery{std::nullopt, 10});
        REQUIRE(tail.has_value());
        CHECK(prompts(tail.value()) == promptRange(16, 25));
    }

    SECTION("page and limit return a slice from the start") {
        auto first = fx.loader->loadSessionHistory("long", HistoryQuery{0, 10});
        REQUIRE(first.has_value());
        CHECK(prompts(first.value()) == promptRange(1, 10));

        auto third = fx.loader->getHistoryPage("long", 2, 10);
        REQUIRE(third.has_value());
        CHECK(prompts(third.value()) == promptRange(21, 25));

        auto past = fx.loader->getHistoryPage("long", 5, 10);
        REQUIRE(past.has_value());
        CHECK(past.value().empty());
    }

    SECTION("no limit returns everything") {
        auto all = fx.loader->loadSessionHistory("long");
        REQUIRE(all.has_value());
        CHECK(all.value().size() == 25);

        auto pageOnly = fx.loader->loadSessionHistory("long", HistoryQuery{3, std::nullopt});
        REQUIRE(pageOnly.has_value());
        CHECK(pageOnly.value().size() == 25);
    }

    SECTION("limit larger than the history") {
        auto tail = fx.loader->loadSessionHistory("long", HistoryQuery{std::nullopt, 100});
        REQUIRE(tail.has_value());
        CHECK(tail.value().size() == 25);
    }

    SECTION("huge pages and limits stay in range") {
        constexpr auto kMax = std::numeric_limits<size_t>::max();
        auto wrapped = fx.loader->loadSessionHistory("long", HistoryQuery{1, kMax});
        REQUIRE(wrapped.has_value());
        CHECK(wrapped.value().empty());

        auto halfway = fx.loader->loadSessionHistory("long", HistoryQuery{2, kMax / 2 + 1});
        REQUIRE(halfway.has_value());
        CHECK(halfway.value().empty());

        auto firstPage = fx.loader->getHistoryPage("long", 0, kMax);
        REQUIRE(firstPage.has_value());
        CHECK(firstPage.value().size() == 25);

        auto farPage = fx.loader->getHistoryPage("long", kMax, 2);
        REQUIRE(farPage.has_value());
        CHECK(farPage.value().empty());

        auto lazy = fx.loader->loadSessionLazy("long", withHistory(kMax / 3, 7));
        REQUIRE(lazy.has_value());
        REQUIRE(lazy.value().has_value());
        CHECK(lazy.value()->history->empty());
    }

    SECTION("missing session is an error") {
        auto missing = fx.loader->loadSessionHistory("nope");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == ErrorCode::FileNotFound);
    }
}

TEST_CASE("Lazy load returns metadata only by default", "[session][loader]") {
    LoaderFixture fx;
    fx.add("s1", 3, "alpha");
    fx.start();

    auto loaded = fx.loader->loadSessionLazy("s1");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().has_value());
    const auto& data = *loaded.value();
    CHECK(data.metadata.projectName == "alpha");
    CHECK(data.metadata.conversationCount == 3);
    CHECK_FALSE(data.history.has_value());
    CHECK_FALSE(data.context.has_value());
    CHECK_FALSE(data.isFullyLoaded);

    auto missing = fx.loader->loadSessionLazy("ghost");
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing.value().has_value());
}

TEST_CASE("Cached entries are enriched, not replaced", "[session][loader]") {
    LoaderFixture fx;
    fx.add("s1", 4);
    fx.start();

    auto first = fx.loader->loadSessionLazy("s1", withHistory());
    REQUIRE(first.has_value());
    REQUIRE(first.value().has_value());
    CHECK(first.value()->history.has_value());
    CHECK_FALSE(first.value()->context.has_value());

    auto second = fx.loader->loadSessionLazy("s1", withContext());
    REQUIRE(second.has_value());
    REQUIRE(second.value().has_value());
    const auto& data = *second.value();
    REQUIRE(data.history.has_value());
    REQUIRE(data.context.has_value());
    CHECK(data.history->size() == 4);
    CHECK(data.context->currentTopic == std::optional<std::string>("setup"));
    CHECK(data.isFullyLoaded);
    CHECK(data.loadedAt == first.value()->loadedAt);

    auto cached = fx.loader->getFromCache("s1");
    REQUIRE(cached.has_value());
    CHECK(cached->history.has_value());
    CHECK(cached->context.has_value());
}

TEST_CASE("Cache hits must cover the requested parts", "[session][loader]") {
    LoaderFixture fx;
    auto path = fx.add("s1", 12);
    fx.start();

    REQUIRE(fx.loader->loadSessionLazy("s1").has_value());
    auto stats = fx.loader->getCacheStats();
    CHECK(stats.size == 1);

    SECTION("full cached history serves a window") {
        REQUIRE(fx.loader->loadSessionLazy("s1", withHistory()).has_value());
        auto window = fx.loader->loadSessionLazy("s1", withHistory(0, 5));
        REQUIRE(window.has_value());
        REQUIRE(window.value().has_value());
        REQUIRE(window.value()->history.has_value());
        CHECK(prompts(*window.value()->history) == promptRange(1, 5));
        CHECK(window.value()->historyWindow == HistoryWindow{0, 5});

        // The cached entry still holds the whole history
        auto cached = fx.loader->getFromCache("s1");
        REQUIRE(cached.has_value());
        CHECK(cached->history->size() == 12);
    }

    SECTION("a different window is reloaded") {
        REQUIRE(fx.loader->loadSessionLazy("s1", withHistory(0, 5)).has_value());
        auto tail = fx.loader->loadSessionLazy("s1", withHistory(std::nullopt, 3));
        REQUIRE(tail.has_value());
        REQUIRE(tail.value().has_value());
        CHECK(prompts(*tail.value()->history) == promptRange(10, 12));
        CHECK_FALSE(tail.value()->isFullyLoaded);
    }

    SECTION("force refresh rereads the file") {
        REQUIRE(fx.loader->loadSessionLazy("s1", withHistory()).has_value());
        write_session(fx.dir.path(), "s1", make_session("s1", "project", 13));
        test::touch_future(path);

        auto options = withHistory();
        options.forceRefresh = true;
        auto refreshed = fx.loader->loadSessionLazy("s1", options);
        REQUIRE(refreshed.has_value());
        REQUIRE(refreshed.value().has_value());
        CHECK(refreshed.value()->history->size() == 13);
        CHECK(refreshed.value()->metadata.conversationCount == 13);
    }
}

TEST_CASE("Context loading is best effort", "[session][loader]") {
    LoaderFixture fx;
    fx.add("s1");
    write_file(fx.dir.path() / "junk.json", "not json at all");
    fx.start();

    auto context = fx.loader->loadSessionContext("s1");
    CHECK(context.currentTopic == std::optional<std::string>("setup"));
    CHECK(context.variables["env"] == "dev");

    auto missing = fx.loader->loadSessionContext("nope");
    CHECK(missing.empty());
    CHECK(missing.variables.is_object());
    CHECK(missing.decisions.is_array());
    CHECK(missing.trackedIssues.is_array());

    CHECK(fx.loader->loadSessionContext("junk").empty());
    CHECK(fx.loader->loadSessionContext("../etc").empty());
}

TEST_CASE("History streams in chunks", "[session][loader]") {
    LoaderFixture fx;
    auto path = fx.add("s1", 7);
    fx.start();

    CHECK(fx.loader->streamSessionHistory("s1", 0).error().code == ErrorCode::InvalidArgument);

    auto stream = fx.loader->streamSessionHistory("s1", 3);
    REQUIRE(stream.has_value());
    auto& chunks = stream.value();

    std::vector<size_t> sizes;
    while (auto chunk = chunks.next()) {
        sizes.push_back(chunk->size());
    }
    CHECK(sizes == std::vector<size_t>{3, 3, 1});
    CHECK(chunks.finished());
    CHECK_FALSE(chunks.error().has_value());
    CHECK_FALSE(chunks.next().has_value());

    SECTION("appends between chunks are observed") {
        chunks.reset();
        auto firstChunk = chunks.next();
        REQUIRE(firstChunk.has_value());
        CHECK(prompts(*firstChunk) == promptRange(1, 3));

        write_session(fx.dir.path(), "s1", make_session("s1", "project", 9));
        size_t total = firstChunk->size();
        while (auto chunk = chunks.next()) {
            total += chunk->size();
        }
        CHECK(total == 9);
    }

    SECTION("exact multiple ends on an empty chunk") {
        write_session(fx.dir.path(), "s1", make_session("s1", "project", 6));
        chunks.reset();
        size_t count = 0;
        while (chunks.next()) {
            ++count;
        }
        CHECK(count == 2);
        CHECK(chunks.page() == 2);
    }

    SECTION("a vanished file ends the stream with an error") {
        chunks.reset();
        std::filesystem::remove(path);
        CHECK_FALSE(chunks.next().has_value());
        REQUIRE(chunks.error().has_value());
        CHECK(chunks.error()->code == ErrorCode::FileNotFound);
    }
}

TEST_CASE("Preloading isolates failures", "[session][loader]") {
    LoaderFixture fx;
    for (int i = 0; i < 6; ++i) {
        fx.add("s" + std::to_string(i), 3);
    }
    fx.start();

    auto result = fx.loader->preloadSessions({"s0", "s1", "missing", "s2", "s3", "s4", "s5"},
                                             withHistory());
    CHECK(result.successful.size() == 6);
    REQUIRE(result.failed.size() == 1);
    CHECK(result.failed[0].sessionId == "missing");
    CHECK(result.failed[0].error.code == ErrorCode::NotFound);

    CHECK(fx.loader->getCacheStats().size == 6);
    auto cached = fx.loader->getFromCache("s4");
    REQUIRE(cached.has_value());
    CHECK(cached->history.has_value());

    auto empty = fx.loader->preloadSessions({});
    CHECK(empty.successful.empty());
    CHECK(empty.failed.empty());
}

TEST_CASE("Bulk metadata keeps input order and omits failures", "[session][loader]") {
    LoaderFixture fx;
    fx.cfg.bulkMetadataBatchSize = 4;
    std::vector<std::string> ids;
    for (int i = 0; i < 11; ++i) {
        auto id = "s" + std::to_string(i);
        fx.add(id);
        ids.push_back(id);
    }
    fx.start();

    std::reverse(ids.begin(), ids.end());
    ids.insert(ids.begin() + 3, "ghost");
    ids.insert(ids.begin() + 7, "bad/id");

    auto metadata = fx.loader->bulkLoadMetadata(ids);
    REQUIRE(metadata.size() == 11);
    std::vector<std::string> got;
    for (const auto& m : metadata) {
        got.push_back(m.sessionId);
    }
    std::vector<std::string> expected;
    for (const auto& id : ids) {
        if (id != "ghost" && id != "bad/id") {
            expected.push_back(id);
        }
    }
    CHECK(got == expected);
    CHECK(fx.loader->bulkLoadMetadata({}).empty());
}

TEST_CASE("Content search scans prompts and responses", "[session][loader]") {
    LoaderFixture fx;
    auto doc = make_session("s1", "p", 0);
    doc["history"].push_back(make_entry(1, "How do I parse JSON?", "Use a parser."));
    doc["history"].push_back(make_entry(2, "Thanks", "You can also PARSE streams."));
    doc["history"].push_back(make_entry(3, "unrelated", "nothing here"));
    write_session(fx.dir.path(), "s1", doc);
    fx.add("s2", 3);
    // Not a session document, so it never makes it into the index
    write_file(fx.dir.path() / "s3.json", "{}");
    fx.start();

    auto results = fx.loader->searchSessionContent({"s1", "s2", "missing", "s3"}, "parse");
    REQUIRE(results.size() == 1);
    const auto& hit = results[0];
    CHECK(hit.sessionId == "s1");
    CHECK(hit.metadata.sessionId == "s1");
    REQUIRE(hit.matches.size() == 3);
    CHECK(hit.matches[0].type == ContentMatch::Field::Prompt);
    CHECK(hit.matches[0].index == 0);
    CHECK(hit.matches[1].type == ContentMatch::Field::Response);
    CHECK(hit.matches[1].index == 0);
    CHECK(hit.matches[2].type == ContentMatch::Field::Response);
    CHECK(hit.matches[2].index == 1);
    CHECK(hit.matches[2].content == "You can also PARSE streams.");
    CHECK(std::string(toString(hit.matches[0].type)) == "prompt");

    CHECK(fx.loader->searchSessionContent({"s1"}, "").empty());
}

TEST_CASE("Cache validation against the file", "[session][loader]") {
    LoaderFixture fx;
    auto path = fx.add("s1");
    auto other = fx.add("s2");
    fx.start();

    REQUIRE(fx.loader->loadSessionLazy("s1", withHistory()).has_value());
    REQUIRE(fx.loader->loadSessionLazy("s2").has_value());

    CHECK(fx.loader->validateCachedSession("s1"));
    CHECK_FALSE(fx.loader->validateCachedSession("uncached"));

    test::touch_future(path);
    CHECK_FALSE(fx.loader->validateCachedSession("s1"));
    CHECK_FALSE(fx.loader->getFromCache("s1").has_value());

    std::filesystem::remove(other);
    CHECK_FALSE(fx.loader->validateCachedSession("s2"));
    CHECK(fx.loader->getCacheStats().size == 0);
}

TEST_CASE("Loader cache hygiene and statistics", "[session][loader]") {
    LoaderFixture fx(2);
    fx.cfg.sessionDataMaxAge = 40ms;
    for (int i = 0; i < 3; ++i) {
        fx.add("s" + std::to_string(i));
    }
    fx.start();

    REQUIRE(fx.loader->loadSessionLazy("s0").has_value());
    REQUIRE(fx.loader->loadSessionLazy("s1").has_value());
    REQUIRE(fx.loader->loadSessionLazy("s2").has_value());

    auto stats = fx.loader->getCacheStats();
    CHECK(stats.size == 2);
    CHECK(stats.capacity == 2);
    CHECK(stats.averageLoadTimeMs >= 0.0);
    CHECK(stats.estimatedMemoryUsage > 0);
    CHECK_FALSE(fx.loader->getFromCache("s0").has_value());

    // A second identical request is served from the cache
    REQUIRE(fx.loader->loadSessionLazy("s2").has_value());
    CHECK(fx.loader->getCacheStats().hitRate > 0.0);

    CHECK(fx.loader->evictFromCache("s1"));
    CHECK_FALSE(fx.loader->evictFromCache("s1"));

    std::this_thread::sleep_for(80ms);
    CHECK(fx.loader->optimizeCache() == 1);
    CHECK(fx.loader->getCacheStats().size == 0);

    REQUIRE(fx.loader->loadSessionLazy("s0").has_value());
    fx.loader->clearCache();
    CHECK(fx.loader->getCacheStats().size == 0);
    CHECK(fx.loader->getCacheStats().averageLoadTimeMs == 0.0);
}

TEST_CASE("Nested look-alike members do not leak into loads", "[session][loader]") {
    LoaderFixture fx;

    // Written with sorted keys, so the context precedes the history
    auto shadowed = make_session("shadowed", "p", 3);
    shadowed["context"]["variables"]["history"] = nlohmann::json::array();
    write_session(fx.dir.path(), "shadowed", shadowed);

    auto innerContext = make_session("inner", "p", 2);
    innerContext["context"]["variables"]["context"] = {{"x", 1}};
    innerContext["context"]["decisions"] = nlohmann::json::array({"keep"});
    write_file(fx.dir.path() / "inner.json",
               test::dump_in_order(innerContext, {"metadata", "history", "context"}));
    fx.start();

    auto metadata = fx.manager->getSessionMetadata("shadowed");
    REQUIRE(metadata.has_value());
    REQUIRE(metadata.value().has_value());
    CHECK(metadata.value()->conversationCount == 3);

    auto history = fx.loader->loadSessionHistory("shadowed");
    REQUIRE(history.has_value());
    CHECK(prompts(history.value()) == promptRange(1, 3));

    auto context = fx.loader->loadSessionContext("inner");
    CHECK(context.decisions == nlohmann::json::array({"keep"}));
    CHECK(context.variables["env"] == "dev");
    CHECK(context.variables["context"]["x"] == 1);
    CHECK(context.extra.empty());

    auto full = fx.loader->loadFullSession("inner");
    REQUIRE(full.has_value());
    REQUIRE(full.value().has_value());
    CHECK(full.value()->history->size() == 2);
    CHECK(full.value()->context->currentTopic == std::optional<std::string>("setup"));
}
