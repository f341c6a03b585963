#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <prompter/core/time_parser.h>
#include <prompter/session/session_json.h>

using namespace std::chrono_literals;
using namespace prompter;
using namespace prompter::session;
using nlohmann::json;

namespace {
TimePoint at(const char* iso) {
    auto tp = core::TimeParser::parseISO8601(iso);
    REQUIRE(tp.has_value());
    return *tp;
}
} // namespace

TEST_CASE("Session enums use their on-disk spelling", "[session][json]") {
    CHECK(std::string(toString(SessionStatus::Archived)) == "archived");
    CHECK(parseSessionStatus("completed") == std::optional<SessionStatus>(SessionStatus::Completed));
    CHECK_FALSE(parseSessionStatus("Completed").has_value());

    CHECK(std::string(toString(EntrySource::ModelA)) == "claude");
    CHECK(std::string(toString(EntrySource::ModelB)) == "gpt-4o");
    CHECK(parseEntrySource("model-b") == std::optional<EntrySource>(EntrySource::ModelB));
    CHECK_FALSE(parseEntrySource("robot").has_value());
}

TEST_CASE("Session document parses into its parts", "[session][json]") {
    auto doc = test::make_session("s1", "alpha", 3);
    doc["context"]["customNote"] = "kept";
    doc["history"][0]["metadata"] = {{"tokens", 12}};

    auto session = sessionFromJson(doc);
    REQUIRE(session.has_value());
    const auto& s = session.value();

    CHECK(s.metadata.projectName == "alpha");
    CHECK(s.metadata.createdDate == at("2024-03-01T09:00:00.000Z"));
    CHECK(s.metadata.tags == std::vector<std::string>{"demo"});
    REQUIRE(s.history.size() == 3);
    CHECK(s.history[0].prompt == "prompt 1");
    CHECK(s.history[0].source == EntrySource::ModelA);
    CHECK(s.history[1].source == EntrySource::User);
    REQUIRE(s.history[0].metadata.has_value());
    CHECK((*s.history[0].metadata)["tokens"] == 12);
    CHECK(s.context.currentTopic == std::optional<std::string>("setup"));
    CHECK(s.context.variables["env"] == "dev");
    CHECK(s.context.extra["customNote"] == "kept");

    // Unknown context members survive a write
    auto written = toJson(s.context);
    CHECK(written["customNote"] == "kept");
    CHECK(written["trackedIssues"].is_array());
}

TEST_CASE("Metadata parsing fills documented defaults", "[session][json]") {
    json minimal = {{"createdDate", "2024-01-01T00:00:00Z"}};
    auto metadata = metadataFromJson(minimal);
    REQUIRE(metadata.has_value());
    CHECK(metadata.value().projectName == "unknown");
    CHECK(metadata.value().lastAccessed == metadata.value().createdDate);
    CHECK(metadata.value().status == SessionStatus::Active);
    CHECK(metadata.value().tags.empty());
    CHECK_FALSE(metadata.value().description.has_value());
}

TEST_CASE("Structural mismatches are validation errors", "[session][json]") {
    auto expectInvalid = [](const json& doc) {
        auto session = sessionFromJson(doc);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error().code == ErrorCode::ValidationError);
    };

    auto base = test::make_session("s1", "alpha");

    SECTION("no metadata") {
        auto doc = base;
        doc.erase("metadata");
        expectInvalid(doc);
    }
    SECTION("history is not an array") {
        auto doc = base;
        doc["history"] = {{"prompt", "x"}};
        expectInvalid(doc);
    }
    SECTION("entry without a timestamp") {
        auto doc = base;
        doc["history"][0].erase("timestamp");
        expectInvalid(doc);
    }
    SECTION("unknown source") {
        auto doc = base;
        doc["history"][1]["source"] = "robot";
        expectInvalid(doc);
    }
    SECTION("context is an array") {
        auto doc = base;
        doc["context"] = json::array();
        expectInvalid(doc);
    }
    SECTION("bad date") {
        auto doc = base;
        doc["metadata"]["createdDate"] = "last tuesday";
        expectInvalid(doc);
    }
    SECTION("tags with numbers") {
        auto doc = base;
        doc["metadata"]["tags"] = {1, 2};
        expectInvalid(doc);
    }
    SECTION("not an object") {
        expectInvalid(json::array({1, 2, 3}));
    }
}

TEST_CASE("Index entries round trip through JSON", "[session][json]") {
    SessionMetadataCache entry;
    entry.sessionId = "abc";
    entry.projectName = "proj";
    entry.createdDate = at("2024-01-02T03:04:05.678Z");
    entry.lastAccessed = at("2024-02-02T03:04:05.001Z");
    entry.status = SessionStatus::Completed;
    entry.tags = {"x", "y"};
    entry.description = "desc";
    entry.conversationCount = 4;
    entry.lastEntryTimestamp = at("2024-02-01T00:00:00.000Z");
    entry.languages = {"python"};
    entry.patterns = {"testing", "database"};
    entry.fileSize = 1234;
    entry.lastCacheUpdate = core::TimeParser::toMillis(std::chrono::system_clock::now());
    entry.filePath = "/tmp/abc.json";

    auto text = toJson(entry).dump();
    auto parsed = metadataCacheFromJson(json::parse(text));
    REQUIRE(parsed.has_value());
    CHECK(parsed.value() == entry);

    SECTION("optional members may be absent") {
        entry.description.reset();
        entry.lastEntryTimestamp.reset();
        auto again = metadataCacheFromJson(toJson(entry));
        REQUIRE(again.has_value());
        CHECK(again.value() == entry);
    }

    SECTION("negative counts are rejected") {
        auto j = toJson(entry);
        j["conversationCount"] = -1;
        auto bad = metadataCacheFromJson(j);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == ErrorCode::ValidationError);
    }
}

TEST_CASE("Lazy session data serializes only loaded parts", "[session][json]") {
    LazySessionData data;
    data.metadata.sessionId = "s";
    data.loadedAt = at("2024-01-01T00:00:00Z");

    auto j = toJson(data);
    CHECK_FALSE(j.contains("history"));
    CHECK_FALSE(j.contains("context"));
    CHECK(j["isFullyLoaded"] == false);

    data.history = std::vector<ConversationEntry>{};
    data.context = SessionContext{};
    auto full = toJson(data);
    CHECK(full["history"].is_array());
    CHECK(full["context"]["variables"].is_object());
}
