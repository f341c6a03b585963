#pragma once

#include <prompter/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prompter::session {

inline constexpr const char* kCacheVersion = "1.0.0";

enum class SessionStatus { Active, Completed, Archived };

/// Who produced a conversation entry. On disk: "user", "claude", "gpt-4o".
enum class EntrySource { User, ModelA, ModelB };

const char* toString(SessionStatus status);
std::optional<SessionStatus> parseSessionStatus(std::string_view text);

const char* toString(EntrySource source);
/// Accepts the on-disk names plus "model-a" / "model-b"
std::optional<EntrySource> parseEntrySource(std::string_view text);

struct ConversationEntry {
    std::string prompt;
    std::string response;
    TimePoint timestamp;
    EntrySource source = EntrySource::User;
    std::optional<nlohmann::json> metadata; ///< Free-form (model, tokens, duration, ...)

    bool operator==(const ConversationEntry&) const = default;
};

/**
 * @brief Free-form session state
 *
 * The well-known members are split out; any other top-level member of the
 * context object is kept verbatim in `extra`.
 */
struct SessionContext {
    std::optional<std::string> currentTopic;
    nlohmann::json variables = nlohmann::json::object();
    nlohmann::json decisions = nlohmann::json::array();
    nlohmann::json trackedIssues = nlohmann::json::array();
    nlohmann::json extra = nlohmann::json::object();

    bool empty() const {
        return !currentTopic && variables.empty() && decisions.empty() && trackedIssues.empty() &&
               extra.empty();
    }

    bool operator==(const SessionContext&) const = default;
};

struct SessionMetadata {
    std::string sessionId;
    std::string projectName;
    TimePoint createdDate;
    TimePoint lastAccessed;
    SessionStatus status = SessionStatus::Active;
    std::optional<std::string> description;
    std::vector<std::string> tags;

    bool operator==(const SessionMetadata&) const = default;
};

struct Session {
    SessionMetadata metadata;
    std::vector<ConversationEntry> history;
    SessionContext context;
};

/**
 * @brief Index record describing one session file
 *
 * conversationCount and lastEntryTimestamp describe the file as it was at
 * lastCacheUpdate.
 */
struct SessionMetadataCache {
    std::string sessionId;
    std::string projectName;
    TimePoint createdDate;
    TimePoint lastAccessed;
    SessionStatus status = SessionStatus::Active;
    std::vector<std::string> tags;
    std::optional<std::string> description;

    size_t conversationCount = 0;
    std::optional<TimePoint> lastEntryTimestamp;
    std::vector<std::string> languages;
    std::vector<std::string> patterns;
    uint64_t fileSize = 0;

    TimePoint lastCacheUpdate;
    std::string cacheVersion = kCacheVersion;
    std::string filePath;

    bool operator==(const SessionMetadataCache&) const = default;
};

/// Partial update for SessionCacheManager::updateSessionMetadata
struct SessionMetadataPatch {
    std::optional<std::string> projectName;
    std::optional<TimePoint> lastAccessed;
    std::optional<SessionStatus> status;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> description;
};

/// Slice of history a load was made with; both empty means the full history
struct HistoryWindow {
    std::optional<size_t> page;
    std::optional<size_t> limit;

    bool isFull() const { return !limit; }
    bool operator==(const HistoryWindow&) const = default;
};

struct LazySessionData {
    SessionMetadataCache metadata;
    std::optional<std::vector<ConversationEntry>> history;
    HistoryWindow historyWindow; ///< Meaningful only when history is set
    std::optional<SessionContext> context;
    bool isFullyLoaded = false;
    TimePoint loadedAt;
};

struct LazyLoadOptions {
    bool includeHistory = false;
    bool includeContext = false;
    std::optional<size_t> historyPage;
    std::optional<size_t> historyLimit;
    bool forceRefresh = false;
};

struct HistoryQuery {
    std::optional<size_t> historyPage;
    std::optional<size_t> historyLimit;
};

} // namespace prompter::session
