#pragma once

#include <prompter/core/types.h>
#include <prompter/session/session_types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prompter::session {

/**
 * @brief Derives index records and partial session content from raw file text
 *
 * Every field group has a fast path that locates the relevant JSON fragment
 * with a regex and parses only that fragment, and a slow path that parses the
 * whole document. The slow path is taken when the fragment cannot be located or
 * fails to parse or validate.
 */
class MetadataExtractor {
public:
    /// Header fields of a session plus the conversation figures
    struct HeaderInfo {
        SessionMetadata metadata;
        size_t conversationCount = 0;
        std::optional<TimePoint> lastEntryTimestamp;
        bool usedFastPath = false;
    };

    /**
     * @brief Build an index record for one session file
     *
     * The session id is the file stem. Fails with ValidationError or
     * CorruptedData when neither path yields valid metadata.
     */
    static Result<SessionMetadataCache> extract(const std::filesystem::path& filePath,
                                                const std::string& content,
                                                TimePoint computedAt);

    static Result<HeaderInfo> extractHeader(const std::string& content);

    /// Fast path only; nullopt when the metadata object cannot be located or is invalid
    static std::optional<HeaderInfo> extractHeaderFast(const std::string& content);

    /// Slow path: full parse
    static Result<HeaderInfo> extractHeaderFull(const std::string& content);

    /// Context with the same two-tier strategy
    static Result<SessionContext> extractContext(const std::string& content);
    static std::optional<SessionContext> extractContextFast(const std::string& content);

    /// History array with the same two-tier strategy
    static Result<std::vector<ConversationEntry>> extractHistory(const std::string& content);

    static Result<Session> parseSession(const std::string& content);

    // Topic tables, applied independently; a text may match any number of them
    static std::vector<std::string> detectLanguages(std::string_view text);
    static std::vector<std::string> detectPatterns(std::string_view text);

    /**
     * @brief Locate the JSON value that follows `"key":` and return its raw text
     *
     * key is one of "metadata", "history" or "context". Only members of the
     * root object are considered; occurrences in nested values or inside string
     * literals are skipped. Only objects and arrays are returned. With `last`
     * set the final root-level occurrence of the key is used.
     */
    static std::optional<std::string_view> findValueFragment(std::string_view content,
                                                             const std::string& key,
                                                             bool last = false);

    static size_t countPromptMarkers(std::string_view text);
    static std::optional<TimePoint> lastTimestampMarker(std::string_view text);
};

} // namespace prompter::session
