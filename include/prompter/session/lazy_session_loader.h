#pragma once

#include <prompter/cache/lru_cache.h>
#include <prompter/config/cache_config.h>
#include <prompter/core/types.h>
#include <prompter/session/session_types.h>

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prompter::session {

class SessionCacheManager;
class LazySessionLoader;

struct SessionLoadFailure {
    std::string sessionId;
    Error error;
};

/// Outcome of preloadSessions; one entry per requested id in either list
struct BatchOperationResult {
    std::vector<std::string> successful;
    std::vector<SessionLoadFailure> failed;
    std::chrono::milliseconds totalTime{0};
};

struct ContentMatch {
    enum class Field { Prompt, Response };

    Field type = Field::Prompt;
    std::string content;
    size_t index = 0; ///< Position of the entry in the session history
};

const char* toString(ContentMatch::Field field);

struct ContentSearchResult {
    std::string sessionId;
    SessionMetadataCache metadata;
    std::vector<ContentMatch> matches;
};

struct LazyLoaderStats {
    size_t size = 0;
    size_t capacity = 0;
    double hitRate = 0.0;             ///< Percent
    double averageLoadTimeMs = 0.0;   ///< Over the most recent loads
    size_t estimatedMemoryUsage = 0;
};

/**
 * @brief Restartable chunked view over one session history
 *
 * Every chunk re-reads the session file, so entries appended between chunks
 * are observed. The stream ends after an empty chunk or a chunk shorter than
 * the chunk size, or when a read fails (see error()).
 */
class HistoryStream {
public:
    /// Next chunk, or nullopt once the stream has ended
    std::optional<std::vector<ConversationEntry>> next();

    /// Start again from the first chunk
    void reset();

    size_t page() const noexcept { return page_; }
    size_t chunkSize() const noexcept { return chunkSize_; }
    bool finished() const noexcept { return finished_; }
    const std::optional<Error>& error() const noexcept { return error_; }

private:
    friend class LazySessionLoader;
    HistoryStream(LazySessionLoader& loader, std::string sessionId, size_t chunkSize);

    LazySessionLoader* loader_;
    std::string sessionId_;
    size_t chunkSize_;
    size_t page_ = 0;
    bool finished_ = false;
    std::optional<Error> error_;
};

/**
 * @brief Materializes only the parts of a session a caller asks for
 *
 * Metadata always comes from the SessionCacheManager. History and context are
 * read straight from the session file on demand and the combined result is
 * kept in a bounded LRU cache. A cached entry is reused only when it already
 * holds every requested part; otherwise the missing parts are loaded and merged
 * into it.
 *
 * Cached data is provisional: use validateCachedSession() before relying on it
 * for anything correctness-sensitive.
 */
class LazySessionLoader {
public:
    explicit LazySessionLoader(SessionCacheManager& manager);
    LazySessionLoader(SessionCacheManager& manager, config::CacheConfiguration config);
    ~LazySessionLoader();

    LazySessionLoader(const LazySessionLoader&) = delete;
    LazySessionLoader& operator=(const LazySessionLoader&) = delete;

    /**
     * @brief Load metadata plus the requested parts of a session
     * @return nullopt when the manager has no metadata for the session
     */
    Result<std::optional<LazySessionData>> loadSessionLazy(const std::string& sessionId,
                                                           const LazyLoadOptions& options = {});

    /// History and context together
    Result<std::optional<LazySessionData>> loadFullSession(const std::string& sessionId);

    /**
     * @brief Read the history of a session
     *
     * With page and limit the slice [page*limit, page*limit+limit) is returned.
     * With only a limit the most recent `limit` entries are returned. Without a
     * limit the whole history is returned.
     */
    Result<std::vector<ConversationEntry>> loadSessionHistory(const std::string& sessionId,
                                                              const HistoryQuery& query = {});

    Result<std::vector<ConversationEntry>> getHistoryPage(const std::string& sessionId,
                                                          size_t page, size_t limit);

    /// Best effort; an unreadable session yields an empty context
    SessionContext loadSessionContext(const std::string& sessionId);

    /// InvalidArgument when chunkSize is zero
    Result<HistoryStream> streamSessionHistory(const std::string& sessionId, size_t chunkSize);

    /// Warm the cache; at most preloadConcurrency loads run at once
    BatchOperationResult preloadSessions(const std::vector<std::string>& sessionIds,
                                         const LazyLoadOptions& options = {});

    /// Metadata for every id that resolves, in input order; failures are left out
    std::vector<SessionMetadataCache> bulkLoadMetadata(const std::vector<std::string>& sessionIds);

    /// Case-insensitive substring search over prompts and responses
    std::vector<ContentSearchResult> searchSessionContent(const std::vector<std::string>& sessionIds,
                                                          const std::string& query);

    // ===== Cache access (no disk I/O) =====

    std::optional<LazySessionData> getFromCache(const std::string& sessionId);
    bool evictFromCache(const std::string& sessionId);
    void clearCache();

    /// False, after evicting, when the session file is gone or changed since the entry was loaded
    bool validateCachedSession(const std::string& sessionId);

    /// Evict entries idle for longer than sessionDataMaxAge; returns the number evicted
    size_t optimizeCache();

    LazyLoaderStats getCacheStats() const;

private:
    static bool satisfies(const LazySessionData& data, const LazyLoadOptions& options);
    static LazySessionData project(const LazySessionData& data, const LazyLoadOptions& options);
    static std::vector<ConversationEntry> paginate(std::vector<ConversationEntry> history,
                                                   const HistoryWindow& window);
    void recordLoadTime(std::chrono::steady_clock::time_point started);

    SessionCacheManager& manager_;
    config::CacheConfiguration config_;
    cache::LRUCache<LazySessionData> cache_;

    mutable std::mutex loadTimesMutex_;
    std::deque<double> loadTimesMs_;
};

} // namespace prompter::session
