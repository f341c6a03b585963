#pragma once

#include <prompter/config/cache_config.h>
#include <prompter/core/types.h>
#include <prompter/io/concurrent_file_processor.h>
#include <prompter/session/session_types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace prompter::session {

enum class IndexState { Uninitialized, Rebuilding, Loaded };

const char* toString(IndexState state);

/**
 * @brief Outcome of a full directory scan
 */
struct RebuildSummary {
    size_t indexed = 0;
    size_t failed = 0;
    std::vector<io::FileFailure> failures;
    std::chrono::milliseconds duration{0};
    io::ProcessingStats processing;
};

struct MetadataCacheStats {
    IndexState state = IndexState::Uninitialized;
    size_t entries = 0;
    std::optional<TimePoint> lastCacheUpdate;           ///< Newest entry computation
    std::optional<TimePoint> lastRebuild;
    std::chrono::milliseconds lastRebuildDuration{0};
    size_t estimatedMemoryUsage = 0;                    ///< Serialized size of all entries
};

struct ProcessingSnapshot {
    io::ProcessingStats fileProcessor;
    io::ProcessorSemaphoreStats semaphores;
};

/**
 * @brief Persisted index of every session file in one directory
 *
 * The index lives in memory and in `<sessionDirectory>/<cacheFileName>`.
 * initialize() loads it, or rebuilds it from the session files when the file
 * is missing or corrupt. Entries are revalidated lazily on direct lookup: an
 * entry older than maxMetadataCacheAge, or whose file changed after it was
 * computed, is re-extracted from that single file.
 *
 * Every mutation rewrites the index file; a failed write is returned to the
 * caller. Concurrent updates of the same session are last-writer-wins.
 */
class SessionCacheManager {
public:
    SessionCacheManager(std::filesystem::path sessionDirectory,
                        config::CacheConfiguration config = {});
    ~SessionCacheManager();

    SessionCacheManager(const SessionCacheManager&) = delete;
    SessionCacheManager& operator=(const SessionCacheManager&) = delete;

    // ===== Lifecycle =====

    /**
     * @brief Create the session directory if needed and load or rebuild the index
     *
     * A second call after success is a no-op.
     */
    Result<void> initialize();

    /// Replace the in-memory index with the persisted one; FileNotFound or CorruptedData on failure
    Result<void> loadMetadataCache();

    /// Write the in-memory index to disk atomically
    Result<void> saveMetadataCache();

    /**
     * @brief Scan the session directory and re-extract every session file
     *
     * Files that fail are logged and left out of the index. Entries without a
     * successfully extracted file are removed. The index is persisted afterwards.
     */
    Result<RebuildSummary> rebuildCache();

    /// Drop processing resources
    void cleanup();

    // ===== Queries =====

    /**
     * @brief Index entry for one session, revalidated against its file
     * @return nullopt when the session file does not exist or is not a valid session
     */
    Result<std::optional<SessionMetadataCache>> getSessionMetadata(const std::string& sessionId);

    /// Every indexed entry, most recently accessed first. Entries are not revalidated.
    Result<std::vector<SessionMetadataCache>> getAllSessionMetadata() const;

    /// Case-insensitive substring match over project name, description, tags, languages and patterns
    Result<std::vector<SessionMetadataCache>> searchMetadata(const std::string& query) const;

    // ===== Mutations =====

    /// @return false when the session is not indexed
    Result<bool> updateSessionMetadata(const std::string& sessionId,
                                       const SessionMetadataPatch& patch);

    Result<void> invalidateSessionCache(const std::string& sessionId);

    /// Remove entries whose file is gone or that fail validation; returns the number removed
    Result<size_t> cleanupStaleEntries();

    // ===== Introspection =====

    MetadataCacheStats getCacheStats() const;
    ProcessingSnapshot getProcessingStats() const;
    void reconfigureProcessing(const io::ConcurrentProcessingConfig& config);

    IndexState state() const noexcept { return state_.load(); }
    size_t size() const;

    const std::filesystem::path& sessionDirectory() const noexcept { return sessionDirectory_; }
    const std::filesystem::path& cacheFilePath() const noexcept { return cacheFilePath_; }
    const config::CacheConfiguration& config() const noexcept { return config_; }

    /// `<sessionDirectory>/<sessionId>.json`; InvalidArgument for ids that are not plain file stems
    Result<std::filesystem::path> sessionFilePath(const std::string& sessionId) const;

private:
    enum class Validity { Valid, Stale, Missing };

    Result<void> requireInitialized() const;
    Validity validate(const SessionMetadataCache& entry) const;
    Result<SessionMetadataCache> extractFromFile(const std::filesystem::path& path) const;
    Result<void> eraseAndPersist(const std::string& sessionId);
    std::vector<SessionMetadataCache> sortedEntries(bool (*keep)(const SessionMetadataCache&,
                                                                 const std::string&),
                                                    const std::string& query) const;

    std::filesystem::path sessionDirectory_;
    std::filesystem::path cacheFilePath_;
    config::CacheConfiguration config_;
    std::unique_ptr<io::ConcurrentFileProcessor> fileProcessor_;

    std::atomic<IndexState> state_{IndexState::Uninitialized};
    std::mutex initMutex_;
    std::mutex rebuildMutex_;
    std::mutex saveMutex_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionMetadataCache> entries_;
    std::optional<TimePoint> lastRebuild_;
    std::chrono::milliseconds lastRebuildDuration_{0};
};

} // namespace prompter::session
