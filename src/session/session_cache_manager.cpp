#include <prompter/core/time_parser.h>
#include <prompter/io/file_utils.h>
#include <prompter/session/metadata_extractor.h>
#include <prompter/session/session_cache_manager.h>
#include <prompter/session/session_json.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace prompter::session {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

io::ConcurrentProcessingConfig processingConfigFor(const config::CacheConfiguration& cfg) {
    io::ConcurrentProcessingConfig pc;
    pc.maxConcurrentReads = cfg.concurrentFileReads;
    pc.maxConcurrentWrites = cfg.concurrentFileWrites;
    pc.operationTimeout = cfg.operationTimeout;
    pc.batchSize = std::max<size_t>(10, cfg.concurrentFileReads * 2);
    pc.enablePerformanceTracking = true;
    return pc;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool matchesQuery(const SessionMetadataCache& entry, const std::string& lowerQuery) {
    std::string text = entry.projectName;
    text += ' ';
    text += entry.description.value_or("");
    for (const auto* list : {&entry.tags, &entry.languages, &entry.patterns}) {
        for (const auto& item : *list) {
            text += ' ';
            text += item;
        }
    }
    return toLower(std::move(text)).find(lowerQuery) != std::string::npos;
}

bool keepAll(const SessionMetadataCache&, const std::string&) {
    return true;
}

TimePoint nowMillis() {
    return std::chrono::time_point_cast<TimePoint::duration>(
        std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()));
}

} // namespace

const char* toString(IndexState state) {
    switch (state) {
        case IndexState::Uninitialized:
            return "uninitialized";
        case IndexState::Rebuilding:
            return "rebuilding";
        case IndexState::Loaded:
            return "loaded";
    }
    return "uninitialized";
}

SessionCacheManager::SessionCacheManager(fs::path sessionDirectory,
                                         config::CacheConfiguration config)
    : sessionDirectory_(std::move(sessionDirectory)),
      cacheFilePath_(sessionDirectory_ / config.cacheFileName), config_(std::move(config)),
      fileProcessor_(
          std::make_unique<io::ConcurrentFileProcessor>(processingConfigFor(config_))) {}

SessionCacheManager::~SessionCacheManager() = default;

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Result<void> SessionCacheManager::initialize() {
    std::lock_guard<std::mutex> initLock(initMutex_);
    if (state_.load() == IndexState::Loaded) {
        return Result<void>();
    }

    std::error_code ec;
    fs::create_directories(sessionDirectory_, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to create session directory " +
                                             sessionDirectory_.string() + ": " + ec.message()};
    }

    auto loaded = loadMetadataCache();
    if (loaded) {
        spdlog::debug("[SessionCacheManager] Loaded {} index entries from {}", size(),
                      cacheFilePath_.string());
        return Result<void>();
    }

    if (loaded.error().code == ErrorCode::FileNotFound) {
        spdlog::info("[SessionCacheManager] No index at {}, rebuilding", cacheFilePath_.string());
    } else {
        spdlog::warn("[SessionCacheManager] Index unusable ({}), rebuilding",
                     loaded.error().message);
    }

    auto rebuilt = rebuildCache();
    if (!rebuilt) {
        return rebuilt.error();
    }
    return Result<void>();
}

Result<void> SessionCacheManager::loadMetadataCache() {
    auto content = io::readFileContents(cacheFilePath_);
    if (!content) {
        return content.error();
    }

    auto document = json::parse(content.value(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Error{ErrorCode::CorruptedData, "Index file is not a JSON object"};
    }

    std::unordered_map<std::string, SessionMetadataCache> loaded;
    loaded.reserve(document.size());
    for (auto it = document.begin(); it != document.end(); ++it) {
        auto entry = metadataCacheFromJson(it.value());
        if (!entry) {
            return Error{ErrorCode::CorruptedData,
                         "Index entry '" + it.key() + "': " + entry.error().message};
        }
        if (entry.value().sessionId != it.key()) {
            return Error{ErrorCode::CorruptedData,
                         "Index entry '" + it.key() + "' carries id '" +
                             entry.value().sessionId + "'"};
        }
        loaded.emplace(it.key(), std::move(entry).value());
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_ = std::move(loaded);
    }
    state_.store(IndexState::Loaded);
    return Result<void>();
}

Result<void> SessionCacheManager::saveMetadataCache() {
    // Serialize snapshot and write under one lock so the newest state always lands last
    std::lock_guard<std::mutex> saveLock(saveMutex_);
    json document = json::object();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            document[id] = toJson(entry);
        }
    }

    auto written = io::atomicWrite(cacheFilePath_, document.dump(2));
    if (!written) {
        spdlog::error("[SessionCacheManager] Failed to persist index {}: {}",
                      cacheFilePath_.string(), written.error().message);
        return written.error();
    }
    return Result<void>();
}

Result<RebuildSummary> SessionCacheManager::rebuildCache() {
    std::lock_guard<std::mutex> rebuildLock(rebuildMutex_);
    const auto previousState = state_.exchange(IndexState::Rebuilding);
    const auto started = std::chrono::steady_clock::now();
    const auto computedAt = std::chrono::system_clock::now();

    std::vector<std::string> filePaths;
    std::error_code ec;
    for (fs::directory_iterator it(sessionDirectory_, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& path = it->path();
        auto name = path.filename().string();
        std::error_code typeEc;
        if (path.extension() == ".json" && !name.empty() && name.front() != '.' &&
            it->is_regular_file(typeEc)) {
            filePaths.push_back(path.string());
        }
    }
    if (ec) {
        state_.store(previousState);
        return Error{ErrorCode::IOError, "Failed to list " + sessionDirectory_.string() + ": " +
                                             ec.message()};
    }

    spdlog::info("[SessionCacheManager] Rebuilding index from {} session files",
                 filePaths.size());

    auto processed = fileProcessor_->processFilesInBatches<SessionMetadataCache>(
        filePaths, [computedAt](const std::string& path, const std::string& content) {
            return MetadataExtractor::extract(path, content, computedAt);
        });

    for (const auto& failure : processed.failed) {
        spdlog::warn("[SessionCacheManager] Skipping {}: {}", failure.filePath, failure.error);
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        std::unordered_set<std::string> rebuilt;
        for (auto& entry : processed.successful) {
            rebuilt.insert(entry.sessionId);
            entries_[entry.sessionId] = std::move(entry);
        }
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (rebuilt.count(it->first) == 0) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    RebuildSummary summary;
    summary.indexed = processed.successful.size();
    summary.failed = processed.failed.size();
    summary.failures = std::move(processed.failed);
    summary.processing = processed.stats;
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        lastRebuild_ = std::chrono::system_clock::now();
        lastRebuildDuration_ = summary.duration;
    }
    state_.store(IndexState::Loaded);

    spdlog::info("[SessionCacheManager] Index rebuilt: {} indexed, {} failed in {}ms "
                 "(avg {:.1f}ms/file, {:.1f}% concurrency utilization)",
                 summary.indexed, summary.failed, summary.duration.count(),
                 summary.processing.averageProcessingTimeMs,
                 summary.processing.concurrencyUtilization);

    if (auto saved = saveMetadataCache(); !saved) {
        return saved.error();
    }
    return summary;
}

void SessionCacheManager::cleanup() {
    fileProcessor_->cleanup();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<void> SessionCacheManager::requireInitialized() const {
    if (state_.load() == IndexState::Uninitialized) {
        return Error{ErrorCode::NotInitialized, "SessionCacheManager::initialize() not called"};
    }
    return Result<void>();
}

Result<fs::path> SessionCacheManager::sessionFilePath(const std::string& sessionId) const {
    if (sessionId.empty() || sessionId.front() == '.' ||
        sessionId.find_first_of("/\\") != std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "Invalid session id: '" + sessionId + "'"};
    }
    return sessionDirectory_ / (sessionId + ".json");
}

SessionCacheManager::Validity
SessionCacheManager::validate(const SessionMetadataCache& entry) const {
    // Checked at the canonical location; the directory may have moved since indexing
    const auto canonical = sessionDirectory_ / (entry.sessionId + ".json");
    auto mtime = io::fileModificationTime(canonical);
    if (!mtime) {
        return Validity::Missing;
    }
    if (fs::path(entry.filePath) != canonical) {
        return Validity::Stale;
    }
    auto age = std::chrono::system_clock::now() - entry.lastCacheUpdate;
    if (age < config_.maxMetadataCacheAge && mtime.value() <= entry.lastCacheUpdate) {
        return Validity::Valid;
    }
    return Validity::Stale;
}

Result<SessionMetadataCache> SessionCacheManager::extractFromFile(const fs::path& path) const {
    const auto computedAt = std::chrono::system_clock::now();
    auto content = io::readFileContents(path);
    if (!content) {
        return content.error();
    }
    return MetadataExtractor::extract(path, content.value(), computedAt);
}

Result<void> SessionCacheManager::eraseAndPersist(const std::string& sessionId) {
    size_t erased = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        erased = entries_.erase(sessionId);
    }
    if (erased == 0) {
        return Result<void>();
    }
    return saveMetadataCache();
}

Result<std::optional<SessionMetadataCache>>
SessionCacheManager::getSessionMetadata(const std::string& sessionId) {
    if (auto ready = requireInitialized(); !ready) {
        return ready.error();
    }
    auto path = sessionFilePath(sessionId);
    if (!path) {
        return path.error();
    }

    std::optional<SessionMetadataCache> cached;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (auto it = entries_.find(sessionId); it != entries_.end()) {
            cached = it->second;
        }
    }

    if (cached) {
        switch (validate(*cached)) {
            case Validity::Valid:
                return cached;
            case Validity::Missing:
            case Validity::Stale:
                // A missing file is confirmed by the extraction below
                spdlog::debug("[SessionCacheManager] Entry {} is stale, re-extracting", sessionId);
                break;
        }
    }

    auto fresh = extractFromFile(path.value());
    if (!fresh) {
        if (fresh.error().code != ErrorCode::FileNotFound) {
            spdlog::warn("[SessionCacheManager] Dropping {}: {}", sessionId,
                         fresh.error().message);
        }
        if (auto erased = eraseAndPersist(sessionId); !erased) {
            return erased.error();
        }
        return std::optional<SessionMetadataCache>{};
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[sessionId] = fresh.value();
    }
    if (auto saved = saveMetadataCache(); !saved) {
        return saved.error();
    }
    return std::optional<SessionMetadataCache>(std::move(fresh).value());
}

std::vector<SessionMetadataCache>
SessionCacheManager::sortedEntries(bool (*keep)(const SessionMetadataCache&, const std::string&),
                                   const std::string& query) const {
    std::vector<SessionMetadataCache> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            if (keep(entry, query)) {
                out.push_back(entry);
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.lastAccessed != b.lastAccessed) {
            return a.lastAccessed > b.lastAccessed;
        }
        return a.sessionId < b.sessionId;
    });
    return out;
}

Result<std::vector<SessionMetadataCache>> SessionCacheManager::getAllSessionMetadata() const {
    if (auto ready = requireInitialized(); !ready) {
        return ready.error();
    }
    return sortedEntries(&keepAll, {});
}

Result<std::vector<SessionMetadataCache>>
SessionCacheManager::searchMetadata(const std::string& query) const {
    if (auto ready = requireInitialized(); !ready) {
        return ready.error();
    }
    return sortedEntries(&matchesQuery, toLower(query));
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

Result<bool> SessionCacheManager::updateSessionMetadata(const std::string& sessionId,
                                                       const SessionMetadataPatch& patch) {
    if (auto ready = requireInitialized(); !ready) {
        return ready.error();
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(sessionId);
        if (it == entries_.end()) {
            return false;
        }
        auto& entry = it->second;
        if (patch.projectName) {
            entry.projectName = *patch.projectName;
        }
        if (patch.lastAccessed) {
            entry.lastAccessed = core::TimeParser::toMillis(*patch.lastAccessed);
        }
        if (patch.status) {
            entry.status = *patch.status;
        }
        if (patch.tags) {
            entry.tags = *patch.tags;
        }
        if (patch.description) {
            entry.description = *patch.description;
        }
        entry.lastCacheUpdate = nowMillis();
    }
    if (auto saved = saveMetadataCache(); !saved) {
        return saved.error();
    }
    return true;
}

Result<void> SessionCacheManager::invalidateSessionCache(const std::string& sessionId) {
    if (auto ready = requireInitialized(); !ready) {
        return ready.error();
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.erase(sessionId);
    }
    return saveMetadataCache();
}

Result<size_t> SessionCacheManager::cleanupStaleEntries() {
    if (auto ready = requireInitialized(); !ready) {
        return ready.error();
    }

    std::vector<SessionMetadataCache> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    std::vector<std::string> stale;
    for (const auto& entry : snapshot) {
        if (validate(entry) != Validity::Valid) {
            stale.push_back(entry.sessionId);
        }
    }

    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& id : stale) {
            removed += entries_.erase(id);
        }
    }
    if (auto saved = saveMetadataCache(); !saved) {
        return saved.error();
    }
    if (removed > 0) {
        spdlog::info("[SessionCacheManager] Removed {} stale index entries", removed);
    }
    return removed;
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

size_t SessionCacheManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

MetadataCacheStats SessionCacheManager::getCacheStats() const {
    MetadataCacheStats stats;
    stats.state = state_.load();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.entries = entries_.size();
    stats.lastRebuild = lastRebuild_;
    stats.lastRebuildDuration = lastRebuildDuration_;
    for (const auto& [id, entry] : entries_) {
        if (!stats.lastCacheUpdate || entry.lastCacheUpdate > *stats.lastCacheUpdate) {
            stats.lastCacheUpdate = entry.lastCacheUpdate;
        }
        stats.estimatedMemoryUsage += toJson(entry).dump().size();
    }
    return stats;
}

ProcessingSnapshot SessionCacheManager::getProcessingStats() const {
    return ProcessingSnapshot{fileProcessor_->getStats(), fileProcessor_->getSemaphoreStats()};
}

void SessionCacheManager::reconfigureProcessing(const io::ConcurrentProcessingConfig& config) {
    fileProcessor_->reconfigure(config);
}

} // namespace prompter::session
