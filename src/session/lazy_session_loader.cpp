#include <prompter/io/file_utils.h>
#include <prompter/session/lazy_session_loader.h>
#include <prompter/session/metadata_extractor.h>
#include <prompter/session/session_cache_manager.h>
#include <prompter/session/session_json.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <numeric>

namespace prompter::session {

namespace {

constexpr size_t kLoadTimeWindow = 100;

HistoryWindow windowFor(std::optional<size_t> page, std::optional<size_t> limit) {
    if (!limit) {
        return {};
    }
    return HistoryWindow{page, limit};
}

HistoryWindow windowFor(const LazyLoadOptions& options) {
    return windowFor(options.historyPage, options.historyLimit);
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

size_t estimateSize(const LazySessionData& data) {
    return toJson(data).dump().size();
}

} // namespace

const char* toString(ContentMatch::Field field) {
    return field == ContentMatch::Field::Prompt ? "prompt" : "response";
}

// ---------------------------------------------------------------------------
// HistoryStream
// ---------------------------------------------------------------------------

HistoryStream::HistoryStream(LazySessionLoader& loader, std::string sessionId, size_t chunkSize)
    : loader_(&loader), sessionId_(std::move(sessionId)), chunkSize_(chunkSize) {}

std::optional<std::vector<ConversationEntry>> HistoryStream::next() {
    if (finished_) {
        return std::nullopt;
    }
    auto chunk = loader_->loadSessionHistory(sessionId_, HistoryQuery{page_, chunkSize_});
    if (!chunk) {
        error_ = chunk.error();
        finished_ = true;
        return std::nullopt;
    }
    if (chunk.value().empty()) {
        finished_ = true;
        return std::nullopt;
    }
    ++page_;
    if (chunk.value().size() < chunkSize_) {
        finished_ = true;
    }
    return std::move(chunk).value();
}

void HistoryStream::reset() {
    page_ = 0;
    finished_ = false;
    error_.reset();
}

// ---------------------------------------------------------------------------
// LazySessionLoader
// ---------------------------------------------------------------------------

LazySessionLoader::LazySessionLoader(SessionCacheManager& manager)
    : LazySessionLoader(manager, manager.config()) {}

LazySessionLoader::LazySessionLoader(SessionCacheManager& manager,
                                     config::CacheConfiguration config)
    : manager_(manager), config_(std::move(config)),
      cache_(config_.maxSessionDataCacheSize, &estimateSize) {}

LazySessionLoader::~LazySessionLoader() = default;

bool LazySessionLoader::satisfies(const LazySessionData& data, const LazyLoadOptions& options) {
    if (options.includeContext && !data.context) {
        return false;
    }
    if (options.includeHistory) {
        if (!data.history) {
            return false;
        }
        if (!data.historyWindow.isFull() && data.historyWindow != windowFor(options)) {
            return false;
        }
    }
    return true;
}

LazySessionData LazySessionLoader::project(const LazySessionData& data,
                                           const LazyLoadOptions& options) {
    auto window = windowFor(options);
    if (!options.includeHistory || !data.history || window.isFull() ||
        !data.historyWindow.isFull()) {
        return data;
    }
    // Full history cached, a window requested
    LazySessionData view = data;
    view.history = paginate(*data.history, window);
    view.historyWindow = window;
    view.isFullyLoaded = false;
    return view;
}

std::vector<ConversationEntry> LazySessionLoader::paginate(std::vector<ConversationEntry> history,
                                                           const HistoryWindow& window) {
    if (window.isFull()) {
        return history;
    }
    const size_t limit = *window.limit;
    const size_t total = history.size();
    size_t begin = 0;
    size_t end = total;
    if (window.page) {
        // page * limit would overflow before it could be compared with total
        if (limit == 0 || *window.page > total / limit) {
            return {};
        }
        begin = std::min(total, *window.page * limit);
        end = begin + std::min(limit, total - begin);
    } else if (total > limit) {
        begin = total - limit;
    }
    return std::vector<ConversationEntry>(std::make_move_iterator(history.begin() + begin),
                                          std::make_move_iterator(history.begin() + end));
}

void LazySessionLoader::recordLoadTime(std::chrono::steady_clock::time_point started) {
    const double elapsed =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();
    std::lock_guard<std::mutex> lock(loadTimesMutex_);
    loadTimesMs_.push_back(elapsed);
    if (loadTimesMs_.size() > kLoadTimeWindow) {
        loadTimesMs_.pop_front();
    }
}

Result<std::optional<LazySessionData>>
LazySessionLoader::loadSessionLazy(const std::string& sessionId, const LazyLoadOptions& options) {
    const auto started = std::chrono::steady_clock::now();

    std::optional<LazySessionData> cached;
    if (options.forceRefresh) {
        cache_.erase(sessionId);
    } else {
        cached = cache_.get(sessionId);
        if (cached && satisfies(*cached, options)) {
            return std::optional<LazySessionData>(project(*cached, options));
        }
    }

    // Taken before any read so a later write is always seen as newer
    const auto loadedAt = std::chrono::system_clock::now();

    auto metadata = manager_.getSessionMetadata(sessionId);
    if (!metadata) {
        return metadata.error();
    }
    if (!metadata.value()) {
        cache_.erase(sessionId);
        return std::optional<LazySessionData>{};
    }

    if (cached) {
        auto mtime = io::fileModificationTime(metadata.value()->filePath);
        if (!mtime || mtime.value() > cached->loadedAt) {
            spdlog::debug("[LazySessionLoader] Cached parts of {} are outdated, reloading",
                          sessionId);
            cached.reset();
        }
    }

    LazySessionData data;
    data.metadata = std::move(*metadata.value());
    data.loadedAt = loadedAt;

    if (options.includeHistory || options.includeContext) {
        auto content = io::readFileContents(data.metadata.filePath);
        if (!content) {
            return content.error();
        }
        if (options.includeHistory) {
            auto history = MetadataExtractor::extractHistory(content.value());
            if (!history) {
                return history.error();
            }
            data.historyWindow = windowFor(options);
            data.history = paginate(std::move(history).value(), data.historyWindow);
        }
        if (options.includeContext) {
            auto context = MetadataExtractor::extractContext(content.value());
            if (context) {
                data.context = std::move(context).value();
            } else {
                spdlog::warn("[LazySessionLoader] Context of {} unreadable: {}", sessionId,
                             context.error().message);
                data.context = SessionContext{};
            }
        }
    }

    if (cached) {
        bool merged = false;
        if (!data.history && cached->history) {
            data.history = std::move(cached->history);
            data.historyWindow = cached->historyWindow;
            merged = true;
        }
        if (!data.context && cached->context) {
            data.context = std::move(cached->context);
            merged = true;
        }
        if (merged) {
            data.loadedAt = std::min(data.loadedAt, cached->loadedAt);
        }
    }

    data.isFullyLoaded = data.history && data.historyWindow.isFull() && data.context;

    cache_.set(sessionId, data);
    recordLoadTime(started);
    return std::optional<LazySessionData>(std::move(data));
}

Result<std::optional<LazySessionData>>
LazySessionLoader::loadFullSession(const std::string& sessionId) {
    LazyLoadOptions options;
    options.includeHistory = true;
    options.includeContext = true;
    return loadSessionLazy(sessionId, options);
}

Result<std::vector<ConversationEntry>>
LazySessionLoader::loadSessionHistory(const std::string& sessionId, const HistoryQuery& query) {
    auto path = manager_.sessionFilePath(sessionId);
    if (!path) {
        return path.error();
    }
    auto content = io::readFileContents(path.value());
    if (!content) {
        return content.error();
    }
    auto history = MetadataExtractor::extractHistory(content.value());
    if (!history) {
        return history.error();
    }
    return paginate(std::move(history).value(), windowFor(query.historyPage, query.historyLimit));
}

Result<std::vector<ConversationEntry>>
LazySessionLoader::getHistoryPage(const std::string& sessionId, size_t page, size_t limit) {
    return loadSessionHistory(sessionId, HistoryQuery{page, limit});
}

SessionContext LazySessionLoader::loadSessionContext(const std::string& sessionId) {
    auto path = manager_.sessionFilePath(sessionId);
    if (!path) {
        spdlog::debug("[LazySessionLoader] {}", path.error().message);
        return {};
    }
    auto content = io::readFileContents(path.value());
    if (!content) {
        spdlog::debug("[LazySessionLoader] No context for {}: {}", sessionId,
                      content.error().message);
        return {};
    }
    auto context = MetadataExtractor::extractContext(content.value());
    if (!context) {
        spdlog::warn("[LazySessionLoader] Context of {} unreadable: {}", sessionId,
                     context.error().message);
        return {};
    }
    return std::move(context).value();
}

Result<HistoryStream> LazySessionLoader::streamSessionHistory(const std::string& sessionId,
                                                              size_t chunkSize) {
    if (chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "chunkSize must be greater than zero"};
    }
    if (auto path = manager_.sessionFilePath(sessionId); !path) {
        return path.error();
    }
    return HistoryStream(*this, sessionId, chunkSize);
}

BatchOperationResult LazySessionLoader::preloadSessions(const std::vector<std::string>& sessionIds,
                                                        const LazyLoadOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    BatchOperationResult result;
    if (sessionIds.empty()) {
        return result;
    }

    std::mutex resultMutex;
    {
        boost::asio::thread_pool pool(
            std::max<size_t>(1, std::min(config_.preloadConcurrency, sessionIds.size())));
        for (const auto& id : sessionIds) {
            boost::asio::post(pool, [this, &id, &options, &result, &resultMutex]() {
                std::optional<Error> failure;
                try {
                    auto loaded = loadSessionLazy(id, options);
                    if (!loaded) {
                        failure = loaded.error();
                    } else if (!loaded.value()) {
                        failure = Error{ErrorCode::NotFound, "Session not found: " + id};
                    }
                } catch (const std::exception& e) {
                    failure = Error{ErrorCode::InternalError, e.what()};
                }

                std::lock_guard<std::mutex> lock(resultMutex);
                if (failure) {
                    result.failed.push_back(SessionLoadFailure{id, std::move(*failure)});
                } else {
                    result.successful.push_back(id);
                }
            });
        }
        pool.join();
    }

    result.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!result.failed.empty()) {
        spdlog::warn("[LazySessionLoader] Preload: {} loaded, {} failed", result.successful.size(),
                     result.failed.size());
    } else {
        spdlog::debug("[LazySessionLoader] Preloaded {} sessions in {}ms",
                      result.successful.size(), result.totalTime.count());
    }
    return result;
}

std::vector<SessionMetadataCache>
LazySessionLoader::bulkLoadMetadata(const std::vector<std::string>& sessionIds) {
    std::vector<std::optional<SessionMetadataCache>> slots(sessionIds.size());
    if (sessionIds.empty()) {
        return {};
    }

    const size_t groupSize = std::max<size_t>(1, config_.bulkMetadataBatchSize);
    boost::asio::thread_pool pool(std::min(groupSize, sessionIds.size()));

    for (size_t groupStart = 0; groupStart < sessionIds.size(); groupStart += groupSize) {
        const size_t groupEnd = std::min(sessionIds.size(), groupStart + groupSize);
        std::vector<std::future<void>> pending;
        pending.reserve(groupEnd - groupStart);

        for (size_t i = groupStart; i < groupEnd; ++i) {
            auto done = std::make_shared<std::promise<void>>();
            pending.push_back(done->get_future());
            boost::asio::post(pool, [this, i, done, &sessionIds, &slots]() {
                auto metadata = manager_.getSessionMetadata(sessionIds[i]);
                if (metadata && metadata.value()) {
                    slots[i] = std::move(*metadata.value());
                } else if (!metadata) {
                    spdlog::debug("[LazySessionLoader] Metadata for {} unavailable: {}",
                                  sessionIds[i], metadata.error().message);
                }
                done->set_value();
            });
        }
        for (auto& f : pending) {
            f.wait();
        }
    }
    pool.join();

    std::vector<SessionMetadataCache> out;
    out.reserve(sessionIds.size());
    for (auto& slot : slots) {
        if (slot) {
            out.push_back(std::move(*slot));
        }
    }
    return out;
}

std::vector<ContentSearchResult>
LazySessionLoader::searchSessionContent(const std::vector<std::string>& sessionIds,
                                        const std::string& query) {
    std::vector<ContentSearchResult> results;
    if (query.empty()) {
        return results;
    }
    const auto needle = toLower(query);

    for (const auto& id : sessionIds) {
        auto metadata = manager_.getSessionMetadata(id);
        if (!metadata) {
            spdlog::warn("[LazySessionLoader] Skipping {} in content search: {}", id,
                         metadata.error().message);
            continue;
        }
        if (!metadata.value()) {
            continue;
        }
        auto history = loadSessionHistory(id);
        if (!history) {
            spdlog::warn("[LazySessionLoader] Skipping {} in content search: {}", id,
                         history.error().message);
            continue;
        }

        ContentSearchResult hit;
        const auto& entries = history.value();
        for (size_t i = 0; i < entries.size(); ++i) {
            if (toLower(entries[i].prompt).find(needle) != std::string::npos) {
                hit.matches.push_back(ContentMatch{ContentMatch::Field::Prompt, entries[i].prompt, i});
            }
            if (toLower(entries[i].response).find(needle) != std::string::npos) {
                hit.matches.push_back(
                    ContentMatch{ContentMatch::Field::Response, entries[i].response, i});
            }
        }
        if (!hit.matches.empty()) {
            hit.sessionId = id;
            hit.metadata = std::move(*metadata.value());
            results.push_back(std::move(hit));
        }
    }
    return results;
}

std::optional<LazySessionData> LazySessionLoader::getFromCache(const std::string& sessionId) {
    return cache_.get(sessionId);
}

bool LazySessionLoader::evictFromCache(const std::string& sessionId) {
    return cache_.erase(sessionId);
}

void LazySessionLoader::clearCache() {
    cache_.clear();
    std::lock_guard<std::mutex> lock(loadTimesMutex_);
    loadTimesMs_.clear();
}

bool LazySessionLoader::validateCachedSession(const std::string& sessionId) {
    auto cached = cache_.peek(sessionId);
    if (!cached) {
        return false;
    }
    auto mtime = io::fileModificationTime(cached->metadata.filePath);
    if (!mtime || mtime.value() > cached->loadedAt) {
        cache_.erase(sessionId);
        return false;
    }
    return true;
}

size_t LazySessionLoader::optimizeCache() {
    const auto evicted = cache_.evictOlderThan(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.sessionDataMaxAge));
    if (evicted > 0) {
        spdlog::debug("[LazySessionLoader] Evicted {} idle sessions", evicted);
    }
    return evicted;
}

LazyLoaderStats LazySessionLoader::getCacheStats() const {
    LazyLoaderStats stats;
    stats.size = cache_.size();
    stats.capacity = cache_.capacity();
    stats.hitRate = cache_.hitRate();
    stats.estimatedMemoryUsage = cache_.estimateMemoryUsage();
    std::lock_guard<std::mutex> lock(loadTimesMutex_);
    if (!loadTimesMs_.empty()) {
        stats.averageLoadTimeMs =
            std::accumulate(loadTimesMs_.begin(), loadTimesMs_.end(), 0.0) /
            static_cast<double>(loadTimesMs_.size());
    }
    return stats;
}

} // namespace prompter::session
