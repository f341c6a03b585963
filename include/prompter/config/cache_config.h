#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace prompter::config {

/**
 * @brief Tunables for the session metadata index and the lazy session loader
 */
struct CacheConfiguration {
    size_t maxSessionDataCacheSize = 20;                              ///< LRU capacity of loaded sessions
    std::chrono::milliseconds maxMetadataCacheAge{5 * 60 * 1000};     ///< Index entry lifetime
    size_t concurrentFileReads = 5;                                   ///< Read permits during rebuild
    size_t concurrentFileWrites = 3;                                  ///< Write permits
    std::chrono::milliseconds operationTimeout{10 * 1000};            ///< Per-file timeout
    std::string cacheFileName = ".metadata-cache.json";               ///< Index file inside the session dir
    std::chrono::milliseconds sessionDataMaxAge{30 * 60 * 1000};      ///< Idle age evicted by optimizeCache
    size_t preloadConcurrency = 3;                                    ///< Loads in flight during preload
    size_t bulkMetadataBatchSize = 10;                                ///< Group size of bulkLoadMetadata
};

/**
 * @brief Resolve the cache configuration.
 *
 * Order: built-in defaults, then the [session_cache] section of the config
 * file, then PROMPTER_SESSION_CACHE_SIZE, PROMPTER_METADATA_MAX_AGE_MS,
 * PROMPTER_CONCURRENT_READS and PROMPTER_FILE_TIMEOUT_MS. Invalid values are
 * ignored with a warning.
 *
 * @param config_path Config file; empty means the default location
 */
CacheConfiguration load_cache_configuration(const std::filesystem::path& config_path = {});

} // namespace prompter::config
