#include <spdlog/spdlog.h>
#include <prompter/config/cache_config.h>
#include <prompter/config/config_helpers.h>

namespace prompter::config {

namespace {

template <typename Parse, typename Apply>
void applyValue(const std::string& raw, const char* origin, Parse parse, Apply apply) {
    if (raw.empty()) {
        return;
    }
    if (auto v = parse(raw)) {
        apply(*v);
    } else {
        spdlog::warn("[CacheConfig] Ignoring invalid value '{}' from {}", raw, origin);
    }
}

std::string envValue(const char* name) {
    if (const char* env = std::getenv(name); env && *env) {
        return env;
    }
    return {};
}

} // namespace

CacheConfiguration load_cache_configuration(const std::filesystem::path& config_path) {
    CacheConfiguration cfg;

    auto path = config_path.empty() ? get_config_path() : config_path;
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        auto value = [&](const char* key) { return parse_config_value(path, "session_cache", key); };
        auto origin = path.string();

        applyValue(value("max_entries"), origin.c_str(), parse_count,
                   [&](size_t v) { cfg.maxSessionDataCacheSize = v; });
        applyValue(value("metadata_max_age_ms"), origin.c_str(), parse_ms,
                   [&](std::chrono::milliseconds v) { cfg.maxMetadataCacheAge = v; });
        applyValue(value("concurrent_reads"), origin.c_str(), parse_count,
                   [&](size_t v) { cfg.concurrentFileReads = v; });
        applyValue(value("concurrent_writes"), origin.c_str(), parse_count,
                   [&](size_t v) { cfg.concurrentFileWrites = v; });
        applyValue(value("file_timeout_ms"), origin.c_str(), parse_ms,
                   [&](std::chrono::milliseconds v) { cfg.operationTimeout = v; });
        applyValue(value("session_max_age_ms"), origin.c_str(), parse_ms,
                   [&](std::chrono::milliseconds v) { cfg.sessionDataMaxAge = v; });
        applyValue(value("preload_concurrency"), origin.c_str(), parse_count,
                   [&](size_t v) { cfg.preloadConcurrency = v; });
        applyValue(value("bulk_batch_size"), origin.c_str(), parse_count,
                   [&](size_t v) { cfg.bulkMetadataBatchSize = v; });
        if (auto name = value("cache_file"); !name.empty()) {
            cfg.cacheFileName = name;
        }
    }

    applyValue(envValue("PROMPTER_SESSION_CACHE_SIZE"), "PROMPTER_SESSION_CACHE_SIZE",
               parse_count, [&](size_t v) { cfg.maxSessionDataCacheSize = v; });
    applyValue(envValue("PROMPTER_METADATA_MAX_AGE_MS"), "PROMPTER_METADATA_MAX_AGE_MS", parse_ms,
               [&](std::chrono::milliseconds v) { cfg.maxMetadataCacheAge = v; });
    applyValue(envValue("PROMPTER_CONCURRENT_READS"), "PROMPTER_CONCURRENT_READS", parse_count,
               [&](size_t v) { cfg.concurrentFileReads = v; });
    applyValue(envValue("PROMPTER_FILE_TIMEOUT_MS"), "PROMPTER_FILE_TIMEOUT_MS", parse_ms,
               [&](std::chrono::milliseconds v) { cfg.operationTimeout = v; });

    return cfg;
}

} // namespace prompter::config
