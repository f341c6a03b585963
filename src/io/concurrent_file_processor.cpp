#include <prompter/io/concurrent_file_processor.h>

#include <utility>

namespace prompter::io {

ConcurrentFileProcessor::ConcurrentFileProcessor(ConcurrentProcessingConfig config)
    : runtime_(makeRuntime(config)) {
    spdlog::debug("[ConcurrentFileProcessor] Initialized (reads={}, writes={}, batch={}, "
                  "timeout={}ms)",
                  config.maxConcurrentReads, config.maxConcurrentWrites, config.batchSize,
                  config.operationTimeout.count());
}

// Pools join on destruction, so processors abandoned after a timeout finish first
ConcurrentFileProcessor::~ConcurrentFileProcessor() = default;

ConcurrentFileProcessor::Runtime
ConcurrentFileProcessor::makeRuntime(const ConcurrentProcessingConfig& config) {
    Runtime rt;
    rt.config = config;
    rt.config.maxConcurrentReads = std::max<size_t>(1, config.maxConcurrentReads);
    rt.config.maxConcurrentWrites = std::max<size_t>(1, config.maxConcurrentWrites);
    rt.config.batchSize = std::max<size_t>(1, config.batchSize);

    rt.reads = std::make_shared<concurrency::Semaphore>(rt.config.maxConcurrentReads);
    rt.writes = std::make_shared<concurrency::Semaphore>(rt.config.maxConcurrentWrites);
    // One dispatcher per batch slot so every file of a batch can queue on the semaphore
    rt.dispatch = std::make_shared<boost::asio::thread_pool>(rt.config.batchSize);
    rt.workers = std::make_shared<boost::asio::thread_pool>(
        std::max(rt.config.batchSize, rt.config.maxConcurrentReads) +
        rt.config.maxConcurrentWrites);
    return rt;
}

ConcurrentFileProcessor::Runtime ConcurrentFileProcessor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_;
}

void ConcurrentFileProcessor::recordStats(const ProcessingStats& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastStats_ = stats;
}

BatchProcessingResult<FileContent>
ConcurrentFileProcessor::readFilesInBatches(const std::vector<std::string>& filePaths) {
    return processFilesInBatches<FileContent>(
        filePaths, [](const std::string& path, const std::string& content) -> Result<FileContent> {
            return FileContent{path, content};
        });
}

BatchProcessingResult<std::string>
ConcurrentFileProcessor::writeFilesInBatches(const std::vector<FileWriteRequest>& writes) {
    return runBatches<std::string>(
        writes, [](const FileWriteRequest& w) -> const std::string& { return w.filePath; }, true,
        [](const FileWriteRequest& w) -> Result<std::string> {
            auto written = atomicWrite(w.filePath, w.content);
            if (!written) {
                return written.error();
            }
            return w.filePath;
        });
}

ProcessingStats ConcurrentFileProcessor::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastStats_;
}

ProcessorSemaphoreStats ConcurrentFileProcessor::getSemaphoreStats() const {
    auto rt = snapshot();
    return ProcessorSemaphoreStats{rt.reads->getStats(), rt.writes->getStats()};
}

ConcurrentProcessingConfig ConcurrentFileProcessor::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_.config;
}

void ConcurrentFileProcessor::reconfigure(const ConcurrentProcessingConfig& config) {
    auto fresh = makeRuntime(config);
    Runtime previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(runtime_, std::move(fresh));
    }
    spdlog::info("[ConcurrentFileProcessor] Reconfigured: reads={}, writes={}, batch={}, "
                 "timeout={}ms",
                 config.maxConcurrentReads, config.maxConcurrentWrites, config.batchSize,
                 config.operationTimeout.count());
    // previous is released here; a run still using it keeps its own references
}

void ConcurrentFileProcessor::cleanup() {
    Runtime previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto config = runtime_.config;
        runtime_.reads->clear();
        runtime_.writes->clear();
        previous = std::exchange(runtime_, makeRuntime(config));
        lastStats_ = ProcessingStats{};
    }
    spdlog::debug("[ConcurrentFileProcessor] Cleaned up");
}

} // namespace prompter::io
