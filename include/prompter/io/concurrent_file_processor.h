#pragma once

#include <prompter/concurrency/semaphore.h>
#include <prompter/core/types.h>
#include <prompter/io/file_utils.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace prompter::io {

/**
 * @brief Limits for batched file processing
 */
struct ConcurrentProcessingConfig {
    size_t maxConcurrentReads = 10;                     ///< Read permits
    size_t maxConcurrentWrites = 5;                     ///< Write permits
    std::chrono::milliseconds operationTimeout{30000};  ///< Per-file deadline, 0 disables
    size_t batchSize = 20;                              ///< Files submitted per wave
    bool enablePerformanceTracking = true;              ///< Per-batch debug logging
};

/**
 * @brief Aggregate figures for one processFilesInBatches() run
 */
struct ProcessingStats {
    size_t totalFiles = 0;
    size_t successfulFiles = 0;
    size_t failedFiles = 0;
    double averageProcessingTimeMs = 0.0;
    double minProcessingTimeMs = 0.0;
    double maxProcessingTimeMs = 0.0;
    double averageQueueWaitMs = 0.0;    ///< Submission until the file operation started
    double concurrencyUtilization = 0.0; ///< Peak permits in use / permits, percent
    std::chrono::milliseconds totalTime{0};
};

struct FileFailure {
    std::string filePath;
    std::string error;
    ErrorCode code = ErrorCode::Unknown;
};

template <typename T> struct BatchProcessingResult {
    std::vector<T> successful;
    std::vector<FileFailure> failed;
    std::vector<std::string> processingOrder; ///< Completion order, not input order
    ProcessingStats stats;
};

struct FileContent {
    std::string filePath;
    std::string content;
};

struct FileWriteRequest {
    std::string filePath;
    std::string content;
};

struct ProcessorSemaphoreStats {
    concurrency::SemaphoreStats reads;
    concurrency::SemaphoreStats writes;
};

/**
 * @brief Runs per-file work over many paths with bounded concurrency
 *
 * Paths are split into batches of config.batchSize. All files of a batch are
 * submitted together and each one passes through the read (or write) semaphore;
 * the next batch starts once every file of the current one has settled. A failing
 * or timed-out file is reported in `failed` and never affects the others.
 *
 * Processors run on an internal worker pool. A processor that outlives its
 * deadline keeps running in the background, so anything it captures by reference
 * must outlive this object.
 */
class ConcurrentFileProcessor {
public:
    template <typename T>
    using FileProcessor =
        std::function<Result<T>(const std::string& filePath, const std::string& content)>;

    explicit ConcurrentFileProcessor(ConcurrentProcessingConfig config = {});
    ~ConcurrentFileProcessor();

    ConcurrentFileProcessor(const ConcurrentFileProcessor&) = delete;
    ConcurrentFileProcessor& operator=(const ConcurrentFileProcessor&) = delete;

    /**
     * @brief Read every file and hand its content to processor
     *
     * Reading and processing one file form a single operation bounded by
     * config.operationTimeout.
     */
    template <typename T>
    BatchProcessingResult<T> processFilesInBatches(const std::vector<std::string>& filePaths,
                                                   FileProcessor<T> processor) {
        return runBatches<T>(
            filePaths, [](const std::string& p) -> const std::string& { return p; }, false,
            [processor = std::move(processor)](const std::string& path) -> Result<T> {
                auto content = readFileContents(path);
                if (!content) {
                    return content.error();
                }
                return processor(path, content.value());
            });
    }

    BatchProcessingResult<FileContent> readFilesInBatches(const std::vector<std::string>& filePaths);

    /// Write each request through the write semaphore; successful holds the written paths
    BatchProcessingResult<std::string>
    writeFilesInBatches(const std::vector<FileWriteRequest>& writes);

    /// Stats of the most recent run
    ProcessingStats getStats() const;
    ProcessorSemaphoreStats getSemaphoreStats() const;
    ConcurrentProcessingConfig getConfig() const;

    /**
     * @brief Replace limits
     *
     * Runs already in progress keep the semaphores they started with; new limits
     * apply to operations queued afterwards.
     */
    void reconfigure(const ConcurrentProcessingConfig& config);

    /// Drop semaphore bookkeeping and wait for abandoned background work
    void cleanup();

private:
    struct Runtime {
        ConcurrentProcessingConfig config;
        std::shared_ptr<concurrency::Semaphore> reads;
        std::shared_ptr<concurrency::Semaphore> writes;
        std::shared_ptr<boost::asio::thread_pool> dispatch;
        std::shared_ptr<boost::asio::thread_pool> workers;
    };

    static Runtime makeRuntime(const ConcurrentProcessingConfig& config);
    Runtime snapshot() const;
    void recordStats(const ProcessingStats& stats);

    template <typename T, typename Item, typename PathOf, typename Op>
    BatchProcessingResult<T> runBatches(const std::vector<Item>& items, PathOf pathOf,
                                        bool useWriteSemaphore, Op op) {
        using Clock = std::chrono::steady_clock;
        auto rt = snapshot();
        auto& semaphore = useWriteSemaphore ? *rt.writes : *rt.reads;
        semaphore.resetPeak();
        auto workerExecutor = rt.workers->get_executor();

        BatchProcessingResult<T> result;
        std::mutex resultMutex;
        std::vector<double> processingTimes;
        double totalWaitMs = 0.0;
        const auto runStart = Clock::now();
        const size_t batchSize = std::max<size_t>(1, rt.config.batchSize);

        for (size_t offset = 0; offset < items.size(); offset += batchSize) {
            const size_t end = std::min(offset + batchSize, items.size());
            const auto batchStart = Clock::now();
            std::vector<std::future<void>> pending;
            pending.reserve(end - offset);

            for (size_t i = offset; i < end; ++i) {
                auto done = std::make_shared<std::promise<void>>();
                pending.push_back(done->get_future());
                const auto submitted = Clock::now();

                boost::asio::post(*rt.dispatch, [&, i, done, submitted]() {
                    const Item& item = items[i];
                    std::string path = pathOf(item);
                    // Nanoseconds since submission at which the worker picked the file up
                    auto startedNs = std::make_shared<std::atomic<int64_t>>(-1);

                    auto outcome = semaphore.execute<T>(
                        workerExecutor,
                        [op, item, startedNs, submitted]() -> Result<T> {
                            startedNs->store(
                                std::chrono::duration_cast<std::chrono::nanoseconds>(
                                    Clock::now() - submitted)
                                    .count());
                            return op(item);
                        },
                        rt.config.operationTimeout);

                    const auto finishedNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                                Clock::now() - submitted)
                                                .count();
                    auto started = startedNs->load();
                    if (started < 0) {
                        started = finishedNs;
                    }
                    const double waitMs = static_cast<double>(started) / 1e6;
                    const double processingMs = static_cast<double>(finishedNs - started) / 1e6;

                    {
                        std::lock_guard<std::mutex> lock(resultMutex);
                        result.processingOrder.push_back(path);
                        processingTimes.push_back(processingMs);
                        totalWaitMs += waitMs;
                        if (outcome) {
                            result.successful.push_back(std::move(outcome).value());
                        } else {
                            result.failed.push_back(
                                FileFailure{path, outcome.error().message, outcome.error().code});
                        }
                    }
                    done->set_value();
                });
            }

            for (auto& f : pending) {
                f.wait();
            }

            if (rt.config.enablePerformanceTracking) {
                spdlog::debug("[ConcurrentFileProcessor] Batch {}-{} of {} settled in {}ms",
                              offset + 1, end, items.size(),
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  Clock::now() - batchStart)
                                  .count());
            }
        }

        auto& stats = result.stats;
        stats.totalFiles = items.size();
        stats.successfulFiles = result.successful.size();
        stats.failedFiles = result.failed.size();
        stats.totalTime =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - runStart);
        if (!processingTimes.empty()) {
            double sum = 0.0;
            for (double t : processingTimes) {
                sum += t;
            }
            auto [minIt, maxIt] = std::minmax_element(processingTimes.begin(), processingTimes.end());
            stats.averageProcessingTimeMs = sum / static_cast<double>(processingTimes.size());
            stats.minProcessingTimeMs = *minIt;
            stats.maxProcessingTimeMs = *maxIt;
            stats.averageQueueWaitMs = totalWaitMs / static_cast<double>(processingTimes.size());
        }
        auto semStats = semaphore.getStats();
        stats.concurrencyUtilization = static_cast<double>(semStats.peakInUse) /
                                       static_cast<double>(semStats.maxPermits) * 100.0;

        recordStats(stats);
        return result;
    }

    mutable std::mutex mutex_;
    Runtime runtime_;
    ProcessingStats lastStats_;
};

} // namespace prompter::io
