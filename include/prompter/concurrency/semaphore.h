#pragma once

// Semaphore
// ---------
// Counting admission gate for file operations. Waiters are served strictly in
// arrival order. execute() runs a callable under a permit, optionally on an
// executor with a deadline; the permit is returned on success, failure and
// timeout alike. A timed-out callable is not interrupted, its result is
// dropped.

#include <prompter/core/types.h>

#include <boost/asio/post.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace prompter::concurrency {

/// Point-in-time view of a semaphore
struct SemaphoreStats {
    size_t maxPermits{0};
    size_t availablePermits{0};
    size_t inUse{0};
    size_t peakInUse{0};     // Highest inUse since construction, clear() or resetPeak()
    size_t queueLength{0};   // Callers currently waiting for a permit
    uint64_t completed{0};   // execute() calls that returned a value
    uint64_t failed{0};      // execute() calls whose callable returned an error or threw
    uint64_t timeouts{0};    // Acquire or execute deadlines that expired
    double utilizationRate{0.0}; // inUse / maxPermits * 100
};

class Semaphore {
public:
    /// @throws std::invalid_argument when maxPermits is zero
    explicit Semaphore(size_t maxPermits);
    ~Semaphore();

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    // ========================================================================
    // Permits
    // ========================================================================

    /// RAII permit, returned to the semaphore on destruction
    class Permit {
    public:
        Permit(Permit&& other) noexcept : sem_(other.sem_), generation_(other.generation_) {
            other.sem_ = nullptr;
        }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                reset();
                sem_ = other.sem_;
                generation_ = other.generation_;
                other.sem_ = nullptr;
            }
            return *this;
        }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        ~Permit() { reset(); }

        /// Give the permit back early
        void reset() {
            if (sem_) {
                sem_->releaseGeneration(generation_);
                sem_ = nullptr;
            }
        }

        explicit operator bool() const noexcept { return sem_ != nullptr; }

    private:
        friend class Semaphore;
        Permit(Semaphore* sem, uint64_t generation) : sem_(sem), generation_(generation) {}

        Semaphore* sem_;
        uint64_t generation_;
    };

    /**
     * @brief Wait for a permit in FIFO order
     * @param timeout Zero waits indefinitely
     * @return Timeout when the deadline expires, OperationCancelled when clear() runs
     *         while waiting
     */
    Result<void> acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    /// Take a permit only if one is free and nobody is queued
    bool tryAcquire();

    /// Return a permit taken with acquire()/tryAcquire()
    void release();

    /// acquire() wrapped in an RAII Permit
    Result<Permit> acquirePermit(std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    // ========================================================================
    // Guarded execution
    // ========================================================================

    /**
     * @brief Run fn on the calling thread while holding a permit.
     *
     * fn must return a Result<T>. Exceptions are converted to InternalError.
     */
    template <typename Fn> auto execute(Fn&& fn) -> std::invoke_result_t<Fn&> {
        using R = std::invoke_result_t<Fn&>;
        auto permit = acquirePermit();
        if (!permit) {
            return permit.error();
        }
        try {
            R result = fn();
            recordOutcome(result.has_value() ? Outcome::Completed : Outcome::Failed);
            return result;
        } catch (const std::exception& e) {
            recordOutcome(Outcome::Failed);
            return Error{ErrorCode::InternalError, e.what()};
        }
    }

    /**
     * @brief Run fn on executor while holding a permit, waiting at most timeout.
     *
     * The permit is acquired on the calling thread (FIFO), the work is posted to
     * executor and the caller blocks until it settles or the deadline passes. On
     * timeout the permit is released immediately and Timeout is returned; fn keeps
     * running and its result is discarded.
     *
     * @param timeout Zero disables the deadline
     */
    template <typename T, typename Executor, typename Fn>
    Result<T> execute(const Executor& executor, Fn fn, std::chrono::milliseconds timeout) {
        auto permit = acquirePermit();
        if (!permit) {
            return permit.error();
        }

        auto promise = std::make_shared<std::promise<Result<T>>>();
        auto future = promise->get_future();
        boost::asio::post(executor, [promise, fn = std::move(fn)]() mutable {
            try {
                promise->set_value(fn());
            } catch (const std::exception& e) {
                promise->set_value(Error{ErrorCode::InternalError, e.what()});
            } catch (...) {
                promise->set_value(Error{ErrorCode::Unknown, "Non-standard exception"});
            }
        });

        if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
            recordOutcome(Outcome::TimedOut);
            return Error{ErrorCode::Timeout,
                         "Operation timed out after " + std::to_string(timeout.count()) + "ms"};
        }

        Result<T> result = future.get();
        recordOutcome(result.has_value() ? Outcome::Completed : Outcome::Failed);
        return result;
    }

    // ========================================================================
    // Introspection (non-blocking snapshots)
    // ========================================================================

    size_t availablePermits() const;
    size_t maxPermits() const noexcept { return maxPermits_; }
    size_t queueLength() const;
    bool isFullyUtilized() const;
    SemaphoreStats getStats() const;

    /// Restart peak tracking from the current in-use count
    void resetPeak();

    /**
     * @brief Drop all bookkeeping.
     *
     * Queued waiters fail with OperationCancelled and every permit becomes
     * available again. Permits held by running operations stay valid for their
     * holders; returning them later does not inflate the count.
     */
    void clear();

private:
    enum class Outcome { Completed, Failed, TimedOut };

    Result<uint64_t> acquireGeneration(std::chrono::milliseconds timeout);
    void releaseGeneration(uint64_t generation);
    void onAcquiredLocked();
    void recordOutcome(Outcome outcome);

    const size_t maxPermits_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<uint64_t> waiters_;
    uint64_t nextTicket_{0};
    uint64_t generation_{0};
    size_t available_;
    size_t peakInUse_{0};
    uint64_t completed_{0};
    uint64_t failed_{0};
    uint64_t timeouts_{0};
};

} // namespace prompter::concurrency
