#include <prompter/concurrency/semaphore.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace prompter::concurrency {

Semaphore::Semaphore(size_t maxPermits) : maxPermits_(maxPermits), available_(maxPermits) {
    if (maxPermits == 0) {
        throw std::invalid_argument("Semaphore requires at least one permit");
    }
}

Semaphore::~Semaphore() = default;

Result<void> Semaphore::acquire(std::chrono::milliseconds timeout) {
    auto gen = acquireGeneration(timeout);
    if (!gen) {
        return gen.error();
    }
    return Result<void>();
}

bool Semaphore::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!waiters_.empty() || available_ == 0) {
        return false;
    }
    --available_;
    onAcquiredLocked();
    return true;
}

void Semaphore::release() {
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gen = generation_;
    }
    releaseGeneration(gen);
}

Result<Semaphore::Permit> Semaphore::acquirePermit(std::chrono::milliseconds timeout) {
    auto gen = acquireGeneration(timeout);
    if (!gen) {
        return gen.error();
    }
    return Permit(this, gen.value());
}

Result<uint64_t> Semaphore::acquireGeneration(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (waiters_.empty() && available_ > 0) {
        --available_;
        onAcquiredLocked();
        return generation_;
    }

    const uint64_t ticket = nextTicket_++;
    const uint64_t gen = generation_;
    waiters_.push_back(ticket);

    auto ready = [&] {
        return generation_ != gen || (waiters_.front() == ticket && available_ > 0);
    };

    bool granted = true;
    if (timeout.count() > 0) {
        granted = cv_.wait_for(lock, timeout, ready);
    } else {
        cv_.wait(lock, ready);
    }

    if (generation_ != gen) {
        // clear() already emptied the queue
        return Error{ErrorCode::OperationCancelled, "Semaphore cleared while waiting"};
    }

    if (!granted) {
        waiters_.erase(std::find(waiters_.begin(), waiters_.end(), ticket));
        ++timeouts_;
        // The next waiter may now be at the front with a free permit
        cv_.notify_all();
        return Error{ErrorCode::Timeout,
                     "Timed out waiting for permit after " + std::to_string(timeout.count()) +
                         "ms"};
    }

    waiters_.pop_front();
    --available_;
    onAcquiredLocked();
    if (!waiters_.empty() && available_ > 0) {
        cv_.notify_all();
    }
    return gen;
}

void Semaphore::releaseGeneration(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        if (available_ >= maxPermits_) {
            spdlog::debug("[Semaphore] release() without matching acquire ignored");
            return;
        }
        ++available_;
    }
    cv_.notify_all();
}

void Semaphore::onAcquiredLocked() {
    peakInUse_ = std::max(peakInUse_, maxPermits_ - available_);
}

void Semaphore::recordOutcome(Outcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (outcome) {
        case Outcome::Completed:
            ++completed_;
            break;
        case Outcome::Failed:
            ++failed_;
            break;
        case Outcome::TimedOut:
            ++timeouts_;
            break;
    }
}

size_t Semaphore::availablePermits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

size_t Semaphore::queueLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

bool Semaphore::isFullyUtilized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_ == 0;
}

SemaphoreStats Semaphore::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SemaphoreStats stats;
    stats.maxPermits = maxPermits_;
    stats.availablePermits = available_;
    stats.inUse = maxPermits_ - available_;
    stats.peakInUse = peakInUse_;
    stats.queueLength = waiters_.size();
    stats.completed = completed_;
    stats.failed = failed_;
    stats.timeouts = timeouts_;
    stats.utilizationRate =
        static_cast<double>(stats.inUse) / static_cast<double>(maxPermits_) * 100.0;
    return stats;
}

void Semaphore::resetPeak() {
    std::lock_guard<std::mutex> lock(mutex_);
    peakInUse_ = maxPermits_ - available_;
}

void Semaphore::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        waiters_.clear();
        available_ = maxPermits_;
        peakInUse_ = 0;
        completed_ = 0;
        failed_ = 0;
        timeouts_ = 0;
    }
    cv_.notify_all();
}

} // namespace prompter::concurrency
