#pragma once

#include <rangeget/downloader/chunk_plan.hpp>
#include <rangeget/downloader/control.hpp>
#include <rangeget/downloader/downloader.hpp>
#include <rangeget/downloader/work_queue.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rangeget::downloader {

// ===========================
// Adaptive retry decision table
// ===========================

/**
 * Attempts before the relaxation point run under the speed floor; later attempts
 * favor completion over throughput.
 */
[[nodiscard]] constexpr bool enforceSpeedFor(std::uint32_t attempt,
                                             const TransferPolicy& policy) noexcept {
    return attempt < policy.relaxSpeedAfterAttempts;
}

/**
 * True once the warm-up window has elapsed and the average rate of this attempt is
 * under the floor.
 */
[[nodiscard]] constexpr bool isBelowSpeedFloor(std::uint64_t bytes,
                                               std::chrono::milliseconds elapsed,
                                               const TransferPolicy& policy) noexcept {
    if (policy.speedFloorBps == 0 || elapsed < policy.speedWarmup || elapsed.count() <= 0)
        return false;
    // bytes * 1000 / ms < floor, without floating point
    return bytes * 1000ull < policy.speedFloorBps * static_cast<std::uint64_t>(elapsed.count());
}

[[nodiscard]] constexpr std::chrono::milliseconds retryBackoffFor(std::uint32_t attempt,
                                                                  const TransferPolicy& policy) {
    const std::chrono::milliseconds scaled{policy.retryBackoffBase.count() *
                                           static_cast<std::chrono::milliseconds::rep>(attempt)};
    return std::min(scaled, policy.retryBackoffMax);
}

/**
 * First unrecoverable error raised by any worker of a batch (disk write failures).
 * Once set, every worker of the batch winds down.
 */
class FatalSlot {
public:
    void set(Error error);
    [[nodiscard]] bool isSet() const noexcept { return set_.load(std::memory_order_acquire); }
    [[nodiscard]] std::optional<Error> get() const;

private:
    std::atomic<bool> set_{false};
    mutable std::mutex mutex_;
    std::optional<Error> error_;
};

/**
 * Everything one worker batch shares. Handles are reference counted so a batch may
 * outlive the call that spawned it only as long as it still holds them.
 */
struct WorkerContext {
    std::string downloadId;
    std::string url;
    ChunkPlan plan;
    std::uint32_t generation{0};

    std::shared_ptr<DownloadControl> control;
    std::shared_ptr<WorkQueue> queue;
    std::shared_ptr<RetryTracker> retries;
    std::shared_ptr<FatalSlot> fatal;

    std::shared_ptr<IHttpAdapter> http;
    std::shared_ptr<PartFile> part;
    std::shared_ptr<IRateLimiter> limiter; // optional

    RequestOptions request;
    TransferPolicy policy;

    // Called after every successful commit with the chunk index.
    std::function<void(std::uint64_t)> onChunkCommitted;
};

/**
 * Fixed-size batch of download workers for one generation.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount);

    /**
     * Spawn the workers and block until every one has exited: because all chunks are
     * committed, the generation went stale, the signal left Run, or a fatal error
     * was recorded.
     */
    void run(const WorkerContext& ctx);

private:
    enum class AttemptResult { Committed, Duplicate, Failed, Abandoned };

    void workerLoop(const WorkerContext& ctx, std::size_t workerIndex) const;
    AttemptResult attemptChunk(const WorkerContext& ctx, const ChunkDescriptor& chunk,
                               std::uint32_t attempt) const;

    // Sleep up to `total`, in short slices, returning early once the batch is stale.
    static void interruptibleSleep(const WorkerContext& ctx, std::chrono::milliseconds total);

    std::size_t threadCount_;
};

} // namespace rangeget::downloader
