/*
 * rangeget/src/downloader/worker_pool.cpp
 *
 * Download loop run by every worker of a batch:
 * - exit when the batch is stale (signal left Run, generation moved on, fatal error)
 * - exit when every chunk is committed; an empty queue alone is not completion
 * - pop, fetch the byte range into the partial file, verify the length, commit
 * - any failed attempt requeues the chunk and backs off before the next pop
 */

#include <rangeget/downloader/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <system_error>
#include <thread>
#include <vector>

namespace rangeget::downloader {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(50);

bool batchIsLive(const WorkerContext& ctx) {
    return ctx.control->isCurrent(ctx.generation) && !(ctx.fatal && ctx.fatal->isSet());
}

} // namespace

void FatalSlot::set(Error error) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (error_)
        return;
    error_ = std::move(error);
    set_.store(true, std::memory_order_release);
}

std::optional<Error> FatalSlot::get() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return error_;
}

WorkerPool::WorkerPool(std::size_t threadCount) : threadCount_(threadCount == 0 ? 1 : threadCount) {}

void WorkerPool::run(const WorkerContext& ctx) {
    std::vector<std::thread> workers;
    workers.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        try {
            workers.emplace_back([this, &ctx, i] { workerLoop(ctx, i); });
        } catch (const std::system_error& e) {
            spdlog::error("[{}] failed to spawn worker {}: {}", ctx.downloadId, i, e.what());
            if (workers.empty() && ctx.fatal) {
                ctx.fatal->set(Error{ErrorCode::Unknown,
                                     std::string("Failed to spawn workers: ") + e.what()});
            }
            break;
        }
    }
    for (auto& t : workers) {
        if (t.joinable())
            t.join();
    }
    spdlog::debug("[{}] worker batch (generation {}) drained: {} / {} chunks", ctx.downloadId,
                  ctx.generation, ctx.control->completedCount(), ctx.plan.totalChunks);
}

void WorkerPool::workerLoop(const WorkerContext& ctx, std::size_t workerIndex) const {
    while (true) {
        if (!batchIsLive(ctx))
            return;
        if (ctx.control->completedCount() >= ctx.plan.totalChunks)
            return;

        auto next = ctx.queue->pop();
        if (!next) {
            // Others may still requeue what they hold.
            interruptibleSleep(ctx, ctx.policy.idleBackoff);
            continue;
        }

        const auto index = *next;
        const auto attempt = ctx.retries->incrementAndGet(index);
        const auto chunk = ctx.plan.chunk(index);

        switch (attemptChunk(ctx, chunk, attempt)) {
            case AttemptResult::Committed:
                if (ctx.onChunkCommitted)
                    ctx.onChunkCommitted(index);
                break;
            case AttemptResult::Duplicate:
                break;
            case AttemptResult::Abandoned:
                // The batch went stale mid-transfer; the chunk stays incomplete in the snapshot.
                return;
            case AttemptResult::Failed:
                ctx.queue->requeue(index);
                if (attempt + 1 >= ctx.policy.relaxSpeedAfterAttempts) {
                    spdlog::warn("[{}] worker {}: chunk {} failed attempt {}, requeued", ctx.downloadId,
                                 workerIndex, index, attempt);
                } else {
                    spdlog::debug("[{}] worker {}: chunk {} failed attempt {}, requeued",
                                  ctx.downloadId, workerIndex, index, attempt);
                }
                interruptibleSleep(ctx, retryBackoffFor(attempt, ctx.policy));
                break;
        }
    }
}

WorkerPool::AttemptResult WorkerPool::attemptChunk(const WorkerContext& ctx,
                                                   const ChunkDescriptor& chunk,
                                                   std::uint32_t attempt) const {
    const bool enforceSpeed = enforceSpeedFor(attempt, ctx.policy);
    const auto started = std::chrono::steady_clock::now();
    std::uint64_t received = 0;
    bool tooSlow = false;

    auto shouldAbort = [&]() -> bool {
        if (!batchIsLive(ctx))
            return true;
        if (enforceSpeed) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (isBelowSpeedFloor(received, elapsed, ctx.policy)) {
                tooSlow = true;
                return true;
            }
        }
        return false;
    };

    ByteSink sink = [&](std::span<const std::byte> data) -> Expected<void> {
        // A stale batch must not overwrite ranges the current one may already own.
        if (!batchIsLive(ctx))
            return Error{ErrorCode::NetworkError, "Transfer aborted"};
        if (received + data.size() > chunk.expectedSize) {
            return Error{ErrorCode::ServerError,
                         "Chunk " + std::to_string(chunk.index) + " overflow: server sent more than " +
                             std::to_string(chunk.expectedSize) + " bytes"};
        }
        auto w = ctx.part->writeAt(chunk.start + received, data);
        if (!w.ok())
            return w;
        received += data.size();
        if (ctx.limiter)
            ctx.limiter->acquire(data.size(), shouldAbort);
        return Expected<void>{};
    };

    ShouldAbort abortPredicate = shouldAbort;
    auto result = ctx.http->fetchRange(ctx.url, chunk.start, chunk.expectedSize, ctx.request, sink,
                                       abortPredicate);

    if (!batchIsLive(ctx))
        return AttemptResult::Abandoned;

    if (!result.ok()) {
        const auto& err = result.error();
        if (err.code == ErrorCode::FileSystemError) {
            spdlog::error("[{}] chunk {}: {}", ctx.downloadId, chunk.index, err.message);
            if (ctx.fatal)
                ctx.fatal->set(err);
            return AttemptResult::Abandoned;
        }
        if (tooSlow) {
            spdlog::debug("[{}] chunk {} attempt {} aborted below speed floor ({} bytes)",
                          ctx.downloadId, chunk.index, attempt, received);
        } else {
            spdlog::debug("[{}] chunk {} attempt {}: {} ({})", ctx.downloadId, chunk.index,
                          attempt, err.message, errorCodeName(err.code));
        }
        return AttemptResult::Failed;
    }

    if (received != chunk.expectedSize) {
        spdlog::debug("[{}] chunk {} short read: {} / {} bytes", ctx.downloadId, chunk.index,
                      received, chunk.expectedSize);
        return AttemptResult::Failed;
    }

    if (!ctx.control->commitChunk(ctx.generation, chunk.index, chunk.expectedSize)) {
        // Either stale (signal/generation moved under us) or a duplicate completion.
        return batchIsLive(ctx) ? AttemptResult::Duplicate : AttemptResult::Abandoned;
    }
    return AttemptResult::Committed;
}

void WorkerPool::interruptibleSleep(const WorkerContext& ctx, std::chrono::milliseconds total) {
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (batchIsLive(ctx)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(kSleepSlice)));
    }
}

} // namespace rangeget::downloader
