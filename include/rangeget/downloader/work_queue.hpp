#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rangeget::downloader {

/**
 * Shared FIFO of pending chunk indices.
 *
 * pop() returning nullopt is not a completion signal: other workers may be holding
 * chunks they are about to requeue.
 */
class WorkQueue {
public:
    WorkQueue() = default;
    explicit WorkQueue(const std::vector<std::uint64_t>& indices) { seed(indices); }

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void seed(const std::vector<std::uint64_t>& indices);
    [[nodiscard]] std::optional<std::uint64_t> pop();
    void requeue(std::uint64_t index);
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::deque<std::uint64_t> pending_;
};

/**
 * Per-chunk attempt counters. Unbounded: a chunk retries until it succeeds or the
 * download leaves the Active state.
 */
class RetryTracker {
public:
    RetryTracker() = default;

    RetryTracker(const RetryTracker&) = delete;
    RetryTracker& operator=(const RetryTracker&) = delete;

    std::uint32_t incrementAndGet(std::uint64_t index);
    [[nodiscard]] std::uint32_t attempts(std::uint64_t index) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::uint32_t> counts_;
};

} // namespace rangeget::downloader
