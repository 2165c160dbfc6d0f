#pragma once

#include <rangeget/downloader/downloader.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rangeget::downloader {

/**
 * Counters captured atomically with a signal change.
 */
struct ControlSnapshot {
    ControlSignal previous{ControlSignal::Run};
    std::uint32_t generation{0};
    std::set<std::uint64_t> completed;
    std::uint64_t downloadedBytes{0};
};

/**
 * Control plane of one download: the cooperative signal, the worker generation and
 * the verified-completion counters.
 *
 * signal() and generation() are lock-free reads for the worker hot path. Commits and
 * signal changes share one short lock so a chunk finishing concurrently with a pause
 * is either part of the pause snapshot or not counted at all.
 */
class DownloadControl {
public:
    DownloadControl() = default;

    DownloadControl(const DownloadControl&) = delete;
    DownloadControl& operator=(const DownloadControl&) = delete;

    [[nodiscard]] ControlSignal signal() const noexcept {
        return signal_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint32_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool isCurrent(std::uint32_t generation) const noexcept {
        return signal() == ControlSignal::Run && this->generation() == generation;
    }

    [[nodiscard]] std::uint64_t completedCount() const noexcept {
        return completedCount_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint64_t downloadedBytes() const noexcept {
        return downloadedBytes_.load(std::memory_order_acquire);
    }

    /**
     * Record a verified chunk. Counters move by exactly `bytes` and one, once per
     * index, and only while `generation` is current and the signal is Run.
     * Returns false without mutating anything otherwise.
     */
    bool commitChunk(std::uint32_t generation, std::uint64_t index, std::uint64_t bytes);

    /**
     * Set `signal` and capture the completion state under the commit lock.
     */
    ControlSnapshot raise(ControlSignal signal);

    /**
     * Start a new worker batch: restore counters from persisted metadata, reset the
     * signal to Run and bump the generation. Returns the new generation.
     */
    std::uint32_t beginGeneration(const std::set<std::uint64_t>& completed,
                                  std::uint64_t downloadedBytes);

    [[nodiscard]] ControlSnapshot snapshot() const;

    /**
     * Serializes state transitions, checkpoints and finalization of this download.
     * Lock order: lifecycle mutex, then session mutex, then the commit lock.
     */
    [[nodiscard]] std::mutex& lifecycleMutex() noexcept { return lifecycle_; }

private:
    std::atomic<ControlSignal> signal_{ControlSignal::Run};
    std::atomic<std::uint32_t> generation_{0};
    std::atomic<std::uint64_t> completedCount_{0};
    std::atomic<std::uint64_t> downloadedBytes_{0};

    mutable std::mutex commitMutex_;
    std::set<std::uint64_t> completed_;

    std::mutex lifecycle_;
};

/**
 * Everything the engine tracks for one registered download.
 */
struct DownloadSession {
    explicit DownloadSession(DownloadMetadata meta)
        : id(meta.id), control(std::make_shared<DownloadControl>()), metadata(std::move(meta)) {}

    const std::string id;
    const std::shared_ptr<DownloadControl> control;

    mutable std::mutex mutex; // guards every member below
    DownloadMetadata metadata;
    StartOptions options;
    bool restoredFromDisk{false};
    std::optional<DownloadOutcome> outcome;
    std::condition_variable outcomeCv;

    /**
     * Publish the terminal result of a run. Ignored when a newer generation has
     * started or a result was already posted for this one.
     */
    void postOutcome(std::uint32_t generation, DownloadOutcome result);

    /**
     * Overwrite the published result (stop after pause, cancel after pause/stop/fail).
     */
    void replaceOutcome(DownloadOutcome result);
};

/**
 * Thread-safe table of active downloads keyed by id.
 */
class DownloadRegistry {
public:
    bool add(const std::shared_ptr<DownloadSession>& session);
    [[nodiscard]] std::shared_ptr<DownloadSession> find(const std::string& id) const;
    [[nodiscard]] std::shared_ptr<DownloadSession>
    findByTarget(const std::filesystem::path& target) const;
    bool remove(const std::string& id);
    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] std::vector<std::shared_ptr<DownloadSession>> sessions() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<DownloadSession>> table_;
};

} // namespace rangeget::downloader
