#pragma once

/*
 * rangeget Downloader - Orchestrator
 *
 * DownloadEngine owns every registered download of the process. Each download runs
 * on its own runner thread, which spawns one WorkerPool batch per generation and
 * finalizes (or fails) the download once the batch drains.
 *
 * All operations return Expected<...>; nothing throws across this interface.
 * Progress callbacks run on worker threads and must not call wait() or shutdown().
 */

#include <rangeget/config/downloader_config.h>
#include <rangeget/downloader/chunk_plan.hpp>
#include <rangeget/downloader/control.hpp>
#include <rangeget/downloader/downloader.hpp>
#include <rangeget/downloader/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rangeget::downloader {

/**
 * Collaborators; empty members get the default implementations.
 */
struct EngineDependencies {
    std::shared_ptr<IHttpAdapter> http;
    std::shared_ptr<IDiskWriter> disk;
    std::shared_ptr<IStateStore> store;
    std::shared_ptr<IRateLimiter> limiter;
};

class DownloadEngine {
public:
    explicit DownloadEngine(config::EngineConfig config = {}, EngineDependencies deps = {});
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    /**
     * Probe `url`, allocate <filepath>.part, persist the sidecar and start fetching.
     * Returns the new download id as soon as the run is spawned.
     * threadCount 0 selects the configured default.
     */
    Expected<std::string> start(const std::string& url, const std::filesystem::path& filepath,
                                int threadCount = 0, StartOptions options = {});

    /**
     * Like start(), naming the file from Content-Disposition, then the URL path,
     * then "download.dat".
     */
    Expected<std::string> startInDirectory(const std::string& url,
                                           const std::filesystem::path& directory,
                                           int threadCount = 0, StartOptions options = {});

    Expected<void> pause(const std::string& id);
    Expected<void> stop(const std::string& id);
    Expected<void> resume(const std::string& id);
    Expected<void> cancel(const std::string& id);

    /**
     * Register a download persisted by an earlier process from <filepath>.part.state.
     * The download comes back Paused (or Stopped/Failed as recorded); call resume().
     */
    Expected<std::string> restore(const std::filesystem::path& filepath, StartOptions options = {});

    /**
     * Block until the current run of `id` ends (Completed, Failed, Paused, Stopped or
     * Cancelled). The timed overload returns Timeout when nothing was posted in time.
     */
    Expected<DownloadOutcome> wait(const std::string& id);
    Expected<DownloadOutcome> wait(const std::string& id, std::chrono::milliseconds timeout);

    [[nodiscard]] Expected<DownloadMetadata> metadata(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> activeIds() const;

    /**
     * Pause every Active download (persisting it) and join all runner threads.
     */
    void shutdown();

    [[nodiscard]] const config::EngineConfig& config() const noexcept { return config_; }

private:
    struct RunHandle {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    struct Archived {
        DownloadOutcome outcome;
        DownloadMetadata metadata;
    };

    Expected<std::uint32_t> resolveThreadCount(int requested) const;
    Expected<void> validateDestination(const std::filesystem::path& target) const;
    Expected<std::string> startProbed(const std::string& url, const std::filesystem::path& target,
                                      std::uint32_t threads, StartOptions options,
                                      const ProbeResult& probe);

    // Caller holds the session's lifecycle mutex.
    Expected<void> launchRun(const std::shared_ptr<DownloadSession>& session);
    Expected<void> refreshRestored(const std::shared_ptr<DownloadSession>& session);

    void runGeneration(const std::shared_ptr<DownloadSession>& session, std::size_t threads,
                       const WorkerContext& ctx);
    void finishRun(const std::shared_ptr<DownloadSession>& session, const WorkerContext& ctx);
    void failRun(const std::shared_ptr<DownloadSession>& session, std::uint32_t generation,
                 const Error& error, bool discardProgress);
    void checkpoint(const std::shared_ptr<DownloadSession>& session, std::uint32_t generation);

    Expected<void> haltWith(const std::string& id, ControlSignal signal);

    RequestOptions requestOptionsFor(const StartOptions& options) const;
    DownloadOutcome outcomeFrom(const DownloadMetadata& metadata, DownloadState status,
                                std::optional<Error> detail = std::nullopt) const;
    void emitProgress(const std::shared_ptr<DownloadSession>& session, DownloadState state) const;
    void archive(const std::shared_ptr<DownloadSession>& session, const DownloadOutcome& outcome);
    void reapFinishedRuns();

    config::EngineConfig config_;
    RequestOptions baseRequest_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IDiskWriter> disk_;
    std::shared_ptr<IStateStore> store_;
    std::shared_ptr<IRateLimiter> limiter_;

    DownloadRegistry registry_;

    mutable std::mutex archiveMutex_;
    std::unordered_map<std::string, Archived> finished_;
    std::deque<std::string> finishedOrder_;

    std::mutex runsMutex_;
    std::vector<RunHandle> runs_;
    std::atomic<bool> shuttingDown_{false};
};

} // namespace rangeget::downloader
