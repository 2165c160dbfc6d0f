/*
 * rangeget/src/downloader/download_engine.cpp
 *
 * DownloadEngine (parallel, resumable):
 * - Probe the server for size and validators (HEAD or GET bytes=0-0)
 * - Partition into chunks, sparse-allocate <target>.part, persist <target>.part.state
 * - One runner thread per download; each resume spawns a fresh WorkerPool batch under a
 *   new generation so workers of an earlier batch can never touch the new counters
 * - On drain: integrity check, optional SHA-256 check, fsync, rename onto the target
 * - Pause/stop persist a snapshot taken atomically with the signal change; cancel
 *   removes the partial file and the sidecar
 *
 * Locking: per download, lifecycle mutex -> session mutex -> commit lock. Registry
 * calls are never made while a session mutex is held.
 */

#include <rangeget/core/uuid.h>
#include <rangeget/downloader/download_engine.hpp>
#include <rangeget/downloader/http_util.hpp>
#include <rangeget/downloader/integrity.hpp>
#include <rangeget/downloader/state_store.hpp>

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace rangeget::downloader {

namespace fs = std::filesystem;

namespace {

ChunkPlan planFor(const DownloadMetadata& meta) {
    if (meta.chunkSize == 0) {
        auto plan = planChunks(meta.totalSize);
        return plan.ok() ? plan.value() : ChunkPlan{};
    }
    ChunkPlan plan;
    plan.totalSize = meta.totalSize;
    plan.chunkSize = meta.chunkSize;
    plan.totalChunks = chunkCountFor(meta.totalSize, meta.chunkSize);
    return plan;
}

// Copy the committed state captured with a signal change into the metadata record.
void applySnapshot(DownloadMetadata& meta, const ChunkPlan& plan, const ControlSnapshot& snap) {
    meta.completedChunks = snap.completed;
    meta.incompleteChunks.clear();
    for (std::uint64_t i = 0; i < plan.totalChunks; ++i) {
        if (snap.completed.count(i) == 0)
            meta.incompleteChunks.insert(i);
    }
    meta.downloadedBytes = snap.downloadedBytes;
}

fs::path normalizeTarget(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal();
}

bool validatorsChanged(const DownloadMetadata& meta, const ProbeResult& probe) {
    if (meta.etag && probe.etag)
        return *meta.etag != *probe.etag;
    if (meta.lastModified && probe.lastModified)
        return *meta.lastModified != *probe.lastModified;
    return false;
}

} // namespace

DownloadEngine::DownloadEngine(config::EngineConfig config, EngineDependencies deps)
    : config_(std::move(config)), baseRequest_(config::makeRequestOptions(config_)),
      http_(std::move(deps.http)), disk_(std::move(deps.disk)), store_(std::move(deps.store)),
      limiter_(std::move(deps.limiter)) {
    const bool limiterInjected = static_cast<bool>(limiter_);
    if (!http_)
        http_ = makeCurlHttpAdapter();
    if (!disk_)
        disk_ = makeDiskWriter();
    if (!store_)
        store_ = makeJsonStateStore();
    if (!limiter_ && (config_.rateLimit.globalBps != 0 || config_.rateLimit.perConnectionBps != 0))
        limiter_ = makeRateLimiter();
    if (limiter_ && !limiterInjected)
        limiter_->setLimits(config_.rateLimit);
}

DownloadEngine::~DownloadEngine() {
    shutdown();
}

// ---- Validation ----

Expected<std::uint32_t> DownloadEngine::resolveThreadCount(int requested) const {
    const long long threads =
        requested == 0 ? static_cast<long long>(config_.defaultThreads) : requested;
    if (threads < kMinThreads || threads > kMaxThreads) {
        return Error{ErrorCode::ConfigError, "Thread count must be within " +
                                                 std::to_string(kMinThreads) + ".." +
                                                 std::to_string(kMaxThreads) + ", got " +
                                                 std::to_string(threads)};
    }
    return static_cast<std::uint32_t>(threads);
}

Expected<void> DownloadEngine::validateDestination(const fs::path& target) const {
    if (target.empty()) {
        return Error{ErrorCode::ConfigError, "Destination path is empty"};
    }
    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        return Error{ErrorCode::ConfigError, "Destination is a directory: " + target.string()};
    }
    auto parent = target.parent_path();
    if (parent.empty())
        parent = ".";
    if (!fs::is_directory(parent, ec)) {
        return Error{ErrorCode::ConfigError,
                     "Destination directory does not exist: " + parent.string()};
    }
    if (::access(parent.c_str(), W_OK) != 0) {
        return Error{ErrorCode::ConfigError,
                     "Destination directory is not writable: " + parent.string()};
    }
    if (registry_.findByTarget(target)) {
        return Error{ErrorCode::InvalidState,
                     "Destination is already being downloaded: " + target.string()};
    }
    return {};
}

// ---- Start ----

Expected<std::string> DownloadEngine::start(const std::string& url, const fs::path& filepath,
                                            int threadCount, StartOptions options) {
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::InvalidState, "Engine is shutting down"};
    }
    auto threads = resolveThreadCount(threadCount);
    if (!threads.ok())
        return threads.error();
    if (url.empty()) {
        return Error{ErrorCode::ConfigError, "Empty URL"};
    }
    const auto target = filepath.empty() ? filepath : normalizeTarget(filepath);
    if (auto dest = validateDestination(target); !dest.ok())
        return dest.error();

    auto probe = http_->probe(url, requestOptionsFor(options));
    if (!probe.ok()) {
        spdlog::error("Probe of {} failed: {}", url, probe.error().message);
        return probe.error();
    }
    return startProbed(url, target, threads.value(), std::move(options), probe.value());
}

Expected<std::string> DownloadEngine::startInDirectory(const std::string& url,
                                                       const fs::path& directory, int threadCount,
                                                       StartOptions options) {
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::InvalidState, "Engine is shutting down"};
    }
    auto threads = resolveThreadCount(threadCount);
    if (!threads.ok())
        return threads.error();
    if (url.empty()) {
        return Error{ErrorCode::ConfigError, "Empty URL"};
    }
    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        return Error{ErrorCode::ConfigError, "Not a directory: " + directory.string()};
    }

    auto probe = http_->probe(url, requestOptionsFor(options));
    if (!probe.ok()) {
        spdlog::error("Probe of {} failed: {}", url, probe.error().message);
        return probe.error();
    }

    std::string name = "download.dat";
    if (probe.value().suggestedFilename) {
        name = sanitizeFileName(*probe.value().suggestedFilename);
    } else if (auto fromUrl = fileNameFromUrl(url)) {
        name = sanitizeFileName(*fromUrl);
    }
    const auto target = normalizeTarget(directory / name);
    if (auto dest = validateDestination(target); !dest.ok())
        return dest.error();

    return startProbed(url, target, threads.value(), std::move(options), probe.value());
}

Expected<std::string> DownloadEngine::startProbed(const std::string& url, const fs::path& target,
                                                  std::uint32_t threads, StartOptions options,
                                                  const ProbeResult& probe) {
    if (!probe.contentLength || *probe.contentLength == 0) {
        return Error{ErrorCode::ParseError, "Server did not report a usable size for " + url};
    }
    if (!probe.acceptRanges) {
        spdlog::warn("{} does not advertise byte ranges; ranged requests may be refused", url);
    }
    auto plan = planChunks(*probe.contentLength);
    if (!plan.ok())
        return plan.error();

    const auto part = partPathFor(target);
    if (auto alloc = disk_->allocateSparse(part, plan.value().totalSize); !alloc.ok()) {
        spdlog::error("Failed to allocate {}: {}", part.string(), alloc.error().message);
        return alloc.error();
    }

    DownloadMetadata meta;
    meta.id = core::generateUUID();
    meta.url = url;
    meta.filepath = target;
    meta.totalSize = plan.value().totalSize;
    meta.chunkSize = plan.value().chunkSize;
    meta.threadCount = threads;
    meta.state = DownloadState::Active;
    for (auto idx : plan.value().allIndices())
        meta.incompleteChunks.insert(idx);
    meta.etag = probe.etag;
    meta.lastModified = probe.lastModified;
    meta.createdAt = std::chrono::system_clock::now();

    if (auto saved = store_->save(meta); !saved.ok()) {
        (void)disk_->remove(part);
        return saved.error();
    }

    auto session = std::make_shared<DownloadSession>(meta);
    session->options = std::move(options);
    if (!registry_.add(session)) {
        (void)disk_->remove(part);
        (void)store_->remove(target);
        return Error{ErrorCode::Unknown, "Duplicate download id " + meta.id};
    }

    spdlog::info("[{}] start {} -> {} ({} bytes, {} chunks of {} bytes, {} threads)", meta.id, url,
                 target.string(), meta.totalSize, plan.value().totalChunks, meta.chunkSize,
                 threads);

    {
        std::lock_guard<std::mutex> lk(session->control->lifecycleMutex());
        auto launched = launchRun(session);
        if (!launched.ok()) {
            registry_.remove(meta.id);
            (void)disk_->remove(part);
            (void)store_->remove(target);
            return launched.error();
        }
    }

    emitProgress(session, DownloadState::Active);
    return meta.id;
}

// ---- Runs ----

Expected<void> DownloadEngine::launchRun(const std::shared_ptr<DownloadSession>& session) {
    DownloadMetadata meta;
    StartOptions opts;
    {
        std::lock_guard<std::mutex> lk(session->mutex);
        meta = session->metadata;
        opts = session->options;
    }
    const auto plan = planFor(meta);

    auto part = disk_->openForWrite(partPathFor(meta.filepath));
    if (!part.ok())
        return part.error();

    WorkerContext ctx;
    ctx.downloadId = meta.id;
    ctx.url = meta.url;
    ctx.plan = plan;
    ctx.control = session->control;
    ctx.queue = std::make_shared<WorkQueue>(
        std::vector<std::uint64_t>(meta.incompleteChunks.begin(), meta.incompleteChunks.end()));
    ctx.retries = std::make_shared<RetryTracker>();
    ctx.fatal = std::make_shared<FatalSlot>();
    ctx.http = http_;
    ctx.part = part.value();
    ctx.limiter = limiter_;
    ctx.request = requestOptionsFor(opts);
    ctx.policy = config_.transfer;
    ctx.generation = session->control->beginGeneration(meta.completedChunks, meta.downloadedBytes);

    const auto every = std::max<std::uint32_t>(1, config_.transfer.checkpointEveryChunks);
    auto sinceCheckpoint = std::make_shared<std::atomic<std::uint32_t>>(0);
    ctx.onChunkCommitted = [this, session, gen = ctx.generation, every,
                            sinceCheckpoint](std::uint64_t) {
        emitProgress(session, DownloadState::Active);
        if ((sinceCheckpoint->fetch_add(1, std::memory_order_acq_rel) + 1) % every == 0)
            checkpoint(session, gen);
    };

    reapFinishedRuns();

    const auto threads = static_cast<std::size_t>(std::max<std::uint32_t>(1, meta.threadCount));
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread runner([this, session, threads, ctx, done] {
            runGeneration(session, threads, ctx);
            done->store(true, std::memory_order_release);
        });
        std::lock_guard<std::mutex> lk(runsMutex_);
        runs_.push_back(RunHandle{std::move(runner), done});
    } catch (const std::system_error& e) {
        (void)session->control->raise(ControlSignal::Stop);
        return Error{ErrorCode::Unknown, std::string("Failed to spawn download runner: ") + e.what()};
    }

    spdlog::debug("[{}] generation {} launched with {} workers, {} chunks pending", meta.id,
                  ctx.generation, threads, meta.incompleteChunks.size());
    return {};
}

void DownloadEngine::runGeneration(const std::shared_ptr<DownloadSession>& session,
                                   std::size_t threads, const WorkerContext& ctx) {
    WorkerPool pool(threads);
    pool.run(ctx);
    finishRun(session, ctx);
}

void DownloadEngine::finishRun(const std::shared_ptr<DownloadSession>& session,
                               const WorkerContext& ctx) {
    auto& control = *session->control;
    const auto gen = ctx.generation;
    std::optional<DownloadState> emitState;

    std::unique_lock<std::mutex> lk(control.lifecycleMutex());
    if (control.generation() != gen) {
        spdlog::debug("[{}] generation {} superseded", ctx.downloadId, gen);
        return;
    }
    if (control.signal() != ControlSignal::Run) {
        // The command that raised the signal already persisted and published the result.
        spdlog::debug("[{}] generation {} ended by control signal", ctx.downloadId, gen);
        return;
    }
    if (ctx.fatal->isSet()) {
        failRun(session, gen, ctx.fatal->get().value_or(Error{ErrorCode::Unknown, "worker failed"}),
                false);
        lk.unlock();
        emitProgress(session, DownloadState::Failed);
        return;
    }

    auto verified = verifyCompletion(control.downloadedBytes(), ctx.plan.totalSize,
                                     control.completedCount(), ctx.plan.totalChunks);
    if (!verified.ok()) {
        failRun(session, gen, verified.error(), false);
        lk.unlock();
        emitProgress(session, DownloadState::Failed);
        return;
    }

    DownloadMetadata meta;
    std::optional<Checksum> expected;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        meta = session->metadata;
        expected = session->options.checksum;
    }
    const auto part = partPathFor(meta.filepath);

    if (expected) {
        if (auto synced = ctx.part->sync(); !synced.ok()) {
            spdlog::warn("[{}] fsync before hashing failed: {}", ctx.downloadId,
                         synced.error().message);
        }
        // Hash without holding the lifecycle lock so pause/cancel stay responsive.
        lk.unlock();
        auto checked = verifyChecksum(part, *expected);
        lk.lock();
        if (!control.isCurrent(gen))
            return;
        if (!checked.ok()) {
            failRun(session, gen, checked.error(),
                    checked.error().code == ErrorCode::ChecksumMismatch);
            lk.unlock();
            emitProgress(session, DownloadState::Failed);
            return;
        }
        spdlog::debug("[{}] SHA-256 verified", ctx.downloadId);
    }

    if (auto synced = ctx.part->sync(); !synced.ok()) {
        failRun(session, gen, synced.error(), false);
        lk.unlock();
        emitProgress(session, DownloadState::Failed);
        return;
    }
    if (auto fin = disk_->finalize(part, meta.filepath); !fin.ok()) {
        failRun(session, gen, fin.error(), false);
        lk.unlock();
        emitProgress(session, DownloadState::Failed);
        return;
    }
    if (auto removed = store_->remove(meta.filepath); !removed.ok()) {
        spdlog::warn("[{}] {}", ctx.downloadId, removed.error().message);
    }

    auto snap = control.raise(ControlSignal::Stop);
    DownloadOutcome outcome;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        auto& m = session->metadata;
        applySnapshot(m, ctx.plan, snap);
        m.state = DownloadState::Completed;
        m.completedAt = std::chrono::system_clock::now();
        m.errorMessage.reset();
        outcome = outcomeFrom(m, DownloadState::Completed);
    }
    archive(session, outcome);
    session->postOutcome(gen, outcome);
    registry_.remove(session->id);
    emitState = DownloadState::Completed;
    lk.unlock();

    spdlog::info("[{}] completed {} ({} bytes)", ctx.downloadId, meta.filepath.string(),
                 ctx.plan.totalSize);
    emitProgress(session, *emitState);
}

void DownloadEngine::failRun(const std::shared_ptr<DownloadSession>& session,
                             std::uint32_t generation, const Error& error, bool discardProgress) {
    auto snap = session->control->raise(ControlSignal::Stop);
    DownloadMetadata copy;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        auto& m = session->metadata;
        const auto plan = planFor(m);
        if (discardProgress) {
            resetProgress(m, plan);
        } else {
            applySnapshot(m, plan, snap);
        }
        m.state = DownloadState::Failed;
        m.errorMessage = error.message;
        copy = m;
    }
    if (auto saved = store_->save(copy); !saved.ok()) {
        spdlog::error("[{}] failed to persist failure state: {}", copy.id, saved.error().message);
    }
    spdlog::error("[{}] download failed ({}): {}", copy.id, errorCodeName(error.code),
                  error.message);
    session->postOutcome(generation, outcomeFrom(copy, DownloadState::Failed, error));
}

void DownloadEngine::checkpoint(const std::shared_ptr<DownloadSession>& session,
                                std::uint32_t generation) {
    auto& control = *session->control;
    std::lock_guard<std::mutex> lk(control.lifecycleMutex());
    if (!control.isCurrent(generation))
        return;
    auto snap = control.snapshot();
    DownloadMetadata copy;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        applySnapshot(session->metadata, planFor(session->metadata), snap);
        copy = session->metadata;
    }
    if (auto saved = store_->save(copy); !saved.ok()) {
        spdlog::warn("[{}] checkpoint failed: {}", copy.id, saved.error().message);
        return;
    }
    spdlog::debug("[{}] checkpoint: {} / {} chunks, {} bytes", copy.id,
                  copy.completedChunks.size(), planFor(copy).totalChunks, copy.downloadedBytes);
}

// ---- Control commands ----

Expected<void> DownloadEngine::pause(const std::string& id) {
    return haltWith(id, ControlSignal::Pause);
}

Expected<void> DownloadEngine::stop(const std::string& id) {
    return haltWith(id, ControlSignal::Stop);
}

Expected<void> DownloadEngine::haltWith(const std::string& id, ControlSignal signal) {
    const bool isStop = signal == ControlSignal::Stop;
    const auto target = isStop ? DownloadState::Stopped : DownloadState::Paused;

    auto session = registry_.find(id);
    if (!session) {
        std::lock_guard<std::mutex> lk(archiveMutex_);
        if (finished_.count(id)) {
            return Error{ErrorCode::InvalidState, "Download " + id + " has already finished"};
        }
        return Error{ErrorCode::NotFound, "Unknown download id " + id};
    }

    DownloadMetadata copy;
    Expected<void> saved;
    {
        std::lock_guard<std::mutex> lk(session->control->lifecycleMutex());
        {
            std::lock_guard<std::mutex> sl(session->mutex);
            auto& m = session->metadata;
            const bool allowed = m.state == DownloadState::Active ||
                                 (isStop && m.state == DownloadState::Paused);
            if (!allowed) {
                return Error{ErrorCode::InvalidState, std::string("Cannot ") +
                                                          (isStop ? "stop" : "pause") +
                                                          " download in state " + toString(m.state)};
            }
            auto snap = session->control->raise(signal);
            applySnapshot(m, planFor(m), snap);
            m.state = target;
            if (isStop) {
                m.stoppedAt = std::chrono::system_clock::now();
            } else {
                m.pausedAt = std::chrono::system_clock::now();
            }
            copy = m;
        }
        saved = store_->save(copy);
        session->replaceOutcome(outcomeFrom(copy, target));
    }

    spdlog::info("[{}] {} at {:.1f}% ({} / {} bytes, {} / {} chunks)", id, toString(target),
                 copy.progressPercentage(), copy.downloadedBytes, copy.totalSize,
                 copy.completedChunks.size(), planFor(copy).totalChunks);
    emitProgress(session, target);

    if (!saved.ok()) {
        spdlog::error("[{}] failed to persist {} state: {}", id, toString(target),
                      saved.error().message);
        return saved.error();
    }
    return {};
}

Expected<void> DownloadEngine::refreshRestored(const std::shared_ptr<DownloadSession>& session) {
    DownloadMetadata meta;
    StartOptions opts;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        meta = session->metadata;
        opts = session->options;
    }

    auto probe = http_->probe(meta.url, requestOptionsFor(opts));
    if (!probe.ok()) {
        spdlog::error("[{}] re-probe of {} failed: {}", meta.id, meta.url, probe.error().message);
        return probe.error();
    }
    const auto& p = probe.value();
    if (!p.contentLength || *p.contentLength == 0) {
        return Error{ErrorCode::ParseError, "Server did not report a usable size for " + meta.url};
    }

    const bool sizeChanged = *p.contentLength != meta.totalSize;
    if (sizeChanged || validatorsChanged(meta, p)) {
        spdlog::warn("[{}] remote file changed since it was saved (size {} -> {}); restarting "
                     "from scratch",
                     meta.id, meta.totalSize, *p.contentLength);
        auto plan = planChunks(*p.contentLength);
        if (!plan.ok())
            return plan.error();
        meta.totalSize = *p.contentLength;
        resetProgress(meta, plan.value());
        if (auto alloc = disk_->allocateSparse(partPathFor(meta.filepath), meta.totalSize);
            !alloc.ok())
            return alloc.error();
    }
    meta.etag = p.etag ? p.etag : meta.etag;
    meta.lastModified = p.lastModified ? p.lastModified : meta.lastModified;

    std::lock_guard<std::mutex> sl(session->mutex);
    session->metadata = std::move(meta);
    return {};
}

Expected<void> DownloadEngine::resume(const std::string& id) {
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::InvalidState, "Engine is shutting down"};
    }
    auto session = registry_.find(id);
    if (!session) {
        std::lock_guard<std::mutex> lk(archiveMutex_);
        if (finished_.count(id)) {
            return Error{ErrorCode::InvalidState, "Download " + id + " has already finished"};
        }
        return Error{ErrorCode::NotFound, "Unknown download id " + id};
    }

    DownloadMetadata next;
    {
        std::lock_guard<std::mutex> lk(session->control->lifecycleMutex());
        bool restored = false;
        {
            std::lock_guard<std::mutex> sl(session->mutex);
            if (!canResume(session->metadata.state)) {
                return Error{ErrorCode::InvalidState, std::string("Cannot resume download in state ") +
                                                          toString(session->metadata.state)};
            }
            restored = session->restoredFromDisk;
        }

        if (restored) {
            if (auto refreshed = refreshRestored(session); !refreshed.ok())
                return refreshed.error();
        }

        {
            std::lock_guard<std::mutex> sl(session->mutex);
            next = session->metadata;
        }
        const auto part = partPathFor(next.filepath);
        const auto onDisk = disk_->fileSize(part);
        if (!onDisk || *onDisk != next.totalSize) {
            spdlog::warn("[{}] partial file {} is missing or has the wrong size; starting over", id,
                         part.string());
            if (auto alloc = disk_->allocateSparse(part, next.totalSize); !alloc.ok())
                return alloc.error();
            resetProgress(next, planFor(next));
        }

        next.state = DownloadState::Active;
        next.resumedAt = std::chrono::system_clock::now();
        next.errorMessage.reset();
        if (auto saved = store_->save(next); !saved.ok())
            return saved.error();

        {
            std::lock_guard<std::mutex> sl(session->mutex);
            session->metadata = next;
            session->restoredFromDisk = false;
            session->outcome.reset();
        }

        if (auto launched = launchRun(session); !launched.ok()) {
            DownloadMetadata failed;
            {
                std::lock_guard<std::mutex> sl(session->mutex);
                session->metadata.state = DownloadState::Failed;
                session->metadata.errorMessage = launched.error().message;
                failed = session->metadata;
            }
            (void)store_->save(failed);
            session->replaceOutcome(outcomeFrom(failed, DownloadState::Failed, launched.error()));
            return launched.error();
        }
    }

    spdlog::info("[{}] resumed: {} chunks remaining ({} / {} bytes done)", id,
                 next.incompleteChunks.size(), next.downloadedBytes, next.totalSize);
    emitProgress(session, DownloadState::Active);
    return {};
}

Expected<void> DownloadEngine::cancel(const std::string& id) {
    auto session = registry_.find(id);
    if (!session) {
        std::lock_guard<std::mutex> lk(archiveMutex_);
        if (auto it = finished_.find(id); it != finished_.end()) {
            return Error{ErrorCode::InvalidState, std::string("Cannot cancel download in state ") +
                                                      toString(it->second.outcome.status)};
        }
        return Error{ErrorCode::NotFound, "Unknown download id " + id};
    }

    DownloadMetadata copy;
    std::optional<Error> cleanupError;
    {
        std::lock_guard<std::mutex> lk(session->control->lifecycleMutex());
        {
            std::lock_guard<std::mutex> sl(session->mutex);
            auto& m = session->metadata;
            if (!canCancel(m.state)) {
                return Error{ErrorCode::InvalidState,
                             std::string("Cannot cancel download in state ") + toString(m.state)};
            }
            auto snap = session->control->raise(ControlSignal::Cancel);
            applySnapshot(m, planFor(m), snap);
            m.state = DownloadState::Cancelled;
            copy = m;
        }

        if (auto removed = disk_->remove(partPathFor(copy.filepath)); !removed.ok()) {
            spdlog::error("[{}] {}", id, removed.error().message);
            cleanupError = removed.error();
        }
        if (auto removed = store_->remove(copy.filepath); !removed.ok()) {
            spdlog::error("[{}] {}", id, removed.error().message);
            if (!cleanupError)
                cleanupError = removed.error();
        }

        auto outcome = outcomeFrom(copy, DownloadState::Cancelled);
        archive(session, outcome);
        session->replaceOutcome(outcome);
    }
    registry_.remove(id);

    spdlog::info("[{}] cancelled; removed partial file and saved state", id);
    emitProgress(session, DownloadState::Cancelled);
    if (cleanupError)
        return *cleanupError;
    return {};
}

// ---- Restore ----

Expected<std::string> DownloadEngine::restore(const fs::path& filepath, StartOptions options) {
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::InvalidState, "Engine is shutting down"};
    }
    if (filepath.empty()) {
        return Error{ErrorCode::ConfigError, "Destination path is empty"};
    }
    const auto target = normalizeTarget(filepath);
    if (registry_.findByTarget(target)) {
        return Error{ErrorCode::InvalidState,
                     "Destination is already registered: " + target.string()};
    }

    auto loaded = store_->load(target);
    if (!loaded.ok())
        return loaded.error();
    auto meta = std::move(loaded).value();
    meta.filepath = target;

    if (isTerminal(meta.state)) {
        return Error{ErrorCode::InvalidState, "Saved download " + meta.id + " is already " +
                                                  toString(meta.state)};
    }
    if (registry_.find(meta.id)) {
        return Error{ErrorCode::InvalidState, "Download " + meta.id + " is already registered"};
    }
    auto plan = planChunks(meta.totalSize);
    if (!plan.ok())
        return plan.error();

    bool dirty = reconcileWithPartFile(meta, plan.value(), disk_->fileSize(partPathFor(target)));
    if (meta.threadCount < static_cast<std::uint32_t>(kMinThreads) ||
        meta.threadCount > static_cast<std::uint32_t>(kMaxThreads)) {
        meta.threadCount = std::clamp<std::uint32_t>(config_.defaultThreads, kMinThreads,
                                                     kMaxThreads);
        dirty = true;
    }
    if (meta.state == DownloadState::Active || meta.state == DownloadState::Pending) {
        // Interrupted by a crash or an unclean exit.
        meta.state = DownloadState::Paused;
        meta.pausedAt = std::chrono::system_clock::now();
        dirty = true;
    }

    auto session = std::make_shared<DownloadSession>(meta);
    session->options = std::move(options);
    session->restoredFromDisk = true;
    (void)session->control->raise(meta.state == DownloadState::Paused ? ControlSignal::Pause
                                                                      : ControlSignal::Stop);
    std::optional<Error> detail;
    if (meta.state == DownloadState::Failed) {
        detail = Error{ErrorCode::IntegrityError, meta.errorMessage.value_or("download failed")};
    }
    session->outcome = outcomeFrom(meta, meta.state, detail);

    if (dirty) {
        if (auto saved = store_->save(meta); !saved.ok()) {
            spdlog::warn("[{}] failed to rewrite restored state: {}", meta.id,
                         saved.error().message);
        }
    }
    if (!registry_.add(session)) {
        return Error{ErrorCode::InvalidState, "Download " + meta.id + " is already registered"};
    }

    spdlog::info("[{}] restored {} ({}: {} / {} bytes)", meta.id, target.string(),
                 toString(meta.state), meta.downloadedBytes, meta.totalSize);
    return meta.id;
}

// ---- Queries ----

Expected<DownloadOutcome> DownloadEngine::wait(const std::string& id) {
    auto session = registry_.find(id);
    if (!session) {
        std::lock_guard<std::mutex> lk(archiveMutex_);
        if (auto it = finished_.find(id); it != finished_.end())
            return it->second.outcome;
        return Error{ErrorCode::NotFound, "Unknown download id " + id};
    }
    std::unique_lock<std::mutex> lk(session->mutex);
    session->outcomeCv.wait(lk, [&] { return session->outcome.has_value(); });
    return *session->outcome;
}

Expected<DownloadOutcome> DownloadEngine::wait(const std::string& id,
                                               std::chrono::milliseconds timeout) {
    auto session = registry_.find(id);
    if (!session) {
        std::lock_guard<std::mutex> lk(archiveMutex_);
        if (auto it = finished_.find(id); it != finished_.end())
            return it->second.outcome;
        return Error{ErrorCode::NotFound, "Unknown download id " + id};
    }
    std::unique_lock<std::mutex> lk(session->mutex);
    if (!session->outcomeCv.wait_for(lk, timeout,
                                     [&] { return session->outcome.has_value(); })) {
        return Error{ErrorCode::Timeout, "Timed out waiting for download " + id};
    }
    return *session->outcome;
}

Expected<DownloadMetadata> DownloadEngine::metadata(const std::string& id) const {
    auto session = registry_.find(id);
    if (!session) {
        std::lock_guard<std::mutex> lk(archiveMutex_);
        if (auto it = finished_.find(id); it != finished_.end())
            return it->second.metadata;
        return Error{ErrorCode::NotFound, "Unknown download id " + id};
    }
    DownloadMetadata meta;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        meta = session->metadata;
    }
    if (meta.state == DownloadState::Active) {
        applySnapshot(meta, planFor(meta), session->control->snapshot());
    }
    return meta;
}

std::vector<std::string> DownloadEngine::activeIds() const {
    return registry_.ids();
}

void DownloadEngine::shutdown() {
    shuttingDown_.store(true, std::memory_order_release);

    for (const auto& session : registry_.sessions()) {
        DownloadState state;
        {
            std::lock_guard<std::mutex> sl(session->mutex);
            state = session->metadata.state;
        }
        if (state != DownloadState::Active)
            continue;
        if (auto paused = pause(session->id); !paused.ok()) {
            spdlog::debug("[{}] shutdown pause: {}", session->id, paused.error().message);
        }
    }

    std::vector<RunHandle> runs;
    {
        std::lock_guard<std::mutex> lk(runsMutex_);
        runs.swap(runs_);
    }
    for (auto& run : runs) {
        if (run.thread.joinable())
            run.thread.join();
    }
}

// ---- Helpers ----

RequestOptions DownloadEngine::requestOptionsFor(const StartOptions& options) const {
    RequestOptions req = baseRequest_;
    req.headers.insert(req.headers.end(), options.headers.begin(), options.headers.end());
    return req;
}

DownloadOutcome DownloadEngine::outcomeFrom(const DownloadMetadata& metadata, DownloadState status,
                                            std::optional<Error> detail) const {
    DownloadOutcome out;
    out.id = metadata.id;
    out.status = status;
    out.detail = std::move(detail);
    out.downloadedBytes = metadata.downloadedBytes;
    out.totalBytes = metadata.totalSize;
    out.completedChunks = metadata.completedChunks.size();
    out.totalChunks = planFor(metadata).totalChunks;
    out.targetPath = metadata.filepath;
    return out;
}

void DownloadEngine::emitProgress(const std::shared_ptr<DownloadSession>& session,
                                  DownloadState state) const {
    ProgressCallback callback;
    ProgressEvent ev;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        if (!session->options.onProgress)
            return;
        callback = session->options.onProgress;
        ev.id = session->id;
        ev.totalBytes = session->metadata.totalSize;
        ev.totalChunks = planFor(session->metadata).totalChunks;
        ev.downloadedBytes = session->metadata.downloadedBytes;
        ev.completedChunks = session->metadata.completedChunks.size();
    }
    if (state == DownloadState::Active) {
        ev.downloadedBytes = session->control->downloadedBytes();
        ev.completedChunks = session->control->completedCount();
    }
    ev.state = state;
    ev.timestamp = std::chrono::steady_clock::now();
    callback(ev);
}

void DownloadEngine::archive(const std::shared_ptr<DownloadSession>& session,
                             const DownloadOutcome& outcome) {
    DownloadMetadata meta;
    {
        std::lock_guard<std::mutex> sl(session->mutex);
        meta = session->metadata;
    }
    // Terminal records need no per-chunk detail; the counters stay.
    meta.completedChunks.clear();
    meta.incompleteChunks.clear();

    std::lock_guard<std::mutex> lk(archiveMutex_);
    if (finished_.insert_or_assign(session->id, Archived{outcome, std::move(meta)}).second)
        finishedOrder_.push_back(session->id);
    while (finishedOrder_.size() > config_.finishedHistory) {
        finished_.erase(finishedOrder_.front());
        finishedOrder_.pop_front();
    }
}

void DownloadEngine::reapFinishedRuns() {
    std::vector<RunHandle> finished;
    {
        std::lock_guard<std::mutex> lk(runsMutex_);
        auto split = std::partition(runs_.begin(), runs_.end(), [](const RunHandle& r) {
            return !r.done->load(std::memory_order_acquire);
        });
        std::move(split, runs_.end(), std::back_inserter(finished));
        runs_.erase(split, runs_.end());
    }
    for (auto& run : finished) {
        if (run.thread.joinable())
            run.thread.join();
    }
}

} // namespace rangeget::downloader
