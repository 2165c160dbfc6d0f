#include <rangeget/downloader/control.hpp>

#include <spdlog/spdlog.h>

namespace rangeget::downloader {

bool DownloadControl::commitChunk(std::uint32_t generation, std::uint64_t index,
                                  std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(commitMutex_);
    if (!isCurrent(generation))
        return false;
    if (!completed_.insert(index).second) {
        spdlog::debug("Chunk {} already committed; ignoring duplicate completion", index);
        return false;
    }
    downloadedBytes_.fetch_add(bytes, std::memory_order_acq_rel);
    completedCount_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

ControlSnapshot DownloadControl::raise(ControlSignal signal) {
    std::lock_guard<std::mutex> lk(commitMutex_);
    ControlSnapshot snap;
    snap.previous = signal_.exchange(signal, std::memory_order_acq_rel);
    snap.generation = generation_.load(std::memory_order_acquire);
    snap.completed = completed_;
    snap.downloadedBytes = downloadedBytes_.load(std::memory_order_acquire);
    return snap;
}

std::uint32_t DownloadControl::beginGeneration(const std::set<std::uint64_t>& completed,
                                               std::uint64_t downloadedBytes) {
    std::lock_guard<std::mutex> lk(commitMutex_);
    completed_ = completed;
    completedCount_.store(completed_.size(), std::memory_order_release);
    downloadedBytes_.store(downloadedBytes, std::memory_order_release);
    // Bump before reopening the gate so a stale worker never sees Run with its own generation.
    const auto next = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    signal_.store(ControlSignal::Run, std::memory_order_release);
    return next;
}

ControlSnapshot DownloadControl::snapshot() const {
    std::lock_guard<std::mutex> lk(commitMutex_);
    ControlSnapshot snap;
    snap.previous = signal_.load(std::memory_order_acquire);
    snap.generation = generation_.load(std::memory_order_acquire);
    snap.completed = completed_;
    snap.downloadedBytes = downloadedBytes_.load(std::memory_order_acquire);
    return snap;
}

void DownloadSession::postOutcome(std::uint32_t generation, DownloadOutcome result) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (control->generation() != generation || outcome.has_value())
            return;
        outcome = std::move(result);
    }
    outcomeCv.notify_all();
}

void DownloadSession::replaceOutcome(DownloadOutcome result) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        outcome = std::move(result);
    }
    outcomeCv.notify_all();
}

bool DownloadRegistry::add(const std::shared_ptr<DownloadSession>& session) {
    std::unique_lock lk(mutex_);
    return table_.emplace(session->id, session).second;
}

std::shared_ptr<DownloadSession> DownloadRegistry::find(const std::string& id) const {
    std::shared_lock lk(mutex_);
    auto it = table_.find(id);
    return it == table_.end() ? nullptr : it->second;
}

std::shared_ptr<DownloadSession>
DownloadRegistry::findByTarget(const std::filesystem::path& target) const {
    std::shared_lock lk(mutex_);
    for (const auto& [id, session] : table_) {
        std::lock_guard<std::mutex> sl(session->mutex);
        if (session->metadata.filepath == target)
            return session;
    }
    return nullptr;
}

bool DownloadRegistry::remove(const std::string& id) {
    std::unique_lock lk(mutex_);
    return table_.erase(id) > 0;
}

std::vector<std::string> DownloadRegistry::ids() const {
    std::shared_lock lk(mutex_);
    std::vector<std::string> out;
    out.reserve(table_.size());
    for (const auto& [id, session] : table_)
        out.push_back(id);
    return out;
}

std::vector<std::shared_ptr<DownloadSession>> DownloadRegistry::sessions() const {
    std::shared_lock lk(mutex_);
    std::vector<std::shared_ptr<DownloadSession>> out;
    out.reserve(table_.size());
    for (const auto& [id, session] : table_)
        out.push_back(session);
    return out;
}

std::size_t DownloadRegistry::size() const {
    std::shared_lock lk(mutex_);
    return table_.size();
}

} // namespace rangeget::downloader
