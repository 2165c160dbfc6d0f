#include <rangeget/downloader/work_queue.hpp>

namespace rangeget::downloader {

void WorkQueue::seed(const std::vector<std::uint64_t>& indices) {
    std::lock_guard<std::mutex> lk(mutex_);
    pending_.assign(indices.begin(), indices.end());
}

std::optional<std::uint64_t> WorkQueue::pop() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (pending_.empty())
        return std::nullopt;
    auto idx = pending_.front();
    pending_.pop_front();
    return idx;
}

void WorkQueue::requeue(std::uint64_t index) {
    std::lock_guard<std::mutex> lk(mutex_);
    pending_.push_back(index);
}

std::size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

std::uint32_t RetryTracker::incrementAndGet(std::uint64_t index) {
    std::lock_guard<std::mutex> lk(mutex_);
    return ++counts_[index];
}

std::uint32_t RetryTracker::attempts(std::uint64_t index) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = counts_.find(index);
    return it == counts_.end() ? 0u : it->second;
}

} // namespace rangeget::downloader
