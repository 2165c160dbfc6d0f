/*
 * rangeget/src/downloader/rate_limiter.cpp
 *
 * Token-bucket RateLimiter
 * - One global bucket shared by every worker, plus one bucket per calling thread
 *   (each worker thread owns exactly one connection at a time)
 * - No-ops when both limits are zero (unlimited)
 * - Waits in slices of at most 50 ms so pause/stop/cancel are observed promptly
 *
 * Buckets hold at most one second of allowance; tokens are doubles so partial bytes
 * accumulate between sleeps.
 */

#include <rangeget/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace rangeget::downloader {

namespace {

using clock_t = std::chrono::steady_clock;

constexpr auto kMaxSlice = std::chrono::milliseconds(50);
constexpr std::size_t kMaxIdleBuckets = 256;
constexpr auto kIdleBucketTtl = std::chrono::seconds(10);

struct Bucket {
    double rate_bps{0.0}; // 0 => unlimited
    double tokens{0.0};
    clock_t::time_point last_refill{clock_t::now()};

    void init(double rate, clock_t::time_point now) {
        rate_bps = rate;
        tokens = rate; // start with a full second of burst
        last_refill = now;
    }

    [[nodiscard]] bool limited() const { return rate_bps > 0.0; }

    void refill(clock_t::time_point now) {
        if (!limited()) {
            last_refill = now;
            return;
        }
        const auto dt = std::chrono::duration<double>(now - last_refill).count();
        if (dt <= 0.0)
            return;
        tokens = std::min(rate_bps, tokens + rate_bps * dt);
        last_refill = now;
    }

    // Seconds until `bytes` tokens are available (0 when ready or unlimited).
    [[nodiscard]] double waitFor(double bytes) const {
        if (!limited())
            return 0.0;
        // A request larger than the burst waits for a full bucket and then drains it.
        const double need = std::min(bytes, rate_bps) - tokens;
        return need > 0.0 ? need / rate_bps : 0.0;
    }

    void take(double bytes) {
        if (limited())
            tokens = std::max(0.0, tokens - bytes);
    }
};

class TokenBucketLimiter final : public IRateLimiter {
public:
    TokenBucketLimiter() = default;
    ~TokenBucketLimiter() override = default;

    void setLimits(const RateLimit& limit) override {
        std::lock_guard<std::mutex> lk(mutex_);
        limits_ = limit;
        const auto now = clock_t::now();
        global_.init(static_cast<double>(limits_.globalBps), now);
        perThread_.clear();
    }

    void acquire(std::uint64_t bytes, const ShouldAbort& shouldAbort) override {
        if (bytes == 0)
            return;

        const auto self = std::this_thread::get_id();
        const double want = static_cast<double>(bytes);

        while (true) {
            if (shouldAbort && shouldAbort())
                return;

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (limits_.globalBps == 0 && limits_.perConnectionBps == 0)
                    return;

                const auto now = clock_t::now();
                auto& mine = connectionBucket(self, now);
                global_.refill(now);
                mine.refill(now);

                wait_seconds = std::max(global_.waitFor(want), mine.waitFor(want));
                if (wait_seconds <= 0.0) {
                    global_.take(want);
                    mine.take(want);
                    return;
                }
            }

            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(sleep_for,
                                                                                kMaxSlice));
            }
        }
    }

private:
    Bucket& connectionBucket(std::thread::id id, clock_t::time_point now) {
        // Worker threads are short-lived; drop buckets of threads that went quiet.
        if (perThread_.size() > kMaxIdleBuckets) {
            std::erase_if(perThread_, [&](const auto& kv) {
                return kv.first != id && now - kv.second.last_refill > kIdleBucketTtl;
            });
        }
        auto [it, inserted] = perThread_.try_emplace(id);
        if (inserted)
            it->second.init(static_cast<double>(limits_.perConnectionBps), now);
        return it->second;
    }

    std::mutex mutex_;
    RateLimit limits_{};
    Bucket global_{};
    std::unordered_map<std::thread::id, Bucket> perThread_;
};

} // namespace

std::shared_ptr<IRateLimiter> makeRateLimiter() {
    return std::make_shared<TokenBucketLimiter>();
}

} // namespace rangeget::downloader
