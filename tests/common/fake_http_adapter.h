// In-process IHttpAdapter for engine tests: serves a deterministic byte pattern with
// injectable failures and throttling. No sockets involved.

#pragma once

#include <rangeget/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace rangeget::test {

inline std::byte patternByte(std::uint64_t offset) {
    return static_cast<std::byte>((offset * 131u + (offset >> 9)) & 0xffu);
}

inline std::string patternString(std::uint64_t size) {
    std::string out(size, '\0');
    for (std::uint64_t i = 0; i < size; ++i)
        out[i] = static_cast<char>(patternByte(i));
    return out;
}

struct FetchRecord {
    std::uint64_t offset{0};
    std::uint64_t size{0};
    std::uint32_t attempt{0};
    bool succeeded{false};
};

class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    explicit FakeHttpAdapter(std::uint64_t size) : size_(size) {}

    void setSize(std::uint64_t size) {
        std::lock_guard<std::mutex> lk(mutex_);
        size_ = size;
    }
    void setReportedLength(std::optional<std::uint64_t> length) {
        std::lock_guard<std::mutex> lk(mutex_);
        reportedLength_ = length;
        overrideLength_ = true;
    }
    // Fraction of fetches that deliver half the range and then drop the connection.
    void setFailureRate(double rate, std::uint64_t seed = 42) {
        std::lock_guard<std::mutex> lk(mutex_);
        failureRate_ = rate;
        rng_.seed(seed);
    }
    // The first `attempts` fetches of every range end cleanly after half the bytes.
    void setShortReads(std::uint32_t attempts) {
        std::lock_guard<std::mutex> lk(mutex_);
        shortReadAttempts_ = attempts;
    }
    // The first `attempts` fetches of every range keep streaming past its end.
    void setOverlongBodies(std::uint32_t attempts) {
        std::lock_guard<std::mutex> lk(mutex_);
        overlongAttempts_ = attempts;
    }
    void setPermanentFailure(bool on) {
        std::lock_guard<std::mutex> lk(mutex_);
        permanentFailure_ = on;
    }
    void setBlockSize(std::size_t bytes) {
        std::lock_guard<std::mutex> lk(mutex_);
        blockSize_ = std::max<std::size_t>(1, bytes);
    }
    void setBlockDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lk(mutex_);
        blockDelay_ = delay;
    }
    void setEtag(std::optional<std::string> etag) {
        std::lock_guard<std::mutex> lk(mutex_);
        etag_ = std::move(etag);
    }
    void setContentDisposition(std::optional<std::string> filename) {
        std::lock_guard<std::mutex> lk(mutex_);
        filename_ = std::move(filename);
    }

    [[nodiscard]] int probeCalls() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return probeCalls_;
    }
    [[nodiscard]] std::vector<FetchRecord> fetchLog() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return log_;
    }
    void clearLog() {
        std::lock_guard<std::mutex> lk(mutex_);
        log_.clear();
    }
    [[nodiscard]] std::uint32_t attemptsFor(std::uint64_t offset) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = attempts_.find(offset);
        return it == attempts_.end() ? 0 : it->second;
    }
    [[nodiscard]] std::vector<downloader::Header> lastHeaders() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return lastHeaders_;
    }

    downloader::Expected<downloader::ProbeResult>
    probe(std::string_view, const downloader::RequestOptions& options) override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++probeCalls_;
        lastHeaders_ = options.headers;
        downloader::ProbeResult r;
        r.httpStatus = 200;
        r.acceptRanges = true;
        r.contentLength = overrideLength_ ? reportedLength_ : std::optional<std::uint64_t>(size_);
        r.etag = etag_;
        r.suggestedFilename = filename_;
        return r;
    }

    downloader::Expected<downloader::FetchStats>
    fetchRange(std::string_view, std::uint64_t offset, std::uint64_t size,
               const downloader::RequestOptions&, const downloader::ByteSink& sink,
               const downloader::ShouldAbort& shouldAbort) override {
        std::uint32_t attempt = 0;
        bool fail = false;
        bool permanent = false;
        std::size_t blockSize = 0;
        std::chrono::milliseconds delay{0};
        std::uint64_t total = 0;
        std::uint64_t body = size;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            attempt = ++attempts_[offset];
            permanent = permanentFailure_;
            fail = !permanent && failureRate_ > 0.0 && unit_(rng_) < failureRate_;
            blockSize = blockSize_;
            delay = blockDelay_;
            total = size_;
            if (attempt <= shortReadAttempts_)
                body = size / 2;
            else if (attempt <= overlongAttempts_)
                body = size + blockSize;
        }

        auto finish = [&](bool ok) {
            std::lock_guard<std::mutex> lk(mutex_);
            log_.push_back(FetchRecord{offset, size, attempt, ok});
        };

        if (permanent) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            finish(false);
            return downloader::Error{downloader::ErrorCode::NetworkError, "connection refused"};
        }
        if (offset + size > total) {
            finish(false);
            return downloader::Error{downloader::ErrorCode::ServerError,
                                     "HTTP 416 Range Not Satisfiable"};
        }

        const std::uint64_t failAt = fail ? size / 2 : body;
        std::vector<std::byte> buf(blockSize);
        std::uint64_t sent = 0;
        while (sent < body) {
            if (shouldAbort && shouldAbort()) {
                finish(false);
                return downloader::Error{downloader::ErrorCode::NetworkError, "Transfer aborted"};
            }
            if (sent >= failAt) {
                finish(false);
                return downloader::Error{downloader::ErrorCode::NetworkError,
                                         "Connection reset by peer"};
            }
            const auto n = static_cast<std::size_t>(
                std::min<std::uint64_t>({blockSize, body - sent, failAt - sent}));
            for (std::size_t i = 0; i < n; ++i)
                buf[i] = patternByte(offset + sent + i);
            if (delay.count() > 0)
                std::this_thread::sleep_for(delay);
            auto w = sink(std::span<const std::byte>(buf.data(), n));
            if (!w.ok()) {
                finish(false);
                return w.error();
            }
            sent += n;
        }
        finish(true);
        return downloader::FetchStats{206, sent};
    }

private:
    mutable std::mutex mutex_;
    std::uint64_t size_;
    bool overrideLength_{false};
    std::optional<std::uint64_t> reportedLength_;
    double failureRate_{0.0};
    bool permanentFailure_{false};
    std::uint32_t shortReadAttempts_{0};
    std::uint32_t overlongAttempts_{0};
    std::size_t blockSize_{64 * 1024};
    std::chrono::milliseconds blockDelay_{0};
    std::optional<std::string> etag_;
    std::optional<std::string> filename_;
    std::mt19937_64 rng_{42};
    std::uniform_real_distribution<double> unit_{0.0, 1.0};

    int probeCalls_{0};
    std::map<std::uint64_t, std::uint32_t> attempts_;
    std::vector<FetchRecord> log_;
    std::vector<downloader::Header> lastHeaders_;
};

} // namespace rangeget::test
