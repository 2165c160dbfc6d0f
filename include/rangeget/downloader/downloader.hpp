#pragma once

/*
 * rangeget Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data model shared by the chunked download engine and
 * the abstract seams it is assembled from. It intentionally contains no
 * implementation details.
 *
 * Design principles:
 * - A download either finishes byte-exact or is reported as failed
 * - Byte-range chunks fetched concurrently, each verified before it counts
 * - Cooperative pause/stop/cancel through an atomic control signal
 * - Clear separation of concerns (HTTP adapter, disk writer, state store, rate limit)
 *
 * Copyright (c) rangeget contributors
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rangeget::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Lifecycle state of a single download.
 */
enum class DownloadState { Pending, Active, Paused, Stopped, Completed, Failed, Cancelled };

/**
 * Cooperative control signal observed by workers.
 */
enum class ControlSignal : std::uint8_t { Run = 0, Pause = 1, Stop = 2, Cancel = 3 };

/**
 * Hash algorithms supported for optional end-to-end verification.
 */
enum class HashAlgo { Sha256 };

/**
 * Canonical error codes for downloader operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    FileSystemError,
    IntegrityError,
    ChecksumMismatch,
    ParseError,
    ConfigError,
    NotFound,
    InvalidState,
    Unknown
};

inline constexpr int kMinThreads = 1;
inline constexpr int kMaxThreads = 64;
inline constexpr std::string_view kPartSuffix = ".part";
inline constexpr std::string_view kStateSuffix = ".state";

[[nodiscard]] constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::FileSystemError:
            return "FileSystemError";
        case ErrorCode::IntegrityError:
            return "IntegrityError";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::ParseError:
            return "ParseError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * Errors a worker recovers from locally by requeueing the chunk.
 */
[[nodiscard]] constexpr bool isNetworkError(ErrorCode code) noexcept {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout ||
           code == ErrorCode::TlsVerificationFailed || code == ErrorCode::ServerError;
}

[[nodiscard]] constexpr const char* toString(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::Pending:
            return "pending";
        case DownloadState::Active:
            return "active";
        case DownloadState::Paused:
            return "paused";
        case DownloadState::Stopped:
            return "stopped";
        case DownloadState::Completed:
            return "completed";
        case DownloadState::Failed:
            return "failed";
        case DownloadState::Cancelled:
            return "cancelled";
    }
    return "pending";
}

[[nodiscard]] std::optional<DownloadState> parseDownloadState(std::string_view name);

[[nodiscard]] constexpr bool canResume(DownloadState state) noexcept {
    return state == DownloadState::Paused || state == DownloadState::Stopped ||
           state == DownloadState::Failed;
}

[[nodiscard]] constexpr bool isTerminal(DownloadState state) noexcept {
    return state == DownloadState::Completed || state == DownloadState::Cancelled;
}

[[nodiscard]] constexpr bool canCancel(DownloadState state) noexcept {
    return !isTerminal(state);
}

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

/**
 * Rate limit configuration (0 = unlimited).
 */
struct RateLimit {
    std::uint64_t globalBps{0};
    std::uint64_t perConnectionBps{0};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Per-attempt transfer policy. Defaults are the engine's tuned constants.
 */
struct TransferPolicy {
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds readTimeout{5000}; // stall timeout: no bytes for this long
    std::uint64_t speedFloorBps{300ull * 1024ull};
    std::chrono::milliseconds speedWarmup{3000};
    std::uint32_t relaxSpeedAfterAttempts{3}; // attempts >= this run without a speed floor
    std::chrono::milliseconds idleBackoff{100};
    std::chrono::milliseconds retryBackoffBase{200};
    std::chrono::milliseconds retryBackoffMax{2000};
    std::uint32_t checkpointEveryChunks{16};
};

/**
 * Options applied to every HTTP request.
 */
struct RequestOptions {
    std::vector<Header> headers;
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"rangeget/1.0"};
    bool followRedirects{true};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds readTimeout{5000};
    std::chrono::milliseconds totalTimeout{0}; // 0 = no overall limit
};

/**
 * Server metadata discovered before a download starts.
 */
struct ProbeResult {
    std::optional<std::uint64_t> contentLength;
    bool acceptRanges{false};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
    std::optional<std::string> suggestedFilename;
    long httpStatus{0};
};

/**
 * Outcome of a single ranged GET.
 */
struct FetchStats {
    long httpStatus{0};
    std::uint64_t bytesReceived{0};
};

/**
 * Byte range of one chunk. `end` is inclusive.
 */
struct ChunkDescriptor {
    std::uint64_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t expectedSize{0};
};

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Identity and progress record for one download.
 * `downloadedBytes` always equals the summed expected size of `completedChunks`.
 */
struct DownloadMetadata {
    std::string id;
    std::string url;
    std::filesystem::path filepath; // final target; the partial file lives at <filepath>.part
    std::uint64_t totalSize{0};
    std::uint64_t downloadedBytes{0};
    std::uint64_t chunkSize{0};
    std::uint32_t threadCount{0};
    DownloadState state{DownloadState::Pending};
    std::set<std::uint64_t> completedChunks;
    std::set<std::uint64_t> incompleteChunks;

    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> errorMessage;

    Timestamp createdAt{std::chrono::system_clock::now()};
    std::optional<Timestamp> pausedAt;
    std::optional<Timestamp> resumedAt;
    std::optional<Timestamp> stoppedAt;
    std::optional<Timestamp> completedAt;

    [[nodiscard]] double progressPercentage() const noexcept {
        if (totalSize == 0)
            return 0.0;
        return static_cast<double>(downloadedBytes) * 100.0 / static_cast<double>(totalSize);
    }
};

/**
 * Streaming progress event for a single download.
 */
struct ProgressEvent {
    std::string id;
    std::uint64_t downloadedBytes{0};
    std::uint64_t totalBytes{0};
    std::uint64_t completedChunks{0};
    std::uint64_t totalChunks{0};
    DownloadState state{DownloadState::Active};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Terminal result of one run of a download.
 */
struct DownloadOutcome {
    std::string id;
    DownloadState status{DownloadState::Pending}; // Completed, Failed, Paused, Stopped, Cancelled
    std::optional<Error> detail;                  // set for Failed
    std::uint64_t downloadedBytes{0};
    std::uint64_t totalBytes{0};
    std::uint64_t completedChunks{0};
    std::uint64_t totalChunks{0};
    std::filesystem::path targetPath;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldAbort = std::function<bool()>; // return true to abandon the transfer ASAP
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * Per-download options supplied at start (or restore) time.
 */
struct StartOptions {
    std::vector<Header> headers;
    std::optional<Checksum> checksum; // verified against the finished file when set
    ProgressCallback onProgress;      // invoked from worker threads
};

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 * Implementations must be safe to call from several worker threads at once.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Probe server metadata (HEAD preferred) for size, range support and validators.
     */
    virtual Expected<ProbeResult> probe(std::string_view url, const RequestOptions& options) = 0;

    /**
     * Fetch the inclusive byte range [offset, offset+size-1] and stream it to `sink`.
     * `shouldAbort` is polled for every received block and periodically while the
     * connection is idle.
     */
    virtual Expected<FetchStats> fetchRange(std::string_view url, std::uint64_t offset,
                                            std::uint64_t size, const RequestOptions& options,
                                            const ByteSink& sink,
                                            const ShouldAbort& shouldAbort) = 0;
};

/**
 * Shared handle to the partial download file. Writes are positional, so workers
 * writing disjoint ranges never need a lock.
 */
class PartFile {
public:
    PartFile(std::filesystem::path path, int fd) noexcept : path_(std::move(path)), fd_(fd) {}
    ~PartFile();

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;

    Expected<void> writeAt(std::uint64_t offset, std::span<const std::byte> data);
    Expected<void> sync();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

/**
 * Disk writer for the partial file and its finalization.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create (or truncate) `path` and establish its final logical size without
     * writing every byte.
     */
    virtual Expected<void> allocateSparse(const std::filesystem::path& path,
                                          std::uint64_t size) = 0;

    /**
     * Open an existing partial file for positional writes.
     */
    virtual Expected<std::shared_ptr<PartFile>> openForWrite(const std::filesystem::path& path) = 0;

    [[nodiscard]] virtual std::optional<std::uint64_t>
    fileSize(const std::filesystem::path& path) const = 0;

    /**
     * Move the finished partial file onto its target path. Atomic rename when
     * possible; copy+fsync+replace on EXDEV.
     */
    virtual Expected<void> finalize(const std::filesystem::path& partFile,
                                    const std::filesystem::path& target) = 0;

    /**
     * Best-effort removal.
     */
    virtual Expected<void> remove(const std::filesystem::path& path) noexcept = 0;
};

/**
 * Sidecar persistence of DownloadMetadata for resumability.
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    virtual Expected<void> save(const DownloadMetadata& metadata) = 0;
    virtual Expected<DownloadMetadata> load(const std::filesystem::path& target) = 0;
    virtual Expected<void> remove(const std::filesystem::path& target) noexcept = 0;
    [[nodiscard]] virtual bool exists(const std::filesystem::path& target) const = 0;
};

/**
 * Streaming hash calculator for optional end-to-end verification.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks/yields until 'bytes' tokens are available based on configured limits.
     * Returns early when `shouldAbort` reports true.
     */
    virtual void acquire(std::uint64_t bytes, const ShouldAbort& shouldAbort) = 0;

    /**
     * Set runtime limits (0 = unlimited).
     */
    virtual void setLimits(const RateLimit& limit) = 0;
};

// ======================
// Default implementations
// ======================

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::shared_ptr<IDiskWriter> makeDiskWriter();
std::shared_ptr<IStateStore> makeJsonStateStore();
std::shared_ptr<IRateLimiter> makeRateLimiter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256();

// ======================
// Utility path builders
// ======================

/**
 * <target>.part
 */
[[nodiscard]] inline std::filesystem::path partPathFor(const std::filesystem::path& target) {
    auto p = target;
    p += std::string(kPartSuffix);
    return p;
}

/**
 * <target>.part.state
 */
[[nodiscard]] inline std::filesystem::path statePathFor(const std::filesystem::path& target) {
    auto p = partPathFor(target);
    p += std::string(kStateSuffix);
    return p;
}

} // namespace rangeget::downloader
