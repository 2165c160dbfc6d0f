/*
 * rangeget/src/downloader/state_store.cpp
 *
 * JSON sidecar persistence of DownloadMetadata (<target>.part.state).
 *
 * - Implements rangeget::downloader::IStateStore with nlohmann::json
 * - Saves are atomic: serialize to <sidecar>.tmp, fsync, then rename over the sidecar
 * - Timestamps are ISO-8601 UTC strings, chunk sets are index arrays
 * - reconcileWithPartFile() guards resume against a partial file that no longer
 *   matches the recorded progress
 */

#include <rangeget/core/uuid.h>
#include <rangeget/downloader/state_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace rangeget::downloader {

using json = nlohmann::json;

std::optional<DownloadState> parseDownloadState(std::string_view name) {
    static constexpr DownloadState kAll[] = {
        DownloadState::Pending, DownloadState::Active,    DownloadState::Paused,
        DownloadState::Stopped, DownloadState::Completed, DownloadState::Failed,
        DownloadState::Cancelled};
    for (auto s : kAll) {
        if (name == toString(s))
            return s;
    }
    return std::nullopt;
}

std::string formatTimestamp(Timestamp ts) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(ts.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << millis << 'Z';
    return ss.str();
}

std::optional<Timestamp> parseTimestamp(std::string_view text) {
    std::tm tm{};
    std::istringstream ss{std::string(text)};
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail())
        return std::nullopt;

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek()))
            digits.push_back(static_cast<char>(ss.get()));
        if (digits.empty())
            return std::nullopt;
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }
    if (ss.peek() != 'Z')
        return std::nullopt;

    const std::time_t secs = timegm(&tm);
    return Timestamp{std::chrono::seconds(secs)} + std::chrono::milliseconds(millis);
}

namespace {

void putOptional(json& j, const char* key, const std::optional<std::string>& v) {
    j[key] = v ? json(*v) : json(nullptr);
}

void putOptional(json& j, const char* key, const std::optional<Timestamp>& v) {
    j[key] = v ? json(formatTimestamp(*v)) : json(nullptr);
}

std::optional<std::string> getOptionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<std::string>();
}

Expected<std::optional<Timestamp>> getOptionalTimestamp(const json& j, const char* key) {
    auto text = getOptionalString(j, key);
    if (!text)
        return std::optional<Timestamp>{};
    auto ts = parseTimestamp(*text);
    if (!ts) {
        return Error{ErrorCode::ParseError,
                     std::string("Invalid timestamp for '") + key + "': " + *text};
    }
    return std::optional<Timestamp>{*ts};
}

Expected<void> fsyncPath(const std::filesystem::path& p, int flags) {
    int fd = ::open(p.c_str(), flags);
    if (fd < 0) {
        return Error{ErrorCode::FileSystemError,
                     "open for fsync failed: " + p.string() + ": " + std::strerror(errno)};
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        return Error{ErrorCode::FileSystemError,
                     "fsync failed: " + p.string() + ": " + std::strerror(err)};
    }
    return {};
}

class JsonStateStore final : public IStateStore {
public:
    JsonStateStore() = default;
    ~JsonStateStore() override = default;

    Expected<void> save(const DownloadMetadata& metadata) override {
        if (metadata.filepath.empty()) {
            return Error{ErrorCode::ConfigError, "StateStore.save: empty target path"};
        }
        const auto path = statePathFor(metadata.filepath);
        auto tempPath = path;
        tempPath += ".tmp";

        std::lock_guard<std::mutex> lk(mutex_);
        {
            std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                return Error{ErrorCode::FileSystemError,
                             "Failed to open sidecar for writing: " + tempPath.string()};
            }
            ofs << toJson(metadata).dump(2);
            ofs.close();
            if (!ofs) {
                return Error{ErrorCode::FileSystemError,
                             "Failed to write sidecar: " + tempPath.string()};
            }
        }
        std::error_code ec;
        std::filesystem::permissions(tempPath,
                                     std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);

        if (auto r = fsyncPath(tempPath, O_RDONLY); !r.ok()) {
            std::filesystem::remove(tempPath, ec);
            return r.error();
        }

        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::FileSystemError,
                         "Failed to replace sidecar " + path.string() + ": " + ec.message()};
        }

        spdlog::debug("StateStore: saved '{}' (state={}, {} / {} bytes, {} chunks done)",
                      path.string(), toString(metadata.state), metadata.downloadedBytes,
                      metadata.totalSize, metadata.completedChunks.size());
        return Expected<void>{};
    }

    Expected<DownloadMetadata> load(const std::filesystem::path& target) override {
        const auto path = statePathFor(target);
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            return Error{ErrorCode::NotFound, "No saved state at " + path.string()};
        }

        json j;
        try {
            ifs >> j;
        } catch (const json::exception& e) {
            return Error{ErrorCode::ParseError,
                         "Corrupt sidecar " + path.string() + ": " + e.what()};
        }

        auto meta = metadataFromJson(j);
        if (!meta.ok())
            return meta.error();
        if (meta.value().filepath != target) {
            spdlog::debug("StateStore: sidecar recorded '{}', loading as '{}'",
                          meta.value().filepath.string(), target.string());
            meta.value().filepath = target;
        }
        return meta;
    }

    Expected<void> remove(const std::filesystem::path& target) noexcept override {
        std::error_code ec;
        std::filesystem::remove(statePathFor(target), ec);
        if (ec) {
            return Error{ErrorCode::FileSystemError,
                         "Failed to remove sidecar for " + target.string() + ": " + ec.message()};
        }
        return Expected<void>{};
    }

    bool exists(const std::filesystem::path& target) const override {
        std::error_code ec;
        return std::filesystem::is_regular_file(statePathFor(target), ec);
    }

private:
    std::mutex mutex_;
};

} // namespace

json toJson(const DownloadMetadata& m) {
    json j;
    j["version"] = kStateFormatVersion;
    j["id"] = m.id;
    j["url"] = m.url;
    j["filepath"] = m.filepath.string();
    j["total_size"] = m.totalSize;
    j["downloaded_bytes"] = m.downloadedBytes;
    j["chunk_size"] = m.chunkSize;
    j["thread_count"] = m.threadCount;
    j["state"] = toString(m.state);
    j["completed_chunks"] = m.completedChunks;
    j["incomplete_chunks"] = m.incompleteChunks;
    putOptional(j, "etag", m.etag);
    putOptional(j, "last_modified", m.lastModified);
    putOptional(j, "error_message", m.errorMessage);
    j["created_at"] = formatTimestamp(m.createdAt);
    putOptional(j, "paused_at", m.pausedAt);
    putOptional(j, "resumed_at", m.resumedAt);
    putOptional(j, "stopped_at", m.stoppedAt);
    putOptional(j, "completed_at", m.completedAt);
    return j;
}

Expected<DownloadMetadata> metadataFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ParseError, "Sidecar is not a JSON object"};
    }
    for (const char* key : {"id", "url", "filepath", "total_size", "downloaded_bytes",
                            "state", "completed_chunks", "incomplete_chunks"}) {
        if (!j.contains(key)) {
            return Error{ErrorCode::ParseError, std::string("Sidecar is missing '") + key + "'"};
        }
    }
    if (j.value("version", kStateFormatVersion) > kStateFormatVersion) {
        return Error{ErrorCode::ParseError,
                     "Unsupported sidecar version " + std::to_string(j.value("version", 0))};
    }

    DownloadMetadata m;
    try {
        m.id = j.at("id").get<std::string>();
        m.url = j.at("url").get<std::string>();
        m.filepath = j.at("filepath").get<std::string>();
        m.totalSize = j.at("total_size").get<std::uint64_t>();
        m.downloadedBytes = j.at("downloaded_bytes").get<std::uint64_t>();
        m.chunkSize = j.value("chunk_size", std::uint64_t{0});
        m.threadCount = j.value("thread_count", std::uint32_t{0});
        m.completedChunks = j.at("completed_chunks").get<std::set<std::uint64_t>>();
        m.incompleteChunks = j.at("incomplete_chunks").get<std::set<std::uint64_t>>();
        m.etag = getOptionalString(j, "etag");
        m.lastModified = getOptionalString(j, "last_modified");
        m.errorMessage = getOptionalString(j, "error_message");

        auto stateName = j.at("state").get<std::string>();
        auto state = parseDownloadState(stateName);
        if (!state) {
            return Error{ErrorCode::ParseError, "Unknown download state '" + stateName + "'"};
        }
        m.state = *state;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ParseError, std::string("Malformed sidecar field: ") + e.what()};
    }

    if (m.totalSize > kMaxFileSize) {
        return Error{ErrorCode::ParseError,
                     "Sidecar total_size " + std::to_string(m.totalSize) + " is out of range"};
    }

    // restore() registers the download under this id.
    if (!core::isUUID(m.id)) {
        return Error{ErrorCode::ParseError, "Sidecar id '" + m.id + "' is not a UUID"};
    }

    if (auto created = getOptionalTimestamp(j, "created_at"); !created.ok()) {
        return created.error();
    } else if (created.value()) {
        m.createdAt = *created.value();
    }
    struct Slot {
        const char* key;
        std::optional<Timestamp>* dest;
    };
    for (const auto& slot : {Slot{"paused_at", &m.pausedAt}, Slot{"resumed_at", &m.resumedAt},
                             Slot{"stopped_at", &m.stoppedAt},
                             Slot{"completed_at", &m.completedAt}}) {
        auto ts = getOptionalTimestamp(j, slot.key);
        if (!ts.ok())
            return ts.error();
        *slot.dest = ts.value();
    }
    return m;
}

void resetProgress(DownloadMetadata& metadata, const ChunkPlan& plan) {
    metadata.chunkSize = plan.chunkSize;
    metadata.completedChunks.clear();
    metadata.incompleteChunks.clear();
    for (auto idx : plan.allIndices())
        metadata.incompleteChunks.insert(idx);
    metadata.downloadedBytes = 0;
}

bool reconcileWithPartFile(DownloadMetadata& metadata, const ChunkPlan& plan,
                           std::optional<std::uint64_t> actualPartSize) {
    const char* reason = nullptr;

    if (!actualPartSize || *actualPartSize != metadata.totalSize) {
        reason = "partial file size does not match the recorded total";
    } else if (metadata.chunkSize != plan.chunkSize) {
        reason = "recorded chunk size differs from the current plan";
    } else if (metadata.completedChunks.size() + metadata.incompleteChunks.size() !=
               plan.totalChunks) {
        reason = "chunk sets do not cover the plan";
    } else {
        for (auto idx : metadata.completedChunks) {
            if (!plan.contains(idx) || metadata.incompleteChunks.count(idx) != 0) {
                reason = "chunk sets overlap or exceed the plan";
                break;
            }
        }
        if (!reason) {
            for (auto idx : metadata.incompleteChunks) {
                if (!plan.contains(idx)) {
                    reason = "chunk sets overlap or exceed the plan";
                    break;
                }
            }
        }
        if (!reason && plan.bytesFor(metadata.completedChunks) != metadata.downloadedBytes) {
            reason = "byte counter disagrees with completed chunks";
        }
    }

    if (!reason)
        return false;

    spdlog::warn("Discarding saved progress for '{}' ({}): {}", metadata.filepath.string(),
                 metadata.id, reason);
    resetProgress(metadata, plan);
    return true;
}

std::shared_ptr<IStateStore> makeJsonStateStore() {
    return std::make_shared<JsonStateStore>();
}

} // namespace rangeget::downloader
