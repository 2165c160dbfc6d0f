/*
 * rangeget/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Sparse allocation of <target>.part to its final logical size
 * - One shared descriptor per download; positional writes (pwrite) from every worker
 * - Atomic rename onto the target when on the same filesystem
 * - EXDEV fallback: copy + fsync + replace when cross-device rename is detected
 * - Restrictive permissions (0600) for the partial file
 */

#include <rangeget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace rangeget::downloader {

namespace fs = std::filesystem;

namespace {

std::string errnoText(int err) {
    return std::strerror(err);
}

} // namespace

// ---------- Helpers (sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::FileSystemError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return Error{ErrorCode::FileSystemError,
                     "fsync() failed for: " + p.string() + ": " + errnoText(err)};
    }
    ::close(fd);
    return Expected<void>{};
}

static Expected<void> fsync_dir(const fs::path& dir) {
    const auto target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::FileSystemError,
                     "open(O_DIRECTORY) failed for: " + target.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::FileSystemError, "fsync(dir) failed for: " + target.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

static void ensure_file_private(const fs::path& p) {
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
}

// ---------- PartFile ----------

PartFile::~PartFile() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Expected<void> PartFile::writeAt(std::uint64_t offset, std::span<const std::byte> data) {
    const char* cursor = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    auto pos = static_cast<off_t>(offset);
    while (remaining > 0) {
        ssize_t n = ::pwrite(fd_, cursor, remaining, pos);
        if (n < 0) {
            const int err = errno;
            if (err == EINTR)
                continue;
            return Error{ErrorCode::FileSystemError, "pwrite failed on " + path_.string() +
                                                         " at offset " + std::to_string(pos) +
                                                         ": " + errnoText(err)};
        }
        cursor += n;
        remaining -= static_cast<std::size_t>(n);
        pos += n;
    }
    return Expected<void>{};
}

Expected<void> PartFile::sync() {
    if (::fsync(fd_) != 0) {
        const int err = errno;
        return Error{ErrorCode::FileSystemError,
                     "fsync failed on " + path_.string() + ": " + errnoText(err)};
    }
    return Expected<void>{};
}

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<void> allocateSparse(const fs::path& path, std::uint64_t size) override {
        std::error_code ec;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::FileSystemError,
                             "Failed to create directory: " + path.parent_path().string()};
            }
        }

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd < 0) {
            return Error{ErrorCode::FileSystemError,
                         "Failed to create partial file " + path.string() + ": " +
                             errnoText(errno)};
        }

        // A single byte at size-1 fixes the logical length without touching the rest.
        if (size > 0) {
            const char zero = 0;
            ssize_t n;
            do {
                n = ::pwrite(fd, &zero, 1, static_cast<off_t>(size - 1));
            } while (n < 0 && errno == EINTR);
            if (n != 1) {
                const int err = errno;
                ::close(fd);
                return Error{ErrorCode::FileSystemError,
                             "Failed to allocate " + std::to_string(size) + " bytes for " +
                                 path.string() + ": " + errnoText(err)};
            }
        }
        ::close(fd);
        ensure_file_private(path);

        spdlog::debug("Allocated sparse partial file {} ({} bytes)", path.string(), size);
        return Expected<void>{};
    }

    Expected<std::shared_ptr<PartFile>> openForWrite(const fs::path& path) override {
        int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) {
            return Error{ErrorCode::FileSystemError,
                         "Failed to open partial file " + path.string() + ": " + errnoText(errno)};
        }
        return std::make_shared<PartFile>(path, fd);
    }

    std::optional<std::uint64_t> fileSize(const fs::path& path) const override {
        std::error_code ec;
        auto sz = fs::file_size(path, ec);
        if (ec)
            return std::nullopt;
        return static_cast<std::uint64_t>(sz);
    }

    Expected<void> finalize(const fs::path& partFile, const fs::path& target) override {
        auto r = fsync_file(partFile);
        if (!r.ok())
            return Error{r.error().code, "Failed to fsync partial file: " + partFile.string()};

        // Attempt atomic rename
        std::error_code ren_ec;
        fs::rename(partFile, target, ren_ec);
        if (ren_ec) {
            // Detect cross-device link (EXDEV) to perform fallback copy
            if (ren_ec == std::errc::cross_device_link) {
                spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                             target.string());
                auto copy_ok = copy_file_fsync_replace(partFile, target);
                if (!copy_ok.ok()) {
                    return copy_ok.error();
                }
                std::error_code del_ec;
                fs::remove(partFile, del_ec);
            } else {
                return Error{ErrorCode::FileSystemError, "rename() failed (" + ren_ec.message() +
                                                             ") from " + partFile.string() +
                                                             " to " + target.string()};
            }
        }

        auto rr = fsync_dir(target.parent_path());
        if (!rr.ok()) {
            spdlog::debug("fsync on target dir failed (continuing): {}", rr.error().message);
        }
        return Expected<void>{};
    }

    Expected<void> remove(const fs::path& path) noexcept override {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            spdlog::debug("remove: failed to remove {}: {}", path.string(), ec.message());
            return Error{ErrorCode::FileSystemError,
                         "Failed to remove " + path.string() + ": " + ec.message()};
        }
        return Expected<void>{};
    }

private:
    // Copy file contents and ensure durability (fsync destination and dir). Replace if exists.
    static Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
        auto staged = dst;
        staged += ".copy";
        {
            std::ifstream is(src, std::ios::binary);
            if (!is.good()) {
                return Error{ErrorCode::FileSystemError,
                             "copy: failed to open source: " + src.string()};
            }
            std::ofstream os(staged, std::ios::binary | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::FileSystemError,
                             "copy: failed to open destination: " + staged.string()};
            }
            std::vector<char> buffer(1 << 20);
            while (is.good()) {
                is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = is.gcount();
                if (got > 0) {
                    os.write(buffer.data(), got);
                    if (!os.good()) {
                        return Error{ErrorCode::FileSystemError,
                                     "copy: write failed for destination: " + staged.string()};
                    }
                }
            }
            if (!is.eof()) {
                return Error{ErrorCode::FileSystemError,
                             "copy: read failed for source: " + src.string()};
            }
        }

        auto rf = fsync_file(staged);
        if (!rf.ok())
            return rf;

        std::error_code ec;
        fs::rename(staged, dst, ec);
        if (ec) {
            return Error{ErrorCode::FileSystemError,
                         "copy: replace failed for " + dst.string() + ": " + ec.message()};
        }
        return fsync_dir(dst.parent_path());
    }
};

std::shared_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_shared<DiskWriter>();
}

} // namespace rangeget::downloader
