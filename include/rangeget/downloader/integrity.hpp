#pragma once

#include <rangeget/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace rangeget::downloader {

/**
 * Final reconciliation once the worker pool has drained. Both equalities are
 * checked independently; a short count and an over-count are both IntegrityError,
 * reported with the achieved and expected byte and chunk counts.
 */
[[nodiscard]] Expected<void> verifyCompletion(std::uint64_t downloadedBytes,
                                              std::uint64_t totalSize,
                                              std::uint64_t completedChunks,
                                              std::uint64_t totalChunks);

/**
 * Stream `path` through a SHA-256 verifier and return the lower-case hex digest.
 */
[[nodiscard]] Expected<std::string> sha256File(const std::filesystem::path& path);

/**
 * Compare `path` against an expected checksum (hex compared case-insensitively).
 */
[[nodiscard]] Expected<void> verifyChecksum(const std::filesystem::path& path,
                                            const Checksum& expected);

} // namespace rangeget::downloader
