#pragma once

#include <rangeget/downloader/downloader.hpp>

#include <cstdint>
#include <set>
#include <vector>

namespace rangeget::downloader {

inline constexpr std::uint64_t KiB = 1024ull;
inline constexpr std::uint64_t MiB = 1024ull * KiB;
inline constexpr std::uint64_t GiB = 1024ull * MiB;

/**
 * Tiered chunk size: fewer, larger requests as files grow, so huge downloads do not
 * issue tens of thousands of ranged GETs while small ones keep their parallelism.
 *   < 100 MiB -> 512 KiB, < 1 GiB -> 4 MiB, < 10 GiB -> 16 MiB, otherwise 64 MiB.
 */
[[nodiscard]] constexpr std::uint64_t chunkSizeFor(std::uint64_t totalSize) noexcept {
    if (totalSize < 100 * MiB)
        return 512 * KiB;
    if (totalSize < 1 * GiB)
        return 4 * MiB;
    if (totalSize < 10 * GiB)
        return 16 * MiB;
    return 64 * MiB;
}

// Largest file the engine will plan: 2^20 chunks at the top tier.
inline constexpr std::uint64_t kMaxFileSize = 1024ull * 1024ull * 64ull * MiB;

// ceil(totalSize / chunkSize) without wrapping near 2^64.
[[nodiscard]] constexpr std::uint64_t chunkCountFor(std::uint64_t totalSize,
                                                    std::uint64_t chunkSize) noexcept {
    if (chunkSize == 0)
        return 0;
    return totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0);
}

/**
 * Fixed partitioning of a file into byte-range chunks.
 * Only the final chunk may be shorter than `chunkSize`.
 */
struct ChunkPlan {
    std::uint64_t totalSize{0};
    std::uint64_t chunkSize{0};
    std::uint64_t totalChunks{0};

    [[nodiscard]] ChunkDescriptor chunk(std::uint64_t index) const noexcept;
    [[nodiscard]] std::uint64_t expectedSizeOf(std::uint64_t index) const noexcept;
    [[nodiscard]] bool contains(std::uint64_t index) const noexcept { return index < totalChunks; }
    [[nodiscard]] std::vector<std::uint64_t> allIndices() const;
    [[nodiscard]] std::uint64_t bytesFor(const std::set<std::uint64_t>& indices) const noexcept;
};

/**
 * Build the plan for `totalSize`. A zero size cannot be partitioned and a size above
 * kMaxFileSize is not accepted (both ParseError).
 */
[[nodiscard]] Expected<ChunkPlan> planChunks(std::uint64_t totalSize);

} // namespace rangeget::downloader
