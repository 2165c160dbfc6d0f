#include <rangeget/downloader/chunk_plan.hpp>

#include <numeric>
#include <string>

namespace rangeget::downloader {

ChunkDescriptor ChunkPlan::chunk(std::uint64_t index) const noexcept {
    ChunkDescriptor d;
    d.index = index;
    d.start = index * chunkSize;
    d.expectedSize = expectedSizeOf(index);
    d.end = d.expectedSize == 0 ? d.start : d.start + d.expectedSize - 1;
    return d;
}

std::uint64_t ChunkPlan::expectedSizeOf(std::uint64_t index) const noexcept {
    if (index >= totalChunks)
        return 0;
    if (index + 1 < totalChunks)
        return chunkSize;
    return totalSize - (totalChunks - 1) * chunkSize;
}

std::vector<std::uint64_t> ChunkPlan::allIndices() const {
    std::vector<std::uint64_t> out(static_cast<std::size_t>(totalChunks));
    std::iota(out.begin(), out.end(), std::uint64_t{0});
    return out;
}

std::uint64_t ChunkPlan::bytesFor(const std::set<std::uint64_t>& indices) const noexcept {
    std::uint64_t sum = 0;
    for (auto idx : indices)
        sum += expectedSizeOf(idx);
    return sum;
}

Expected<ChunkPlan> planChunks(std::uint64_t totalSize) {
    if (totalSize == 0) {
        return Error{ErrorCode::ParseError, "File has no size; server did not report Content-Length"};
    }
    if (totalSize > kMaxFileSize) {
        return Error{ErrorCode::ParseError, "File size " + std::to_string(totalSize) +
                                                " exceeds the supported maximum of " +
                                                std::to_string(kMaxFileSize) + " bytes"};
    }
    ChunkPlan plan;
    plan.totalSize = totalSize;
    plan.chunkSize = chunkSizeFor(totalSize);
    plan.totalChunks = chunkCountFor(totalSize, plan.chunkSize);
    return plan;
}

} // namespace rangeget::downloader
