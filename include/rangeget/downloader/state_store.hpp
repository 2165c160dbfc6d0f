#pragma once

#include <rangeget/downloader/chunk_plan.hpp>
#include <rangeget/downloader/downloader.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangeget::downloader {

inline constexpr int kStateFormatVersion = 1;

/**
 * ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.250Z.
 */
[[nodiscard]] std::string formatTimestamp(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view text);

[[nodiscard]] nlohmann::json toJson(const DownloadMetadata& metadata);
[[nodiscard]] Expected<DownloadMetadata> metadataFromJson(const nlohmann::json& j);

/**
 * Reconcile persisted progress with what is actually on disk.
 *
 * Every chunk is marked incomplete and the byte counter zeroed when the partial
 * file size differs from the recorded total, the chunk sets do not partition the
 * plan, or the byte counter disagrees with the completed set. Returns true when
 * progress was discarded.
 */
bool reconcileWithPartFile(DownloadMetadata& metadata, const ChunkPlan& plan,
                           std::optional<std::uint64_t> actualPartSize);

/**
 * Mark every chunk of `plan` incomplete and zero the byte counter.
 */
void resetProgress(DownloadMetadata& metadata, const ChunkPlan& plan);

} // namespace rangeget::downloader
