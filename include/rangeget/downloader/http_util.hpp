#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangeget::downloader {

/**
 * Total length from a Content-Range value such as "bytes 0-0/12345".
 * Returns nullopt for an unknown ("*") or malformed total.
 */
[[nodiscard]] std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value);

/**
 * File name from a Content-Disposition value. RFC 5987 `filename*=` wins over
 * `filename=`; percent-escapes are decoded.
 */
[[nodiscard]] std::optional<std::string> parseContentDispositionFilename(std::string_view value);

/**
 * Last non-empty path segment of `url`, ignoring query and fragment, percent-decoded.
 */
[[nodiscard]] std::optional<std::string> fileNameFromUrl(std::string_view url);

/**
 * Strip directory components and characters that are unsafe in file names.
 * Returns "download.dat" when nothing usable is left.
 */
[[nodiscard]] std::string sanitizeFileName(std::string_view name);

[[nodiscard]] std::string percentDecode(std::string_view text);

} // namespace rangeget::downloader
