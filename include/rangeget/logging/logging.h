#pragma once

#include <rangeget/downloader/downloader.hpp>

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rangeget::logging {

struct LoggingConfig {
    std::string level{"info"};
    std::filesystem::path file; // empty = colored stderr
    std::size_t maxFileBytes{10 * 1024 * 1024};
    std::size_t maxFiles{5};
    std::string loggerName{"rangeget"};
};

// trace|debug|info|warn|error|off, case-insensitive ("warning" and "err" accepted)
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

// Install the default logger described by `config`.
downloader::Expected<void> init(const LoggingConfig& config);

} // namespace rangeget::logging
