#include <rangeget/logging/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <system_error>

namespace rangeget::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "off")
        return spdlog::level::off;
    return std::nullopt;
}

downloader::Expected<void> init(const LoggingConfig& config) {
    using downloader::Error;
    using downloader::ErrorCode;

    auto level = parseLevel(config.level);
    if (!level) {
        return Error{ErrorCode::ConfigError, "Unknown log level '" + config.level + "'"};
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        if (!config.file.empty()) {
            // Create log directory if needed
            std::error_code ec;
            if (config.file.has_parent_path())
                std::filesystem::create_directories(config.file.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::FileSystemError,
                             "Failed to create log directory " +
                                 config.file.parent_path().string() + ": " + ec.message()};
            }
            // Use rotating file sink to preserve logs across crashes
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), config.maxFileBytes, config.maxFiles);
            logger = std::make_shared<spdlog::logger>(config.loggerName, rotating_sink);
        } else {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            logger = std::make_shared<spdlog::logger>(config.loggerName, console_sink);
        }
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::FileSystemError,
                     std::string("Failed to initialize logging: ") + e.what()};
    }

    logger->set_level(*level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(*level);
    spdlog::flush_on(spdlog::level::info);

    if (!config.file.empty()) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.file.string(),
                     config.maxFileBytes / (1024 * 1024), config.maxFiles);
    }
    return {};
}

} // namespace rangeget::logging
