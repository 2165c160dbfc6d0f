#pragma once

#include <rangeget/downloader/downloader.hpp>
#include <rangeget/logging/logging.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rangeget::config {

inline constexpr std::uint32_t kDefaultThreads = 8;

/**
 * Engine-wide settings. Defaults are the tuned constants; a config file and the
 * environment may override them.
 *
 *   [downloader]  threads, connect_timeout_ms, read_timeout_ms, speed_floor_bps,
 *                 speed_warmup_ms, relax_speed_after_attempts, idle_backoff_ms,
 *                 retry_backoff_base_ms, retry_backoff_max_ms, checkpoint_every_chunks,
 *                 finished_history
 *   [network]     user_agent, proxy, tls_insecure, ca_path, follow_redirects,
 *                 rate_limit_global_bps, rate_limit_per_connection_bps
 *   [logging]     level, file
 */
struct EngineConfig {
    std::uint32_t defaultThreads{kDefaultThreads};
    // Completed or cancelled downloads kept for wait()/metadata(), oldest dropped first.
    std::uint32_t finishedHistory{256};
    downloader::TransferPolicy transfer{};
    downloader::RateLimit rateLimit{};
    downloader::TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"rangeget/1.0"};
    bool followRedirects{true};
    logging::LoggingConfig logging{};
};

/**
 * Config file location: explicit path, then RANGEGET_CONFIG, then
 * $XDG_CONFIG_HOME/rangeget/config.toml, then ~/.config/rangeget/config.toml.
 */
std::filesystem::path resolveConfigPath(const std::filesystem::path& explicitPath = {});

/**
 * Load and validate. A missing file yields defaults; malformed values are ParseError,
 * out-of-range values ConfigError. RANGEGET_LOG_LEVEL overrides [logging] level.
 */
downloader::Expected<EngineConfig> loadEngineConfig(const std::filesystem::path& explicitPath = {});

downloader::Expected<void> validateConfig(const EngineConfig& config);

/**
 * Per-request options derived from the engine settings.
 */
downloader::RequestOptions makeRequestOptions(const EngineConfig& config);

} // namespace rangeget::config
