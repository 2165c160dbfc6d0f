#include <rangeget/config/config_helpers.h>
#include <rangeget/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <map>

namespace rangeget::config {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

namespace {

using Section = std::map<std::string, std::string>;

template <typename T>
Expected<void> readUnsigned(const Section& section, const char* sectionName, const char* key,
                            T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->second.empty())
        return {};
    const auto& text = it->second;
    T value{};
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        return Error{ErrorCode::ParseError, std::string("[") + sectionName + "] " + key +
                                                ": expected a non-negative integer, got '" +
                                                text + "'"};
    }
    out = value;
    return {};
}

Expected<void> readMillis(const Section& section, const char* sectionName, const char* key,
                          std::chrono::milliseconds& out) {
    std::uint64_t ms = static_cast<std::uint64_t>(out.count());
    auto r = readUnsigned(section, sectionName, key, ms);
    if (!r.ok())
        return r;
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    return {};
}

Expected<void> readBool(const Section& section, const char* sectionName, const char* key,
                        bool& out) {
    auto it = section.find(key);
    if (it == section.end() || it->second.empty())
        return {};
    const auto& v = it->second;
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
    } else if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
    } else {
        return Error{ErrorCode::ParseError, std::string("[") + sectionName + "] " + key +
                                                ": expected a boolean, got '" + v + "'"};
    }
    return {};
}

std::optional<std::string> readString(const Section& section, const char* key) {
    auto it = section.find(key);
    if (it == section.end() || it->second.empty())
        return std::nullopt;
    return it->second;
}

Expected<void> applyDownloaderSection(const Section& s, EngineConfig& cfg) {
    constexpr const char* kName = "downloader";
    auto& t = cfg.transfer;
    for (auto r : {readUnsigned(s, kName, "threads", cfg.defaultThreads),
                   readMillis(s, kName, "connect_timeout_ms", t.connectTimeout),
                   readMillis(s, kName, "read_timeout_ms", t.readTimeout),
                   readUnsigned(s, kName, "speed_floor_bps", t.speedFloorBps),
                   readMillis(s, kName, "speed_warmup_ms", t.speedWarmup),
                   readUnsigned(s, kName, "relax_speed_after_attempts", t.relaxSpeedAfterAttempts),
                   readMillis(s, kName, "idle_backoff_ms", t.idleBackoff),
                   readMillis(s, kName, "retry_backoff_base_ms", t.retryBackoffBase),
                   readMillis(s, kName, "retry_backoff_max_ms", t.retryBackoffMax),
                   readUnsigned(s, kName, "checkpoint_every_chunks", t.checkpointEveryChunks),
                   readUnsigned(s, kName, "finished_history", cfg.finishedHistory)}) {
        if (!r.ok())
            return r;
    }
    return {};
}

Expected<void> applyNetworkSection(const Section& s, EngineConfig& cfg) {
    constexpr const char* kName = "network";
    if (auto ua = readString(s, "user_agent"))
        cfg.userAgent = *ua;
    if (auto proxy = readString(s, "proxy"))
        cfg.proxy = *proxy;
    if (auto ca = readString(s, "ca_path"))
        cfg.tls.caPath = expand_tilde(*ca).string();
    for (auto r : {readBool(s, kName, "tls_insecure", cfg.tls.insecure),
                   readBool(s, kName, "follow_redirects", cfg.followRedirects),
                   readUnsigned(s, kName, "rate_limit_global_bps", cfg.rateLimit.globalBps),
                   readUnsigned(s, kName, "rate_limit_per_connection_bps",
                                cfg.rateLimit.perConnectionBps)}) {
        if (!r.ok())
            return r;
    }
    return {};
}

void applyLoggingSection(const Section& s, EngineConfig& cfg) {
    if (auto level = readString(s, "level"))
        cfg.logging.level = *level;
    if (auto file = readString(s, "file"))
        cfg.logging.file = expand_tilde(*file);
}

} // namespace

std::filesystem::path resolveConfigPath(const std::filesystem::path& explicitPath) {
    if (!explicitPath.empty())
        return explicitPath;
    if (const char* env = std::getenv("RANGEGET_CONFIG"); env && *env)
        return expand_tilde(env);
    return get_config_path();
}

Expected<EngineConfig> loadEngineConfig(const std::filesystem::path& explicitPath) {
    EngineConfig cfg;
    const auto path = resolveConfigPath(explicitPath);

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        spdlog::debug("Loading configuration from {}", path.string());
        if (auto r = applyDownloaderSection(parse_config_section(path, "downloader"), cfg);
            !r.ok())
            return r.error();
        if (auto r = applyNetworkSection(parse_config_section(path, "network"), cfg); !r.ok())
            return r.error();
        applyLoggingSection(parse_config_section(path, "logging"), cfg);
    } else if (!explicitPath.empty()) {
        return Error{ErrorCode::ConfigError, "Config file not found: " + path.string()};
    }

    if (const char* env = std::getenv("RANGEGET_LOG_LEVEL"); env && *env) {
        cfg.logging.level = env;
    }

    auto valid = validateConfig(cfg);
    if (!valid.ok())
        return valid.error();
    return cfg;
}

Expected<void> validateConfig(const EngineConfig& config) {
    auto fail = [](std::string message) {
        return Expected<void>{Error{ErrorCode::ConfigError, std::move(message)}};
    };
    const auto& t = config.transfer;

    if (config.defaultThreads < static_cast<std::uint32_t>(downloader::kMinThreads) ||
        config.defaultThreads > static_cast<std::uint32_t>(downloader::kMaxThreads)) {
        return fail("threads must be within " + std::to_string(downloader::kMinThreads) + ".." +
                    std::to_string(downloader::kMaxThreads) + ", got " +
                    std::to_string(config.defaultThreads));
    }
    if (t.connectTimeout.count() <= 0)
        return fail("connect_timeout_ms must be positive");
    if (t.readTimeout.count() <= 0)
        return fail("read_timeout_ms must be positive");
    if (t.idleBackoff.count() <= 0)
        return fail("idle_backoff_ms must be positive");
    if (t.retryBackoffMax < t.retryBackoffBase)
        return fail("retry_backoff_max_ms must not be below retry_backoff_base_ms");
    if (t.checkpointEveryChunks == 0)
        return fail("checkpoint_every_chunks must be at least 1");
    if (t.relaxSpeedAfterAttempts < 1)
        return fail("relax_speed_after_attempts must be at least 1");
    if (config.finishedHistory == 0)
        return fail("finished_history must be at least 1");
    if (!logging::parseLevel(config.logging.level))
        return fail("unknown log level '" + config.logging.level + "'");
    return {};
}

downloader::RequestOptions makeRequestOptions(const EngineConfig& config) {
    downloader::RequestOptions opts;
    opts.tls = config.tls;
    opts.proxy = config.proxy;
    opts.userAgent = config.userAgent;
    opts.followRedirects = config.followRedirects;
    opts.connectTimeout = config.transfer.connectTimeout;
    opts.readTimeout = config.transfer.readTimeout;
    return opts;
}

} // namespace rangeget::config
