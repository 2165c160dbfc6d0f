/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - probe() and fetchRange() over the libcurl easy API; one easy handle per call, so
 *   any number of worker threads may share one adapter.
 * - Honors connect timeout, stall (read) timeout, TLS verify/CA, proxy, headers,
 *   redirects and Range.
 * - The abort predicate is polled from the write callback and from the transfer-info
 *   callback, so cooperative cancellation works while the connection is idle.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <rangeget/downloader/downloader.hpp>
#include <rangeget/downloader/http_util.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace rangeget::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::ConfigError;
            break;
        default:
            // Resolve/connect/send/recv failures, partial bodies, aborted transfers.
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

// Header parser context
struct HeaderParseContext {
    long status{0};
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> contentRangeTotal{};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
    std::optional<std::string> dispositionFilename;
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line starts a new response (redirect hops); forget earlier headers.
    if (line.rfind("HTTP/", 0) == 0) {
        *ctx = HeaderParseContext{};
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto code = line.substr(sp + 1, 3);
            long status = 0;
            auto res = std::from_chars(code.data(), code.data() + code.size(), status);
            if (res.ec == std::errc())
                ctx->status = status;
        }
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes") {
            ctx->acceptRangesBytes = true;
        }
    } else if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    } else if (key == "content-range") {
        ctx->contentRangeTotal = parseContentRangeTotal(val);
    } else if (key == "etag") {
        ctx->etag = val;
    } else if (key == "last-modified") {
        ctx->lastModified = val;
    } else if (key == "content-type") {
        ctx->contentType = val;
    } else if (key == "content-disposition") {
        ctx->dispositionFilename = parseContentDispositionFilename(val);
    }

    return total;
}

// Write context for fetchRange
struct WriteContext {
    CURL* curl{nullptr};
    std::uint64_t offset{0};
    const ByteSink* sink{nullptr};
    const ShouldAbort* shouldAbort{nullptr};
    std::uint64_t downloaded{0};
    bool abortRequested{false};
    std::optional<Error> sinkError;
};

static bool poll_abort(WriteContext* ctx) {
    if (ctx->shouldAbort && *ctx->shouldAbort && (*ctx->shouldAbort)()) {
        ctx->abortRequested = true;
        return true;
    }
    return false;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->downloaded == 0 && ctx->offset > 0) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (status == 200) {
            // Body starts at byte 0, not at our offset.
            ctx->sinkError = Error{ErrorCode::ServerError, "Server ignored the Range request"};
            return 0;
        }
    }

    if (poll_abort(ctx)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }

    ctx->downloaded += static_cast<std::uint64_t>(total);
    return total;
}

static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    return poll_abort(ctx) ? 1 : 0;
}

// Probe body sink: keep at most the single byte a 0-0 range asks for.
struct ProbeBodyContext {
    std::uint64_t received{0};
    bool truncated{false};
};

static size_t probe_body_cb(char*, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ProbeBodyContext*>(userdata);
    const size_t total = size * nmemb;
    ctx->received += total;
    if (ctx->received > 1) {
        ctx->truncated = true;
        return 0;
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const RequestOptions& options) {
    // Timeouts: connect, stall (no bytes for readTimeout), optional overall limit
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    const long stallSeconds =
        std::max<long>(1, static_cast<long>((options.readTimeout.count() + 999) / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);
    if (options.totalTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.totalTimeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

// Owns one easy handle and its header list for the duration of a request.
struct EasyRequest {
    CURL* curl{nullptr};
    curl_slist* headers{nullptr};

    EasyRequest() : curl(curl_easy_init()) {}
    ~EasyRequest() {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
    EasyRequest(const EasyRequest&) = delete;
    EasyRequest& operator=(const EasyRequest&) = delete;
};

static ProbeResult to_probe_result(const HeaderParseContext& hctx, long status) {
    ProbeResult out;
    out.httpStatus = status;
    out.acceptRanges = hctx.acceptRangesBytes || status == 206;
    // A 206 Content-Length is the range length; the total lives in Content-Range.
    if (hctx.contentRangeTotal) {
        out.contentLength = hctx.contentRangeTotal;
    } else if (status != 206) {
        out.contentLength = hctx.contentLength;
    }
    out.etag = hctx.etag;
    out.lastModified = hctx.lastModified;
    out.contentType = hctx.contentType;
    out.suggestedFilename = hctx.dispositionFilename;
    return out;
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_global_init(); }
    ~CurlHttpAdapter() override = default;

    Expected<ProbeResult> probe(std::string_view url, const RequestOptions& options) override {
        const std::string urlStr(url);

        // HEAD first
        {
            EasyRequest req;
            if (!req.curl) {
                return Error{ErrorCode::Unknown, "curl_easy_init failed"};
            }
            req.headers = build_header_list(options.headers);
            HeaderParseContext hctx{};

            curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
            curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
            curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
            curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &hctx);
            curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
            configure_common(req.curl, options);

            CURLcode rc = curl_easy_perform(req.curl);
            long status = 0;
            curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &status);
            if (rc == CURLE_OK && status < 400 && hctx.contentLength) {
                auto result = to_probe_result(hctx, status);
                logValidators(result);
                return result;
            }
            // Some servers reject HEAD or omit the length; try GET range 0-0 as fallback
            spdlog::debug("HEAD probe of {} inconclusive (rc={}, status={}), attempting GET "
                          "Range 0-0",
                          urlStr, curl_easy_strerror(rc), status);
        }

        EasyRequest req;
        if (!req.curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }
        req.headers = build_header_list(options.headers);
        req.headers = curl_slist_append(req.headers, "Range: bytes=0-0");
        HeaderParseContext hctx{};
        ProbeBodyContext body{};

        curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, probe_body_cb);
        curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
        configure_common(req.curl, options);

        CURLcode rc = curl_easy_perform(req.curl);
        long status = 0;
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &status);

        // A server that ignores Range sends the whole body; we stop after the headers.
        if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && body.truncated)) {
            return makeCurlError(rc, "probe(GET range)");
        }
        if (status >= 400) {
            return Error{ErrorCode::ServerError,
                         "HTTP error " + std::to_string(status) + " probing " + urlStr};
        }

        auto result = to_probe_result(hctx, status);
        logValidators(result);
        return result;
    }

    Expected<FetchStats> fetchRange(std::string_view url, std::uint64_t offset, std::uint64_t size,
                                    const RequestOptions& options, const ByteSink& sink,
                                    const ShouldAbort& shouldAbort) override {
        if (!sink) {
            return Error{ErrorCode::Unknown, "fetchRange: no sink provided"};
        }
        EasyRequest req;
        if (!req.curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        // Build headers including Range
        req.headers = build_header_list(options.headers);
        std::string rangeHeader;
        if (size == 0) {
            // Open-ended range from offset
            rangeHeader = "Range: bytes=" + std::to_string(offset) + "-";
        } else {
            const auto last = offset + size - 1;
            rangeHeader = "Range: bytes=" + std::to_string(offset) + "-" + std::to_string(last);
        }
        req.headers = curl_slist_append(req.headers, rangeHeader.c_str());

        const std::string urlStr(url);
        curl_easy_setopt(req.curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);

        WriteContext wctx;
        wctx.curl = req.curl;
        wctx.offset = offset;
        wctx.sink = &sink;
        wctx.shouldAbort = &shouldAbort;

        curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        // Fail fast on >= 400 instead of streaming an error page into the file
        curl_easy_setopt(req.curl, CURLOPT_FAILONERROR, 1L);

        configure_common(req.curl, options);

        CURLcode rc = curl_easy_perform(req.curl);

        FetchStats stats;
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &stats.httpStatus);
        stats.bytesReceived = wctx.downloaded;

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (wctx.abortRequested) {
            return Error{ErrorCode::NetworkError, "Transfer aborted after " +
                                                      std::to_string(wctx.downloaded) + " bytes"};
        }
        if (stats.httpStatus >= 400) {
            return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(stats.httpStatus)};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetchRange(GET)");
        }
        return stats;
    }

private:
    static void logValidators(const ProbeResult& result) {
        spdlog::debug("HTTP probe: status={} length={} ranges={}", result.httpStatus,
                      result.contentLength ? std::to_string(*result.contentLength) : "unknown",
                      result.acceptRanges);
        if (result.etag) {
            spdlog::debug("HTTP probe captured ETag: {}", *result.etag);
        }
        if (result.lastModified) {
            spdlog::debug("HTTP probe captured Last-Modified: {}", *result.lastModified);
        }
    }
};

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_shared<CurlHttpAdapter>();
}

} // namespace rangeget::downloader
