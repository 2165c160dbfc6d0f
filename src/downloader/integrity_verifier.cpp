/*
 * rangeget/src/downloader/integrity_verifier.cpp
 *
 * Completion verification and optional SHA-256 verification (OpenSSL EVP).
 *
 * - verifyCompletion() reconciles the byte and chunk counters after the pool drains.
 * - OpenSslIntegrityVerifier implements IIntegrityVerifier over EVP_sha256; update()
 *   feeds byte spans, finalize() returns { algo, hex } and re-arms the context.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <rangeget/downloader/integrity.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>

namespace rangeget::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() { reset(HashAlgo::Sha256); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx)
            return;
        if (EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) != 1) {
            _ctx = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        (void)EVP_DigestUpdate(_ctx.ctx, data.data(), data.size());
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;

        if (!_ctx || _finalized) {
            return out; // empty hex signals failure
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _finalized = true;
            return out;
        }

        out.hex = to_hex_lower(md_buf.data(), md_len);
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

Expected<void> verifyCompletion(std::uint64_t downloadedBytes, std::uint64_t totalSize,
                                std::uint64_t completedChunks, std::uint64_t totalChunks) {
    const bool chunksOk = completedChunks == totalChunks;
    const bool bytesOk = downloadedBytes == totalSize;
    if (chunksOk && bytesOk) {
        spdlog::debug("Integrity check passed: {} bytes in {} chunks", totalSize, totalChunks);
        return {};
    }

    const char* verdict = (downloadedBytes > totalSize || completedChunks > totalChunks)
                              ? "Download over-counted"
                              : "Download incomplete";
    auto message = std::string(verdict) + ": " + std::to_string(downloadedBytes) + " / " +
                   std::to_string(totalSize) + " bytes (" + std::to_string(completedChunks) +
                   " / " + std::to_string(totalChunks) + " chunks)";
    spdlog::error("Integrity check failed: {}", message);
    return Error{ErrorCode::IntegrityError, std::move(message)};
}

Expected<std::string> sha256File(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileSystemError, "Failed to open for hashing: " + path.string()};
    }
    auto verifier = makeIntegrityVerifierSha256();
    std::array<char, 1 << 16> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::FileSystemError, "Read failed while hashing: " + path.string()};
    }
    auto digest = verifier->finalize();
    if (digest.hex.empty()) {
        return Error{ErrorCode::Unknown, "Failed to finalize SHA-256 digest"};
    }
    return digest.hex;
}

Expected<void> verifyChecksum(const std::filesystem::path& path, const Checksum& expected) {
    auto actual = sha256File(path);
    if (!actual.ok())
        return actual.error();
    if (to_lower(expected.hex) != actual.value()) {
        return Error{ErrorCode::ChecksumMismatch,
                     "Checksum mismatch (expected " + expected.hex + ", got " + actual.value() + ")"};
    }
    return {};
}

} // namespace rangeget::downloader
