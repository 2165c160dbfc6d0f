// End-to-end engine behavior against the in-process FakeHttpAdapter: real partial
// files, real sidecars, real worker threads.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <nlohmann/json.hpp>
#include <rangeget/downloader/download_engine.hpp>
#include <rangeget/downloader/integrity.hpp>

#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <mutex>
#include <set>
#include <vector>

namespace fs = std::filesystem;
using namespace rangeget::downloader;
using namespace std::chrono_literals;
using rangeget::test::FakeHttpAdapter;
using rangeget::test::patternString;
using rangeget::test::read_file;
using rangeget::test::wait_until;
using rangeget::test_support::TempDirScope;

namespace {

constexpr const char* kUrl = "https://downloads.example.com/releases/blob.bin";

rangeget::config::EngineConfig testConfig() {
    rangeget::config::EngineConfig cfg;
    cfg.defaultThreads = 4;
    cfg.transfer.speedFloorBps = 0;
    cfg.transfer.idleBackoff = 5ms;
    cfg.transfer.retryBackoffBase = 5ms;
    cfg.transfer.retryBackoffMax = 20ms;
    cfg.transfer.checkpointEveryChunks = 4;
    return cfg;
}

struct Harness {
    explicit Harness(std::uint64_t size, const char* name = "rangeget-engine")
        : dir(TempDirScope::unique_under(name)), http(std::make_shared<FakeHttpAdapter>(size)) {
        open();
    }

    void open() {
        EngineDependencies deps;
        deps.http = http;
        engine = std::make_unique<DownloadEngine>(testConfig(), deps);
    }

    fs::path target(const std::string& name = "blob.bin") const { return dir.path() / name; }

    std::size_t completed(const std::string& id) const {
        auto m = engine->metadata(id);
        return m.ok() ? m.value().completedChunks.size() : 0;
    }

    std::vector<fs::path> files() const {
        std::vector<fs::path> out;
        for (const auto& entry : fs::directory_iterator(dir.path()))
            out.push_back(entry.path().filename());
        return out;
    }

    TempDirScope dir;
    std::shared_ptr<FakeHttpAdapter> http;
    std::unique_ptr<DownloadEngine> engine;
};

std::set<std::uint64_t> offsetsOf(const std::set<std::uint64_t>& chunks, std::uint64_t chunkSize) {
    std::set<std::uint64_t> out;
    for (auto c : chunks)
        out.insert(c * chunkSize);
    return out;
}

} // namespace

TEST_CASE("Engine completes a download over flaky connections", "[downloader][engine]") {
    const std::uint64_t size = 24 * MiB + 321;
    Harness h(size);
    h.http->setFailureRate(0.10, 1234);

    std::mutex eventsMutex;
    std::vector<ProgressEvent> events;
    StartOptions opts;
    opts.onProgress = [&](const ProgressEvent& ev) {
        std::lock_guard<std::mutex> lk(eventsMutex);
        events.push_back(ev);
    };

    auto id = h.engine->start(kUrl, h.target(), 8, opts);
    REQUIRE(id.ok());

    auto outcome = h.engine->wait(id.value());
    REQUIRE(outcome.ok());
    CHECK(outcome.value().status == DownloadState::Completed);
    CHECK(outcome.value().downloadedBytes == size);
    CHECK(outcome.value().completedChunks == outcome.value().totalChunks);

    CHECK(read_file(h.target()) == patternString(size));
    CHECK_FALSE(fs::exists(partPathFor(h.target())));
    CHECK_FALSE(fs::exists(statePathFor(h.target())));

    auto meta = h.engine->metadata(id.value());
    REQUIRE(meta.ok());
    CHECK(meta.value().state == DownloadState::Completed);
    CHECK(meta.value().completedAt.has_value());
    CHECK(meta.value().threadCount == 8);
    CHECK(h.engine->activeIds().empty());

    REQUIRE(wait_until([&] {
        std::lock_guard<std::mutex> lk(eventsMutex);
        return !events.empty() && events.back().state == DownloadState::Completed;
    }));
    std::lock_guard<std::mutex> lk(eventsMutex);
    CHECK(events.back().downloadedBytes == size);
    for (const auto& ev : events) {
        CHECK(ev.downloadedBytes <= size);
        CHECK(ev.totalBytes == size);
    }
}

TEST_CASE("Engine completes 100 MiB with eight threads and 10% failures",
          "[downloader][engine][large]") {
    const std::uint64_t size = 100 * MiB - 1;
    Harness h(size, "rangeget-engine-large");
    h.http->setFailureRate(0.10, 99);

    auto id = h.engine->start(kUrl, h.target(), 8);
    REQUIRE(id.ok());
    auto outcome = h.engine->wait(id.value());
    REQUIRE(outcome.ok());
    REQUIRE(outcome.value().status == DownloadState::Completed);
    CHECK(outcome.value().totalChunks == 200);
    // One byte more crosses into the 4 MiB tier.
    CHECK(planChunks(100 * MiB).value().totalChunks == 25);

    CHECK(fs::file_size(h.target()) == size);
    CHECK(read_file(h.target()) == patternString(size));
}

TEST_CASE("Pause persists progress and resume fetches only the remainder",
          "[downloader][engine][resume]") {
    const std::uint64_t size = 32 * MiB;
    Harness h(size);
    h.http->setBlockDelay(5ms);

    auto id = h.engine->start(kUrl, h.target(), 4);
    REQUIRE(id.ok());
    REQUIRE(wait_until([&] { return h.completed(id.value()) >= 24; }));

    REQUIRE(h.engine->pause(id.value()).ok());
    auto paused = h.engine->wait(id.value());
    REQUIRE(paused.ok());
    CHECK(paused.value().status == DownloadState::Paused);

    auto meta = h.engine->metadata(id.value());
    REQUIRE(meta.ok());
    const auto done = meta.value().completedChunks;
    const auto plan = planChunks(size).value();
    CHECK(meta.value().state == DownloadState::Paused);
    CHECK(meta.value().pausedAt.has_value());
    CHECK(done.size() >= 24);
    CHECK(done.size() < plan.totalChunks);
    CHECK(meta.value().downloadedBytes == plan.bytesFor(done));
    CHECK(meta.value().incompleteChunks.size() + done.size() == plan.totalChunks);
    const double percent = meta.value().progressPercentage();
    CHECK(percent > 0.0);
    CHECK(percent < 100.0);
    CHECK(std::abs(percent - 100.0 * static_cast<double>(done.size()) /
                                 static_cast<double>(plan.totalChunks)) < 1e-9);

    auto saved = nlohmann::json::parse(read_file(statePathFor(h.target())));
    CHECK(saved["state"] == "paused");
    CHECK(saved["completed_chunks"].size() == done.size());

    SECTION("Pausing twice is rejected") {
        auto again = h.engine->pause(id.value());
        REQUIRE_FALSE(again.ok());
        CHECK(again.error().code == ErrorCode::InvalidState);
    }

    SECTION("Resume skips completed chunks") {
        h.http->clearLog();
        h.http->setBlockDelay(0ms);
        REQUIRE(h.engine->resume(id.value()).ok());
        auto outcome = h.engine->wait(id.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Completed);

        const auto skipped = offsetsOf(done, plan.chunkSize);
        for (const auto& rec : h.http->fetchLog()) {
            CHECK(skipped.count(rec.offset) == 0);
        }
        CHECK(read_file(h.target()) == patternString(size));
    }

    SECTION("Stop from Paused then resume") {
        REQUIRE(h.engine->stop(id.value()).ok());
        auto stopped = h.engine->metadata(id.value());
        REQUIRE(stopped.ok());
        CHECK(stopped.value().state == DownloadState::Stopped);
        CHECK(stopped.value().completedChunks == done);

        h.http->setBlockDelay(0ms);
        REQUIRE(h.engine->resume(id.value()).ok());
        auto outcome = h.engine->wait(id.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Completed);
        CHECK(read_file(h.target()) == patternString(size));
    }
}

TEST_CASE("A new engine restores a download saved at shutdown", "[downloader][engine][resume]") {
    const std::uint64_t size = 16 * MiB;
    Harness h(size);
    h.http->setEtag("\"v1\"");
    h.http->setBlockDelay(5ms);

    auto id = h.engine->start(kUrl, h.target(), 4);
    REQUIRE(id.ok());
    REQUIRE(wait_until([&] { return h.completed(id.value()) >= 8; }));

    // Shutting down pauses and persists every active download.
    h.engine.reset();
    REQUIRE(fs::exists(statePathFor(h.target())));
    REQUIRE(fs::exists(partPathFor(h.target())));
    const auto plan = planChunks(size).value();

    auto second = std::make_shared<FakeHttpAdapter>(size);
    second->setEtag("\"v1\"");
    h.http = second;
    h.open();

    SECTION("Progress survives the restart") {
        auto restored = h.engine->restore(h.target());
        REQUIRE(restored.ok());
        CHECK(restored.value() == id.value());

        auto meta = h.engine->metadata(id.value());
        REQUIRE(meta.ok());
        CHECK(meta.value().state == DownloadState::Paused);
        const auto done = meta.value().completedChunks;
        CHECK(done.size() >= 8);
        CHECK(meta.value().downloadedBytes == plan.bytesFor(done));

        REQUIRE(h.engine->resume(id.value()).ok());
        auto outcome = h.engine->wait(id.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Completed);
        CHECK(second->probeCalls() == 1);

        const auto skipped = offsetsOf(done, plan.chunkSize);
        for (const auto& rec : second->fetchLog())
            CHECK(skipped.count(rec.offset) == 0);
        CHECK(read_file(h.target()) == patternString(size));
    }

    SECTION("A crash mid-run comes back paused, and a truncated part file restarts") {
        auto sidecar = nlohmann::json::parse(read_file(statePathFor(h.target())));
        sidecar["state"] = "active";
        rangeget::test::write_file(statePathFor(h.target()), sidecar.dump());
        fs::resize_file(partPathFor(h.target()), size / 2);

        auto restored = h.engine->restore(h.target());
        REQUIRE(restored.ok());
        auto meta = h.engine->metadata(restored.value());
        REQUIRE(meta.ok());
        CHECK(meta.value().state == DownloadState::Paused);
        CHECK(meta.value().downloadedBytes == 0);
        CHECK(meta.value().completedChunks.empty());

        REQUIRE(h.engine->resume(restored.value()).ok());
        auto outcome = h.engine->wait(restored.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Completed);
        CHECK(read_file(h.target()) == patternString(size));
    }

    SECTION("A changed remote file is fetched from scratch") {
        second->setEtag("\"v2\"");
        auto restored = h.engine->restore(h.target());
        REQUIRE(restored.ok());
        REQUIRE(h.engine->resume(restored.value()).ok());
        auto outcome = h.engine->wait(restored.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Completed);

        std::set<std::uint64_t> fetched;
        for (const auto& rec : second->fetchLog()) {
            if (rec.succeeded)
                fetched.insert(rec.offset);
        }
        CHECK(fetched.size() == plan.totalChunks);
    }

    SECTION("A corrupt total size is reported, not thrown") {
        auto sidecar = nlohmann::json::parse(read_file(statePathFor(h.target())));
        sidecar["total_size"] = std::uint64_t{1} << 62;
        rangeget::test::write_file(statePathFor(h.target()), sidecar.dump());

        auto restored = h.engine->restore(h.target());
        REQUIRE_FALSE(restored.ok());
        CHECK(restored.error().code == ErrorCode::ParseError);
        CHECK(h.engine->activeIds().empty());
    }

    SECTION("Restoring twice is rejected") {
        REQUIRE(h.engine->restore(h.target()).ok());
        auto again = h.engine->restore(h.target());
        REQUIRE_FALSE(again.ok());
        CHECK(again.error().code == ErrorCode::InvalidState);
    }
}

TEST_CASE("Cancel removes the partial file and the sidecar", "[downloader][engine][cancel]") {
    const std::uint64_t size = 8 * MiB;
    Harness h(size);

    auto expectCancelled = [&](const std::string& id) {
        CHECK_FALSE(fs::exists(partPathFor(h.target())));
        CHECK_FALSE(fs::exists(statePathFor(h.target())));
        CHECK_FALSE(fs::exists(h.target()));
        auto outcome = h.engine->wait(id);
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Cancelled);
        auto again = h.engine->cancel(id);
        REQUIRE_FALSE(again.ok());
        CHECK(again.error().code == ErrorCode::InvalidState);
        auto meta = h.engine->metadata(id);
        REQUIRE(meta.ok());
        CHECK(meta.value().state == DownloadState::Cancelled);
    };

    SECTION("From Active while every request fails") {
        h.http->setPermanentFailure(true);
        auto id = h.engine->start(kUrl, h.target(), 4);
        REQUIRE(id.ok());
        std::this_thread::sleep_for(50ms);
        CHECK(h.engine->metadata(id.value()).value().state == DownloadState::Active);
        REQUIRE(h.engine->cancel(id.value()).ok());
        expectCancelled(id.value());
    }

    SECTION("From Paused") {
        h.http->setBlockDelay(5ms);
        auto id = h.engine->start(kUrl, h.target(), 2);
        REQUIRE(id.ok());
        REQUIRE(h.engine->pause(id.value()).ok());
        REQUIRE(h.engine->cancel(id.value()).ok());
        expectCancelled(id.value());
    }

    SECTION("From Stopped") {
        h.http->setBlockDelay(5ms);
        auto id = h.engine->start(kUrl, h.target(), 2);
        REQUIRE(id.ok());
        REQUIRE(h.engine->stop(id.value()).ok());
        REQUIRE(h.engine->cancel(id.value()).ok());
        expectCancelled(id.value());
    }

    SECTION("From Failed") {
        StartOptions opts;
        opts.checksum = Checksum{HashAlgo::Sha256, std::string(64, 'a')};
        auto id = h.engine->start(kUrl, h.target(), 4, opts);
        REQUIRE(id.ok());
        auto failed = h.engine->wait(id.value());
        REQUIRE(failed.ok());
        REQUIRE(failed.value().status == DownloadState::Failed);
        REQUIRE(failed.value().detail.has_value());
        CHECK(failed.value().detail->code == ErrorCode::ChecksumMismatch);

        auto meta = h.engine->metadata(id.value());
        REQUIRE(meta.ok());
        CHECK(meta.value().state == DownloadState::Failed);
        CHECK(meta.value().errorMessage.has_value());
        CHECK(meta.value().completedChunks.empty());
        CHECK_FALSE(fs::exists(h.target()));

        REQUIRE(h.engine->cancel(id.value()).ok());
        expectCancelled(id.value());
    }
}

TEST_CASE("Matching checksum completes the download", "[downloader][engine]") {
    const std::uint64_t size = 2 * MiB + 5;
    Harness h(size);
    const auto reference =
        rangeget::test::write_file(h.dir.path() / "reference.bin", patternString(size));
    auto digest = sha256File(reference);
    REQUIRE(digest.ok());

    StartOptions opts;
    opts.checksum = Checksum{HashAlgo::Sha256, digest.value()};
    opts.headers.push_back(Header{"Authorization", "Bearer token"});
    auto id = h.engine->start(kUrl, h.target(), 0, opts);
    REQUIRE(id.ok());
    auto outcome = h.engine->wait(id.value());
    REQUIRE(outcome.ok());
    CHECK(outcome.value().status == DownloadState::Completed);
    CHECK(h.engine->metadata(id.value()).value().threadCount == 4);

    auto headers = h.http->lastHeaders();
    CHECK(std::any_of(headers.begin(), headers.end(),
                      [](const Header& hd) { return hd.name == "Authorization"; }));
}

TEST_CASE("Invalid start requests leave nothing behind", "[downloader][engine][validation]") {
    Harness h(1 * MiB);

    SECTION("Thread count out of range") {
        for (int threads : {-1, 65, 1000}) {
            auto r = h.engine->start(kUrl, h.target(), threads);
            REQUIRE_FALSE(r.ok());
            CHECK(r.error().code == ErrorCode::ConfigError);
        }
        CHECK(h.http->probeCalls() == 0);
    }

    SECTION("Missing destination directory") {
        auto r = h.engine->start(kUrl, h.dir.path() / "no" / "such" / "file.bin", 2);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ConfigError);
    }

    SECTION("Destination is a directory") {
        auto r = h.engine->start(kUrl, h.dir.path(), 2);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ConfigError);
    }

    SECTION("Server reports no size") {
        h.http->setReportedLength(std::nullopt);
        auto r = h.engine->start(kUrl, h.target(), 2);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ParseError);
    }

    SECTION("Unknown ids") {
        CHECK(h.engine->pause("missing").error().code == ErrorCode::NotFound);
        CHECK(h.engine->resume("missing").error().code == ErrorCode::NotFound);
        CHECK(h.engine->cancel("missing").error().code == ErrorCode::NotFound);
        CHECK(h.engine->wait("missing").error().code == ErrorCode::NotFound);
        CHECK(h.engine->metadata("missing").error().code == ErrorCode::NotFound);
        CHECK(h.engine->restore(h.target()).error().code == ErrorCode::NotFound);
    }

    CHECK(h.files().empty());
}

TEST_CASE("Same destination cannot be downloaded twice at once", "[downloader][engine]") {
    Harness h(4 * MiB);
    h.http->setBlockDelay(5ms);
    auto first = h.engine->start(kUrl, h.target(), 2);
    REQUIRE(first.ok());

    auto second = h.engine->start(kUrl, h.target(), 2);
    REQUIRE_FALSE(second.ok());
    CHECK(second.error().code == ErrorCode::InvalidState);

    auto timed = h.engine->wait(first.value(), 1ms);
    REQUIRE_FALSE(timed.ok());
    CHECK(timed.error().code == ErrorCode::Timeout);

    REQUIRE(h.engine->cancel(first.value()).ok());
}

TEST_CASE("Download into a directory names the file from the server", "[downloader][engine]") {
    const std::uint64_t size = 600 * KiB;
    Harness h(size);

    SECTION("Content-Disposition is sanitized") {
        h.http->setContentDisposition("../../evil?.bin");
        auto id = h.engine->startInDirectory(kUrl, h.dir.path(), 2);
        REQUIRE(id.ok());
        auto outcome = h.engine->wait(id.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().status == DownloadState::Completed);
        CHECK(outcome.value().targetPath.filename() == "evil_.bin");
        CHECK(read_file(h.dir.path() / "evil_.bin") == patternString(size));
    }

    SECTION("Falls back to the URL path") {
        auto id = h.engine->startInDirectory(kUrl, h.dir.path(), 2);
        REQUIRE(id.ok());
        auto outcome = h.engine->wait(id.value());
        REQUIRE(outcome.ok());
        CHECK(outcome.value().targetPath.filename() == "blob.bin");
    }
}

TEST_CASE("Finished downloads are kept in a bounded history", "[downloader][engine]") {
    const std::uint64_t size = 1 * MiB + 3;
    Harness h(size);
    auto cfg = testConfig();
    cfg.finishedHistory = 2;
    EngineDependencies deps;
    deps.http = h.http;
    DownloadEngine engine(cfg, deps);

    std::vector<std::string> ids;
    for (const char* name : {"a.bin", "b.bin", "c.bin"}) {
        auto id = engine.start(kUrl, h.target(name), 2);
        REQUIRE(id.ok());
        auto outcome = engine.wait(id.value());
        REQUIRE(outcome.ok());
        REQUIRE(outcome.value().status == DownloadState::Completed);
        ids.push_back(id.value());
    }

    CHECK(engine.wait(ids[0]).error().code == ErrorCode::NotFound);
    CHECK(engine.metadata(ids[0]).error().code == ErrorCode::NotFound);

    for (std::size_t i = 1; i < ids.size(); ++i) {
        auto outcome = engine.wait(ids[i]);
        REQUIRE(outcome.ok());
        CHECK(outcome.value().completedChunks == outcome.value().totalChunks);

        auto meta = engine.metadata(ids[i]);
        REQUIRE(meta.ok());
        CHECK(meta.value().state == DownloadState::Completed);
        CHECK(meta.value().downloadedBytes == size);
        CHECK(meta.value().completedChunks.empty());
        CHECK(meta.value().incompleteChunks.empty());
    }
    CHECK(read_file(h.target("a.bin")) == patternString(size));
}
