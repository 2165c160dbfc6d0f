#include <catch2/catch_test_macros.hpp>

#include <rangeget/downloader/worker_pool.hpp>

#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace rangeget::downloader;
using namespace std::chrono_literals;
using rangeget::test::FakeHttpAdapter;
using rangeget::test_support::TempDirScope;

namespace {

TransferPolicy fastPolicy() {
    TransferPolicy p;
    p.speedFloorBps = 0;
    p.idleBackoff = 5ms;
    p.retryBackoffBase = 5ms;
    p.retryBackoffMax = 20ms;
    return p;
}

WorkerContext makeContext(const std::shared_ptr<IHttpAdapter>& http,
                          const std::shared_ptr<PartFile>& part, std::uint64_t size,
                          const TransferPolicy& policy) {
    WorkerContext ctx;
    ctx.downloadId = "test";
    ctx.url = "https://example.invalid/blob";
    ctx.plan = planChunks(size).value();
    ctx.control = std::make_shared<DownloadControl>();
    ctx.generation = ctx.control->beginGeneration({}, 0);
    ctx.queue = std::make_shared<WorkQueue>(ctx.plan.allIndices());
    ctx.retries = std::make_shared<RetryTracker>();
    ctx.fatal = std::make_shared<FatalSlot>();
    ctx.http = http;
    ctx.part = part;
    ctx.policy = policy;
    return ctx;
}

} // namespace

TEST_CASE("Speed floor is enforced only before the relaxation point", "[downloader][policy]") {
    TransferPolicy p;
    p.relaxSpeedAfterAttempts = 3;
    CHECK(enforceSpeedFor(1, p));
    CHECK(enforceSpeedFor(2, p));
    CHECK_FALSE(enforceSpeedFor(3, p));
    CHECK_FALSE(enforceSpeedFor(10, p));
}

TEST_CASE("Speed floor ignores the warm-up window", "[downloader][policy]") {
    TransferPolicy p;
    p.speedFloorBps = 300 * 1024;
    p.speedWarmup = 3000ms;

    CHECK_FALSE(isBelowSpeedFloor(0, 2999ms, p));
    CHECK(isBelowSpeedFloor(0, 3000ms, p));
    CHECK(isBelowSpeedFloor(299 * 1024 * 3, 3000ms, p));
    CHECK_FALSE(isBelowSpeedFloor(300 * 1024 * 3, 3000ms, p));

    p.speedFloorBps = 0;
    CHECK_FALSE(isBelowSpeedFloor(0, 60000ms, p));
}

TEST_CASE("Retry backoff grows linearly and is capped", "[downloader][policy]") {
    TransferPolicy p;
    p.retryBackoffBase = 200ms;
    p.retryBackoffMax = 2000ms;
    CHECK(retryBackoffFor(1, p) == 200ms);
    CHECK(retryBackoffFor(4, p) == 800ms);
    CHECK(retryBackoffFor(50, p) == 2000ms);
}

TEST_CASE("Worker pool fetches every chunk exactly once", "[downloader][workers]") {
    auto dir = TempDirScope::unique_under("rangeget-workers");
    auto disk = makeDiskWriter();
    const auto path = dir.path() / "blob.part";
    const std::uint64_t size = 3 * MiB + 777;
    REQUIRE(disk->allocateSparse(path, size).ok());
    auto part = disk->openForWrite(path);
    REQUIRE(part.ok());

    auto http = std::make_shared<FakeHttpAdapter>(size);
    http->setFailureRate(0.3, 7);
    auto ctx = makeContext(http, part.value(), size, fastPolicy());
    std::atomic<int> commits{0};
    ctx.onChunkCommitted = [&](std::uint64_t) { commits.fetch_add(1); };

    WorkerPool(4).run(ctx);

    CHECK(ctx.control->completedCount() == ctx.plan.totalChunks);
    CHECK(ctx.control->downloadedBytes() == size);
    CHECK(commits.load() == static_cast<int>(ctx.plan.totalChunks));
    CHECK(rangeget::test::read_file(path) == rangeget::test::patternString(size));
}

TEST_CASE("Wrong-length bodies are requeued and refetched", "[downloader][workers]") {
    auto dir = TempDirScope::unique_under("rangeget-length");
    auto disk = makeDiskWriter();
    const auto path = dir.path() / "blob.part";
    const std::uint64_t size = 2 * MiB + 1000;
    REQUIRE(disk->allocateSparse(path, size).ok());
    auto part = disk->openForWrite(path);
    REQUIRE(part.ok());

    auto http = std::make_shared<FakeHttpAdapter>(size);
    auto ctx = makeContext(http, part.value(), size, fastPolicy());
    std::atomic<int> commits{0};
    ctx.onChunkCommitted = [&](std::uint64_t) { commits.fetch_add(1); };

    SECTION("Body ends early without a transport error") {
        http->setShortReads(2);
    }
    SECTION("Body runs past the end of the range") {
        http->setOverlongBodies(2);
    }

    WorkerPool(3).run(ctx);

    CHECK(ctx.control->completedCount() == ctx.plan.totalChunks);
    CHECK(ctx.control->downloadedBytes() == size);
    CHECK(commits.load() == static_cast<int>(ctx.plan.totalChunks));
    for (std::uint64_t i = 0; i < ctx.plan.totalChunks; ++i) {
        CHECK(ctx.retries->attempts(i) == 3);
        CHECK(http->attemptsFor(ctx.plan.chunk(i).start) == 3);
    }
    CHECK(rangeget::test::read_file(path) == rangeget::test::patternString(size));
}

TEST_CASE("Short bodies never reach the counters", "[downloader][workers]") {
    auto dir = TempDirScope::unique_under("rangeget-short");
    auto disk = makeDiskWriter();
    const auto path = dir.path() / "blob.part";
    const std::uint64_t size = 1 * MiB;
    REQUIRE(disk->allocateSparse(path, size).ok());
    auto part = disk->openForWrite(path);
    REQUIRE(part.ok());

    auto http = std::make_shared<FakeHttpAdapter>(size);
    http->setShortReads(1000000);
    auto ctx = makeContext(http, part.value(), size, fastPolicy());

    std::thread pauser([&] {
        std::this_thread::sleep_for(150ms);
        (void)ctx.control->raise(ControlSignal::Pause);
    });
    WorkerPool(2).run(ctx);
    pauser.join();

    CHECK(ctx.retries->attempts(0) >= 2);
    CHECK(ctx.control->completedCount() == 0);
    CHECK(ctx.control->downloadedBytes() == 0);
}

TEST_CASE("Slow attempts are aborted until the floor is relaxed", "[downloader][workers]") {
    auto dir = TempDirScope::unique_under("rangeget-relax");
    auto disk = makeDiskWriter();
    const auto path = dir.path() / "slow.part";
    const std::uint64_t size = 16 * KiB;
    REQUIRE(disk->allocateSparse(path, size).ok());
    auto part = disk->openForWrite(path);
    REQUIRE(part.ok());

    // 1 KiB every 20 ms is ~50 KB/s, far below a 1 MiB/s floor.
    auto http = std::make_shared<FakeHttpAdapter>(size);
    http->setBlockSize(1024);
    http->setBlockDelay(20ms);

    auto policy = fastPolicy();
    policy.speedFloorBps = 1 * MiB;
    policy.speedWarmup = 50ms;
    policy.relaxSpeedAfterAttempts = 3;
    auto ctx = makeContext(http, part.value(), size, policy);

    WorkerPool(1).run(ctx);

    CHECK(ctx.control->completedCount() == 1);
    CHECK(ctx.retries->attempts(0) == 3);
    auto log = http->fetchLog();
    REQUIRE(log.size() == 3);
    CHECK_FALSE(log[0].succeeded);
    CHECK_FALSE(log[1].succeeded);
    CHECK(log[2].succeeded);
    CHECK(rangeget::test::read_file(path) == rangeget::test::patternString(size));
}

TEST_CASE("Pausing the batch stops every worker", "[downloader][workers]") {
    auto dir = TempDirScope::unique_under("rangeget-stop");
    auto disk = makeDiskWriter();
    const auto path = dir.path() / "never.part";
    const std::uint64_t size = 4 * MiB;
    REQUIRE(disk->allocateSparse(path, size).ok());
    auto part = disk->openForWrite(path);
    REQUIRE(part.ok());

    auto http = std::make_shared<FakeHttpAdapter>(size);
    http->setPermanentFailure(true);
    auto ctx = makeContext(http, part.value(), size, fastPolicy());

    std::thread pauser([&] {
        std::this_thread::sleep_for(100ms);
        (void)ctx.control->raise(ControlSignal::Pause);
    });
    const auto started = std::chrono::steady_clock::now();
    WorkerPool(4).run(ctx);
    pauser.join();

    CHECK(ctx.control->completedCount() == 0);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(ctx.retries->attempts(0) >= 1);
}

TEST_CASE("A disk write failure ends the batch", "[downloader][workers]") {
    const std::uint64_t size = 2 * MiB;
    auto http = std::make_shared<FakeHttpAdapter>(size);
    // No descriptor behind this handle: every pwrite fails with EBADF.
    auto broken = std::make_shared<PartFile>("/nonexistent/broken.part", -1);
    auto ctx = makeContext(http, broken, size, fastPolicy());

    WorkerPool(2).run(ctx);

    REQUIRE(ctx.fatal->isSet());
    CHECK(ctx.fatal->get()->code == ErrorCode::FileSystemError);
    CHECK(ctx.control->completedCount() == 0);
}
