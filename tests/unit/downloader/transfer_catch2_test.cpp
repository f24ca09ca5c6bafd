// Transfer executor: staging, verification, cancellation and publication of a single body.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dlkit/downloader/downloader.hpp>

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include "../../common/test_helpers_catch2.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace dlkit;
using namespace dlkit::downloader;
using namespace std::chrono_literals;
using dlkit::test::entries_with_prefix;
using dlkit::test::read_file;
using dlkit::test::ScriptedSource;
using dlkit::test::TempDir;
using dlkit::test::write_file;

namespace {

constexpr std::string_view kPayload = "hello world";
constexpr const char kPayloadSha256[] =
    "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

std::shared_ptr<spdlog::logger> quiet_logger() {
    return std::make_shared<spdlog::logger>("dlkit-test",
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::int64_t payload_len() {
    return static_cast<std::int64_t>(kPayload.size());
}

} // namespace

// =============================================================================
// Successful transfers
// =============================================================================

TEST_CASE("handle: writes the body to the destination", "[downloader][transfer]") {
    TempDir dir;
    auto dest = dir / "out.bin";
    auto scope = Scope::background();

    SECTION("Known content length") {
        ScriptedSource src{std::string(kPayload)};
        auto r = handle(scope, src, payload_len(), dest, {withLogger(quiet_logger())});
        REQUIRE(r.has_value());
        CHECK(read_file(dest) == kPayload);
    }

    SECTION("Unknown content length") {
        ScriptedSource src{std::string(kPayload)};
        auto r = handle(scope, src, kUnknownLength, dest, {withLogger(quiet_logger())});
        REQUIRE(r.has_value());
        CHECK(read_file(dest) == kPayload);
    }

    SECTION("Empty body") {
        ScriptedSource src{""};
        REQUIRE(handle(scope, src, 0, dest).has_value());
        CHECK(fs::exists(dest));
        CHECK(fs::file_size(dest) == 0);
    }

    SECTION("Existing destination is replaced") {
        write_file(dest, "old content");
        ScriptedSource src{std::string(kPayload)};
        REQUIRE(handle(scope, src, payload_len(), dest).has_value());
        CHECK(read_file(dest) == kPayload);
    }

    SECTION("Destination without directory component lands in the working directory") {
        auto cwd = fs::current_path();
        fs::current_path(dir.path());
        ScriptedSource src{std::string(kPayload)};
        auto r = handle(scope, src, payload_len(), "relative.bin");
        fs::current_path(cwd);
        REQUIRE(r.has_value());
        CHECK(read_file(dir / "relative.bin") == kPayload);
    }

    SECTION("std::istream bodies") {
        std::istringstream in{std::string(kPayload)};
        StreamSource src{in};
        REQUIRE(handle(scope, src, payload_len(), dest).has_value());
        CHECK(read_file(dest) == kPayload);
    }

    CHECK(entries_with_prefix(dir.path(), kDefaultTempPrefix).empty());
}

TEST_CASE("handle: temp file is staged beside the destination", "[downloader][transfer]") {
    TempDir dir;
    auto dest = dir / "out.bin";

    DownloaderConfig cfg;
    cfg.tempPrefix = ".custom-";
    cfg.bufferSize = 2;

    ScriptedSource src{std::string(kPayload)};
    std::size_t stagedSeen = 0;
    bool destSeenEarly = false;
    src.onRead([&](std::size_t) {
        stagedSeen = std::max(stagedSeen, entries_with_prefix(dir.path(), ".custom-").size());
        destSeenEarly = destSeenEarly || fs::exists(dest);
    });

    auto r = handle(Scope::background(), src, payload_len(), dest, {withConfig(cfg)});
    REQUIRE(r.has_value());
    CHECK(stagedSeen == 1);
    CHECK_FALSE(destSeenEarly);
    CHECK(entries_with_prefix(dir.path(), ".custom-").empty());
    // 11 bytes through a 2 byte buffer, plus the end-of-stream read.
    CHECK(src.reads() == 7);
}

// =============================================================================
// Verification failures
// =============================================================================

TEST_CASE("handle: content length mismatch", "[downloader][transfer]") {
    TempDir dir;
    auto dest = dir / "out.bin";

    SECTION("Body shorter than declared") {
        ScriptedSource src{std::string(kPayload)};
        auto r = handle(Scope::background(), src, 20, dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ContentLengthMismatch);
        CHECK(r.error().message == "content length mismatch: expected 20 bytes, got 11");
        CHECK_FALSE(fs::exists(dest));
    }

    SECTION("Body longer than declared keeps the old destination") {
        write_file(dest, "previous");
        ScriptedSource src{std::string(kPayload)};
        auto r = handle(Scope::background(), src, 5, dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ContentLengthMismatch);
        CHECK(read_file(dest) == "previous");
    }

    CHECK(entries_with_prefix(dir.path(), kDefaultTempPrefix).empty());
}

TEST_CASE("handle: checksum verification", "[downloader][transfer][integrity]") {
    TempDir dir;
    auto dest = dir / "out.bin";
    ScriptedSource src{std::string(kPayload)};

    SECTION("Matching digest publishes") {
        auto r = handle(Scope::background(), src, payload_len(), dest,
                        {withChecksum(HashAlgo::Sha256, kPayloadSha256)});
        REQUIRE(r.has_value());
        CHECK(read_file(dest) == kPayload);
    }

    SECTION("Caller supplied hasher") {
        auto r = handle(Scope::background(), src, payload_len(), dest,
                        {withChecksum(makeIntegrityVerifier(HashAlgo::Sha256), kPayloadSha256)});
        REQUIRE(r.has_value());
    }

    SECTION("Mismatching digest leaves no file") {
        auto r = handle(Scope::background(), src, payload_len(), dest,
                        {withChecksum(HashAlgo::Sha256, std::string(64, 'f'))});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ChecksumMismatch);
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring(kPayloadSha256));
        CHECK_FALSE(fs::exists(dest));
    }

    SECTION("Length is checked before the digest") {
        auto r = handle(Scope::background(), src, 99, dest,
                        {withChecksum(HashAlgo::Sha256, std::string(64, 'f'))});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ContentLengthMismatch);
    }

    CHECK(entries_with_prefix(dir.path(), kDefaultTempPrefix).empty());
}

// =============================================================================
// Early exits
// =============================================================================

TEST_CASE("handle: skip existing never reads the body", "[downloader][transfer]") {
    TempDir dir;
    auto dest = write_file(dir / "out.bin", "already here");
    ScriptedSource src{std::string(kPayload)};

    auto r = handle(Scope::background(), src, payload_len(), dest,
                    {withSkipExisting(), withLogger(quiet_logger())});
    REQUIRE(r.has_value());
    CHECK(src.reads() == 0);
    CHECK(read_file(dest) == "already here");
}

TEST_CASE("handle: skip existing downloads a missing destination", "[downloader][transfer]") {
    TempDir dir;
    auto dest = dir / "out.bin";
    ScriptedSource src{std::string(kPayload)};

    REQUIRE(handle(Scope::background(), src, payload_len(), dest, {withSkipExisting()}));
    CHECK(read_file(dest) == kPayload);
}

TEST_CASE("handle: empty destination path", "[downloader][transfer]") {
    ScriptedSource src{std::string(kPayload)};
    auto r = handle(Scope::background(), src, payload_len(), fs::path{});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
    CHECK(r.error().message == "destPath must not be empty");
    CHECK(src.reads() == 0);
}

TEST_CASE("handle: failing option aborts before any I/O", "[downloader][transfer]") {
    TempDir dir;
    ScriptedSource src{std::string(kPayload)};
    auto r = handle(Scope::background(), src, payload_len(), dir / "out.bin",
                    {withChecksum(HashAlgo::Sha256, "")});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
    CHECK(src.reads() == 0);
    CHECK(fs::is_empty(dir.path()));
}

TEST_CASE("handle: missing destination directory", "[downloader][transfer]") {
    TempDir dir;
    ScriptedSource src{std::string(kPayload)};
    auto r = handle(Scope::background(), src, payload_len(), dir / "missing" / "out.bin");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::IoError);
    CHECK(src.reads() == 0);
}

// =============================================================================
// Cancellation and read errors
// =============================================================================

TEST_CASE("handle: cancellation mid-stream", "[downloader][transfer][cancel]") {
    TempDir dir;
    auto dest = dir / "out.bin";
    auto scope = Scope::background().child();

    ScriptedSource src{std::string(kPayload)};
    src.onRead([&](std::size_t offset) {
        if (offset >= 4) {
            scope.cancel();
        }
    });

    auto r = handle(scope, src, payload_len(), dest);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::OperationCancelled);
    CHECK_THAT(r.error().message, Catch::Matchers::StartsWith("download cancelled"));
    CHECK(errorIs(r.error(), Error{ErrorCode::OperationCancelled, "context canceled"}));
    CHECK(src.consumed() < kPayload.size());
    CHECK_FALSE(fs::exists(dest));
    CHECK(entries_with_prefix(dir.path(), kDefaultTempPrefix).empty());
}

TEST_CASE("handle: cancelled scope never reads", "[downloader][transfer][cancel]") {
    TempDir dir;
    auto scope = Scope::background().child();
    scope.cancel();

    ScriptedSource src{std::string(kPayload)};
    auto r = handle(scope, src, payload_len(), dir / "out.bin");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::OperationCancelled);
    CHECK(src.reads() == 0);
    CHECK(entries_with_prefix(dir.path(), kDefaultTempPrefix).empty());
}

TEST_CASE("handle: expired deadline", "[downloader][transfer][cancel]") {
    TempDir dir;
    auto scope = Scope::background().withTimeout(1ms);
    std::this_thread::sleep_for(5ms);

    ScriptedSource src{std::string(kPayload)};
    auto r = handle(scope, src, payload_len(), dir / "out.bin");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::OperationCancelled);
    CHECK(errorIs(r.error(), ErrorCode::Timeout));
}

TEST_CASE("handle: read error is wrapped", "[downloader][transfer]") {
    TempDir dir;
    auto dest = write_file(dir / "out.bin", "keep me");

    ScriptedSource src{std::string(kPayload)};
    Error reset{ErrorCode::NetworkError, "connection reset"};
    src.failAfter(4, reset);

    auto r = handle(Scope::background(), src, payload_len(), dest);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NetworkError);
    CHECK(r.error().message == "copying file body: connection reset");
    CHECK(errorIs(r.error(), reset));
    CHECK(read_file(dest) == "keep me");
    CHECK(entries_with_prefix(dir.path(), kDefaultTempPrefix).empty());
}

// =============================================================================
// Progress
// =============================================================================

TEST_CASE("handle: progress reporting", "[downloader][transfer][progress]") {
    TempDir dir;
    auto dest = dir / "out.bin";
    std::vector<ProgressEvent> events;
    auto collect = [&](const ProgressEvent& ev) { events.push_back(ev); };

    SECTION("Known length completes at 100%") {
        ScriptedSource src{std::string(kPayload)};
        REQUIRE(handle(Scope::background(), src, payload_len(), dest,
                       {withProgress(collect), withLogger(quiet_logger())}));
        REQUIRE(events.size() >= 2);
        CHECK(events.front().stage == ProgressStage::Downloading);
        const auto& last = events.back();
        CHECK(last.stage == ProgressStage::Completed);
        CHECK(last.downloadedBytes == kPayload.size());
        REQUIRE(last.totalBytes.has_value());
        CHECK(*last.totalBytes == kPayload.size());
        REQUIRE(last.percentage.has_value());
        CHECK(*last.percentage == 100.0f);
        CHECK(last.destination.string() == dest.string());
    }

    SECTION("Unknown length has no percentage") {
        ScriptedSource src{std::string(kPayload)};
        REQUIRE(handle(Scope::background(), src, kUnknownLength, dest,
                       {withProgress(collect), withLogger(quiet_logger())}));
        REQUIRE_FALSE(events.empty());
        for (const auto& ev : events) {
            CHECK(ev.stage == ProgressStage::Downloading);
            CHECK_FALSE(ev.totalBytes.has_value());
            CHECK_FALSE(ev.percentage.has_value());
        }
    }

    SECTION("Throttled to the configured interval") {
        DownloaderConfig cfg;
        cfg.progressInterval = std::chrono::hours(1);
        cfg.bufferSize = 1;
        ScriptedSource src{std::string(kPayload)};
        REQUIRE(handle(Scope::background(), src, kUnknownLength, dest,
                       {withConfig(cfg), withProgress(collect), withLogger(quiet_logger())}));
        CHECK(events.size() == 1);
    }
}
