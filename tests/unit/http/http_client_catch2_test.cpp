// HttpClient against local file:// URLs; no network access required.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dlkit/http/http_client.h>

#include "../../common/test_helpers_catch2.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace dlkit;
using namespace dlkit::http;
using dlkit::test::entries_with_prefix;
using dlkit::test::read_file;
using dlkit::test::TempDir;
using dlkit::test::write_file;

namespace {

// file:// transfers carry no status code.
constexpr long kFileStatus = 0;

Request file_request(const fs::path& p) {
    return Request{"file://" + fs::absolute(p).string()};
}

} // namespace

TEST_CASE("HttpClient: argument validation", "[http]") {
    HttpClient client;
    TempDir dir;

    SECTION("Empty destination is rejected before any request") {
        auto r = client.download(Scope::background(), Request{"http://127.0.0.1:9/never"}, 200,
                                 fs::path{});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(r.error().message == "destPath must not be empty");
    }

    SECTION("Empty URL") {
        auto r = client.open(Scope::background(), Request{}, 200);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Unsupported scheme") {
        auto r = client.download(Scope::background(), Request{"nosuchscheme://host/file"}, 200,
                                 dir / "out.bin");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK_FALSE(fs::exists(dir / "out.bin"));
    }
}

TEST_CASE("HttpClient: downloads a local file", "[http][file]") {
    TempDir dir;
    auto source = write_file(dir / "source.txt", "payload from curl");
    auto dest = dir / "copy.txt";
    HttpClient client;

    SECTION("Synchronous") {
        auto r = client.download(Scope::background(), file_request(source), kFileStatus, dest);
        REQUIRE(r.has_value());
        CHECK(read_file(dest) == "payload from curl");
    }

    SECTION("Open reports the content length") {
        auto body = client.open(Scope::background(), file_request(source), kFileStatus);
        REQUIRE(body.has_value());
        CHECK(body.value().contentLength == 17);
        REQUIRE(body.value().stream);
    }

    SECTION("Asynchronous") {
        auto started =
            client.downloadAsync(Scope::background(), file_request(source), kFileStatus, dest);
        REQUIRE(started.has_value());
        CHECK(started.value()->err().has_value());
        CHECK(read_file(dest) == "payload from curl");
    }

    SECTION("Batch through opener") {
        auto second = write_file(dir / "second.txt", "second");
        auto started = client.downloadAsync(Scope::background(), file_request(source),
                                            kFileStatus, dest, {downloader::withBatch(1)});
        REQUIRE(started.has_value());
        auto first = started.value();
        first->add(client.opener(file_request(second), kFileStatus), dir / "second-copy.txt");
        REQUIRE(first->wait().has_value());
        CHECK(read_file(dest) == "payload from curl");
        CHECK(read_file(dir / "second-copy.txt") == "second");
    }

    CHECK(entries_with_prefix(dir.path(), downloader::kDefaultTempPrefix).empty());
}

TEST_CASE("HttpClient: failures", "[http][file]") {
    TempDir dir;
    auto source = write_file(dir / "source.txt", "payload from curl");
    auto dest = dir / "copy.txt";
    HttpClient client;

    SECTION("Unexpected status code") {
        auto r = client.download(Scope::background(), file_request(source), 200, dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NetworkError);
        CHECK(r.error().message == "unexpected status code: got 0, want 200");
    }

    SECTION("Checksum mismatch is prefixed") {
        auto r = client.download(
            Scope::background(), file_request(source), kFileStatus, dest,
            {downloader::withChecksum(downloader::HashAlgo::Sha256, std::string(64, '0'))});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ChecksumMismatch);
        CHECK_THAT(r.error().message, Catch::Matchers::StartsWith("download: checksum mismatch"));
    }

    SECTION("Missing file") {
        auto r = client.download(Scope::background(), file_request(dir / "absent.txt"),
                                 kFileStatus, dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NetworkError);
    }

    SECTION("Cancelled scope") {
        auto scope = Scope::background().child();
        scope.cancel();
        auto r = client.download(scope, file_request(source), kFileStatus, dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::OperationCancelled);
    }

    CHECK_FALSE(fs::exists(dest));
    CHECK(entries_with_prefix(dir.path(), downloader::kDefaultTempPrefix).empty());
}

TEST_CASE("HttpClient: skip existing avoids the request", "[http]") {
    TempDir dir;
    auto dest = write_file(dir / "present.txt", "kept");
    HttpClient client;

    // The URL would fail if it were requested.
    auto r = client.download(Scope::background(), Request{"nosuchscheme://host/file"}, 200, dest,
                             {downloader::withSkipExisting()});
    REQUIRE(r.has_value());
    CHECK(read_file(dest) == "kept");
}
