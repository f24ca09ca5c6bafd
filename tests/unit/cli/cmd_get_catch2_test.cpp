#include <catch2/catch_test_macros.hpp>

#include <CLI/CLI.hpp>
#include <dlkit/cli/cmd_get.h>

#include <string>

using namespace dlkit;
using dlkit::cli::destinationFor;
using dlkit::cli::parseChecksumSpec;

TEST_CASE("parseChecksumSpec", "[cli][get]") {
    SECTION("Valid specs") {
        auto sha = parseChecksumSpec(
            "sha256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
        REQUIRE(sha.has_value());
        CHECK(sha.value().algo == downloader::HashAlgo::Sha256);

        auto md5 = parseChecksumSpec("MD5:900150983cd24fb0d6963f7d28e17f72");
        REQUIRE(md5.has_value());
        CHECK(md5.value().algo == downloader::HashAlgo::Md5);
        CHECK(md5.value().hex == "900150983cd24fb0d6963f7d28e17f72");
    }

    SECTION("Invalid specs") {
        CHECK_FALSE(parseChecksumSpec("900150983cd24fb0d6963f7d28e17f72"));
        CHECK_FALSE(parseChecksumSpec("crc32:deadbeef"));
        CHECK_FALSE(parseChecksumSpec("md5:xyz"));
        CHECK_FALSE(parseChecksumSpec("sha1:900150983cd24fb0d6963f7d28e17f72"));
        auto r = parseChecksumSpec("blake3:00");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("destinationFor", "[cli][get]") {
    const std::filesystem::path dir{"/downloads"};
    CHECK(destinationFor("https://example.com/files/archive.tar.gz", dir).string() ==
          "/downloads/archive.tar.gz");
    CHECK(destinationFor("https://example.com/a/b.bin?token=1#frag", dir).string() ==
          "/downloads/b.bin");
    CHECK(destinationFor("https://example.com", dir).string() == "/downloads/index.html");
    CHECK(destinationFor("https://example.com/dir/", dir).string() == "/downloads/index.html");
    CHECK(destinationFor("https://example.com/..", dir).string() == "/downloads/index.html");
}

TEST_CASE("get subcommand validation", "[cli][get]") {
    CLI::App app{"test"};
    app.require_subcommand(1);
    int exitCode = -1;
    cli::registerGetCommand(app, exitCode);

    SECTION("URL is required") {
        CHECK_THROWS_AS(app.parse("get"), CLI::ParseError);
    }

    SECTION("Malformed checksum") {
        CHECK_THROWS_AS(app.parse("get --checksum md5:zz https://example.com/a"),
                        CLI::ParseError);
    }

    SECTION("Checksum with several URLs") {
        CHECK_THROWS_AS(app.parse("get --checksum md5:900150983cd24fb0d6963f7d28e17f72 "
                                  "https://example.com/a https://example.com/b"),
                        CLI::ParseError);
    }

    SECTION("Concurrency out of range") {
        CHECK_THROWS_AS(app.parse("get -c 1000 https://example.com/a"), CLI::ParseError);
    }

    CHECK(exitCode == -1);
}
