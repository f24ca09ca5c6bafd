#pragma once

#include <dlkit/core/types.h>
#include <dlkit/downloader/downloader.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace CLI {
class App;
}

namespace dlkit::cli {

// Parses "<algo>:<hex>" (algo: sha256|sha512|sha1|md5).
Result<downloader::Checksum> parseChecksumSpec(std::string_view spec);

// Destination for `url` inside `dir`: the last path segment without query or fragment,
// "index.html" when the URL has none.
std::filesystem::path destinationFor(std::string_view url, const std::filesystem::path& dir);

// Registers the `get` subcommand. `exitCode` receives the command's exit status.
void registerGetCommand(CLI::App& app, int& exitCode);

} // namespace dlkit::cli
