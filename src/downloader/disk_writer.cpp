/*
 * dlkit/src/downloader/disk_writer.cpp
 *
 * StagingFile implementation:
 * - Temp file created with mkstemp in the destination's own directory, so the final rename
 *   never crosses a filesystem boundary
 * - fsync of the file before the rename and of the directory after it
 * - Conventional permissions (0644) on the published file
 * - The temp file is removed on every path that does not publish it
 */

#include <dlkit/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace dlkit::downloader {

namespace fs = std::filesystem;

namespace {

std::string errno_message() {
    return std::error_code(errno, std::generic_category()).message();
}

Result<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return {};
}

void set_conventional_perms(const fs::path& p) noexcept {
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions on {}: {}", p.string(), ec.message());
    }
}

fs::path directory_of(const fs::path& destination) {
    auto dir = destination.parent_path();
    return dir.empty() ? fs::path{"."} : dir;
}

} // namespace

Result<StagingFile> StagingFile::create(const fs::path& destination, std::string_view prefix) {
    const fs::path dir = directory_of(destination);
    std::string pattern = (dir / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Error{ErrorCode::IoError,
                     "creating temp file in " + dir.string() + ": " + errno_message()};
    }
    fs::path path{buf.data()};

    std::FILE* file = ::fdopen(fd, "wb");
    if (file == nullptr) {
        auto msg = errno_message();
        ::close(fd);
        std::error_code ec;
        fs::remove(path, ec);
        return Error{ErrorCode::IoError, "fdopen failed for " + path.string() + ": " + msg};
    }
    return StagingFile{file, std::move(path)};
}

StagingFile::StagingFile(StagingFile&& other) noexcept
    : file_(std::exchange(other.file_, nullptr)), path_(std::move(other.path_)),
      published_(std::exchange(other.published_, true)) {}

StagingFile& StagingFile::operator=(StagingFile&& other) noexcept {
    if (this != &other) {
        discard();
        file_ = std::exchange(other.file_, nullptr);
        path_ = std::move(other.path_);
        published_ = std::exchange(other.published_, true);
    }
    return *this;
}

StagingFile::~StagingFile() {
    discard();
}

Result<void> StagingFile::write(std::span<const std::byte> data) {
    if (file_ == nullptr) {
        return Error{ErrorCode::InvalidState, "temp file already closed: " + path_.string()};
    }
    if (data.empty()) {
        return {};
    }
    if (std::fwrite(data.data(), 1, data.size(), file_) != data.size()) {
        return Error{ErrorCode::IoError,
                     "writing temp file " + path_.string() + ": " + errno_message()};
    }
    return {};
}

Result<void> StagingFile::publish(const fs::path& destination) {
    if (file_ == nullptr) {
        return Error{ErrorCode::InvalidState, "temp file already closed: " + path_.string()};
    }

    if (std::fflush(file_) != 0 || ::fsync(::fileno(file_)) != 0) {
        return Error{ErrorCode::IoError,
                     "syncing temp file " + path_.string() + ": " + errno_message()};
    }

    int rc = std::fclose(std::exchange(file_, nullptr));
    if (rc != 0) {
        return Error{ErrorCode::IoError,
                     "closing temp file " + path_.string() + ": " + errno_message()};
    }

    set_conventional_perms(path_);

    std::error_code ec;
    fs::rename(path_, destination, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "renaming temp file " + path_.string() + " to " +
                                             destination.string() + ": " + ec.message()};
    }
    published_ = true;

    auto synced = fsync_dir(directory_of(destination));
    if (!synced) {
        spdlog::warn("fsync on destination dir failed (continuing): {}",
                     synced.error().message);
    }
    return {};
}

void StagingFile::discard() noexcept {
    if (file_ != nullptr) {
        if (std::fclose(file_) != 0) {
            spdlog::debug("closing temp file {} failed: {}", path_.string(), errno_message());
        }
        file_ = nullptr;
    }
    if (!published_ && !path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            spdlog::error("failed to remove temp file {}: {}", path_.string(), ec.message());
        }
        published_ = true;
    }
}

} // namespace dlkit::downloader
