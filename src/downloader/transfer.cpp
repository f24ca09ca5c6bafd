/*
 * dlkit/src/downloader/transfer.cpp
 *
 * Transfer Executor: one body, one destination.
 * - Each read checks the scope first; a cancelled scope never reaches the source
 * - Bytes are written to a StagingFile and teed into the checksum verifier and progress tracker
 * - Content length, then checksum, are verified before the atomic publish
 */

#include <dlkit/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <vector>

namespace dlkit::downloader {

namespace fs = std::filesystem;

namespace {

// Refuses to read once the scope has ended.
class ScopedSource final : public IByteSource {
public:
    ScopedSource(const Scope& scope, IByteSource& inner) : scope_(scope), inner_(inner) {}

    Result<std::size_t> read(std::span<std::byte> buffer) override {
        if (scope_.done()) {
            return scope_.error();
        }
        return inner_.read(buffer);
    }

private:
    const Scope& scope_;
    IByteSource& inner_;
};

bool is_scope_error(const Error& err) {
    return err.code == ErrorCode::OperationCancelled || err.code == ErrorCode::Timeout;
}

bool destination_exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec) && !ec;
}

} // namespace

Result<void> handle(const Scope& scope, IByteSource& body, std::int64_t contentLength,
                    const fs::path& destPath, const std::vector<Option>& opts) {
    auto resolved = applyOptions(opts);
    if (!resolved) {
        return resolved.error();
    }
    return transfer(scope, body, contentLength, destPath, resolved.value());
}

Result<void> transfer(const Scope& scope, IByteSource& body, std::int64_t contentLength,
                      const fs::path& destPath, const Options& opts) {
    auto logger = opts.logger ? opts.logger : spdlog::default_logger();

    if (destPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "destPath must not be empty"};
    }

    if (opts.skipExisting && destination_exists(destPath)) {
        logger->info("skipping existing file: {}", destPath.string());
        return {};
    }

    ScopedSource source(scope, body);

    auto staging = StagingFile::create(destPath, opts.tempPrefix);
    if (!staging) {
        return staging.error();
    }
    StagingFile file = std::move(staging).value();

    std::optional<ProgressTracker> progress;
    if (opts.progress) {
        progress.emplace(destPath, contentLength, opts.progressInterval, logger, opts.onProgress);
    }

    std::vector<std::byte> buffer(opts.bufferSize > 0 ? opts.bufferSize : DEFAULT_BUFFER_SIZE);
    std::uint64_t copied = 0;

    while (true) {
        auto got = source.read(buffer);
        if (!got) {
            const auto& err = got.error();
            if (is_scope_error(err)) {
                return Error{ErrorCode::OperationCancelled, "download cancelled: " + err.message,
                             {err}};
            }
            return wrapError("copying file body", err);
        }
        const std::size_t n = got.value();
        if (n == 0) {
            break;
        }
        std::span<const std::byte> chunk(buffer.data(), n);
        auto written = file.write(chunk);
        if (!written) {
            return wrapError("copying file body", written.error());
        }
        if (opts.checksum) {
            opts.checksum->update(chunk);
        }
        copied += n;
        if (progress) {
            progress->onWrite(n);
        }
    }

    if (contentLength >= 0 && copied != static_cast<std::uint64_t>(contentLength)) {
        return Error{ErrorCode::ContentLengthMismatch,
                     "content length mismatch: expected " + std::to_string(contentLength) +
                         " bytes, got " + std::to_string(copied)};
    }

    if (opts.checksum) {
        if (auto verified = opts.checksum->verify(); !verified) {
            return verified.error();
        }
    }

    if (auto published = file.publish(destPath); !published) {
        return published.error();
    }

    logger->debug("downloaded {} bytes to {}", copied, destPath.string());
    return {};
}

} // namespace dlkit::downloader
