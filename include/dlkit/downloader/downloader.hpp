#pragma once

/*
 * dlkit Downloader - Public Types and the single-shot Transfer Executor (C++20)
 *
 * Design principles:
 * - Stage into a temp file next to the destination so the final rename is atomic
 * - The destination only ever shows the old content or the complete new content
 * - Streaming integrity verification (hash tee), throttled progress reporting
 * - Cooperative cancellation at read granularity through dlkit::Scope
 */

#include <dlkit/core/scope.h>
#include <dlkit/core/types.h>
#include <dlkit/downloader/byte_source.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dlkit::downloader {

class Queue;

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Sha256,
    Sha512,
    Sha1, // legacy mirrors; discouraged for security-critical verification
    Md5   // discouraged for security-critical verification
};

/**
 * Progress stages during a single transfer.
 */
enum class ProgressStage { Downloading, Completed };

inline constexpr std::string_view kDefaultTempPrefix = ".dlkit-dl-";

// ===================
// Small data objects
// ===================

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

/**
 * Downloader defaults, resolved from config.toml and the environment by
 * resolveDownloaderConfig().
 */
struct DownloaderConfig {
    std::size_t bufferSize{DEFAULT_BUFFER_SIZE};
    std::string tempPrefix{kDefaultTempPrefix};
    std::chrono::milliseconds progressInterval{1000};
    int maxConcurrent{0}; // 0 = unlimited
    std::string logLevel{"info"};
};

/**
 * Progress report for a single transfer.
 */
struct ProgressEvent {
    std::filesystem::path destination;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<float> percentage{}; // 0.0 - 100.0, absent when the total is unknown
    std::chrono::milliseconds elapsed{0};
    std::uint64_t speedBps{0};
    ProgressStage stage{ProgressStage::Downloading};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

// OpenSSL EVP backed verifier for `algo`.
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo);

/**
 * Pairs a hasher with the digest the transfer is expected to produce.
 */
class ChecksumVerifier {
public:
    ChecksumVerifier(std::shared_ptr<IIntegrityVerifier> hasher, std::string expectedHex);

    void update(std::span<const std::byte> data) { hasher_->update(data); }

    // ChecksumMismatch ("expected X, got Y") when the digest differs.
    Result<void> verify();

    [[nodiscard]] const std::string& expected() const noexcept { return expected_; }

private:
    std::shared_ptr<IIntegrityVerifier> hasher_;
    std::string expected_;
};

/**
 * Observes the write path of a transfer and reports progress at most once per interval, plus
 * once when a transfer of known length completes.
 */
class ProgressTracker {
public:
    ProgressTracker(std::filesystem::path destination, std::int64_t total,
                    std::chrono::milliseconds interval, std::shared_ptr<spdlog::logger> logger,
                    ProgressCallback callback = {});

    void onWrite(std::size_t bytes);

    [[nodiscard]] std::uint64_t transferred() const noexcept { return transferred_; }

private:
    void report(ProgressStage stage);

    using Clock = std::chrono::steady_clock;

    std::filesystem::path destination_;
    std::int64_t total_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<spdlog::logger> logger_;
    ProgressCallback callback_;
    std::uint64_t transferred_{0};
    Clock::time_point start_;
    std::optional<Clock::time_point> lastReport_;
};

/**
 * Temp file created next to a destination. Removed on destruction unless published.
 */
class StagingFile {
public:
    static Result<StagingFile> create(const std::filesystem::path& destination,
                                      std::string_view prefix);

    StagingFile(StagingFile&& other) noexcept;
    StagingFile& operator=(StagingFile&& other) noexcept;
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;
    ~StagingFile();

    Result<void> write(std::span<const std::byte> data);

    // Flushes and fsyncs the file, closes it and renames it onto the destination.
    Result<void> publish(const std::filesystem::path& destination);

    // Closes and removes the file. Safe to call repeatedly.
    void discard() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    StagingFile(std::FILE* file, std::filesystem::path path)
        : file_(file), path_(std::move(path)) {}

    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    bool published_{false};
};

// =====================
// Functional options
// =====================

/**
 * Resolved per-transfer configuration.
 */
struct Options {
    std::shared_ptr<ChecksumVerifier> checksum;
    bool progress{false};
    ProgressCallback onProgress;
    bool skipExisting{false};
    std::shared_ptr<Queue> batch;
    std::shared_ptr<spdlog::logger> logger;
    std::size_t bufferSize{DEFAULT_BUFFER_SIZE};
    std::string tempPrefix{kDefaultTempPrefix};
    std::chrono::milliseconds progressInterval{1000};
};

using Option = std::function<Result<void>(Options&)>;

// Applies `opts` in order and stops at the first failure.
Result<Options> applyOptions(const std::vector<Option>& opts);

// Verify the transfer against `expectedHex` using a fresh hasher for `algo`.
Option withChecksum(HashAlgo algo, std::string expectedHex);
// Verify the transfer with a caller supplied hasher.
Option withChecksum(std::shared_ptr<IIntegrityVerifier> hasher, std::string expectedHex);
// Report progress through the logger, and to `callback` if given.
Option withProgress(ProgressCallback callback = {});
// Succeed without reading the body when the destination already exists.
Option withSkipExisting();
// Run asynchronously in a new queue allowing `maxConcurrent` transfers (<= 0: unlimited).
Option withBatch(int maxConcurrent);
// Join an existing queue. Used by DownloadResult::add.
Option withQueue(std::shared_ptr<Queue> queue);
Option withLogger(std::shared_ptr<spdlog::logger> logger);
Option withConfig(const DownloaderConfig& config);

// Effective config: environment, then config.toml [downloader], then defaults.
DownloaderConfig resolveDownloaderConfig();

// ==========================
// Transfer Executor
// ==========================

/**
 * Streams `body` into `destPath`: temp file in the same directory, optional checksum and
 * progress, content length check (skipped for kUnknownLength), then atomic rename.
 * On any failure the temp file is removed and the destination is left untouched.
 */
Result<void> handle(const Scope& scope, IByteSource& body, std::int64_t contentLength,
                    const std::filesystem::path& destPath, const std::vector<Option>& opts = {});

// Same as handle() with options already applied.
Result<void> transfer(const Scope& scope, IByteSource& body, std::int64_t contentLength,
                      const std::filesystem::path& destPath, const Options& opts);

} // namespace dlkit::downloader
