#include <dlkit/downloader/downloader.hpp>
#include <dlkit/downloader/queue.hpp>

namespace dlkit::downloader {

Result<Options> applyOptions(const std::vector<Option>& opts) {
    Options resolved;
    for (const auto& opt : opts) {
        if (!opt) {
            continue;
        }
        auto r = opt(resolved);
        if (!r) {
            return wrapError("applying option", r.error());
        }
    }
    return resolved;
}

Option withChecksum(HashAlgo algo, std::string expectedHex) {
    return [algo, expected = std::move(expectedHex)](Options& opts) -> Result<void> {
        if (expected.empty()) {
            return Error{ErrorCode::InvalidArgument, "expected checksum must not be empty"};
        }
        // A fresh hasher per application: options may be reused across transfers.
        opts.checksum = std::make_shared<ChecksumVerifier>(
            std::shared_ptr<IIntegrityVerifier>(makeIntegrityVerifier(algo)), expected);
        return {};
    };
}

Option withChecksum(std::shared_ptr<IIntegrityVerifier> hasher, std::string expectedHex) {
    return [hasher = std::move(hasher),
            expected = std::move(expectedHex)](Options& opts) -> Result<void> {
        if (!hasher) {
            return Error{ErrorCode::InvalidArgument, "hash must not be nil"};
        }
        if (expected.empty()) {
            return Error{ErrorCode::InvalidArgument, "expected checksum must not be empty"};
        }
        opts.checksum = std::make_shared<ChecksumVerifier>(hasher, expected);
        return {};
    };
}

Option withProgress(ProgressCallback callback) {
    return [callback = std::move(callback)](Options& opts) -> Result<void> {
        opts.progress = true;
        opts.onProgress = callback;
        return {};
    };
}

Option withSkipExisting() {
    return [](Options& opts) -> Result<void> {
        opts.skipExisting = true;
        return {};
    };
}

Option withBatch(int maxConcurrent) {
    return [maxConcurrent](Options& opts) -> Result<void> {
        if (opts.batch) {
            return Error{ErrorCode::InvalidArgument,
                         "batch already configured: cannot start a new batch here"};
        }
        opts.batch = Queue::create(maxConcurrent);
        return {};
    };
}

Option withQueue(std::shared_ptr<Queue> queue) {
    return [queue = std::move(queue)](Options& opts) -> Result<void> {
        if (!queue) {
            return Error{ErrorCode::InvalidArgument, "queue must not be nil"};
        }
        if (opts.batch) {
            return Error{ErrorCode::InvalidArgument, "batch already configured"};
        }
        opts.batch = queue;
        return {};
    };
}

Option withLogger(std::shared_ptr<spdlog::logger> logger) {
    return [logger = std::move(logger)](Options& opts) -> Result<void> {
        if (!logger) {
            return Error{ErrorCode::InvalidArgument, "logger must not be nil"};
        }
        opts.logger = logger;
        return {};
    };
}

Option withConfig(const DownloaderConfig& config) {
    return [config](Options& opts) -> Result<void> {
        if (config.bufferSize == 0) {
            return Error{ErrorCode::InvalidArgument, "buffer size must be positive"};
        }
        if (config.tempPrefix.empty() ||
            config.tempPrefix.find('/') != std::string::npos) {
            return Error{ErrorCode::InvalidArgument,
                         "temp prefix must be a non-empty file name: '" + config.tempPrefix +
                             "'"};
        }
        opts.bufferSize = config.bufferSize;
        opts.tempPrefix = config.tempPrefix;
        opts.progressInterval = config.progressInterval;
        return {};
    };
}

} // namespace dlkit::downloader
