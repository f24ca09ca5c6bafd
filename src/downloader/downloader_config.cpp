#include <dlkit/config/config_helpers.h>
#include <dlkit/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dlkit::downloader {

namespace {
// Upper bound for max_concurrent; each admitted transfer holds a thread and a connection.
constexpr long long kMaxConcurrentCap = 1024;
} // namespace

DownloaderConfig resolveDownloaderConfig() {
    DownloaderConfig cfg;

    if (auto v = config::resolve_value("DLKIT_BUFFER_SIZE", "downloader", "buffer_size");
        !v.empty()) {
        if (auto n = config::parse_integer(v); n && *n > 0) {
            cfg.bufferSize = static_cast<std::size_t>(*n);
        } else {
            spdlog::warn("ignoring invalid downloader buffer_size '{}'", v);
        }
    }

    if (auto v = config::resolve_value(nullptr, "downloader", "temp_prefix"); !v.empty()) {
        cfg.tempPrefix = v;
    }

    if (auto v = config::resolve_value(nullptr, "downloader", "progress_interval_ms");
        !v.empty()) {
        auto ms = config::parse_ms(v);
        if (ms.count() > 0) {
            cfg.progressInterval = ms;
        } else {
            spdlog::warn("ignoring invalid downloader progress_interval_ms '{}'", v);
        }
    }

    if (auto v = config::resolve_value("DLKIT_MAX_CONCURRENT", "downloader", "max_concurrent");
        !v.empty()) {
        if (auto n = config::parse_integer(v)) {
            if (*n > kMaxConcurrentCap) {
                spdlog::warn("downloader max_concurrent {} capped at {}", *n, kMaxConcurrentCap);
            }
            cfg.maxConcurrent = static_cast<int>(std::clamp(*n, 0LL, kMaxConcurrentCap));
        } else {
            spdlog::warn("ignoring invalid downloader max_concurrent '{}'", v);
        }
    }

    if (auto v = config::resolve_value("DLKIT_LOG_LEVEL", "downloader", "log_level");
        !v.empty()) {
        cfg.logLevel = v;
    }

    return cfg;
}

} // namespace dlkit::downloader
