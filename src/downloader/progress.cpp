#include <dlkit/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

namespace dlkit::downloader {

ProgressTracker::ProgressTracker(std::filesystem::path destination, std::int64_t total,
                                 std::chrono::milliseconds interval,
                                 std::shared_ptr<spdlog::logger> logger, ProgressCallback callback)
    : destination_(std::move(destination)), total_(total), interval_(interval),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      callback_(std::move(callback)), start_(Clock::now()) {}

void ProgressTracker::onWrite(std::size_t bytes) {
    transferred_ += bytes;

    if (total_ >= 0 && transferred_ == static_cast<std::uint64_t>(total_)) {
        report(ProgressStage::Completed);
        return;
    }

    const auto now = Clock::now();
    if (!lastReport_ || now - *lastReport_ >= interval_) {
        lastReport_ = now;
        report(ProgressStage::Downloading);
    }
}

void ProgressTracker::report(ProgressStage stage) {
    using namespace std::chrono;

    ProgressEvent ev;
    ev.destination = destination_;
    ev.downloadedBytes = transferred_;
    ev.stage = stage;
    ev.elapsed = duration_cast<milliseconds>(Clock::now() - start_);
    if (total_ >= 0) {
        ev.totalBytes = static_cast<std::uint64_t>(total_);
        if (total_ > 0) {
            ev.percentage = static_cast<float>((static_cast<long double>(transferred_) * 100.0L) /
                                               static_cast<long double>(total_));
        } else {
            ev.percentage = 100.0f;
        }
    }
    const double seconds = duration<double>(Clock::now() - start_).count();
    if (seconds > 1e-6) {
        ev.speedBps = static_cast<std::uint64_t>(static_cast<double>(transferred_) / seconds);
    }

    const char* msg = stage == ProgressStage::Completed ? "download complete" : "downloading";
    const double mibps = static_cast<double>(ev.speedBps) / (1024.0 * 1024.0);
    if (ev.percentage) {
        logger_->info("{}: {} progress={:.1f}% elapsed={}ms transferred={} total={} mbps={:.2f}",
                      msg, destination_.string(), *ev.percentage, ev.elapsed.count(),
                      ev.downloadedBytes, *ev.totalBytes, mibps);
    } else {
        logger_->info("{}: {} progress=unknown elapsed={}ms transferred={} total=unknown "
                      "mbps={:.2f}",
                      msg, destination_.string(), ev.elapsed.count(), ev.downloadedBytes, mibps);
    }

    if (callback_) {
        callback_(ev);
    }
}

} // namespace dlkit::downloader
