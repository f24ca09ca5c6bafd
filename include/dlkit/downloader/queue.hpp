#pragma once

/*
 * dlkit Downloader - asynchronous and batched transfers
 *
 * A Queue coordinates a batch: completion counter, optional concurrency gate, shutdown flag and
 * the list of every task's terminal error. Tasks run on worker threads and are observed through
 * a DownloadResult. A bounded queue keeps at most `limit` workers; tasks beyond that wait
 * without a thread and are handed to the next worker that frees up.
 */

#include <dlkit/core/scope.h>
#include <dlkit/core/types.h>
#include <dlkit/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace dlkit::downloader {

class DownloadResult;

namespace detail {
struct TaskState;
}

// A unit of asynchronous work managed by a Queue.
using WorkFunc = std::function<Result<void>(const Scope&)>;

class Queue : public std::enable_shared_from_this<Queue> {
public:
    // maxConcurrent <= 0 means unlimited concurrency.
    static std::shared_ptr<Queue> create(int maxConcurrent);

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    /**
     * Blocks until every started task finished and joins the worker threads. When the last
     * owner is released by one of the queue's own tasks, the workers are detached instead and
     * finish the remaining tasks on their own.
     */
    ~Queue();

    /**
     * Schedules `work` under a child of `scope` and returns its result handle.
     * The task waits for a gate slot first (giving up with the scope's error), then fails with
     * SystemShutdown if shutdown() was called, otherwise runs `work`.
     */
    std::shared_ptr<DownloadResult> start(const Scope& scope, WorkFunc work);

    // Blocks until every started task finished; returns all recorded errors joined.
    Result<void> wait() const;

    // Tasks that have not passed admission yet fail without running. Running tasks continue.
    void shutdown() noexcept;

    [[nodiscard]] bool isShutdown() const noexcept;
    [[nodiscard]] std::optional<std::size_t> limit() const noexcept;
    // Number of tasks waiting for a gate slot.
    [[nodiscard]] std::size_t queued() const;

    void recordError(Error err);

private:
    explicit Queue(int maxConcurrent);

    // Shared with the worker threads, which never own the Queue itself.
    struct Core;
    std::shared_ptr<Core> core_;
};

/**
 * Handle for one asynchronous transfer.
 * err() answers "did this transfer succeed", wait() answers "is the whole batch done".
 */
class DownloadResult {
public:
    // Completion signal; ready once the transfer's task exited.
    [[nodiscard]] std::shared_future<void> done() const { return done_; }

    // Blocks until this transfer finished and returns its own outcome.
    Result<void> err() const;

    // Blocks until every transfer of the batch finished; all errors joined.
    Result<void> wait() const;

    // Cancels this transfer only.
    void cancel() const noexcept { scope_.cancel(); }

    /**
     * Enqueues another transfer into the same queue. Configuration errors (empty path, a new
     * batch requested through withBatch, failing options) are recorded in the queue and
     * reported by the returned, already finished result.
     */
    std::shared_ptr<DownloadResult> add(BodyOpener opener, std::filesystem::path destPath,
                                        std::vector<Option> opts = {});
    std::shared_ptr<DownloadResult> add(Body body, std::filesystem::path destPath,
                                        std::vector<Option> opts = {});

    [[nodiscard]] const std::shared_ptr<Queue>& queue() const noexcept { return group_; }

private:
    friend class Queue;

    DownloadResult(std::shared_ptr<Queue> group, Scope parent, Scope scope,
                   std::shared_ptr<detail::TaskState> state);

    static std::shared_ptr<DownloadResult> failed(std::shared_ptr<Queue> group, Scope parent,
                                                  Error err);

    std::shared_ptr<Queue> group_;
    Scope parent_; // scope siblings added through add() derive from
    Scope scope_;  // this transfer's private scope
    std::shared_ptr<detail::TaskState> state_;
    std::shared_future<void> done_;
};

/**
 * Starts a transfer asynchronously. Without withBatch the transfer gets a private unlimited
 * queue. Option and path errors are returned before anything is started.
 */
Result<std::shared_ptr<DownloadResult>> downloadAsync(const Scope& scope, BodyOpener opener,
                                                      std::filesystem::path destPath,
                                                      std::vector<Option> opts = {});
Result<std::shared_ptr<DownloadResult>> downloadAsync(const Scope& scope, Body body,
                                                      std::filesystem::path destPath,
                                                      std::vector<Option> opts = {});

} // namespace dlkit::downloader
