/*
 * dlkit/src/downloader/queue.cpp
 *
 * Queue and DownloadResult.
 * - Queue state lives in a Core shared with the worker threads; a thread never owns the Queue,
 *   so a work function may drop the last queue owner without freeing state still in use
 * - Unbounded queues start one thread per task. Bounded queues start a thread only when a slot
 *   is free; a finishing worker takes over the next waiting task together with its slot
 * - A watcher thread fails waiting tasks whose scope was cancelled or passed its deadline
 * - Shutdown is checked after admission, so a task waiting for a slot is only released early
 *   by cancellation
 */

#include <dlkit/downloader/queue.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace dlkit::downloader {

namespace fs = std::filesystem;

namespace detail {
struct TaskState {
    std::promise<void> promise;
    Error error;
};
} // namespace detail

// ---------- Queue::Core ----------

struct Queue::Core : std::enable_shared_from_this<Queue::Core> {
    struct Task {
        Task(Scope s, WorkFunc w, std::shared_ptr<detail::TaskState> st)
            : scope(std::move(s)), work(std::move(w)), state(std::move(st)) {}

        Scope scope;
        WorkFunc work;
        std::shared_ptr<detail::TaskState> state;
        // Wakes the watcher when the scope is cancelled while the task waits for a slot.
        std::optional<std::stop_callback<std::function<void()>>> onCancel;
    };
    using TaskPtr = std::unique_ptr<Task>;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    explicit Core(std::optional<std::size_t> l) : limit(l) {}

    void submit(TaskPtr task);
    void spawn(TaskPtr task);
    void runWorker(TaskPtr task);
    TaskPtr nextAdmitted();
    void watchGate();
    void execute(Task& task);
    void finish(Task& task, Error err);
    void recordError(Error err);
    void taskDone();
    void reapFinished();
    void close();

    // Completion counter
    std::mutex pendingMutex;
    std::condition_variable pendingCv;
    std::size_t pending{0};

    // Concurrency gate (unbounded when limit is empty)
    const std::optional<std::size_t> limit;
    std::mutex gateMutex;
    std::condition_variable gateCv;
    std::size_t active{0};
    std::deque<TaskPtr> waiting;
    bool closed{false};
    std::thread watcher;

    std::atomic<bool> shutdown{false};

    std::mutex errMutex;
    std::vector<Error> errors;

    std::mutex workersMutex;
    std::vector<Worker> workers;
};

void Queue::Core::submit(TaskPtr task) {
    if (!limit) {
        spawn(std::move(task));
        return;
    }

    bool admitted = false;
    {
        std::lock_guard<std::mutex> lk(gateMutex);
        if (active < *limit && waiting.empty()) {
            ++active;
            admitted = true;
        }
    }
    if (admitted) {
        spawn(std::move(task));
        return;
    }

    // Registered outside the lock: the callback runs inline if the scope already ended.
    task->onCancel.emplace(task->scope.token(), std::function<void()>([this] {
                               { std::lock_guard<std::mutex> lk(gateMutex); }
                               gateCv.notify_all();
                           }));
    {
        std::lock_guard<std::mutex> lk(gateMutex);
        // A worker may have exited between the two checks.
        if (active < *limit && waiting.empty()) {
            ++active;
            admitted = true;
        } else {
            waiting.push_back(std::move(task));
            if (!watcher.joinable()) {
                try {
                    watcher = std::thread([self = shared_from_this()] { self->watchGate(); });
                } catch (const std::system_error& e) {
                    spdlog::warn("gate watcher not started, waiting tasks only end when "
                                 "admitted: {}",
                                 e.what());
                }
            }
        }
    }
    if (admitted) {
        task->onCancel.reset();
        spawn(std::move(task));
        return;
    }
    gateCv.notify_all();
}

void Queue::Core::spawn(TaskPtr task) {
    reapFinished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    Task* raw = task.get();
    std::thread thread;
    try {
        thread = std::thread([self = shared_from_this(), raw, finished] {
            self->runWorker(TaskPtr(raw));
            finished->store(true);
        });
    } catch (const std::system_error& e) {
        spdlog::error("failed to launch download task: {}", e.what());
        finish(*task, Error{ErrorCode::InternalError, std::string("launching task: ") + e.what()});
        if (auto next = nextAdmitted()) {
            spawn(std::move(next));
        }
        return;
    }
    // Owned by the worker from here on.
    static_cast<void>(task.release());

    std::lock_guard<std::mutex> lk(workersMutex);
    workers.push_back(Worker{std::move(thread), finished});
}

void Queue::Core::runWorker(TaskPtr task) {
    bool handedOver = false;
    while (task) {
        // A task that waited for its slot gives up if its scope ended meanwhile.
        if (handedOver && task->scope.done()) {
            finish(*task, task->scope.error());
        } else {
            execute(*task);
        }
        task = nextAdmitted();
        handedOver = true;
    }
}

Queue::Core::TaskPtr Queue::Core::nextAdmitted() {
    TaskPtr next;
    {
        std::lock_guard<std::mutex> lk(gateMutex);
        if (!limit) {
            return nullptr;
        }
        if (waiting.empty()) {
            --active;
        } else {
            next = std::move(waiting.front());
            waiting.pop_front();
        }
    }
    gateCv.notify_all();
    if (next) {
        // May block until a concurrently running callback returned; never under gateMutex.
        next->onCancel.reset();
    }
    return next;
}

void Queue::Core::watchGate() {
    std::unique_lock<std::mutex> lk(gateMutex);
    for (;;) {
        std::vector<TaskPtr> expired;
        std::optional<Scope::Clock::time_point> next;
        for (auto it = waiting.begin(); it != waiting.end();) {
            if ((*it)->scope.done()) {
                expired.push_back(std::move(*it));
                it = waiting.erase(it);
                continue;
            }
            if (auto dl = (*it)->scope.deadline(); dl && (!next || *dl < *next)) {
                next = dl;
            }
            ++it;
        }

        if (!expired.empty()) {
            lk.unlock();
            for (auto& task : expired) {
                task->onCancel.reset();
                finish(*task, task->scope.error());
            }
            expired.clear();
            lk.lock();
            continue;
        }

        if (closed && waiting.empty()) {
            return;
        }
        if (next) {
            gateCv.wait_until(lk, *next);
        } else {
            gateCv.wait(lk);
        }
    }
}

void Queue::Core::execute(Task& task) {
    Error err;
    if (shutdown.load()) {
        err = Error{ErrorCode::SystemShutdown, "group is shut down"};
    } else {
        try {
            auto r = task.work(task.scope);
            if (!r) {
                err = r.error();
            }
        } catch (const std::exception& e) {
            err = Error{ErrorCode::InternalError, std::string("download task failed: ") + e.what()};
        } catch (...) {
            err = Error{ErrorCode::InternalError, "download task failed: unknown exception"};
        }
    }
    finish(task, std::move(err));
}

void Queue::Core::finish(Task& task, Error err) {
    // May release the last Queue owner; only Core state is used afterwards.
    task.work = nullptr;

    if (err.code != ErrorCode::Success) {
        recordError(err);
    }
    task.state->error = std::move(err);
    task.scope.cancel();
    task.state->promise.set_value();
    taskDone();
}

void Queue::Core::recordError(Error err) {
    std::lock_guard<std::mutex> lk(errMutex);
    errors.push_back(std::move(err));
}

void Queue::Core::taskDone() {
    std::lock_guard<std::mutex> lk(pendingMutex);
    if (--pending == 0) {
        pendingCv.notify_all();
    }
}

void Queue::Core::reapFinished() {
    std::vector<Worker> done;
    {
        std::lock_guard<std::mutex> lk(workersMutex);
        auto it = workers.begin();
        while (it != workers.end()) {
            if (it->finished->load()) {
                done.push_back(std::move(*it));
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : done) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

void Queue::Core::close() {
    std::thread watch;
    {
        std::lock_guard<std::mutex> lk(gateMutex);
        closed = true;
        watch.swap(watcher);
    }
    gateCv.notify_all();

    std::vector<Worker> all;
    {
        std::lock_guard<std::mutex> lk(workersMutex);
        all.swap(workers);
    }

    const auto self = std::this_thread::get_id();
    const bool ownThread =
        watch.get_id() == self || std::any_of(all.begin(), all.end(), [&](const Worker& w) {
            return w.thread.get_id() == self;
        });

    // Workers first: they drain the waiting tasks the watcher is still guarding.
    for (auto& w : all) {
        if (!w.thread.joinable()) {
            continue;
        }
        if (ownThread) {
            w.thread.detach();
        } else {
            w.thread.join();
        }
    }
    if (watch.joinable()) {
        if (ownThread) {
            watch.detach();
        } else {
            watch.join();
        }
    }
}

// ---------- Queue ----------

std::shared_ptr<Queue> Queue::create(int maxConcurrent) {
    return std::shared_ptr<Queue>(new Queue(maxConcurrent));
}

Queue::Queue(int maxConcurrent) {
    std::optional<std::size_t> limit;
    if (maxConcurrent > 0) {
        limit = static_cast<std::size_t>(maxConcurrent);
    }
    core_ = std::make_shared<Core>(limit);
}

Queue::~Queue() {
    core_->close();
}

std::shared_ptr<DownloadResult> Queue::start(const Scope& scope, WorkFunc work) {
    Scope taskScope = scope.child();
    auto state = std::make_shared<detail::TaskState>();
    auto result = std::shared_ptr<DownloadResult>(
        new DownloadResult(shared_from_this(), scope, taskScope, state));

    {
        std::lock_guard<std::mutex> lk(core_->pendingMutex);
        ++core_->pending;
    }
    core_->submit(std::make_unique<Core::Task>(std::move(taskScope), std::move(work),
                                               std::move(state)));
    return result;
}

Result<void> Queue::wait() const {
    {
        std::unique_lock<std::mutex> lk(core_->pendingMutex);
        core_->pendingCv.wait(lk, [this] { return core_->pending == 0; });
    }
    std::lock_guard<std::mutex> lk(core_->errMutex);
    return joinErrors(core_->errors);
}

void Queue::shutdown() noexcept {
    core_->shutdown.store(true);
}

bool Queue::isShutdown() const noexcept {
    return core_->shutdown.load();
}

std::optional<std::size_t> Queue::limit() const noexcept {
    return core_->limit;
}

std::size_t Queue::queued() const {
    std::lock_guard<std::mutex> lk(core_->gateMutex);
    return core_->waiting.size();
}

void Queue::recordError(Error err) {
    core_->recordError(std::move(err));
}

// ---------- DownloadResult ----------

DownloadResult::DownloadResult(std::shared_ptr<Queue> group, Scope parent, Scope scope,
                               std::shared_ptr<detail::TaskState> state)
    : group_(std::move(group)), parent_(std::move(parent)), scope_(std::move(scope)),
      state_(std::move(state)), done_(state_->promise.get_future().share()) {}

std::shared_ptr<DownloadResult> DownloadResult::failed(std::shared_ptr<Queue> group,
                                                       Scope parent, Error err) {
    auto state = std::make_shared<detail::TaskState>();
    Scope scope = parent.child();
    auto result = std::shared_ptr<DownloadResult>(
        new DownloadResult(std::move(group), std::move(parent), std::move(scope), state));
    state->error = std::move(err);
    state->promise.set_value();
    return result;
}

Result<void> DownloadResult::err() const {
    done_.wait();
    return state_->error;
}

Result<void> DownloadResult::wait() const {
    return group_->wait();
}

std::shared_ptr<DownloadResult> DownloadResult::add(BodyOpener opener, fs::path destPath,
                                                    std::vector<Option> opts) {
    opts.insert(opts.begin(), withQueue(group_));
    auto started = downloadAsync(parent_, std::move(opener), std::move(destPath), std::move(opts));
    if (!started) {
        group_->recordError(started.error());
        return failed(group_, parent_, started.error());
    }
    return std::move(started).value();
}

std::shared_ptr<DownloadResult> DownloadResult::add(Body body, fs::path destPath,
                                                    std::vector<Option> opts) {
    return add(openerFor(std::move(body)), std::move(destPath), std::move(opts));
}

// ---------- async entry points ----------

Result<std::shared_ptr<DownloadResult>> downloadAsync(const Scope& scope, BodyOpener opener,
                                                      fs::path destPath,
                                                      std::vector<Option> opts) {
    if (destPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "destPath must not be empty"};
    }
    if (!opener) {
        return Error{ErrorCode::InvalidArgument, "body opener must not be empty"};
    }
    auto resolved = applyOptions(opts);
    if (!resolved) {
        return resolved.error();
    }
    Options options = std::move(resolved).value();
    auto group = options.batch ? options.batch : Queue::create(0);
    // Tasks do not reference their own queue, so dropping the results lets ~Queue join.
    options.batch.reset();

    auto work = [opener = std::move(opener), dest = std::move(destPath),
                 options](const Scope& taskScope) -> Result<void> {
        if (options.skipExisting) {
            std::error_code ec;
            if (fs::exists(dest, ec) && !ec) {
                auto logger = options.logger ? options.logger : spdlog::default_logger();
                logger->info("skipping existing file: {}", dest.string());
                return {};
            }
        }
        auto body = opener(taskScope);
        if (!body) {
            return body.error();
        }
        const auto& opened = body.value();
        if (!opened.stream) {
            return Error{ErrorCode::InvalidArgument, "body stream must not be null"};
        }
        return transfer(taskScope, *opened.stream, opened.contentLength, dest, options);
    };

    return group->start(scope, std::move(work));
}

Result<std::shared_ptr<DownloadResult>> downloadAsync(const Scope& scope, Body body,
                                                      fs::path destPath,
                                                      std::vector<Option> opts) {
    return downloadAsync(scope, openerFor(std::move(body)), std::move(destPath),
                         std::move(opts));
}

} // namespace dlkit::downloader
