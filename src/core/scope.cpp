#include <dlkit/core/scope.h>

#include <functional>

namespace dlkit {

struct Scope::State {
    std::stop_source source;
    std::optional<Clock::time_point> deadline;
    // Keeps the parent's state alive for as long as this scope can be queried.
    std::shared_ptr<State> parent;
    // Declared after `source` so it deregisters before the source is destroyed.
    std::optional<std::stop_callback<std::function<void()>>> link;

    State() = default;

    State(std::shared_ptr<State> p, std::optional<Clock::time_point> dl)
        : deadline(dl), parent(std::move(p)) {
        if (parent) {
            if (parent->deadline && (!deadline || *parent->deadline < *deadline)) {
                deadline = parent->deadline;
            }
            link.emplace(parent->source.get_token(),
                         std::function<void()>([this] { source.request_stop(); }));
        }
    }

    bool expired() const noexcept { return deadline && Clock::now() >= *deadline; }
};

Scope::Scope() : state_(std::make_shared<State>()) {}

Scope Scope::child() const {
    return Scope{std::make_shared<State>(state_, std::nullopt)};
}

Scope Scope::withDeadline(Clock::time_point deadline) const {
    return Scope{std::make_shared<State>(state_, deadline)};
}

Scope Scope::withTimeout(std::chrono::milliseconds timeout) const {
    return withDeadline(Clock::now() + timeout);
}

void Scope::cancel() const noexcept {
    state_->source.request_stop();
}

bool Scope::done() const noexcept {
    return state_->source.stop_requested() || state_->expired();
}

Error Scope::error() const {
    // An explicit cancellation wins over a deadline that passed afterwards.
    if (state_->source.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "context canceled"};
    }
    if (state_->expired()) {
        return Error{ErrorCode::Timeout, "context deadline exceeded"};
    }
    return Error{};
}

std::stop_token Scope::token() const noexcept {
    return state_->source.get_token();
}

std::optional<Scope::Clock::time_point> Scope::deadline() const noexcept {
    return state_->deadline;
}

} // namespace dlkit
