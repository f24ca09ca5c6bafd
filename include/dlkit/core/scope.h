#pragma once

#include <dlkit/core/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>

namespace dlkit {

/**
 * Cancellation scope propagated from a caller down to the work it starts.
 *
 * A scope ends when it is cancelled explicitly, when any ancestor is cancelled, or when its
 * deadline (inherited from the nearest ancestor unless narrowed) passes. Child scopes are
 * independent of their siblings: cancelling a child never affects its parent.
 *
 * Scope is a cheap, copyable handle; copies observe and control the same scope.
 */
class Scope {
public:
    using Clock = std::chrono::steady_clock;

    // A scope that never ends on its own.
    Scope();

    static Scope background() { return Scope{}; }

    // Child scope, cancelled together with this one.
    [[nodiscard]] Scope child() const;
    // Child scope that additionally ends at `deadline` (or the parent's, if earlier).
    [[nodiscard]] Scope withDeadline(Clock::time_point deadline) const;
    [[nodiscard]] Scope withTimeout(std::chrono::milliseconds timeout) const;

    void cancel() const noexcept;

    // True once cancelled or past the deadline.
    [[nodiscard]] bool done() const noexcept;

    // Success while the scope is live, OperationCancelled or Timeout after it ended.
    [[nodiscard]] Error error() const;

    [[nodiscard]] std::stop_token token() const noexcept;
    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept;

private:
    struct State;
    explicit Scope(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace dlkit
