#pragma once

#include "registry.hpp"
#include "value.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace babel::testing {

/**
 * \brief Handle an async operation receives from its scheduler.
 *
 * checkpoint() and sleep_for() are the suspension points: the only places where a
 * requested cancellation takes effect (by throwing OperationCancelled).
 */
class AsyncContext {
public:
    AsyncContext() = default;
    AsyncContext(const AsyncContext&) = delete;
    AsyncContext& operator=(const AsyncContext&) = delete;

    void checkpoint() const;

    /// Waits up to `duration`, waking early when cancellation is requested.
    void sleep_for(std::chrono::milliseconds duration) const;

    [[nodiscard]] bool cancellation_requested() const;
    void request_cancel();

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable wake_;
    bool cancelled_{false};
};

/**
 * \brief Runs async operations on the calling thread, optionally racing a deadline.
 *
 * While run() is active the scheduler is current() for the calling thread.
 */
class Scheduler {
public:
    using Operation = std::function<Value(AsyncContext&)>;

    Scheduler() = default;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Scheduler running on this thread, or nullptr.
    [[nodiscard]] static Scheduler* current() noexcept;

    /// Runs `op` to completion. With a timeout, a watchdog requests cancellation at the deadline.
    Value run(const Operation& op, std::optional<long> timeout_ms = std::nullopt);

    /// True when the last run() reached its deadline.
    [[nodiscard]] bool timed_out() const noexcept { return timed_out_.load(); }

private:
    std::atomic<bool> timed_out_{false};
};

/**
 * \brief Calls `callable` with `kwargs`, bounded by `timeout_ms` when given.
 *
 * Exactly one of three outcomes: the returned Value, the callable's own exception,
 * or InvocationTimeout. A timed-out synchronous call keeps running on its detached worker.
 */
[[nodiscard]] Value invoke(const CallablePtr& callable, const InstancePtr& receiver, const json& kwargs,
                           std::optional<long> timeout_ms = std::nullopt);

}  // namespace babel::testing
