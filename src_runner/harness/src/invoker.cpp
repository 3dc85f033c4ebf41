#include "babel_testing/invoker.hpp"

#include "babel_testing/failure.hpp"

#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

using namespace babel::testing;

thread_local Scheduler* current_scheduler = nullptr;

class CurrentSchedulerGuard {
public:
    explicit CurrentSchedulerGuard(Scheduler* scheduler) : previous_{current_scheduler} {
        current_scheduler = scheduler;
    }
    ~CurrentSchedulerGuard() { current_scheduler = previous_; }

    CurrentSchedulerGuard(const CurrentSchedulerGuard&) = delete;
    CurrentSchedulerGuard& operator=(const CurrentSchedulerGuard&) = delete;

private:
    Scheduler* previous_;
};

/// Stops and joins the watchdog on every exit path of Scheduler::run.
class Watchdog {
public:
    Watchdog(AsyncContext& ctx, std::atomic<bool>& timed_out, long timeout_ms) {
        thread_ = std::thread([this, &ctx, &timed_out, timeout_ms] {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!stopped_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return done_; })) {
                timed_out.store(true);
                ctx.request_cancel();
            }
        });
    }

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        stopped_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

private:
    std::mutex mutex_;
    std::condition_variable stopped_;
    bool done_{false};
    std::thread thread_;
};

Value invoke_sync_with_timeout(const CallablePtr& callable, const InstancePtr& receiver, const Arguments& args,
                               long timeout_ms) {
    auto promise = std::make_shared<std::promise<Value>>();
    auto future = promise->get_future();

    // The worker owns copies of everything it touches; it may outlive this call.
    std::thread([promise, callable, receiver, args] {
        try {
            promise->set_value(callable->sync(receiver.get(), args));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
        throw InvocationTimeout(timeout_ms);
    }
    return future.get();
}

Value invoke_async_here(const CallablePtr& callable, const InstancePtr& receiver, const Arguments& args,
                        std::optional<long> timeout_ms) {
    Scheduler scheduler;
    try {
        return scheduler.run([&](AsyncContext& ctx) { return callable->async(receiver.get(), args, ctx); },
                             timeout_ms);
    } catch (const OperationCancelled&) {
        if (timeout_ms && scheduler.timed_out()) {
            throw InvocationTimeout(*timeout_ms);
        }
        throw;
    }
}

}  // namespace

namespace babel::testing {

void AsyncContext::checkpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        throw OperationCancelled();
    }
}

void AsyncContext::sleep_for(std::chrono::milliseconds duration) const {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, duration, [this] { return cancelled_; });
    }
    checkpoint();
}

bool AsyncContext::cancellation_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void AsyncContext::request_cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    wake_.notify_all();
}

Scheduler* Scheduler::current() noexcept {
    return current_scheduler;
}

Value Scheduler::run(const Operation& op, std::optional<long> timeout_ms) {
    CurrentSchedulerGuard guard(this);
    AsyncContext ctx;
    timed_out_.store(false);

    if (!timeout_ms) {
        return op(ctx);
    }
    Watchdog watchdog(ctx, timed_out_, *timeout_ms);
    return op(ctx);
}

Value invoke(const CallablePtr& callable, const InstancePtr& receiver, const json& kwargs,
             std::optional<long> timeout_ms) {
    if (!callable) {
        throw std::invalid_argument("invoke: no callable bound");
    }
    const Arguments args(kwargs);

    if (!callable->is_async()) {
        if (!timeout_ms) {
            return callable->sync(receiver.get(), args);
        }
        return invoke_sync_with_timeout(callable, receiver, args, *timeout_ms);
    }

    if (Scheduler::current() == nullptr) {
        return invoke_async_here(callable, receiver, args, timeout_ms);
    }

    // Already inside a scheduler: run on an isolated worker that owns a private one.
    Value result;
    std::exception_ptr error;
    std::thread worker([&] {
        try {
            result = invoke_async_here(callable, receiver, args, timeout_ms);
        } catch (...) {
            error = std::current_exception();
        }
    });
    worker.join();
    if (error) {
        std::rethrow_exception(error);
    }
    return result;
}

}  // namespace babel::testing
