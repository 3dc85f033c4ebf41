#include "babel_testing/spy_recorder.hpp"

#include "babel_testing/invoker.hpp"
#include "babel_testing/resolver.hpp"

#include <stdexcept>

namespace babel::testing {

SpyScope::~SpyScope() {
    restore();
}

void SpyScope::install_all(const MutatesSpec& spec) {
    try {
        for (const auto& assertion : spec.called) {
            if (find(assertion.target) == nullptr) {
                install(assertion.target);
            }
        }
    } catch (const std::exception&) {
        restore();
        throw;
    }
}

void SpyScope::install(const std::string& target) {
    const Location location = locate(registry_, target);
    CallablePtr wrapped = location.binding->get();
    auto log = std::make_shared<CallLog>();

    auto recorder = std::make_shared<Callable>();
    recorder->name = wrapped->name;
    recorder->params = wrapped->params;

    auto record = [log](const Arguments& args) {
        std::lock_guard<std::mutex> lock(log->mutex);
        log->calls.push_back(args.raw());
    };
    if (wrapped->is_async()) {
        recorder->async = [wrapped, record](Instance* receiver, const Arguments& args, AsyncContext& ctx) {
            record(args);
            return wrapped->async(receiver, args, ctx);
        };
    } else {
        recorder->sync = [wrapped, record](Instance* receiver, const Arguments& args) {
            record(args);
            return wrapped->sync(receiver, args);
        };
    }

    location.binding->exchange(std::move(recorder));
    spies_.push_back(Spy{target, location.binding, std::move(wrapped), std::move(log)});
}

const SpyScope::Spy* SpyScope::find(const std::string& target) const {
    for (const auto& spy : spies_) {
        if (spy.target == target) return &spy;
    }
    return nullptr;
}

std::vector<json> SpyScope::calls(const std::string& target) const {
    const Spy* spy = find(target);
    if (spy == nullptr) {
        return {};
    }
    std::lock_guard<std::mutex> lock(spy->log->mutex);
    return spy->log->calls;
}

MatchResult SpyScope::verify(const MutatesSpec& spec) const {
    for (const auto& assertion : spec.called) {
        const auto recorded = calls(assertion.target);
        const auto count = static_cast<int>(recorded.size());

        if (!assertion.times && count == 0) {
            return MatchResult::fail("Expected " + assertion.target + " to be called, but it was not called");
        }
        if (assertion.times && count != *assertion.times) {
            return MatchResult::fail("Expected " + assertion.target + " to be called " +
                                     std::to_string(*assertion.times) + " time(s), but it was called " +
                                     std::to_string(count) + " time(s)");
        }
        if (assertion.with_args) {
            bool matched = false;
            for (const auto& kwargs : recorded) {
                if (contains(kwargs, *assertion.with_args).passed) {
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                return MatchResult::fail("Expected " + assertion.target + " to be called with " +
                                         assertion.with_args->dump() + ", recorded calls: " + json(recorded).dump());
            }
        }
    }
    return MatchResult::pass();
}

void SpyScope::restore() noexcept {
    while (!spies_.empty()) {
        auto& last = spies_.back();
        last.binding->exchange(std::move(last.original));
        spies_.pop_back();
    }
}

}  // namespace babel::testing
