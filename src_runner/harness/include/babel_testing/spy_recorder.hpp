#pragma once

#include "ir.hpp"
#include "matcher.hpp"
#include "registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Records calls made through selected bindings during one test (`mutates.called`).
 *
 * A spy wraps whatever is bound when it is installed, so calls into a mock are counted too.
 */
class SpyScope {
public:
    explicit SpyScope(Registry& registry) : registry_{registry} {}
    ~SpyScope();

    SpyScope(const SpyScope&) = delete;
    SpyScope& operator=(const SpyScope&) = delete;

    /// Wraps each distinct target named by `spec.called`. Restores and rethrows on failure.
    void install_all(const MutatesSpec& spec);

    /// Checks every assertion against the recorded calls; the first miss fails the match.
    [[nodiscard]] MatchResult verify(const MutatesSpec& spec) const;

    /// Keyword arguments of every call recorded for `target`, in call order.
    [[nodiscard]] std::vector<json> calls(const std::string& target) const;

    void restore() noexcept;

private:
    struct CallLog {
        mutable std::mutex mutex;
        std::vector<json> calls;
    };

    struct Spy {
        std::string target;
        BindingPtr binding;
        CallablePtr original;
        std::shared_ptr<CallLog> log;
    };

    void install(const std::string& target);
    [[nodiscard]] const Spy* find(const std::string& target) const;

    Registry& registry_;
    std::vector<Spy> spies_;
};

}  // namespace babel::testing
