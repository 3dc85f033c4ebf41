#pragma once

#include "ir.hpp"
#include "registry.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Scoped substitution of collaborators for one test.
 *
 * Every binding replaced by install_all() is put back when the scope ends, in reverse
 * order, whatever way the test finished.
 */
class MockScope {
public:
    explicit MockScope(Registry& registry) : registry_{registry} {}
    ~MockScope();

    MockScope(const MockScope&) = delete;
    MockScope& operator=(const MockScope&) = delete;

    /// Installs every mock in order. On the first failure the mocks already installed are
    /// restored and the error is rethrown.
    void install_all(const std::vector<MockSpec>& mocks);

    /// Restores original bindings (idempotent).
    void restore() noexcept;

    [[nodiscard]] std::size_t installed() const noexcept { return installed_.size(); }

private:
    struct Installed {
        BindingPtr binding;
        CallablePtr original;
    };

    void install(const MockSpec& mock);

    Registry& registry_;
    std::vector<Installed> installed_;
};

/**
 * \brief Finds how to raise the failure named by a mock's `throws` block.
 *
 * Lookup order: fully-qualified `module.Name`, a failure registered in a module prefixing
 * `mock_target`, a well-known standard exception, then a generic Failure with the requested name.
 */
[[nodiscard]] FailureFactory resolve_failure_factory(Registry& registry, const std::string& mock_target,
                                                     const ThrowsExpectation& throws);

}  // namespace babel::testing
