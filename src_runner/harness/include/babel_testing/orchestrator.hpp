#pragma once

#include "adapter.hpp"
#include "ir.hpp"

#include <vector>

namespace babel::testing {

/**
 * \brief Runs every test of an IR document through one adapter, sequentially.
 *
 * Top-level tests run first, then suites in declaration order. A relative target
 * (`.method`) is prefixed with the suite target. Lifecycle notifications are sent only
 * when the adapter also implements LifecycleListener.
 */
class Orchestrator {
public:
    explicit Orchestrator(Adapter& adapter);

    [[nodiscard]] std::vector<TestResult> run(const IrDocument& document);

private:
    TestResult run_one(const TestSpec& test);

    Adapter& adapter_;
    LifecycleListener* listener_;
};

/// True for suite-relative targets such as `.getById`.
[[nodiscard]] bool is_relative_target(const std::string& target) noexcept;

}  // namespace babel::testing
