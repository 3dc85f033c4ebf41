#pragma once

#include "ir.hpp"

#include <string>

namespace babel::testing {

/**
 * \brief Runs single tests for one implementation language.
 *
 * run_test() never throws for per-test problems; they come back as ERROR results.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    [[nodiscard]] virtual TestResult run_test(const TestSpec& test) = 0;

    /// Releases runtime resources. Safe to call more than once.
    virtual void shutdown() {}
};

/**
 * \brief Optional capability: adapters that want suite/test boundary notifications.
 */
class LifecycleListener {
public:
    virtual ~LifecycleListener() = default;

    virtual void on_suite_start(const std::string& suite_name) = 0;
    virtual void on_suite_end(const std::string& suite_name) = 0;
    virtual void on_test_start(const std::string& test_name) = 0;
    virtual void on_test_end(const std::string& test_name) = 0;
};

}  // namespace babel::testing
