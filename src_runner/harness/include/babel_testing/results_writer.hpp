#pragma once

#include "ir.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Emits machine-readable and console reports for a run.
 *
 * - build_summary()/write_summary(): JSON document with aggregate counts and per-test results.
 * - format_results(): console listing with one line per test and a closing tally.
 */
class ResultsWriter {
public:
    ResultsWriter() = default;

    [[nodiscard]] json build_summary(const std::vector<TestResult>& results) const;

    void write_summary(const std::filesystem::path& destination, const std::vector<TestResult>& results) const;

    /// Output blocks are listed for failures and errors, and for passes only when `show_all_logs`.
    [[nodiscard]] std::string format_results(const std::vector<TestResult>& results,
                                             bool show_all_logs = false) const;
};

/// True when every result is PASSED or SKIPPED.
[[nodiscard]] bool all_passed(const std::vector<TestResult>& results) noexcept;

}  // namespace babel::testing
