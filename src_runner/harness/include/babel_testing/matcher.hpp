#pragma once

#include "ir.hpp"
#include "value.hpp"

#include <optional>
#include <string>

namespace babel::testing {

struct MatchResult {
    bool passed{false};
    std::optional<std::string> message;  ///< set when the match failed

    [[nodiscard]] static MatchResult pass() { return MatchResult{true, std::nullopt}; }
    [[nodiscard]] static MatchResult fail(std::string message) { return MatchResult{false, std::move(message)}; }
};

/// Compares a returned value against a return-value expectation.
[[nodiscard]] MatchResult matches(const Value& actual, const Expectation& expectation);

/**
 * \brief Partial structural match: every key/element of `expected` must be present in `actual`.
 *
 * Objects recurse, arrays are unordered subsets; the first mismatch's dotted path is reported.
 */
[[nodiscard]] MatchResult contains(const json& actual, const json& expected, const std::string& path = {});

/// Checks a raised failure against a `throws` expectation; absent fields match anything.
[[nodiscard]] MatchResult matches_failure(const RaisedFailure& raised, const ThrowsExpectation& expectation);

}  // namespace babel::testing
