#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace babel::testing {

using json = nlohmann::json;

/**
 * \brief Kind of assertion made on a returned value.
 *
 * Wire spelling is lower-case (`exact`, `contains`, `type`, `null`, `not_null`, `true`, `false`).
 */
enum class ExpectationType {
    Exact,
    Contains,
    Type,
    Null,
    NotNull,
    True,
    False,
};

struct Expectation {
    ExpectationType type{ExpectationType::Exact};
    json value{};
};

/**
 * \brief Assertion that the call raises. Absent fields are wildcards.
 */
struct ThrowsExpectation {
    std::optional<std::string> type;
    std::optional<std::string> message;
    json code{};  ///< null when absent; integer or string otherwise
};

/**
 * \brief Substitute for one collaborator during one test.
 *
 * `given` is preserved as authored ("any" or a structure) but never consulted when the
 * substitute is called.
 */
struct MockSpec {
    std::string target;
    json given = "any";
    json returns{};
    std::optional<ThrowsExpectation> throws;
};

struct CalledAssertion {
    std::string target;
    std::optional<json> with_args;
    std::optional<int> times;  ///< nullopt = at least once
};

struct MutatesSpec {
    std::vector<CalledAssertion> called;
};

struct TestSpec {
    std::string target;
    std::optional<std::string> description;
    json given = json::object();
    std::map<std::string, std::string> types;
    std::optional<Expectation> expect;
    std::optional<ThrowsExpectation> throws;
    std::vector<MockSpec> mocks;
    std::optional<MutatesSpec> mutates;
    std::optional<long> timeout_ms;

    /// Name reported to lifecycle listeners: description when present, target otherwise.
    [[nodiscard]] std::string display_name() const { return description ? *description : target; }
};

struct SuiteSpec {
    std::string name;
    std::optional<std::string> target;
    std::vector<TestSpec> tests;
};

struct IrDocument {
    std::string version{"0.1"};
    std::vector<SuiteSpec> suites;
    std::vector<TestSpec> tests;
};

enum class ResultStatus {
    Passed,
    Failed,
    Error,
    Skipped,
};

/**
 * \brief Failure raised by the invoked code, reduced to language-neutral fields.
 */
struct RaisedFailure {
    std::string type;
    std::string message;
    json code{};
};

/**
 * \brief One grouping of captured output (`stdout` or `stderr`).
 */
struct OutputBlock {
    std::string stream;
    std::string text;
};

/**
 * \brief Outcome of exactly one executed TestSpec. Built once, never mutated afterwards.
 */
struct TestResult {
    TestSpec test;
    ResultStatus status{ResultStatus::Error};
    std::optional<std::string> message;
    json actual_value{};
    json expected_value{};
    std::optional<RaisedFailure> failure;
    double duration_ms{0.0};
    std::vector<OutputBlock> output;
};

[[nodiscard]] const char* to_string(ExpectationType type) noexcept;
[[nodiscard]] const char* to_string(ResultStatus status) noexcept;

/// Parses the wire spelling; nullopt for anything unknown.
[[nodiscard]] std::optional<ExpectationType> parse_expectation_type(const std::string& text);

/// Maps a status string reported by a runtime; anything unrecognised is Error.
[[nodiscard]] ResultStatus parse_result_status(const std::string& text) noexcept;

// nlohmann ADL hooks. from_json throws std::runtime_error on malformed input.
void to_json(json& j, const Expectation& value);
void from_json(const json& j, Expectation& value);
void to_json(json& j, const ThrowsExpectation& value);
void from_json(const json& j, ThrowsExpectation& value);
void to_json(json& j, const MockSpec& value);
void from_json(const json& j, MockSpec& value);
void to_json(json& j, const CalledAssertion& value);
void from_json(const json& j, CalledAssertion& value);
void to_json(json& j, const MutatesSpec& value);
void from_json(const json& j, MutatesSpec& value);
void to_json(json& j, const TestSpec& value);
void from_json(const json& j, TestSpec& value);
void to_json(json& j, const SuiteSpec& value);
void from_json(const json& j, SuiteSpec& value);
void to_json(json& j, const IrDocument& value);
void from_json(const json& j, IrDocument& value);
void to_json(json& j, const RaisedFailure& value);
void to_json(json& j, const OutputBlock& value);

}  // namespace babel::testing
