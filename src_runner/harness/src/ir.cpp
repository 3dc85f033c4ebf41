#include "babel_testing/ir.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {

using babel::testing::json;

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw std::runtime_error(std::string{"field '"} + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string required_string(const json& j, const char* key) {
    auto value = optional_string(j, key);
    if (!value || value->empty()) {
        throw std::runtime_error(std::string{"field '"} + key + "' is required");
    }
    return *value;
}

void require_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw std::runtime_error(std::string{what} + " must be a JSON object");
    }
}

template <typename T>
std::vector<T> list_of(const json& j, const char* key) {
    std::vector<T> out;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return out;
    if (!it->is_array()) {
        throw std::runtime_error(std::string{"field '"} + key + "' must be an array");
    }
    out.reserve(it->size());
    for (const auto& element : *it) {
        out.push_back(element.get<T>());
    }
    return out;
}

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

namespace babel::testing {

const char* to_string(ExpectationType type) noexcept {
    switch (type) {
        case ExpectationType::Exact: return "exact";
        case ExpectationType::Contains: return "contains";
        case ExpectationType::Type: return "type";
        case ExpectationType::Null: return "null";
        case ExpectationType::NotNull: return "not_null";
        case ExpectationType::True: return "true";
        case ExpectationType::False: return "false";
    }
    return "exact";
}

const char* to_string(ResultStatus status) noexcept {
    switch (status) {
        case ResultStatus::Passed: return "passed";
        case ResultStatus::Failed: return "failed";
        case ResultStatus::Error: return "error";
        case ResultStatus::Skipped: return "skipped";
    }
    return "error";
}

std::optional<ExpectationType> parse_expectation_type(const std::string& text) {
    if (text == "exact") return ExpectationType::Exact;
    if (text == "contains") return ExpectationType::Contains;
    if (text == "type") return ExpectationType::Type;
    if (text == "null") return ExpectationType::Null;
    if (text == "not_null") return ExpectationType::NotNull;
    if (text == "true") return ExpectationType::True;
    if (text == "false") return ExpectationType::False;
    return std::nullopt;
}

ResultStatus parse_result_status(const std::string& text) noexcept {
    if (text == "passed") return ResultStatus::Passed;
    if (text == "failed") return ResultStatus::Failed;
    if (text == "error") return ResultStatus::Error;
    if (text == "skipped") return ResultStatus::Skipped;
    return ResultStatus::Error;
}

void to_json(json& j, const Expectation& value) {
    j = json{{"type", to_string(value.type)}, {"value", value.value}};
}

void from_json(const json& j, Expectation& value) {
    require_object(j, "expect");
    const auto kind = optional_string(j, "type").value_or("exact");
    const auto parsed = parse_expectation_type(kind);
    if (!parsed) {
        throw std::runtime_error("unknown expectation type '" + kind + "'");
    }
    value.type = *parsed;
    value.value = j.value("value", json(nullptr));
}

void to_json(json& j, const ThrowsExpectation& value) {
    j = json{
        {"type", optional_to_json(value.type)},
        {"message", optional_to_json(value.message)},
        {"code", value.code},
    };
}

void from_json(const json& j, ThrowsExpectation& value) {
    require_object(j, "throws");
    value.type = optional_string(j, "type");
    value.message = optional_string(j, "message");
    value.code = j.value("code", json(nullptr));
    if (!value.code.is_null() && !value.code.is_number_integer() && !value.code.is_string()) {
        throw std::runtime_error("field 'code' must be an integer or a string");
    }
}

void to_json(json& j, const MockSpec& value) {
    j = json{
        {"target", value.target},
        {"given", value.given},
        {"returns", value.returns},
        {"throws", value.throws ? json(*value.throws) : json(nullptr)},
    };
}

void from_json(const json& j, MockSpec& value) {
    require_object(j, "mock");
    value.target = required_string(j, "target");
    value.given = j.value("given", json("any"));
    value.returns = j.value("returns", json(nullptr));
    auto it = j.find("throws");
    if (it != j.end() && !it->is_null()) {
        value.throws = it->get<ThrowsExpectation>();
    } else {
        value.throws.reset();
    }
}

void to_json(json& j, const CalledAssertion& value) {
    j = json{
        {"target", value.target},
        {"with_args", value.with_args ? *value.with_args : json(nullptr)},
        {"times", value.times ? json(*value.times) : json(nullptr)},
    };
}

void from_json(const json& j, CalledAssertion& value) {
    require_object(j, "called");
    value.target = required_string(j, "target");
    auto args = j.find("with_args");
    if (args != j.end() && !args->is_null()) {
        value.with_args = *args;
    }
    auto times = j.find("times");
    if (times != j.end() && !times->is_null()) {
        if (!times->is_number_integer() || times->get<int>() < 0) {
            throw std::runtime_error("field 'times' must be a non-negative integer");
        }
        value.times = times->get<int>();
    }
}

void to_json(json& j, const MutatesSpec& value) {
    j = json{{"called", value.called}};
}

void from_json(const json& j, MutatesSpec& value) {
    require_object(j, "mutates");
    value.called = list_of<CalledAssertion>(j, "called");
}

void to_json(json& j, const TestSpec& value) {
    j = json{
        {"target", value.target},
        {"description", optional_to_json(value.description)},
        {"given", value.given},
        {"types", value.types},
        {"expect", value.expect ? json(*value.expect) : json(nullptr)},
        {"throws", value.throws ? json(*value.throws) : json(nullptr)},
        {"mocks", value.mocks},
        {"mutates", value.mutates ? json(*value.mutates) : json(nullptr)},
        {"timeout_ms", value.timeout_ms ? json(*value.timeout_ms) : json(nullptr)},
    };
}

void from_json(const json& j, TestSpec& value) {
    require_object(j, "test");
    value.target = required_string(j, "target");
    value.description = optional_string(j, "description");

    auto given = j.find("given");
    if (given == j.end() || given->is_null()) {
        value.given = json::object();
    } else if (given->is_object()) {
        value.given = *given;
    } else {
        throw std::runtime_error("field 'given' must be an object");
    }

    value.types.clear();
    auto types = j.find("types");
    if (types != j.end() && !types->is_null()) {
        require_object(*types, "types");
        for (const auto& item : types->items()) {
            if (!item.value().is_string()) {
                throw std::runtime_error("type hint for '" + item.key() + "' must be a string");
            }
            value.types[item.key()] = item.value().get<std::string>();
        }
    }

    auto expect = j.find("expect");
    if (expect != j.end() && !expect->is_null()) value.expect = expect->get<Expectation>();
    auto throws = j.find("throws");
    if (throws != j.end() && !throws->is_null()) value.throws = throws->get<ThrowsExpectation>();
    value.mocks = list_of<MockSpec>(j, "mocks");
    auto mutates = j.find("mutates");
    if (mutates != j.end() && !mutates->is_null()) value.mutates = mutates->get<MutatesSpec>();

    auto timeout = j.find("timeout_ms");
    if (timeout != j.end() && !timeout->is_null()) {
        if (!timeout->is_number_integer() || timeout->get<long>() <= 0) {
            throw std::runtime_error("field 'timeout_ms' must be a positive integer");
        }
        value.timeout_ms = timeout->get<long>();
    }
}

void to_json(json& j, const SuiteSpec& value) {
    j = json{
        {"name", value.name},
        {"target", optional_to_json(value.target)},
        {"tests", value.tests},
    };
}

void from_json(const json& j, SuiteSpec& value) {
    require_object(j, "suite");
    value.name = required_string(j, "name");
    value.target = optional_string(j, "target");
    value.tests = list_of<TestSpec>(j, "tests");
}

void to_json(json& j, const IrDocument& value) {
    j = json{
        {"version", value.version},
        {"suites", value.suites},
        {"tests", value.tests},
    };
}

void from_json(const json& j, IrDocument& value) {
    require_object(j, "IR document");
    value.version = optional_string(j, "version").value_or("0.1");
    value.suites = list_of<SuiteSpec>(j, "suites");
    value.tests = list_of<TestSpec>(j, "tests");
}

void to_json(json& j, const RaisedFailure& value) {
    j = json{{"type", value.type}, {"message", value.message}};
    if (!value.code.is_null()) {
        j["code"] = value.code;
    }
}

void to_json(json& j, const OutputBlock& value) {
    j = json{{"stream", value.stream}, {"text", value.text}};
}

}  // namespace babel::testing
