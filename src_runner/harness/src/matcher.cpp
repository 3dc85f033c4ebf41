#include "babel_testing/matcher.hpp"

namespace {

using namespace babel::testing;

std::string at_path(const std::string& path) {
    return path.empty() ? std::string{} : " at '" + path + "'";
}

MatchResult list_contains(const json& actual, const json& expected, const std::string& path) {
    if (!actual.is_array()) {
        return MatchResult::fail("Expected list" + at_path(path) + ", got " + json_type_name(actual));
    }

    for (const auto& expected_item : expected) {
        bool found = false;
        for (const auto& actual_item : actual) {
            if (expected_item.is_object() ? contains(actual_item, expected_item).passed : actual_item == expected_item) {
                found = true;
                break;
            }
        }
        if (!found) {
            return MatchResult::fail("Expected item " + expected_item.dump() + " not found in list" + at_path(path));
        }
    }
    return MatchResult::pass();
}

}  // namespace

namespace babel::testing {

MatchResult contains(const json& actual, const json& expected, const std::string& path) {
    if (expected.is_object()) {
        if (!actual.is_object()) {
            return MatchResult::fail("Expected object with keys" + at_path(path) + ", got " + json_type_name(actual));
        }
        for (const auto& item : expected.items()) {
            const auto& key = item.key();
            const auto& expected_value = item.value();
            const auto key_path = path.empty() ? key : path + "." + key;

            auto it = actual.find(key);
            if (it == actual.end()) {
                return MatchResult::fail("Missing key '" + key + "'" + at_path(path));
            }

            if (expected_value.is_object()) {
                auto nested = contains(*it, expected_value, key_path);
                if (!nested.passed) return nested;
            } else if (expected_value.is_array()) {
                auto nested = list_contains(*it, expected_value, key_path);
                if (!nested.passed) return nested;
            } else if (*it != expected_value) {
                return MatchResult::fail("Mismatch at '" + key_path + "': expected " + expected_value.dump() +
                                         ", got " + it->dump());
            }
        }
        return MatchResult::pass();
    }

    if (expected.is_array()) {
        return list_contains(actual, expected, path);
    }

    if (actual != expected) {
        return MatchResult::fail("Expected " + expected.dump() + at_path(path) + ", got " + actual.dump());
    }
    return MatchResult::pass();
}

MatchResult matches(const Value& actual, const Expectation& expectation) {
    const auto& data = actual.data();

    switch (expectation.type) {
        case ExpectationType::Exact:
            if (data == expectation.value) return MatchResult::pass();
            return MatchResult::fail("Expected " + expectation.value.dump() + ", got " + data.dump());

        case ExpectationType::Contains:
            return contains(data, expectation.value);

        case ExpectationType::Type: {
            const auto expected_name = expectation.value.is_string() ? expectation.value.get<std::string>()
                                                                     : expectation.value.dump();
            if (actual.type_name() == expected_name) return MatchResult::pass();
            return MatchResult::fail("Expected type " + expected_name + ", got " + actual.type_name());
        }

        case ExpectationType::Null:
            if (data.is_null()) return MatchResult::pass();
            return MatchResult::fail("Expected null, got " + data.dump());

        case ExpectationType::NotNull:
            if (!data.is_null()) return MatchResult::pass();
            return MatchResult::fail("Expected non-null value, got null");

        case ExpectationType::True:
            if (data.is_boolean() && data.get<bool>()) return MatchResult::pass();
            return MatchResult::fail("Expected true, got " + data.dump());

        case ExpectationType::False:
            if (data.is_boolean() && !data.get<bool>()) return MatchResult::pass();
            return MatchResult::fail("Expected false, got " + data.dump());
    }
    return MatchResult::fail(std::string{"Unknown expectation type: "} + to_string(expectation.type));
}

MatchResult matches_failure(const RaisedFailure& raised, const ThrowsExpectation& expectation) {
    if (expectation.type && raised.type != *expectation.type) {
        return MatchResult::fail("Expected " + *expectation.type + ", got " + raised.type);
    }
    if (expectation.message && raised.message.find(*expectation.message) == std::string::npos) {
        return MatchResult::fail("Expected message containing \"" + *expectation.message + "\", got \"" +
                                 raised.message + "\"");
    }
    if (!expectation.code.is_null() && raised.code != expectation.code) {
        return MatchResult::fail("Expected code " + expectation.code.dump() + ", got " +
                                 (raised.code.is_null() ? std::string{"none"} : raised.code.dump()));
    }
    return MatchResult::pass();
}

}  // namespace babel::testing
