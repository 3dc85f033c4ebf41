/**
 * @file test_value_capture.cpp
 * @brief Tests for turning C++ results into comparable values, and keyword arguments back into C++.
 *
 * Scope:
 *  - records serialized through nlohmann ADL keep their class name as type name
 *  - to_json() members, std::optional, containers and scalars
 *  - Arguments::get conversion failures surface as TypeError failures
 *  - payloads and failure codes are kept as given
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/failure.hpp"
#include "babel_testing/registry.hpp"
#include "babel_testing/value.hpp"
#include "example_modules.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace babel::testing;
using babel::testing::examples::Point;
using babel::testing::examples::Profile;
using babel::testing::examples::User;

TEST_CASE("records are captured with their unqualified class name", "[value]") {
    const auto value = capture(User{7, "Eve", "eve@example.com", Profile{"Rome", {"x"}}});
    CHECK(value.type_name() == "User");
    CHECK(value.data()["name"] == "Eve");
    CHECK(value.data()["profile"]["city"] == "Rome");
}

TEST_CASE("to_json members take precedence over ADL", "[value]") {
    const auto value = capture(Point{2, 3});
    CHECK(value.type_name() == "Point");
    CHECK(value.data() == json({{"x", 2}, {"y", 3}}));
}

TEST_CASE("scalars, containers and optionals use neutral names", "[value]") {
    CHECK(capture(42).type_name() == "int");
    CHECK(capture(1.5).type_name() == "float");
    CHECK(capture(true).type_name() == "bool");
    CHECK(capture(std::string{"hi"}).type_name() == "string");
    CHECK(capture(std::vector<int>{1, 2}).type_name() == "array");
    CHECK(capture(std::map<std::string, int>{{"a", 1}}).type_name() == "object");

    CHECK(capture(std::optional<int>{}).is_null());
    CHECK(capture(std::optional<int>{9}).data() == 9);
}

TEST_CASE("unqualified_type_name strips namespaces and template arguments", "[value]") {
    CHECK(unqualified_type_name(typeid(User)) == "User");
    CHECK(unqualified_type_name(typeid(std::invalid_argument)) == "invalid_argument");
    CHECK(unqualified_type_name(typeid(std::vector<int>)) == "vector");
}

TEST_CASE("describe_failure keeps type, message and code", "[value]") {
    const auto from_failure = describe_failure(std::make_exception_ptr(Failure("ValidationError", "bad", 422)));
    CHECK(from_failure.type == "ValidationError");
    CHECK(from_failure.message == "bad");
    CHECK(from_failure.code == 422);

    const auto from_std = describe_failure(std::make_exception_ptr(std::out_of_range("index 4")));
    CHECK(from_std.type == "out_of_range");
    CHECK(from_std.message == "index 4");
    CHECK(from_std.code.is_null());
}

TEST_CASE("argument conversion errors are TypeErrors", "[value]") {
    const Arguments args(json{{"a", 1}, {"name", "x"}, {"nothing", nullptr}});

    CHECK(args.get<int>("a") == 1);
    CHECK(args.get<std::optional<int>>("missing") == std::nullopt);
    CHECK(args.get<std::optional<int>>("nothing") == std::nullopt);

    try {
        (void)args.get<int>("b");
        FAIL("missing argument accepted");
    } catch (const Failure& failure) {
        CHECK(failure.type() == "TypeError");
        CHECK(std::string{failure.what()}.find("'b'") != std::string::npos);
    }

    try {
        (void)args.get<int>("name");
        FAIL("string accepted as int");
    } catch (const Failure& failure) {
        CHECK(failure.type() == "TypeError");
    }
}

TEST_CASE("payloads are stored as given, never wrapped in an array", "[value]") {
    const Value five(json(5), "int");
    CHECK(five.data().is_number_integer());
    CHECK(five.data() == 5);

    const Value record(json{{"id", 1}}, "User");
    CHECK(record.data().is_object());

    CHECK(Failure("E", "msg").code().is_null());
    CHECK(Failure("E", "msg", 409).code() == 409);

    const Arguments args(json{{"a", 2}, {"b", 3}});
    CHECK(args.raw().is_object());
    CHECK(args.get<int>("a") + args.get<int>("b") == 5);
    CHECK_NOTHROW(Arguments(json(nullptr)));
    CHECK_THROWS_AS(Arguments(json::array({1, 2})), Failure);
}
