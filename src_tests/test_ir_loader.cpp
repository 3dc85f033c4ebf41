/**
 * @file test_ir_loader.cpp
 * @brief Tests for reading persisted IR documents.
 *
 * Scope:
 *  - full documents with suites, top-level tests, mocks, mutates and throws blocks
 *  - defaults for absent optional fields
 *  - rejection of documents that do not map onto the model, with the file named in the error
 *  - directory trees of documents
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/ir_loader.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>

using namespace babel::testing;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

bool message_contains(const std::function<void()>& fn, const std::string& text) {
    try {
        fn();
    } catch (const std::runtime_error& ex) {
        return std::string{ex.what()}.find(text) != std::string::npos;
    }
    return false;
}

}  // namespace

TEST_CASE("a complete document is loaded", "[ir]") {
    const auto path = write_temp("babel_ir_complete.json", R"({
        "version": "0.1",
        "suites": [{
            "name": "users",
            "target": "example.services.UserService",
            "tests": [{
                "target": ".getById",
                "description": "finds Alice",
                "given": {"id": 1},
                "types": {"id": "int"},
                "expect": {"type": "contains", "value": {"name": "Alice"}},
                "timeout_ms": 500
            }, {
                "target": ".getById",
                "given": {"id": 9},
                "throws": {"type": "NotFound", "message": "not found", "code": 404}
            }]
        }],
        "tests": [{
            "target": "shop.checkout.CheckoutService.checkout",
            "given": {"amount": 10},
            "mocks": [{"target": "payments.gateway.charge", "returns": {"status": "approved"}},
                      {"target": "payments.gateway.refund", "given": {"amount": 1},
                       "throws": {"type": "PaymentDeclined"}}],
            "mutates": {"called": [{"target": "shop.notifications.send", "times": 1},
                                   {"target": "payments.gateway.charge", "with_args": {"amount": 10}}]}
        }]
    })");

    const auto document = IrLoader{}.load(path);
    REQUIRE(document.suites.size() == 1);
    REQUIRE(document.tests.size() == 1);

    const auto& suite = document.suites[0];
    CHECK(suite.name == "users");
    CHECK(suite.target == std::optional<std::string>{"example.services.UserService"});
    REQUIRE(suite.tests.size() == 2);

    const auto& finds = suite.tests[0];
    CHECK(finds.display_name() == "finds Alice");
    CHECK(finds.types.at("id") == "int");
    REQUIRE(finds.expect);
    CHECK(finds.expect->type == ExpectationType::Contains);
    CHECK(finds.timeout_ms == 500L);

    const auto& missing = suite.tests[1];
    CHECK(missing.display_name() == ".getById");
    REQUIRE(missing.throws);
    CHECK(missing.throws->type == std::optional<std::string>{"NotFound"});
    CHECK(missing.throws->code == 404);

    const auto& checkout = document.tests[0];
    REQUIRE(checkout.mocks.size() == 2);
    CHECK(checkout.mocks[0].given == "any");
    CHECK(checkout.mocks[0].returns == json({{"status", "approved"}}));
    CHECK(checkout.mocks[1].given == json({{"amount", 1}}));
    REQUIRE(checkout.mocks[1].throws);
    CHECK_FALSE(checkout.mocks[1].throws->message.has_value());
    REQUIRE(checkout.mutates);
    REQUIRE(checkout.mutates->called.size() == 2);
    CHECK(checkout.mutates->called[0].times == 1);
    CHECK_FALSE(checkout.mutates->called[1].times.has_value());
}

TEST_CASE("absent optional fields take their defaults", "[ir]") {
    const auto document = IrLoader{}.parse(json{{"tests", {{{"target", "example.math.nothing"}}}}});

    CHECK(document.version == "0.1");
    CHECK(document.suites.empty());
    REQUIRE(document.tests.size() == 1);
    const auto& test = document.tests[0];
    CHECK(test.given == json::object());
    CHECK_FALSE(test.expect.has_value());
    CHECK_FALSE(test.throws.has_value());
    CHECK(test.mocks.empty());
    CHECK_FALSE(test.timeout_ms.has_value());
}

TEST_CASE("expectations without a type are exact", "[ir]") {
    const auto document = IrLoader{}.parse(
        json{{"tests", {{{"target", "example.math.add"}, {"expect", {{"value", 5}}}}}}});
    REQUIRE(document.tests[0].expect);
    CHECK(document.tests[0].expect->type == ExpectationType::Exact);
}

TEST_CASE("malformed documents are rejected with their origin", "[ir]") {
    const IrLoader loader;

    CHECK(message_contains([&] { (void)loader.parse(json{{"tests", {{{"given", json::object()}}}}}, "doc.json"); },
                           "Invalid IR in doc.json"));
    CHECK(message_contains(
        [&] {
            (void)loader.parse(json{{"tests", {{{"target", "a.b"}, {"expect", {{"type", "roughly"}}}}}}});
        },
        "unknown expectation type 'roughly'"));
    CHECK(message_contains(
        [&] { (void)loader.parse(json{{"tests", {{{"target", "a.b"}, {"timeout_ms", 0}}}}}); },
        "'timeout_ms' must be a positive integer"));
    CHECK(message_contains(
        [&] { (void)loader.parse(json{{"tests", {{{"target", "a.b"}, {"given", {1, 2}}}}}}); },
        "'given' must be an object"));
    CHECK(message_contains(
        [&] {
            (void)loader.parse(json{{"tests",
                                     {{{"target", "a.b"}, {"mutates", {{"called", {{{"target", "x.y"}, {"times", -1}}}}}}}}}});
        },
        "'times' must be a non-negative integer"));
}

TEST_CASE("unreadable files are reported", "[ir]") {
    const IrLoader loader;
    CHECK(message_contains([&] { (void)loader.load("/nonexistent/babel_ir.json"); }, "IR file does not exist"));

    const auto broken = write_temp("babel_ir_broken.json", "{\"tests\": [");
    CHECK(message_contains([&] { (void)loader.load(broken); }, "Malformed JSON in"));
}

TEST_CASE("directories yield every JSON document below them in path order", "[ir]") {
    const auto root = std::filesystem::temp_directory_path() / "babel_ir_tree";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "nested");

    std::ofstream(root / "b.json") << R"({"tests": [{"target": "b.second"}]})";
    std::ofstream(root / "a.json") << R"({"tests": [{"target": "a.first"}]})";
    std::ofstream(root / "nested" / "c.json") << R"({"tests": [{"target": "c.third"}]})";
    std::ofstream(root / "notes.txt") << "not an IR document";

    const IrLoader loader;
    const auto documents = loader.load_directory(root);
    REQUIRE(documents.size() == 3);
    CHECK(documents[0].tests[0].target == "a.first");
    CHECK(documents[1].tests[0].target == "b.second");
    CHECK(documents[2].tests[0].target == "c.third");

    CHECK(loader.load_directory(root / "a.json").size() == 1);
    CHECK(message_contains([&] { (void)loader.load_directory(root / "missing"); }, "IR path does not exist"));
}
