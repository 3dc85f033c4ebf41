/**
 * @file test_native_adapter.cpp
 * @brief Tests for the per-test flow of the in-process adapter.
 *
 * Scope:
 *  - PASSED / FAILED / ERROR classification of returned values, raised failures and timeouts
 *  - throws taking precedence over expect
 *  - mocks and spies scoped to one test, including a failing test
 *  - captured output attached to results, also after a timed-out worker printed late
 *  - the basic call path: keyword arguments reach the target and its value is matched
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/native_adapter.hpp"
#include "example_modules.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace babel::testing;

namespace {

Registry& with_examples(Registry& registry) {
    examples::register_examples(registry);
    return registry;
}

struct Fixture {
    explicit Fixture(NativeAdapter::Config config = {}) : adapter{with_examples(registry), std::move(config)} {}

    TestResult run(const json& test) { return adapter.run_test(test.get<TestSpec>()); }

    Registry registry;
    NativeAdapter adapter;
};

}  // namespace

TEST_CASE("returned values are matched against expect", "[native]") {
    Fixture f;

    const auto passed = f.run({{"target", "example.math.add"}, {"given", {{"a", 2}, {"b", 3}}},
                               {"expect", {{"type", "exact"}, {"value", 5}}}});
    CHECK(passed.status == ResultStatus::Passed);
    CHECK(passed.actual_value == 5);
    CHECK(passed.expected_value == 5);
    CHECK_FALSE(passed.message.has_value());

    const auto failed = f.run({{"target", "example.math.add"}, {"given", {{"a", 2}, {"b", 2}}},
                               {"expect", {{"type", "exact"}, {"value", 5}}}});
    CHECK(failed.status == ResultStatus::Failed);
    CHECK(failed.message == std::optional<std::string>{"Expected 5, got 4"});
    CHECK(failed.actual_value == 4);

    // No expect at all: returning is enough.
    CHECK(f.run({{"target", "example.math.nothing"}}).status == ResultStatus::Passed);
}

TEST_CASE("record results keep their type name for type expectations", "[native]") {
    Fixture f;
    const auto result = f.run({{"target", "example.services.UserService.getById"}, {"given", {{"id", 2}}},
                               {"expect", {{"type", "type"}, {"value", "User"}}}});
    CHECK(result.status == ResultStatus::Passed);
}

TEST_CASE("unexpected failures are errors with type and message", "[native]") {
    Fixture f;
    const auto result = f.run({{"target", "example.math.validate"}, {"given", {{"age", -1}}},
                               {"expect", {{"value", 1}}}});
    CHECK(result.status == ResultStatus::Error);
    CHECK(result.message == std::optional<std::string>{"ValidationError: age must not be negative"});
    REQUIRE(result.failure);
    CHECK(result.failure->code == 422);
}

TEST_CASE("throws takes precedence over expect", "[native]") {
    Fixture f;

    SECTION("raised and matched") {
        const auto result = f.run({{"target", "example.math.validate"},
                                   {"given", {{"age", -1}}},
                                   {"expect", {{"value", 99}}},
                                   {"throws", {{"type", "ValidationError"}, {"code", 422}}}});
        CHECK(result.status == ResultStatus::Passed);
    }

    SECTION("raised the wrong type") {
        const auto result = f.run({{"target", "example.math.validate"},
                                   {"given", {{"age", -1}}},
                                   {"throws", {{"type", "NotFound"}}}});
        CHECK(result.status == ResultStatus::Failed);
        CHECK(result.message == std::optional<std::string>{"Expected NotFound, got ValidationError"});
    }

    SECTION("returned instead") {
        const auto result = f.run({{"target", "example.math.validate"},
                                   {"given", {{"age", 3}}},
                                   {"expect", {{"value", 3}}},
                                   {"throws", {{"type", "ValidationError"}}}});
        CHECK(result.status == ResultStatus::Failed);
        CHECK(result.message == std::optional<std::string>{"Expected exception ValidationError but call succeeded"});
    }
}

TEST_CASE("resolution problems are errors carrying the trail", "[native]") {
    Fixture f;
    const auto result = f.run({{"target", "example.math.subtract"}});
    CHECK(result.status == ResultStatus::Error);
    REQUIRE(result.message);
    CHECK(result.message->rfind("Module example.math has no function 'subtract'", 0) == 0);
    CHECK(result.message->find("Suggestions:") != std::string::npos);
}

TEST_CASE("timeouts fail the test", "[native]") {
    SECTION("per-test timeout") {
        Fixture f;
        const auto result = f.run({{"target", "example.async.fetch_after"}, {"given", {{"delay_ms", 100}}},
                                   {"timeout_ms", 10}});
        CHECK(result.status == ResultStatus::Failed);
        CHECK(result.message == std::optional<std::string>{"Test timed out after 10ms"});
    }

    SECTION("default timeout from the adapter") {
        NativeAdapter::Config config;
        config.default_timeout_ms = 10;
        Fixture f(config);
        const auto result = f.run({{"target", "example.math.sleep_ms"}, {"given", {{"ms", 100}}}});
        CHECK(result.status == ResultStatus::Failed);
        CHECK(result.message == std::optional<std::string>{"Test timed out after 10ms"});
    }
}

TEST_CASE("mocks apply to one test only, even when it fails", "[native][mocks]") {
    Fixture f;
    const json mocked = {{"target", "shop.checkout.CheckoutService.checkout"},
                         {"given", {{"amount", 10}}},
                         {"mocks", {{{"target", "payments.gateway.charge"},
                                     {"throws", {{"type", "PaymentDeclined"}, {"message", "card expired"}}}}}},
                         {"expect", {{"value", "never"}}}};

    const auto declined = f.run(mocked);
    CHECK(declined.status == ResultStatus::Error);
    CHECK(declined.message == std::optional<std::string>{"PaymentDeclined: card expired"});

    const auto real = f.run({{"target", "shop.checkout.CheckoutService.checkout"},
                             {"given", {{"amount", 10}}},
                             {"expect", {{"type", "contains"}, {"value", {{"status", "charged"}}}}}});
    CHECK(real.status == ResultStatus::Passed);
}

TEST_CASE("mock installation failures are errors", "[native][mocks]") {
    Fixture f;
    const auto result = f.run({{"target", "example.math.add"},
                               {"given", {{"a", 1}, {"b", 1}}},
                               {"mocks", {{{"target", "example.math.missing"}, {"returns", 1}}}}});
    CHECK(result.status == ResultStatus::Error);
    REQUIRE(result.message);
    CHECK(result.message->rfind("Failed to install mock: ", 0) == 0);
}

TEST_CASE("mutates assertions are verified after a passing match", "[native][spies]") {
    Fixture f;
    json test = {{"target", "shop.checkout.CheckoutService.checkout"},
                 {"given", {{"amount", 7}}},
                 {"mutates", {{"called", {{{"target", "shop.notifications.send"}, {"times", 1}}}}}}};
    CHECK(f.run(test).status == ResultStatus::Passed);

    test["mutates"]["called"][0]["times"] = 2;
    const auto result = f.run(test);
    CHECK(result.status == ResultStatus::Failed);
    CHECK(result.message ==
          std::optional<std::string>{
              "Expected shop.notifications.send to be called 2 time(s), but it was called 1 time(s)"});

    test["mutates"]["called"][0] = {{"target", "nowhere.fn"}};
    CHECK(f.run(test).message.value_or("").rfind("Failed to install spy: ", 0) == 0);
}

TEST_CASE("output written by the target is captured", "[native]") {
    NativeAdapter::Config config;
    config.capture_output = true;
    Fixture f(config);

    const auto result = f.run({{"target", "example.math.chatty"}, {"given", {{"text", "hi"}}}});
    CHECK(result.status == ResultStatus::Passed);
    REQUIRE(result.output.size() == 2);
    CHECK(result.output[0].stream == "stdout");
    CHECK(result.output[0].text == "out: hi\n");
    CHECK(result.output[1].stream == "stderr");
    CHECK(result.output[1].text == "err: hi\n");
}

TEST_CASE("a worker still printing after its timeout leaves later captures intact", "[native][timeout]") {
    NativeAdapter::Config config;
    config.capture_output = true;
    Fixture f(config);

    const auto late = f.run({{"target", "example.math.print_after"}, {"given", {{"ms", 50}, {"text", "late line"}}},
                             {"timeout_ms", 10}});
    CHECK(late.status == ResultStatus::Failed);
    CHECK(late.output.empty());

    // Let the abandoned worker write after its capture ended.
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    const auto next = f.run({{"target", "example.math.chatty"}, {"given", {{"text", "after"}}}});
    CHECK(next.status == ResultStatus::Passed);
    REQUIRE(next.output.size() == 2);
    CHECK(next.output[0].text == "out: after\n");
    CHECK(next.output[1].text == "err: after\n");
}

TEST_CASE("lifecycle notifications drive the receiver cache", "[native][lifecycle]") {
    NativeAdapter::Config config;
    config.lifecycle = InstanceLifecycle::PerTest;
    Fixture f(config);
    const json increment = {{"target", "example.services.Counter.increment"}, {"expect", {{"value", 1}}}};

    f.adapter.on_test_start("first");
    CHECK(f.run(increment).status == ResultStatus::Passed);
    f.adapter.on_test_start("second");
    CHECK(f.run(increment).status == ResultStatus::Passed);
    CHECK(f.adapter.instances().cached_instances() == 0);
}
