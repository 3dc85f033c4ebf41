/**
 * @file test_orchestrator.cpp
 * @brief Tests for running whole IR documents.
 *
 * Scope:
 *  - top-level tests run before suites, suites in declaration order
 *  - suite-relative targets (`.method`) and their error without a suite target
 *  - lifecycle notifications only for adapters that listen
 *  - end to end through the in-process adapter, including per-suite receivers
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/ir_loader.hpp"
#include "babel_testing/native_adapter.hpp"
#include "babel_testing/orchestrator.hpp"
#include "example_modules.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace babel::testing;

namespace {

/// Passes every test and records what it saw.
class RecordingAdapter : public Adapter, public LifecycleListener {
public:
    TestResult run_test(const TestSpec& test) override {
        events.push_back("run " + test.target);
        TestResult result;
        result.test = test;
        result.status = ResultStatus::Passed;
        return result;
    }

    void on_suite_start(const std::string& name) override { events.push_back("suite_start " + name); }
    void on_suite_end(const std::string& name) override { events.push_back("suite_end " + name); }
    void on_test_start(const std::string& name) override { events.push_back("test_start " + name); }
    void on_test_end(const std::string& name) override { events.push_back("test_end " + name); }

    std::vector<std::string> events;
};

/// No lifecycle capability.
class PlainAdapter : public Adapter {
public:
    TestResult run_test(const TestSpec& test) override {
        ++runs;
        TestResult result;
        result.test = test;
        result.status = ResultStatus::Passed;
        return result;
    }

    int runs{0};
};

TestSpec spec(std::string target, std::optional<std::string> description = {}) {
    TestSpec test;
    test.target = std::move(target);
    test.description = std::move(description);
    return test;
}

}  // namespace

TEST_CASE("relative targets are prefixed with the suite target", "[orchestrator]") {
    IrDocument document;
    document.tests.push_back(spec("example.math.add"));
    document.suites.push_back(SuiteSpec{"users", std::string{"example.services.UserService"},
                                        {spec(".getById", std::string{"finds Alice"}), spec("example.math.add")}});

    RecordingAdapter adapter;
    const auto results = Orchestrator(adapter).run(document);

    REQUIRE(results.size() == 3);
    CHECK(results[1].test.target == "example.services.UserService.getById");
    CHECK(adapter.events == std::vector<std::string>{
                                "test_start example.math.add",
                                "run example.math.add",
                                "test_end example.math.add",
                                "suite_start users",
                                "test_start finds Alice",
                                "run example.services.UserService.getById",
                                "test_end finds Alice",
                                "test_start example.math.add",
                                "run example.math.add",
                                "test_end example.math.add",
                                "suite_end users",
                            });
}

TEST_CASE("relative targets without a suite target are errors", "[orchestrator]") {
    IrDocument document;
    document.suites.push_back(SuiteSpec{"loose", std::nullopt, {spec(".getById"), spec("example.math.add")}});

    RecordingAdapter adapter;
    const auto results = Orchestrator(adapter).run(document);

    REQUIRE(results.size() == 2);
    CHECK(results[0].status == ResultStatus::Error);
    CHECK(results[0].message == std::optional<std::string>{"Relative target '.getById' but suite has no default target"});
    CHECK(results[1].status == ResultStatus::Passed);
    // The erroring test never reached the adapter.
    CHECK(std::count(adapter.events.begin(), adapter.events.end(), "run example.math.add") == 1);
    CHECK(adapter.events.size() == 5);
}

TEST_CASE("adapters without lifecycle support still run every test", "[orchestrator]") {
    IrDocument document;
    document.tests.push_back(spec("a.b"));
    document.suites.push_back(SuiteSpec{"s", std::string{"a.T"}, {spec(".m"), spec(".n")}});

    PlainAdapter adapter;
    CHECK(Orchestrator(adapter).run(document).size() == 3);
    CHECK(adapter.runs == 3);
}

TEST_CASE("a document runs end to end in process", "[orchestrator][native]") {
    Registry registry;
    examples::register_examples(registry);

    const auto document = IrLoader{}.parse(json::parse(R"({
        "tests": [
            {"target": "example.math.add", "given": {"a": 2, "b": 3}, "expect": {"type": "exact", "value": 5}},
            {"target": "example.math.divide", "given": {"a": 1, "b": 0},
             "throws": {"type": "invalid_argument", "message": "zero"}}
        ],
        "suites": [
            {"name": "counter", "target": "example.services.Counter", "tests": [
                {"target": ".increment", "expect": {"value": 1}},
                {"target": ".increment", "expect": {"value": 2}}
            ]},
            {"name": "counter again", "target": "example.services.Counter", "tests": [
                {"target": ".increment", "expect": {"value": 1}}
            ]},
            {"name": "users", "target": "example.services.UserService", "tests": [
                {"target": ".getById", "given": {"id": 1},
                 "expect": {"type": "contains", "value": {"profile": {"city": "Lisbon"}}}},
                {"target": ".getById", "given": {"id": 5}, "throws": {"type": "NotFound"}}
            ]}
        ]
    })"));

    NativeAdapter adapter(registry, NativeAdapter::Config{InstanceLifecycle::PerSuite});
    const auto results = Orchestrator(adapter).run(document);

    REQUIRE(results.size() == 7);
    for (const auto& result : results) {
        INFO(result.test.target << ": " << result.message.value_or(""));
        CHECK(result.status == ResultStatus::Passed);
    }
}
