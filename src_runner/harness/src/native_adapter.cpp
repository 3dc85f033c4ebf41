#include "babel_testing/native_adapter.hpp"

#include "babel_testing/failure.hpp"
#include "babel_testing/invoker.hpp"
#include "babel_testing/matcher.hpp"
#include "babel_testing/mock_installer.hpp"
#include "babel_testing/output_capture.hpp"
#include "babel_testing/spy_recorder.hpp"

#include <chrono>
#include <iostream>

namespace {

using namespace babel::testing;

class Stopwatch {
public:
    Stopwatch() : start_{std::chrono::steady_clock::now()} {}

    [[nodiscard]] double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace

namespace babel::testing {

NativeAdapter::NativeAdapter(Registry& registry, Config config)
    : registry_{registry},
      config_{std::move(config)},
      instances_{registry, InstanceRegistry::Config{config_.lifecycle, config_.factories, config_.debug}},
      resolver_{registry, instances_} {}

TestResult NativeAdapter::run_test(const TestSpec& test) {
    const Stopwatch stopwatch;
    TestResult result;
    result.test = test;

    auto finish = [&](ResultStatus status, std::optional<std::string> message) {
        result.status = status;
        result.message = std::move(message);
        result.duration_ms = stopwatch.elapsed_ms();
        return result;
    };

    if (config_.debug) {
        std::cerr << "[DEBUG] Running " << test.target << "\n";
    }

    // Declaration order matters: spies wrap mocks and are restored first.
    MockScope mocks(registry_);
    try {
        mocks.install_all(test.mocks);
    } catch (const std::exception& ex) {
        return finish(ResultStatus::Error, std::string{"Failed to install mock: "} + ex.what());
    }

    SpyScope spies(registry_);
    if (test.mutates) {
        try {
            spies.install_all(*test.mutates);
        } catch (const std::exception& ex) {
            return finish(ResultStatus::Error, std::string{"Failed to install spy: "} + ex.what());
        }
    }

    const auto timeout_ms = test.timeout_ms ? test.timeout_ms : config_.default_timeout_ms;
    OutputCapture capture(config_.capture_output);
    capture.start();

    Value value;
    try {
        const Resolution resolution = resolver_.resolve(test.target);
        value = invoke(resolution.binding->get(), resolution.receiver, test.given, timeout_ms);
    } catch (const HarnessError& ex) {
        result.output = capture.stop();
        return finish(ResultStatus::Error, std::string{ex.what()});
    } catch (const InvocationTimeout& ex) {
        result.output = capture.stop();
        return finish(ResultStatus::Failed, "Test timed out after " + std::to_string(ex.timeout_ms()) + "ms");
    } catch (...) {
        result.output = capture.stop();
        result.failure = describe_failure(std::current_exception());
        const auto& raised = *result.failure;
        if (config_.debug) {
            std::cerr << "[DEBUG] " << test.target << " raised " << raised.type << ": " << raised.message << "\n";
        }
        if (!test.throws) {
            return finish(ResultStatus::Error, raised.type + ": " + raised.message);
        }
        const auto match = matches_failure(raised, *test.throws);
        if (!match.passed) {
            return finish(ResultStatus::Failed, match.message);
        }
        if (test.mutates) {
            const auto verified = spies.verify(*test.mutates);
            if (!verified.passed) {
                return finish(ResultStatus::Failed, verified.message);
            }
        }
        return finish(ResultStatus::Passed, std::nullopt);
    }
    result.output = capture.stop();
    result.actual_value = value.data();

    if (test.throws) {
        return finish(ResultStatus::Failed,
                      "Expected exception " + test.throws->type.value_or("(any)") + " but call succeeded");
    }

    if (test.expect) {
        result.expected_value = test.expect->value;
        const auto match = matches(value, *test.expect);
        if (!match.passed) {
            return finish(ResultStatus::Failed, match.message);
        }
    }

    if (test.mutates) {
        const auto verified = spies.verify(*test.mutates);
        if (!verified.passed) {
            return finish(ResultStatus::Failed, verified.message);
        }
    }
    return finish(ResultStatus::Passed, std::nullopt);
}

void NativeAdapter::on_suite_start(const std::string& suite_name) {
    if (config_.debug) {
        std::cerr << "[DEBUG] Suite start: " << suite_name << "\n";
    }
    instances_.on_suite_start();
}

void NativeAdapter::on_suite_end(const std::string& suite_name) {
    if (config_.debug) {
        std::cerr << "[DEBUG] Suite end: " << suite_name << "\n";
    }
}

void NativeAdapter::on_test_start(const std::string& test_name) {
    if (config_.debug) {
        std::cerr << "[DEBUG] Test start: " << test_name << "\n";
    }
    instances_.on_test_start();
}

void NativeAdapter::on_test_end(const std::string& test_name) {
    if (config_.debug) {
        std::cerr << "[DEBUG] Test end: " << test_name << "\n";
    }
}

}  // namespace babel::testing
