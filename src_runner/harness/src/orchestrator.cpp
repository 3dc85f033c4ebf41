#include "babel_testing/orchestrator.hpp"

namespace babel::testing {

bool is_relative_target(const std::string& target) noexcept {
    return !target.empty() && target.front() == '.';
}

Orchestrator::Orchestrator(Adapter& adapter)
    : adapter_{adapter}, listener_{dynamic_cast<LifecycleListener*>(&adapter)} {}

TestResult Orchestrator::run_one(const TestSpec& test) {
    const auto name = test.display_name();
    if (listener_ != nullptr) listener_->on_test_start(name);
    TestResult result = adapter_.run_test(test);
    if (listener_ != nullptr) listener_->on_test_end(name);
    return result;
}

std::vector<TestResult> Orchestrator::run(const IrDocument& document) {
    std::vector<TestResult> results;

    for (const auto& test : document.tests) {
        results.push_back(run_one(test));
    }

    for (const auto& suite : document.suites) {
        if (listener_ != nullptr) listener_->on_suite_start(suite.name);

        for (const auto& declared : suite.tests) {
            if (!is_relative_target(declared.target)) {
                results.push_back(run_one(declared));
                continue;
            }
            if (!suite.target || suite.target->empty()) {
                TestResult error;
                error.test = declared;
                error.status = ResultStatus::Error;
                error.message = "Relative target '" + declared.target + "' but suite has no default target";
                results.push_back(std::move(error));
                continue;
            }

            TestSpec test = declared;
            test.target = *suite.target + declared.target;
            results.push_back(run_one(test));
        }

        if (listener_ != nullptr) listener_->on_suite_end(suite.name);
    }
    return results;
}

}  // namespace babel::testing
