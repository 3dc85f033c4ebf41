#pragma once

#include "adapter.hpp"
#include "instance_registry.hpp"
#include "registry.hpp"
#include "resolver.hpp"

#include <optional>
#include <string>

namespace babel::testing {

/**
 * \brief Runs tests against targets registered in this process.
 *
 * Per test: install mocks, install spies, resolve, invoke (bounded by the test or default
 * timeout), then match `throws` (which takes precedence) or `expect`, then verify spies.
 */
class NativeAdapter : public Adapter, public LifecycleListener {
public:
    struct Config {
        InstanceLifecycle lifecycle{InstanceLifecycle::Shared};
        std::string factories{"babel/factories"};
        std::optional<long> default_timeout_ms{};
        bool capture_output{false};
        bool debug{false};
    };

    NativeAdapter(Registry& registry, Config config);

    [[nodiscard]] TestResult run_test(const TestSpec& test) override;

    void on_suite_start(const std::string& suite_name) override;
    void on_suite_end(const std::string& suite_name) override;
    void on_test_start(const std::string& test_name) override;
    void on_test_end(const std::string& test_name) override;

    /// Drops cached receivers regardless of lifecycle.
    void clear_cache() noexcept { instances_.clear(); }

    [[nodiscard]] InstanceRegistry& instances() noexcept { return instances_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Registry& registry_;
    Config config_;
    InstanceRegistry instances_;
    Resolver resolver_;
};

}  // namespace babel::testing
