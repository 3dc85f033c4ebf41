#pragma once

#include "instance_registry.hpp"
#include "ir.hpp"
#include "native_adapter.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Runner configuration, read from `babeltest.json` or `.babeltest.json`.
 *
 * \code{.json}
 * {
 *   "version": "0.1",
 *   "adapters": {
 *     "native":     { "factories": "babel/factories", "instance_lifecycle": "per_suite",
 *                     "capture_output": true, "timeout_ms": 2000, "debug_mode": false },
 *     "subprocess": { "command": ["./build/example_runtime"], "build_command": ["make", "runtime"],
 *                     "factories": "babel/factories", "read_timeout_ms": 30000, "debug_mode": false }
 *   },
 *   "test_paths": ["babel/tests"]
 * }
 * \endcode
 */
struct RunnerConfig {
    struct Native {
        std::string factories{"babel/factories"};
        InstanceLifecycle instance_lifecycle{InstanceLifecycle::Shared};
        bool capture_output{false};
        std::optional<long> timeout_ms{};
        bool debug_mode{false};
    };

    struct Subprocess {
        std::vector<std::string> command;
        std::vector<std::string> build_command;
        std::string factories{"babel/factories"};
        long read_timeout_ms{30000};
        bool debug_mode{false};
        json extra = json::object();  ///< forwarded verbatim inside the runtime's `config`
    };

    std::string version{"0.1"};
    Native native;
    Subprocess subprocess;
    std::vector<std::string> test_paths{"babel/tests"};
    std::filesystem::path source;  ///< file the values came from; empty for defaults
};

/// Loads `explicit_path` when given (it must exist), else the first config file found under
/// `project_root`. No file yields defaults.
/// \throws std::runtime_error on unreadable files or invalid values.
[[nodiscard]] RunnerConfig load_config(const std::filesystem::path& project_root,
                                       const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

/// \throws std::runtime_error naming `origin` and the offending key.
[[nodiscard]] RunnerConfig parse_config(const json& document, const std::string& origin = "<memory>");

[[nodiscard]] NativeAdapter::Config native_adapter_config(const RunnerConfig& config);

}  // namespace babel::testing
