#pragma once

#include "babel_testing/ir.hpp"
#include "babel_testing/native_adapter.hpp"
#include "babel_testing/registry.hpp"

#include <iosfwd>
#include <memory>

namespace babel::testing {

/**
 * \brief Child side of the subprocess protocol for targets registered in a Registry.
 *
 * Reads one JSON command per line and answers each with exactly one JSON line:
 * - `run`: `{status, message, actual, expected, duration_ms, error?, output?}`
 * - `lifecycle` (`suite_start`, `suite_end`, `test_start`, `test_end`, `clear_cache`): `{status:"ok"}`
 * - `exit`: `{status:"ok", action:"exit"}`, then serve() returns
 * - anything unreadable: `{status:"error", message:"Runner error: ..."}`
 *
 * A `config` block on any command reconfigures the in-process adapter
 * (`factoriesPath`, `debug`, `lifecycle`, `captureOutput`, `timeoutMs`).
 */
class RuntimeHost {
public:
    explicit RuntimeHost(Registry& registry, NativeAdapter::Config defaults = {});

    /// Serves until `exit` or end of input. Returns the process exit code.
    int serve(std::istream& in, std::ostream& out);

    /// Serves the process's stdin and stdout. Responses go to a private duplicate of the
    /// original stdout; descriptor 1 itself is pointed at stderr, so target output written
    /// with printf or by a timed-out worker cannot reach the protocol stream.
    /// \throws std::runtime_error when the descriptors cannot be rearranged.
    int serve_stdio();

    /// Handles one decoded command.
    [[nodiscard]] json handle(const json& command);

    [[nodiscard]] bool exit_requested() const noexcept { return exit_requested_; }

private:
    void apply_config(const json& config);
    [[nodiscard]] json run(const json& test);
    [[nodiscard]] json lifecycle(const std::string& event, const json& data);
    NativeAdapter& adapter();

    Registry& registry_;
    NativeAdapter::Config config_;
    bool forward_output_{true};
    std::unique_ptr<NativeAdapter> adapter_;
    bool exit_requested_{false};
};

}  // namespace babel::testing
