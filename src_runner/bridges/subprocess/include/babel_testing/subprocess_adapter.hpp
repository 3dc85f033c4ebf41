#pragma once

#include "babel_testing/adapter.hpp"
#include "babel_testing/child_process.hpp"
#include "babel_testing/config.hpp"
#include "babel_testing/ir.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Drives a runtime for another language as a child process.
 *
 * Transport is newline-delimited JSON over the child's stdin/stdout, one command at a time:
 * - `{"action":"run","test":{...}}` answered by a structured result;
 * - `{"action":"lifecycle","lifecycle":"suite_start","data":{"name":...}}` (best-effort);
 * - `{"action":"exit"}` on shutdown.
 *
 * The child starts on the first command and is restarted if it died; the first command
 * sent to every new child carries the `config` block.
 */
class SubprocessAdapter : public Adapter, public LifecycleListener {
public:
    struct Config {
        std::vector<std::string> command;        ///< runtime argv
        std::vector<std::string> build_command;  ///< optional, run once before the first start
        std::filesystem::path project_root{"."};
        std::string factories{"babel/factories"};
        bool debug{false};
        long read_timeout_ms{30000};
        long shutdown_grace_ms{5000};
        json extra = json::object();  ///< merged into the `config` block
        std::string label{"runtime"};  ///< prefix of adapter error messages
    };

    /// Runs the build step, if any. \throws AdapterStartError when it fails.
    explicit SubprocessAdapter(Config config);
    ~SubprocessAdapter() override;

    SubprocessAdapter(const SubprocessAdapter&) = delete;
    SubprocessAdapter& operator=(const SubprocessAdapter&) = delete;

    [[nodiscard]] TestResult run_test(const TestSpec& test) override;

    void on_suite_start(const std::string& suite_name) override;
    void on_suite_end(const std::string& suite_name) override;
    void on_test_start(const std::string& test_name) override;
    void on_test_end(const std::string& test_name) override;

    /// Asks the runtime for a cache clear (best-effort).
    void clear_cache();

    /// exit command, SIGTERM, bounded wait, SIGKILL. Idempotent.
    void shutdown() override;

    /// Sends one command and returns the parsed response.
    /// \throws ProtocolError on a dead child, EOF, read timeout or malformed JSON.
    [[nodiscard]] json send_command(json command);

    /// Number of child processes started so far.
    [[nodiscard]] int starts() const noexcept { return starts_; }

private:
    void build();
    ChildProcess& ensure_started();
    /// Kills and forgets a child whose stream can no longer be trusted.
    void discard_process() noexcept;
    void send_lifecycle(const char* event, const std::string& name);
    [[nodiscard]] json config_block() const;
    [[nodiscard]] TestResult to_result(const TestSpec& test, const json& response, double elapsed_ms) const;

    Config config_;
    std::unique_ptr<ChildProcess> process_;
    bool config_sent_{false};
    int starts_{0};
};

/// Adapter settings from the `adapters.subprocess` section of the runner configuration.
[[nodiscard]] SubprocessAdapter::Config subprocess_adapter_config(const RunnerConfig& config,
                                                                  const std::filesystem::path& project_root);

}  // namespace babel::testing
