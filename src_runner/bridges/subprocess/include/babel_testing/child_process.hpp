#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace babel::testing {

/**
 * \brief Long-lived child process with line-oriented pipes (POSIX fork/execvp).
 *
 * stdin and stdout are always piped; stderr is piped unless `pipe_stderr` is false, in
 * which case it is inherited so runtime diagnostics show up live. SIGPIPE is ignored
 * process-wide so writes to a dead child fail with EPIPE instead of killing the runner.
 */
class ChildProcess {
public:
    struct Options {
        std::vector<std::string> argv;
        std::filesystem::path working_dir{};
        bool pipe_stderr{true};
    };

    /// \throws ProtocolError when pipes cannot be created or fork fails.
    explicit ChildProcess(Options options);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// False once the child has exited (reaps it).
    [[nodiscard]] bool running();

    /// Writes `line` plus a newline. \throws ProtocolError when the child is gone.
    void write_line(const std::string& line);

    /// Next complete line from stdout; nullopt on end of stream (including EOF mid-line).
    /// \throws ProtocolError when nothing arrives within `timeout`.
    [[nodiscard]] std::optional<std::string> read_line(std::chrono::milliseconds timeout);

    /// Returns and clears everything collected from stderr so far.
    [[nodiscard]] std::string drain_stderr();

    void close_stdin() noexcept;
    void terminate() noexcept;
    void kill() noexcept;

    /// Exit status once the child exited within `timeout`, nullopt otherwise.
    [[nodiscard]] std::optional<int> wait_for(std::chrono::milliseconds timeout);

private:
    void collect_stderr() noexcept;
    void close_all() noexcept;

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    bool reaped_{false};
    int exit_status_{0};
    std::string stdout_buffer_;
    std::string stderr_text_;
};

/**
 * \brief Result of a command run to completion (build steps).
 */
struct CommandResult {
    int exit_code{-1};
    std::string output;  ///< stdout and stderr interleaved
};

/// Runs `argv` in `working_dir` and waits for it. \throws ProtocolError when it cannot be started.
[[nodiscard]] CommandResult run_command(const std::vector<std::string>& argv,
                                        const std::filesystem::path& working_dir = {});

}  // namespace babel::testing
