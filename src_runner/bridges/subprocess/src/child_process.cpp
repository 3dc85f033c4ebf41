#include "babel_testing/child_process.hpp"

#include "babel_testing/failure.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void ignore_sigpipe() {
    static const bool installed = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)installed;
}

std::vector<char*> to_c_argv(const std::vector<std::string>& argv) {
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);
    return c_args;
}

/// Child side after fork: never returns.
[[noreturn]] void exec_child(const std::vector<char*>& c_args, const std::filesystem::path& working_dir) {
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
        const std::string message = "chdir failed: " + std::string{std::strerror(errno)} + "\n";
        (void)!::write(STDERR_FILENO, message.data(), message.size());
        ::_exit(127);
    }
    ::execvp(c_args[0], c_args.data());
    const std::string message =
        "execvp " + std::string{c_args[0]} + " failed: " + std::string{std::strerror(errno)} + "\n";
    (void)!::write(STDERR_FILENO, message.data(), message.size());
    ::_exit(127);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}  // namespace

namespace babel::testing {

ChildProcess::ChildProcess(Options options) {
    if (options.argv.empty()) {
        throw ProtocolError("No runtime command configured");
    }
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(in_pipe) != 0 || ::pipe(out_pipe) != 0 || (options.pipe_stderr && ::pipe(err_pipe) != 0)) {
        const std::string reason = std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) {
            close_fd(*fd);
        }
        throw ProtocolError("Failed to create pipes: " + reason);
    }

    const auto c_args = to_c_argv(options.argv);
    pid_ = ::fork();
    if (pid_ < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) {
            close_fd(*fd);
        }
        throw ProtocolError("Failed to fork runtime: " + reason);
    }

    if (pid_ == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        if (options.pipe_stderr) {
            ::dup2(err_pipe[1], STDERR_FILENO);
        }
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
        exec_child(c_args, options.working_dir);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    ::fcntl(stdin_fd_, F_SETFD, FD_CLOEXEC);
    ::fcntl(stdout_fd_, F_SETFD, FD_CLOEXEC);
    if (stderr_fd_ >= 0) {
        ::fcntl(stderr_fd_, F_SETFD, FD_CLOEXEC);
        ::fcntl(stderr_fd_, F_SETFL, O_NONBLOCK);
    }
}

ChildProcess::~ChildProcess() {
    if (running()) {
        kill();
        (void)wait_for(std::chrono::milliseconds(1000));
    }
    close_all();
}

bool ChildProcess::running() {
    if (pid_ <= 0 || reaped_) {
        return false;
    }
    int status = 0;
    const pid_t ret = ::waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_status_ = decode_status(status);
        return false;
    }
    return ret == 0;
}

void ChildProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        throw ProtocolError("Runtime stdin is closed");
    }
    std::string framed = line;
    framed.push_back('\n');

    std::size_t written = 0;
    while (written < framed.size()) {
        const ssize_t n = ::write(stdin_fd_, framed.data() + written, framed.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ProtocolError("Failed to write to runtime: " + std::string{std::strerror(errno)});
        }
        written += static_cast<std::size_t>(n);
    }
}

std::optional<std::string> ChildProcess::read_line(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    for (;;) {
        if (const auto newline = stdout_buffer_.find('\n'); newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            return line;
        }
        if (stdout_fd_ < 0) {
            return std::nullopt;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw ProtocolError("Timed out after " + std::to_string(timeout.count()) +
                                "ms waiting for runtime response");
        }

        pollfd fds[2] = {{stdout_fd_, POLLIN, 0}, {stderr_fd_, POLLIN, 0}};
        const nfds_t count = stderr_fd_ >= 0 ? 2 : 1;
        const int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ProtocolError("poll failed: " + std::string{std::strerror(errno)});
        }
        if (count == 2 && (fds[1].revents & (POLLIN | POLLHUP)) != 0) {
            collect_stderr();
        }
        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            char buffer[4096];
            const ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                // End of stream: a partial line is an incomplete response.
                close_fd(stdout_fd_);
                stdout_buffer_.clear();
                return std::nullopt;
            }
            stdout_buffer_.append(buffer, static_cast<std::size_t>(n));
        }
    }
}

void ChildProcess::collect_stderr() noexcept {
    if (stderr_fd_ < 0) return;
    char buffer[4096];
    for (;;) {
        const ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            stderr_text_.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(stderr_fd_);
        }
        return;
    }
}

std::string ChildProcess::drain_stderr() {
    collect_stderr();
    std::string text;
    text.swap(stderr_text_);
    return text;
}

void ChildProcess::close_stdin() noexcept {
    close_fd(stdin_fd_);
}

void ChildProcess::terminate() noexcept {
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGTERM);
    }
}

void ChildProcess::kill() noexcept {
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGKILL);
    }
}

std::optional<int> ChildProcess::wait_for(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (running()) {
        if (Clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (!reaped_) {
        return std::nullopt;
    }
    return exit_status_;
}

void ChildProcess::close_all() noexcept {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

CommandResult run_command(const std::vector<std::string>& argv, const std::filesystem::path& working_dir) {
    if (argv.empty()) {
        throw ProtocolError("Empty command");
    }

    int out_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        throw ProtocolError("Failed to create pipe: " + std::string{std::strerror(errno)});
    }

    const auto c_args = to_c_argv(argv);
    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw ProtocolError("Failed to fork: " + reason);
    }
    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        exec_child(c_args, working_dir);
    }

    close_fd(out_pipe[1]);
    CommandResult result;
    char buffer[4096];
    for (;;) {
        const ssize_t n = ::read(out_pipe[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buffer, static_cast<std::size_t>(n));
    }
    close_fd(out_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exit_code = decode_status(status);
    return result;
}

}  // namespace babel::testing
