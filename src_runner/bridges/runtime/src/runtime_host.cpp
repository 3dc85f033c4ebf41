#include "babel_testing/runtime_host.hpp"

#include "babel_testing/instance_registry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <streambuf>
#include <string>

#include <unistd.h>

namespace {

using babel::testing::json;

json error_response(const std::string& message) {
    return json{{"status", "error"}, {"message", "Runner error: " + message}};
}

/// Unbuffered output straight to a file descriptor.
class DescriptorBuffer : public std::streambuf {
public:
    explicit DescriptorBuffer(int fd) : fd_{fd} {}

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        const char c = traits_type::to_char_type(ch);
        return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
    }

    std::streamsize xsputn(const char* data, std::streamsize size) override {
        std::streamsize written = 0;
        while (written < size) {
            const ssize_t n = ::write(fd_, data + written, static_cast<std::size_t>(size - written));
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            written += n;
        }
        return written;
    }

private:
    int fd_;
};

}  // namespace

namespace babel::testing {

RuntimeHost::RuntimeHost(Registry& registry, NativeAdapter::Config defaults)
    : registry_{registry}, config_{std::move(defaults)} {
    forward_output_ = !config_.capture_output;
    // Target output must never reach the protocol stream.
    config_.capture_output = true;
}

NativeAdapter& RuntimeHost::adapter() {
    if (!adapter_) {
        adapter_ = std::make_unique<NativeAdapter>(registry_, config_);
    }
    return *adapter_;
}

void RuntimeHost::apply_config(const json& config) {
    if (!config.is_object()) {
        throw std::runtime_error("config must be an object");
    }
    if (auto it = config.find("factoriesPath"); it != config.end() && it->is_string()) {
        config_.factories = it->get<std::string>();
    }
    if (auto it = config.find("debug"); it != config.end() && it->is_boolean()) {
        config_.debug = it->get<bool>();
    }
    if (auto it = config.find("captureOutput"); it != config.end() && it->is_boolean()) {
        forward_output_ = !it->get<bool>();
    }
    if (auto it = config.find("timeoutMs"); it != config.end() && it->is_number_integer()) {
        config_.default_timeout_ms = it->get<long>();
    }
    if (auto it = config.find("lifecycle"); it != config.end() && it->is_string()) {
        const auto parsed = parse_instance_lifecycle(it->get<std::string>());
        if (!parsed) {
            throw std::runtime_error("unknown lifecycle '" + it->get<std::string>() + "'");
        }
        config_.lifecycle = *parsed;
    }
    adapter_.reset();
}

json RuntimeHost::run(const json& test) {
    const TestResult result = adapter().run_test(test.get<TestSpec>());

    json response = {
        {"status", to_string(result.status)},
        {"message", result.message ? json(*result.message) : json(nullptr)},
        {"actual", result.actual_value},
        {"expected", result.expected_value},
        {"duration_ms", result.duration_ms},
    };
    if (result.failure) {
        response["error"] = *result.failure;
    }

    if (forward_output_) {
        for (const auto& block : result.output) {
            std::cerr << block.text;
        }
    } else {
        response["output"] = result.output;
    }
    return response;
}

json RuntimeHost::lifecycle(const std::string& event, const json& data) {
    const std::string name = data.is_object() ? data.value("name", std::string{}) : std::string{};
    auto& native = adapter();

    if (event == "suite_start") {
        native.on_suite_start(name);
    } else if (event == "suite_end") {
        native.on_suite_end(name);
    } else if (event == "test_start") {
        native.on_test_start(name);
    } else if (event == "test_end") {
        native.on_test_end(name);
    } else if (event == "clear_cache") {
        native.clear_cache();
    } else {
        return error_response("Unknown lifecycle event: " + event);
    }
    return json{{"status", "ok"}};
}

json RuntimeHost::handle(const json& command) {
    try {
        if (!command.is_object()) {
            return error_response("command must be a JSON object");
        }
        if (auto config = command.find("config"); config != command.end() && !config->is_null()) {
            apply_config(*config);
        }

        const std::string action = command.value("action", std::string{});
        if (action == "run") {
            return run(command.at("test"));
        }
        if (action == "lifecycle") {
            return lifecycle(command.value("lifecycle", std::string{}), command.value("data", json::object()));
        }
        if (action == "exit") {
            exit_requested_ = true;
            return json{{"status", "ok"}, {"action", "exit"}};
        }
        return error_response("Unknown action: " + action);
    } catch (const std::exception& ex) {
        return error_response(ex.what());
    }
}

int RuntimeHost::serve(std::istream& in, std::ostream& out) {
    std::string line;
    while (!exit_requested_ && std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json response;
        try {
            response = handle(json::parse(line));
        } catch (const json::parse_error& ex) {
            response = error_response(ex.what());
        }
        out << response.dump() + "\n" << std::flush;
    }
    return 0;
}

int RuntimeHost::serve_stdio() {
    std::cout.flush();
    std::fflush(stdout);

    const int protocol_fd = ::dup(STDOUT_FILENO);
    if (protocol_fd < 0) {
        throw std::runtime_error(std::string{"cannot duplicate stdout: "} + std::strerror(errno));
    }
    if (::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        const int error = errno;
        ::close(protocol_fd);
        throw std::runtime_error(std::string{"cannot redirect stdout: "} + std::strerror(error));
    }

    DescriptorBuffer buffer(protocol_fd);
    std::ostream protocol(&buffer);
    const int code = serve(std::cin, protocol);
    ::close(protocol_fd);
    return code;
}

}  // namespace babel::testing
