#include "babel_testing/subprocess_adapter.hpp"

#include "babel_testing/failure.hpp"
#include "babel_testing/instance_registry.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace {

using namespace babel::testing;

double elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

std::optional<std::string> optional_text(const json& response, const char* key) {
    auto it = response.find(key);
    if (it == response.end() || it->is_null()) return std::nullopt;
    return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

namespace babel::testing {

SubprocessAdapter::SubprocessAdapter(Config config) : config_{std::move(config)} {
    if (config_.command.empty()) {
        throw AdapterStartError("No runtime command configured for the " + config_.label + " adapter");
    }
    build();
}

SubprocessAdapter::~SubprocessAdapter() {
    shutdown();
}

void SubprocessAdapter::build() {
    if (config_.build_command.empty()) {
        return;
    }
    if (config_.debug) {
        std::cerr << "[DEBUG] Building " << config_.label << ": " << join_argv(config_.build_command) << "\n";
    }

    CommandResult built;
    try {
        built = run_command(config_.build_command, config_.project_root);
    } catch (const ProtocolError& ex) {
        throw AdapterStartError("Failed to run build command '" + join_argv(config_.build_command) +
                                "': " + ex.what());
    }
    if (built.exit_code != 0) {
        throw AdapterStartError("Build command '" + join_argv(config_.build_command) + "' failed with exit code " +
                                std::to_string(built.exit_code) + ":\n" + built.output);
    }
}

ChildProcess& SubprocessAdapter::ensure_started() {
    if (process_ && process_->running()) {
        return *process_;
    }
    if (process_ && config_.debug) {
        std::cerr << "[DEBUG] " << config_.label << " exited; restarting\n";
    }

    ChildProcess::Options options;
    options.argv = config_.command;
    options.working_dir = config_.project_root;
    options.pipe_stderr = !config_.debug;

    process_ = std::make_unique<ChildProcess>(std::move(options));
    config_sent_ = false;
    ++starts_;
    return *process_;
}

json SubprocessAdapter::config_block() const {
    json block = {
        {"projectRoot", std::filesystem::absolute(config_.project_root).string()},
        {"factoriesPath", config_.factories},
        {"debug", config_.debug},
    };
    for (const auto& item : config_.extra.items()) {
        block[item.key()] = item.value();
    }
    return block;
}

json SubprocessAdapter::send_command(json command) {
    ChildProcess& child = ensure_started();

    if (!config_sent_ && !command.contains("config")) {
        command["config"] = config_block();
    }

    try {
        child.write_line(command.dump());
    } catch (const ProtocolError& ex) {
        const auto stderr_text = child.drain_stderr();
        discard_process();
        throw ProtocolError(config_.label + " process died: " + std::string{ex.what()} + "\n" + stderr_text);
    }
    config_sent_ = true;

    std::optional<std::string> line;
    try {
        line = child.read_line(std::chrono::milliseconds(config_.read_timeout_ms));
    } catch (const ProtocolError&) {
        // A late answer would desynchronize the next exchange.
        discard_process();
        throw;
    }
    if (!line || line->empty()) {
        const auto stderr_text = child.drain_stderr();
        discard_process();
        throw ProtocolError("No response from " + config_.label + ": " + stderr_text);
    }

    try {
        return json::parse(*line);
    } catch (const json::parse_error&) {
        // Whatever follows the bad line belongs to this command, not the next one.
        const auto stderr_text = child.drain_stderr();
        discard_process();
        throw ProtocolError("Invalid JSON from " + config_.label + ": " + *line +
                            (stderr_text.empty() ? std::string{} : "\n" + stderr_text));
    }
}

TestResult SubprocessAdapter::run_test(const TestSpec& test) {
    const auto start = std::chrono::steady_clock::now();
    try {
        const json response = send_command(json{{"action", "run"}, {"test", test}});
        return to_result(test, response, elapsed_since(start));
    } catch (const std::exception& ex) {
        TestResult result;
        result.test = test;
        result.status = ResultStatus::Error;
        result.message = config_.label + " adapter error: " + ex.what();
        result.duration_ms = elapsed_since(start);
        return result;
    }
}

TestResult SubprocessAdapter::to_result(const TestSpec& test, const json& response, double elapsed_ms) const {
    TestResult result;
    result.test = test;

    if (!response.is_object()) {
        result.status = ResultStatus::Error;
        result.message = "Unexpected response from " + config_.label + ": " + response.dump();
        result.duration_ms = elapsed_ms;
        return result;
    }

    const auto status = response.find("status");
    result.status = (status != response.end() && status->is_string()) ? parse_result_status(status->get<std::string>())
                                                                       : ResultStatus::Error;
    result.message = optional_text(response, "message");
    result.actual_value = response.value("actual", json{});
    result.expected_value = response.value("expected", json{});

    const auto duration = response.find("duration_ms");
    result.duration_ms = (duration != response.end() && duration->is_number()) ? duration->get<double>() : elapsed_ms;

    if (auto error = response.find("error"); error != response.end() && error->is_object()) {
        RaisedFailure failure;
        failure.type = error->value("type", std::string{});
        failure.message = error->value("message", std::string{});
        failure.code = error->value("code", json{});
        result.failure = std::move(failure);
    }

    if (auto output = response.find("output"); output != response.end() && output->is_array()) {
        for (const auto& block : *output) {
            if (!block.is_object()) continue;
            result.output.push_back(OutputBlock{block.value("stream", std::string{"stdout"}),
                                                block.value("text", std::string{})});
        }
    }
    return result;
}

void SubprocessAdapter::discard_process() noexcept {
    if (!process_) {
        return;
    }
    process_->kill();
    (void)process_->wait_for(std::chrono::milliseconds(config_.shutdown_grace_ms));
    process_.reset();
}

void SubprocessAdapter::send_lifecycle(const char* event, const std::string& name) {
    try {
        (void)send_command(json{{"action", "lifecycle"}, {"lifecycle", event}, {"data", {{"name", name}}}});
    } catch (const std::exception& ex) {
        if (config_.debug) {
            std::cerr << "[DEBUG] lifecycle " << event << " ignored: " << ex.what() << "\n";
        }
    }
}

void SubprocessAdapter::on_suite_start(const std::string& suite_name) {
    send_lifecycle("suite_start", suite_name);
}

void SubprocessAdapter::on_suite_end(const std::string& suite_name) {
    send_lifecycle("suite_end", suite_name);
}

void SubprocessAdapter::on_test_start(const std::string& test_name) {
    send_lifecycle("test_start", test_name);
}

void SubprocessAdapter::on_test_end(const std::string& test_name) {
    send_lifecycle("test_end", test_name);
}

void SubprocessAdapter::clear_cache() {
    send_lifecycle("clear_cache", {});
}

void SubprocessAdapter::shutdown() {
    if (!process_) {
        return;
    }

    if (process_->running()) {
        try {
            process_->write_line(json{{"action", "exit"}}.dump());
            (void)process_->read_line(std::chrono::milliseconds(std::min(config_.read_timeout_ms,
                                                                         config_.shutdown_grace_ms)));
        } catch (const std::exception& ex) {
            if (config_.debug) {
                std::cerr << "[DEBUG] exit command failed: " << ex.what() << "\n";
            }
        }
        process_->close_stdin();
        process_->terminate();
        if (!process_->wait_for(std::chrono::milliseconds(config_.shutdown_grace_ms))) {
            process_->kill();
            (void)process_->wait_for(std::chrono::milliseconds(config_.shutdown_grace_ms));
        }
    }
    process_.reset();
}

SubprocessAdapter::Config subprocess_adapter_config(const RunnerConfig& config,
                                                    const std::filesystem::path& project_root) {
    SubprocessAdapter::Config out;
    out.command = config.subprocess.command;
    out.build_command = config.subprocess.build_command;
    out.project_root = project_root;
    out.factories = config.subprocess.factories;
    out.debug = config.subprocess.debug_mode;
    out.read_timeout_ms = config.subprocess.read_timeout_ms;

    // The runtime executes targets with its in-process adapter; `adapters.native` configures it.
    out.extra = json{
        {"lifecycle", to_string(config.native.instance_lifecycle)},
        {"captureOutput", config.native.capture_output},
    };
    if (config.native.timeout_ms) {
        out.extra["timeoutMs"] = *config.native.timeout_ms;
    }
    for (const auto& item : config.subprocess.extra.items()) {
        out.extra[item.key()] = item.value();
    }
    return out;
}

}  // namespace babel::testing
