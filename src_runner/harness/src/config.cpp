#include "babel_testing/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

using babel::testing::json;

const json* section(const json& parent, const char* key) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw std::runtime_error(std::string{"'"} + key + "' must be an object");
    }
    return &*it;
}

template <typename T>
void read_value(const json& parent, const char* key, T& out) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw std::runtime_error(std::string{"'"} + key + "' has the wrong type");
    }
}

/// Accepts `"a b c"` or `["a", "b", "c"]`.
std::vector<std::string> read_command(const json& parent, const char* key) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return {};
    std::vector<std::string> argv;
    if (it->is_string()) {
        std::istringstream words(it->get<std::string>());
        std::string word;
        while (words >> word) argv.push_back(word);
        return argv;
    }
    if (it->is_array()) {
        for (const auto& element : *it) {
            if (!element.is_string()) {
                throw std::runtime_error(std::string{"'"} + key + "' entries must be strings");
            }
            argv.push_back(element.get<std::string>());
        }
        return argv;
    }
    throw std::runtime_error(std::string{"'"} + key + "' must be a string or an array of strings");
}

/// `test_paths` may be a single string.
std::vector<std::string> read_paths(const json& parent, const char* key, std::vector<std::string> fallback) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return fallback;
    if (it->is_string()) return {it->get<std::string>()};
    return read_command(parent, key);
}

std::optional<long> read_positive(const json& parent, const char* key) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer() || it->get<long>() <= 0) {
        throw std::runtime_error(std::string{"'"} + key + "' must be a positive integer");
    }
    return it->get<long>();
}

}  // namespace

namespace babel::testing {

RunnerConfig parse_config(const json& document, const std::string& origin) {
    try {
        if (!document.is_object()) {
            throw std::runtime_error("configuration root must be an object");
        }

        RunnerConfig config;
        read_value(document, "version", config.version);
        config.test_paths = read_paths(document, "test_paths", config.test_paths);

        const json* adapters = section(document, "adapters");
        if (adapters == nullptr) {
            return config;
        }

        if (const json* native = section(*adapters, "native")) {
            read_value(*native, "factories", config.native.factories);
            read_value(*native, "capture_output", config.native.capture_output);
            read_value(*native, "debug_mode", config.native.debug_mode);
            config.native.timeout_ms = read_positive(*native, "timeout_ms");

            std::string lifecycle = to_string(config.native.instance_lifecycle);
            read_value(*native, "instance_lifecycle", lifecycle);
            const auto parsed = parse_instance_lifecycle(lifecycle);
            if (!parsed) {
                throw std::runtime_error("unknown instance_lifecycle '" + lifecycle + "'");
            }
            config.native.instance_lifecycle = *parsed;
        }

        if (const json* subprocess = section(*adapters, "subprocess")) {
            config.subprocess.command = read_command(*subprocess, "command");
            config.subprocess.build_command = read_command(*subprocess, "build_command");
            read_value(*subprocess, "factories", config.subprocess.factories);
            read_value(*subprocess, "debug_mode", config.subprocess.debug_mode);
            if (auto timeout = read_positive(*subprocess, "read_timeout_ms")) {
                config.subprocess.read_timeout_ms = *timeout;
            }
            if (const json* extra = section(*subprocess, "extra")) {
                config.subprocess.extra = *extra;
            }
        }
        return config;
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error("Invalid configuration in " + origin + ": " + ex.what());
    }
}

RunnerConfig load_config(const std::filesystem::path& project_root,
                         const std::optional<std::filesystem::path>& explicit_path) {
    std::filesystem::path file;
    if (explicit_path) {
        if (!std::filesystem::exists(*explicit_path)) {
            throw std::runtime_error("Configuration file does not exist: " + explicit_path->string());
        }
        file = *explicit_path;
    } else {
        for (const char* candidate : {"babeltest.json", ".babeltest.json"}) {
            if (std::filesystem::exists(project_root / candidate)) {
                file = project_root / candidate;
                break;
            }
        }
    }

    if (file.empty()) {
        return RunnerConfig{};
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open configuration file: " + file.string());
    }
    json document;
    try {
        input >> document;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Malformed JSON in " + file.string() + ": " + ex.what());
    }

    RunnerConfig config = parse_config(document, file.string());
    config.source = file;
    return config;
}

NativeAdapter::Config native_adapter_config(const RunnerConfig& config) {
    NativeAdapter::Config out;
    out.lifecycle = config.native.instance_lifecycle;
    out.factories = config.native.factories;
    out.default_timeout_ms = config.native.timeout_ms;
    out.capture_output = config.native.capture_output;
    out.debug = config.native.debug_mode;
    return out;
}

}  // namespace babel::testing
