/**
 * @file test_config.cpp
 * @brief Tests for the runner configuration file.
 *
 * Scope:
 *  - defaults when no configuration file exists
 *  - discovery of babeltest.json / .babeltest.json under the project root
 *  - adapter sections, command strings vs arrays, and validation errors
 *  - native settings forwarded to the runtime inside the subprocess config block
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/config.hpp"
#include "babel_testing/subprocess_adapter.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace babel::testing;

namespace {

std::filesystem::path fresh_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

std::string error_of(const json& document) {
    try {
        (void)parse_config(document, "babeltest.json");
    } catch (const std::runtime_error& ex) {
        return ex.what();
    }
    return {};
}

}  // namespace

TEST_CASE("no configuration file yields defaults", "[config]") {
    const auto config = load_config(fresh_dir("babel_config_empty"));

    CHECK(config.source.empty());
    CHECK(config.version == "0.1");
    CHECK(config.native.factories == "babel/factories");
    CHECK(config.native.instance_lifecycle == InstanceLifecycle::Shared);
    CHECK_FALSE(config.native.timeout_ms.has_value());
    CHECK(config.subprocess.command.empty());
    CHECK(config.subprocess.read_timeout_ms == 30000);
    REQUIRE(config.test_paths.size() == 1);
    CHECK(config.test_paths[0] == "babel/tests");
}

TEST_CASE("the hidden configuration file is found when the plain one is absent", "[config]") {
    const auto dir = fresh_dir("babel_config_hidden");
    write_file(dir / ".babeltest.json", R"({"test_paths": "spec/babel"})");

    const auto config = load_config(dir);
    CHECK(config.source == dir / ".babeltest.json");
    REQUIRE(config.test_paths.size() == 1);
    CHECK(config.test_paths[0] == "spec/babel");
}

TEST_CASE("adapter sections are read", "[config]") {
    const auto dir = fresh_dir("babel_config_full");
    write_file(dir / "babeltest.json", R"({
        "version": "0.2",
        "adapters": {
            "native": {"factories": "fixtures/factories", "instance_lifecycle": "per_suite",
                       "capture_output": true, "timeout_ms": 2000, "debug_mode": true},
            "subprocess": {"command": "./build/runtime --serve", "build_command": ["make", "runtime"],
                           "read_timeout_ms": 5000, "extra": {"classpath": "lib/*"}}
        }
    })");

    const auto config = load_config(dir);
    CHECK(config.version == "0.2");
    CHECK(config.native.factories == "fixtures/factories");
    CHECK(config.native.instance_lifecycle == InstanceLifecycle::PerSuite);
    CHECK(config.native.capture_output);
    CHECK(config.native.timeout_ms == 2000L);
    CHECK(config.subprocess.command == std::vector<std::string>{"./build/runtime", "--serve"});
    CHECK(config.subprocess.build_command == std::vector<std::string>{"make", "runtime"});
    CHECK(config.subprocess.read_timeout_ms == 5000);

    const auto native = native_adapter_config(config);
    CHECK(native.lifecycle == InstanceLifecycle::PerSuite);
    CHECK(native.default_timeout_ms == 2000L);
    CHECK(native.debug);

    const auto subprocess = subprocess_adapter_config(config, dir);
    CHECK(subprocess.project_root == dir);
    CHECK(subprocess.extra ==
          json({{"classpath", "lib/*"}, {"lifecycle", "per_suite"}, {"captureOutput", true}, {"timeoutMs", 2000}}));
}

TEST_CASE("explicit extra keys override the forwarded native settings", "[config]") {
    const auto config = parse_config(json::parse(R"({
        "adapters": {
            "native": {"instance_lifecycle": "per_test"},
            "subprocess": {"command": ["runtime"], "extra": {"lifecycle": "shared"}}
        }
    })"));

    const auto subprocess = subprocess_adapter_config(config, ".");
    CHECK(subprocess.extra["lifecycle"] == "shared");
    CHECK(subprocess.extra["captureOutput"] == false);
    CHECK_FALSE(subprocess.extra.contains("timeoutMs"));
}

TEST_CASE("an explicit configuration path must exist", "[config]") {
    CHECK_THROWS_AS(load_config(".", std::filesystem::path{"/nonexistent/babeltest.json"}), std::runtime_error);
}

TEST_CASE("invalid values name the file and the key", "[config]") {
    CHECK(error_of(json::array()) == "Invalid configuration in babeltest.json: configuration root must be an object");
    CHECK(error_of({{"adapters", {{"native", {{"instance_lifecycle", "forever"}}}}}}) ==
          "Invalid configuration in babeltest.json: unknown instance_lifecycle 'forever'");
    CHECK(error_of({{"adapters", {{"native", {{"timeout_ms", -5}}}}}}) ==
          "Invalid configuration in babeltest.json: 'timeout_ms' must be a positive integer");
    CHECK(error_of({{"adapters", {{"subprocess", {{"command", 42}}}}}}) ==
          "Invalid configuration in babeltest.json: 'command' must be a string or an array of strings");
    CHECK(error_of({{"adapters", "native"}}) == "Invalid configuration in babeltest.json: 'adapters' must be an object");
}
