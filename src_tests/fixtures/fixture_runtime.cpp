// Child runtime serving the example modules over stdin/stdout, driven by the subprocess tests.

#include "example_modules.hpp"

#include "babel_testing/config.hpp"
#include "babel_testing/runtime_host.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

int main() {
    using namespace babel::testing;

    Registry registry;
    examples::register_examples(registry);

    registry.define("example.stdio", [](Module& m) {
        m.def("print_c", [](std::string text) {
            std::printf("%s\n", text.c_str());
            std::fflush(stdout);
            return text.size();
        }, {"text"});
        // Keeps printing after the test that started it has timed out.
        m.def("print_late", [](std::string text, int delay_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            std::printf("%s\n", text.c_str());
            std::fflush(stdout);
            std::cout << text << std::endl;
            return delay_ms;
        }, {"text", "delay_ms"});
    });
    registry.define("example.crash", [](Module& m) { m.def("exit_silently", [] { std::_Exit(0); }); });

    try {
        RuntimeHost host(registry, native_adapter_config(load_config(std::filesystem::current_path())));
        return host.serve_stdio();
    } catch (const std::exception& ex) {
        std::cerr << "fixture runtime: " << ex.what() << "\n";
        return 2;
    }
}
