#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "babel_testing/config.hpp"
#include "babel_testing/failure.hpp"
#include "babel_testing/ir_loader.hpp"
#include "babel_testing/orchestrator.hpp"
#include "babel_testing/results_writer.hpp"
#include "babel_testing/subprocess_adapter.hpp"

using babel::testing::AdapterStartError;
using babel::testing::IrDocument;
using babel::testing::IrLoader;
using babel::testing::Orchestrator;
using babel::testing::ResultsWriter;
using babel::testing::SubprocessAdapter;

namespace {

struct Args {
    std::string command;
    std::filesystem::path ir_path;
    std::filesystem::path project_root{"."};
    std::optional<std::filesystem::path> config_path;
    std::vector<std::string> runtime;
    std::filesystem::path summary_path{};
    bool show_logs{false};
    bool debug{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr << "Cross-language test runner\n"
              << "Usage:\n"
              << "  " << argv0 << " run [<ir.json|dir>] [--project <dir>] [--config <file>] [--summary <file>]\n"
              << "                 [--show-logs] [--debug] [--runtime <command> [args...]]\n"
              << "  " << argv0 << " check [<ir.json|dir>] [--project <dir>] [--config <file>]\n"
              << "\n"
              << "Without an IR path, every *.json document under the configured test_paths is used.\n"
              << "\n"
              << "Options:\n"
              << "  --project    Project root handed to the runtime (default: current directory).\n"
              << "  --config     Configuration file (default: <project>/babeltest.json if present).\n"
              << "  --summary    Write a JSON summary of the results to this path.\n"
              << "  --show-logs  Print captured output for passing tests too.\n"
              << "  --debug      Let the runtime write diagnostics to this terminal.\n"
              << "  --runtime    Runtime command; consumes the remaining arguments.\n"
              << "  -h, --help   Show this help message.\n"
              << std::endl;
}

std::string expect_value(int& i, int argc, char** argv, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (tok == "-h" || tok == "--help") {
            args.help = true;
            return args;
        } else if (tok == "--project") {
            args.project_root = expect_value(i, argc, argv, tok);
        } else if (tok == "--config") {
            args.config_path = std::filesystem::path(expect_value(i, argc, argv, tok));
        } else if (tok == "--summary") {
            args.summary_path = expect_value(i, argc, argv, tok);
        } else if (tok == "--show-logs") {
            args.show_logs = true;
        } else if (tok == "--debug") {
            args.debug = true;
        } else if (tok == "--runtime") {
            args.runtime.assign(argv + i + 1, argv + argc);
            break;
        } else if (args.command.empty()) {
            args.command = std::string(tok);
        } else if (args.ir_path.empty()) {
            args.ir_path = std::string(tok);
        } else {
            throw std::runtime_error("Unexpected argument: " + std::string(tok));
        }
    }

    if (args.command != "run" && args.command != "check") {
        throw std::runtime_error(args.command.empty() ? "Missing command" : "Unknown command: " + args.command);
    }
    return args;
}

/// The IR path from the command line, else every configured test path under the project root.
std::vector<IrDocument> load_documents(const Args& args, const babel::testing::RunnerConfig& config) {
    const IrLoader loader;
    if (!args.ir_path.empty()) {
        return loader.load_directory(args.ir_path);
    }

    std::vector<IrDocument> documents;
    for (const auto& entry : config.test_paths) {
        const std::filesystem::path path = args.project_root / entry;
        if (!std::filesystem::exists(path)) {
            continue;
        }
        auto loaded = loader.load_directory(path);
        documents.insert(documents.end(), std::make_move_iterator(loaded.begin()),
                         std::make_move_iterator(loaded.end()));
    }
    if (documents.empty()) {
        throw std::runtime_error("No IR documents found under the configured test paths");
    }
    return documents;
}

std::size_t count_tests(const IrDocument& document) {
    std::size_t total = document.tests.size();
    for (const auto& suite : document.suites) {
        total += suite.tests.size();
    }
    return total;
}

int check(const std::vector<IrDocument>& documents) {
    std::size_t unresolved = 0;
    for (const auto& document : documents) {
        for (const auto& suite : document.suites) {
            for (const auto& test : suite.tests) {
                if (babel::testing::is_relative_target(test.target) && !suite.target) {
                    std::cerr << "  ! " << suite.name << ": relative target '" << test.target
                              << "' but suite has no default target\n";
                    ++unresolved;
                }
            }
        }
        std::cout << "version " << document.version << ", " << document.suites.size() << " suite(s), "
                  << count_tests(document) << " test(s)\n";
    }
    return unresolved == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        const auto config = babel::testing::load_config(args.project_root, args.config_path);
        const auto documents = load_documents(args, config);
        if (args.command == "check") {
            return check(documents);
        }

        auto adapter_config = babel::testing::subprocess_adapter_config(config, args.project_root);
        if (!args.runtime.empty()) {
            adapter_config.command = args.runtime;
        }
        adapter_config.debug = adapter_config.debug || args.debug;

        SubprocessAdapter adapter(std::move(adapter_config));
        Orchestrator orchestrator(adapter);
        std::vector<babel::testing::TestResult> results;
        for (std::size_t i = 0; i < documents.size(); ++i) {
            if (i > 0) {
                // Receivers never leak from one document into the next.
                adapter.clear_cache();
            }
            auto document_results = orchestrator.run(documents[i]);
            results.insert(results.end(), std::make_move_iterator(document_results.begin()),
                           std::make_move_iterator(document_results.end()));
        }
        adapter.shutdown();

        ResultsWriter writer;
        std::cout << writer.format_results(results, args.show_logs) << std::endl;
        if (!args.summary_path.empty()) {
            writer.write_summary(args.summary_path, results);
            std::cout << "Summary: " << args.summary_path.string() << "\n";
        }

        return babel::testing::all_passed(results) ? 0 : 1;
    } catch (const AdapterStartError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;  // configuration/environment issue
    }
}
