#include "babel_testing/results_writer.hpp"

#include "babel_testing/output_capture.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

using namespace babel::testing;

json result_to_json(const TestResult& result) {
    json entry = {
        {"target", result.test.target},
        {"description", result.test.description ? json(*result.test.description) : json(nullptr)},
        {"status", to_string(result.status)},
        {"message", result.message ? json(*result.message) : json(nullptr)},
        {"actual", result.actual_value},
        {"expected", result.expected_value},
        {"duration_ms", result.duration_ms},
        {"output", result.output},
    };
    if (result.failure) {
        entry["failure"] = *result.failure;
    }
    return entry;
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

const char* status_icon(ResultStatus status) {
    switch (status) {
        case ResultStatus::Passed: return "✓";
        case ResultStatus::Failed: return "✗";
        case ResultStatus::Error: return "!";
        case ResultStatus::Skipped: return "-";
    }
    return "?";
}

void append_logs(std::ostringstream& oss, const std::vector<OutputBlock>& blocks) {
    for (const auto& log : as_logs(blocks)) {
        std::istringstream lines(log);
        std::string line;
        while (std::getline(lines, line)) {
            oss << "\n      " << line;
        }
    }
}

}  // namespace

namespace babel::testing {

json ResultsWriter::build_summary(const std::vector<TestResult>& results) const {
    json summary = {
        {"total", results.size()},
        {"by_status", json::object()},
        {"results", json::array()},
    };

    auto& by_status = summary["by_status"];
    for (const auto& result : results) {
        summary["results"].push_back(result_to_json(result));
        auto& counter = by_status[to_string(result.status)];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
    }
    return summary;
}

void ResultsWriter::write_summary(const std::filesystem::path& destination,
                                  const std::vector<TestResult>& results) const {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << build_summary(results).dump(2);
}

std::string ResultsWriter::format_results(const std::vector<TestResult>& results, bool show_all_logs) const {
    std::ostringstream oss;
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::size_t errors = 0;

    for (const auto& result : results) {
        oss << "  " << status_icon(result.status) << " " << result.test.display_name();
        switch (result.status) {
            case ResultStatus::Passed:
                ++passed;
                if (show_all_logs) append_logs(oss, result.output);
                break;
            case ResultStatus::Failed:
            case ResultStatus::Error:
                ++(result.status == ResultStatus::Failed ? failed : errors);
                if (result.message) oss << "\n      " << *result.message;
                append_logs(oss, result.output);
                break;
            case ResultStatus::Skipped:
                break;
        }
        oss << "\n";
    }

    oss << "\n" << passed << " passed, " << failed << " failed, " << errors << " errors (" << results.size()
        << " total)";
    return oss.str();
}

bool all_passed(const std::vector<TestResult>& results) noexcept {
    for (const auto& result : results) {
        if (result.status == ResultStatus::Failed || result.status == ResultStatus::Error) {
            return false;
        }
    }
    return true;
}

}  // namespace babel::testing
