#include "babel_testing/diagnostics.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <utility>

namespace babel::testing {

void DiagnosticTrail::add_search(std::string location, bool found, std::string reason) {
    searches_.push_back(SearchAttempt{std::move(location), found, std::move(reason)});
}

void DiagnosticTrail::add_suggestion(std::string suggestion) {
    suggestions_.push_back(std::move(suggestion));
}

void DiagnosticTrail::merge(const DiagnosticTrail& other) {
    searches_.insert(searches_.end(), other.searches_.begin(), other.searches_.end());
    suggestions_.insert(suggestions_.end(), other.suggestions_.begin(), other.suggestions_.end());
}

std::string DiagnosticTrail::format(const std::string& summary) const {
    std::ostringstream oss;
    oss << summary;

    if (!searches_.empty()) {
        oss << "\n\nSearched:";
        for (const auto& attempt : searches_) {
            oss << "\n  " << (attempt.found ? "+ " : "x ") << attempt.location;
            if (!attempt.reason.empty()) {
                oss << " (" << attempt.reason << ")";
            }
        }
    }

    if (!suggestions_.empty()) {
        oss << "\n\nSuggestions:";
        std::size_t index = 1;
        for (const auto& suggestion : suggestions_) {
            oss << "\n  " << index++ << ". " << suggestion;
        }
    }
    return oss.str();
}

std::string to_snake_case(const std::string& name) {
    std::string result;
    result.reserve(name.size() + 4);
    for (std::size_t i = 0; i < name.size(); ++i) {
        const auto ch = static_cast<unsigned char>(name[i]);
        if (std::isupper(ch) && i > 0) {
            result.push_back('_');
        }
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string suggest_factory_creation(const std::string& type_name,
                                     const std::string& module_path,
                                     const std::string& factories_root) {
    const auto func_name = to_snake_case(type_name);
    const auto last_dot = module_path.rfind('.');
    const auto location = last_dot == std::string::npos ? module_path : module_path.substr(last_dot + 1);

    const auto factory_location = factories_root + "/" + (location.empty() ? func_name : location);

    std::ostringstream oss;
    oss << "Register a factory function:\n\n"
        << "  registry.factories().define(\"" << factory_location << "\", [](babel::testing::FactoryModule& m) {\n"
        << "      m.def(\"" << func_name << "\", [] { return std::make_shared<" << type_name
        << ">(/* dependencies */); });\n"
        << "  });";
    return oss.str();
}

}  // namespace babel::testing
