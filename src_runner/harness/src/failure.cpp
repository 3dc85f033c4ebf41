#include "babel_testing/failure.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include <cxxabi.h>

namespace babel::testing {

HarnessError::HarnessError(const std::string& summary, DiagnosticTrail trail)
    : std::runtime_error(trail.format(summary)), summary_{summary}, trail_{std::move(trail)} {}

InvocationTimeout::InvocationTimeout(long timeout_ms)
    : std::runtime_error("Test timed out after " + std::to_string(timeout_ms) + "ms"),
      timeout_ms_{timeout_ms} {}

Failure::Failure(std::string type, const std::string& message, json code)
    : std::runtime_error(message), type_{std::move(type)}, code_(std::move(code)) {}

std::string unqualified_type_name(const std::type_info& info) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled{
        abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free};
    std::string name = (status == 0 && demangled) ? demangled.get() : info.name();

    // Drop template arguments, then everything up to the last scope separator.
    if (const auto angle = name.find('<'); angle != std::string::npos) {
        name.erase(angle);
    }
    if (const auto scope = name.rfind("::"); scope != std::string::npos) {
        name.erase(0, scope + 2);
    }
    return name;
}

RaisedFailure describe_failure(const std::exception_ptr& error) {
    RaisedFailure out;
    if (!error) {
        out.type = "unknown";
        return out;
    }
    try {
        std::rethrow_exception(error);
    } catch (const Failure& failure) {
        out.type = failure.type();
        out.message = failure.what();
        out.code = failure.code();
    } catch (const std::exception& ex) {
        out.type = unqualified_type_name(typeid(ex));
        out.message = ex.what();
    } catch (...) {
        out.type = "unknown";
        out.message = "non-standard exception";
    }
    return out;
}

}  // namespace babel::testing
