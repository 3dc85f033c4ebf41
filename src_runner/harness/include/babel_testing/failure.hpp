#pragma once

#include "diagnostics.hpp"
#include "ir.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <typeinfo>

namespace babel::testing {

/**
 * \brief Base of harness-side errors that carry a diagnostic trail.
 *
 * what() returns the fully formatted trail; summary() returns the one-line headline.
 */
class HarnessError : public std::runtime_error {
public:
    HarnessError(const std::string& summary, DiagnosticTrail trail);

    [[nodiscard]] const std::string& summary() const noexcept { return summary_; }
    [[nodiscard]] const DiagnosticTrail& trail() const noexcept { return trail_; }

private:
    std::string summary_;
    DiagnosticTrail trail_;
};

/// Target path could not be navigated.
class ResolutionError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// No viable way to build a required receiver.
class ConstructionError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// Call exceeded its deadline.
class InvocationTimeout : public std::runtime_error {
public:
    explicit InvocationTimeout(long timeout_ms);

    [[nodiscard]] long timeout_ms() const noexcept { return timeout_ms_; }

private:
    long timeout_ms_;
};

/// Raised inside an async operation at a suspension point once cancellation was requested.
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

/// I/O breakdown while talking to a child runtime.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A child runtime could not be built or started; aborts the whole run.
class AdapterStartError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Failure with a language-neutral type name, raised by targets and by mock substitutes.
 *
 * Code under test may throw any std::exception; this type exists for failures whose name is
 * not a C++ class (generic mock fallback) or that carry an error code.
 */
class Failure : public std::runtime_error {
public:
    Failure(std::string type, const std::string& message, json code = nullptr);

    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] const json& code() const noexcept { return code_; }

private:
    std::string type_;
    json code_;
};

/// Demangled class name with namespaces and template arguments stripped (`example::User` -> `User`).
[[nodiscard]] std::string unqualified_type_name(const std::type_info& info);

/// Reduces an in-flight exception to the neutral fields used by the failure matcher.
[[nodiscard]] RaisedFailure describe_failure(const std::exception_ptr& error);

}  // namespace babel::testing
