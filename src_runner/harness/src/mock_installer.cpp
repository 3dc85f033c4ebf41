#include "babel_testing/mock_installer.hpp"

#include "babel_testing/invoker.hpp"
#include "babel_testing/resolver.hpp"

#include <map>
#include <memory>
#include <stdexcept>

namespace {

using namespace babel::testing;

template <typename E>
FailureFactory standard_failure() {
    return [](const std::string& message) { return std::make_exception_ptr(E(message)); };
}

const std::map<std::string, FailureFactory>& standard_failures() {
    static const std::map<std::string, FailureFactory> table{
        {"runtime_error", standard_failure<std::runtime_error>()},
        {"logic_error", standard_failure<std::logic_error>()},
        {"invalid_argument", standard_failure<std::invalid_argument>()},
        {"out_of_range", standard_failure<std::out_of_range>()},
        {"domain_error", standard_failure<std::domain_error>()},
        {"length_error", standard_failure<std::length_error>()},
        {"range_error", standard_failure<std::range_error>()},
        {"overflow_error", standard_failure<std::overflow_error>()},
        {"underflow_error", standard_failure<std::underflow_error>()},
    };
    return table;
}

const FailureFactory* registered_failure(Registry& registry, const std::string& module_name,
                                         const std::string& failure_name) {
    if (!registry.is_defined(module_name)) {
        return nullptr;
    }
    std::string reason;
    Module* module = registry.try_load(module_name, reason);
    return module == nullptr ? nullptr : module->failure_named(failure_name);
}

}  // namespace

namespace babel::testing {

FailureFactory resolve_failure_factory(Registry& registry, const std::string& mock_target,
                                       const ThrowsExpectation& throws) {
    if (!throws.type) {
        return standard_failure<std::runtime_error>();
    }
    const auto& type = *throws.type;

    if (const auto dot = type.rfind('.'); dot != std::string::npos) {
        if (const auto* found = registered_failure(registry, type.substr(0, dot), type.substr(dot + 1))) {
            return *found;
        }
    }

    // Modules prefixing the mock target, longest first.
    for (auto dot = mock_target.rfind('.'); dot != std::string::npos && dot > 0;
         dot = mock_target.rfind('.', dot - 1)) {
        if (const auto* found = registered_failure(registry, mock_target.substr(0, dot), type)) {
            return *found;
        }
    }

    const auto& standard = standard_failures();
    const auto std_name = type.rfind("std::", 0) == 0 ? type.substr(5) : type;
    if (auto it = standard.find(std_name); it != standard.end()) {
        return it->second;
    }

    return [type, code = throws.code](const std::string& message) {
        return std::make_exception_ptr(Failure(type, message, code));
    };
}

MockScope::~MockScope() {
    restore();
}

void MockScope::install_all(const std::vector<MockSpec>& mocks) {
    try {
        for (const auto& mock : mocks) {
            install(mock);
        }
    } catch (const std::exception&) {
        restore();
        throw;
    }
}

void MockScope::install(const MockSpec& mock) {
    const Location location = locate(registry_, mock.target);
    const CallablePtr original = location.binding->get();

    auto substitute = std::make_shared<Callable>();
    substitute->name = original->name;
    substitute->params = original->params;

    std::function<Value()> behaviour;
    if (mock.throws) {
        const std::string message = mock.throws->message.value_or("Mock error");
        behaviour = [raise = resolve_failure_factory(registry_, mock.target, *mock.throws), message]() -> Value {
            std::rethrow_exception(raise(message));
        };
    } else {
        behaviour = [returns = mock.returns] { return Value::from_json(returns); };
    }

    if (original->is_async()) {
        substitute->async = [behaviour](Instance*, const Arguments&, AsyncContext& ctx) {
            ctx.checkpoint();
            return behaviour();
        };
    } else {
        substitute->sync = [behaviour](Instance*, const Arguments&) { return behaviour(); };
    }

    installed_.push_back(Installed{location.binding, location.binding->exchange(std::move(substitute))});
}

void MockScope::restore() noexcept {
    while (!installed_.empty()) {
        auto& last = installed_.back();
        last.binding->exchange(std::move(last.original));
        installed_.pop_back();
    }
}

}  // namespace babel::testing
