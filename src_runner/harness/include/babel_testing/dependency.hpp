#pragma once

#include "failure.hpp"
#include "invoker.hpp"
#include "registry.hpp"
#include "resolver.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace babel::testing {

template <typename Signature>
class Dependency;

/**
 * \brief Collaborator handle for code under test.
 *
 * Every call looks the target up through the registry, so whatever is bound at call
 * time (the real function, a mock or a spy) receives it. Positional arguments are
 * passed by the parameter names the target was registered with.
 *
 * \code
 * class CheckoutService {
 * public:
 *     explicit CheckoutService(Registry& r) : charge_{r, "payments.gateway.charge"} {}
 *     Receipt checkout(double amount) { return {charge_(amount)}; }
 * private:
 *     Dependency<std::string(double)> charge_;
 * };
 * \endcode
 */
template <typename R, typename... A>
class Dependency<R(A...)> {
public:
    Dependency(Registry& registry, std::string target) : registry_{&registry}, target_{std::move(target)} {}

    [[nodiscard]] const std::string& target() const noexcept { return target_; }

    R operator()(A... args) const {
        const Location location = locate(*registry_, target_);
        const CallablePtr callable = location.binding->get();
        if (callable->params.size() != sizeof...(A)) {
            throw Failure("TypeError", target_ + " takes " + std::to_string(callable->params.size()) +
                                           " argument(s), " + std::to_string(sizeof...(A)) + " given");
        }

        json kwargs = json::object();
        bind(kwargs, callable->params, std::index_sequence_for<A...>{}, args...);
        Value result = invoke(callable, location.receiver, kwargs);

        if constexpr (!std::is_void_v<R>) {
            try {
                return result.data().template get<R>();
            } catch (const json::exception& ex) {
                throw Failure("TypeError", target_ + " returned " + result.type_name() + ": " + ex.what());
            }
        }
    }

private:
    template <std::size_t... I>
    static void bind(json& kwargs, const std::vector<std::string>& names, std::index_sequence<I...>,
                     const A&... args) {
        ((kwargs[names[I]] = capture(args).data()), ...);
    }

    Registry* registry_;
    std::string target_;
};

}  // namespace babel::testing
