#pragma once

#include "instance_registry.hpp"
#include "registry.hpp"

#include <string>

namespace babel::testing {

/**
 * \brief A target path turned into something invocable.
 */
struct Resolution {
    InstancePtr receiver;  ///< null for module-level functions
    BindingPtr binding;
    std::string method_name;
    Module* root{nullptr};
};

/**
 * \brief Static view of a target path: the binding slot, without constructing any receiver.
 */
struct Location {
    BindingPtr binding;
    InstancePtr receiver;  ///< set only when the path goes through a named object
    Module* root{nullptr};
    std::string member;
};

/**
 * \brief Navigates dotted targets (`module.function`, `module.Type.method`, `module.Outer.Inner.method`).
 *
 * Leading segments are tried as a module name, longest first. Every attempt is recorded
 * in the DiagnosticTrail attached to the thrown ResolutionError.
 */
class Resolver {
public:
    Resolver(Registry& registry, InstanceRegistry& instances) : registry_{registry}, instances_{instances} {}

    /// \throws ResolutionError when no interpretation of the path works.
    /// \throws ConstructionError when a receiver on the path cannot be built.
    [[nodiscard]] Resolution resolve(const std::string& target);

    /// Same walk as resolve() without building receivers. Used to install mocks and spies.
    [[nodiscard]] Location locate(const std::string& target) const;

private:
    Registry& registry_;
    InstanceRegistry& instances_;
};

/// Free-standing locate for code holding only the registry (Dependency handles).
[[nodiscard]] Location locate(Registry& registry, const std::string& target);

}  // namespace babel::testing
