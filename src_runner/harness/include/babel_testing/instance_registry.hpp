#pragma once

#include "diagnostics.hpp"
#include "registry.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace babel::testing {

/**
 * \brief How long a constructed receiver is reused.
 */
enum class InstanceLifecycle {
    Shared,    ///< one instance per type path for the whole run
    PerSuite,  ///< cache cleared at every suite start
    PerTest,   ///< cache cleared at every test start and never consulted
};

[[nodiscard]] const char* to_string(InstanceLifecycle lifecycle) noexcept;

/// `shared`, `per_suite` or `per_test`; nullopt for anything else.
[[nodiscard]] std::optional<InstanceLifecycle> parse_instance_lifecycle(const std::string& text);

/**
 * \brief Builds and caches receiver instances for registered types.
 *
 * Construction order: lifecycle cache, factory (nested, flat, then type-named location),
 * zero-argument constructor. Loaded factory modules stay cached for the whole run.
 */
class InstanceRegistry {
public:
    struct Config {
        InstanceLifecycle lifecycle{InstanceLifecycle::Shared};
        std::string factories_root{"babel/factories"};
        bool debug{false};
    };

    InstanceRegistry(Registry& registry, Config config);

    /// Returns a receiver for `type`.
    /// \throws ConstructionError with every searched location when nothing can build it.
    [[nodiscard]] InstancePtr obtain(const TypeInfo& type);

    void on_suite_start();
    void on_test_start();

    /// Drops every cached instance regardless of lifecycle (factory modules stay loaded).
    void clear() noexcept;

    [[nodiscard]] std::size_t cached_instances() const noexcept { return cache_.size(); }
    [[nodiscard]] std::size_t loaded_factory_modules() const noexcept { return factory_modules_.size(); }

private:
    [[nodiscard]] InstancePtr try_factory(const TypeInfo& type, DiagnosticTrail& trail);
    [[nodiscard]] const FactoryModule* load_factory_module(const std::string& location, std::string& reason);

    Registry& registry_;
    Config config_;
    std::map<std::string, InstancePtr> cache_;
    std::map<std::string, std::unique_ptr<FactoryModule>> factory_modules_;
};

}  // namespace babel::testing
