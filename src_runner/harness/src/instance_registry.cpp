#include "babel_testing/instance_registry.hpp"

#include "babel_testing/failure.hpp"

#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace {

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, separator)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::size_t count, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

}  // namespace

namespace babel::testing {

const char* to_string(InstanceLifecycle lifecycle) noexcept {
    switch (lifecycle) {
        case InstanceLifecycle::Shared: return "shared";
        case InstanceLifecycle::PerSuite: return "per_suite";
        case InstanceLifecycle::PerTest: return "per_test";
    }
    return "shared";
}

std::optional<InstanceLifecycle> parse_instance_lifecycle(const std::string& text) {
    if (text == "shared") return InstanceLifecycle::Shared;
    if (text == "per_suite") return InstanceLifecycle::PerSuite;
    if (text == "per_test") return InstanceLifecycle::PerTest;
    return std::nullopt;
}

InstanceRegistry::InstanceRegistry(Registry& registry, Config config)
    : registry_{registry}, config_{std::move(config)} {}

InstancePtr InstanceRegistry::obtain(const TypeInfo& type) {
    const auto& key = type.path();

    if (config_.lifecycle != InstanceLifecycle::PerTest) {
        auto cached = cache_.find(key);
        if (cached != cache_.end()) {
            return cached->second;
        }
    }

    DiagnosticTrail trail(key);
    InstancePtr instance = try_factory(type, trail);

    if (!instance) {
        const auto& ctor = type.constructor();
        if (ctor) {
            trail.add_search(type.name() + "() (zero-arg constructor)", true);
            instance = std::make_shared<Instance>(ctor(), type);
        } else {
            trail.add_search(type.name() + "() (zero-arg constructor)", false,
                             "no zero-argument constructor registered");
        }
    }

    if (!instance) {
        trail.add_suggestion(suggest_factory_creation(type.name(), type.module_name(), config_.factories_root));
        trail.add_suggestion("Register a zero-argument constructor:\n\n  module.type<" + type.name() + ">(\"" +
                             type.name() + "\").constructor();");
        throw ConstructionError("Cannot construct " + type.name(), std::move(trail));
    }

    if (config_.lifecycle != InstanceLifecycle::PerTest) {
        cache_[key] = instance;
    }
    return instance;
}

InstancePtr InstanceRegistry::try_factory(const TypeInfo& type, DiagnosticTrail& trail) {
    const auto module_parts = split(type.module_name(), '.');
    const auto factory_name = to_snake_case(type.name());

    std::vector<std::pair<std::string, const char*>> locations;
    if (module_parts.size() > 1) {
        locations.emplace_back(config_.factories_root + "/" + join(module_parts, module_parts.size() - 1, "/") +
                                   "/" + module_parts.back(),
                               "nested structure");
    }
    if (!module_parts.empty()) {
        locations.emplace_back(config_.factories_root + "/" + module_parts.back(), "flat structure");
    }
    locations.emplace_back(config_.factories_root + "/" + factory_name, "type-named location");

    for (const auto& [location, description] : locations) {
        std::string reason;
        const FactoryModule* factories = load_factory_module(location, reason);
        if (factories == nullptr) {
            trail.add_search(location + " (" + description + ")", false, reason);
            continue;
        }

        const auto* factory = factories->find(factory_name);
        if (factory == nullptr) {
            trail.add_search(location + " (" + description + ")", false, "no factory '" + factory_name + "'");
            continue;
        }
        if (factory->type != type.type()) {
            trail.add_search(location + "::" + factory_name + "()", false,
                             "factory builds a different type than " + type.name());
            continue;
        }

        trail.add_search(location + "::" + factory_name + "()", true);
        if (config_.debug) {
            std::cerr << "[DEBUG] Using factory " << location << "::" << factory_name << "()\n";
        }
        return std::make_shared<Instance>(factory->make(), type);
    }
    return nullptr;
}

const FactoryModule* InstanceRegistry::load_factory_module(const std::string& location, std::string& reason) {
    auto cached = factory_modules_.find(location);
    if (cached != factory_modules_.end()) {
        return cached->second.get();
    }

    const auto* loader = registry_.factories().find(location);
    if (loader == nullptr) {
        reason = "factory location not registered";
        return nullptr;
    }

    auto module = std::make_unique<FactoryModule>();
    try {
        (*loader)(*module);
    } catch (const std::exception& ex) {
        reason = std::string{"failed to load factory module: "} + ex.what();
        return nullptr;
    }
    const FactoryModule* loaded = module.get();
    factory_modules_.emplace(location, std::move(module));
    return loaded;
}

void InstanceRegistry::on_suite_start() {
    if (config_.lifecycle == InstanceLifecycle::PerSuite) {
        cache_.clear();
    }
}

void InstanceRegistry::on_test_start() {
    if (config_.lifecycle == InstanceLifecycle::PerTest) {
        cache_.clear();
    }
}

void InstanceRegistry::clear() noexcept {
    cache_.clear();
}

}  // namespace babel::testing
