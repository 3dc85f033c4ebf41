/**
 * @file test_instance_lifecycle.cpp
 * @brief Tests for receiver construction and reuse across suites and tests.
 *
 * Scope:
 *  - shared: one receiver per type path for the whole run
 *  - per_suite: cache cleared at suite start
 *  - per_test: a fresh receiver on every obtain
 *  - factory lookup order (nested, flat, type-named) and factory type checks
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/failure.hpp"
#include "babel_testing/instance_registry.hpp"
#include "example_modules.hpp"

using namespace babel::testing;

namespace {

const TypeInfo& type_of(Registry& registry, const std::string& module_name, const std::string& type_name) {
    std::string reason;
    Module* module = registry.try_load(module_name, reason);
    REQUIRE(module != nullptr);
    auto type = module->type_named(type_name);
    REQUIRE(type);
    return *type;
}

}  // namespace

TEST_CASE("lifecycle names round-trip", "[lifecycle]") {
    for (auto lifecycle : {InstanceLifecycle::Shared, InstanceLifecycle::PerSuite, InstanceLifecycle::PerTest}) {
        CHECK(parse_instance_lifecycle(to_string(lifecycle)) == lifecycle);
    }
    CHECK_FALSE(parse_instance_lifecycle("per_call").has_value());
}

TEST_CASE("shared receivers live for the whole run", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    InstanceRegistry instances(registry, {InstanceLifecycle::Shared});
    const auto& counter = type_of(registry, "example.services", "Counter");

    const auto first = instances.obtain(counter);
    instances.on_suite_start();
    instances.on_test_start();
    const auto second = instances.obtain(counter);

    CHECK(first == second);
    CHECK(instances.cached_instances() == 1);
}

TEST_CASE("per-suite receivers are rebuilt when a suite starts", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    InstanceRegistry instances(registry, {InstanceLifecycle::PerSuite});
    const auto& counter = type_of(registry, "example.services", "Counter");

    instances.on_suite_start();
    const auto a = instances.obtain(counter);
    instances.on_test_start();
    const auto b = instances.obtain(counter);
    instances.on_suite_start();
    const auto c = instances.obtain(counter);

    CHECK(a == b);
    CHECK(a != c);
}

TEST_CASE("per-test receivers are never reused", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    InstanceRegistry instances(registry, {InstanceLifecycle::PerTest});
    const auto& counter = type_of(registry, "example.services", "Counter");

    const int before = examples::Counter::constructed.load();
    const auto a = instances.obtain(counter);
    const auto b = instances.obtain(counter);

    CHECK(a != b);
    CHECK(examples::Counter::constructed.load() - before == 2);
    CHECK(instances.cached_instances() == 0);
}

TEST_CASE("clear drops receivers but keeps factory modules", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    InstanceRegistry instances(registry, {InstanceLifecycle::Shared});
    const auto& service = type_of(registry, "example.services", "UserService");

    const auto first = instances.obtain(service);
    CHECK(instances.loaded_factory_modules() == 1);

    instances.clear();
    CHECK(instances.cached_instances() == 0);
    CHECK(instances.loaded_factory_modules() == 1);
    CHECK(instances.obtain(service) != first);
}

TEST_CASE("factories are found at the flat location", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    InstanceRegistry instances(registry, {});
    const auto& checkout = type_of(registry, "shop.checkout", "CheckoutService");

    const auto receiver = instances.obtain(checkout);
    REQUIRE(receiver != nullptr);
    CHECK(receiver->type().name() == "CheckoutService");
}

TEST_CASE("a factory building another type is skipped", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    registry.factories().define("babel/factories/orphan", [](FactoryModule& f) {
        f.def("orphan", [] { return std::make_shared<examples::Counter>(); });
    });
    InstanceRegistry instances(registry, {});
    const auto& orphan = type_of(registry, "example.services", "Orphan");

    try {
        (void)instances.obtain(orphan);
        FAIL("accepted a factory of the wrong type");
    } catch (const ConstructionError& ex) {
        CHECK(std::string{ex.what()}.find("factory builds a different type than Orphan") != std::string::npos);
    }
}

TEST_CASE("a factory location whose loader throws is reported and skipped", "[lifecycle]") {
    Registry registry;
    examples::register_examples(registry);
    registry.factories().define("babel/factories/example/services",
                                [](FactoryModule&) { throw std::runtime_error("database offline"); });
    InstanceRegistry instances(registry, {});
    const auto& counter = type_of(registry, "example.services", "Counter");

    // Falls through to the zero-argument constructor.
    CHECK(instances.obtain(counter) != nullptr);
    CHECK(instances.loaded_factory_modules() == 0);
}
