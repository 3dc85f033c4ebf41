/**
 * @file test_resolver.cpp
 * @brief Tests for turning dotted targets into invocable bindings.
 *
 * Scope:
 *  - module functions, methods on factory-built receivers, named objects, nested types
 *  - longest-module-first interpretation of the path
 *  - diagnostic trails for unknown modules, missing members and unbuildable receivers
 */

#include <catch2/catch_test_macros.hpp>

#include "babel_testing/failure.hpp"
#include "babel_testing/instance_registry.hpp"
#include "babel_testing/invoker.hpp"
#include "babel_testing/resolver.hpp"
#include "example_modules.hpp"

#include <string>

using namespace babel::testing;

namespace {

struct Fixture {
    Fixture() { examples::register_examples(registry); }

    Registry registry;
    InstanceRegistry instances{registry, InstanceRegistry::Config{}};
    Resolver resolver{registry, instances};
};

bool mentions(const std::exception& ex, const std::string& text) {
    return std::string{ex.what()}.find(text) != std::string::npos;
}

}  // namespace

TEST_CASE("module functions resolve without a receiver", "[resolver]") {
    Fixture f;
    const auto resolution = f.resolver.resolve("example.math.add");

    CHECK(resolution.receiver == nullptr);
    CHECK(resolution.method_name == "add");
    REQUIRE(resolution.root != nullptr);
    CHECK(resolution.root->name() == "example.math");
    CHECK(invoke(resolution.binding->get(), resolution.receiver, {{"a", 2}, {"b", 3}}).data() == 5);
}

TEST_CASE("methods resolve on a receiver built by a factory", "[resolver]") {
    Fixture f;
    const auto resolution = f.resolver.resolve("example.services.UserService.getById");

    REQUIRE(resolution.receiver != nullptr);
    CHECK(resolution.receiver->type().name() == "UserService");
    const auto value = invoke(resolution.binding->get(), resolution.receiver, {{"id", 1}});
    CHECK(value.type_name() == "User");
    CHECK(value.data()["name"] == "Alice");
}

TEST_CASE("named objects are used as the receiver", "[resolver]") {
    Fixture f;
    const auto first = f.resolver.resolve("example.services.default_counter.increment");
    const auto second = f.resolver.resolve("example.services.default_counter.increment");

    CHECK(first.receiver == second.receiver);
    CHECK(invoke(first.binding->get(), first.receiver, json::object()).data() == 1);
    CHECK(invoke(second.binding->get(), second.receiver, json::object()).data() == 2);
    CHECK(f.instances.cached_instances() == 0);
}

TEST_CASE("nested types are navigated and built", "[resolver]") {
    Fixture f;
    const auto resolution = f.resolver.resolve("example.services.Outer.Inner.ping");

    REQUIRE(resolution.receiver != nullptr);
    CHECK(resolution.receiver->type().path() == "example.services.Outer.Inner");
    CHECK(invoke(resolution.binding->get(), resolution.receiver, json::object()).data() == "pong");
}

TEST_CASE("targets without a dot are rejected", "[resolver]") {
    Fixture f;
    try {
        (void)f.resolver.resolve("add");
        FAIL("resolved a bare name");
    } catch (const ResolutionError& ex) {
        CHECK(ex.summary() == "Invalid target format: add");
        CHECK(mentions(ex, "module.function"));
    }
}

TEST_CASE("missing members name the module and the registered members", "[resolver]") {
    Fixture f;

    SECTION("function") {
        try {
            (void)f.resolver.resolve("example.math.subtract");
            FAIL("resolved a missing function");
        } catch (const ResolutionError& ex) {
            CHECK(ex.summary() == "Module example.math has no function 'subtract'");
            CHECK(mentions(ex, "add"));
            CHECK(mentions(ex, "+ load example.math"));
        }
    }

    SECTION("method") {
        try {
            (void)f.resolver.resolve("example.services.UserService.deleteAll");
            FAIL("resolved a missing method");
        } catch (const ResolutionError& ex) {
            CHECK(ex.summary() == "Type UserService has no method 'deleteAll'");
            CHECK(mentions(ex, "getById"));
        }
    }
}

TEST_CASE("unknown modules list every module interpretation tried", "[resolver]") {
    Fixture f;
    try {
        (void)f.resolver.resolve("nowhere.deep.fn");
        FAIL("resolved an unknown module");
    } catch (const ResolutionError& ex) {
        CHECK(ex.summary() == "Could not resolve target: nowhere.deep.fn");
        CHECK(ex.trail().searches().size() == 2);
        CHECK(ex.trail().searches()[0].location == "load nowhere.deep");
        CHECK(ex.trail().searches()[1].location == "load nowhere");
        CHECK(mentions(ex, "module not registered"));
    }
}

TEST_CASE("a module whose init failed reports why", "[resolver]") {
    Fixture f;
    try {
        (void)f.resolver.resolve("example.broken.fn");
        FAIL("resolved into a broken module");
    } catch (const ResolutionError& ex) {
        CHECK(mentions(ex, "module init failed: missing native library"));
    }
}

TEST_CASE("unbuildable receivers raise a construction trail", "[resolver]") {
    Fixture f;
    try {
        (void)f.resolver.resolve("example.services.Orphan.seed");
        FAIL("built a receiver without factory or constructor");
    } catch (const ConstructionError& ex) {
        CHECK(ex.summary() == "Cannot construct Orphan");
        CHECK(mentions(ex, "babel/factories/example/services (nested structure) (no factory 'orphan')"));
        CHECK(mentions(ex, "babel/factories/services (flat structure) (factory location not registered)"));
        CHECK(mentions(ex, "babel/factories/orphan (type-named location)"));
        CHECK(mentions(ex, "Orphan() (zero-arg constructor) (no zero-argument constructor registered)"));
        CHECK(ex.trail().suggestions().size() == 2);
    }
}

TEST_CASE("locate finds the binding without building receivers", "[resolver]") {
    Fixture f;
    const auto location = f.resolver.locate("example.services.Orphan.seed");

    REQUIRE(location.binding != nullptr);
    CHECK(location.receiver == nullptr);
    CHECK(location.member == "seed");
    CHECK(f.instances.cached_instances() == 0);
}
