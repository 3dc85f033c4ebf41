#pragma once

#include "babel_testing/dependency.hpp"
#include "babel_testing/registry.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace babel::testing::examples {

struct Profile {
    std::string city;
    std::vector<std::string> tags;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Profile, city, tags)

struct User {
    int id{0};
    std::string name;
    std::string email;
    Profile profile;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(User, id, name, email, profile)

/// Serializes itself through a member rather than ADL.
struct Point {
    int x{0};
    int y{0};

    [[nodiscard]] nlohmann::json to_json() const { return {{"x", x}, {"y", y}}; }
};

class NotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PaymentDeclined : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UserRepository {
public:
    UserRepository();
    [[nodiscard]] const User* find(int id) const;

private:
    std::map<int, User> users_;
};

/// Needs a repository, so it is only buildable through its factory.
class UserService {
public:
    explicit UserService(std::shared_ptr<UserRepository> repository) : repository_{std::move(repository)} {}

    [[nodiscard]] User get_by_id(int id) const;
    [[nodiscard]] int count() const { return 2; }

private:
    std::shared_ptr<UserRepository> repository_;
};

class Counter {
public:
    Counter() { ++constructed; }

    int increment() { return ++value_; }

    static std::atomic<int> constructed;

private:
    int value_{0};
};

/// No factory and no default constructor.
class Orphan {
public:
    explicit Orphan(int seed) : seed_{seed} {}
    [[nodiscard]] int seed() const { return seed_; }

private:
    int seed_;
};

class Outer {
public:
    class Inner {
    public:
        [[nodiscard]] std::string ping() const { return "pong"; }
    };
};

/// Calls its collaborators through the registry so tests can mock and spy on them.
class CheckoutService {
public:
    explicit CheckoutService(Registry& registry)
        : charge_{registry, "payments.gateway.charge"}, notify_{registry, "shop.notifications.send"} {}

    nlohmann::json checkout(double amount);

private:
    Dependency<nlohmann::json(double)> charge_;
    Dependency<bool(std::string)> notify_;
};

/// Registers every example module and factory location into `registry`.
void register_examples(Registry& registry);

}  // namespace babel::testing::examples
