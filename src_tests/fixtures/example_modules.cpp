#include "example_modules.hpp"

#include "babel_testing/failure.hpp"
#include "babel_testing/invoker.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

namespace babel::testing::examples {

std::atomic<int> Counter::constructed{0};

UserRepository::UserRepository() {
    users_[1] = User{1, "Alice", "alice@example.com", Profile{"Lisbon", {"admin", "beta"}}};
    users_[2] = User{2, "Bob", "bob@example.com", Profile{"Oslo", {}}};
}

const User* UserRepository::find(int id) const {
    auto it = users_.find(id);
    return it == users_.end() ? nullptr : &it->second;
}

User UserService::get_by_id(int id) const {
    const User* user = repository_->find(id);
    if (user == nullptr) {
        throw NotFound("User " + std::to_string(id) + " not found");
    }
    return *user;
}

nlohmann::json CheckoutService::checkout(double amount) {
    if (amount <= 0) {
        throw std::invalid_argument("amount must be positive");
    }
    nlohmann::json receipt = charge_(amount);
    (void)notify_("charged " + std::to_string(static_cast<long>(amount)));
    return receipt;
}

namespace {

void register_math(Module& m) {
    m.def("add", [](int a, int b) { return a + b; }, {"a", "b"})
        .def("divide",
             [](double a, double b) {
                 if (b == 0) {
                     throw std::invalid_argument("division by zero");
                 }
                 return a / b;
             },
             {"a", "b"})
        .def("is_even", [](int n) { return n % 2 == 0; }, {"n"})
        .def("greet", [](std::string name) { return "Hello, " + name + "!"; }, {"name"})
        .def("nothing", [] {})
        .def("maybe_find",
             [](int id) -> std::optional<std::string> {
                 if (id == 1) return std::string{"one"};
                 return std::nullopt;
             },
             {"id"})
        .def("scale", [](int value, std::optional<int> factor) { return value * factor.value_or(1); },
             {"value", "factor"})
        .def("validate", [](int age) {
            if (age < 0) {
                throw Failure("ValidationError", "age must not be negative", 422);
            }
            return age;
        }, {"age"})
        .def("chatty", [](std::string text) {
            std::cout << "out: " << text << "\n";
            std::cerr << "err: " << text << "\n";
            return text.size();
        }, {"text"})
        .def("sleep_ms", [](int ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            return ms;
        }, {"ms"})
        .def("print_after", [](int ms, std::string text) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            std::cout << text << "\n";
            return ms;
        }, {"ms", "text"});
}

void register_records(Module& m) {
    m.def("get_user", [](int id) { return User{id, "Alice", "alice@example.com", Profile{"Lisbon", {"admin"}}}; },
          {"id"})
        .def("list_numbers", [] { return std::vector<int>{3, 1, 2}; })
        .def("origin", [] { return Point{0, 0}; })
        .def("scores", [] { return std::map<std::string, int>{{"alice", 3}, {"bob", 5}}; });
}

void register_services(Module& m) {
    m.type<UserService>("UserService")
        .method("getById", &UserService::get_by_id, {"id"})
        .method("count", &UserService::count);

    m.type<Counter>("Counter").constructor().method("increment", &Counter::increment);
    m.object("default_counter", std::make_shared<Counter>());

    m.type<Orphan>("Orphan").method("seed", &Orphan::seed);

    m.type<Outer>("Outer").constructor().nested<Outer::Inner>("Inner").constructor().method("ping",
                                                                                             &Outer::Inner::ping);

    m.failure<NotFound>("NotFound");
}

void register_async(Registry& registry, Module& m) {
    m.def_async("fetch_after",
                [](int delay_ms, AsyncContext& ctx) {
                    ctx.sleep_for(std::chrono::milliseconds(delay_ms));
                    return delay_ms;
                },
                {"delay_ms"})
        .def_async("fail_after",
                   [](int delay_ms, AsyncContext& ctx) -> int {
                       ctx.sleep_for(std::chrono::milliseconds(delay_ms));
                       throw Failure("FetchError", "upstream failed");
                   },
                   {"delay_ms"})
        .def_async("relay",
                   [&registry](int delay_ms, AsyncContext& ctx) {
                       ctx.checkpoint();
                       Dependency<int(int)> fetch{registry, "example.async.fetch_after"};
                       return fetch(delay_ms) + 1;
                   },
                   {"delay_ms"});
}

}  // namespace

void register_examples(Registry& registry) {
    registry.define("example.math", register_math);
    registry.define("example.records", register_records);
    registry.define("example.services", register_services);
    registry.define("example.async", [&registry](Module& m) { register_async(registry, m); });
    registry.define("example.broken", [](Module&) { throw std::runtime_error("missing native library"); });

    registry.define("payments.gateway", [](Module& m) {
        m.def("charge", [](double amount) { return nlohmann::json{{"status", "charged"}, {"amount", amount}}; },
              {"amount"})
            .failure<PaymentDeclined>("PaymentDeclined");
    });
    registry.define("shop.notifications", [](Module& m) {
        m.def("send", [](std::string message) { return !message.empty(); }, {"message"});
    });
    registry.define("shop.checkout", [](Module& m) {
        m.type<CheckoutService>("CheckoutService").method("checkout", &CheckoutService::checkout, {"amount"});
    });

    registry.factories().define("babel/factories/example/services", [](FactoryModule& f) {
        f.def("user_service", [] { return std::make_shared<UserService>(std::make_shared<UserRepository>()); });
    });
    registry.factories().define("babel/factories/checkout", [&registry](FactoryModule& f) {
        f.def("checkout_service", [&registry] { return std::make_shared<CheckoutService>(registry); });
    });
}

}  // namespace babel::testing::examples
