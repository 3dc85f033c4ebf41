#pragma once

#include "failure.hpp"
#include "ir.hpp"
#include "value.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace babel::testing {

class AsyncContext;
class TypeInfo;

/**
 * \brief Keyword arguments of one call (the test's `given` block).
 */
class Arguments {
public:
    Arguments() = default;
    explicit Arguments(json kwargs);

    [[nodiscard]] const json& raw() const noexcept { return kwargs_; }
    [[nodiscard]] bool has(const std::string& name) const;

    /// Converts one argument. Missing or mistyped arguments raise a `TypeError` Failure;
    /// std::optional parameters accept a missing argument as nullopt.
    template <typename T>
    [[nodiscard]] T get(const std::string& name) const;

private:
    json kwargs_ = json::object();
};

/**
 * \brief Type-erased receiver instance together with its registered type.
 */
class Instance {
public:
    Instance(std::shared_ptr<void> object, const TypeInfo& type) : object_{std::move(object)}, type_{&type} {}

    [[nodiscard]] const TypeInfo& type() const noexcept { return *type_; }
    [[nodiscard]] const std::shared_ptr<void>& object() const noexcept { return object_; }

    template <typename T>
    [[nodiscard]] T& as() const;

private:
    std::shared_ptr<void> object_;
    const TypeInfo* type_;
};

using InstancePtr = std::shared_ptr<Instance>;

/**
 * \brief Invocable entry: either a synchronous function or an async operation.
 *
 * `receiver` is null for module-level functions.
 */
struct Callable {
    using SyncFn = std::function<Value(Instance* receiver, const Arguments& args)>;
    using AsyncFn = std::function<Value(Instance* receiver, const Arguments& args, AsyncContext& ctx)>;

    std::string name;
    std::vector<std::string> params;
    SyncFn sync;
    AsyncFn async;

    [[nodiscard]] bool is_async() const noexcept { return static_cast<bool>(async); }
};

using CallablePtr = std::shared_ptr<const Callable>;

/**
 * \brief Swappable slot every function and method is called through.
 *
 * Mocks and spies exchange the callable for the duration of one test.
 */
class Binding {
public:
    explicit Binding(CallablePtr callable) : callable_{std::move(callable)} {}

    [[nodiscard]] CallablePtr get() const;

    /// Installs `replacement` and returns what was bound before.
    CallablePtr exchange(CallablePtr replacement);

private:
    mutable std::mutex mutex_;
    CallablePtr callable_;
};

using BindingPtr = std::shared_ptr<Binding>;

/// Builds the exception a named failure type raises, from its message.
using FailureFactory = std::function<std::exception_ptr(const std::string& message)>;

/**
 * \brief Registered class: how to build it, its methods and its nested types.
 */
class TypeInfo {
public:
    using Constructor = std::function<std::shared_ptr<void>()>;

    TypeInfo(std::string name, std::string module_name, std::string path, std::type_index type)
        : name_{std::move(name)}, module_name_{std::move(module_name)}, path_{std::move(path)}, type_{type} {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    /// Dotted module the type was registered in.
    [[nodiscard]] const std::string& module_name() const noexcept { return module_name_; }
    /// Fully-qualified path (`module.Outer.Inner`), the instance cache key.
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::type_index type() const noexcept { return type_; }

    [[nodiscard]] const Constructor& constructor() const noexcept { return constructor_; }
    [[nodiscard]] BindingPtr method(const std::string& name) const;
    [[nodiscard]] std::shared_ptr<TypeInfo> nested(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> method_names() const;

private:
    template <typename T>
    friend class TypeBuilder;
    friend class Module;

    std::string name_;
    std::string module_name_;
    std::string path_;
    std::type_index type_;
    Constructor constructor_;
    std::map<std::string, BindingPtr> methods_;
    std::map<std::string, std::shared_ptr<TypeInfo>> nested_;
};

namespace detail {

template <typename... A>
struct type_list {};

template <typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template <typename R, typename... A>
struct function_traits<R (*)(A...)> {
    using result = R;
    using args = type_list<A...>;
    static constexpr std::size_t arity = sizeof...(A);
};

template <typename R, typename C, typename... A>
struct function_traits<R (C::*)(A...)> {
    using result = R;
    using owner = C;
    using args = type_list<A...>;
    static constexpr std::size_t arity = sizeof...(A);
};

template <typename R, typename C, typename... A>
struct function_traits<R (C::*)(A...) const> : function_traits<R (C::*)(A...)> {};

template <typename Head, typename List>
struct prepend;
template <typename Head, typename... A>
struct prepend<Head, type_list<A...>> {
    using type = type_list<Head, A...>;
};

/// Splits a parameter list into everything but the last parameter, and the last one.
template <typename List>
struct drop_last;
template <typename Last>
struct drop_last<type_list<Last>> {
    using type = type_list<>;
    using last = Last;
};
template <typename First, typename Second, typename... Rest>
struct drop_last<type_list<First, Second, Rest...>> {
    using tail = drop_last<type_list<Second, Rest...>>;
    using type = typename prepend<First, typename tail::type>::type;
    using last = typename tail::last;
};

template <typename R, typename F>
Value finish(F&& call) {
    if constexpr (std::is_void_v<R>) {
        std::forward<F>(call)();
        return Value{};
    } else {
        return capture(std::forward<F>(call)());
    }
}

/// Calls `fn(prefix..., args[names[I]]...)` with each argument converted to its parameter type.
template <typename R, typename Fn, typename... A, std::size_t... I, typename... Prefix>
Value apply_named(Fn& fn, const Arguments& args, const std::vector<std::string>& names, type_list<A...>,
                  std::index_sequence<I...>, Prefix&&... prefix) {
    return finish<R>([&]() -> R {
        return std::invoke(fn, std::forward<Prefix>(prefix)..., args.get<std::decay_t<A>>(names[I])...);
    });
}

void check_arity(const std::string& name, std::size_t expected, std::size_t given);
void reject_unknown_arguments(const std::string& name, const std::vector<std::string>& params,
                              const Arguments& args);
[[noreturn]] void throw_missing_receiver(const std::string& name);

}  // namespace detail

class Module;

/**
 * \brief Fluent registration of one C++ class inside a module.
 *
 * \code
 * module.type<UserService>("UserService")
 *     .constructor()
 *     .method("getById", &UserService::get_by_id, {"id"});
 * \endcode
 */
template <typename T>
class TypeBuilder {
public:
    TypeBuilder(Module& module, TypeInfo& info) : module_{module}, info_{info} {}

    /// Registers the zero-argument constructor as the last-resort construction path.
    TypeBuilder& constructor() {
        static_assert(std::is_default_constructible_v<T>, "constructor() needs a default-constructible type");
        info_.constructor_ = [] { return std::static_pointer_cast<void>(std::make_shared<T>()); };
        return *this;
    }

    template <typename Method>
    TypeBuilder& method(const std::string& name, Method fn, std::vector<std::string> params = {}) {
        using traits = detail::function_traits<Method>;
        using args = typename traits::args;
        detail::check_arity(info_.path() + "." + name, traits::arity, params.size());

        auto callable = std::make_shared<Callable>();
        callable->name = name;
        callable->params = params;
        callable->sync = [fn, params, name](Instance* receiver, const Arguments& arguments) {
            if (receiver == nullptr) {
                detail::throw_missing_receiver(name);
            }
            detail::reject_unknown_arguments(name, params, arguments);
            T& self = receiver->as<T>();
            return detail::apply_named<typename traits::result>(fn, arguments, params, args{},
                                                                std::make_index_sequence<traits::arity>{}, self);
        };
        info_.methods_[name] = std::make_shared<Binding>(std::move(callable));
        return *this;
    }

    /// Registers an async method; its last parameter must be `AsyncContext&`.
    template <typename Method>
    TypeBuilder& method_async(const std::string& name, Method fn, std::vector<std::string> params = {}) {
        using traits = detail::function_traits<Method>;
        using split = detail::drop_last<typename traits::args>;
        static_assert(std::is_same_v<typename split::last, AsyncContext&>,
                      "async methods take AsyncContext& as their last parameter");
        detail::check_arity(info_.path() + "." + name, traits::arity - 1, params.size());

        auto callable = std::make_shared<Callable>();
        callable->name = name;
        callable->params = params;
        callable->async = [fn, params, name](Instance* receiver, const Arguments& arguments, AsyncContext& ctx) {
            if (receiver == nullptr) {
                detail::throw_missing_receiver(name);
            }
            detail::reject_unknown_arguments(name, params, arguments);
            T& self = receiver->as<T>();
            return finish_async(fn, self, arguments, params, ctx, typename split::type{},
                                std::make_index_sequence<traits::arity - 1>{});
        };
        info_.methods_[name] = std::make_shared<Binding>(std::move(callable));
        return *this;
    }

    /// Registers a type nested in this one (`Outer.Inner` in target paths).
    template <typename U>
    TypeBuilder<U> nested(const std::string& name) {
        auto info = std::make_shared<TypeInfo>(name, info_.module_name(), info_.path() + "." + name,
                                               std::type_index(typeid(U)));
        info_.nested_[name] = info;
        return TypeBuilder<U>{module_, *info};
    }

    [[nodiscard]] const TypeInfo& info() const noexcept { return info_; }

private:
    template <typename Method, typename... A, std::size_t... I>
    static Value finish_async(Method& fn, T& self, const Arguments& arguments, const std::vector<std::string>& params,
                              AsyncContext& ctx, detail::type_list<A...>, std::index_sequence<I...>) {
        using R = typename detail::function_traits<std::remove_const_t<Method>>::result;
        return detail::finish<R>([&]() -> R {
            return std::invoke(fn, self, arguments.get<std::decay_t<A>>(params[I])..., ctx);
        });
    }

    Module& module_;
    TypeInfo& info_;
};

/**
 * \brief Named unit of registered targets: functions, types, objects and failure types.
 */
class Module {
public:
    explicit Module(std::string name) : name_{std::move(name)} {}

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Registers a synchronous function; `params` names each C++ parameter in order.
    template <typename Fn>
    Module& def(const std::string& name, Fn fn, std::vector<std::string> params = {}) {
        using traits = detail::function_traits<Fn>;
        detail::check_arity(name_ + "." + name, traits::arity, params.size());

        auto callable = std::make_shared<Callable>();
        callable->name = name;
        callable->params = params;
        callable->sync = [fn, params, name](Instance*, const Arguments& arguments) mutable {
            detail::reject_unknown_arguments(name, params, arguments);
            return detail::apply_named<typename traits::result>(fn, arguments, params, typename traits::args{},
                                                                std::make_index_sequence<traits::arity>{});
        };
        functions_[name] = std::make_shared<Binding>(std::move(callable));
        return *this;
    }

    /// Registers an async operation; its last parameter must be `AsyncContext&`.
    template <typename Fn>
    Module& def_async(const std::string& name, Fn fn, std::vector<std::string> params = {}) {
        using traits = detail::function_traits<Fn>;
        using split = detail::drop_last<typename traits::args>;
        static_assert(std::is_same_v<typename split::last, AsyncContext&>,
                      "async functions take AsyncContext& as their last parameter");
        detail::check_arity(name_ + "." + name, traits::arity - 1, params.size());

        auto callable = std::make_shared<Callable>();
        callable->name = name;
        callable->params = params;
        callable->async = [fn, params, name](Instance*, const Arguments& arguments, AsyncContext& ctx) mutable {
            detail::reject_unknown_arguments(name, params, arguments);
            return call_async(fn, arguments, params, ctx, typename split::type{},
                              std::make_index_sequence<traits::arity - 1>{});
        };
        functions_[name] = std::make_shared<Binding>(std::move(callable));
        return *this;
    }

    template <typename T>
    TypeBuilder<T> type(const std::string& name) {
        auto info = std::make_shared<TypeInfo>(name, name_, name_ + "." + name, std::type_index(typeid(T)));
        types_[name] = info;
        return TypeBuilder<T>{*this, *info};
    }

    /// Registers a pre-built instance; `T` must already be registered as a type of this module.
    template <typename T>
    Module& object(const std::string& name, std::shared_ptr<T> instance) {
        const TypeInfo* info = find_type_by_index(std::type_index(typeid(T)));
        if (info == nullptr) {
            throw std::logic_error("object '" + name_ + "." + name + "' has an unregistered type");
        }
        objects_[name] = std::make_shared<Instance>(std::static_pointer_cast<void>(std::move(instance)), *info);
        return *this;
    }

    /// Registers a failure type raised by mocks naming it; `E` must be constructible from a message.
    template <typename E>
    Module& failure(const std::string& name) {
        static_assert(std::is_constructible_v<E, std::string>, "failure types are built from their message");
        failures_[name] = [](const std::string& message) { return std::make_exception_ptr(E(message)); };
        return *this;
    }

    [[nodiscard]] BindingPtr function(const std::string& name) const;
    [[nodiscard]] std::shared_ptr<TypeInfo> type_named(const std::string& name) const;
    [[nodiscard]] InstancePtr object_named(const std::string& name) const;
    [[nodiscard]] const FailureFactory* failure_named(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> member_names() const;

private:
    template <typename Fn, typename... A, std::size_t... I>
    static Value call_async(Fn& fn, const Arguments& arguments, const std::vector<std::string>& params,
                            AsyncContext& ctx, detail::type_list<A...>, std::index_sequence<I...>) {
        using R = typename detail::function_traits<Fn>::result;
        return detail::finish<R>([&]() -> R { return fn(arguments.get<std::decay_t<A>>(params[I])..., ctx); });
    }

    [[nodiscard]] const TypeInfo* find_type_by_index(std::type_index index) const;

    std::string name_;
    std::map<std::string, BindingPtr> functions_;
    std::map<std::string, std::shared_ptr<TypeInfo>> types_;
    std::map<std::string, InstancePtr> objects_;
    std::map<std::string, FailureFactory> failures_;
};

/**
 * \brief Zero-argument factories found at one factory location.
 */
class FactoryModule {
public:
    struct Factory {
        std::type_index type;
        std::function<std::shared_ptr<void>()> make;
    };

    /// `fn` takes no arguments and returns `std::shared_ptr<T>`.
    template <typename Fn>
    FactoryModule& def(const std::string& name, Fn fn) {
        using Ptr = std::invoke_result_t<Fn&>;
        using T = typename Ptr::element_type;
        factories_.insert_or_assign(
            name, Factory{std::type_index(typeid(T)), [fn]() mutable { return std::static_pointer_cast<void>(fn()); }});
        return *this;
    }

    [[nodiscard]] const Factory* find(const std::string& name) const;

private:
    std::map<std::string, Factory> factories_;
};

/**
 * \brief Factory locations (`babel/factories/example/services`) mapped to their loaders.
 */
class FactoryTable {
public:
    using Loader = std::function<void(FactoryModule&)>;

    void define(const std::string& location, Loader loader);
    [[nodiscard]] const Loader* find(const std::string& location) const;

private:
    std::map<std::string, Loader> loaders_;
};

/**
 * \brief Every module reachable from a target path, loaded lazily on first use.
 *
 * \code
 * Registry registry;
 * registry.define("example.math", [](Module& m) {
 *     m.def("add", [](int a, int b) { return a + b; }, {"a", "b"});
 * });
 * \endcode
 */
class Registry {
public:
    using ModuleInit = std::function<void(Module&)>;

    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void define(const std::string& name, ModuleInit init);

    /// Loads (once) and returns the module, or nullptr with `reason` set when it is unknown or its init threw.
    [[nodiscard]] Module* try_load(const std::string& name, std::string& reason);

    [[nodiscard]] bool is_defined(const std::string& name) const;
    [[nodiscard]] FactoryTable& factories() noexcept { return factories_; }
    [[nodiscard]] const FactoryTable& factories() const noexcept { return factories_; }

private:
    struct Entry {
        ModuleInit init;
        std::unique_ptr<Module> module;
        std::optional<std::string> load_error;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> modules_;
    FactoryTable factories_;
};

// ---------------------------------------------------------------------------------------------

template <typename T>
T Arguments::get(const std::string& name) const {
    if constexpr (detail::is_optional<T>::value) {
        if (!has(name) || kwargs_.at(name).is_null()) {
            return std::nullopt;
        }
        return get<typename T::value_type>(name);
    } else {
        if (!has(name)) {
            throw Failure("TypeError", "missing required argument '" + name + "'");
        }
        try {
            return kwargs_.at(name).template get<T>();
        } catch (const json::exception& ex) {
            throw Failure("TypeError", "argument '" + name + "' has the wrong type: " + ex.what());
        }
    }
}

template <typename T>
T& Instance::as() const {
    if (type_->type() != std::type_index(typeid(T))) {
        throw std::logic_error("instance of " + type_->path() + " accessed as " + unqualified_type_name(typeid(T)));
    }
    return *static_cast<T*>(object_.get());
}

}  // namespace babel::testing
