#include "babel_testing/registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace babel::testing {

Arguments::Arguments(json kwargs) : kwargs_(std::move(kwargs)) {
    if (kwargs_.is_null()) {
        kwargs_ = json::object();
    }
    if (!kwargs_.is_object()) {
        throw Failure("TypeError", "arguments must be a JSON object");
    }
}

bool Arguments::has(const std::string& name) const {
    return kwargs_.contains(name);
}

CallablePtr Binding::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callable_;
}

CallablePtr Binding::exchange(CallablePtr replacement) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::swap(callable_, replacement);
    return replacement;
}

BindingPtr TypeInfo::method(const std::string& name) const {
    auto it = methods_.find(name);
    return it == methods_.end() ? nullptr : it->second;
}

std::shared_ptr<TypeInfo> TypeInfo::nested(const std::string& name) const {
    auto it = nested_.find(name);
    return it == nested_.end() ? nullptr : it->second;
}

std::vector<std::string> TypeInfo::method_names() const {
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& [name, binding] : methods_) {
        names.push_back(name);
    }
    return names;
}

namespace detail {

void check_arity(const std::string& name, std::size_t expected, std::size_t given) {
    if (expected != given) {
        throw std::invalid_argument("registration of '" + name + "' names " + std::to_string(given) +
                                    " parameter(s) but the callable takes " + std::to_string(expected));
    }
}

void reject_unknown_arguments(const std::string& name, const std::vector<std::string>& params,
                              const Arguments& args) {
    for (const auto& item : args.raw().items()) {
        if (std::find(params.begin(), params.end(), item.key()) == params.end()) {
            throw Failure("TypeError", name + "() got an unexpected argument '" + item.key() + "'");
        }
    }
}

void throw_missing_receiver(const std::string& name) {
    throw Failure("TypeError", "method '" + name + "' called without a receiver instance");
}

}  // namespace detail

BindingPtr Module::function(const std::string& name) const {
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : it->second;
}

std::shared_ptr<TypeInfo> Module::type_named(const std::string& name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : it->second;
}

InstancePtr Module::object_named(const std::string& name) const {
    auto it = objects_.find(name);
    return it == objects_.end() ? nullptr : it->second;
}

const FailureFactory* Module::failure_named(const std::string& name) const {
    auto it = failures_.find(name);
    return it == failures_.end() ? nullptr : &it->second;
}

std::vector<std::string> Module::member_names() const {
    std::vector<std::string> names;
    for (const auto& entry : functions_) names.push_back(entry.first);
    for (const auto& entry : types_) names.push_back(entry.first);
    for (const auto& entry : objects_) names.push_back(entry.first);
    std::sort(names.begin(), names.end());
    return names;
}

const TypeInfo* Module::find_type_by_index(std::type_index index) const {
    std::vector<const TypeInfo*> pending;
    for (const auto& entry : types_) {
        pending.push_back(entry.second.get());
    }
    while (!pending.empty()) {
        const TypeInfo* info = pending.back();
        pending.pop_back();
        if (info->type() == index) {
            return info;
        }
        for (const auto& entry : info->nested_) {
            pending.push_back(entry.second.get());
        }
    }
    return nullptr;
}

const FactoryModule::Factory* FactoryModule::find(const std::string& name) const {
    auto it = factories_.find(name);
    return it == factories_.end() ? nullptr : &it->second;
}

void FactoryTable::define(const std::string& location, Loader loader) {
    loaders_[location] = std::move(loader);
}

const FactoryTable::Loader* FactoryTable::find(const std::string& location) const {
    auto it = loaders_.find(location);
    return it == loaders_.end() ? nullptr : &it->second;
}

void Registry::define(const std::string& name, ModuleInit init) {
    if (name.empty()) {
        throw std::invalid_argument("module name must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = modules_[name];
    entry.init = std::move(init);
    entry.module.reset();
    entry.load_error.reset();
}

Module* Registry::try_load(const std::string& name, std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = modules_.find(name);
    if (it == modules_.end()) {
        reason = "module not registered";
        return nullptr;
    }

    auto& entry = it->second;
    if (entry.module) {
        return entry.module.get();
    }
    if (entry.load_error) {
        reason = *entry.load_error;
        return nullptr;
    }

    auto module = std::make_unique<Module>(name);
    try {
        entry.init(*module);
    } catch (const std::exception& ex) {
        entry.load_error = std::string{"module init failed: "} + ex.what();
        reason = *entry.load_error;
        return nullptr;
    }
    entry.module = std::move(module);
    return entry.module.get();
}

bool Registry::is_defined(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_.count(name) != 0;
}

}  // namespace babel::testing
