#include "babel_testing/resolver.hpp"

#include "babel_testing/failure.hpp"

#include <sstream>
#include <vector>

namespace {

using namespace babel::testing;

std::vector<std::string> split_target(const std::string& target) {
    std::vector<std::string> parts;
    std::stringstream stream(target);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

std::string join_range(const std::vector<std::string>& parts, std::size_t begin, std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        if (i > begin) out += '.';
        out += parts[i];
    }
    return out;
}

std::string list_names(const std::vector<std::string>& names) {
    if (names.empty()) return "none";
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

/**
 * Shared walk of resolve() and locate(). With `instances` null, types on the path are only
 * traversed; receivers are attached for named objects alone.
 */
Resolution walk(Registry& registry, InstanceRegistry* instances, const std::string& target) {
    const auto parts = split_target(target);
    DiagnosticTrail trail(target);

    if (parts.size() < 2) {
        trail.add_suggestion("Use format: 'module.function' or 'module.Type.method'");
        throw ResolutionError("Invalid target format: " + target, std::move(trail));
    }

    for (std::size_t split = parts.size() - 1; split > 0; --split) {
        const auto module_path = join_range(parts, 0, split);

        std::string reason;
        Module* module = registry.try_load(module_path, reason);
        if (module == nullptr) {
            trail.add_search("load " + module_path, false, reason);
            continue;
        }
        trail.add_search("load " + module_path, true);

        InstancePtr receiver;
        const TypeInfo* current_type = nullptr;
        std::string walked = module_path;
        bool navigated = true;

        for (std::size_t j = split; j + 1 < parts.size(); ++j) {
            const auto& part = parts[j];
            std::shared_ptr<TypeInfo> type;

            if (current_type == nullptr) {
                if (auto object = module->object_named(part)) {
                    receiver = object;
                    current_type = &object->type();
                    walked += "." + part;
                    continue;
                }
                type = module->type_named(part);
            } else {
                type = current_type->nested(part);
            }

            if (!type) {
                trail.add_search(walked + "." + part, false, "member not found");
                navigated = false;
                break;
            }
            current_type = type.get();
            receiver = instances != nullptr ? instances->obtain(*type) : nullptr;
            walked += "." + part;
        }
        if (!navigated) {
            continue;
        }

        const auto& member = parts.back();
        Resolution out;
        out.receiver = receiver;
        out.method_name = member;
        out.root = module;

        if (current_type == nullptr) {
            out.binding = module->function(member);
            if (!out.binding) {
                trail.add_search(target, false, "no function '" + member + "'");
                trail.add_suggestion("Check that '" + member + "' is registered in module " + module_path +
                                     " (members: " + list_names(module->member_names()) + ")");
                throw ResolutionError("Module " + module_path + " has no function '" + member + "'",
                                      std::move(trail));
            }
        } else {
            out.binding = current_type->method(member);
            if (!out.binding) {
                trail.add_search(target, false, "no method '" + member + "'");
                trail.add_suggestion("Check that '" + member + "' is registered on " + current_type->name() +
                                     " (methods: " + list_names(current_type->method_names()) + ")");
                throw ResolutionError("Type " + current_type->name() + " has no method '" + member + "'",
                                      std::move(trail));
            }
        }
        return out;
    }

    trail.add_suggestion("Register the module with registry.define(\"" + parts.front() + "...\", ...)");
    trail.add_suggestion("Check the spelling of every segment of '" + target + "'");
    throw ResolutionError("Could not resolve target: " + target, std::move(trail));
}

}  // namespace

namespace babel::testing {

Resolution Resolver::resolve(const std::string& target) {
    return walk(registry_, &instances_, target);
}

Location Resolver::locate(const std::string& target) const {
    return babel::testing::locate(registry_, target);
}

Location locate(Registry& registry, const std::string& target) {
    auto found = walk(registry, nullptr, target);
    return Location{std::move(found.binding), std::move(found.receiver), found.root, std::move(found.method_name)};
}

}  // namespace babel::testing
