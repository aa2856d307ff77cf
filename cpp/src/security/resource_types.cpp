#include "warden/security/resource_types.hpp"

#include <utility>

namespace warden::security {

using namespace warden::core;

namespace {
    [[nodiscard]] Status sec_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Security, code);
    }
} // namespace

Status ResourceTypeRegistry::add(const ResourceType& type, ErrorReport* report) {
    if (type.name.empty()) {
        report_error(report, sec_status(StatusCode::Invalid), "resource type with an empty name");
        return sec_status(StatusCode::Invalid);
    }
    if (types_.count(type.name) != 0) {
        report_error(report, sec_status(StatusCode::Conflict), "resource type " + type.name.v + " defined twice");
        return sec_status(StatusCode::Conflict);
    }
    if (type.roles.count(type.owner_role) == 0) {
        report_error(report, sec_status(StatusCode::Invalid),
                     "resource type " + type.name.v + ": owner role '" + type.owner_role.v + "' is not one of its roles");
        return sec_status(StatusCode::Invalid);
    }
    for (const auto& [name, role] : type.roles) {
        if (name != role.name) {
            report_error(report, sec_status(StatusCode::Invalid),
                         "resource type " + type.name.v + ": role key '" + name.v + "' does not match role '" +
                             role.name.v + "'");
            return sec_status(StatusCode::Invalid);
        }
    }

    Entry entry;
    entry.type = type;
    for (const std::string& pattern : type.action_patterns) {
        try {
            entry.patterns.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            report_error(report, sec_status(StatusCode::Invalid),
                         "resource type " + type.name.v + ": bad action pattern '" + pattern + "': " + e.what());
            return sec_status(StatusCode::Invalid);
        }
    }
    types_.emplace(type.name, std::move(entry));
    return ok_status();
}

const ResourceType* ResourceTypeRegistry::find(const ResourceTypeName& name) const noexcept {
    const auto it = types_.find(name);
    return it == types_.end() ? nullptr : &it->second.type;
}

bool ResourceTypeRegistry::has_role(const ResourceTypeName& type, const RoleName& role) const noexcept {
    const ResourceType* t = find(type);
    return t != nullptr && t->roles.count(role) != 0;
}

bool ResourceTypeRegistry::action_allowed(const ResourceTypeName& type, const ActionName& action) const {
    const auto it = types_.find(type);
    if (it == types_.end()) {
        return false;
    }
    for (const std::regex& re : it->second.patterns) {
        if (std::regex_match(action.v, re)) {
            return true;
        }
    }
    for (const auto& [name, role] : it->second.type.roles) {
        if (role.actions.count(action) != 0) {
            return true;
        }
    }
    return false;
}

std::set<ActionName> ResourceTypeRegistry::role_actions(const ResourceTypeName& type,
                                                        const std::set<RoleName>& roles) const {
    std::set<ActionName> out;
    const ResourceType* t = find(type);
    if (t == nullptr) {
        return out;
    }
    for (const RoleName& r : roles) {
        const auto it = t->roles.find(r);
        if (it != t->roles.end()) {
            out.insert(it->second.actions.begin(), it->second.actions.end());
        }
    }
    return out;
}

std::vector<const ResourceType*> ResourceTypeRegistry::all() const {
    std::vector<const ResourceType*> out;
    out.reserve(types_.size());
    for (const auto& [name, entry] : types_) {
        out.push_back(&entry.type);
    }
    return out;
}

} // namespace warden::security
