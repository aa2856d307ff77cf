#include "warden/core/types.hpp"

#include <utility>

#include "warden/core/visit.hpp"

namespace warden::core {

namespace {
    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
} // namespace

SubjectKind subject_kind(const Subject& s) noexcept {
    switch (s.index()) {
        case 0: return SubjectKind::User;
        case 1: return SubjectKind::Group;
        default: return SubjectKind::Policy;
    }
}

Subject to_subject(const GroupIdentity& g) {
    return std::visit([](const auto& v) -> Subject { return v; }, g);
}

std::optional<GroupIdentity> to_group_identity(const Subject& s) {
    return std::visit(Overloaded{
        [](const UserId&) -> std::optional<GroupIdentity> { return std::nullopt; },
        [](const GroupName& g) -> std::optional<GroupIdentity> { return GroupIdentity{g}; },
        [](const PolicyId& p) -> std::optional<GroupIdentity> { return GroupIdentity{p}; },
    }, s);
}

std::string to_string(const FullyQualifiedResourceId& r) {
    return r.type.v + "/" + r.id.v;
}

std::string to_string(const PolicyId& p) {
    return to_string(p.resource) + "/" + p.name.v;
}

std::string to_string(const GroupIdentity& g) {
    return std::visit(Overloaded{
        [](const GroupName& n) { return n.v; },
        [](const PolicyId& p) { return to_string(p); },
    }, g);
}

std::string to_string(const Subject& s) {
    return std::visit(Overloaded{
        [](const UserId& u) { return "user:" + u.v; },
        [](const GroupName& g) { return "group:" + g.v; },
        [](const PolicyId& p) { return "policy:" + to_string(p); },
    }, s);
}

Status parse_resource_id(std::string_view text, FullyQualifiedResourceId* out) noexcept {
    if (out == nullptr) {
        return invalid();
    }
    const size_t slash = text.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 >= text.size()) {
        return invalid();
    }
    const std::string_view id = text.substr(slash + 1);
    if (id.find('/') != std::string_view::npos) {
        return invalid();
    }
    out->type = ResourceTypeName{std::string(text.substr(0, slash))};
    out->id = ResourceId{std::string(id)};
    return ok_status();
}

Status parse_policy_id(std::string_view text, PolicyId* out) noexcept {
    if (out == nullptr) {
        return invalid();
    }
    const size_t last = text.rfind('/');
    if (last == std::string_view::npos || last + 1 >= text.size()) {
        return invalid();
    }
    FullyQualifiedResourceId resource;
    const Status s = parse_resource_id(text.substr(0, last), &resource);
    if (!is_ok(s)) {
        return s;
    }
    out->resource = std::move(resource);
    out->name = PolicyName{std::string(text.substr(last + 1))};
    return ok_status();
}

Status parse_subject(std::string_view text, Subject* out) noexcept {
    if (out == nullptr) {
        return invalid();
    }
    const size_t colon = text.find(':');
    if (colon == std::string_view::npos || colon + 1 >= text.size()) {
        return invalid();
    }
    const std::string_view kind = text.substr(0, colon);
    const std::string_view rest = text.substr(colon + 1);

    if (kind == "user") {
        *out = UserId{std::string(rest)};
        return ok_status();
    }
    if (kind == "group") {
        *out = GroupName{std::string(rest)};
        return ok_status();
    }
    if (kind == "policy") {
        PolicyId p;
        const Status s = parse_policy_id(rest, &p);
        if (!is_ok(s)) {
            return s;
        }
        *out = std::move(p);
        return ok_status();
    }
    return invalid();
}

} // namespace warden::core
