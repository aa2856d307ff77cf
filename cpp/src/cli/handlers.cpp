#include "warden/cli/handlers.hpp"

#include <cstring>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::cli {

using namespace warden::core;
using warden::service::AccessService;

namespace {

// ========================================================================
// Argument handling
// ========================================================================

constexpr u32 kMaxOptions = 64;

const OptionSpec kCommandOptions[] = {
    {OptionId::Disabled, OptionType::Flag, "disabled", '\0'},
    {OptionId::Parent, OptionType::String, "parent", 'p'},
    {OptionId::AuthDomain, OptionType::String, "auth-domain", '\0'},
    {OptionId::Member, OptionType::String, "member", 'm'},
    {OptionId::Role, OptionType::String, "role", 'r'},
    {OptionId::Action, OptionType::String, "action", 'a'},
    {OptionId::DescendantRole, OptionType::String, "descendant-role", '\0'},
    {OptionId::DescendantAction, OptionType::String, "descendant-action", '\0'},
    {OptionId::Public, OptionType::String, "public", '\0'},
    {OptionId::Record, OptionType::I64, "record", '\0'},
    {OptionId::Limit, OptionType::I64, "limit", 'n'},
};
constexpr u32 kCommandOptionCount = sizeof(kCommandOptions) / sizeof(kCommandOptions[0]);

// Positionals and options may interleave; options are collected in order.
struct CommandArgs {
    std::vector<std::string_view> positional;
    ParsedOption storage[kMaxOptions]{};
    ParsedOptions options{storage, 0, kMaxOptions};

    [[nodiscard]] std::vector<const char*> strings(OptionId id) const {
        std::vector<const char*> out;
        for (u32 i = 0; i < options.len; ++i) {
            if (options.data[i].id == id) {
                out.push_back(options.data[i].value.str);
            }
        }
        return out;
    }

    [[nodiscard]] bool flag(OptionId id) const noexcept { return find_option(options, id) != nullptr; }
};

Status split_args(const CliArgs& args, CommandArgs* out) {
    u32 i = 0;
    while (i < args.argc) {
        const char* tok = args.argv[i];
        if (tok[0] != '-' || tok[1] == '\0') {
            out->positional.emplace_back(tok);
            ++i;
            continue;
        }
        ParsedOption chunk_storage[kMaxOptions]{};
        ParsedOptions chunk{chunk_storage, 0, kMaxOptions - out->options.len};
        u32 consumed = 0;
        const Status s = parse_options(CliArgs{args.argv + i, args.argc - i}, kCommandOptions, kCommandOptionCount,
                                       &chunk, &consumed);
        if (!is_ok(s)) {
            return s;
        }
        for (u32 j = 0; j < chunk.len; ++j) {
            out->options.data[out->options.len++] = chunk.data[j];
        }
        // "--" ends option parsing; the rest is positional.
        const bool terminated = consumed > 0 && std::strcmp(args.argv[i + consumed - 1], "--") == 0;
        i += consumed;
        if (terminated) {
            for (; i < args.argc; ++i) {
                out->positional.emplace_back(args.argv[i]);
            }
        }
    }
    return ok_status();
}

// ========================================================================
// Output
// ========================================================================

int fail(std::FILE* err, const char* context, Status s, const ErrorReport& report) {
    const std::string& message = report.message.empty() ? std::string(status_domain_name(s.domain)) : report.message;
    std::fprintf(err, "error: %s: %s: %s\n", context, status_code_name(s.code), message.c_str());
    return 1;
}

int usage(std::FILE* err, const char* context, const char* message) {
    std::fprintf(err, "error: %s: %s: %s\n", context, status_code_name(StatusCode::Invalid), message);
    return 1;
}

template <typename T>
std::string join_names(const std::set<Name<T>>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) {
            out += ',';
        }
        out += n.v;
    }
    return out;
}

std::string join_subjects(const std::set<Subject>& subjects) {
    std::string out;
    for (const auto& s : subjects) {
        if (!out.empty()) {
            out += ',';
        }
        out += to_string(s);
    }
    return out;
}

void print_policy(std::FILE* out, const AccessPolicy& p) {
    std::fprintf(out, "%s public=%s version=%lld roles=%s actions=%s members=%s\n", to_string(p.id).c_str(),
                 p.is_public ? "true" : "false", static_cast<long long>(p.version), join_names(p.roles).c_str(),
                 join_names(p.actions).c_str(), join_subjects(p.members).c_str());
    for (const auto& d : p.descendant_permissions) {
        std::fprintf(out, "  descendants %s roles=%s actions=%s\n", d.resource_type.v.c_str(),
                     join_names(d.roles).c_str(), join_names(d.actions).c_str());
    }
}

// ========================================================================
// Parsing helpers
// ========================================================================

// "policy:t/id/name" names a policy; "group:x" or a bare name a group.
bool parse_group(std::string_view text, GroupIdentity* out) {
    constexpr std::string_view kPolicy = "policy:";
    constexpr std::string_view kGroup = "group:";
    if (text.substr(0, kPolicy.size()) == kPolicy) {
        PolicyId id;
        if (!is_ok(parse_policy_id(text.substr(kPolicy.size()), &id))) {
            return false;
        }
        *out = std::move(id);
        return true;
    }
    if (text.substr(0, kGroup.size()) == kGroup) {
        text.remove_prefix(kGroup.size());
    }
    if (text.empty()) {
        return false;
    }
    *out = GroupName{std::string(text)};
    return true;
}

// "type:name"
template <typename T>
bool parse_typed(std::string_view text, ResourceTypeName* type, Name<T>* name) {
    const size_t colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return false;
    }
    *type = ResourceTypeName{std::string(text.substr(0, colon))};
    *name = Name<T>{std::string(text.substr(colon + 1))};
    return true;
}

bool parse_bool(const char* text, bool* out) {
    if (std::strcmp(text, "true") == 0 || std::strcmp(text, "1") == 0) {
        *out = true;
        return true;
    }
    if (std::strcmp(text, "false") == 0 || std::strcmp(text, "0") == 0) {
        *out = false;
        return true;
    }
    return false;
}

// ========================================================================
// Command Handlers
// ========================================================================

class Runner {
public:
    Runner(CliSession& session, std::FILE* out, std::FILE* err)
        : session_(session), access_(*session.access), out_(out), err_(err) {}

    int run(CommandId id, const CommandArgs& a);

private:
    [[nodiscard]] const RequestContext& ctx() const { return session_.ctx; }

    bool caller(const char* context, UserId* out) {
        if (session_.acting_user.empty()) {
            usage(err_, context, "--as USER is required");
            return false;
        }
        *out = UserId{session_.acting_user};
        return true;
    }

    // Optional trailing user positional, else the acting user.
    bool subject_user(const char* context, const CommandArgs& a, size_t index, UserId* out) {
        if (a.positional.size() > index) {
            *out = UserId{std::string(a.positional[index])};
            return true;
        }
        return caller(context, out);
    }

    int init();
    int create_user(const CommandArgs& a);
    int set_enabled(const CommandArgs& a, bool enabled);
    int create_group(const CommandArgs& a);
    int delete_group(const CommandArgs& a);
    int change_member(const CommandArgs& a, bool add);
    int is_member(const CommandArgs& a);
    int ancestors(const CommandArgs& a);
    int flatten(const CommandArgs& a);
    int intersect(const CommandArgs& a);
    int create_resource(const CommandArgs& a);
    int delete_resource(const CommandArgs& a);
    int set_parent(const CommandArgs& a);
    int get_parent(const CommandArgs& a);
    int overwrite_policy(const CommandArgs& a);
    int delete_policy(const CommandArgs& a);
    int list_policies(const CommandArgs& a);
    int check(const CommandArgs& a);
    int actions(const CommandArgs& a);
    int roles(const CommandArgs& a);
    int list_resources(const CommandArgs& a);
    int sync_status(const CommandArgs& a);

    CliSession& session_;
    AccessService& access_;
    std::FILE* out_;
    std::FILE* err_;
};

int Runner::init() {
    ErrorReport report;
    const Status s = access_.init(ctx(), &report);
    if (!is_ok(s)) {
        return fail(err_, "init", s, report);
    }
    std::fprintf(out_, "registered %zu resource types\n", access_.types().size());
    return 0;
}

int Runner::create_user(const CommandArgs& a) {
    if (a.positional.size() != 2) {
        return usage(err_, "create-user", "expected: create-user <id> <email> [--disabled]");
    }
    ErrorReport report;
    User user;
    const Status s = access_.create_user(ctx(), UserId{std::string(a.positional[0])},
                                         Email{std::string(a.positional[1])}, !a.flag(OptionId::Disabled), &user,
                                         &report);
    if (!is_ok(s)) {
        return fail(err_, "create-user", s, report);
    }
    std::fprintf(out_, "%s %s %s\n", user.id.v.c_str(), user.email.v.c_str(), user.enabled ? "enabled" : "disabled");
    return 0;
}

int Runner::set_enabled(const CommandArgs& a, bool enabled) {
    const char* context = enabled ? "enable-user" : "disable-user";
    if (a.positional.size() != 1) {
        return usage(err_, context, "expected a user id");
    }
    ErrorReport report;
    const Status s = access_.set_user_enabled(ctx(), UserId{std::string(a.positional[0])}, enabled, &report);
    if (!is_ok(s)) {
        return fail(err_, context, s, report);
    }
    return 0;
}

int Runner::create_group(const CommandArgs& a) {
    if (a.positional.size() != 2) {
        return usage(err_, "create-group", "expected: create-group <name> <email> [--member SUBJECT]...");
    }
    std::set<Subject> members;
    for (const char* m : a.strings(OptionId::Member)) {
        Subject subject;
        if (!is_ok(parse_subject(m, &subject))) {
            return usage(err_, "create-group", "members are user:<id>, group:<name> or policy:<type>/<id>/<name>");
        }
        members.insert(std::move(subject));
    }
    ErrorReport report;
    Group group;
    const Status s = access_.create_group(ctx(), GroupName{std::string(a.positional[0])},
                                          Email{std::string(a.positional[1])}, members, &group, &report);
    if (!is_ok(s)) {
        return fail(err_, "create-group", s, report);
    }
    std::fprintf(out_, "%s %s version=%lld\n", group.name.v.c_str(), group.email.v.c_str(),
                 static_cast<long long>(group.version));
    return 0;
}

int Runner::delete_group(const CommandArgs& a) {
    if (a.positional.size() != 1) {
        return usage(err_, "delete-group", "expected a group name");
    }
    ErrorReport report;
    const Status s = access_.delete_group(ctx(), GroupName{std::string(a.positional[0])}, &report);
    if (!is_ok(s)) {
        return fail(err_, "delete-group", s, report);
    }
    return 0;
}

int Runner::change_member(const CommandArgs& a, bool add) {
    const char* context = add ? "add-member" : "remove-member";
    GroupIdentity group;
    Subject member;
    if (a.positional.size() != 2 || !parse_group(a.positional[0], &group) ||
        !is_ok(parse_subject(a.positional[1], &member))) {
        return usage(err_, context, "expected: <group> <subject>");
    }
    ErrorReport report;
    bool changed = false;
    const Status s = add ? access_.add_member(ctx(), group, member, &changed, &report)
                         : access_.remove_member(ctx(), group, member, &changed, &report);
    if (!is_ok(s)) {
        return fail(err_, context, s, report);
    }
    std::fprintf(out_, "%s\n", changed ? (add ? "added" : "removed") : "unchanged");
    return 0;
}

int Runner::is_member(const CommandArgs& a) {
    GroupIdentity group;
    Subject member;
    if (a.positional.size() != 2 || !parse_group(a.positional[0], &group) ||
        !is_ok(parse_subject(a.positional[1], &member))) {
        return usage(err_, "is-member", "expected: is-member <group> <subject>");
    }
    ErrorReport report;
    bool member_of = false;
    const Status s = access_.is_member(ctx(), group, member, &member_of, &report);
    if (!is_ok(s)) {
        return fail(err_, "is-member", s, report);
    }
    std::fprintf(out_, "%s\n", member_of ? "true" : "false");
    return 0;
}

int Runner::ancestors(const CommandArgs& a) {
    Subject subject;
    if (a.positional.size() != 1 || !is_ok(parse_subject(a.positional[0], &subject))) {
        return usage(err_, "ancestors", "expected a subject");
    }
    ErrorReport report;
    std::vector<GroupIdentity> groups;
    const Status s = access_.list_ancestor_groups(ctx(), subject, &groups, &report);
    if (!is_ok(s)) {
        return fail(err_, "ancestors", s, report);
    }
    for (const auto& g : groups) {
        std::fprintf(out_, "%s\n", to_string(to_subject(g)).c_str());
    }
    return 0;
}

int Runner::flatten(const CommandArgs& a) {
    GroupIdentity group;
    if (a.positional.size() != 1 || !parse_group(a.positional[0], &group)) {
        return usage(err_, "flatten", "expected a group");
    }
    ErrorReport report;
    std::vector<UserId> users;
    const Status s = access_.list_flattened_members(ctx(), group, &users, &report);
    if (!is_ok(s)) {
        return fail(err_, "flatten", s, report);
    }
    for (const auto& u : users) {
        std::fprintf(out_, "%s\n", u.v.c_str());
    }
    return 0;
}

int Runner::intersect(const CommandArgs& a) {
    if (a.positional.empty()) {
        return usage(err_, "intersect", "expected one or more groups");
    }
    std::vector<GroupIdentity> groups;
    for (const auto& text : a.positional) {
        GroupIdentity g;
        if (!parse_group(text, &g)) {
            return usage(err_, "intersect", "invalid group");
        }
        groups.push_back(std::move(g));
    }
    ErrorReport report;
    std::vector<UserId> users;
    const Status s = access_.intersect_groups(ctx(), groups, &users, &report);
    if (!is_ok(s)) {
        return fail(err_, "intersect", s, report);
    }
    for (const auto& u : users) {
        std::fprintf(out_, "%s\n", u.v.c_str());
    }
    return 0;
}

int Runner::create_resource(const CommandArgs& a) {
    FullyQualifiedResourceId id;
    if (a.positional.size() != 1 || !is_ok(parse_resource_id(a.positional[0], &id))) {
        return usage(err_, "create-resource", "expected: create-resource <type>/<id> [--parent T/ID] [--auth-domain G]...");
    }
    UserId as;
    if (!caller("create-resource", &as)) {
        return 1;
    }
    std::optional<FullyQualifiedResourceId> parent;
    if (const ParsedOption* p = find_option(a.options, OptionId::Parent)) {
        FullyQualifiedResourceId parent_id;
        if (!is_ok(parse_resource_id(p->value.str, &parent_id))) {
            return usage(err_, "create-resource", "--parent expects <type>/<id>");
        }
        parent = std::move(parent_id);
    }
    std::set<GroupName> auth_domain;
    for (const char* g : a.strings(OptionId::AuthDomain)) {
        auth_domain.insert(GroupName{g});
    }
    ErrorReport report;
    Resource resource;
    const Status s = access_.create_resource(ctx(), id, as, parent, auth_domain, &resource, &report);
    if (!is_ok(s)) {
        return fail(err_, "create-resource", s, report);
    }
    std::fprintf(out_, "%s\n", to_string(resource.id).c_str());
    return 0;
}

int Runner::delete_resource(const CommandArgs& a) {
    FullyQualifiedResourceId id;
    if (a.positional.size() != 1 || !is_ok(parse_resource_id(a.positional[0], &id))) {
        return usage(err_, "delete-resource", "expected <type>/<id>");
    }
    UserId as;
    if (!caller("delete-resource", &as)) {
        return 1;
    }
    ErrorReport report;
    const Status s = access_.delete_resource(ctx(), id, as, &report);
    if (!is_ok(s)) {
        return fail(err_, "delete-resource", s, report);
    }
    return 0;
}

int Runner::set_parent(const CommandArgs& a) {
    FullyQualifiedResourceId child;
    FullyQualifiedResourceId parent;
    if (a.positional.size() != 2 || !is_ok(parse_resource_id(a.positional[0], &child)) ||
        !is_ok(parse_resource_id(a.positional[1], &parent))) {
        return usage(err_, "set-parent", "expected: set-parent <child> <parent>");
    }
    UserId as;
    if (!caller("set-parent", &as)) {
        return 1;
    }
    ErrorReport report;
    const Status s = access_.set_parent(ctx(), child, parent, as, &report);
    if (!is_ok(s)) {
        return fail(err_, "set-parent", s, report);
    }
    return 0;
}

int Runner::get_parent(const CommandArgs& a) {
    FullyQualifiedResourceId child;
    if (a.positional.size() != 1 || !is_ok(parse_resource_id(a.positional[0], &child))) {
        return usage(err_, "get-parent", "expected <type>/<id>");
    }
    UserId as;
    if (!caller("get-parent", &as)) {
        return 1;
    }
    ErrorReport report;
    std::optional<FullyQualifiedResourceId> parent;
    const Status s = access_.get_parent(ctx(), child, as, &parent, &report);
    if (!is_ok(s)) {
        return fail(err_, "get-parent", s, report);
    }
    std::fprintf(out_, "%s\n", parent ? to_string(*parent).c_str() : "-");
    return 0;
}

int Runner::overwrite_policy(const CommandArgs& a) {
    PolicyId id;
    if (a.positional.size() != 1 || !is_ok(parse_policy_id(a.positional[0], &id))) {
        return usage(err_, "overwrite-policy", "expected <type>/<id>/<policy>");
    }
    UserId as;
    if (!caller("overwrite-policy", &as)) {
        return 1;
    }

    AccessPolicyMembership spec;
    for (const char* m : a.strings(OptionId::Member)) {
        Subject subject;
        if (!is_ok(parse_subject(m, &subject))) {
            return usage(err_, "overwrite-policy", "members are user:<id>, group:<name> or policy:<type>/<id>/<name>");
        }
        spec.members.insert(std::move(subject));
    }
    for (const char* r : a.strings(OptionId::Role)) {
        spec.roles.insert(RoleName{r});
    }
    for (const char* act : a.strings(OptionId::Action)) {
        spec.actions.insert(ActionName{act});
    }

    std::map<ResourceTypeName, DescendantPermissions> descendants;
    for (const char* text : a.strings(OptionId::DescendantRole)) {
        ResourceTypeName type;
        RoleName role;
        if (!parse_typed(text, &type, &role)) {
            return usage(err_, "overwrite-policy", "--descendant-role expects <type>:<role>");
        }
        DescendantPermissions& d = descendants[type];
        d.resource_type = type;
        d.roles.insert(std::move(role));
    }
    for (const char* text : a.strings(OptionId::DescendantAction)) {
        ResourceTypeName type;
        ActionName action;
        if (!parse_typed(text, &type, &action)) {
            return usage(err_, "overwrite-policy", "--descendant-action expects <type>:<action>");
        }
        DescendantPermissions& d = descendants[type];
        d.resource_type = type;
        d.actions.insert(std::move(action));
    }
    for (auto& [type, d] : descendants) {
        spec.descendant_permissions.insert(std::move(d));
    }

    if (const ParsedOption* p = find_option(a.options, OptionId::Public)) {
        bool is_public = false;
        if (!parse_bool(p->value.str, &is_public)) {
            return usage(err_, "overwrite-policy", "--public expects true or false");
        }
        spec.is_public = is_public;
    }

    ErrorReport report;
    AccessPolicy policy;
    const Status s = access_.overwrite_policy(ctx(), id, spec, as, &policy, &report);
    if (!is_ok(s)) {
        return fail(err_, "overwrite-policy", s, report);
    }
    print_policy(out_, policy);
    return 0;
}

int Runner::delete_policy(const CommandArgs& a) {
    PolicyId id;
    if (a.positional.size() != 1 || !is_ok(parse_policy_id(a.positional[0], &id))) {
        return usage(err_, "delete-policy", "expected <type>/<id>/<policy>");
    }
    UserId as;
    if (!caller("delete-policy", &as)) {
        return 1;
    }
    ErrorReport report;
    const Status s = access_.delete_policy(ctx(), id, as, &report);
    if (!is_ok(s)) {
        return fail(err_, "delete-policy", s, report);
    }
    return 0;
}

int Runner::list_policies(const CommandArgs& a) {
    FullyQualifiedResourceId id;
    if (a.positional.size() != 1 || !is_ok(parse_resource_id(a.positional[0], &id))) {
        return usage(err_, "list-policies", "expected <type>/<id>");
    }
    UserId as;
    if (!caller("list-policies", &as)) {
        return 1;
    }
    ErrorReport report;
    std::vector<AccessPolicy> policies;
    const Status s = access_.list_policies(ctx(), id, as, &policies, &report);
    if (!is_ok(s)) {
        return fail(err_, "list-policies", s, report);
    }
    for (const auto& p : policies) {
        print_policy(out_, p);
    }
    return 0;
}

int Runner::check(const CommandArgs& a) {
    FullyQualifiedResourceId id;
    if (a.positional.size() < 2 || a.positional.size() > 3 || !is_ok(parse_resource_id(a.positional[0], &id))) {
        return usage(err_, "check", "expected: check <type>/<id> <action> [user]");
    }
    UserId user;
    if (!subject_user("check", a, 2, &user)) {
        return 1;
    }
    ErrorReport report;
    bool allowed = false;
    const Status s =
        access_.check_permission(ctx(), id, ActionName{std::string(a.positional[1])}, user, &allowed, &report);
    if (!is_ok(s)) {
        return fail(err_, "check", s, report);
    }
    std::fprintf(out_, "%s\n", allowed ? "true" : "false");
    return 0;
}

int Runner::actions(const CommandArgs& a) {
    FullyQualifiedResourceId id;
    if (a.positional.empty() || a.positional.size() > 2 || !is_ok(parse_resource_id(a.positional[0], &id))) {
        return usage(err_, "actions", "expected: actions <type>/<id> [user]");
    }
    UserId user;
    if (!subject_user("actions", a, 1, &user)) {
        return 1;
    }
    ErrorReport report;
    std::set<ActionName> held;
    const Status s = access_.list_user_resource_actions(ctx(), id, user, &held, &report);
    if (!is_ok(s)) {
        return fail(err_, "actions", s, report);
    }
    for (const auto& act : held) {
        std::fprintf(out_, "%s\n", act.v.c_str());
    }
    return 0;
}

int Runner::roles(const CommandArgs& a) {
    FullyQualifiedResourceId id;
    if (a.positional.empty() || a.positional.size() > 2 || !is_ok(parse_resource_id(a.positional[0], &id))) {
        return usage(err_, "roles", "expected: roles <type>/<id> [user]");
    }
    UserId user;
    if (!subject_user("roles", a, 1, &user)) {
        return 1;
    }
    ErrorReport report;
    std::set<RoleName> held;
    const Status s = access_.list_user_resource_roles(ctx(), id, user, &held, &report);
    if (!is_ok(s)) {
        return fail(err_, "roles", s, report);
    }
    for (const auto& r : held) {
        std::fprintf(out_, "%s\n", r.v.c_str());
    }
    return 0;
}

int Runner::list_resources(const CommandArgs& a) {
    if (a.positional.empty() || a.positional.size() > 2) {
        return usage(err_, "list-resources", "expected: list-resources <type> [user]");
    }
    UserId user;
    if (!subject_user("list-resources", a, 1, &user)) {
        return 1;
    }
    ErrorReport report;
    std::vector<FilteredResource> resources;
    const Status s = access_.list_filtered_resources(ctx(), ResourceTypeName{std::string(a.positional[0])}, user,
                                                     &resources, &report);
    if (!is_ok(s)) {
        return fail(err_, "list-resources", s, report);
    }
    for (const auto& r : resources) {
        std::fprintf(out_, "%s roles=%s actions=%s policies=%s%s\n", to_string(r.resource).c_str(),
                     join_names(r.roles).c_str(), join_names(r.actions).c_str(), join_names(r.policies).c_str(),
                     r.is_public ? " public" : "");
    }
    return 0;
}

int Runner::sync_status(const CommandArgs& a) {
    ErrorReport report;
    if (a.positional.empty()) {
        i64 limit = 100;
        if (const ParsedOption* p = find_option(a.options, OptionId::Limit)) {
            limit = p->value.i64v;
        }
        if (limit <= 0) {
            return usage(err_, "sync-status", "--limit must be positive");
        }
        std::vector<GroupIdentity> groups;
        const Status s = access_.list_unsynchronized_groups(ctx(), static_cast<u32>(limit), &groups, &report);
        if (!is_ok(s)) {
            return fail(err_, "sync-status", s, report);
        }
        for (const auto& g : groups) {
            std::fprintf(out_, "%s\n", to_string(to_subject(g)).c_str());
        }
        return 0;
    }

    GroupIdentity group;
    if (a.positional.size() != 1 || !parse_group(a.positional[0], &group)) {
        return usage(err_, "sync-status", "expected: sync-status [<group> [--record VERSION]] [--limit N]");
    }
    if (const ParsedOption* p = find_option(a.options, OptionId::Record)) {
        bool advanced = false;
        const Status s = access_.record_group_synchronized(ctx(), group, p->value.i64v, &advanced, &report);
        if (!is_ok(s)) {
            return fail(err_, "sync-status", s, report);
        }
        std::fprintf(out_, "%s\n", advanced ? "advanced" : "unchanged");
        return 0;
    }
    SyncState state;
    const Status s = access_.load_sync_state(ctx(), group, &state, &report);
    if (!is_ok(s)) {
        return fail(err_, "sync-status", s, report);
    }
    if (state.last_synchronized_version) {
        std::fprintf(out_, "version=%lld synchronized=%lld\n", static_cast<long long>(state.version),
                     static_cast<long long>(*state.last_synchronized_version));
    } else {
        std::fprintf(out_, "version=%lld synchronized=-\n", static_cast<long long>(state.version));
    }
    return 0;
}

int Runner::run(CommandId id, const CommandArgs& a) {
    switch (id) {
        case CommandId::Help:
            print_help(out_);
            return 0;
        case CommandId::Init: return init();
        case CommandId::CreateUser: return create_user(a);
        case CommandId::EnableUser: return set_enabled(a, true);
        case CommandId::DisableUser: return set_enabled(a, false);
        case CommandId::CreateGroup: return create_group(a);
        case CommandId::DeleteGroup: return delete_group(a);
        case CommandId::AddMember: return change_member(a, true);
        case CommandId::RemoveMember: return change_member(a, false);
        case CommandId::IsMember: return is_member(a);
        case CommandId::Ancestors: return ancestors(a);
        case CommandId::Flatten: return flatten(a);
        case CommandId::Intersect: return intersect(a);
        case CommandId::CreateResource: return create_resource(a);
        case CommandId::DeleteResource: return delete_resource(a);
        case CommandId::SetParent: return set_parent(a);
        case CommandId::GetParent: return get_parent(a);
        case CommandId::OverwritePolicy: return overwrite_policy(a);
        case CommandId::DeletePolicy: return delete_policy(a);
        case CommandId::ListPolicies: return list_policies(a);
        case CommandId::Check: return check(a);
        case CommandId::Actions: return actions(a);
        case CommandId::Roles: return roles(a);
        case CommandId::ListResources: return list_resources(a);
        case CommandId::SyncStatus: return sync_status(a);
        case CommandId::Exit:
        case CommandId::None:
            break;
    }
    return usage(err_, "command", "unknown command");
}

} // namespace

void print_help(std::FILE* out) {
    std::fprintf(out,
        "Commands:\n"
        "  init                                   Register the configured resource types\n"
        "  create-user <id> <email> [--disabled]\n"
        "  enable-user <id> | disable-user <id>\n"
        "  create-group <name> <email> [--member SUBJECT]...\n"
        "  delete-group <name>\n"
        "  add-member <group> <subject>           remove-member <group> <subject>\n"
        "  is-member <group> <subject>            Transitive membership\n"
        "  ancestors <subject>                    Groups containing the subject\n"
        "  flatten <group>                        Users reachable from the group\n"
        "  intersect <group>...                   Users in every group\n"
        "  create-resource <type>/<id> [--parent T/ID] [--auth-domain GROUP]...\n"
        "  delete-resource <type>/<id>\n"
        "  set-parent <child> <parent>            get-parent <child>\n"
        "  overwrite-policy <type>/<id>/<name> [--member S] [--role R] [--action A]\n"
        "                   [--descendant-role T:R] [--descendant-action T:A] [--public true|false]\n"
        "  delete-policy <type>/<id>/<name>       list-policies <type>/<id>\n"
        "  check <type>/<id> <action> [user]\n"
        "  actions <type>/<id> [user]             roles <type>/<id> [user]\n"
        "  list-resources <type> [user]\n"
        "  sync-status [<group> [--record VERSION]] [--limit N]\n"
        "  help                                   Show this help\n"
        "  q, quit, exit                          Exit the interactive loop\n"
        "\n"
        "Subjects: user:<id>, group:<name>, policy:<type>/<id>/<name>\n"
        "Gated commands act as the --as user.\n");
}

int run_command(CliSession& session, const CommandInvocation& cmd, std::FILE* out, std::FILE* err) {
    if (session.access == nullptr) {
        return usage(err, "command", "no service");
    }
    CommandArgs args;
    const Status s = split_args(cmd.args, &args);
    if (!is_ok(s)) {
        return usage(err, "options", "unknown option or missing value");
    }
    Runner runner(session, out, err);
    return runner.run(cmd.id, args);
}

} // namespace warden::cli
