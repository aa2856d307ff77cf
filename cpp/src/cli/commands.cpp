#include "warden/cli/commands.hpp"

#include <cstring>

namespace warden::cli {

const CommandSpec kCommands[] = {
    {CommandId::Help, "help"},
    {CommandId::Init, "init"},
    {CommandId::CreateUser, "create-user"},
    {CommandId::EnableUser, "enable-user"},
    {CommandId::DisableUser, "disable-user"},
    {CommandId::CreateGroup, "create-group"},
    {CommandId::DeleteGroup, "delete-group"},
    {CommandId::AddMember, "add-member"},
    {CommandId::RemoveMember, "remove-member"},
    {CommandId::IsMember, "is-member"},
    {CommandId::Ancestors, "ancestors"},
    {CommandId::Flatten, "flatten"},
    {CommandId::Intersect, "intersect"},
    {CommandId::CreateResource, "create-resource"},
    {CommandId::DeleteResource, "delete-resource"},
    {CommandId::SetParent, "set-parent"},
    {CommandId::GetParent, "get-parent"},
    {CommandId::OverwritePolicy, "overwrite-policy"},
    {CommandId::DeletePolicy, "delete-policy"},
    {CommandId::ListPolicies, "list-policies"},
    {CommandId::Check, "check"},
    {CommandId::Actions, "actions"},
    {CommandId::Roles, "roles"},
    {CommandId::ListResources, "list-resources"},
    {CommandId::SyncStatus, "sync-status"},
    {CommandId::Exit, "q"},
    {CommandId::Exit, "quit"},
    {CommandId::Exit, "exit"},
};
const u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

warden::core::Status parse_command(const CliArgs& args,
    const CommandSpec* specs,
    u32 spec_count,
    CommandInvocation* out,
    u32* consumed) noexcept {
    const warden::core::Status invalid =
        warden::core::make_status(warden::core::StatusDomain::Cli, warden::core::StatusCode::Invalid);
    if (out == nullptr || consumed == nullptr) {
        return invalid;
    }
    *consumed = 0;
    out->id = CommandId::None;
    out->args = CliArgs{};

    if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
        return invalid;
    }
    if (spec_count > 0 && specs == nullptr) {
        return invalid;
    }

    const char* cmd = args.argv[0];
    if (cmd[0] == '-') {
        return invalid;
    }

    for (u32 i = 0; i < spec_count; ++i) {
        if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
            out->id = specs[i].id;
            out->args.argv = args.argv + 1;
            out->args.argc = args.argc - 1;
            *consumed = 1;
            return warden::core::ok_status();
        }
    }
    return make_status(warden::core::StatusDomain::Cli, warden::core::StatusCode::NotFound);
}

} // namespace warden::cli
