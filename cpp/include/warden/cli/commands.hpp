#pragma once

#include <type_traits>

#include "warden/cli/options.hpp"
#include "warden/core/errors.hpp"

namespace warden::cli {
    using u32 = warden::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help,
        Init,
        CreateUser,
        EnableUser,
        DisableUser,
        CreateGroup,
        DeleteGroup,
        AddMember,
        RemoveMember,
        IsMember,
        Ancestors,
        Flatten,
        Intersect,
        CreateResource,
        DeleteResource,
        SetParent,
        GetParent,
        OverwritePolicy,
        DeletePolicy,
        ListPolicies,
        Check,
        Actions,
        Roles,
        ListResources,
        SyncStatus,
        Exit,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // The command table used by the warden binary.
    extern const CommandSpec kCommands[];
    extern const u32 kCommandCount;

    warden::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace warden::cli
