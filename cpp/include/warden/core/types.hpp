#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "warden/core/errors.hpp"

namespace warden::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch.
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // Surrogate row key. Never leaves the store layer.
    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct GroupKeyTag {};
    using GroupKey = Id<GroupKeyTag, i64>;

    struct ResourceKeyTag {};
    using ResourceKey = Id<ResourceKeyTag, i64>;

    struct PolicyKeyTag {};
    using PolicyKey = Id<PolicyKeyTag, i64>;

    struct ResourceTypeKeyTag {};
    using ResourceTypeKey = Id<ResourceTypeKeyTag, i64>;

    // Opaque string identifier. Distinct tags keep a role name from being
    // passed where an action name is expected.
    template <typename Tag>
    struct Name {
        std::string v;

        [[nodiscard]] bool empty() const noexcept { return v.empty(); }

        friend bool operator==(const Name&, const Name&) = default;
        friend auto operator<=>(const Name&, const Name&) = default;
    };

    struct UserIdTag {};
    using UserId = Name<UserIdTag>;

    struct GroupNameTag {};
    using GroupName = Name<GroupNameTag>;

    struct ResourceTypeNameTag {};
    using ResourceTypeName = Name<ResourceTypeNameTag>;

    struct ResourceIdTag {};
    using ResourceId = Name<ResourceIdTag>;

    struct PolicyNameTag {};
    using PolicyName = Name<PolicyNameTag>;

    struct RoleNameTag {};
    using RoleName = Name<RoleNameTag>;

    struct ActionNameTag {};
    using ActionName = Name<ActionNameTag>;

    struct EmailTag {};
    using Email = Name<EmailTag>;

    struct FullyQualifiedResourceId {
        ResourceTypeName type;
        ResourceId id;

        friend bool operator==(const FullyQualifiedResourceId&, const FullyQualifiedResourceId&) = default;
        friend auto operator<=>(const FullyQualifiedResourceId&, const FullyQualifiedResourceId&) = default;
    };

    struct PolicyId {
        FullyQualifiedResourceId resource;
        PolicyName name;

        friend bool operator==(const PolicyId&, const PolicyId&) = default;
        friend auto operator<=>(const PolicyId&, const PolicyId&) = default;
    };

    // A policy is a group with extra attributes, so both name a group.
    using GroupIdentity = std::variant<GroupName, PolicyId>;
    using Subject = std::variant<UserId, GroupName, PolicyId>;

    enum class SubjectKind : u8 {
        User = 0,
        Group = 1,
        Policy = 2,
    };

    [[nodiscard]] SubjectKind subject_kind(const Subject& s) noexcept;
    [[nodiscard]] Subject to_subject(const GroupIdentity& g);
    [[nodiscard]] std::optional<GroupIdentity> to_group_identity(const Subject& s);

    // "type/id"
    [[nodiscard]] std::string to_string(const FullyQualifiedResourceId& r);
    // "type/id/name"
    [[nodiscard]] std::string to_string(const PolicyId& p);
    [[nodiscard]] std::string to_string(const GroupIdentity& g);
    // "user:<id>", "group:<name>", "policy:<type>/<id>/<name>"
    [[nodiscard]] std::string to_string(const Subject& s);

    Status parse_resource_id(std::string_view text, FullyQualifiedResourceId* out) noexcept;
    Status parse_policy_id(std::string_view text, PolicyId* out) noexcept;
    Status parse_subject(std::string_view text, Subject* out) noexcept;

} // namespace warden::core
