#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/models.hpp"
#include "warden/core/request_context.hpp"
#include "warden/core/types.hpp"
#include "warden/db/db.hpp"
#include "warden/directory/group_store.hpp"
#include "warden/directory/membership_index.hpp"
#include "warden/directory/user_store.hpp"
#include "warden/security/evaluator.hpp"
#include "warden/security/resource_store.hpp"
#include "warden/security/resource_types.hpp"
#include "warden/service/subject_directory.hpp"
#include "warden/sync/mirror.hpp"

namespace warden::service {
    using warden::core::AccessPolicy;
    using warden::core::AccessPolicyMembership;
    using warden::core::ActionName;
    using warden::core::Email;
    using warden::core::FilteredResource;
    using warden::core::FullyQualifiedResourceId;
    using warden::core::Group;
    using warden::core::GroupIdentity;
    using warden::core::GroupName;
    using warden::core::PolicyId;
    using warden::core::PolicyName;
    using warden::core::Resource;
    using warden::core::ResourceId;
    using warden::core::ResourceTypeName;
    using warden::core::RoleName;
    using warden::core::Subject;
    using warden::core::SyncState;

    // The request-facing surface. Every call runs in its own transaction
    // (write calls serializable and retried on busy), threads the request
    // context into the logs, and reports a stable status plus a message.
    //
    // Calls that touch a resource on behalf of `caller` are gated on the
    // resource type's actions (see security/actions.hpp); a caller with no
    // access at all gets NotFound so existence does not leak.
    //
    // Mirror notifications go out after commit, for the changed group and
    // each group containing it.
    class AccessService {
    public:
        // Null `directory` / `notifier` select the database-backed directory
        // and a no-op notifier.
        AccessService(db::DbHandle db, const security::ResourceTypeRegistry& types, std::string email_domain,
                      SubjectDirectory* directory = nullptr, sync::MirrorNotifier* notifier = nullptr);

        AccessService(const AccessService&) = delete;
        AccessService& operator=(const AccessService&) = delete;

        // Persists the resource types. Run once after db_open.
        Status init(const RequestContext& ctx, ErrorReport* report = nullptr);

        // ---- users ----
        Status create_user(const RequestContext& ctx, const UserId& id, const Email& email, bool enabled,
                           User* out = nullptr, ErrorReport* report = nullptr);
        Status load_user(const RequestContext& ctx, const UserId& id, User* out, ErrorReport* report = nullptr);
        Status delete_user(const RequestContext& ctx, const UserId& id, ErrorReport* report = nullptr);
        Status set_user_enabled(const RequestContext& ctx, const UserId& id, bool enabled,
                                ErrorReport* report = nullptr);

        // ---- groups ----
        Status create_group(const RequestContext& ctx, const GroupName& name, const Email& email,
                            const std::set<Subject>& members, Group* out = nullptr, ErrorReport* report = nullptr);
        Status load_group(const RequestContext& ctx, const GroupIdentity& id, Group* out,
                          ErrorReport* report = nullptr);
        Status delete_group(const RequestContext& ctx, const GroupName& name, ErrorReport* report = nullptr);
        Status add_member(const RequestContext& ctx, const GroupIdentity& group, const Subject& member,
                          bool* added = nullptr, ErrorReport* report = nullptr);
        Status remove_member(const RequestContext& ctx, const GroupIdentity& group, const Subject& member,
                             bool* removed = nullptr, ErrorReport* report = nullptr);
        Status is_member(const RequestContext& ctx, const GroupIdentity& group, const Subject& member, bool* out,
                         ErrorReport* report = nullptr);
        Status list_direct_memberships(const RequestContext& ctx, const Subject& subject,
                                       std::vector<GroupIdentity>* out, ErrorReport* report = nullptr);
        Status list_parent_groups(const RequestContext& ctx, const GroupIdentity& group,
                                  std::vector<GroupIdentity>* out, ErrorReport* report = nullptr);
        Status list_ancestor_groups(const RequestContext& ctx, const Subject& subject,
                                    std::vector<GroupIdentity>* out, ErrorReport* report = nullptr);
        Status list_flattened_members(const RequestContext& ctx, const GroupIdentity& group,
                                      std::vector<UserId>* out, ErrorReport* report = nullptr);
        Status intersect_groups(const RequestContext& ctx, const std::vector<GroupIdentity>& groups,
                                std::vector<UserId>* out, ErrorReport* report = nullptr);
        Status load_group_email(const RequestContext& ctx, const GroupIdentity& group, Email* out,
                                ErrorReport* report = nullptr);
        Status load_subject_from_email(const RequestContext& ctx, const Email& email, Subject* out,
                                       ErrorReport* report = nullptr);

        // ---- mirror bookkeeping ----
        Status load_sync_state(const RequestContext& ctx, const GroupIdentity& group, SyncState* out,
                               ErrorReport* report = nullptr);
        Status record_group_synchronized(const RequestContext& ctx, const GroupIdentity& group,
                                         core::i64 synced_version, bool* advanced = nullptr,
                                         ErrorReport* report = nullptr);
        Status list_unsynchronized_groups(const RequestContext& ctx, core::u32 limit,
                                          std::vector<GroupIdentity>* out, ErrorReport* report = nullptr);

        // ---- resources ----
        // With a parent, the caller needs add_child on it.
        Status create_resource(const RequestContext& ctx, const FullyQualifiedResourceId& id, const UserId& caller,
                               const std::optional<FullyQualifiedResourceId>& parent,
                               const std::set<GroupName>& auth_domain, Resource* out = nullptr,
                               ErrorReport* report = nullptr);
        Status load_resource(const RequestContext& ctx, const FullyQualifiedResourceId& id, Resource* out,
                             ErrorReport* report = nullptr);
        Status delete_resource(const RequestContext& ctx, const FullyQualifiedResourceId& id, const UserId& caller,
                               ErrorReport* report = nullptr);
        // Needs set_parent on the child, add_child on the new parent and
        // remove_child on the current one.
        Status set_parent(const RequestContext& ctx, const FullyQualifiedResourceId& child,
                          const FullyQualifiedResourceId& parent, const UserId& caller,
                          ErrorReport* report = nullptr);
        Status get_parent(const RequestContext& ctx, const FullyQualifiedResourceId& child, const UserId& caller,
                          std::optional<FullyQualifiedResourceId>* out, ErrorReport* report = nullptr);
        Status delete_parent(const RequestContext& ctx, const FullyQualifiedResourceId& child, const UserId& caller,
                             bool* removed = nullptr, ErrorReport* report = nullptr);
        Status list_children(const RequestContext& ctx, const FullyQualifiedResourceId& id, const UserId& caller,
                             std::vector<FullyQualifiedResourceId>* out, ErrorReport* report = nullptr);

        // ---- policies ----
        Status create_policy(const RequestContext& ctx, const PolicyId& id, const AccessPolicyMembership& spec,
                             const UserId& caller, AccessPolicy* out = nullptr, ErrorReport* report = nullptr);
        // alter_policies, or share_policy::<name> for that one policy.
        Status overwrite_policy(const RequestContext& ctx, const PolicyId& id, const AccessPolicyMembership& spec,
                                const UserId& caller, AccessPolicy* out = nullptr, ErrorReport* report = nullptr);
        Status delete_policy(const RequestContext& ctx, const PolicyId& id, const UserId& caller,
                             ErrorReport* report = nullptr);
        Status list_policies(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                             const UserId& caller, std::vector<AccessPolicy>* out, ErrorReport* report = nullptr);
        Status set_policy_public(const RequestContext& ctx, const PolicyId& id, bool is_public,
                                 const UserId& caller, ErrorReport* report = nullptr);
        // Ungated; for callers that already authorized the request.
        Status load_policy(const RequestContext& ctx, const PolicyId& id, AccessPolicy* out,
                           ErrorReport* report = nullptr);

        // ---- evaluation ----
        // NotFound for an unknown resource type, Invalid for an action the
        // type does not define. Disabled users get false.
        Status check_permission(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                const ActionName& action, const UserId& user, bool* out,
                                ErrorReport* report = nullptr);
        // Ok, PermissionDenied when the user holds some other action on the
        // resource, NotFound when they hold none or it does not exist.
        Status require_action(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                              const ActionName& action, const UserId& user, ErrorReport* report = nullptr);
        Status list_user_resource_actions(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                          const UserId& user, std::set<ActionName>* out,
                                          ErrorReport* report = nullptr);
        Status list_user_resource_roles(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                        const UserId& user, std::set<RoleName>* out, ErrorReport* report = nullptr);
        Status list_user_policies(const RequestContext& ctx, const FullyQualifiedResourceId& resource,
                                  const UserId& user, std::set<PolicyName>* out, ErrorReport* report = nullptr);
        Status list_resources_and_roles(const RequestContext& ctx, const ResourceTypeName& type, const UserId& user,
                                        std::map<ResourceId, std::set<RoleName>>* out,
                                        ErrorReport* report = nullptr);
        Status list_filtered_resources(const RequestContext& ctx, const ResourceTypeName& type, const UserId& user,
                                       std::vector<FilteredResource>* out, ErrorReport* report = nullptr);

        // ---- building blocks for composite services ----

        [[nodiscard]] db::DbHandle db() const noexcept { return db_; }
        [[nodiscard]] const security::ResourceTypeRegistry& types() const noexcept { return types_; }
        [[nodiscard]] const std::string& email_domain() const noexcept { return resources_.email_domain(); }
        [[nodiscard]] directory::GroupStore& groups() noexcept { return groups_; }
        [[nodiscard]] security::ResourceStore& resources() noexcept { return resources_; }

        // Asks the subject directory; call before opening a transaction.
        Status caller_enabled(const RequestContext& ctx, const UserId& user, bool* out, ErrorReport* report);
        // PermissionDenied unless `user` exists and is enabled.
        Status require_enabled(const RequestContext& ctx, const UserId& user, ErrorReport* report);
        // Inside a transaction: Ok when `user` holds any of `actions` on
        // `resource`, else PermissionDenied or NotFound as require_action.
        Status authorize(db::DbSession& s, const FullyQualifiedResourceId& resource,
                         const std::vector<ActionName>& actions, const UserId& user, bool enabled);
        // `group` and every group containing it, for mirror notification.
        Status collect_mirror_targets(db::DbSession& s, const GroupIdentity& group,
                                      std::vector<GroupIdentity>* out);
        void publish(const RequestContext& ctx, const std::vector<GroupIdentity>& targets,
                     const std::vector<Subject>& changed) noexcept;

    private:
        Status validate_type(const ResourceTypeName& type, ErrorReport* report) const;

        db::DbHandle db_;
        const security::ResourceTypeRegistry& types_;
        directory::FlatTableIndex index_;
        directory::GroupStore groups_;
        directory::UserStore users_;
        security::ResourceStore resources_;
        security::PolicyEvaluator evaluator_;
        DbSubjectDirectory db_directory_;
        sync::NullMirrorNotifier null_notifier_;
        SubjectDirectory& directory_;
        sync::MirrorNotifier& notifier_;
    };

} // namespace warden::service
