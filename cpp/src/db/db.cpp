#include "warden/db/db.hpp"
#include "warden/db/session.hpp"
#include "warden/core/log.hpp"

#include <sqlite3.h>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

namespace warden::db {

using namespace warden::core;

// Global database state
namespace {
    struct DbState {
        sqlite3* db = nullptr;
        // Writers hold it exclusively, readers shared.
        std::shared_mutex rw;
        u32 generation = 0;
        u32 max_write_attempts = 3;
    };

    DbState g_db_state;

    constexpr const char* kSchemaSQL = R"SQL(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS users (
            id TEXT PRIMARY KEY,
            email TEXT NOT NULL UNIQUE COLLATE NOCASE,
            enabled INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS directory_groups (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            email TEXT NOT NULL UNIQUE COLLATE NOCASE,
            version INTEGER NOT NULL DEFAULT 1,
            last_synchronized_version INTEGER,
            synchronized_at INTEGER,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS group_members (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            group_id INTEGER NOT NULL REFERENCES directory_groups(id) ON DELETE CASCADE,
            member_user_id TEXT REFERENCES users(id) ON DELETE CASCADE,
            member_group_id INTEGER REFERENCES directory_groups(id),
            CHECK ((member_user_id IS NULL) <> (member_group_id IS NULL))
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_group_members_user
            ON group_members(group_id, member_user_id) WHERE member_user_id IS NOT NULL;
        CREATE UNIQUE INDEX IF NOT EXISTS idx_group_members_group
            ON group_members(group_id, member_group_id) WHERE member_group_id IS NOT NULL;
        CREATE INDEX IF NOT EXISTS idx_group_members_by_user ON group_members(member_user_id);
        CREATE INDEX IF NOT EXISTS idx_group_members_by_group ON group_members(member_group_id);

        CREATE TABLE IF NOT EXISTS group_members_flat (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            group_id INTEGER NOT NULL REFERENCES directory_groups(id) ON DELETE CASCADE,
            member_user_id TEXT REFERENCES users(id) ON DELETE CASCADE,
            member_group_id INTEGER REFERENCES directory_groups(id) ON DELETE CASCADE,
            CHECK ((member_user_id IS NULL) <> (member_group_id IS NULL))
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_flat_user
            ON group_members_flat(group_id, member_user_id) WHERE member_user_id IS NOT NULL;
        CREATE UNIQUE INDEX IF NOT EXISTS idx_flat_group
            ON group_members_flat(group_id, member_group_id) WHERE member_group_id IS NOT NULL;
        CREATE INDEX IF NOT EXISTS idx_flat_by_user ON group_members_flat(member_user_id);
        CREATE INDEX IF NOT EXISTS idx_flat_by_group ON group_members_flat(member_group_id);

        CREATE TABLE IF NOT EXISTS resource_types (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            owner_role TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS resource_type_roles (
            resource_type_id INTEGER NOT NULL REFERENCES resource_types(id) ON DELETE CASCADE,
            role TEXT NOT NULL,
            PRIMARY KEY (resource_type_id, role)
        );

        CREATE TABLE IF NOT EXISTS resource_role_actions (
            resource_type_id INTEGER NOT NULL,
            role TEXT NOT NULL,
            action TEXT NOT NULL,
            PRIMARY KEY (resource_type_id, role, action),
            FOREIGN KEY (resource_type_id, role)
                REFERENCES resource_type_roles(resource_type_id, role) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS resource_type_action_patterns (
            resource_type_id INTEGER NOT NULL REFERENCES resource_types(id) ON DELETE CASCADE,
            pattern TEXT NOT NULL,
            PRIMARY KEY (resource_type_id, pattern)
        );

        CREATE TABLE IF NOT EXISTS resources (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            resource_type_id INTEGER NOT NULL REFERENCES resource_types(id),
            name TEXT NOT NULL,
            resource_parent_id INTEGER REFERENCES resources(id),
            created_at INTEGER NOT NULL,
            UNIQUE (resource_type_id, name)
        );
        CREATE INDEX IF NOT EXISTS idx_resources_parent ON resources(resource_parent_id);

        CREATE TABLE IF NOT EXISTS resource_auth_domains (
            resource_id INTEGER NOT NULL REFERENCES resources(id) ON DELETE CASCADE,
            group_id INTEGER NOT NULL REFERENCES directory_groups(id),
            PRIMARY KEY (resource_id, group_id)
        );
        CREATE INDEX IF NOT EXISTS idx_auth_domains_group ON resource_auth_domains(group_id);

        CREATE TABLE IF NOT EXISTS policies (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            resource_id INTEGER NOT NULL REFERENCES resources(id),
            group_id INTEGER NOT NULL UNIQUE REFERENCES directory_groups(id),
            name TEXT NOT NULL,
            public INTEGER NOT NULL DEFAULT 0,
            UNIQUE (resource_id, name)
        );
        CREATE INDEX IF NOT EXISTS idx_policies_public ON policies(public) WHERE public = 1;

        CREATE TABLE IF NOT EXISTS policy_roles (
            policy_id INTEGER NOT NULL REFERENCES policies(id) ON DELETE CASCADE,
            resource_type_id INTEGER NOT NULL REFERENCES resource_types(id),
            role TEXT NOT NULL,
            descendants_only INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (policy_id, resource_type_id, role, descendants_only)
        );

        CREATE TABLE IF NOT EXISTS policy_actions (
            policy_id INTEGER NOT NULL REFERENCES policies(id) ON DELETE CASCADE,
            resource_type_id INTEGER NOT NULL REFERENCES resource_types(id),
            action TEXT NOT NULL,
            descendants_only INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (policy_id, resource_type_id, action, descendants_only)
        );
    )SQL";

    [[nodiscard]] bool handle_valid_locked(DbHandle db) noexcept {
        return db.id != 0 && db.id == g_db_state.generation && g_db_state.db != nullptr;
    }

    void rollback_if_open(sqlite3* db) noexcept {
        if (db != nullptr && sqlite3_get_autocommit(db) == 0) {
            char* err_msg = nullptr;
            if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &err_msg) != SQLITE_OK) {
                log_error("rollback failed: %s", err_msg ? err_msg : "unknown");
            }
            sqlite3_free(err_msg);
        }
    }

    [[nodiscard]] Status run_body(const TxnBody& body, DbSession& session) noexcept {
        try {
            return body(session);
        } catch (const std::exception& e) {
            return session.fail(make_status(StatusDomain::Db, StatusCode::Unknown), e.what());
        }
    }

    void finish_failure(const char* name, const RequestContext& ctx, const DbSession& session, Status s,
                        ErrorReport* report) noexcept {
        const std::string& msg = session.message();
        if (s.code == StatusCode::Unknown) {
            log_error("txn %s [trace=%s] failed: %s/%s: %s", name, ctx.trace_id.c_str(),
                      status_domain_name(s.domain), status_code_name(s.code), msg.c_str());
        } else {
            log_debug("txn %s [trace=%s] rejected: %s/%s: %s", name, ctx.trace_id.c_str(),
                      status_domain_name(s.domain), status_code_name(s.code), msg.c_str());
        }
        if (report != nullptr) {
            report->status = s;
            report->message = msg.empty() ? std::string(status_code_name(s.code)) : msg;
        }
    }
}

// ============================================================================
// Schema
// ============================================================================

const char* table_name(TableId table) noexcept {
    switch (table) {
        case TableId::Users: return "users";
        case TableId::Groups: return "directory_groups";
        case TableId::GroupMembers: return "group_members";
        case TableId::GroupMembersFlat: return "group_members_flat";
        case TableId::ResourceTypes: return "resource_types";
        case TableId::ResourceTypeRoles: return "resource_type_roles";
        case TableId::ResourceRoleActions: return "resource_role_actions";
        case TableId::ResourceTypeActionPatterns: return "resource_type_action_patterns";
        case TableId::Resources: return "resources";
        case TableId::ResourceAuthDomains: return "resource_auth_domains";
        case TableId::Policies: return "policies";
        case TableId::PolicyRoles: return "policy_roles";
        case TableId::PolicyActions: return "policy_actions";
    }
    return "";
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::unique_lock<std::shared_mutex> lock(g_db_state.rw);

    // Close existing connection if any
    if (g_db_state.db) {
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
    }

    const char* path = (cfg.path && cfg.path[0] != '\0') ? cfg.path : ":memory:";
    int rc = sqlite3_open(path, &g_db_state.db);
    if (rc != SQLITE_OK) {
        log_error("cannot open database %s: %s", path,
                  g_db_state.db ? sqlite3_errmsg(g_db_state.db) : "out of memory");
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Io);
    }
    sqlite3_extended_result_codes(g_db_state.db, 1);
    sqlite3_busy_timeout(g_db_state.db, static_cast<int>(cfg.busy_timeout_ms));

    // WAL unless configured otherwise.
    char* err_msg = nullptr;
    const char* journal_mode = cfg.journal_mode;
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = std::getenv("WARDEN_DB_JOURNAL_MODE");
    }
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    rc = sqlite3_exec(g_db_state.db, journal_sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        // In-memory databases keep their own journal.
        log_warn("journal_mode=%s not applied: %s", journal_mode, err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }

    sqlite3_exec(g_db_state.db, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec(g_db_state.db, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);

    rc = sqlite3_exec(g_db_state.db, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        log_error("schema setup failed: %s", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        sqlite3_close(g_db_state.db);
        g_db_state.db = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    g_db_state.max_write_attempts = cfg.max_write_attempts == 0 ? 1 : cfg.max_write_attempts;
    ++g_db_state.generation;
    if (g_db_state.generation == 0) {
        g_db_state.generation = 1;
    }
    out->id = g_db_state.generation;
    log_info("database open: %s (schema v%u)", path, kSchemaVersion);
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    std::unique_lock<std::shared_mutex> lock(g_db_state.rw);
    if (!handle_valid_locked(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_close(g_db_state.db);
    g_db_state.db = nullptr;
    return ok_status();
}

bool db_handle_valid(DbHandle db) noexcept {
    std::shared_lock<std::shared_mutex> lock(g_db_state.rw);
    return handle_valid_locked(db);
}

// ============================================================================
// Transaction Management
// ============================================================================

Status db_transaction(DbHandle db,
    TxnMode mode,
    const char* name,
    const RequestContext& ctx,
    const TxnBody& body,
    ErrorReport* report) noexcept {
    const char* txn_name = name ? name : "transaction";
    if (!body) {
        report_error(report, make_status(StatusDomain::Db, StatusCode::Invalid), "empty transaction body");
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    if (mode == TxnMode::Read) {
        std::shared_lock<std::shared_mutex> lock(g_db_state.rw);
        if (!handle_valid_locked(db)) {
            report_error(report, make_status(StatusDomain::Db, StatusCode::Invalid), "database is not open");
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }
        log_debug("txn %s [trace=%s] read", txn_name, ctx.trace_id.c_str());
        DbSession session(g_db_state.db, TxnMode::Read, now_millis());
        const Status s = run_body(body, session);
        if (!is_ok(s)) {
            finish_failure(txn_name, ctx, session, s, report);
        }
        return s;
    }

    std::unique_lock<std::shared_mutex> lock(g_db_state.rw);
    if (!handle_valid_locked(db)) {
        report_error(report, make_status(StatusDomain::Db, StatusCode::Invalid), "database is not open");
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const u32 max_attempts = g_db_state.max_write_attempts;
    for (u32 attempt = 1;; ++attempt) {
        log_debug("txn %s [trace=%s] write attempt %u", txn_name, ctx.trace_id.c_str(), attempt);
        DbSession session(g_db_state.db, TxnMode::Write, now_millis());
        Status s = session.exec("BEGIN IMMEDIATE");
        if (is_ok(s)) {
            s = run_body(body, session);
        }
        if (is_ok(s)) {
            s = session.exec("COMMIT");
        }
        if (is_ok(s)) {
            return s;
        }

        rollback_if_open(g_db_state.db);
        if (is_transient(s) && attempt < max_attempts) {
            log_warn("txn %s [trace=%s] busy, retrying (%u/%u)", txn_name, ctx.trace_id.c_str(),
                     attempt, max_attempts);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * attempt));
            continue;
        }
        finish_failure(txn_name, ctx, session, s, report);
        return s;
    }
}

} // namespace warden::db
