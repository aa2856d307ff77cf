#pragma once

#include <functional>
#include <type_traits>

#include "warden/core/errors.hpp"
#include "warden/core/request_context.hpp"
#include "warden/core/types.hpp"
#include "warden/db/schema.hpp"

namespace warden::db {
    using u8 = warden::core::u8;
    using u32 = warden::core::u32;

    struct DbConfig {
        const char* path{nullptr};          // null or ":memory:" for a private in-memory store
        const char* journal_mode{nullptr};  // null: WARDEN_DB_JOURNAL_MODE, then WAL
        u32 busy_timeout_ms{5000};
        u32 max_write_attempts{3};
    };

    struct DbHandle {
        u32 id{0};
    };

    enum class TxnMode : u8 {
        Read = 0,
        Write = 1,
    };

    class DbSession;

    using TxnBody = std::function<warden::core::Status(DbSession&)>;

    warden::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    warden::core::Status db_close(DbHandle db) noexcept;
    [[nodiscard]] bool db_handle_valid(DbHandle db) noexcept;

    // Runs `body` in one transaction. Write transactions are serializable
    // (exclusive in-process lock + BEGIN IMMEDIATE) and are retried up to
    // max_write_attempts when the store reports busy/locked. Read
    // transactions share a lock that excludes writers, so they only ever see
    // committed state. A failing body rolls everything back; its message
    // lands in `report`.
    warden::core::Status db_transaction(DbHandle db,
        TxnMode mode,
        const char* name,
        const warden::core::RequestContext& ctx,
        const TxnBody& body,
        warden::core::ErrorReport* report = nullptr) noexcept;

    inline warden::core::Status db_read(DbHandle db,
        const char* name,
        const warden::core::RequestContext& ctx,
        const TxnBody& body,
        warden::core::ErrorReport* report = nullptr) noexcept {
        return db_transaction(db, TxnMode::Read, name, ctx, body, report);
    }

    inline warden::core::Status db_write(DbHandle db,
        const char* name,
        const warden::core::RequestContext& ctx,
        const TxnBody& body,
        warden::core::ErrorReport* report = nullptr) noexcept {
        return db_transaction(db, TxnMode::Write, name, ctx, body, report);
    }

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace warden::db
