#pragma once

#include <string>
#include <string_view>

#include "warden/core/errors.hpp"
#include "warden/core/types.hpp"
#include "warden/db/db.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace warden::db {
    using i64 = warden::core::i64;

    // One transaction attempt on the shared connection. Store code records
    // its failure here so the transaction runner can hand the message to the
    // outermost caller.
    class DbSession {
    public:
        DbSession(sqlite3* conn, TxnMode mode, warden::core::Timestamp now) noexcept;

        DbSession(const DbSession&) = delete;
        DbSession& operator=(const DbSession&) = delete;

        [[nodiscard]] sqlite3* raw() const noexcept { return conn_; }
        [[nodiscard]] TxnMode mode() const noexcept { return mode_; }
        // Fixed for the whole attempt so every row written shares one timestamp.
        [[nodiscard]] warden::core::Timestamp now() const noexcept { return now_; }

        warden::core::Status fail(warden::core::Status s, std::string message);
        // Maps a sqlite result code: unique/primary key -> Conflict, foreign
        // key -> ReferentialIntegrity, busy/locked -> Busy, else Unknown.
        warden::core::Status fail_sqlite(int rc, std::string_view what);

        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] warden::core::Status failure() const noexcept { return failure_; }

        warden::core::Status exec(const char* sql);
        [[nodiscard]] i64 last_insert_rowid() const noexcept;
        [[nodiscard]] int changes() const noexcept;

    private:
        sqlite3* conn_{nullptr};
        TxnMode mode_{TxnMode::Read};
        warden::core::Timestamp now_{0};
        warden::core::Status failure_{};
        std::string message_;
    };

    enum class StepResult : warden::core::u8 {
        Row = 0,
        Done = 1,
        Error = 2,
    };

    class Statement {
    public:
        Statement(DbSession& session, const char* sql) noexcept;
        ~Statement();

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }
        // Records the last sqlite error on the session and returns it.
        warden::core::Status error(std::string_view what);

        void bind_int64(int idx, i64 v) noexcept;
        void bind_text(int idx, std::string_view v) noexcept;
        void bind_null(int idx) noexcept;

        StepResult step() noexcept;
        // Steps once expecting completion.
        warden::core::Status run(std::string_view what);
        void reset() noexcept;

        [[nodiscard]] bool column_is_null(int col) const noexcept;
        [[nodiscard]] i64 column_int64(int col) const noexcept;
        [[nodiscard]] std::string column_text(int col) const;

    private:
        DbSession& session_;
        sqlite3_stmt* stmt_{nullptr};
        int rc_{0};
    };

} // namespace warden::db
