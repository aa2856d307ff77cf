#include "warden/db/session.hpp"
#include "warden/core/log.hpp"

#include <sqlite3.h>
#include <utility>

namespace warden::db {

using namespace warden::core;

namespace {
    [[nodiscard]] StatusCode map_sqlite(int rc) noexcept {
        switch (rc) {
            case SQLITE_CONSTRAINT_UNIQUE:
            case SQLITE_CONSTRAINT_PRIMARYKEY:
                return StatusCode::Conflict;
            case SQLITE_CONSTRAINT_FOREIGNKEY:
                return StatusCode::ReferentialIntegrity;
            default:
                break;
        }
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return StatusCode::Busy;
            case SQLITE_CONSTRAINT:
                return StatusCode::Invalid;
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_CANTOPEN:
                return StatusCode::Io;
            default:
                return StatusCode::Unknown;
        }
    }
} // namespace

// ============================================================================
// DbSession
// ============================================================================

DbSession::DbSession(sqlite3* conn, TxnMode mode, Timestamp now) noexcept
    : conn_(conn), mode_(mode), now_(now) {}

Status DbSession::fail(Status s, std::string message) {
    failure_ = s;
    message_ = std::move(message);
    return s;
}

Status DbSession::fail_sqlite(int rc, std::string_view what) {
    const Status s = make_status(StatusDomain::Db, map_sqlite(rc), static_cast<u32>(rc));
    std::string msg(what);
    msg += ": ";
    msg += conn_ ? sqlite3_errmsg(conn_) : sqlite3_errstr(rc);
    if (s.code == StatusCode::Unknown || s.code == StatusCode::Io) {
        log_error("%s", msg.c_str());
    }
    return fail(s, std::move(msg));
}

Status DbSession::exec(const char* sql) {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(conn_, sql, nullptr, nullptr, &err_msg);
    sqlite3_free(err_msg);
    if (rc != SQLITE_OK) {
        return fail_sqlite(rc, sql);
    }
    return ok_status();
}

i64 DbSession::last_insert_rowid() const noexcept {
    return sqlite3_last_insert_rowid(conn_);
}

int DbSession::changes() const noexcept {
    return sqlite3_changes(conn_);
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(DbSession& session, const char* sql) noexcept : session_(session) {
    rc_ = sqlite3_prepare_v2(session_.raw(), sql, -1, &stmt_, nullptr);
    if (rc_ != SQLITE_OK && stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Status Statement::error(std::string_view what) {
    return session_.fail_sqlite(rc_ == SQLITE_OK ? SQLITE_ERROR : rc_, what);
}

void Statement::bind_int64(int idx, i64 v) noexcept {
    sqlite3_bind_int64(stmt_, idx, v);
}

void Statement::bind_text(int idx, std::string_view v) noexcept {
    sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void Statement::bind_null(int idx) noexcept {
    sqlite3_bind_null(stmt_, idx);
}

StepResult Statement::step() noexcept {
    rc_ = sqlite3_step(stmt_);
    if (rc_ == SQLITE_ROW) {
        return StepResult::Row;
    }
    if (rc_ == SQLITE_DONE) {
        return StepResult::Done;
    }
    return StepResult::Error;
}

Status Statement::run(std::string_view what) {
    if (stmt_ == nullptr) {
        return error(what);
    }
    const StepResult r = step();
    if (r == StepResult::Error) {
        return error(what);
    }
    return ok_status();
}

void Statement::reset() noexcept {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::column_is_null(int col) const noexcept {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

i64 Statement::column_int64(int col) const noexcept {
    return sqlite3_column_int64(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (text == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

} // namespace warden::db
