#include "warden/service/subject_directory.hpp"

namespace warden::service {

using namespace warden::core;

Status DbSubjectDirectory::load_user(const RequestContext& ctx, const UserId& id, User* out, ErrorReport* report) {
    if (out == nullptr) {
        return make_status(StatusDomain::Service, StatusCode::Invalid);
    }
    return db::db_read(db_, "load_user", ctx, [&](db::DbSession& s) {
        return users_.load_user(s, id, out);
    }, report);
}

Status DbSubjectDirectory::enabled(const RequestContext& ctx, const UserId& id, bool* out, ErrorReport* report) {
    if (out == nullptr) {
        return make_status(StatusDomain::Service, StatusCode::Invalid);
    }
    return db::db_read(db_, "user_enabled", ctx, [&](db::DbSession& s) {
        return users_.is_enabled(s, id, out);
    }, report);
}

} // namespace warden::service
