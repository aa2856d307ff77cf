#include "warden/core/errors.hpp"

namespace warden::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::InvalidGraph: return "InvalidGraph";
        case StatusCode::ReferentialIntegrity: return "ReferentialIntegrity";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Io: return "Io";
        case StatusCode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Directory: return "Directory";
        case StatusDomain::Sync: return "Sync";
        case StatusDomain::Security: return "Security";
        case StatusDomain::Service: return "Service";
        case StatusDomain::Config: return "Config";
        case StatusDomain::Cli: return "Cli";
    }
    return "Unknown";
}

} // namespace warden::core
