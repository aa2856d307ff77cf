#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "warden/core/errors.hpp"
#include "warden/core/log.hpp"
#include "warden/core/models.hpp"
#include "warden/security/resource_types.hpp"

namespace warden::config {
    using warden::core::ErrorReport;
    using warden::core::Status;
    using u32 = warden::core::u32;

    struct ServiceConfig {
        std::string db_path;                // empty: in-memory
        std::string journal_mode;           // empty: WAL
        u32 busy_timeout_ms{5000};
        u32 max_write_attempts{3};
        std::string email_domain{"warden.local"};
        core::LogLevel log_level{core::LogLevel::Warn};
        std::vector<core::ResourceType> resource_types;
    };

    // Parses the YAML document. Invalid (Config domain) with a message
    // naming the offending key, type, role or pattern.
    Status config_parse_string(std::string_view yaml, ServiceConfig* out, ErrorReport* report = nullptr);
    // Io when the file cannot be read, otherwise as config_parse_string.
    Status config_load_file(const std::string& path, ServiceConfig* out, ErrorReport* report = nullptr);

    // WARDEN_DB_PATH, WARDEN_DB_JOURNAL_MODE, WARDEN_EMAIL_DOMAIN and
    // WARDEN_LOG_LEVEL win over the file.
    Status config_apply_env(ServiceConfig* cfg, ErrorReport* report = nullptr);

    // Loads every resource type into `out`; the first rejected type stops it.
    Status config_build_registry(const ServiceConfig& cfg, security::ResourceTypeRegistry* out,
                                 ErrorReport* report = nullptr);

} // namespace warden::config
