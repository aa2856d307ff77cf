#include "warden/config/config.hpp"

#include <cstdlib>
#include <exception>
#include <map>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace warden::config {

using namespace warden::core;

namespace {
    [[nodiscard]] Status cfg_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Config, code);
    }

    [[nodiscard]] Status reject(ErrorReport* report, std::string message) {
        report_error(report, cfg_status(StatusCode::Invalid), std::move(message));
        return cfg_status(StatusCode::Invalid);
    }

    Status parse_database(const YAML::Node& node, ServiceConfig* cfg, ErrorReport* report) {
        if (!node.IsMap()) {
            return reject(report, "database: expected a mapping");
        }
        if (node["path"]) {
            cfg->db_path = node["path"].as<std::string>();
        }
        if (node["journalMode"]) {
            cfg->journal_mode = node["journalMode"].as<std::string>();
        }
        if (node["busyTimeoutMs"]) {
            cfg->busy_timeout_ms = node["busyTimeoutMs"].as<u32>();
        }
        if (node["maxWriteAttempts"]) {
            cfg->max_write_attempts = node["maxWriteAttempts"].as<u32>();
            if (cfg->max_write_attempts == 0) {
                return reject(report, "database.maxWriteAttempts must be at least 1");
            }
        }
        return ok_status();
    }

    Status parse_resource_type(const std::string& name, const YAML::Node& node, ResourceType* out,
                               ErrorReport* report) {
        if (name.empty()) {
            return reject(report, "resourceTypes: empty type name");
        }
        if (!node.IsMap()) {
            return reject(report, "resourceTypes." + name + ": expected a mapping");
        }

        ResourceType type;
        type.name = ResourceTypeName{name};

        if (const YAML::Node patterns = node["actionPatterns"]) {
            if (!patterns.IsSequence()) {
                return reject(report, "resourceTypes." + name + ".actionPatterns: expected a list");
            }
            for (const auto& p : patterns) {
                type.action_patterns.insert(p.as<std::string>());
            }
        }

        const YAML::Node owner = node["ownerRoleName"];
        if (!owner) {
            return reject(report, "resourceTypes." + name + ": missing ownerRoleName");
        }
        type.owner_role = RoleName{owner.as<std::string>()};

        if (const YAML::Node roles = node["roles"]) {
            if (!roles.IsMap()) {
                return reject(report, "resourceTypes." + name + ".roles: expected a mapping");
            }
            for (auto it : roles.as<std::map<std::string, YAML::Node>>()) {
                ResourceRole role;
                role.name = RoleName{it.first};
                if (const YAML::Node actions = it.second["roleActions"]) {
                    if (!actions.IsSequence()) {
                        return reject(report, "resourceTypes." + name + ".roles." + it.first +
                                                  ".roleActions: expected a list");
                    }
                    for (const auto& a : actions) {
                        role.actions.insert(ActionName{a.as<std::string>()});
                    }
                }
                type.roles.emplace(role.name, std::move(role));
            }
        }

        *out = std::move(type);
        return ok_status();
    }

    Status parse_document(const YAML::Node& root, ServiceConfig* out, ErrorReport* report) {
        ServiceConfig cfg;
        if (root.IsNull()) {
            *out = std::move(cfg);
            return ok_status();
        }
        if (!root.IsMap()) {
            return reject(report, "configuration: expected a mapping at the top level");
        }

        Status status = ok_status();
        if (root["database"]) {
            status = parse_database(root["database"], &cfg, report);
            if (!is_ok(status)) {
                return status;
            }
        }
        if (root["emailDomain"]) {
            cfg.email_domain = root["emailDomain"].as<std::string>();
        }
        if (root["logLevel"]) {
            const std::string level = root["logLevel"].as<std::string>();
            if (!log_parse_level(level.c_str(), &cfg.log_level)) {
                return reject(report, "logLevel: unknown level '" + level + "'");
            }
        }
        if (const YAML::Node types = root["resourceTypes"]) {
            if (!types.IsMap()) {
                return reject(report, "resourceTypes: expected a mapping");
            }
            for (auto it : types.as<std::map<std::string, YAML::Node>>()) {
                ResourceType type;
                status = parse_resource_type(it.first, it.second, &type, report);
                if (!is_ok(status)) {
                    return status;
                }
                cfg.resource_types.push_back(std::move(type));
            }
        }

        *out = std::move(cfg);
        return ok_status();
    }
} // namespace

Status config_parse_string(std::string_view yaml, ServiceConfig* out, ErrorReport* report) {
    if (out == nullptr) {
        return cfg_status(StatusCode::Invalid);
    }
    try {
        return parse_document(YAML::Load(std::string(yaml)), out, report);
    } catch (const YAML::Exception& e) {
        return reject(report, std::string("configuration: ") + e.what());
    }
}

Status config_load_file(const std::string& path, ServiceConfig* out, ErrorReport* report) {
    if (out == nullptr) {
        return cfg_status(StatusCode::Invalid);
    }
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        report_error(report, cfg_status(StatusCode::Io), "cannot read " + path);
        return cfg_status(StatusCode::Io);
    } catch (const YAML::Exception& e) {
        return reject(report, path + ": " + e.what());
    }
    try {
        return parse_document(root, out, report);
    } catch (const YAML::Exception& e) {
        return reject(report, path + ": " + e.what());
    }
}

Status config_apply_env(ServiceConfig* cfg, ErrorReport* report) {
    if (cfg == nullptr) {
        return cfg_status(StatusCode::Invalid);
    }
    if (const char* v = std::getenv("WARDEN_DB_PATH"); v != nullptr && v[0] != '\0') {
        cfg->db_path = v;
    }
    if (const char* v = std::getenv("WARDEN_DB_JOURNAL_MODE"); v != nullptr && v[0] != '\0') {
        cfg->journal_mode = v;
    }
    if (const char* v = std::getenv("WARDEN_EMAIL_DOMAIN"); v != nullptr && v[0] != '\0') {
        cfg->email_domain = v;
    }
    if (const char* v = std::getenv("WARDEN_LOG_LEVEL"); v != nullptr && v[0] != '\0') {
        if (!log_parse_level(v, &cfg->log_level)) {
            return reject(report, std::string("WARDEN_LOG_LEVEL: unknown level '") + v + "'");
        }
    }
    return ok_status();
}

Status config_build_registry(const ServiceConfig& cfg, security::ResourceTypeRegistry* out, ErrorReport* report) {
    if (out == nullptr) {
        return cfg_status(StatusCode::Invalid);
    }
    for (const ResourceType& type : cfg.resource_types) {
        ErrorReport detail;
        const Status status = out->add(type, &detail);
        if (!is_ok(status)) {
            return reject(report, detail.message);
        }
    }
    return ok_status();
}

} // namespace warden::config
