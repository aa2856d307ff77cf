#pragma once
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace warden::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        InvalidGraph,
        ReferentialIntegrity,
        Busy,
        Io,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Db,
        Directory,
        Sync,
        Security,
        Service,
        Config,
        Cli,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Busy is the only code a caller may retry as-is.
    [[nodiscard]] constexpr bool is_transient(Status s) noexcept {
        return s.code == StatusCode::Busy;
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);

    // Status plus the human-readable message for the outermost caller.
    // Messages name the conflicting entity (group, parent, child resource).
    struct ErrorReport {
        Status status{};
        std::string message;
    };

    inline void report_error(ErrorReport* report, Status s, std::string message) {
        if (report == nullptr) {
            return;
        }
        report->status = s;
        report->message = std::move(message);
    }

} // namespace warden::core
