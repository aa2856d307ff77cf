#include "warden/core/validation.hpp"

namespace warden::core {

namespace {
    [[nodiscard]] bool printable_no_space(char c) noexcept {
        return c > 0x20 && c < 0x7f;
    }
} // namespace

bool valid_group_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxGroupNameLength) {
        return false;
    }
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

bool valid_resource_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > kMaxResourceIdLength) {
        return false;
    }
    for (char c : id) {
        if (!printable_no_space(c) || c == '/') {
            return false;
        }
    }
    return true;
}

bool valid_identifier(std::string_view id) noexcept {
    if (id.empty() || id.size() > kMaxIdentifierLength) {
        return false;
    }
    for (char c : id) {
        if (!printable_no_space(c)) {
            return false;
        }
    }
    return true;
}

bool valid_email(std::string_view email) noexcept {
    if (!valid_identifier(email)) {
        return false;
    }
    const std::size_t at = email.find('@');
    if (at == std::string_view::npos || at == 0 || at + 1 >= email.size()) {
        return false;
    }
    return email.find('@', at + 1) == std::string_view::npos;
}

} // namespace warden::core
