#pragma once

#include <cstddef>
#include <string_view>

namespace warden::core {

    inline constexpr std::size_t kMaxGroupNameLength = 60;
    inline constexpr std::size_t kMaxResourceIdLength = 100;
    inline constexpr std::size_t kMaxIdentifierLength = 255;

    // [A-Za-z0-9_-]{1,60}
    [[nodiscard]] bool valid_group_name(std::string_view name) noexcept;
    // 1..100 printable characters, no '/'
    [[nodiscard]] bool valid_resource_id(std::string_view id) noexcept;
    // 1..255 printable characters, no whitespace
    [[nodiscard]] bool valid_identifier(std::string_view id) noexcept;
    // local@domain, both non-empty, exactly one '@'
    [[nodiscard]] bool valid_email(std::string_view email) noexcept;

} // namespace warden::core
