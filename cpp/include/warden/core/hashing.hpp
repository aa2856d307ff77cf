#pragma once

#include <string>
#include <string_view>

#include "warden/core/errors.hpp"
#include "warden/core/types.hpp"

namespace warden::core {
    [[nodiscard]] constexpr bool hash_is_zero(const Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    Status hash_compute(std::string_view data, Hash256* out) noexcept;

    // Lowercase hex of the first `bytes` bytes (at most 32).
    [[nodiscard]] std::string hash_to_hex(const Hash256& h, size_t bytes = 32);

    // policy-<hex(BLAKE3("type/id/name"))[0..16 bytes]>@<domain>. Stable
    // across processes and bounded in length whatever the policy name is.
    Status derive_policy_email(const PolicyId& policy, std::string_view email_domain, Email* out) noexcept;

} // namespace warden::core
