#include "warden/core/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace warden::core {
    Status hash_compute(std::string_view data, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (!data.empty()) {
            blake3_hasher_update(&hasher, data.data(), data.size());
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    std::string hash_to_hex(const Hash256& h, size_t bytes) {
        static constexpr char kHex[] = "0123456789abcdef";
        if (bytes > h.b.size()) {
            bytes = h.b.size();
        }
        std::string out;
        out.reserve(bytes * 2);
        for (size_t i = 0; i < bytes; ++i) {
            out.push_back(kHex[h.b[i] >> 4]);
            out.push_back(kHex[h.b[i] & 0x0f]);
        }
        return out;
    }

    Status derive_policy_email(const PolicyId& policy, std::string_view email_domain, Email* out) noexcept {
        if (out == nullptr || email_domain.empty()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        Hash256 h{};
        const Status s = hash_compute(to_string(policy), &h);
        if (!is_ok(s)) {
            return s;
        }
        std::string email = "policy-";
        email += hash_to_hex(h, 16);
        email += '@';
        email += email_domain;
        out->v = std::move(email);
        return ok_status();
    }
} // namespace warden::core
