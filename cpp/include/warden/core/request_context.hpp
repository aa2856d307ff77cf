#pragma once

#include <string>

#include "warden/core/types.hpp"

namespace warden::core {

    // Passed explicitly through every service call. The core only reads the
    // trace id (for log lines); the rest belongs to the caller.
    struct RequestContext {
        std::string trace_id;
        std::string span_id;
        Timestamp started_at{0};
    };

    [[nodiscard]] Timestamp now_millis() noexcept;

} // namespace warden::core
