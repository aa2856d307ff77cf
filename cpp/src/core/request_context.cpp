#include "warden/core/request_context.hpp"

#include <chrono>

namespace warden::core {

Timestamp now_millis() noexcept {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

} // namespace warden::core
