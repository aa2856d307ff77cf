#pragma once

#include <cstdarg>
#include <cstdio>

#include "warden/core/types.hpp"

namespace warden::core {

    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    // Process-wide threshold. The first call to log_level() seeds it from
    // WARDEN_LOG_LEVEL; log_set_level() overrides it afterwards.
    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;

    [[nodiscard]] bool log_parse_level(const char* text, LogLevel* out) noexcept;
    [[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

    // Lines go to stderr unless redirected; nullptr restores stderr.
    void log_set_output(std::FILE* out) noexcept;

    // Writes "<level>: <message>\n" when `level` is at or above the threshold.
    void log_write(LogLevel level, const char* fmt, ...) noexcept;
    void log_vwrite(LogLevel level, const char* fmt, va_list args) noexcept;

    void log_debug(const char* fmt, ...) noexcept;
    void log_info(const char* fmt, ...) noexcept;
    void log_warn(const char* fmt, ...) noexcept;
    void log_error(const char* fmt, ...) noexcept;

} // namespace warden::core
