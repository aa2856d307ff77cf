#include "warden/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <strings.h>

namespace warden::core {

namespace {
    constexpr u8 kUnset = 0xff;

    std::atomic<u8> g_level{kUnset};
    std::mutex g_write_mutex;
    std::FILE* g_output = nullptr;

    [[nodiscard]] LogLevel level_from_env() noexcept {
        LogLevel level = LogLevel::Warn;
        const char* env = std::getenv("WARDEN_LOG_LEVEL");
        if (env != nullptr && env[0] != '\0') {
            (void)log_parse_level(env, &level);
        }
        return level;
    }
} // namespace

void log_set_level(LogLevel level) noexcept {
    g_level.store(static_cast<u8>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    u8 v = g_level.load(std::memory_order_relaxed);
    if (v == kUnset) {
        const u8 seeded = static_cast<u8>(level_from_env());
        if (g_level.compare_exchange_strong(v, seeded, std::memory_order_relaxed)) {
            v = seeded;
        }
    }
    return static_cast<LogLevel>(v);
}

bool log_parse_level(const char* text, LogLevel* out) noexcept {
    if (text == nullptr || out == nullptr) {
        return false;
    }
    struct Entry {
        const char* name;
        LogLevel level;
    };
    static constexpr Entry kLevels[] = {
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"off", LogLevel::Off},
    };
    for (const Entry& e : kLevels) {
        if (strcasecmp(text, e.name) == 0) {
            *out = e.level;
            return true;
        }
    }
    return false;
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "off";
}

void log_set_output(std::FILE* out) noexcept {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_output = out;
}

void log_vwrite(LogLevel level, const char* fmt, va_list args) noexcept {
    if (level == LogLevel::Off || level < log_level() || fmt == nullptr) {
        return;
    }

    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, args);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::FILE* out = g_output != nullptr ? g_output : stderr;
    std::fprintf(out, "%s: %s\n", log_level_name(level), buf);
    std::fflush(out);
}

void log_write(LogLevel level, const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    log_vwrite(level, fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Debug, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Warn, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Error, fmt, args);
    va_end(args);
}

} // namespace warden::core
