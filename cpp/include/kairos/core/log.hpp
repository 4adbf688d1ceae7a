#pragma once

#include "kairos/core/errors.hpp"
#include "kairos/core/types.hpp"

namespace kairos::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    // Receives one fully formatted message (no trailing newline).
    using LogSink = void (*)(LogLevel level, const char* component, const char* message, void* user);

    // The threshold starts from KAIROS_LOG_LEVEL (error|warn|info|debug),
    // default warn. Messages above the threshold are dropped.
    void set_log_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] bool log_enabled(LogLevel level) noexcept;

    // nullptr restores the stderr sink.
    void set_log_sink(LogSink sink, void* user) noexcept;

    const char* log_level_name(LogLevel level) noexcept;
    [[nodiscard]] bool log_level_parse(const char* name, LogLevel* out) noexcept;

#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    void log_message(LogLevel level, const char* component, const char* fmt, ...) noexcept;

    // Logs a failed status with its formatted context.
    void log_status(LogLevel level, const char* component, const char* what, Status s) noexcept;

} // namespace kairos::core
