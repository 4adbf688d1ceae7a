#include "kairos/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace kairos::core {
    namespace {
        struct LogState {
            std::once_flag env_once;
            std::atomic<u8> level{static_cast<u8>(LogLevel::Warn)};
            std::mutex sink_mutex;
            LogSink sink = nullptr;
            void* user = nullptr;
        };

        LogState& state() noexcept {
            static LogState s;
            return s;
        }

        void load_env_level() noexcept {
            std::call_once(state().env_once, [] {
                const char* env = std::getenv("KAIROS_LOG_LEVEL");
                LogLevel parsed = LogLevel::Warn;
                if (env && env[0] != '\0' && log_level_parse(env, &parsed)) {
                    state().level.store(static_cast<u8>(parsed), std::memory_order_relaxed);
                }
            });
        }
    } // namespace

    const char* log_level_name(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Error: return "error";
            case LogLevel::Warn: return "warn";
            case LogLevel::Info: return "info";
            case LogLevel::Debug: return "debug";
        }
        return "unknown";
    }

    bool log_level_parse(const char* name, LogLevel* out) noexcept {
        if (!name || !out) {
            return false;
        }
        constexpr LogLevel kLevels[] = {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug};
        for (LogLevel l : kLevels) {
            if (std::strcmp(name, log_level_name(l)) == 0) {
                *out = l;
                return true;
            }
        }
        return false;
    }

    void set_log_level(LogLevel level) noexcept {
        load_env_level();
        state().level.store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        load_env_level();
        return static_cast<LogLevel>(state().level.load(std::memory_order_relaxed));
    }

    bool log_enabled(LogLevel level) noexcept {
        return static_cast<u8>(level) <= static_cast<u8>(log_level());
    }

    void set_log_sink(LogSink sink, void* user) noexcept {
        std::lock_guard<std::mutex> lock(state().sink_mutex);
        state().sink = sink;
        state().user = user;
    }

    void log_message(LogLevel level, const char* component, const char* fmt, ...) noexcept {
        if (!fmt || !log_enabled(level)) {
            return;
        }

        char buf[1024];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);

        const char* comp = component ? component : "kairos";

        std::lock_guard<std::mutex> lock(state().sink_mutex);
        if (state().sink) {
            state().sink(level, comp, buf, state().user);
            return;
        }
        std::fprintf(stderr, "%s: [%s] %s\n", log_level_name(level), comp, buf);
    }

    void log_status(LogLevel level, const char* component, const char* what, Status s) noexcept {
        if (!log_enabled(level)) {
            return;
        }
        char detail[256];
        format_status(s, detail, sizeof(detail));
        log_message(level, component, "%s: %s", what ? what : "operation failed", detail);
    }

} // namespace kairos::core
