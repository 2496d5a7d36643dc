#pragma once

#include <atomic>
#include <cstdio>
#include <format>
#include <print>
#include <system_error>
#include <utility>

namespace sstun::log {

inline std::atomic<bool>& debug_enabled() {
    static std::atomic<bool> enabled{false};
    return enabled;
}

inline void set_debug(bool enabled) {
    debug_enabled().store(enabled, std::memory_order_relaxed);
}

inline std::atomic<std::FILE*>& sink() {
    static std::atomic<std::FILE*> stream{stderr};
    return stream;
}

// Where messages go; stderr by default.
inline void set_sink(std::FILE* stream) {
    sink().store(stream, std::memory_order_relaxed);
}

// Output failures are dropped: a broken sink must not end a connection.
template <typename... Args>
void emit(std::format_string<Args...> fmt, Args&&... args) {
    try {
        std::println(sink().load(std::memory_order_relaxed), fmt, std::forward<Args>(args)...);
    } catch (const std::system_error&) {
    }
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    emit(fmt, std::forward<Args>(args)...);
}

// Diagnostic output, dropped unless set_debug(true) was called.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (!debug_enabled().load(std::memory_order_relaxed))
        return;
    emit(fmt, std::forward<Args>(args)...);
}

} // namespace sstun::log
