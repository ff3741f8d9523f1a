#ifndef COLORSCRIPT_DEBUG_LOG_HPP
#define COLORSCRIPT_DEBUG_LOG_HPP

#include <cstdio>
#include <cstdarg>
#include <atomic>

namespace colorscript {
namespace debug {

// Receives one formatted message without trailing newline
using DebugCallback = void (*)(const char* message);

// When null, DEBUG_LOG writes to stderr
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

/**
 * Installs a callback for the lifetime of the guard and restores the
 * previous one afterwards. Used by the tools and by tests that capture
 * trace output.
 */
class ScopedDebugCallback {
    DebugCallback previous_;

public:
    explicit ScopedDebugCallback(DebugCallback cb)
        : previous_(g_debug_callback.exchange(cb, std::memory_order_acq_rel)) {}

    ~ScopedDebugCallback() {
        g_debug_callback.store(previous_, std::memory_order_release);
    }

    ScopedDebugCallback(const ScopedDebugCallback&) = delete;
    ScopedDebugCallback& operator=(const ScopedDebugCallback&) = delete;
};

// Internal: format a message and hand it to the callback or stderr
inline void debug_output(const char* stage, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[colorscript][%s] %s", stage, buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

} // namespace debug
} // namespace colorscript

// Stage-tagged trace logging, compiled out unless COLORSCRIPT_ENABLE_DEBUG_OUTPUT is set
#ifdef COLORSCRIPT_ENABLE_DEBUG_OUTPUT
    #define DEBUG_LOG(stage, fmt, ...) ::colorscript::debug::debug_output(stage, fmt, ##__VA_ARGS__)
#else
    #define DEBUG_LOG(stage, fmt, ...) ((void)0)
#endif

#endif // COLORSCRIPT_DEBUG_LOG_HPP
