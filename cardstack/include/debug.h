#pragma once
// debug.h
// Diagnostics for stack editing and compilation.
//
// Configure with -DCARDSTACK_DEBUG_LOG=ON to define CS_DEBUG; otherwise every
// macro expands to nothing and its arguments are not evaluated.
//
// Subsystems in use: "ports", "card", "registry", "stack", "validate",
// "graph", "history", "compiler". For example:
//   CS_LOG("graph", "graph_to_stack: %s", message.c_str());
//   CS_WARN(card, "registry", "factory for %s returned no card", id.c_str());
//   CS_ASSERT(!active.empty(), "serial fold over no active entries");
//
// Each line is written with a single fprintf to stderr as "[cs/<subsystem>] ...".

#include <cstdio>
#include <cstdarg>

#ifdef CS_DEBUG

// Internal helper: single formatted write to stderr with prefix.
static inline void cs_log_impl(const char* subsystem, const char* fmt, ...) {
    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(buf, sizeof(buf) - 2, fmt, ap);
    va_end(ap);
    if (n < 0) n = 0;
    if (n > static_cast<int>(sizeof(buf)) - 2) n = static_cast<int>(sizeof(buf)) - 2;
    buf[n] = '\n'; buf[n+1] = '\0';
    fprintf(stderr, "[cs/%s] %s", subsystem, buf);
}

#define CS_LOG(subsystem, ...) cs_log_impl(subsystem, __VA_ARGS__)

// Trap with diagnostic if condition is false, only in debug builds.
#define CS_ASSERT(cond, ...) \
    do { if (!(cond)) { \
        fprintf(stderr, "[cs/ASSERT] %s:%d: ", __FILE__, __LINE__); \
        fprintf(stderr, __VA_ARGS__); \
        fprintf(stderr, "\n"); \
        fflush(stderr); \
        __builtin_trap(); \
    } } while (0)

// Softer version: logs but doesn't trap.
#define CS_WARN(cond, subsystem, ...) \
    do { if (!(cond)) { cs_log_impl(subsystem, "WARN " __VA_ARGS__); } } while (0)

#else // !CS_DEBUG

#define CS_LOG(subsystem, ...)     do {} while (0)
#define CS_ASSERT(cond, ...)       do {} while (0)
#define CS_WARN(cond, sub, ...)    do {} while (0)

#endif // CS_DEBUG
