#pragma once
#include <cstdio>
#include <cstdlib>
#include <csignal>

// Raising SIGTRAP lets an attached debugger stop on the failing line, without a debugger it just falls through to abort()
#define DEBUG_BREAK raise(SIGTRAP)

#define message_and_abort_fmt(message, ...)                                                                                                                    \
    do                                                                                                                                                         \
    {                                                                                                                                                          \
        fprintf(stderr, message, __VA_ARGS__);                                                                                                                 \
        fflush(stderr);                                                                                                                                        \
        if (getenv("SUPERCOPY_BREAK_ON_ASSERT"))                                                                                                               \
            DEBUG_BREAK;                                                                                                                                       \
        abort();                                                                                                                                               \
    } while (0)

#define message_and_abort(message) message_and_abort_fmt("%s\n", message)

#define release_assert(cond)                                                                                                                                   \
    do                                                                                                                                                         \
    {                                                                                                                                                          \
        if (!(cond))                                                                                                                                           \
            message_and_abort_fmt("ASSERTION FAILED: (%s) in %s() %s:%d\n", #cond, __func__, __FILE__, __LINE__);                                              \
    } while (0)

#ifdef NDEBUG
#define debug_assert(cond)                                                                                                                                     \
    do                                                                                                                                                         \
    {                                                                                                                                                          \
        (void)sizeof(cond);                                                                                                                                    \
    } while (0)
#else
#define debug_assert(cond) release_assert(cond)
#endif
