#pragma once

// ==============================================================================
// Panel Debug Tracing
// ==============================================================================
// printf-style trace output for the panel state machine. Compiled out unless
// VERNIER_PANEL_DEBUG is defined to 1 (e.g. -DVERNIER_PANEL_DEBUG=1 or the
// VERNIER_PANEL_DEBUG CMake option).
//
// Output goes to the debugger on Windows and to stderr elsewhere.
// ==============================================================================

#ifndef VERNIER_PANEL_DEBUG
#define VERNIER_PANEL_DEBUG 0
#endif

#if VERNIER_PANEL_DEBUG
#include <cstdarg>
#include <cstdio>
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace Vernier::Core {

inline void logPanel(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
#ifdef _WIN32
    OutputDebugStringA(buf);
#else
    fprintf(stderr, "%s", buf);
#endif
}

} // namespace Vernier::Core

#define VERNIER_LOG_PANEL(...) ::Vernier::Core::logPanel(__VA_ARGS__)
#else
#define VERNIER_LOG_PANEL(...) ((void)0)
#endif
