#pragma once
/**
 * @file cgt_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * Every file that needs platform macros (CELLGATE_PLATFORM_WIN64, CELLGATE_IS_POSIX, etc.)
 * or Windows headers should include this. It is self-contained and can be included at any
 * point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define CELLGATE_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define CELLGATE_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define CELLGATE_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define CELLGATE_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define CELLGATE_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define CELLGATE_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define CELLGATE_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define CELLGATE_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define CELLGATE_PLATFORM_LINUX 1
#else
#define CELLGATE_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(CELLGATE_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(CELLGATE_PLATFORM_WIN64)
#define CELLGATE_IS_WINDOWS 1
#undef CELLGATE_IS_POSIX
#elif defined(CELLGATE_PLATFORM_APPLE) || defined(CELLGATE_PLATFORM_FREEBSD) ||                    \
    defined(CELLGATE_PLATFORM_LINUX)
#undef CELLGATE_IS_WINDOWS
#define CELLGATE_IS_POSIX 1
#else
#undef CELLGATE_IS_WINDOWS
#undef CELLGATE_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "cellgate_utils_export.h"

namespace cellgate::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
CELLGATE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
CELLGATE_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Name of the platform this binary was compiled for, in matrix spelling
 *        ("linux", "windows", "macos", "freebsd" or "unknown").
 */
CELLGATE_UTILS_EXPORT const char *host_platform_name() noexcept;

} // namespace cellgate::platform
