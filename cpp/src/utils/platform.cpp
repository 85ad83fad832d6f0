#include "cgt_platform.hpp"

#include <functional>
#include <thread>

#if defined(CELLGATE_PLATFORM_WIN64)
// <windows.h> comes from cgt_platform.hpp
#else
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace cellgate::platform
{

uint64_t get_pid()
{
#if defined(CELLGATE_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses `GetCurrentThreadId`, `pthread_threadid_np` or `syscall(SYS_gettid)`.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(CELLGATE_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

const char *host_platform_name() noexcept
{
#if defined(CELLGATE_PLATFORM_WIN64)
    return "windows";
#elif defined(CELLGATE_PLATFORM_LINUX)
    return "linux";
#elif defined(CELLGATE_PLATFORM_APPLE)
    return "macos";
#elif defined(CELLGATE_PLATFORM_FREEBSD)
    return "freebsd";
#else
    return "unknown";
#endif
}

} // namespace cellgate::platform
