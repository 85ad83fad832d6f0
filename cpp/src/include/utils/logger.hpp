/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * 1.  Calls from application threads (`LOGGER_INFO(...)`) format the message and
 *     push a command onto a mutex-protected queue.
 * 2.  A single worker thread is the sole consumer of the queue. It performs all
 *     I/O and owns the active sink, so sinks need no locking of their own.
 * 3.  A `Sink` writes formatted records: `ConsoleSink` (stderr) or `FileSink`.
 * 4.  `flush()` blocks until every command queued before it has been processed;
 *     `shutdown()` drains the queue and joins the worker.
 *
 * The gate runner logs from its worker-pool threads; records from different cells
 * interleave but each record is written atomically.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("[cell {}] static-quality passed", cell_id);
 *
 * auto &logger = cellgate::utils::Logger::instance();
 * logger.set_logfile("cellgate.log");
 * logger.set_level(cellgate::utils::Logger::Level::L_DEBUG);
 * logger.shutdown(); // blocks until all records are written
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "cellgate_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace cellgate::utils
{

struct LoggerImpl;

class CELLGATE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5, ///< logger's own records (sink switches); not a filter level
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks / Configuration ---
    // Sink changes are commands executed in order by the worker thread.

    /**
     * @brief Switch logging to a file (append mode). Non-blocking.
     *
     * The file is opened on the calling thread. On failure the current sink is kept
     * and the reason is printed to stderr.
     */
    void set_logfile(const std::string &utf8_path);

    /**
     * @brief Drains the queue, flushes the sink and stops the worker. Idempotent.
     *
     * Messages logged after shutdown go straight to stderr.
     */
    void shutdown();

    /// Blocks until every command queued before this call has been processed.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error".
     * @return The level, or std::nullopt for an unknown name.
     */
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace cellgate::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::cellgate::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::cellgate::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::cellgate::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::cellgate::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::cellgate::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

