/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * - The `Command` variant holds a `LogMessage`, a sink switch, a sink creation
 *   error or a flush request. Public API calls are the producers.
 * - `worker_loop` swaps the whole queue into a local vector under the lock and
 *   then processes the batch without holding it.
 * - Sink errors are reported on stderr; they never reach the sink that failed.
 ******************************************************************************/

#include "cgt_platform.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>

#if defined(CELLGATE_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace cellgate::utils
{

namespace
{

/** @struct LogMessage @brief A single formatted log entry. */
struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

const char *level_to_string(Logger::Level lvl)
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

std::string format_message(const LogMessage &msg)
{
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n",
                       format_tools::formatted_time(msg.timestamp), level_to_string(msg.level),
                       msg.thread_id, msg.body);
}

/**
 * @class Sink
 * @brief Abstract log destination. Only ever called from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : path_(path)
    {
#if defined(CELLGATE_PLATFORM_WIN64)
        std::wstring wpath = format_tools::s2ws(path);
        handle_ = CreateFileW(wpath.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE,
                              nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
#else
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
        if (fd_ == -1)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
#endif
    }

    ~FileSink() override
    {
#if defined(CELLGATE_PLATFORM_WIN64)
        if (handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(handle_);
#else
        if (fd_ != -1)
            ::close(fd_);
#endif
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const std::string line = format_message(msg);
#if defined(CELLGATE_PLATFORM_WIN64)
        DWORD bytes_written = 0;
        if (!WriteFile(handle_, line.data(), static_cast<DWORD>(line.size()), &bytes_written,
                       nullptr))
        {
            throw std::runtime_error("write to " + path_ + " failed");
        }
#else
        const char *p = line.data();
        std::size_t left = line.size();
        while (left > 0)
        {
            const ssize_t n = ::write(fd_, p, left);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error("write to " + path_ + " failed");
            }
            p += n;
            left -= static_cast<std::size_t>(n);
        }
#endif
    }

    void flush() override
    {
#if defined(CELLGATE_PLATFORM_WIN64)
        FlushFileBuffers(handle_);
#else
        ::fsync(fd_);
#endif
    }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
#if defined(CELLGATE_PLATFORM_WIN64)
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<void>> promise;
};
using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand>;

} // namespace

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void process(Command &cmd);
    void report_error(std::string msg);
    void enqueue_command(Command &&cmd);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::mutex shutdown_mutex_;

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Owned by the worker thread.
    std::unique_ptr<Sink> sink_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    shutdown();
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    if (!shutdown_requested_.load(std::memory_order_relaxed))
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // Re-check under the lock: shutdown may have started in between.
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }

    if (auto *msg = std::get_if<LogMessage>(&cmd))
    {
        fmt::print(stderr, "[cellgate::Logger-fallback] {}", format_message(*msg));
    }
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
    {
        flush->promise->set_value();
    }
}

void LoggerImpl::report_error(std::string msg)
{
    fmt::print(stderr, "[cellgate::Logger] {}\n", msg);
}

void LoggerImpl::process(Command &cmd)
{
    std::visit(
        [this](auto &arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, LogMessage>)
            {
                if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                    sink_->write(arg);
            }
            else if constexpr (std::is_same_v<T, SetSinkCommand>)
            {
                const std::string old_desc = sink_ ? sink_->description() : "null";
                if (sink_)
                    sink_->flush();
                sink_ = std::move(arg.new_sink);
                if (sink_)
                {
                    sink_->write({Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                                  platform::get_native_thread_id(),
                                  "Log sink switched from: " + old_desc});
                }
            }
            else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
            {
                report_error(arg.error_message);
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                if (sink_)
                    sink_->flush();
                arg.promise->set_value();
            }
        },
        cmd);
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    for (;;)
    {
        bool stop = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            stop = shutdown_requested_.load() && queue_.empty();
            local_queue.swap(queue_);
        }

        if (stop)
        {
            if (sink_)
                sink_->flush();
            return;
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                process(cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                // Never leave a flush() caller blocked.
                if (auto *flush = std::get_if<FlushCommand>(&cmd))
                    flush->promise->set_value();
            }
        }
        local_queue.clear();
    }
}

void LoggerImpl::shutdown()
{
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    if (shutdown_completed_.load())
        return;

    {
        // Taken so the store cannot slip between the worker's predicate check and its wait.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();

    shutdown_completed_.store(true);
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Intentionally leaked: the worker thread must stay valid for loggers used from
    // static destructors. shutdown() is the supported way to stop it.
    static Logger *instance = new Logger();
    return *instance;
}

void Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (pImpl->shutdown_requested_.load())
        return;

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >=
           static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(LogMessage{lvl, std::chrono::system_clock::now(),
                                          platform::get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[cellgate::Logger] dropped record: {}\n", e.what());
    }
}

} // namespace cellgate::utils
