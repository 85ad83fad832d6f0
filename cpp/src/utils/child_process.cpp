/**
 * @file child_process.cpp
 * @brief Implements platform-abstracted spawning, waiting and termination of child processes.
 */
#include "cgt_platform.hpp"
#include "utils/child_process.hpp"
#include "utils/format_tools.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#include <fmt/format.h>

#if defined(CELLGATE_IS_POSIX)
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
extern char **environ; // NOLINT(readability-redundant-declaration)
#endif

namespace cellgate::utils
{

namespace fs = std::filesystem;

namespace
{
// Poll interval while waiting for a child; bounds cancellation latency.
constexpr auto kPollInterval = std::chrono::milliseconds(20);
// How long a terminated child gets to exit before it is killed outright.
constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);
} // namespace

const char *to_string(ExitKind kind) noexcept
{
    switch (kind)
    {
    case ExitKind::Exited: return "exited";
    case ExitKind::Signaled: return "signaled";
    case ExitKind::TimedOut: return "timed out";
    case ExitKind::Cancelled: return "cancelled";
    default: return "unknown";
    }
}

const char *to_string(SpawnError err) noexcept
{
    switch (err)
    {
    case SpawnError::EmptyCommand: return "empty command";
    case SpawnError::ProgramNotFound: return "program not found";
    case SpawnError::RedirectFailed: return "cannot create output file";
    case SpawnError::BadWorkingDir: return "cannot enter working directory";
    case SpawnError::ForkFailed: return "cannot create process";
    case SpawnError::ExecFailed: return "cannot execute program";
    case SpawnError::WaitFailed: return "cannot wait for process";
    default: return "unknown";
    }
}

#if defined(CELLGATE_IS_POSIX)

// ============================================================================
// POSIX implementation
// ============================================================================

struct ChildProcessImpl
{
    pid_t pid = -1;
    bool reaped = false;
    ProcessSpec spec;
    std::chrono::steady_clock::time_point started;

    ~ChildProcessImpl() { terminate_and_reap(); }

    void signal_group(int sig) const
    {
        // The child made itself a process group leader, so -pid reaches its descendants.
        if (::kill(-pid, sig) == -1)
            ::kill(pid, sig);
    }

    enum class Reap
    {
        Running,
        Reaped, ///< status is valid
        Lost    ///< gone, but its status is unknown (ECHILD)
    };

    Reap try_reap(int &status)
    {
        for (;;)
        {
            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid)
            {
                reaped = true;
                return Reap::Reaped;
            }
            if (r == -1 && errno == EINTR)
                continue;
            if (r == -1)
            {
                // Reaped elsewhere, e.g. SIGCHLD inherited as SIG_IGN.
                reaped = true;
                return Reap::Lost;
            }
            return Reap::Running;
        }
    }

    void terminate(int &status)
    {
        signal_group(SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (try_reap(status) != Reap::Running)
                return;
            std::this_thread::sleep_for(kPollInterval);
        }
        signal_group(SIGKILL);
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR)
        {
        }
        reaped = true;
    }

    void terminate_and_reap()
    {
        if (pid > 0 && !reaped)
        {
            int status = 0;
            terminate(status);
        }
    }
};

namespace
{

// Resolves argv[0] against PATH the way execvp would, but in the parent, so the child
// only has to call execve().
std::string resolve_program(const std::string &program)
{
    if (program.find('/') != std::string::npos)
    {
        return ::access(program.c_str(), X_OK) == 0 ? program : std::string{};
    }
    const char *path_env = std::getenv("PATH");
    std::string_view path = (path_env != nullptr) ? path_env : "/usr/local/bin:/usr/bin:/bin";
    while (!path.empty())
    {
        const auto sep = path.find(':');
        std::string_view dir = path.substr(0, sep);
        path = (sep == std::string_view::npos) ? std::string_view{} : path.substr(sep + 1);
        const fs::path candidate = fs::path(dir.empty() ? "." : std::string(dir)) / program;
        if (::access(candidate.c_str(), X_OK) == 0)
        {
            std::error_code ec;
            if (!fs::is_directory(candidate, ec))
                return candidate.string();
        }
    }
    return {};
}

std::vector<std::string> build_environment(const ProcessSpec &spec)
{
    std::vector<std::string> env;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e)
    {
        std::string_view entry(*e);
        const auto eq = entry.find('=');
        const std::string_view key = entry.substr(0, eq);
        const bool overridden =
            std::any_of(spec.env.begin(), spec.env.end(),
                        [&](const auto &kv) { return kv.first == key; });
        if (!overridden)
            env.emplace_back(entry);
    }
    for (const auto &[key, value] : spec.env)
    {
        env.push_back(key + "=" + value);
    }
    return env;
}

#if defined(CELLGATE_PLATFORM_APPLE)
std::mutex &spawn_mutex()
{
    static std::mutex m;
    return m;
}
#endif

int open_output(const fs::path &path)
{
    int fd = -1;
    do
    {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    } while (fd == -1 && errno == EINTR);
    return fd;
}

void close_fd(int &fd)
{
    if (fd != -1)
    {
        ::close(fd);
        fd = -1;
    }
}

// Child side after fork(): only async-signal-safe calls from here on.
[[noreturn]] void exec_child(int stdin_fd, int stdout_fd, int stderr_fd, int report_fd,
                             const char *working_dir, const char *program, char *const argv[],
                             char *const envp[])
{
    ::setpgid(0, 0);
    ::dup2(stdin_fd, 0);
    ::dup2(stdout_fd, 1);
    ::dup2(stderr_fd, 2);

    int err = 0;
    if (working_dir != nullptr && ::chdir(working_dir) != 0)
    {
        err = -errno; // negative: working directory problem
    }
    else
    {
        ::execve(program, argv, envp);
        err = errno;
    }
    ssize_t unused = ::write(report_fd, &err, sizeof(err));
    (void)unused;
    ::_exit(127);
}

} // namespace

Result<std::unique_ptr<ChildProcess>, SpawnError> ChildProcess::spawn(const ProcessSpec &spec)
{
    using R = Result<std::unique_ptr<ChildProcess>, SpawnError>;
    if (spec.argv.empty() || spec.argv.front().empty())
    {
        return R::error(SpawnError::EmptyCommand);
    }

    const std::string program = resolve_program(spec.argv.front());
    if (program.empty())
    {
        return R::error(SpawnError::ProgramNotFound, ENOENT);
    }

    // Everything the child needs is allocated before fork().
    std::vector<std::string> env_strings = build_environment(spec);
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &e : env_strings)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_strings = spec.argv;
    std::vector<char *> argv;
    argv.reserve(argv_strings.size() + 1);
    for (auto &a : argv_strings)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    const std::string working_dir = spec.working_dir.string();

    int stdout_fd = open_output(spec.stdout_path);
    int stderr_fd = open_output(spec.stderr_path);
    int stdin_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    int report_pipe[2] = {-1, -1};
    // Close-on-exec from creation: a sibling thread's fork must not inherit the write end.
#if defined(CELLGATE_PLATFORM_APPLE)
    // No pipe2(); hold the spawn lock from pipe() until after fork() instead.
    std::unique_lock<std::mutex> spawn_lock(spawn_mutex());
    const bool pipe_ok = ::pipe(report_pipe) == 0 &&
                         ::fcntl(report_pipe[0], F_SETFD, FD_CLOEXEC) == 0 &&
                         ::fcntl(report_pipe[1], F_SETFD, FD_CLOEXEC) == 0;
#else
    const bool pipe_ok = ::pipe2(report_pipe, O_CLOEXEC) == 0;
#endif

    auto close_all = [&]
    {
        close_fd(stdout_fd);
        close_fd(stderr_fd);
        close_fd(stdin_fd);
        close_fd(report_pipe[0]);
        close_fd(report_pipe[1]);
    };

    if (stdout_fd == -1 || stderr_fd == -1 || stdin_fd == -1)
    {
        const int err = errno;
        close_all();
        return R::error(SpawnError::RedirectFailed, err);
    }
    if (!pipe_ok)
    {
        const int err = errno;
        close_all();
        return R::error(SpawnError::ForkFailed, err);
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = ::fork();
    if (pid == -1)
    {
        const int err = errno;
        close_all();
        return R::error(SpawnError::ForkFailed, err);
    }
    if (pid == 0)
    {
        exec_child(stdin_fd, stdout_fd, stderr_fd, report_pipe[1],
                   working_dir.empty() ? nullptr : working_dir.c_str(), program.c_str(),
                   argv.data(), envp.data());
    }

#if defined(CELLGATE_PLATFORM_APPLE)
    spawn_lock.unlock();
#endif
    // Parent. Mirror the child's setpgid() so signal_group() works even if we race it.
    ::setpgid(pid, pid);
    close_fd(report_pipe[1]);

    int child_err = 0;
    ssize_t n = 0;
    do
    {
        n = ::read(report_pipe[0], &child_err, sizeof(child_err));
    } while (n == -1 && errno == EINTR);
    close_all();

    if (n == static_cast<ssize_t>(sizeof(child_err)))
    {
        // exec or chdir failed; the child has already exited with 127.
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR)
        {
        }
        if (child_err < 0)
            return R::error(SpawnError::BadWorkingDir, -child_err);
        return R::error(SpawnError::ExecFailed, child_err);
    }

    auto impl = std::make_unique<ChildProcessImpl>();
    impl->pid = pid;
    impl->spec = spec;
    impl->started = started;
    return R::ok(std::unique_ptr<ChildProcess>(new ChildProcess(std::move(impl))));
}

Result<ProcessOutcome, SpawnError> ChildProcess::wait(const CancellationToken *cancel)
{
    using R = Result<ProcessOutcome, SpawnError>;
    auto &impl = *pImpl;
    if (impl.reaped)
    {
        return R::error(SpawnError::WaitFailed, ECHILD);
    }

    ProcessOutcome outcome;
    int status = 0;
    bool ended_by_us = false;
    for (;;)
    {
        const auto state = impl.try_reap(status);
        if (state == ChildProcessImpl::Reap::Lost)
            return R::error(SpawnError::WaitFailed, ECHILD);
        if (state == ChildProcessImpl::Reap::Reaped)
            break;
        if (cancel != nullptr && cancel->requested())
        {
            outcome.kind = ExitKind::Cancelled;
            ended_by_us = true;
            impl.terminate(status);
            break;
        }
        if (impl.spec.timeout.count() > 0 &&
            std::chrono::steady_clock::now() - impl.started >= impl.spec.timeout)
        {
            outcome.kind = ExitKind::TimedOut;
            ended_by_us = true;
            impl.terminate(status);
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - impl.started);
    if (WIFEXITED(status))
    {
        outcome.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        outcome.signal = WTERMSIG(status);
        if (!ended_by_us)
            outcome.kind = ExitKind::Signaled;
    }

    outcome.stdout_text = format_tools::read_file(impl.spec.stdout_path).value_or(std::string{});
    outcome.stderr_text = format_tools::read_file(impl.spec.stderr_path).value_or(std::string{});
    return R::ok(std::move(outcome));
}

long ChildProcess::pid() const noexcept
{
    return static_cast<long>(pImpl->pid);
}

#else

// ============================================================================
// Windows implementation
// ============================================================================

struct ChildProcessImpl
{
    HANDLE process = nullptr;
    DWORD process_id = 0;
    bool reaped = false;
    ProcessSpec spec;
    std::chrono::steady_clock::time_point started;

    ~ChildProcessImpl()
    {
        if (process != nullptr)
        {
            if (!reaped)
            {
                TerminateProcess(process, 1);
                WaitForSingleObject(process, INFINITE);
            }
            CloseHandle(process);
        }
    }
};

namespace
{

// Quotes one argument following the CommandLineToArgvW rules.
std::wstring quote_argument(const std::wstring &arg)
{
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos)
        return arg;

    std::wstring out = L"\"";
    for (auto it = arg.begin();; ++it)
    {
        std::size_t backslashes = 0;
        while (it != arg.end() && *it == L'\\')
        {
            ++it;
            ++backslashes;
        }
        if (it == arg.end())
        {
            out.append(backslashes * 2, L'\\');
            break;
        }
        if (*it == L'"')
        {
            out.append(backslashes * 2 + 1, L'\\');
            out.push_back(*it);
        }
        else
        {
            out.append(backslashes, L'\\');
            out.push_back(*it);
        }
    }
    out.push_back(L'"');
    return out;
}

std::vector<wchar_t> build_environment_block(const ProcessSpec &spec)
{
    std::vector<std::wstring> entries;
    LPWCH block = GetEnvironmentStringsW();
    if (block != nullptr)
    {
        for (LPWCH p = block; *p != L'\0'; p += wcslen(p) + 1)
        {
            std::wstring entry(p);
            const auto eq = entry.find(L'=', 1); // "=C:=C:\..." entries start with '='
            const std::string key = format_tools::ws2s(entry.substr(0, eq));
            const bool overridden = std::any_of(
                spec.env.begin(), spec.env.end(),
                [&](const auto &kv) { return _stricmp(kv.first.c_str(), key.c_str()) == 0; });
            if (!overridden)
                entries.push_back(std::move(entry));
        }
        FreeEnvironmentStringsW(block);
    }
    for (const auto &[key, value] : spec.env)
    {
        entries.push_back(format_tools::s2ws(key + "=" + value));
    }
    std::sort(entries.begin(), entries.end());

    std::vector<wchar_t> out;
    for (const auto &e : entries)
    {
        out.insert(out.end(), e.begin(), e.end());
        out.push_back(L'\0');
    }
    out.push_back(L'\0');
    return out;
}

} // namespace

Result<std::unique_ptr<ChildProcess>, SpawnError> ChildProcess::spawn(const ProcessSpec &spec)
{
    using R = Result<std::unique_ptr<ChildProcess>, SpawnError>;
    if (spec.argv.empty() || spec.argv.front().empty())
    {
        return R::error(SpawnError::EmptyCommand);
    }

    std::wstring cmdline;
    for (const auto &a : spec.argv)
    {
        if (!cmdline.empty())
            cmdline += L' ';
        cmdline += quote_argument(format_tools::s2ws(a));
    }
    std::vector<wchar_t> cmd_buf(cmdline.begin(), cmdline.end());
    cmd_buf.push_back(L'\0');

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE hStdout = CreateFileW(spec.stdout_path.c_str(), GENERIC_WRITE,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, CREATE_ALWAYS,
                                 FILE_ATTRIBUTE_NORMAL, nullptr);
    HANDLE hStderr = CreateFileW(spec.stderr_path.c_str(), GENERIC_WRITE,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, CREATE_ALWAYS,
                                 FILE_ATTRIBUTE_NORMAL, nullptr);
    if (hStdout == INVALID_HANDLE_VALUE || hStderr == INVALID_HANDLE_VALUE)
    {
        const DWORD err = GetLastError();
        if (hStdout != INVALID_HANDLE_VALUE)
            CloseHandle(hStdout);
        if (hStderr != INVALID_HANDLE_VALUE)
            CloseHandle(hStderr);
        return R::error(SpawnError::RedirectFailed, static_cast<int>(err));
    }

    std::error_code ec;
    if (!spec.working_dir.empty() && !fs::is_directory(spec.working_dir, ec))
    {
        CloseHandle(hStdout);
        CloseHandle(hStderr);
        return R::error(SpawnError::BadWorkingDir, ERROR_DIRECTORY);
    }

    STARTUPINFOW si{};
    PROCESS_INFORMATION pi{};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdOutput = hStdout;
    si.hStdError = hStderr;
    si.hStdInput = nullptr;

    std::vector<wchar_t> env_block = build_environment_block(spec);
    const std::wstring cwd = spec.working_dir.wstring();

    const auto started = std::chrono::steady_clock::now();
    BOOL ok = CreateProcessW(nullptr, cmd_buf.data(), nullptr, nullptr,
                             /*bInheritHandles*/ TRUE, CREATE_UNICODE_ENVIRONMENT,
                             env_block.data(), cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);

    // The child owns its copies of the redirect handles now.
    CloseHandle(hStdout);
    CloseHandle(hStderr);

    if (!ok)
    {
        const DWORD err = GetLastError();
        if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND)
            return R::error(SpawnError::ProgramNotFound, static_cast<int>(err));
        return R::error(SpawnError::ExecFailed, static_cast<int>(err));
    }

    CloseHandle(pi.hThread);
    auto impl = std::make_unique<ChildProcessImpl>();
    impl->process = pi.hProcess;
    impl->process_id = pi.dwProcessId;
    impl->spec = spec;
    impl->started = started;
    return R::ok(std::unique_ptr<ChildProcess>(new ChildProcess(std::move(impl))));
}

Result<ProcessOutcome, SpawnError> ChildProcess::wait(const CancellationToken *cancel)
{
    using R = Result<ProcessOutcome, SpawnError>;
    auto &impl = *pImpl;
    if (impl.reaped)
    {
        return R::error(SpawnError::WaitFailed);
    }

    ProcessOutcome outcome;
    for (;;)
    {
        const DWORD r = WaitForSingleObject(impl.process,
                                            static_cast<DWORD>(kPollInterval.count()));
        if (r == WAIT_OBJECT_0)
            break;
        if (r == WAIT_FAILED)
        {
            return R::error(SpawnError::WaitFailed, static_cast<int>(GetLastError()));
        }
        const bool cancelled = cancel != nullptr && cancel->requested();
        const bool timed_out =
            impl.spec.timeout.count() > 0 &&
            std::chrono::steady_clock::now() - impl.started >= impl.spec.timeout;
        if (cancelled || timed_out)
        {
            outcome.kind = cancelled ? ExitKind::Cancelled : ExitKind::TimedOut;
            TerminateProcess(impl.process, 1);
            WaitForSingleObject(impl.process, INFINITE);
            break;
        }
    }
    impl.reaped = true;

    DWORD exit_code = 0;
    GetExitCodeProcess(impl.process, &exit_code);
    outcome.exit_code = static_cast<int>(exit_code);
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - impl.started);
    outcome.stdout_text = format_tools::read_file(impl.spec.stdout_path).value_or(std::string{});
    outcome.stderr_text = format_tools::read_file(impl.spec.stderr_path).value_or(std::string{});
    return R::ok(std::move(outcome));
}

long ChildProcess::pid() const noexcept
{
    return static_cast<long>(pImpl->process_id);
}

#endif

ChildProcess::ChildProcess(std::unique_ptr<ChildProcessImpl> impl) : pImpl(std::move(impl)) {}

ChildProcess::~ChildProcess() = default;

Result<ProcessOutcome, SpawnError> run_process(const ProcessSpec &spec,
                                               const CancellationToken *cancel)
{
    auto spawned = ChildProcess::spawn(spec);
    if (spawned.is_error())
    {
        return Result<ProcessOutcome, SpawnError>::error(spawned.error(), spawned.error_code());
    }
    return spawned.content()->wait(cancel);
}

} // namespace cellgate::utils
