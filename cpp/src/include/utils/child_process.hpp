#pragma once
/**
 * @file child_process.hpp
 * @brief Platform-abstracted execution of external tools with captured output.
 *
 * Every gate step is one child process. Its stdout and stderr are redirected to files
 * (no pipes, so a chatty tool can never block on a full pipe buffer) and read back
 * once the process has ended. Waiting honours a timeout and a run-wide
 * CancellationToken; on either, the child is terminated (on POSIX the whole process
 * group, so tools that fork compilers do not leave orphans behind).
 */
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cellgate_utils_export.h"
#include "utils/cancellation.hpp"
#include "utils/result.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace cellgate::utils
{

/// What to run and where its output goes.
struct ProcessSpec
{
    std::vector<std::string> argv;                           ///< argv[0] is looked up in PATH
    std::filesystem::path working_dir;                       ///< empty = inherit
    std::vector<std::pair<std::string, std::string>> env;    ///< added to / overrides the parent env
    std::filesystem::path stdout_path;                       ///< required
    std::filesystem::path stderr_path;                       ///< required
    std::chrono::milliseconds timeout{0};                    ///< 0 = no timeout
};

enum class ExitKind
{
    Exited,    ///< normal exit; exit_code is valid
    Signaled,  ///< killed by a signal not sent by us (POSIX only)
    TimedOut,  ///< terminated after ProcessSpec::timeout
    Cancelled  ///< terminated because the run was cancelled
};

CELLGATE_UTILS_EXPORT const char *to_string(ExitKind kind) noexcept;

struct ProcessOutcome
{
    ExitKind kind{ExitKind::Exited};
    int exit_code{-1};
    int signal{0};
    std::chrono::milliseconds duration{0};
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool succeeded() const noexcept
    {
        return kind == ExitKind::Exited && exit_code == 0;
    }
};

/// Expected failures to start or reap a process. The Result error code carries errno
/// (POSIX) or GetLastError() (Windows).
enum class SpawnError
{
    EmptyCommand,
    ProgramNotFound,
    RedirectFailed,
    BadWorkingDir,
    ForkFailed,
    ExecFailed,
    WaitFailed
};

CELLGATE_UTILS_EXPORT const char *to_string(SpawnError err) noexcept;

struct ChildProcessImpl;

/**
 * @class ChildProcess
 * @brief RAII owner of one running child process.
 *
 * A ChildProcess that is destroyed before wait() returned terminates and reaps its
 * child, so no zombie or orphan outlives the owner.
 */
class CELLGATE_UTILS_EXPORT ChildProcess
{
  public:
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;
    ChildProcess(ChildProcess &&) = delete;
    ChildProcess &operator=(ChildProcess &&) = delete;

    /// Starts the process described by @p spec.
    [[nodiscard]] static Result<std::unique_ptr<ChildProcess>, SpawnError>
    spawn(const ProcessSpec &spec);

    /**
     * @brief Waits for the child to end, enforcing the spec's timeout and @p cancel.
     *
     * Captured output is read back from the redirect files before returning.
     * Calling wait() a second time returns WaitFailed.
     */
    [[nodiscard]] Result<ProcessOutcome, SpawnError> wait(const CancellationToken *cancel);

    /// Native process id (POSIX pid or Windows process id).
    [[nodiscard]] long pid() const noexcept;

  private:
    explicit ChildProcess(std::unique_ptr<ChildProcessImpl> impl);

    std::unique_ptr<ChildProcessImpl> pImpl;
};

/// spawn() followed by wait().
[[nodiscard]] CELLGATE_UTILS_EXPORT Result<ProcessOutcome, SpawnError>
run_process(const ProcessSpec &spec, const CancellationToken *cancel);

} // namespace cellgate::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
