#pragma once
/**
 * @file workspace.hpp
 * @brief Per-task scratch directories: `<work_root>/<run-id>/<task-id>`.
 */

#include "gate_config.hpp"

#include <filesystem>
#include <string>

namespace cellgate::gate
{

/// Where one task runs. Both paths are absolute.
struct TaskWorkspace
{
    std::filesystem::path scratch;    ///< private to the task; logs and build output live here
    std::filesystem::path source_dir; ///< shared source tree, or the task's copy of it
};

/// Makes a run id from the current UTC time, the pid and a per-process sequence
/// number: "20261019-153012-4711-0".
std::string make_run_id();

/**
 * @brief Creates the task's scratch directory and, for Isolation::Copy, copies the
 *        source tree into `<scratch>/src`.
 *
 * The copy skips @p run_root's work root when the work root lives inside the source
 * tree.
 *
 * @throws std::filesystem::filesystem_error on any I/O failure.
 */
TaskWorkspace prepare_workspace(const ProjectSettings &project,
                                const std::filesystem::path &run_root, const std::string &task_id);

} // namespace cellgate::gate
