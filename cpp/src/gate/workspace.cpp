#include "workspace.hpp"

#include "cgt_platform.hpp"
#include "utils/logger.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <ctime>

namespace cellgate::gate
{

namespace fs = std::filesystem;

namespace
{

bool is_same_or_inside(const fs::path &p, const fs::path &dir)
{
    auto pi = p.begin();
    for (auto di = dir.begin(); di != dir.end(); ++di, ++pi)
    {
        if (di->empty())
            continue;
        if (pi == p.end() || *pi != *di)
            return false;
    }
    return true;
}

void copy_tree(const fs::path &from, const fs::path &to, const fs::path &skip)
{
    fs::create_directories(to);
    for (auto it = fs::recursive_directory_iterator(from); it != fs::recursive_directory_iterator();
         ++it)
    {
        const fs::path &src = it->path();
        if (is_same_or_inside(src, skip))
        {
            if (it->is_directory())
                it.disable_recursion_pending();
            continue;
        }
        const fs::path dst = to / fs::relative(src, from);
        if (it->is_symlink())
            fs::copy_symlink(src, dst);
        else if (it->is_directory())
            fs::create_directories(dst);
        else
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    }
}

} // namespace

std::string make_run_id()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(CELLGATE_PLATFORM_WIN64)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    static std::atomic<unsigned> seq{0};
    return fmt::format("{:%Y%m%d-%H%M%S}-{}-{}", tm, platform::get_pid(),
                       seq.fetch_add(1, std::memory_order_relaxed));
}

TaskWorkspace prepare_workspace(const ProjectSettings &project, const fs::path &run_root,
                                const std::string &task_id)
{
    TaskWorkspace ws;
    ws.scratch = fs::absolute(run_root / task_id).lexically_normal();
    fs::create_directories(ws.scratch);

    const fs::path source = fs::absolute(project.source_dir).lexically_normal();
    if (project.isolation == Isolation::Copy)
    {
        ws.source_dir = ws.scratch / "src";
        // run_root is <work_root>/<run-id>; skip the whole work root.
        const fs::path work_root = fs::absolute(run_root).lexically_normal().parent_path();
        copy_tree(source, ws.source_dir, work_root);
        LOGGER_DEBUG("[workspace] {}: copied '{}' to '{}'", task_id, source.string(),
                     ws.source_dir.string());
    }
    else
    {
        ws.source_dir = source;
    }
    return ws;
}

} // namespace cellgate::gate
