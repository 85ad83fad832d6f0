/**
 * @file verification_run.cpp
 * @brief Task planning, the worker pool and verdict aggregation.
 */
#include "verification_run.hpp"

#include "gate_runner.hpp"
#include "workspace.hpp"

#include "cgt_service.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace cellgate::gate
{

namespace fs = std::filesystem;

namespace
{

/// A gate that could not run at all, e.g. because its workspace could not be created.
GateResult unavailable_gate(const char *gate_name, std::string configuration,
                            std::optional<Environment> env, FailureKind kind,
                            std::string subject, std::string detail)
{
    GateResult gate(gate_name, std::move(configuration), env);
    gate.start();
    gate.add_failure({kind, std::move(subject), std::move(detail)});
    gate.finish();
    return gate;
}

} // namespace

// ============================================================================
// Planning and aggregation
// ============================================================================

RunPlan plan_run(const GateConfig &config, const RunOptions &options)
{
    RunPlan plan;
    const auto toolchains = apply_filter(config.matrix.toolchains, options.filter.toolchains);

    if (options.hosted)
    {
        const auto platforms =
            apply_filter(config.matrix.platform_list(), options.filter.platforms);
        plan.cells = expand_cells(toolchains, platforms);
        plan.feature_sets =
            apply_filter(config.matrix.feature_set_list(), options.filter.feature_sets);
    }

    if (options.freestanding)
    {
        for (const auto &target : config.freestanding)
        {
            const bool toolchain_ok =
                options.filter.toolchains.empty() ||
                std::find(options.filter.toolchains.begin(), options.filter.toolchains.end(),
                          target.toolchain) != options.filter.toolchains.end();
            if (toolchain_ok)
                plan.freestanding.push_back(target);
        }
    }
    return plan;
}

const char *to_string(Verdict v) noexcept
{
    switch (v)
    {
    case Verdict::Green: return "green";
    case Verdict::Red: return "red";
    case Verdict::Cancelled: return "cancelled";
    }
    return "unknown";
}

Verdict compute_verdict(const std::vector<GateResult> &gates) noexcept
{
    const bool all_passed = std::all_of(gates.begin(), gates.end(),
                                        [](const GateResult &g) { return g.passed(); });
    return all_passed ? Verdict::Green : Verdict::Red;
}

std::vector<Environment> regressed_environments(const std::vector<GateResult> &gates)
{
    std::vector<Environment> out;
    for (const auto env : {Environment::FullStd, Environment::Core, Environment::CoreAlloc,
                           Environment::Freestanding})
    {
        const bool regressed = std::any_of(gates.begin(), gates.end(),
                                           [env](const GateResult &g)
                                           { return !g.passed() && g.environment() == env; });
        if (regressed)
            out.push_back(env);
    }
    return out;
}

std::size_t RunSummary::failed_gate_count() const noexcept
{
    return static_cast<std::size_t>(std::count_if(gates.begin(), gates.end(),
                                                  [](const GateResult &g) { return !g.passed(); }));
}

std::size_t RunSummary::failure_count() const noexcept
{
    std::size_t n = 0;
    for (const auto &g : gates)
        n += g.failures().size();
    return n;
}

// ============================================================================
// VerificationRun
// ============================================================================

VerificationRun::VerificationRun(const GateConfig &config, RunOptions options,
                                 const utils::CancellationToken &cancel)
    : config_(config), options_(std::move(options)), cancel_(cancel),
      plan_(plan_run(config_, options_))
{
}

std::vector<GateResult> VerificationRun::run_task(std::size_t index, const GateRunner &runner,
                                                  const fs::path &run_root) const
{
    if (index < plan_.cells.size())
    {
        const MatrixCell &cell = plan_.cells[index];
        TaskWorkspace ws;
        try
        {
            ws = prepare_workspace(config_.project, run_root, cell.id());
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("[{}] cannot run cell: {}", cell.id(), e.what());
            const std::string detail = fmt::format("cell could not run: {}", e.what());
            std::vector<GateResult> failed;
            failed.push_back(unavailable_gate(kStaticQualityGate, cell.configuration().label(),
                                              std::nullopt, FailureKind::FormatViolation, "workspace",
                                              detail));
            for (const auto fset : plan_.feature_sets)
            {
                failed.push_back(unavailable_gate(kTestGate, cell.configuration(fset).label(),
                                                  environment_for(fset), FailureKind::CompileError,
                                                  "workspace", detail));
            }
            return failed;
        }
        return runner.run_cell(cell, plan_.feature_sets, ws);
    }

    const FreestandingTarget &target = plan_.freestanding[index - plan_.cells.size()];
    TaskWorkspace ws;
    try
    {
        ws = prepare_workspace(config_.project, run_root, target.id());
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("[{}] cannot run target: {}", target.id(), e.what());
        std::vector<GateResult> failed;
        failed.push_back(unavailable_gate(kFreestandingGate, target.label(),
                                          Environment::Freestanding,
                                          FailureKind::FreestandingCompileError, target.triple,
                                          fmt::format("target could not run: {}", e.what())));
        return failed;
    }
    return {runner.run_freestanding_gate(target, ws)};
}

RunSummary VerificationRun::execute()
{
    RunSummary summary;
    summary.run_id = make_run_id();
    summary.name = config_.run.name;
    summary.started_at = std::chrono::system_clock::now();
    const auto t0 = std::chrono::steady_clock::now();

    const fs::path run_root = fs::path(config_.run.work_root) / summary.run_id;
    auto scratch_guard = basics::make_scope_guard(
        [&run_root, work_root = fs::path(config_.run.work_root)]
        {
            std::error_code ec;
            fs::remove_all(run_root, ec);
            if (ec)
                LOGGER_WARN("[run] cannot remove scratch '{}': {}", run_root.string(), ec.message());
            fs::remove(work_root, ec); // only succeeds if empty
        });
    if (options_.keep_scratch)
        scratch_guard.dismiss();

    const std::size_t n_tasks = plan_.task_count();
    const std::size_t n_workers =
        std::max<std::size_t>(1, std::min<std::size_t>(static_cast<std::size_t>(config_.run.jobs), n_tasks));
    LOGGER_INFO("[run] {} '{}': {} task(s), {} gate(s), {} worker(s)", summary.run_id,
                summary.name, n_tasks, plan_.gate_count(), n_workers);

    const GateRunner runner(config_, &cancel_);
    std::vector<std::vector<GateResult>> slots(n_tasks);
    std::atomic<std::size_t> next{0};
    std::atomic<bool> aborted{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]
    {
        for (;;)
        {
            if (cancel_.requested() || aborted.load())
                return;
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= n_tasks)
                return;
            try
            {
                slots[i] = run_task(i, runner, run_root);
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("[run] task {} aborted the run: {}", i, e.what());
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error)
                    first_error = std::current_exception();
                aborted.store(true);
                return;
            }
        }
    };

    if (n_tasks > 0)
    {
        std::vector<std::thread> pool;
        pool.reserve(n_workers);
        for (std::size_t w = 0; w < n_workers; ++w)
            pool.emplace_back(worker);
        for (auto &t : pool)
            t.join();
    }
    if (first_error)
        std::rethrow_exception(first_error);

    summary.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);

    if (cancel_.requested())
    {
        LOGGER_WARN("[run] {} cancelled after {}; results discarded", summary.run_id,
                    format_tools::formatted_duration(summary.duration));
        summary.verdict = Verdict::Cancelled;
        return summary;
    }

    for (auto &slot : slots)
    {
        for (auto &g : slot)
            summary.gates.push_back(std::move(g));
    }
    summary.verdict = compute_verdict(summary.gates);
    LOGGER_INFO("[run] {} finished in {}: {} ({} of {} gate(s) failed)", summary.run_id,
                format_tools::formatted_duration(summary.duration), to_string(summary.verdict),
                summary.failed_gate_count(), summary.gates.size());
    if (options_.keep_scratch)
        LOGGER_INFO("[run] scratch kept at '{}'", run_root.string());
    return summary;
}

} // namespace cellgate::gate
