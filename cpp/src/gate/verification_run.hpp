#pragma once
/**
 * @file verification_run.hpp
 * @brief One verification run: plans the tasks, runs them on a worker pool and
 *        aggregates every GateResult into a verdict.
 *
 * A task is one hosted cell (static gate, then one test gate per feature set) or one
 * freestanding target. Workers pull task indices from a shared atomic counter and
 * write only their own pre-allocated result slot, so no lock guards the results.
 *
 * Cancellation terminates running children, starts no further tasks and discards
 * everything: a cancelled run has no gates and no verdict.
 */

#include "gate_config.hpp"
#include "gate_types.hpp"

#include "utils/cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cellgate::gate
{

class GateRunner;

struct RunOptions
{
    MatrixFilter filter;
    bool hosted{true};       ///< false with --only-freestanding
    bool freestanding{true}; ///< false with --no-freestanding
    bool keep_scratch{false};
};

/// What a run will execute, after filters.
struct RunPlan
{
    std::vector<MatrixCell> cells;
    std::vector<FeatureSet> feature_sets;
    std::vector<FreestandingTarget> freestanding;

    [[nodiscard]] std::size_t task_count() const noexcept { return cells.size() + freestanding.size(); }
    [[nodiscard]] std::size_t gate_count() const noexcept
    {
        return cells.size() * (1 + feature_sets.size()) + freestanding.size();
    }
    [[nodiscard]] bool empty() const noexcept { return task_count() == 0; }
};

/// Applies @p options to the configured matrix. Freestanding targets are filtered
/// by toolchain as well.
RunPlan plan_run(const GateConfig &config, const RunOptions &options);

enum class Verdict
{
    Green,
    Red,
    Cancelled
};

const char *to_string(Verdict v) noexcept;

/// Green iff every gate passed (an empty list is green).
Verdict compute_verdict(const std::vector<GateResult> &gates) noexcept;

/// Environments regressed by at least one failed gate, in enum order. Static gate
/// failures regress no environment.
std::vector<Environment> regressed_environments(const std::vector<GateResult> &gates);

struct RunSummary
{
    std::string run_id;
    std::string name;
    Verdict verdict{Verdict::Cancelled};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::milliseconds duration{0};
    std::vector<GateResult> gates; ///< task order, then gate order within a task

    [[nodiscard]] std::size_t failed_gate_count() const noexcept;
    [[nodiscard]] std::size_t failure_count() const noexcept;
};

class VerificationRun
{
  public:
    /**
     * @param config Validated configuration; must outlive the run.
     * @param cancel Checked between tasks and while steps run.
     */
    VerificationRun(const GateConfig &config, RunOptions options,
                    const utils::CancellationToken &cancel);

    [[nodiscard]] const RunPlan &plan() const noexcept { return plan_; }

    /**
     * @brief Runs every planned task and returns the aggregate.
     *
     * Scratch directories live under `<work_root>/<run-id>` and are removed before
     * returning unless RunOptions::keep_scratch is set.
     *
     * A task that cannot create its workspace fails its gates. Any other exception from a
     * task stops handing out tasks and is rethrown once the workers have joined.
     */
    [[nodiscard]] RunSummary execute();

  private:
    std::vector<GateResult> run_task(std::size_t index, const GateRunner &runner,
                                     const std::filesystem::path &run_root) const;

    const GateConfig &config_;
    RunOptions options_;
    const utils::CancellationToken &cancel_;
    RunPlan plan_;
};

} // namespace cellgate::gate
