#pragma once
/**
 * @file gate_runner.hpp
 * @brief Runs the three gate kinds as external commands and classifies their failures.
 *
 * Each gate is a function from (configuration, workspace) to GateResult. A gate
 * always completes: spawn errors, timeouts, missing executors and cancellation all
 * end as Failed with a diagnostic, never as an exception.
 *
 * | Gate               | Steps                  | Failure kinds                     |
 * |--------------------|------------------------|-----------------------------------|
 * | static-quality     | format, lint (both)    | FormatViolation, LintWarning      |
 * | test               | compile, then test     | CompileError, TestFailure (×N)    |
 * | freestanding-build | build                  | FreestandingCompileError          |
 */

#include "gate_config.hpp"
#include "gate_types.hpp"
#include "workspace.hpp"

#include "utils/cancellation.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace cellgate::gate
{

class GateRunner
{
  public:
    /**
     * @param config Must outlive the runner and already be validated.
     * @param cancel Optional; when requested, running steps are terminated and
     *               further steps are not started.
     */
    GateRunner(const GateConfig &config, const utils::CancellationToken *cancel);

    /// Format check and lint for one cell. Lint also fails on warning lines.
    [[nodiscard]] GateResult run_static_gate(const MatrixCell &cell,
                                             const TaskWorkspace &ws) const;

    /// Compile, then test, with one feature set. A failed compile skips the test step.
    [[nodiscard]] GateResult run_test_gate(const MatrixCell &cell, FeatureSet feature_set,
                                           const TaskWorkspace &ws) const;

    /// Builds one freestanding target on the host.
    [[nodiscard]] GateResult run_freestanding_gate(const FreestandingTarget &target,
                                                   const TaskWorkspace &ws) const;

    /// The static gate followed by one test gate per feature set, in that order.
    [[nodiscard]] std::vector<GateResult> run_cell(const MatrixCell &cell,
                                                   const std::vector<FeatureSet> &feature_sets,
                                                   const TaskWorkspace &ws) const;

    /**
     * @brief Test-case names reported as failed in @p output, in order of appearance.
     *
     * Each line is matched against the configured test_failure_pattern; capture group
     * 1 is the name (the whole match if the pattern has no group).
     */
    [[nodiscard]] std::vector<std::string> failed_test_cases(const std::string &output) const;

    /// Lines of @p output matching the configured lint_warning_pattern.
    [[nodiscard]] std::vector<std::string> lint_warnings(const std::string &output) const;

  private:
    struct StepRun;

    [[nodiscard]] StepRun execute_step(const std::string &name, const std::string &log_stem,
                                       const CommandTemplate &tmpl, const TemplateContext &ctx,
                                       std::optional<Platform> target_platform,
                                       const TaskWorkspace &ws) const;

    [[nodiscard]] TemplateContext hosted_context(const MatrixCell &cell,
                                                 std::optional<FeatureSet> feature_set,
                                                 const TaskWorkspace &ws) const;

    [[nodiscard]] std::string failure_detail(const StepRecord &step) const;

    const GateConfig &config_;
    const utils::CancellationToken *cancel_;
    std::regex test_failure_re_;
    std::regex lint_warning_re_;
};

} // namespace cellgate::gate
