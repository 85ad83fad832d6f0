/**
 * @file gate_runner.cpp
 * @brief Step execution and failure classification for the static, test and
 *        freestanding gates.
 */
#include "gate_runner.hpp"

#include "cgt_service.hpp"

#include <system_error>

namespace cellgate::gate
{

struct GateRunner::StepRun
{
    StepRecord record;
    std::string output; ///< full stdout followed by full stderr
};

namespace
{

std::vector<std::string> matching_lines(const std::string &output, const std::regex &re,
                                        bool capture_first_group)
{
    std::vector<std::string> out;
    for (const auto &raw : format_tools::split_lines(output))
    {
        // Tools run with CARGO_TERM_COLOR=always colour their diagnostics.
        const std::string line = format_tools::strip_ansi(raw);
        std::smatch m;
        if (!std::regex_search(line, m, re))
            continue;
        if (capture_first_group && m.size() > 1 && m[1].matched)
            out.push_back(m[1].str());
        else if (capture_first_group)
            out.push_back(m[0].str());
        else
            out.push_back(line);
    }
    return out;
}

std::string os_error_message(int code)
{
    return std::error_code(code, std::system_category()).message();
}

} // namespace

GateRunner::GateRunner(const GateConfig &config, const utils::CancellationToken *cancel)
    : config_(config), cancel_(cancel), test_failure_re_(config.steps.test_failure_pattern),
      lint_warning_re_(config.steps.lint_warning_pattern)
{
}

std::vector<std::string> GateRunner::failed_test_cases(const std::string &output) const
{
    return matching_lines(output, test_failure_re_, true);
}

std::vector<std::string> GateRunner::lint_warnings(const std::string &output) const
{
    return matching_lines(output, lint_warning_re_, false);
}

// ============================================================================
// Step execution
// ============================================================================

GateRunner::StepRun GateRunner::execute_step(const std::string &name, const std::string &log_stem,
                                             const CommandTemplate &tmpl,
                                             const TemplateContext &ctx,
                                             std::optional<Platform> target_platform,
                                             const TaskWorkspace &ws) const
{
    StepRun run;
    StepRecord &rec = run.record;
    rec.name = name;

    const PlatformSettings *ps =
        target_platform ? config_.matrix.find_platform(*target_platform) : nullptr;
    if (ps != nullptr)
    {
        for (const auto &arg : ps->runner)
            rec.command.push_back(expand_string(arg, ctx));
    }
    const auto argv = expand_command(tmpl, ctx);
    rec.command.insert(rec.command.end(), argv.begin(), argv.end());

    if (target_platform && *target_platform != host_platform() &&
        (ps == nullptr || ps->runner.empty()))
    {
        rec.diagnostic = fmt::format(
            "no executor for platform '{}': not the host platform and no runner configured "
            "(matrix.platforms.{}.runner)",
            to_string(*target_platform), to_string(*target_platform));
        LOGGER_WARN("[{}] {}: {}", ctx.cell, name, rec.diagnostic);
        return run;
    }

    if (cancel_ != nullptr && cancel_->requested())
    {
        rec.diagnostic = "cancelled before start";
        return run;
    }

    utils::ProcessSpec spec;
    spec.argv = rec.command;
    spec.working_dir = ws.source_dir;
    spec.stdout_path = ws.scratch / (log_stem + ".stdout.log");
    spec.stderr_path = ws.scratch / (log_stem + ".stderr.log");
    spec.timeout = std::chrono::seconds(config_.run.gate_timeout_seconds);
    for (const auto &[key, value] : config_.env)
    {
        spec.env.emplace_back(key, expand_string(value, ctx));
        LOGGER_TRACE("[{}] {}: env {}={}", ctx.cell, name, key, spec.env.back().second);
    }

    LOGGER_DEBUG("[{}] {}: {}", ctx.cell, name, format_tools::join_command_line(rec.command));

    auto result = utils::run_process(spec, cancel_);
    if (result.is_error())
    {
        const int code = result.error_code();
        rec.diagnostic = code != 0 ? fmt::format("cannot run '{}': {} ({})", rec.command.front(),
                                                 utils::to_string(result.error()),
                                                 os_error_message(code))
                                   : fmt::format("cannot run '{}': {}", rec.command.front(),
                                                 utils::to_string(result.error()));
        LOGGER_ERROR("[{}] {}: {}", ctx.cell, name, rec.diagnostic);
        return run;
    }

    utils::ProcessOutcome &outcome = result.content();
    rec.duration = outcome.duration;
    rec.stdout_tail = format_tools::tail_bytes(outcome.stdout_text, config_.run.diagnostic_tail_bytes);
    rec.stderr_tail = format_tools::tail_bytes(outcome.stderr_text, config_.run.diagnostic_tail_bytes);
    switch (outcome.kind)
    {
    case utils::ExitKind::Exited:
        rec.exit_code = outcome.exit_code;
        break;
    case utils::ExitKind::Signaled:
        rec.diagnostic = fmt::format("killed by signal {}", outcome.signal);
        break;
    case utils::ExitKind::TimedOut:
        rec.diagnostic = fmt::format("timed out after {}s", config_.run.gate_timeout_seconds);
        break;
    case utils::ExitKind::Cancelled:
        rec.diagnostic = "cancelled";
        break;
    }

    run.output = std::move(outcome.stdout_text);
    if (!outcome.stderr_text.empty())
    {
        if (!run.output.empty() && run.output.back() != '\n')
            run.output += '\n';
        run.output += outcome.stderr_text;
    }

    LOGGER_DEBUG("[{}] {}: {} in {}", ctx.cell, name,
                 rec.exit_code ? fmt::format("exit {}", *rec.exit_code) : rec.diagnostic,
                 format_tools::formatted_duration(rec.duration));
    return run;
}

TemplateContext GateRunner::hosted_context(const MatrixCell &cell,
                                           std::optional<FeatureSet> feature_set,
                                           const TaskWorkspace &ws) const
{
    TemplateContext ctx;
    ctx.toolchain = to_string(cell.toolchain);
    ctx.platform = to_string(cell.platform);
    ctx.source_dir = ws.source_dir.string();
    ctx.scratch = ws.scratch.string();
    ctx.cell = cell.id();
    if (feature_set)
    {
        ctx.feature_set = to_string(*feature_set);
        ctx.feature_args = config_.matrix.feature_args(*feature_set);
    }
    return ctx;
}

std::string GateRunner::failure_detail(const StepRecord &step) const
{
    std::string detail;
    if (!step.diagnostic.empty())
        detail = step.diagnostic;
    else if (step.exit_code)
        detail = fmt::format("'{}' exited with code {}", step.name, *step.exit_code);

    for (const std::string *tail : {&step.stdout_tail, &step.stderr_tail})
    {
        if (tail->empty())
            continue;
        if (!detail.empty())
            detail += '\n';
        detail += *tail;
    }
    return detail;
}

// ============================================================================
// Gates
// ============================================================================

GateResult GateRunner::run_static_gate(const MatrixCell &cell, const TaskWorkspace &ws) const
{
    GateResult gate(kStaticQualityGate, cell.configuration().label());
    gate.start();
    const TemplateContext ctx = hosted_context(cell, std::nullopt, ws);

    // Both checks always run; a format failure does not hide lint findings.
    StepRun format = execute_step("format", "format", config_.steps.format, ctx, cell.platform, ws);
    if (!format.record.succeeded())
        gate.add_failure({FailureKind::FormatViolation, "format", failure_detail(format.record)});
    gate.add_step(std::move(format.record));

    StepRun lint = execute_step("lint", "lint", config_.steps.lint, ctx, cell.platform, ws);
    if (!lint.record.succeeded())
    {
        gate.add_failure({FailureKind::LintWarning, "lint", failure_detail(lint.record)});
    }
    else if (const auto warnings = lint_warnings(lint.output); !warnings.empty())
    {
        std::string detail = fmt::format("{} warning line(s) emitted; warnings are errors", warnings.size());
        for (const auto &w : warnings)
        {
            if (detail.size() >= config_.run.diagnostic_tail_bytes)
                break;
            detail += '\n';
            detail += w;
        }
        gate.add_failure({FailureKind::LintWarning, "lint", std::move(detail)});
    }
    gate.add_step(std::move(lint.record));

    gate.finish();
    LOGGER_INFO("[{}] {} {}", cell.id(), kStaticQualityGate, gate.passed() ? "passed" : "FAILED");
    return gate;
}

GateResult GateRunner::run_test_gate(const MatrixCell &cell, FeatureSet feature_set,
                                     const TaskWorkspace &ws) const
{
    GateResult gate(kTestGate, cell.configuration(feature_set).label(),
                    environment_for(feature_set));
    gate.start();
    const TemplateContext ctx = hosted_context(cell, feature_set, ws);
    const std::string fs_name = to_string(feature_set);

    StepRun compile = execute_step("compile", "compile-" + fs_name, config_.steps.compile, ctx,
                                   cell.platform, ws);
    const bool compiled = compile.record.succeeded();
    if (!compiled)
        gate.add_failure({FailureKind::CompileError, "compile", failure_detail(compile.record)});
    gate.add_step(std::move(compile.record));

    if (compiled)
    {
        StepRun test = execute_step("test", "test-" + fs_name, config_.steps.test, ctx,
                                    cell.platform, ws);
        if (!test.record.succeeded())
        {
            const auto cases = failed_test_cases(test.output);
            const std::string detail = failure_detail(test.record);
            if (cases.empty())
            {
                gate.add_failure({FailureKind::TestFailure, "test suite", detail});
            }
            for (const auto &name : cases)
            {
                gate.add_failure({FailureKind::TestFailure, name, detail});
            }
        }
        gate.add_step(std::move(test.record));
    }

    gate.finish();
    LOGGER_INFO("[{}] {} [{}] {}", cell.id(), kTestGate, fs_name,
                gate.passed() ? "passed" : "FAILED");
    return gate;
}

GateResult GateRunner::run_freestanding_gate(const FreestandingTarget &target,
                                             const TaskWorkspace &ws) const
{
    GateResult gate(kFreestandingGate, target.label(), Environment::Freestanding);
    gate.start();

    TemplateContext ctx;
    ctx.toolchain = to_string(target.toolchain);
    ctx.platform = platform::host_platform_name();
    ctx.feature_set = to_string(target.feature_set);
    ctx.feature_args = config_.matrix.feature_args(target.feature_set);
    ctx.triple = target.triple;
    ctx.source_dir = ws.source_dir.string();
    ctx.scratch = ws.scratch.string();
    ctx.cell = target.id();

    // Runs on the host; the target has no test harness, so nothing is executed.
    StepRun build = execute_step("build", "build", target.build, ctx, std::nullopt, ws);
    if (!build.record.succeeded())
    {
        gate.add_failure({FailureKind::FreestandingCompileError, target.triple,
                          failure_detail(build.record)});
    }
    gate.add_step(std::move(build.record));

    gate.finish();
    LOGGER_INFO("[{}] {} {}", target.id(), kFreestandingGate, gate.passed() ? "passed" : "FAILED");
    return gate;
}

std::vector<GateResult> GateRunner::run_cell(const MatrixCell &cell,
                                             const std::vector<FeatureSet> &feature_sets,
                                             const TaskWorkspace &ws) const
{
    std::vector<GateResult> results;
    results.reserve(1 + feature_sets.size());
    results.push_back(run_static_gate(cell, ws));
    for (const auto fs : feature_sets)
        results.push_back(run_test_gate(cell, fs, ws));
    return results;
}

} // namespace cellgate::gate
