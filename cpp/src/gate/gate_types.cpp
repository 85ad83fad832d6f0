/**
 * @file gate_types.cpp
 * @brief GateResult state machine and failure taxonomy names.
 */
#include "gate_types.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace cellgate::gate
{

const char *to_string(GateState s) noexcept
{
    switch (s)
    {
    case GateState::Pending: return "pending";
    case GateState::Running: return "running";
    case GateState::Passed: return "passed";
    case GateState::Failed: return "failed";
    }
    return "unknown";
}

bool is_legal_transition(GateState from, GateState to) noexcept
{
    switch (from)
    {
    case GateState::Pending: return to == GateState::Running;
    case GateState::Running: return to == GateState::Passed || to == GateState::Failed;
    default: return false;
    }
}

const char *to_string(FailureKind k) noexcept
{
    switch (k)
    {
    case FailureKind::FormatViolation: return "FormatViolation";
    case FailureKind::LintWarning: return "LintWarning";
    case FailureKind::CompileError: return "CompileError";
    case FailureKind::TestFailure: return "TestFailure";
    case FailureKind::FreestandingCompileError: return "FreestandingCompileError";
    }
    return "unknown";
}

const char *to_string(Severity s) noexcept
{
    switch (s)
    {
    case Severity::Style: return "style";
    case Severity::Behavior: return "behavior";
    case Severity::Architecture: return "architecture";
    }
    return "unknown";
}

Severity severity_of(FailureKind k) noexcept
{
    switch (k)
    {
    case FailureKind::FormatViolation:
    case FailureKind::LintWarning: return Severity::Style;
    case FailureKind::CompileError:
    case FailureKind::TestFailure: return Severity::Behavior;
    case FailureKind::FreestandingCompileError: return Severity::Architecture;
    }
    return Severity::Behavior;
}

// ============================================================================
// GateResult
// ============================================================================

GateResult::GateResult(std::string gate_name, std::string configuration,
                       std::optional<Environment> environment)
    : gate_name_(std::move(gate_name)), configuration_(std::move(configuration)),
      environment_(environment)
{
}

std::chrono::milliseconds GateResult::duration() const noexcept
{
    std::chrono::milliseconds total{0};
    for (const auto &s : steps_)
        total += s.duration;
    return total;
}

void GateResult::transition(GateState to)
{
    if (!is_legal_transition(state_, to))
    {
        throw std::logic_error(fmt::format("gate '{}' [{}]: illegal transition {} -> {}",
                                           gate_name_, configuration_, to_string(state_),
                                           to_string(to)));
    }
    state_ = to;
}

void GateResult::require_running(const char *what) const
{
    if (state_ != GateState::Running)
    {
        throw std::logic_error(fmt::format("gate '{}' [{}]: {} while {}", gate_name_,
                                           configuration_, what, to_string(state_)));
    }
}

void GateResult::start()
{
    transition(GateState::Running);
}

void GateResult::finish()
{
    require_running("finish");
    transition(failures_.empty() ? GateState::Passed : GateState::Failed);
}

void GateResult::add_step(StepRecord step)
{
    require_running("add_step");
    steps_.push_back(std::move(step));
}

void GateResult::add_failure(Failure failure)
{
    require_running("add_failure");
    failures_.push_back(std::move(failure));
}

} // namespace cellgate::gate
