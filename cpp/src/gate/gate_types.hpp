#pragma once
/**
 * @file gate_types.hpp
 * @brief Gate outcomes as values: state machine, failure taxonomy, step records.
 *
 * A gate never throws to report that the code under test is broken; it returns a
 * GateResult in state Failed with one Failure per problem found.
 */

#include "matrix.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cellgate::gate
{

// ============================================================================
// GateState
// ============================================================================

/// Pending → Running → {Passed, Failed}. There are no retries.
enum class GateState
{
    Pending,
    Running,
    Passed,
    Failed
};

const char *to_string(GateState s) noexcept;

/// True for Pending→Running, Running→Passed and Running→Failed.
bool is_legal_transition(GateState from, GateState to) noexcept;

// ============================================================================
// Failure taxonomy
// ============================================================================

enum class FailureKind
{
    FormatViolation,
    LintWarning,
    CompileError,
    TestFailure,
    FreestandingCompileError
};

/// Style (format, lint) vs behavior (compile, test) vs architecture (freestanding).
enum class Severity
{
    Style,
    Behavior,
    Architecture
};

const char *to_string(FailureKind k) noexcept;
const char *to_string(Severity s) noexcept;
Severity severity_of(FailureKind k) noexcept;

struct Failure
{
    FailureKind kind{FailureKind::CompileError};
    std::string subject; ///< what failed: a step name or a test case
    std::string detail;  ///< tail of the tool output, or a runner diagnostic

    [[nodiscard]] Severity severity() const noexcept { return severity_of(kind); }
};

// ============================================================================
// StepRecord
// ============================================================================

/// One external command run by a gate.
struct StepRecord
{
    std::string name;                 ///< "format", "lint", "compile", "test", "build"
    std::vector<std::string> command; ///< expanded argv, runner prefix included
    std::optional<int> exit_code;     ///< empty when the process never exited normally
    std::chrono::milliseconds duration{0};
    std::string stdout_tail;
    std::string stderr_tail;
    std::string diagnostic;           ///< runner-side problem (spawn error, timeout, ...)

    [[nodiscard]] bool succeeded() const noexcept
    {
        return exit_code.has_value() && *exit_code == 0 && diagnostic.empty();
    }
};

// ============================================================================
// GateResult
// ============================================================================

inline constexpr const char *kStaticQualityGate = "static-quality";
inline constexpr const char *kTestGate = "test";
inline constexpr const char *kFreestandingGate = "freestanding-build";

/**
 * @class GateResult
 * @brief Result of one gate invocation. Owns its state machine.
 *
 * The configuration label is "<toolchain>/<platform>[/<feature set>]" for hosted
 * gates and "<triple>/<feature set>" for freestanding ones.
 */
class GateResult
{
  public:
    GateResult() = default;
    GateResult(std::string gate_name, std::string configuration,
               std::optional<Environment> environment = std::nullopt);

    [[nodiscard]] const std::string &gate_name() const noexcept { return gate_name_; }
    [[nodiscard]] const std::string &configuration() const noexcept { return configuration_; }
    /// The environment a failure of this gate regresses; empty for the static gate.
    [[nodiscard]] const std::optional<Environment> &environment() const noexcept
    {
        return environment_;
    }
    [[nodiscard]] GateState state() const noexcept { return state_; }
    [[nodiscard]] bool passed() const noexcept { return state_ == GateState::Passed; }

    [[nodiscard]] const std::vector<Failure> &failures() const noexcept { return failures_; }
    [[nodiscard]] const std::vector<StepRecord> &steps() const noexcept { return steps_; }
    [[nodiscard]] std::chrono::milliseconds duration() const noexcept;

    /// @throws std::logic_error if Pending→Running is not legal from the current state.
    void start();
    /// Moves to Passed if no failure was recorded, Failed otherwise.
    /// @throws std::logic_error unless the gate is Running.
    void finish();

    /// @throws std::logic_error unless the gate is Running.
    void add_step(StepRecord step);
    /// @throws std::logic_error unless the gate is Running.
    void add_failure(Failure failure);

  private:
    void transition(GateState to);
    void require_running(const char *what) const;

    std::string gate_name_;
    std::string configuration_;
    std::optional<Environment> environment_;
    GateState state_{GateState::Pending};
    std::vector<Failure> failures_;
    std::vector<StepRecord> steps_;
};

} // namespace cellgate::gate
