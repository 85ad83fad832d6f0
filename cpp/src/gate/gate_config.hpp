#pragma once
/**
 * @file gate_config.hpp
 * @brief Gate runner configuration, loaded from a JSON file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "run":      { "name": "ihex", "jobs": 4, "work_root": ".cellgate",
 *                 "report": "cellgate-report.json", "diagnostic_tail_bytes": 4096,
 *                 "gate_timeout_seconds": 3600, "log_level": "info", "log_file": "" },
 *   "trigger":  { "branch": "main", "events": ["push", "pull_request"] },
 *   "project":  { "source_dir": ".", "isolation": "target_dir" },
 *   "matrix":   {
 *     "toolchains":   ["stable", "beta", "nightly"],
 *     "platforms":    { "linux": {}, "windows": { "runner": ["ssh", "win", "--"] } },
 *     "feature_sets": { "default": [], "none": ["--no-default-features"],
 *                       "alloc": ["--no-default-features", "--features", "alloc"] }
 *   },
 *   "steps": {
 *     "format":  ["cargo", "+{toolchain}", "fmt", "--all", "--", "--check"],
 *     "lint":    ["cargo", "+{toolchain}", "clippy", "--all-features", "--all-targets",
 *                 "--", "-D", "warnings"],
 *     "compile": ["cargo", "+{toolchain}", "test", "--no-run", "--verbose", "{feature_args}"],
 *     "test":    ["cargo", "+{toolchain}", "test", "--verbose", "{feature_args}"],
 *     "test_failure_pattern": "^test (\\S+) \\.\\.\\. FAILED$",
 *     "lint_warning_pattern": "^warning"
 *   },
 *   "freestanding": [
 *     { "triple": "thumbv6m-none-eabi", "toolchain": "stable", "feature_set": "alloc",
 *       "build": ["cargo", "+{toolchain}", "build", "{feature_args}", "--target", "{triple}"] }
 *   ],
 *   "env": { "CARGO_TERM_COLOR": "always", "CARGO_TARGET_DIR": "{scratch}/target" }
 * }
 * @endcode
 *
 * Every section and key is optional; missing ones keep the values of defaults().
 * `matrix.platforms` and `matrix.feature_sets` also accept a plain array of names.
 */

#include "command_template.hpp"
#include "matrix.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cellgate::gate
{

enum class Isolation
{
    TargetDir, ///< shared source tree, private build output via env
    Copy       ///< source tree copied into {scratch}/src
};

const char *to_string(Isolation i) noexcept;

struct RunSettings
{
    std::string name{"cellgate"};
    int jobs{1};                            ///< defaults() uses hardware concurrency
    std::string work_root{".cellgate"};
    std::string report{"cellgate-report.json"}; ///< empty = no JSON report
    std::size_t diagnostic_tail_bytes{4096};
    int gate_timeout_seconds{3600};         ///< per step; 0 = none
    std::string log_level{"info"};
    std::string log_file;                   ///< empty = console
};

struct TriggerSettings
{
    std::string branch{"main"};
    std::vector<std::string> events{"push", "pull_request"};

    /**
     * @brief Decides whether a trigger applies. No event means a manual run, which
     *        always applies. A given branch must equal the configured branch.
     */
    [[nodiscard]] bool applies(const std::optional<std::string> &event,
                               const std::optional<std::string> &branch) const;
};

struct ProjectSettings
{
    std::string source_dir{"."};
    Isolation isolation{Isolation::TargetDir};
};

struct PlatformSettings
{
    Platform platform{Platform::Linux};
    /// Prefix prepended to every command of a cell on this platform (e.g. an ssh
    /// wrapper). Empty means "run locally", which only works on the host platform.
    std::vector<std::string> runner;
};

struct FeatureSetSettings
{
    FeatureSet feature_set{FeatureSet::Default};
    std::vector<std::string> args; ///< spliced into `{feature_args}`
};

struct MatrixSettings
{
    std::vector<Toolchain> toolchains;
    std::vector<PlatformSettings> platforms;      ///< enum order
    std::vector<FeatureSetSettings> feature_sets; ///< enum order

    [[nodiscard]] std::vector<Platform> platform_list() const;
    [[nodiscard]] std::vector<FeatureSet> feature_set_list() const;
    [[nodiscard]] const PlatformSettings *find_platform(Platform p) const noexcept;
    /// Flags for @p f; the built-in ones if @p f is not in the matrix.
    [[nodiscard]] std::vector<std::string> feature_args(FeatureSet f) const;
};

struct StepSettings
{
    CommandTemplate format;
    CommandTemplate lint;
    CommandTemplate compile;
    CommandTemplate test;
    std::string test_failure_pattern;
    std::string lint_warning_pattern;
};

/// Compile-only target without an operating system. Never test-executed.
struct FreestandingTarget
{
    std::string triple{"thumbv6m-none-eabi"};
    Toolchain toolchain{Toolchain::Stable};
    FeatureSet feature_set{FeatureSet::Alloc}; ///< never Default
    CommandTemplate build;

    /// Filesystem-safe task id, e.g. "freestanding-thumbv6m-none-eabi".
    [[nodiscard]] std::string id() const;
    /// "thumbv6m-none-eabi/alloc".
    [[nodiscard]] std::string label() const;
};

/**
 * @struct GateConfig
 * @brief Top-level configuration. Load with from_json_file(), or start from defaults().
 */
struct GateConfig
{
    RunSettings run{};
    TriggerSettings trigger{};
    ProjectSettings project{};
    MatrixSettings matrix{};
    StepSettings steps{};
    std::vector<FreestandingTarget> freestanding;
    std::vector<std::pair<std::string, std::string>> env; ///< values may use placeholders

    /// The built-in cargo workflow: 3 toolchains × 2 platforms × 3 feature sets plus
    /// the thumbv6m-none-eabi build.
    static GateConfig defaults();

    /**
     * @brief Loads and validates a JSON config file.
     * @throws std::runtime_error if the file cannot be read or parsed, or on any
     *         invalid value. The message names the file and the key.
     */
    static GateConfig from_json_file(const std::string &path);

    /// Same as from_json_file() for an already-parsed document; @p origin names it in errors.
    static GateConfig from_json(const nlohmann::json &j, const std::string &origin);

    /// Cross-field checks (templates, patterns, counts).
    /// @throws std::runtime_error naming @p origin and the key.
    void validate(const std::string &origin) const;
};

} // namespace cellgate::gate
