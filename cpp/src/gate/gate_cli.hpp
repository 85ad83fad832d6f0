#pragma once
/**
 * @file gate_cli.hpp
 * @brief Command-line front end of cellgate: argument parsing and the top-level
 *        load → filter → run → report sequence.
 */

#include "matrix.hpp"

#include "utils/cancellation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cellgate::gate
{

enum ExitCode : int
{
    kExitGreen = 0,       ///< every gate passed, or the trigger does not apply
    kExitFailed = 1,      ///< at least one gate failed
    kExitUsage = 2,       ///< usage or configuration error
    kExitCancelled = 130  ///< interrupted; no report written
};

struct CliArgs
{
    std::string config_path; ///< empty = built-in defaults
    std::vector<Toolchain> toolchains;
    std::vector<Platform> platforms;
    std::vector<FeatureSet> feature_sets;
    std::optional<int> jobs;
    std::optional<std::string> event;
    std::optional<std::string> branch;
    std::optional<std::string> report;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool keep_scratch{false};
    bool no_freestanding{false};
    bool only_freestanding{false};
    bool list{false};
    bool validate_only{false};
    bool help{false};
};

void print_usage(const char *prog);

/**
 * @brief Parses argv[1..].
 * @throws std::invalid_argument with a message suitable for the user.
 */
CliArgs parse_args(const std::vector<std::string> &args);

/**
 * @brief Runs cellgate with parsed arguments.
 *
 * Configuration errors are reported on stderr and mapped to kExitUsage; this function
 * does not throw for them.
 *
 * @return One of ExitCode.
 */
int run_cli(const CliArgs &args, const utils::CancellationToken &cancel);

} // namespace cellgate::gate
