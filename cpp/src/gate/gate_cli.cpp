/**
 * @file gate_cli.cpp
 * @brief Argument parsing and the top-level run sequence of the cellgate tool.
 */
#include "gate_cli.hpp"

#include "gate_config.hpp"
#include "run_report.hpp"
#include "verification_run.hpp"

#include "cgt_service.hpp"

#include <cstdio>
#include <stdexcept>

namespace cellgate::gate
{

namespace
{

template <typename T, typename Parser>
T parse_enum_arg(std::string_view opt, const std::string &value, Parser parse,
                 const char *allowed)
{
    if (auto v = parse(value))
        return *v;
    throw std::invalid_argument(
        fmt::format("invalid value '{}' for {} (must be {})", value, opt, allowed));
}

int parse_jobs(const std::string &value)
{
    std::size_t used = 0;
    int jobs = 0;
    try
    {
        jobs = std::stoi(value, &used);
    }
    catch (const std::exception &)
    {
        used = 0;
    }
    if (used != value.size() || jobs < 1)
        throw std::invalid_argument(
            fmt::format("invalid value '{}' for --jobs (must be a positive integer)", value));
    return jobs;
}

} // namespace

void print_usage(const char *prog)
{
    fmt::print(
        "Usage:\n"
        "  {} [--config <path.json>] [options]\n\n"
        "Runs the static-quality, test and freestanding-build gates over the\n"
        "toolchain x platform x feature-set matrix and reports one verdict.\n\n"
        "Options:\n"
        "  --config <path>         JSON config; built-in cargo workflow if omitted\n"
        "  --toolchain <t>         Only this toolchain (stable|beta|nightly); repeatable\n"
        "  --platform <p>          Only this platform (linux|windows); repeatable\n"
        "  --feature-set <f>       Only this feature set (default|none|alloc); repeatable\n"
        "  --jobs <n>              Parallel tasks (default: config or CPU count)\n"
        "  --event <e>             Trigger event (push|pull_request); omit for a manual run\n"
        "  --branch <b>            Branch the event targets\n"
        "  --report <path>         JSON report path (\"\" disables the report)\n"
        "  --log-level <l>         trace|debug|info|warn|error\n"
        "  --log-file <path>       Write the log to a file instead of stderr\n"
        "  --keep-scratch          Keep per-task scratch directories\n"
        "  --no-freestanding       Skip the freestanding build gate\n"
        "  --only-freestanding     Run only the freestanding build gate\n"
        "  --list                  Print the expanded matrix and exit\n"
        "  --validate              Validate the config and exit 0 (valid) or 2\n"
        "  --help                  Show this message\n\n"
        "Exit codes: 0 green, 1 gate failure, 2 usage/config error, 130 cancelled\n",
        prog);
}

CliArgs parse_args(const std::vector<std::string> &args)
{
    CliArgs out;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        auto value = [&]() -> const std::string &
        {
            if (i + 1 >= args.size())
                throw std::invalid_argument(fmt::format("{} requires a value", arg));
            return args[++i];
        };

        if (arg == "--help" || arg == "-h")
            out.help = true;
        else if (arg == "--config")
            out.config_path = value();
        else if (arg == "--toolchain")
            out.toolchains.push_back(parse_enum_arg<Toolchain>(arg, value(), parse_toolchain,
                                                               "stable, beta or nightly"));
        else if (arg == "--platform")
            out.platforms.push_back(
                parse_enum_arg<Platform>(arg, value(), parse_platform, "linux or windows"));
        else if (arg == "--feature-set")
            out.feature_sets.push_back(parse_enum_arg<FeatureSet>(
                arg, value(), parse_feature_set, "default, none or alloc"));
        else if (arg == "--jobs" || arg == "-j")
            out.jobs = parse_jobs(value());
        else if (arg == "--event")
        {
            out.event = value();
            if (*out.event != "push" && *out.event != "pull_request")
                throw std::invalid_argument(fmt::format(
                    "invalid value '{}' for --event (must be push or pull_request)", *out.event));
        }
        else if (arg == "--branch")
            out.branch = value();
        else if (arg == "--report")
            out.report = value();
        else if (arg == "--log-level")
        {
            out.log_level = value();
            if (!utils::Logger::level_from_string(*out.log_level))
                throw std::invalid_argument(
                    fmt::format("invalid value '{}' for --log-level", *out.log_level));
        }
        else if (arg == "--log-file")
            out.log_file = value();
        else if (arg == "--keep-scratch")
            out.keep_scratch = true;
        else if (arg == "--no-freestanding")
            out.no_freestanding = true;
        else if (arg == "--only-freestanding")
            out.only_freestanding = true;
        else if (arg == "--list")
            out.list = true;
        else if (arg == "--validate")
            out.validate_only = true;
        else
            throw std::invalid_argument(fmt::format("unknown argument: {}", arg));
    }

    if (out.no_freestanding && out.only_freestanding)
        throw std::invalid_argument("--no-freestanding and --only-freestanding are exclusive");
    if (out.list && out.validate_only)
        throw std::invalid_argument("--list and --validate are exclusive");
    if (out.branch && !out.event)
        throw std::invalid_argument("--branch requires --event");
    return out;
}

int run_cli(const CliArgs &args, const utils::CancellationToken &cancel)
{
    auto &logger = utils::Logger::instance();

    // ── Load config ───────────────────────────────────────────────────────────
    GateConfig config;
    const std::string origin = args.config_path.empty() ? "<built-in>" : args.config_path;
    try
    {
        config = args.config_path.empty() ? GateConfig::defaults()
                                          : GateConfig::from_json_file(args.config_path);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Config error: {}\n", e.what());
        return kExitUsage;
    }

    if (args.jobs)
        config.run.jobs = *args.jobs;
    if (args.report)
        config.run.report = *args.report;
    if (args.log_level)
        config.run.log_level = *args.log_level;
    if (args.log_file)
        config.run.log_file = *args.log_file;

    if (auto lvl = utils::Logger::level_from_string(config.run.log_level))
        logger.set_level(*lvl);
    if (!config.run.log_file.empty())
        logger.set_logfile(config.run.log_file);

    // ── validate mode ─────────────────────────────────────────────────────────
    if (args.validate_only)
    {
        fmt::print("Configuration {} is valid.\n", origin);
        return kExitGreen;
    }

    // ── Trigger filter ────────────────────────────────────────────────────────
    if (!config.trigger.applies(args.event, args.branch))
    {
        LOGGER_INFO("[cli] trigger '{}' on branch '{}' does not apply (configured: branch '{}'); "
                    "nothing to do",
                    args.event.value_or(""), args.branch.value_or(""), config.trigger.branch);
        logger.flush();
        fmt::print("Trigger does not apply; nothing to run.\n");
        return kExitGreen;
    }

    RunOptions options;
    options.filter.toolchains = args.toolchains;
    options.filter.platforms = args.platforms;
    options.filter.feature_sets = args.feature_sets;
    options.hosted = !args.only_freestanding;
    options.freestanding = !args.no_freestanding;
    options.keep_scratch = args.keep_scratch;

    VerificationRun run(config, std::move(options), cancel);

    // ── list mode ─────────────────────────────────────────────────────────────
    if (args.list)
    {
        print_plan(run.plan(), stdout);
        return kExitGreen;
    }
    if (run.plan().empty())
    {
        fmt::print(stderr, "Error: nothing to run after applying filters to {}\n", origin);
        return kExitUsage;
    }

    // ── Run ───────────────────────────────────────────────────────────────────
    RunSummary summary;
    try
    {
        summary = run.execute();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("[cli] run aborted: {}", e.what());
        logger.flush();
        fmt::print(stderr, "Error: run aborted: {}\n", e.what());
        return kExitUsage;
    }
    logger.flush();

    if (summary.verdict == Verdict::Cancelled)
    {
        fmt::print(stderr, "Run {} cancelled; results discarded, no report written.\n",
                   summary.run_id);
        return kExitCancelled;
    }

    print_summary(summary, stdout);
    std::fflush(stdout);

    if (!config.run.report.empty())
    {
        try
        {
            write_json_report(summary, config.run.report);
            LOGGER_INFO("[cli] report written to '{}'", config.run.report);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("[cli] {}", e.what());
            logger.flush();
            return kExitUsage;
        }
    }

    return summary.verdict == Verdict::Green ? kExitGreen : kExitFailed;
}

} // namespace cellgate::gate
