/**
 * @file gate_main.cpp
 * @brief cellgate: release-gate runner for a library that must build hosted, hosted
 *        without std, and freestanding.
 *
 * ## Usage
 *
 *     cellgate                                   # built-in cargo workflow on "."
 *     cellgate --config ci/cellgate.json         # run the configured matrix
 *     cellgate --config ci/cellgate.json --list  # print the expanded matrix; exit 0
 *     cellgate --config ci/cellgate.json --validate
 *     cellgate --toolchain stable --platform linux --feature-set alloc --no-freestanding
 *     cellgate --event push --branch main        # CI trigger; exits 0 if not applicable
 *
 * SIGINT/SIGTERM cancel the run: running tools are terminated, partial results are
 * discarded and no report is written (exit 130). A second signal exits immediately.
 */

#include "gate_cli.hpp"

#include "cgt_service.hpp"

#include <csignal>
#include <cstdlib>
#include <string>
#include <vector>

using namespace cellgate;

// ---------------------------------------------------------------------------
// Global cancellation flag (set by SIGINT/SIGTERM)
// ---------------------------------------------------------------------------

static utils::CancellationToken g_cancel;

extern "C" void signal_handler(int /*sig*/)
{
    if (g_cancel.requested())
        std::_Exit(gate::kExitCancelled); // second signal: give up on cleanup
    g_cancel.request();
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#if defined(CELLGATE_IS_POSIX)
    // An inherited SIG_IGN would let the kernel reap tools before their status is read.
    std::signal(SIGCHLD, SIG_DFL);
#endif

    // ── Parse arguments ───────────────────────────────────────────────────────
    gate::CliArgs args;
    try
    {
        args = gate::parse_args(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const std::invalid_argument &e)
    {
        fmt::print(stderr, "Error: {}\n\n", e.what());
        gate::print_usage(argv[0]);
        return gate::kExitUsage;
    }
    if (args.help)
    {
        gate::print_usage(argv[0]);
        return gate::kExitGreen;
    }

    // ── Logger lifetime ───────────────────────────────────────────────────────
    auto logger_guard =
        basics::make_scope_guard([] { utils::Logger::instance().shutdown(); });

    return gate::run_cli(args, g_cancel);
}
