// tests/test_cellgate/test_verification_run.cpp
/**
 * @file test_verification_run.cpp
 * @brief Whole runs over the fake-tool matrix: planning, filters, failure scenarios,
 *        verdicts, regressed environments, cancellation and scratch handling.
 */
#include "fake_gate_config.h"
#include "verification_run.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using namespace cellgate;
using namespace cellgate::gate;
using namespace cellgate::tests::helper;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace
{

std::size_t count_failed(const std::vector<GateResult> &gates, const char *gate_name)
{
    std::size_t n = 0;
    for (const auto &g : gates)
    {
        if (!g.passed() && g.gate_name() == gate_name)
            ++n;
    }
    return n;
}

GateResult finished_gate(const char *name, std::optional<Environment> env, bool pass)
{
    GateResult g(name, "stable/linux", env);
    g.start();
    if (!pass)
        g.add_failure({FailureKind::CompileError, "compile", "boom"});
    g.finish();
    return g;
}

} // namespace

class VerificationRunTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmp_ = std::make_unique<TempDir>(std::string("run_") + info->name());
        fs::create_directories(tmp_->path() / "src");
        config_ = make_fake_gate_config();
        config_.run.work_root = (tmp_->path() / "work").string();
        config_.project.source_dir = (tmp_->path() / "src").string();
    }

    RunSummary Execute(RunOptions options = {})
    {
        VerificationRun run(config_, std::move(options), cancel_);
        return run.execute();
    }

    std::unique_ptr<TempDir> tmp_;
    GateConfig config_;
    utils::CancellationToken cancel_;
};

// ============================================================================
// Planning
// ============================================================================

TEST_F(VerificationRunTest, FullPlan)
{
    const auto plan = plan_run(config_, {});
    EXPECT_EQ(plan.cells.size(), 6u);
    EXPECT_EQ(plan.feature_sets.size(), 3u);
    EXPECT_EQ(plan.freestanding.size(), 1u);
    EXPECT_EQ(plan.task_count(), 7u);
    EXPECT_EQ(plan.gate_count(), 25u);
    EXPECT_FALSE(plan.empty());
}

TEST_F(VerificationRunTest, FiltersNarrowThePlan)
{
    RunOptions opts;
    opts.filter.toolchains = {Toolchain::Stable};
    opts.filter.platforms = {Platform::Linux};
    opts.filter.feature_sets = {FeatureSet::Alloc};
    auto plan = plan_run(config_, opts);
    ASSERT_EQ(plan.cells.size(), 1u);
    EXPECT_THAT(plan.feature_sets, ElementsAre(FeatureSet::Alloc));
    EXPECT_EQ(plan.freestanding.size(), 1u);
    EXPECT_EQ(plan.gate_count(), 3u);

    // The freestanding target uses stable, so a nightly-only run drops it.
    opts.filter.toolchains = {Toolchain::Nightly};
    plan = plan_run(config_, opts);
    EXPECT_EQ(plan.cells.size(), 1u);
    EXPECT_TRUE(plan.freestanding.empty());
}

TEST_F(VerificationRunTest, HostedAndFreestandingSwitches)
{
    RunOptions only_fs;
    only_fs.hosted = false;
    EXPECT_EQ(plan_run(config_, only_fs).gate_count(), 1u);

    RunOptions no_fs;
    no_fs.freestanding = false;
    EXPECT_EQ(plan_run(config_, no_fs).gate_count(), 24u);

    RunOptions nothing;
    nothing.hosted = false;
    nothing.filter.toolchains = {Toolchain::Beta};
    EXPECT_TRUE(plan_run(config_, nothing).empty());
}

// ============================================================================
// Verdict and aggregation
// ============================================================================

TEST(VerdictTest, ComputeVerdict)
{
    std::vector<GateResult> gates;
    EXPECT_EQ(compute_verdict(gates), Verdict::Green);
    gates.push_back(finished_gate(kTestGate, Environment::Core, true));
    EXPECT_EQ(compute_verdict(gates), Verdict::Green);
    gates.push_back(finished_gate(kTestGate, Environment::FullStd, false));
    EXPECT_EQ(compute_verdict(gates), Verdict::Red);
    EXPECT_STREQ(to_string(Verdict::Cancelled), "cancelled");
}

TEST(VerdictTest, RegressedEnvironmentsInEnumOrder)
{
    std::vector<GateResult> gates;
    gates.push_back(finished_gate(kFreestandingGate, Environment::Freestanding, false));
    gates.push_back(finished_gate(kStaticQualityGate, std::nullopt, false));
    gates.push_back(finished_gate(kTestGate, Environment::CoreAlloc, true));
    gates.push_back(finished_gate(kTestGate, Environment::Core, false));
    gates.push_back(finished_gate(kTestGate, Environment::Core, false));
    EXPECT_THAT(regressed_environments(gates),
                ElementsAre(Environment::Core, Environment::Freestanding));
}

// ============================================================================
// Runs
// ============================================================================

TEST_F(VerificationRunTest, AllGatesGreen)
{
    const auto summary = Execute();
    EXPECT_EQ(summary.verdict, Verdict::Green);
    ASSERT_EQ(summary.gates.size(), 25u);
    EXPECT_EQ(summary.failed_gate_count(), 0u);
    EXPECT_EQ(summary.failure_count(), 0u);
    EXPECT_EQ(summary.name, config_.run.name);
    EXPECT_FALSE(summary.run_id.empty());

    // Task order, then gate order within a task.
    EXPECT_EQ(summary.gates[0].gate_name(), kStaticQualityGate);
    EXPECT_EQ(summary.gates[0].configuration(), "stable/linux");
    EXPECT_EQ(summary.gates[1].configuration(), "stable/linux/default");
    EXPECT_EQ(summary.gates[3].configuration(), "stable/linux/alloc");
    EXPECT_EQ(summary.gates[4].configuration(), "stable/windows");
    EXPECT_EQ(summary.gates[8].configuration(), "beta/linux");
    EXPECT_EQ(summary.gates[24].gate_name(), kFreestandingGate);
    EXPECT_EQ(summary.gates[24].configuration(), "thumbv6m-none-eabi/alloc");

    // Scratch is removed, and so is the then-empty work root.
    EXPECT_FALSE(fs::exists(config_.run.work_root));
}

TEST_F(VerificationRunTest, FormatViolationFailsOnlyStaticGates)
{
    config_.steps.format = fake_tool("print", {"Diff in src/lib.rs at line 12:", "1"});
    const auto summary = Execute();

    EXPECT_EQ(summary.verdict, Verdict::Red);
    EXPECT_EQ(summary.failed_gate_count(), 6u);
    EXPECT_EQ(count_failed(summary.gates, kStaticQualityGate), 6u);
    for (const auto &g : summary.gates)
    {
        for (const auto &f : g.failures())
        {
            EXPECT_EQ(f.kind, FailureKind::FormatViolation);
            EXPECT_EQ(f.severity(), Severity::Style);
        }
    }
    EXPECT_THAT(regressed_environments(summary.gates), IsEmpty());
}

TEST_F(VerificationRunTest, OsFacilityBreaksOnlyFreestanding)
{
    for (auto &t : config_.freestanding)
        t.build = fake_tool("print_err", {"error[E0463]: can't find crate for `std`", "101"});
    const auto summary = Execute();

    EXPECT_EQ(summary.verdict, Verdict::Red);
    EXPECT_EQ(summary.failed_gate_count(), 1u);
    EXPECT_EQ(count_failed(summary.gates, kFreestandingGate), 1u);
    EXPECT_THAT(regressed_environments(summary.gates), ElementsAre(Environment::Freestanding));
}

TEST_F(VerificationRunTest, AllocOutsideGuardBreaksOnlyCore)
{
    config_.steps.compile = fake_tool(
        "fail_if", {"{feature_set}", "none", "error[E0432]: unresolved import `alloc`"});
    const auto summary = Execute();

    EXPECT_EQ(summary.verdict, Verdict::Red);
    EXPECT_EQ(summary.failed_gate_count(), 6u);
    for (const auto &g : summary.gates)
    {
        if (g.passed())
            continue;
        EXPECT_EQ(g.gate_name(), kTestGate);
        EXPECT_EQ(g.environment(), Environment::Core);
        ASSERT_EQ(g.failures().size(), 1u);
        EXPECT_EQ(g.failures()[0].kind, FailureKind::CompileError);
        EXPECT_THAT(g.failures()[0].detail, HasSubstr("unresolved import `alloc`"));
    }
    EXPECT_THAT(regressed_environments(summary.gates), ElementsAre(Environment::Core));
}

TEST_F(VerificationRunTest, EachTestGateGetsItsOwnFeatureArgs)
{
    config_.steps.compile = fake_tool("argv", {"{feature_args}"});
    const auto summary = Execute();
    ASSERT_EQ(summary.verdict, Verdict::Green);

    for (const auto &g : summary.gates)
    {
        if (g.gate_name() != std::string(kTestGate))
            continue;
        const auto &cmd = g.steps().at(0).command;
        const auto fake_pos = std::find(cmd.begin(), cmd.end(), "fake.argv");
        ASSERT_NE(fake_pos, cmd.end());
        const std::vector<std::string> args(fake_pos + 1, cmd.end());
        switch (*g.environment())
        {
        case Environment::FullStd: EXPECT_THAT(args, IsEmpty()); break;
        case Environment::Core: EXPECT_THAT(args, ElementsAre("--no-default-features")); break;
        case Environment::CoreAlloc:
            EXPECT_THAT(args, ElementsAre("--no-default-features", "--features", "alloc"));
            break;
        default: ADD_FAILURE() << "unexpected environment"; break;
        }
    }
}

TEST_F(VerificationRunTest, KeepScratchLeavesLogs)
{
    RunOptions opts;
    opts.keep_scratch = true;
    opts.filter.toolchains = {Toolchain::Stable};
    const auto summary = Execute(opts);
    ASSERT_EQ(summary.verdict, Verdict::Green);

    const fs::path run_root = fs::path(config_.run.work_root) / summary.run_id;
    EXPECT_TRUE(fs::exists(run_root / "stable-linux" / "format.stdout.log"));
    EXPECT_TRUE(fs::exists(run_root / "stable-windows" / "test-none.stdout.log"));
    EXPECT_TRUE(fs::exists(run_root / "freestanding-thumbv6m-none-eabi" / "build.stdout.log"));
}

TEST_F(VerificationRunTest, WorkspaceFailureFailsEveryGate)
{
    write_text_file(tmp_->path() / "blocker", "not a directory");
    config_.run.work_root = (tmp_->path() / "blocker" / "work").string();
    RunOptions opts;
    opts.filter.toolchains = {Toolchain::Stable};
    opts.filter.platforms = {Platform::Linux};
    const auto summary = Execute(opts);

    EXPECT_EQ(summary.verdict, Verdict::Red);
    ASSERT_EQ(summary.gates.size(), 5u);
    EXPECT_EQ(summary.gates[0].failures().at(0).kind, FailureKind::FormatViolation);
    EXPECT_EQ(summary.gates[1].failures().at(0).kind, FailureKind::CompileError);
    EXPECT_EQ(summary.gates[1].failures().at(0).subject, "workspace");
    EXPECT_EQ(summary.gates[4].failures().at(0).kind, FailureKind::FreestandingCompileError);
    EXPECT_THAT(summary.gates[4].failures().at(0).detail, HasSubstr("target could not run"));
}

TEST_F(VerificationRunTest, EmptyPlanIsGreen)
{
    RunOptions opts;
    opts.hosted = false;
    opts.filter.toolchains = {Toolchain::Beta};
    const auto summary = Execute(opts);
    EXPECT_EQ(summary.verdict, Verdict::Green);
    EXPECT_TRUE(summary.gates.empty());
}

TEST_F(VerificationRunTest, CancellationDiscardsResults)
{
    config_.steps.format = fake_tool("sleep", {"30000"});
    config_.steps.compile = fake_tool("sleep", {"30000"});
    for (auto &t : config_.freestanding)
        t.build = fake_tool("sleep", {"30000"});

    std::thread canceller(
        [this]
        {
            std::this_thread::sleep_for(300ms);
            cancel_.request();
        });
    const auto start = std::chrono::steady_clock::now();
    const auto summary = Execute();
    canceller.join();

    EXPECT_EQ(summary.verdict, Verdict::Cancelled);
    EXPECT_TRUE(summary.gates.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 20s);
    EXPECT_FALSE(fs::exists(config_.run.work_root));
}
