// tests/test_layer2_service/test_child_process.cpp
/**
 * @file test_child_process.cpp
 * @brief Tests for utils::ChildProcess and run_process().
 *
 * The child is always this test executable in "fake.<scenario>" mode, so the tests
 * need no tool from the host system.
 */
#include "cgt_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include <atomic>
#include <csignal>
#include <thread>

namespace fs = std::filesystem;
using namespace cellgate;
using namespace cellgate::tests::helper;
using namespace std::chrono_literals;

class ChildProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmp_ = std::make_unique<TempDir>(std::string("child_") + info->name());
    }

    utils::ProcessSpec MakeSpec(std::vector<std::string> argv) const
    {
        utils::ProcessSpec spec;
        spec.argv = std::move(argv);
        spec.stdout_path = *tmp_ / "out.log";
        spec.stderr_path = *tmp_ / "err.log";
        return spec;
    }

    std::unique_ptr<TempDir> tmp_;
};

TEST_F(ChildProcessTest, ReportsExitCode)
{
    auto r = utils::run_process(MakeSpec(fake_tool("exit", {"7"})), nullptr);
    ASSERT_TRUE(r.is_ok()) << utils::to_string(r.error());
    EXPECT_EQ(r.content().kind, utils::ExitKind::Exited);
    EXPECT_EQ(r.content().exit_code, 7);
    EXPECT_FALSE(r.content().succeeded());
}

TEST_F(ChildProcessTest, CapturesStdoutAndStderrSeparately)
{
    auto r = utils::run_process(MakeSpec(fake_tool("print", {"to-stdout", "0"})), nullptr);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.content().succeeded());
    EXPECT_NE(r.content().stdout_text.find("to-stdout"), std::string::npos);
    EXPECT_EQ(r.content().stderr_text.find("to-stdout"), std::string::npos);

    auto e = utils::run_process(MakeSpec(fake_tool("print_err", {"to-stderr", "3"})), nullptr);
    ASSERT_TRUE(e.is_ok());
    EXPECT_EQ(e.content().exit_code, 3);
    EXPECT_NE(e.content().stderr_text.find("to-stderr"), std::string::npos);
    EXPECT_EQ(e.content().stdout_text.find("to-stderr"), std::string::npos);

    // Output also stays in the redirect files.
    std::string err_file;
    ASSERT_TRUE(read_file_contents((*tmp_ / "err.log").string(), err_file));
    EXPECT_NE(err_file.find("to-stderr"), std::string::npos);
}

TEST_F(ChildProcessTest, PassesArgumentsVerbatim)
{
    auto r = utils::run_process(MakeSpec(fake_tool("argv", {"a b", "", "--flag=\"x\""})), nullptr);
    ASSERT_TRUE(r.is_ok());
    auto lines = format_tools::split_lines(r.content().stdout_text);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a b");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "--flag=\"x\"");
}

TEST_F(ChildProcessTest, AddsEnvironmentVariables)
{
    auto spec = MakeSpec(fake_tool("env", {"CELLGATE_CHILD_TEST_VAR", "hello"}));
    spec.env.emplace_back("CELLGATE_CHILD_TEST_VAR", "hello");
    auto r = utils::run_process(spec, nullptr);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.content().succeeded()) << r.content().stderr_text;

    // Not set in the parent, so not inherited without the spec entry.
    auto unset = utils::run_process(MakeSpec(fake_tool("env", {"CELLGATE_CHILD_TEST_VAR"})), nullptr);
    ASSERT_TRUE(unset.is_ok());
    EXPECT_EQ(unset.content().exit_code, 3);
}

TEST_F(ChildProcessTest, RunsInWorkingDirectory)
{
    fs::create_directories(*tmp_ / "work");
    auto spec = MakeSpec(fake_tool("cwd"));
    spec.working_dir = *tmp_ / "work";
    auto r = utils::run_process(spec, nullptr);
    ASSERT_TRUE(r.is_ok());
    auto lines = format_tools::split_lines(r.content().stdout_text);
    ASSERT_FALSE(lines.empty());
    EXPECT_TRUE(fs::equivalent(fs::path(lines[0]), *tmp_ / "work"));
}

TEST_F(ChildProcessTest, EmptyCommandIsRejected)
{
    auto r = utils::run_process(MakeSpec({}), nullptr);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), utils::SpawnError::EmptyCommand);
}

TEST_F(ChildProcessTest, MissingProgramIsReported)
{
    auto r = utils::run_process(MakeSpec({"cellgate-no-such-program-4711"}), nullptr);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), utils::SpawnError::ProgramNotFound);
}

TEST_F(ChildProcessTest, MissingWorkingDirectoryIsReported)
{
    auto spec = MakeSpec(fake_tool("exit", {"0"}));
    spec.working_dir = *tmp_ / "does-not-exist";
    auto r = utils::run_process(spec, nullptr);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), utils::SpawnError::BadWorkingDir);
}

TEST_F(ChildProcessTest, UnwritableRedirectIsReported)
{
    auto spec = MakeSpec(fake_tool("exit", {"0"}));
    spec.stdout_path = *tmp_ / "no-such-dir" / "out.log";
    auto r = utils::run_process(spec, nullptr);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), utils::SpawnError::RedirectFailed);
}

TEST_F(ChildProcessTest, TimeoutTerminatesChild)
{
    auto spec = MakeSpec(fake_tool("sleep", {"30000"}));
    spec.timeout = 300ms;
    const auto start = std::chrono::steady_clock::now();
    auto r = utils::run_process(spec, nullptr);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().kind, utils::ExitKind::TimedOut);
    EXPECT_FALSE(r.content().succeeded());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST_F(ChildProcessTest, CancellationTerminatesChild)
{
    utils::CancellationToken cancel;
    std::thread canceller(
        [&cancel]
        {
            std::this_thread::sleep_for(200ms);
            cancel.request();
        });

    const auto start = std::chrono::steady_clock::now();
    auto r = utils::run_process(MakeSpec(fake_tool("sleep", {"30000"})), &cancel);
    canceller.join();

    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().kind, utils::ExitKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST_F(ChildProcessTest, SecondWaitFails)
{
    auto spawned = utils::ChildProcess::spawn(MakeSpec(fake_tool("exit", {"0"})));
    ASSERT_TRUE(spawned.is_ok());
    auto child = std::move(spawned).content();
    EXPECT_GT(child->pid(), 0);

    auto first = child->wait(nullptr);
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.content().succeeded());

    auto second = child->wait(nullptr);
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error(), utils::SpawnError::WaitFailed);
}

TEST_F(ChildProcessTest, DestructorTerminatesRunningChild)
{
    const auto start = std::chrono::steady_clock::now();
    {
        auto spawned = utils::ChildProcess::spawn(MakeSpec(fake_tool("sleep", {"30000"})));
        ASSERT_TRUE(spawned.is_ok());
        std::this_thread::sleep_for(100ms);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

#if defined(CELLGATE_IS_POSIX)

TEST_F(ChildProcessTest, ReportsDeathBySignal)
{
    auto r = utils::run_process(MakeSpec(fake_tool("killed", {"about to die"})), nullptr);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().kind, utils::ExitKind::Signaled);
    EXPECT_EQ(r.content().signal, SIGKILL);
    EXPECT_FALSE(r.content().succeeded());
    EXPECT_NE(r.content().stderr_text.find("about to die"), std::string::npos);
}

TEST_F(ChildProcessTest, UnknownExitStatusIsAnError)
{
    // With SIGCHLD ignored the kernel reaps children itself and waitpid() fails
    // with ECHILD; the exit code 7 is lost and must not read as success.
    auto *previous = std::signal(SIGCHLD, SIG_IGN);
    auto restore = basics::make_scope_guard([previous] { std::signal(SIGCHLD, previous); });

    auto r = utils::run_process(MakeSpec(fake_tool("exit", {"7"})), nullptr);
    ASSERT_TRUE(r.is_error()) << "exit_code " << r.content().exit_code;
    EXPECT_EQ(r.error(), utils::SpawnError::WaitFailed);
    EXPECT_EQ(r.error_code(), ECHILD);
}

TEST_F(ChildProcessTest, LongRunningSiblingsDoNotDelaySpawn)
{
    std::atomic<bool> stop{false};
    std::vector<std::thread> siblings;
    for (int t = 0; t < 2; ++t)
    {
        siblings.emplace_back(
            [this, &stop, t]
            {
                utils::ProcessSpec spec;
                spec.argv = fake_tool("sleep", {"1500"});
                spec.stdout_path = *tmp_ / fmt::format("sibling{}.out", t);
                spec.stderr_path = *tmp_ / fmt::format("sibling{}.err", t);
                while (!stop.load())
                {
                    auto r = utils::run_process(spec, nullptr);
                    if (r.is_error())
                        return;
                }
            });
    }
    auto stop_siblings = basics::make_scope_guard(
        [&]
        {
            stop.store(true);
            for (auto &t : siblings)
                t.join();
        });

    // A spawn that picked up a sibling's status pipe would block until that
    // sibling's 1.5s sleep ended.
    for (int i = 0; i < 60; ++i)
    {
        const auto start = std::chrono::steady_clock::now();
        auto spawned = utils::ChildProcess::spawn(MakeSpec(fake_tool("exit", {"0"})));
        ASSERT_TRUE(spawned.is_ok());
        EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms) << "spawn " << i;
        auto child = std::move(spawned).content();
        ASSERT_TRUE(child->wait(nullptr).is_ok());
    }
}

#endif
