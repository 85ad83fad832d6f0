// tests/test_cellgate/test_gate_config.cpp
/**
 * @file test_gate_config.cpp
 * @brief GateConfig defaults, JSON loading and validation errors.
 */
#include "gate_config.hpp"
#include "shared_test_helpers.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace cellgate::gate;
using cellgate::tests::helper::TempDir;
using cellgate::tests::helper::write_text_file;
using nlohmann::json;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace
{
/// Error message of loading @p j, or "" if it loads.
std::string load_error(const json &j)
{
    try
    {
        (void)GateConfig::from_json(j, "test.json");
    }
    catch (const std::runtime_error &e)
    {
        return e.what();
    }
    return {};
}
} // namespace

TEST(GateConfigTest, DefaultsDescribeTheFullWorkflow)
{
    const auto cfg = GateConfig::defaults();
    EXPECT_EQ(cfg.matrix.toolchains.size(), 3u);
    EXPECT_THAT(cfg.matrix.platform_list(), ElementsAre(Platform::Linux, Platform::Windows));
    EXPECT_THAT(cfg.matrix.feature_set_list(),
                ElementsAre(FeatureSet::Default, FeatureSet::None, FeatureSet::Alloc));
    ASSERT_EQ(cfg.freestanding.size(), 1u);
    EXPECT_EQ(cfg.freestanding[0].triple, "thumbv6m-none-eabi");
    EXPECT_EQ(cfg.freestanding[0].feature_set, FeatureSet::Alloc);
    EXPECT_EQ(cfg.freestanding[0].id(), "freestanding-thumbv6m-none-eabi");
    EXPECT_EQ(cfg.freestanding[0].label(), "thumbv6m-none-eabi/alloc");
    EXPECT_GE(cfg.run.jobs, 1);
    EXPECT_EQ(cfg.project.isolation, Isolation::TargetDir);
    EXPECT_NO_THROW(cfg.validate("defaults"));
}

TEST(GateConfigTest, DefaultFeatureArgs)
{
    const auto cfg = GateConfig::defaults();
    EXPECT_TRUE(cfg.matrix.feature_args(FeatureSet::Default).empty());
    EXPECT_THAT(cfg.matrix.feature_args(FeatureSet::None), ElementsAre("--no-default-features"));
    EXPECT_THAT(cfg.matrix.feature_args(FeatureSet::Alloc),
                ElementsAre("--no-default-features", "--features", "alloc"));
}

TEST(GateConfigTest, EmptyDocumentKeepsDefaults)
{
    const auto cfg = GateConfig::from_json(json::object(), "empty.json");
    EXPECT_EQ(cfg.matrix.toolchains, GateConfig::defaults().matrix.toolchains);
    EXPECT_EQ(cfg.steps.compile, GateConfig::defaults().steps.compile);
    EXPECT_EQ(cfg.run.report, "cellgate-report.json");
}

TEST(GateConfigTest, OverridesAreApplied)
{
    const json j = {
        {"run", {{"name", "ihex"}, {"jobs", 4}, {"gate_timeout_seconds", 0}, {"log_level", "debug"}}},
        {"trigger", {{"branch", "release"}, {"events", {"push"}}}},
        {"project", {{"source_dir", "../lib"}, {"isolation", "copy"}}},
        {"matrix",
         {{"toolchains", {"nightly", "stable", "stable"}},
          {"platforms", {"windows", "linux"}},
          {"feature_sets", {{"none", {"--no-default-features", "-Zflag"}}}}}},
        {"steps", {{"test", {"make", "check", "{feature_args}"}}}},
        {"env", {{"RUSTFLAGS", "-D warnings"}}}};

    const auto cfg = GateConfig::from_json(j, "ci.json");
    EXPECT_EQ(cfg.run.name, "ihex");
    EXPECT_EQ(cfg.run.jobs, 4);
    EXPECT_EQ(cfg.run.gate_timeout_seconds, 0);
    EXPECT_EQ(cfg.trigger.branch, "release");
    EXPECT_EQ(cfg.project.source_dir, "../lib");
    EXPECT_EQ(cfg.project.isolation, Isolation::Copy);
    // Duplicates dropped; order as written.
    EXPECT_THAT(cfg.matrix.toolchains, ElementsAre(Toolchain::Nightly, Toolchain::Stable));
    // Sorted into enum order.
    EXPECT_THAT(cfg.matrix.platform_list(), ElementsAre(Platform::Linux, Platform::Windows));
    EXPECT_THAT(cfg.matrix.feature_set_list(), ElementsAre(FeatureSet::None));
    EXPECT_THAT(cfg.matrix.feature_args(FeatureSet::None),
                ElementsAre("--no-default-features", "-Zflag"));
    EXPECT_THAT(cfg.steps.test, ElementsAre("make", "check", "{feature_args}"));
    // Untouched steps keep their defaults.
    EXPECT_EQ(cfg.steps.format, GateConfig::defaults().steps.format);
    ASSERT_EQ(cfg.env.size(), 1u);
    EXPECT_EQ(cfg.env[0].first, "RUSTFLAGS");
}

TEST(GateConfigTest, PlatformRunners)
{
    const json j = {{"matrix",
                     {{"platforms",
                       {{"linux", json::object()},
                        {"windows", {{"runner", {"ssh", "winbox", "--", "cd {scratch} &&"}}}}}}}}};
    const auto cfg = GateConfig::from_json(j, "ci.json");
    const auto *win = cfg.matrix.find_platform(Platform::Windows);
    ASSERT_NE(win, nullptr);
    EXPECT_THAT(win->runner, ElementsAre("ssh", "winbox", "--", "cd {scratch} &&"));
    ASSERT_NE(cfg.matrix.find_platform(Platform::Linux), nullptr);
    EXPECT_TRUE(cfg.matrix.find_platform(Platform::Linux)->runner.empty());
}

TEST(GateConfigTest, FeatureSetArrayUsesBuiltinArgs)
{
    const json j = {{"matrix", {{"feature_sets", {"alloc", "default", "alloc"}}}}};
    const auto cfg = GateConfig::from_json(j, "ci.json");
    EXPECT_THAT(cfg.matrix.feature_set_list(), ElementsAre(FeatureSet::Default, FeatureSet::Alloc));
    EXPECT_THAT(cfg.matrix.feature_args(FeatureSet::Alloc),
                ElementsAre("--no-default-features", "--features", "alloc"));
}

TEST(GateConfigTest, FreestandingTargets)
{
    const json j = {{"freestanding",
                     {{{"triple", "riscv32imc-unknown-none-elf"}, {"feature_set", "none"}},
                      {{"triple", "thumbv7em-none-eabihf"},
                       {"toolchain", "nightly"},
                       {"build", {"cargo", "+{toolchain}", "build", "--target", "{triple}"}}}}}};
    const auto cfg = GateConfig::from_json(j, "ci.json");
    ASSERT_EQ(cfg.freestanding.size(), 2u);
    EXPECT_EQ(cfg.freestanding[0].feature_set, FeatureSet::None);
    EXPECT_EQ(cfg.freestanding[0].toolchain, Toolchain::Stable);
    EXPECT_FALSE(cfg.freestanding[0].build.empty());
    EXPECT_EQ(cfg.freestanding[1].toolchain, Toolchain::Nightly);
    EXPECT_EQ(cfg.freestanding[1].feature_set, FeatureSet::Alloc);

    const auto none = GateConfig::from_json({{"freestanding", json::array()}}, "ci.json");
    EXPECT_TRUE(none.freestanding.empty());
}

TEST(GateConfigTest, FreestandingIsNeverTested)
{
    const auto err = load_error(
        {{"freestanding", {{{"triple", "thumbv6m-none-eabi"}, {"test", {"cargo", "test"}}}}}});
    EXPECT_THAT(err, HasSubstr("freestanding[0].test"));
    EXPECT_THAT(err, HasSubstr("never test-executed"));
}

TEST(GateConfigTest, FreestandingRejectsDefaultFeatures)
{
    EXPECT_THAT(load_error({{"freestanding", {{{"feature_set", "default"}}}}}),
                HasSubstr("freestanding[0].feature_set"));
}

TEST(GateConfigTest, InvalidValuesNameTheKey)
{
    EXPECT_THAT(load_error({{"matrix", {{"toolchains", {"stabel"}}}}}),
                HasSubstr("'matrix.toolchains' in 'test.json': unknown toolchain 'stabel'"));
    EXPECT_THAT(load_error({{"matrix", {{"toolchains", json::array()}}}}),
                HasSubstr("must not be empty"));
    EXPECT_THAT(load_error({{"matrix", {{"platforms", {"macos"}}}}}),
                HasSubstr("unknown platform 'macos'"));
    EXPECT_THAT(load_error({{"matrix", {{"feature_sets", {{"std", json::array()}}}}}}),
                HasSubstr("matrix.feature_sets.std"));
    EXPECT_THAT(load_error({{"run", {{"jobs", 0}}}}), HasSubstr("run.jobs"));
    EXPECT_THAT(load_error({{"run", {{"jobs", "4"}}}}), HasSubstr("must be an integer"));
    EXPECT_THAT(load_error({{"run", {{"gate_timeout_seconds", -1}}}}),
                HasSubstr("run.gate_timeout_seconds"));
    EXPECT_THAT(load_error({{"run", {{"gate_timeout_seconds", 3000000000LL}}}}),
                HasSubstr("must be between 0 and 604800"));
    EXPECT_EQ(load_error({{"run", {{"gate_timeout_seconds", 604800}}}}), "");
    EXPECT_THAT(load_error({{"run", {{"log_level", "loud"}}}}), HasSubstr("unknown log level"));
    EXPECT_THAT(load_error({{"project", {{"isolation", "chroot"}}}}),
                HasSubstr("project.isolation"));
    EXPECT_THAT(load_error({{"trigger", {{"events", {"tag"}}}}}), HasSubstr("unknown event 'tag'"));
    EXPECT_THAT(load_error({{"env", {{"X", 1}}}}), HasSubstr("'env.X'"));
    EXPECT_THAT(load_error({{"run", "fast"}}), HasSubstr("'run' in 'test.json': must be an object"));
    EXPECT_THAT(load_error(json::array()), HasSubstr("must be an object"));
}

TEST(GateConfigTest, TemplatesAndPatternsAreValidated)
{
    EXPECT_THAT(load_error({{"steps", {{"lint", {"cargo", "+{toolchian}", "clippy"}}}}}),
                HasSubstr("unknown placeholder '{toolchian}'"));
    EXPECT_THAT(load_error({{"steps", {{"format", json::array()}}}}),
                HasSubstr("command is empty"));
    EXPECT_THAT(load_error({{"steps", {{"test_failure_pattern", "(unclosed"}}}}),
                HasSubstr("steps.test_failure_pattern"));
    EXPECT_THAT(load_error({{"env", {{"TARGET", "{target}"}}}}), HasSubstr("env.TARGET"));
    EXPECT_THAT(load_error({{"matrix", {{"platforms", {{"windows", {{"runner", {"ssh", "{host}"}}}}}}}}}),
                HasSubstr("matrix.platforms.windows.runner"));
}

TEST(GateConfigTest, UnknownSectionsAreIgnored)
{
    EXPECT_EQ(load_error({{"comment", "ignored"}, {"run", {{"jobs", 2}}}}), "");
}

TEST(GateConfigTest, TriggerApplies)
{
    TriggerSettings t; // main, push + pull_request
    EXPECT_TRUE(t.applies(std::nullopt, std::nullopt));
    EXPECT_TRUE(t.applies(std::string("push"), std::string("main")));
    EXPECT_TRUE(t.applies(std::string("pull_request"), std::nullopt));
    EXPECT_FALSE(t.applies(std::string("push"), std::string("feature/x")));

    t.events = {"pull_request"};
    EXPECT_FALSE(t.applies(std::string("push"), std::string("main")));
}

TEST(GateConfigTest, LoadsFromFile)
{
    TempDir tmp("gate_config_file");
    const auto path = (tmp / "ci.json").string();
    write_text_file(path, R"({ "run": { "name": "from-file", "jobs": 2 } })");
    const auto cfg = GateConfig::from_json_file(path);
    EXPECT_EQ(cfg.run.name, "from-file");
    EXPECT_EQ(cfg.run.jobs, 2);
}

TEST(GateConfigTest, ShippedExampleConfigsLoad)
{
    const std::string dir = CELLGATE_EXAMPLES_DIR;

    const auto full = GateConfig::from_json_file(dir + "/cellgate.json");
    EXPECT_EQ(full.run.name, "ihex");
    EXPECT_EQ(full.run.jobs, 4);
    EXPECT_THAT(full.matrix.toolchains,
                ElementsAre(Toolchain::Stable, Toolchain::Beta, Toolchain::Nightly));
    const auto *win = full.matrix.find_platform(Platform::Windows);
    ASSERT_NE(win, nullptr);
    EXPECT_THAT(win->runner, ElementsAre("ssh", "ci-win01", "--"));
    EXPECT_THAT(full.matrix.feature_set_list(),
                ElementsAre(FeatureSet::Default, FeatureSet::None, FeatureSet::Alloc));
    ASSERT_EQ(full.freestanding.size(), 1u);
    EXPECT_EQ(full.freestanding[0].triple, "thumbv6m-none-eabi");
    EXPECT_EQ(full.env.size(), 2u);

    const auto quick = GateConfig::from_json_file(dir + "/linux_quick.json");
    EXPECT_EQ(quick.run.name, "ihex-quick");
    EXPECT_TRUE(quick.run.report.empty());
    EXPECT_THAT(quick.matrix.platform_list(), ElementsAre(Platform::Linux));
    EXPECT_THAT(quick.matrix.feature_set_list(), ElementsAre(FeatureSet::Default, FeatureSet::Alloc));
    ASSERT_EQ(quick.freestanding.size(), 2u);
    EXPECT_EQ(quick.freestanding[1].feature_set, FeatureSet::None);
}

TEST(GateConfigTest, FileErrors)
{
    TempDir tmp("gate_config_file_errors");
    try
    {
        (void)GateConfig::from_json_file((tmp / "missing.json").string());
        FAIL() << "expected an exception";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("cannot open file"));
    }

    const auto bad = (tmp / "bad.json").string();
    write_text_file(bad, "{ \"run\": ");
    try
    {
        (void)GateConfig::from_json_file(bad);
        FAIL() << "expected an exception";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("JSON parse error"));
    }
}
