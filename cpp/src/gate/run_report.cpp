#include "run_report.hpp"

#include "cgt_base.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace cellgate::gate
{

using nlohmann::json;

namespace
{

// Indents every line of a diagnostic under its failure header.
void print_indented(std::FILE *out, const std::string &text)
{
    for (const auto &line : format_tools::split_lines(text))
        fmt::print(out, "      | {}\n", line);
}

std::string iso_utc(std::chrono::system_clock::time_point tp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(CELLGATE_PLATFORM_WIN64)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", tm);
}

json step_to_json(const StepRecord &s)
{
    json j;
    j["name"] = s.name;
    j["command"] = s.command;
    j["exit_code"] = s.exit_code ? json(*s.exit_code) : json(nullptr);
    j["duration_ms"] = s.duration.count();
    if (!s.diagnostic.empty())
        j["diagnostic"] = s.diagnostic;
    j["stdout_tail"] = s.stdout_tail;
    j["stderr_tail"] = s.stderr_tail;
    return j;
}

json failure_to_json(const GateResult &gate, const Failure &f)
{
    return json{{"gate", gate.gate_name()},
                {"configuration", gate.configuration()},
                {"kind", to_string(f.kind)},
                {"severity", to_string(f.severity())},
                {"subject", f.subject},
                {"detail", f.detail}};
}

} // namespace

void print_plan(const RunPlan &plan, std::FILE *out)
{
    for (const auto &cell : plan.cells)
    {
        fmt::print(out, "{:<20} {}\n", kStaticQualityGate, cell.configuration().label());
        for (const auto fs : plan.feature_sets)
            fmt::print(out, "{:<20} {}\n", kTestGate, cell.configuration(fs).label());
    }
    for (const auto &target : plan.freestanding)
        fmt::print(out, "{:<20} {} (toolchain {})\n", kFreestandingGate, target.label(),
                   to_string(target.toolchain));
    fmt::print(out, "{} task(s), {} gate(s)\n", plan.task_count(), plan.gate_count());
}

void print_summary(const RunSummary &summary, std::FILE *out)
{
    if (summary.verdict == Verdict::Cancelled)
    {
        fmt::print(out, "Run {} cancelled; no results.\n", summary.run_id);
        return;
    }

    fmt::print(out, "\nGates:\n");
    for (const auto &g : summary.gates)
    {
        fmt::print(out, "  {} {:<20} {:<28} {:>8}\n", g.passed() ? "PASS" : "FAIL", g.gate_name(),
                   g.configuration(), format_tools::formatted_duration(g.duration()));
    }

    if (summary.failure_count() > 0)
    {
        fmt::print(out, "\nFailures:\n");
        for (const auto &g : summary.gates)
        {
            for (const auto &f : g.failures())
            {
                fmt::print(out, "  [{}] {} {} ({}): {}\n", to_string(f.severity()), g.gate_name(),
                           g.configuration(), to_string(f.kind), f.subject);
                print_indented(out, f.detail);
            }
        }
    }

    const auto regressed = regressed_environments(summary.gates);
    if (!regressed.empty())
    {
        std::string names;
        for (const auto e : regressed)
        {
            if (!names.empty())
                names += ", ";
            names += to_string(e);
        }
        fmt::print(out, "\nRegressed environments: {}\n", names);
    }

    fmt::print(out, "\nVerdict: {} ({} of {} gate(s) failed, {})\n",
               summary.verdict == Verdict::Green ? "GREEN" : "RED", summary.failed_gate_count(),
               summary.gates.size(), format_tools::formatted_duration(summary.duration));
}

json gate_to_json(const GateResult &gate)
{
    json j;
    j["gate"] = gate.gate_name();
    j["configuration"] = gate.configuration();
    j["environment"] = gate.environment() ? json(to_string(*gate.environment())) : json(nullptr);
    j["state"] = to_string(gate.state());
    j["outcome"] = gate.passed() ? "pass" : "fail";
    j["duration_ms"] = gate.duration().count();

    json steps = json::array();
    for (const auto &s : gate.steps())
        steps.push_back(step_to_json(s));
    j["steps"] = std::move(steps);

    json failures = json::array();
    for (const auto &f : gate.failures())
    {
        failures.push_back(json{{"kind", to_string(f.kind)},
                                {"severity", to_string(f.severity())},
                                {"subject", f.subject},
                                {"detail", f.detail}});
    }
    j["failures"] = std::move(failures);
    return j;
}

json report_to_json(const RunSummary &summary)
{
    json j;
    j["run"] = json{{"id", summary.run_id}, {"name", summary.name}};
    j["verdict"] = to_string(summary.verdict);
    j["started_at"] = iso_utc(summary.started_at);
    j["duration_ms"] = summary.duration.count();

    json gates = json::array();
    json failures = json::array();
    for (const auto &g : summary.gates)
    {
        gates.push_back(gate_to_json(g));
        for (const auto &f : g.failures())
            failures.push_back(failure_to_json(g, f));
    }
    j["gates"] = std::move(gates);
    j["failures"] = std::move(failures);

    json regressed = json::array();
    for (const auto e : regressed_environments(summary.gates))
        regressed.push_back(to_string(e));
    j["regressed_environments"] = std::move(regressed);
    return j;
}

void write_json_report(const RunSummary &summary, const std::string &path)
{
    namespace fs = std::filesystem;
    const fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path())
        fs::create_directories(p.parent_path(), ec);

    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
        throw std::runtime_error("Report: cannot open '" + path + "' for writing");
    // Tool output is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    f << report_to_json(summary).dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    f.flush();
    if (!f)
        throw std::runtime_error("Report: write to '" + path + "' failed");
}

} // namespace cellgate::gate
