#pragma once
/**
 * @file run_report.hpp
 * @brief Console summary and JSON report of a verification run.
 *
 * Every gate and every failure is listed individually, so each failing
 * (gate, configuration) pair can be read off the report.
 */

#include "verification_run.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace cellgate::gate
{

/// `--list`: the expanded matrix, one line per gate.
void print_plan(const RunPlan &plan, std::FILE *out);

/// One line per gate, then the failures with their diagnostics, then the verdict.
void print_summary(const RunSummary &summary, std::FILE *out);

nlohmann::json gate_to_json(const GateResult &gate);

/// {run, verdict, started_at, duration_ms, gates, failures, regressed_environments}
nlohmann::json report_to_json(const RunSummary &summary);

/**
 * @brief Writes report_to_json() to @p path (pretty-printed), creating parent
 *        directories as needed.
 * @throws std::runtime_error if the file cannot be written.
 */
void write_json_report(const RunSummary &summary, const std::string &path);

} // namespace cellgate::gate
