/**
 * @file gate_config.cpp
 * @brief GateConfig defaults, JSON parsing and validation.
 */
#include "gate_config.hpp"

#include "utils/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <thread>

namespace cellgate::gate
{

using nlohmann::json;

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

// One week.
constexpr long long kMaxGateTimeoutSeconds = 7LL * 24 * 3600;

[[noreturn]] void config_error(const std::string &origin, const std::string &key,
                               const std::string &what)
{
    throw std::runtime_error(fmt::format("Gate config: '{}' in '{}': {}", key, origin, what));
}

const json *find_key(const json &obj, const char *key)
{
    const auto it = obj.find(key);
    return it == obj.end() ? nullptr : &*it;
}

const json *section(const json &root, const char *key, const std::string &origin)
{
    const json *s = find_key(root, key);
    if (s != nullptr && !s->is_object())
        config_error(origin, key, "must be an object");
    return s;
}

std::string get_string(const json &obj, const char *key, const std::string &path,
                       const std::string &origin, std::string fallback)
{
    const json *v = find_key(obj, key);
    if (v == nullptr)
        return fallback;
    if (!v->is_string())
        config_error(origin, path, "must be a string");
    return v->get<std::string>();
}

long long get_integer(const json &obj, const char *key, const std::string &path,
                      const std::string &origin, long long fallback)
{
    const json *v = find_key(obj, key);
    if (v == nullptr)
        return fallback;
    if (!v->is_number_integer())
        config_error(origin, path, "must be an integer");
    return v->get<long long>();
}

std::vector<std::string> to_string_array(const json &v, const std::string &path,
                                         const std::string &origin)
{
    if (!v.is_array())
        config_error(origin, path, "must be an array of strings");
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto &e : v)
    {
        if (!e.is_string())
            config_error(origin, path, "must be an array of strings");
        out.push_back(e.get<std::string>());
    }
    return out;
}

std::vector<std::string> get_string_array(const json &obj, const char *key,
                                          const std::string &path, const std::string &origin,
                                          std::vector<std::string> fallback)
{
    const json *v = find_key(obj, key);
    if (v == nullptr)
        return fallback;
    return to_string_array(*v, path, origin);
}

Toolchain require_toolchain(const std::string &name, const std::string &path,
                            const std::string &origin)
{
    if (auto t = parse_toolchain(name))
        return *t;
    config_error(origin, path,
                 fmt::format("unknown toolchain '{}' (must be 'stable', 'beta' or 'nightly')", name));
}

Platform require_platform(const std::string &name, const std::string &path,
                          const std::string &origin)
{
    if (auto p = parse_platform(name))
        return *p;
    config_error(origin, path,
                 fmt::format("unknown platform '{}' (must be 'linux' or 'windows')", name));
}

FeatureSet require_feature_set(const std::string &name, const std::string &path,
                               const std::string &origin)
{
    if (auto f = parse_feature_set(name))
        return *f;
    config_error(origin, path,
                 fmt::format("unknown feature set '{}' (must be 'default', 'none' or 'alloc')", name));
}

std::vector<std::string> builtin_feature_args(FeatureSet f)
{
    switch (f)
    {
    case FeatureSet::Default: return {};
    case FeatureSet::None: return {"--no-default-features"};
    case FeatureSet::Alloc: return {"--no-default-features", "--features", "alloc"};
    }
    return {};
}

CommandTemplate default_build_command()
{
    return {"cargo", "+{toolchain}", "build", "{feature_args}", "--target", "{triple}"};
}

void parse_run(const json &s, RunSettings &run, const std::string &origin)
{
    run.name = get_string(s, "name", "run.name", origin, run.name);

    const long long jobs = get_integer(s, "jobs", "run.jobs", origin, run.jobs);
    if (jobs < 1 || jobs > 1024)
        config_error(origin, "run.jobs", fmt::format("must be between 1 and 1024, got {}", jobs));
    run.jobs = static_cast<int>(jobs);

    run.work_root = get_string(s, "work_root", "run.work_root", origin, run.work_root);
    if (run.work_root.empty())
        config_error(origin, "run.work_root", "must not be empty");
    run.report = get_string(s, "report", "run.report", origin, run.report);

    const long long tail = get_integer(s, "diagnostic_tail_bytes", "run.diagnostic_tail_bytes",
                                       origin, static_cast<long long>(run.diagnostic_tail_bytes));
    if (tail < 0)
        config_error(origin, "run.diagnostic_tail_bytes", "must not be negative");
    run.diagnostic_tail_bytes = static_cast<std::size_t>(tail);

    const long long timeout = get_integer(s, "gate_timeout_seconds", "run.gate_timeout_seconds",
                                          origin, run.gate_timeout_seconds);
    if (timeout < 0 || timeout > kMaxGateTimeoutSeconds)
        config_error(origin, "run.gate_timeout_seconds",
                     fmt::format("must be between 0 and {}", kMaxGateTimeoutSeconds));
    run.gate_timeout_seconds = static_cast<int>(timeout);

    run.log_level = get_string(s, "log_level", "run.log_level", origin, run.log_level);
    if (!utils::Logger::level_from_string(run.log_level))
        config_error(origin, "run.log_level", fmt::format("unknown log level '{}'", run.log_level));
    run.log_file = get_string(s, "log_file", "run.log_file", origin, run.log_file);
}

void parse_trigger(const json &s, TriggerSettings &trigger, const std::string &origin)
{
    trigger.branch = get_string(s, "branch", "trigger.branch", origin, trigger.branch);
    trigger.events = get_string_array(s, "events", "trigger.events", origin, trigger.events);
    for (const auto &e : trigger.events)
    {
        if (e != "push" && e != "pull_request")
            config_error(origin, "trigger.events",
                         fmt::format("unknown event '{}' (must be 'push' or 'pull_request')", e));
    }
}

void parse_project(const json &s, ProjectSettings &project, const std::string &origin)
{
    project.source_dir = get_string(s, "source_dir", "project.source_dir", origin, project.source_dir);
    if (project.source_dir.empty())
        config_error(origin, "project.source_dir", "must not be empty");

    const std::string iso = get_string(s, "isolation", "project.isolation", origin,
                                       to_string(project.isolation));
    if (iso == "target_dir")
        project.isolation = Isolation::TargetDir;
    else if (iso == "copy")
        project.isolation = Isolation::Copy;
    else
        config_error(origin, "project.isolation",
                     fmt::format("invalid value '{}' (must be 'target_dir' or 'copy')", iso));
}

void parse_matrix(const json &s, MatrixSettings &matrix, const std::string &origin)
{
    if (const json *v = find_key(s, "toolchains"))
    {
        matrix.toolchains.clear();
        for (const auto &name : to_string_array(*v, "matrix.toolchains", origin))
        {
            const Toolchain t = require_toolchain(name, "matrix.toolchains", origin);
            if (std::find(matrix.toolchains.begin(), matrix.toolchains.end(), t) ==
                matrix.toolchains.end())
                matrix.toolchains.push_back(t);
        }
        if (matrix.toolchains.empty())
            config_error(origin, "matrix.toolchains", "must not be empty");
    }

    if (const json *v = find_key(s, "platforms"))
    {
        matrix.platforms.clear();
        if (v->is_array())
        {
            for (const auto &name : to_string_array(*v, "matrix.platforms", origin))
                matrix.platforms.push_back({require_platform(name, "matrix.platforms", origin), {}});
        }
        else if (v->is_object())
        {
            for (const auto &[name, body] : v->items())
            {
                const std::string path = "matrix.platforms." + name;
                PlatformSettings ps;
                ps.platform = require_platform(name, path, origin);
                if (!body.is_object())
                    config_error(origin, path, "must be an object");
                ps.runner = get_string_array(body, "runner", path + ".runner", origin, {});
                matrix.platforms.push_back(std::move(ps));
            }
        }
        else
        {
            config_error(origin, "matrix.platforms", "must be an object or an array");
        }
        std::sort(matrix.platforms.begin(), matrix.platforms.end(),
                  [](const auto &a, const auto &b) { return a.platform < b.platform; });
        matrix.platforms.erase(std::unique(matrix.platforms.begin(), matrix.platforms.end(),
                                           [](const auto &a, const auto &b)
                                           { return a.platform == b.platform; }),
                               matrix.platforms.end());
        if (matrix.platforms.empty())
            config_error(origin, "matrix.platforms", "must not be empty");
    }

    if (const json *v = find_key(s, "feature_sets"))
    {
        matrix.feature_sets.clear();
        if (v->is_array())
        {
            for (const auto &name : to_string_array(*v, "matrix.feature_sets", origin))
            {
                const FeatureSet f = require_feature_set(name, "matrix.feature_sets", origin);
                matrix.feature_sets.push_back({f, builtin_feature_args(f)});
            }
        }
        else if (v->is_object())
        {
            for (const auto &[name, args] : v->items())
            {
                const std::string path = "matrix.feature_sets." + name;
                const FeatureSet f = require_feature_set(name, path, origin);
                matrix.feature_sets.push_back({f, to_string_array(args, path, origin)});
            }
        }
        else
        {
            config_error(origin, "matrix.feature_sets", "must be an object or an array");
        }
        std::sort(matrix.feature_sets.begin(), matrix.feature_sets.end(),
                  [](const auto &a, const auto &b) { return a.feature_set < b.feature_set; });
        matrix.feature_sets.erase(std::unique(matrix.feature_sets.begin(),
                                              matrix.feature_sets.end(),
                                              [](const auto &a, const auto &b)
                                              { return a.feature_set == b.feature_set; }),
                                  matrix.feature_sets.end());
        if (matrix.feature_sets.empty())
            config_error(origin, "matrix.feature_sets", "must not be empty");
    }
}

void parse_steps(const json &s, StepSettings &steps, const std::string &origin)
{
    steps.format = get_string_array(s, "format", "steps.format", origin, steps.format);
    steps.lint = get_string_array(s, "lint", "steps.lint", origin, steps.lint);
    steps.compile = get_string_array(s, "compile", "steps.compile", origin, steps.compile);
    steps.test = get_string_array(s, "test", "steps.test", origin, steps.test);
    steps.test_failure_pattern = get_string(s, "test_failure_pattern", "steps.test_failure_pattern",
                                            origin, steps.test_failure_pattern);
    steps.lint_warning_pattern = get_string(s, "lint_warning_pattern", "steps.lint_warning_pattern",
                                            origin, steps.lint_warning_pattern);
}

FreestandingTarget parse_freestanding_target(const json &t, std::size_t index,
                                             const std::string &origin)
{
    const std::string path = fmt::format("freestanding[{}]", index);
    if (!t.is_object())
        config_error(origin, path, "must be an object");
    if (t.contains("test"))
        config_error(origin, path + ".test",
                     "freestanding targets are built only, never test-executed");

    FreestandingTarget target;
    target.triple = get_string(t, "triple", path + ".triple", origin, target.triple);
    if (target.triple.empty())
        config_error(origin, path + ".triple", "must not be empty");

    target.toolchain = require_toolchain(
        get_string(t, "toolchain", path + ".toolchain", origin, to_string(target.toolchain)),
        path + ".toolchain", origin);

    target.feature_set = require_feature_set(
        get_string(t, "feature_set", path + ".feature_set", origin, to_string(target.feature_set)),
        path + ".feature_set", origin);
    if (target.feature_set == FeatureSet::Default)
        config_error(origin, path + ".feature_set",
                     "the default feature set assumes an operating system; use 'alloc' or 'none'");

    target.build = get_string_array(t, "build", path + ".build", origin, default_build_command());
    return target;
}

void check_pattern(const std::string &pattern, const std::string &key, const std::string &origin)
{
    try
    {
        std::regex re(pattern);
        (void)re;
    }
    catch (const std::regex_error &e)
    {
        config_error(origin, key, fmt::format("invalid regular expression '{}': {}", pattern, e.what()));
    }
}

} // anonymous namespace

// ============================================================================
// Settings helpers
// ============================================================================

const char *to_string(Isolation i) noexcept
{
    switch (i)
    {
    case Isolation::TargetDir: return "target_dir";
    case Isolation::Copy: return "copy";
    }
    return "unknown";
}

bool TriggerSettings::applies(const std::optional<std::string> &event,
                              const std::optional<std::string> &branch_name) const
{
    if (!event)
        return true;
    if (std::find(events.begin(), events.end(), *event) == events.end())
        return false;
    return !branch_name || *branch_name == branch;
}

std::vector<Platform> MatrixSettings::platform_list() const
{
    std::vector<Platform> out;
    for (const auto &p : platforms)
        out.push_back(p.platform);
    return out;
}

std::vector<FeatureSet> MatrixSettings::feature_set_list() const
{
    std::vector<FeatureSet> out;
    for (const auto &f : feature_sets)
        out.push_back(f.feature_set);
    return out;
}

const PlatformSettings *MatrixSettings::find_platform(Platform p) const noexcept
{
    for (const auto &ps : platforms)
    {
        if (ps.platform == p)
            return &ps;
    }
    return nullptr;
}

std::vector<std::string> MatrixSettings::feature_args(FeatureSet f) const
{
    for (const auto &fs : feature_sets)
    {
        if (fs.feature_set == f)
            return fs.args;
    }
    return builtin_feature_args(f);
}

std::string FreestandingTarget::id() const
{
    return "freestanding-" + triple;
}

std::string FreestandingTarget::label() const
{
    return fmt::format("{}/{}", triple, to_string(feature_set));
}

// ============================================================================
// GateConfig
// ============================================================================

GateConfig GateConfig::defaults()
{
    GateConfig cfg;
    cfg.run.jobs = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    cfg.matrix.toolchains = all_toolchains();
    for (const auto p : all_platforms())
        cfg.matrix.platforms.push_back({p, {}});
    for (const auto f : all_feature_sets())
        cfg.matrix.feature_sets.push_back({f, builtin_feature_args(f)});

    cfg.steps.format = {"cargo", "+{toolchain}", "fmt", "--all", "--", "--check"};
    cfg.steps.lint = {"cargo", "+{toolchain}", "clippy", "--all-features", "--all-targets",
                      "--", "-D", "warnings"};
    cfg.steps.compile = {"cargo", "+{toolchain}", "test", "--no-run", "--verbose",
                         std::string(kFeatureArgsPlaceholder)};
    cfg.steps.test = {"cargo", "+{toolchain}", "test", "--verbose",
                      std::string(kFeatureArgsPlaceholder)};
    cfg.steps.test_failure_pattern = R"(^test (\S+) \.\.\. FAILED$)";
    cfg.steps.lint_warning_pattern = "^warning";

    FreestandingTarget thumb;
    thumb.build = default_build_command();
    cfg.freestanding.push_back(std::move(thumb));

    cfg.env = {{"CARGO_TERM_COLOR", "always"}, {"CARGO_TARGET_DIR", "{scratch}/target"}};
    return cfg;
}

GateConfig GateConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Gate config: cannot open file: " + path);

    json j;
    try
    {
        j = json::parse(f);
    }
    catch (const json::parse_error &e)
    {
        throw std::runtime_error("Gate config: JSON parse error in '" + path + "': " + e.what());
    }
    return from_json(j, path);
}

GateConfig GateConfig::from_json(const json &j, const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Gate config: top level of '" + origin + "' must be an object");

    static const char *const known_sections[] = {"run",   "trigger",      "project", "matrix",
                                                 "steps", "freestanding", "env"};
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const std::string &key = it.key();
        if (std::none_of(std::begin(known_sections), std::end(known_sections),
                         [&key](const char *k) { return key == k; }))
        {
            LOGGER_WARN("[config] '{}': ignoring unknown section '{}'", origin, key);
        }
    }

    GateConfig cfg = defaults();

    if (const json *s = section(j, "run", origin))
        parse_run(*s, cfg.run, origin);
    if (const json *s = section(j, "trigger", origin))
        parse_trigger(*s, cfg.trigger, origin);
    if (const json *s = section(j, "project", origin))
        parse_project(*s, cfg.project, origin);
    if (const json *s = section(j, "matrix", origin))
        parse_matrix(*s, cfg.matrix, origin);
    if (const json *s = section(j, "steps", origin))
        parse_steps(*s, cfg.steps, origin);

    if (const json *fs = find_key(j, "freestanding"))
    {
        if (!fs->is_array())
            config_error(origin, "freestanding", "must be an array of targets");
        cfg.freestanding.clear();
        for (std::size_t i = 0; i < fs->size(); ++i)
            cfg.freestanding.push_back(parse_freestanding_target((*fs)[i], i, origin));
    }

    if (const json *env = section(j, "env", origin))
    {
        cfg.env.clear();
        for (const auto &[key, value] : env->items())
        {
            if (!value.is_string())
                config_error(origin, "env." + key, "must be a string");
            cfg.env.emplace_back(key, value.get<std::string>());
        }
    }

    cfg.validate(origin);
    return cfg;
}

void GateConfig::validate(const std::string &origin) const
{
    if (run.jobs < 1)
        config_error(origin, "run.jobs", "must be at least 1");
    if (matrix.toolchains.empty())
        config_error(origin, "matrix.toolchains", "must not be empty");
    if (matrix.platforms.empty())
        config_error(origin, "matrix.platforms", "must not be empty");
    if (matrix.feature_sets.empty())
        config_error(origin, "matrix.feature_sets", "must not be empty");

    const auto where = [&](const std::string &key)
    { return fmt::format("'{}' in '{}'", key, origin); };

    validate_command_template(steps.format, where("steps.format"));
    validate_command_template(steps.lint, where("steps.lint"));
    validate_command_template(steps.compile, where("steps.compile"));
    validate_command_template(steps.test, where("steps.test"));
    for (std::size_t i = 0; i < freestanding.size(); ++i)
    {
        const auto key = fmt::format("freestanding[{}]", i);
        validate_command_template(freestanding[i].build, where(key + ".build"));
        if (freestanding[i].feature_set == FeatureSet::Default)
            config_error(origin, key + ".feature_set", "must not be 'default'");
    }
    for (const auto &[key, value] : env)
    {
        if (key.empty() || key.find('=') != std::string::npos)
            config_error(origin, "env", fmt::format("invalid variable name '{}'", key));
        validate_string_template(value, where("env." + key));
    }
    for (const auto &p : matrix.platforms)
    {
        for (const auto &arg : p.runner)
            validate_string_template(arg, where(fmt::format("matrix.platforms.{}.runner",
                                                            to_string(p.platform))));
    }

    check_pattern(steps.test_failure_pattern, "steps.test_failure_pattern", origin);
    check_pattern(steps.lint_warning_pattern, "steps.lint_warning_pattern", origin);
}

} // namespace cellgate::gate
