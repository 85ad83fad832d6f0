/**
 * @file command_template.cpp
 * @brief Placeholder scanning, validation and expansion for step commands.
 */
#include "command_template.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace cellgate::gate
{

namespace
{

constexpr std::array<std::string_view, 7> kScalarPlaceholders = {
    "toolchain", "platform", "feature_set", "triple", "source_dir", "scratch", "cell"};

struct Placeholder
{
    std::size_t begin; ///< index of '{'
    std::size_t end;   ///< index one past '}'
    std::string_view name;
};

bool is_identifier(std::string_view s) noexcept
{
    if (s.empty())
        return false;
    for (const char c : s)
    {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_')
            return false;
    }
    return true;
}

std::optional<Placeholder> next_placeholder(std::string_view text, std::size_t from)
{
    while (from < text.size())
    {
        const auto open = text.find('{', from);
        if (open == std::string_view::npos)
            return std::nullopt;
        const auto close = text.find('}', open + 1);
        if (close == std::string_view::npos)
            return std::nullopt;
        const auto name = text.substr(open + 1, close - open - 1);
        if (is_identifier(name))
            return Placeholder{open, close + 1, name};
        from = open + 1;
    }
    return std::nullopt;
}

const std::string *scalar_value(std::string_view name, const TemplateContext &ctx) noexcept
{
    if (name == "toolchain")   return &ctx.toolchain;
    if (name == "platform")    return &ctx.platform;
    if (name == "feature_set") return &ctx.feature_set;
    if (name == "triple")      return &ctx.triple;
    if (name == "source_dir")  return &ctx.source_dir;
    if (name == "scratch")     return &ctx.scratch;
    if (name == "cell")        return &ctx.cell;
    return nullptr;
}

bool is_scalar_placeholder(std::string_view name) noexcept
{
    for (const auto known : kScalarPlaceholders)
    {
        if (known == name)
            return true;
    }
    return false;
}

void check_placeholders(std::string_view text, const std::string &where)
{
    std::size_t pos = 0;
    while (auto ph = next_placeholder(text, pos))
    {
        if (ph->name == "feature_args")
        {
            throw std::runtime_error(fmt::format(
                "Gate config: {}: '{{feature_args}}' must be a whole argument, found in '{}'",
                where, text));
        }
        if (!is_scalar_placeholder(ph->name))
        {
            throw std::runtime_error(fmt::format("Gate config: {}: unknown placeholder '{{{}}}'",
                                                 where, ph->name));
        }
        pos = ph->end;
    }
}

} // namespace

std::string expand_string(std::string_view text, const TemplateContext &ctx)
{
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (auto ph = next_placeholder(text, pos))
    {
        out.append(text.substr(pos, ph->begin - pos));
        if (const std::string *value = scalar_value(ph->name, ctx))
            out.append(*value);
        else
            out.append(text.substr(ph->begin, ph->end - ph->begin));
        pos = ph->end;
    }
    out.append(text.substr(pos));
    return out;
}

std::vector<std::string> expand_command(const CommandTemplate &tmpl, const TemplateContext &ctx)
{
    std::vector<std::string> argv;
    argv.reserve(tmpl.size() + ctx.feature_args.size());
    for (const auto &arg : tmpl)
    {
        if (arg == kFeatureArgsPlaceholder)
        {
            argv.insert(argv.end(), ctx.feature_args.begin(), ctx.feature_args.end());
            continue;
        }
        argv.push_back(expand_string(arg, ctx));
    }
    return argv;
}

void validate_command_template(const CommandTemplate &tmpl, const std::string &where)
{
    if (tmpl.empty())
        throw std::runtime_error(fmt::format("Gate config: {}: command is empty", where));
    if (tmpl.front() == kFeatureArgsPlaceholder || tmpl.front().empty())
        throw std::runtime_error(
            fmt::format("Gate config: {}: first argument must name a program", where));

    for (const auto &arg : tmpl)
    {
        if (arg == kFeatureArgsPlaceholder)
            continue;
        check_placeholders(arg, where);
    }
}

void validate_string_template(std::string_view text, const std::string &where)
{
    check_placeholders(text, where);
}

} // namespace cellgate::gate
