#pragma once
/**
 * @file command_template.hpp
 * @brief argv templates with `{placeholder}` substitution.
 *
 * Recognised placeholders: `{toolchain}`, `{platform}`, `{feature_set}`, `{triple}`,
 * `{source_dir}`, `{scratch}`, `{cell}` (substituted inside any argument) and
 * `{feature_args}`, which must be a whole argument and is spliced into zero or more
 * arguments.
 *
 * Only `{identifier}` sequences are placeholders; other braces are literal text.
 */

#include <string>
#include <string_view>
#include <vector>

namespace cellgate::gate
{

using CommandTemplate = std::vector<std::string>;

/// Values substituted into a template for one step.
struct TemplateContext
{
    std::string toolchain;
    std::string platform;
    std::string feature_set;
    std::string triple;
    std::string source_dir;
    std::string scratch;
    std::string cell;
    std::vector<std::string> feature_args;
};

inline constexpr std::string_view kFeatureArgsPlaceholder = "{feature_args}";

/// Substitutes the scalar placeholders in @p text.
std::string expand_string(std::string_view text, const TemplateContext &ctx);

/// Expands every argument, splicing `{feature_args}` elements.
std::vector<std::string> expand_command(const CommandTemplate &tmpl, const TemplateContext &ctx);

/**
 * @brief Checks that @p tmpl is non-empty and uses only known placeholders.
 * @param where Used in the error message, e.g. "'steps.compile' in 'ci.json'".
 * @throws std::runtime_error naming @p where and the offending placeholder.
 */
void validate_command_template(const CommandTemplate &tmpl, const std::string &where);

/**
 * @brief Checks a single string (an env value) for unknown placeholders.
 *        `{feature_args}` is not allowed here.
 * @throws std::runtime_error naming @p where.
 */
void validate_string_template(std::string_view text, const std::string &where);

} // namespace cellgate::gate
