#pragma once
/**
 * @file matrix.hpp
 * @brief Verification matrix: toolchains × platforms × feature sets, plus the
 *        environment each feature set stands for.
 *
 * The matrix is a cross product over explicit enumerated sets. Filters narrow the
 * sets before expansion; they never branch on cell contents. Adding a value to a
 * dimension is a configuration change.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cellgate::gate
{

enum class Toolchain
{
    Stable,
    Beta,
    Nightly
};

enum class Platform
{
    Linux,
    Windows
};

/// Closed set of feature configurations. `None` and `Alloc` are both "no default
/// features"; `Alloc` adds the `alloc` feature. Neither is combined with `Default`.
enum class FeatureSet
{
    Default,
    None,
    Alloc
};

/// The environment a failing feature configuration regresses.
enum class Environment
{
    FullStd,      ///< default features
    Core,         ///< no default features
    CoreAlloc,    ///< no default features + alloc
    Freestanding  ///< no OS at all
};

const char *to_string(Toolchain t) noexcept;
const char *to_string(Platform p) noexcept;
const char *to_string(FeatureSet f) noexcept;
const char *to_string(Environment e) noexcept;

std::optional<Toolchain> parse_toolchain(std::string_view name) noexcept;
std::optional<Platform> parse_platform(std::string_view name) noexcept;
std::optional<FeatureSet> parse_feature_set(std::string_view name) noexcept;

Environment environment_for(FeatureSet f) noexcept;

/// The platform this binary was compiled for, or std::nullopt for hosts outside
/// the matrix (macOS, BSD).
std::optional<Platform> host_platform() noexcept;

const std::vector<Toolchain> &all_toolchains();
const std::vector<Platform> &all_platforms();
const std::vector<FeatureSet> &all_feature_sets();

/**
 * @struct BuildConfiguration
 * @brief One (toolchain, platform[, feature set]) combination.
 *
 * The static gate's configuration has no feature set; lint runs with all features.
 */
struct BuildConfiguration
{
    Toolchain toolchain{Toolchain::Stable};
    Platform platform{Platform::Linux};
    std::optional<FeatureSet> feature_set;

    /// "stable/linux" or "stable/linux/alloc".
    [[nodiscard]] std::string label() const;

    bool operator==(const BuildConfiguration &) const = default;
};

/// One (toolchain, platform) pair. Each hosted cell runs the static gate and one
/// test gate per feature set.
struct MatrixCell
{
    Toolchain toolchain{Toolchain::Stable};
    Platform platform{Platform::Linux};

    /// Filesystem-safe id, e.g. "stable-linux".
    [[nodiscard]] std::string id() const;

    [[nodiscard]] BuildConfiguration configuration(std::optional<FeatureSet> fs = std::nullopt) const
    {
        return BuildConfiguration{toolchain, platform, fs};
    }

    bool operator==(const MatrixCell &) const = default;
};

/// Restricts the dimensions; an empty vector means "no restriction".
struct MatrixFilter
{
    std::vector<Toolchain> toolchains;
    std::vector<Platform> platforms;
    std::vector<FeatureSet> feature_sets;
};

/// Keeps the members of @p values that @p allowed names (all of them if @p allowed is
/// empty), preserving the order of @p values.
template <typename T>
std::vector<T> apply_filter(const std::vector<T> &values, const std::vector<T> &allowed)
{
    if (allowed.empty())
        return values;
    std::vector<T> out;
    for (const auto &v : values)
    {
        for (const auto &a : allowed)
        {
            if (a == v)
            {
                out.push_back(v);
                break;
            }
        }
    }
    return out;
}

/// Cross product in toolchain-major order.
std::vector<MatrixCell> expand_cells(const std::vector<Toolchain> &toolchains,
                                     const std::vector<Platform> &platforms);

} // namespace cellgate::gate
