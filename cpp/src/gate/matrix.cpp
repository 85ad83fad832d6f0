/**
 * @file matrix.cpp
 * @brief Enum names, parsing and cross-product expansion of the verification matrix.
 */
#include "matrix.hpp"

#include "cgt_platform.hpp"

#include <fmt/format.h>

namespace cellgate::gate
{

const char *to_string(Toolchain t) noexcept
{
    switch (t)
    {
    case Toolchain::Stable: return "stable";
    case Toolchain::Beta: return "beta";
    case Toolchain::Nightly: return "nightly";
    }
    return "unknown";
}

const char *to_string(Platform p) noexcept
{
    switch (p)
    {
    case Platform::Linux: return "linux";
    case Platform::Windows: return "windows";
    }
    return "unknown";
}

const char *to_string(FeatureSet f) noexcept
{
    switch (f)
    {
    case FeatureSet::Default: return "default";
    case FeatureSet::None: return "none";
    case FeatureSet::Alloc: return "alloc";
    }
    return "unknown";
}

const char *to_string(Environment e) noexcept
{
    switch (e)
    {
    case Environment::FullStd: return "full-std";
    case Environment::Core: return "core";
    case Environment::CoreAlloc: return "core+alloc";
    case Environment::Freestanding: return "freestanding";
    }
    return "unknown";
}

std::optional<Toolchain> parse_toolchain(std::string_view name) noexcept
{
    if (name == "stable")  return Toolchain::Stable;
    if (name == "beta")    return Toolchain::Beta;
    if (name == "nightly") return Toolchain::Nightly;
    return std::nullopt;
}

std::optional<Platform> parse_platform(std::string_view name) noexcept
{
    if (name == "linux")   return Platform::Linux;
    if (name == "windows") return Platform::Windows;
    return std::nullopt;
}

std::optional<FeatureSet> parse_feature_set(std::string_view name) noexcept
{
    if (name == "default") return FeatureSet::Default;
    if (name == "none")    return FeatureSet::None;
    if (name == "alloc")   return FeatureSet::Alloc;
    return std::nullopt;
}

Environment environment_for(FeatureSet f) noexcept
{
    switch (f)
    {
    case FeatureSet::Default: return Environment::FullStd;
    case FeatureSet::None: return Environment::Core;
    case FeatureSet::Alloc: return Environment::CoreAlloc;
    }
    return Environment::FullStd;
}

std::optional<Platform> host_platform() noexcept
{
#if defined(CELLGATE_PLATFORM_WIN64)
    return Platform::Windows;
#elif defined(CELLGATE_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return std::nullopt;
#endif
}

const std::vector<Toolchain> &all_toolchains()
{
    static const std::vector<Toolchain> v{Toolchain::Stable, Toolchain::Beta, Toolchain::Nightly};
    return v;
}

const std::vector<Platform> &all_platforms()
{
    static const std::vector<Platform> v{Platform::Linux, Platform::Windows};
    return v;
}

const std::vector<FeatureSet> &all_feature_sets()
{
    static const std::vector<FeatureSet> v{FeatureSet::Default, FeatureSet::None,
                                           FeatureSet::Alloc};
    return v;
}

std::string BuildConfiguration::label() const
{
    if (feature_set)
        return fmt::format("{}/{}/{}", to_string(toolchain), to_string(platform),
                           to_string(*feature_set));
    return fmt::format("{}/{}", to_string(toolchain), to_string(platform));
}

std::string MatrixCell::id() const
{
    return fmt::format("{}-{}", to_string(toolchain), to_string(platform));
}

std::vector<MatrixCell> expand_cells(const std::vector<Toolchain> &toolchains,
                                     const std::vector<Platform> &platforms)
{
    std::vector<MatrixCell> cells;
    cells.reserve(toolchains.size() * platforms.size());
    for (const auto t : toolchains)
        for (const auto p : platforms)
            cells.push_back(MatrixCell{t, p});
    return cells;
}

} // namespace cellgate::gate
