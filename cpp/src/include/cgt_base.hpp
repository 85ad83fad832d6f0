#pragma once
/**
 * @file cgt_base.hpp
 * @brief Layer 1: Basic modules built on cgt_platform.
 *
 * Provides format_tools, scope_guard and the Result<T, E> type.
 * Include this when you need formatting or basic RAII guards.
 */
#include "cgt_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
