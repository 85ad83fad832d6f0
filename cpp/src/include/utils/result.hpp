/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool
 * - [[nodiscard]] prevents ignoring errors
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cellgate
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type
 * @tparam E Error enum type (should be an enum or enum class)
 *
 * Usage:
 * @code
 * Result<ProcessOutcome, SpawnError> r = ChildProcess::run(spec, cancel);
 * if (r.is_ok()) {
 *     int code = r.content().exit_code;
 * } else {
 *     SpawnError err = r.error();
 *     int os_errno = r.error_code();
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error enum value
     * @param code Optional detailed error code, e.g. errno (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @brief Get the error enum value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @brief Get the detailed error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace cellgate
