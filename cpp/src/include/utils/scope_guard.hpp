#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace cellgate::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, normally or by exception.
 *
 * Movable, not copyable. A moved-from or dismissed guard does nothing.
 *
 * @code
 *  auto logger_guard = cellgate::basics::make_scope_guard(
 *      [] { cellgate::utils::Logger::instance().shutdown(); });
 *
 *  auto scratch_guard = cellgate::basics::make_scope_guard([&] {
 *      std::error_code ec;
 *      std::filesystem::remove_all(scratch_root, ec);
 *  });
 *  if (keep_scratch)
 *      scratch_guard.dismiss();
 * @endcode
 *
 * The destructor is noexcept: a callable that throws during scope exit terminates the
 * program. Cleanup callables must handle their own errors (e.g. with std::error_code
 * overloads). Use invoke_and_rethrow() when the caller needs to see a failure.
 *
 * Not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Deactivates the guard; the callable will not run.
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (if still active) and dismisses the guard.
     *        Exceptions propagate to the caller.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace cellgate::basics
