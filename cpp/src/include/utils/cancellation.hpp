#pragma once
/**
 * @file cancellation.hpp
 * @brief Run-wide cancellation flag shared by the scheduler and the process runner.
 *
 * `request()` only performs a lock-free atomic store, so it may be called from a
 * signal handler.
 */
#include <atomic>

namespace cellgate::utils
{

class CancellationToken
{
  public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void request() noexcept { requested_.store(true, std::memory_order_release); }

    [[nodiscard]] bool requested() const noexcept
    {
        return requested_.load(std::memory_order_acquire);
    }

  private:
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "CancellationToken::request() must be async-signal-safe");
    std::atomic<bool> requested_{false};
};

} // namespace cellgate::utils
