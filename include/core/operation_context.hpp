#pragma once

#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace mongoacl {

/**
 * @brief Caller-supplied cancellation context for one reconcile operation
 *
 * Every server command is preceded by check(). A cancelled or expired
 * context aborts before the next command; commands that already completed
 * are not rolled back.
 */
class OperationContext {
public:
    OperationContext() = default;
    explicit OperationContext(std::chrono::milliseconds timeout);

    OperationContext(const OperationContext&) = delete;
    OperationContext& operator=(const OperationContext&) = delete;

    /// Safe to call from a signal handler or another thread.
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_expired() const;

    /// Milliseconds left before the deadline, std::nullopt without a deadline.
    [[nodiscard]] std::optional<int64_t> remaining_ms() const;

    /// CANCELLED error naming `step` if the context is done, ok otherwise.
    [[nodiscard]] Status check(std::string_view step) const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace mongoacl
