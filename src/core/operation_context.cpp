#include "core/operation_context.hpp"

#include <format>

namespace mongoacl {

OperationContext::OperationContext(std::chrono::milliseconds timeout)
    : deadline_(std::chrono::steady_clock::now() + timeout) {}

bool OperationContext::is_expired() const {
    return deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_;
}

std::optional<int64_t> OperationContext::remaining_ms() const {
    if (!deadline_) return std::nullopt;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - std::chrono::steady_clock::now());
    return left.count() > 0 ? left.count() : 0;
}

Status OperationContext::check(std::string_view step) const {
    if (is_cancelled()) {
        return Status::error(ErrorCategory::CANCELLED,
            std::format("operation cancelled before {}", step));
    }
    if (is_expired()) {
        return Status::error(ErrorCategory::CANCELLED,
            std::format("deadline exceeded before {}", step));
    }
    return Status::ok();
}

} // namespace mongoacl
