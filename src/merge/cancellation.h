#pragma once

#include <atomic>

namespace Braid {

/**
 * Cooperative cancellation flag shared by the caller, the workers and the writer loop.
 * A token built with a parent also reports cancelled once the parent is.
 * Cancel() is a single lock-free store and may be called from a signal handler.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(const CancellationToken* parent) : parent_(parent) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel() { cancelled_.store(true, std::memory_order_release); }

    bool IsCancelled() const {
        if (cancelled_.load(std::memory_order_acquire)) return true;
        return parent_ != nullptr && parent_->IsCancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
    const CancellationToken* parent_ = nullptr;
};

} // namespace Braid
