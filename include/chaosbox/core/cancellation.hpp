/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between a job task and callers
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <memory>

namespace chaosbox {
namespace core {

/**
 * @class CancellationToken
 * @brief One-way flag; once cancelled it stays cancelled
 *
 * **Thread Safety**: All methods are safe to call concurrently.
 */
class CancellationToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool IsCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace core
} // namespace chaosbox
