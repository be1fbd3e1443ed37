#include "rangedl/transfer_control.hpp"

#include <algorithm>
#include <thread>

namespace rangedl {

bool TransferControl::waitWhilePaused() const {
    while (paused_.load()) {
        if (cancelled_.load()) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval_);
    }
    return !cancelled_.load();
}

bool TransferControl::sleepFor(std::chrono::milliseconds duration) const {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancelled_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, poll_interval_));
    }
    return false;
}

} // namespace rangedl
