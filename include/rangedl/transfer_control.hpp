#pragma once

#include <atomic>
#include <chrono>

namespace rangedl {

// Cooperative pause/cancel signals owned by one session and shared with its
// workers. Every wait polls the cancel flag at `poll_interval`.
class TransferControl {
public:
    explicit TransferControl(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200))
        : poll_interval_(poll_interval) {}

    TransferControl(const TransferControl&) = delete;
    TransferControl& operator=(const TransferControl&) = delete;

    void cancel() {
        cancelled_.store(true);
        paused_.store(false);
    }
    void pause() { paused_.store(true); }
    void resume() { paused_.store(false); }

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }
    [[nodiscard]] bool isPaused() const { return paused_.load(); }

    // Blocks while paused. Returns false if cancelled before or during the wait.
    bool waitWhilePaused() const;

    // Sleeps for `duration`. Returns false if cancelled before it elapsed.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> paused_{false};
};

} // namespace rangedl
