#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <utility>

namespace rangedl {

// Sliding-window throughput estimate over (timestamp, bytes) samples.
// Not synchronized; the owning session guards it with its state mutex.
class SpeedMeter {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedMeter(std::chrono::milliseconds window = std::chrono::seconds(3))
        : window_(window) {}

    // Records `bytes` received since the previous sample, evicts samples older
    // than the window and recomputes the speed.
    void addSample(Clock::time_point now, std::uint64_t bytes);

    [[nodiscard]] double bytesPerSecond() const { return speed_; }

    [[nodiscard]] std::size_t sampleCount() const { return samples_.size(); }

    void reset();

    // Seconds left for `remaining` bytes at `speed`; 0 when the speed is 0.
    [[nodiscard]] static std::uint64_t eta(std::uint64_t total, std::uint64_t downloaded, double speed);

private:
    std::chrono::milliseconds window_;
    std::deque<std::pair<Clock::time_point, std::uint64_t>> samples_;
    double speed_{0.0};
};

} // namespace rangedl
