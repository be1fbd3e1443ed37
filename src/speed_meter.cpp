#include "rangedl/speed_meter.hpp"

#include <algorithm>

namespace rangedl {

namespace {
// Floor for the elapsed window so the first samples cannot blow up the rate.
constexpr double kMinWindowSeconds = 0.01;
} // namespace

void SpeedMeter::addSample(Clock::time_point now, std::uint64_t bytes) {
    samples_.emplace_back(now, bytes);

    const auto cutoff = now - window_;
    while (!samples_.empty() && samples_.front().first < cutoff) {
        samples_.pop_front();
    }

    std::uint64_t bytes_in_window = 0;
    for (const auto& sample : samples_) {
        bytes_in_window += sample.second;
    }

    double elapsed = 1.0;
    if (samples_.size() > 1) {
        elapsed = std::chrono::duration<double>(now - samples_.front().first).count();
    }
    speed_ = static_cast<double>(bytes_in_window) / std::max(elapsed, kMinWindowSeconds);
}

void SpeedMeter::reset() {
    samples_.clear();
    speed_ = 0.0;
}

std::uint64_t SpeedMeter::eta(std::uint64_t total, std::uint64_t downloaded, double speed) {
    if (speed <= 0.0) {
        return 0;
    }
    const std::uint64_t remaining = total > downloaded ? total - downloaded : 0;
    return static_cast<std::uint64_t>(static_cast<double>(remaining) / speed);
}

} // namespace rangedl
