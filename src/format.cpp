#include "rangedl/format.hpp"

#include <fmt/format.h>

namespace rangedl {

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= TB) {
        return fmt::format("{:.1f} TB", value / TB);
    } else if (value >= GB) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (value >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (value >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatSpeed(double bytes_per_second) {
    if (bytes_per_second < 1.0) {
        return "0 B/s";
    }
    return fmt::format("{}/s", formatSize(static_cast<std::uint64_t>(bytes_per_second)));
}

std::string formatEta(std::uint64_t seconds) {
    if (seconds == 0) {
        return "--:--";
    }
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;
    if (hours > 0) {
        return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
    }
    return fmt::format("{:02}:{:02}", minutes, secs);
}

} // namespace rangedl
