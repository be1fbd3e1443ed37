#pragma once

#include <cstdint>
#include <string>

namespace rangedl {

[[nodiscard]] std::string formatSize(std::uint64_t bytes);
[[nodiscard]] std::string formatSpeed(double bytes_per_second);
// "--:--" when unknown, MM:SS under an hour, HH:MM:SS beyond.
[[nodiscard]] std::string formatEta(std::uint64_t seconds);

} // namespace rangedl
