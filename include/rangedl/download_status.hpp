#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rangedl {

enum class DownloadStatus {
    Queued,
    Downloading,
    Paused,
    Stopped,
    Error,
    Merging,
    Completed
};

[[nodiscard]] std::string_view toString(DownloadStatus status);

// Parses the names produced by toString(); anything else yields nullopt.
[[nodiscard]] std::optional<DownloadStatus> statusFromString(std::string_view text);

// Completed, Error and Stopped tasks have no running session behind them.
[[nodiscard]] bool isFinished(DownloadStatus status);

} // namespace rangedl
