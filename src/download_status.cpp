#include "rangedl/download_status.hpp"

#include <array>
#include <utility>

namespace rangedl {

namespace {

constexpr std::array<std::pair<DownloadStatus, std::string_view>, 7> kStatusNames{{
    {DownloadStatus::Queued, "Queued"},
    {DownloadStatus::Downloading, "Downloading"},
    {DownloadStatus::Paused, "Paused"},
    {DownloadStatus::Stopped, "Stopped"},
    {DownloadStatus::Error, "Error"},
    {DownloadStatus::Merging, "Merging"},
    {DownloadStatus::Completed, "Completed"},
}};

} // namespace

std::string_view toString(DownloadStatus status) {
    for (const auto& [value, name] : kStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<DownloadStatus> statusFromString(std::string_view text) {
    for (const auto& [value, name] : kStatusNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

bool isFinished(DownloadStatus status) {
    return status == DownloadStatus::Completed || status == DownloadStatus::Error ||
           status == DownloadStatus::Stopped;
}

} // namespace rangedl
