#pragma once

#include "download_status.hpp"
#include "http_transport.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rangedl {

struct DownloadTask {
    std::string id;
    std::string url;
    std::string filename;
    std::string filepath;
    int connections{8};
    int priority{1};
    std::uint64_t speed_limit{0};
    std::string referer;
    Headers extra_headers;
    std::string category{"Other"};

    DownloadStatus status{DownloadStatus::Queued};
    std::uint64_t total_size{0};
    std::uint64_t downloaded{0};
    double speed{0.0};
    std::uint64_t eta{0};
    std::string error_message;

    // Seconds since the epoch.
    double added_at{0.0};
    double started_at{0.0};
    double completed_at{0.0};
};

// Subset of row fields written by TaskStore::updateRow.
struct TaskUpdate {
    std::optional<DownloadStatus> status;
    std::optional<std::uint64_t> total_size;
    std::optional<std::uint64_t> downloaded;
    std::optional<std::string> error_message;
    std::optional<double> started_at;
    std::optional<double> completed_at;

    [[nodiscard]] bool empty() const {
        return !status && !total_size && !downloaded && !error_message && !started_at && !completed_at;
    }
};

} // namespace rangedl
