#pragma once

#include "download_status.hpp"

#include <cstdint>
#include <string>

namespace rangedl {

struct Progress {
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    double speed_bps{0.0};
    std::uint64_t eta_seconds{0};
    DownloadStatus status{DownloadStatus::Queued};
    std::string error_message;
};

} // namespace rangedl
