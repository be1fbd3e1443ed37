#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rangedl {

struct ChunkInfo {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive
    std::uint64_t downloaded{0};
    bool completed{false};

    [[nodiscard]] std::uint64_t length() const {
        return start > end ? 0 : end - start + 1;
    }
};

struct TransferState {
    std::string url;
    std::string filepath;
    std::uint64_t total_size{0};
    std::vector<ChunkInfo> chunks;
    bool completed{false};
    double timestamp{0.0};
};

// Splits [0, total_size - 1] into `connections` contiguous chunks; the last
// chunk takes the remainder. Without range support, with one connection or
// with an unknown size a single chunk [0, max(total_size - 1, 0)] is returned.
[[nodiscard]] std::vector<ChunkInfo> planChunks(std::uint64_t total_size,
                                                bool accepts_ranges,
                                                int connections);

[[nodiscard]] std::uint64_t sumDownloaded(const std::vector<ChunkInfo>& chunks);

[[nodiscard]] bool allCompleted(const std::vector<ChunkInfo>& chunks);

} // namespace rangedl
