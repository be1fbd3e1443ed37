#include "rangedl/chunk_info.hpp"

#include <algorithm>
#include <numeric>

namespace rangedl {

std::vector<ChunkInfo> planChunks(std::uint64_t total_size, bool accepts_ranges, int connections) {
    std::vector<ChunkInfo> chunks;

    const auto count = static_cast<std::uint64_t>(std::max(1, connections));
    if (total_size == 0 || !accepts_ranges || count == 1 || total_size < count) {
        ChunkInfo single;
        single.end = total_size > 0 ? total_size - 1 : 0;
        chunks.push_back(single);
        return chunks;
    }

    const std::uint64_t chunk_size = total_size / count;
    chunks.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        ChunkInfo chunk;
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.start = i * chunk_size;
        chunk.end = (i + 1 < count) ? chunk.start + chunk_size - 1 : total_size - 1;
        chunks.push_back(chunk);
    }
    return chunks;
}

std::uint64_t sumDownloaded(const std::vector<ChunkInfo>& chunks) {
    return std::accumulate(chunks.begin(), chunks.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const ChunkInfo& chunk) { return sum + chunk.downloaded; });
}

bool allCompleted(const std::vector<ChunkInfo>& chunks) {
    return std::all_of(chunks.begin(), chunks.end(), [](const ChunkInfo& chunk) { return chunk.completed; });
}

} // namespace rangedl
