#pragma once

#include "chunk_info.hpp"
#include "http_transport.hpp"
#include "transfer_control.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace rangedl {

using ByteProgressCallback = std::function<void(std::uint64_t bytes)>;

// Waits out a retry delay; returns false when the transfer was cancelled.
using BackoffWaiter = std::function<bool(std::chrono::seconds delay, const TransferControl& control)>;

struct ChunkWorkerOptions {
    std::string url;
    std::filesystem::path temp_dir;
    Headers headers;
    std::string proxy;
    bool size_known{true};
    bool single_stream{false};
    std::uint64_t max_bytes_per_second{0};
    int max_attempts{5};
    BackoffWaiter backoff;
};

// Downloads one chunk into temp_dir/chunk_<index>.part. `chunk` is shared with
// the owning session and only touched under `chunk_mutex`.
class ChunkWorker {
public:
    ChunkWorker(HttpTransport& transport,
                ChunkInfo& chunk,
                std::mutex& chunk_mutex,
                const TransferControl& control,
                ChunkWorkerOptions options,
                ByteProgressCallback on_progress);

    void run();

    // True when the last attempt failed and the chunk is not complete.
    [[nodiscard]] bool hasError() const;
    [[nodiscard]] const std::string& error() const { return error_; }
    [[nodiscard]] std::uint32_t index() const { return index_; }

    [[nodiscard]] static std::filesystem::path chunkPath(const std::filesystem::path& temp_dir,
                                                         std::uint32_t index);
    [[nodiscard]] static std::chrono::seconds backoffDelay(int attempt);

private:
    bool runAttempt(int attempt);
    bool waitBackoff(std::chrono::seconds delay) const;
    void markCompleted();
    [[nodiscard]] bool isCompleted() const;

    HttpTransport& transport_;
    ChunkInfo& chunk_;
    std::mutex& chunk_mutex_;
    const TransferControl& control_;
    ChunkWorkerOptions options_;
    ByteProgressCallback on_progress_;
    std::uint32_t index_;
    std::string error_;
};

} // namespace rangedl
