#include "rangedl/chunk_worker.hpp"
#include "rangedl/detail/file_handle.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangedl {

ChunkWorker::ChunkWorker(HttpTransport& transport,
                         ChunkInfo& chunk,
                         std::mutex& chunk_mutex,
                         const TransferControl& control,
                         ChunkWorkerOptions options,
                         ByteProgressCallback on_progress)
    : transport_(transport),
      chunk_(chunk),
      chunk_mutex_(chunk_mutex),
      control_(control),
      options_(std::move(options)),
      on_progress_(std::move(on_progress)),
      index_(chunk.index) {}

std::filesystem::path ChunkWorker::chunkPath(const std::filesystem::path& temp_dir, std::uint32_t index) {
    return temp_dir / fmt::format("chunk_{}.part", index);
}

std::chrono::seconds ChunkWorker::backoffDelay(int attempt) {
    return std::chrono::seconds{1LL << std::max(attempt, 0)};
}

void ChunkWorker::run() {
    {
        std::lock_guard<std::mutex> lock(chunk_mutex_);
        if (chunk_.completed) {
            return;
        }
        if (chunk_.start > chunk_.end) {
            chunk_.completed = true;
            return;
        }
    }

    const int max_attempts = std::max(1, options_.max_attempts);
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (control_.isCancelled() || !control_.waitWhilePaused()) {
            return;
        }

        if (runAttempt(attempt)) {
            error_.clear();
            return;
        }

        if (control_.isCancelled()) {
            return;
        }

        spdlog::warn("Chunk {} attempt {}/{} failed: {}", index_, attempt, max_attempts, error_);
        if (attempt < max_attempts && !waitBackoff(backoffDelay(attempt))) {
            return;
        }
    }

    spdlog::error("Chunk {} gave up after {} attempts: {}", index_, max_attempts, error_);
}

bool ChunkWorker::hasError() const {
    return !error_.empty() && !isCompleted();
}

bool ChunkWorker::runAttempt(int attempt) {
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t downloaded = 0;
    {
        std::lock_guard<std::mutex> lock(chunk_mutex_);
        start = chunk_.start;
        end = chunk_.end;
        downloaded = chunk_.downloaded;
    }

    const std::uint64_t length = end - start + 1;
    const std::filesystem::path path = chunkPath(options_.temp_dir, index_);
    const bool append = downloaded > 0 || attempt > 1;
    if (append) {
        // The recorded count and the file only agree at the last flush: bytes
        // past the count are dropped, and a shorter file moves the count back.
        std::error_code ec;
        std::uint64_t on_disk = std::filesystem::file_size(path, ec);
        if (ec) {
            on_disk = 0;
        }
        if (on_disk > downloaded) {
            std::filesystem::resize_file(path, downloaded, ec);
            if (ec) {
                error_ = fmt::format("Cannot truncate chunk file {}: {}", path.string(), ec.message());
                return false;
            }
        } else if (on_disk < downloaded) {
            spdlog::warn("Chunk {} file holds {} of {} recorded bytes, resuming from the file",
                         index_, on_disk, downloaded);
            downloaded = on_disk;
            std::lock_guard<std::mutex> lock(chunk_mutex_);
            chunk_.downloaded = on_disk;
        }
    }
    if (options_.size_known && downloaded >= length) {
        markCompleted();
        return true;
    }

    detail::FilePtr file{std::fopen(path.c_str(), append ? "ab" : "wb")};
    if (!file) {
        error_ = fmt::format("Cannot open chunk file {}", path.string());
        return false;
    }

    RangeRequest request;
    request.url = options_.url;
    request.headers = options_.headers;
    request.proxy = options_.proxy;
    request.offset = start + downloaded;
    if (options_.size_known) {
        request.last_byte = end;
    }
    request.max_bytes_per_second = options_.max_bytes_per_second;

    long status = 0;
    std::uint64_t skip = 0;
    bool write_failed = false;

    FetchHandlers handlers;
    handlers.on_response = [&](long code) {
        status = code;
        if (!isAcceptedRangeStatus(code)) {
            return false;
        }
        if (code == 200) {
            // The server sent the whole resource.
            if (!options_.single_stream) {
                return false;
            }
            skip = request.offset;
        }
        return true;
    };
    handlers.on_data = [&](const char* data, std::size_t size) {
        if (control_.isCancelled() || !control_.waitWhilePaused()) {
            return false;
        }

        if (skip > 0) {
            const auto dropped = static_cast<std::size_t>(std::min<std::uint64_t>(skip, size));
            data += dropped;
            size -= dropped;
            skip -= dropped;
            if (size == 0) {
                return true;
            }
        }

        std::size_t to_write = size;
        bool full = false;
        if (options_.size_known) {
            const std::uint64_t remaining = length - downloaded;
            if (to_write > remaining) {
                // Extra body bytes past the chunk end are dropped.
                to_write = static_cast<std::size_t>(remaining);
                full = true;
            }
        }

        if (to_write > 0) {
            const std::size_t written = std::fwrite(data, 1, to_write, file.get());
            if (written != to_write) {
                write_failed = true;
                return false;
            }
            downloaded += written;
            {
                std::lock_guard<std::mutex> lock(chunk_mutex_);
                chunk_.downloaded += written;
            }
            if (on_progress_) {
                on_progress_(written);
            }
        }
        return !full;
    };
    handlers.should_abort = [this] { return control_.isCancelled(); };

    const FetchResult result = transport_.fetch(request, handlers);
    if (std::fflush(file.get()) != 0) {
        write_failed = true;
    }
    file.reset();

    if (control_.isCancelled()) {
        return false;
    }
    if (status == 0) {
        status = result.status_code;
    }

    if (write_failed) {
        error_ = fmt::format("Failed to write chunk file {}", path.string());
    } else if (!result.transport_ok) {
        error_ = fmt::format("curl error: {}", result.error_message);
    } else if (!isAcceptedRangeStatus(status)) {
        error_ = fmt::format("HTTP {}", status);
    } else if (status == 200 && !options_.single_stream) {
        error_ = "Server ignored range request";
    } else if (options_.size_known && downloaded < length) {
        error_ = fmt::format("Range download incomplete ({}/{} bytes)", downloaded, length);
    } else {
        markCompleted();
        return true;
    }
    return false;
}

bool ChunkWorker::waitBackoff(std::chrono::seconds delay) const {
    if (options_.backoff) {
        return options_.backoff(delay, control_);
    }
    return control_.sleepFor(delay);
}

void ChunkWorker::markCompleted() {
    std::lock_guard<std::mutex> lock(chunk_mutex_);
    chunk_.completed = true;
}

bool ChunkWorker::isCompleted() const {
    std::lock_guard<std::mutex> lock(chunk_mutex_);
    return chunk_.completed;
}

} // namespace rangedl
