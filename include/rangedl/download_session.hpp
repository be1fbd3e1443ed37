#pragma once

#include "chunk_info.hpp"
#include "chunk_worker.hpp"
#include "download_status.hpp"
#include "http_transport.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rangedl {

using ProgressCallback = std::function<void(std::uint64_t downloaded_bytes,
                                            std::uint64_t total_bytes,
                                            double speed_bps,
                                            std::uint64_t eta_seconds)>;
using StatusCallback = std::function<void(DownloadStatus status)>;

struct SessionTuning {
    std::chrono::milliseconds state_save_interval{3000};
    std::chrono::milliseconds supervise_interval{500};
    std::chrono::milliseconds notify_interval{200};
    std::chrono::milliseconds speed_window{3000};
    std::chrono::milliseconds poll_interval{200};
    int max_attempts{5};
    BackoffWaiter backoff; // empty: cancellable sleep
};

struct SessionOptions {
    std::string url;
    std::filesystem::path filepath;
    int connections{8};
    Headers headers;
    std::string proxy;
    std::uint64_t speed_limit{0}; // bytes/s for the whole task, 0 = unlimited
    SessionTuning tuning;
};

// One file transfer: probe, chunk planning or resume, concurrent chunk
// workers, merge and cleanup. Callbacks run on whichever thread triggers them,
// one at a time; they may call pause(), resume() or stopAndSave() on the
// session, but must not wait for another thread that does.
class DownloadSession {
public:
    static constexpr int kMinConnections = 1;
    static constexpr int kMaxConnections = 32;

    DownloadSession(std::shared_ptr<HttpTransport> transport,
                    SessionOptions options,
                    ProgressCallback on_progress = {},
                    StatusCallback on_status_change = {});
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    // Blocks until the transfer completes, fails or is cancelled. A session
    // runs once; later calls return immediately.
    void run();

    void pause();
    void resume();
    void cancel();
    // Cancel whose intent is a later resume from the saved state.
    void stopAndSave();

    [[nodiscard]] Progress getProgress() const;
    [[nodiscard]] DownloadStatus status() const;
    [[nodiscard]] std::string errorMessage() const;
    [[nodiscard]] std::string url() const;
    [[nodiscard]] std::vector<ChunkInfo> chunks() const;
    [[nodiscard]] const std::filesystem::path& filepath() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangedl
