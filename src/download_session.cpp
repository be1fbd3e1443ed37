#include "rangedl/download_session.hpp"
#include "rangedl/detail/file_handle.hpp"
#include "rangedl/speed_meter.hpp"
#include "rangedl/state_store.hpp"
#include "rangedl/transfer_control.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangedl {

namespace {

constexpr std::size_t kMergeBufferSize = 1024 * 1024;

double epochSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

class DownloadSession::Impl {
public:
    Impl(std::shared_ptr<HttpTransport> transport,
         SessionOptions options,
         ProgressCallback on_progress,
         StatusCallback on_status_change)
        : transport_(std::move(transport)),
          url_(std::move(options.url)),
          filepath_(std::move(options.filepath)),
          temp_dir_(StateStore::tempDirFor(filepath_)),
          connections_(std::clamp(options.connections, kMinConnections, kMaxConnections)),
          headers_(std::move(options.headers)),
          proxy_(std::move(options.proxy)),
          speed_limit_(options.speed_limit),
          tuning_(std::move(options.tuning)),
          on_progress_(std::move(on_progress)),
          on_status_change_(std::move(on_status_change)),
          state_store_(filepath_),
          control_(tuning_.poll_interval),
          speed_meter_(tuning_.speed_window) {
        if (!transport_) {
            throw std::invalid_argument("DownloadSession requires a transport");
        }
    }

    void run() {
        if (started_.exchange(true)) {
            spdlog::warn("Session for {} already ran", filepath_.string());
            return;
        }

        // pause() may land before the session thread gets here.
        setStatus(control_.isPaused() ? DownloadStatus::Paused : DownloadStatus::Downloading);

        std::error_code ec;
        std::filesystem::create_directories(temp_dir_, ec);
        if (ec) {
            fail(fmt::format("Cannot create temp directory {}: {}", temp_dir_.string(), ec.message()));
            return;
        }

        prepareChunks();

        const bool chunks_ok = runChunks();
        if (control_.isCancelled()) {
            spdlog::info("{} {}, partial state kept", filepath_.string(),
                         stop_requested_.load() ? "stopped" : "cancelled");
            setStatus(DownloadStatus::Stopped);
            return;
        }
        if (!chunks_ok) {
            fail(errorMessage().empty() ? std::string{"Download incomplete"} : errorMessage());
            return;
        }

        setStatus(DownloadStatus::Merging);
        try {
            mergeChunks();
        } catch (const std::exception& ex) {
            fail(fmt::format("Merge failed: {}", ex.what()));
            return;
        }
        cleanup();

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (total_bytes_ == 0) {
                total_bytes_ = downloaded_bytes_;
            }
            speed_ = 0.0;
            eta_ = 0;
        }
        notifyProgress();
        spdlog::info("Completed {} ({} bytes)", filepath_.string(), getProgress().total_bytes);
        setStatus(DownloadStatus::Completed);
    }

    void pause() {
        const DownloadStatus current = status();
        if (isFinished(current) || current == DownloadStatus::Merging) {
            return;
        }
        control_.pause();
        setStatus(DownloadStatus::Paused);
    }

    void resume() {
        control_.resume();
        if (status() == DownloadStatus::Paused) {
            setStatus(DownloadStatus::Downloading);
        }
    }

    void cancel() {
        control_.cancel();
    }

    void stopAndSave() {
        stop_requested_.store(true);
        control_.cancel();
    }

    [[nodiscard]] Progress getProgress() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return {total_bytes_, downloaded_bytes_, speed_, eta_, status_, error_message_};
    }

    [[nodiscard]] DownloadStatus status() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return status_;
    }

    [[nodiscard]] std::string errorMessage() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return error_message_;
    }

    [[nodiscard]] std::string url() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return url_;
    }

    [[nodiscard]] std::vector<ChunkInfo> chunks() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return chunks_;
    }

    [[nodiscard]] const std::filesystem::path& filepath() const { return filepath_; }

private:
    void prepareChunks() {
        const std::string requested_url = url();
        auto state = state_store_.load();
        if (state && state->url == requested_url && !state->completed) {
            for (auto& chunk : state->chunks) {
                reconcileWithDisk(chunk);
            }
            const std::uint64_t downloaded = sumDownloaded(state->chunks);
            spdlog::info("Resuming {} ({}/{} bytes, {} chunks)", filepath_.string(),
                         downloaded, state->total_size, state->chunks.size());

            std::lock_guard<std::mutex> lock(state_mutex_);
            total_bytes_ = state->total_size;
            chunks_ = std::move(state->chunks);
            downloaded_bytes_ = downloaded;
            return;
        }

        ProbeResult probe = transport_->probe(requested_url, headers_, proxy_);
        if (!probe.ok) {
            spdlog::warn("Probe failed for {}, falling back to a single connection", requested_url);
            probe.content_length = 0;
            probe.accepts_ranges = false;
        }

        std::vector<ChunkInfo> planned = planChunks(probe.content_length, probe.accepts_ranges, connections_);
        spdlog::info("Starting {} ({} bytes, {} chunks)", filepath_.string(), probe.content_length, planned.size());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (probe.ok && !probe.final_url.empty()) {
                url_ = probe.final_url;
            }
            total_bytes_ = probe.content_length;
            chunks_ = std::move(planned);
            downloaded_bytes_ = 0;
        }
        saveState();
    }

    // A crash can leave the saved count ahead of what reached the chunk file.
    void reconcileWithDisk(ChunkInfo& chunk) const {
        if (chunk.downloaded == 0) {
            return;
        }
        std::error_code ec;
        std::uint64_t on_disk = std::filesystem::file_size(ChunkWorker::chunkPath(temp_dir_, chunk.index), ec);
        if (ec) {
            on_disk = 0;
        }
        if (on_disk < chunk.downloaded) {
            spdlog::warn("Chunk {} of {} holds {} of {} recorded bytes", chunk.index, filepath_.string(),
                         on_disk, chunk.downloaded);
            chunk.downloaded = on_disk;
            chunk.completed = false;
        }
    }

    bool runChunks() {
        std::vector<std::unique_ptr<ChunkWorker>> workers;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            const bool size_known = total_bytes_ > 0;
            const bool single_stream = chunks_.size() == 1;
            const auto pending = static_cast<std::uint64_t>(
                std::count_if(chunks_.begin(), chunks_.end(), [](const ChunkInfo& c) { return !c.completed; }));

            for (auto& chunk : chunks_) {
                if (chunk.completed) {
                    continue;
                }

                ChunkWorkerOptions options;
                options.url = url_;
                options.temp_dir = temp_dir_;
                options.headers = headers_;
                options.proxy = proxy_;
                options.size_known = size_known;
                options.single_stream = single_stream;
                options.max_bytes_per_second = speed_limit_ > 0 ? std::max<std::uint64_t>(1, speed_limit_ / pending) : 0;
                options.max_attempts = tuning_.max_attempts;
                options.backoff = tuning_.backoff;

                workers.push_back(std::make_unique<ChunkWorker>(
                    *transport_, chunk, state_mutex_, control_, std::move(options),
                    [this](std::uint64_t bytes) { onChunkProgress(bytes); }));
            }
        }

        if (workers.empty()) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return allCompleted(chunks_);
        }

        std::mutex done_mutex;
        std::condition_variable done_cv;
        std::size_t running = workers.size();

        std::vector<std::thread> threads;
        threads.reserve(workers.size());
        for (auto& worker : workers) {
            threads.emplace_back([this, w = worker.get(), &done_mutex, &done_cv, &running]() {
                try {
                    w->run();
                } catch (const std::exception& ex) {
                    registerError(fmt::format("Chunk {} failed: {}", w->index(), ex.what()));
                }
                {
                    std::lock_guard<std::mutex> lock(done_mutex);
                    --running;
                }
                done_cv.notify_all();
            });
        }

        auto last_save = std::chrono::steady_clock::now();
        {
            std::unique_lock<std::mutex> lock(done_mutex);
            while (running > 0) {
                done_cv.wait_for(lock, tuning_.supervise_interval, [&running] { return running == 0; });
                const auto now = std::chrono::steady_clock::now();
                if (running > 0 && now - last_save >= tuning_.state_save_interval) {
                    lock.unlock();
                    saveState();
                    lock.lock();
                    last_save = now;
                }
            }
        }

        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        saveState();

        bool ok = true;
        for (const auto& worker : workers) {
            if (worker->hasError()) {
                registerError(fmt::format("Chunk {} failed: {}", worker->index(), worker->error()));
                ok = false;
            }
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        return ok && !worker_failed_ && allCompleted(chunks_);
    }

    void onChunkProgress(std::uint64_t bytes) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            downloaded_bytes_ += bytes;
            bytes_since_sample_ += bytes;

            const auto now = SpeedMeter::Clock::now();
            if (now - last_notify_ < tuning_.notify_interval) {
                return;
            }
            speed_meter_.addSample(now, bytes_since_sample_);
            bytes_since_sample_ = 0;
            speed_ = speed_meter_.bytesPerSecond();
            eta_ = SpeedMeter::eta(total_bytes_, downloaded_bytes_, speed_);
            last_notify_ = now;
        }
        notifyProgress();
    }

    void notifyProgress() {
        if (!on_progress_) {
            return;
        }
        // Snapshot under the delivery lock so callers never see the count go back.
        std::lock_guard<std::recursive_mutex> delivery(callback_mutex_);
        const Progress snapshot = getProgress();
        on_progress_(snapshot.downloaded_bytes, snapshot.total_bytes, snapshot.speed_bps, snapshot.eta_seconds);
    }

    void setStatus(DownloadStatus status) {
        std::lock_guard<std::recursive_mutex> delivery(callback_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            status_ = status;
        }
        if (on_status_change_) {
            on_status_change_(status);
        }
    }

    void saveState() {
        TransferState state;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state.url = url_;
            state.total_size = total_bytes_;
            state.chunks = chunks_;
        }
        state.filepath = filepath_.string();
        state.timestamp = epochSeconds();
        state_store_.save(state);
    }

    void mergeChunks() {
        std::vector<ChunkInfo> ordered = chunks();
        std::sort(ordered.begin(), ordered.end(),
                  [](const ChunkInfo& a, const ChunkInfo& b) { return a.index < b.index; });

        const auto parent = filepath_.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        detail::FilePtr out{std::fopen(filepath_.c_str(), "wb")};
        if (!out) {
            throw std::runtime_error(fmt::format("Cannot create destination file {}", filepath_.string()));
        }

        std::vector<char> buffer(kMergeBufferSize);
        for (const auto& chunk : ordered) {
            const auto part = ChunkWorker::chunkPath(temp_dir_, chunk.index);
            detail::FilePtr in{std::fopen(part.c_str(), "rb")};
            if (!in) {
                if (chunk.downloaded == 0) {
                    continue;
                }
                throw std::runtime_error(fmt::format("Missing chunk file {}", part.string()));
            }

            std::size_t read = 0;
            while ((read = std::fread(buffer.data(), 1, buffer.size(), in.get())) > 0) {
                if (std::fwrite(buffer.data(), 1, read, out.get()) != read) {
                    throw std::runtime_error(fmt::format("Failed to write destination file {}", filepath_.string()));
                }
            }
            if (std::ferror(in.get())) {
                throw std::runtime_error(fmt::format("Failed to read chunk file {}", part.string()));
            }
        }

        if (std::fflush(out.get()) != 0) {
            throw std::runtime_error(fmt::format("Failed to flush destination file {}", filepath_.string()));
        }
        out.reset();

        const std::uint64_t expected = getProgress().total_bytes;
        if (expected > 0) {
            const auto actual = std::filesystem::file_size(filepath_);
            if (actual != expected) {
                throw std::runtime_error(fmt::format("Merged size {} does not match expected {}", actual, expected));
            }
        }
    }

    void cleanup() {
        std::error_code ec;
        for (const auto& chunk : chunks()) {
            std::filesystem::remove(ChunkWorker::chunkPath(temp_dir_, chunk.index), ec);
            if (ec) {
                spdlog::warn("Cannot remove chunk {} of {}: {}", chunk.index, filepath_.string(), ec.message());
            }
        }
        // Only succeeds when the directory is empty.
        std::filesystem::remove(temp_dir_, ec);
        state_store_.remove();
    }

    void registerError(std::string message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        worker_failed_ = true;
        if (error_message_.empty()) {
            error_message_ = std::move(message);
        }
    }

    void fail(std::string message) {
        spdlog::error("{} failed: {}", filepath_.string(), message);
        registerError(std::move(message));
        setStatus(DownloadStatus::Error);
    }

    std::shared_ptr<HttpTransport> transport_;
    std::string url_;
    std::filesystem::path filepath_;
    std::filesystem::path temp_dir_;
    int connections_;
    Headers headers_;
    std::string proxy_;
    std::uint64_t speed_limit_;
    SessionTuning tuning_;
    ProgressCallback on_progress_;
    StatusCallback on_status_change_;
    StateStore state_store_;
    TransferControl control_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex state_mutex_;
    // Recursive so a callback can pause or resume this session from the
    // delivering thread.
    mutable std::recursive_mutex callback_mutex_;

    std::vector<ChunkInfo> chunks_;
    std::uint64_t total_bytes_{0};
    std::uint64_t downloaded_bytes_{0};
    std::uint64_t bytes_since_sample_{0};
    SpeedMeter speed_meter_;
    SpeedMeter::Clock::time_point last_notify_{};
    double speed_{0.0};
    std::uint64_t eta_{0};
    DownloadStatus status_{DownloadStatus::Queued};
    bool worker_failed_{false};
    std::string error_message_;
};

DownloadSession::DownloadSession(std::shared_ptr<HttpTransport> transport,
                                 SessionOptions options,
                                 ProgressCallback on_progress,
                                 StatusCallback on_status_change)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(options),
                                   std::move(on_progress), std::move(on_status_change))) {}

DownloadSession::~DownloadSession() = default;

void DownloadSession::run() { impl_->run(); }

void DownloadSession::pause() { impl_->pause(); }

void DownloadSession::resume() { impl_->resume(); }

void DownloadSession::cancel() { impl_->cancel(); }

void DownloadSession::stopAndSave() { impl_->stopAndSave(); }

Progress DownloadSession::getProgress() const { return impl_->getProgress(); }

DownloadStatus DownloadSession::status() const { return impl_->status(); }

std::string DownloadSession::errorMessage() const { return impl_->errorMessage(); }

std::string DownloadSession::url() const { return impl_->url(); }

std::vector<ChunkInfo> DownloadSession::chunks() const { return impl_->chunks(); }

const std::filesystem::path& DownloadSession::filepath() const { return impl_->filepath(); }

} // namespace rangedl
