#pragma once

#include "download_session.hpp"
#include "download_task.hpp"
#include "http_transport.hpp"
#include "task_store.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace rangedl {

struct AddRequest {
    std::string url;
    std::optional<std::string> filename;
    std::optional<std::string> save_path; // full target path; skips category placement
    std::optional<int> connections;       // default: the default_connections setting
    int priority{1};
    std::uint64_t speed_limit{0};
    std::string referer;
    Headers extra_headers;
    bool auto_start{true};
    std::uint64_t size{0};
    bool skip_probe{false};
};

struct SchedulerOptions {
    std::chrono::milliseconds loop_interval{2000};
    std::filesystem::path download_dir; // empty: download_dir setting, then ./downloads
    std::string proxy;
    SessionTuning session_tuning;
};

using TaskUpdateCallback = std::function<void(const DownloadTask& task)>;

// Owns every known task, admits queued tasks by (priority desc, arrival asc)
// up to the max_concurrent setting and mirrors status changes into the store.
class QueueScheduler {
public:
    QueueScheduler(std::shared_ptr<TaskStore> store,
                   std::shared_ptr<HttpTransport> transport,
                   SchedulerOptions options = {},
                   TaskUpdateCallback on_task_update = {});
    ~QueueScheduler();

    QueueScheduler(const QueueScheduler&) = delete;
    QueueScheduler& operator=(const QueueScheduler&) = delete;

    // Loads persisted rows; a row left Downloading or Merging becomes Paused.
    void loadFromStore();

    std::string add(const AddRequest& request);

    bool start(const std::string& id);
    bool resume(const std::string& id);
    bool pause(const std::string& id);
    bool stop(const std::string& id);
    bool retry(const std::string& id);
    bool remove(const std::string& id, bool delete_file = false);

    void startAll();
    void stopAll();

    // Promotes queued tasks while fewer than max_concurrent are downloading.
    void tryStartNext();

    [[nodiscard]] std::vector<DownloadTask> tasks() const;
    [[nodiscard]] std::optional<DownloadTask> task(const std::string& id) const;
    [[nodiscard]] std::size_t activeCount() const;

    [[nodiscard]] int maxConcurrent() const;
    [[nodiscard]] int defaultConnections() const;

    void startBackgroundLoop();
    void stopBackgroundLoop();

private:
    struct Entry {
        DownloadTask task;
        std::uint64_t sequence{0};
        std::uint64_t generation{0};
        std::shared_ptr<DownloadSession> session;
        std::thread worker;
    };

    void startLocked(Entry& entry);
    void onSessionProgress(const std::string& id, std::uint64_t generation,
                           std::uint64_t downloaded, std::uint64_t total, double speed, std::uint64_t eta);
    void onSessionStatus(const std::string& id, std::uint64_t generation, DownloadStatus status);
    void persistActive();
    void loop();
    void notify(const DownloadTask& task) const;

    [[nodiscard]] std::size_t activeCountLocked() const;
    [[nodiscard]] Entry* findLocked(const std::string& id);
    [[nodiscard]] std::string generateIdLocked();
    [[nodiscard]] std::filesystem::path downloadDir() const;
    [[nodiscard]] int intSetting(const std::string& key, int fallback) const;

    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<HttpTransport> transport_;
    SchedulerOptions options_;
    TaskUpdateCallback on_task_update_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
    std::uint64_t next_sequence_{0};
    std::mt19937_64 rng_;
    bool shutting_down_{false};

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool loop_stop_{false};
    std::thread loop_thread_;
};

} // namespace rangedl
