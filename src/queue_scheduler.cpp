#include "rangedl/queue_scheduler.hpp"
#include "rangedl/file_naming.hpp"
#include "rangedl/state_store.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangedl {

namespace {

double epochSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void removePath(const std::filesystem::path& path, bool recursive) {
    std::error_code ec;
    if (recursive) {
        std::filesystem::remove_all(path, ec);
    } else {
        std::filesystem::remove(path, ec);
    }
    if (ec) {
        spdlog::warn("Failed to delete {}: {}", path.string(), ec.message());
    }
}

} // namespace

QueueScheduler::QueueScheduler(std::shared_ptr<TaskStore> store,
                               std::shared_ptr<HttpTransport> transport,
                               SchedulerOptions options,
                               TaskUpdateCallback on_task_update)
    : store_(std::move(store)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      on_task_update_(std::move(on_task_update)),
      rng_(std::random_device{}()) {
    if (!store_ || !transport_) {
        throw std::invalid_argument("QueueScheduler requires a task store and a transport");
    }
}

QueueScheduler::~QueueScheduler() {
    stopBackgroundLoop();

    std::vector<std::shared_ptr<DownloadSession>> sessions;
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (auto& [id, entry] : entries_) {
            if (entry->session) {
                sessions.push_back(entry->session);
            }
            if (entry->worker.joinable()) {
                workers.push_back(std::move(entry->worker));
            }
        }
    }

    for (auto& session : sessions) {
        session->stopAndSave();
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

void QueueScheduler::loadFromStore() {
    std::vector<DownloadTask> rows = store_->getAllRows();
    std::sort(rows.begin(), rows.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.added_at < b.added_at;
    });

    std::size_t loaded = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (DownloadTask& row : rows) {
        if (entries_.count(row.id) != 0) {
            continue;
        }
        if (row.status == DownloadStatus::Downloading || row.status == DownloadStatus::Merging) {
            row.status = DownloadStatus::Paused;
            TaskUpdate update;
            update.status = DownloadStatus::Paused;
            store_->updateRow(row.id, update);
        }
        row.speed = 0.0;
        row.eta = 0;

        auto entry = std::make_unique<Entry>();
        entry->sequence = next_sequence_++;
        entry->task = std::move(row);
        const std::string id = entry->task.id;
        entries_.emplace(id, std::move(entry));
        ++loaded;
    }
    spdlog::info("Loaded {} task(s) from the store", loaded);
}

std::string QueueScheduler::add(const AddRequest& request) {
    if (request.url.empty()) {
        throw std::invalid_argument("Cannot add a download without a URL");
    }

    Headers headers = request.extra_headers;
    if (!request.referer.empty()) {
        headers["Referer"] = request.referer;
    }

    std::string url = request.url;
    std::uint64_t size = request.size;
    std::string filename = request.filename.value_or("");

    if (!request.skip_probe) {
        const ProbeResult probe = transport_->probe(request.url, headers, options_.proxy);
        std::string disposition;
        if (isDownloadableProbe(probe)) {
            url = probe.final_url.empty() ? request.url : probe.final_url;
            if (size == 0) {
                size = probe.content_length;
            }
            disposition = probe.content_disposition;
        } else {
            spdlog::warn("Probe of {} did not find a direct file (HTTP {}, {})", request.url,
                         probe.status_code, probe.content_type.empty() ? "no content type" : probe.content_type);
        }
        if (filename.empty()) {
            filename = filenameFromUrl(url, disposition);
        }
    } else if (filename.empty()) {
        filename = filenameFromUrl(url);
    }
    filename = sanitizeFilename(filename);

    const std::vector<Category> categories = store_->getCategories();
    DownloadTask task;
    task.url = url;
    task.filename = filename;
    task.category = categoryFor(filename, categories);
    task.filepath = request.save_path
        ? *request.save_path
        : savePathFor(filename, task.category, categories, downloadDir()).string();
    task.connections = std::clamp(request.connections.value_or(defaultConnections()),
                                  DownloadSession::kMinConnections, DownloadSession::kMaxConnections);
    task.priority = request.priority;
    task.speed_limit = request.speed_limit;
    task.referer = request.referer;
    task.extra_headers = request.extra_headers;
    task.status = DownloadStatus::Queued;
    task.total_size = size;
    task.added_at = epochSeconds();

    DownloadTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task.id = generateIdLocked();
        if (!request.save_path) {
            task.filepath = ensureUnique(task.filepath, [this](const std::filesystem::path& candidate) {
                return std::any_of(entries_.begin(), entries_.end(), [&candidate](const auto& item) {
                    return std::filesystem::path{item.second->task.filepath} == candidate;
                });
            }).string();
            task.filename = std::filesystem::path{task.filepath}.filename().string();
        }
        auto entry = std::make_unique<Entry>();
        entry->sequence = next_sequence_++;
        entry->task = std::move(task);
        if (!store_->addOrReplaceRow(entry->task)) {
            spdlog::error("Failed to store task {}", entry->task.id);
        }
        snapshot = entry->task;
        entries_.emplace(snapshot.id, std::move(entry));
    }

    spdlog::info("Added task {} ({}) -> {}", snapshot.id, snapshot.url, snapshot.filepath);
    notify(snapshot);

    if (request.auto_start) {
        tryStartNext();
    }
    return snapshot.id;
}

bool QueueScheduler::start(const std::string& id) {
    DownloadTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry) {
            return false;
        }
        const DownloadStatus status = entry->task.status;
        if (entry->session || status == DownloadStatus::Completed) {
            if (status != DownloadStatus::Paused) {
                return false;
            }
        } else {
            entry->task.status = DownloadStatus::Queued;
            entry->task.error_message.clear();
            TaskUpdate update;
            update.status = DownloadStatus::Queued;
            update.error_message = std::string{};
            store_->updateRow(id, update);
            snapshot = entry->task;
        }
    }

    if (snapshot.id.empty()) {
        // Paused with a live session: let its workers continue.
        return resume(id);
    }
    notify(snapshot);
    tryStartNext();
    return true;
}

bool QueueScheduler::resume(const std::string& id) {
    std::shared_ptr<DownloadSession> to_resume;
    std::shared_ptr<DownloadSession> to_stop;
    bool requeued = false;
    DownloadTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry || entry->task.status != DownloadStatus::Paused) {
            return false;
        }

        TaskUpdate update;
        if (entry->session && activeCountLocked() < static_cast<std::size_t>(maxConcurrent())) {
            to_resume = entry->session;
            entry->task.status = DownloadStatus::Downloading;
        } else {
            if (entry->session) {
                // No free slot: park the running session on disk and wait in line.
                to_stop = std::move(entry->session);
                ++entry->generation;
                update.downloaded = entry->task.downloaded;
            }
            entry->task.status = DownloadStatus::Queued;
            entry->task.speed = 0.0;
            entry->task.eta = 0;
            requeued = true;
        }
        update.status = entry->task.status;
        store_->updateRow(id, update);
        snapshot = entry->task;
    }

    if (to_resume) {
        to_resume->resume();
    }
    if (to_stop) {
        to_stop->stopAndSave();
    }
    notify(snapshot);
    if (requeued) {
        tryStartNext();
    }
    return true;
}

bool QueueScheduler::pause(const std::string& id) {
    std::shared_ptr<DownloadSession> session;
    std::optional<DownloadTask> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry) {
            return false;
        }
        if (entry->session && entry->task.status == DownloadStatus::Downloading) {
            session = entry->session;
        } else if (entry->task.status == DownloadStatus::Queued) {
            entry->task.status = DownloadStatus::Paused;
            TaskUpdate update;
            update.status = DownloadStatus::Paused;
            store_->updateRow(id, update);
            snapshot = entry->task;
        } else {
            return false;
        }
    }

    if (session) {
        // The session reports Paused through its status callback.
        session->pause();
    }
    if (snapshot) {
        notify(*snapshot);
    }
    return true;
}

bool QueueScheduler::stop(const std::string& id) {
    std::shared_ptr<DownloadSession> session;
    DownloadTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry) {
            return false;
        }
        const DownloadStatus status = entry->task.status;
        if (status == DownloadStatus::Merging || isFinished(status)) {
            return false;
        }
        if (entry->session) {
            session = std::move(entry->session);
            ++entry->generation;
        }
        entry->task.status = DownloadStatus::Stopped;
        entry->task.speed = 0.0;
        entry->task.eta = 0;

        TaskUpdate update;
        update.status = DownloadStatus::Stopped;
        update.downloaded = entry->task.downloaded;
        store_->updateRow(id, update);
        snapshot = entry->task;
    }

    if (session) {
        session->stopAndSave();
    }
    spdlog::info("Stopped task {}", id);
    notify(snapshot);
    return true;
}

bool QueueScheduler::retry(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry || entry->task.status != DownloadStatus::Error) {
            return false;
        }
    }
    return start(id);
}

bool QueueScheduler::remove(const std::string& id, bool delete_file) {
    std::shared_ptr<DownloadSession> session;
    std::thread worker;
    std::filesystem::path filepath;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry) {
            return false;
        }
        session = std::move(entry->session);
        ++entry->generation;
        worker = std::move(entry->worker);
        filepath = entry->task.filepath;
    }

    if (session) {
        session->cancel();
    }
    if (worker.joinable()) {
        worker.join();
    }

    if (delete_file && !filepath.empty()) {
        removePath(filepath, false);
        removePath(StateStore::tempDirFor(filepath), true);
        removePath(StateStore::statePathFor(filepath), false);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(id);
        if (!store_->deleteRow(id)) {
            spdlog::error("Failed to delete row for task {}", id);
        }
    }
    spdlog::info("Removed task {}{}", id, delete_file ? " and its files" : "");
    return true;
}

void QueueScheduler::startAll() {
    std::vector<std::string> paused_with_session;
    std::vector<DownloadTask> requeued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_) {
            const DownloadStatus status = entry->task.status;
            if (status == DownloadStatus::Paused && entry->session) {
                paused_with_session.push_back(id);
            } else if (!entry->session &&
                       (status == DownloadStatus::Paused || status == DownloadStatus::Stopped)) {
                entry->task.status = DownloadStatus::Queued;
                TaskUpdate update;
                update.status = DownloadStatus::Queued;
                store_->updateRow(id, update);
                requeued.push_back(entry->task);
            }
        }
    }

    for (const auto& task : requeued) {
        notify(task);
    }
    for (const auto& id : paused_with_session) {
        resume(id);
    }
    tryStartNext();
}

void QueueScheduler::stopAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (entry->session || entry->task.status == DownloadStatus::Queued) {
                ids.push_back(id);
            }
        }
    }
    for (const auto& id : ids) {
        stop(id);
    }
}

void QueueScheduler::tryStartNext() {
    const auto max_concurrent = static_cast<std::size_t>(maxConcurrent());
    std::vector<DownloadTask> started;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        std::size_t active = activeCountLocked();
        if (active >= max_concurrent) {
            return;
        }

        std::vector<Entry*> queued;
        for (auto& [id, entry] : entries_) {
            if (entry->task.status == DownloadStatus::Queued && !entry->session) {
                queued.push_back(entry.get());
            }
        }
        std::sort(queued.begin(), queued.end(), [](const Entry* a, const Entry* b) {
            if (a->task.priority != b->task.priority) {
                return a->task.priority > b->task.priority;
            }
            if (a->task.added_at != b->task.added_at) {
                return a->task.added_at < b->task.added_at;
            }
            return a->sequence < b->sequence;
        });

        for (Entry* entry : queued) {
            if (active >= max_concurrent) {
                break;
            }
            startLocked(*entry);
            ++active;
            started.push_back(entry->task);
        }
    }

    for (const auto& task : started) {
        notify(task);
    }
}

std::vector<DownloadTask> QueueScheduler::tasks() const {
    std::vector<DownloadTask> result;
    std::vector<std::pair<std::uint64_t, DownloadTask>> ordered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ordered.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            ordered.emplace_back(entry->sequence, entry->task);
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    result.reserve(ordered.size());
    for (auto& item : ordered) {
        result.push_back(std::move(item.second));
    }
    return result;
}

std::optional<DownloadTask> QueueScheduler::task(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second->task;
}

std::size_t QueueScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeCountLocked();
}

int QueueScheduler::maxConcurrent() const {
    return std::max(1, intSetting("max_concurrent", 3));
}

int QueueScheduler::defaultConnections() const {
    return std::clamp(intSetting("default_connections", 8),
                      DownloadSession::kMinConnections, DownloadSession::kMaxConnections);
}

void QueueScheduler::startBackgroundLoop() {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (loop_thread_.joinable()) {
        return;
    }
    loop_stop_ = false;
    loop_thread_ = std::thread([this] { loop(); });
}

void QueueScheduler::stopBackgroundLoop() {
    std::thread loop_thread;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        loop_stop_ = true;
        loop_thread = std::move(loop_thread_);
    }
    loop_cv_.notify_all();
    if (loop_thread.joinable()) {
        loop_thread.join();
    }
}

void QueueScheduler::loop() {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (!loop_stop_) {
        if (loop_cv_.wait_for(lock, options_.loop_interval, [this] { return loop_stop_; })) {
            break;
        }
        lock.unlock();
        tryStartNext();
        persistActive();
        lock.lock();
    }
}

void QueueScheduler::persistActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (entry->task.status != DownloadStatus::Downloading) {
            continue;
        }
        TaskUpdate update;
        update.status = entry->task.status;
        update.downloaded = entry->task.downloaded;
        update.total_size = entry->task.total_size;
        store_->updateRow(id, update);
    }
}

void QueueScheduler::startLocked(Entry& entry) {
    DownloadTask& task = entry.task;
    task.status = DownloadStatus::Downloading;
    task.started_at = epochSeconds();
    task.error_message.clear();
    task.speed = 0.0;
    task.eta = 0;

    const std::uint64_t generation = ++entry.generation;
    const std::string id = task.id;

    SessionOptions session_options;
    session_options.url = task.url;
    session_options.filepath = task.filepath;
    session_options.connections = task.connections;
    session_options.headers = task.extra_headers;
    if (!task.referer.empty()) {
        session_options.headers["Referer"] = task.referer;
    }
    session_options.proxy = options_.proxy;
    session_options.speed_limit = task.speed_limit;
    session_options.tuning = options_.session_tuning;

    auto session = std::make_shared<DownloadSession>(
        transport_, std::move(session_options),
        [this, id, generation](std::uint64_t downloaded, std::uint64_t total, double speed, std::uint64_t eta) {
            onSessionProgress(id, generation, downloaded, total, speed, eta);
        },
        [this, id, generation](DownloadStatus status) { onSessionStatus(id, generation, status); });
    entry.session = session;

    TaskUpdate update;
    update.status = DownloadStatus::Downloading;
    update.started_at = task.started_at;
    update.error_message = std::string{};
    store_->updateRow(id, update);

    // A stopped session may still be unwinding on the previous thread; it must
    // finish with the chunk files before the new session touches them.
    std::thread previous = std::move(entry.worker);
    entry.worker = std::thread([previous = std::move(previous), session, id]() mutable {
        if (previous.joinable()) {
            previous.join();
        }
        try {
            session->run();
        } catch (const std::exception& ex) {
            spdlog::error("Session for task {} failed: {}", id, ex.what());
        }
    });
    spdlog::info("Started task {} ({})", id, task.filename);
}

void QueueScheduler::onSessionProgress(const std::string& id, std::uint64_t generation,
                                       std::uint64_t downloaded, std::uint64_t total,
                                       double speed, std::uint64_t eta) {
    DownloadTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry || entry->generation != generation) {
            return;
        }
        entry->task.downloaded = downloaded;
        if (total > 0) {
            entry->task.total_size = total;
        }
        entry->task.speed = speed;
        entry->task.eta = eta;
        snapshot = entry->task;
    }
    notify(snapshot);
}

void QueueScheduler::onSessionStatus(const std::string& id, std::uint64_t generation, DownloadStatus status) {
    bool admit = false;
    DownloadTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry* entry = findLocked(id);
        if (!entry || entry->generation != generation) {
            return;
        }
        DownloadTask& task = entry->task;
        task.status = status;

        TaskUpdate update;
        update.status = status;
        switch (status) {
        case DownloadStatus::Completed:
            task.completed_at = epochSeconds();
            if (task.total_size > 0) {
                task.downloaded = task.total_size;
            } else {
                task.total_size = task.downloaded;
            }
            task.speed = 0.0;
            task.eta = 0;
            update.completed_at = task.completed_at;
            update.downloaded = task.downloaded;
            update.total_size = task.total_size;
            entry->session.reset();
            admit = true;
            break;
        case DownloadStatus::Error:
            task.error_message = entry->session ? entry->session->errorMessage() : std::string{};
            task.speed = 0.0;
            task.eta = 0;
            update.error_message = task.error_message;
            update.downloaded = task.downloaded;
            entry->session.reset();
            // A failed task frees its slot too.
            admit = true;
            break;
        case DownloadStatus::Stopped:
            task.speed = 0.0;
            task.eta = 0;
            update.downloaded = task.downloaded;
            entry->session.reset();
            admit = true;
            break;
        case DownloadStatus::Paused:
            task.speed = 0.0;
            task.eta = 0;
            update.downloaded = task.downloaded;
            update.total_size = task.total_size;
            break;
        default:
            break;
        }
        store_->updateRow(id, update);
        snapshot = task;
    }

    if (status == DownloadStatus::Error) {
        spdlog::error("Task {} failed: {}", id, snapshot.error_message);
    } else if (status == DownloadStatus::Completed) {
        spdlog::info("Task {} completed ({} bytes)", id, snapshot.downloaded);
    }
    notify(snapshot);
    if (admit) {
        tryStartNext();
    }
}

void QueueScheduler::notify(const DownloadTask& task) const {
    if (!on_task_update_) {
        return;
    }
    // Runs on session threads; a throwing listener must not stall the transfer.
    try {
        on_task_update_(task);
    } catch (const std::exception& ex) {
        spdlog::error("Task update listener failed for {}: {}", task.id, ex.what());
    }
}

std::size_t QueueScheduler::activeCountLocked() const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [](const auto& item) {
        return item.second->task.status == DownloadStatus::Downloading;
    }));
}

QueueScheduler::Entry* QueueScheduler::findLocked(const std::string& id) {
    const auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.get();
}

std::string QueueScheduler::generateIdLocked() {
    std::string id;
    do {
        id = fmt::format("{:016x}", rng_());
    } while (entries_.count(id) != 0);
    return id;
}

std::filesystem::path QueueScheduler::downloadDir() const {
    if (!options_.download_dir.empty()) {
        return options_.download_dir;
    }
    const std::string configured = store_->getSetting("download_dir", "");
    if (!configured.empty()) {
        return configured;
    }
    return std::filesystem::current_path() / "downloads";
}

int QueueScheduler::intSetting(const std::string& key, int fallback) const {
    const std::string value = store_->getSetting(key, std::to_string(fallback));
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        spdlog::warn("Setting {}='{}' is not a number, using {}", key, value, fallback);
        return fallback;
    }
}

} // namespace rangedl
