#include "rangedl/sqlite_task_store.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

namespace rangedl {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

const std::vector<Category>& defaultCategories() {
    static const std::vector<Category> categories{
        {"Videos", {"mp4", "mkv", "avi", "mov", "wmv", "flv", "webm", "m4v", "ts", "mpeg", "mpg", "3gp", "vob", "rmvb", "divx", "m2ts"}, ""},
        {"Music", {"mp3", "flac", "aac", "ogg", "wav", "wma", "m4a", "opus", "alac", "aiff"}, ""},
        {"Documents", {"pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "txt", "epub", "odt", "csv", "rtf", "md"}, ""},
        {"Programs", {"exe", "msi", "dmg", "pkg", "deb", "rpm", "apk", "iso", "img", "bin", "run"}, ""},
        {"Archives", {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "cab"}, ""},
        {"Other", {}, ""},
    };
    return categories;
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::uint64_t columnUnsigned(sqlite3_stmt* stmt, int column) {
    const sqlite3_int64 value = sqlite3_column_int64(stmt, column);
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

Headers headersFromJson(const std::string& text) {
    Headers headers;
    if (text.empty()) {
        return headers;
    }
    try {
        const auto j = nlohmann::json::parse(text);
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_string()) {
                headers[it.key()] = it.value().get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("Ignoring malformed extra_headers column: {}", ex.what());
    }
    return headers;
}

} // namespace

SqliteTaskStore::SqliteTaskStore(std::string db_path)
    : db_path_(std::move(db_path)) {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error(fmt::format("Can't open database {}: {}", db_path_, message));
    }
    executeSql("PRAGMA journal_mode=WAL;");
    createTables();
    insertDefaults();
    spdlog::info("Opened task database {}", db_path_);
}

SqliteTaskStore::~SqliteTaskStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteTaskStore::executeSql(const std::string& sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

void SqliteTaskStore::createTables() {
    const std::string schema = R"(
        CREATE TABLE IF NOT EXISTS downloads (
            id            TEXT PRIMARY KEY,
            url           TEXT NOT NULL,
            filename      TEXT NOT NULL,
            filepath      TEXT NOT NULL,
            size          INTEGER DEFAULT 0,
            downloaded    INTEGER DEFAULT 0,
            status        TEXT DEFAULT 'Queued',
            category      TEXT DEFAULT 'Other',
            connections   INTEGER DEFAULT 8,
            speed_limit   INTEGER DEFAULT 0,
            priority      INTEGER DEFAULT 1,
            added_at      REAL DEFAULT 0,
            started_at    REAL DEFAULT 0,
            completed_at  REAL DEFAULT 0,
            error_msg     TEXT DEFAULT '',
            referer       TEXT DEFAULT '',
            extra_headers TEXT DEFAULT '{}'
        );

        CREATE TABLE IF NOT EXISTS settings (
            key   TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS categories (
            name       TEXT PRIMARY KEY,
            extensions TEXT NOT NULL,
            save_path  TEXT NOT NULL
        );
    )";

    if (!executeSql(schema)) {
        throw std::runtime_error(fmt::format("Failed to create tables in database {}", db_path_));
    }
}

void SqliteTaskStore::insertDefaults() {
    const std::pair<const char*, const char*> defaults[] = {
        {"max_concurrent", "3"},
        {"default_connections", "8"},
        {"speed_limit", "0"},
        {"download_dir", ""},
    };

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : defaults) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, "INSERT OR IGNORE INTO settings (key, value) VALUES (?, ?);", -1, &raw, nullptr) != SQLITE_OK) {
            throw std::runtime_error(fmt::format("Failed to prepare settings defaults: {}", sqlite3_errmsg(db_)));
        }
        Statement stmt{raw};
        sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 2, value, -1, SQLITE_STATIC);
        sqlite3_step(stmt.get());
    }
    for (const auto& category : defaultCategories()) {
        writeCategory(category, false);
    }
}

bool SqliteTaskStore::addOrReplaceRow(const DownloadTask& task) {
    static const char* sql = R"(
        INSERT OR REPLACE INTO downloads
            (id, url, filename, filepath, size, downloaded, status, category, connections,
             speed_limit, priority, added_at, started_at, completed_at, error_msg, referer, extra_headers)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return false;
    }
    Statement stmt{raw};

    const nlohmann::json headers(task.extra_headers);
    bindText(stmt.get(), 1, task.id);
    bindText(stmt.get(), 2, task.url);
    bindText(stmt.get(), 3, task.filename);
    bindText(stmt.get(), 4, task.filepath);
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(task.total_size));
    sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(task.downloaded));
    bindText(stmt.get(), 7, std::string{toString(task.status)});
    bindText(stmt.get(), 8, task.category);
    sqlite3_bind_int(stmt.get(), 9, task.connections);
    sqlite3_bind_int64(stmt.get(), 10, static_cast<sqlite3_int64>(task.speed_limit));
    sqlite3_bind_int(stmt.get(), 11, task.priority);
    sqlite3_bind_double(stmt.get(), 12, task.added_at);
    sqlite3_bind_double(stmt.get(), 13, task.started_at);
    sqlite3_bind_double(stmt.get(), 14, task.completed_at);
    bindText(stmt.get(), 15, task.error_message);
    bindText(stmt.get(), 16, task.referer);
    bindText(stmt.get(), 17, headers.dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("Failed to store task {}: {}", task.id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteTaskStore::updateRow(const std::string& id, const TaskUpdate& update) {
    if (update.empty()) {
        return true;
    }

    std::string sets;
    const auto add_column = [&sets](const char* column) {
        if (!sets.empty()) {
            sets += ", ";
        }
        sets += column;
        sets += " = ?";
    };
    if (update.status) add_column("status");
    if (update.total_size) add_column("size");
    if (update.downloaded) add_column("downloaded");
    if (update.error_message) add_column("error_msg");
    if (update.started_at) add_column("started_at");
    if (update.completed_at) add_column("completed_at");

    const std::string sql = fmt::format("UPDATE downloads SET {} WHERE id = ?;", sets);

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return false;
    }
    Statement stmt{raw};

    int index = 1;
    if (update.status) bindText(stmt.get(), index++, std::string{toString(*update.status)});
    if (update.total_size) sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(*update.total_size));
    if (update.downloaded) sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(*update.downloaded));
    if (update.error_message) bindText(stmt.get(), index++, *update.error_message);
    if (update.started_at) sqlite3_bind_double(stmt.get(), index++, *update.started_at);
    if (update.completed_at) sqlite3_bind_double(stmt.get(), index++, *update.completed_at);
    bindText(stmt.get(), index, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("Failed to update task {}: {}", id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<DownloadTask> SqliteTaskStore::getAllRows() {
    static const char* sql = R"(
        SELECT id, url, filename, filepath, size, downloaded, status, category, connections,
               speed_limit, priority, added_at, started_at, completed_at, error_msg, referer, extra_headers
        FROM downloads ORDER BY added_at DESC;
    )";

    std::vector<DownloadTask> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return rows;
    }
    Statement stmt{raw};

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        DownloadTask task;
        task.id = columnText(stmt.get(), 0);
        task.url = columnText(stmt.get(), 1);
        task.filename = columnText(stmt.get(), 2);
        task.filepath = columnText(stmt.get(), 3);
        task.total_size = columnUnsigned(stmt.get(), 4);
        task.downloaded = columnUnsigned(stmt.get(), 5);

        const std::string status = columnText(stmt.get(), 6);
        if (auto parsed = statusFromString(status)) {
            task.status = *parsed;
        } else {
            spdlog::warn("Task {} has unknown status '{}', treating it as Paused", task.id, status);
            task.status = DownloadStatus::Paused;
        }

        task.category = columnText(stmt.get(), 7);
        task.connections = sqlite3_column_int(stmt.get(), 8);
        task.speed_limit = columnUnsigned(stmt.get(), 9);
        task.priority = sqlite3_column_int(stmt.get(), 10);
        task.added_at = sqlite3_column_double(stmt.get(), 11);
        task.started_at = sqlite3_column_double(stmt.get(), 12);
        task.completed_at = sqlite3_column_double(stmt.get(), 13);
        task.error_message = columnText(stmt.get(), 14);
        task.referer = columnText(stmt.get(), 15);
        task.extra_headers = headersFromJson(columnText(stmt.get(), 16));
        rows.push_back(std::move(task));
    }
    return rows;
}

bool SqliteTaskStore::deleteRow(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM downloads WHERE id = ?;", -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return false;
    }
    Statement stmt{raw};
    bindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("Failed to delete task {}: {}", id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::string SqliteTaskStore::getSetting(const std::string& key, const std::string& fallback) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?;", -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return fallback;
    }
    Statement stmt{raw};
    bindText(stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return columnText(stmt.get(), 0);
    }
    return fallback;
}

bool SqliteTaskStore::setSetting(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);", -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return false;
    }
    Statement stmt{raw};
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("Failed to store setting {}: {}", key, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<Category> SqliteTaskStore::getCategories() {
    std::vector<Category> categories;
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT name, extensions, save_path FROM categories;", -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return categories;
    }
    Statement stmt{raw};

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        Category category;
        category.name = columnText(stmt.get(), 0);
        try {
            category.extensions = nlohmann::json::parse(columnText(stmt.get(), 1)).get<std::vector<std::string>>();
        } catch (const nlohmann::json::exception& ex) {
            spdlog::warn("Category {} has malformed extensions: {}", category.name, ex.what());
        }
        category.save_path = columnText(stmt.get(), 2);
        categories.push_back(std::move(category));
    }
    return categories;
}

bool SqliteTaskStore::setCategory(const Category& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    return writeCategory(category, true);
}

bool SqliteTaskStore::writeCategory(const Category& category, bool replace) {
    const char* sql = replace
        ? "INSERT OR REPLACE INTO categories (name, extensions, save_path) VALUES (?, ?, ?);"
        : "INSERT OR IGNORE INTO categories (name, extensions, save_path) VALUES (?, ?, ?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return false;
    }
    Statement stmt{raw};
    bindText(stmt.get(), 1, category.name);
    bindText(stmt.get(), 2, nlohmann::json(category.extensions).dump());
    bindText(stmt.get(), 3, category.save_path);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("Failed to store category {}: {}", category.name, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

} // namespace rangedl
