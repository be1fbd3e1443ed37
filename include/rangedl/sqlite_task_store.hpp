#pragma once

#include "task_store.hpp"

#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace rangedl {

// TaskStore on a single SQLite connection serialized by a mutex. Pass
// ":memory:" for a throwaway database.
class SqliteTaskStore final : public TaskStore {
public:
    // Throws std::runtime_error when the database cannot be opened or initialized.
    explicit SqliteTaskStore(std::string db_path);
    ~SqliteTaskStore() override;

    SqliteTaskStore(const SqliteTaskStore&) = delete;
    SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

    bool addOrReplaceRow(const DownloadTask& task) override;
    bool updateRow(const std::string& id, const TaskUpdate& update) override;
    [[nodiscard]] std::vector<DownloadTask> getAllRows() override;
    bool deleteRow(const std::string& id) override;

    [[nodiscard]] std::string getSetting(const std::string& key, const std::string& fallback) override;
    bool setSetting(const std::string& key, const std::string& value) override;

    [[nodiscard]] std::vector<Category> getCategories() override;
    bool setCategory(const Category& category) override;

    [[nodiscard]] const std::string& path() const { return db_path_; }

private:
    bool executeSql(const std::string& sql);
    void createTables();
    void insertDefaults();
    bool writeCategory(const Category& category, bool replace);

    std::string db_path_;
    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace rangedl
