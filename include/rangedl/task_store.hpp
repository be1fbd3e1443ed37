#pragma once

#include "download_task.hpp"

#include <string>
#include <vector>

namespace rangedl {

struct Category {
    std::string name;
    std::vector<std::string> extensions;
    std::string save_path; // empty: <download_dir>/<name>
};

// Durable rows for the task queue, plus settings and categories. Every
// method must be safe to call concurrently; each row update is atomic.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    virtual bool addOrReplaceRow(const DownloadTask& task) = 0;
    virtual bool updateRow(const std::string& id, const TaskUpdate& update) = 0;
    [[nodiscard]] virtual std::vector<DownloadTask> getAllRows() = 0;
    virtual bool deleteRow(const std::string& id) = 0;

    [[nodiscard]] virtual std::string getSetting(const std::string& key, const std::string& fallback) = 0;
    virtual bool setSetting(const std::string& key, const std::string& value) = 0;

    [[nodiscard]] virtual std::vector<Category> getCategories() = 0;
    virtual bool setCategory(const Category& category) = 0;
};

} // namespace rangedl
