#include "rangedl/sqlite_task_store.hpp"

#include "temp_dir.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <thread>
#include <vector>

namespace rangedl {
namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

DownloadTask makeTask(const std::string& id, double added_at) {
    DownloadTask task;
    task.id = id;
    task.url = "http://example.com/" + id + ".zip";
    task.filename = id + ".zip";
    task.filepath = "/downloads/Archives/" + id + ".zip";
    task.connections = 4;
    task.priority = 2;
    task.speed_limit = 1024;
    task.referer = "http://example.com/";
    task.extra_headers = {{"Cookie", "a=b"}};
    task.category = "Archives";
    task.total_size = 5000;
    task.added_at = added_at;
    return task;
}

TEST(SqliteTaskStoreTest, InsertsDefaultSettings) {
    SqliteTaskStore store(":memory:");
    EXPECT_EQ(store.getSetting("max_concurrent", "x"), "3");
    EXPECT_EQ(store.getSetting("default_connections", "x"), "8");
    EXPECT_EQ(store.getSetting("speed_limit", "x"), "0");
    EXPECT_EQ(store.getSetting("download_dir", "x"), "");
    EXPECT_EQ(store.getSetting("missing", "fallback"), "fallback");
}

TEST(SqliteTaskStoreTest, SettingsPersistAcrossOpens) {
    fakes::TempDir dir;
    const std::string db = (dir / "tasks.db").string();
    {
        SqliteTaskStore store(db);
        EXPECT_TRUE(store.setSetting("max_concurrent", "5"));
    }
    SqliteTaskStore reopened(db);
    EXPECT_EQ(reopened.getSetting("max_concurrent", "3"), "5");
}

TEST(SqliteTaskStoreTest, RowRoundTrip) {
    SqliteTaskStore store(":memory:");
    ASSERT_TRUE(store.addOrReplaceRow(makeTask("abc", 10.0)));

    const auto rows = store.getAllRows();
    ASSERT_EQ(rows.size(), 1u);
    const DownloadTask& row = rows[0];
    EXPECT_EQ(row.id, "abc");
    EXPECT_EQ(row.url, "http://example.com/abc.zip");
    EXPECT_EQ(row.filepath, "/downloads/Archives/abc.zip");
    EXPECT_EQ(row.connections, 4);
    EXPECT_EQ(row.priority, 2);
    EXPECT_EQ(row.speed_limit, 1024u);
    EXPECT_EQ(row.referer, "http://example.com/");
    EXPECT_EQ(row.extra_headers.at("Cookie"), "a=b");
    EXPECT_EQ(row.category, "Archives");
    EXPECT_EQ(row.status, DownloadStatus::Queued);
    EXPECT_EQ(row.total_size, 5000u);
    EXPECT_DOUBLE_EQ(row.added_at, 10.0);
}

TEST(SqliteTaskStoreTest, UpdateTouchesOnlyGivenFields) {
    SqliteTaskStore store(":memory:");
    ASSERT_TRUE(store.addOrReplaceRow(makeTask("abc", 10.0)));

    TaskUpdate update;
    update.status = DownloadStatus::Error;
    update.downloaded = 1234;
    update.error_message = std::string{"HTTP 500"};
    ASSERT_TRUE(store.updateRow("abc", update));
    EXPECT_TRUE(store.updateRow("abc", TaskUpdate{}));

    const auto row = store.getAllRows().at(0);
    EXPECT_EQ(row.status, DownloadStatus::Error);
    EXPECT_EQ(row.downloaded, 1234u);
    EXPECT_EQ(row.error_message, "HTTP 500");
    EXPECT_EQ(row.total_size, 5000u);
    EXPECT_EQ(row.filename, "abc.zip");
}

TEST(SqliteTaskStoreTest, RowsAreNewestFirst) {
    SqliteTaskStore store(":memory:");
    store.addOrReplaceRow(makeTask("old", 1.0));
    store.addOrReplaceRow(makeTask("new", 3.0));
    store.addOrReplaceRow(makeTask("mid", 2.0));

    std::vector<std::string> ids;
    for (const auto& row : store.getAllRows()) {
        ids.push_back(row.id);
    }
    EXPECT_THAT(ids, ElementsAre("new", "mid", "old"));
}

TEST(SqliteTaskStoreTest, DeleteRemovesRow) {
    SqliteTaskStore store(":memory:");
    store.addOrReplaceRow(makeTask("a", 1.0));
    store.addOrReplaceRow(makeTask("b", 2.0));
    EXPECT_TRUE(store.deleteRow("a"));
    const auto rows = store.getAllRows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, "b");
}

TEST(SqliteTaskStoreTest, DefaultCategories) {
    SqliteTaskStore store(":memory:");
    std::vector<std::string> names;
    for (const auto& category : store.getCategories()) {
        names.push_back(category.name);
        EXPECT_TRUE(category.save_path.empty());
    }
    EXPECT_THAT(names, UnorderedElementsAre("Videos", "Music", "Documents", "Programs", "Archives", "Other"));
}

TEST(SqliteTaskStoreTest, SetCategoryReplaces) {
    SqliteTaskStore store(":memory:");
    ASSERT_TRUE(store.setCategory({"Videos", {"mp4"}, "/media/videos"}));
    const auto categories = store.getCategories();
    const auto it = std::find_if(categories.begin(), categories.end(),
                                 [](const Category& c) { return c.name == "Videos"; });
    ASSERT_NE(it, categories.end());
    EXPECT_THAT(it->extensions, ElementsAre("mp4"));
    EXPECT_EQ(it->save_path, "/media/videos");
}

TEST(SqliteTaskStoreTest, ConcurrentUpdates) {
    SqliteTaskStore store(":memory:");
    for (int i = 0; i < 4; ++i) {
        store.addOrReplaceRow(makeTask("t" + std::to_string(i), i));
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&store, i] {
            for (int n = 1; n <= 50; ++n) {
                TaskUpdate update;
                update.downloaded = static_cast<std::uint64_t>(n);
                store.updateRow("t" + std::to_string(i), update);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& row : store.getAllRows()) {
        EXPECT_EQ(row.downloaded, 50u) << row.id;
    }
}

TEST(SqliteTaskStoreTest, UnopenableDatabaseThrows) {
    EXPECT_THROW(SqliteTaskStore("/nonexistent-dir/for/sure/tasks.db"), std::runtime_error);
}

} // namespace
} // namespace rangedl
