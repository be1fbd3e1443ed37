#include "rangedl/file_naming.hpp"
#include "rangedl/state_store.hpp"

#include "temp_dir.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace rangedl {
namespace {

using fakes::TempDir;
using ::testing::StartsWith;

std::vector<Category> categories() {
    return {
        {"Videos", {"mp4", "mkv"}, ""},
        {"Archives", {"zip", "gz"}, ""},
        {"Other", {}, ""},
    };
}

TEST(FileNamingTest, NameFromUrlPath) {
    EXPECT_EQ(filenameFromUrl("https://example.com/files/report.pdf"), "report.pdf");
    EXPECT_EQ(filenameFromUrl("https://example.com/files/report.pdf?token=1#top"), "report.pdf");
    EXPECT_EQ(filenameFromUrl("https://example.com/files/my%20file.zip"), "my file.zip");
}

TEST(FileNamingTest, NameWithoutExtensionFallsBack) {
    EXPECT_THAT(filenameFromUrl("https://example.com/download"), StartsWith("download_"));
    EXPECT_THAT(filenameFromUrl("https://example.com/"), StartsWith("download_"));
}

TEST(FileNamingTest, ContentDispositionWins) {
    EXPECT_EQ(filenameFromUrl("https://example.com/get?id=4", "attachment; filename=\"data.csv\""), "data.csv");
    EXPECT_EQ(filenameFromUrl("https://example.com/get", "attachment; filename=plain.txt"), "plain.txt");
}

TEST(FileNamingTest, EncodedFilenamePreferred) {
    EXPECT_EQ(filenameFromUrl("https://example.com/get",
                              "attachment; filename=\"fallback.txt\"; filename*=UTF-8''r%C3%A9sum%C3%A9.pdf"),
              "r\xC3\xA9sum\xC3\xA9.pdf");
}

TEST(FileNamingTest, Sanitize) {
    EXPECT_EQ(sanitizeFilename("a<b>c:d\"e/f\\g|h?i*j"), "a_b_c_d_e_f_g_h_i_j");
    EXPECT_EQ(sanitizeFilename("  ..name.txt.. "), "name.txt");
    EXPECT_EQ(sanitizeFilename("tab\there"), "tab_here");
    EXPECT_EQ(sanitizeFilename("..."), "download");
    EXPECT_EQ(sanitizeFilename(std::string(300, 'x')).size(), 200u);
}

TEST(FileNamingTest, CategoryByExtension) {
    EXPECT_EQ(categoryFor("movie.MKV", categories()), "Videos");
    EXPECT_EQ(categoryFor("backup.tar.gz", categories()), "Archives");
    EXPECT_EQ(categoryFor("notes.txt", categories()), "Other");
    EXPECT_EQ(categoryFor("README", categories()), "Other");
}

TEST(FileNamingTest, SavePathUsesCategoryFolder) {
    TempDir dir;
    const auto path = savePathFor("movie.mkv", "Videos", categories(), dir.path());
    EXPECT_EQ(path, dir.path() / "Videos" / "movie.mkv");
    EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "Videos"));
}

TEST(FileNamingTest, SavePathHonoursCategoryOverride) {
    TempDir dir;
    auto cats = categories();
    cats[0].save_path = (dir.path() / "media").string();
    EXPECT_EQ(savePathFor("movie.mkv", "Videos", cats, dir.path() / "unused"), dir.path() / "media" / "movie.mkv");
}

TEST(FileNamingTest, EnsureUniqueAddsCounter) {
    TempDir dir;
    const auto base = dir / "file.zip";
    EXPECT_EQ(ensureUnique(base), base);

    fakes::writeFile(base, "x");
    EXPECT_EQ(ensureUnique(base), dir / "file (1).zip");

    fakes::writeFile(StateStore::statePathFor(dir / "file (1).zip"), "{}");
    EXPECT_EQ(ensureUnique(base), dir / "file (2).zip");

    const auto taken = [&dir](const std::filesystem::path& p) { return p == dir / "file (2).zip"; };
    EXPECT_EQ(ensureUnique(base, taken), dir / "file (3).zip");
}

TEST(FileNamingTest, DownloadableProbe) {
    ProbeResult probe;
    probe.ok = true;
    probe.content_length = 100;
    probe.content_type = "application/zip";
    EXPECT_TRUE(isDownloadableProbe(probe));

    probe.content_type = "Text/HTML; charset=utf-8";
    EXPECT_FALSE(isDownloadableProbe(probe));

    probe.content_type = "";
    probe.content_length = 0;
    EXPECT_FALSE(isDownloadableProbe(probe));

    probe.content_length = 100;
    probe.ok = false;
    EXPECT_FALSE(isDownloadableProbe(probe));
}

} // namespace
} // namespace rangedl
