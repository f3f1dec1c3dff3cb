#include <gtest/gtest.h>

#include "ContentHasher.hpp"
#include "PostProcessHooks.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

using test_support::TempDir;
using test_support::makeRecord;
using test_support::writeFile;

namespace {

FileRecord transferred(const TempDir& dir, const std::string& name) {
    FileRecord record = makeRecord("in/" + name, (dir / "src").string());
    record.newName = name;
    record.targetPath = (dir / "target" / name).string();
    writeFile(record.fullPath, "source");
    writeFile(record.targetPath, "target");
    return record;
}

TEST(PostProcessHooksTest, FactoryFollowsMode) {
    EXPECT_STREQ(ThumbnailRefresher::create(ThumbnailRefreshMode::Off)->name(), "off");
    EXPECT_STREQ(ThumbnailRefresher::create(ThumbnailRefreshMode::TouchTimestamps)->name(), "touch");
    EXPECT_STREQ(ThumbnailRefresher::create(ThumbnailRefreshMode::ShellNotify)->name(), "shell");
    EXPECT_STREQ(ThumbnailRefresher::create(ThumbnailRefreshMode::ClearCache)->name(), "cache_clear");
}

TEST(PostProcessHooksTest, TouchUpdatesTargetTimestamps) {
    TempDir dir;
    const FileRecord record = transferred(dir, "a.jpg");
    const auto old = std::filesystem::last_write_time(record.targetPath) - std::chrono::hours(48);
    std::filesystem::last_write_time(record.targetPath, old);

    TouchTimestampRefresher refresher;
    EXPECT_TRUE(refresher.refresh(dir / "target", {record}));
    EXPECT_TRUE(std::filesystem::last_write_time(record.targetPath) > old);
}

#ifndef _WIN32
TEST(PostProcessHooksTest, ShellNotifyFailsForMissingDirectory) {
    TempDir dir;
    ShellNotifyRefresher refresher;
    EXPECT_FALSE(refresher.refresh(dir / "absent", {}));
    EXPECT_TRUE(refresher.refresh(dir.path(), {}));
}

TEST(PostProcessHooksTest, FileUriIsPercentEncoded) {
    EXPECT_EQ(ThumbnailCacheCleaner::fileUri("/home/u/my photo.jpg"), "file:///home/u/my%20photo.jpg");
    EXPECT_EQ(ThumbnailCacheCleaner::fileUri("/p/\xE7\x85\xA7.png"), "file:///p/%E7%85%A7.png");
}

class ThumbnailCacheCleanerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* previous = std::getenv("XDG_CACHE_HOME")) {
            hadPrevious_ = true;
            previous_ = previous;
        }
        setenv("XDG_CACHE_HOME", (dir_ / "cache").c_str(), 1);
    }

    void TearDown() override {
        if (hadPrevious_) {
            setenv("XDG_CACHE_HOME", previous_.c_str(), 1);
        } else {
            unsetenv("XDG_CACHE_HOME");
        }
    }

    TempDir dir_;
    bool hadPrevious_ = false;
    std::string previous_;
};

TEST_F(ThumbnailCacheCleanerTest, RemovesThumbnailsOfTransferredFiles) {
    const FileRecord record = transferred(dir_, "pic.png");
    const std::string uri = ThumbnailCacheCleaner::fileUri(std::filesystem::path(record.targetPath).lexically_normal());
    const std::string thumbName = ContentHasher(HashAlgorithm::Md5).hashString(uri) + ".png";

    writeFile(dir_ / "cache/thumbnails/normal" / thumbName, "thumb");
    writeFile(dir_ / "cache/thumbnails/large" / thumbName, "thumb");
    writeFile(dir_ / "cache/thumbnails/normal/unrelated.png", "keep");

    EXPECT_EQ(ThumbnailCacheCleaner::cacheRoot().string(), (dir_ / "cache/thumbnails").string());

    ThumbnailCacheCleaner cleaner;
    EXPECT_TRUE(cleaner.refresh(dir_ / "target", {record}));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "cache/thumbnails/normal" / thumbName));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "cache/thumbnails/large" / thumbName));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "cache/thumbnails/normal/unrelated.png"));
}

TEST_F(ThumbnailCacheCleanerTest, MissingCacheDirectoryReportsFailure) {
    ThumbnailCacheCleaner cleaner;
    EXPECT_FALSE(cleaner.refresh(dir_ / "target", {}));
}
#endif

TEST(PostProcessHooksTest, DeleteCopiedSourcesOnlyAfterCopy) {
    TempDir dir;
    const FileRecord kept = transferred(dir, "a.jpg");
    FileRecord orphan = transferred(dir, "b.jpg");
    std::filesystem::remove(orphan.targetPath);

    const SourceDeletionResult moveRun = deleteCopiedSources({kept, orphan}, OperationKind::Move);
    EXPECT_EQ(moveRun.deleted, 0u);
    EXPECT_TRUE(std::filesystem::exists(kept.fullPath));

    const SourceDeletionResult copyRun = deleteCopiedSources({kept, orphan}, OperationKind::Copy);
    EXPECT_EQ(copyRun.deleted, 1u);
    EXPECT_EQ(copyRun.failed, 0u);
    EXPECT_FALSE(std::filesystem::exists(kept.fullPath));
    EXPECT_TRUE(std::filesystem::exists(orphan.fullPath));
}

} // namespace
