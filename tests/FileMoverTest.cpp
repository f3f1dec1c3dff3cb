#include <gtest/gtest.h>

#include "FileMover.hpp"
#include "TestSupport.hpp"

#include <chrono>

using test_support::TempDir;
using test_support::readFile;
using test_support::writeFile;

namespace {

class FileMoverTest : public ::testing::Test {
protected:
    TempDir dir_;
    FileMover mover_;
};

TEST_F(FileMoverTest, CopyKeepsSourceContentAndTimestamp) {
    const auto source = dir_ / "in/photo.jpg";
    const auto target = dir_ / "photo_copy.jpg";
    writeFile(source, "pixels");
    const auto stamp = std::filesystem::last_write_time(source) - std::chrono::hours(24);
    std::filesystem::last_write_time(source, stamp);

    std::string error;
    ASSERT_TRUE(mover_.copyFile(source, target, error)) << error;

    EXPECT_TRUE(std::filesystem::exists(source));
    EXPECT_EQ(readFile(target), "pixels");
    EXPECT_TRUE(std::filesystem::last_write_time(target) == stamp);
}

TEST_F(FileMoverTest, CopyRefusesExistingTarget) {
    writeFile(dir_ / "a.txt", "new");
    writeFile(dir_ / "b.txt", "old contents");

    std::string error;
    EXPECT_FALSE(mover_.copyFile(dir_ / "a.txt", dir_ / "b.txt", error));
    EXPECT_NE(error.find("already exists"), std::string::npos) << error;
    EXPECT_EQ(readFile(dir_ / "b.txt"), "old contents");
    EXPECT_EQ(readFile(dir_ / "a.txt"), "new");
}

TEST_F(FileMoverTest, CopyOntoItselfKeepsSource) {
    writeFile(dir_ / "d/a.jpg", "precious");

    std::string error;
    EXPECT_FALSE(mover_.copyFile(dir_ / "d/a.jpg", dir_ / "d/../d/a.jpg", error));
    EXPECT_NE(error.find("same file"), std::string::npos) << error;
    EXPECT_EQ(readFile(dir_ / "d/a.jpg"), "precious");

    EXPECT_FALSE(mover_.moveFile(dir_ / "d/a.jpg", dir_ / "d/a.jpg", error));
    EXPECT_EQ(readFile(dir_ / "d/a.jpg"), "precious");
}

TEST_F(FileMoverTest, CopyOfVanishedSourceKeepsUnrelatedTarget) {
    writeFile(dir_ / "out.txt", "someone else's file");

    std::string error;
    EXPECT_FALSE(mover_.copyFile(dir_ / "vanished.txt", dir_ / "out.txt", error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(readFile(dir_ / "out.txt"), "someone else's file");
}

TEST_F(FileMoverTest, CopyOfMissingSourceLeavesNoTarget) {
    std::string error;
    EXPECT_FALSE(mover_.copyFile(dir_ / "missing.txt", dir_ / "out.txt", error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.txt"));
}

TEST_F(FileMoverTest, MoveRemovesSourceAfterVerifiedCopy) {
    writeFile(dir_ / "src.bin", std::string(70000, 'z'));

    std::string error;
    ASSERT_TRUE(mover_.moveFile(dir_ / "src.bin", dir_ / "dst.bin", error)) << error;
    EXPECT_FALSE(std::filesystem::exists(dir_ / "src.bin"));
    EXPECT_EQ(readFile(dir_ / "dst.bin"), std::string(70000, 'z'));
}

TEST_F(FileMoverTest, MoveToUnwritableLocationKeepsSource) {
    writeFile(dir_ / "src.bin", "payload");

    std::string error;
    EXPECT_FALSE(mover_.moveFile(dir_ / "src.bin", dir_ / "no/such/dir/dst.bin", error));
    EXPECT_EQ(readFile(dir_ / "src.bin"), "payload");
}

// Verification that always reports a corrupted copy.
class CorruptCopyMover : public FileMover {
public:
    bool verifyIntegrity(const std::filesystem::path&, const std::filesystem::path&, std::string& error) const override {
        error = "integrity verification failed: content hash mismatch";
        return false;
    }
};

// Passes verification, then leaves a non-empty directory where the source file was.
class PinnedSourceMover : public FileMover {
public:
    bool verifyIntegrity(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath,
                         std::string& error) const override {
        if (!FileMover::verifyIntegrity(sourcePath, targetPath, error)) {
            return false;
        }
        std::filesystem::remove(sourcePath);
        writeFile(sourcePath / "keep", "pinned");
        return true;
    }
};

TEST_F(FileMoverTest, MoveWithFailedVerificationDiscardsTargetAndKeepsSource) {
    writeFile(dir_ / "src.bin", "payload");

    std::string error;
    EXPECT_FALSE(CorruptCopyMover().moveFile(dir_ / "src.bin", dir_ / "dst.bin", error));
    EXPECT_NE(error.find("hash mismatch"), std::string::npos) << error;
    EXPECT_FALSE(std::filesystem::exists(dir_ / "dst.bin"));
    EXPECT_EQ(readFile(dir_ / "src.bin"), "payload");
}

TEST_F(FileMoverTest, MoveWhoseSourceCannotBeRemovedDiscardsTarget) {
    writeFile(dir_ / "src.bin", "payload");

    std::string error;
    EXPECT_FALSE(PinnedSourceMover().moveFile(dir_ / "src.bin", dir_ / "dst.bin", error));
    EXPECT_NE(error.find("unable to remove source"), std::string::npos) << error;
    EXPECT_FALSE(std::filesystem::exists(dir_ / "dst.bin"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "src.bin"));
}

TEST_F(FileMoverTest, IntegrityDetectsSizeAndContentMismatch) {
    writeFile(dir_ / "a", "abcd");
    writeFile(dir_ / "b", "abc");
    writeFile(dir_ / "c", "abce");
    writeFile(dir_ / "d", "abcd");

    std::string error;
    EXPECT_FALSE(mover_.verifyIntegrity(dir_ / "a", dir_ / "b", error));
    EXPECT_NE(error.find("size mismatch"), std::string::npos);

    error.clear();
    EXPECT_FALSE(FileMover(HashAlgorithm::Sha1).verifyIntegrity(dir_ / "a", dir_ / "c", error));
    EXPECT_NE(error.find("hash mismatch"), std::string::npos);

    error.clear();
    EXPECT_TRUE(mover_.verifyIntegrity(dir_ / "a", dir_ / "d", error)) << error;
}

TEST_F(FileMoverTest, RelocateRenamesFile) {
    writeFile(dir_ / "from.txt", "x");

    std::string error;
    ASSERT_TRUE(FileMover::relocate(dir_ / "from.txt", dir_ / "to.txt", error)) << error;
    EXPECT_FALSE(std::filesystem::exists(dir_ / "from.txt"));
    EXPECT_EQ(readFile(dir_ / "to.txt"), "x");

    EXPECT_FALSE(FileMover::relocate(dir_ / "from.txt", dir_ / "again.txt", error));
}

} // namespace
