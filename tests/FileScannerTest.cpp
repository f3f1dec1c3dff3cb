#include <gtest/gtest.h>

#include "FileScanner.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <filesystem>
#include <vector>

using test_support::TempDir;
using test_support::writeFile;

namespace {

std::vector<std::string> relativePaths(const std::vector<FileRecord>& records) {
    std::vector<std::string> paths;
    for (const auto& record : records) {
        paths.push_back(record.relativePath);
    }
    return paths;
}

void shiftMtime(const std::filesystem::path& file, std::chrono::hours offset) {
    const auto base = std::filesystem::last_write_time(file);
    std::filesystem::last_write_time(file, base + offset);
}

TEST(FileScannerTest, NaturalCompareTreatsDigitRunsAsNumbers) {
    EXPECT_LT(FileScanner::naturalCompare("img2.jpg", "img10.jpg"), 0);
    EXPECT_GT(FileScanner::naturalCompare("img10.jpg", "img9.jpg"), 0);
    EXPECT_EQ(FileScanner::naturalCompare("IMG1.jpg", "img1.jpg"), 0);
    EXPECT_LT(FileScanner::naturalCompare("a", "ab"), 0);
    EXPECT_LT(FileScanner::naturalCompare("1abc", "abc"), 0);
    EXPECT_LT(FileScanner::naturalCompare("x99999999999999999999998", "x99999999999999999999999"), 0);
}

TEST(FileScannerTest, ScansRecursivelyInNaturalOrder) {
    TempDir root;
    writeFile(root / "b/img10.jpg", "x");
    writeFile(root / "b/img2.jpg", "x");
    writeFile(root / "a/z.jpg", "x");
    writeFile(root / "top.jpg", "x");

    FileScanner scanner({}, SortOrder::Natural);
    const auto records = scanner.scanDirectories({root.path().string()});

    EXPECT_EQ(relativePaths(records), (std::vector<std::string>{"top.jpg", "a/z.jpg", "b/img2.jpg", "b/img10.jpg"}));
    EXPECT_EQ(records[0].parentPath, ".");
    EXPECT_EQ(records[2].parentPath, "b");
    EXPECT_EQ(records[2].stem, "img2");
    EXPECT_EQ(records[2].extension, ".jpg");
    EXPECT_EQ(records[2].sizeBytes, 1u);
    EXPECT_GT(records[2].mtime, 0.0);
}

TEST(FileScannerTest, SkipsHiddenEmptyAndExcludedFiles) {
    TempDir root;
    writeFile(root / "keep.JPG", "data");
    writeFile(root / "keep.png", "data");
    writeFile(root / ".hidden.jpg", "data");
    writeFile(root / "empty.jpg", "");
    writeFile(root / "notes.txt", "data");
    writeFile(root / "noext", "data");

    FileScanner scanner({"jpg", ".PNG"}, SortOrder::Natural);
    const auto records = scanner.scanDirectories({root.path().string()});

    EXPECT_EQ(relativePaths(records), (std::vector<std::string>{"keep.JPG", "keep.png"}));
}

TEST(FileScannerTest, EmptyIncludeListAcceptsEveryExtension) {
    TempDir root;
    writeFile(root / "notes.txt", "data");
    writeFile(root / "noext", "data");

    FileScanner scanner({}, SortOrder::Natural);
    EXPECT_EQ(scanner.scanDirectories({root.path().string()}).size(), 2u);
}

TEST(FileScannerTest, MissingRootIsSkipped) {
    TempDir root;
    writeFile(root / "a.jpg", "x");

    FileScanner scanner({}, SortOrder::Natural);
    const auto records = scanner.scanDirectories({(root / "missing").string(), root.path().string()});

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].filename, "a.jpg");
}

TEST(FileScannerTest, MultipleRootsShareOneOrdering) {
    TempDir first;
    TempDir second;
    writeFile(first / "set/b.jpg", "x");
    writeFile(second / "set/a.jpg", "x");

    FileScanner scanner({}, SortOrder::Natural);
    const auto records = scanner.scanDirectories({first.path().string(), second.path().string()});

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].filename, "a.jpg");
    EXPECT_EQ(records[0].sourceRoot, second.path().string());
    EXPECT_EQ(records[1].filename, "b.jpg");
}

TEST(FileScannerTest, ModificationTimeOrdering) {
    TempDir root;
    writeFile(root / "a.jpg", "x");
    writeFile(root / "b.jpg", "x");
    writeFile(root / "c.jpg", "x");
    shiftMtime(root / "a.jpg", std::chrono::hours(2));
    shiftMtime(root / "c.jpg", std::chrono::hours(-2));

    const auto ascending = FileScanner({}, SortOrder::MtimeAsc).scanDirectories({root.path().string()});
    EXPECT_EQ(relativePaths(ascending), (std::vector<std::string>{"c.jpg", "b.jpg", "a.jpg"}));

    const auto descending = FileScanner({}, SortOrder::MtimeDesc).scanDirectories({root.path().string()});
    EXPECT_EQ(relativePaths(descending), (std::vector<std::string>{"a.jpg", "b.jpg", "c.jpg"}));
}

TEST(FileScannerTest, TimeTiesFallBackToNaturalOrder) {
    std::vector<FileRecord> records = {
        test_support::makeRecord("d/f10.jpg"),
        test_support::makeRecord("d/f2.jpg"),
        test_support::makeRecord("d/f1.jpg"),
    };
    for (auto& record : records) {
        record.ctime = 100.0;
    }
    records[0].ctime = 50.0;

    FileScanner({}, SortOrder::CtimeAsc).sortRecords(records);
    EXPECT_EQ(relativePaths(records), (std::vector<std::string>{"d/f10.jpg", "d/f1.jpg", "d/f2.jpg"}));
}

} // namespace
