#include <gtest/gtest.h>

#include "ConflictResolver.hpp"
#include "TestSupport.hpp"

#include <set>
#include <vector>

namespace {

std::vector<FileRecord> withNames(const std::vector<std::string>& names) {
    std::vector<FileRecord> records;
    for (std::size_t i = 0; i < names.size(); ++i) {
        FileRecord record = test_support::makeRecord("dir/file" + std::to_string(i) + ".bin");
        record.newName = names[i];
        records.push_back(record);
    }
    return records;
}

std::vector<std::string> namesOf(const std::vector<FileRecord>& records) {
    std::vector<std::string> names;
    for (const auto& record : records) {
        names.push_back(record.newName);
    }
    return names;
}

TEST(ConflictResolverTest, FirstOccurrenceKeepsItsName) {
    auto records = withNames({"a.jpg", "a.jpg", "a.jpg", "b.jpg"});
    ConflictResolver::resolve(records);
    EXPECT_EQ(namesOf(records), (std::vector<std::string>{"a.jpg", "a__dup1.jpg", "a__dup2.jpg", "b.jpg"}));
}

TEST(ConflictResolverTest, NameWithoutExtensionGetsTrailingSuffix) {
    auto records = withNames({"README", "README"});
    ConflictResolver::resolve(records);
    EXPECT_EQ(records[1].newName, "README__dup1");
}

TEST(ConflictResolverTest, SuffixGoesBeforeLastDot) {
    EXPECT_EQ(ConflictResolver::withDuplicateSuffix("archive.tar.gz", 3), "archive.tar__dup3.gz");
}

TEST(ConflictResolverTest, CollisionsIgnoreAsciiCase) {
    auto records = withNames({"Photo.JPG", "photo.jpg"});
    ConflictResolver::resolve(records);
    EXPECT_EQ(records[0].newName, "Photo.JPG");
    EXPECT_EQ(records[1].newName, "photo__dup1.jpg");
}

TEST(ConflictResolverTest, RewrittenNamesNeverCollideWithExistingOnes) {
    auto records = withNames({"a.jpg", "a__dup1.jpg", "a.jpg", "a.jpg"});
    ConflictResolver::resolve(records);

    const auto names = namesOf(records);
    EXPECT_EQ(names[0], "a.jpg");
    EXPECT_EQ(names[1], "a__dup1.jpg");
    EXPECT_EQ(names[2], "a__dup2.jpg");
    EXPECT_EQ(names[3], "a__dup3.jpg");
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), names.size());
}

TEST(ConflictResolverTest, NamesAlreadyInTargetDirectoryAreTaken) {
    auto records = withNames({"p_2.jpg", "P_1.JPG", "p_3.jpg"});
    ConflictResolver::resolve(records, {"p_1.jpg", "p_2.jpg", "p_2__dup1.jpg", "logs"});
    EXPECT_EQ(namesOf(records), (std::vector<std::string>{"p_2__dup2.jpg", "P_1__dup1.JPG", "p_3.jpg"}));
}

TEST(ConflictResolverTest, UniqueNamesAreUntouched) {
    auto records = withNames({"x.png", "y.png", "z"});
    ConflictResolver::resolve(records);
    EXPECT_EQ(namesOf(records), (std::vector<std::string>{"x.png", "y.png", "z"}));
}

} // namespace
