#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "FileRecord.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

namespace test_support {

// Scratch directory removed with everything in it when the fixture goes away.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
            ("relocator_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& child) const { return m_path / child; }

private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::filesystem::path& file, const std::string& contents) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string readFile(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Record for naming tests; no file has to exist.
inline FileRecord makeRecord(const std::string& relativePath, const std::string& sourceRoot = "/data") {
    const std::filesystem::path relative(relativePath);
    const std::filesystem::path parent = relative.parent_path();

    FileRecord record;
    record.sourceRoot = sourceRoot;
    record.relativePath = relative.generic_string();
    record.fullPath = (std::filesystem::path(sourceRoot) / relative).string();
    record.parentPath = parent.empty() ? std::string(".") : parent.generic_string();
    record.filename = relative.filename().string();
    record.stem = relative.stem().string();
    record.extension = relative.extension().string();
    record.sizeBytes = 1;
    return record;
}

} // namespace test_support

#endif
