#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include "ConfigParser.hpp"
#include "FileRecord.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Walks source roots, filters candidates and returns them in the configured order.
class FileScanner {
public:
    explicit FileScanner(const RelocatorConfig& config);
    FileScanner(std::vector<std::string> includeExtensions, SortOrder order);

    // Scan every root (missing roots are skipped with a warning) and sort the union.
    std::vector<FileRecord> scanDirectories(const std::vector<std::string>& sourceDirs) const;
    // Apply the configured ordering in place; ties keep a deterministic natural order.
    void sortRecords(std::vector<FileRecord>& records) const;

    // Alphanumeric comparison treating embedded digit runs as numbers; <0, 0 or >0.
    static int naturalCompare(const std::string& lhs, const std::string& rhs);

private:
    std::vector<FileRecord> scanSingleDirectory(const std::filesystem::path& root) const;
    bool isIncluded(const std::filesystem::path& file) const;

    std::vector<std::string> m_includeExtensions;
    SortOrder m_order;
};

#endif
