#include "FileScanner.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>

#include <sys/stat.h>
#include <sys/types.h>

namespace {
// Reads modification and status-change/creation times as epoch seconds.
bool readTimestamps(const std::filesystem::path& file, double& mtime, double& ctime) {
#if defined(_WIN32)
    struct _stat64 st;
    if (_wstat64(file.c_str(), &st) != 0) {
        return false;
    }
    mtime = static_cast<double>(st.st_mtime);
    ctime = static_cast<double>(st.st_ctime);
#elif defined(__APPLE__)
    struct stat st;
    if (::stat(file.c_str(), &st) != 0) {
        return false;
    }
    mtime = static_cast<double>(st.st_mtimespec.tv_sec) + st.st_mtimespec.tv_nsec / 1e9;
    ctime = static_cast<double>(st.st_ctimespec.tv_sec) + st.st_ctimespec.tv_nsec / 1e9;
#else
    struct stat st;
    if (::stat(file.c_str(), &st) != 0) {
        return false;
    }
    mtime = static_cast<double>(st.st_mtim.tv_sec) + st.st_mtim.tv_nsec / 1e9;
    ctime = static_cast<double>(st.st_ctim.tv_sec) + st.st_ctim.tv_nsec / 1e9;
#endif
    return true;
}

int compareDigitRuns(const std::string& lhs, const std::string& rhs) {
    // Compare by value without overflow: drop leading zeros, then length, then digits.
    const auto lhsStart = std::min(lhs.find_first_not_of('0'), lhs.size());
    const auto rhsStart = std::min(rhs.find_first_not_of('0'), rhs.size());
    const auto lhsLength = lhs.size() - lhsStart;
    const auto rhsLength = rhs.size() - rhsStart;
    if (lhsLength != rhsLength) {
        return lhsLength < rhsLength ? -1 : 1;
    }
    return lhs.compare(lhsStart, lhsLength, rhs, rhsStart, rhsLength);
}

int compareFolded(const std::string& lhs, const std::string& rhs) {
    const std::size_t common = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < common; ++i) {
        const int a = std::tolower(static_cast<unsigned char>(lhs[i]));
        const int b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) {
            return a < b ? -1 : 1;
        }
    }
    if (lhs.size() == rhs.size()) {
        return 0;
    }
    return lhs.size() < rhs.size() ? -1 : 1;
}

bool isDigit(char ch) {
    return ch >= '0' && ch <= '9';
}

std::filesystem::path normalizeRoot(const std::string& sourceDir) {
    std::filesystem::path root = std::filesystem::path(sourceDir).lexically_normal();
    if (!root.has_filename() && root.has_relative_path()) {
        root = root.parent_path();
    }
    return root;
}
}

FileScanner::FileScanner(const RelocatorConfig& config)
    : FileScanner(config.includeExtensions, config.order) {}

FileScanner::FileScanner(std::vector<std::string> includeExtensions, SortOrder order)
    : m_includeExtensions(std::move(includeExtensions)), m_order(order) {
    for (auto& ext : m_includeExtensions) {
        ext = ConfigParser::normalizeExtension(ext);
    }
}

std::vector<FileRecord> FileScanner::scanDirectories(const std::vector<std::string>& sourceDirs) const {
    std::vector<FileRecord> all;

    for (const auto& sourceDir : sourceDirs) {
        const std::filesystem::path root = normalizeRoot(sourceDir);

        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec) || ec) {
            std::cerr << "Warning: source directory `" << sourceDir << "` does not exist or is not a directory." << std::endl;
            continue;
        }

        auto files = scanSingleDirectory(root);
        all.insert(all.end(), std::make_move_iterator(files.begin()), std::make_move_iterator(files.end()));
    }

    sortRecords(all);
    return all;
}

std::vector<FileRecord> FileScanner::scanSingleDirectory(const std::filesystem::path& root) const {
    std::vector<FileRecord> files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator iter(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << root.string() << "`: " << ec.message() << std::endl;
        return files;
    }

    const std::filesystem::recursive_directory_iterator end;
    while (iter != end) {
        const std::filesystem::directory_entry entry = *iter;
        const std::filesystem::path& filePath = entry.path();

        std::error_code entryErr;
        const bool regular = entry.is_regular_file(entryErr);
        const std::string filename = filePath.filename().string();

        if (entryErr) {
            std::cerr << "Skipping `" << filePath.string() << "`: " << entryErr.message() << std::endl;
        } else if (regular && !filename.empty() && filename.front() != '.' && isIncluded(filePath)) {
            const std::uintmax_t size = entry.file_size(entryErr);
            double mtime = 0.0;
            double ctime = 0.0;

            if (entryErr) {
                std::cerr << "Skipping `" << filePath.string() << "`: " << entryErr.message() << std::endl;
            } else if (size == 0) {
                std::cout << "Skipping empty file `" << filePath.string() << "`." << std::endl;
            } else if (!readTimestamps(filePath, mtime, ctime)) {
                std::cerr << "Skipping `" << filePath.string() << "`: unable to read timestamps." << std::endl;
            } else {
                const std::filesystem::path relative = filePath.lexically_relative(root);
                const std::filesystem::path parent = relative.parent_path();

                FileRecord record;
                record.sourceRoot = root.string();
                record.fullPath = filePath.string();
                record.relativePath = relative.generic_string();
                record.parentPath = parent.empty() ? std::string(".") : parent.generic_string();
                record.filename = filename;
                record.stem = filePath.stem().string();
                record.extension = filePath.extension().string();
                record.sizeBytes = size;
                record.mtime = mtime;
                record.ctime = ctime;
                files.push_back(std::move(record));
            }
        }

        iter.increment(ec);
        if (ec) {
            std::cerr << "Scan of `" << root.string() << "` stopped early: " << ec.message() << std::endl;
            break;
        }
    }

    return files;
}

bool FileScanner::isIncluded(const std::filesystem::path& file) const {
    if (m_includeExtensions.empty()) {
        return true;
    }

    const std::string extension = ConfigParser::normalizeExtension(file.extension().string());
    if (extension.empty()) {
        return false;
    }
    return std::find(m_includeExtensions.begin(), m_includeExtensions.end(), extension) != m_includeExtensions.end();
}

void FileScanner::sortRecords(std::vector<FileRecord>& records) const {
    // The natural order is always applied first so time-based ties stay deterministic.
    std::sort(records.begin(), records.end(), [](const FileRecord& lhs, const FileRecord& rhs) {
        if (int cmp = naturalCompare(lhs.parentPath, rhs.parentPath); cmp != 0) {
            return cmp < 0;
        }
        if (int cmp = naturalCompare(lhs.filename, rhs.filename); cmp != 0) {
            return cmp < 0;
        }
        if (lhs.relativePath != rhs.relativePath) {
            return lhs.relativePath < rhs.relativePath;
        }
        return lhs.sourceRoot < rhs.sourceRoot;
    });

    switch (m_order) {
    case SortOrder::Natural:
        break;
    case SortOrder::MtimeAsc:
        std::stable_sort(records.begin(), records.end(), [](const FileRecord& lhs, const FileRecord& rhs) {
            return lhs.mtime < rhs.mtime;
        });
        break;
    case SortOrder::MtimeDesc:
        std::stable_sort(records.begin(), records.end(), [](const FileRecord& lhs, const FileRecord& rhs) {
            return lhs.mtime > rhs.mtime;
        });
        break;
    case SortOrder::CtimeAsc:
        std::stable_sort(records.begin(), records.end(), [](const FileRecord& lhs, const FileRecord& rhs) {
            return lhs.ctime < rhs.ctime;
        });
        break;
    case SortOrder::CtimeDesc:
        std::stable_sort(records.begin(), records.end(), [](const FileRecord& lhs, const FileRecord& rhs) {
            return lhs.ctime > rhs.ctime;
        });
        break;
    }
}

int FileScanner::naturalCompare(const std::string& lhs, const std::string& rhs) {
    std::size_t i = 0;
    std::size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        const bool lhsDigit = isDigit(lhs[i]);
        const bool rhsDigit = isDigit(rhs[j]);

        std::size_t iEnd = i;
        while (iEnd < lhs.size() && isDigit(lhs[iEnd]) == lhsDigit) {
            ++iEnd;
        }
        std::size_t jEnd = j;
        while (jEnd < rhs.size() && isDigit(rhs[jEnd]) == rhsDigit) {
            ++jEnd;
        }

        const std::string lhsRun = lhs.substr(i, iEnd - i);
        const std::string rhsRun = rhs.substr(j, jEnd - j);

        int cmp = 0;
        if (lhsDigit && rhsDigit) {
            cmp = compareDigitRuns(lhsRun, rhsRun);
        } else if (lhsDigit != rhsDigit) {
            // Numbers sort before text, as digits do in plain ASCII order.
            cmp = lhsDigit ? -1 : 1;
        } else {
            cmp = compareFolded(lhsRun, rhsRun);
        }

        if (cmp != 0) {
            return cmp;
        }
        i = iEnd;
        j = jEnd;
    }

    if (i == lhs.size() && j == rhs.size()) {
        return 0;
    }
    return i == lhs.size() ? -1 : 1;
}
