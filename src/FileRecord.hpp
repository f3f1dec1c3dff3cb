#ifndef FILE_RECORD_HPP
#define FILE_RECORD_HPP

#include <cstdint>
#include <string>

enum class OperationKind {
    Copy,
    Move
};

// Descriptor of one discovered file. Scan-time fields are filled once by the
// FileScanner; the trailing fields are assigned by the naming and transfer stages.
struct FileRecord {
    std::string sourceRoot;
    std::string fullPath;
    // Relative to sourceRoot, generic ('/') separators.
    std::string relativePath;
    // Parent of relativePath, "." for files directly under the root.
    std::string parentPath;
    std::string filename;
    std::string stem;
    // Includes the leading dot, empty when the file has no extension.
    std::string extension;
    std::uintmax_t sizeBytes = 0;
    // Seconds since the Unix epoch.
    double mtime = 0.0;
    double ctime = 0.0;

    std::string newName;
    std::string targetPath;
    OperationKind operation = OperationKind::Copy;
    double completedAt = 0.0;
};

// Stable ledger key for a record: source root and relative path.
std::string operationIdFor(const FileRecord& record);

const char* toString(OperationKind kind);
// Parses "copy" / "move"; returns false for anything else.
bool parseOperationKind(const std::string& text, OperationKind& out);

// Current wall-clock time as seconds since the Unix epoch.
double nowEpochSeconds();

#endif
