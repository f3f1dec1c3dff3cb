#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include "ContentHasher.hpp"

#include <filesystem>
#include <string>

// Single-file transfer primitives. Failures are reported through `error` and
// never leave a half-written target behind.
class FileMover {
public:
    explicit FileMover(HashAlgorithm verifyAlgorithm = HashAlgorithm::Md5);
    virtual ~FileMover() = default;

    // Copy bytes, permissions and modification time to `target`. Refuses a target
    // that already exists, including the source itself, and leaves it untouched.
    bool copyFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const;
    // Copy, verify size and content hash, and only then delete the source.
    bool moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const;
    // True when both files exist with equal size and equal full-content digest.
    virtual bool verifyIntegrity(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath,
                                 std::string& error) const;

    // Rename `from` to `to`, falling back to copy and remove across devices.
    static bool relocate(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error);

private:
    // Delete a partially written regular file; silent when it is already gone.
    static void discardTarget(const std::filesystem::path& targetPath);

    ContentHasher m_hasher;
};

#endif
