#ifndef POST_PROCESS_HOOKS_HPP
#define POST_PROCESS_HOOKS_HPP

#include "ConfigParser.hpp"
#include "FileRecord.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

// Best-effort refresh of file-manager thumbnails after a run. Implementations
// report failure by returning false; the relocation result never depends on it.
class ThumbnailRefresher {
public:
    virtual ~ThumbnailRefresher() = default;

    virtual bool refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) = 0;
    virtual const char* name() const = 0;

    static std::unique_ptr<ThumbnailRefresher> create(ThumbnailRefreshMode mode);
};

class NoThumbnailRefresh : public ThumbnailRefresher {
public:
    bool refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) override;
    const char* name() const override { return "off"; }
};

// Sets every transferred target's modification time to now.
class TouchTimestampRefresher : public ThumbnailRefresher {
public:
    bool refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) override;
    const char* name() const override { return "touch"; }
};

// Tells the shell the target directory changed (SHChangeNotify on Windows,
// a directory timestamp bump picked up by file-manager watchers elsewhere).
class ShellNotifyRefresher : public ThumbnailRefresher {
public:
    bool refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) override;
    const char* name() const override { return "shell"; }
};

// Drops cached thumbnails: Explorer's thumbcache_*.db on Windows, the
// freedesktop.org per-file thumbnails under $XDG_CACHE_HOME/thumbnails elsewhere.
class ThumbnailCacheCleaner : public ThumbnailRefresher {
public:
    bool refresh(const std::filesystem::path& targetDir, const std::vector<FileRecord>& processed) override;
    const char* name() const override { return "cache_clear"; }

    // Thumbnail base directory for the current user, empty when it cannot be determined.
    static std::filesystem::path cacheRoot();
    // file:// URI for an absolute path, percent-encoded as thumbnail specs require.
    static std::string fileUri(const std::filesystem::path& absolutePath);
};

// Prints manual refresh instructions after an automatic refresh failed.
void showManualRefreshTips(const std::filesystem::path& targetDir);

struct SourceDeletionResult {
    std::size_t deleted = 0;
    std::size_t failed = 0;
};

// Copy mode only: delete sources whose copied target exists. Move runs delete nothing here.
SourceDeletionResult deleteCopiedSources(const std::vector<FileRecord>& processed, OperationKind operation);

#endif
